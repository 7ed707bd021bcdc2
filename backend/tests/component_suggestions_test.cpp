#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "../common/domain/component_suggestions.h"
#include "../common/domain/components.h"

using namespace domain;

namespace {

std::vector<ComponentType> TypesOf(const std::vector<SuggestedComponent> &suggestions) {
  std::vector<ComponentType> types;
  for (const auto &suggestion : suggestions) {
    types.push_back(suggestion.type);
  }
  return types;
}

}  // namespace

TEST(ComponentSuggestionsTest, EnvelopeMailingWithSamples) {
  JobClassification classification;
  classification.meta_type = JobMetaType::kMailing;
  classification.mail_format = MailFormat::kEnvelope;
  classification.envelope_components = 3;
  classification.has_samples = true;

  const auto suggestions = SuggestComponents(classification);
  EXPECT_EQ(TypesOf(suggestions),
            (std::vector<ComponentType>{ComponentType::kPrint, ComponentType::kData, ComponentType::kFinishing,
                                        ComponentType::kProof, ComponentType::kMailing, ComponentType::kSamples,
                                        ComponentType::kShipping}));
  ASSERT_EQ(suggestions.size(), 7u);
  EXPECT_EQ(suggestions[1].description, "Mailing list processing and CASS certification");
  EXPECT_EQ(suggestions[2].name, "Insertion/Assembly");
  EXPECT_EQ(suggestions[2].description, "Insert 3 components into envelope");
  EXPECT_EQ(suggestions[6].description, "Delivery to mail facility");
  for (std::size_t i = 0; i < suggestions.size(); ++i) {
    EXPECT_EQ(suggestions[i].sort_order, static_cast<int>(i));
    EXPECT_EQ(suggestions[i].owner, ComponentOwner::kInternal);
  }
}

TEST(ComponentSuggestionsTest, PlainBookletWithCover) {
  JobClassification classification;
  classification.meta_type = JobMetaType::kJob;
  classification.job_type = JobType::kBookletPlusCover;

  const auto suggestions = SuggestComponents(classification);
  ASSERT_EQ(suggestions.size(), 4u);
  EXPECT_EQ(TypesOf(suggestions), (std::vector<ComponentType>{ComponentType::kPrint, ComponentType::kBindery,
                                                               ComponentType::kProof, ComponentType::kShipping}));
  EXPECT_EQ(suggestions[1].name, "Bindery");
  EXPECT_EQ(suggestions[1].description, "Saddle stitch with separate cover");
  EXPECT_EQ(suggestions[3].description, "Delivery to customer");
}

TEST(ComponentSuggestionsTest, SingleEnvelopeComponentIsSingular) {
  JobClassification classification;
  classification.meta_type = JobMetaType::kMailing;
  classification.mail_format = MailFormat::kEnvelope;

  const auto suggestions = SuggestComponents(classification);
  ASSERT_GE(suggestions.size(), 3u);
  EXPECT_EQ(suggestions[2].description, "Insert 1 component into envelope");
}

TEST(ComponentSuggestionsTest, UnclassifiedJobGetsTheMinimalSet) {
  const auto suggestions = SuggestComponents(JobClassification{});
  EXPECT_EQ(TypesOf(suggestions),
            (std::vector<ComponentType>{ComponentType::kPrint, ComponentType::kProof, ComponentType::kShipping}));
}

TEST(ComponentSuggestionsTest, FoldedJobWithVariableData) {
  JobClassification classification;
  classification.job_type = JobType::kFolded;
  classification.has_data = true;

  const auto suggestions = SuggestComponents(classification);
  ASSERT_EQ(suggestions.size(), 5u);
  EXPECT_EQ(suggestions[1].name, "Variable Data");
  EXPECT_EQ(suggestions[2].name, "Folding");
  EXPECT_EQ(suggestions[2].type, ComponentType::kBindery);
}

TEST(ComponentSuggestionsTest, MailingsNeverGetBindery) {
  JobClassification classification;
  classification.meta_type = JobMetaType::kMailing;
  classification.job_type = JobType::kBookletSelfCover;

  for (const auto &suggestion : SuggestComponents(classification)) {
    EXPECT_NE(suggestion.type, ComponentType::kBindery);
  }
}

TEST(ComponentSuggestionsTest, StructuralGuarantees) {
  std::vector<JobClassification> classifications(6);
  classifications[1].meta_type = JobMetaType::kMailing;
  classifications[2].meta_type = JobMetaType::kMailing;
  classifications[2].mail_format = MailFormat::kEnvelope;
  classifications[2].envelope_components = 5;
  classifications[3].job_type = JobType::kBookletSelfCover;
  classifications[3].has_samples = true;
  classifications[4].meta_type = JobMetaType::kJob;
  classifications[4].has_data = true;
  classifications[4].has_versions = true;
  classifications[5].mail_format = MailFormat::kPostcard;

  for (const auto &classification : classifications) {
    const auto suggestions = SuggestComponents(classification);
    ASSERT_FALSE(suggestions.empty());
    EXPECT_EQ(suggestions.front().type, ComponentType::kPrint);
    EXPECT_EQ(suggestions.back().type, ComponentType::kShipping);
    int proofs = 0;
    for (const auto &suggestion : suggestions) {
      proofs += suggestion.type == ComponentType::kProof ? 1 : 0;
      const auto defaults = ComponentDefaultsFor(suggestion.type);
      EXPECT_EQ(suggestion.artwork_required, defaults.artwork_required);
      EXPECT_EQ(suggestion.data_required, defaults.data_required);
    }
    EXPECT_EQ(proofs, 1);
  }
}

TEST(ComponentSuggestionsTest, SameInputGivesSameOutput) {
  JobClassification classification;
  classification.meta_type = JobMetaType::kMailing;
  classification.mail_format = MailFormat::kEnvelope;
  classification.envelope_components = 2;
  EXPECT_EQ(SuggestComponents(classification), SuggestComponents(classification));

  JobClassification with_versions = classification;
  with_versions.has_versions = true;
  EXPECT_EQ(SuggestComponents(classification), SuggestComponents(with_versions));
}

TEST(ComponentSuggestionsTest, ToJobComponentKeepsFlagsAndOrder) {
  JobClassification classification;
  classification.meta_type = JobMetaType::kMailing;
  const auto suggestions = SuggestComponents(classification);
  const auto component = ToJobComponent(suggestions[1]);
  EXPECT_EQ(component.type, ComponentType::kData);
  EXPECT_TRUE(component.data_required);
  EXPECT_FALSE(component.artwork_required);
  EXPECT_EQ(component.sort_order, 1);
  EXPECT_EQ(component.status, "PENDING");
  EXPECT_TRUE(component.vendor_id.empty());
}

TEST(ComponentDefaultsTest, ArtworkAndDataFlags) {
  EXPECT_TRUE(ComponentDefaultsFor(ComponentType::kPrint).artwork_required);
  EXPECT_TRUE(ComponentDefaultsFor(ComponentType::kProof).artwork_required);
  EXPECT_TRUE(ComponentDefaultsFor(ComponentType::kData).data_required);
  EXPECT_TRUE(ComponentDefaultsFor(ComponentType::kMailing).data_required);
  EXPECT_FALSE(ComponentDefaultsFor(ComponentType::kShipping).artwork_required);
  EXPECT_FALSE(ComponentDefaultsFor(ComponentType::kShipping).data_required);
}

TEST(ComponentTypeInferenceTest, KeywordsMapToTypes) {
  EXPECT_EQ(InferComponentType("Letter Print"), ComponentType::kPrint);
  EXPECT_EQ(InferComponentType("NCOA update"), ComponentType::kData);
  EXPECT_EQ(InferComponentType("Hard proof"), ComponentType::kProof);
  EXPECT_EQ(InferComponentType("Postal drop"), ComponentType::kMailing);
  EXPECT_EQ(InferComponentType("Insert & tab"), ComponentType::kFinishing);
  EXPECT_EQ(InferComponentType("Saddle stitch"), ComponentType::kBindery);
  EXPECT_EQ(InferComponentType("Ship to client"), ComponentType::kShipping);
  EXPECT_EQ(InferComponentType("Press samples"), ComponentType::kSamples);
  EXPECT_EQ(InferComponentType("Misc"), ComponentType::kOther);
  // Earlier rules win: "mailer" is a print keyword before "mail" is a mailing one.
  EXPECT_EQ(InferComponentType("Self mailer"), ComponentType::kPrint);
}

TEST(ComponentTypeInferenceTest, SupplierLabelsMapToOwners) {
  EXPECT_EQ(OwnerForSupplier("JD"), ComponentOwner::kInternal);
  EXPECT_EQ(OwnerForSupplier("LAHLOUH"), ComponentOwner::kVendor);
  EXPECT_EQ(OwnerForSupplier("THIRD_PARTY"), ComponentOwner::kVendor);
  EXPECT_EQ(OwnerForSupplier("ANYONE"), ComponentOwner::kInternal);
}
