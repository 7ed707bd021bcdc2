#include "component_suggestions.h"

#include <utility>

namespace domain {

namespace {

class SuggestionList {
 public:
  void Add(ComponentType type, std::string name, std::string description) {
    const auto defaults = ComponentDefaultsFor(type);
    SuggestedComponent component;
    component.type = type;
    component.name = std::move(name);
    component.description = std::move(description);
    component.owner = ComponentOwner::kInternal;
    component.artwork_required = defaults.artwork_required;
    component.data_required = defaults.data_required;
    component.sort_order = static_cast<int>(items_.size());
    items_.push_back(std::move(component));
  }

  std::vector<SuggestedComponent> Take() { return std::move(items_); }

 private:
  std::vector<SuggestedComponent> items_;
};

bool IsBooklet(JobType type) {
  return type == JobType::kBookletSelfCover || type == JobType::kBookletPlusCover;
}

}  // namespace

bool operator==(const SuggestedComponent &lhs, const SuggestedComponent &rhs) {
  return lhs.type == rhs.type && lhs.name == rhs.name && lhs.description == rhs.description &&
         lhs.owner == rhs.owner && lhs.artwork_required == rhs.artwork_required &&
         lhs.data_required == rhs.data_required && lhs.sort_order == rhs.sort_order;
}

bool operator!=(const SuggestedComponent &lhs, const SuggestedComponent &rhs) {
  return !(lhs == rhs);
}

std::vector<SuggestedComponent> SuggestComponents(const JobClassification &classification) {
  const bool mailing = classification.meta_type == JobMetaType::kMailing;
  SuggestionList list;

  list.Add(ComponentType::kPrint, "Print Production", "Primary print production");

  if (mailing) {
    list.Add(ComponentType::kData, "Data Processing", "Mailing list processing and CASS certification");
  } else if (classification.has_data) {
    list.Add(ComponentType::kData, "Variable Data", "Variable data processing");
  }

  if (classification.mail_format == MailFormat::kEnvelope) {
    const int count = EffectiveEnvelopeComponents(classification);
    list.Add(ComponentType::kFinishing, "Insertion/Assembly",
             "Insert " + std::to_string(count) + (count > 1 ? " components" : " component") + " into envelope");
  }

  // Bindery only applies to plain jobs; mailings fold and stitch at the mail house.
  if (classification.meta_type == JobMetaType::kJob || classification.meta_type == JobMetaType::kUnspecified) {
    if (classification.job_type == JobType::kFolded) {
      list.Add(ComponentType::kBindery, "Folding", "Folding operation");
    }
    if (IsBooklet(classification.job_type)) {
      list.Add(ComponentType::kBindery, "Bindery",
               classification.job_type == JobType::kBookletPlusCover ? "Saddle stitch with separate cover"
                                                                     : "Saddle stitch self-cover");
    }
  }

  list.Add(ComponentType::kProof, "Proof", "Customer proof for approval");

  if (mailing) {
    list.Add(ComponentType::kMailing, "Mailing Services", "Postal processing and drop-ship");
  }

  if (classification.has_samples) {
    list.Add(ComponentType::kSamples, "Samples", "Production samples for customer");
  }

  list.Add(ComponentType::kShipping, "Shipping", mailing ? "Delivery to mail facility" : "Delivery to customer");

  return list.Take();
}

JobComponent ToJobComponent(const SuggestedComponent &suggestion) {
  JobComponent component;
  component.type = suggestion.type;
  component.name = suggestion.name;
  component.description = suggestion.description;
  component.owner = suggestion.owner;
  component.artwork_required = suggestion.artwork_required;
  component.data_required = suggestion.data_required;
  component.sort_order = suggestion.sort_order;
  return component;
}

}  // namespace domain
