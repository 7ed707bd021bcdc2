#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "../common/domain/component_validation.h"

using namespace domain;

namespace {

JobComponent Make(ComponentType type, const std::string &name) {
  JobComponent component;
  component.type = type;
  component.name = name;
  return component;
}

}  // namespace

TEST(ComponentValidationTest, CompleteSetHasNoIssues) {
  const std::vector<JobComponent> components{Make(ComponentType::kPrint, "Print"),
                                             Make(ComponentType::kProof, "Proof"),
                                             Make(ComponentType::kShipping, "Shipping")};
  EXPECT_TRUE(ValidateComponents(components).empty());
}

TEST(ComponentValidationTest, MissingProofAndVendorWithoutId) {
  auto vendor_print = Make(ComponentType::kPrint, "Offset run");
  vendor_print.owner = ComponentOwner::kVendor;
  const std::vector<JobComponent> components{vendor_print};

  const auto issues = ValidateComponents(components);
  ASSERT_EQ(issues.size(), 2u);
  EXPECT_EQ(issues[0].code, "missing_proof");
  EXPECT_EQ(issues[0].message, "Missing PROOF component (required for all jobs)");
  EXPECT_FALSE(issues[0].component_index.has_value());
  EXPECT_EQ(issues[1].code, "vendor_missing_vendor_id");
  EXPECT_EQ(issues[1].message, "Vendor-owned component missing vendorId");
  ASSERT_TRUE(issues[1].component_index.has_value());
  EXPECT_EQ(*issues[1].component_index, 0);
  EXPECT_EQ(issues[1].component_name, "Offset run");
}

TEST(ComponentValidationTest, EmptySetMissesPrintAndProof) {
  const auto issues = ValidateComponents({});
  ASSERT_EQ(issues.size(), 2u);
  EXPECT_EQ(issues[0].code, "missing_print");
  EXPECT_EQ(issues[0].message, "Missing PRINT component (required for all jobs)");
  EXPECT_EQ(issues[1].code, "missing_proof");
}

TEST(ComponentValidationTest, OneIssuePerVendorComponent) {
  auto print = Make(ComponentType::kPrint, "Print");
  auto proof = Make(ComponentType::kProof, "Proof");
  auto mailing = Make(ComponentType::kMailing, "Mail house");
  mailing.owner = ComponentOwner::kVendor;
  auto bindery = Make(ComponentType::kBindery, "Bindery");
  bindery.owner = ComponentOwner::kVendor;
  bindery.vendor_id = "vendor-42";
  auto shipping = Make(ComponentType::kShipping, "Freight");
  shipping.owner = ComponentOwner::kVendor;

  const auto issues = ValidateComponents({print, proof, mailing, bindery, shipping});
  ASSERT_EQ(issues.size(), 2u);
  EXPECT_EQ(*issues[0].component_index, 2);
  EXPECT_EQ(issues[0].component_name, "Mail house");
  EXPECT_EQ(*issues[1].component_index, 4);
}

TEST(ComponentValidationTest, InputIsLeftUntouched) {
  auto vendor = Make(ComponentType::kOther, "Outsourced");
  vendor.owner = ComponentOwner::kVendor;
  const std::vector<JobComponent> components{vendor};
  const auto before = components;
  ValidateComponents(components);
  ASSERT_EQ(components.size(), before.size());
  EXPECT_EQ(components[0].name, before[0].name);
  EXPECT_EQ(components[0].vendor_id, before[0].vendor_id);
}

TEST(ComponentValidationTest, FailedErrorCarriesIssues) {
  const ValidationFailedError error(ValidateComponents({}));
  EXPECT_EQ(error.code(), "validation_failed");
  EXPECT_EQ(error.issues().size(), 2u);
  EXPECT_NE(std::string(error.what()).find("Missing PRINT component"), std::string::npos);
}
