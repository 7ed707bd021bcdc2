#include <gtest/gtest.h>

#include <optional>

#include "../common/domain/content_digest.h"
#include "../common/persistence/change_order_allocator.h"
#include "../common/persistence/change_orders_repository_utils.h"
#include "../common/persistence/jobs_repository_utils.h"
#include "../common/persistence/transaction.h"

using namespace persistence::detail;

namespace {

persistence::ChangeOrderRecord Approved(int version, const nlohmann::json &changes) {
  persistence::ChangeOrderRecord record;
  record.version = version;
  record.change_order_no = "BK000001-CO" + std::to_string(version);
  record.status = domain::ChangeOrderStatus::kApproved;
  record.content.summary = "v" + std::to_string(version);
  record.content.changes = domain::ChangeSet::FromJson(changes);
  return record;
}

}  // namespace

TEST(JobsRepositoryUtilsTest, BuildJobRecordParsesClassificationAndSpecs) {
  JobRowData data;
  data.id = "7f0c8f1e-3d4b-4f5a-9a57-0c2f6a9d1b11";
  data.base_job_id = "ME3000042";
  data.master_seq = 42;
  data.job_type_code = "ME3";
  data.status = "DRAFT";
  data.job_meta_type = std::string("MAILING");
  data.mail_format = std::string("ENVELOPE");
  data.envelope_components = 3;
  data.specs_json = std::string(R"({"quantity":1000})");
  data.effective_co_version = 2;

  const auto record = BuildJobRecord(data);
  EXPECT_EQ(record.base_job_id, "ME3000042");
  EXPECT_EQ(record.master_seq, 42);
  EXPECT_EQ(record.classification.meta_type, domain::JobMetaType::kMailing);
  EXPECT_EQ(record.classification.mail_format, domain::MailFormat::kEnvelope);
  EXPECT_EQ(record.classification.job_type, domain::JobType::kUnspecified);
  EXPECT_EQ(record.specs.at("quantity"), 1000);
  ASSERT_TRUE(record.effective_co_version.has_value());
  EXPECT_EQ(*record.effective_co_version, 2);
  EXPECT_TRUE(record.title.empty());
}

TEST(JobsRepositoryUtilsTest, BuildJobRecordToleratesUnreadableSpecs) {
  JobRowData data;
  data.id = "job";
  data.specs_json = std::string("not json");
  data.job_type = std::string("POSTER");
  const auto record = BuildJobRecord(data);
  EXPECT_TRUE(record.specs.is_object());
  EXPECT_TRUE(record.specs.empty());
  EXPECT_EQ(record.classification.job_type, domain::JobType::kUnspecified);
  EXPECT_FALSE(record.effective_co_version.has_value());
}

TEST(JobsRepositoryUtilsTest, LegacyComponentRowsAreInferred) {
  ComponentRowData data;
  data.id = "c1";
  data.job_id = "job";
  data.name = "Letter print";
  data.owner = std::string("LAHLOUH");

  const auto record = BuildComponentRecord(data);
  EXPECT_EQ(record.component.type, domain::ComponentType::kPrint);
  EXPECT_EQ(record.component.owner, domain::ComponentOwner::kVendor);
  EXPECT_TRUE(record.component.artwork_required);
  EXPECT_EQ(record.component.status, "PENDING");
}

TEST(JobsRepositoryUtilsTest, BuildComponentAppliesDefaultsAndPosition) {
  persistence::ComponentInput input;
  input.type = domain::ComponentType::kData;
  input.data_required = false;

  const auto component = BuildComponent(input, 3);
  EXPECT_EQ(component.name, "DATA");
  EXPECT_FALSE(component.data_required);
  EXPECT_FALSE(component.artwork_required);
  EXPECT_EQ(component.sort_order, 3);

  input.sort_order = 0;
  EXPECT_EQ(BuildComponent(input, 3).sort_order, 0);
}

TEST(JobsRepositoryUtilsTest, ResolveJobTypeCode) {
  domain::JobClassification classification;
  classification.job_type = domain::JobType::kFolded;
  EXPECT_EQ(ResolveJobTypeCode("", classification), "HJ");
  EXPECT_EQ(ResolveJobTypeCode("BK", classification), "BK");
  EXPECT_THROW(ResolveJobTypeCode("bk", classification), domain::InvalidArgumentError);
}

TEST(JobsRepositoryUtilsTest, LooksLikeUuid) {
  EXPECT_TRUE(LooksLikeUuid("7f0c8f1e-3d4b-4f5a-9a57-0c2f6a9d1b11"));
  EXPECT_TRUE(LooksLikeUuid("7F0C8F1E-3D4B-4F5A-9A57-0C2F6A9D1B11"));
  EXPECT_FALSE(LooksLikeUuid("7f0c8f1e3d4b4f5a9a570c2f6a9d1b11"));
  EXPECT_FALSE(LooksLikeUuid("BK000001"));
  EXPECT_FALSE(LooksLikeUuid("7f0c8f1e-3d4b-4f5a-9a57-0c2f6a9d1b1g"));
}

TEST(ChangeOrdersRepositoryUtilsTest, SerializesAndParsesVendorRefs) {
  const std::vector<std::string> values{"vendor-a", "vendor-b"};
  const auto json = SerializeStringArray(values);
  EXPECT_EQ(json, "[\"vendor-a\",\"vendor-b\"]");
  EXPECT_EQ(ParseStringArray(std::optional<std::string>(json)), values);
  EXPECT_TRUE(ParseStringArray(std::optional<std::string>("not_json")).empty());
  EXPECT_TRUE(ParseStringArray(std::nullopt).empty());
}

TEST(ChangeOrdersRepositoryUtilsTest, BuildChangeOrderRecord) {
  ChangeOrderRowData data;
  data.id = "co";
  data.job_id = "job";
  data.version = 3;
  data.change_order_no = "BK000001-CO3";
  data.status = "PENDING_APPROVAL";
  data.summary = "Paper swap";
  data.changes_json = std::string(R"({"paper":"100# gloss"})");
  data.affects_vendors_json = std::string(R"(["vendor-a"])");
  data.requires_new_po = true;

  const auto record = BuildChangeOrderRecord(data);
  EXPECT_EQ(record.status, domain::ChangeOrderStatus::kPendingApproval);
  EXPECT_EQ(record.content.changes.size(), 1u);
  EXPECT_EQ(record.content.affects_vendors, std::vector<std::string>{"vendor-a"});
  EXPECT_TRUE(record.content.requires_new_po);
  EXPECT_FALSE(record.approved_at.has_value());

  data.status = "ARCHIVED";
  EXPECT_THROW(BuildChangeOrderRecord(data), std::runtime_error);
}

TEST(ChangeOrdersRepositoryUtilsTest, AnonymousApprovalsBelongToSystem) {
  EXPECT_EQ(ResolveApprover(""), "system");
  EXPECT_EQ(ResolveApprover("   "), "system");
  EXPECT_EQ(ResolveApprover(" approver-7 "), "approver-7");
}

TEST(ChangeOrdersRepositoryUtilsTest, IntegrityReportComparesSealedDigest) {
  auto record = Approved(1, nlohmann::json{{"quantity", 5000}});
  record.content_digest = domain::ChangeOrderDigest(record.content.summary, record.content.changes);
  auto report = BuildIntegrityReport(record);
  EXPECT_TRUE(report.sealed);
  EXPECT_TRUE(report.intact);

  record.content.summary = "tampered";
  report = BuildIntegrityReport(record);
  EXPECT_TRUE(report.sealed);
  EXPECT_FALSE(report.intact);

  record.status = domain::ChangeOrderStatus::kDraft;
  record.content_digest.reset();
  report = BuildIntegrityReport(record);
  EXPECT_FALSE(report.sealed);
  EXPECT_FALSE(report.intact);
}

TEST(ChangeOrdersRepositoryUtilsTest, EffectiveStateFoldsApprovedInVersionOrder) {
  persistence::JobRecord job;
  job.id = "job";
  job.base_job_id = "BK000001";
  job.specs = nlohmann::json{{"quantity", 1000}, {"paper", "80# matte"}};
  job.effective_co_version = 3;

  auto rejected = Approved(2, nlohmann::json{{"paper", "silk"}});
  rejected.status = domain::ChangeOrderStatus::kRejected;
  const auto state = BuildEffectiveState(
      job, {Approved(3, nlohmann::json{{"quantity", 7500}}), rejected, Approved(1, nlohmann::json{{"quantity", 5000}})});

  EXPECT_EQ(state.applied_versions, (std::vector<int>{1, 3}));
  EXPECT_EQ(state.specs.at("quantity"), 7500);
  EXPECT_EQ(state.specs.at("paper"), "80# matte");
  EXPECT_EQ(state.effective_co_version.value_or(0), 3);
}

TEST(ChangeOrdersRepositoryUtilsTest, EffectiveStateKeepsBaseSpecsAndLatestApproval) {
  persistence::JobRecord job;
  job.id = "job";
  job.base_job_id = "BK000001";
  job.specs = nlohmann::json{{"quantity", 1000}};

  const auto untouched = BuildEffectiveState(job, {});
  EXPECT_FALSE(untouched.latest_approved.has_value());
  EXPECT_EQ(untouched.base_specs, job.specs);

  auto pending = Approved(3, nlohmann::json{{"quantity", 9000}});
  pending.status = domain::ChangeOrderStatus::kPendingApproval;
  const auto state = BuildEffectiveState(
      job, {Approved(2, nlohmann::json{{"quantity", 7500}}), pending, Approved(1, nlohmann::json{{"quantity", 5000}})});
  ASSERT_TRUE(state.latest_approved.has_value());
  EXPECT_EQ(state.latest_approved->version, 2);
  EXPECT_EQ(state.latest_approved->change_order_no, "BK000001-CO2");
  EXPECT_EQ(state.base_specs.at("quantity"), 1000);
  EXPECT_EQ(state.specs.at("quantity"), 7500);
}

TEST(ChangeOrderAllocatorTest, NextAfterFormatsTheChangeOrderNumber) {
  persistence::JobRecord job;
  job.base_job_id = "BK000001";
  const auto first = persistence::ChangeOrderAllocator::NextAfter(job, 0);
  EXPECT_EQ(first.version, 1);
  EXPECT_EQ(first.change_order_no, "BK000001-CO1");
  const auto next = persistence::ChangeOrderAllocator::NextAfter(job, 2);
  EXPECT_EQ(next.version, 3);
  EXPECT_EQ(next.change_order_no, "BK000001-CO3");
}

TEST(TransactionTest, ConflictClassification) {
  EXPECT_TRUE(IsRetryableConflict("40001"));
  EXPECT_TRUE(IsRetryableConflict("40P01"));
  EXPECT_TRUE(IsRetryableConflict("23505"));
  EXPECT_TRUE(IsRetryableConflict("55P03"));
  EXPECT_FALSE(IsRetryableConflict("23503"));
  EXPECT_FALSE(IsRetryableConflict("42P01"));
  EXPECT_FALSE(IsRetryableConflict(""));
}
