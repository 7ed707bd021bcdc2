#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../common/domain/errors.h"
#include "../services/jobs/http_mapping.h"

using namespace jobs_http;

TEST(HttpMappingTest, ErrorStatusMapping) {
  EXPECT_EQ(StatusForError(domain::NotFoundError("job", "abc")), 404);
  EXPECT_EQ(StatusForError(domain::InvalidArgumentError("summary_required", "empty")), 400);
  EXPECT_EQ(StatusForError(domain::ChangeSetError("bad")), 400);
  EXPECT_EQ(StatusForError(domain::InvalidTransitionError("submit", "change order", "APPROVED")), 409);
  EXPECT_EQ(StatusForError(domain::OpenChangeOrderError("J-1001-CO1")), 409);
  EXPECT_EQ(StatusForError(domain::IdentifierCollisionError("master-seq", "BK000001")), 409);
  EXPECT_EQ(StatusForError(domain::ImmutableRecordError("J-1001-CO1", "approved")), 423);
  EXPECT_EQ(StatusForError(domain::SequenceConflictError("create_change_order")), 503);
  EXPECT_EQ(StatusForError(domain::ValidationFailedError(std::vector<domain::ValidationIssue>{})), 422);
  EXPECT_EQ(StatusForError(std::runtime_error("boom")), 500);
}

TEST(HttpMappingTest, MalformedJsonIsABadRequest) {
  try {
    ParseBody("{not json");
    FAIL() << "expected a parse error";
  } catch (const std::exception &ex) {
    EXPECT_EQ(StatusForError(ex), 400);
    EXPECT_EQ(ErrorBody(ex).at("error"), "invalid_json");
  }
  EXPECT_THROW(ParseBody("[1,2]"), domain::InvalidArgumentError);
  EXPECT_TRUE(ParseBody("").is_object());
}

TEST(HttpMappingTest, ErrorBodiesCarryCodesAndIssues) {
  const auto immutable = ErrorBody(domain::ImmutableRecordError("J-1001-CO1", "APPROVED records cannot be edited"));
  EXPECT_EQ(immutable.at("error"), "immutable_record");

  const auto failed = ErrorBody(domain::ValidationFailedError(domain::ValidateComponents({})));
  EXPECT_EQ(failed.at("error"), "validation_failed");
  ASSERT_EQ(failed.at("issues").size(), 2u);
  EXPECT_EQ(failed.at("issues")[0].at("code"), "missing_print");

  const auto internal = ErrorBody(std::runtime_error("password=hunter2"));
  EXPECT_EQ(internal.at("error"), "internal_server_error");
  EXPECT_EQ(internal.dump().find("hunter2"), std::string::npos);
}

TEST(HttpMappingTest, ClassificationParsing) {
  const auto classification = ParseClassification(
      json{{"jobMetaType", "MAILING"}, {"mailFormat", "ENVELOPE"}, {"envelopeComponents", 3}, {"hasSamples", true}});
  EXPECT_EQ(classification.meta_type, domain::JobMetaType::kMailing);
  EXPECT_EQ(classification.mail_format, domain::MailFormat::kEnvelope);
  ASSERT_TRUE(classification.envelope_components.has_value());
  EXPECT_EQ(*classification.envelope_components, 3);
  EXPECT_TRUE(classification.has_samples);
  EXPECT_FALSE(classification.has_data);

  const auto unset = ParseClassification(json{{"jobType", nullptr}});
  EXPECT_EQ(unset.job_type, domain::JobType::kUnspecified);

  EXPECT_THROW(ParseClassification(json{{"jobType", "POSTER"}}), domain::InvalidArgumentError);
  EXPECT_THROW(ParseClassification(json{{"hasData", "yes"}}), domain::InvalidArgumentError);
}

TEST(HttpMappingTest, ComponentsFallBackToDefaultsInferenceAndSupplier) {
  const auto components = ParseComponents(json::array({
      json{{"type", "PRINT"}, {"name", "Offset"}},
      json{{"name", "Customer proof"}},
      json{{"type", "MAILING"}, {"name", "Mail house"}, {"supplier", "LAHLOUH"}},
      json{{"type", "SHIPPING"}, {"name", "Freight"}, {"owner", "VENDOR"}, {"vendorId", "v-9"}, {"sortOrder", 10}},
  }));
  ASSERT_EQ(components.size(), 4u);
  EXPECT_TRUE(components[0].artwork_required);
  EXPECT_EQ(components[0].sort_order, 0);
  EXPECT_EQ(components[1].type, domain::ComponentType::kProof);
  EXPECT_EQ(components[2].owner, domain::ComponentOwner::kVendor);
  EXPECT_TRUE(components[2].data_required);
  EXPECT_EQ(components[3].vendor_id, "v-9");
  EXPECT_EQ(components[3].sort_order, 10);

  const auto issues = domain::ValidateComponents(components);
  ASSERT_EQ(issues.size(), 1u);
  EXPECT_EQ(issues[0].code, "vendor_missing_vendor_id");
  EXPECT_EQ(*issues[0].component_index, 2);

  EXPECT_THROW(ParseComponents(json::array({json{{"type", "LAMINATE"}}})), domain::InvalidArgumentError);
  EXPECT_THROW(ParseComponents(json::object()), domain::InvalidArgumentError);
}

TEST(HttpMappingTest, ChangeOrderCreateInput) {
  const auto input = ParseChangeOrderCreateInput(
      "job-1", json{{"summary", "Qty change"}, {"changes", {{"quantity", 5000}}}, {"requiresReprice", true}});
  EXPECT_EQ(input.job_id, "job-1");
  EXPECT_EQ(input.summary, "Qty change");
  EXPECT_EQ(input.changes.size(), 1u);
  EXPECT_TRUE(input.requires_reprice);
  EXPECT_FALSE(input.requires_new_po);

  EXPECT_THROW(ParseChangeOrderCreateInput("job-1", json{{"summary", "x"}, {"changes", {{"quantity", "many"}}}}),
               domain::ChangeSetError);
}

TEST(HttpMappingTest, ChangeOrderUpdateOnlyCarriesProvidedFields) {
  const auto update = ParseChangeOrderUpdate(json{{"summary", "Qty change to 7500"}, {"version", 1}});
  ASSERT_TRUE(update.summary.has_value());
  EXPECT_EQ(*update.summary, "Qty change to 7500");
  EXPECT_EQ(update.version, 1);
  EXPECT_FALSE(update.changes.has_value());
  EXPECT_FALSE(update.affects_vendors.has_value());
  EXPECT_FALSE(update.requires_new_po.has_value());

  EXPECT_THROW(ParseChangeOrderUpdate(json{{"status", "APPROVED"}}), domain::InvalidArgumentError);
}

TEST(HttpMappingTest, IntegerFieldsOutsideIntRangeAreRejected) {
  for (const auto &body : {json{{"version", 4294967297LL}}, json{{"version", -5000000000LL}},
                           json{{"version", 18446744073709551615ULL}}}) {
    try {
      ParseChangeOrderUpdate(body);
      FAIL() << "expected InvalidArgumentError for " << body.dump();
    } catch (const domain::InvalidArgumentError &error) {
      EXPECT_EQ(error.code(), "invalid_field");
      EXPECT_EQ(StatusForError(error), 400);
    }
  }
  EXPECT_EQ(ParseChangeOrderUpdate(json{{"version", 2147483647}}).version, 2147483647);
}

TEST(HttpMappingTest, ChangeOrderJsonShape) {
  persistence::ChangeOrderRecord record;
  record.id = "co-1";
  record.job_id = "job-1";
  record.version = 2;
  record.change_order_no = "BK000001-CO2";
  record.status = domain::ChangeOrderStatus::kApproved;
  record.content.summary = "Qty change";
  record.content.changes.Set("quantity", std::int64_t{5000});
  record.content.affects_vendors = {"vendor-a"};
  record.approved_by = std::string("approver-7");

  const auto payload = ChangeOrderToJson(record);
  EXPECT_EQ(payload.at("changeOrderNo"), "BK000001-CO2");
  EXPECT_EQ(payload.at("status"), "APPROVED");
  EXPECT_EQ(payload.at("changes").at("quantity"), 5000);
  EXPECT_EQ(payload.at("approvedBy"), "approver-7");
  EXPECT_TRUE(payload.at("approvedAt").is_null());
  EXPECT_TRUE(payload.at("rejectionReason").is_null());
  EXPECT_EQ(payload.at("affectsVendors"), json::array({"vendor-a"}));
}

TEST(HttpMappingTest, JobJsonLeavesUnsetClassificationNull) {
  persistence::JobRecord job;
  job.id = "job-1";
  job.base_job_id = "FJ000004";
  job.master_seq = 4;
  job.job_type_code = "FJ";
  job.status = "DRAFT";
  job.classification.job_type = domain::JobType::kFlat;

  const auto payload = JobToJson(job);
  EXPECT_EQ(payload.at("baseJobId"), "FJ000004");
  EXPECT_EQ(payload.at("jobType"), "FLAT");
  EXPECT_TRUE(payload.at("jobMetaType").is_null());
  EXPECT_TRUE(payload.at("effectiveCOVersion").is_null());
}

TEST(HttpMappingTest, EffectiveStateCarriesBaseSpecsAndLatestApproval) {
  persistence::EffectiveJobState state;
  state.job_id = "job-1";
  state.base_job_id = "BK000001";
  state.base_specs = json{{"quantity", 1000}};
  state.specs = json{{"quantity", 5000}};

  auto payload = EffectiveStateToJson(state);
  EXPECT_TRUE(payload.at("latestApprovedCO").is_null());
  EXPECT_EQ(payload.at("baseSpecs").at("quantity"), 1000);

  persistence::ChangeOrderRecord approved;
  approved.id = "co-1";
  approved.version = 1;
  approved.change_order_no = "BK000001-CO1";
  approved.content.summary = "Qty change";
  approved.approved_at = std::string("2026-10-01T09:00:00Z");
  state.effective_co_version = 1;
  state.applied_versions = {1};
  state.latest_approved = approved;

  payload = EffectiveStateToJson(state);
  EXPECT_EQ(payload.at("latestApprovedCO").at("changeOrderNo"), "BK000001-CO1");
  EXPECT_EQ(payload.at("latestApprovedCO").at("version"), 1);
  EXPECT_EQ(payload.at("latestApprovedCO").at("approvedAt"), "2026-10-01T09:00:00Z");
  EXPECT_EQ(payload.at("specs").at("quantity"), 5000);
}
