#include "internal/core/record_codec.hpp"

#include <google/protobuf/struct.pb.h>

#include "internal/util/proto_json.hpp"
#include "internal/util/text.hpp"
#include "internal/util/time.hpp"

namespace recall::core {

using namespace recall::memory::v1;

std::string_view KindName(MemoryKind kind) {
  switch (kind) {
    case MEMORY_KIND_ENTITY:
      return "entity";
    case MEMORY_KIND_FACT:
      return "fact";
    case MEMORY_KIND_PREFERENCE:
      return "preference";
    case MEMORY_KIND_EVENT:
      return "event";
    case MEMORY_KIND_GOAL:
      return "goal";
    case MEMORY_KIND_PROCEDURE:
      return "procedure";
    case MEMORY_KIND_DECISION:
      return "decision";
    case MEMORY_KIND_ACTION:
      return "action";
    default:
      return "unspecified";
  }
}

std::optional<MemoryKind> ParseKind(std::string_view name) {
  const auto key = util::NormalizeKey(name);
  for (auto kind : {MEMORY_KIND_ENTITY, MEMORY_KIND_FACT, MEMORY_KIND_PREFERENCE, MEMORY_KIND_EVENT, MEMORY_KIND_GOAL,
                    MEMORY_KIND_PROCEDURE, MEMORY_KIND_DECISION, MEMORY_KIND_ACTION}) {
    if (key == KindName(kind)) return kind;
  }
  return std::nullopt;
}

std::string_view SensitivityName(Sensitivity sensitivity) {
  switch (sensitivity) {
    case SENSITIVITY_SENSITIVE:
      return "sensitive";
    case SENSITIVITY_PRIVATE:
      return "private";
    default:
      return "normal";
  }
}

std::optional<Sensitivity> ParseSensitivity(std::string_view name) {
  const auto key = util::NormalizeKey(name);
  if (key.empty() || key == "normal") return SENSITIVITY_NORMAL;
  if (key == "sensitive") return SENSITIVITY_SENSITIVE;
  if (key == "private") return SENSITIVITY_PRIVATE;
  return std::nullopt;
}

std::string_view StatusName(RecordStatus status) {
  switch (status) {
    case RECORD_STATUS_ACTIVE:
      return "active";
    case RECORD_STATUS_SUPERSEDED:
      return "superseded";
    case RECORD_STATUS_ARCHIVED:
      return "archived";
    default:
      return "unspecified";
  }
}

std::string_view OperationName(Operation op) {
  switch (op) {
    case OPERATION_ADD:
      return "ADD";
    case OPERATION_UPDATE:
      return "UPDATE";
    case OPERATION_DELETE:
      return "DELETE";
    case OPERATION_NOOP:
      return "NOOP";
    case OPERATION_CONSOLIDATE:
      return "CONSOLIDATE";
    default:
      return "UNSPECIFIED";
  }
}

std::string_view StrategyName(MergeStrategy strategy) {
  switch (strategy) {
    case MERGE_STRATEGY_REPLACE:
      return "replace";
    case MERGE_STRATEGY_APPEND:
      return "append";
    case MERGE_STRATEGY_SUPERSEDE:
      return "supersede";
    case MERGE_STRATEGY_ALIAS:
      return "alias";
    default:
      return "";
  }
}

std::string_view OutcomeName(OperationOutcome outcome) {
  switch (outcome) {
    case OPERATION_OUTCOME_APPLIED:
      return "applied";
    case OPERATION_OUTCOME_FAILED:
      return "failed";
    case OPERATION_OUTCOME_REJECTED:
      return "rejected";
    case OPERATION_OUTCOME_CANCELLED:
      return "cancelled";
    default:
      return "unspecified";
  }
}

std::string_view JobTypeName(JobType type) {
  switch (type) {
    case JOB_TYPE_DECAY:
      return "decay";
    case JOB_TYPE_CONSOLIDATE:
      return "consolidate";
    case JOB_TYPE_RESUMMARIZE:
      return "resummarize";
    case JOB_TYPE_REINDEX:
      return "reindex";
    case JOB_TYPE_CLEANUP:
      return "cleanup";
    default:
      return "unspecified";
  }
}

MemoryRecordView ToView(const db::model::MemoryRecord& record, double similarity) {
  MemoryRecordView view;
  view.set_id(record.id);
  view.set_kind(std::string(KindName(record.kind)));
  view.set_subject_name(record.subject_name);
  view.set_content(record.content);
  view.set_predicate(record.predicate);
  view.set_object(record.object);
  for (const auto& alias : record.aliases) view.add_aliases(alias);
  view.set_importance(record.importance);
  view.set_is_historical(record.is_historical);
  view.set_sensitivity(std::string(SensitivityName(record.sensitivity)));
  view.set_status(std::string(StatusName(record.status)));
  view.set_version(record.version);
  view.set_similarity(similarity);
  if (record.effective_from_ms) *view.mutable_effective_from() = util::MillisToProto(record.effective_from_ms);
  if (record.expires_at_ms) *view.mutable_expires_at() = util::MillisToProto(record.expires_at_ms);
  if (record.last_accessed_at_ms) *view.mutable_last_accessed_at() = util::MillisToProto(record.last_accessed_at_ms);
  if (record.created_at_ms) *view.mutable_created_at() = util::MillisToProto(record.created_at_ms);
  view.set_supersedes_id(record.supersedes_id);
  view.set_superseded_by_id(record.superseded_by_id);
  view.set_category(record.category);
  view.set_access_count(record.access_count);
  return view;
}

CategorySummaryView ToView(const db::model::CategorySummaryRecord& summary) {
  CategorySummaryView view;
  view.set_category(summary.category);
  view.set_summary_text(summary.summary_text);
  for (const auto& id : summary.member_record_ids) view.add_member_record_ids(id);
  view.set_version(summary.version);
  if (summary.last_synthesized_at_ms) *view.mutable_last_synthesized_at() = util::MillisToProto(summary.last_synthesized_at_ms);
  return view;
}

std::string SnapshotJson(const db::model::MemoryRecord& record) {
  google::protobuf::Struct snapshot;
  auto&                    fields = *snapshot.mutable_fields();

  // The view carries the user-visible fields; the rest are added beside it.
  google::protobuf::Value view_value;
  util::FromJson(util::ToJson(ToView(record)), &view_value, false);
  fields["record"] = view_value;
  fields["owner_id"].set_string_value(record.owner_id);
  fields["embedding_model"].set_string_value(record.embedding_model);
  fields["user_pinned"].set_bool_value(record.user_pinned);
  fields["recurrence_json"].set_string_value(record.recurrence_json);
  fields["revision"].set_number_value(static_cast<double>(record.revision));
  fields["updated_at_ms"].set_number_value(static_cast<double>(record.updated_at_ms));
  if (record.sentiment) fields["sentiment"].set_number_value(*record.sentiment);
  if (record.sentiment_average) fields["sentiment_average"].set_number_value(*record.sentiment_average);
  return util::ToJson(snapshot);
}

} // namespace recall::core
