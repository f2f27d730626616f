#include "pg_repository.hpp"

#include <cstring>

#include "internal/db/sql/row_codec.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/text.hpp"
#include "recall/memory/v1.hpp"

namespace recall::db::postgres {

namespace v1 = recall::memory::v1;

namespace {

std::string Text(const pqxx::field& f) {
  return f.is_null() ? "" : f.c_str();
}

model::MemoryRecord ReadMemory(const pqxx::row& row) {
  model::MemoryRecord r;
  r.id              = Text(row[0]);
  r.owner_id        = Text(row[1]);
  r.kind            = static_cast<v1::MemoryKind>(row[2].as<int>());
  r.subject_name    = Text(row[3]);
  r.content         = Text(row[4]);
  r.predicate       = Text(row[5]);
  r.object          = Text(row[6]);
  r.aliases         = sql::SplitList(Text(row[7]));
  r.embedding       = sql::EmbeddingFromText(Text(row[8]));
  r.embedding_model = Text(row[9]);
  r.importance      = row[10].as<double>();
  if (!row[11].is_null()) r.sentiment = row[11].as<double>();
  r.is_historical       = row[12].as<bool>();
  r.user_pinned         = row[13].as<bool>();
  r.effective_from_ms   = row[14].as<uint64_t>();
  r.expires_at_ms       = row[15].as<uint64_t>();
  r.recurrence_json     = Text(row[16]);
  r.sensitivity         = static_cast<v1::Sensitivity>(row[17].as<int>());
  r.status              = static_cast<v1::RecordStatus>(row[18].as<int>());
  r.category            = Text(row[19]);
  r.supersedes_id       = Text(row[20]);
  r.superseded_by_id    = Text(row[21]);
  r.version             = row[22].as<uint64_t>();
  r.revision            = row[23].as<uint64_t>();
  r.access_count        = row[24].as<uint64_t>();
  r.last_accessed_at_ms = row[25].as<uint64_t>();
  r.decayed_at_ms       = row[26].as<uint64_t>();
  r.created_at_ms       = row[27].as<uint64_t>();
  r.updated_at_ms       = row[28].as<uint64_t>();
  if (!row[29].is_null()) r.sentiment_average = row[29].as<double>();
  return r;
}

model::CategorySummaryRecord ReadSummary(const pqxx::row& row) {
  model::CategorySummaryRecord r;
  r.owner_id               = Text(row[0]);
  r.category               = Text(row[1]);
  r.summary_text           = Text(row[2]);
  r.member_record_ids      = sql::SplitList(Text(row[3]));
  r.member_fingerprint     = Text(row[4]);
  r.version                = row[5].as<uint64_t>();
  r.last_synthesized_at_ms = row[6].as<uint64_t>();
  return r;
}

model::MemoryOperationRecord ReadOperation(const pqxx::row& row) {
  model::MemoryOperationRecord r;
  r.id             = Text(row[0]);
  r.owner_id       = Text(row[1]);
  r.operation      = static_cast<v1::Operation>(row[2].as<int>());
  r.merge_strategy = static_cast<v1::MergeStrategy>(row[3].as<int>());
  r.outcome        = static_cast<v1::OperationOutcome>(row[4].as<int>());
  r.candidate_text = Text(row[5]);
  r.candidate_json = Text(row[6]);
  r.similar_ids    = sql::SplitList(Text(row[7]));
  r.target_id      = Text(row[8]);
  r.result_ids     = sql::SplitList(Text(row[9]));
  r.reasoning      = Text(row[10]);
  r.old_content    = Text(row[11]);
  r.new_content    = Text(row[12]);
  r.snapshot_json  = Text(row[13]);
  r.error          = Text(row[14]);
  r.job_id         = Text(row[15]);
  r.source_id      = Text(row[16]);
  r.duration_ms    = row[17].as<uint64_t>();
  r.created_at_ms  = row[18].as<uint64_t>();
  return r;
}

model::MaintenanceJobRecord ReadJob(const pqxx::row& row) {
  model::MaintenanceJobRecord r;
  r.id               = Text(row[0]);
  r.job_type         = static_cast<v1::JobType>(row[1].as<int>());
  r.status           = static_cast<v1::JobStatus>(row[2].as<int>());
  r.owner_id         = Text(row[3]);
  r.payload_json     = Text(row[4]);
  r.attempts         = row[5].as<uint32_t>();
  r.max_attempts     = row[6].as<uint32_t>();
  r.scheduled_for_ms = row[7].as<uint64_t>();
  r.depends_on       = Text(row[8]);
  r.last_error       = Text(row[9]);
  r.created_at_ms    = row[10].as<uint64_t>();
  r.started_at_ms    = row[11].as<uint64_t>();
  r.completed_at_ms  = row[12].as<uint64_t>();
  return r;
}

// Row id first for INSERT, last for UPDATE.
pqxx::params MemoryParams(const model::MemoryRecord& r, bool id_first) {
  pqxx::params p;
  if (id_first) p.append(r.id);
  p.append(r.owner_id);
  p.append(static_cast<int>(r.kind));
  p.append(r.subject_name);
  p.append(r.content);
  p.append(r.predicate);
  p.append(r.object);
  p.append(sql::JoinList(r.aliases));
  p.append(sql::EmbeddingToText(r.embedding));
  p.append(r.embedding_model);
  p.append(r.importance);
  p.append(r.sentiment);
  p.append(r.is_historical);
  p.append(r.user_pinned);
  p.append(r.effective_from_ms);
  p.append(r.expires_at_ms);
  p.append(r.recurrence_json);
  p.append(static_cast<int>(r.sensitivity));
  p.append(static_cast<int>(r.status));
  p.append(r.category);
  p.append(r.supersedes_id);
  p.append(r.superseded_by_id);
  p.append(r.version);
  p.append(r.revision);
  p.append(r.access_count);
  p.append(r.last_accessed_at_ms);
  p.append(r.decayed_at_ms);
  p.append(r.created_at_ms);
  p.append(r.updated_at_ms);
  p.append(r.sentiment_average);
  if (!id_first) p.append(r.id);
  return p;
}

pqxx::params JobParams(const model::MaintenanceJobRecord& r, bool id_first) {
  pqxx::params p;
  if (id_first) p.append(r.id);
  p.append(static_cast<int>(r.job_type));
  p.append(static_cast<int>(r.status));
  p.append(r.owner_id);
  p.append(r.payload_json);
  p.append(r.attempts);
  p.append(r.max_attempts);
  p.append(r.scheduled_for_ms);
  p.append(r.depends_on);
  p.append(r.last_error);
  p.append(r.created_at_ms);
  p.append(r.started_at_ms);
  p.append(r.completed_at_ms);
  if (!id_first) p.append(r.id);
  return p;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (const auto* sql_error = dynamic_cast<const pqxx::sql_error*>(&e)) {
    const std::string state = sql_error->sqlstate();
    if (state == "23505") {
      const bool primary_key = std::strstr(e.what(), "_pkey") != nullptr;
      return Result::Err(primary_key ? ErrorCode::AlreadyExists : ErrorCode::ConstraintViolation, e.what());
    }
    if (state.rfind("23", 0) == 0) return Result::Err(ErrorCode::ConstraintViolation, e.what());
    if (state == "40001") return Result::Err(ErrorCode::SerializationFailure, e.what());
    if (state == "40P01") return Result::Err(ErrorCode::Conflict, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Memory records
// ------------------------------------------------------------------

Result PgRepository::InsertMemory(Transaction& t, const model::MemoryRecord& r) {
  try {
    TX(t).Savepoint([&](pqxx::subtransaction& sub) { return sub.exec_prepared("insert_memory", MemoryParams(r, true)); });
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::MemoryRecord> PgRepository::GetMemory(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("select_memory", id);
  if (res.empty()) return std::nullopt;
  return ReadMemory(res[0]);
}

Result PgRepository::UpdateMemory(Transaction& t, const model::MemoryRecord& r) {
  try {
    auto res = TX(t).Savepoint([&](pqxx::subtransaction& sub) { return sub.exec_prepared("update_memory", MemoryParams(r, false)); });
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "memory not found");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteMemory(Transaction& t, const std::string& id) {
  try {
    TX(t).Work().exec_prepared("delete_memory", id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::MemoryRecord> PgRepository::GetActiveBySlot(Transaction& t, const std::string& owner_id,
                                                                const std::string& subject, const std::string& predicate) {
  const auto predicate_key = util::NormalizeKey(predicate);
  if (predicate_key.empty()) return std::nullopt;

  auto res = TX(t).Work().exec_prepared("select_active_by_slot", owner_id, util::NormalizeKey(subject), predicate_key);
  if (res.empty()) return std::nullopt;
  return ReadMemory(res[0]);
}

std::vector<model::MemoryRecord> PgRepository::ListMemories(Transaction& t, const model::MemoryFilter& filter) {
  std::string  query = sql::SELECT_MEMORIES_BY_OWNER;
  pqxx::params p;
  p.append(filter.owner_id);
  if (filter.status) {
    query += sql::MEMORY_FILTER_STATUS;
    p.append(static_cast<int>(*filter.status));
  }
  if (filter.subject_key) {
    query += sql::MEMORY_FILTER_SUBJECT;
    p.append(*filter.subject_key);
  }
  if (filter.category) {
    query += sql::MEMORY_FILTER_CATEGORY;
    p.append(*filter.category);
  }
  query += sql::MEMORY_ORDER;

  auto res = TX(t).Work().exec_params(sql::Numbered(query), p);

  std::vector<model::MemoryRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadMemory(row));
  return out;
}

std::vector<std::string> PgRepository::ListOwners(Transaction& t) {
  auto res = TX(t).Work().exec(sql::SELECT_OWNERS);

  std::vector<std::string> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(Text(row[0]));
  return out;
}

// ------------------------------------------------------------------
// Category summaries
// ------------------------------------------------------------------

Result PgRepository::UpsertCategorySummary(Transaction& t, const model::CategorySummaryRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_summary", r.owner_id, r.category, r.summary_text, sql::JoinList(r.member_record_ids),
                               r.member_fingerprint, r.version, r.last_synthesized_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::CategorySummaryRecord> PgRepository::GetCategorySummary(Transaction& t, const std::string& owner_id,
                                                                             const std::string& category) {
  auto res = TX(t).Work().exec_prepared("select_summary", owner_id, category);
  if (res.empty()) return std::nullopt;
  return ReadSummary(res[0]);
}

std::vector<model::CategorySummaryRecord> PgRepository::ListCategorySummaries(Transaction& t, const std::string& owner_id) {
  auto res = TX(t).Work().exec_prepared("select_summaries", owner_id);

  std::vector<model::CategorySummaryRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadSummary(row));
  return out;
}

Result PgRepository::DeleteCategorySummary(Transaction& t, const std::string& owner_id, const std::string& category) {
  try {
    TX(t).Work().exec_prepared("delete_summary", owner_id, category);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Audit log
// ------------------------------------------------------------------

Result PgRepository::AppendOperation(Transaction& t, const model::MemoryOperationRecord& r) {
  try {
    pqxx::params p;
    p.append(r.id);
    p.append(r.owner_id);
    p.append(static_cast<int>(r.operation));
    p.append(static_cast<int>(r.merge_strategy));
    p.append(static_cast<int>(r.outcome));
    p.append(r.candidate_text);
    p.append(r.candidate_json);
    p.append(sql::JoinList(r.similar_ids));
    p.append(r.target_id);
    p.append(sql::JoinList(r.result_ids));
    p.append(r.reasoning);
    p.append(r.old_content);
    p.append(r.new_content);
    p.append(r.snapshot_json);
    p.append(r.error);
    p.append(r.job_id);
    p.append(r.source_id);
    p.append(r.duration_ms);
    p.append(r.created_at_ms);
    TX(t).Work().exec_prepared("insert_operation", p);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::MemoryOperationRecord> PgRepository::ListOperations(Transaction& t, const std::string& owner_id,
                                                                       uint64_t limit) {
  std::string query = sql::SELECT_OPERATIONS;
  if (limit > 0) query += " LIMIT " + std::to_string(limit);
  query += ";";

  auto res = TX(t).Work().exec_params(sql::Numbered(query), owner_id);

  std::vector<model::MemoryOperationRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadOperation(row));
  return out;
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result PgRepository::InsertJob(Transaction& t, const model::MaintenanceJobRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_job", JobParams(r, true));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::MaintenanceJobRecord> PgRepository::GetJob(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("select_job", id);
  if (res.empty()) return std::nullopt;
  return ReadJob(res[0]);
}

Result PgRepository::UpdateJob(Transaction& t, const model::MaintenanceJobRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_job", JobParams(r, false));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "job not found");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::MaintenanceJobRecord> PgRepository::ListJobs(Transaction& t, std::optional<v1::JobStatus> status) {
  auto res = status ? TX(t).Work().exec_params(sql::Numbered(sql::SELECT_JOBS_BY_STATUS), static_cast<int>(*status))
                    : TX(t).Work().exec(sql::SELECT_JOBS);

  std::vector<model::MaintenanceJobRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadJob(row));
  return out;
}

// ------------------------------------------------------------------
// Access log / relationships
// ------------------------------------------------------------------

Result PgRepository::InsertAccess(Transaction& t, const model::AccessRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_access", r.owner_id, r.record_id, r.batch_id, r.accessed_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::AccessRecord> PgRepository::ListAccesses(Transaction& t, const std::string& owner_id) {
  auto res = TX(t).Work().exec_prepared("select_accesses", owner_id);

  std::vector<model::AccessRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::AccessRecord r;
    r.owner_id       = Text(row[0]);
    r.record_id      = Text(row[1]);
    r.batch_id       = Text(row[2]);
    r.accessed_at_ms = row[3].as<uint64_t>();
    out.push_back(std::move(r));
  }
  return out;
}

Result PgRepository::UpsertRelationship(Transaction& t, const model::RelationshipRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_relationship", r.owner_id, r.record_a, r.record_b, r.co_access_count, r.strength,
                               r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::RelationshipRecord> PgRepository::ListRelationships(Transaction& t, const std::string& owner_id) {
  auto res = TX(t).Work().exec_prepared("select_relationships", owner_id);

  std::vector<model::RelationshipRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::RelationshipRecord r;
    r.owner_id        = Text(row[0]);
    r.record_a        = Text(row[1]);
    r.record_b        = Text(row[2]);
    r.co_access_count = row[3].as<uint64_t>();
    r.strength        = row[4].as<double>();
    r.updated_at_ms   = row[5].as<uint64_t>();
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Sentiment samples
// ------------------------------------------------------------------

Result PgRepository::AppendSentimentSample(Transaction& t, const model::SentimentSampleRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_sentiment_sample", r.owner_id, r.subject_key, r.record_id, r.sentiment, r.source_id,
                               r.recorded_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::SentimentSampleRecord> PgRepository::ListSentimentSamples(Transaction& t, const std::string& owner_id,
                                                                             const std::string& subject_key, uint64_t limit) {
  std::string query = sql::SELECT_SENTIMENT_SAMPLES;
  if (limit > 0) query += " LIMIT " + std::to_string(limit);
  query += ";";

  auto res = TX(t).Work().exec_params(sql::Numbered(query), owner_id, subject_key);

  std::vector<model::SentimentSampleRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::SentimentSampleRecord r;
    r.owner_id       = Text(row[0]);
    r.subject_key    = Text(row[1]);
    r.record_id      = Text(row[2]);
    r.sentiment      = row[3].as<double>();
    r.source_id      = Text(row[4]);
    r.recorded_at_ms = row[5].as<uint64_t>();
    out.push_back(std::move(r));
  }
  return out;
}

} // namespace recall::db::postgres
