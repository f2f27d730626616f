#pragma once

#include <string>

namespace recall::db::sql {

/*
  Canonical SQL used by all backends.

  IMPORTANT:
  These are written with '?' placeholders in a SQLite/Postgres-compatible
  subset. Postgres callers run them through Numbered().
*/

// memory records

#define RECALL_MEMORY_COLUMNS                                                                                            \
  "id,owner_id,kind,subject_name,content,predicate,object,aliases,embedding,embedding_model,importance,sentiment,"      \
  "is_historical,user_pinned,effective_from_ms,expires_at_ms,recurrence_json,sensitivity,status,category,"             \
  "supersedes_id,superseded_by_id,version,revision,access_count,last_accessed_at_ms,decayed_at_ms,created_at_ms,"      \
  "updated_at_ms,sentiment_average"

static constexpr int kMemoryColumnCount = 30;

static constexpr const char* INSERT_MEMORY =
    "INSERT INTO memory_records(" RECALL_MEMORY_COLUMNS ")"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_MEMORY =
    "SELECT " RECALL_MEMORY_COLUMNS " FROM memory_records WHERE id=?;";

// Columns 2..30 followed by id.
static constexpr const char* UPDATE_MEMORY =
    "UPDATE memory_records SET owner_id=?,kind=?,subject_name=?,content=?,predicate=?,object=?,aliases=?,"
    "embedding=?,embedding_model=?,importance=?,sentiment=?,is_historical=?,user_pinned=?,effective_from_ms=?,"
    "expires_at_ms=?,recurrence_json=?,sensitivity=?,status=?,category=?,supersedes_id=?,superseded_by_id=?,"
    "version=?,revision=?,access_count=?,last_accessed_at_ms=?,decayed_at_ms=?,created_at_ms=?,updated_at_ms=?,"
    "sentiment_average=? WHERE id=?;";

static constexpr const char* DELETE_MEMORY =
    "DELETE FROM memory_records WHERE id=?;";

static constexpr const char* SELECT_ACTIVE_BY_SLOT =
    "SELECT " RECALL_MEMORY_COLUMNS " FROM memory_records"
    " WHERE owner_id=? AND lower(trim(subject_name))=? AND lower(trim(predicate))=? AND status=1 AND predicate<>'';";

// Filters are appended as "AND ..." clauses by the caller.
static constexpr const char* SELECT_MEMORIES_BY_OWNER =
    "SELECT " RECALL_MEMORY_COLUMNS " FROM memory_records WHERE owner_id=?";

static constexpr const char* MEMORY_FILTER_STATUS   = " AND status=?";
static constexpr const char* MEMORY_FILTER_SUBJECT  = " AND lower(trim(subject_name))=?";
static constexpr const char* MEMORY_FILTER_CATEGORY = " AND category=?";
static constexpr const char* MEMORY_ORDER           = " ORDER BY created_at_ms, id;";

static constexpr const char* SELECT_OWNERS =
    "SELECT DISTINCT owner_id FROM memory_records ORDER BY owner_id;";

// category summaries

static constexpr const char* UPSERT_SUMMARY =
    "INSERT INTO category_summaries(owner_id,category,summary_text,member_record_ids,member_fingerprint,version,"
    "last_synthesized_at_ms) VALUES(?,?,?,?,?,?,?)"
    " ON CONFLICT(owner_id,category) DO UPDATE SET summary_text=excluded.summary_text,"
    "member_record_ids=excluded.member_record_ids,member_fingerprint=excluded.member_fingerprint,"
    "version=excluded.version,last_synthesized_at_ms=excluded.last_synthesized_at_ms;";

#define RECALL_SUMMARY_COLUMNS \
  "owner_id,category,summary_text,member_record_ids,member_fingerprint,version,last_synthesized_at_ms"

static constexpr const char* SELECT_SUMMARY =
    "SELECT " RECALL_SUMMARY_COLUMNS " FROM category_summaries WHERE owner_id=? AND category=?;";

static constexpr const char* SELECT_SUMMARIES_BY_OWNER =
    "SELECT " RECALL_SUMMARY_COLUMNS " FROM category_summaries WHERE owner_id=? ORDER BY category;";

static constexpr const char* DELETE_SUMMARY =
    "DELETE FROM category_summaries WHERE owner_id=? AND category=?;";

// audit log

#define RECALL_OPERATION_COLUMNS                                                                                      \
  "id,owner_id,operation,merge_strategy,outcome,candidate_text,candidate_json,similar_ids,target_id,result_ids,"     \
  "reasoning,old_content,new_content,snapshot_json,error,job_id,source_id,duration_ms,created_at_ms"

static constexpr const char* INSERT_OPERATION =
    "INSERT INTO memory_operations(" RECALL_OPERATION_COLUMNS ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

// LIMIT is appended by the caller when non-zero.
static constexpr const char* SELECT_OPERATIONS =
    "SELECT " RECALL_OPERATION_COLUMNS " FROM memory_operations WHERE owner_id=? ORDER BY seq DESC";

// maintenance jobs

#define RECALL_JOB_COLUMNS                                                                                            \
  "id,job_type,status,owner_id,payload_json,attempts,max_attempts,scheduled_for_ms,depends_on,last_error,"           \
  "created_at_ms,started_at_ms,completed_at_ms"

static constexpr const char* INSERT_JOB =
    "INSERT INTO maintenance_jobs(" RECALL_JOB_COLUMNS ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_JOB =
    "SELECT " RECALL_JOB_COLUMNS " FROM maintenance_jobs WHERE id=?;";

// Columns 2..13 followed by id.
static constexpr const char* UPDATE_JOB =
    "UPDATE maintenance_jobs SET job_type=?,status=?,owner_id=?,payload_json=?,attempts=?,max_attempts=?,"
    "scheduled_for_ms=?,depends_on=?,last_error=?,created_at_ms=?,started_at_ms=?,completed_at_ms=? WHERE id=?;";

static constexpr const char* SELECT_JOBS =
    "SELECT " RECALL_JOB_COLUMNS " FROM maintenance_jobs ORDER BY scheduled_for_ms, created_at_ms, id;";

static constexpr const char* SELECT_JOBS_BY_STATUS =
    "SELECT " RECALL_JOB_COLUMNS " FROM maintenance_jobs WHERE status=? ORDER BY scheduled_for_ms, created_at_ms, id;";

// access log and relationships

static constexpr const char* INSERT_ACCESS =
    "INSERT INTO memory_accesses(owner_id,record_id,batch_id,accessed_at_ms) VALUES(?,?,?,?);";

static constexpr const char* SELECT_ACCESSES =
    "SELECT owner_id,record_id,batch_id,accessed_at_ms FROM memory_accesses WHERE owner_id=?"
    " ORDER BY accessed_at_ms, batch_id, record_id;";

static constexpr const char* UPSERT_RELATIONSHIP =
    "INSERT INTO memory_relationships(owner_id,record_a,record_b,co_access_count,strength,updated_at_ms)"
    " VALUES(?,?,?,?,?,?) ON CONFLICT(owner_id,record_a,record_b) DO UPDATE SET"
    " co_access_count=excluded.co_access_count,strength=excluded.strength,updated_at_ms=excluded.updated_at_ms;";

static constexpr const char* SELECT_RELATIONSHIPS =
    "SELECT owner_id,record_a,record_b,co_access_count,strength,updated_at_ms FROM memory_relationships"
    " WHERE owner_id=? ORDER BY record_a, record_b;";

// sentiment samples

static constexpr const char* INSERT_SENTIMENT_SAMPLE =
    "INSERT INTO sentiment_samples(owner_id,subject_key,record_id,sentiment,source_id,recorded_at_ms)"
    " VALUES(?,?,?,?,?,?);";

// LIMIT is appended by the caller when non-zero.
static constexpr const char* SELECT_SENTIMENT_SAMPLES =
    "SELECT owner_id,subject_key,record_id,sentiment,source_id,recorded_at_ms FROM sentiment_samples"
    " WHERE owner_id=? AND subject_key=? ORDER BY seq DESC";

// schema version bookkeeping

static constexpr const char* SELECT_SCHEMA_VERSION =
    "SELECT COALESCE(MAX(version),0) FROM recall_schema_migrations;";

static constexpr const char* INSERT_SCHEMA_VERSION =
    "INSERT INTO recall_schema_migrations(version,applied_at_ms) VALUES(?,?);";

// Rewrites '?' placeholders to $1..$n. Quoted literals are left untouched.
inline std::string Numbered(const std::string& sql) {
  std::string out;
  out.reserve(sql.size() + 16);
  bool in_quote = false;
  int  n        = 0;
  for (char c : sql) {
    if (c == '\'') in_quote = !in_quote;
    if (c == '?' && !in_quote) {
      out += '$';
      out += std::to_string(++n);
    } else {
      out += c;
    }
  }
  return out;
}

} // namespace recall::db::sql
