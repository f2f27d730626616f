#pragma once

#include <vector>

namespace recall::db::sql {

/*
  Ordered schema migrations. Entry N is applied once as schema version N+1.
  Applied entries are never edited; schema changes append a new entry.

  The active-slot index is the durable form of the single-active-per-slot
  invariant: the store checks first, the index rejects whatever slips past
  (e.g. a second process).
*/

inline const std::vector<const char*>& SqliteMigrations() {
  static const std::vector<const char*> kMigrations = {
      "CREATE TABLE IF NOT EXISTS memory_records ("
      " id TEXT PRIMARY KEY, owner_id TEXT NOT NULL, kind INTEGER NOT NULL, subject_name TEXT NOT NULL,"
      " content TEXT NOT NULL, predicate TEXT NOT NULL DEFAULT '', object TEXT NOT NULL DEFAULT '',"
      " aliases TEXT NOT NULL DEFAULT '', embedding BLOB, embedding_model TEXT NOT NULL DEFAULT '',"
      " importance REAL NOT NULL, sentiment REAL, is_historical INTEGER NOT NULL, user_pinned INTEGER NOT NULL,"
      " effective_from_ms INTEGER NOT NULL, expires_at_ms INTEGER NOT NULL, recurrence_json TEXT NOT NULL DEFAULT '',"
      " sensitivity INTEGER NOT NULL, status INTEGER NOT NULL, category TEXT NOT NULL DEFAULT '',"
      " supersedes_id TEXT NOT NULL DEFAULT '', superseded_by_id TEXT NOT NULL DEFAULT '',"
      " version INTEGER NOT NULL, revision INTEGER NOT NULL, access_count INTEGER NOT NULL,"
      " last_accessed_at_ms INTEGER NOT NULL, decayed_at_ms INTEGER NOT NULL,"
      " created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);"
      "CREATE UNIQUE INDEX IF NOT EXISTS memory_records_active_slot ON memory_records"
      " (owner_id, (lower(trim(subject_name))), (lower(trim(predicate)))) WHERE status = 1 AND predicate <> '';"
      "CREATE INDEX IF NOT EXISTS memory_records_owner_status ON memory_records(owner_id, status);"
      "CREATE TABLE IF NOT EXISTS category_summaries ("
      " owner_id TEXT NOT NULL, category TEXT NOT NULL, summary_text TEXT NOT NULL,"
      " member_record_ids TEXT NOT NULL, member_fingerprint TEXT NOT NULL, version INTEGER NOT NULL,"
      " last_synthesized_at_ms INTEGER NOT NULL, PRIMARY KEY (owner_id, category));"
      "CREATE TABLE IF NOT EXISTS memory_operations ("
      " seq INTEGER PRIMARY KEY AUTOINCREMENT, id TEXT NOT NULL UNIQUE, owner_id TEXT NOT NULL,"
      " operation INTEGER NOT NULL, merge_strategy INTEGER NOT NULL, outcome INTEGER NOT NULL,"
      " candidate_text TEXT NOT NULL, candidate_json TEXT NOT NULL, similar_ids TEXT NOT NULL,"
      " target_id TEXT NOT NULL, result_ids TEXT NOT NULL, reasoning TEXT NOT NULL,"
      " old_content TEXT NOT NULL, new_content TEXT NOT NULL, snapshot_json TEXT NOT NULL,"
      " error TEXT NOT NULL, job_id TEXT NOT NULL, source_id TEXT NOT NULL,"
      " duration_ms INTEGER NOT NULL, created_at_ms INTEGER NOT NULL);"
      "CREATE INDEX IF NOT EXISTS memory_operations_owner ON memory_operations(owner_id, seq);"
      "CREATE TABLE IF NOT EXISTS maintenance_jobs ("
      " id TEXT PRIMARY KEY, job_type INTEGER NOT NULL, status INTEGER NOT NULL, owner_id TEXT NOT NULL,"
      " payload_json TEXT NOT NULL, attempts INTEGER NOT NULL, max_attempts INTEGER NOT NULL,"
      " scheduled_for_ms INTEGER NOT NULL, depends_on TEXT NOT NULL, last_error TEXT NOT NULL,"
      " created_at_ms INTEGER NOT NULL, started_at_ms INTEGER NOT NULL, completed_at_ms INTEGER NOT NULL);"
      "CREATE INDEX IF NOT EXISTS maintenance_jobs_status ON maintenance_jobs(status, scheduled_for_ms);"
      "CREATE TABLE IF NOT EXISTS memory_accesses ("
      " owner_id TEXT NOT NULL, record_id TEXT NOT NULL, batch_id TEXT NOT NULL, accessed_at_ms INTEGER NOT NULL);"
      "CREATE INDEX IF NOT EXISTS memory_accesses_owner ON memory_accesses(owner_id, batch_id);"
      "CREATE TABLE IF NOT EXISTS memory_relationships ("
      " owner_id TEXT NOT NULL, record_a TEXT NOT NULL, record_b TEXT NOT NULL, co_access_count INTEGER NOT NULL,"
      " strength REAL NOT NULL, updated_at_ms INTEGER NOT NULL, PRIMARY KEY (owner_id, record_a, record_b));",
      "ALTER TABLE memory_records ADD COLUMN sentiment_average REAL;"
      "CREATE TABLE IF NOT EXISTS sentiment_samples ("
      " seq INTEGER PRIMARY KEY AUTOINCREMENT, owner_id TEXT NOT NULL, subject_key TEXT NOT NULL,"
      " record_id TEXT NOT NULL, sentiment REAL NOT NULL, source_id TEXT NOT NULL, recorded_at_ms INTEGER NOT NULL);"
      "CREATE INDEX IF NOT EXISTS sentiment_samples_subject ON sentiment_samples(owner_id, subject_key, seq);",
  };
  return kMigrations;
}

inline const std::vector<const char*>& PostgresMigrations() {
  static const std::vector<const char*> kMigrations = {
      "CREATE TABLE IF NOT EXISTS memory_records ("
      " id TEXT PRIMARY KEY, owner_id TEXT NOT NULL, kind SMALLINT NOT NULL, subject_name TEXT NOT NULL,"
      " content TEXT NOT NULL, predicate TEXT NOT NULL DEFAULT '', object TEXT NOT NULL DEFAULT '',"
      " aliases TEXT NOT NULL DEFAULT '', embedding TEXT NOT NULL DEFAULT '', embedding_model TEXT NOT NULL DEFAULT '',"
      " importance DOUBLE PRECISION NOT NULL, sentiment DOUBLE PRECISION, is_historical BOOLEAN NOT NULL,"
      " user_pinned BOOLEAN NOT NULL, effective_from_ms BIGINT NOT NULL, expires_at_ms BIGINT NOT NULL,"
      " recurrence_json TEXT NOT NULL DEFAULT '', sensitivity SMALLINT NOT NULL, status SMALLINT NOT NULL,"
      " category TEXT NOT NULL DEFAULT '', supersedes_id TEXT NOT NULL DEFAULT '', superseded_by_id TEXT NOT NULL DEFAULT '',"
      " version BIGINT NOT NULL, revision BIGINT NOT NULL, access_count BIGINT NOT NULL,"
      " last_accessed_at_ms BIGINT NOT NULL, decayed_at_ms BIGINT NOT NULL,"
      " created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL);"
      "CREATE UNIQUE INDEX IF NOT EXISTS memory_records_active_slot ON memory_records"
      " (owner_id, (lower(trim(subject_name))), (lower(trim(predicate)))) WHERE status = 1 AND predicate <> '';"
      "CREATE INDEX IF NOT EXISTS memory_records_owner_status ON memory_records(owner_id, status);"
      "CREATE TABLE IF NOT EXISTS category_summaries ("
      " owner_id TEXT NOT NULL, category TEXT NOT NULL, summary_text TEXT NOT NULL,"
      " member_record_ids TEXT NOT NULL, member_fingerprint TEXT NOT NULL, version BIGINT NOT NULL,"
      " last_synthesized_at_ms BIGINT NOT NULL, PRIMARY KEY (owner_id, category));"
      "CREATE TABLE IF NOT EXISTS memory_operations ("
      " seq BIGSERIAL PRIMARY KEY, id TEXT NOT NULL UNIQUE, owner_id TEXT NOT NULL,"
      " operation SMALLINT NOT NULL, merge_strategy SMALLINT NOT NULL, outcome SMALLINT NOT NULL,"
      " candidate_text TEXT NOT NULL, candidate_json TEXT NOT NULL, similar_ids TEXT NOT NULL,"
      " target_id TEXT NOT NULL, result_ids TEXT NOT NULL, reasoning TEXT NOT NULL,"
      " old_content TEXT NOT NULL, new_content TEXT NOT NULL, snapshot_json TEXT NOT NULL,"
      " error TEXT NOT NULL, job_id TEXT NOT NULL, source_id TEXT NOT NULL,"
      " duration_ms BIGINT NOT NULL, created_at_ms BIGINT NOT NULL);"
      "CREATE INDEX IF NOT EXISTS memory_operations_owner ON memory_operations(owner_id, seq);"
      "CREATE TABLE IF NOT EXISTS maintenance_jobs ("
      " id TEXT PRIMARY KEY, job_type SMALLINT NOT NULL, status SMALLINT NOT NULL, owner_id TEXT NOT NULL,"
      " payload_json TEXT NOT NULL, attempts INTEGER NOT NULL, max_attempts INTEGER NOT NULL,"
      " scheduled_for_ms BIGINT NOT NULL, depends_on TEXT NOT NULL, last_error TEXT NOT NULL,"
      " created_at_ms BIGINT NOT NULL, started_at_ms BIGINT NOT NULL, completed_at_ms BIGINT NOT NULL);"
      "CREATE INDEX IF NOT EXISTS maintenance_jobs_status ON maintenance_jobs(status, scheduled_for_ms);"
      "CREATE TABLE IF NOT EXISTS memory_accesses ("
      " owner_id TEXT NOT NULL, record_id TEXT NOT NULL, batch_id TEXT NOT NULL, accessed_at_ms BIGINT NOT NULL);"
      "CREATE INDEX IF NOT EXISTS memory_accesses_owner ON memory_accesses(owner_id, batch_id);"
      "CREATE TABLE IF NOT EXISTS memory_relationships ("
      " owner_id TEXT NOT NULL, record_a TEXT NOT NULL, record_b TEXT NOT NULL, co_access_count BIGINT NOT NULL,"
      " strength DOUBLE PRECISION NOT NULL, updated_at_ms BIGINT NOT NULL, PRIMARY KEY (owner_id, record_a, record_b));",
      "ALTER TABLE memory_records ADD COLUMN IF NOT EXISTS sentiment_average DOUBLE PRECISION;"
      "CREATE TABLE IF NOT EXISTS sentiment_samples ("
      " seq BIGSERIAL PRIMARY KEY, owner_id TEXT NOT NULL, subject_key TEXT NOT NULL, record_id TEXT NOT NULL,"
      " sentiment DOUBLE PRECISION NOT NULL, source_id TEXT NOT NULL, recorded_at_ms BIGINT NOT NULL);"
      "CREATE INDEX IF NOT EXISTS sentiment_samples_subject ON sentiment_samples(owner_id, subject_key, seq);",
  };
  return kMigrations;
}

} // namespace recall::db::sql
