#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/access_record.hpp"
#include "internal/db/model/category_summary_record.hpp"
#include "internal/db/model/maintenance_job_record.hpp"
#include "internal/db/model/memory_operation_record.hpp"
#include "internal/db/model/memory_record.hpp"
#include "internal/db/model/relationship_record.hpp"
#include "internal/db/model/sentiment_sample_record.hpp"

namespace recall::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes happen inside a Transaction
  - Reads inside a transaction see its writes
  - At most one ACTIVE memory row per (owner, lower(trim(subject)),
    lower(predicate)) when predicate is non-empty; violations surface as
    ConstraintViolation
  - The operation log is append-only

  The DB is the source of truth for:
    memory records and their version chains
    category summaries
    the audit log
    the maintenance job queue
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Memory records
  // ---------------------------------------------------------------------

  virtual Result InsertMemory(Transaction&, const model::MemoryRecord&) = 0;

  virtual std::optional<model::MemoryRecord> GetMemory(Transaction&, const std::string& id) = 0;

  virtual Result UpdateMemory(Transaction&, const model::MemoryRecord&) = 0;

  // Physical removal; only used for explicit hard deletes.
  virtual Result DeleteMemory(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::MemoryRecord> GetActiveBySlot(Transaction&, const std::string& owner_id, const std::string& subject,
                                                             const std::string& predicate) = 0;

  virtual std::vector<model::MemoryRecord> ListMemories(Transaction&, const model::MemoryFilter& filter) = 0;

  virtual std::vector<std::string> ListOwners(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Category summaries
  // ---------------------------------------------------------------------

  virtual Result UpsertCategorySummary(Transaction&, const model::CategorySummaryRecord&) = 0;

  virtual std::optional<model::CategorySummaryRecord> GetCategorySummary(Transaction&, const std::string& owner_id,
                                                                         const std::string& category) = 0;

  virtual std::vector<model::CategorySummaryRecord> ListCategorySummaries(Transaction&, const std::string& owner_id) = 0;

  virtual Result DeleteCategorySummary(Transaction&, const std::string& owner_id, const std::string& category) = 0;

  // ---------------------------------------------------------------------
  // Audit log (append-only)
  // ---------------------------------------------------------------------

  virtual Result AppendOperation(Transaction&, const model::MemoryOperationRecord&) = 0;

  // Newest first; limit 0 = all.
  virtual std::vector<model::MemoryOperationRecord> ListOperations(Transaction&, const std::string& owner_id, uint64_t limit) = 0;

  // ---------------------------------------------------------------------
  // Maintenance jobs
  // ---------------------------------------------------------------------

  virtual Result InsertJob(Transaction&, const model::MaintenanceJobRecord&) = 0;

  virtual std::optional<model::MaintenanceJobRecord> GetJob(Transaction&, const std::string& id) = 0;

  virtual Result UpdateJob(Transaction&, const model::MaintenanceJobRecord&) = 0;

  // Ordered by scheduled_for, then created_at.
  virtual std::vector<model::MaintenanceJobRecord> ListJobs(Transaction&, std::optional<recall::memory::v1::JobStatus> status) = 0;

  // ---------------------------------------------------------------------
  // Access log and co-access relationships
  // ---------------------------------------------------------------------

  virtual Result InsertAccess(Transaction&, const model::AccessRecord&) = 0;

  virtual std::vector<model::AccessRecord> ListAccesses(Transaction&, const std::string& owner_id) = 0;

  virtual Result UpsertRelationship(Transaction&, const model::RelationshipRecord&) = 0;

  virtual std::vector<model::RelationshipRecord> ListRelationships(Transaction&, const std::string& owner_id) = 0;

  // ---------------------------------------------------------------------
  // Sentiment samples (append-only)
  // ---------------------------------------------------------------------

  virtual Result AppendSentimentSample(Transaction&, const model::SentimentSampleRecord&) = 0;

  // Newest first; limit 0 = all.
  virtual std::vector<model::SentimentSampleRecord> ListSentimentSamples(Transaction&, const std::string& owner_id,
                                                                         const std::string& subject_key, uint64_t limit) = 0;
};

} // namespace recall::db
