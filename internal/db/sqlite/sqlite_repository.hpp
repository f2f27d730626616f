#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace recall::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertMemory(Transaction&, const model::MemoryRecord&) override;
  std::optional<model::MemoryRecord> GetMemory(Transaction&, const std::string&) override;
  Result UpdateMemory(Transaction&, const model::MemoryRecord&) override;
  Result DeleteMemory(Transaction&, const std::string&) override;
  std::optional<model::MemoryRecord> GetActiveBySlot(Transaction&, const std::string& owner_id,
                                                     const std::string& subject,
                                                     const std::string& predicate) override;
  std::vector<model::MemoryRecord> ListMemories(Transaction&, const model::MemoryFilter&) override;
  std::vector<std::string> ListOwners(Transaction&) override;

  Result UpsertCategorySummary(Transaction&, const model::CategorySummaryRecord&) override;
  std::optional<model::CategorySummaryRecord> GetCategorySummary(Transaction&, const std::string& owner_id,
                                                                 const std::string& category) override;
  std::vector<model::CategorySummaryRecord> ListCategorySummaries(Transaction&, const std::string& owner_id) override;
  Result DeleteCategorySummary(Transaction&, const std::string& owner_id, const std::string& category) override;

  Result AppendOperation(Transaction&, const model::MemoryOperationRecord&) override;
  std::vector<model::MemoryOperationRecord> ListOperations(Transaction&, const std::string& owner_id,
                                                           uint64_t limit) override;

  Result InsertJob(Transaction&, const model::MaintenanceJobRecord&) override;
  std::optional<model::MaintenanceJobRecord> GetJob(Transaction&, const std::string&) override;
  Result UpdateJob(Transaction&, const model::MaintenanceJobRecord&) override;
  std::vector<model::MaintenanceJobRecord> ListJobs(Transaction&,
                                                    std::optional<recall::memory::v1::JobStatus>) override;

  Result InsertAccess(Transaction&, const model::AccessRecord&) override;
  std::vector<model::AccessRecord> ListAccesses(Transaction&, const std::string& owner_id) override;
  Result UpsertRelationship(Transaction&, const model::RelationshipRecord&) override;
  std::vector<model::RelationshipRecord> ListRelationships(Transaction&, const std::string& owner_id) override;

  Result AppendSentimentSample(Transaction&, const model::SentimentSampleRecord&) override;
  std::vector<model::SentimentSampleRecord> ListSentimentSamples(Transaction&, const std::string& owner_id,
                                                                   const std::string& subject_key, uint64_t limit) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
