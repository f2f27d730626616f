#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace recall::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) : conn_(pool->Acquire()), tx_(std::make_unique<Txn>(*conn_)) {
}

PgTransaction::~PgTransaction() {
  if (finished_) return;
  try {
    tx_->abort();
  } catch (const std::exception& e) {
    RECALL_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
  }
}

void PgTransaction::Commit() {
  finished_ = true;
  try {
    tx_->commit();
  } catch (const pqxx::serialization_failure& e) {
    throw CommitConflict(e.what());
  }
  committed_ = true;
}

void PgTransaction::Rollback() {
  finished_ = true;
  tx_->abort();
}

} // namespace recall::db::postgres
