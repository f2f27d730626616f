#include "sqlite_tx.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace recall::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->TxMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) Finish("ROLLBACK;");
}

// Rollback that never throws; the connection must end up in autocommit
// before the tx mutex is handed to the next writer.
void SqliteTransaction::Finish(const char* statement) {
  finished_ = true;
  try {
    db_->Exec(statement);
  } catch (const std::exception& e) {
    RECALL_LOG_WARN("sqlite transaction end failed", {observability::StringField("statement", statement),
                                                      observability::StringField("error", e.what())});
  }
  if (lock_.owns_lock()) lock_.unlock();
}

void SqliteTransaction::Commit() {
  try {
    db_->Exec("COMMIT;");
  } catch (const std::exception&) {
    Finish("ROLLBACK;");
    throw;
  }
  committed_ = true;
  finished_  = true;
  lock_.unlock();
}

void SqliteTransaction::Rollback() {
  Finish("ROLLBACK;");
}

} // namespace recall::db::sqlite
