#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace recall::db::sqlite {

/*
  BEGIN IMMEDIATE transaction on the shared connection.

  SQLite allows one writer; the connection's tx mutex serializes recall's
  transactions in-process, so CommitConflict never occurs here and a second
  Begin() blocks until the first transaction commits or rolls back. The
  mutex is released as soon as the transaction finishes, not at
  destruction.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

 private:
  // Runs statement, logs instead of throwing, releases the tx mutex.
  void Finish(const char* statement);

  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> lock_;
  bool                         committed_ = false;
  bool                         finished_  = false;
};

} // namespace recall::db::sqlite
