#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace recall::db::postgres {

/*
  One pooled connection plus one REPEATABLE READ transaction.

  Two writers touching the same memory row surface as SQLSTATE 40001:
  mid-transaction as ErrorCode::SerializationFailure from the repository,
  at commit as CommitConflict. Either way the caller reruns on a fresh
  snapshot. The active-slot unique index still decides ties between two
  inserts into an empty slot.
*/
class PgTransaction final : public db::Transaction {
 public:
  using Txn = pqxx::transaction<pqxx::isolation_level::repeatable_read>;

  explicit PgTransaction(std::shared_ptr<PgPool> pool);
  ~PgTransaction() override;

  Txn& Work() {
    return *tx_;
  }

  // Runs fn(pqxx::subtransaction&) under a savepoint so a constraint
  // violation fails only this statement, not the whole transaction.
  template <typename Fn>
  pqxx::result Savepoint(Fn&& fn) {
    pqxx::subtransaction sub(*tx_);
    auto                 res = fn(sub);
    sub.commit();
    return res;
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

 private:
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<Txn>              tx_;
  bool                              committed_ = false;
  bool                              finished_  = false;
};

} // namespace recall::db::postgres
