#pragma once

#include <stdexcept>
#include <string>

namespace recall::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed

  SQLite: BEGIN IMMEDIATE (one writer at a time)
  Postgres: pqxx::work
  Memory: snapshot copy-on-write, optimistic commit
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically; throws CommitConflict when an optimistic
  // backend lost the race, in which case nothing was applied
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;
};

// Raised by Commit() when a concurrent transaction committed first.
class CommitConflict : public std::runtime_error {
public:
  explicit CommitConflict(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace recall::db
