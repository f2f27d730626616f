#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace recall::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements the executor; RunMigrations tracks applied versions
  in recall_schema_migrations.
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;

  // Highest applied version, 0 when none.
  virtual uint64_t AppliedVersion() = 0;

  virtual void MarkApplied(uint64_t version, uint64_t applied_at_ms) = 0;
};

/*
  Runs migrations in order, skipping already applied ones.
  Returns the number of migrations applied. Throws std::runtime_error when
  the database was migrated by a newer build.
*/

std::size_t RunMigrations(MigrationExecutor& executor, const std::vector<const char*>& ordered_sql);

} // namespace recall::db::sql
