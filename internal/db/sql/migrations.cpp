#include "migrations.hpp"

#include <stdexcept>
#include <string>

#include "internal/util/time.hpp"

namespace recall::db::sql {

std::size_t RunMigrations(MigrationExecutor& executor, const std::vector<const char*>& ordered_sql) {
  executor.ExecuteSQL("CREATE TABLE IF NOT EXISTS recall_schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms BIGINT NOT NULL);");

  const auto applied = executor.AppliedVersion();
  if (applied > ordered_sql.size()) {
    throw std::runtime_error("database schema version " + std::to_string(applied) + " is newer than this build (" +
                             std::to_string(ordered_sql.size()) + ")");
  }

  std::size_t ran = 0;
  for (std::size_t i = applied; i < ordered_sql.size(); ++i) {
    executor.ExecuteSQL(ordered_sql[i]);
    executor.MarkApplied(i + 1, util::ToUnixMillis(util::Now()));
    ++ran;
  }
  return ran;
}

} // namespace recall::db::sql
