#include "sqlite_db.hpp"

#include <stdexcept>

#include "internal/db/sql/migrations.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/db/sql/sql_queries.hpp"

namespace recall::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

namespace {

class SqliteMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

  uint64_t AppliedVersion() override {
    sqlite3_stmt* st = db_.Prepare(sql::SELECT_SCHEMA_VERSION);
    uint64_t      v  = 0;
    if (sqlite3_step(st) == SQLITE_ROW) v = static_cast<uint64_t>(sqlite3_column_int64(st, 0));
    sqlite3_finalize(st);
    return v;
  }

  void MarkApplied(uint64_t version, uint64_t applied_at_ms) override {
    sqlite3_stmt* st = db_.Prepare(sql::INSERT_SCHEMA_VERSION);
    sqlite3_bind_int64(st, 1, static_cast<sqlite3_int64>(version));
    sqlite3_bind_int64(st, 2, static_cast<sqlite3_int64>(applied_at_ms));
    const int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE) throw std::runtime_error(std::string("sqlite mark migration: ") + sqlite3_errmsg(db_.Handle()));
  }

 private:
  SqliteDB& db_;
};

} // namespace

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  sqlite3_extended_result_codes(db_, 1);
  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  ThrowIf(rc, db_, "sqlite prepare");
  return stmt;
}

void SqliteDB::Configure() {
  // IMPORTANT: WAL enables concurrent readers while writer holds lock
  Exec("PRAGMA journal_mode=WAL;");

  // NORMAL is a good tradeoff; use FULL if you want stronger durability
  Exec("PRAGMA synchronous=NORMAL;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
  Exec("PRAGMA cache_size=-20000;"); // ~20MB (negative means KB)
}

std::size_t SqliteDB::Migrate() {
  std::lock_guard<std::mutex> lock(tx_mutex_);
  SqliteMigrationExecutor     executor(*this);
  return sql::RunMigrations(executor, sql::SqliteMigrations());
}

} // namespace recall::db::sqlite
