#include "pg_pool.hpp"

#include "internal/db/sql/migrations.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/db/sql/sql_queries.hpp"

namespace recall::db::postgres {

namespace {

class PgMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit PgMigrationExecutor(pqxx::connection& conn) : conn_(conn) {
  }

  void ExecuteSQL(const std::string& sql) override {
    pqxx::work tx(conn_);
    tx.exec(sql);
    tx.commit();
  }

  uint64_t AppliedVersion() override {
    pqxx::work tx(conn_);
    auto       res = tx.exec(sql::SELECT_SCHEMA_VERSION);
    tx.commit();
    return res.empty() ? 0 : res[0][0].as<uint64_t>();
  }

  void MarkApplied(uint64_t version, uint64_t applied_at_ms) override {
    pqxx::work tx(conn_);
    tx.exec_params(sql::Numbered(sql::INSERT_SCHEMA_VERSION), version, applied_at_ms);
    tx.commit();
  }

 private:
  pqxx::connection& conn_;
};

} // namespace

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn.release());
        } catch (const std::exception&) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

std::size_t PgPool::Migrate() {
  pqxx::connection    conn(conninfo_);
  PgMigrationExecutor executor(conn);
  return sql::RunMigrations(executor, sql::PostgresMigrations());
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("insert_memory", sql::Numbered(sql::INSERT_MEMORY));
  conn.prepare("select_memory", sql::Numbered(sql::SELECT_MEMORY));
  conn.prepare("update_memory", sql::Numbered(sql::UPDATE_MEMORY));
  conn.prepare("delete_memory", sql::Numbered(sql::DELETE_MEMORY));
  conn.prepare("select_active_by_slot", sql::Numbered(sql::SELECT_ACTIVE_BY_SLOT));

  conn.prepare("upsert_summary", sql::Numbered(sql::UPSERT_SUMMARY));
  conn.prepare("select_summary", sql::Numbered(sql::SELECT_SUMMARY));
  conn.prepare("select_summaries", sql::Numbered(sql::SELECT_SUMMARIES_BY_OWNER));
  conn.prepare("delete_summary", sql::Numbered(sql::DELETE_SUMMARY));

  conn.prepare("insert_operation", sql::Numbered(sql::INSERT_OPERATION));

  conn.prepare("insert_job", sql::Numbered(sql::INSERT_JOB));
  conn.prepare("select_job", sql::Numbered(sql::SELECT_JOB));
  conn.prepare("update_job", sql::Numbered(sql::UPDATE_JOB));

  conn.prepare("insert_access", sql::Numbered(sql::INSERT_ACCESS));
  conn.prepare("select_accesses", sql::Numbered(sql::SELECT_ACCESSES));
  conn.prepare("upsert_relationship", sql::Numbered(sql::UPSERT_RELATIONSHIP));
  conn.prepare("select_relationships", sql::Numbered(sql::SELECT_RELATIONSHIPS));

  conn.prepare("insert_sentiment_sample", sql::Numbered(sql::INSERT_SENTIMENT_SAMPLE));
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  std::unique_ptr<pqxx::connection> owned(conn);
  {
    std::lock_guard lock(mutex_);
    if (owned->is_open()) {
      idle_.push_back(std::move(owned));
    } else {
      // Broken connection: free its slot so the next Acquire dials a new one.
      --live_connections_;
    }
  }
  cv_.notify_one();
}

} // namespace recall::db::postgres
