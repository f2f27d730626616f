#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace recall::db::postgres {

/*
  Bounded pool of libpqxx connections.

  A PgTransaction holds one connection for its whole life; the shared_ptr
  deleter hands it back (or drops it when the link broke). At most
  max_connections are open; Acquire blocks when all are in use. Every
  connection has the recall statements prepared once, when dialed.

  Migrate() runs on its own short-lived connection before the pool serves
  transactions.
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  // database.postgres.max_connections, 8 unless configured.
  explicit PgPool(std::string conninfo, std::size_t max_connections = 8);

  std::shared_ptr<pqxx::connection> Acquire();

  // Applies pending schema migrations; returns how many ran.
  std::size_t Migrate();

 private:
  static void                       PrepareStatements(pqxx::connection& conn);
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string conninfo_;
  std::size_t max_connections_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace recall::db::postgres
