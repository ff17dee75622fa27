#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace reaper::db::postgres {

/*
  Bounded set of catalog connections shared by the reaper threads.

  A pqxx::connection is used by one transaction at a time. Acquire()
  hands out an idle connection, opens a new one while fewer than
  max_connections exist, and otherwise blocks. The returned shared_ptr
  gives the connection back on release; if the pool is already gone the
  connection is closed instead. Every new connection gets the replica
  statements prepared once.
*/
class PgConnectionPool : public std::enable_shared_from_this<PgConnectionPool> {
 public:
  static constexpr std::size_t kDefaultMaxConnections = 16;

  explicit PgConnectionPool(std::string conninfo, std::size_t max_connections = kDefaultMaxConnections);

  std::shared_ptr<pqxx::connection> Acquire();

 private:
  std::unique_ptr<pqxx::connection> Open();
  std::shared_ptr<pqxx::connection> HandOut(std::unique_ptr<pqxx::connection> conn);
  void                              GiveBack(pqxx::connection* conn);

  const std::string conninfo_;
  const std::size_t capacity_;

  std::mutex                                     mutex_;
  std::condition_variable                        returned_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    opened_ = 0;
};

} // namespace reaper::db::postgres
