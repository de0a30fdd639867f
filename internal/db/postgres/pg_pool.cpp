#include "pg_pool.hpp"

namespace research::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  std::unique_ptr<pqxx::connection> conn;
  try {
    conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
  } catch (const std::exception&) {
    std::lock_guard rollback_lock(mutex_);
    --live_connections_;
    cv_.notify_one();
    throw;
  }
  return Wrap(conn.release());
}

// Claim in one statement; SKIP LOCKED lets concurrent workers pass each other.
void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("claim_next_job",
               "UPDATE jobs SET status='running', locked_at_ms=$1, locked_by=$2, updated_at_ms=$1 "
               "WHERE id = (SELECT id FROM jobs "
               "WHERE (status='queued' AND next_retry_at_ms<=$1) OR (status='running' AND locked_at_ms<$3) "
               "ORDER BY created_at_ms, id LIMIT 1 FOR UPDATE SKIP LOCKED) "
               "RETURNING id,tenant_id,run_id,job_type,status,attempt_count,max_attempts,next_retry_at_ms,locked_at_ms,"
               "locked_by,cancel_requested,last_error,created_at_ms,updated_at_ms");
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
  {
    std::lock_guard lock(mutex_);
    if (conn->is_open()) {
      idle_.emplace_back(conn);
    } else {
      delete conn;
      --live_connections_;
    }
  }
  cv_.notify_one();
}

} // namespace research::db::postgres
