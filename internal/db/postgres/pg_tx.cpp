#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace research::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) {
  conn_ = pool->Acquire();
  tx_   = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      RESEARCH_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
    }
  }
  tx_.reset();
}

void PgTransaction::Commit() {
  tx_->commit();
  finished_ = true;
}

void PgTransaction::Rollback() {
  finished_ = true;
  tx_->abort();
}

} // namespace research::db::postgres
