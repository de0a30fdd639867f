#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/acquisition/curl_http_fetcher.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#if RESEARCH_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if RESEARCH_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace research::factory {

namespace {

#if RESEARCH_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);
  for (const auto& sql : db::sql::PostgresSchema()) {
    tx.exec(sql);
  }
  tx.commit();
}
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const research::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if RESEARCH_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    sqlite_db->Bootstrap(db::sql::SqliteSchema());
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if RESEARCH_DB_POSTGRES
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), database.postgres().max_connections());
    BootstrapPostgresSchema(pool);
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

RuntimeDependencies BuildRuntime(const research::runtime::config::RuntimeConfig& config, std::shared_ptr<acquisition::HttpFetcher> fetcher) {
  RuntimeDependencies deps;

  // ------------------------------------------------------------------
  // Persistence
  // ------------------------------------------------------------------
  deps.repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Acquisition
  // ------------------------------------------------------------------
  deps.fetcher       = fetcher ? std::move(fetcher) : std::make_shared<acquisition::CurlHttpFetcher>();
  deps.pdf_extractor = std::make_shared<acquisition::PdftotextExtractor>(config.fetch().pdftotext_path());
  deps.acquisition   = std::make_shared<acquisition::SourceAcquisition>(deps.fetcher, deps.pdf_extractor, config.fetch());

  // ------------------------------------------------------------------
  // Pipeline
  // ------------------------------------------------------------------
  deps.job_queue = std::make_shared<pipeline::JobQueue>(deps.repository, config.worker());

  pipeline::PipelineServices services;
  services.acquisition = deps.acquisition;
  services.worker      = config.worker();
  services.ranking     = config.ranking();
  deps.worker          = std::make_shared<pipeline::ResearchWorker>(deps.repository, deps.job_queue, services);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.repository   = deps.repository;
  ctx.jobs         = deps.job_queue;
  ctx.worker       = config.worker();
  ctx.ranking      = config.ranking();
  deps.run_service = std::make_shared<service::RunService>(ctx);

  return deps;
}

} // namespace research::factory
