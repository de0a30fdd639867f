#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/acquisition/http_fetcher.hpp"
#include "internal/acquisition/pdf_text_extractor.hpp"
#include "internal/acquisition/source_acquisition.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/pipeline/job_queue.hpp"
#include "internal/pipeline/research_worker.hpp"
#include "internal/service/run_service.hpp"

namespace research::factory {

/*
  RuntimeDependencies

  Owns all long-lived singletons used by the CLIs.
  Everything here lives for the lifetime of the process.
*/
struct RuntimeDependencies {
  std::shared_ptr<db::Repository> repository;

  std::shared_ptr<acquisition::HttpFetcher>       fetcher;
  std::shared_ptr<acquisition::PdfTextExtractor>  pdf_extractor;
  std::shared_ptr<acquisition::SourceAcquisition> acquisition;

  std::shared_ptr<pipeline::JobQueue>       job_queue;
  std::shared_ptr<pipeline::ResearchWorker> worker;
  std::shared_ptr<service::RunService>      run_service;
};

/*
  Constructs the repository selected by config.database and bootstraps its
  schema. Throws when the selected backend was not compiled in.
*/
std::shared_ptr<db::Repository> BuildRepository(const research::runtime::config::RuntimeConfig& config);

/*
  BuildRuntime

  Composition root of the application; the only place that knows concrete
  backend and fetcher types. A null fetcher selects libcurl.
*/
RuntimeDependencies BuildRuntime(const research::runtime::config::RuntimeConfig& config,
                                 std::shared_ptr<acquisition::HttpFetcher> fetcher = nullptr);

} // namespace research::factory
