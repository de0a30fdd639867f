#pragma once

#include <memory>

#include "config/config.pb.h"

namespace research::db {
class Repository;
}
namespace research::pipeline {
class JobQueue;
}

namespace research::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<research::db::Repository>       repository;
  std::shared_ptr<research::pipeline::JobQueue>   jobs;
  research::runtime::config::WorkerConfig         worker;
  research::runtime::config::RankingConfig        ranking;
};

} // namespace research::service
