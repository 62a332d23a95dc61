#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"

namespace plancast::pipeline {
class RunWorkerPool;
}
namespace plancast::service {
class ProjectService;
}

namespace plancast::factory {

/*
  Application

  Owns every long-lived object of the server process.
*/
struct Application {
  std::shared_ptr<db::Repository>               repository;
  std::shared_ptr<service::ProjectService>      project_service;
  std::shared_ptr<pipeline::RunWorkerPool>      workers;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Selects the configured backend and bootstraps its schema.
  Throws when the backend was not enabled at build time.
*/
std::shared_ptr<db::Repository> BuildRepository(const plancast::runtime::config::RuntimeConfig& config);

/*
  Build

  Composition root: the only place that knows concrete backends. The
  returned workers are already started.
*/
Application Build(const plancast::runtime::config::RuntimeConfig& config);

} // namespace plancast::factory
