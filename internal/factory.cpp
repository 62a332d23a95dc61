#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/config/runtime_options.hpp"
#include "internal/core/project_state_machine.hpp"
#include "internal/core/user_registry.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/geometry/sidecar_geometry_extractor.hpp"
#include "internal/grpc/project_server.hpp"
#include "internal/lease/run_lease_table.hpp"
#include "internal/modeling/model_builder.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pipeline/run_scheduler.hpp"
#include "internal/pipeline/run_worker_pool.hpp"
#include "internal/quota/quota_gate.hpp"
#include "internal/scaling/coordinate_scaler.hpp"
#include "internal/service/project_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/storage/artifact_store.hpp"
#include "internal/usage/usage_ledger.hpp"
#if PLANCAST_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if PLANCAST_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace plancast::factory {

using namespace plancast;
using plancast::observability::StringField;

std::shared_ptr<db::Repository> BuildRepository(const plancast::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if PLANCAST_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    sqlite_db->BootstrapSchema();
    PLANCAST_LOG_INFO("using sqlite repository", {StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if PLANCAST_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() > 0 ? database.postgres().max_connections() : 16u;
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    pool->BootstrapSchema();
    PLANCAST_LOG_INFO("using postgres repository");
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  PLANCAST_LOG_WARN("using in-memory repository; state is lost on exit");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const plancast::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Persistence
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  auto artifacts = std::make_shared<storage::ArtifactStore>(config::ToArtifactStoreOptions(config.storage()));
  auto ledger    = std::make_shared<usage::UsageLedger>(app.repository);

  // ------------------------------------------------------------------
  // Pipeline stages
  // ------------------------------------------------------------------
  auto writers = modeling::MeshWriterRegistry::WithDefaults();

  core::PipelineStages stages;
  stages.extractor = std::make_shared<geometry::SidecarGeometryExtractor>(config::ToSidecarOptions(config.geometry()));
  stages.scaler    = std::make_shared<scaling::CoordinateScaler>(config::ToScalerOptions(config.pipeline()));
  stages.builder   = std::make_shared<modeling::ModelBuilder>(config::ToModelBuilderOptions(config.pipeline()), artifacts, writers);

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  auto quota    = std::make_shared<quota::QuotaGate>(ledger, config::ToQuotaPolicy(config.quota()));
  auto users    = std::make_shared<core::UserRegistry>(app.repository);
  auto leases   = lease::RunLeaseTable::Create();
  auto projects = std::make_shared<core::ProjectStateMachine>(app.repository, quota, ledger, leases, std::move(stages),
                                                              config::ToPipelineOptions(config, *writers));

  // ------------------------------------------------------------------
  // Run workers
  // ------------------------------------------------------------------
  auto scheduler = std::make_shared<pipeline::RunScheduler>();
  app.workers    = std::make_shared<pipeline::RunWorkerPool>(scheduler, projects, config::ToWorkerCount(config.workers()));
  app.workers->Start();

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.users            = users;
  ctx.projects         = projects;
  ctx.scheduler        = scheduler;
  ctx.quota            = quota;
  ctx.ledger           = ledger;
  ctx.record_api_calls = config.usage().record_api_calls();

  app.project_service = std::make_shared<service::ProjectService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::ProjectServer>(app.project_service));

  return app;
}

} // namespace plancast::factory
