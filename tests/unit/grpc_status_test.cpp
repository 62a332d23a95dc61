#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/core/project_state_machine.hpp"
#include "internal/core/user_registry.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/geometry/geometry_extractor.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/project_server.hpp"
#include "internal/modeling/model_builder.hpp"
#include "internal/pipeline/run_scheduler.hpp"
#include "internal/quota/quota_gate.hpp"
#include "internal/scaling/coordinate_scaler.hpp"
#include "internal/service/project_service.hpp"
#include "internal/storage/artifact_store.hpp"
#include "internal/usage/usage_ledger.hpp"
#include "plancast/v1.hpp"

namespace {

using namespace plancast::v1;

class FixedExtractor final : public plancast::geometry::GeometryExtractor {
 public:
  plancast::model::RawGeometry Extract(const std::filesystem::path&) override {
    plancast::model::RawGeometry raw;
    raw.rooms.push_back({"hall", {{0, 0}, {200, 0}, {200, 100}, {0, 100}}});
    return raw;
  }
};

// No workers: RunProject leaves queued tasks holding their leases.
struct Fixture {
  std::shared_ptr<plancast::db::memory::MemoryRepository> repository = std::make_shared<plancast::db::memory::MemoryRepository>();
  plancast::service::ServiceContext                       ctx;
  std::unique_ptr<plancast::grpc::ProjectServer>          server;

  explicit Fixture(plancast::quota::QuotaPolicy policy = {}, bool record_api_calls = false) {
    auto artifacts = std::make_shared<plancast::storage::ArtifactStore>(
        plancast::storage::ArtifactStoreOptions{std::filesystem::temp_directory_path() / "plancast_grpc_status_tests", false});

    plancast::core::PipelineStages stages;
    stages.extractor = std::make_shared<FixedExtractor>();
    stages.scaler    = std::make_shared<plancast::scaling::CoordinateScaler>();
    stages.builder   = std::make_shared<plancast::modeling::ModelBuilder>(plancast::modeling::ModelBuilderOptions{}, artifacts);

    ctx.ledger           = std::make_shared<plancast::usage::UsageLedger>(repository);
    ctx.quota            = std::make_shared<plancast::quota::QuotaGate>(ctx.ledger, policy);
    ctx.users            = std::make_shared<plancast::core::UserRegistry>(repository);
    ctx.scheduler        = std::make_shared<plancast::pipeline::RunScheduler>();
    ctx.projects         = std::make_shared<plancast::core::ProjectStateMachine>(repository, ctx.quota, ctx.ledger,
                                                                         plancast::lease::RunLeaseTable::Create(), std::move(stages),
                                                                         plancast::core::PipelineOptions{});
    ctx.record_api_calls = record_api_calls;

    server = std::make_unique<plancast::grpc::ProjectServer>(std::make_shared<plancast::service::ProjectService>(ctx));
  }

  uint64_t RegisterUser(const std::string& email) {
    RegisterUserRequest  req;
    RegisterUserResponse resp;
    req.set_email(email);
    ::grpc::ServerContext grpc_ctx;
    const auto            status = server->RegisterUser(&grpc_ctx, &req, &resp);
    assert(status.ok());
    return resp.user().id();
  }

  ::grpc::Status CreateProject(uint64_t user_id, double size_mb, const std::string& format, CreateProjectResponse* resp) {
    CreateProjectRequest req;
    req.set_user_id(user_id);
    req.mutable_input()->set_filename("upload-1.png");
    req.mutable_input()->set_original_filename("floor.png");
    req.mutable_input()->set_input_path("/uploads/upload-1.png");
    req.mutable_input()->set_file_size_mb(size_mb);
    req.mutable_input()->set_file_format(format);
    req.mutable_scale_reference()->mutable_length()->set_pixel_length(100);
    req.mutable_scale_reference()->mutable_length()->set_real_length(5.0);
    ::grpc::ServerContext grpc_ctx;
    return server->CreateProject(&grpc_ctx, &req, resp);
  }

  uint64_t CreatedProject(uint64_t user_id) {
    CreateProjectResponse resp;
    assert(CreateProject(user_id, 1.0, "png", &resp).ok());
    return resp.project().id();
  }

  ::grpc::Status RunProject(uint64_t project_id, RunProjectResponse* resp) {
    RunProjectRequest req;
    req.set_project_id(project_id);
    ::grpc::ServerContext grpc_ctx;
    return server->RunProject(&grpc_ctx, &req, resp);
  }

  ::grpc::Status GetStatus(uint64_t project_id, GetProjectStatusResponse* resp) {
    GetProjectStatusRequest req;
    req.set_project_id(project_id);
    ::grpc::ServerContext grpc_ctx;
    return server->GetProjectStatus(&grpc_ctx, &req, resp);
  }
};

void TestMissingProjectReturnsNotFound() {
  Fixture                  fx;
  GetProjectStatusResponse resp;
  const auto               status = fx.GetStatus(404, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(status.error_message().find("404") != std::string::npos);
}

void TestZeroIdsAndBadInputReturnInvalidArgument() {
  Fixture fx;

  GetProjectStatusResponse status_resp;
  assert(fx.GetStatus(0, &status_resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  ListProjectsRequest   list_req;
  ListProjectsResponse  list_resp;
  ::grpc::ServerContext grpc_ctx;
  assert(fx.server->ListProjects(&grpc_ctx, &list_req, &list_resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  const auto            user = fx.RegisterUser("drafter@example.com");
  CreateProjectResponse create_resp;
  assert(fx.CreateProject(user, 1.0, "gif", &create_resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(fx.CreateProject(user, 0.0, "png", &create_resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  RegisterUserRequest  bad_email;
  RegisterUserResponse register_resp;
  bad_email.set_email("not-an-address");
  ::grpc::ServerContext register_ctx;
  assert(fx.server->RegisterUser(&register_ctx, &bad_email, &register_resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestDuplicateEmailReturnsAlreadyExists() {
  Fixture fx;
  fx.RegisterUser("dup@example.com");

  RegisterUserRequest  req;
  RegisterUserResponse resp;
  req.set_email("dup@example.com");
  ::grpc::ServerContext grpc_ctx;
  assert(fx.server->RegisterUser(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
}

void TestQuotaDenialReturnsResourceExhausted() {
  plancast::quota::QuotaPolicy policy;
  policy.free = {5, 2.0, 0.0};
  Fixture fx(policy);

  const auto            user = fx.RegisterUser("small@example.com");
  CreateProjectResponse resp;
  const auto            status = fx.CreateProject(user, 3.0, "png", &resp);
  assert(status.error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);
  assert(status.error_details() == "DENY_REASON_FILE_TOO_LARGE");

  ListProjectsRequest list_req;
  list_req.set_user_id(user);
  ListProjectsResponse  list_resp;
  ::grpc::ServerContext grpc_ctx;
  assert(fx.server->ListProjects(&grpc_ctx, &list_req, &list_resp).ok());
  assert(list_resp.projects_size() == 0);
}

void TestSecondRunReturnsAborted() {
  Fixture    fx;
  const auto user    = fx.RegisterUser("runner@example.com");
  const auto project = fx.CreatedProject(user);

  RunProjectResponse first;
  assert(fx.RunProject(project, &first).ok());
  assert(first.snapshot().status() == PROJECT_STATUS_PROCESSING);
  assert(fx.ctx.scheduler->Pending() == 1);

  RunProjectResponse second;
  assert(fx.RunProject(project, &second).error_code() == ::grpc::StatusCode::ABORTED);
  assert(fx.ctx.scheduler->Pending() == 1);
}

void TestResetOfPendingReturnsFailedPrecondition() {
  Fixture    fx;
  const auto project = fx.CreatedProject(fx.RegisterUser("reset@example.com"));

  ResetProjectRequest req;
  req.set_project_id(project);
  ResetProjectResponse  resp;
  ::grpc::ServerContext grpc_ctx;
  assert(fx.server->ResetProject(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);

  CancelProjectRequest cancel_req;
  cancel_req.set_project_id(project);
  CancelProjectResponse cancel_resp;
  ::grpc::ServerContext cancel_ctx;
  assert(fx.server->CancelProject(&cancel_ctx, &cancel_req, &cancel_resp).ok());
  assert(cancel_resp.snapshot().status() == PROJECT_STATUS_CANCELLED);

  RunProjectResponse run_resp;
  assert(fx.RunProject(project, &run_resp).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestRunAfterShutdownReturnsUnavailableAndCancels() {
  Fixture    fx;
  const auto user    = fx.RegisterUser("late@example.com");
  const auto project = fx.CreatedProject(user);

  fx.ctx.scheduler->Shutdown();

  RunProjectResponse run_resp;
  assert(fx.RunProject(project, &run_resp).error_code() == ::grpc::StatusCode::UNAVAILABLE);

  GetProjectStatusResponse status_resp;
  assert(fx.GetStatus(project, &status_resp).ok());
  assert(status_resp.snapshot().status() == PROJECT_STATUS_CANCELLED);
  assert(!status_resp.snapshot().has_started_at());

  // work that never started is not charged
  const auto uploads = fx.ctx.ledger->SumForPeriod(user, USAGE_ACTION_UPLOAD, std::chrono::hours(24));
  assert(uploads.count() == 0);
}

void TestApiCallsAreRecordedWhenEnabled() {
  Fixture    fx({}, true);
  const auto user    = fx.RegisterUser("metered@example.com");
  const auto project = fx.CreatedProject(user);

  GetProjectStatusResponse status_resp;
  assert(fx.GetStatus(project, &status_resp).ok());
  assert(fx.GetStatus(999, &status_resp).error_code() == ::grpc::StatusCode::NOT_FOUND);

  GetUsageSummaryRequest req;
  req.set_user_id(user);
  GetUsageSummaryResponse resp;
  ::grpc::ServerContext   grpc_ctx;
  assert(fx.server->GetUsageSummary(&grpc_ctx, &req, &resp).ok());

  // register, create, status, summary; the failed status call is not counted
  const auto calls = fx.ctx.ledger->SumForPeriod(user, USAGE_ACTION_API_CALL, std::chrono::hours(24));
  assert(calls.count() == 4);
}

void TestUnknownErrorsMapToInternal() {
  const auto status = plancast::grpc::ToStatus(std::runtime_error("disk on fire"));
  assert(status.error_code() == ::grpc::StatusCode::INTERNAL);
  assert(status.error_message() == "disk on fire");

  const auto quota = plancast::grpc::ToStatus(plancast::util::QuotaExceeded(DENY_REASON_INACTIVE_ACCOUNT, "account disabled"));
  assert(quota.error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);
  assert(quota.error_details() == "DENY_REASON_INACTIVE_ACCOUNT");
}

} // namespace

int main() {
  TestMissingProjectReturnsNotFound();
  TestZeroIdsAndBadInputReturnInvalidArgument();
  TestDuplicateEmailReturnsAlreadyExists();
  TestQuotaDenialReturnsResourceExhausted();
  TestSecondRunReturnsAborted();
  TestResetOfPendingReturnsFailedPrecondition();
  TestRunAfterShutdownReturnsUnavailableAndCancels();
  TestApiCallsAreRecordedWhenEnabled();
  TestUnknownErrorsMapToInternal();

  std::cout << "plancast_unit_grpc_status: pass\n";
  return 0;
}
