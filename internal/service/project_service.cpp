#include "project_service.hpp"

#include <chrono>
#include <optional>
#include <stdexcept>
#include <type_traits>

#include "internal/core/project_state_machine.hpp"
#include "internal/core/user_registry.hpp"
#include "internal/model/metadata.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/pipeline/run_scheduler.hpp"
#include "internal/quota/quota_gate.hpp"
#include "internal/usage/usage_ledger.hpp"
#include "internal/util/errors.hpp"

namespace plancast::service {

using namespace plancast::v1;
using plancast::observability::IntField;
using plancast::observability::StringField;

namespace {

constexpr std::string_view kRegisterUser     = "ProjectService.RegisterUser";
constexpr std::string_view kUpdateUser       = "ProjectService.UpdateUser";
constexpr std::string_view kCreateProject    = "ProjectService.CreateProject";
constexpr std::string_view kRunProject       = "ProjectService.RunProject";
constexpr std::string_view kCancelProject    = "ProjectService.CancelProject";
constexpr std::string_view kResetProject     = "ProjectService.ResetProject";
constexpr std::string_view kGetProjectStatus = "ProjectService.GetProjectStatus";
constexpr std::string_view kListProjects     = "ProjectService.ListProjects";
constexpr std::string_view kGetUsageSummary  = "ProjectService.GetUsageSummary";

double ElapsedMs(std::chrono::steady_clock::time_point started_at) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
}

template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view id_key, uint64_t id, Fn&& fn) {
  plancast::observability::SpanScope span(route);
  span.SetAttribute(id_key, static_cast<int64_t>(id));

  auto&       metrics    = plancast::observability::Metrics::Instance();
  const auto started_at = std::chrono::steady_clock::now();
  try {
    auto result = fn();
    metrics.RecordRequest(route, true);
    metrics.ObserveRequestLatencyMs(route, ElapsedMs(started_at));
    return result;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    PLANCAST_LOG_ERROR("RPC failed", {StringField("route", route), StringField("error", ex.what()), IntField(id_key, static_cast<int64_t>(id))});
    metrics.RecordRequest(route, false);
    metrics.ObserveRequestLatencyMs(route, ElapsedMs(started_at));
    throw;
  }
}

void RequireId(uint64_t id, std::string_view what) {
  if (id == 0) throw util::InvalidInput(std::string(what) + " is required");
}

} // namespace

ProjectService::ProjectService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.users || !ctx_.projects || !ctx_.scheduler || !ctx_.quota || !ctx_.ledger) {
    throw std::invalid_argument("project service context is incomplete");
  }
}

void ProjectService::RecordApiCall(uint64_t user_id, uint64_t project_id, std::string_view route) {
  if (!ctx_.record_api_calls) return;

  UsageEntry entry;
  entry.set_user_id(user_id);
  if (project_id != 0) entry.set_project_id(project_id);
  entry.set_action(USAGE_ACTION_API_CALL);
  entry.set_endpoint(std::string(route));

  // The call itself already succeeded; a ledger failure is reported, not returned.
  try {
    ctx_.ledger->Append(entry);
  } catch (const std::exception& e) {
    PLANCAST_LOG_ERROR("api_call usage entry not recorded", {StringField("route", route), IntField("user_id", static_cast<int64_t>(user_id)),
                                                             StringField("error", e.what())});
  }
}

void ProjectService::RecordProjectApiCall(uint64_t project_id, std::string_view route) {
  if (!ctx_.record_api_calls) return;
  RecordApiCall(ctx_.projects->Get(project_id).user_id(), project_id, route);
}

RegisterUserResponse ProjectService::RegisterUser(const RegisterUserRequest& req) {
  return ObserveRpc(kRegisterUser, "user_id", 0, [&] {
    core::NewUser user;
    user.email       = req.email();
    user.tier        = req.tier() == SUBSCRIPTION_TIER_UNSPECIFIED ? SUBSCRIPTION_TIER_FREE : req.tier();
    user.api_key     = req.api_key();
    user.is_verified = req.is_verified();

    RegisterUserResponse resp;
    *resp.mutable_user() = ctx_.users->Register(user);
    RecordApiCall(resp.user().id(), 0, kRegisterUser);
    return resp;
  });
}

UpdateUserResponse ProjectService::UpdateUser(const UpdateUserRequest& req) {
  return ObserveRpc(kUpdateUser, "user_id", req.user_id(), [&] {
    RequireId(req.user_id(), "user_id");

    core::UserUpdate update;
    if (req.has_tier()) update.tier = req.tier();
    if (req.has_is_active()) update.is_active = req.is_active();
    if (req.has_is_verified()) update.is_verified = req.is_verified();

    UpdateUserResponse resp;
    *resp.mutable_user() = ctx_.users->Update(req.user_id(), update);
    RecordApiCall(req.user_id(), 0, kUpdateUser);
    return resp;
  });
}

CreateProjectResponse ProjectService::CreateProject(const CreateProjectRequest& req) {
  return ObserveRpc(kCreateProject, "user_id", req.user_id(), [&] {
    RequireId(req.user_id(), "user_id");

    std::optional<ScaleReference> reference;
    if (req.has_scale_reference()) reference = req.scale_reference();

    CreateProjectResponse resp;
    *resp.mutable_project() = ctx_.projects->Create(req.user_id(), req.input(), reference);
    RecordApiCall(req.user_id(), resp.project().id(), kCreateProject);
    return resp;
  });
}

RunProjectResponse ProjectService::RunProject(const RunProjectRequest& req) {
  return ObserveRpc(kRunProject, "project_id", req.project_id(), [&] {
    RequireId(req.project_id(), "project_id");

    try {
      ctx_.projects->StartRun(req.project_id(),
                              [&](core::RunTicket&& ticket) { ctx_.scheduler->Enqueue(pipeline::RunTask{std::move(ticket)}); });
    } catch (const util::Unavailable& e) {
      // The run was rolled back uncharged. The queue never reopens, so the
      // project cannot stay pending either.
      PLANCAST_LOG_WARN("run rejected; cancelling project", {IntField("project_id", static_cast<int64_t>(req.project_id())), StringField("error", e.what())});
      ctx_.projects->Cancel(req.project_id());
      throw;
    }

    RunProjectResponse resp;
    *resp.mutable_snapshot() = ctx_.projects->GetStatus(req.project_id());
    RecordProjectApiCall(req.project_id(), kRunProject);
    return resp;
  });
}

CancelProjectResponse ProjectService::CancelProject(const CancelProjectRequest& req) {
  return ObserveRpc(kCancelProject, "project_id", req.project_id(), [&] {
    RequireId(req.project_id(), "project_id");

    CancelProjectResponse resp;
    *resp.mutable_snapshot() = ctx_.projects->Cancel(req.project_id());
    RecordProjectApiCall(req.project_id(), kCancelProject);
    return resp;
  });
}

ResetProjectResponse ProjectService::ResetProject(const ResetProjectRequest& req) {
  return ObserveRpc(kResetProject, "project_id", req.project_id(), [&] {
    RequireId(req.project_id(), "project_id");

    ResetProjectResponse resp;
    *resp.mutable_snapshot() = ctx_.projects->Reset(req.project_id());
    RecordProjectApiCall(req.project_id(), kResetProject);
    return resp;
  });
}

GetProjectStatusResponse ProjectService::GetProjectStatus(const GetProjectStatusRequest& req) {
  return ObserveRpc(kGetProjectStatus, "project_id", req.project_id(), [&] {
    RequireId(req.project_id(), "project_id");

    GetProjectStatusResponse resp;
    *resp.mutable_snapshot() = ctx_.projects->GetStatus(req.project_id());
    RecordProjectApiCall(req.project_id(), kGetProjectStatus);
    return resp;
  });
}

ListProjectsResponse ProjectService::ListProjects(const ListProjectsRequest& req) {
  return ObserveRpc(kListProjects, "user_id", req.user_id(), [&] {
    RequireId(req.user_id(), "user_id");

    ListProjectsResponse resp;
    for (auto& project : ctx_.projects->ListByUser(req.user_id())) {
      *resp.add_projects() = std::move(project);
    }
    RecordApiCall(req.user_id(), 0, kListProjects);
    return resp;
  });
}

GetUsageSummaryResponse ProjectService::GetUsageSummary(const GetUsageSummaryRequest& req) {
  return ObserveRpc(kGetUsageSummary, "user_id", req.user_id(), [&] {
    RequireId(req.user_id(), "user_id");

    const auto user = ctx_.users->Get(req.user_id());

    GetUsageSummaryResponse resp;
    *resp.mutable_summary() = ctx_.quota->Summary(user);
    RecordApiCall(req.user_id(), 0, kGetUsageSummary);
    return resp;
  });
}

} // namespace plancast::service
