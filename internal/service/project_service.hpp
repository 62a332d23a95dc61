#pragma once

#include <cstdint>
#include <string_view>

#include "plancast/v1/project_service.pb.h"
#include "service_context.hpp"

namespace plancast::service {

/*
  Request handling for plancast.v1.ProjectService, independent of gRPC.

  Every method throws the util:: error types; the transport maps them.
*/
class ProjectService {
 public:
  explicit ProjectService(ServiceContext ctx);

  plancast::v1::RegisterUserResponse RegisterUser(const plancast::v1::RegisterUserRequest& req);

  plancast::v1::UpdateUserResponse UpdateUser(const plancast::v1::UpdateUserRequest& req);

  plancast::v1::CreateProjectResponse CreateProject(const plancast::v1::CreateProjectRequest& req);

  // Starts the run synchronously (lease, pending -> processing) and queues
  // the stages for a worker.
  plancast::v1::RunProjectResponse RunProject(const plancast::v1::RunProjectRequest& req);

  plancast::v1::CancelProjectResponse CancelProject(const plancast::v1::CancelProjectRequest& req);

  plancast::v1::ResetProjectResponse ResetProject(const plancast::v1::ResetProjectRequest& req);

  plancast::v1::GetProjectStatusResponse GetProjectStatus(const plancast::v1::GetProjectStatusRequest& req);

  plancast::v1::ListProjectsResponse ListProjects(const plancast::v1::ListProjectsRequest& req);

  plancast::v1::GetUsageSummaryResponse GetUsageSummary(const plancast::v1::GetUsageSummaryRequest& req);

 private:
  void RecordApiCall(uint64_t user_id, uint64_t project_id, std::string_view route);
  void RecordProjectApiCall(uint64_t project_id, std::string_view route);

  ServiceContext ctx_;
};

} // namespace plancast::service
