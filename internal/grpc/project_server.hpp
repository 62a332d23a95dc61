#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "internal/service/project_service.hpp"
#include "plancast/v1/project_service.grpc.pb.h"

namespace plancast::grpc {

class ProjectServer final : public plancast::v1::ProjectService::Service {
 public:
  explicit ProjectServer(std::shared_ptr<plancast::service::ProjectService> svc);

  ::grpc::Status RegisterUser(::grpc::ServerContext*, const plancast::v1::RegisterUserRequest*, plancast::v1::RegisterUserResponse*) override;

  ::grpc::Status UpdateUser(::grpc::ServerContext*, const plancast::v1::UpdateUserRequest*, plancast::v1::UpdateUserResponse*) override;

  ::grpc::Status CreateProject(::grpc::ServerContext*, const plancast::v1::CreateProjectRequest*, plancast::v1::CreateProjectResponse*) override;

  ::grpc::Status RunProject(::grpc::ServerContext*, const plancast::v1::RunProjectRequest*, plancast::v1::RunProjectResponse*) override;

  ::grpc::Status CancelProject(::grpc::ServerContext*, const plancast::v1::CancelProjectRequest*, plancast::v1::CancelProjectResponse*) override;

  ::grpc::Status ResetProject(::grpc::ServerContext*, const plancast::v1::ResetProjectRequest*, plancast::v1::ResetProjectResponse*) override;

  ::grpc::Status GetProjectStatus(::grpc::ServerContext*, const plancast::v1::GetProjectStatusRequest*,
                                  plancast::v1::GetProjectStatusResponse*) override;

  ::grpc::Status ListProjects(::grpc::ServerContext*, const plancast::v1::ListProjectsRequest*, plancast::v1::ListProjectsResponse*) override;

  ::grpc::Status GetUsageSummary(::grpc::ServerContext*, const plancast::v1::GetUsageSummaryRequest*,
                                 plancast::v1::GetUsageSummaryResponse*) override;

 private:
  std::shared_ptr<plancast::service::ProjectService> service_;
};

} // namespace plancast::grpc
