#include "project_server.hpp"

#include "grpc_error.hpp"

namespace plancast::grpc {

namespace {

template <typename Req, typename Resp, typename Method>
::grpc::Status Dispatch(plancast::service::ProjectService& service, Method method, const Req* req, Resp* resp) {
  try {
    *resp = (service.*method)(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace

using plancast::service::ProjectService;

ProjectServer::ProjectServer(std::shared_ptr<ProjectService> svc) : service_(std::move(svc)) {
}

::grpc::Status ProjectServer::RegisterUser(::grpc::ServerContext*, const plancast::v1::RegisterUserRequest* req,
                                           plancast::v1::RegisterUserResponse* resp) {
  return Dispatch(*service_, &ProjectService::RegisterUser, req, resp);
}

::grpc::Status ProjectServer::UpdateUser(::grpc::ServerContext*, const plancast::v1::UpdateUserRequest* req, plancast::v1::UpdateUserResponse* resp) {
  return Dispatch(*service_, &ProjectService::UpdateUser, req, resp);
}

::grpc::Status ProjectServer::CreateProject(::grpc::ServerContext*, const plancast::v1::CreateProjectRequest* req,
                                            plancast::v1::CreateProjectResponse* resp) {
  return Dispatch(*service_, &ProjectService::CreateProject, req, resp);
}

::grpc::Status ProjectServer::RunProject(::grpc::ServerContext*, const plancast::v1::RunProjectRequest* req, plancast::v1::RunProjectResponse* resp) {
  return Dispatch(*service_, &ProjectService::RunProject, req, resp);
}

::grpc::Status ProjectServer::CancelProject(::grpc::ServerContext*, const plancast::v1::CancelProjectRequest* req,
                                            plancast::v1::CancelProjectResponse* resp) {
  return Dispatch(*service_, &ProjectService::CancelProject, req, resp);
}

::grpc::Status ProjectServer::ResetProject(::grpc::ServerContext*, const plancast::v1::ResetProjectRequest* req,
                                           plancast::v1::ResetProjectResponse* resp) {
  return Dispatch(*service_, &ProjectService::ResetProject, req, resp);
}

::grpc::Status ProjectServer::GetProjectStatus(::grpc::ServerContext*, const plancast::v1::GetProjectStatusRequest* req,
                                               plancast::v1::GetProjectStatusResponse* resp) {
  return Dispatch(*service_, &ProjectService::GetProjectStatus, req, resp);
}

::grpc::Status ProjectServer::ListProjects(::grpc::ServerContext*, const plancast::v1::ListProjectsRequest* req,
                                           plancast::v1::ListProjectsResponse* resp) {
  return Dispatch(*service_, &ProjectService::ListProjects, req, resp);
}

::grpc::Status ProjectServer::GetUsageSummary(::grpc::ServerContext*, const plancast::v1::GetUsageSummaryRequest* req,
                                              plancast::v1::GetUsageSummaryResponse* resp) {
  return Dispatch(*service_, &ProjectService::GetUsageSummary, req, resp);
}

} // namespace plancast::grpc
