/******************************************************************************
 * Copyright (c) Huawei Technologies Co., Ltd. 2026. All rights reserved.
 * crishim licensed under the Mulan PSL v2.
 * You can use this software according to the terms and conditions of the Mulan PSL v2.
 * You may obtain a copy of Mulan PSL v2 at:
 *     http://license.coscl.org.cn/MulanPSL2
 * THIS SOFTWARE IS PROVIDED ON AN "AS IS" BASIS, WITHOUT WARRANTIES OF ANY KIND, EITHER EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO NON-INFRINGEMENT, MERCHANTABILITY OR FIT FOR A PARTICULAR
 * PURPOSE.
 * See the Mulan PSL v2 for more details.
 * Create: 2026-10-19
 * Description: grpc RuntimeService over the lifecycle manager
 ******************************************************************************/
#include "runtime_service.h"

#include <isula_libutils/log.h>

namespace crishim {

RuntimeServiceImpl::RuntimeServiceImpl(std::shared_ptr<LifecycleManager> manager) : m_manager(std::move(manager))
{
}

grpc::Status RuntimeServiceImpl::ToGRPCStatus(Errors &error)
{
    if (error.Empty()) {
        return grpc::Status::OK;
    }

    switch (error.GetCode()) {
        case ERR_NOT_FOUND:
            return grpc::Status(grpc::StatusCode::NOT_FOUND, error.GetMessage());
        case ERR_ILLEGAL_TRANSITION:
            return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, error.GetMessage());
        case ERR_BACKEND_UNAVAILABLE:
            return grpc::Status(grpc::StatusCode::UNAVAILABLE, error.GetMessage());
        case ERR_INVALID_ARGUMENT:
            return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, error.GetMessage());
        case ERR_ALREADY_EXISTS:
            return grpc::Status(grpc::StatusCode::ALREADY_EXISTS, error.GetMessage());
        default:
            return grpc::Status(grpc::StatusCode::UNKNOWN, error.GetMessage());
    }
}

void RuntimeServiceImpl::SandboxRecordToStatus(const crishim::v1::SandboxRecord &record,
                                               crishim::v1::PodSandboxStatus &status)
{
    status.set_id(record.id());
    *status.mutable_metadata() = record.config().metadata();
    status.set_state(record.state());
    status.set_created_at(record.created_at());
    *status.mutable_labels() = record.config().labels();
    *status.mutable_annotations() = record.config().annotations();
    status.set_runtime_handler(record.runtime_handler());
    for (const auto &id : record.containers()) {
        status.add_container_ids(id);
    }
}

void RuntimeServiceImpl::SandboxRecordToSummary(const crishim::v1::SandboxRecord &record,
                                                crishim::v1::PodSandbox &sandbox)
{
    sandbox.set_id(record.id());
    *sandbox.mutable_metadata() = record.config().metadata();
    sandbox.set_state(record.state());
    sandbox.set_created_at(record.created_at());
    *sandbox.mutable_labels() = record.config().labels();
    *sandbox.mutable_annotations() = record.config().annotations();
    sandbox.set_runtime_handler(record.runtime_handler());
}

void RuntimeServiceImpl::ContainerRecordToStatus(const crishim::v1::ContainerRecord &record,
                                                 crishim::v1::ContainerStatus &status)
{
    status.set_id(record.id());
    *status.mutable_metadata() = record.config().metadata();
    status.set_state(record.state());
    status.set_created_at(record.created_at());
    status.set_started_at(record.started_at());
    status.set_finished_at(record.finished_at());
    status.set_exit_code(record.exit_code());
    status.set_image(record.image());
    status.set_reason(record.reason());
    *status.mutable_labels() = record.config().labels();
    *status.mutable_annotations() = record.config().annotations();
    status.set_pod_sandbox_id(record.sandbox_id());
    status.set_pid_namespace_mode(record.pid_namespace_mode());
}

void RuntimeServiceImpl::ContainerRecordToSummary(const crishim::v1::ContainerRecord &record,
                                                  crishim::v1::Container &container)
{
    container.set_id(record.id());
    container.set_pod_sandbox_id(record.sandbox_id());
    *container.mutable_metadata() = record.config().metadata();
    container.set_image(record.image());
    container.set_state(record.state());
    container.set_created_at(record.created_at());
    *container.mutable_labels() = record.config().labels();
    *container.mutable_annotations() = record.config().annotations();
}

grpc::Status RuntimeServiceImpl::RunPodSandbox(grpc::ServerContext *context,
                                               const crishim::v1::RunPodSandboxRequest *request,
                                               crishim::v1::RunPodSandboxResponse *reply)
{
    Errors error;
    std::string sandboxId;

    if (request == nullptr || reply == nullptr) {
        ERROR("Invalid input arguments");
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "Invalid input arguments");
    }

    EVENT("Event: {Object: CRI, Type: Running Pod %s}", request->config().metadata().name().c_str());

    if (!m_manager->RunPodSandbox(request->config(), request->runtime_handler(), sandboxId, error)) {
        ERROR("Object: CRI, Type: Failed to run pod:%s due to %s", request->config().metadata().name().c_str(),
              error.GetCMessage());
        return ToGRPCStatus(error);
    }
    reply->set_pod_sandbox_id(sandboxId);

    EVENT("Event: {Object: CRI, Type: Run Pod: %s}", sandboxId.c_str());
    return grpc::Status::OK;
}

grpc::Status RuntimeServiceImpl::StopPodSandbox(grpc::ServerContext *context,
                                                const crishim::v1::StopPodSandboxRequest *request,
                                                crishim::v1::StopPodSandboxResponse *reply)
{
    Errors error;

    if (request == nullptr || reply == nullptr) {
        ERROR("Invalid input arguments");
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "Invalid input arguments");
    }

    EVENT("Event: {Object: CRI, Type: Stopping Pod: %s}", request->pod_sandbox_id().c_str());

    if (!m_manager->StopPodSandbox(request->pod_sandbox_id(), error)) {
        ERROR("Object: CRI, Type: Failed to stop pod:%s due to %s", request->pod_sandbox_id().c_str(),
              error.GetCMessage());
        return ToGRPCStatus(error);
    }

    EVENT("Event: {Object: CRI, Type: Stopped Pod: %s}", request->pod_sandbox_id().c_str());
    return grpc::Status::OK;
}

grpc::Status RuntimeServiceImpl::RemovePodSandbox(grpc::ServerContext *context,
                                                  const crishim::v1::RemovePodSandboxRequest *request,
                                                  crishim::v1::RemovePodSandboxResponse *reply)
{
    Errors error;

    if (request == nullptr || reply == nullptr) {
        ERROR("Invalid input arguments");
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "Invalid input arguments");
    }

    EVENT("Event: {Object: CRI, Type: Removing Pod: %s}", request->pod_sandbox_id().c_str());

    if (!m_manager->RemovePodSandbox(request->pod_sandbox_id(), error)) {
        ERROR("Object: CRI, Type: Failed to remove pod:%s due to %s", request->pod_sandbox_id().c_str(),
              error.GetCMessage());
        return ToGRPCStatus(error);
    }

    EVENT("Event: {Object: CRI, Type: Removed Pod: %s}", request->pod_sandbox_id().c_str());
    return grpc::Status::OK;
}

grpc::Status RuntimeServiceImpl::PodSandboxStatus(grpc::ServerContext *context,
                                                  const crishim::v1::PodSandboxStatusRequest *request,
                                                  crishim::v1::PodSandboxStatusResponse *reply)
{
    Errors error;
    crishim::v1::SandboxRecord record;

    if (request == nullptr || reply == nullptr) {
        ERROR("Invalid input arguments");
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "Invalid input arguments");
    }

    if (!m_manager->PodSandboxStatus(request->pod_sandbox_id(), record, error)) {
        ERROR("Object: CRI, Type: Failed to status pod:%s due to %s", request->pod_sandbox_id().c_str(),
              error.GetCMessage());
        return ToGRPCStatus(error);
    }
    SandboxRecordToStatus(record, *reply->mutable_status());

    return grpc::Status::OK;
}

grpc::Status RuntimeServiceImpl::ListPodSandbox(grpc::ServerContext *context,
                                                const crishim::v1::ListPodSandboxRequest *request,
                                                crishim::v1::ListPodSandboxResponse *reply)
{
    Errors error;
    std::vector<crishim::v1::SandboxRecord> records;

    if (request == nullptr || reply == nullptr) {
        ERROR("Invalid input arguments");
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "Invalid input arguments");
    }

    if (!m_manager->ListPodSandbox(request->filter(), records, error)) {
        ERROR("Object: CRI, Type: Failed to list all pods: %s", error.GetCMessage());
        return ToGRPCStatus(error);
    }
    for (const auto &record : records) {
        SandboxRecordToSummary(record, *reply->add_items());
    }

    return grpc::Status::OK;
}

grpc::Status RuntimeServiceImpl::CreateContainer(grpc::ServerContext *context,
                                                 const crishim::v1::CreateContainerRequest *request,
                                                 crishim::v1::CreateContainerResponse *reply)
{
    Errors error;
    std::string containerId;

    if (request == nullptr || reply == nullptr) {
        ERROR("Invalid input arguments");
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "Invalid input arguments");
    }

    EVENT("Event: {Object: CRI, Type: Creating Container for sandbox: %s}", request->pod_sandbox_id().c_str());

    if (!m_manager->CreateContainer(request->pod_sandbox_id(), request->config(), containerId, error)) {
        ERROR("Object: CRI, Type: Failed to create container: %s", error.GetCMessage());
        return ToGRPCStatus(error);
    }
    reply->set_container_id(containerId);

    EVENT("Event: {Object: CRI, Type: Created Container %s}", containerId.c_str());
    return grpc::Status::OK;
}

grpc::Status RuntimeServiceImpl::StartContainer(grpc::ServerContext *context,
                                                const crishim::v1::StartContainerRequest *request,
                                                crishim::v1::StartContainerResponse *reply)
{
    Errors error;

    if (request == nullptr || reply == nullptr) {
        ERROR("Invalid input arguments");
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "Invalid input arguments");
    }

    EVENT("Event: {Object: CRI, Type: Starting Container: %s}", request->container_id().c_str());

    if (!m_manager->StartContainer(request->container_id(), error)) {
        ERROR("Object: CRI, Type: Failed to start container %s due to %s", request->container_id().c_str(),
              error.GetCMessage());
        return ToGRPCStatus(error);
    }

    EVENT("Event: {Object: CRI, Type: Started Container: %s}", request->container_id().c_str());
    return grpc::Status::OK;
}

grpc::Status RuntimeServiceImpl::StopContainer(grpc::ServerContext *context,
                                               const crishim::v1::StopContainerRequest *request,
                                               crishim::v1::StopContainerResponse *reply)
{
    Errors error;

    if (request == nullptr || reply == nullptr) {
        ERROR("Invalid input arguments");
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "Invalid input arguments");
    }

    EVENT("Event: {Object: CRI, Type: Stopping Container: %s}", request->container_id().c_str());

    if (!m_manager->StopContainer(request->container_id(), request->timeout(), error)) {
        ERROR("Object: CRI, Type: Failed to stop container %s due to %s", request->container_id().c_str(),
              error.GetCMessage());
        return ToGRPCStatus(error);
    }

    EVENT("Event: {Object: CRI, Type: Stopped Container: %s}", request->container_id().c_str());
    return grpc::Status::OK;
}

grpc::Status RuntimeServiceImpl::RemoveContainer(grpc::ServerContext *context,
                                                 const crishim::v1::RemoveContainerRequest *request,
                                                 crishim::v1::RemoveContainerResponse *reply)
{
    Errors error;

    if (request == nullptr || reply == nullptr) {
        ERROR("Invalid input arguments");
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "Invalid input arguments");
    }

    EVENT("Event: {Object: CRI, Type: Removing Container: %s}", request->container_id().c_str());

    if (!m_manager->RemoveContainer(request->container_id(), error)) {
        ERROR("Object: CRI, Type: Failed to remove container %s due to %s", request->container_id().c_str(),
              error.GetCMessage());
        return ToGRPCStatus(error);
    }

    EVENT("Event: {Object: CRI, Type: Removed Container: %s}", request->container_id().c_str());
    return grpc::Status::OK;
}

grpc::Status RuntimeServiceImpl::ContainerStatus(grpc::ServerContext *context,
                                                 const crishim::v1::ContainerStatusRequest *request,
                                                 crishim::v1::ContainerStatusResponse *reply)
{
    Errors error;
    crishim::v1::ContainerRecord record;

    if (request == nullptr || reply == nullptr) {
        ERROR("Invalid input arguments");
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "Invalid input arguments");
    }

    if (!m_manager->ContainerStatus(request->container_id(), record, error)) {
        ERROR("Object: CRI, Type: Failed to get container status %s due to %s", request->container_id().c_str(),
              error.GetCMessage());
        return ToGRPCStatus(error);
    }
    ContainerRecordToStatus(record, *reply->mutable_status());

    return grpc::Status::OK;
}

grpc::Status RuntimeServiceImpl::ListContainers(grpc::ServerContext *context,
                                                const crishim::v1::ListContainersRequest *request,
                                                crishim::v1::ListContainersResponse *reply)
{
    Errors error;
    std::vector<crishim::v1::ContainerRecord> records;

    if (request == nullptr || reply == nullptr) {
        ERROR("Invalid input arguments");
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "Invalid input arguments");
    }

    if (!m_manager->ListContainers(request->filter(), records, error)) {
        ERROR("Object: CRI, Type: Failed to list all containers: %s", error.GetCMessage());
        return ToGRPCStatus(error);
    }
    for (const auto &record : records) {
        ContainerRecordToSummary(record, *reply->add_containers());
    }

    return grpc::Status::OK;
}

} // namespace crishim
