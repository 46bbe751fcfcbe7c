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
#ifndef CRISHIM_DAEMON_ENTRY_CONNECT_GRPC_RUNTIME_SERVICE_H
#define CRISHIM_DAEMON_ENTRY_CONNECT_GRPC_RUNTIME_SERVICE_H

#include <memory>

#include <grpc++/grpc++.h>

#include "errors.h"
#include "lifecycle_manager.h"
#include "runtime.grpc.pb.h"

namespace crishim {

// Implement of RuntimeService
class RuntimeServiceImpl : public crishim::v1::RuntimeService::Service {
public:
    explicit RuntimeServiceImpl(std::shared_ptr<LifecycleManager> manager);
    virtual ~RuntimeServiceImpl() = default;

    grpc::Status RunPodSandbox(grpc::ServerContext *context, const crishim::v1::RunPodSandboxRequest *request,
                               crishim::v1::RunPodSandboxResponse *reply) override;

    grpc::Status StopPodSandbox(grpc::ServerContext *context, const crishim::v1::StopPodSandboxRequest *request,
                                crishim::v1::StopPodSandboxResponse *reply) override;

    grpc::Status RemovePodSandbox(grpc::ServerContext *context, const crishim::v1::RemovePodSandboxRequest *request,
                                  crishim::v1::RemovePodSandboxResponse *reply) override;

    grpc::Status PodSandboxStatus(grpc::ServerContext *context, const crishim::v1::PodSandboxStatusRequest *request,
                                  crishim::v1::PodSandboxStatusResponse *reply) override;

    grpc::Status ListPodSandbox(grpc::ServerContext *context, const crishim::v1::ListPodSandboxRequest *request,
                                crishim::v1::ListPodSandboxResponse *reply) override;

    grpc::Status CreateContainer(grpc::ServerContext *context, const crishim::v1::CreateContainerRequest *request,
                                 crishim::v1::CreateContainerResponse *reply) override;

    grpc::Status StartContainer(grpc::ServerContext *context, const crishim::v1::StartContainerRequest *request,
                                crishim::v1::StartContainerResponse *reply) override;

    grpc::Status StopContainer(grpc::ServerContext *context, const crishim::v1::StopContainerRequest *request,
                               crishim::v1::StopContainerResponse *reply) override;

    grpc::Status RemoveContainer(grpc::ServerContext *context, const crishim::v1::RemoveContainerRequest *request,
                                 crishim::v1::RemoveContainerResponse *reply) override;

    grpc::Status ContainerStatus(grpc::ServerContext *context, const crishim::v1::ContainerStatusRequest *request,
                                 crishim::v1::ContainerStatusResponse *reply) override;

    grpc::Status ListContainers(grpc::ServerContext *context, const crishim::v1::ListContainersRequest *request,
                                crishim::v1::ListContainersResponse *reply) override;

    static grpc::Status ToGRPCStatus(Errors &error);

private:
    void SandboxRecordToStatus(const crishim::v1::SandboxRecord &record, crishim::v1::PodSandboxStatus &status);
    void SandboxRecordToSummary(const crishim::v1::SandboxRecord &record, crishim::v1::PodSandbox &sandbox);
    void ContainerRecordToStatus(const crishim::v1::ContainerRecord &record, crishim::v1::ContainerStatus &status);
    void ContainerRecordToSummary(const crishim::v1::ContainerRecord &record, crishim::v1::Container &container);

    std::shared_ptr<LifecycleManager> m_manager;
};

} // namespace crishim

#endif // CRISHIM_DAEMON_ENTRY_CONNECT_GRPC_RUNTIME_SERVICE_H
