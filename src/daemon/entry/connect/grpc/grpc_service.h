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
 * Description: grpc server of the runtime service
 ******************************************************************************/
#ifndef CRISHIM_DAEMON_ENTRY_CONNECT_GRPC_GRPC_SERVICE_H
#define CRISHIM_DAEMON_ENTRY_CONNECT_GRPC_GRPC_SERVICE_H

#include <memory>
#include <string>

#include <grpc++/grpc++.h>

#include "errors.h"
#include "lifecycle_manager.h"
#include "runtime_service.h"

namespace crishim {

class GRPCServer {
public:
    GRPCServer(const std::string &host, std::shared_ptr<LifecycleManager> manager);
    virtual ~GRPCServer() = default;
    GRPCServer(const GRPCServer &) = delete;
    GRPCServer &operator=(const GRPCServer &) = delete;

    auto Start(Errors &error) -> bool;

    // Blocks until Shutdown is called from another thread.
    void Wait();

    // Stops serving and removes the unix socket file.
    void Shutdown();

private:
    std::string m_host;
    RuntimeServiceImpl m_runtimeService;
    grpc::ServerBuilder m_builder;
    std::unique_ptr<grpc::Server> m_server;
};

} // namespace crishim

#endif // CRISHIM_DAEMON_ENTRY_CONNECT_GRPC_GRPC_SERVICE_H
