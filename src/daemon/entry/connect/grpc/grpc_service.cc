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
#include "grpc_service.h"

#include <errno.h>
#include <string.h>
#include <unistd.h>

#include <isula_libutils/log.h>

#include "cxxutils.h"

namespace crishim {

GRPCServer::GRPCServer(const std::string &host, std::shared_ptr<LifecycleManager> manager)
    : m_host(host)
    , m_runtimeService(std::move(manager))
{
}

auto GRPCServer::Start(Errors &error) -> bool
{
    if (!CXXUtils::HasPrefix(m_host, UNIX_SOCKET_PREFIX)) {
        ERROR("Invalid host %s, only unix sockets are supported", m_host.c_str());
        error.Errorf("Invalid host %s, only unix sockets are supported", m_host.c_str());
        error.SetCode(ERR_INVALID_ARGUMENT);
        return false;
    }

    // a socket file left by a previous instance makes bind fail
    std::string socketPath = m_host.substr(strlen(UNIX_SOCKET_PREFIX));
    if (unlink(socketPath.c_str()) < 0 && errno != ENOENT) {
        SYSWARN("Failed to remove stale socket '%s'.", socketPath.c_str());
    }

    m_builder.AddListeningPort(m_host, grpc::InsecureServerCredentials());
    m_builder.RegisterService(&m_runtimeService);

    m_server = m_builder.BuildAndStart();
    if (m_server == nullptr) {
        ERROR("Failed to build and start grpc server on %s", m_host.c_str());
        error.Errorf("Failed to build and start grpc server on %s", m_host.c_str());
        return false;
    }

    INFO("Server listening on %s", m_host.c_str());
    return true;
}

void GRPCServer::Wait()
{
    if (m_server != nullptr) {
        m_server->Wait();
    }
}

void GRPCServer::Shutdown()
{
    if (m_server == nullptr) {
        return;
    }

    m_server->Shutdown();

    // Shutdown daemon, this operation should remove socket file.
    if (unlink(m_host.c_str() + strlen(UNIX_SOCKET_PREFIX)) < 0 && errno != ENOENT) {
        SYSWARN("Failed to remove '%s'.", m_host.c_str());
    }
}

} // namespace crishim
