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
 * Description: task backend client over the Tasks grpc service
 ******************************************************************************/
#ifndef CRISHIM_DAEMON_BACKEND_GRPC_TASK_CLIENT_H
#define CRISHIM_DAEMON_BACKEND_GRPC_TASK_CLIENT_H

#include <chrono>
#include <memory>
#include <string>

#include <grpc++/grpc++.h>

#include "cxxutils.h"
#include "task.pb.h"
#include "task.grpc.pb.h"
#include "task_backend.h"

namespace crishim {

class GrpcTaskClient : public TaskBackend {
public:
    // callTimeout bounds every rpc, StopTask adds the grace period on top of it
    GrpcTaskClient(const std::string &address, std::chrono::milliseconds callTimeout);
    virtual ~GrpcTaskClient() = default;

    auto CreateTask(const TaskSpec &spec, std::string &taskId, Errors &error) -> bool override;
    auto StartTask(const std::string &taskId, uint32_t &pid, Errors &error) -> bool override;
    auto StopTask(const std::string &taskId, uint32_t gracePeriodSecs, TaskExitInfo &exitInfo,
                  Errors &error) -> bool override;
    auto DeleteTask(const std::string &taskId, bool forceKill, Errors &error) -> bool override;
    auto LoadTask(const std::string &taskId, TaskInfo &info, Errors &error) -> bool override;
    auto ListLiveTasks(std::vector<std::string> &taskIds, Errors &error) -> bool override;

    auto GetAddress() const -> const std::string &
    {
        return m_address;
    }

private:
    void InitContext(grpc::ClientContext &context, std::chrono::milliseconds extra);
    void InitCreateRequest(crishim::task::v1::CreateTaskRequest &request, const TaskSpec &spec);
    void TaskToTaskInfo(const crishim::task::v1::Task &task, TaskInfo &info);
    void StatusToErrors(const char *op, const std::string &taskId, const grpc::Status &status, Errors &error);

    std::string m_address;
    std::chrono::milliseconds m_callTimeout;

protected:
    std::unique_ptr<crishim::task::v1::Tasks::StubInterface> stub_;
};

} // namespace crishim

#endif // CRISHIM_DAEMON_BACKEND_GRPC_TASK_CLIENT_H
