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
#include "grpc_task_client.h"

#include <isula_libutils/log.h>

namespace crishim {

GrpcTaskClient::GrpcTaskClient(const std::string &address, std::chrono::milliseconds callTimeout)
    : m_address(address), m_callTimeout(callTimeout)
{
    std::string unixPrefix(UNIX_SOCKET_PREFIX);

    // Only support unix domain socket
    if (m_address.compare(0, unixPrefix.length(), unixPrefix) != 0) {
        m_address = unixPrefix + m_address;
    }
    auto channel = grpc::CreateChannel(m_address, grpc::InsecureChannelCredentials());
    stub_ = crishim::task::v1::Tasks::NewStub(channel);
}

void GrpcTaskClient::InitContext(grpc::ClientContext &context, std::chrono::milliseconds extra)
{
    context.set_deadline(std::chrono::system_clock::now() + m_callTimeout + extra);
}

void GrpcTaskClient::StatusToErrors(const char *op, const std::string &taskId, const grpc::Status &status,
                                    Errors &error)
{
    std::string msg = std::string("Task ") + op + " request for " + (taskId.empty() ? "<new>" : taskId) +
                      " failed: " + status.error_message();

    switch (status.error_code()) {
        case grpc::StatusCode::NOT_FOUND:
            error.SetError(ERR_NOT_FOUND, msg);
            break;
        case grpc::StatusCode::UNAVAILABLE:
        case grpc::StatusCode::DEADLINE_EXCEEDED:
            error.SetError(ERR_BACKEND_UNAVAILABLE, msg);
            break;
        case grpc::StatusCode::INVALID_ARGUMENT:
            error.SetError(ERR_INVALID_ARGUMENT, msg);
            break;
        default:
            error.SetError(ERR_BACKEND_FAILED, msg);
            break;
    }
    // not found is an expected answer during cleanup and reconciliation
    if (status.error_code() == grpc::StatusCode::NOT_FOUND) {
        DEBUG("%s", msg.c_str());
    } else {
        ERROR("%s, error_code: %d", msg.c_str(), status.error_code());
    }
}

void GrpcTaskClient::InitCreateRequest(crishim::task::v1::CreateTaskRequest &request, const TaskSpec &spec)
{
    request.set_name(spec.name);
    request.set_sandbox_id(spec.sandboxId);
    request.set_share_sandbox_pid(spec.shareSandboxPid);
    request.set_image(spec.image);
    for (const auto &arg : spec.args) {
        request.add_args(arg);
    }
    for (const auto &env : spec.envs) {
        request.add_envs(env);
    }
    request.set_working_dir(spec.workingDir);
    for (const auto &label : spec.labels) {
        (*request.mutable_labels())[label.first] = label.second;
    }
}

void GrpcTaskClient::TaskToTaskInfo(const crishim::task::v1::Task &task, TaskInfo &info)
{
    info.id = task.id();
    info.pid = task.pid();
    info.exitStatus = task.exit_status();
    info.exitedAt = task.exited_at();
    switch (task.status()) {
        case crishim::task::v1::TASK_CREATED:
            info.state = TASK_STATE_CREATED;
            break;
        case crishim::task::v1::TASK_RUNNING:
            info.state = TASK_STATE_RUNNING;
            break;
        case crishim::task::v1::TASK_STOPPED:
            info.state = TASK_STATE_STOPPED;
            break;
        default:
            info.state = TASK_STATE_UNKNOWN;
            break;
    }
}

auto GrpcTaskClient::CreateTask(const TaskSpec &spec, std::string &taskId, Errors &error) -> bool
{
    grpc::ClientContext context;
    crishim::task::v1::CreateTaskRequest request;
    crishim::task::v1::CreateTaskResponse response;
    grpc::Status status;

    InitCreateRequest(request, spec);
    InitContext(context, std::chrono::milliseconds(0));

    status = stub_->Create(&context, request, &response);
    if (!status.ok()) {
        StatusToErrors("create", "", status, error);
        return false;
    }

    if (response.task_id().empty()) {
        ERROR("Task create request for %s returned an empty task id", spec.name.c_str());
        error.SetError(ERR_BACKEND_FAILED, "Task create request returned an empty task id for " + spec.name);
        return false;
    }
    taskId = response.task_id();
    return true;
}

auto GrpcTaskClient::StartTask(const std::string &taskId, uint32_t &pid, Errors &error) -> bool
{
    grpc::ClientContext context;
    crishim::task::v1::StartTaskRequest request;
    crishim::task::v1::StartTaskResponse response;
    grpc::Status status;

    request.set_task_id(taskId);
    InitContext(context, std::chrono::milliseconds(0));

    status = stub_->Start(&context, request, &response);
    if (!status.ok()) {
        StatusToErrors("start", taskId, status, error);
        return false;
    }

    pid = response.pid();
    return true;
}

auto GrpcTaskClient::StopTask(const std::string &taskId, uint32_t gracePeriodSecs, TaskExitInfo &exitInfo,
                              Errors &error) -> bool
{
    grpc::ClientContext context;
    crishim::task::v1::StopTaskRequest request;
    crishim::task::v1::StopTaskResponse response;
    grpc::Status status;

    request.set_task_id(taskId);
    request.set_timeout_secs(gracePeriodSecs);
    InitContext(context, std::chrono::seconds(gracePeriodSecs));

    status = stub_->Stop(&context, request, &response);
    if (!status.ok()) {
        StatusToErrors("stop", taskId, status, error);
        return false;
    }

    exitInfo.exitStatus = response.exit_status();
    exitInfo.exitedAt = response.exited_at();
    return true;
}

auto GrpcTaskClient::DeleteTask(const std::string &taskId, bool forceKill, Errors &error) -> bool
{
    grpc::ClientContext context;
    crishim::task::v1::DeleteTaskRequest request;
    crishim::task::v1::DeleteTaskResponse response;
    grpc::Status status;

    request.set_task_id(taskId);
    request.set_force_kill(forceKill);
    InitContext(context, std::chrono::milliseconds(0));

    status = stub_->Delete(&context, request, &response);
    if (!status.ok()) {
        StatusToErrors("delete", taskId, status, error);
        return false;
    }
    return true;
}

auto GrpcTaskClient::LoadTask(const std::string &taskId, TaskInfo &info, Errors &error) -> bool
{
    grpc::ClientContext context;
    crishim::task::v1::GetTaskRequest request;
    crishim::task::v1::GetTaskResponse response;
    grpc::Status status;

    request.set_task_id(taskId);
    InitContext(context, std::chrono::milliseconds(0));

    status = stub_->Get(&context, request, &response);
    if (!status.ok()) {
        StatusToErrors("get", taskId, status, error);
        return false;
    }

    TaskToTaskInfo(response.task(), info);
    if (info.id.empty()) {
        info.id = taskId;
    }
    return true;
}

auto GrpcTaskClient::ListLiveTasks(std::vector<std::string> &taskIds, Errors &error) -> bool
{
    grpc::ClientContext context;
    crishim::task::v1::ListTasksRequest request;
    crishim::task::v1::ListTasksResponse response;
    grpc::Status status;

    request.set_live_only(true);
    InitContext(context, std::chrono::milliseconds(0));

    status = stub_->List(&context, request, &response);
    if (!status.ok()) {
        StatusToErrors("list", "", status, error);
        return false;
    }

    for (const auto &task : response.tasks()) {
        taskIds.push_back(task.id());
    }
    return true;
}

} // namespace crishim
