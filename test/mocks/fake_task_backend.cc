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
 * Description: in memory task backend for tests
 ******************************************************************************/

#include "fake_task_backend.h"

#include <stdio.h>

#include "cxxutils.h"

namespace crishim {
namespace {
const int32_t KILLED_EXIT_STATUS = 137;
}

auto FakeTaskBackend::CheckAvailable(Errors &error) -> bool
{
    m_calls++;
    if (m_down) {
        error.SetError(ERR_BACKEND_UNAVAILABLE, "connection refused");
        return false;
    }
    if (m_failNext > 0) {
        m_failNext--;
        error.SetError(ERR_BACKEND_UNAVAILABLE, "connection reset");
        return false;
    }
    return true;
}

auto FakeTaskBackend::FindTask(const std::string &taskId, Errors &error) -> FakeTask *
{
    auto iter = m_tasks.find(taskId);
    if (iter == m_tasks.end()) {
        error.SetError(ERR_NOT_FOUND, "task " + taskId + " not found");
        return nullptr;
    }
    return &iter->second;
}

void FakeTaskBackend::Exit(FakeTask &task, int32_t exitStatus)
{
    if (task.info.state == TASK_STATE_STOPPED) {
        return;
    }
    task.info.state = TASK_STATE_STOPPED;
    task.info.exitStatus = exitStatus;
    task.info.exitedAt = CXXUtils::GetNowTimeNanos();
    task.info.pid = 0;
}

void FakeTaskBackend::KillSharers(const std::string &sandboxTaskId)
{
    for (auto &pair : m_tasks) {
        if (pair.second.spec.shareSandboxPid && pair.second.spec.sandboxId == sandboxTaskId) {
            Exit(pair.second, KILLED_EXIT_STATUS);
        }
    }
}

auto FakeTaskBackend::CreateTask(const TaskSpec &spec, std::string &taskId, Errors &error) -> bool
{
    char buf[33] = { 0 };
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!CheckAvailable(error)) {
        return false;
    }
    if (spec.shareSandboxPid) {
        auto iter = m_tasks.find(spec.sandboxId);
        if (iter == m_tasks.end() || iter->second.info.state != TASK_STATE_RUNNING) {
            error.SetError(ERR_BACKEND_FAILED, "pid namespace of " + spec.sandboxId + " is gone");
            return false;
        }
    }

    (void)snprintf(buf, sizeof(buf), "%016llx%016llx", 0xc0ffee00ULL, static_cast<unsigned long long>(++m_nextId));
    FakeTask task;
    task.spec = spec;
    task.info.id = buf;
    task.info.state = TASK_STATE_CREATED;
    m_tasks[task.info.id] = task;
    taskId = task.info.id;
    return true;
}

auto FakeTaskBackend::StartTask(const std::string &taskId, uint32_t &pid, Errors &error) -> bool
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!CheckAvailable(error)) {
        return false;
    }
    auto *task = FindTask(taskId, error);
    if (task == nullptr) {
        return false;
    }
    if (task->info.state != TASK_STATE_CREATED) {
        error.SetError(ERR_BACKEND_FAILED, "task " + taskId + " is " + TaskStateToString(task->info.state));
        return false;
    }
    task->info.state = TASK_STATE_RUNNING;
    task->info.pid = m_nextPid++;
    pid = task->info.pid;
    return true;
}

auto FakeTaskBackend::StopTask(const std::string &taskId, uint32_t gracePeriodSecs, TaskExitInfo &exitInfo,
                               Errors &error) -> bool
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!CheckAvailable(error)) {
        return false;
    }
    auto *task = FindTask(taskId, error);
    if (task == nullptr) {
        return false;
    }
    Exit(*task, task->stopExitStatus);
    KillSharers(taskId);
    exitInfo.exitStatus = task->info.exitStatus;
    exitInfo.exitedAt = task->info.exitedAt;
    return true;
}

auto FakeTaskBackend::DeleteTask(const std::string &taskId, bool forceKill, Errors &error) -> bool
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!CheckAvailable(error)) {
        return false;
    }
    auto *task = FindTask(taskId, error);
    if (task == nullptr) {
        return false;
    }
    if (task->info.state == TASK_STATE_RUNNING && !forceKill) {
        error.SetError(ERR_BACKEND_FAILED, "task " + taskId + " is running");
        return false;
    }
    KillSharers(taskId);
    m_tasks.erase(taskId);
    m_deletes[taskId]++;
    return true;
}

auto FakeTaskBackend::LoadTask(const std::string &taskId, TaskInfo &info, Errors &error) -> bool
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!CheckAvailable(error)) {
        return false;
    }
    if (m_unreachable.count(taskId) != 0) {
        error.SetError(ERR_BACKEND_UNAVAILABLE, "shim of task " + taskId + " does not answer");
        return false;
    }
    auto *task = FindTask(taskId, error);
    if (task == nullptr) {
        return false;
    }
    info = task->info;
    return true;
}

auto FakeTaskBackend::ListLiveTasks(std::vector<std::string> &taskIds, Errors &error) -> bool
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!CheckAvailable(error)) {
        return false;
    }
    for (const auto &pair : m_tasks) {
        if (pair.second.info.state != TASK_STATE_STOPPED) {
            taskIds.push_back(pair.first);
        }
    }
    return true;
}

void FakeTaskBackend::KillTask(const std::string &taskId, int32_t exitStatus)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    auto iter = m_tasks.find(taskId);
    if (iter == m_tasks.end()) {
        return;
    }
    Exit(iter->second, exitStatus);
    KillSharers(taskId);
}

void FakeTaskBackend::SetStopExitStatus(const std::string &taskId, int32_t exitStatus)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    auto iter = m_tasks.find(taskId);
    if (iter != m_tasks.end()) {
        iter->second.stopExitStatus = exitStatus;
    }
}

void FakeTaskBackend::ForgetTask(const std::string &taskId)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_tasks.erase(taskId);
}

void FakeTaskBackend::SetDown(bool down)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_down = down;
}

void FakeTaskBackend::FailNextCalls(unsigned count)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_failNext = count;
}

void FakeTaskBackend::SetUnreachableTask(const std::string &taskId, bool unreachable)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (unreachable) {
        m_unreachable.insert(taskId);
    } else {
        m_unreachable.erase(taskId);
    }
}

void FakeTaskBackend::Restart()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_down = false;
    m_failNext = 0;
    m_restarts++;
}

auto FakeTaskBackend::HasTask(const std::string &taskId) -> bool
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tasks.find(taskId) != m_tasks.end();
}

auto FakeTaskBackend::GetTaskState(const std::string &taskId) -> TaskState
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto iter = m_tasks.find(taskId);
    return iter == m_tasks.end() ? TASK_STATE_UNKNOWN : iter->second.info.state;
}

auto FakeTaskBackend::GetTaskSpec(const std::string &taskId) -> TaskSpec
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto iter = m_tasks.find(taskId);
    return iter == m_tasks.end() ? TaskSpec() : iter->second.spec;
}

auto FakeTaskBackend::GetTaskCount() -> size_t
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tasks.size();
}

auto FakeTaskBackend::GetCallCount() -> unsigned
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_calls;
}

auto FakeTaskBackend::GetDeleteCount(const std::string &taskId) -> unsigned
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto iter = m_deletes.find(taskId);
    return iter == m_deletes.end() ? 0 : iter->second;
}

auto FakeTaskBackend::GetRestartCount() -> unsigned
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_restarts;
}

} // namespace crishim
