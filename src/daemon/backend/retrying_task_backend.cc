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
 * Description: task backend decorator retrying unavailable backend calls
 ******************************************************************************/
#include "retrying_task_backend.h"

#include <algorithm>
#include <random>
#include <thread>

#include <isula_libutils/log.h>

namespace crishim {

RetryingTaskBackend::RetryingTaskBackend(std::shared_ptr<TaskBackend> backend, const RetryPolicy &policy)
    : m_backend(std::move(backend)), m_policy(policy)
{
    if (m_policy.maxAttempts == 0) {
        m_policy.maxAttempts = 1;
    }
}

auto RetryingTaskBackend::NextBackoff(std::chrono::milliseconds current) -> std::chrono::milliseconds
{
    return std::min(current * 2, m_policy.maxBackoff);
}

// Random sleep between half and the full backoff to avoid thundering herd
auto RetryingTaskBackend::Jitter(std::chrono::milliseconds backoff) -> std::chrono::milliseconds
{
    if (backoff.count() <= 1) {
        return backoff;
    }
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<int64_t> dis(backoff.count() / 2, backoff.count());
    return std::chrono::milliseconds(dis(gen));
}

auto RetryingTaskBackend::Retry(const char *op, const std::string &taskId,
                                const std::function<bool(Errors &)> &call, Errors &error) -> bool
{
    const auto deadline = std::chrono::steady_clock::now() + m_policy.deadline;
    auto backoff = m_policy.initialBackoff;

    for (uint32_t attempt = 1;; attempt++) {
        Errors callErr;
        if (call(callErr)) {
            if (attempt > 1) {
                INFO("Task %s for %s succeeded after %u attempts", op, taskId.c_str(), attempt);
            }
            return true;
        }

        if (!callErr.IsBackendUnavailable()) {
            error = callErr;
            return false;
        }

        auto sleepTime = Jitter(backoff);
        if (attempt >= m_policy.maxAttempts || std::chrono::steady_clock::now() + sleepTime >= deadline) {
            ERROR("Task %s for %s gave up after %u attempts: %s", op, taskId.c_str(), attempt,
                  callErr.GetCMessage());
            error = callErr;
            return false;
        }

        WARN("Task %s for %s failed with backend unavailable, retry %u in %ld ms", op, taskId.c_str(), attempt,
             static_cast<long>(sleepTime.count()));
        std::this_thread::sleep_for(sleepTime);
        backoff = NextBackoff(backoff);
    }
}

auto RetryingTaskBackend::CreateTask(const TaskSpec &spec, std::string &taskId, Errors &error) -> bool
{
    return Retry("create", spec.name, [&](Errors &err) {
        return m_backend->CreateTask(spec, taskId, err);
    }, error);
}

auto RetryingTaskBackend::StartTask(const std::string &taskId, uint32_t &pid, Errors &error) -> bool
{
    return Retry("start", taskId, [&](Errors &err) {
        return m_backend->StartTask(taskId, pid, err);
    }, error);
}

auto RetryingTaskBackend::StopTask(const std::string &taskId, uint32_t gracePeriodSecs, TaskExitInfo &exitInfo,
                                   Errors &error) -> bool
{
    return Retry("stop", taskId, [&](Errors &err) {
        return m_backend->StopTask(taskId, gracePeriodSecs, exitInfo, err);
    }, error);
}

auto RetryingTaskBackend::DeleteTask(const std::string &taskId, bool forceKill, Errors &error) -> bool
{
    return Retry("delete", taskId, [&](Errors &err) {
        return m_backend->DeleteTask(taskId, forceKill, err);
    }, error);
}

auto RetryingTaskBackend::LoadTask(const std::string &taskId, TaskInfo &info, Errors &error) -> bool
{
    return Retry("get", taskId, [&](Errors &err) {
        return m_backend->LoadTask(taskId, info, err);
    }, error);
}

auto RetryingTaskBackend::ListLiveTasks(std::vector<std::string> &taskIds, Errors &error) -> bool
{
    return Retry("list", "", [&](Errors &err) {
        taskIds.clear();
        return m_backend->ListLiveTasks(taskIds, err);
    }, error);
}

} // namespace crishim
