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
#ifndef CRISHIM_DAEMON_BACKEND_RETRYING_TASK_BACKEND_H
#define CRISHIM_DAEMON_BACKEND_RETRYING_TASK_BACKEND_H

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "task_backend.h"

namespace crishim {

struct RetryPolicy {
    uint32_t maxAttempts { 5 };
    std::chrono::milliseconds initialBackoff { 100 };
    std::chrono::milliseconds maxBackoff { 2000 };
    // upper bound for one call including all attempts and sleeps
    std::chrono::milliseconds deadline { 10000 };
};

// Only ERR_BACKEND_UNAVAILABLE is retried, any other failure, including
// ERR_NOT_FOUND, is returned at once.
class RetryingTaskBackend : public TaskBackend {
public:
    RetryingTaskBackend(std::shared_ptr<TaskBackend> backend, const RetryPolicy &policy);
    virtual ~RetryingTaskBackend() = default;

    auto CreateTask(const TaskSpec &spec, std::string &taskId, Errors &error) -> bool override;
    auto StartTask(const std::string &taskId, uint32_t &pid, Errors &error) -> bool override;
    auto StopTask(const std::string &taskId, uint32_t gracePeriodSecs, TaskExitInfo &exitInfo,
                  Errors &error) -> bool override;
    auto DeleteTask(const std::string &taskId, bool forceKill, Errors &error) -> bool override;
    auto LoadTask(const std::string &taskId, TaskInfo &info, Errors &error) -> bool override;
    auto ListLiveTasks(std::vector<std::string> &taskIds, Errors &error) -> bool override;

    auto GetPolicy() const -> const RetryPolicy &
    {
        return m_policy;
    }

private:
    auto Retry(const char *op, const std::string &taskId, const std::function<bool(Errors &)> &call,
               Errors &error) -> bool;
    auto NextBackoff(std::chrono::milliseconds current) -> std::chrono::milliseconds;
    auto Jitter(std::chrono::milliseconds backoff) -> std::chrono::milliseconds;

private:
    std::shared_ptr<TaskBackend> m_backend;
    RetryPolicy m_policy;
};

} // namespace crishim

#endif // CRISHIM_DAEMON_BACKEND_RETRYING_TASK_BACKEND_H
