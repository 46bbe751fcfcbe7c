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
 * Description: task execution backend interface
 ******************************************************************************/
#ifndef CRISHIM_DAEMON_BACKEND_TASK_BACKEND_H
#define CRISHIM_DAEMON_BACKEND_TASK_BACKEND_H

#include <stdint.h>

#include <map>
#include <string>
#include <vector>

#include "errors.h"

namespace crishim {

enum TaskState {
    TASK_STATE_UNKNOWN = 0,
    TASK_STATE_CREATED,
    TASK_STATE_RUNNING,
    TASK_STATE_STOPPED,
};

struct TaskSpec {
    std::string name;
    // empty for the task backing a sandbox
    std::string sandboxId;
    // join the pid namespace of the sandbox task, killed together with it
    bool shareSandboxPid { false };
    std::string image;
    std::vector<std::string> args;
    std::vector<std::string> envs;
    std::string workingDir;
    std::map<std::string, std::string> labels;
};

struct TaskInfo {
    std::string id;
    TaskState state { TASK_STATE_UNKNOWN };
    uint32_t pid { 0 };
    int32_t exitStatus { 0 };
    int64_t exitedAt { 0 };
};

struct TaskExitInfo {
    int32_t exitStatus { 0 };
    int64_t exitedAt { 0 };
};

// Failures carry ERR_NOT_FOUND when the backend does not know the task,
// ERR_BACKEND_UNAVAILABLE when it could not be reached and ERR_BACKEND_FAILED otherwise.
class TaskBackend {
public:
    virtual ~TaskBackend() {};

    virtual auto CreateTask(const TaskSpec &spec, std::string &taskId, Errors &error) -> bool = 0;
    virtual auto StartTask(const std::string &taskId, uint32_t &pid, Errors &error) -> bool = 0;
    // Graceful signal, wait gracePeriodSecs, then kill. Stopping a stopped task returns its exit info.
    virtual auto StopTask(const std::string &taskId, uint32_t gracePeriodSecs, TaskExitInfo &exitInfo,
                          Errors &error) -> bool = 0;
    virtual auto DeleteTask(const std::string &taskId, bool forceKill, Errors &error) -> bool = 0;
    // Works for tasks created before a backend restart.
    virtual auto LoadTask(const std::string &taskId, TaskInfo &info, Errors &error) -> bool = 0;
    virtual auto ListLiveTasks(std::vector<std::string> &taskIds, Errors &error) -> bool = 0;
};

auto TaskStateToString(TaskState state) -> const char *;

} // namespace crishim

#endif // CRISHIM_DAEMON_BACKEND_TASK_BACKEND_H
