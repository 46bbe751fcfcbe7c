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
 * Description: sandbox and container transition tables
 ******************************************************************************/
#ifndef CRISHIM_DAEMON_LIFECYCLE_STATE_MACHINE_H
#define CRISHIM_DAEMON_LIFECYCLE_STATE_MACHINE_H

#include <string>

#include "runtime.pb.h"
#include "task_backend.h"

namespace crishim {

enum TransitionResult {
    // perform the operation and move to the next state
    TRANSITION_APPLY = 0,
    // already there, succeed without touching backend or store
    TRANSITION_NOOP,
    TRANSITION_ILLEGAL,
};

enum SandboxEvent {
    SANDBOX_EVENT_STOP = 0,
    SANDBOX_EVENT_REMOVE,
};

enum ContainerEvent {
    CONTAINER_EVENT_START = 0,
    CONTAINER_EVENT_STOP,
    CONTAINER_EVENT_REMOVE,
};

enum TaskLookupResult {
    TASK_LOOKUP_FOUND = 0,
    TASK_LOOKUP_NOT_FOUND,
    // retries exhausted, the task state is unknown
    TASK_LOOKUP_FAILED,
};

// reasons recorded on containers changed by reconciliation
#define REASON_COMPLETED "Completed"
#define REASON_ERROR "Error"
#define REASON_TASK_NOT_FOUND "TaskNotFound"
#define REASON_BACKEND_UNAVAILABLE "BackendUnavailable"
#define REASON_TASK_STATE_AMBIGUOUS "TaskStateAmbiguous"
#define REASON_SANDBOX_NOT_READY "SandboxNotReady"

// For REMOVE, next is left untouched, APPLY means the record goes away.
auto SandboxTransition(crishim::v1::PodSandboxState current, SandboxEvent event,
                       crishim::v1::PodSandboxState &next) -> TransitionResult;
auto ContainerTransition(crishim::v1::ContainerState current, ContainerEvent event,
                         crishim::v1::ContainerState &next) -> TransitionResult;

// READY only while the backing task runs.
auto ReconcileSandboxState(TaskLookupResult lookup, const TaskInfo &task) -> crishim::v1::PodSandboxState;

// Map a persisted container state and the backend view to the recovered state.
// EXITED is terminal and never changes. reason is set when the state changes for a reason
// worth reporting.
auto ReconcileContainerState(crishim::v1::ContainerState persisted, TaskLookupResult lookup, const TaskInfo &task,
                             std::string &reason) -> crishim::v1::ContainerState;

// A container sharing the pid namespace of a sandbox that is gone or not ready died with it.
auto ReconcileDetachedContainerState(crishim::v1::ContainerState persisted) -> crishim::v1::ContainerState;

} // namespace crishim

#endif // CRISHIM_DAEMON_LIFECYCLE_STATE_MACHINE_H
