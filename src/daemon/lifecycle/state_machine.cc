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
#include "state_machine.h"

namespace crishim {

using crishim::v1::ContainerState;
using crishim::v1::PodSandboxState;

auto SandboxTransition(PodSandboxState current, SandboxEvent event, PodSandboxState &next) -> TransitionResult
{
    switch (event) {
        case SANDBOX_EVENT_STOP:
            switch (current) {
                case crishim::v1::SANDBOX_READY:
                    next = crishim::v1::SANDBOX_NOTREADY;
                    return TRANSITION_APPLY;
                case crishim::v1::SANDBOX_NOTREADY:
                    return TRANSITION_NOOP;
                default:
                    return TRANSITION_ILLEGAL;
            }
        case SANDBOX_EVENT_REMOVE:
            switch (current) {
                case crishim::v1::SANDBOX_NOTREADY:
                    return TRANSITION_APPLY;
                case crishim::v1::SANDBOX_READY:
                default:
                    return TRANSITION_ILLEGAL;
            }
        default:
            return TRANSITION_ILLEGAL;
    }
}

auto ContainerTransition(ContainerState current, ContainerEvent event, ContainerState &next) -> TransitionResult
{
    switch (event) {
        case CONTAINER_EVENT_START:
            switch (current) {
                case crishim::v1::CONTAINER_CREATED:
                    next = crishim::v1::CONTAINER_RUNNING;
                    return TRANSITION_APPLY;
                case crishim::v1::CONTAINER_RUNNING:
                case crishim::v1::CONTAINER_EXITED:
                case crishim::v1::CONTAINER_UNKNOWN:
                default:
                    return TRANSITION_ILLEGAL;
            }
        case CONTAINER_EVENT_STOP:
            switch (current) {
                case crishim::v1::CONTAINER_RUNNING:
                case crishim::v1::CONTAINER_UNKNOWN:
                    next = crishim::v1::CONTAINER_EXITED;
                    return TRANSITION_APPLY;
                case crishim::v1::CONTAINER_CREATED:
                case crishim::v1::CONTAINER_EXITED:
                    return TRANSITION_NOOP;
                default:
                    return TRANSITION_ILLEGAL;
            }
        case CONTAINER_EVENT_REMOVE:
            switch (current) {
                case crishim::v1::CONTAINER_CREATED:
                case crishim::v1::CONTAINER_EXITED:
                case crishim::v1::CONTAINER_UNKNOWN:
                    return TRANSITION_APPLY;
                case crishim::v1::CONTAINER_RUNNING:
                default:
                    return TRANSITION_ILLEGAL;
            }
        default:
            return TRANSITION_ILLEGAL;
    }
}

auto ReconcileSandboxState(TaskLookupResult lookup, const TaskInfo &task) -> PodSandboxState
{
    if (lookup == TASK_LOOKUP_FOUND && task.state == TASK_STATE_RUNNING) {
        return crishim::v1::SANDBOX_READY;
    }
    return crishim::v1::SANDBOX_NOTREADY;
}

auto ReconcileContainerState(ContainerState persisted, TaskLookupResult lookup, const TaskInfo &task,
                             std::string &reason) -> ContainerState
{
    if (persisted == crishim::v1::CONTAINER_EXITED) {
        return crishim::v1::CONTAINER_EXITED;
    }

    switch (lookup) {
        case TASK_LOOKUP_FAILED:
            reason = REASON_BACKEND_UNAVAILABLE;
            return crishim::v1::CONTAINER_UNKNOWN;
        case TASK_LOOKUP_NOT_FOUND:
            reason = REASON_TASK_NOT_FOUND;
            return crishim::v1::CONTAINER_UNKNOWN;
        case TASK_LOOKUP_FOUND:
            break;
        default:
            reason = REASON_TASK_STATE_AMBIGUOUS;
            return crishim::v1::CONTAINER_UNKNOWN;
    }

    switch (task.state) {
        case TASK_STATE_RUNNING:
            return crishim::v1::CONTAINER_RUNNING;
        case TASK_STATE_STOPPED:
            reason = task.exitStatus == 0 ? REASON_COMPLETED : REASON_ERROR;
            return crishim::v1::CONTAINER_EXITED;
        case TASK_STATE_CREATED:
            // a started container never goes back to CREATED
            if (persisted == crishim::v1::CONTAINER_CREATED) {
                return crishim::v1::CONTAINER_CREATED;
            }
            reason = REASON_TASK_STATE_AMBIGUOUS;
            return crishim::v1::CONTAINER_UNKNOWN;
        case TASK_STATE_UNKNOWN:
        default:
            reason = REASON_TASK_STATE_AMBIGUOUS;
            return crishim::v1::CONTAINER_UNKNOWN;
    }
}

auto ReconcileDetachedContainerState(ContainerState persisted) -> ContainerState
{
    if (persisted == crishim::v1::CONTAINER_CREATED) {
        return crishim::v1::CONTAINER_CREATED;
    }
    return crishim::v1::CONTAINER_EXITED;
}

} // namespace crishim
