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
 * Description: task execution backend helpers
 ******************************************************************************/
#include "task_backend.h"

namespace crishim {

auto TaskStateToString(TaskState state) -> const char *
{
    switch (state) {
        case TASK_STATE_CREATED:
            return "created";
        case TASK_STATE_RUNNING:
            return "running";
        case TASK_STATE_STOPPED:
            return "stopped";
        case TASK_STATE_UNKNOWN:
        default:
            return "unknown";
    }
}

} // namespace crishim
