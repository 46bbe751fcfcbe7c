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
 * Description: sandbox and container record filters
 ******************************************************************************/
#ifndef CRISHIM_DAEMON_COMMON_RECORD_FILTERS_H
#define CRISHIM_DAEMON_COMMON_RECORD_FILTERS_H

#include <string>

#include <google/protobuf/map.h>

#include "records.pb.h"
#include "runtime.pb.h"

namespace crishim {

auto MatchLabels(const google::protobuf::Map<std::string, std::string> &selector,
                 const google::protobuf::Map<std::string, std::string> &labels) -> bool;

// id and pod_sandbox_id match by prefix, the other fields exactly
auto MatchSandboxFilter(const crishim::v1::PodSandboxFilter &filter, const crishim::v1::SandboxRecord &record) -> bool;
auto MatchContainerFilter(const crishim::v1::ContainerFilter &filter,
                          const crishim::v1::ContainerRecord &record) -> bool;

auto SandboxStateToString(crishim::v1::PodSandboxState state) -> const char *;
auto ContainerStateToString(crishim::v1::ContainerState state) -> const char *;

} // namespace crishim

#endif // CRISHIM_DAEMON_COMMON_RECORD_FILTERS_H
