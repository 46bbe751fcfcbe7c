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
#include "record_filters.h"

#include "cxxutils.h"

namespace crishim {

auto MatchLabels(const google::protobuf::Map<std::string, std::string> &selector,
                 const google::protobuf::Map<std::string, std::string> &labels) -> bool
{
    for (auto &iter : selector) {
        auto val = labels.find(iter.first);
        if (val == labels.end() || val->second != iter.second) {
            return false;
        }
    }
    return true;
}

auto MatchSandboxFilter(const crishim::v1::PodSandboxFilter &filter, const crishim::v1::SandboxRecord &record) -> bool
{
    // (1) filter by id
    if (!filter.id().empty() && !CXXUtils::HasPrefix(record.id(), filter.id())) {
        return false;
    }
    // (2) filter by state
    if (filter.has_state() && filter.state().state() != record.state()) {
        return false;
    }
    // (3) filter by namespace
    if (!filter.namespace_().empty() && filter.namespace_() != record.namespace_()) {
        return false;
    }
    // (4) filter by labels
    return MatchLabels(filter.label_selector(), record.config().labels());
}

auto MatchContainerFilter(const crishim::v1::ContainerFilter &filter, const crishim::v1::ContainerRecord &record) -> bool
{
    if (!filter.id().empty() && !CXXUtils::HasPrefix(record.id(), filter.id())) {
        return false;
    }
    if (filter.has_state() && filter.state().state() != record.state()) {
        return false;
    }
    if (!filter.pod_sandbox_id().empty() && !CXXUtils::HasPrefix(record.sandbox_id(), filter.pod_sandbox_id())) {
        return false;
    }
    return MatchLabels(filter.label_selector(), record.config().labels());
}

auto SandboxStateToString(crishim::v1::PodSandboxState state) -> const char *
{
    switch (state) {
        case crishim::v1::SANDBOX_READY:
            return "READY";
        case crishim::v1::SANDBOX_NOTREADY:
            return "NOTREADY";
        default:
            return "INVALID";
    }
}

auto ContainerStateToString(crishim::v1::ContainerState state) -> const char *
{
    switch (state) {
        case crishim::v1::CONTAINER_CREATED:
            return "CREATED";
        case crishim::v1::CONTAINER_RUNNING:
            return "RUNNING";
        case crishim::v1::CONTAINER_EXITED:
            return "EXITED";
        case crishim::v1::CONTAINER_UNKNOWN:
            return "UNKNOWN";
        default:
            return "INVALID";
    }
}

} // namespace crishim
