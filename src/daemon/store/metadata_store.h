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
 * Description: durable sandbox and container metadata store interface
 ******************************************************************************/
#ifndef CRISHIM_DAEMON_STORE_METADATA_STORE_H
#define CRISHIM_DAEMON_STORE_METADATA_STORE_H

#include <string>
#include <vector>

#include "errors.h"
#include "records.pb.h"
#include "runtime.pb.h"

namespace crishim {

// Every Put replaces the whole record and is durable when it returns true.
// Get of an unknown id fails with ERR_NOT_FOUND, Delete of an unknown id succeeds.
// List skips records it cannot parse but fails when a record cannot be read at all.
class MetadataStore {
public:
    virtual ~MetadataStore() = default;

    virtual auto Init(Errors &error) -> bool = 0;

    virtual auto PutSandbox(const crishim::v1::SandboxRecord &record, Errors &error) -> bool = 0;
    virtual auto GetSandbox(const std::string &id, crishim::v1::SandboxRecord &record, Errors &error) -> bool = 0;
    virtual auto DeleteSandbox(const std::string &id, Errors &error) -> bool = 0;
    virtual auto ListSandboxes(const crishim::v1::PodSandboxFilter &filter,
                               std::vector<crishim::v1::SandboxRecord> &records, Errors &error) -> bool = 0;

    virtual auto PutContainer(const crishim::v1::ContainerRecord &record, Errors &error) -> bool = 0;
    virtual auto GetContainer(const std::string &id, crishim::v1::ContainerRecord &record, Errors &error) -> bool = 0;
    virtual auto DeleteContainer(const std::string &id, Errors &error) -> bool = 0;
    virtual auto ListContainers(const crishim::v1::ContainerFilter &filter,
                                std::vector<crishim::v1::ContainerRecord> &records, Errors &error) -> bool = 0;

    // Number of records the List calls skipped so far because their content could not be parsed.
    virtual auto GetCorruptRecords() const -> size_t = 0;
};

} // namespace crishim

#endif // CRISHIM_DAEMON_STORE_METADATA_STORE_H
