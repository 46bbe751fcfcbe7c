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
 * Description: metadata store keeping one json file per record
 ******************************************************************************/
#ifndef CRISHIM_DAEMON_STORE_FILE_METADATA_STORE_H
#define CRISHIM_DAEMON_STORE_FILE_METADATA_STORE_H

#include <atomic>
#include <string>
#include <vector>

#include "metadata_store.h"

namespace crishim {

// Layout:
//   <root>/sandboxes/<id>.json
//   <root>/containers/<id>.json
// Callers serialize writes for the same id.
class FileMetadataStore : public MetadataStore {
public:
    explicit FileMetadataStore(const std::string &rootdir);
    virtual ~FileMetadataStore() = default;

    auto Init(Errors &error) -> bool override;

    auto PutSandbox(const crishim::v1::SandboxRecord &record, Errors &error) -> bool override;
    auto GetSandbox(const std::string &id, crishim::v1::SandboxRecord &record, Errors &error) -> bool override;
    auto DeleteSandbox(const std::string &id, Errors &error) -> bool override;
    auto ListSandboxes(const crishim::v1::PodSandboxFilter &filter,
                       std::vector<crishim::v1::SandboxRecord> &records, Errors &error) -> bool override;

    auto PutContainer(const crishim::v1::ContainerRecord &record, Errors &error) -> bool override;
    auto GetContainer(const std::string &id, crishim::v1::ContainerRecord &record, Errors &error) -> bool override;
    auto DeleteContainer(const std::string &id, Errors &error) -> bool override;
    auto ListContainers(const crishim::v1::ContainerFilter &filter,
                        std::vector<crishim::v1::ContainerRecord> &records, Errors &error) -> bool override;

    auto GetCorruptRecords() const -> size_t override
    {
        return m_corruptRecords.load();
    }

    auto GetSandboxDir() const -> const std::string &
    {
        return m_sandboxDir;
    }
    auto GetContainerDir() const -> const std::string &
    {
        return m_containerDir;
    }

private:
    auto RecordPath(const std::string &dir, const std::string &id) -> std::string;
    auto RemoveStaleTempFiles(const std::string &dir, Errors &error) -> bool;
    auto ListRecordIds(const std::string &dir, std::vector<std::string> &ids, Errors &error) -> bool;

    template <typename Record>
    auto WriteRecord(const std::string &dir, const Record &record, Errors &error) -> bool;
    template <typename Record>
    auto ParseRecord(const std::string &id, const std::string &json, Record &record, Errors &error) -> bool;
    template <typename Record>
    auto ReadRecord(const std::string &dir, const std::string &id, Record &record, Errors &error) -> bool;
    template <typename Record>
    auto ReadAllRecords(const std::string &dir, const char *kind, std::vector<Record> &records, Errors &error) -> bool;
    auto DeleteRecord(const std::string &dir, const std::string &id, Errors &error) -> bool;

private:
    std::string m_rootdir;
    std::string m_sandboxDir;
    std::string m_containerDir;
    std::atomic<size_t> m_corruptRecords { 0 };
};

} // namespace crishim

#endif // CRISHIM_DAEMON_STORE_FILE_METADATA_STORE_H
