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
 * Description: in-memory index of sandboxes and containers
 ******************************************************************************/
#ifndef CRISHIM_DAEMON_REGISTRY_ENTITY_REGISTRY_H
#define CRISHIM_DAEMON_REGISTRY_ENTITY_REGISTRY_H

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "errors.h"
#include "read_write_lock.h"
#include "records.pb.h"
#include "runtime.pb.h"

namespace crishim {

// One registered entity. The operation mutex serializes lifecycle transitions on
// the entity, the record lock only guards the record copy so readers never wait
// for a transition in flight.
template <typename Record>
class RegistryEntry {
public:
    explicit RegistryEntry(const Record &record) : m_id(record.id()), m_record(record) {}
    virtual ~RegistryEntry() = default;
    RegistryEntry(const RegistryEntry &) = delete;
    RegistryEntry &operator=(const RegistryEntry &) = delete;

    auto GetId() const -> const std::string &
    {
        return m_id;
    }

    auto GetRecord() -> Record
    {
        ReadGuard<RWMutex> lock(m_recordMutex);
        return m_record;
    }

    void SetRecord(const Record &record)
    {
        WriteGuard<RWMutex> lock(m_recordMutex);
        m_record = record;
    }

    auto GetOperationMutex() -> std::mutex &
    {
        return m_opMutex;
    }

    // Set under the operation mutex once the entity left the registry.
    auto IsRemoved() -> bool
    {
        ReadGuard<RWMutex> lock(m_recordMutex);
        return m_removed;
    }

    void MarkRemoved()
    {
        WriteGuard<RWMutex> lock(m_recordMutex);
        m_removed = true;
    }

private:
    const std::string m_id;
    std::mutex m_opMutex;
    RWMutex m_recordMutex;
    Record m_record;
    bool m_removed { false };
};

using SandboxEntry = RegistryEntry<crishim::v1::SandboxRecord>;
using ContainerEntry = RegistryEntry<crishim::v1::ContainerRecord>;

class EntityRegistry {
public:
    // Queries arriving before Publish wait up to startupTimeout.
    explicit EntityRegistry(std::chrono::milliseconds startupTimeout);
    virtual ~EntityRegistry() = default;
    EntityRegistry(const EntityRegistry &) = delete;
    EntityRegistry &operator=(const EntityRegistry &) = delete;

    // Replace the whole content at once and open the registry. Only allowed once.
    auto Publish(const std::vector<crishim::v1::SandboxRecord> &sandboxes,
                 const std::vector<crishim::v1::ContainerRecord> &containers, Errors &error) -> bool;
    auto IsPublished() -> bool;
    // ERR_BACKEND_UNAVAILABLE on timeout
    auto WaitPublished(Errors &error) -> bool;

    // full id or unique id prefix
    auto GetSandbox(const std::string &idOrPrefix, Errors &error) -> std::shared_ptr<SandboxEntry>;
    auto GetContainer(const std::string &idOrPrefix, Errors &error) -> std::shared_ptr<ContainerEntry>;
    // exact match only, nullptr when absent
    auto GetSandboxById(const std::string &id) -> std::shared_ptr<SandboxEntry>;

    auto AddSandbox(const crishim::v1::SandboxRecord &record, Errors &error) -> std::shared_ptr<SandboxEntry>;
    auto AddContainer(const crishim::v1::ContainerRecord &record, Errors &error) -> std::shared_ptr<ContainerEntry>;
    void RemoveSandbox(const std::string &id);
    void RemoveContainer(const std::string &id);

    auto ListSandboxes(const crishim::v1::PodSandboxFilter &filter, std::vector<crishim::v1::SandboxRecord> &records,
                       Errors &error) -> bool;
    auto ListContainers(const crishim::v1::ContainerFilter &filter,
                        std::vector<crishim::v1::ContainerRecord> &records, Errors &error) -> bool;

    auto FindReadySandbox(const std::string &name, const std::string &ns) -> std::shared_ptr<SandboxEntry>;
    auto FindContainer(const std::string &sandboxId, const std::string &name,
                       uint32_t attempt) -> std::shared_ptr<ContainerEntry>;

private:
    template <typename Entry>
    auto StoreGet(std::map<std::string, std::shared_ptr<Entry>> &store, const std::string &idOrPrefix,
                  const char *kind, Errors &error) -> std::shared_ptr<Entry>;
    template <typename Entry>
    void StoreGetAll(std::map<std::string, std::shared_ptr<Entry>> &store,
                     std::vector<std::shared_ptr<Entry>> &entries);

private:
    std::chrono::milliseconds m_startupTimeout;
    bool m_published { false };
    std::mutex m_publishMutex;
    std::condition_variable m_publishCond;

    // id --> entry maps
    std::map<std::string, std::shared_ptr<SandboxEntry>> m_sandboxes;
    std::map<std::string, std::shared_ptr<ContainerEntry>> m_containers;
    RWMutex m_storeRWMutex;
};

} // namespace crishim

#endif // CRISHIM_DAEMON_REGISTRY_ENTITY_REGISTRY_H
