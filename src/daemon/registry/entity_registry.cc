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
#include "entity_registry.h"

#include <isula_libutils/log.h>

#include "cxxutils.h"
#include "record_filters.h"

namespace crishim {

EntityRegistry::EntityRegistry(std::chrono::milliseconds startupTimeout) : m_startupTimeout(startupTimeout)
{
}

auto EntityRegistry::Publish(const std::vector<crishim::v1::SandboxRecord> &sandboxes,
                             const std::vector<crishim::v1::ContainerRecord> &containers, Errors &error) -> bool
{
    std::map<std::string, std::shared_ptr<SandboxEntry>> sandboxMap;
    std::map<std::string, std::shared_ptr<ContainerEntry>> containerMap;

    for (const auto &record : sandboxes) {
        sandboxMap[record.id()] = std::make_shared<SandboxEntry>(record);
    }
    for (const auto &record : containers) {
        containerMap[record.id()] = std::make_shared<ContainerEntry>(record);
    }

    std::unique_lock<std::mutex> publishLock(m_publishMutex);
    if (m_published) {
        ERROR("Entity registry is already published");
        error.SetError(ERR_INTERNAL, "Entity registry is already published");
        return false;
    }

    {
        WriteGuard<RWMutex> lock(m_storeRWMutex);
        m_sandboxes.swap(sandboxMap);
        m_containers.swap(containerMap);
    }
    m_published = true;
    publishLock.unlock();
    m_publishCond.notify_all();

    INFO("Entity registry published with %zu sandboxes and %zu containers", sandboxes.size(), containers.size());
    return true;
}

auto EntityRegistry::IsPublished() -> bool
{
    std::unique_lock<std::mutex> lock(m_publishMutex);
    return m_published;
}

auto EntityRegistry::WaitPublished(Errors &error) -> bool
{
    std::unique_lock<std::mutex> lock(m_publishMutex);
    if (m_publishCond.wait_for(lock, m_startupTimeout, [this]() {
        return m_published;
    })) {
        return true;
    }

    WARN("Request rejected, recovery did not finish in %ld ms", static_cast<long>(m_startupTimeout.count()));
    error.SetError(ERR_BACKEND_UNAVAILABLE, "Runtime is still recovering, try again later");
    return false;
}

template <typename Entry>
auto EntityRegistry::StoreGet(std::map<std::string, std::shared_ptr<Entry>> &store, const std::string &idOrPrefix,
                              const char *kind, Errors &error) -> std::shared_ptr<Entry>
{
    std::shared_ptr<Entry> entry = nullptr;

    if (idOrPrefix.empty()) {
        error.SetError(ERR_INVALID_ARGUMENT, std::string("Empty ") + kind + " id");
        return nullptr;
    }

    if (!WaitPublished(error)) {
        return nullptr;
    }

    ReadGuard<RWMutex> lock(m_storeRWMutex);
    // A full ID, which do an exact match
    auto iter = store.find(idOrPrefix);
    if (iter != store.end()) {
        return iter->second;
    }

    // A partial ID prefix, map is ordered so all candidates are adjacent
    for (auto it = store.lower_bound(idOrPrefix); it != store.end(); it++) {
        if (!CXXUtils::HasPrefix(it->first, idOrPrefix)) {
            break;
        }
        if (entry != nullptr) {
            WARN("Multiple IDs found with provided prefix: %s", idOrPrefix.c_str());
            error.SetError(ERR_INVALID_ARGUMENT,
                           std::string("Multiple ") + kind + "s found with provided prefix: " + idOrPrefix);
            return nullptr;
        }
        entry = it->second;
    }

    if (entry == nullptr) {
        error.SetError(ERR_NOT_FOUND, std::string("Failed to find ") + kind + " " + idOrPrefix);
    }
    return entry;
}

template <typename Entry>
void EntityRegistry::StoreGetAll(std::map<std::string, std::shared_ptr<Entry>> &store,
                                 std::vector<std::shared_ptr<Entry>> &entries)
{
    ReadGuard<RWMutex> lock(m_storeRWMutex);
    for (const auto &pair : store) {
        entries.push_back(pair.second);
    }
}

auto EntityRegistry::GetSandbox(const std::string &idOrPrefix, Errors &error) -> std::shared_ptr<SandboxEntry>
{
    return StoreGet(m_sandboxes, idOrPrefix, "sandbox", error);
}

auto EntityRegistry::GetContainer(const std::string &idOrPrefix, Errors &error) -> std::shared_ptr<ContainerEntry>
{
    return StoreGet(m_containers, idOrPrefix, "container", error);
}

auto EntityRegistry::GetSandboxById(const std::string &id) -> std::shared_ptr<SandboxEntry>
{
    ReadGuard<RWMutex> lock(m_storeRWMutex);
    auto iter = m_sandboxes.find(id);
    if (iter != m_sandboxes.end()) {
        return iter->second;
    }
    return nullptr;
}

auto EntityRegistry::AddSandbox(const crishim::v1::SandboxRecord &record, Errors &error)
-> std::shared_ptr<SandboxEntry>
{
    auto entry = std::make_shared<SandboxEntry>(record);

    WriteGuard<RWMutex> lock(m_storeRWMutex);
    if (m_sandboxes.find(record.id()) != m_sandboxes.end()) {
        ERROR("Sandbox %s is already registered", record.id().c_str());
        error.SetError(ERR_ALREADY_EXISTS, "Sandbox " + record.id() + " is already registered");
        return nullptr;
    }
    m_sandboxes[record.id()] = entry;
    return entry;
}

auto EntityRegistry::AddContainer(const crishim::v1::ContainerRecord &record, Errors &error)
-> std::shared_ptr<ContainerEntry>
{
    auto entry = std::make_shared<ContainerEntry>(record);

    WriteGuard<RWMutex> lock(m_storeRWMutex);
    if (m_containers.find(record.id()) != m_containers.end()) {
        ERROR("Container %s is already registered", record.id().c_str());
        error.SetError(ERR_ALREADY_EXISTS, "Container " + record.id() + " is already registered");
        return nullptr;
    }
    m_containers[record.id()] = entry;
    return entry;
}

void EntityRegistry::RemoveSandbox(const std::string &id)
{
    WriteGuard<RWMutex> lock(m_storeRWMutex);
    m_sandboxes.erase(id);
}

void EntityRegistry::RemoveContainer(const std::string &id)
{
    WriteGuard<RWMutex> lock(m_storeRWMutex);
    m_containers.erase(id);
}

auto EntityRegistry::ListSandboxes(const crishim::v1::PodSandboxFilter &filter,
                                   std::vector<crishim::v1::SandboxRecord> &records, Errors &error) -> bool
{
    std::vector<std::shared_ptr<SandboxEntry>> entries;

    if (!WaitPublished(error)) {
        return false;
    }

    // 1. snapshot the entries, 2. copy and filter each record under its own lock
    StoreGetAll(m_sandboxes, entries);
    for (const auto &entry : entries) {
        auto record = entry->GetRecord();
        if (MatchSandboxFilter(filter, record)) {
            records.push_back(record);
        }
    }
    return true;
}

auto EntityRegistry::ListContainers(const crishim::v1::ContainerFilter &filter,
                                    std::vector<crishim::v1::ContainerRecord> &records, Errors &error) -> bool
{
    std::vector<std::shared_ptr<ContainerEntry>> entries;

    if (!WaitPublished(error)) {
        return false;
    }

    StoreGetAll(m_containers, entries);
    for (const auto &entry : entries) {
        auto record = entry->GetRecord();
        if (MatchContainerFilter(filter, record)) {
            records.push_back(record);
        }
    }
    return true;
}

auto EntityRegistry::FindReadySandbox(const std::string &name, const std::string &ns) -> std::shared_ptr<SandboxEntry>
{
    std::vector<std::shared_ptr<SandboxEntry>> entries;

    StoreGetAll(m_sandboxes, entries);
    for (const auto &entry : entries) {
        auto record = entry->GetRecord();
        if (record.name() == name && record.namespace_() == ns && record.state() == crishim::v1::SANDBOX_READY) {
            return entry;
        }
    }
    return nullptr;
}

auto EntityRegistry::FindContainer(const std::string &sandboxId, const std::string &name,
                                   uint32_t attempt) -> std::shared_ptr<ContainerEntry>
{
    std::vector<std::shared_ptr<ContainerEntry>> entries;

    StoreGetAll(m_containers, entries);
    for (const auto &entry : entries) {
        auto record = entry->GetRecord();
        if (record.sandbox_id() == sandboxId && record.name() == name && record.attempt() == attempt) {
            return entry;
        }
    }
    return nullptr;
}

} // namespace crishim
