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
 * Description: sandbox and container lifecycle operations
 ******************************************************************************/
#ifndef CRISHIM_DAEMON_LIFECYCLE_LIFECYCLE_MANAGER_H
#define CRISHIM_DAEMON_LIFECYCLE_LIFECYCLE_MANAGER_H

#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "entity_registry.h"
#include "errors.h"
#include "metadata_store.h"
#include "records.pb.h"
#include "runtime.pb.h"
#include "state_machine.h"
#include "task_backend.h"

namespace crishim {

// Every transition is written to the metadata store before the registry is updated.
// Lock order: sandbox operation mutex, then container operation mutex.
class LifecycleManager {
public:
    LifecycleManager(std::shared_ptr<MetadataStore> store, std::shared_ptr<TaskBackend> backend,
                     std::shared_ptr<EntityRegistry> registry, uint32_t defaultStopTimeout);
    virtual ~LifecycleManager() = default;
    LifecycleManager(const LifecycleManager &) = delete;
    LifecycleManager &operator=(const LifecycleManager &) = delete;

    auto RunPodSandbox(const crishim::v1::PodSandboxConfig &config, const std::string &runtimeHandler,
                       std::string &sandboxId, Errors &error) -> bool;
    auto StopPodSandbox(const std::string &sandboxId, Errors &error) -> bool;
    auto RemovePodSandbox(const std::string &sandboxId, Errors &error) -> bool;
    auto PodSandboxStatus(const std::string &sandboxId, crishim::v1::SandboxRecord &record, Errors &error) -> bool;
    auto ListPodSandbox(const crishim::v1::PodSandboxFilter &filter, std::vector<crishim::v1::SandboxRecord> &records,
                        Errors &error) -> bool;

    auto CreateContainer(const std::string &sandboxId, const crishim::v1::ContainerConfig &config,
                         std::string &containerId, Errors &error) -> bool;
    auto StartContainer(const std::string &containerId, Errors &error) -> bool;
    // timeout < 0 selects the default stop timeout
    auto StopContainer(const std::string &containerId, int64_t timeout, Errors &error) -> bool;
    auto RemoveContainer(const std::string &containerId, Errors &error) -> bool;
    auto ContainerStatus(const std::string &containerId, crishim::v1::ContainerRecord &record, Errors &error) -> bool;
    auto ListContainers(const crishim::v1::ContainerFilter &filter, std::vector<crishim::v1::ContainerRecord> &records,
                        Errors &error) -> bool;

private:
    auto ValidateSandboxConfig(const crishim::v1::PodSandboxConfig &config, Errors &error) -> bool;
    auto ValidateContainerConfig(const crishim::v1::ContainerConfig &config, Errors &error) -> bool;
    // Only one RunPodSandbox at a time may hold a name in a namespace.
    auto TryReserveSandboxName(const crishim::v1::PodSandboxMetadata &metadata, Errors &error) -> bool;
    void ReleaseSandboxName(const crishim::v1::PodSandboxMetadata &metadata);
    auto CreateSandbox(const crishim::v1::PodSandboxConfig &config, const std::string &runtimeHandler,
                       std::string &sandboxId, Errors &error) -> bool;
    void GenerateContainerTaskSpec(const crishim::v1::ContainerConfig &config, const std::string &sandboxId,
                                   TaskSpec &spec);

    // The caller holds the operation mutex of entry (and of its sandbox).
    auto StopContainerLocked(const std::shared_ptr<ContainerEntry> &entry, uint32_t gracePeriod,
                             Errors &error) -> bool;
    auto RemoveContainerLocked(const std::shared_ptr<ContainerEntry> &entry, Errors &error) -> bool;
    auto ForceRemoveContainerLocked(const std::shared_ptr<ContainerEntry> &entry, Errors &error) -> bool;
    // Best effort, the back reference is recomputed on restart.
    void UpdateSandboxContainers(const std::shared_ptr<SandboxEntry> &sandbox, const std::string &containerId,
                                 bool add);

    auto ContainersOfSandbox(const std::string &sandboxId) -> std::vector<std::shared_ptr<ContainerEntry>>;
    auto SandboxOfContainer(const crishim::v1::ContainerRecord &record) -> std::shared_ptr<SandboxEntry>;

private:
    std::shared_ptr<MetadataStore> m_store;
    std::shared_ptr<TaskBackend> m_backend;
    std::shared_ptr<EntityRegistry> m_registry;
    uint32_t m_defaultStopTimeout;
    std::mutex m_reservedNamesMutex;
    // namespace/name keys of sandboxes being created
    std::set<std::string> m_reservedNames;
};

} // namespace crishim

#endif // CRISHIM_DAEMON_LIFECYCLE_LIFECYCLE_MANAGER_H
