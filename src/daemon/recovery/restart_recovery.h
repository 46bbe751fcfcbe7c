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
 * Description: rebuild the entity registry from the metadata store and the backend after restart
 ******************************************************************************/
#ifndef CRISHIM_DAEMON_RECOVERY_RESTART_RECOVERY_H
#define CRISHIM_DAEMON_RECOVERY_RESTART_RECOVERY_H

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "entity_registry.h"
#include "errors.h"
#include "metadata_store.h"
#include "records.pb.h"
#include "state_machine.h"
#include "task_backend.h"

namespace crishim {

struct RecoveryOptions {
    // bound of the whole pass
    std::chrono::milliseconds timeout { std::chrono::seconds(120) };
    unsigned workers { 8 };
    // force delete live tasks no record refers to, never done while records are corrupt
    bool cleanupOrphanTasks { true };
};

struct RecoveryStats {
    size_t sandboxes { 0 };
    size_t readySandboxes { 0 };
    size_t containers { 0 };
    size_t unknownContainers { 0 };
    size_t orphanContainers { 0 };
    // records skipped by the store because they could not be parsed
    size_t corruptRecords { 0 };
    size_t correctedRecords { 0 };
    size_t orphanTasks { 0 };
    size_t deletedOrphanTasks { 0 };
};

// Runs once before the runtime serves requests. Nothing else populates the registry.
class RestartRecovery {
public:
    RestartRecovery(std::shared_ptr<MetadataStore> store, std::shared_ptr<TaskBackend> backend,
                    std::shared_ptr<EntityRegistry> registry, const RecoveryOptions &options);
    virtual ~RestartRecovery() = default;
    RestartRecovery(const RestartRecovery &) = delete;
    RestartRecovery &operator=(const RestartRecovery &) = delete;

    // Failure is fatal for the daemon: unreachable backend, unreadable store,
    // failed persist or timeout.
    auto Run(Errors &error) -> bool;

    auto GetStats() const -> const RecoveryStats &
    {
        return m_stats;
    }

private:
    struct SandboxSlot {
        crishim::v1::SandboxRecord record;
        bool dirty { false };
    };
    struct ContainerSlot {
        crishim::v1::ContainerRecord record;
        bool dirty { false };
        bool orphan { false };
    };

    auto ProbeBackend(std::vector<std::string> &liveTasks, Errors &error) -> bool;
    auto LoadRecords(std::vector<SandboxSlot> &sandboxes, std::vector<ContainerSlot> &containers,
                     Errors &error) -> bool;
    auto LookupTask(const std::string &id, TaskInfo &info) -> TaskLookupResult;
    void ReconcileSandbox(SandboxSlot &slot);
    void ReconcileContainer(ContainerSlot &slot, const std::map<std::string, crishim::v1::PodSandboxState> &sandboxes);
    void RebuildSandboxContainers(std::vector<SandboxSlot> &sandboxes, const std::vector<ContainerSlot> &containers);
    auto FanOut(size_t count, const std::function<void(size_t)> &job,
                std::chrono::steady_clock::time_point deadline, Errors &error) -> bool;
    auto PersistCorrections(std::vector<SandboxSlot> &sandboxes, std::vector<ContainerSlot> &containers,
                            std::chrono::steady_clock::time_point deadline, Errors &error) -> bool;
    void CleanupOrphanTasks(const std::vector<std::string> &liveTasks, const std::set<std::string> &referenced);

private:
    std::shared_ptr<MetadataStore> m_store;
    std::shared_ptr<TaskBackend> m_backend;
    std::shared_ptr<EntityRegistry> m_registry;
    RecoveryOptions m_options;
    RecoveryStats m_stats;
    std::atomic<bool> m_started { false };
};

} // namespace crishim

#endif // CRISHIM_DAEMON_RECOVERY_RESTART_RECOVERY_H
