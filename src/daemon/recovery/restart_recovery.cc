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
#include "restart_recovery.h"

#include <algorithm>

#include <isula_libutils/log.h>

#include "cxxutils.h"
#include "record_filters.h"
#include "worker_pool.h"

namespace crishim {

RestartRecovery::RestartRecovery(std::shared_ptr<MetadataStore> store, std::shared_ptr<TaskBackend> backend,
                                 std::shared_ptr<EntityRegistry> registry, const RecoveryOptions &options)
    : m_store(std::move(store)), m_backend(std::move(backend)), m_registry(std::move(registry)), m_options(options)
{
}

auto RestartRecovery::Run(Errors &error) -> bool
{
    std::vector<std::string> liveTasks;
    std::vector<SandboxSlot> sandboxes;
    std::vector<ContainerSlot> containers;
    std::map<std::string, crishim::v1::PodSandboxState> sandboxStates;
    std::set<std::string> referenced;

    if (m_started.exchange(true)) {
        ERROR("Restart recovery already ran");
        error.SetError(ERR_INTERNAL, "Restart recovery already ran");
        return false;
    }

    const auto begin = std::chrono::steady_clock::now();
    const auto deadline = begin + m_options.timeout;
    INFO("Restart recovery started, timeout %ld ms, %u workers", static_cast<long>(m_options.timeout.count()),
         m_options.workers);

    // 1. a backend that cannot even list its tasks is fatal
    if (!ProbeBackend(liveTasks, error)) {
        return false;
    }

    // 2. load every persisted record
    const size_t corruptBefore = m_store->GetCorruptRecords();
    if (!LoadRecords(sandboxes, containers, error)) {
        return false;
    }
    m_stats.corruptRecords = m_store->GetCorruptRecords() - corruptBefore;

    // 3. sandboxes first, pod containers depend on the sandbox state
    if (!FanOut(sandboxes.size(), [&](size_t i) {
        ReconcileSandbox(sandboxes[i]);
    }, deadline, error)) {
        return false;
    }
    for (const auto &slot : sandboxes) {
        sandboxStates[slot.record.id()] = slot.record.state();
        referenced.insert(slot.record.id());
    }

    // 4. containers
    if (!FanOut(containers.size(), [&](size_t i) {
        ReconcileContainer(containers[i], sandboxStates);
    }, deadline, error)) {
        return false;
    }
    // a container keeps the task of its sandbox referenced even when the sandbox record is gone
    for (const auto &slot : containers) {
        referenced.insert(slot.record.id());
        if (!slot.record.sandbox_id().empty()) {
            referenced.insert(slot.record.sandbox_id());
        }
    }
    RebuildSandboxContainers(sandboxes, containers);

    // 5. store first, the registry never runs ahead of it
    if (!PersistCorrections(sandboxes, containers, deadline, error)) {
        return false;
    }

    CleanupOrphanTasks(liveTasks, referenced);

    // 6. publish atomically
    std::vector<crishim::v1::SandboxRecord> sandboxRecords;
    std::vector<crishim::v1::ContainerRecord> containerRecords;
    for (const auto &slot : sandboxes) {
        sandboxRecords.push_back(slot.record);
        if (slot.record.state() == crishim::v1::SANDBOX_READY) {
            m_stats.readySandboxes++;
        }
    }
    for (const auto &slot : containers) {
        containerRecords.push_back(slot.record);
        if (slot.record.state() == crishim::v1::CONTAINER_UNKNOWN) {
            m_stats.unknownContainers++;
        }
    }
    if (!m_registry->Publish(sandboxRecords, containerRecords, error)) {
        ERROR("Failed to publish recovered entities: %s", error.GetCMessage());
        return false;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - begin);
    INFO("Restart recovery finished in %ld ms: %zu sandboxes (%zu ready), %zu containers (%zu unknown, %zu orphan), "
         "%zu corrupt records skipped, %zu records corrected, %zu orphan tasks (%zu deleted)",
         static_cast<long>(elapsed.count()), m_stats.sandboxes, m_stats.readySandboxes, m_stats.containers,
         m_stats.unknownContainers, m_stats.orphanContainers, m_stats.corruptRecords, m_stats.correctedRecords,
         m_stats.orphanTasks, m_stats.deletedOrphanTasks);
    return true;
}

auto RestartRecovery::ProbeBackend(std::vector<std::string> &liveTasks, Errors &error) -> bool
{
    if (!m_backend->ListLiveTasks(liveTasks, error)) {
        ERROR("Task backend is unreachable: %s", error.GetCMessage());
        error.SetError(ERR_BACKEND_UNAVAILABLE, "Task backend is unreachable: " + error.GetMessage());
        return false;
    }
    DEBUG("Task backend reports %zu live tasks", liveTasks.size());
    return true;
}

auto RestartRecovery::LoadRecords(std::vector<SandboxSlot> &sandboxes, std::vector<ContainerSlot> &containers,
                                  Errors &error) -> bool
{
    std::vector<crishim::v1::SandboxRecord> sandboxRecords;
    std::vector<crishim::v1::ContainerRecord> containerRecords;

    if (!m_store->ListSandboxes(crishim::v1::PodSandboxFilter(), sandboxRecords, error)) {
        ERROR("Failed to load sandbox records: %s", error.GetCMessage());
        return false;
    }
    if (!m_store->ListContainers(crishim::v1::ContainerFilter(), containerRecords, error)) {
        ERROR("Failed to load container records: %s", error.GetCMessage());
        return false;
    }

    for (const auto &record : sandboxRecords) {
        SandboxSlot slot;
        slot.record = record;
        sandboxes.push_back(slot);
    }
    for (const auto &record : containerRecords) {
        ContainerSlot slot;
        slot.record = record;
        containers.push_back(slot);
    }
    m_stats.sandboxes = sandboxes.size();
    m_stats.containers = containers.size();
    INFO("Loaded %zu sandbox records and %zu container records", sandboxes.size(), containers.size());
    return true;
}

auto RestartRecovery::LookupTask(const std::string &id, TaskInfo &info) -> TaskLookupResult
{
    Errors error;

    if (m_backend->LoadTask(id, info, error)) {
        return TASK_LOOKUP_FOUND;
    }
    if (error.IsNotFound()) {
        return TASK_LOOKUP_NOT_FOUND;
    }
    WARN("Failed to load task %s: %s", id.c_str(), error.GetCMessage());
    return TASK_LOOKUP_FAILED;
}

void RestartRecovery::ReconcileSandbox(SandboxSlot &slot)
{
    TaskInfo info;
    auto &record = slot.record;

    auto lookup = LookupTask(record.id(), info);
    auto state = ReconcileSandboxState(lookup, info);
    if (state == record.state()) {
        DEBUG("Sandbox %s recovered as %s", record.id().c_str(), SandboxStateToString(state));
        return;
    }

    WARN("Sandbox %s recovered as %s, persisted %s, task %s", record.id().c_str(), SandboxStateToString(state),
         SandboxStateToString(record.state()),
         lookup == TASK_LOOKUP_FOUND ? TaskStateToString(info.state) :
         (lookup == TASK_LOOKUP_NOT_FOUND ? "not found" : "unreachable"));
    record.set_state(state);
    slot.dirty = true;
}

void RestartRecovery::ReconcileContainer(ContainerSlot &slot,
                                         const std::map<std::string, crishim::v1::PodSandboxState> &sandboxes)
{
    auto &record = slot.record;
    const auto persisted = record.state();
    crishim::v1::ContainerState state = persisted;
    std::string reason;
    TaskInfo info;
    TaskLookupResult lookup = TASK_LOOKUP_NOT_FOUND;

    auto sandbox = sandboxes.find(record.sandbox_id());
    if (sandbox == sandboxes.end()) {
        slot.orphan = true;
    }
    if (persisted == crishim::v1::CONTAINER_EXITED) {
        // terminal
        return;
    }

    if (slot.orphan) {
        // the sandbox record may be gone or unreadable, only the backend knows whether the task lives
        WARN("Sandbox %s of container %s has no record", record.sandbox_id().c_str(), record.id().c_str());
        lookup = LookupTask(record.id(), info);
        state = ReconcileContainerState(persisted, lookup, info, reason);
    } else if (record.pid_namespace_mode() == crishim::v1::POD && sandbox->second != crishim::v1::SANDBOX_READY) {
        state = ReconcileDetachedContainerState(persisted);
        reason = REASON_SANDBOX_NOT_READY;
    } else {
        lookup = LookupTask(record.id(), info);
        state = ReconcileContainerState(persisted, lookup, info, reason);
    }

    if (state == persisted) {
        DEBUG("Container %s recovered as %s", record.id().c_str(), ContainerStateToString(state));
        return;
    }

    WARN("Container %s recovered as %s, persisted %s: %s", record.id().c_str(), ContainerStateToString(state),
         ContainerStateToString(persisted), reason.c_str());
    record.set_state(state);
    if (!reason.empty()) {
        record.set_reason(reason);
    }
    if (state == crishim::v1::CONTAINER_EXITED) {
        if (lookup == TASK_LOOKUP_FOUND && info.state == TASK_STATE_STOPPED) {
            record.set_exit_code(info.exitStatus);
            record.set_finished_at(info.exitedAt);
        }
        if (record.finished_at() == 0) {
            record.set_finished_at(CXXUtils::GetNowTimeNanos());
        }
    }
    if (state == crishim::v1::CONTAINER_RUNNING && record.started_at() == 0) {
        record.set_started_at(CXXUtils::GetNowTimeNanos());
    }
    slot.dirty = true;
}

void RestartRecovery::RebuildSandboxContainers(std::vector<SandboxSlot> &sandboxes,
                                               const std::vector<ContainerSlot> &containers)
{
    std::map<std::string, std::vector<std::string>> owned;

    for (const auto &slot : containers) {
        if (slot.orphan) {
            m_stats.orphanContainers++;
            continue;
        }
        owned[slot.record.sandbox_id()].push_back(slot.record.id());
    }

    for (auto &slot : sandboxes) {
        auto &ids = owned[slot.record.id()];
        std::sort(ids.begin(), ids.end());
        std::vector<std::string> current(slot.record.containers().begin(), slot.record.containers().end());
        std::sort(current.begin(), current.end());
        if (current == ids) {
            continue;
        }
        slot.record.clear_containers();
        for (const auto &id : ids) {
            slot.record.add_containers(id);
        }
        slot.dirty = true;
    }
}

auto RestartRecovery::FanOut(size_t count, const std::function<void(size_t)> &job,
                             std::chrono::steady_clock::time_point deadline, Errors &error) -> bool
{
    if (count == 0) {
        return true;
    }

    WorkerPool pool(std::min<unsigned>(m_options.workers, static_cast<unsigned>(count)));
    pool.Start();
    for (size_t i = 0; i < count; i++) {
        if (!pool.Execute([&job, i]() {
            job(i);
        })) {
            error.SetError(ERR_INTERNAL, "Failed to schedule reconciliation job");
            return false;
        }
    }

    auto now = std::chrono::steady_clock::now();
    auto remaining = deadline > now ? std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now) :
                     std::chrono::milliseconds(0);
    if (!pool.WaitIdle(remaining)) {
        // running jobs are bounded by the backend retry deadline, Stop waits for them
        pool.Stop();
        ERROR("Restart recovery exceeded %ld ms", static_cast<long>(m_options.timeout.count()));
        error.SetError(ERR_BACKEND_UNAVAILABLE, "Restart recovery exceeded " +
                       std::to_string(m_options.timeout.count()) + " ms");
        return false;
    }
    pool.Stop();
    return true;
}

auto RestartRecovery::PersistCorrections(std::vector<SandboxSlot> &sandboxes, std::vector<ContainerSlot> &containers,
                                         std::chrono::steady_clock::time_point deadline, Errors &error) -> bool
{
    for (auto &slot : containers) {
        if (!slot.dirty) {
            continue;
        }
        if (!m_store->PutContainer(slot.record, error)) {
            ERROR("Failed to persist recovered container %s: %s", slot.record.id().c_str(), error.GetCMessage());
            return false;
        }
        m_stats.correctedRecords++;
    }

    for (auto &slot : sandboxes) {
        if (!slot.dirty) {
            continue;
        }
        if (!m_store->PutSandbox(slot.record, error)) {
            ERROR("Failed to persist recovered sandbox %s: %s", slot.record.id().c_str(), error.GetCMessage());
            return false;
        }
        m_stats.correctedRecords++;
    }

    if (std::chrono::steady_clock::now() > deadline) {
        ERROR("Restart recovery exceeded %ld ms", static_cast<long>(m_options.timeout.count()));
        error.SetError(ERR_BACKEND_UNAVAILABLE, "Restart recovery exceeded " +
                       std::to_string(m_options.timeout.count()) + " ms");
        return false;
    }
    return true;
}

void RestartRecovery::CleanupOrphanTasks(const std::vector<std::string> &liveTasks,
                                         const std::set<std::string> &referenced)
{
    for (const auto &id : liveTasks) {
        if (referenced.find(id) != referenced.end()) {
            continue;
        }
        m_stats.orphanTasks++;
        if (!m_options.cleanupOrphanTasks) {
            WARN("Live task %s is not referenced by any record, leave it", id.c_str());
            continue;
        }
        // a skipped record may be the one referring to this task
        if (m_stats.corruptRecords > 0) {
            WARN("Live task %s is not referenced by any readable record, leave it, %zu records are corrupt",
                 id.c_str(), m_stats.corruptRecords);
            continue;
        }

        Errors error;
        WARN("Live task %s is not referenced by any record, delete it", id.c_str());
        if (!m_backend->DeleteTask(id, true, error) && !error.IsNotFound()) {
            WARN("Failed to delete orphan task %s: %s", id.c_str(), error.GetCMessage());
            continue;
        }
        m_stats.deletedOrphanTasks++;
    }
}

} // namespace crishim
