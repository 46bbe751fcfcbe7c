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
#include "lifecycle_manager.h"

#include <algorithm>
#include <limits>

#include <isula_libutils/log.h>

#include "cxxutils.h"
#include "record_filters.h"

namespace crishim {

LifecycleManager::LifecycleManager(std::shared_ptr<MetadataStore> store, std::shared_ptr<TaskBackend> backend,
                                   std::shared_ptr<EntityRegistry> registry, uint32_t defaultStopTimeout)
    : m_store(std::move(store))
    , m_backend(std::move(backend))
    , m_registry(std::move(registry))
    , m_defaultStopTimeout(defaultStopTimeout)
{
}

auto LifecycleManager::ValidateSandboxConfig(const crishim::v1::PodSandboxConfig &config, Errors &error) -> bool
{
    if (!config.has_metadata()) {
        error.SetError(ERR_INVALID_ARGUMENT, "Sandbox config metadata is required");
        return false;
    }
    if (config.metadata().name().empty()) {
        error.SetError(ERR_INVALID_ARGUMENT, "Sandbox name is required");
        return false;
    }
    return true;
}

auto LifecycleManager::ValidateContainerConfig(const crishim::v1::ContainerConfig &config, Errors &error) -> bool
{
    if (!config.has_metadata()) {
        error.SetError(ERR_INVALID_ARGUMENT, "Container config metadata is required");
        return false;
    }
    if (config.metadata().name().empty()) {
        error.SetError(ERR_INVALID_ARGUMENT, "Container name is required");
        return false;
    }
    return true;
}

namespace {
auto SandboxNameKey(const crishim::v1::PodSandboxMetadata &metadata) -> std::string
{
    return metadata.namespace_() + "/" + metadata.name();
}
} // namespace

auto LifecycleManager::TryReserveSandboxName(const crishim::v1::PodSandboxMetadata &metadata, Errors &error) -> bool
{
    std::lock_guard<std::mutex> lock(m_reservedNamesMutex);

    if (m_reservedNames.count(SandboxNameKey(metadata)) != 0) {
        ERROR("Conflict. The name \"%s\" in namespace \"%s\" is being used by a sandbox in creation",
              metadata.name().c_str(), metadata.namespace_().c_str());
        error.SetError(ERR_ALREADY_EXISTS, "Conflict. The name \"" + metadata.name() + "\" in namespace \"" +
                       metadata.namespace_() + "\" is being used by a sandbox in creation");
        return false;
    }

    auto old = m_registry->FindReadySandbox(metadata.name(), metadata.namespace_());
    if (old != nullptr) {
        ERROR("Conflict. The name \"%s\" in namespace \"%s\" is already in use by ready sandbox %s",
              metadata.name().c_str(), metadata.namespace_().c_str(), old->GetId().c_str());
        error.SetError(ERR_ALREADY_EXISTS, "Conflict. The name \"" + metadata.name() + "\" in namespace \"" +
                       metadata.namespace_() + "\" is already in use by ready sandbox " + old->GetId());
        return false;
    }

    m_reservedNames.insert(SandboxNameKey(metadata));
    return true;
}

void LifecycleManager::ReleaseSandboxName(const crishim::v1::PodSandboxMetadata &metadata)
{
    std::lock_guard<std::mutex> lock(m_reservedNamesMutex);
    m_reservedNames.erase(SandboxNameKey(metadata));
}

auto LifecycleManager::RunPodSandbox(const crishim::v1::PodSandboxConfig &config, const std::string &runtimeHandler,
                                     std::string &sandboxId, Errors &error) -> bool
{
    if (!ValidateSandboxConfig(config, error)) {
        ERROR("Invalid sandbox config: %s", error.GetCMessage());
        return false;
    }
    if (!m_registry->WaitPublished(error)) {
        return false;
    }

    if (!TryReserveSandboxName(config.metadata(), error)) {
        return false;
    }
    // the sandbox is READY in the registry before its name is released
    bool ret = CreateSandbox(config, runtimeHandler, sandboxId, error);
    ReleaseSandboxName(config.metadata());
    return ret;
}

auto LifecycleManager::CreateSandbox(const crishim::v1::PodSandboxConfig &config, const std::string &runtimeHandler,
                                     std::string &sandboxId, Errors &error) -> bool
{
    TaskSpec spec;
    std::string taskId;
    uint32_t pid = 0;
    Errors tmpErr;
    const auto &metadata = config.metadata();

    spec.name = metadata.name();
    spec.labels.insert(config.labels().begin(), config.labels().end());
    if (!m_backend->CreateTask(spec, taskId, error)) {
        ERROR("Failed to create task for sandbox %s: %s", metadata.name().c_str(), error.GetCMessage());
        return false;
    }

    if (!CXXUtils::IsValidId(taskId)) {
        ERROR("Backend returned invalid task id '%s' for sandbox %s", taskId.c_str(), metadata.name().c_str());
        error.SetError(ERR_BACKEND_FAILED, "Backend returned invalid task id '" + taskId + "'");
        if (!m_backend->DeleteTask(taskId, true, tmpErr)) {
            WARN("Failed to delete task %s: %s", taskId.c_str(), tmpErr.GetCMessage());
        }
        return false;
    }

    if (!m_backend->StartTask(taskId, pid, error)) {
        ERROR("Failed to start task for sandbox %s: %s", taskId.c_str(), error.GetCMessage());
        if (!m_backend->DeleteTask(taskId, true, tmpErr)) {
            WARN("Failed to delete task %s: %s", taskId.c_str(), tmpErr.GetCMessage());
        }
        return false;
    }

    crishim::v1::SandboxRecord record;
    record.set_id(taskId);
    record.set_name(metadata.name());
    record.set_namespace_(metadata.namespace_());
    record.set_uid(metadata.uid());
    record.set_attempt(metadata.attempt());
    record.set_state(crishim::v1::SANDBOX_READY);
    *record.mutable_config() = config;
    record.set_created_at(CXXUtils::GetNowTimeNanos());
    record.set_runtime_handler(runtimeHandler);

    // a task without record is an orphan, recovery deletes it
    if (!m_store->PutSandbox(record, error)) {
        ERROR("Failed to save sandbox %s: %s", taskId.c_str(), error.GetCMessage());
        if (!m_backend->DeleteTask(taskId, true, tmpErr)) {
            WARN("Failed to delete task %s: %s", taskId.c_str(), tmpErr.GetCMessage());
        }
        return false;
    }

    if (m_registry->AddSandbox(record, error) == nullptr) {
        return false;
    }

    sandboxId = taskId;
    EVENT("Event: {Object: %s, Type: Running sandbox %s in namespace %s}", sandboxId.c_str(),
          metadata.name().c_str(), metadata.namespace_().c_str());
    return true;
}

auto LifecycleManager::StopPodSandbox(const std::string &sandboxId, Errors &error) -> bool
{
    crishim::v1::PodSandboxState next;
    TaskExitInfo exitInfo;

    auto sandbox = m_registry->GetSandbox(sandboxId, error);
    if (sandbox == nullptr) {
        ERROR("Failed to stop sandbox %s: %s", sandboxId.c_str(), error.GetCMessage());
        return false;
    }

    std::lock_guard<std::mutex> opLock(sandbox->GetOperationMutex());
    if (sandbox->IsRemoved()) {
        error.SetError(ERR_NOT_FOUND, "Failed to find sandbox " + sandboxId);
        return false;
    }

    auto record = sandbox->GetRecord();
    switch (SandboxTransition(record.state(), SANDBOX_EVENT_STOP, next)) {
        case TRANSITION_NOOP:
            DEBUG("Sandbox %s is already stopped", record.id().c_str());
            return true;
        case TRANSITION_APPLY:
            break;
        case TRANSITION_ILLEGAL:
        default:
            error.SetError(ERR_ILLEGAL_TRANSITION, std::string("Cannot stop sandbox ") + record.id() + " in state " +
                           SandboxStateToString(record.state()));
            return false;
    }

    // containers sharing the sandbox pid namespace die with the sandbox task
    for (const auto &container : ContainersOfSandbox(record.id())) {
        std::lock_guard<std::mutex> containerLock(container->GetOperationMutex());
        if (container->IsRemoved()) {
            continue;
        }
        auto containerRecord = container->GetRecord();
        if (containerRecord.pid_namespace_mode() != crishim::v1::POD) {
            continue;
        }
        if (!StopContainerLocked(container, 0, error)) {
            ERROR("Failed to stop container %s of sandbox %s: %s", containerRecord.id().c_str(), record.id().c_str(),
                  error.GetCMessage());
            return false;
        }
    }

    if (!m_backend->StopTask(record.id(), m_defaultStopTimeout, exitInfo, error) && !error.IsNotFound()) {
        ERROR("Failed to stop task of sandbox %s: %s", record.id().c_str(), error.GetCMessage());
        return false;
    }
    error.Clear();

    if (!m_backend->DeleteTask(record.id(), true, error) && !error.IsNotFound()) {
        ERROR("Failed to delete task of sandbox %s: %s", record.id().c_str(), error.GetCMessage());
        return false;
    }
    error.Clear();

    record.set_state(next);
    if (!m_store->PutSandbox(record, error)) {
        ERROR("Failed to save sandbox %s: %s", record.id().c_str(), error.GetCMessage());
        return false;
    }
    sandbox->SetRecord(record);

    EVENT("Event: {Object: %s, Type: Stopped sandbox}", record.id().c_str());
    return true;
}

auto LifecycleManager::RemovePodSandbox(const std::string &sandboxId, Errors &error) -> bool
{
    crishim::v1::PodSandboxState next;

    auto sandbox = m_registry->GetSandbox(sandboxId, error);
    if (sandbox == nullptr) {
        if (error.IsNotFound()) {
            DEBUG("Sandbox %s is already removed", sandboxId.c_str());
            error.Clear();
            return true;
        }
        ERROR("Failed to remove sandbox %s: %s", sandboxId.c_str(), error.GetCMessage());
        return false;
    }

    std::lock_guard<std::mutex> opLock(sandbox->GetOperationMutex());
    if (sandbox->IsRemoved()) {
        return true;
    }

    auto record = sandbox->GetRecord();
    if (SandboxTransition(record.state(), SANDBOX_EVENT_REMOVE, next) != TRANSITION_APPLY) {
        ERROR("Cannot remove sandbox %s in state %s", record.id().c_str(), SandboxStateToString(record.state()));
        error.SetError(ERR_ILLEGAL_TRANSITION, std::string("Cannot remove sandbox ") + record.id() + " in state " +
                       SandboxStateToString(record.state()) + ", stop it first");
        return false;
    }

    // try every container, the sandbox stays until all of them are gone
    std::vector<std::string> errors;
    int code = ERR_OK;
    for (const auto &container : ContainersOfSandbox(record.id())) {
        std::lock_guard<std::mutex> containerLock(container->GetOperationMutex());
        if (container->IsRemoved()) {
            continue;
        }
        Errors removeErr;
        if (!ForceRemoveContainerLocked(container, removeErr)) {
            ERROR("Failed to remove container %s of sandbox %s: %s", container->GetId().c_str(),
                  record.id().c_str(), removeErr.GetCMessage());
            errors.push_back(removeErr.GetMessage());
            code = removeErr.GetCode();
        }
    }
    if (!errors.empty()) {
        error.SetAggregate(errors);
        error.SetCode(code);
        return false;
    }

    if (!m_backend->DeleteTask(record.id(), true, error) && !error.IsNotFound()) {
        ERROR("Failed to delete task of sandbox %s: %s", record.id().c_str(), error.GetCMessage());
        return false;
    }
    error.Clear();

    if (!m_store->DeleteSandbox(record.id(), error)) {
        ERROR("Failed to delete sandbox %s from store: %s", record.id().c_str(), error.GetCMessage());
        return false;
    }
    m_registry->RemoveSandbox(record.id());
    sandbox->MarkRemoved();

    EVENT("Event: {Object: %s, Type: Removed sandbox}", record.id().c_str());
    return true;
}

auto LifecycleManager::PodSandboxStatus(const std::string &sandboxId, crishim::v1::SandboxRecord &record,
                                        Errors &error) -> bool
{
    auto sandbox = m_registry->GetSandbox(sandboxId, error);
    if (sandbox == nullptr) {
        return false;
    }
    record = sandbox->GetRecord();
    return true;
}

auto LifecycleManager::ListPodSandbox(const crishim::v1::PodSandboxFilter &filter,
                                      std::vector<crishim::v1::SandboxRecord> &records, Errors &error) -> bool
{
    return m_registry->ListSandboxes(filter, records, error);
}

void LifecycleManager::GenerateContainerTaskSpec(const crishim::v1::ContainerConfig &config,
                                                 const std::string &sandboxId, TaskSpec &spec)
{
    spec.name = config.metadata().name();
    spec.sandboxId = sandboxId;
    spec.shareSandboxPid = config.namespace_options().pid() == crishim::v1::POD;
    spec.image = config.image();
    spec.args.insert(spec.args.end(), config.command().begin(), config.command().end());
    spec.args.insert(spec.args.end(), config.args().begin(), config.args().end());
    spec.envs.insert(spec.envs.end(), config.envs().begin(), config.envs().end());
    spec.workingDir = config.working_dir();
    spec.labels.insert(config.labels().begin(), config.labels().end());
}

auto LifecycleManager::CreateContainer(const std::string &sandboxId, const crishim::v1::ContainerConfig &config,
                                       std::string &containerId, Errors &error) -> bool
{
    TaskSpec spec;
    std::string taskId;
    Errors tmpErr;

    if (!ValidateContainerConfig(config, error)) {
        ERROR("Invalid container config: %s", error.GetCMessage());
        return false;
    }

    auto sandbox = m_registry->GetSandbox(sandboxId, error);
    if (sandbox == nullptr) {
        ERROR("Failed to create container in sandbox %s: %s", sandboxId.c_str(), error.GetCMessage());
        return false;
    }

    std::lock_guard<std::mutex> opLock(sandbox->GetOperationMutex());
    auto sandboxRecord = sandbox->GetRecord();
    if (sandbox->IsRemoved() || sandboxRecord.state() != crishim::v1::SANDBOX_READY) {
        ERROR("Sandbox %s is not ready", sandboxId.c_str());
        error.SetError(ERR_NOT_FOUND, "Failed to find ready sandbox " + sandboxId);
        return false;
    }

    const auto &metadata = config.metadata();
    auto old = m_registry->FindContainer(sandboxRecord.id(), metadata.name(), metadata.attempt());
    if (old != nullptr) {
        ERROR("Conflict. The name \"%s\" attempt %u is already in use by container %s", metadata.name().c_str(),
              metadata.attempt(), old->GetId().c_str());
        error.SetError(ERR_ALREADY_EXISTS, "Conflict. The name \"" + metadata.name() +
                       "\" is already in use by container " + old->GetId());
        return false;
    }

    GenerateContainerTaskSpec(config, sandboxRecord.id(), spec);
    if (!m_backend->CreateTask(spec, taskId, error)) {
        ERROR("Failed to create task for container %s: %s", metadata.name().c_str(), error.GetCMessage());
        return false;
    }

    crishim::v1::ContainerRecord record;
    record.set_id(taskId);
    record.set_name(metadata.name());
    record.set_attempt(metadata.attempt());
    record.set_sandbox_id(sandboxRecord.id());
    record.set_state(crishim::v1::CONTAINER_CREATED);
    record.set_pid_namespace_mode(config.namespace_options().pid());
    *record.mutable_config() = config;
    record.set_image(config.image());
    record.set_created_at(CXXUtils::GetNowTimeNanos());

    if (!m_store->PutContainer(record, error)) {
        ERROR("Failed to save container %s: %s", taskId.c_str(), error.GetCMessage());
        if (!m_backend->DeleteTask(taskId, true, tmpErr)) {
            WARN("Failed to delete task %s: %s", taskId.c_str(), tmpErr.GetCMessage());
        }
        return false;
    }

    if (m_registry->AddContainer(record, error) == nullptr) {
        return false;
    }
    UpdateSandboxContainers(sandbox, record.id(), true);

    containerId = taskId;
    EVENT("Event: {Object: %s, Type: Created container %s in sandbox %s}", containerId.c_str(),
          metadata.name().c_str(), sandboxRecord.id().c_str());
    return true;
}

auto LifecycleManager::StartContainer(const std::string &containerId, Errors &error) -> bool
{
    crishim::v1::ContainerState next;
    uint32_t pid = 0;

    auto container = m_registry->GetContainer(containerId, error);
    if (container == nullptr) {
        ERROR("Failed to start container %s: %s", containerId.c_str(), error.GetCMessage());
        return false;
    }

    auto sandbox = SandboxOfContainer(container->GetRecord());
    std::unique_lock<std::mutex> sandboxLock;
    if (sandbox != nullptr) {
        sandboxLock = std::unique_lock<std::mutex>(sandbox->GetOperationMutex());
    }
    std::lock_guard<std::mutex> opLock(container->GetOperationMutex());
    if (container->IsRemoved()) {
        error.SetError(ERR_NOT_FOUND, "Failed to find container " + containerId);
        return false;
    }

    auto record = container->GetRecord();
    if (ContainerTransition(record.state(), CONTAINER_EVENT_START, next) != TRANSITION_APPLY) {
        ERROR("Cannot start container %s in state %s", record.id().c_str(), ContainerStateToString(record.state()));
        error.SetError(ERR_ILLEGAL_TRANSITION, std::string("Cannot start container ") + record.id() + " in state " +
                       ContainerStateToString(record.state()));
        return false;
    }

    if (sandbox == nullptr || sandbox->IsRemoved() || sandbox->GetRecord().state() != crishim::v1::SANDBOX_READY) {
        ERROR("Cannot start container %s, sandbox %s is not ready", record.id().c_str(),
              record.sandbox_id().c_str());
        error.SetError(ERR_ILLEGAL_TRANSITION, "Cannot start container " + record.id() + ", sandbox " +
                       record.sandbox_id() + " is not ready");
        return false;
    }

    if (!m_backend->StartTask(record.id(), pid, error)) {
        ERROR("Failed to start task of container %s: %s", record.id().c_str(), error.GetCMessage());
        return false;
    }

    record.set_state(next);
    record.set_started_at(CXXUtils::GetNowTimeNanos());
    if (!m_store->PutContainer(record, error)) {
        ERROR("Failed to save container %s: %s", record.id().c_str(), error.GetCMessage());
        return false;
    }
    container->SetRecord(record);

    EVENT("Event: {Object: %s, Type: Started container, pid %u}", record.id().c_str(), pid);
    return true;
}

auto LifecycleManager::StopContainerLocked(const std::shared_ptr<ContainerEntry> &entry, uint32_t gracePeriod,
                                           Errors &error) -> bool
{
    crishim::v1::ContainerState next;
    TaskExitInfo exitInfo;

    auto record = entry->GetRecord();
    switch (ContainerTransition(record.state(), CONTAINER_EVENT_STOP, next)) {
        case TRANSITION_NOOP:
            return true;
        case TRANSITION_APPLY:
            break;
        case TRANSITION_ILLEGAL:
        default:
            error.SetError(ERR_ILLEGAL_TRANSITION, std::string("Cannot stop container ") + record.id() +
                           " in state " + ContainerStateToString(record.state()));
            return false;
    }

    if (m_backend->StopTask(record.id(), gracePeriod, exitInfo, error)) {
        record.set_exit_code(exitInfo.exitStatus);
        record.set_finished_at(exitInfo.exitedAt != 0 ? exitInfo.exitedAt : CXXUtils::GetNowTimeNanos());
        record.set_reason(exitInfo.exitStatus == 0 ? REASON_COMPLETED : REASON_ERROR);
    } else if (error.IsNotFound()) {
        // the task is already gone, nothing left to stop
        WARN("Task of container %s not found while stopping", record.id().c_str());
        error.Clear();
        record.set_finished_at(CXXUtils::GetNowTimeNanos());
        record.set_reason(REASON_TASK_NOT_FOUND);
    } else {
        ERROR("Failed to stop task of container %s: %s", record.id().c_str(), error.GetCMessage());
        return false;
    }

    record.set_state(next);
    if (!m_store->PutContainer(record, error)) {
        ERROR("Failed to save container %s: %s", record.id().c_str(), error.GetCMessage());
        return false;
    }
    entry->SetRecord(record);

    EVENT("Event: {Object: %s, Type: Stopped container, exit code %d}", record.id().c_str(), record.exit_code());
    return true;
}

auto LifecycleManager::StopContainer(const std::string &containerId, int64_t timeout, Errors &error) -> bool
{
    auto container = m_registry->GetContainer(containerId, error);
    if (container == nullptr) {
        ERROR("Failed to stop container %s: %s", containerId.c_str(), error.GetCMessage());
        return false;
    }

    std::lock_guard<std::mutex> opLock(container->GetOperationMutex());
    if (container->IsRemoved()) {
        error.SetError(ERR_NOT_FOUND, "Failed to find container " + containerId);
        return false;
    }

    uint32_t gracePeriod = m_defaultStopTimeout;
    if (timeout >= 0) {
        gracePeriod = static_cast<uint32_t>(std::min<int64_t>(timeout, std::numeric_limits<uint32_t>::max()));
    }
    return StopContainerLocked(container, gracePeriod, error);
}

auto LifecycleManager::RemoveContainerLocked(const std::shared_ptr<ContainerEntry> &entry, Errors &error) -> bool
{
    crishim::v1::ContainerState next;

    auto record = entry->GetRecord();
    if (ContainerTransition(record.state(), CONTAINER_EVENT_REMOVE, next) != TRANSITION_APPLY) {
        ERROR("Cannot remove container %s in state %s", record.id().c_str(), ContainerStateToString(record.state()));
        error.SetError(ERR_ILLEGAL_TRANSITION, std::string("Cannot remove container ") + record.id() + " in state " +
                       ContainerStateToString(record.state()) + ", stop it first");
        return false;
    }

    // an UNKNOWN container may still have a live process
    bool force = record.state() == crishim::v1::CONTAINER_UNKNOWN;
    if (!m_backend->DeleteTask(record.id(), force, error) && !error.IsNotFound()) {
        ERROR("Failed to delete task of container %s: %s", record.id().c_str(), error.GetCMessage());
        return false;
    }
    error.Clear();

    if (!m_store->DeleteContainer(record.id(), error)) {
        ERROR("Failed to delete container %s from store: %s", record.id().c_str(), error.GetCMessage());
        return false;
    }
    m_registry->RemoveContainer(record.id());
    entry->MarkRemoved();

    EVENT("Event: {Object: %s, Type: Removed container}", record.id().c_str());
    return true;
}

auto LifecycleManager::ForceRemoveContainerLocked(const std::shared_ptr<ContainerEntry> &entry, Errors &error) -> bool
{
    auto record = entry->GetRecord();
    if (record.state() == crishim::v1::CONTAINER_RUNNING && !StopContainerLocked(entry, 0, error)) {
        return false;
    }
    return RemoveContainerLocked(entry, error);
}

auto LifecycleManager::RemoveContainer(const std::string &containerId, Errors &error) -> bool
{
    auto container = m_registry->GetContainer(containerId, error);
    if (container == nullptr) {
        if (error.IsNotFound()) {
            DEBUG("Container %s is already removed", containerId.c_str());
            error.Clear();
            return true;
        }
        ERROR("Failed to remove container %s: %s", containerId.c_str(), error.GetCMessage());
        return false;
    }

    auto sandbox = SandboxOfContainer(container->GetRecord());
    std::unique_lock<std::mutex> sandboxLock;
    if (sandbox != nullptr) {
        sandboxLock = std::unique_lock<std::mutex>(sandbox->GetOperationMutex());
    }
    std::lock_guard<std::mutex> opLock(container->GetOperationMutex());
    if (container->IsRemoved()) {
        return true;
    }

    if (!RemoveContainerLocked(container, error)) {
        return false;
    }
    if (sandbox != nullptr && !sandbox->IsRemoved()) {
        UpdateSandboxContainers(sandbox, container->GetId(), false);
    }
    return true;
}

auto LifecycleManager::ContainerStatus(const std::string &containerId, crishim::v1::ContainerRecord &record,
                                       Errors &error) -> bool
{
    auto container = m_registry->GetContainer(containerId, error);
    if (container == nullptr) {
        return false;
    }
    record = container->GetRecord();
    return true;
}

auto LifecycleManager::ListContainers(const crishim::v1::ContainerFilter &filter,
                                      std::vector<crishim::v1::ContainerRecord> &records, Errors &error) -> bool
{
    return m_registry->ListContainers(filter, records, error);
}

void LifecycleManager::UpdateSandboxContainers(const std::shared_ptr<SandboxEntry> &sandbox,
                                               const std::string &containerId, bool add)
{
    Errors error;

    auto record = sandbox->GetRecord();
    auto *containers = record.mutable_containers();
    auto iter = std::find(containers->begin(), containers->end(), containerId);
    if (add && iter == containers->end()) {
        record.add_containers(containerId);
    } else if (!add && iter != containers->end()) {
        containers->erase(iter);
    } else {
        return;
    }

    if (!m_store->PutSandbox(record, error)) {
        WARN("Failed to save containers of sandbox %s: %s", record.id().c_str(), error.GetCMessage());
        return;
    }
    sandbox->SetRecord(record);
}

auto LifecycleManager::ContainersOfSandbox(const std::string &sandboxId)
-> std::vector<std::shared_ptr<ContainerEntry>>
{
    std::vector<std::shared_ptr<ContainerEntry>> result;
    std::vector<crishim::v1::ContainerRecord> records;
    crishim::v1::ContainerFilter filter;
    Errors error;

    filter.set_pod_sandbox_id(sandboxId);
    if (!m_registry->ListContainers(filter, records, error)) {
        WARN("Failed to list containers of sandbox %s: %s", sandboxId.c_str(), error.GetCMessage());
        return result;
    }

    for (const auto &record : records) {
        // the filter matches by prefix
        if (record.sandbox_id() != sandboxId) {
            continue;
        }
        Errors getErr;
        auto entry = m_registry->GetContainer(record.id(), getErr);
        if (entry != nullptr) {
            result.push_back(entry);
        }
    }
    return result;
}

auto LifecycleManager::SandboxOfContainer(const crishim::v1::ContainerRecord &record) -> std::shared_ptr<SandboxEntry>
{
    return m_registry->GetSandboxById(record.sandbox_id());
}

} // namespace crishim
