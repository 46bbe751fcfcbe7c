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
 * Description: daemon configuration loading and validation
 ******************************************************************************/
#include "daemon_config.h"

#include <algorithm>
#include <vector>

#include <google/protobuf/util/json_util.h>
#include <isula_libutils/log.h>

#include "file_utils.h"

namespace crishim {
namespace {
const std::vector<std::string> LOG_LEVELS = { "FATAL", "ALERT", "CRIT", "ERROR", "WARN",
                                              "NOTICE", "INFO", "DEBUG", "TRACE" };
const std::vector<std::string> LOG_DRIVERS = { "stdout", "file" };
} // namespace

void DefaultDaemonConfig(crishim::v1::DaemonConfig &config)
{
    config.Clear();
    config.set_root(CRISHIM_DEFAULT_ROOT);
    config.set_host(CRISHIM_DEFAULT_HOST);
    config.set_task_address(CRISHIM_DEFAULT_TASK_ADDRESS);
    config.set_log_level(CRISHIM_DEFAULT_LOG_LEVEL);
    config.set_log_driver(CRISHIM_DEFAULT_LOG_DRIVER);
    config.set_log_file(CRISHIM_DEFAULT_LOG_FILE);
    config.set_recovery_timeout(CRISHIM_DEFAULT_RECOVERY_TIMEOUT);
    config.set_recovery_workers(CRISHIM_DEFAULT_RECOVERY_WORKERS);
    config.mutable_cleanup_orphan_tasks()->set_value(true);
    config.set_default_stop_timeout(CRISHIM_DEFAULT_STOP_TIMEOUT);

    auto *retry = config.mutable_backend_retry();
    retry->set_max_attempts(CRISHIM_DEFAULT_RETRY_MAX_ATTEMPTS);
    retry->set_initial_backoff_ms(CRISHIM_DEFAULT_RETRY_INITIAL_BACKOFF_MS);
    retry->set_max_backoff_ms(CRISHIM_DEFAULT_RETRY_MAX_BACKOFF_MS);
    retry->set_deadline_ms(CRISHIM_DEFAULT_RETRY_DEADLINE_MS);
}

auto LoadDaemonConfigFile(const std::string &path, bool required, crishim::v1::DaemonConfig &config,
                          Errors &error) -> bool
{
    std::string content;
    crishim::v1::DaemonConfig fileConfig;
    google::protobuf::util::JsonParseOptions options;

    if (!FileUtils::ReadFile(path, content, error)) {
        if (error.IsNotFound() && !required) {
            INFO("Config file %s not found, use defaults", path.c_str());
            error.Clear();
            return true;
        }
        ERROR("Failed to read config file %s: %s", path.c_str(), error.GetCMessage());
        error.SetCode(ERR_INVALID_ARGUMENT);
        return false;
    }

    options.ignore_unknown_fields = false;
    auto status = google::protobuf::util::JsonStringToMessage(content, &fileConfig, options);
    if (!status.ok()) {
        ERROR("Failed to parse config file %s: %s", path.c_str(), status.ToString().c_str());
        error.SetError(ERR_INVALID_ARGUMENT, "Failed to parse config file " + path + ": " + status.ToString());
        return false;
    }

    // proto3 merge only copies fields that are set in the file
    config.MergeFrom(fileConfig);
    return true;
}

auto ValidateDaemonConfig(const crishim::v1::DaemonConfig &config, Errors &error) -> bool
{
    if (config.root().empty()) {
        error.SetError(ERR_INVALID_ARGUMENT, "root must not be empty");
        return false;
    }
    if (config.root()[0] != '/') {
        error.SetError(ERR_INVALID_ARGUMENT, "root must be an absolute path: " + config.root());
        return false;
    }
    if (config.host().empty()) {
        error.SetError(ERR_INVALID_ARGUMENT, "host must not be empty");
        return false;
    }
    if (config.task_address().empty()) {
        error.SetError(ERR_INVALID_ARGUMENT, "task-address must not be empty");
        return false;
    }
    if (std::find(LOG_LEVELS.begin(), LOG_LEVELS.end(), config.log_level()) == LOG_LEVELS.end()) {
        error.SetError(ERR_INVALID_ARGUMENT, "Invalid log-level: " + config.log_level());
        return false;
    }
    if (std::find(LOG_DRIVERS.begin(), LOG_DRIVERS.end(), config.log_driver()) == LOG_DRIVERS.end()) {
        error.SetError(ERR_INVALID_ARGUMENT, "Invalid log-driver: " + config.log_driver());
        return false;
    }
    if (config.log_driver() == "file" && config.log_file().empty()) {
        error.SetError(ERR_INVALID_ARGUMENT, "log-file must not be empty with the file log driver");
        return false;
    }
    if (config.recovery_timeout() == 0) {
        error.SetError(ERR_INVALID_ARGUMENT, "recovery-timeout must be positive");
        return false;
    }
    if (config.recovery_workers() == 0) {
        error.SetError(ERR_INVALID_ARGUMENT, "recovery-workers must be positive");
        return false;
    }

    const auto &retry = config.backend_retry();
    if (retry.max_attempts() == 0) {
        error.SetError(ERR_INVALID_ARGUMENT, "backend-retry.max-attempts must be positive");
        return false;
    }
    if (retry.max_backoff_ms() < retry.initial_backoff_ms()) {
        error.SetError(ERR_INVALID_ARGUMENT, "backend-retry.max-backoff-ms is less than initial-backoff-ms");
        return false;
    }
    if (retry.deadline_ms() == 0) {
        error.SetError(ERR_INVALID_ARGUMENT, "backend-retry.deadline-ms must be positive");
        return false;
    }
    return true;
}

auto GetRetryPolicy(const crishim::v1::DaemonConfig &config) -> RetryPolicy
{
    RetryPolicy policy;
    const auto &retry = config.backend_retry();

    policy.maxAttempts = retry.max_attempts();
    policy.initialBackoff = std::chrono::milliseconds(retry.initial_backoff_ms());
    policy.maxBackoff = std::chrono::milliseconds(retry.max_backoff_ms());
    policy.deadline = std::chrono::milliseconds(retry.deadline_ms());
    return policy;
}

auto GetRecoveryOptions(const crishim::v1::DaemonConfig &config) -> RecoveryOptions
{
    RecoveryOptions options;

    options.timeout = std::chrono::seconds(config.recovery_timeout());
    options.workers = config.recovery_workers();
    options.cleanupOrphanTasks = !config.has_cleanup_orphan_tasks() || config.cleanup_orphan_tasks().value();
    return options;
}

} // namespace crishim
