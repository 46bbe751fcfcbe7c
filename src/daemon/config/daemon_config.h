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
#ifndef CRISHIM_DAEMON_CONFIG_DAEMON_CONFIG_H
#define CRISHIM_DAEMON_CONFIG_DAEMON_CONFIG_H

#include <string>

#include "daemon_config.pb.h"
#include "errors.h"
#include "retrying_task_backend.h"
#include "restart_recovery.h"

namespace crishim {

#define CRISHIM_DEFAULT_CONFIG_FILE "/etc/crishim/daemon.json"
#define CRISHIM_DEFAULT_ROOT "/var/lib/crishim"
#define CRISHIM_DEFAULT_HOST "unix:///var/run/crishim.sock"
#define CRISHIM_DEFAULT_TASK_ADDRESS "unix:///run/crishim/task.sock"
#define CRISHIM_DEFAULT_LOG_LEVEL "INFO"
#define CRISHIM_DEFAULT_LOG_DRIVER "file"
#define CRISHIM_DEFAULT_LOG_FILE "/var/lib/crishim/crishimd.log"
#define CRISHIM_DEFAULT_RECOVERY_TIMEOUT 120
#define CRISHIM_DEFAULT_RECOVERY_WORKERS 8
#define CRISHIM_DEFAULT_STOP_TIMEOUT 10
#define CRISHIM_DEFAULT_RETRY_MAX_ATTEMPTS 5
#define CRISHIM_DEFAULT_RETRY_INITIAL_BACKOFF_MS 100
#define CRISHIM_DEFAULT_RETRY_MAX_BACKOFF_MS 2000
#define CRISHIM_DEFAULT_RETRY_DEADLINE_MS 10000

void DefaultDaemonConfig(crishim::v1::DaemonConfig &config);

// Fields present in the file override the current values of config. A missing
// file is only an error when required is set.
auto LoadDaemonConfigFile(const std::string &path, bool required, crishim::v1::DaemonConfig &config,
                          Errors &error) -> bool;

auto ValidateDaemonConfig(const crishim::v1::DaemonConfig &config, Errors &error) -> bool;

auto GetRetryPolicy(const crishim::v1::DaemonConfig &config) -> RetryPolicy;
auto GetRecoveryOptions(const crishim::v1::DaemonConfig &config) -> RecoveryOptions;

} // namespace crishim

#endif // CRISHIM_DAEMON_CONFIG_DAEMON_CONFIG_H
