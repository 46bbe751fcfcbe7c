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
 * Description: provide crishimd commands definition
 ******************************************************************************/
#ifndef CRISHIM_CMD_CRISHIMD_COMMANDS_H
#define CRISHIM_CMD_CRISHIMD_COMMANDS_H

#include <string>

#include "daemon_config.h"
#include "daemon_config.pb.h"
#include "errors.h"

namespace crishim {

struct ServiceArguments {
    std::string configFile { CRISHIM_DEFAULT_CONFIG_FILE };
    // set when --config is given, the file must exist then
    bool configRequired { false };
    bool help { false };
    bool version { false };
    // only the fields given on the command line are set
    crishim::v1::DaemonConfig overrides;
};

void PrintCommonHelp(const char *programName);
void PrintVersion();

auto ParseArgs(int argc, char **argv, ServiceArguments &args, Errors &error) -> bool;

// defaults < config file < command line, then validated
auto LoadServiceConfig(const ServiceArguments &args, crishim::v1::DaemonConfig &config, Errors &error) -> bool;

} // namespace crishim

#endif // CRISHIM_CMD_CRISHIMD_COMMANDS_H
