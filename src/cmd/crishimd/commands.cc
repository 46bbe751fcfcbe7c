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
#include "commands.h"

#include <getopt.h>
#include <stdio.h>


#ifndef CRISHIM_VERSION
#define CRISHIM_VERSION "unknown"
#endif

namespace crishim {
namespace {
enum LongOption {
    OPT_CONFIG = 256,
    OPT_TASK_ADDRESS,
    OPT_LOG_DRIVER,
    OPT_LOG_FILE,
};

const struct option LONG_OPTIONS[] = {
    { "config", required_argument, nullptr, OPT_CONFIG },
    { "root", required_argument, nullptr, 'g' },
    { "host", required_argument, nullptr, 'H' },
    { "task-address", required_argument, nullptr, OPT_TASK_ADDRESS },
    { "log-level", required_argument, nullptr, 'l' },
    { "log-driver", required_argument, nullptr, OPT_LOG_DRIVER },
    { "log-file", required_argument, nullptr, OPT_LOG_FILE },
    { "help", no_argument, nullptr, 'h' },
    { "version", no_argument, nullptr, 'V' },
    { nullptr, 0, nullptr, 0 },
};

const char *SHORT_OPTIONS = "g:H:l:hV";
} // namespace

void PrintCommonHelp(const char *programName)
{
    printf("Usage: %s [OPTIONS]\n\n", programName);
    printf("Container runtime shim daemon\n\n");
    printf("  --config <path>          Daemon configuration file (default \"%s\")\n", CRISHIM_DEFAULT_CONFIG_FILE);
    printf("  -g, --root <dir>         Root directory of the metadata store (default \"%s\")\n", CRISHIM_DEFAULT_ROOT);
    printf("  -H, --host <address>     The socket name used to create gRPC server (default \"%s\")\n",
           CRISHIM_DEFAULT_HOST);
    printf("  --task-address <address> Socket of the task backend (default \"%s\")\n", CRISHIM_DEFAULT_TASK_ADDRESS);
    printf("  -l, --log-level <level>  Set log level, the levels can be: FATAL ALERT CRIT ERROR WARN NOTICE INFO "
           "DEBUG TRACE\n");
    printf("  --log-driver <driver>    Set daemon log driver, stdout or file\n");
    printf("  --log-file <path>        Log file used by the file driver\n");
    printf("  -h, --help               Show help\n");
    printf("  -V, --version            Print the version\n");
}

void PrintVersion()
{
    printf("Version %s\n", CRISHIM_VERSION);
}

auto ParseArgs(int argc, char **argv, ServiceArguments &args, Errors &error) -> bool
{
    int opt = 0;

    // getopt keeps global state, optind 0 makes it reinitialize so the parser can run more than once
    optind = 0;
    opterr = 0;
    while ((opt = getopt_long(argc, argv, SHORT_OPTIONS, LONG_OPTIONS, nullptr)) != -1) {
        switch (opt) {
            case OPT_CONFIG:
                args.configFile = optarg;
                args.configRequired = true;
                break;
            case 'g':
                args.overrides.set_root(optarg);
                break;
            case 'H':
                args.overrides.set_host(optarg);
                break;
            case OPT_TASK_ADDRESS:
                args.overrides.set_task_address(optarg);
                break;
            case 'l':
                args.overrides.set_log_level(optarg);
                break;
            case OPT_LOG_DRIVER:
                args.overrides.set_log_driver(optarg);
                break;
            case OPT_LOG_FILE:
                args.overrides.set_log_file(optarg);
                break;
            case 'h':
                args.help = true;
                break;
            case 'V':
                args.version = true;
                break;
            default:
                error.SetError(ERR_INVALID_ARGUMENT,
                               std::string("Unknown flag or missing argument: ") + argv[optind - 1]);
                return false;
        }
    }

    if (optind < argc) {
        error.SetError(ERR_INVALID_ARGUMENT, std::string("Unexpected argument: ") + argv[optind]);
        return false;
    }
    return true;
}

auto LoadServiceConfig(const ServiceArguments &args, crishim::v1::DaemonConfig &config, Errors &error) -> bool
{
    DefaultDaemonConfig(config);

    if (!LoadDaemonConfigFile(args.configFile, args.configRequired, config, error)) {
        return false;
    }

    // proto3 MergeFrom only copies scalar fields that differ from their default
    config.MergeFrom(args.overrides);

    return ValidateDaemonConfig(config, error);
}

} // namespace crishim
