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
 * Description: crishimd main
 ******************************************************************************/
#include <errno.h>
#include <pthread.h>
#include <signal.h>
#include <stdio.h>

#include <memory>

#include <isula_libutils/log.h>

#include "commands.h"
#include "daemon_config.h"
#include "entity_registry.h"
#include "errors.h"
#include "file_metadata_store.h"
#include "file_utils.h"
#include "grpc_service.h"
#include "grpc_task_client.h"
#include "lifecycle_manager.h"
#include "restart_recovery.h"
#include "retrying_task_backend.h"

using namespace crishim;

namespace {
const char *LOG_NAME = "crishimd";

auto InitLog(const crishim::v1::DaemonConfig &config) -> bool
{
    struct isula_libutils_log_config lconf = { 0 };
    Errors err;

    if (config.log_driver() == "file") {
        auto pos = config.log_file().find_last_of('/');
        if (pos != std::string::npos && pos > 0 &&
            !FileUtils::MkdirAll(config.log_file().substr(0, pos), FileUtils::CONFIG_DIRECTORY_MODE, err)) {
            fprintf(stderr, "Failed to create log directory: %s\n", err.GetCMessage());
            return false;
        }
        lconf.file = config.log_file().c_str();
    }
    lconf.name = LOG_NAME;
    lconf.priority = config.log_level().c_str();
    lconf.driver = config.log_driver().c_str();
    if (isula_libutils_log_enable(&lconf) != 0) {
        fprintf(stderr, "log init failed\n");
        return false;
    }
    return true;
}

auto BlockStopSignals(sigset_t &set) -> bool
{
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    // threads created afterwards inherit the mask, only sigwait sees the signals
    return pthread_sigmask(SIG_BLOCK, &set, nullptr) == 0;
}

auto WaitStopSignal(const sigset_t &set) -> int
{
    int sig = 0;

    for (;;) {
        int ret = sigwait(&set, &sig);
        if (ret == 0) {
            return sig;
        }
        if (ret != EINTR) {
            SYSERROR("Failed to wait for stop signals");
            return -1;
        }
    }
}
} // namespace

int main(int argc, char **argv)
{
    ServiceArguments args;
    crishim::v1::DaemonConfig config;
    Errors err;
    sigset_t stopSignals;

    if (!ParseArgs(argc, argv, args, err)) {
        fprintf(stderr, "%s\n", err.GetCMessage());
        PrintCommonHelp(argv[0]);
        return 1;
    }
    if (args.help) {
        PrintCommonHelp(argv[0]);
        return 0;
    }
    if (args.version) {
        PrintVersion();
        return 0;
    }

    if (!LoadServiceConfig(args, config, err)) {
        fprintf(stderr, "Invalid configuration: %s\n", err.GetCMessage());
        return 1;
    }

    if (!InitLog(config)) {
        return 1;
    }

    if (!BlockStopSignals(stopSignals)) {
        SYSERROR("Failed to block stop signals");
        return 1;
    }

    auto store = std::make_shared<FileMetadataStore>(config.root());
    if (!store->Init(err)) {
        ERROR("Failed to init metadata store: %s", err.GetCMessage());
        return 1;
    }

    auto policy = GetRetryPolicy(config);
    auto client = std::make_shared<GrpcTaskClient>(config.task_address(), policy.deadline);
    auto backend = std::make_shared<RetryingTaskBackend>(client, policy);

    auto options = GetRecoveryOptions(config);
    auto registry = std::make_shared<EntityRegistry>(options.timeout);

    RestartRecovery recovery(store, backend, registry, options);
    if (!recovery.Run(err)) {
        ERROR("Restart recovery failed: %s", err.GetCMessage());
        return 1;
    }

    auto manager = std::make_shared<LifecycleManager>(store, backend, registry, config.default_stop_timeout());
    GRPCServer server(config.host(), manager);
    if (!server.Start(err)) {
        ERROR("Failed to start grpc server: %s", err.GetCMessage());
        return 1;
    }
    EVENT("Event: {Object: crishimd, Type: Started on %s}", config.host().c_str());

    int sig = WaitStopSignal(stopSignals);
    INFO("Received signal %d, shutting down", sig);

    server.Shutdown();
    server.Wait();
    EVENT("Event: {Object: crishimd, Type: Stopped}");
    return sig < 0 ? 1 : 0;
}
