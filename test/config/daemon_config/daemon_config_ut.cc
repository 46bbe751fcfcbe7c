/*
 * Copyright (c) Huawei Technologies Co., Ltd. 2026. All rights reserved.
 * crishim licensed under the Mulan PSL v2.
 * You can use this software according to the terms and conditions of the Mulan PSL v2.
 * You may obtain a copy of Mulan PSL v2 at:
 *     http://license.coscl.org.cn/MulanPSL2
 * THIS SOFTWARE IS PROVIDED ON AN "AS IS" BASIS, WITHOUT WARRANTIES OF ANY KIND, EITHER EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO NON-INFRINGEMENT, MERCHANTABILITY OR FIT FOR A PARTICULAR
 * PURPOSE.
 * See the Mulan PSL v2 for more details.
 * Description: daemon_config unit test
 * Create: 2026-10-19
 */

#include <stdlib.h>

#include <string>

#include <gtest/gtest.h>

#include "daemon_config.h"
#include "file_utils.h"

using namespace crishim;

class DaemonConfigUnitTest : public testing::Test {
protected:
    void SetUp() override
    {
        char tmpl[] = "/tmp/crishim_config_XXXXXX";
        ASSERT_NE(mkdtemp(tmpl), nullptr);
        m_dir = tmpl;
        m_file = FileUtils::JoinPath(m_dir, "daemon.json");
        DefaultDaemonConfig(m_config);
    }

    void TearDown() override
    {
        std::string cmd = "rm -rf " + m_dir;
        ASSERT_EQ(system(cmd.c_str()), 0);
    }

    void WriteConfig(const std::string &content)
    {
        Errors err;
        ASSERT_TRUE(FileUtils::AtomicWriteFile(m_file, content, FileUtils::CONFIG_FILE_MODE, err))
                << err.GetMessage();
    }

    std::string m_dir;
    std::string m_file;
    crishim::v1::DaemonConfig m_config;
};

TEST_F(DaemonConfigUnitTest, test_defaults_are_valid)
{
    Errors err;

    ASSERT_TRUE(ValidateDaemonConfig(m_config, err)) << err.GetMessage();
    ASSERT_EQ(m_config.root(), CRISHIM_DEFAULT_ROOT);
    ASSERT_EQ(m_config.host(), CRISHIM_DEFAULT_HOST);
    ASSERT_EQ(m_config.default_stop_timeout(), static_cast<uint32_t>(CRISHIM_DEFAULT_STOP_TIMEOUT));
    ASSERT_TRUE(m_config.cleanup_orphan_tasks().value());
}

TEST_F(DaemonConfigUnitTest, test_missing_file)
{
    Errors err;

    ASSERT_TRUE(LoadDaemonConfigFile(FileUtils::JoinPath(m_dir, "none.json"), false, m_config, err));
    ASSERT_TRUE(err.Empty());
    ASSERT_EQ(m_config.root(), CRISHIM_DEFAULT_ROOT);

    ASSERT_FALSE(LoadDaemonConfigFile(FileUtils::JoinPath(m_dir, "none.json"), true, m_config, err));
    ASSERT_TRUE(err.Is(ERR_INVALID_ARGUMENT));
}

TEST_F(DaemonConfigUnitTest, test_file_overrides_defaults)
{
    Errors err;

    WriteConfig("{\"root\": \"/data/crishim\", \"log-level\": \"DEBUG\", \"cleanup-orphan-tasks\": false, "
                "\"backend-retry\": {\"max-attempts\": 3}}");
    ASSERT_TRUE(LoadDaemonConfigFile(m_file, true, m_config, err)) << err.GetMessage();
    ASSERT_TRUE(ValidateDaemonConfig(m_config, err)) << err.GetMessage();

    ASSERT_EQ(m_config.root(), "/data/crishim");
    ASSERT_EQ(m_config.log_level(), "DEBUG");
    // untouched fields keep their defaults
    ASSERT_EQ(m_config.host(), CRISHIM_DEFAULT_HOST);

    auto policy = GetRetryPolicy(m_config);
    ASSERT_EQ(policy.maxAttempts, 3U);
    ASSERT_EQ(policy.deadline, std::chrono::milliseconds(CRISHIM_DEFAULT_RETRY_DEADLINE_MS));

    auto options = GetRecoveryOptions(m_config);
    ASSERT_FALSE(options.cleanupOrphanTasks);
    ASSERT_EQ(options.timeout, std::chrono::seconds(CRISHIM_DEFAULT_RECOVERY_TIMEOUT));
    ASSERT_EQ(options.workers, static_cast<unsigned>(CRISHIM_DEFAULT_RECOVERY_WORKERS));
}

TEST_F(DaemonConfigUnitTest, test_invalid_file)
{
    Errors err;

    WriteConfig("{\"root\": ");
    ASSERT_FALSE(LoadDaemonConfigFile(m_file, true, m_config, err));
    ASSERT_TRUE(err.Is(ERR_INVALID_ARGUMENT));

    err.Clear();
    WriteConfig("{\"no-such-option\": 1}");
    ASSERT_FALSE(LoadDaemonConfigFile(m_file, true, m_config, err));
    ASSERT_TRUE(err.Is(ERR_INVALID_ARGUMENT));
}

TEST_F(DaemonConfigUnitTest, test_validate)
{
    Errors err;
    crishim::v1::DaemonConfig config;

    config = m_config;
    config.set_root("relative/root");
    ASSERT_FALSE(ValidateDaemonConfig(config, err));
    ASSERT_TRUE(err.Is(ERR_INVALID_ARGUMENT));

    config = m_config;
    config.set_log_level("VERBOSE");
    ASSERT_FALSE(ValidateDaemonConfig(config, err));

    config = m_config;
    config.set_log_driver("syslog");
    ASSERT_FALSE(ValidateDaemonConfig(config, err));

    config = m_config;
    config.set_log_driver("stdout");
    config.clear_log_file();
    ASSERT_TRUE(ValidateDaemonConfig(config, err));

    config = m_config;
    config.set_recovery_workers(0);
    ASSERT_FALSE(ValidateDaemonConfig(config, err));

    config = m_config;
    config.mutable_backend_retry()->set_max_backoff_ms(10);
    ASSERT_FALSE(ValidateDaemonConfig(config, err));
}
