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
 * Description: retrying_task_backend unit test
 * Create: 2026-10-19
 */

#include <chrono>
#include <memory>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "retrying_task_backend.h"
#include "task_backend_mock.h"

using namespace crishim;
using ::testing::_;
using ::testing::DoAll;
using ::testing::Invoke;
using ::testing::Return;

static bool FailUnavailable(Errors &error)
{
    error.SetError(ERR_BACKEND_UNAVAILABLE, "connection refused");
    return false;
}

class RetryingTaskBackendUnitTest : public testing::Test {
protected:
    void SetUp() override
    {
        m_mock = std::make_shared<MockTaskBackend>();
        m_policy.maxAttempts = 4;
        m_policy.initialBackoff = std::chrono::milliseconds(1);
        m_policy.maxBackoff = std::chrono::milliseconds(4);
        m_policy.deadline = std::chrono::milliseconds(5000);
    }

    std::shared_ptr<MockTaskBackend> m_mock;
    RetryPolicy m_policy;
};

TEST_F(RetryingTaskBackendUnitTest, test_success_is_not_retried)
{
    Errors err;
    uint32_t pid = 0;
    RetryingTaskBackend backend(m_mock, m_policy);

    EXPECT_CALL(*m_mock, StartTask("t1", _, _)).Times(1).WillOnce(Invoke([](const std::string &, uint32_t &p,
    Errors &) {
        p = 42;
        return true;
    }));
    ASSERT_TRUE(backend.StartTask("t1", pid, err));
    ASSERT_EQ(pid, 42U);
    ASSERT_TRUE(err.Empty());
}

TEST_F(RetryingTaskBackendUnitTest, test_unavailable_is_retried_until_success)
{
    Errors err;
    TaskInfo info;
    RetryingTaskBackend backend(m_mock, m_policy);

    EXPECT_CALL(*m_mock, LoadTask("t1", _, _))
    .Times(3)
    .WillOnce(Invoke([](const std::string &, TaskInfo &, Errors &e) {
        return FailUnavailable(e);
    }))
    .WillOnce(Invoke([](const std::string &, TaskInfo &, Errors &e) {
        return FailUnavailable(e);
    }))
    .WillOnce(Invoke([](const std::string &id, TaskInfo &i, Errors &) {
        i.id = id;
        i.state = TASK_STATE_RUNNING;
        return true;
    }));

    ASSERT_TRUE(backend.LoadTask("t1", info, err));
    ASSERT_EQ(info.state, TASK_STATE_RUNNING);
    ASSERT_TRUE(err.Empty());
}

TEST_F(RetryingTaskBackendUnitTest, test_gives_up_after_max_attempts)
{
    Errors err;
    RetryingTaskBackend backend(m_mock, m_policy);

    EXPECT_CALL(*m_mock, DeleteTask("t1", true, _)).Times(4).WillRepeatedly(Invoke([](const std::string &, bool,
    Errors &e) {
        return FailUnavailable(e);
    }));

    ASSERT_FALSE(backend.DeleteTask("t1", true, err));
    ASSERT_TRUE(err.IsBackendUnavailable());
    ASSERT_STREQ(err.GetCMessage(), "connection refused");
}

TEST_F(RetryingTaskBackendUnitTest, test_not_found_is_returned_at_once)
{
    Errors err;
    TaskInfo info;
    RetryingTaskBackend backend(m_mock, m_policy);

    EXPECT_CALL(*m_mock, LoadTask("gone", _, _)).Times(1).WillOnce(Invoke([](const std::string &, TaskInfo &,
    Errors &e) {
        e.SetError(ERR_NOT_FOUND, "task gone not found");
        return false;
    }));

    ASSERT_FALSE(backend.LoadTask("gone", info, err));
    ASSERT_TRUE(err.IsNotFound());
}

TEST_F(RetryingTaskBackendUnitTest, test_backend_failure_is_not_retried)
{
    Errors err;
    TaskExitInfo exitInfo;
    RetryingTaskBackend backend(m_mock, m_policy);

    EXPECT_CALL(*m_mock, StopTask("t1", 10, _, _)).Times(1).WillOnce(Invoke([](const std::string &, uint32_t,
    TaskExitInfo &, Errors &e) {
        e.SetError(ERR_BACKEND_FAILED, "permission denied");
        return false;
    }));

    ASSERT_FALSE(backend.StopTask("t1", 10, exitInfo, err));
    ASSERT_TRUE(err.Is(ERR_BACKEND_FAILED));
}

TEST_F(RetryingTaskBackendUnitTest, test_deadline_bounds_retries)
{
    Errors err;
    std::vector<std::string> ids;

    m_policy.maxAttempts = 1000;
    m_policy.initialBackoff = std::chrono::milliseconds(20);
    m_policy.maxBackoff = std::chrono::milliseconds(20);
    m_policy.deadline = std::chrono::milliseconds(100);
    RetryingTaskBackend backend(m_mock, m_policy);

    EXPECT_CALL(*m_mock, ListLiveTasks(_, _)).WillRepeatedly(Invoke([](std::vector<std::string> &, Errors &e) {
        return FailUnavailable(e);
    }));

    auto begin = std::chrono::steady_clock::now();
    ASSERT_FALSE(backend.ListLiveTasks(ids, err));
    auto elapsed = std::chrono::steady_clock::now() - begin;
    ASSERT_TRUE(err.IsBackendUnavailable());
    ASSERT_LT(elapsed, std::chrono::seconds(2));
}

TEST_F(RetryingTaskBackendUnitTest, test_list_result_is_not_duplicated_by_retries)
{
    Errors err;
    std::vector<std::string> ids;
    RetryingTaskBackend backend(m_mock, m_policy);

    EXPECT_CALL(*m_mock, ListLiveTasks(_, _))
    .Times(2)
    .WillOnce(Invoke([](std::vector<std::string> &out, Errors &e) {
        out.push_back("partial");
        return FailUnavailable(e);
    }))
    .WillOnce(Invoke([](std::vector<std::string> &out, Errors &) {
        out.push_back("t1");
        out.push_back("t2");
        return true;
    }));

    ASSERT_TRUE(backend.ListLiveTasks(ids, err));
    ASSERT_EQ(ids, std::vector<std::string>({ "t1", "t2" }));
}

TEST_F(RetryingTaskBackendUnitTest, test_zero_attempts_means_one)
{
    m_policy.maxAttempts = 0;
    RetryingTaskBackend backend(m_mock, m_policy);
    ASSERT_EQ(backend.GetPolicy().maxAttempts, 1U);
}
