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
 * Description: worker_pool unit test
 * Create: 2026-10-19
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

#include <gtest/gtest.h>

#include "worker_pool.h"

TEST(WorkerPoolTest, test_run_all_jobs)
{
    WorkerPool pool(4);
    std::atomic<int> done { 0 };

    pool.Start();
    for (int i = 0; i < 100; i++) {
        ASSERT_TRUE(pool.Execute([&done]() {
            done++;
        }));
    }
    ASSERT_TRUE(pool.WaitIdle(std::chrono::seconds(10)));
    ASSERT_EQ(done.load(), 100);
    ASSERT_EQ(pool.GetNumPending(), 0U);
    pool.Stop();
}

TEST(WorkerPoolTest, test_concurrency_is_bounded)
{
    WorkerPool pool(3);
    std::atomic<int> running { 0 };
    std::atomic<int> peak { 0 };

    pool.Start();
    for (int i = 0; i < 30; i++) {
        ASSERT_TRUE(pool.Execute([&running, &peak]() {
            int now = ++running;
            int old = peak.load();
            while (now > old && !peak.compare_exchange_weak(old, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            running--;
        }));
    }
    ASSERT_TRUE(pool.WaitIdle(std::chrono::seconds(10)));
    ASSERT_LE(peak.load(), 3);
    ASSERT_GE(peak.load(), 1);
}

TEST(WorkerPoolTest, test_wait_idle_timeout)
{
    WorkerPool pool(1);
    std::mutex mutex;
    std::condition_variable cond;
    bool release = false;

    pool.Start();
    ASSERT_TRUE(pool.Execute([&]() {
        std::unique_lock<std::mutex> lock(mutex);
        cond.wait(lock, [&release]() {
            return release;
        });
    }));
    ASSERT_TRUE(pool.Execute([]() {}));

    ASSERT_FALSE(pool.WaitIdle(std::chrono::milliseconds(50)));

    {
        std::lock_guard<std::mutex> lock(mutex);
        release = true;
    }
    cond.notify_all();
    ASSERT_TRUE(pool.WaitIdle(std::chrono::seconds(10)));
}

TEST(WorkerPoolTest, test_execute_after_stop_fails)
{
    WorkerPool pool(2);

    ASSERT_FALSE(pool.Execute([]() {}));
    pool.Start();
    pool.Stop();
    ASSERT_FALSE(pool.Execute([]() {}));
}

TEST(WorkerPoolTest, test_zero_threads_means_one)
{
    WorkerPool pool(0);
    ASSERT_EQ(pool.GetNumThreads(), 1U);
}
