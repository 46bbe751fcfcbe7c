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
 * Description: fixed size worker pool definition
 ******************************************************************************/
#ifndef CRISHIM_UTILS_CPPUTILS_WORKER_POOL_H
#define CRISHIM_UTILS_CPPUTILS_WORKER_POOL_H

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

// Fixed number of threads draining a FIFO job queue. At most GetNumThreads()
// jobs run at the same time.
class WorkerPool {
public:
    explicit WorkerPool(unsigned numThreads);
    virtual ~WorkerPool();
    WorkerPool(const WorkerPool &) = delete;
    WorkerPool &operator=(const WorkerPool &) = delete;

    void Start();
    // Drop pending jobs, let running jobs finish and join the threads.
    void Stop();

    auto Execute(std::function<void()> job) -> bool;

    // Block until no job is pending or running. Returns false on timeout.
    auto WaitIdle(std::chrono::milliseconds timeout) -> bool;

    auto GetNumThreads() const -> unsigned
    {
        return m_numThreads;
    }
    auto GetNumPending() -> size_t;

private:
    void ThreadFunction();

private:
    unsigned m_numThreads;
    bool m_running { false };
    unsigned m_numActive { 0 };
    std::deque<std::function<void()>> m_jobs;
    std::vector<std::thread> m_threads;
    std::mutex m_mutex;
    std::condition_variable m_jobCond;
    std::condition_variable m_idleCond;
};

#endif // CRISHIM_UTILS_CPPUTILS_WORKER_POOL_H
