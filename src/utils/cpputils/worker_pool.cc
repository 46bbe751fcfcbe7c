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
 * Description: fixed size worker pool
 ******************************************************************************/
#include "worker_pool.h"

#include <isula_libutils/log.h>

WorkerPool::WorkerPool(unsigned numThreads) : m_numThreads(numThreads == 0 ? 1 : numThreads)
{
}

WorkerPool::~WorkerPool()
{
    Stop();
}

void WorkerPool::Start()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    if (m_running) {
        return;
    }
    m_running = true;
    for (unsigned i = 0; i < m_numThreads; i++) {
        m_threads.emplace_back(&WorkerPool::ThreadFunction, this);
    }
}

void WorkerPool::Stop()
{
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        if (!m_running) {
            return;
        }
        m_running = false;
        if (!m_jobs.empty()) {
            WARN("Worker pool stopped with %zu pending jobs", m_jobs.size());
        }
        m_jobs.clear();
    }
    m_jobCond.notify_all();

    for (auto &t : m_threads) {
        if (t.joinable()) {
            t.join();
        }
    }
    m_threads.clear();
    m_idleCond.notify_all();
}

auto WorkerPool::Execute(std::function<void()> job) -> bool
{
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        if (!m_running) {
            ERROR("Worker pool is not running");
            return false;
        }
        m_jobs.push_back(std::move(job));
    }
    m_jobCond.notify_one();
    return true;
}

auto WorkerPool::WaitIdle(std::chrono::milliseconds timeout) -> bool
{
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_idleCond.wait_for(lock, timeout, [this]() {
        return m_jobs.empty() && m_numActive == 0;
    });
}

auto WorkerPool::GetNumPending() -> size_t
{
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_jobs.size();
}

void WorkerPool::ThreadFunction()
{
    for (;;) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_jobCond.wait(lock, [this]() {
                return !m_running || !m_jobs.empty();
            });
            if (!m_running) {
                return;
            }
            job = std::move(m_jobs.front());
            m_jobs.pop_front();
            m_numActive++;
        }

        job();

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_numActive--;
            if (m_jobs.empty() && m_numActive == 0) {
                m_idleCond.notify_all();
            }
        }
    }
}
