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
 * Description: reader/writer lock and scoped guards
 *********************************************************************************/
#ifndef CRISHIM_UTILS_CPPUTILS_READ_WRITE_LOCK_H
#define CRISHIM_UTILS_CPPUTILS_READ_WRITE_LOCK_H

#include <condition_variable>
#include <mutex>

// Writer preferring reader/writer lock. Once a writer queues up, new readers
// wait until every queued writer has been served.
class RWMutex {
public:
    RWMutex() = default;
    ~RWMutex() = default;
    RWMutex(const RWMutex &) = delete;
    RWMutex &operator=(const RWMutex &) = delete;

    void rdlock();
    void wrlock();
    // releases whichever mode the caller holds
    void unlock();

private:
    void WakeWaiters();

    std::mutex m_stateMutex;
    std::condition_variable m_readerGate;
    std::condition_variable m_writerGate;
    unsigned int m_activeReaders {0};
    unsigned int m_queuedWriters {0};
    bool m_writerActive {false};
};

template<typename RWMutexType>
class ReadGuard {
public:
    explicit ReadGuard(RWMutexType &lock) : m_lock(lock)
    {
        m_lock.rdlock();
    }
    virtual ~ReadGuard()
    {
        m_lock.unlock();
    }

    ReadGuard() = delete;
    ReadGuard(const ReadGuard &) = delete;
    ReadGuard &operator=(const ReadGuard &) = delete;

private:
    RWMutexType &m_lock;
};

template<typename RWMutexType>
class WriteGuard {
public:
    explicit WriteGuard(RWMutexType &lock) : m_lock(lock)
    {
        m_lock.wrlock();
    }
    virtual ~WriteGuard()
    {
        m_lock.unlock();
    }

    WriteGuard() = delete;
    WriteGuard(const WriteGuard &) = delete;
    WriteGuard &operator=(const WriteGuard &) = delete;

private:
    RWMutexType &m_lock;
};

#endif // CRISHIM_UTILS_CPPUTILS_READ_WRITE_LOCK_H
