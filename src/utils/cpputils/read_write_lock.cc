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
#include "read_write_lock.h"

void RWMutex::rdlock()
{
    std::unique_lock<std::mutex> guard(m_stateMutex);
    m_readerGate.wait(guard, [this]() {
        return !m_writerActive && m_queuedWriters == 0;
    });
    m_activeReaders++;
}

void RWMutex::wrlock()
{
    std::unique_lock<std::mutex> guard(m_stateMutex);
    m_queuedWriters++;
    m_writerGate.wait(guard, [this]() {
        return !m_writerActive && m_activeReaders == 0;
    });
    m_queuedWriters--;
    m_writerActive = true;
}

void RWMutex::unlock()
{
    std::lock_guard<std::mutex> guard(m_stateMutex);

    if (m_writerActive) {
        m_writerActive = false;
    } else if (m_activeReaders > 0) {
        if (--m_activeReaders != 0) {
            return;
        }
    } else {
        // not locked
        return;
    }
    WakeWaiters();
}

// caller holds m_stateMutex
void RWMutex::WakeWaiters()
{
    if (m_queuedWriters > 0) {
        m_writerGate.notify_one();
        return;
    }
    m_readerGate.notify_all();
}
