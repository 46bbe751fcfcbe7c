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
 * Description: provide c++ common utils functions
 *******************************************************************************/
#include "cxxutils.h"

#include <chrono>
#include <numeric>

namespace CXXUtils {
const size_t MAX_ID_LEN = 128;

// Join concatenates the elements of a to create a single string. The separator string
// sep is placed between elements in the resulting string.
std::string StringsJoin(const std::vector<std::string> &vec, const std::string &sep)
{
    auto func = [&sep](const std::string & a, const std::string & b) -> std::string {
        return a + (a.length() > 0 ? sep : "") + b;
    };
    return std::accumulate(vec.begin(), vec.end(), std::string(), func);
}

bool HasPrefix(const std::string &str, const std::string &prefix)
{
    return str.compare(0, prefix.length(), prefix) == 0;
}

bool IsValidId(const std::string &id)
{
    if (id.empty() || id.length() > MAX_ID_LEN || id[0] == '.') {
        return false;
    }

    for (const char c : id) {
        if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
            c == '_' || c == '.' || c == '-') {
            continue;
        }
        return false;
    }
    return true;
}

int64_t GetNowTimeNanos()
{
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::nanoseconds>(now).count();
}

} // namespace CXXUtils
