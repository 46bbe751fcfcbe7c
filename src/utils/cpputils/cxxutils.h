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
 * Description: c++ common tools.
 ******************************************************************************/
#ifndef CRISHIM_UTILS_CPPUTILS_CXXUTILS_H
#define CRISHIM_UTILS_CPPUTILS_CXXUTILS_H

#include <cstdint>
#include <string>
#include <vector>

#define UNIX_SOCKET_PREFIX "unix://"

namespace CXXUtils {
std::string StringsJoin(const std::vector<std::string> &vec, const std::string &sep);
bool HasPrefix(const std::string &str, const std::string &prefix);
// ids end up as file names, allow [A-Za-z0-9_.-] only and no leading dot
bool IsValidId(const std::string &id);
int64_t GetNowTimeNanos();
};
#endif // CRISHIM_UTILS_CPPUTILS_CXXUTILS_H
