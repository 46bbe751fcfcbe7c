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
 * Description: provide durable file helpers
 ******************************************************************************/
#ifndef CRISHIM_UTILS_CPPUTILS_FILE_UTILS_H
#define CRISHIM_UTILS_CPPUTILS_FILE_UTILS_H

#include <sys/types.h>

#include <string>
#include <vector>

#include "errors.h"

namespace FileUtils {
const mode_t CONFIG_FILE_MODE = 0640;
const mode_t CONFIG_DIRECTORY_MODE = 0750;
const char * const TEMP_FILE_SUFFIX = ".tmp";

// Write content to path.tmp, fsync it, rename it over path and fsync the parent
// directory. After a successful return the new content survives a crash.
auto AtomicWriteFile(const std::string &path, const std::string &content, mode_t mode, Errors &error) -> bool;

auto ReadFile(const std::string &path, std::string &content, Errors &error) -> bool;

// Remove path; a missing file is not an error.
auto RemoveFile(const std::string &path, Errors &error) -> bool;

// mkdir -p
auto MkdirAll(const std::string &path, mode_t mode, Errors &error) -> bool;

// List regular file names directly under dir, sorted.
auto ListDir(const std::string &dir, std::vector<std::string> &names, Errors &error) -> bool;

auto FsyncDir(const std::string &dir, Errors &error) -> bool;
auto JoinPath(const std::string &dir, const std::string &name) -> std::string;
};

#endif // CRISHIM_UTILS_CPPUTILS_FILE_UTILS_H
