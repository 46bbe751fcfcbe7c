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
#include "file_utils.h"

#include <dirent.h>
#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>

#include <isula_libutils/log.h>

namespace FileUtils {
namespace {
const size_t READ_BUFFER_SIZE = 4096;

auto WriteAll(int fd, const char *buf, size_t len) -> bool
{
    size_t written = 0;

    while (written < len) {
        ssize_t n = write(fd, buf + written, len - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

auto ParentDir(const std::string &path) -> std::string
{
    auto pos = path.find_last_of('/');
    if (pos == std::string::npos) {
        return ".";
    }
    if (pos == 0) {
        return "/";
    }
    return path.substr(0, pos);
}
} // namespace

auto JoinPath(const std::string &dir, const std::string &name) -> std::string
{
    if (dir.empty()) {
        return name;
    }
    if (dir.back() == '/') {
        return dir + name;
    }
    return dir + "/" + name;
}

auto FsyncDir(const std::string &dir, Errors &error) -> bool
{
    int fd = open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        SYSERROR("Failed to open directory %s", dir.c_str());
        error.Errorf("Failed to open directory %s: %s", dir.c_str(), strerror(errno));
        return false;
    }

    if (fsync(fd) != 0) {
        SYSERROR("Failed to sync directory %s", dir.c_str());
        error.Errorf("Failed to sync directory %s: %s", dir.c_str(), strerror(errno));
        close(fd);
        return false;
    }

    close(fd);
    return true;
}

auto AtomicWriteFile(const std::string &path, const std::string &content, mode_t mode, Errors &error) -> bool
{
    const std::string tmpPath = path + TEMP_FILE_SUFFIX;

    int fd = open(tmpPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode);
    if (fd < 0) {
        SYSERROR("Failed to create file %s", tmpPath.c_str());
        error.Errorf("Failed to create file %s: %s", tmpPath.c_str(), strerror(errno));
        return false;
    }

    if (!WriteAll(fd, content.c_str(), content.length())) {
        SYSERROR("Failed to write file %s", tmpPath.c_str());
        error.Errorf("Failed to write file %s: %s", tmpPath.c_str(), strerror(errno));
        close(fd);
        (void)unlink(tmpPath.c_str());
        return false;
    }

    if (fsync(fd) != 0) {
        SYSERROR("Failed to sync file %s", tmpPath.c_str());
        error.Errorf("Failed to sync file %s: %s", tmpPath.c_str(), strerror(errno));
        close(fd);
        (void)unlink(tmpPath.c_str());
        return false;
    }
    close(fd);

    if (rename(tmpPath.c_str(), path.c_str()) != 0) {
        SYSERROR("Failed to rename %s to %s", tmpPath.c_str(), path.c_str());
        error.Errorf("Failed to rename %s to %s: %s", tmpPath.c_str(), path.c_str(), strerror(errno));
        (void)unlink(tmpPath.c_str());
        return false;
    }

    // the rename itself is only durable once the directory entry is flushed
    return FsyncDir(ParentDir(path), error);
}

auto ReadFile(const std::string &path, std::string &content, Errors &error) -> bool
{
    char buf[READ_BUFFER_SIZE];

    int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        if (errno == ENOENT) {
            error.SetError(ERR_NOT_FOUND, "No such file: " + path);
            return false;
        }
        SYSERROR("Failed to open file %s", path.c_str());
        error.Errorf("Failed to open file %s: %s", path.c_str(), strerror(errno));
        return false;
    }

    content.clear();
    for (;;) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            SYSERROR("Failed to read file %s", path.c_str());
            error.Errorf("Failed to read file %s: %s", path.c_str(), strerror(errno));
            close(fd);
            return false;
        }
        if (n == 0) {
            break;
        }
        content.append(buf, static_cast<size_t>(n));
    }

    close(fd);
    return true;
}

auto RemoveFile(const std::string &path, Errors &error) -> bool
{
    if (unlink(path.c_str()) != 0 && errno != ENOENT) {
        SYSERROR("Failed to remove file %s", path.c_str());
        error.Errorf("Failed to remove file %s: %s", path.c_str(), strerror(errno));
        return false;
    }
    return true;
}

auto MkdirAll(const std::string &path, mode_t mode, Errors &error) -> bool
{
    if (path.empty()) {
        error.SetError(ERR_INVALID_ARGUMENT, "Empty directory path");
        return false;
    }

    std::string current;
    size_t pos = 0;
    while (pos != std::string::npos) {
        pos = path.find('/', pos + 1);
        current = path.substr(0, pos);
        if (current.empty()) {
            continue;
        }
        if (mkdir(current.c_str(), mode) != 0 && errno != EEXIST) {
            SYSERROR("Failed to create directory %s", current.c_str());
            error.Errorf("Failed to create directory %s: %s", current.c_str(), strerror(errno));
            return false;
        }
    }

    struct stat st;
    if (stat(path.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
        ERROR("%s exists and is not a directory", path.c_str());
        error.Errorf("%s exists and is not a directory", path.c_str());
        return false;
    }
    return true;
}

auto ListDir(const std::string &dir, std::vector<std::string> &names, Errors &error) -> bool
{
    DIR *dp = opendir(dir.c_str());
    if (dp == nullptr) {
        SYSERROR("Failed to open directory %s", dir.c_str());
        error.Errorf("Failed to open directory %s: %s", dir.c_str(), strerror(errno));
        return false;
    }

    struct dirent *entry = nullptr;
    while ((entry = readdir(dp)) != nullptr) {
        if (strcmp(entry->d_name, ".") == 0 || strcmp(entry->d_name, "..") == 0) {
            continue;
        }
        // d_type may be DT_UNKNOWN on some filesystems
        if (entry->d_type != DT_REG && entry->d_type != DT_UNKNOWN) {
            continue;
        }
        names.push_back(entry->d_name);
    }
    closedir(dp);

    std::sort(names.begin(), names.end());
    return true;
}

} // namespace FileUtils
