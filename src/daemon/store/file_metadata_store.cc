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
 * Description: metadata store keeping one json file per record
 ******************************************************************************/
#include "file_metadata_store.h"

#include <google/protobuf/util/json_util.h>
#include <isula_libutils/log.h>

#include "cxxutils.h"
#include "file_utils.h"
#include "record_filters.h"

namespace crishim {
namespace {
const char *SANDBOX_DIR_NAME = "sandboxes";
const char *CONTAINER_DIR_NAME = "containers";
const std::string RECORD_SUFFIX = ".json";

auto HasSuffix(const std::string &str, const std::string &suffix) -> bool
{
    return str.length() >= suffix.length() &&
           str.compare(str.length() - suffix.length(), suffix.length(), suffix) == 0;
}
} // namespace

FileMetadataStore::FileMetadataStore(const std::string &rootdir)
    : m_rootdir(rootdir)
    , m_sandboxDir(FileUtils::JoinPath(rootdir, SANDBOX_DIR_NAME))
    , m_containerDir(FileUtils::JoinPath(rootdir, CONTAINER_DIR_NAME))
{
}

auto FileMetadataStore::Init(Errors &error) -> bool
{
    if (m_rootdir.empty()) {
        ERROR("Empty metadata root directory");
        error.SetError(ERR_INVALID_ARGUMENT, "Empty metadata root directory");
        return false;
    }

    for (const auto &dir : { m_sandboxDir, m_containerDir }) {
        if (!FileUtils::MkdirAll(dir, FileUtils::CONFIG_DIRECTORY_MODE, error)) {
            ERROR("Failed to create metadata directory %s: %s", dir.c_str(), error.GetCMessage());
            error.SetCode(ERR_STORE_FAILED);
            return false;
        }
        // a crash during Put may leave <id>.json.tmp behind, the target file is still intact
        if (!RemoveStaleTempFiles(dir, error)) {
            error.SetCode(ERR_STORE_FAILED);
            return false;
        }
    }

    INFO("Metadata store initialized at %s", m_rootdir.c_str());
    return true;
}

auto FileMetadataStore::RecordPath(const std::string &dir, const std::string &id) -> std::string
{
    return FileUtils::JoinPath(dir, id + RECORD_SUFFIX);
}

auto FileMetadataStore::RemoveStaleTempFiles(const std::string &dir, Errors &error) -> bool
{
    std::vector<std::string> names;

    if (!FileUtils::ListDir(dir, names, error)) {
        return false;
    }

    for (const auto &name : names) {
        if (!HasSuffix(name, FileUtils::TEMP_FILE_SUFFIX)) {
            continue;
        }
        WARN("Removing stale temporary record file %s/%s", dir.c_str(), name.c_str());
        if (!FileUtils::RemoveFile(FileUtils::JoinPath(dir, name), error)) {
            return false;
        }
    }
    return true;
}

auto FileMetadataStore::ListRecordIds(const std::string &dir, std::vector<std::string> &ids, Errors &error) -> bool
{
    std::vector<std::string> names;

    if (!FileUtils::ListDir(dir, names, error)) {
        error.SetCode(ERR_STORE_FAILED);
        return false;
    }

    for (const auto &name : names) {
        if (!HasSuffix(name, RECORD_SUFFIX)) {
            continue;
        }
        ids.push_back(name.substr(0, name.length() - RECORD_SUFFIX.length()));
    }
    return true;
}

template <typename Record>
auto FileMetadataStore::WriteRecord(const std::string &dir, const Record &record, Errors &error) -> bool
{
    std::string json;
    google::protobuf::util::JsonPrintOptions options;

    if (!CXXUtils::IsValidId(record.id())) {
        ERROR("Invalid record id: '%s'", record.id().c_str());
        error.SetError(ERR_INVALID_ARGUMENT, "Invalid record id: '" + record.id() + "'");
        return false;
    }

    options.preserve_proto_field_names = true;
    options.always_print_primitive_fields = true;
    auto status = google::protobuf::util::MessageToJsonString(record, &json, options);
    if (!status.ok()) {
        ERROR("Failed to marshal record %s: %s", record.id().c_str(), status.ToString().c_str());
        error.SetError(ERR_STORE_FAILED, "Failed to marshal record " + record.id() + ": " + status.ToString());
        return false;
    }

    if (!FileUtils::AtomicWriteFile(RecordPath(dir, record.id()), json, FileUtils::CONFIG_FILE_MODE, error)) {
        ERROR("Failed to save record %s: %s", record.id().c_str(), error.GetCMessage());
        error.SetCode(ERR_STORE_FAILED);
        return false;
    }
    return true;
}

template <typename Record>
auto FileMetadataStore::ParseRecord(const std::string &id, const std::string &json, Record &record,
                                    Errors &error) -> bool
{
    google::protobuf::util::JsonParseOptions options;

    options.ignore_unknown_fields = true;
    auto status = google::protobuf::util::JsonStringToMessage(json, &record, options);
    if (!status.ok()) {
        error.SetError(ERR_STORE_FAILED, "Failed to parse record " + id + ": " + status.ToString());
        return false;
    }

    if (record.id() != id) {
        error.SetError(ERR_STORE_FAILED, "Record file " + id + " holds id '" + record.id() + "'");
        return false;
    }
    return true;
}

template <typename Record>
auto FileMetadataStore::ReadRecord(const std::string &dir, const std::string &id, Record &record,
                                   Errors &error) -> bool
{
    std::string json;

    if (!CXXUtils::IsValidId(id)) {
        error.SetError(ERR_INVALID_ARGUMENT, "Invalid record id: '" + id + "'");
        return false;
    }

    if (!FileUtils::ReadFile(RecordPath(dir, id), json, error)) {
        if (!error.IsNotFound()) {
            error.SetCode(ERR_STORE_FAILED);
        }
        return false;
    }

    return ParseRecord(id, json, record, error);
}

// A record that cannot be parsed is skipped and counted. A record that cannot be
// read fails the whole listing, its content may well be valid.
template <typename Record>
auto FileMetadataStore::ReadAllRecords(const std::string &dir, const char *kind, std::vector<Record> &records,
                                       Errors &error) -> bool
{
    std::vector<std::string> ids;

    if (!ListRecordIds(dir, ids, error)) {
        return false;
    }

    for (const auto &id : ids) {
        std::string json;
        Record record;
        Errors tmpErr;

        if (!CXXUtils::IsValidId(id)) {
            ERROR("Skip %s record file with invalid id '%s'", kind, id.c_str());
            m_corruptRecords++;
            continue;
        }
        if (!FileUtils::ReadFile(RecordPath(dir, id), json, tmpErr)) {
            // deleted between listing and reading
            if (tmpErr.IsNotFound()) {
                continue;
            }
            ERROR("Failed to read %s record %s: %s", kind, id.c_str(), tmpErr.GetCMessage());
            error.SetError(ERR_STORE_FAILED, std::string("Failed to read ") + kind + " record " + id + ": " +
                           tmpErr.GetMessage());
            return false;
        }
        if (!ParseRecord(id, json, record, tmpErr)) {
            ERROR("Skip corrupt %s record %s: %s", kind, id.c_str(), tmpErr.GetCMessage());
            m_corruptRecords++;
            continue;
        }
        records.push_back(record);
    }
    return true;
}

auto FileMetadataStore::DeleteRecord(const std::string &dir, const std::string &id, Errors &error) -> bool
{
    if (!CXXUtils::IsValidId(id)) {
        error.SetError(ERR_INVALID_ARGUMENT, "Invalid record id: '" + id + "'");
        return false;
    }

    if (!FileUtils::RemoveFile(RecordPath(dir, id), error)) {
        error.SetCode(ERR_STORE_FAILED);
        return false;
    }
    if (!FileUtils::FsyncDir(dir, error)) {
        error.SetCode(ERR_STORE_FAILED);
        return false;
    }
    return true;
}

auto FileMetadataStore::PutSandbox(const crishim::v1::SandboxRecord &record, Errors &error) -> bool
{
    return WriteRecord(m_sandboxDir, record, error);
}

auto FileMetadataStore::GetSandbox(const std::string &id, crishim::v1::SandboxRecord &record, Errors &error) -> bool
{
    if (!ReadRecord(m_sandboxDir, id, record, error)) {
        if (error.IsNotFound()) {
            error.Errorf("Failed to find sandbox %s", id.c_str());
        }
        return false;
    }
    return true;
}

auto FileMetadataStore::DeleteSandbox(const std::string &id, Errors &error) -> bool
{
    return DeleteRecord(m_sandboxDir, id, error);
}

auto FileMetadataStore::ListSandboxes(const crishim::v1::PodSandboxFilter &filter,
                                      std::vector<crishim::v1::SandboxRecord> &records, Errors &error) -> bool
{
    std::vector<crishim::v1::SandboxRecord> all;

    if (!ReadAllRecords(m_sandboxDir, "sandbox", all, error)) {
        return false;
    }
    for (const auto &record : all) {
        if (MatchSandboxFilter(filter, record)) {
            records.push_back(record);
        }
    }
    return true;
}

auto FileMetadataStore::PutContainer(const crishim::v1::ContainerRecord &record, Errors &error) -> bool
{
    return WriteRecord(m_containerDir, record, error);
}

auto FileMetadataStore::GetContainer(const std::string &id, crishim::v1::ContainerRecord &record,
                                     Errors &error) -> bool
{
    if (!ReadRecord(m_containerDir, id, record, error)) {
        if (error.IsNotFound()) {
            error.Errorf("Failed to find container %s", id.c_str());
        }
        return false;
    }
    return true;
}

auto FileMetadataStore::DeleteContainer(const std::string &id, Errors &error) -> bool
{
    return DeleteRecord(m_containerDir, id, error);
}

auto FileMetadataStore::ListContainers(const crishim::v1::ContainerFilter &filter,
                                       std::vector<crishim::v1::ContainerRecord> &records, Errors &error) -> bool
{
    std::vector<crishim::v1::ContainerRecord> all;

    if (!ReadAllRecords(m_containerDir, "container", all, error)) {
        return false;
    }
    for (const auto &record : all) {
        if (MatchContainerFilter(filter, record)) {
            records.push_back(record);
        }
    }
    return true;
}

} // namespace crishim
