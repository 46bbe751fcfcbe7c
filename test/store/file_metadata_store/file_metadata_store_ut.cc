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
 * Description: file_metadata_store unit test
 * Create: 2026-10-19
 */

#include <stdlib.h>
#include <unistd.h>

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "file_metadata_store.h"
#include "file_utils.h"

using namespace crishim;

class FileMetadataStoreUnitTest : public testing::Test {
protected:
    void SetUp() override
    {
        char tmpl[] = "/tmp/crishim_store_XXXXXX";
        ASSERT_NE(mkdtemp(tmpl), nullptr);
        m_root = tmpl;
        m_store = std::unique_ptr<FileMetadataStore>(new FileMetadataStore(m_root));
        Errors err;
        ASSERT_TRUE(m_store->Init(err)) << err.GetMessage();
    }

    void TearDown() override
    {
        m_store.reset();
        std::string cmd = "rm -rf " + m_root;
        ASSERT_EQ(system(cmd.c_str()), 0);
    }

    std::string m_root;
    std::unique_ptr<FileMetadataStore> m_store;
};

static crishim::v1::SandboxRecord MakeSandbox(const std::string &id, const std::string &ns,
                                             crishim::v1::PodSandboxState state)
{
    crishim::v1::SandboxRecord record;
    record.set_id(id);
    record.set_name("pod-" + id);
    record.set_namespace_(ns);
    record.set_state(state);
    record.mutable_config()->mutable_metadata()->set_name("pod-" + id);
    record.mutable_config()->mutable_metadata()->set_namespace_(ns);
    (*record.mutable_config()->mutable_labels())["app"] = "web";
    record.set_created_at(1588);
    return record;
}

static crishim::v1::ContainerRecord MakeContainer(const std::string &id, const std::string &sandboxId,
                                                 crishim::v1::ContainerState state)
{
    crishim::v1::ContainerRecord record;
    record.set_id(id);
    record.set_name("ctr-" + id);
    record.set_sandbox_id(sandboxId);
    record.set_state(state);
    record.set_pid_namespace_mode(crishim::v1::CONTAINER);
    record.mutable_config()->mutable_metadata()->set_name("ctr-" + id);
    record.mutable_config()->add_command("sleep");
    record.mutable_config()->add_args("inf");
    record.set_image("busybox");
    return record;
}

TEST_F(FileMetadataStoreUnitTest, test_put_get_sandbox)
{
    Errors err;
    crishim::v1::SandboxRecord got;
    auto record = MakeSandbox("sb1", "default", crishim::v1::SANDBOX_READY);
    record.add_containers("c1");

    ASSERT_TRUE(m_store->PutSandbox(record, err)) << err.GetMessage();
    ASSERT_TRUE(m_store->GetSandbox("sb1", got, err)) << err.GetMessage();
    ASSERT_EQ(got.id(), "sb1");
    ASSERT_EQ(got.namespace_(), "default");
    ASSERT_EQ(got.state(), crishim::v1::SANDBOX_READY);
    ASSERT_EQ(got.containers_size(), 1);
    ASSERT_EQ(got.config().labels().at("app"), "web");
    ASSERT_EQ(got.created_at(), 1588);
    ASSERT_EQ(access(FileUtils::JoinPath(m_store->GetSandboxDir(), "sb1.json").c_str(), F_OK), 0);
}

TEST_F(FileMetadataStoreUnitTest, test_put_overwrites_whole_record)
{
    Errors err;
    crishim::v1::ContainerRecord got;
    auto record = MakeContainer("c1", "sb1", crishim::v1::CONTAINER_RUNNING);
    record.set_reason("Whatever");

    ASSERT_TRUE(m_store->PutContainer(record, err));
    record.set_state(crishim::v1::CONTAINER_EXITED);
    record.clear_reason();
    record.set_exit_code(2);
    ASSERT_TRUE(m_store->PutContainer(record, err));

    ASSERT_TRUE(m_store->GetContainer("c1", got, err));
    ASSERT_EQ(got.state(), crishim::v1::CONTAINER_EXITED);
    ASSERT_EQ(got.exit_code(), 2);
    ASSERT_EQ(got.reason(), "");
    ASSERT_EQ(got.config().command(0), "sleep");
}

TEST_F(FileMetadataStoreUnitTest, test_get_missing_is_not_found)
{
    Errors err;
    crishim::v1::SandboxRecord sandbox;
    crishim::v1::ContainerRecord container;

    ASSERT_FALSE(m_store->GetSandbox("nope", sandbox, err));
    ASSERT_TRUE(err.IsNotFound());
    ASSERT_STREQ(err.GetCMessage(), "Failed to find sandbox nope");

    err.Clear();
    ASSERT_FALSE(m_store->GetContainer("nope", container, err));
    ASSERT_TRUE(err.IsNotFound());
}

TEST_F(FileMetadataStoreUnitTest, test_delete_is_idempotent)
{
    Errors err;
    crishim::v1::SandboxRecord got;

    ASSERT_TRUE(m_store->PutSandbox(MakeSandbox("sb1", "default", crishim::v1::SANDBOX_READY), err));
    ASSERT_TRUE(m_store->DeleteSandbox("sb1", err));
    ASSERT_FALSE(m_store->GetSandbox("sb1", got, err));
    ASSERT_TRUE(err.IsNotFound());

    err.Clear();
    ASSERT_TRUE(m_store->DeleteSandbox("sb1", err));
    ASSERT_TRUE(m_store->DeleteContainer("never", err));
}

TEST_F(FileMetadataStoreUnitTest, test_invalid_ids_rejected)
{
    Errors err;
    crishim::v1::SandboxRecord got;

    ASSERT_FALSE(m_store->PutSandbox(MakeSandbox("../escape", "default", crishim::v1::SANDBOX_READY), err));
    ASSERT_TRUE(err.Is(ERR_INVALID_ARGUMENT));

    err.Clear();
    ASSERT_FALSE(m_store->GetSandbox("a/b", got, err));
    ASSERT_TRUE(err.Is(ERR_INVALID_ARGUMENT));

    err.Clear();
    ASSERT_FALSE(m_store->DeleteContainer("", err));
    ASSERT_TRUE(err.Is(ERR_INVALID_ARGUMENT));
}

TEST_F(FileMetadataStoreUnitTest, test_list_with_filters)
{
    Errors err;
    std::vector<crishim::v1::SandboxRecord> sandboxes;
    std::vector<crishim::v1::ContainerRecord> containers;

    ASSERT_TRUE(m_store->PutSandbox(MakeSandbox("aa1", "default", crishim::v1::SANDBOX_READY), err));
    ASSERT_TRUE(m_store->PutSandbox(MakeSandbox("aa2", "kube-system", crishim::v1::SANDBOX_NOTREADY), err));
    ASSERT_TRUE(m_store->PutSandbox(MakeSandbox("bb1", "default", crishim::v1::SANDBOX_NOTREADY), err));
    ASSERT_TRUE(m_store->PutContainer(MakeContainer("c1", "aa1", crishim::v1::CONTAINER_RUNNING), err));
    ASSERT_TRUE(m_store->PutContainer(MakeContainer("c2", "bb1", crishim::v1::CONTAINER_EXITED), err));

    ASSERT_TRUE(m_store->ListSandboxes(crishim::v1::PodSandboxFilter(), sandboxes, err));
    ASSERT_EQ(sandboxes.size(), 3U);

    crishim::v1::PodSandboxFilter filter;
    filter.set_id("aa");
    sandboxes.clear();
    ASSERT_TRUE(m_store->ListSandboxes(filter, sandboxes, err));
    ASSERT_EQ(sandboxes.size(), 2U);

    filter.mutable_state()->set_state(crishim::v1::SANDBOX_NOTREADY);
    sandboxes.clear();
    ASSERT_TRUE(m_store->ListSandboxes(filter, sandboxes, err));
    ASSERT_EQ(sandboxes.size(), 1U);
    ASSERT_EQ(sandboxes[0].id(), "aa2");

    crishim::v1::ContainerFilter cfilter;
    cfilter.set_pod_sandbox_id("bb1");
    ASSERT_TRUE(m_store->ListContainers(cfilter, containers, err));
    ASSERT_EQ(containers.size(), 1U);
    ASSERT_EQ(containers[0].id(), "c2");
}

TEST_F(FileMetadataStoreUnitTest, test_corrupt_records_are_skipped)
{
    Errors err;
    std::vector<crishim::v1::SandboxRecord> sandboxes;
    std::vector<crishim::v1::ContainerRecord> containers;

    ASSERT_TRUE(m_store->PutSandbox(MakeSandbox("good", "default", crishim::v1::SANDBOX_READY), err));
    ASSERT_TRUE(FileUtils::AtomicWriteFile(FileUtils::JoinPath(m_store->GetSandboxDir(), "bad.json"), "{not json",
                                           FileUtils::CONFIG_FILE_MODE, err));
    // a record whose id does not match its file name
    ASSERT_TRUE(FileUtils::AtomicWriteFile(FileUtils::JoinPath(m_store->GetContainerDir(), "c1.json"),
                                           "{\"id\":\"c2\"}", FileUtils::CONFIG_FILE_MODE, err));
    // unrelated files are ignored
    ASSERT_TRUE(FileUtils::AtomicWriteFile(FileUtils::JoinPath(m_store->GetSandboxDir(), "README"), "x",
                                           FileUtils::CONFIG_FILE_MODE, err));

    ASSERT_TRUE(m_store->ListSandboxes(crishim::v1::PodSandboxFilter(), sandboxes, err));
    ASSERT_EQ(sandboxes.size(), 1U);
    ASSERT_EQ(sandboxes[0].id(), "good");
    ASSERT_TRUE(m_store->ListContainers(crishim::v1::ContainerFilter(), containers, err));
    ASSERT_TRUE(containers.empty());
    ASSERT_EQ(m_store->GetCorruptRecords(), 2U);
}

TEST_F(FileMetadataStoreUnitTest, test_unknown_fields_are_ignored)
{
    Errors err;
    crishim::v1::SandboxRecord got;

    ASSERT_TRUE(FileUtils::AtomicWriteFile(FileUtils::JoinPath(m_store->GetSandboxDir(), "sb1.json"),
                                           "{\"id\":\"sb1\",\"state\":\"SANDBOX_NOTREADY\",\"future_field\":1}",
                                           FileUtils::CONFIG_FILE_MODE, err));
    ASSERT_TRUE(m_store->GetSandbox("sb1", got, err)) << err.GetMessage();
    ASSERT_EQ(got.state(), crishim::v1::SANDBOX_NOTREADY);
}

TEST_F(FileMetadataStoreUnitTest, test_init_removes_stale_temp_files)
{
    Errors err;
    crishim::v1::SandboxRecord got;
    std::string tmpPath = FileUtils::JoinPath(m_store->GetSandboxDir(), std::string("sb1.json") +
                                              FileUtils::TEMP_FILE_SUFFIX);

    ASSERT_TRUE(m_store->PutSandbox(MakeSandbox("sb1", "default", crishim::v1::SANDBOX_READY), err));
    // crash between writing the temp file and the rename
    ASSERT_TRUE(FileUtils::AtomicWriteFile(tmpPath, "{\"id\":\"sb1\",\"state\":\"SANDBOX_NOTREADY\"}",
                                           FileUtils::CONFIG_FILE_MODE, err));

    FileMetadataStore reopened(m_root);
    ASSERT_TRUE(reopened.Init(err));
    ASSERT_NE(access(tmpPath.c_str(), F_OK), 0);
    ASSERT_TRUE(reopened.GetSandbox("sb1", got, err));
    ASSERT_EQ(got.state(), crishim::v1::SANDBOX_READY);
}

TEST(FileMetadataStoreTest, test_init_with_empty_root_fails)
{
    Errors err;
    FileMetadataStore store("");

    ASSERT_FALSE(store.Init(err));
    ASSERT_TRUE(err.Is(ERR_INVALID_ARGUMENT));
}
