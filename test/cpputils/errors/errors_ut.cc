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
 * Description: errors unit test
 * Create: 2026-10-19
 */

#include <gtest/gtest.h>

#include "errors.h"

TEST(ErrorsTest, test_empty_by_default)
{
    Errors err;
    ASSERT_TRUE(err.Empty());
    ASSERT_FALSE(err.NotEmpty());
    ASSERT_EQ(err.GetCode(), ERR_OK);
    ASSERT_STREQ(err.GetCMessage(), "");
}

TEST(ErrorsTest, test_message_without_code_is_internal)
{
    Errors err;
    err.SetError("boom");
    ASSERT_TRUE(err.NotEmpty());
    ASSERT_EQ(err.GetCode(), ERR_INTERNAL);
    ASSERT_TRUE(err.Is(ERR_INTERNAL));
    ASSERT_FALSE(err.IsNotFound());
}

TEST(ErrorsTest, test_set_error_with_code)
{
    Errors err;
    err.SetError(ERR_NOT_FOUND, "Failed to find sandbox abc");
    ASSERT_TRUE(err.IsNotFound());
    ASSERT_FALSE(err.IsBackendUnavailable());
    ASSERT_STREQ(err.GetCMessage(), "Failed to find sandbox abc");

    err.SetCode(ERR_BACKEND_UNAVAILABLE);
    ASSERT_TRUE(err.IsBackendUnavailable());
    ASSERT_EQ(err.GetMessage(), "Failed to find sandbox abc");
}

TEST(ErrorsTest, test_errorf_keeps_code)
{
    Errors err;
    err.SetError(ERR_NOT_FOUND, "No such file");
    err.Errorf("Failed to find %s %d", "container", 3);
    ASSERT_TRUE(err.IsNotFound());
    ASSERT_STREQ(err.GetCMessage(), "Failed to find container 3");
}

TEST(ErrorsTest, test_append_error)
{
    Errors err;
    err.AppendError("first");
    err.AppendError("second");
    ASSERT_EQ(err.GetMessage(), "first: second");
}

TEST(ErrorsTest, test_clear_and_copy)
{
    Errors err;
    err.SetError(ERR_ALREADY_EXISTS, "dup");

    Errors copy(err);
    ASSERT_TRUE(copy.Is(ERR_ALREADY_EXISTS));
    Errors assigned;
    assigned = err;
    ASSERT_EQ(assigned.GetMessage(), "dup");

    err.Clear();
    ASSERT_TRUE(err.Empty());
    ASSERT_TRUE(copy.NotEmpty());
}
