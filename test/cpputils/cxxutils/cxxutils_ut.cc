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
 * Description: cxxutils unit test
 * Create: 2026-10-19
 */

#include <gtest/gtest.h>

#include "cxxutils.h"

TEST(CxxUtilsTest, test_strings_join)
{
    ASSERT_EQ(CXXUtils::StringsJoin({}, ","), "");
    ASSERT_EQ(CXXUtils::StringsJoin({ "a" }, ","), "a");
    ASSERT_EQ(CXXUtils::StringsJoin({ "a", "b", "c" }, ", "), "a, b, c");
}

TEST(CxxUtilsTest, test_has_prefix)
{
    ASSERT_TRUE(CXXUtils::HasPrefix("unix:///run/crishim.sock", UNIX_SOCKET_PREFIX));
    ASSERT_TRUE(CXXUtils::HasPrefix("abc", ""));
    ASSERT_FALSE(CXXUtils::HasPrefix("ab", "abc"));
    ASSERT_FALSE(CXXUtils::HasPrefix("tcp://1.1.1.1", UNIX_SOCKET_PREFIX));
}

TEST(CxxUtilsTest, test_is_valid_id)
{
    ASSERT_TRUE(CXXUtils::IsValidId("0123456789abcdef"));
    ASSERT_TRUE(CXXUtils::IsValidId("sandbox_1.a-b"));
    ASSERT_TRUE(CXXUtils::IsValidId(std::string(128, 'a')));

    ASSERT_FALSE(CXXUtils::IsValidId(""));
    ASSERT_FALSE(CXXUtils::IsValidId(std::string(129, 'a')));
    ASSERT_FALSE(CXXUtils::IsValidId(".hidden"));
    ASSERT_FALSE(CXXUtils::IsValidId(".."));
    ASSERT_FALSE(CXXUtils::IsValidId("a/b"));
    ASSERT_FALSE(CXXUtils::IsValidId("a b"));
}

TEST(CxxUtilsTest, test_now_time_nanos_increases)
{
    int64_t first = CXXUtils::GetNowTimeNanos();
    int64_t second = CXXUtils::GetNowTimeNanos();
    ASSERT_GT(first, 0);
    ASSERT_GE(second, first);
}
