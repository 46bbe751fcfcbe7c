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
 * Description: provide error carrier definition
 *********************************************************************************/
#ifndef CRISHIM_UTILS_CPPUTILS_ERRORS_H
#define CRISHIM_UTILS_CPPUTILS_ERRORS_H

#include <string>
#include <vector>

// Error codes carried by Errors. ERR_OK with an empty message means success.
enum ErrorCode {
    ERR_OK = 0,
    // unknown sandbox, container or task id
    ERR_NOT_FOUND,
    // operation is not valid for the current lifecycle state
    ERR_ILLEGAL_TRANSITION,
    // backend could not be reached, retried before surfacing
    ERR_BACKEND_UNAVAILABLE,
    // backend answered with a non transient failure
    ERR_BACKEND_FAILED,
    ERR_INVALID_ARGUMENT,
    ERR_ALREADY_EXISTS,
    ERR_STORE_FAILED,
    ERR_INTERNAL,
};

class Errors {
public:
    Errors();
    Errors(const Errors &copy)
        : m_message(copy.m_message), m_code(copy.m_code)
    {
    }
    Errors &operator=(const Errors &);
    virtual ~Errors();

    void Clear();
    std::string &GetMessage();
    const char *GetCMessage() const;
    int GetCode() const;
    bool Empty() const;
    bool NotEmpty() const;

    // code helpers, a message without code counts as ERR_INTERNAL
    void SetCode(int code);
    bool Is(int code) const;
    bool IsNotFound() const;
    bool IsBackendUnavailable() const;

    void AppendError(const std::string &msg);
    void SetError(const std::string &msg);
    void SetError(const char *msg);
    void SetError(int code, const std::string &msg);
    void Errorf(const char *fmt, ...);

    void SetAggregate(const std::vector<std::string> &msgs);

private:
    std::string m_message;
    int m_code{0};
};

#endif // CRISHIM_UTILS_CPPUTILS_ERRORS_H
