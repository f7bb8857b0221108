/**
 *    Copyright (C) 2025-present MongoDB, Inc.
 *
 *    This program is free software: you can redistribute it and/or modify
 *    it under the terms of the Server Side Public License, version 1,
 *    as published by MongoDB, Inc.
 *
 *    This program is distributed in the hope that it will be useful,
 *    but WITHOUT ANY WARRANTY; without even the implied warranty of
 *    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *    Server Side Public License for more details.
 *
 *    You should have received a copy of the Server Side Public License
 *    along with this program. If not, see
 *    <http://www.mongodb.com/licensing/server-side-public-license>.
 *
 *    As a special exception, the copyright holders give permission to link the
 *    code of portions of this program with the OpenSSL library under certain
 *    conditions as described in each individual source file and distribute
 *    linked combinations including the program with the OpenSSL library. You
 *    must comply with the Server Side Public License in all respects for
 *    all of the code used other than as permitted herein. If you modify file(s)
 *    with this exception, you may extend this exception to your version of the
 *    file(s), but you are not obligated to do so. If you do not wish to do so,
 *    delete this exception statement from your version. If you delete this
 *    exception statement from all source files in the program, then also delete
 *    it in the license file.
 */

#pragma once

#include "shardplan/base/error_codes.h"
#include "shardplan/base/status.h"
#include "shardplan/base/status_with.h"

#include <exception>
#include <string>
#include <utility>

namespace shardplan {

/** Most shardplan exceptions inherit from this; this is commonly caught at component edges */
class DBException : public std::exception {
public:
    const char* what() const noexcept final {
        return _status.reason().c_str();
    }

    ErrorCodes::Error code() const {
        return _status.code();
    }

    const std::string& reason() const {
        return _status.reason();
    }

    std::string codeString() const {
        return _status.codeString();
    }

    const Status& toStatus() const {
        return _status;
    }

    Status toStatus(const std::string& context) const {
        return _status.withContext(context);
    }

    void addContext(const std::string& context) {
        _status.addContext(context);
    }

protected:
    explicit DBException(Status status);

private:
    Status _status;
};

class AssertionException : public DBException {
public:
    explicit AssertionException(Status status) : DBException(std::move(status)) {}
};

[[noreturn]] void uassertedWithLocation(const Status& status, const char* file, unsigned line);

[[noreturn]] void invariantFailed(const char* expr, const char* file, unsigned line) noexcept;

[[noreturn]] void invariantOKFailed(const char* expr,
                                    const Status& status,
                                    const char* file,
                                    unsigned line) noexcept;

/**
 * "user assert". if asserts, user did something wrong, not our code.
 */
#define uassert(code, msg, expr)                                                             \
    do {                                                                                     \
        if (!(expr)) {                                                                       \
            ::shardplan::uassertedWithLocation(::shardplan::Status(code, msg), __FILE__,     \
                                               __LINE__);                                    \
        }                                                                                    \
    } while (false)

#define uasserted(code, msg) \
    ::shardplan::uassertedWithLocation(::shardplan::Status(code, msg), __FILE__, __LINE__)

#define uassertStatusOK(...) ::shardplan::uassertStatusOKWithLocation(__VA_ARGS__, __FILE__, __LINE__)

inline void uassertStatusOKWithLocation(const Status& status, const char* file, unsigned line) {
    if (!status.isOK())
        uassertedWithLocation(status, file, line);
}

template <typename T>
T uassertStatusOKWithLocation(StatusWith<T> sw, const char* file, unsigned line) {
    uassertStatusOKWithLocation(sw.getStatus(), file, line);
    return std::move(sw.getValue());
}

/**
 * Checks a condition which can only fail because of a programming error in this process.
 */
#define invariant(expr)                                                  \
    do {                                                                 \
        if (!(expr)) {                                                   \
            ::shardplan::invariantFailed(#expr, __FILE__, __LINE__);     \
        }                                                                \
    } while (false)

#define invariantOK(expression)                                                             \
    do {                                                                                    \
        const ::shardplan::Status _invariantOK_status = expression;                         \
        if (!_invariantOK_status.isOK()) {                                                  \
            ::shardplan::invariantOKFailed(#expression, _invariantOK_status, __FILE__,      \
                                           __LINE__);                                       \
        }                                                                                   \
    } while (false)

#define SHARDPLAN_UNREACHABLE ::shardplan::invariantFailed("Hit a SHARDPLAN_UNREACHABLE!", __FILE__, __LINE__)

/**
 * Converts the currently active exception to a Status. Must only be called from within a catch
 * block:
 *
 *     try {
 *         ...
 *     } catch (...) {
 *         return exceptionToStatus();
 *     }
 */
Status exceptionToStatus() noexcept;

}  // namespace shardplan
