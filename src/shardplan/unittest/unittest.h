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

/**
 * Unit test helpers: GoogleTest plus the assertion vocabulary used throughout the shardplan
 * tests.
 */

#pragma once

#include "shardplan/base/status.h"
#include "shardplan/base/status_with.h"
#include "shardplan/util/assert_util.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace shardplan {
namespace unittest {

using Test = ::testing::Test;

namespace detail {

inline const Status& toStatus(const Status& status) {
    return status;
}

template <typename T>
const Status& toStatus(const StatusWith<T>& sw) {
    return sw.getStatus();
}

template <typename T>
::testing::AssertionResult assertOK(const char* expr, const T& value) {
    const Status& status = toStatus(value);
    if (status.isOK())
        return ::testing::AssertionSuccess();
    return ::testing::AssertionFailure() << expr << " failed: " << status;
}

template <typename T>
::testing::AssertionResult assertNotOK(const char* expr, const T& value) {
    if (!toStatus(value).isOK())
        return ::testing::AssertionSuccess();
    return ::testing::AssertionFailure() << expr << " unexpectedly succeeded";
}

template <typename T>
::testing::AssertionResult assertStatusCode(const char* codeExpr,
                                            const char* expr,
                                            ErrorCodes::Error code,
                                            const T& value) {
    const Status& status = toStatus(value);
    if (status.code() == code)
        return ::testing::AssertionSuccess();
    return ::testing::AssertionFailure() << expr << " returned " << status << ", expected "
                                         << codeExpr;
}

}  // namespace detail
}  // namespace unittest
}  // namespace shardplan

#define ASSERT(EXPR) ASSERT_TRUE(EXPR)

#define ASSERT_LTE(a, b) ASSERT_LE(a, b)
#define ASSERT_GTE(a, b) ASSERT_GE(a, b)

/**
 * Asserts that a Status or StatusWith is OK, printing the error otherwise.
 */
#define ASSERT_OK(EXPR) ASSERT_PRED_FORMAT1(::shardplan::unittest::detail::assertOK, EXPR)

#define ASSERT_NOT_OK(EXPR) ASSERT_PRED_FORMAT1(::shardplan::unittest::detail::assertNotOK, EXPR)

/**
 * Asserts that a Status or StatusWith carries the error code CODE.
 */
#define ASSERT_STATUS_CODE(CODE, EXPR) \
    ASSERT_PRED_FORMAT2(::shardplan::unittest::detail::assertStatusCode, CODE, EXPR)

/**
 * Asserts that STATEMENT throws a DBException with code CODE.
 */
#define ASSERT_THROWS_CODE(STATEMENT, EXCEPTION, CODE)                                         \
    do {                                                                                       \
        bool _threw = false;                                                                   \
        try {                                                                                  \
            STATEMENT;                                                                         \
        } catch (const EXCEPTION& ex) {                                                        \
            _threw = true;                                                                     \
            ASSERT_EQ(CODE, ex.code()) << ex.what();                                           \
        }                                                                                      \
        ASSERT_TRUE(_threw) << "Expected " #STATEMENT " to throw " #EXCEPTION " with code " \
                            << ::shardplan::ErrorCodes::errorString(CODE);                     \
    } while (false)
