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

#include "shardplan/base/status.h"
#include "shardplan/base/status_with.h"

#include "shardplan/unittest/unittest.h"
#include "shardplan/util/assert_util.h"

#include <string>
#include <vector>

namespace shardplan {
namespace {

TEST(StatusTest, OKHasNoReason) {
    auto status = Status::OK();
    ASSERT_TRUE(status.isOK());
    ASSERT_EQ(ErrorCodes::OK, status.code());
    ASSERT_EQ("", status.reason());
    ASSERT_EQ("OK", status.toString());
}

TEST(StatusTest, CodeAndReason) {
    Status status(ErrorCodes::InvalidDomain, "no values");
    ASSERT_FALSE(status.isOK());
    ASSERT_EQ(ErrorCodes::InvalidDomain, status.code());
    ASSERT_EQ("no values", status.reason());
    ASSERT_EQ("InvalidDomain: no values", status.toString());
}

TEST(StatusTest, WithContextChainsReasons) {
    Status status(ErrorCodes::HostUnreachable, "connection refused");
    auto withContext = status.withContext("Failed to list shards");
    ASSERT_EQ(ErrorCodes::HostUnreachable, withContext.code());
    ASSERT_EQ("Failed to list shards :: caused by :: connection refused", withContext.reason());

    // The original is untouched.
    ASSERT_EQ("connection refused", status.reason());
}

TEST(StatusTest, WithContextOnOKIsNoop) {
    ASSERT_OK(Status::OK().withContext("ignored"));
}

TEST(StatusTest, ComparesByCodeOnly) {
    ASSERT_EQ(Status(ErrorCodes::BadValue, "a"), Status(ErrorCodes::BadValue, "b"));
    ASSERT_NE(Status(ErrorCodes::BadValue, "a"), Status(ErrorCodes::FailedToParse, "a"));
    ASSERT_TRUE(Status(ErrorCodes::BadValue, "a") == ErrorCodes::BadValue);
}

TEST(StatusTest, CopiesShareTheError) {
    Status original(ErrorCodes::PlacementFailed, "move failed");
    Status copy = original;
    ASSERT_EQ(original.code(), copy.code());
    ASSERT_EQ(&original.reason(), &copy.reason());
}

TEST(ErrorCodesTest, RetriableCategories) {
    ASSERT_TRUE(ErrorCodes::isNetworkError(ErrorCodes::HostUnreachable));
    ASSERT_TRUE(ErrorCodes::isRetriableError(ErrorCodes::NetworkTimeout));
    ASSERT_TRUE(ErrorCodes::isRetriableError(ErrorCodes::ExceededTimeLimit));
    ASSERT_TRUE(ErrorCodes::isRetriableError(ErrorCodes::ConflictingOperationInProgress));
    ASSERT_FALSE(ErrorCodes::isRetriableError(ErrorCodes::BadValue));
    ASSERT_FALSE(ErrorCodes::isRetriableError(ErrorCodes::IllegalOperation));
    ASSERT_TRUE(ErrorCodes::isPlanningError(ErrorCodes::EmptyShardSet));
}

TEST(ErrorCodesTest, FromStringRoundTrips) {
    ASSERT_EQ(ErrorCodes::BalancerStateError, ErrorCodes::fromString("BalancerStateError"));
    ASSERT_EQ(ErrorCodes::UnknownError, ErrorCodes::fromString("NotACode"));
    ASSERT_EQ("Location12345", ErrorCodes::errorString(ErrorCodes::fromInt(12345)));
}

TEST(StatusWithTest, HoldsValue) {
    StatusWith<std::vector<int>> sw(std::vector<int>{1, 2, 3});
    ASSERT_OK(sw);
    ASSERT_EQ(3U, sw.getValue().size());
}

TEST(StatusWithTest, HoldsError) {
    StatusWith<int> sw(ErrorCodes::BadValue, "negative");
    ASSERT_NOT_OK(sw);
    ASSERT_STATUS_CODE(ErrorCodes::BadValue, sw);
    ASSERT_EQ("negative", sw.getStatus().reason());
}

TEST(StatusWithTest, ConvertsCompatibleValues) {
    StatusWith<std::string> sw("literal");
    ASSERT_OK(sw);
    ASSERT_EQ("literal", sw.getValue());
}

TEST(AssertUtilTest, UassertStatusOKThrowsWithCode) {
    ASSERT_THROWS_CODE(uassertStatusOK(Status(ErrorCodes::EmptyShardSet, "none")),
                       DBException,
                       ErrorCodes::EmptyShardSet);
}

TEST(AssertUtilTest, UassertStatusOKReturnsValue) {
    ASSERT_EQ(42, uassertStatusOK(StatusWith<int>(42)));
}

TEST(AssertUtilTest, ExceptionToStatus) {
    auto status = [] {
        try {
            uasserted(ErrorCodes::InvalidDomain, "bad domain");
        } catch (...) {
            return exceptionToStatus();
        }
    }();
    ASSERT_STATUS_CODE(ErrorCodes::InvalidDomain, status);
    ASSERT_EQ("bad domain", status.reason());
}

}  // namespace
}  // namespace shardplan
