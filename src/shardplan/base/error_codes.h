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

#include <iosfwd>
#include <string>

namespace shardplan {

/**
 * Table of error codes and their corresponding error strings.
 *
 *  # Error table
 *  [OK, 0]
 *  [InternalError, 1]
 *  [BadValue, 2]
 *  ...
 *  [VerificationUnavailable, <nnnn>]
 *
 *  # Error classes
 *  [NetworkError, [HostUnreachable, HostNotFound, NetworkTimeout, SocketException]]
 *  [RetriableError, NetworkError + [ExceededTimeLimit, LockBusy,
 *                                   ConflictingOperationInProgress, ShardNotFound]]
 *  [PlanningError, [InvalidDomain, EmptyShardSet]]
 */
class ErrorCodes {
public:
    enum Error {
        OK = 0,
        InternalError = 1,
        BadValue = 2,
        NoSuchKey = 4,
        HostUnreachable = 6,
        HostNotFound = 7,
        UnknownError = 8,
        FailedToParse = 9,
        DuplicateKey = 11000,
        IllegalOperation = 20,
        FileNotOpen = 38,
        LockBusy = 46,
        ExceededTimeLimit = 50,
        NetworkTimeout = 89,
        CallbackCanceled = 90,
        ShutdownInProgress = 91,
        SocketException = 9001,
        ShardNotFound = 70,
        ConflictingOperationInProgress = 117,
        InvalidDomain = 9100,
        EmptyShardSet = 9101,
        PlacementFailed = 9102,
        BalancerStateError = 9103,
        VerificationUnavailable = 9104,
        MaxError
    };

    static std::string errorString(Error err);

    /**
     * Parses an Error from its "name".  Returns UnknownError if "name" is unrecognized.
     *
     * NOTE: Also returns UnknownError for the string "UnknownError".
     */
    static Error fromString(const std::string& name);

    /**
     * Casts an integer "code" to an Error.  Unrecognized codes are preserved, meaning
     * that the result of a call to fromInt() may not be one of the values in the
     * Error enumeration.
     */
    static Error fromInt(int code) {
        return static_cast<Error>(code);
    }

    static bool isNetworkError(Error err);

    /**
     * Errors a cluster metadata operation may succeed on when simply issued again.
     */
    static bool isRetriableError(Error err);

    /**
     * Errors which abort a whole planning run.
     */
    static bool isPlanningError(Error err);
};

std::ostream& operator<<(std::ostream& stream, ErrorCodes::Error code);

}  // namespace shardplan
