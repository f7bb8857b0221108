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

#include "shardplan/base/error_codes.h"

#include <ostream>

namespace shardplan {

std::string ErrorCodes::errorString(Error err) {
    switch (err) {
        case OK:
            return "OK";
        case InternalError:
            return "InternalError";
        case BadValue:
            return "BadValue";
        case NoSuchKey:
            return "NoSuchKey";
        case HostUnreachable:
            return "HostUnreachable";
        case HostNotFound:
            return "HostNotFound";
        case UnknownError:
            return "UnknownError";
        case FailedToParse:
            return "FailedToParse";
        case DuplicateKey:
            return "DuplicateKey";
        case IllegalOperation:
            return "IllegalOperation";
        case FileNotOpen:
            return "FileNotOpen";
        case LockBusy:
            return "LockBusy";
        case ExceededTimeLimit:
            return "ExceededTimeLimit";
        case NetworkTimeout:
            return "NetworkTimeout";
        case CallbackCanceled:
            return "CallbackCanceled";
        case ShutdownInProgress:
            return "ShutdownInProgress";
        case SocketException:
            return "SocketException";
        case ShardNotFound:
            return "ShardNotFound";
        case ConflictingOperationInProgress:
            return "ConflictingOperationInProgress";
        case InvalidDomain:
            return "InvalidDomain";
        case EmptyShardSet:
            return "EmptyShardSet";
        case PlacementFailed:
            return "PlacementFailed";
        case BalancerStateError:
            return "BalancerStateError";
        case VerificationUnavailable:
            return "VerificationUnavailable";
        default:
            return "Location" + std::to_string(static_cast<int>(err));
    }
}

ErrorCodes::Error ErrorCodes::fromString(const std::string& name) {
    for (int code : {OK,
                     InternalError,
                     BadValue,
                     NoSuchKey,
                     HostUnreachable,
                     HostNotFound,
                     FailedToParse,
                     DuplicateKey,
                     IllegalOperation,
                     FileNotOpen,
                     LockBusy,
                     ExceededTimeLimit,
                     NetworkTimeout,
                     CallbackCanceled,
                     ShutdownInProgress,
                     SocketException,
                     ShardNotFound,
                     ConflictingOperationInProgress,
                     InvalidDomain,
                     EmptyShardSet,
                     PlacementFailed,
                     BalancerStateError,
                     VerificationUnavailable}) {
        if (errorString(fromInt(code)) == name)
            return fromInt(code);
    }
    return UnknownError;
}

bool ErrorCodes::isNetworkError(Error err) {
    switch (err) {
        case HostUnreachable:
        case HostNotFound:
        case NetworkTimeout:
        case SocketException:
            return true;
        default:
            return false;
    }
}

bool ErrorCodes::isRetriableError(Error err) {
    if (isNetworkError(err))
        return true;

    switch (err) {
        case ExceededTimeLimit:
        case LockBusy:
        case ConflictingOperationInProgress:
        case ShardNotFound:
            return true;
        default:
            return false;
    }
}

bool ErrorCodes::isPlanningError(Error err) {
    return err == InvalidDomain || err == EmptyShardSet;
}

std::ostream& operator<<(std::ostream& stream, ErrorCodes::Error code) {
    return stream << ErrorCodes::errorString(code);
}

}  // namespace shardplan
