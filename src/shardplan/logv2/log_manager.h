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

#include "shardplan/base/status.h"
#include "shardplan/logv2/log_severity.h"

#include <atomic>
#include <string>

namespace shardplan::logv2 {

struct LogSettings {
    // Number of 'v's given on the command line; Debug(n) messages are shown for n <= verbosity.
    int verbosity = 0;

    bool logToConsole = true;

    // Appends to this file when not empty.
    std::string logPath;
};

/**
 * Owns the process wide log sinks. Messages are routed through Boost.Log; the severity filter
 * is kept here so that suppressed debug messages are never formatted.
 */
class LogManager {
    LogManager(const LogManager&) = delete;
    LogManager& operator=(const LogManager&) = delete;

public:
    static LogManager& global();

    /**
     * Replaces the currently installed sinks with the ones described by 'settings'.
     */
    Status configure(const LogSettings& settings);

    void setMinimumLoggedSeverity(LogSeverity severity);

    bool shouldLog(LogSeverity severity) const;

private:
    LogManager();

    std::atomic<int> _minimumSeverity;
};

}  // namespace shardplan::logv2
