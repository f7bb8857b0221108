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

#include "shardplan/logv2/log_manager.h"

#include "shardplan/util/str.h"

#include <exception>
#include <iostream>

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>

namespace shardplan::logv2 {

namespace keywords = boost::log::keywords;
namespace expr = boost::log::expressions;

LogManager::LogManager() : _minimumSeverity(LogSeverity::Info().toInt()) {}

LogManager& LogManager::global() {
    static LogManager manager;
    return manager;
}

Status LogManager::configure(const LogSettings& settings) {
    if (settings.verbosity < 0) {
        return Status(ErrorCodes::BadValue, "verbosity cannot be negative");
    }

    auto core = boost::log::core::get();
    core->remove_all_sinks();

    try {
        if (settings.logToConsole) {
            boost::log::add_console_log(std::clog,
                                        keywords::format = expr::stream << expr::smessage,
                                        keywords::auto_flush = true);
        }
        if (!settings.logPath.empty()) {
            boost::log::add_file_log(keywords::file_name = settings.logPath,
                                     keywords::open_mode = std::ios_base::out | std::ios_base::app,
                                     keywords::format = expr::stream << expr::smessage,
                                     keywords::auto_flush = true);
        }
    } catch (const std::exception& ex) {
        return Status(ErrorCodes::BadValue,
                      str::stream() << "Unable to open log sink '" << settings.logPath
                                    << "': " << ex.what());
    }

    setMinimumLoggedSeverity(LogSeverity::Debug(settings.verbosity));
    return Status::OK();
}

void LogManager::setMinimumLoggedSeverity(LogSeverity severity) {
    _minimumSeverity.store(severity.toInt());
}

bool LogManager::shouldLog(LogSeverity severity) const {
    return severity.toInt() <= _minimumSeverity.load();
}

}  // namespace shardplan::logv2
