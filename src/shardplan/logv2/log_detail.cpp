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

#include "shardplan/logv2/log_detail.h"

#include "shardplan/logv2/log_manager.h"

#include <chrono>
#include <ctime>
#include <iterator>

#include <boost/log/sources/logger.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/global_logger_storage.hpp>
#include <fmt/chrono.h>
#include <fmt/format.h>

namespace shardplan::logv2::detail {
namespace {

BOOST_LOG_INLINE_GLOBAL_LOGGER_DEFAULT(GlobalLogger, boost::log::sources::logger_mt)

void appendJsonString(fmt::memory_buffer& out, std::string_view value) {
    out.push_back('"');
    for (char c : value) {
        switch (c) {
            case '"':
                fmt::format_to(std::back_inserter(out), "\\\"");
                break;
            case '\\':
                fmt::format_to(std::back_inserter(out), "\\\\");
                break;
            case '\n':
                fmt::format_to(std::back_inserter(out), "\\n");
                break;
            case '\r':
                fmt::format_to(std::back_inserter(out), "\\r");
                break;
            case '\t':
                fmt::format_to(std::back_inserter(out), "\\t");
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    fmt::format_to(std::back_inserter(out), "\\u{:04x}", static_cast<int>(c));
                } else {
                    out.push_back(c);
                }
        }
    }
    out.push_back('"');
}

std::string currentTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() %
        1000;
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03}Z", fmt::gmtime(seconds), millis);
}

}  // namespace

bool shouldLog(LogComponent, LogSeverity severity) {
    return LogManager::global().shouldLog(severity);
}

std::string encodeJson(std::int32_t id,
                       LogSeverity severity,
                       LogComponent component,
                       std::string_view message,
                       const std::vector<NamedAttribute>& attrs) {
    fmt::memory_buffer out;
    fmt::format_to(std::back_inserter(out), "{{\"t\":{{\"$date\":\"{}\"}},", currentTimestamp());
    fmt::format_to(std::back_inserter(out),
                   "\"s\":\"{}\",\"c\":\"{}\",\"id\":{},\"msg\":",
                   severity.toStringDataCompact(),
                   component.getNameForLog(),
                   id);
    appendJsonString(out, message);

    if (!attrs.empty()) {
        fmt::format_to(std::back_inserter(out), ",\"attr\":{{");
        bool first = true;
        for (const auto& attr : attrs) {
            if (!first)
                out.push_back(',');
            first = false;
            appendJsonString(out, attr.name);
            out.push_back(':');
            if (attr.quoted) {
                appendJsonString(out, attr.value);
            } else {
                out.append(attr.value.data(), attr.value.data() + attr.value.size());
            }
        }
        out.push_back('}');
    }
    out.push_back('}');
    return fmt::to_string(out);
}

void doLogImpl(std::int32_t id,
               LogSeverity severity,
               LogComponent component,
               std::string_view message,
               const std::vector<NamedAttribute>& attrs) {
    auto& logger = GlobalLogger::get();
    BOOST_LOG(logger) << encodeJson(id, severity, component, message, attrs);
}

}  // namespace shardplan::logv2::detail
