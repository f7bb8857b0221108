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

#include "shardplan/logv2/log_attr.h"
#include "shardplan/logv2/log_component.h"
#include "shardplan/logv2/log_severity.h"

#include <cstdint>
#include <string_view>
#include <vector>

namespace shardplan::logv2::detail {

/**
 * Returns true if a message of the given severity would be emitted.
 */
bool shouldLog(LogComponent component, LogSeverity severity);

void doLogImpl(std::int32_t id,
               LogSeverity severity,
               LogComponent component,
               std::string_view message,
               const std::vector<NamedAttribute>& attrs);

template <typename... Attrs>
void doLog(std::int32_t id,
           LogSeverity severity,
           LogComponent component,
           std::string_view message,
           Attrs&&... attrs) {
    doLogImpl(id, severity, component, message, std::vector<NamedAttribute>{attrs...});
}

/**
 * Renders one log line as the JSON document written to the sinks.
 */
std::string encodeJson(std::int32_t id,
                       LogSeverity severity,
                       LogComponent component,
                       std::string_view message,
                       const std::vector<NamedAttribute>& attrs);

}  // namespace shardplan::logv2::detail
