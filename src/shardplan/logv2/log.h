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
 * Structured logging.
 *
 * Each translation unit which logs must define the component it logs under before using the
 * macros:
 *
 *     #define SHARDPLAN_LOGV2_DEFAULT_COMPONENT ::shardplan::logv2::LogComponent::kSharding
 *
 * Every log statement carries a unique numeric id, a static message and named attributes:
 *
 *     LOGV2(9201, "Split chunk", "namespace"_attr = nss, "boundary"_attr = key);
 */

#pragma once

#include "shardplan/logv2/log_attr.h"
#include "shardplan/logv2/log_component.h"
#include "shardplan/logv2/log_detail.h"
#include "shardplan/logv2/log_severity.h"

namespace shardplan {
using namespace logv2::literals;
}  // namespace shardplan

#define LOGV2_IMPL(ID, SEVERITY, COMPONENT, MESSAGE, ...)                                 \
    do {                                                                                  \
        const auto _logv2Severity = (SEVERITY);                                           \
        if (::shardplan::logv2::detail::shouldLog((COMPONENT), _logv2Severity)) {         \
            ::shardplan::logv2::detail::doLog(                                            \
                ID, _logv2Severity, (COMPONENT), MESSAGE __VA_OPT__(, ) __VA_ARGS__);     \
        }                                                                                 \
    } while (false)

#define LOGV2(ID, MESSAGE, ...)                                      \
    LOGV2_IMPL(ID,                                                   \
               ::shardplan::logv2::LogSeverity::Info(),              \
               SHARDPLAN_LOGV2_DEFAULT_COMPONENT,                    \
               MESSAGE __VA_OPT__(, ) __VA_ARGS__)

#define LOGV2_OPTIONS(ID, COMPONENT, MESSAGE, ...) \
    LOGV2_IMPL(                                    \
        ID, ::shardplan::logv2::LogSeverity::Info(), COMPONENT, MESSAGE __VA_OPT__(, ) __VA_ARGS__)

#define LOGV2_WARNING(ID, MESSAGE, ...)                              \
    LOGV2_IMPL(ID,                                                   \
               ::shardplan::logv2::LogSeverity::Warning(),           \
               SHARDPLAN_LOGV2_DEFAULT_COMPONENT,                    \
               MESSAGE __VA_OPT__(, ) __VA_ARGS__)

#define LOGV2_ERROR(ID, MESSAGE, ...)                                \
    LOGV2_IMPL(ID,                                                   \
               ::shardplan::logv2::LogSeverity::Error(),             \
               SHARDPLAN_LOGV2_DEFAULT_COMPONENT,                    \
               MESSAGE __VA_OPT__(, ) __VA_ARGS__)

#define LOGV2_FATAL_CONTINUE(ID, MESSAGE, ...)                       \
    LOGV2_IMPL(ID,                                                   \
               ::shardplan::logv2::LogSeverity::Severe(),            \
               SHARDPLAN_LOGV2_DEFAULT_COMPONENT,                    \
               MESSAGE __VA_OPT__(, ) __VA_ARGS__)

#define LOGV2_DEBUG(ID, DLEVEL, MESSAGE, ...)                        \
    LOGV2_IMPL(ID,                                                   \
               ::shardplan::logv2::LogSeverity::Debug(DLEVEL),       \
               SHARDPLAN_LOGV2_DEFAULT_COMPONENT,                    \
               MESSAGE __VA_OPT__(, ) __VA_ARGS__)
