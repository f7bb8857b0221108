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

#include "shardplan/s/shell_script_writer.h"

#include "shardplan/s/placement_plan.h"

#include <ostream>
#include <sstream>

#include <fmt/format.h>
#include <fmt/ostream.h>

namespace shardplan {
namespace {

std::string quoted(const std::string& s) {
    return KeyValue(s).toString();
}

}  // namespace

void ShellScriptWriter::write(const PlacementPlan& plan, std::ostream& out) const {
    const auto ns = quoted(plan.getNss().ns());
    const auto counts = plan.countsPerShard();

    fmt::print(out,
               "// Placement of {} chunks of {} over {} shards\n",
               plan.size(),
               plan.getNss().ns(),
               counts.size());
    for (const auto& [shard, count] : counts) {
        fmt::print(out, "//   {}: {} chunks\n", shard, count);
    }

    if (_options.suspendBalancer) {
        fmt::print(out, "sh.stopBalancer();\n");
    }

    if (_options.shardCollection) {
        fmt::print(out, "sh.enableSharding({});\n", quoted(plan.getNss().db()));
        fmt::print(out, "sh.shardCollection({}, {});\n", ns, _pattern.toString());
    }

    for (const auto& entry : plan.getEntries()) {
        if (entry.range.getMin().isGlobalMin())
            continue;
        fmt::print(out, "sh.splitAt({}, {});\n", ns, entry.range.getMin().toString(_pattern));
    }

    for (const auto& entry : plan.getEntries()) {
        fmt::print(out,
                   "db.adminCommand({{ moveRange: {}, min: {}, max: {}, toShard: {} }});\n",
                   ns,
                   entry.range.getMin().toString(_pattern),
                   entry.range.getMax().toString(_pattern),
                   quoted(entry.targetShard));
    }

    if (_options.suspendBalancer) {
        fmt::print(out, "sh.startBalancer();\n");
    }
}

std::string ShellScriptWriter::toString(const PlacementPlan& plan) const {
    std::ostringstream ss;
    write(plan, ss);
    return ss.str();
}

}  // namespace shardplan
