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

#include "shardplan/s/placement_plan.h"

#include "shardplan/util/str.h"

namespace shardplan {

StatusWith<PlacementPlan> PlacementPlan::make(NamespaceString nss,
                                              std::vector<PlacementEntry> entries) {
    if (nss.isEmpty()) {
        return Status(ErrorCodes::BadValue, "A placement plan needs a target namespace");
    }

    std::vector<KeyRange> ranges;
    ranges.reserve(entries.size());
    for (std::size_t i = 0; i < entries.size(); ++i) {
        if (entries[i].targetShard.empty()) {
            return Status(ErrorCodes::BadValue,
                          str::stream() << "Placement entry " << i << " for range "
                                        << entries[i].range.toString() << " has no target shard");
        }
        ranges.push_back(entries[i].range);
    }

    if (auto status = validatePartition(ranges); !status.isOK()) {
        return status.withContext(str::stream()
                                  << "Invalid placement plan for " << nss.toString());
    }

    return PlacementPlan(std::move(nss), std::move(entries));
}

std::map<ShardId, std::size_t> PlacementPlan::countsPerShard() const {
    std::map<ShardId, std::size_t> counts;
    for (const auto& entry : _entries) {
        ++counts[entry.targetShard];
    }
    return counts;
}

std::vector<std::size_t> PlacementPlan::entriesForShard(const ShardId& shard) const {
    std::vector<std::size_t> indexes;
    for (std::size_t i = 0; i < _entries.size(); ++i) {
        if (_entries[i].targetShard == shard)
            indexes.push_back(i);
    }
    return indexes;
}

}  // namespace shardplan
