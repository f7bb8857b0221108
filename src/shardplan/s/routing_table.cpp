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

#include "shardplan/s/routing_table.h"

#include "shardplan/s/placement_plan.h"
#include "shardplan/util/assert_util.h"

#include <algorithm>

namespace shardplan {

StatusWith<RoutingTable> RoutingTable::make(std::vector<ChunkType> chunks) {
    std::sort(chunks.begin(), chunks.end(), [](const ChunkType& lhs, const ChunkType& rhs) {
        return lhs.range.getMin() < rhs.range.getMin();
    });

    std::vector<KeyRange> ranges;
    ranges.reserve(chunks.size());
    for (const auto& chunk : chunks) {
        ranges.push_back(chunk.range);
    }
    if (auto status = validatePartition(ranges); !status.isOK()) {
        return status.withContext("Chunks do not form a valid routing table");
    }

    return RoutingTable(std::move(chunks));
}

RoutingTable RoutingTable::fromPlan(const PlacementPlan& plan) {
    std::vector<ChunkType> chunks;
    chunks.reserve(plan.size());
    for (const auto& entry : plan.getEntries()) {
        chunks.emplace_back(entry.range, entry.targetShard);
    }
    // A plan always partitions the key space.
    return RoutingTable(std::move(chunks));
}

const ChunkType& RoutingTable::findChunk(const ShardKey& key) const {
    // First chunk whose lower bound is greater than 'key', the one before it contains 'key'.
    auto it = std::upper_bound(
        _chunks.begin(), _chunks.end(), key, [](const ShardKey& k, const ChunkType& chunk) {
            return k < chunk.range.getMin();
        });
    invariant(it != _chunks.begin());
    --it;
    invariant(it->range.containsKey(key));
    return *it;
}

std::set<ShardId> RoutingTable::targetShardsForRange(const KeyRange& range) const {
    std::set<ShardId> shards;
    for (const auto& chunk : _chunks) {
        if (chunk.range.overlaps(range))
            shards.insert(chunk.shard);
    }
    return shards;
}

std::set<ShardId> RoutingTable::targetShardsForPrimary(const KeyValue& value) const {
    std::set<ShardId> shards;
    const ShardKey lower(value, MinKey);
    const ShardKey upper(value, MaxKey);
    for (const auto& chunk : _chunks) {
        // Closed interval [lower, upper] against the half-open chunk range.
        if (chunk.range.getMin() <= upper && lower < chunk.range.getMax())
            shards.insert(chunk.shard);
    }
    return shards;
}

std::set<ShardId> RoutingTable::targetShardsForAll() const {
    std::set<ShardId> shards;
    for (const auto& chunk : _chunks) {
        shards.insert(chunk.shard);
    }
    return shards;
}

}  // namespace shardplan
