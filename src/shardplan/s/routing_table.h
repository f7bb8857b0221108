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

#include "shardplan/base/status_with.h"
#include "shardplan/s/catalog/type_chunk.h"
#include "shardplan/s/catalog/type_shard.h"
#include "shardplan/s/key_range.h"
#include "shardplan/s/shard_key.h"

#include <set>
#include <utility>
#include <vector>

namespace shardplan {

class PlacementPlan;

/**
 * Chunk map of a collection used to target queries: which shards a query on the shard key has to
 * visit. Chunks are kept sorted by lower bound and partition the whole key space.
 */
class RoutingTable {
public:
    /**
     * Builds the table from chunks in any order. Fails with BadValue if the chunks do not
     * partition the key space.
     */
    static StatusWith<RoutingTable> make(std::vector<ChunkType> chunks);

    /**
     * The chunk map the cluster ends up with once 'plan' is fully applied.
     */
    static RoutingTable fromPlan(const PlacementPlan& plan);

    const std::vector<ChunkType>& getChunks() const {
        return _chunks;
    }

    /**
     * The chunk containing 'key'.
     */
    const ChunkType& findChunk(const ShardKey& key) const;

    const ShardId& shardForKey(const ShardKey& key) const {
        return findChunk(key).shard;
    }

    /**
     * Shards owning at least one chunk intersecting 'range'.
     */
    std::set<ShardId> targetShardsForRange(const KeyRange& range) const;

    /**
     * Shards a query with an equality predicate on the primary field must visit, i.e. those
     * intersecting [{ value, MinKey }, { value, MaxKey }].
     */
    std::set<ShardId> targetShardsForPrimary(const KeyValue& value) const;

    /**
     * Shards a query without a shard key predicate must visit (scatter-gather).
     */
    std::set<ShardId> targetShardsForAll() const;

private:
    explicit RoutingTable(std::vector<ChunkType> chunks) : _chunks(std::move(chunks)) {}

    std::vector<ChunkType> _chunks;
};

}  // namespace shardplan
