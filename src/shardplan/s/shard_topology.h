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
#include "shardplan/base/status_with.h"
#include "shardplan/s/catalog/type_shard.h"
#include "shardplan/util/duration.h"

#include <cstddef>
#include <utility>
#include <vector>

#include <boost/optional.hpp>

namespace shardplan {

class ClusterControlPlane;

/**
 * Orders shard ids the way an operator numbers them: runs of digits compare by their value, so
 * "shard2" sorts before "shard10".
 */
bool shardIdLessThan(const ShardId& lhs, const ShardId& rhs);

/**
 * Snapshot of the cluster's shard membership, the single source of truth about shards during a
 * planning run. Shards are kept ordered by shardIdLessThan() so that planning does not depend on the order in
 * which the control plane lists them.
 *
 * Only refresh() changes the snapshot; planners and executors hold it by const reference.
 */
class ShardTopology {
public:
    ShardTopology() = default;

    /**
     * Builds a topology from an explicit shard list. Fails with DuplicateKey if two shards share
     * an id and with BadValue if an id is empty.
     */
    static StatusWith<ShardTopology> fromShards(std::vector<ShardType> shards);

    /**
     * Replaces the snapshot with the control plane's current shard list. On error the previous
     * snapshot is kept.
     */
    Status refresh(ClusterControlPlane* controlPlane, Milliseconds timeout);

    const std::vector<ShardType>& getShards() const {
        return _shards;
    }

    std::vector<ShardId> getShardIds() const;

    boost::optional<ShardType> findShard(const ShardId& id) const;

    bool contains(const ShardId& id) const {
        return findShard(id).has_value();
    }

    std::size_t size() const {
        return _shards.size();
    }

    bool empty() const {
        return _shards.empty();
    }

    /**
     * Returns the first 'shardCount' shards in shardIdLessThan() order, or all of them when 'shardCount' is 0.
     * Fails with EmptyShardSet if the topology has no shards and with BadValue if fewer than
     * 'shardCount' shards are present.
     */
    StatusWith<std::vector<ShardType>> selectShards(std::size_t shardCount) const;

private:
    explicit ShardTopology(std::vector<ShardType> shards) : _shards(std::move(shards)) {}

    std::vector<ShardType> _shards;
};

}  // namespace shardplan
