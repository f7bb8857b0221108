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
#include "shardplan/db/namespace_string.h"
#include "shardplan/s/catalog/type_shard.h"
#include "shardplan/s/key_range.h"
#include "shardplan/s/placement_plan.h"

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace shardplan {

/**
 * Interface for the policies which decide the shard each range of an initial split goes to.
 * Policies are pure: the same ranges and shards always produce the same choice.
 */
class AssignmentPolicy {
public:
    virtual ~AssignmentPolicy() = default;

    virtual std::string name() const = 0;

    /**
     * Returns, for each range, the index into 'shards' of the shard it should be placed on.
     * 'shards' is never empty.
     */
    virtual StatusWith<std::vector<std::size_t>> chooseShards(
        const std::vector<KeyRange>& ranges, const std::vector<ShardType>& shards) const = 0;
};

/**
 * Range i goes to shard i mod S. Every shard receives floor(K/S) or ceil(K/S) ranges.
 */
class RoundRobinPolicy final : public AssignmentPolicy {
public:
    std::string name() const override {
        return "roundRobin";
    }

    StatusWith<std::vector<std::size_t>> chooseShards(
        const std::vector<KeyRange>& ranges, const std::vector<ShardType>& shards) const override;
};

/**
 * Distributes ranges in proportion to per-shard capacity weights using smooth weighted
 * round-robin, so that each shard's count is within one of K * w / sum(w) and consecutive ranges
 * are interleaved across shards. Shards without a configured weight have weight 1.
 */
class WeightedPolicy final : public AssignmentPolicy {
public:
    using WeightMap = std::map<ShardId, double>;

    explicit WeightedPolicy(WeightMap weights) : _weights(std::move(weights)) {}

    std::string name() const override {
        return "weighted";
    }

    /**
     * Fails with BadValue if a weight is not positive or names a shard not in 'shards'.
     */
    StatusWith<std::vector<std::size_t>> chooseShards(
        const std::vector<KeyRange>& ranges, const std::vector<ShardType>& shards) const override;

private:
    WeightMap _weights;
};

/**
 * Delegates the choice to a caller supplied function.
 */
class CallbackAssignmentPolicy final : public AssignmentPolicy {
public:
    using ChooseFn = std::function<std::size_t(
        std::size_t rangeIndex, const KeyRange& range, const std::vector<ShardType>& shards)>;

    CallbackAssignmentPolicy(std::string name, ChooseFn chooseFn)
        : _name(std::move(name)), _chooseFn(std::move(chooseFn)) {}

    std::string name() const override {
        return _name;
    }

    /**
     * Fails with BadValue if the function returns an index outside of 'shards'.
     */
    StatusWith<std::vector<std::size_t>> chooseShards(
        const std::vector<KeyRange>& ranges, const std::vector<ShardType>& shards) const override;

private:
    std::string _name;
    ChooseFn _chooseFn;
};

/**
 * Turns the ranges of an initial split into a placement plan using a pluggable policy.
 */
class ChunkAssigner {
public:
    explicit ChunkAssigner(std::unique_ptr<AssignmentPolicy> policy);

    const AssignmentPolicy& getPolicy() const {
        return *_policy;
    }

    /**
     * Fails with EmptyShardSet if 'shards' is empty, or with the policy's error. The returned
     * plan holds every range exactly once, in the order given.
     */
    StatusWith<PlacementPlan> assign(const NamespaceString& nss,
                                     const std::vector<KeyRange>& ranges,
                                     const std::vector<ShardType>& shards) const;

private:
    std::unique_ptr<AssignmentPolicy> _policy;
};

}  // namespace shardplan
