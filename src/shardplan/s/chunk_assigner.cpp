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

#define SHARDPLAN_LOGV2_DEFAULT_COMPONENT ::shardplan::logv2::LogComponent::kSharding

#include "shardplan/s/chunk_assigner.h"

#include "shardplan/logv2/log.h"
#include "shardplan/util/assert_util.h"
#include "shardplan/util/str.h"

#include <algorithm>

namespace shardplan {

StatusWith<std::vector<std::size_t>> RoundRobinPolicy::chooseShards(
    const std::vector<KeyRange>& ranges, const std::vector<ShardType>& shards) const {
    std::vector<std::size_t> choices;
    choices.reserve(ranges.size());
    for (std::size_t i = 0; i < ranges.size(); ++i) {
        choices.push_back(i % shards.size());
    }
    return choices;
}

StatusWith<std::vector<std::size_t>> WeightedPolicy::chooseShards(
    const std::vector<KeyRange>& ranges, const std::vector<ShardType>& shards) const {
    std::vector<double> weights(shards.size(), 1.0);
    for (const auto& [shardId, weight] : _weights) {
        auto it = std::find_if(shards.begin(), shards.end(), [&](const ShardType& shard) {
            return shard.name == shardId;
        });
        if (it == shards.end()) {
            return Status(ErrorCodes::BadValue,
                          str::stream() << "Weight given for shard '" << shardId
                                        << "' which is not part of the placement");
        }
        if (!(weight > 0)) {
            return Status(ErrorCodes::BadValue,
                          str::stream() << "Weight of shard '" << shardId
                                        << "' must be positive, got " << weight);
        }
        weights[it - shards.begin()] = weight;
    }

    double totalWeight = 0;
    for (auto weight : weights) {
        totalWeight += weight;
    }

    // Each round every shard gains its weight, the shard with the highest running credit wins the
    // range and pays back the total. Ties go to the lowest index.
    std::vector<double> credit(shards.size(), 0.0);
    std::vector<std::size_t> choices;
    choices.reserve(ranges.size());
    for (std::size_t i = 0; i < ranges.size(); ++i) {
        std::size_t best = 0;
        for (std::size_t s = 0; s < shards.size(); ++s) {
            credit[s] += weights[s];
            if (credit[s] > credit[best])
                best = s;
        }
        credit[best] -= totalWeight;
        choices.push_back(best);
    }
    return choices;
}

StatusWith<std::vector<std::size_t>> CallbackAssignmentPolicy::chooseShards(
    const std::vector<KeyRange>& ranges, const std::vector<ShardType>& shards) const {
    std::vector<std::size_t> choices;
    choices.reserve(ranges.size());
    for (std::size_t i = 0; i < ranges.size(); ++i) {
        auto choice = _chooseFn(i, ranges[i], shards);
        if (choice >= shards.size()) {
            return Status(ErrorCodes::BadValue,
                          str::stream() << "Assignment policy '" << _name << "' chose shard index "
                                        << choice << " for range " << i << " but only "
                                        << shards.size() << " shards are available");
        }
        choices.push_back(choice);
    }
    return choices;
}

ChunkAssigner::ChunkAssigner(std::unique_ptr<AssignmentPolicy> policy)
    : _policy(std::move(policy)) {
    invariant(_policy);
}

StatusWith<PlacementPlan> ChunkAssigner::assign(const NamespaceString& nss,
                                                const std::vector<KeyRange>& ranges,
                                                const std::vector<ShardType>& shards) const {
    if (shards.empty()) {
        return Status(ErrorCodes::EmptyShardSet,
                      str::stream() << "No shards available to place the chunks of "
                                    << nss.toString());
    }

    auto swChoices = _policy->chooseShards(ranges, shards);
    if (!swChoices.isOK()) {
        return swChoices.getStatus().withContext(str::stream()
                                                 << "Assignment policy '" << _policy->name()
                                                 << "' failed");
    }

    const auto& choices = swChoices.getValue();
    invariant(choices.size() == ranges.size());

    std::vector<PlacementEntry> entries;
    entries.reserve(ranges.size());
    for (std::size_t i = 0; i < ranges.size(); ++i) {
        entries.push_back(PlacementEntry{ranges[i], shards[choices[i]].name});
    }

    auto swPlan = PlacementPlan::make(nss, std::move(entries));
    if (!swPlan.isOK()) {
        return swPlan.getStatus();
    }

    LOGV2(9170,
          "Assigned chunks to shards",
          "namespace"_attr = nss.toString(),
          "policy"_attr = _policy->name(),
          "numChunks"_attr = ranges.size(),
          "countsPerShard"_attr = swPlan.getValue().countsPerShard());

    return swPlan;
}

}  // namespace shardplan
