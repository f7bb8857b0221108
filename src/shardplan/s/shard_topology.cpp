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

#include "shardplan/s/shard_topology.h"

#include "shardplan/logv2/log.h"
#include "shardplan/s/cluster_control_plane.h"
#include "shardplan/util/str.h"

#include <algorithm>
#include <cctype>
#include <string>
#include <set>

namespace shardplan {
namespace {

bool isDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

std::size_t endOfDigits(const std::string& s, std::size_t pos) {
    while (pos < s.size() && isDigit(s[pos]))
        ++pos;
    return pos;
}

std::size_t skipLeadingZeros(const std::string& s, std::size_t pos, std::size_t end) {
    while (pos + 1 < end && s[pos] == '0')
        ++pos;
    return pos;
}

}  // namespace

bool shardIdLessThan(const ShardId& lhs, const ShardId& rhs) {
    std::size_t i = 0;
    std::size_t j = 0;
    while (i < lhs.size() && j < rhs.size()) {
        if (!isDigit(lhs[i]) || !isDigit(rhs[j])) {
            if (lhs[i] != rhs[j])
                return lhs[i] < rhs[j];
            ++i;
            ++j;
            continue;
        }

        // Digit runs compare by value: the shorter number is smaller once zeros are dropped.
        const auto lhsEnd = endOfDigits(lhs, i);
        const auto rhsEnd = endOfDigits(rhs, j);
        const auto lhsStart = skipLeadingZeros(lhs, i, lhsEnd);
        const auto rhsStart = skipLeadingZeros(rhs, j, rhsEnd);
        const auto lhsLength = lhsEnd - lhsStart;
        const auto rhsLength = rhsEnd - rhsStart;
        if (lhsLength != rhsLength)
            return lhsLength < rhsLength;
        if (int cmp = lhs.compare(lhsStart, lhsLength, rhs, rhsStart, rhsLength); cmp != 0)
            return cmp < 0;
        i = lhsEnd;
        j = rhsEnd;
    }

    if (i == lhs.size() && j == rhs.size())
        return lhs < rhs;
    return i == lhs.size();
}

StatusWith<ShardTopology> ShardTopology::fromShards(std::vector<ShardType> shards) {
    std::set<ShardId> seen;
    for (const auto& shard : shards) {
        if (shard.name.empty()) {
            return Status(ErrorCodes::BadValue,
                          str::stream() << "Shard with host '" << shard.host
                                        << "' has an empty id");
        }
        if (!seen.insert(shard.name).second) {
            return Status(ErrorCodes::DuplicateKey,
                          str::stream() << "Shard id '" << shard.name
                                        << "' is reported more than once");
        }
    }

    std::sort(shards.begin(), shards.end(), [](const ShardType& lhs, const ShardType& rhs) {
        return shardIdLessThan(lhs.name, rhs.name);
    });

    return ShardTopology(std::move(shards));
}

Status ShardTopology::refresh(ClusterControlPlane* controlPlane, Milliseconds timeout) {
    auto swShards = controlPlane->listShards(timeout);
    if (!swShards.isOK()) {
        return swShards.getStatus().withContext("Failed to list the cluster's shards");
    }

    auto swTopology = fromShards(std::move(swShards.getValue()));
    if (!swTopology.isOK()) {
        return swTopology.getStatus().withContext("Cluster reported an invalid shard list");
    }

    *this = std::move(swTopology.getValue());

    LOGV2(9150,
          "Refreshed shard topology",
          "numShards"_attr = _shards.size(),
          "shards"_attr = getShardIds());
    return Status::OK();
}

std::vector<ShardId> ShardTopology::getShardIds() const {
    std::vector<ShardId> ids;
    ids.reserve(_shards.size());
    for (const auto& shard : _shards) {
        ids.push_back(shard.name);
    }
    return ids;
}

boost::optional<ShardType> ShardTopology::findShard(const ShardId& id) const {
    auto it = std::find_if(
        _shards.begin(), _shards.end(), [&](const ShardType& shard) { return shard.name == id; });
    if (it == _shards.end())
        return boost::none;
    return *it;
}

StatusWith<std::vector<ShardType>> ShardTopology::selectShards(std::size_t shardCount) const {
    if (_shards.empty()) {
        return Status(ErrorCodes::EmptyShardSet, "The cluster has no shards to place chunks on");
    }

    if (shardCount == 0) {
        return _shards;
    }

    if (shardCount > _shards.size()) {
        return Status(ErrorCodes::BadValue,
                      str::stream() << "Configured shard count " << shardCount
                                    << " exceeds the " << _shards.size()
                                    << " shards present in the cluster");
    }

    return std::vector<ShardType>(_shards.begin(), _shards.begin() + shardCount);
}

}  // namespace shardplan
