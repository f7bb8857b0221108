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

#define SHARDPLAN_LOGV2_DEFAULT_COMPONENT ::shardplan::logv2::LogComponent::kNetwork

#include "shardplan/s/in_memory_cluster.h"

#include "shardplan/logv2/log.h"
#include "shardplan/util/assert_util.h"
#include "shardplan/util/str.h"

#include <algorithm>
#include <iterator>

namespace shardplan {

InMemoryCluster::InMemoryCluster(std::vector<ShardType> shards) : _shards(std::move(shards)) {}

Status InMemoryCluster::_beginOperation(Operation op, Milliseconds timeout) {
    const auto inFlight = ++_inFlight;
    auto maxInFlight = _maxInFlight.load();
    while (inFlight > maxInFlight && !_maxInFlight.compare_exchange_weak(maxInFlight, inFlight)) {
    }

    Milliseconds delay;
    {
        std::lock_guard<std::mutex> lk(_mutex);
        delay = _operationDelay;
    }
    sleepFor(std::min(delay, timeout));
    --_inFlight;

    if (delay > timeout) {
        return Status(ErrorCodes::ExceededTimeLimit,
                      str::stream() << "Operation exceeded its time limit of " << timeout.count()
                                    << "ms");
    }

    std::lock_guard<std::mutex> lk(_mutex);
    auto it = _injectedFailures.find(op);
    if (it != _injectedFailures.end() && it->second.remaining > 0) {
        --it->second.remaining;
        return it->second.status;
    }
    return Status::OK();
}

std::vector<ChunkType>& InMemoryCluster::_getChunks(const NamespaceString& nss) {
    auto it = _chunks.find(nss);
    if (it == _chunks.end()) {
        std::vector<ChunkType> chunks;
        if (!_shards.empty()) {
            chunks.emplace_back(KeyRange::all(), _shards.front().name);
        }
        it = _chunks.emplace(nss, std::move(chunks)).first;
    }
    return it->second;
}

StatusWith<std::vector<ShardType>> InMemoryCluster::listShards(Milliseconds timeout) {
    if (auto status = _beginOperation(Operation::kListShards, timeout); !status.isOK()) {
        return status;
    }

    std::lock_guard<std::mutex> lk(_mutex);
    return _shards;
}

StatusWith<std::vector<ChunkType>> InMemoryCluster::listChunks(const NamespaceString& nss,
                                                               Milliseconds timeout) {
    if (auto status = _beginOperation(Operation::kListChunks, timeout); !status.isOK()) {
        return status;
    }

    std::lock_guard<std::mutex> lk(_mutex);
    return _getChunks(nss);
}

Status InMemoryCluster::splitAt(const NamespaceString& nss,
                                const ShardKey& boundary,
                                Milliseconds timeout) {
    {
        std::lock_guard<std::mutex> lk(_mutex);
        ++_counts.splitRequests;
    }

    if (auto status = _beginOperation(Operation::kSplitAt, timeout); !status.isOK()) {
        return status;
    }

    if (boundary.isGlobalMin() || boundary.isGlobalMax()) {
        return Status(ErrorCodes::BadValue,
                      str::stream() << "Cannot split at the global bound " << boundary);
    }

    std::lock_guard<std::mutex> lk(_mutex);
    auto& chunks = _getChunks(nss);
    auto it = std::find_if(chunks.begin(), chunks.end(), [&](const ChunkType& chunk) {
        return chunk.range.containsKey(boundary);
    });
    if (it == chunks.end()) {
        return Status(ErrorCodes::IllegalOperation,
                      str::stream() << "Collection " << nss << " has no chunks");
    }

    if (it->range.getMin() == boundary) {
        return Status::OK();
    }

    ChunkType upper(KeyRange(boundary, it->range.getMax()), it->shard);
    it->range = KeyRange(it->range.getMin(), boundary);
    chunks.insert(std::next(it), std::move(upper));
    ++_counts.splitsApplied;

    LOGV2_DEBUG(9210, 3, "Split chunk", "namespace"_attr = nss, "splitPoint"_attr = boundary);
    return Status::OK();
}

Status InMemoryCluster::moveRange(const NamespaceString& nss,
                                  const KeyRange& range,
                                  const ShardId& toShard,
                                  Milliseconds timeout) {
    {
        std::lock_guard<std::mutex> lk(_mutex);
        ++_counts.moveRequests;
    }

    if (auto status = _beginOperation(Operation::kMoveRange, timeout); !status.isOK()) {
        return status;
    }

    std::lock_guard<std::mutex> lk(_mutex);
    if (auto failed = _failedMoves.find(range.getMin()); failed != _failedMoves.end()) {
        return failed->second;
    }

    if (std::none_of(_shards.begin(), _shards.end(), [&](const ShardType& shard) {
            return shard.name == toShard;
        })) {
        return Status(ErrorCodes::ShardNotFound,
                      str::stream() << "Shard " << toShard << " not found");
    }

    auto& chunks = _getChunks(nss);
    auto it = std::find_if(chunks.begin(), chunks.end(), [&](const ChunkType& chunk) {
        return chunk.range.getMin() == range.getMin();
    });
    if (it == chunks.end()) {
        return Status(ErrorCodes::IllegalOperation,
                      str::stream() << "No chunk of " << nss << " starts at " << range.getMin());
    }

    if (it->shard == toShard) {
        return Status::OK();
    }

    LOGV2_DEBUG(9211,
                3,
                "Moved chunk",
                "namespace"_attr = nss,
                "range"_attr = it->range,
                "from"_attr = it->shard,
                "to"_attr = toShard);
    it->shard = toShard;
    ++_counts.movesApplied;
    return Status::OK();
}

Status InMemoryCluster::setBalancerState(bool enabled, Milliseconds timeout) {
    {
        std::lock_guard<std::mutex> lk(_mutex);
        ++_counts.balancerStateRequests;
    }

    if (auto status = _beginOperation(Operation::kSetBalancerState, timeout); !status.isOK()) {
        return status;
    }

    std::lock_guard<std::mutex> lk(_mutex);
    if (_balancerEnabled != enabled) {
        _balancerEnabled = enabled;
        ++_counts.balancerStateChanges;
    }
    return Status::OK();
}

StatusWith<bool> InMemoryCluster::getBalancerState(Milliseconds timeout) {
    if (auto status = _beginOperation(Operation::kGetBalancerState, timeout); !status.isOK()) {
        return status;
    }

    std::lock_guard<std::mutex> lk(_mutex);
    return _balancerEnabled;
}

StatusWith<ShardCountMap> InMemoryCluster::perShardCount(const NamespaceString& nss) {
    if (auto status = _beginOperation(Operation::kPerShardCount, Milliseconds::max());
        !status.isOK()) {
        return status;
    }

    std::lock_guard<std::mutex> lk(_mutex);
    if (!_metricsAvailable) {
        return Status(ErrorCodes::HostUnreachable, "Metrics source is not reachable");
    }

    if (auto it = _perShardCountOverrides.find(nss); it != _perShardCountOverrides.end()) {
        return it->second;
    }

    ShardCountMap counts;
    for (const auto& shard : _shards) {
        counts[shard.name] = 0;
    }

    auto docs = _documentCounts.find(nss);
    if (docs == _documentCounts.end()) {
        return counts;
    }

    const auto& chunks = _getChunks(nss);
    for (const auto& [primary, count] : docs->second) {
        const auto key = ShardKey::lowestFor(primary);
        auto chunk = std::find_if(chunks.begin(), chunks.end(), [&](const ChunkType& c) {
            return c.range.containsKey(key);
        });
        if (chunk != chunks.end()) {
            counts[chunk->shard] += count;
        }
    }
    return counts;
}

void InMemoryCluster::setShards(std::vector<ShardType> shards) {
    std::lock_guard<std::mutex> lk(_mutex);
    _shards = std::move(shards);
}

void InMemoryCluster::setDocumentCount(const NamespaceString& nss,
                                       const KeyValue& primary,
                                       std::int64_t count) {
    std::lock_guard<std::mutex> lk(_mutex);
    _documentCounts[nss][primary] = count;
}

void InMemoryCluster::setPerShardCounts(const NamespaceString& nss, ShardCountMap counts) {
    std::lock_guard<std::mutex> lk(_mutex);
    _perShardCountOverrides[nss] = std::move(counts);
}

void InMemoryCluster::setBalancerEnabled_forTest(bool enabled) {
    std::lock_guard<std::mutex> lk(_mutex);
    _balancerEnabled = enabled;
}

void InMemoryCluster::failNextCalls(Operation op, std::int32_t times, Status status) {
    std::lock_guard<std::mutex> lk(_mutex);
    _injectedFailures.insert_or_assign(op, InjectedFailure{times, std::move(status)});
}

void InMemoryCluster::failMovesStartingAt(const ShardKey& lowerBound, Status status) {
    std::lock_guard<std::mutex> lk(_mutex);
    _failedMoves.insert_or_assign(lowerBound, std::move(status));
}

void InMemoryCluster::setMetricsAvailable(bool available) {
    std::lock_guard<std::mutex> lk(_mutex);
    _metricsAvailable = available;
}

void InMemoryCluster::setOperationDelay(Milliseconds delay) {
    std::lock_guard<std::mutex> lk(_mutex);
    _operationDelay = delay;
}

InMemoryCluster::OperationCounts InMemoryCluster::getCounts() const {
    std::lock_guard<std::mutex> lk(_mutex);
    return _counts;
}

void InMemoryCluster::resetCounts() {
    std::lock_guard<std::mutex> lk(_mutex);
    _counts = OperationCounts{};
    _maxInFlight.store(0);
}

}  // namespace shardplan
