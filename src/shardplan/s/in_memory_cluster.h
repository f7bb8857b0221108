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
#include "shardplan/s/catalog/type_chunk.h"
#include "shardplan/s/catalog/type_shard.h"
#include "shardplan/s/cluster_control_plane.h"
#include "shardplan/s/metrics_source.h"
#include "shardplan/s/shard_key.h"

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace shardplan {

/**
 * A cluster which lives entirely in memory: a chunk map per collection, a balancer flag and
 * per-key document counts. Used for dry runs and as the collaborator of unit tests, for which it
 * counts every operation and can inject failures.
 *
 * A collection springs into existence on first use as a single chunk [globalMin, globalMax)
 * owned by the first shard.
 */
class InMemoryCluster final : public ClusterControlPlane, public MetricsSource {
public:
    enum class Operation {
        kListShards,
        kListChunks,
        kSplitAt,
        kMoveRange,
        kSetBalancerState,
        kGetBalancerState,
        kPerShardCount,
    };

    struct OperationCounts {
        // Requests received, failed ones included.
        std::int64_t splitRequests = 0;
        std::int64_t moveRequests = 0;
        std::int64_t balancerStateRequests = 0;

        // Requests which changed the cluster's metadata.
        std::int64_t splitsApplied = 0;
        std::int64_t movesApplied = 0;
        std::int64_t balancerStateChanges = 0;
    };

    explicit InMemoryCluster(std::vector<ShardType> shards);

    StatusWith<std::vector<ShardType>> listShards(Milliseconds timeout) override;

    StatusWith<std::vector<ChunkType>> listChunks(const NamespaceString& nss,
                                                  Milliseconds timeout) override;

    Status splitAt(const NamespaceString& nss,
                   const ShardKey& boundary,
                   Milliseconds timeout) override;

    Status moveRange(const NamespaceString& nss,
                     const KeyRange& range,
                     const ShardId& toShard,
                     Milliseconds timeout) override;

    Status setBalancerState(bool enabled, Milliseconds timeout) override;

    StatusWith<bool> getBalancerState(Milliseconds timeout) override;

    /**
     * Sums the registered document counts by the shard owning each primary value. Counts set
     * with setPerShardCounts() take precedence.
     */
    StatusWith<ShardCountMap> perShardCount(const NamespaceString& nss) override;

    void setShards(std::vector<ShardType> shards);

    /**
     * Registers 'count' documents whose primary key field equals 'primary'.
     */
    void setDocumentCount(const NamespaceString& nss, const KeyValue& primary, std::int64_t count);

    void setPerShardCounts(const NamespaceString& nss, ShardCountMap counts);

    void setBalancerEnabled_forTest(bool enabled);

    /**
     * Makes the next 'times' calls of 'op' fail with 'status'.
     */
    void failNextCalls(Operation op, std::int32_t times, Status status);

    /**
     * Makes every move of the chunk starting at 'lowerBound' fail with 'status'.
     */
    void failMovesStartingAt(const ShardKey& lowerBound, Status status);

    /**
     * Makes perShardCount() fail with HostUnreachable while 'available' is false.
     */
    void setMetricsAvailable(bool available);

    /**
     * Every control plane call takes 'delay'. Calls whose timeout is shorter fail with
     * ExceededTimeLimit once the timeout elapses.
     */
    void setOperationDelay(Milliseconds delay);

    OperationCounts getCounts() const;

    /**
     * Largest number of control plane calls observed running at the same time.
     */
    std::int32_t getMaxConcurrentOperations() const {
        return _maxInFlight.load();
    }

    void resetCounts();

private:
    /**
     * Accounts for a call of 'op': simulates its latency and consumes an injected failure.
     */
    Status _beginOperation(Operation op, Milliseconds timeout);

    // Requires _mutex.
    std::vector<ChunkType>& _getChunks(const NamespaceString& nss);

    mutable std::mutex _mutex;

    std::vector<ShardType> _shards;
    std::map<NamespaceString, std::vector<ChunkType>> _chunks;
    std::map<NamespaceString, std::map<KeyValue, std::int64_t>> _documentCounts;
    std::map<NamespaceString, ShardCountMap> _perShardCountOverrides;
    bool _balancerEnabled = true;

    struct InjectedFailure {
        std::int32_t remaining;
        Status status;
    };
    std::map<Operation, InjectedFailure> _injectedFailures;
    std::map<ShardKey, Status> _failedMoves;
    bool _metricsAvailable = true;
    Milliseconds _operationDelay{0};

    OperationCounts _counts;

    std::atomic<std::int32_t> _inFlight{0};
    std::atomic<std::int32_t> _maxInFlight{0};
};

}  // namespace shardplan
