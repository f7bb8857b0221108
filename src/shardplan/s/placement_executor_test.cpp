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

#include "shardplan/s/placement_executor.h"

#include "shardplan/s/chunk_assigner.h"
#include "shardplan/s/in_memory_cluster.h"
#include "shardplan/s/range_splitter.h"
#include "shardplan/unittest/unittest.h"

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace shardplan {
namespace {

/**
 * Forwards to an InMemoryCluster, except that moving the chunk starting at a given bound throws
 * instead of returning an error.
 */
class ThrowingControlPlane final : public ClusterControlPlane {
public:
    ThrowingControlPlane(InMemoryCluster* cluster, ShardKey throwOnMoveFrom)
        : _cluster(cluster), _throwOnMoveFrom(std::move(throwOnMoveFrom)) {}

    StatusWith<std::vector<ShardType>> listShards(Milliseconds timeout) override {
        return _cluster->listShards(timeout);
    }

    StatusWith<std::vector<ChunkType>> listChunks(const NamespaceString& nss,
                                                  Milliseconds timeout) override {
        return _cluster->listChunks(nss, timeout);
    }

    Status splitAt(const NamespaceString& nss,
                   const ShardKey& boundary,
                   Milliseconds timeout) override {
        return _cluster->splitAt(nss, boundary, timeout);
    }

    Status moveRange(const NamespaceString& nss,
                     const KeyRange& range,
                     const ShardId& toShard,
                     Milliseconds timeout) override {
        if (range.getMin() == _throwOnMoveFrom) {
            throw std::runtime_error("migration driver crashed");
        }
        return _cluster->moveRange(nss, range, toShard, timeout);
    }

    Status setBalancerState(bool enabled, Milliseconds timeout) override {
        return _cluster->setBalancerState(enabled, timeout);
    }

    StatusWith<bool> getBalancerState(Milliseconds timeout) override {
        return _cluster->getBalancerState(timeout);
    }

private:
    InMemoryCluster* const _cluster;
    const ShardKey _throwOnMoveFrom;
};

class PlacementExecutorTest : public unittest::Test {
public:
    static std::vector<ShardType> makeShards() {
        std::vector<ShardType> shards;
        for (int i = 1; i <= 3; ++i) {
            auto name = "shard" + std::to_string(i);
            shards.push_back(ShardType{name, name + ".example.net:27018", name + "-rs"});
        }
        return shards;
    }

    static PlacementPlan makePlan(std::int64_t numChunks) {
        auto ranges =
            uassertStatusOK(RangeSplitter::split(KeyDomain::integerRange(0, 99), numChunks));
        ChunkAssigner assigner(std::make_unique<RoundRobinPolicy>());
        return uassertStatusOK(assigner.assign(kNss, ranges, makeShards()));
    }

    static PlacementExecutorParams makeParams(std::int32_t concurrency = 1) {
        PlacementExecutorParams params;
        params.concurrency = concurrency;
        params.retryParameters = kRetryParameters;
        params.operationTimeout = Milliseconds{5000};
        return params;
    }

    /**
     * Asserts that the cluster's chunks are exactly the plan's ranges on the planned shards.
     */
    void assertClusterMatches(const PlacementPlan& plan) {
        auto chunks = uassertStatusOK(cluster.listChunks(kNss, Milliseconds{1000}));
        ASSERT_EQ(plan.size(), chunks.size());
        for (std::size_t i = 0; i < plan.size(); ++i) {
            ASSERT(plan.getEntry(i).range == chunks[i].range) << "entry " << i;
            ASSERT_EQ(plan.getEntry(i).targetShard, chunks[i].shard) << "entry " << i;
        }
    }

    static inline const NamespaceString kNss{"marketplace", "products"};

    static constexpr std::int32_t kMaxRetryAttempts = 4;

    static constexpr DefaultRetryStrategy::RetryParameters kRetryParameters{
        kMaxRetryAttempts, Milliseconds{0}, Milliseconds{0}};

    InMemoryCluster cluster{makeShards()};
};

TEST_F(PlacementExecutorTest, AppliesEveryEntry) {
    auto plan = makePlan(10);
    PlacementExecutor executor(&cluster, makeParams());

    auto summary = executor.execute(plan);
    ASSERT(summary.allApplied());
    ASSERT_EQ(10U, summary.numMoved);
    ASSERT_EQ(0U, summary.numFailed);
    ASSERT_EQ(9U, summary.numSplit);

    for (const auto& record : summary.records) {
        ASSERT_EQ(EntryState::kMoved, record.state);
        ASSERT_OK(record.lastError);
    }

    // The collection starts as one chunk on shard1, so the first entry is already in place. Every
    // later split leaves the new chunk on the previous entry's shard, which it then moves off.
    auto counts = cluster.getCounts();
    ASSERT_EQ(9, counts.splitsApplied);
    ASSERT_EQ(9, counts.movesApplied);
    ASSERT_FALSE(summary.records[0].moveIssued);
    ASSERT(summary.records[1].moveIssued);

    assertClusterMatches(plan);
}

TEST_F(PlacementExecutorTest, ReapplyingIssuesNoOperations) {
    auto plan = makePlan(10);
    PlacementExecutor executor(&cluster, makeParams());
    ASSERT(executor.execute(plan).allApplied());

    cluster.resetCounts();
    auto summary = executor.execute(plan);
    ASSERT(summary.allApplied());
    ASSERT_EQ(0U, summary.numSplit);

    auto counts = cluster.getCounts();
    ASSERT_EQ(0, counts.splitRequests);
    ASSERT_EQ(0, counts.moveRequests);
    assertClusterMatches(plan);
}

TEST_F(PlacementExecutorTest, PartialFailureCarriesOn) {
    auto plan = makePlan(10);
    const auto& failing = plan.getEntry(5);
    ASSERT_NE("shard1", failing.targetShard);
    cluster.failMovesStartingAt(failing.range.getMin(),
                                Status(ErrorCodes::HostUnreachable, "recipient unreachable"));

    PlacementExecutor executor(&cluster, makeParams());
    auto summary = executor.execute(plan);

    ASSERT_FALSE(summary.allApplied());
    ASSERT_EQ(9U, summary.numMoved);
    ASSERT_EQ(1U, summary.numFailed);

    const auto& record = summary.records[5];
    ASSERT_EQ(EntryState::kFailed, record.state);
    ASSERT_STATUS_CODE(ErrorCodes::PlacementFailed, record.lastError);
    ASSERT_NE(std::string::npos, record.lastError.reason().find("recipient unreachable"));

    // One split plus every move attempt.
    ASSERT_EQ(1 + kMaxRetryAttempts + 1, record.attempts);

    for (std::size_t i = 0; i < summary.records.size(); ++i) {
        if (i != 5) {
            ASSERT_EQ(EntryState::kMoved, summary.records[i].state) << "entry " << i;
        }
    }
}

TEST_F(PlacementExecutorTest, ThrowingControlPlaneFailsOnlyThatEntry) {
    auto plan = makePlan(10);
    ThrowingControlPlane controlPlane(&cluster, plan.getEntry(5).range.getMin());

    PlacementExecutor executor(&controlPlane, makeParams(4));
    auto summary = executor.execute(plan);

    ASSERT_EQ(9U, summary.numMoved);
    ASSERT_EQ(1U, summary.numFailed);

    const auto& record = summary.records[5];
    ASSERT_EQ(EntryState::kFailed, record.state);
    ASSERT_STATUS_CODE(ErrorCodes::PlacementFailed, record.lastError);
    ASSERT_NE(std::string::npos, record.lastError.reason().find("migration driver crashed"));
}

TEST_F(PlacementExecutorTest, NonRetriableFailureIsNotRetried) {
    auto plan = makePlan(4);
    cluster.failMovesStartingAt(plan.getEntry(1).range.getMin(),
                                Status(ErrorCodes::IllegalOperation, "chunk is jumbo"));

    PlacementExecutor executor(&cluster, makeParams());
    auto summary = executor.execute(plan);

    ASSERT_EQ(1U, summary.numFailed);
    ASSERT_EQ(2, summary.records[1].attempts);
}

TEST_F(PlacementExecutorTest, TransientFailuresAreRetried) {
    auto plan = makePlan(10);
    cluster.failNextCalls(InMemoryCluster::Operation::kMoveRange,
                          2,
                          Status(ErrorCodes::ConflictingOperationInProgress, "migration active"));
    cluster.failNextCalls(InMemoryCluster::Operation::kSplitAt,
                          1,
                          Status(ErrorCodes::NetworkTimeout, "timed out"));

    PlacementExecutor executor(&cluster, makeParams());
    auto summary = executor.execute(plan);

    ASSERT(summary.allApplied());
    auto counts = cluster.getCounts();
    ASSERT_EQ(11, counts.moveRequests);
    ASSERT_EQ(9, counts.movesApplied);
    ASSERT_EQ(10, counts.splitRequests);
    ASSERT_EQ(9, counts.splitsApplied);
    assertClusterMatches(plan);
}

TEST_F(PlacementExecutorTest, ListChunksFailureFailsTheEntry) {
    auto plan = makePlan(2);
    cluster.failNextCalls(InMemoryCluster::Operation::kListChunks,
                          kMaxRetryAttempts + 1,
                          Status(ErrorCodes::HostUnreachable, "config server down"));

    PlacementExecutor executor(&cluster, makeParams());
    auto summary = executor.execute(plan);

    // Entry 0 cannot look up its owner; entry 1 runs once the injected failures are used up.
    ASSERT_EQ(EntryState::kFailed, summary.records[0].state);
    ASSERT_STATUS_CODE(ErrorCodes::PlacementFailed, summary.records[0].lastError);
    ASSERT_EQ(EntryState::kMoved, summary.records[1].state);
}

TEST_F(PlacementExecutorTest, ConcurrencyIsBounded) {
    auto plan = makePlan(12);
    cluster.setOperationDelay(Milliseconds{20});

    PlacementExecutor executor(&cluster, makeParams(4));
    auto summary = executor.execute(plan);

    ASSERT(summary.allApplied());
    ASSERT_LTE(cluster.getMaxConcurrentOperations(), 4);
    ASSERT_GTE(cluster.getMaxConcurrentOperations(), 2);
    assertClusterMatches(plan);
}

TEST_F(PlacementExecutorTest, SequentialByDefault) {
    auto plan = makePlan(6);
    cluster.setOperationDelay(Milliseconds{1});

    PlacementExecutor executor(&cluster, makeParams());
    ASSERT(executor.execute(plan).allApplied());
    ASSERT_EQ(1, cluster.getMaxConcurrentOperations());
}

TEST_F(PlacementExecutorTest, OperationTimeout) {
    auto plan = makePlan(2);
    cluster.setOperationDelay(Milliseconds{50});

    auto params = makeParams();
    params.operationTimeout = Milliseconds{5};
    params.retryParameters.maxRetryAttempts = 0;
    PlacementExecutor executor(&cluster, params);

    auto summary = executor.execute(plan);
    ASSERT_EQ(2U, summary.numFailed);
    ASSERT_NE(std::string::npos,
              summary.records[1].lastError.reason().find("ExceededTimeLimit"));
}

TEST_F(PlacementExecutorTest, CancelledRunSkipsEntries) {
    auto plan = makePlan(10);
    CancellationSource source;
    source.cancel();

    PlacementExecutor executor(&cluster, makeParams());
    auto summary = executor.execute(plan, source.token());

    ASSERT_EQ(10U, summary.numSkipped);
    ASSERT_EQ(0U, summary.numMoved);
    for (const auto& record : summary.records) {
        ASSERT_EQ(EntryState::kSkipped, record.state);
    }

    auto counts = cluster.getCounts();
    ASSERT_EQ(0, counts.splitRequests);
    ASSERT_EQ(0, counts.moveRequests);

    auto resumed = executor.resume(plan, summary);
    ASSERT(resumed.allApplied());
    assertClusterMatches(plan);
}

TEST_F(PlacementExecutorTest, ResumeSkipsMovedEntries) {
    auto plan = makePlan(10);

    // The first move issued is entry 1's; let it fail without retrying.
    cluster.failNextCalls(InMemoryCluster::Operation::kMoveRange,
                          1,
                          Status(ErrorCodes::IllegalOperation, "chunk is jumbo"));

    PlacementExecutor executor(&cluster, makeParams());
    auto first = executor.execute(plan);
    ASSERT_EQ(1U, first.numFailed);
    ASSERT_EQ(EntryState::kFailed, first.records[1].state);

    cluster.resetCounts();
    auto second = executor.resume(plan, first);

    ASSERT(second.allApplied());
    ASSERT_EQ(0U, second.numSplit);
    ASSERT_EQ(first.records[0].attempts, second.records[0].attempts);

    auto counts = cluster.getCounts();
    ASSERT_EQ(0, counts.splitRequests);
    ASSERT_EQ(1, counts.moveRequests);
    assertClusterMatches(plan);
}

TEST_F(PlacementExecutorTest, UnknownTargetShardFails) {
    auto ranges = uassertStatusOK(RangeSplitter::split(KeyDomain::integerRange(0, 99), 2));
    auto plan = uassertStatusOK(PlacementPlan::make(
        kNss, {PlacementEntry{ranges[0], "shard1"}, PlacementEntry{ranges[1], "shard9"}}));

    PlacementExecutor executor(&cluster, makeParams());
    auto summary = executor.execute(plan);

    ASSERT_EQ(EntryState::kMoved, summary.records[0].state);
    ASSERT_EQ(EntryState::kFailed, summary.records[1].state);
    ASSERT_NE(std::string::npos, summary.records[1].lastError.reason().find("shard9"));
}

TEST_F(PlacementExecutorTest, EntryStateToString) {
    ASSERT_EQ("pending", toString(EntryState::kPending));
    ASSERT_EQ("split-done", toString(EntryState::kSplitDone));
    ASSERT_EQ("moved", toString(EntryState::kMoved));
    ASSERT_EQ("failed", toString(EntryState::kFailed));
    ASSERT_EQ("skipped", toString(EntryState::kSkipped));
}

}  // namespace
}  // namespace shardplan
