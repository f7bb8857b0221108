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

#include "shardplan/s/planning_run.h"

#include "shardplan/s/in_memory_cluster.h"
#include "shardplan/s/metrics_source.h"
#include "shardplan/unittest/unittest.h"

#include <cstdint>
#include <string>
#include <vector>

namespace shardplan {
namespace {

/**
 * Answers the first count query from the cluster and fails every later one.
 */
class OneShotMetricsSource final : public MetricsSource {
public:
    explicit OneShotMetricsSource(MetricsSource* source) : _source(source) {}

    StatusWith<ShardCountMap> perShardCount(const NamespaceString& nss) override {
        if (_calls++ > 0) {
            return Status(ErrorCodes::HostUnreachable, "metrics source went away");
        }
        return _source->perShardCount(nss);
    }

    int calls() const {
        return _calls;
    }

private:
    MetricsSource* const _source;
    int _calls = 0;
};

class PlanningRunTest : public unittest::Test {
public:
    static std::vector<ShardType> makeShards(int count) {
        std::vector<ShardType> shards;
        for (int i = 1; i <= count; ++i) {
            auto name = "shard" + std::to_string(i);
            shards.push_back(ShardType{name, name + ".example.net:27018", name + "-rs"});
        }
        return shards;
    }

    static PlannerParams makeParams() {
        PlannerParams params;
        params.retryMaxAttempts = 3;
        params.retryBaseBackoff = Milliseconds{0};
        params.retryMaxBackoff = Milliseconds{0};
        params.operationTimeout = Milliseconds{5000};
        params.verifyPollInterval = Milliseconds{0};
        params.verifyMaxPolls = 1;
        return params;
    }

    /**
     * The same number of products in each of the 100 categories.
     */
    void loadCatalog(std::int64_t productsPerCategory) {
        for (std::int64_t category = 0; category < 100; ++category) {
            cluster.setDocumentCount(kNss, category, productsPerCategory);
        }
    }

    bool balancerEnabled() {
        return uassertStatusOK(cluster.getBalancerState(Milliseconds{1000}));
    }

    static inline const NamespaceString kNss{"marketplace", "products"};

    InMemoryCluster cluster{makeShards(3)};
};

TEST_F(PlanningRunTest, EndToEnd) {
    loadCatalog(10);

    PlanningRun run(makeParams(), &cluster, &cluster);
    auto swSummary = run.run();
    ASSERT_OK(swSummary);

    const auto& summary = swSummary.getValue();
    ASSERT_EQ(100U, summary.plan.size());
    ASSERT(summary.execution.allApplied());
    ASSERT_OK(summary.verification);
    ASSERT(summary.isBalanced());
    ASSERT(summary.report);
    ASSERT_EQ(1000, summary.report->total);
    ASSERT_NEAR(0.01, summary.report->skew, 1e-9);

    ASSERT_EQ(3U, run.getTopology().size());
    ASSERT(balancerEnabled());

    auto counts = cluster.getCounts();
    ASSERT_EQ(99, counts.splitsApplied);
    ASSERT_EQ(2, counts.balancerStateChanges);
}

TEST_F(PlanningRunTest, RerunIsANoop) {
    loadCatalog(10);
    ASSERT_OK(PlanningRun(makeParams(), &cluster, &cluster).run());

    cluster.resetCounts();
    auto swSummary = PlanningRun(makeParams(), &cluster, &cluster).run();
    ASSERT_OK(swSummary);
    ASSERT(swSummary.getValue().execution.allApplied());

    auto counts = cluster.getCounts();
    ASSERT_EQ(0, counts.splitRequests);
    ASSERT_EQ(0, counts.moveRequests);
}

TEST_F(PlanningRunTest, MakePlanDoesNotTouchTheCluster) {
    PlanningRun run(makeParams(), &cluster, &cluster);
    auto swPlan = run.makePlan();
    ASSERT_OK(swPlan);
    ASSERT_EQ(34U, swPlan.getValue().countsPerShard().at("shard1"));

    auto counts = cluster.getCounts();
    ASSERT_EQ(0, counts.splitRequests);
    ASSERT_EQ(0, counts.moveRequests);
    ASSERT_EQ(0, counts.balancerStateRequests);
}

TEST_F(PlanningRunTest, ShardCountLimitsTargets) {
    auto params = makeParams();
    params.shardCount = 2;

    auto swPlan = PlanningRun(params, &cluster, &cluster).makePlan();
    ASSERT_OK(swPlan);
    auto counts = swPlan.getValue().countsPerShard();
    ASSERT_EQ(2U, counts.size());
    ASSERT_EQ(50U, counts["shard1"]);
    ASSERT_EQ(50U, counts["shard2"]);
}

TEST_F(PlanningRunTest, ShardSubsetIsVerifiedAgainstItsTargets) {
    cluster.setShards(makeShards(4));
    for (std::int64_t category = 0; category < 99; ++category) {
        cluster.setDocumentCount(kNss, category, 1000);
    }

    auto params = makeParams();
    params.domain = KeyDomain::integerRange(0, 98);
    params.splitCount = 99;
    params.shardCount = 3;

    PlanningRun run(params, &cluster, &cluster);
    auto swSummary = run.run();
    ASSERT_OK(swSummary);

    const auto& summary = swSummary.getValue();
    ASSERT(summary.execution.allApplied());
    ASSERT_OK(summary.verification);
    ASSERT(summary.isBalanced());
    ASSERT(summary.report);
    ASSERT_EQ(3U, summary.report->shards.size());
    ASSERT_EQ(0.0, summary.report->skew);
    ASSERT_EQ((std::vector<ShardId>{"shard1", "shard2", "shard3"}), run.getTargetShardIds());
    ASSERT_EQ(4U, run.getTopology().size());
}

TEST_F(PlanningRunTest, ShardCountLargerThanTopology) {
    auto params = makeParams();
    params.shardCount = 5;

    PlanningRun run(params, &cluster, &cluster);
    auto swSummary = run.run();
    ASSERT_STATUS_CODE(ErrorCodes::BadValue, swSummary);
    ASSERT_NE(std::string::npos,
              swSummary.getStatus().reason().find("Failed to select target shards"));
    ASSERT_EQ(0, cluster.getCounts().balancerStateRequests);
}

TEST_F(PlanningRunTest, NoShards) {
    cluster.setShards({});
    ASSERT_STATUS_CODE(ErrorCodes::EmptyShardSet,
                       PlanningRun(makeParams(), &cluster, &cluster).run());
}

TEST_F(PlanningRunTest, InvalidDomain) {
    auto params = makeParams();
    params.splitCount = 101;
    ASSERT_STATUS_CODE(ErrorCodes::InvalidDomain,
                       PlanningRun(params, &cluster, &cluster).run());
}

TEST_F(PlanningRunTest, TopologyUnavailable) {
    cluster.failNextCalls(InMemoryCluster::Operation::kListShards,
                          1,
                          Status(ErrorCodes::HostUnreachable, "config server down"));
    auto swSummary = PlanningRun(makeParams(), &cluster, &cluster).run();
    ASSERT_STATUS_CODE(ErrorCodes::HostUnreachable, swSummary);
    ASSERT_NE(std::string::npos,
              swSummary.getStatus().reason().find("Failed to load the cluster topology"));
}

TEST_F(PlanningRunTest, BalancerLeftDisabledIfItWasDisabled) {
    loadCatalog(10);
    cluster.setBalancerEnabled_forTest(false);

    ASSERT_OK(PlanningRun(makeParams(), &cluster, &cluster).run());
    ASSERT_FALSE(balancerEnabled());
    ASSERT_EQ(0, cluster.getCounts().balancerStateRequests);
}

TEST_F(PlanningRunTest, BalancerSuspendFailureStopsTheRun) {
    cluster.failNextCalls(InMemoryCluster::Operation::kSetBalancerState,
                          3,
                          Status(ErrorCodes::NetworkTimeout, "timed out"));

    auto swSummary = PlanningRun(makeParams(), &cluster, &cluster).run();
    ASSERT_STATUS_CODE(ErrorCodes::BalancerStateError, swSummary);
    ASSERT_EQ(0, cluster.getCounts().splitRequests);
    ASSERT(balancerEnabled());
}

TEST_F(PlanningRunTest, EntryFailureIsReportedAndBalancerRestored) {
    loadCatalog(10);
    cluster.failMovesStartingAt(ShardKey::lowestFor(50),
                                Status(ErrorCodes::IllegalOperation, "chunk is jumbo"));

    auto swSummary = PlanningRun(makeParams(), &cluster, &cluster).run();
    ASSERT_OK(swSummary);

    const auto& execution = swSummary.getValue().execution;
    ASSERT_EQ(1U, execution.numFailed);
    ASSERT_EQ(99U, execution.numMoved);
    ASSERT_EQ(EntryState::kFailed, execution.records[50].state);
    ASSERT(balancerEnabled());
}

TEST_F(PlanningRunTest, MetricsUnavailable) {
    cluster.setMetricsAvailable(false);

    auto swSummary = PlanningRun(makeParams(), &cluster, &cluster).run();
    ASSERT_OK(swSummary);

    const auto& summary = swSummary.getValue();
    ASSERT(summary.execution.allApplied());
    ASSERT_STATUS_CODE(ErrorCodes::VerificationUnavailable, summary.verification);
    ASSERT_FALSE(summary.report);
    ASSERT_FALSE(summary.isBalanced());
}

TEST_F(PlanningRunTest, SkewedDataIsReported) {
    // Category 0 holds most of the catalog.
    loadCatalog(1);
    cluster.setDocumentCount(kNss, 0, 10000);

    auto swSummary = PlanningRun(makeParams(), &cluster, &cluster).run();
    ASSERT_OK(swSummary);

    const auto& summary = swSummary.getValue();
    ASSERT(summary.execution.allApplied());
    ASSERT_STATUS_CODE(ErrorCodes::ExceededTimeLimit, summary.verification);
    ASSERT(summary.report);
    ASSERT_GT(summary.report->skew, 0.9);
}

TEST_F(PlanningRunTest, UnbalancedReportComesFromTheMeasurement) {
    loadCatalog(1);
    cluster.setDocumentCount(kNss, 0, 10000);
    OneShotMetricsSource metrics(&cluster);

    auto swSummary = PlanningRun(makeParams(), &cluster, &metrics).run();
    ASSERT_OK(swSummary);

    const auto& summary = swSummary.getValue();
    ASSERT_STATUS_CODE(ErrorCodes::ExceededTimeLimit, summary.verification);
    ASSERT(summary.report);
    ASSERT_EQ(10099, summary.report->total);
    ASSERT_EQ(1, metrics.calls());
}

TEST_F(PlanningRunTest, CancelledRunSkipsEverything) {
    CancellationSource source;
    source.cancel();

    auto swSummary = PlanningRun(makeParams(), &cluster, &cluster).run(source.token());
    ASSERT_OK(swSummary);
    ASSERT_EQ(100U, swSummary.getValue().execution.numSkipped);
    ASSERT(balancerEnabled());
}

}  // namespace
}  // namespace shardplan
