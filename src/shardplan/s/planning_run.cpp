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

#include "shardplan/s/planning_run.h"

#include "shardplan/logv2/log.h"
#include "shardplan/s/balancer_coordinator.h"
#include "shardplan/s/chunk_assigner.h"
#include "shardplan/s/range_splitter.h"
#include "shardplan/util/assert_util.h"
#include "shardplan/util/str.h"

namespace shardplan {

std::string RunSummary::toString() const {
    str::stream ss;
    ss << "{ namespace: " << plan.getNss() << ", execution: " << execution.toString()
       << ", verification: " << verification;
    if (report) {
        ss << ", distribution: " << report->toString();
    }
    ss << " }";
    return ss;
}

PlanningRun::PlanningRun(PlannerParams params,
                         ClusterControlPlane* controlPlane,
                         MetricsSource* metrics)
    : _params(std::move(params)), _controlPlane(controlPlane), _metrics(metrics) {
    invariant(_controlPlane);
    invariant(_metrics);
}

StatusWith<PlacementPlan> PlanningRun::makePlan() {
    if (auto status = _topology.refresh(_controlPlane, _params.operationTimeout); !status.isOK()) {
        return status.withContext("Failed to load the cluster topology");
    }

    auto swShards = _topology.selectShards(static_cast<std::size_t>(_params.shardCount));
    if (!swShards.isOK()) {
        return swShards.getStatus().withContext("Failed to select target shards");
    }

    _targetShardIds.clear();
    for (const auto& shard : swShards.getValue()) {
        _targetShardIds.push_back(shard.name);
    }

    auto swRanges = RangeSplitter::split(_params.domain, _params.splitCount);
    if (!swRanges.isOK()) {
        return swRanges.getStatus().withContext("Failed to split the key domain");
    }

    ChunkAssigner assigner(makeAssignmentPolicy(_params));
    auto swPlan = assigner.assign(_params.nss, swRanges.getValue(), swShards.getValue());
    if (!swPlan.isOK()) {
        return swPlan.getStatus().withContext("Failed to assign chunks to shards");
    }
    return swPlan;
}

StatusWith<RunSummary> PlanningRun::run(const CancellationToken& token) {
    LOGV2(9230,
          "Starting planning run",
          "namespace"_attr = _params.nss,
          "shardKey"_attr = _params.shardKey,
          "splitCount"_attr = _params.splitCount,
          "shardCount"_attr = _params.shardCount,
          "policy"_attr = toString(_params.policy));

    auto swPlan = makePlan();
    if (!swPlan.isOK()) {
        return swPlan.getStatus();
    }
    const auto& plan = swPlan.getValue();

    BalancerCoordinator balancer(
        _controlPlane, _params.retryParameters(), _params.operationTimeout);
    PlacementExecutor executor(_controlPlane, _params.executorParams());

    ExecutionSummary execution;
    auto status = runWithBalancerSuspended(&balancer, [&] {
        execution = executor.execute(plan, token);
        return Status::OK();
    });
    if (!status.isOK()) {
        return status.withContext("Failed to apply the placement plan");
    }

    RunSummary summary{plan, std::move(execution)};

    // Only the shards the plan places chunks on are expected to hold data.
    DistributionVerifier verifier(_metrics);
    auto swReport = verifier.waitForBalance(_params.nss,
                                            _targetShardIds,
                                            _params.tolerance,
                                            _params.verifyPollInterval,
                                            _params.verifyMaxPolls,
                                            &summary.report);
    if (!swReport.isOK()) {
        summary.verification = swReport.getStatus();
    }

    if (summary.execution.numFailed > 0 || !summary.isBalanced()) {
        LOGV2_WARNING(9231, "Planning run finished with problems", "summary"_attr = summary);
    } else {
        LOGV2(9232, "Planning run finished", "summary"_attr = summary);
    }

    return summary;
}

}  // namespace shardplan
