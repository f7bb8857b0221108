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
#include "shardplan/s/distribution_verifier.h"
#include "shardplan/s/placement_executor.h"
#include "shardplan/s/placement_plan.h"
#include "shardplan/s/planner_options.h"
#include "shardplan/s/shard_topology.h"
#include "shardplan/util/cancellation.h"

#include <string>
#include <vector>

#include <boost/optional.hpp>

namespace shardplan {

class ClusterControlPlane;
class MetricsSource;

/**
 * Outcome of a planning run which got as far as applying its plan. Entry failures and an
 * unverifiable or unbalanced distribution are reported here rather than failing the run.
 */
struct RunSummary {
    PlacementPlan plan;
    ExecutionSummary execution;

    // OK when the distribution is within tolerance, ExceededTimeLimit when it is not,
    // VerificationUnavailable when it could not be measured.
    Status verification = Status::OK();
    boost::optional<DistributionReport> report;

    bool isBalanced() const {
        return verification.isOK();
    }

    std::string toString() const;
};

/**
 * Drives one planning run end to end: refresh the topology, split the key domain, assign ranges
 * to shards, suspend the balancer, apply the plan, resume the balancer and verify the resulting
 * distribution.
 */
class PlanningRun {
public:
    PlanningRun(PlannerParams params, ClusterControlPlane* controlPlane, MetricsSource* metrics);

    /**
     * Refreshes the topology and computes the plan without touching the cluster's metadata.
     */
    StatusWith<PlacementPlan> makePlan();

    /**
     * Runs every stage. Returns a non-OK status naming the failed stage when the run could not
     * apply its plan; otherwise the summary.
     */
    StatusWith<RunSummary> run(const CancellationToken& token = CancellationToken::uncancelable());

    const ShardTopology& getTopology() const {
        return _topology;
    }

    const PlannerParams& getParams() const {
        return _params;
    }

    /**
     * Ids of the shards the last plan placed chunks on.
     */
    const std::vector<ShardId>& getTargetShardIds() const {
        return _targetShardIds;
    }

private:
    const PlannerParams _params;
    ClusterControlPlane* const _controlPlane;
    MetricsSource* const _metrics;

    ShardTopology _topology;
    std::vector<ShardId> _targetShardIds;
};

}  // namespace shardplan
