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

#include "shardplan/s/distribution_verifier.h"

#include "shardplan/logv2/log.h"
#include "shardplan/s/metrics_source.h"
#include "shardplan/s/shard_topology.h"
#include "shardplan/util/assert_util.h"
#include "shardplan/util/str.h"

#include <algorithm>

#include <fmt/format.h>

namespace shardplan {

std::string DistributionReport::toString() const {
    str::stream ss;
    ss << "{ total: " << total << ", skew: " << fmt::format("{:.4f}", skew) << ", shards: { ";
    for (std::size_t i = 0; i < shards.size(); ++i) {
        if (i > 0)
            ss << ", ";
        ss << shards[i].shard << ": " << shards[i].count << " ("
           << fmt::format("{:.2f}%", shards[i].share * 100) << ")";
    }
    ss << " } }";
    return ss;
}

DistributionVerifier::DistributionVerifier(MetricsSource* metrics) : _metrics(metrics) {
    invariant(_metrics);
}

DistributionReport DistributionVerifier::computeReport(
    const std::vector<ShardId>& shardIds, const std::map<ShardId, std::int64_t>& counts) {
    std::map<ShardId, std::int64_t> merged;
    for (const auto& shardId : shardIds) {
        merged[shardId] = 0;
    }
    for (const auto& [shardId, count] : counts) {
        if (count != 0 || merged.count(shardId)) {
            merged[shardId] = count;
        }
    }

    DistributionReport report;
    for (const auto& [shardId, count] : merged) {
        report.total += count;
    }

    double minShare = 0;
    double maxShare = 0;
    for (const auto& [shardId, count] : merged) {
        const double share =
            report.total > 0 ? static_cast<double>(count) / static_cast<double>(report.total) : 0;
        if (report.shards.empty()) {
            minShare = maxShare = share;
        } else {
            minShare = std::min(minShare, share);
            maxShare = std::max(maxShare, share);
        }
        report.shards.push_back({shardId, count, share});
    }
    report.skew = maxShare - minShare;

    return report;
}

StatusWith<DistributionReport> DistributionVerifier::verify(const NamespaceString& nss,
                                                            const ShardTopology& topology) {
    return verify(nss, topology.getShardIds());
}

StatusWith<DistributionReport> DistributionVerifier::verify(
    const NamespaceString& nss, const std::vector<ShardId>& shardIds) {
    auto swCounts = _metrics->perShardCount(nss);
    if (!swCounts.isOK()) {
        return Status(ErrorCodes::VerificationUnavailable,
                      str::stream() << "Could not read per-shard counts of " << nss
                                    << causedBy(swCounts.getStatus()));
    }

    auto report = computeReport(shardIds, swCounts.getValue());
    LOGV2(9200,
          "Measured data distribution",
          "namespace"_attr = nss,
          "total"_attr = report.total,
          "skew"_attr = report.skew,
          "report"_attr = report);
    return report;
}

StatusWith<DistributionReport> DistributionVerifier::waitForBalance(const NamespaceString& nss,
                                                                    const ShardTopology& topology,
                                                                    double tolerance,
                                                                    Milliseconds interval,
                                                                    std::int32_t maxPolls) {
    return waitForBalance(nss, topology.getShardIds(), tolerance, interval, maxPolls);
}

StatusWith<DistributionReport> DistributionVerifier::waitForBalance(
    const NamespaceString& nss,
    const std::vector<ShardId>& shardIds,
    double tolerance,
    Milliseconds interval,
    std::int32_t maxPolls,
    boost::optional<DistributionReport>* lastReport) {
    invariant(maxPolls >= 1);

    double lastSkew = 0;
    for (std::int32_t poll = 1; poll <= maxPolls; ++poll) {
        auto swReport = verify(nss, shardIds);
        if (!swReport.isOK()) {
            return swReport;
        }
        if (lastReport) {
            *lastReport = swReport.getValue();
        }

        if (swReport.getValue().isBalanced(tolerance)) {
            LOGV2(9201,
                  "Data distribution converged",
                  "namespace"_attr = nss,
                  "polls"_attr = poll,
                  "skew"_attr = swReport.getValue().skew);
            return swReport;
        }

        lastSkew = swReport.getValue().skew;
        if (poll < maxPolls) {
            LOGV2_DEBUG(9202,
                        1,
                        "Data distribution not balanced yet",
                        "namespace"_attr = nss,
                        "skew"_attr = lastSkew,
                        "tolerance"_attr = tolerance);
            sleepFor(interval);
        }
    }

    return Status(ErrorCodes::ExceededTimeLimit,
                  str::stream() << "Distribution of " << nss << " did not converge within "
                                << maxPolls << " polls, last skew " << lastSkew
                                << " exceeds tolerance " << tolerance);
}

}  // namespace shardplan
