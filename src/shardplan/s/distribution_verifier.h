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
#include "shardplan/util/duration.h"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <boost/optional.hpp>

namespace shardplan {

class MetricsSource;
class ShardTopology;

/**
 * Observed data distribution of a collection across shards.
 */
struct DistributionReport {
    struct ShardShare {
        ShardId shard;
        std::int64_t count;
        // Fraction of the total, in [0, 1].
        double share;
    };

    // Ordered by shard id.
    std::vector<ShardShare> shards;
    std::int64_t total = 0;
    // max(share) - min(share).
    double skew = 0;

    bool isBalanced(double tolerance) const {
        return skew <= tolerance;
    }

    std::string toString() const;
};

/**
 * Measures how evenly a collection's data is spread across the shards of a topology.
 */
class DistributionVerifier {
public:
    explicit DistributionVerifier(MetricsSource* metrics);

    /**
     * Builds a report from raw per-shard counts. Shards of 'shardIds' missing from 'counts'
     * count as 0. Non-zero counts for shards outside 'shardIds' are added to the report as well,
     * since data there is misplaced. A zero total yields all-zero shares and zero skew.
     */
    static DistributionReport computeReport(const std::vector<ShardId>& shardIds,
                                            const std::map<ShardId, std::int64_t>& counts);

    /**
     * Queries the metrics source once and reports the spread over 'shardIds'. Returns
     * VerificationUnavailable if it cannot be read.
     */
    StatusWith<DistributionReport> verify(const NamespaceString& nss,
                                          const std::vector<ShardId>& shardIds);

    StatusWith<DistributionReport> verify(const NamespaceString& nss,
                                          const ShardTopology& topology);

    /**
     * Polls verify() every 'interval' until the distribution is within 'tolerance' or 'maxPolls'
     * reports have been taken. Returns the balanced report, ExceededTimeLimit carrying the last
     * report's skew if the distribution never converged, or VerificationUnavailable.
     *
     * When 'lastReport' is not null it receives the most recent report measured, if any.
     */
    StatusWith<DistributionReport> waitForBalance(
        const NamespaceString& nss,
        const std::vector<ShardId>& shardIds,
        double tolerance,
        Milliseconds interval,
        std::int32_t maxPolls,
        boost::optional<DistributionReport>* lastReport = nullptr);

    StatusWith<DistributionReport> waitForBalance(const NamespaceString& nss,
                                                  const ShardTopology& topology,
                                                  double tolerance,
                                                  Milliseconds interval,
                                                  std::int32_t maxPolls);

private:
    MetricsSource* const _metrics;
};

}  // namespace shardplan
