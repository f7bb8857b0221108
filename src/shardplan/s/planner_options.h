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
#include "shardplan/client/retry_strategy.h"
#include "shardplan/db/namespace_string.h"
#include "shardplan/s/catalog/type_shard.h"
#include "shardplan/s/chunk_assigner.h"
#include "shardplan/s/placement_executor.h"
#include "shardplan/s/range_splitter.h"
#include "shardplan/s/shard_key.h"
#include "shardplan/util/duration.h"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/variables_map.hpp>

namespace shardplan {

namespace po = boost::program_options;

enum class AssignmentPolicyKind { kRoundRobin, kWeighted };

/**
 * Everything a planning run can be configured with. Defaults describe the marketplace catalog:
 * products sharded on { category_id: 1, product_id: 1 } with 100 categories.
 */
struct PlannerParams {
    NamespaceString nss{"marketplace", "products"};
    ShardKeyPattern shardKey;
    KeyDomain domain = KeyDomain::integerRange(0, 99);

    // 0 means every shard of the topology.
    std::int64_t shardCount = 0;
    std::int64_t splitCount = 100;
    double tolerance = 0.05;
    std::int32_t concurrency = 1;

    // Total attempts per cluster operation, the first one included.
    std::int32_t retryMaxAttempts = 5;
    Milliseconds retryBaseBackoff{100};
    Milliseconds retryMaxBackoff{5000};
    Milliseconds operationTimeout{30000};

    AssignmentPolicyKind policy = AssignmentPolicyKind::kRoundRobin;
    std::map<ShardId, double> weights;

    // Shards of the simulated cluster and of rendered scripts.
    std::vector<ShardType> shards;

    Milliseconds verifyPollInterval{1000};
    std::int32_t verifyMaxPolls = 1;

    DefaultRetryStrategy::RetryParameters retryParameters() const {
        return {retryMaxAttempts - 1, retryBaseBackoff, retryMaxBackoff};
    }

    PlacementExecutorParams executorParams() const {
        return {concurrency, retryParameters(), operationTimeout};
    }
};

/**
 * Parses a YAML configuration document on top of the defaults in 'params'. Malformed YAML or a
 * value of the wrong type yields FailedToParse; an unknown option yields BadValue.
 */
Status parsePlannerConfig(const std::string& yaml, PlannerParams* params);

/**
 * Reads and parses the YAML file at 'path'.
 */
Status loadPlannerConfigFile(const std::string& path, PlannerParams* params);

/**
 * Registers the command line flags which override configuration file values.
 */
void addPlannerOptions(po::options_description* options);

/**
 * Applies the flags present in 'vm' to 'params', loading --config first when given.
 */
Status storePlannerOptions(const po::variables_map& vm, PlannerParams* params);

/**
 * Checks ranges and cross-field constraints. Returns BadValue naming the offending option.
 */
Status validatePlannerParams(const PlannerParams& params);

/**
 * Registers --verbose,-v and --logpath in 'options', and the hidden -vv ... -vvvvvvvvvv forms
 * in 'hidden'. Parse with allow_long_disguise and without allow_sticky so that "-vvv" is read
 * as the long option "vvv".
 */
void addLoggingOptions(po::options_description* options, po::options_description* hidden);

/**
 * Verbosity requested with -v flags: "-v" is 1, "-vvv" is 3.
 */
int getVerbosity(const po::variables_map& vm);

/**
 * Command line style shared by the shardplan tools.
 */
int commandLineStyle();

std::unique_ptr<AssignmentPolicy> makeAssignmentPolicy(const PlannerParams& params);

std::string toString(AssignmentPolicyKind kind);

}  // namespace shardplan
