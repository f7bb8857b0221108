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

#define SHARDPLAN_LOGV2_DEFAULT_COMPONENT ::shardplan::logv2::LogComponent::kControl

#include "shardplan/s/planner_options.h"

#include "shardplan/logv2/log.h"
#include "shardplan/util/assert_util.h"
#include "shardplan/util/str.h"

#include <algorithm>
#include <fstream>
#include <initializer_list>
#include <sstream>

#include <boost/program_options/parsers.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <yaml-cpp/yaml.h>

namespace shardplan {
namespace {

Status checkKnownKeys(const YAML::Node& node,
                      const std::string& section,
                      std::initializer_list<const char*> known) {
    for (auto it = node.begin(); it != node.end(); ++it) {
        const auto key = it->first.as<std::string>();
        if (std::none_of(known.begin(), known.end(), [&](const char* k) { return key == k; })) {
            return Status(ErrorCodes::BadValue,
                          str::stream() << "Unrecognized option: "
                                        << (section.empty() ? key : section + "." + key));
        }
    }
    return Status::OK();
}

template <typename T>
Status readScalar(const YAML::Node& node, const std::string& name, T* out) {
    if (!node.IsScalar()) {
        return Status(ErrorCodes::FailedToParse,
                      str::stream() << "Option '" << name << "' must be a scalar value");
    }
    try {
        *out = node.as<T>();
    } catch (const YAML::Exception& ex) {
        return Status(ErrorCodes::FailedToParse,
                      str::stream() << "Invalid value '" << node.Scalar() << "' for option '"
                                    << name << "': " << ex.what());
    }
    return Status::OK();
}

/**
 * Reads parent[key] into 'out' when present.
 */
template <typename T>
Status readOption(const YAML::Node& parent, const char* key, const std::string& name, T* out) {
    const YAML::Node node = parent[key];
    if (!node)
        return Status::OK();
    return readScalar(node, name, out);
}

Status readMillis(const YAML::Node& parent,
                  const char* key,
                  const std::string& name,
                  Milliseconds* out) {
    std::int64_t value = out->count();
    if (auto status = readOption(parent, key, name, &value); !status.isOK()) {
        return status;
    }
    *out = Milliseconds(value);
    return Status::OK();
}

Status expectMap(const YAML::Node& node, const std::string& name) {
    if (!node.IsMap()) {
        return Status(ErrorCodes::FailedToParse,
                      str::stream() << "Option '" << name << "' must be a map");
    }
    return Status::OK();
}

Status parseDomain(const YAML::Node& node, PlannerParams* params) {
    if (auto status = expectMap(node, "domain"); !status.isOK())
        return status;
    if (auto status = checkKnownKeys(node, "domain", {"min", "max", "values"}); !status.isOK())
        return status;

    const bool hasBounds = node["min"] || node["max"];
    if (hasBounds && node["values"]) {
        return Status(ErrorCodes::BadValue,
                      "Options 'domain.min'/'domain.max' and 'domain.values' are exclusive");
    }

    if (node["values"]) {
        const YAML::Node valuesNode = node["values"];
        if (!valuesNode.IsSequence()) {
            return Status(ErrorCodes::FailedToParse, "Option 'domain.values' must be a list");
        }
        std::vector<std::string> values;
        for (std::size_t i = 0; i < valuesNode.size(); ++i) {
            std::string value;
            if (auto status = readScalar(valuesNode[i], "domain.values", &value);
                !status.isOK())
                return status;
            values.push_back(std::move(value));
        }
        params->domain = KeyDomain::stringValues(std::move(values));
        return Status::OK();
    }

    std::int64_t min = 0;
    std::int64_t max = 99;
    if (auto status = readOption(node, "min", "domain.min", &min); !status.isOK())
        return status;
    if (auto status = readOption(node, "max", "domain.max", &max); !status.isOK())
        return status;
    params->domain = KeyDomain::integerRange(min, max);
    return Status::OK();
}

Status parseShards(const YAML::Node& node, PlannerParams* params) {
    if (!node.IsSequence()) {
        return Status(ErrorCodes::FailedToParse, "Option 'shards' must be a list");
    }

    std::vector<ShardType> shards;
    for (std::size_t i = 0; i < node.size(); ++i) {
        const YAML::Node shardNode = node[i];
        const std::string name = str::stream() << "shards[" << i << "]";
        if (auto status = expectMap(shardNode, name); !status.isOK())
            return status;
        if (auto status = checkKnownKeys(shardNode, name, {"id", "host", "replicaSet"});
            !status.isOK())
            return status;
        if (!shardNode["id"]) {
            return Status(ErrorCodes::BadValue,
                          str::stream() << "Option '" << name << ".id' is required");
        }

        ShardType shard;
        if (auto status = readOption(shardNode, "id", name + ".id", &shard.name); !status.isOK())
            return status;
        if (auto status = readOption(shardNode, "host", name + ".host", &shard.host);
            !status.isOK())
            return status;
        if (auto status =
                readOption(shardNode, "replicaSet", name + ".replicaSet", &shard.replicaSetName);
            !status.isOK())
            return status;
        shards.push_back(std::move(shard));
    }
    params->shards = std::move(shards);
    return Status::OK();
}

Status parsePolicy(const std::string& value, AssignmentPolicyKind* out) {
    if (value == "roundRobin") {
        *out = AssignmentPolicyKind::kRoundRobin;
    } else if (value == "weighted") {
        *out = AssignmentPolicyKind::kWeighted;
    } else {
        return Status(ErrorCodes::BadValue,
                      str::stream() << "Option 'policy' must be 'roundRobin' or 'weighted', got '"
                                    << value << "'");
    }
    return Status::OK();
}

Status parseRoot(const YAML::Node& root, PlannerParams* params) {
    if (auto status = checkKnownKeys(root,
                                     "",
                                     {"namespace",
                                      "shardKey",
                                      "domain",
                                      "shardCount",
                                      "splitCount",
                                      "tolerance",
                                      "concurrency",
                                      "retry",
                                      "operationTimeoutMS",
                                      "policy",
                                      "weights",
                                      "shards",
                                      "verify"});
        !status.isOK())
        return status;

    if (root["namespace"]) {
        std::string ns;
        if (auto status = readScalar(root["namespace"], "namespace", &ns); !status.isOK())
            return status;
        auto swNss = NamespaceString::parse(ns);
        if (!swNss.isOK())
            return swNss.getStatus().withContext("Invalid option 'namespace'");
        params->nss = swNss.getValue();
    }

    if (const YAML::Node shardKey = root["shardKey"]) {
        if (auto status = expectMap(shardKey, "shardKey"); !status.isOK())
            return status;
        if (auto status = checkKnownKeys(shardKey, "shardKey", {"primary", "tiebreaker"});
            !status.isOK())
            return status;
        if (auto status = readOption(
                shardKey, "primary", "shardKey.primary", &params->shardKey.primaryField);
            !status.isOK())
            return status;
        if (auto status = readOption(
                shardKey, "tiebreaker", "shardKey.tiebreaker", &params->shardKey.tiebreakerField);
            !status.isOK())
            return status;
    }

    if (const YAML::Node domain = root["domain"]) {
        if (auto status = parseDomain(domain, params); !status.isOK())
            return status;
    }

    if (auto status = readOption(root, "shardCount", "shardCount", &params->shardCount);
        !status.isOK())
        return status;
    if (auto status = readOption(root, "splitCount", "splitCount", &params->splitCount);
        !status.isOK())
        return status;
    if (auto status = readOption(root, "tolerance", "tolerance", &params->tolerance);
        !status.isOK())
        return status;
    if (auto status = readOption(root, "concurrency", "concurrency", &params->concurrency);
        !status.isOK())
        return status;
    if (auto status = readMillis(
            root, "operationTimeoutMS", "operationTimeoutMS", &params->operationTimeout);
        !status.isOK())
        return status;

    if (const YAML::Node retry = root["retry"]) {
        if (auto status = expectMap(retry, "retry"); !status.isOK())
            return status;
        if (auto status =
                checkKnownKeys(retry, "retry", {"maxAttempts", "baseBackoffMS", "maxBackoffMS"});
            !status.isOK())
            return status;
        if (auto status =
                readOption(retry, "maxAttempts", "retry.maxAttempts", &params->retryMaxAttempts);
            !status.isOK())
            return status;
        if (auto status = readMillis(
                retry, "baseBackoffMS", "retry.baseBackoffMS", &params->retryBaseBackoff);
            !status.isOK())
            return status;
        if (auto status =
                readMillis(retry, "maxBackoffMS", "retry.maxBackoffMS", &params->retryMaxBackoff);
            !status.isOK())
            return status;
    }

    if (root["policy"]) {
        std::string policy;
        if (auto status = readScalar(root["policy"], "policy", &policy); !status.isOK())
            return status;
        if (auto status = parsePolicy(policy, &params->policy); !status.isOK())
            return status;
    }

    if (const YAML::Node weights = root["weights"]) {
        if (auto status = expectMap(weights, "weights"); !status.isOK())
            return status;
        std::map<ShardId, double> parsed;
        for (auto it = weights.begin(); it != weights.end(); ++it) {
            const auto shardId = it->first.as<std::string>();
            double weight = 0;
            if (auto status = readScalar(it->second, "weights." + shardId, &weight);
                !status.isOK())
                return status;
            parsed[shardId] = weight;
        }
        params->weights = std::move(parsed);
    }

    if (const YAML::Node shards = root["shards"]) {
        if (auto status = parseShards(shards, params); !status.isOK())
            return status;
    }

    if (const YAML::Node verify = root["verify"]) {
        if (auto status = expectMap(verify, "verify"); !status.isOK())
            return status;
        if (auto status = checkKnownKeys(verify, "verify", {"pollIntervalMS", "maxPolls"});
            !status.isOK())
            return status;
        if (auto status = readMillis(
                verify, "pollIntervalMS", "verify.pollIntervalMS", &params->verifyPollInterval);
            !status.isOK())
            return status;
        if (auto status =
                readOption(verify, "maxPolls", "verify.maxPolls", &params->verifyMaxPolls);
            !status.isOK())
            return status;
    }

    return Status::OK();
}

}  // namespace

Status parsePlannerConfig(const std::string& yaml, PlannerParams* params) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception& ex) {
        return Status(ErrorCodes::FailedToParse,
                      str::stream() << "Error parsing YAML config: " << ex.what());
    }

    if (root.IsNull())
        return Status::OK();

    if (!root.IsMap()) {
        return Status(ErrorCodes::FailedToParse, "YAML config must be a map of options");
    }

    try {
        return parseRoot(root, params);
    } catch (const YAML::Exception& ex) {
        return Status(ErrorCodes::FailedToParse,
                      str::stream() << "Error reading YAML config: " << ex.what());
    }
}

Status loadPlannerConfigFile(const std::string& path, PlannerParams* params) {
    std::ifstream file(path);
    if (!file) {
        return Status(ErrorCodes::FileNotOpen,
                      str::stream() << "Error reading config file " << path);
    }
    std::ostringstream contents;
    contents << file.rdbuf();

    return parsePlannerConfig(contents.str(), params)
        .withContext(str::stream() << "Invalid config file " << path);
}

void addPlannerOptions(po::options_description* options) {
    // clang-format off
    options->add_options()
        ("config,f", po::value<std::string>(), "YAML configuration file")
        ("namespace", po::value<std::string>(), "collection to plan, \"db.collection\"")
        ("splitCount", po::value<std::int64_t>(), "number of chunks of the initial split")
        ("shardCount", po::value<std::int64_t>(),
            "number of shards to place chunks on, 0 for all")
        ("tolerance", po::value<double>(), "maximum acceptable skew, in [0, 1]")
        ("concurrency", po::value<std::int32_t>(), "plan entries applied in parallel")
        ("policy", po::value<std::string>(), "assignment policy: roundRobin or weighted");
    // clang-format on
}

Status storePlannerOptions(const po::variables_map& vm, PlannerParams* params) {
    if (vm.count("config")) {
        if (auto status = loadPlannerConfigFile(vm["config"].as<std::string>(), params);
            !status.isOK())
            return status;
    }

    if (vm.count("namespace")) {
        auto swNss = NamespaceString::parse(vm["namespace"].as<std::string>());
        if (!swNss.isOK())
            return swNss.getStatus().withContext("Invalid option 'namespace'");
        params->nss = swNss.getValue();
    }
    if (vm.count("splitCount"))
        params->splitCount = vm["splitCount"].as<std::int64_t>();
    if (vm.count("shardCount"))
        params->shardCount = vm["shardCount"].as<std::int64_t>();
    if (vm.count("tolerance"))
        params->tolerance = vm["tolerance"].as<double>();
    if (vm.count("concurrency"))
        params->concurrency = vm["concurrency"].as<std::int32_t>();
    if (vm.count("policy")) {
        if (auto status = parsePolicy(vm["policy"].as<std::string>(), &params->policy);
            !status.isOK())
            return status;
    }

    return validatePlannerParams(*params);
}

Status validatePlannerParams(const PlannerParams& params) {
    if (params.splitCount < 1) {
        return Status(ErrorCodes::BadValue,
                      str::stream() << "Option 'splitCount' must be at least 1, got "
                                    << params.splitCount);
    }
    if (params.shardCount < 0) {
        return Status(ErrorCodes::BadValue,
                      str::stream() << "Option 'shardCount' must not be negative, got "
                                    << params.shardCount);
    }
    if (!(params.tolerance >= 0 && params.tolerance <= 1)) {
        return Status(ErrorCodes::BadValue,
                      str::stream() << "Option 'tolerance' must be between 0 and 1, got "
                                    << params.tolerance);
    }
    if (params.concurrency < 1) {
        return Status(ErrorCodes::BadValue,
                      str::stream() << "Option 'concurrency' must be at least 1, got "
                                    << params.concurrency);
    }
    if (params.retryMaxAttempts < 1) {
        return Status(ErrorCodes::BadValue,
                      str::stream() << "Option 'retry.maxAttempts' must be at least 1, got "
                                    << params.retryMaxAttempts);
    }
    if (params.retryBaseBackoff < Milliseconds(0)) {
        return Status(ErrorCodes::BadValue, "Option 'retry.baseBackoffMS' must not be negative");
    }
    if (params.retryMaxBackoff < params.retryBaseBackoff) {
        return Status(ErrorCodes::BadValue,
                      "Option 'retry.maxBackoffMS' must not be less than 'retry.baseBackoffMS'");
    }
    if (params.operationTimeout <= Milliseconds(0)) {
        return Status(ErrorCodes::BadValue, "Option 'operationTimeoutMS' must be positive");
    }
    if (params.verifyPollInterval < Milliseconds(0)) {
        return Status(ErrorCodes::BadValue, "Option 'verify.pollIntervalMS' must not be negative");
    }
    if (params.verifyMaxPolls < 1) {
        return Status(ErrorCodes::BadValue, "Option 'verify.maxPolls' must be at least 1");
    }
    if (params.shardKey.primaryField.empty() || params.shardKey.tiebreakerField.empty()) {
        return Status(ErrorCodes::BadValue, "Shard key field names must not be empty");
    }
    if (params.shardKey.primaryField == params.shardKey.tiebreakerField) {
        return Status(ErrorCodes::BadValue,
                      "Options 'shardKey.primary' and 'shardKey.tiebreaker' must differ");
    }
    for (const auto& [shardId, weight] : params.weights) {
        if (!(weight > 0)) {
            return Status(ErrorCodes::BadValue,
                          str::stream() << "Option 'weights." << shardId
                                        << "' must be positive, got " << weight);
        }
    }
    if (!params.weights.empty() && params.policy != AssignmentPolicyKind::kWeighted) {
        LOGV2_WARNING(9220,
                      "Shard weights are ignored unless the weighted policy is selected",
                      "policy"_attr = toString(params.policy));
    }

    if (auto status = params.domain.validate(); !status.isOK()) {
        return status.withContext("Invalid option 'domain'");
    }

    return Status::OK();
}

void addLoggingOptions(po::options_description* options, po::options_description* hidden) {
    // clang-format off
    options->add_options()
        ("verbose,v", "be more verbose (include multiple times for more verbosity e.g. -vvvvv)")
        ("logpath", po::value<std::string>(), "append log output to this file");
    // clang-format on

    for (std::string s = "vv"; s.length() <= 10; s.append("v")) {
        hidden->add_options()(s.c_str(), "verbose");
    }
}

int getVerbosity(const po::variables_map& vm) {
    int verbosity = vm.count("verbose") ? 1 : 0;
    for (std::string s = "vv"; s.length() <= 10; s.append("v")) {
        if (vm.count(s)) {
            verbosity = static_cast<int>(s.length());
        }
    }
    return verbosity;
}

int commandLineStyle() {
    return ((po::command_line_style::unix_style ^ po::command_line_style::allow_guessing) |
            po::command_line_style::allow_long_disguise) ^
        po::command_line_style::allow_sticky;
}

std::unique_ptr<AssignmentPolicy> makeAssignmentPolicy(const PlannerParams& params) {
    switch (params.policy) {
        case AssignmentPolicyKind::kRoundRobin:
            return std::make_unique<RoundRobinPolicy>();
        case AssignmentPolicyKind::kWeighted:
            return std::make_unique<WeightedPolicy>(params.weights);
    }
    SHARDPLAN_UNREACHABLE;
}

std::string toString(AssignmentPolicyKind kind) {
    switch (kind) {
        case AssignmentPolicyKind::kRoundRobin:
            return "roundRobin";
        case AssignmentPolicyKind::kWeighted:
            return "weighted";
    }
    SHARDPLAN_UNREACHABLE;
}

}  // namespace shardplan
