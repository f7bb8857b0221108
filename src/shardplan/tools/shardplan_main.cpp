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

#define SHARDPLAN_LOGV2_DEFAULT_COMPONENT ::shardplan::logv2::LogComponent::kDefault

#include "shardplan/logv2/log.h"
#include "shardplan/logv2/log_manager.h"
#include "shardplan/s/in_memory_cluster.h"
#include "shardplan/s/planner_options.h"
#include "shardplan/s/planning_run.h"
#include "shardplan/s/shell_script_writer.h"
#include "shardplan/util/assert_util.h"
#include "shardplan/util/exit_code.h"
#include "shardplan/util/str.h"

#include <cstdint>
#include <fstream>
#include <memory>
#include <iostream>
#include <string>
#include <vector>

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/positional_options.hpp>
#include <boost/program_options/variables_map.hpp>

namespace shardplan {
namespace {

const char* const kUsage =
    "usage: shardplan <command> [options]\n"
    "\n"
    "commands:\n"
    "  plan      print the placement plan for the configured topology\n"
    "  script    write a mongosh script which applies the plan\n"
    "  simulate  apply the plan to an in-memory cluster and verify the distribution\n";

void printHelp(std::ostream& out, const po::options_description& visible) {
    out << kUsage << "\n" << visible << std::endl;
}

/**
 * Shards the dry run commands plan against when the configuration names none.
 */
std::vector<ShardType> defaultShards() {
    std::vector<ShardType> shards;
    for (int i = 1; i <= 3; i++) {
        ShardType shard;
        shard.name = str::stream() << "shard" << i;
        shard.replicaSetName = str::stream() << "rs" << i;
        shard.host = str::stream() << "localhost:" << 27017 + i;
        shards.push_back(std::move(shard));
    }
    return shards;
}

/**
 * An in-memory cluster holding the configured shards and 'documentsPerValue' documents for every
 * value of the key domain.
 */
std::unique_ptr<InMemoryCluster> makeSimulatedCluster(const PlannerParams& params,
                                                      std::int64_t documentsPerValue) {
    auto cluster = std::make_unique<InMemoryCluster>(params.shards.empty() ? defaultShards()
                                                                           : params.shards);
    if (params.domain.validate().isOK()) {
        for (std::size_t i = 0; i < params.domain.size(); i++) {
            cluster->setDocumentCount(params.nss, params.domain.valueAt(i), documentsPerValue);
        }
    }
    return cluster;
}

int runPlan(const PlannerParams& params) {
    auto cluster = makeSimulatedCluster(params, 0);
    PlanningRun run(params, cluster.get(), cluster.get());
    auto swPlan = run.makePlan();
    if (!swPlan.isOK()) {
        std::cerr << "ERROR: " << swPlan.getStatus() << std::endl;
        return EXIT_FAILURE_RUN;
    }

    const auto& plan = swPlan.getValue();
    std::cout << "namespace: " << plan.getNss() << "\n";
    for (std::size_t i = 0; i < plan.size(); i++) {
        std::cout << i << "\t" << plan.getEntry(i).toString() << "\n";
    }
    for (const auto& [shard, count] : plan.countsPerShard()) {
        std::cout << shard << ": " << count << " chunks\n";
    }
    std::cout.flush();
    return EXIT_CLEAN;
}

int runScript(const PlannerParams& params, const po::variables_map& vm) {
    auto cluster = makeSimulatedCluster(params, 0);
    PlanningRun run(params, cluster.get(), cluster.get());
    auto swPlan = run.makePlan();
    if (!swPlan.isOK()) {
        std::cerr << "ERROR: " << swPlan.getStatus() << std::endl;
        return EXIT_FAILURE_RUN;
    }

    ShellScriptWriter::Options options;
    options.shardCollection = !vm.count("noShardCollection");
    options.suspendBalancer = !vm.count("noBalancer");
    ShellScriptWriter writer(params.shardKey, options);

    if (!vm.count("out")) {
        writer.write(swPlan.getValue(), std::cout);
        return EXIT_CLEAN;
    }

    const auto path = vm["out"].as<std::string>();
    std::ofstream out(path);
    if (!out) {
        std::cerr << "ERROR: " << Status(ErrorCodes::FileNotOpen, "Cannot open " + path)
                  << std::endl;
        return EXIT_FAILURE_RUN;
    }
    writer.write(swPlan.getValue(), out);

    LOGV2(9250,
          "Wrote placement script",
          "path"_attr = path,
          "entries"_attr = swPlan.getValue().size());
    return EXIT_CLEAN;
}

int runSimulate(const PlannerParams& params, const po::variables_map& vm) {
    auto cluster = makeSimulatedCluster(params, vm["documentsPerValue"].as<std::int64_t>());
    PlanningRun run(params, cluster.get(), cluster.get());
    auto swSummary = run.run();
    if (!swSummary.isOK()) {
        std::cerr << "ERROR: " << swSummary.getStatus() << std::endl;
        return EXIT_FAILURE_RUN;
    }

    const auto& summary = swSummary.getValue();
    std::cout << summary.toString() << std::endl;
    if (summary.execution.numFailed > 0)
        return EXIT_FAILURE_RUN;
    if (!summary.isBalanced())
        return EXIT_UNBALANCED;
    return EXIT_CLEAN;
}

int shardplanMain(int argc, char** argv) {
    po::options_description visible("options");
    po::options_description hidden("hidden options");
    po::positional_options_description positional;

    // clang-format off
    visible.add_options()
        ("help,h", "produce help message")
        ("out,o", po::value<std::string>(), "script: write the script to this file")
        ("noShardCollection", "script: skip sh.enableSharding() and sh.shardCollection()")
        ("noBalancer", "script: do not stop and restart the balancer")
        ("documentsPerValue", po::value<std::int64_t>()->default_value(10),
            "simulate: documents stored for every key domain value");
    hidden.add_options()
        ("command", po::value<std::string>(), "plan, script or simulate");
    // clang-format on
    addLoggingOptions(&visible, &hidden);
    addPlannerOptions(&visible);
    positional.add("command", 1);

    po::options_description all;
    all.add(visible).add(hidden);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(all)
                      .positional(positional)
                      .style(commandLineStyle())
                      .run(),
                  vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "ERROR: " << e.what() << std::endl << std::endl;
        printHelp(std::cerr, visible);
        return EXIT_BADOPTIONS;
    }

    if (vm.count("help")) {
        printHelp(std::cout, visible);
        return EXIT_CLEAN;
    }

    if (!vm.count("command")) {
        std::cerr << "ERROR: a command is required" << std::endl << std::endl;
        printHelp(std::cerr, visible);
        return EXIT_BADOPTIONS;
    }
    const auto command = vm["command"].as<std::string>();
    if (command != "plan" && command != "script" && command != "simulate") {
        std::cerr << "ERROR: unknown command '" << command << "'" << std::endl << std::endl;
        printHelp(std::cerr, visible);
        return EXIT_BADOPTIONS;
    }

    logv2::LogSettings logSettings;
    logSettings.verbosity = getVerbosity(vm);
    if (vm.count("logpath")) {
        logSettings.logPath = vm["logpath"].as<std::string>();
    }
    if (auto status = logv2::LogManager::global().configure(logSettings); !status.isOK()) {
        std::cerr << "ERROR: " << status << std::endl;
        return EXIT_BADOPTIONS;
    }

    PlannerParams params;
    if (auto status = storePlannerOptions(vm, &params); !status.isOK()) {
        std::cerr << "ERROR: " << status << std::endl;
        return EXIT_BADOPTIONS;
    }

    try {
        if (command == "plan")
            return runPlan(params);
        if (command == "script")
            return runScript(params, vm);
        return runSimulate(params, vm);
    } catch (const DBException& ex) {
        LOGV2_ERROR(
            9251, "shardplan failed", "command"_attr = command, "error"_attr = ex.toStatus());
        return EXIT_FAILURE_RUN;
    }
}

}  // namespace
}  // namespace shardplan

int main(int argc, char** argv) {
    return shardplan::shardplanMain(argc, argv);
}
