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
#include "shardplan/client/retry_strategy.h"
#include "shardplan/s/placement_plan.h"
#include "shardplan/util/cancellation.h"
#include "shardplan/util/duration.h"

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

namespace shardplan {

class ClusterControlPlane;

/**
 * Progress of a single plan entry.
 */
enum class EntryState {
    kPending,
    kSplitDone,
    kMoved,
    kFailed,
    // Not started because the run was cancelled.
    kSkipped,
};

std::string toString(EntryState state);
std::ostream& operator<<(std::ostream& os, EntryState state);

struct ExecutionRecord {
    EntryState state = EntryState::kPending;

    // Whether this run actually issued a split or a move for the entry, as opposed to finding
    // it already applied.
    bool splitIssued = false;
    bool moveIssued = false;

    // Number of split and move requests sent for the entry, retries included.
    std::int32_t attempts = 0;

    Status lastError = Status::OK();

    bool isDone() const {
        return state == EntryState::kMoved;
    }
};

struct ExecutionSummary {
    // Indexed like the plan's entries.
    std::vector<ExecutionRecord> records;

    std::size_t numSplit = 0;
    std::size_t numMoved = 0;
    std::size_t numFailed = 0;
    std::size_t numSkipped = 0;

    bool allApplied() const {
        return numMoved == records.size();
    }

    std::string toString() const;
};

struct PlacementExecutorParams {
    // Maximum number of plan entries worked on at the same time.
    std::int32_t concurrency = 1;

    DefaultRetryStrategy::RetryParameters retryParameters{
        4, Milliseconds(100), Milliseconds(5000)};

    // Bound on every individual control plane request.
    Milliseconds operationTimeout{30000};
};

/**
 * Applies a placement plan to the cluster, one entry at a time or several in parallel.
 *
 * For each entry the executor splits at the range's lower bound unless a chunk already starts
 * there, then moves the chunk starting at the lower bound to the target shard unless it already
 * lives there. Applying an already applied plan therefore issues no split or move.
 *
 * Transient errors are retried with exponential backoff with jitter. An entry which still fails
 * is recorded with a PlacementFailed error and the remaining entries are carried on with.
 */
class PlacementExecutor {
public:
    PlacementExecutor(ClusterControlPlane* controlPlane, PlacementExecutorParams params);

    /**
     * Applies every entry of 'plan'. Once 'token' is cancelled, entries which have not started
     * yet are recorded as skipped; entries in flight run to completion.
     */
    ExecutionSummary execute(const PlacementPlan& plan,
                             const CancellationToken& token = CancellationToken::uncancelable());

    /**
     * Continues a previous execution of 'plan'. Entries already moved are left alone; pending,
     * failed and skipped entries are applied again.
     */
    ExecutionSummary resume(const PlacementPlan& plan,
                            const ExecutionSummary& previous,
                            const CancellationToken& token = CancellationToken::uncancelable());

private:
    ExecutionSummary _run(const PlacementPlan& plan,
                          std::vector<ExecutionRecord> records,
                          const CancellationToken& token);

    void _applyEntry(const PlacementPlan& plan, std::size_t index, ExecutionRecord* record);

    Status _ensureSplit(const PlacementPlan& plan,
                        const PlacementEntry& entry,
                        ExecutionRecord* record);

    Status _ensureMoved(const PlacementPlan& plan,
                        const PlacementEntry& entry,
                        ExecutionRecord* record);

    ClusterControlPlane* const _controlPlane;
    const PlacementExecutorParams _params;
};

}  // namespace shardplan
