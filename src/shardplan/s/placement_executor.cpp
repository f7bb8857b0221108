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

#define SHARDPLAN_LOGV2_DEFAULT_COMPONENT ::shardplan::logv2::LogComponent::kExecutor

#include "shardplan/s/placement_executor.h"

#include "shardplan/logv2/log.h"
#include "shardplan/s/cluster_control_plane.h"
#include "shardplan/util/assert_util.h"
#include "shardplan/util/str.h"

#include <algorithm>
#include <exception>
#include <ostream>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/optional.hpp>

namespace shardplan {
namespace {

/**
 * Returns the shard owning the chunk whose lower bound is 'lowerBound', or none if no chunk
 * starts there.
 */
StatusWith<boost::optional<ShardId>> findChunkStartingAt(ClusterControlPlane* controlPlane,
                                                         const NamespaceString& nss,
                                                         const ShardKey& lowerBound,
                                                         const PlacementExecutorParams& params) {
    DefaultRetryStrategy strategy(params.retryParameters);
    auto swChunks = runWithRetryStrategy(
        strategy, [&] { return controlPlane->listChunks(nss, params.operationTimeout); });
    if (!swChunks.isOK()) {
        return swChunks.getStatus().withContext(str::stream()
                                                << "Failed to list the chunks of " << nss);
    }

    const auto& chunks = swChunks.getValue();
    auto it = std::find_if(chunks.begin(), chunks.end(), [&](const ChunkType& chunk) {
        return chunk.range.getMin() == lowerBound;
    });
    if (it == chunks.end()) {
        return boost::optional<ShardId>();
    }
    return boost::optional<ShardId>(it->shard);
}

}  // namespace

std::string toString(EntryState state) {
    switch (state) {
        case EntryState::kPending:
            return "pending";
        case EntryState::kSplitDone:
            return "split-done";
        case EntryState::kMoved:
            return "moved";
        case EntryState::kFailed:
            return "failed";
        case EntryState::kSkipped:
            return "skipped";
    }
    SHARDPLAN_UNREACHABLE;
}

std::ostream& operator<<(std::ostream& os, EntryState state) {
    return os << toString(state);
}

std::string ExecutionSummary::toString() const {
    return str::stream() << "{ entries: " << records.size() << ", split: " << numSplit
                         << ", moved: " << numMoved << ", failed: " << numFailed
                         << ", skipped: " << numSkipped << " }";
}

PlacementExecutor::PlacementExecutor(ClusterControlPlane* controlPlane,
                                     PlacementExecutorParams params)
    : _controlPlane(controlPlane), _params(std::move(params)) {
    invariant(_controlPlane);
    invariant(_params.concurrency >= 1);
}

ExecutionSummary PlacementExecutor::execute(const PlacementPlan& plan,
                                            const CancellationToken& token) {
    return _run(plan, std::vector<ExecutionRecord>(plan.size()), token);
}

ExecutionSummary PlacementExecutor::resume(const PlacementPlan& plan,
                                           const ExecutionSummary& previous,
                                           const CancellationToken& token) {
    invariant(previous.records.size() == plan.size());

    std::vector<ExecutionRecord> records(plan.size());
    for (std::size_t i = 0; i < plan.size(); ++i) {
        if (previous.records[i].isDone()) {
            records[i].state = EntryState::kMoved;
            records[i].attempts = previous.records[i].attempts;
        }
    }
    return _run(plan, std::move(records), token);
}

ExecutionSummary PlacementExecutor::_run(const PlacementPlan& plan,
                                         std::vector<ExecutionRecord> records,
                                         const CancellationToken& token) {
    const auto numAlreadyMoved = std::count_if(
        records.begin(), records.end(), [](const ExecutionRecord& r) { return r.isDone(); });

    LOGV2(9190,
          "Applying placement plan",
          "namespace"_attr = plan.getNss(),
          "numEntries"_attr = plan.size(),
          "numAlreadyMoved"_attr = numAlreadyMoved,
          "concurrency"_attr = _params.concurrency);

    {
        boost::asio::thread_pool pool(static_cast<std::size_t>(_params.concurrency));
        for (std::size_t i = 0; i < plan.size(); ++i) {
            if (records[i].isDone())
                continue;

            // Each task writes only its own record.
            boost::asio::post(pool, [this, &plan, &records, &token, i] {
                if (token.isCanceled()) {
                    records[i].state = EntryState::kSkipped;
                    return;
                }
                _applyEntry(plan, i, &records[i]);
            });
        }
        pool.join();
    }

    ExecutionSummary summary;
    summary.records = std::move(records);
    for (const auto& record : summary.records) {
        if (record.splitIssued)
            ++summary.numSplit;

        switch (record.state) {
            case EntryState::kMoved:
                ++summary.numMoved;
                break;
            case EntryState::kFailed:
                ++summary.numFailed;
                break;
            case EntryState::kSkipped:
                ++summary.numSkipped;
                break;
            case EntryState::kPending:
            case EntryState::kSplitDone:
                break;
        }
    }

    if (summary.numFailed > 0) {
        LOGV2_WARNING(9191,
                      "Placement plan applied with failures",
                      "namespace"_attr = plan.getNss(),
                      "summary"_attr = summary);
    } else {
        LOGV2(9192,
              "Placement plan applied",
              "namespace"_attr = plan.getNss(),
              "summary"_attr = summary);
    }

    return summary;
}

void PlacementExecutor::_applyEntry(const PlacementPlan& plan,
                                    std::size_t index,
                                    ExecutionRecord* record) {
    const auto& entry = plan.getEntry(index);

    auto status = [&]() -> Status {
        try {
            if (auto splitStatus = _ensureSplit(plan, entry, record); !splitStatus.isOK()) {
                return splitStatus;
            }
            record->state = EntryState::kSplitDone;

            return _ensureMoved(plan, entry, record);
        } catch (const std::exception&) {
            return Status(ErrorCodes::PlacementFailed,
                          str::stream() << "Unexpected error applying " << entry.toString()
                                        << causedBy(exceptionToStatus()));
        }
    }();

    if (!status.isOK()) {
        record->state = EntryState::kFailed;
        record->lastError = status;
        LOGV2_WARNING(9193,
                      "Failed to apply placement entry",
                      "index"_attr = index,
                      "range"_attr = entry.range,
                      "toShard"_attr = entry.targetShard,
                      "attempts"_attr = record->attempts,
                      "error"_attr = status);
        return;
    }

    record->state = EntryState::kMoved;
    LOGV2_DEBUG(9194,
                1,
                "Applied placement entry",
                "index"_attr = index,
                "range"_attr = entry.range,
                "toShard"_attr = entry.targetShard,
                "splitIssued"_attr = record->splitIssued,
                "moveIssued"_attr = record->moveIssued);
}

Status PlacementExecutor::_ensureSplit(const PlacementPlan& plan,
                                       const PlacementEntry& entry,
                                       ExecutionRecord* record) {
    const auto& lowerBound = entry.range.getMin();

    // The global minimum always starts a chunk.
    if (lowerBound.isGlobalMin())
        return Status::OK();

    auto swOwner = findChunkStartingAt(_controlPlane, plan.getNss(), lowerBound, _params);
    if (!swOwner.isOK()) {
        return Status(ErrorCodes::PlacementFailed,
                      str::stream() << "Could not check whether " << lowerBound
                                    << " is already a chunk boundary"
                                    << causedBy(swOwner.getStatus()));
    }
    if (swOwner.getValue())
        return Status::OK();

    DefaultRetryStrategy strategy(_params.retryParameters);
    record->splitIssued = true;
    auto status = runWithRetryStrategy(strategy, [&] {
        ++record->attempts;
        return _controlPlane->splitAt(plan.getNss(), lowerBound, _params.operationTimeout);
    });
    if (!status.isOK()) {
        return Status(ErrorCodes::PlacementFailed,
                      str::stream() << "Failed to split at " << lowerBound << " after "
                                    << strategy.getAttemptCount() << " attempts"
                                    << causedBy(status));
    }
    return Status::OK();
}

Status PlacementExecutor::_ensureMoved(const PlacementPlan& plan,
                                       const PlacementEntry& entry,
                                       ExecutionRecord* record) {
    auto swOwner = findChunkStartingAt(_controlPlane, plan.getNss(), entry.range.getMin(), _params);
    if (!swOwner.isOK()) {
        return Status(ErrorCodes::PlacementFailed,
                      str::stream() << "Could not find the owner of " << entry.range.toString()
                                    << causedBy(swOwner.getStatus()));
    }

    const auto& owner = swOwner.getValue();
    if (!owner) {
        return Status(ErrorCodes::PlacementFailed,
                      str::stream() << "No chunk starts at " << entry.range.getMin()
                                    << " after splitting");
    }
    if (*owner == entry.targetShard)
        return Status::OK();

    DefaultRetryStrategy strategy(_params.retryParameters);
    record->moveIssued = true;
    auto status = runWithRetryStrategy(strategy, [&] {
        ++record->attempts;
        return _controlPlane->moveRange(
            plan.getNss(), entry.range, entry.targetShard, _params.operationTimeout);
    });
    if (!status.isOK()) {
        return Status(ErrorCodes::PlacementFailed,
                      str::stream() << "Failed to move " << entry.range.toString() << " from "
                                    << *owner << " to " << entry.targetShard << " after "
                                    << strategy.getAttemptCount() << " attempts"
                                    << causedBy(status));
    }
    return Status::OK();
}

}  // namespace shardplan
