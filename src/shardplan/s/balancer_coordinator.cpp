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

#define SHARDPLAN_LOGV2_DEFAULT_COMPONENT ::shardplan::logv2::LogComponent::kBalancer

#include "shardplan/s/balancer_coordinator.h"

#include "shardplan/logv2/log.h"
#include "shardplan/s/cluster_control_plane.h"
#include "shardplan/util/str.h"

namespace shardplan {

BalancerCoordinator::BalancerCoordinator(ClusterControlPlane* controlPlane,
                                         DefaultRetryStrategy::RetryParameters retryParameters,
                                         Milliseconds operationTimeout)
    : _controlPlane(controlPlane),
      _retryParameters(retryParameters),
      _operationTimeout(operationTimeout) {
    invariant(_controlPlane);
}

StatusWith<bool> BalancerCoordinator::isBalancerEnabled() {
    DefaultRetryStrategy strategy(_retryParameters);
    auto swEnabled = runWithRetryStrategy(
        strategy, [&] { return _controlPlane->getBalancerState(_operationTimeout); });
    if (!swEnabled.isOK()) {
        return Status(ErrorCodes::BalancerStateError,
                      str::stream() << "Failed to read the balancer state after "
                                    << strategy.getAttemptCount() << " attempts"
                                    << causedBy(swEnabled.getStatus()));
    }
    return swEnabled;
}

Status BalancerCoordinator::suspend() {
    auto swEnabled = isBalancerEnabled();
    if (!swEnabled.isOK()) {
        return swEnabled.getStatus().withContext("Failed to suspend the balancer");
    }

    if (!swEnabled.getValue()) {
        LOGV2_DEBUG(9180, 1, "Balancer is already suspended");
        return Status::OK();
    }

    if (auto status = _setBalancerState(false); !status.isOK()) {
        return status;
    }

    LOGV2(9181, "Suspended the automatic balancer");
    return Status::OK();
}

Status BalancerCoordinator::resume() {
    auto swEnabled = isBalancerEnabled();
    if (!swEnabled.isOK()) {
        return swEnabled.getStatus().withContext("Failed to resume the balancer");
    }

    if (swEnabled.getValue()) {
        LOGV2_DEBUG(9182, 1, "Balancer is already running");
        return Status::OK();
    }

    if (auto status = _setBalancerState(true); !status.isOK()) {
        return status;
    }

    LOGV2(9183, "Resumed the automatic balancer");
    return Status::OK();
}

Status BalancerCoordinator::_setBalancerState(bool enabled) {
    DefaultRetryStrategy strategy(_retryParameters);
    auto status = runWithRetryStrategy(
        strategy, [&] { return _controlPlane->setBalancerState(enabled, _operationTimeout); });
    if (!status.isOK()) {
        LOGV2_WARNING(9184,
                      "Failed to change the balancer state",
                      "enabled"_attr = enabled,
                      "attempts"_attr = strategy.getAttemptCount(),
                      "error"_attr = status);
        return Status(ErrorCodes::BalancerStateError,
                      str::stream() << "Failed to " << (enabled ? "resume" : "suspend")
                                    << " the balancer after " << strategy.getAttemptCount()
                                    << " attempts" << causedBy(status));
    }
    return Status::OK();
}

StatusWith<ScopedBalancerSuspension> ScopedBalancerSuspension::acquire(
    BalancerCoordinator* coordinator) {
    auto swEnabled = coordinator->isBalancerEnabled();
    if (!swEnabled.isOK()) {
        return swEnabled.getStatus().withContext("Failed to suspend the balancer");
    }

    const bool wasEnabled = swEnabled.getValue();
    if (wasEnabled) {
        if (auto status = coordinator->suspend(); !status.isOK()) {
            return status;
        }
    } else {
        LOGV2(9185, "Balancer was disabled before placement, it will be left disabled");
    }

    return ScopedBalancerSuspension(coordinator, wasEnabled);
}

ScopedBalancerSuspension::~ScopedBalancerSuspension() {
    auto status = release();
    if (!status.isOK()) {
        LOGV2_ERROR(9186, "Failed to resume the balancer", "error"_attr = status);
    }
}

Status ScopedBalancerSuspension::release() {
    auto coordinator = std::exchange(_coordinator, nullptr);
    if (!coordinator || !_wasEnabled) {
        return Status::OK();
    }
    return coordinator->resume();
}

}  // namespace shardplan
