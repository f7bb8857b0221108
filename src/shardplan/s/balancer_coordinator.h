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
#include "shardplan/util/assert_util.h"
#include "shardplan/util/duration.h"

#include <functional>
#include <utility>

namespace shardplan {

class ClusterControlPlane;

/**
 * Pauses and resumes the cluster's automatic balancer around bulk placement work so that the
 * balancer does not migrate chunks which are being placed.
 *
 * Control plane failures are retried with backoff. Running out of attempts yields
 * BalancerStateError naming the operation and the underlying cause.
 */
class BalancerCoordinator {
public:
    BalancerCoordinator(ClusterControlPlane* controlPlane,
                        DefaultRetryStrategy::RetryParameters retryParameters,
                        Milliseconds operationTimeout);

    /**
     * Returns whether the automatic balancer is currently enabled.
     */
    StatusWith<bool> isBalancerEnabled();

    /**
     * Disables the automatic balancer. Succeeds without issuing a change if it is already
     * disabled.
     */
    Status suspend();

    /**
     * Enables the automatic balancer. Succeeds without issuing a change if it is already
     * enabled. Never disables the balancer.
     */
    Status resume();

private:
    Status _setBalancerState(bool enabled);

    ClusterControlPlane* const _controlPlane;
    const DefaultRetryStrategy::RetryParameters _retryParameters;
    const Milliseconds _operationTimeout;
};

/**
 * Keeps the balancer suspended for its lifetime. On destruction the balancer is resumed, unless
 * it was already disabled when the suspension began, in which case it is left disabled.
 */
class ScopedBalancerSuspension {
public:
    /**
     * Records the current balancer state and suspends it.
     */
    static StatusWith<ScopedBalancerSuspension> acquire(BalancerCoordinator* coordinator);

    ScopedBalancerSuspension(ScopedBalancerSuspension&& other) noexcept
        : _coordinator(std::exchange(other._coordinator, nullptr)),
          _wasEnabled(other._wasEnabled) {}

    ScopedBalancerSuspension& operator=(ScopedBalancerSuspension&&) = delete;
    ScopedBalancerSuspension(const ScopedBalancerSuspension&) = delete;
    ScopedBalancerSuspension& operator=(const ScopedBalancerSuspension&) = delete;

    ~ScopedBalancerSuspension();

    /**
     * Ends the suspension early and reports the outcome of resuming. Calling it again, or
     * destroying the object afterwards, does nothing.
     */
    Status release();

    bool wasEnabled() const {
        return _wasEnabled;
    }

private:
    ScopedBalancerSuspension(BalancerCoordinator* coordinator, bool wasEnabled)
        : _coordinator(coordinator), _wasEnabled(wasEnabled) {}

    BalancerCoordinator* _coordinator;
    bool _wasEnabled;
};

/**
 * Runs 'work' with the balancer suspended and restores it on every exit path, including when
 * 'work' fails or throws. An error from 'work' takes precedence over an error restoring the
 * balancer.
 */
template <typename Work>
Status runWithBalancerSuspended(BalancerCoordinator* coordinator, Work&& work) {
    auto swSuspension = ScopedBalancerSuspension::acquire(coordinator);
    if (!swSuspension.isOK()) {
        return swSuspension.getStatus();
    }
    auto suspension = std::move(swSuspension.getValue());

    Status workStatus = [&]() -> Status {
        try {
            return work();
        } catch (const DBException& ex) {
            return ex.toStatus();
        }
    }();

    Status releaseStatus = suspension.release();
    if (!workStatus.isOK()) {
        return workStatus;
    }
    return releaseStatus;
}

}  // namespace shardplan
