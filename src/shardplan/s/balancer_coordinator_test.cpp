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

#include "shardplan/s/balancer_coordinator.h"

#include "shardplan/s/in_memory_cluster.h"
#include "shardplan/unittest/unittest.h"

#include <string>
#include <utility>

namespace shardplan {
namespace {

class BalancerCoordinatorTest : public unittest::Test {
public:
    static constexpr std::int32_t kMaxRetryAttempts = 3;

    static constexpr DefaultRetryStrategy::RetryParameters kRetryParameters{
        kMaxRetryAttempts, Milliseconds{0}, Milliseconds{0}};

    static inline const Status kUnreachable{ErrorCodes::HostUnreachable, "config server down"};

    bool balancerEnabled() {
        return uassertStatusOK(cluster.getBalancerState(Milliseconds{1000}));
    }

    InMemoryCluster cluster{{ShardType{"shard1", "shard1.example.net:27018", "shard1-rs"}}};
    BalancerCoordinator coordinator{&cluster, kRetryParameters, Milliseconds{1000}};
};

TEST_F(BalancerCoordinatorTest, SuspendAndResume) {
    ASSERT(uassertStatusOK(coordinator.isBalancerEnabled()));

    ASSERT_OK(coordinator.suspend());
    ASSERT_FALSE(balancerEnabled());

    ASSERT_OK(coordinator.resume());
    ASSERT(balancerEnabled());
    ASSERT_EQ(2, cluster.getCounts().balancerStateChanges);
}

TEST_F(BalancerCoordinatorTest, SuspendIsIdempotent) {
    ASSERT_OK(coordinator.suspend());
    ASSERT_OK(coordinator.suspend());
    ASSERT_FALSE(balancerEnabled());

    // The second call observes the balancer disabled and issues no change.
    ASSERT_EQ(1, cluster.getCounts().balancerStateRequests);
}

TEST_F(BalancerCoordinatorTest, ResumeWithoutSuspendDoesNotDisable) {
    ASSERT_OK(coordinator.resume());
    ASSERT(balancerEnabled());
    ASSERT_EQ(0, cluster.getCounts().balancerStateRequests);
}

TEST_F(BalancerCoordinatorTest, TransientFailuresAreRetried) {
    cluster.failNextCalls(InMemoryCluster::Operation::kSetBalancerState, 2, kUnreachable);
    ASSERT_OK(coordinator.suspend());
    ASSERT_FALSE(balancerEnabled());
    ASSERT_EQ(3, cluster.getCounts().balancerStateRequests);
}

TEST_F(BalancerCoordinatorTest, ExhaustedRetriesFailWithBalancerStateError) {
    cluster.failNextCalls(
        InMemoryCluster::Operation::kSetBalancerState, kMaxRetryAttempts + 1, kUnreachable);
    auto status = coordinator.suspend();
    ASSERT_STATUS_CODE(ErrorCodes::BalancerStateError, status);
    ASSERT_NE(std::string::npos, status.reason().find("config server down"));
    ASSERT(balancerEnabled());
    ASSERT_EQ(kMaxRetryAttempts + 1, cluster.getCounts().balancerStateRequests);
}

TEST_F(BalancerCoordinatorTest, UnreadableStateFailsWithBalancerStateError) {
    cluster.failNextCalls(
        InMemoryCluster::Operation::kGetBalancerState, kMaxRetryAttempts + 1, kUnreachable);
    ASSERT_STATUS_CODE(ErrorCodes::BalancerStateError, coordinator.isBalancerEnabled());
}

TEST_F(BalancerCoordinatorTest, NonRetriableFailureIsNotRetried) {
    cluster.failNextCalls(InMemoryCluster::Operation::kSetBalancerState,
                          1,
                          Status(ErrorCodes::IllegalOperation, "not authorized"));
    ASSERT_STATUS_CODE(ErrorCodes::BalancerStateError, coordinator.suspend());
    ASSERT_EQ(1, cluster.getCounts().balancerStateRequests);
}

TEST_F(BalancerCoordinatorTest, ScopedSuspensionRestoresBalancer) {
    {
        auto suspension = uassertStatusOK(ScopedBalancerSuspension::acquire(&coordinator));
        ASSERT(suspension.wasEnabled());
        ASSERT_FALSE(balancerEnabled());
    }
    ASSERT(balancerEnabled());
}

TEST_F(BalancerCoordinatorTest, ScopedSuspensionLeavesDisabledBalancerDisabled) {
    cluster.setBalancerEnabled_forTest(false);
    {
        auto suspension = uassertStatusOK(ScopedBalancerSuspension::acquire(&coordinator));
        ASSERT_FALSE(suspension.wasEnabled());
        ASSERT_OK(suspension.release());
    }
    ASSERT_FALSE(balancerEnabled());
    ASSERT_EQ(0, cluster.getCounts().balancerStateRequests);
}

TEST_F(BalancerCoordinatorTest, ScopedSuspensionReleaseIsIdempotent) {
    auto suspension = uassertStatusOK(ScopedBalancerSuspension::acquire(&coordinator));
    ASSERT_OK(suspension.release());
    ASSERT(balancerEnabled());

    ASSERT_OK(coordinator.suspend());
    ASSERT_OK(suspension.release());
    ASSERT_FALSE(balancerEnabled());
}

TEST_F(BalancerCoordinatorTest, ScopedSuspensionSurvivesMove) {
    {
        auto swSuspension = ScopedBalancerSuspension::acquire(&coordinator);
        ASSERT_OK(swSuspension);
        auto moved = std::move(swSuspension.getValue());
        ASSERT_FALSE(balancerEnabled());
    }
    ASSERT(balancerEnabled());
    ASSERT_EQ(2, cluster.getCounts().balancerStateChanges);
}

TEST_F(BalancerCoordinatorTest, AcquireFailsWhenSuspendFails) {
    cluster.failNextCalls(
        InMemoryCluster::Operation::kSetBalancerState, kMaxRetryAttempts + 1, kUnreachable);
    ASSERT_STATUS_CODE(ErrorCodes::BalancerStateError,
                       ScopedBalancerSuspension::acquire(&coordinator));
    ASSERT(balancerEnabled());
}

TEST_F(BalancerCoordinatorTest, RunWithBalancerSuspended) {
    bool ran = false;
    auto status = runWithBalancerSuspended(&coordinator, [&] {
        ran = true;
        EXPECT_FALSE(balancerEnabled());
        return Status::OK();
    });
    ASSERT_OK(status);
    ASSERT(ran);
    ASSERT(balancerEnabled());
}

TEST_F(BalancerCoordinatorTest, BalancerRestoredWhenWorkFails) {
    auto status = runWithBalancerSuspended(
        &coordinator, [&] { return Status(ErrorCodes::PlacementFailed, "move failed"); });
    ASSERT_STATUS_CODE(ErrorCodes::PlacementFailed, status);
    ASSERT(balancerEnabled());
}

TEST_F(BalancerCoordinatorTest, BalancerRestoredWhenWorkThrows) {
    auto status = runWithBalancerSuspended(&coordinator, [&]() -> Status {
        uasserted(ErrorCodes::InternalError, "boom");
    });
    ASSERT_STATUS_CODE(ErrorCodes::InternalError, status);
    ASSERT(balancerEnabled());
}

TEST_F(BalancerCoordinatorTest, WorkErrorTakesPrecedenceOverResumeError) {
    auto status = runWithBalancerSuspended(&coordinator, [&] {
        cluster.failNextCalls(
            InMemoryCluster::Operation::kSetBalancerState, kMaxRetryAttempts + 1, kUnreachable);
        return Status(ErrorCodes::PlacementFailed, "move failed");
    });
    ASSERT_STATUS_CODE(ErrorCodes::PlacementFailed, status);
    ASSERT_FALSE(balancerEnabled());
}

TEST_F(BalancerCoordinatorTest, ResumeErrorReportedWhenWorkSucceeds) {
    auto status = runWithBalancerSuspended(&coordinator, [&] {
        cluster.failNextCalls(
            InMemoryCluster::Operation::kSetBalancerState, kMaxRetryAttempts + 1, kUnreachable);
        return Status::OK();
    });
    ASSERT_STATUS_CODE(ErrorCodes::BalancerStateError, status);
}

}  // namespace
}  // namespace shardplan
