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

#include "shardplan/s/shard_topology.h"

#include "shardplan/s/in_memory_cluster.h"
#include "shardplan/unittest/unittest.h"

#include <vector>

namespace shardplan {
namespace {

class ShardTopologyTest : public unittest::Test {
public:
    static ShardType makeShard(const ShardId& id) {
        return ShardType{id, id + ".example.net:27018", id + "-rs"};
    }

    static constexpr Milliseconds kTimeout{1000};
};

TEST_F(ShardTopologyTest, FromShardsSortsById) {
    auto swTopology =
        ShardTopology::fromShards({makeShard("shard3"), makeShard("shard1"), makeShard("shard2")});
    ASSERT_OK(swTopology);

    const auto& topology = swTopology.getValue();
    ASSERT_EQ(3U, topology.size());
    ASSERT_EQ((std::vector<ShardId>{"shard1", "shard2", "shard3"}), topology.getShardIds());
}

TEST_F(ShardTopologyTest, NumberedShardsSortByNumber) {
    auto topology = uassertStatusOK(ShardTopology::fromShards({makeShard("shard10"),
                                                               makeShard("shard2"),
                                                               makeShard("shard11"),
                                                               makeShard("shard1"),
                                                               makeShard("shard3")}));
    ASSERT_EQ((std::vector<ShardId>{"shard1", "shard2", "shard3", "shard10", "shard11"}),
              topology.getShardIds());

    auto selected = uassertStatusOK(topology.selectShards(3));
    ASSERT_EQ("shard1", selected[0].name);
    ASSERT_EQ("shard2", selected[1].name);
    ASSERT_EQ("shard3", selected[2].name);
}

TEST(ShardIdLessThanTest, ComparesDigitRunsByValue) {
    ASSERT_TRUE(shardIdLessThan("shard2", "shard10"));
    ASSERT_FALSE(shardIdLessThan("shard10", "shard2"));
    ASSERT_TRUE(shardIdLessThan("rs2-shard9", "rs10-shard1"));
    ASSERT_TRUE(shardIdLessThan("shard", "shard1"));
    ASSERT_TRUE(shardIdLessThan("alpha", "beta"));
    ASSERT_FALSE(shardIdLessThan("shard7", "shard7"));

    // Equal values differing only in leading zeros still have a strict order.
    ASSERT_NE(shardIdLessThan("shard01", "shard1"), shardIdLessThan("shard1", "shard01"));
}

TEST_F(ShardTopologyTest, FromShardsRejectsDuplicates) {
    ASSERT_STATUS_CODE(ErrorCodes::DuplicateKey,
                       ShardTopology::fromShards({makeShard("shard1"), makeShard("shard1")}));
}

TEST_F(ShardTopologyTest, FromShardsRejectsEmptyId) {
    ASSERT_STATUS_CODE(ErrorCodes::BadValue, ShardTopology::fromShards({makeShard("")}));
}

TEST_F(ShardTopologyTest, FindShard) {
    auto topology = uassertStatusOK(ShardTopology::fromShards({makeShard("shard1")}));

    auto shard = topology.findShard("shard1");
    ASSERT(shard);
    ASSERT_EQ("shard1-rs", shard->replicaSetName);
    ASSERT(topology.contains("shard1"));
    ASSERT_FALSE(topology.contains("shard9"));
    ASSERT_FALSE(topology.findShard("shard9"));
}

TEST_F(ShardTopologyTest, RefreshReplacesSnapshot) {
    InMemoryCluster cluster({makeShard("shard2"), makeShard("shard1")});

    ShardTopology topology;
    ASSERT(topology.empty());
    ASSERT_OK(topology.refresh(&cluster, kTimeout));
    ASSERT_EQ((std::vector<ShardId>{"shard1", "shard2"}), topology.getShardIds());

    cluster.setShards({makeShard("shard1"), makeShard("shard2"), makeShard("shard3")});
    ASSERT_OK(topology.refresh(&cluster, kTimeout));
    ASSERT_EQ(3U, topology.size());
}

TEST_F(ShardTopologyTest, RefreshKeepsSnapshotOnDuplicateIds) {
    InMemoryCluster cluster({makeShard("shard1"), makeShard("shard2")});

    ShardTopology topology;
    ASSERT_OK(topology.refresh(&cluster, kTimeout));

    cluster.setShards({makeShard("shard1"), makeShard("shard1")});
    ASSERT_STATUS_CODE(ErrorCodes::DuplicateKey, topology.refresh(&cluster, kTimeout));
    ASSERT_EQ((std::vector<ShardId>{"shard1", "shard2"}), topology.getShardIds());
}

TEST_F(ShardTopologyTest, RefreshKeepsSnapshotOnControlPlaneError) {
    InMemoryCluster cluster({makeShard("shard1")});

    ShardTopology topology;
    ASSERT_OK(topology.refresh(&cluster, kTimeout));

    cluster.failNextCalls(InMemoryCluster::Operation::kListShards,
                          1,
                          Status(ErrorCodes::HostUnreachable, "config server down"));
    ASSERT_STATUS_CODE(ErrorCodes::HostUnreachable, topology.refresh(&cluster, kTimeout));
    ASSERT_EQ(1U, topology.size());
}

TEST_F(ShardTopologyTest, SelectAllShards) {
    auto topology = uassertStatusOK(
        ShardTopology::fromShards({makeShard("shard1"), makeShard("shard2"), makeShard("shard3")}));

    auto swSelected = topology.selectShards(0);
    ASSERT_OK(swSelected);
    ASSERT_EQ(3U, swSelected.getValue().size());
}

TEST_F(ShardTopologyTest, SelectFirstShardsInIdOrder) {
    auto topology = uassertStatusOK(
        ShardTopology::fromShards({makeShard("shard3"), makeShard("shard1"), makeShard("shard2")}));

    auto swSelected = topology.selectShards(2);
    ASSERT_OK(swSelected);
    ASSERT_EQ(2U, swSelected.getValue().size());
    ASSERT_EQ("shard1", swSelected.getValue()[0].name);
    ASSERT_EQ("shard2", swSelected.getValue()[1].name);
}

TEST_F(ShardTopologyTest, SelectMoreShardsThanPresent) {
    auto topology = uassertStatusOK(ShardTopology::fromShards({makeShard("shard1")}));
    ASSERT_STATUS_CODE(ErrorCodes::BadValue, topology.selectShards(3));
}

TEST_F(ShardTopologyTest, SelectFromEmptyTopology) {
    ShardTopology topology;
    ASSERT_STATUS_CODE(ErrorCodes::EmptyShardSet, topology.selectShards(0));
    ASSERT_STATUS_CODE(ErrorCodes::EmptyShardSet, topology.selectShards(2));
}

}  // namespace
}  // namespace shardplan
