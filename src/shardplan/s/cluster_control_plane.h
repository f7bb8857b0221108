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
#include "shardplan/s/catalog/type_chunk.h"
#include "shardplan/s/catalog/type_shard.h"
#include "shardplan/s/key_range.h"
#include "shardplan/s/shard_key.h"
#include "shardplan/util/duration.h"

#include <vector>

namespace shardplan {

/**
 * The cluster's metadata control plane (a mongos router or config server). All metadata
 * changes go through it; it serializes conflicting operations itself.
 *
 * Every call bounds its wait by 'timeout' and reports ExceededTimeLimit when it expires.
 * Implementations must be safe to call from several threads at once.
 */
class ClusterControlPlane {
public:
    virtual ~ClusterControlPlane() = default;

    virtual StatusWith<std::vector<ShardType>> listShards(Milliseconds timeout) = 0;

    /**
     * Returns the chunks of 'nss' sorted by their lower bound.
     */
    virtual StatusWith<std::vector<ChunkType>> listChunks(const NamespaceString& nss,
                                                          Milliseconds timeout) = 0;

    /**
     * Splits the chunk containing 'boundary' so that 'boundary' becomes a chunk lower bound.
     * Splitting at an existing boundary succeeds without changing anything.
     */
    virtual Status splitAt(const NamespaceString& nss,
                           const ShardKey& boundary,
                           Milliseconds timeout) = 0;

    /**
     * Migrates the chunk whose lower bound is range.getMin() to 'toShard'. Fails with
     * ShardNotFound for an unknown shard and with IllegalOperation if no chunk starts at
     * range.getMin(). Moving a chunk onto the shard which already owns it succeeds without
     * changing anything.
     */
    virtual Status moveRange(const NamespaceString& nss,
                             const KeyRange& range,
                             const ShardId& toShard,
                             Milliseconds timeout) = 0;

    virtual Status setBalancerState(bool enabled, Milliseconds timeout) = 0;

    virtual StatusWith<bool> getBalancerState(Milliseconds timeout) = 0;
};

}  // namespace shardplan
