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
#include "shardplan/s/catalog/type_shard.h"
#include "shardplan/s/key_range.h"

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace shardplan {

/**
 * One unit of placement work: the range to carve out and the shard it should live on.
 */
struct PlacementEntry {
    KeyRange range;
    ShardId targetShard;

    std::string toString() const {
        return range.toString() + " -> " + targetShard;
    }

    bool operator==(const PlacementEntry& other) const {
        return range == other.range && targetShard == other.targetShard;
    }
};

/**
 * Ordered, immutable list of placement entries for one collection. Every range appears exactly
 * once and the ranges, in order, partition the whole key space.
 */
class PlacementPlan {
public:
    /**
     * Builds a plan after checking that the entries' ranges partition the key space and that
     * every entry names a target shard. Returns BadValue otherwise.
     */
    static StatusWith<PlacementPlan> make(NamespaceString nss, std::vector<PlacementEntry> entries);

    const NamespaceString& getNss() const {
        return _nss;
    }

    const std::vector<PlacementEntry>& getEntries() const {
        return _entries;
    }

    const PlacementEntry& getEntry(std::size_t index) const {
        return _entries.at(index);
    }

    std::size_t size() const {
        return _entries.size();
    }

    /**
     * Number of ranges planned onto each shard. Shards without ranges are absent.
     */
    std::map<ShardId, std::size_t> countsPerShard() const;

    /**
     * Indexes of the entries planned onto 'shard', ascending.
     */
    std::vector<std::size_t> entriesForShard(const ShardId& shard) const;

private:
    PlacementPlan(NamespaceString nss, std::vector<PlacementEntry> entries)
        : _nss(std::move(nss)), _entries(std::move(entries)) {}

    NamespaceString _nss;
    std::vector<PlacementEntry> _entries;
};

}  // namespace shardplan
