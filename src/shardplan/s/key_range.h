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
#include "shardplan/s/shard_key.h"

#include <string>
#include <vector>

namespace shardplan {

/**
 * Half-open interval [lowerBound, upperBound) of the composite key space.
 */
class KeyRange {
public:
    KeyRange(ShardKey lowerBound, ShardKey upperBound);

    const ShardKey& getMin() const {
        return _min;
    }

    const ShardKey& getMax() const {
        return _max;
    }

    bool containsKey(const ShardKey& key) const {
        return _min <= key && key < _max;
    }

    /**
     * Returns true if the two half-open ranges share at least one key.
     */
    bool overlaps(const KeyRange& other) const {
        return _min < other._max && other._min < _max;
    }

    /**
     * The whole key space, [globalMin, globalMax).
     */
    static KeyRange all() {
        return KeyRange(ShardKey::globalMin(), ShardKey::globalMax());
    }

    std::string toString() const;
    std::string toString(const ShardKeyPattern& pattern) const;

    bool operator==(const KeyRange& other) const {
        return _min == other._min && _max == other._max;
    }

private:
    ShardKey _min;
    ShardKey _max;
};

/**
 * Checks that 'ranges' are sorted, contiguous, non-empty and together cover
 * [globalMin, globalMax) with no gaps or overlaps.
 */
Status validatePartition(const std::vector<KeyRange>& ranges);

}  // namespace shardplan
