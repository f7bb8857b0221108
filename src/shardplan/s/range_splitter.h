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
#include "shardplan/s/key_range.h"
#include "shardplan/s/shard_key.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace shardplan {

/**
 * The set of distinct primary key values a collection is expected to hold: either the inclusive
 * integer range [min, max] or an explicit, strictly ascending list of strings.
 */
class KeyDomain {
public:
    struct IntegerRange {
        std::int64_t min;
        std::int64_t max;
    };

    static KeyDomain integerRange(std::int64_t min, std::int64_t max) {
        return KeyDomain(IntegerRange{min, max});
    }

    static KeyDomain stringValues(std::vector<std::string> values) {
        return KeyDomain(std::move(values));
    }

    /**
     * Returns InvalidDomain if the domain holds no values, if an integer domain spans every
     * int64 value, or for string domains, if the values are not strictly ascending.
     */
    Status validate() const;

    /**
     * Number of distinct values. Only meaningful for a valid domain.
     */
    std::size_t size() const;

    /**
     * The value at 'index' in ascending order, 0 <= index < size().
     */
    KeyValue valueAt(std::size_t index) const;

    bool isIntegerRange() const {
        return std::holds_alternative<IntegerRange>(_values);
    }

    std::string toString() const;

private:
    explicit KeyDomain(std::variant<IntegerRange, std::vector<std::string>> values)
        : _values(std::move(values)) {}

    std::variant<IntegerRange, std::vector<std::string>> _values;
};

/**
 * Computes the chunk boundaries of an initial split. Pure and deterministic: the same domain and
 * split count always produce the same ranges.
 */
class RangeSplitter {
public:
    /**
     * Returns the 'splitCount' + 1 boundary points, from globalMin to globalMax. Interior
     * boundary i is { v, MinKey } where v is the domain value at position
     * floor(i * N / splitCount), N being the domain size.
     *
     * Fails with InvalidDomain if 'splitCount' < 1, the domain is malformed, or the domain has
     * fewer values than 'splitCount'.
     */
    static StatusWith<std::vector<ShardKey>> computeBoundaries(const KeyDomain& domain,
                                                               std::int64_t splitCount);

    /**
     * Returns the 'splitCount' contiguous, non-overlapping ranges covering the whole key space.
     */
    static StatusWith<std::vector<KeyRange>> split(const KeyDomain& domain,
                                                   std::int64_t splitCount);
};

}  // namespace shardplan
