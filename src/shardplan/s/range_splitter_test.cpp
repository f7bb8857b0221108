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

#include "shardplan/s/range_splitter.h"

#include "shardplan/unittest/unittest.h"

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace shardplan {
namespace {

class RangeSplitterTest : public unittest::Test {
public:
    static std::vector<KeyRange> split(const KeyDomain& domain, std::int64_t splitCount) {
        auto swRanges = RangeSplitter::split(domain, splitCount);
        uassertStatusOK(swRanges.getStatus());
        return std::move(swRanges.getValue());
    }
};

TEST_F(RangeSplitterTest, OneRangePerCategory) {
    auto ranges = split(KeyDomain::integerRange(0, 99), 100);
    ASSERT_EQ(100U, ranges.size());

    ASSERT(ranges.front().getMin().isGlobalMin());
    ASSERT_EQ(ShardKey::lowestFor(1), ranges.front().getMax());
    for (std::int64_t i = 1; i < 99; ++i) {
        ASSERT_EQ(ShardKey::lowestFor(i), ranges[i].getMin());
        ASSERT_EQ(ShardKey::lowestFor(i + 1), ranges[i].getMax());
    }
    ASSERT_EQ(ShardKey::lowestFor(99), ranges.back().getMin());
    ASSERT(ranges.back().getMax().isGlobalMax());
}

TEST_F(RangeSplitterTest, EveryProductOfACategoryFallsInOneRange) {
    auto ranges = split(KeyDomain::integerRange(0, 99), 100);
    for (std::int64_t category = 0; category < 100; ++category) {
        const auto& range = ranges[category];
        ASSERT(range.containsKey(ShardKey(category, MinKey)));
        ASSERT(range.containsKey(ShardKey(category, 0)));
        ASSERT(range.containsKey(ShardKey(category, std::numeric_limits<std::int64_t>::max())));
        ASSERT(range.containsKey(ShardKey(category, MaxKey)));
    }
}

TEST_F(RangeSplitterTest, RangesAreContiguousForUnevenSplits) {
    for (std::int64_t splitCount : {1, 3, 7, 10, 33, 64, 100}) {
        auto ranges = split(KeyDomain::integerRange(0, 99), splitCount);
        ASSERT_EQ(static_cast<std::size_t>(splitCount), ranges.size());
        ASSERT_OK(validatePartition(ranges));
    }
}

TEST_F(RangeSplitterTest, BoundariesFollowFloorFormula) {
    // N = 10, K = 3: interior boundaries at floor(10 / 3) = 3 and floor(20 / 3) = 6.
    auto swBoundaries = RangeSplitter::computeBoundaries(KeyDomain::integerRange(0, 9), 3);
    ASSERT_OK(swBoundaries);
    ASSERT_EQ((std::vector<ShardKey>{ShardKey::globalMin(),
                                     ShardKey::lowestFor(3),
                                     ShardKey::lowestFor(6),
                                     ShardKey::globalMax()}),
              swBoundaries.getValue());
}

TEST_F(RangeSplitterTest, OffsetIntegerDomain) {
    auto swBoundaries = RangeSplitter::computeBoundaries(KeyDomain::integerRange(1000, 1003), 2);
    ASSERT_OK(swBoundaries);
    ASSERT_EQ(ShardKey::lowestFor(1002), swBoundaries.getValue()[1]);
}

TEST_F(RangeSplitterTest, WideIntegerDomainDoesNotOverflow) {
    auto ranges = split(KeyDomain::integerRange(std::numeric_limits<std::int64_t>::min() / 2,
                                                std::numeric_limits<std::int64_t>::max() / 2),
                        1000);
    ASSERT_EQ(1000U, ranges.size());
    ASSERT_OK(validatePartition(ranges));
}

TEST_F(RangeSplitterTest, RejectsEveryInt64Value) {
    auto domain = KeyDomain::integerRange(std::numeric_limits<std::int64_t>::min(),
                                          std::numeric_limits<std::int64_t>::max());
    ASSERT_STATUS_CODE(ErrorCodes::InvalidDomain, domain.validate());
    ASSERT_STATUS_CODE(ErrorCodes::InvalidDomain, RangeSplitter::split(domain, 2));
}

TEST_F(RangeSplitterTest, LargestCountableIntegerDomain) {
    auto domain = KeyDomain::integerRange(std::numeric_limits<std::int64_t>::min() + 1,
                                          std::numeric_limits<std::int64_t>::max());
    ASSERT_OK(domain.validate());
    ASSERT_EQ(std::numeric_limits<std::uint64_t>::max(), domain.size());

    auto swBoundaries = RangeSplitter::computeBoundaries(domain, 2);
    ASSERT_OK(swBoundaries);
    ASSERT_EQ(ShardKey::lowestFor(0), swBoundaries.getValue()[1]);
}

TEST_F(RangeSplitterTest, SingleRangeCoversEverything) {
    auto ranges = split(KeyDomain::integerRange(5, 5), 1);
    ASSERT_EQ(1U, ranges.size());
    ASSERT_EQ(KeyRange::all(), ranges.front());
}

TEST_F(RangeSplitterTest, Deterministic) {
    auto first = split(KeyDomain::integerRange(0, 99), 17);
    auto second = split(KeyDomain::integerRange(0, 99), 17);
    ASSERT(first == second);
}

TEST_F(RangeSplitterTest, StringDomain) {
    auto domain = KeyDomain::stringValues({"apparel", "books", "garden", "music", "toys"});
    auto swBoundaries = RangeSplitter::computeBoundaries(domain, 2);
    ASSERT_OK(swBoundaries);
    ASSERT_EQ(3U, swBoundaries.getValue().size());
    ASSERT_EQ(ShardKey::lowestFor("garden"), swBoundaries.getValue()[1]);

    auto ranges = split(domain, 5);
    ASSERT_EQ(5U, ranges.size());
    ASSERT(ranges[2].containsKey(ShardKey("garden", 42)));
}

TEST_F(RangeSplitterTest, RejectsSplitCountBelowOne) {
    ASSERT_STATUS_CODE(ErrorCodes::InvalidDomain,
                       RangeSplitter::split(KeyDomain::integerRange(0, 99), 0));
    ASSERT_STATUS_CODE(ErrorCodes::InvalidDomain,
                       RangeSplitter::split(KeyDomain::integerRange(0, 99), -4));
}

TEST_F(RangeSplitterTest, RejectsTooFewValues) {
    ASSERT_STATUS_CODE(ErrorCodes::InvalidDomain,
                       RangeSplitter::split(KeyDomain::integerRange(0, 9), 11));
    ASSERT_STATUS_CODE(ErrorCodes::InvalidDomain,
                       RangeSplitter::split(KeyDomain::stringValues({"a", "b"}), 3));
}

TEST_F(RangeSplitterTest, RejectsInvertedIntegerDomain) {
    ASSERT_STATUS_CODE(ErrorCodes::InvalidDomain,
                       RangeSplitter::split(KeyDomain::integerRange(10, 0), 1));
}

TEST_F(RangeSplitterTest, RejectsEmptyOrUnsortedStringDomain) {
    ASSERT_STATUS_CODE(ErrorCodes::InvalidDomain, KeyDomain::stringValues({}).validate());
    ASSERT_STATUS_CODE(ErrorCodes::InvalidDomain,
                       KeyDomain::stringValues({"b", "a"}).validate());
    ASSERT_STATUS_CODE(ErrorCodes::InvalidDomain,
                       KeyDomain::stringValues({"a", "a"}).validate());
}

TEST_F(RangeSplitterTest, DomainSize) {
    ASSERT_EQ(100U, KeyDomain::integerRange(0, 99).size());
    ASSERT_EQ(3U, KeyDomain::stringValues({"a", "b", "c"}).size());
    ASSERT_EQ(KeyValue("b"), KeyDomain::stringValues({"a", "b", "c"}).valueAt(1));
    ASSERT_EQ(KeyValue(42), KeyDomain::integerRange(40, 50).valueAt(2));
}

}  // namespace
}  // namespace shardplan
