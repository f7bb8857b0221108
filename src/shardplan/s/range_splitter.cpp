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

#define SHARDPLAN_LOGV2_DEFAULT_COMPONENT ::shardplan::logv2::LogComponent::kSharding

#include "shardplan/s/range_splitter.h"

#include "shardplan/logv2/log.h"
#include "shardplan/util/assert_util.h"
#include "shardplan/util/str.h"

#include <cstdint>
#include <limits>

namespace shardplan {

Status KeyDomain::validate() const {
    if (auto range = std::get_if<IntegerRange>(&_values)) {
        if (range->min > range->max) {
            return Status(ErrorCodes::InvalidDomain,
                          str::stream() << "Key domain lower bound " << range->min
                                        << " is greater than its upper bound " << range->max);
        }
        if (static_cast<std::uint64_t>(range->max) - static_cast<std::uint64_t>(range->min) ==
            std::numeric_limits<std::uint64_t>::max()) {
            return Status(ErrorCodes::InvalidDomain,
                          str::stream() << "Key domain " << toString()
                                        << " has more distinct values than can be counted");
        }
        return Status::OK();
    }

    const auto& values = std::get<std::vector<std::string>>(_values);
    if (values.empty()) {
        return Status(ErrorCodes::InvalidDomain, "Key domain has no values");
    }
    for (std::size_t i = 1; i < values.size(); ++i) {
        if (!(values[i - 1] < values[i])) {
            return Status(ErrorCodes::InvalidDomain,
                          str::stream() << "Key domain values must be strictly ascending, found '"
                                        << values[i - 1] << "' before '" << values[i]
                                        << "' at position " << i);
        }
    }
    return Status::OK();
}

std::size_t KeyDomain::size() const {
    if (auto range = std::get_if<IntegerRange>(&_values)) {
        // max - min may exceed the int64 range.
        return static_cast<std::size_t>(static_cast<std::uint64_t>(range->max) -
                                        static_cast<std::uint64_t>(range->min)) +
            1;
    }
    return std::get<std::vector<std::string>>(_values).size();
}

KeyValue KeyDomain::valueAt(std::size_t index) const {
    invariant(index < size());
    if (auto range = std::get_if<IntegerRange>(&_values)) {
        return KeyValue(static_cast<std::int64_t>(static_cast<std::uint64_t>(range->min) + index));
    }
    return KeyValue(std::get<std::vector<std::string>>(_values)[index]);
}

std::string KeyDomain::toString() const {
    if (auto range = std::get_if<IntegerRange>(&_values)) {
        return str::stream() << "[" << range->min << ", " << range->max << "]";
    }
    const auto& values = std::get<std::vector<std::string>>(_values);
    str::stream ss;
    ss << values.size() << " string values";
    if (!values.empty()) {
        ss << " [\"" << values.front() << "\" .. \"" << values.back() << "\"]";
    }
    return ss;
}

StatusWith<std::vector<ShardKey>> RangeSplitter::computeBoundaries(const KeyDomain& domain,
                                                                   std::int64_t splitCount) {
    if (splitCount < 1) {
        return Status(ErrorCodes::InvalidDomain,
                      str::stream() << "Split count must be at least 1, got " << splitCount);
    }

    if (auto status = domain.validate(); !status.isOK()) {
        return status;
    }

    const auto numValues = domain.size();
    const auto numRanges = static_cast<std::size_t>(splitCount);
    if (numValues < numRanges) {
        return Status(ErrorCodes::InvalidDomain,
                      str::stream() << "Cannot split a key domain of " << numValues
                                    << " distinct values into " << splitCount << " ranges");
    }

    std::vector<ShardKey> boundaries;
    boundaries.reserve(numRanges + 1);
    boundaries.push_back(ShardKey::globalMin());
    for (std::size_t i = 1; i < numRanges; ++i) {
        // floor(i * N / K) without computing i * N, which overflows for wide integer domains.
        const auto index =
            (numValues / numRanges) * i + ((numValues % numRanges) * i) / numRanges;
        boundaries.push_back(ShardKey::lowestFor(domain.valueAt(index)));
    }
    boundaries.push_back(ShardKey::globalMax());

    LOGV2_DEBUG(9160,
                2,
                "Computed split boundaries",
                "domain"_attr = domain.toString(),
                "splitCount"_attr = splitCount,
                "numBoundaries"_attr = boundaries.size());

    return boundaries;
}

StatusWith<std::vector<KeyRange>> RangeSplitter::split(const KeyDomain& domain,
                                                       std::int64_t splitCount) {
    auto swBoundaries = computeBoundaries(domain, splitCount);
    if (!swBoundaries.isOK()) {
        return swBoundaries.getStatus();
    }

    const auto& boundaries = swBoundaries.getValue();
    std::vector<KeyRange> ranges;
    ranges.reserve(boundaries.size() - 1);
    for (std::size_t i = 0; i + 1 < boundaries.size(); ++i) {
        ranges.emplace_back(boundaries[i], boundaries[i + 1]);
    }

    invariantOK(validatePartition(ranges));
    return ranges;
}

}  // namespace shardplan
