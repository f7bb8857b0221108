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

#include "shardplan/s/key_range.h"

#include "shardplan/util/assert_util.h"
#include "shardplan/util/str.h"

namespace shardplan {

KeyRange::KeyRange(ShardKey lowerBound, ShardKey upperBound)
    : _min(std::move(lowerBound)), _max(std::move(upperBound)) {
    uassert(ErrorCodes::BadValue,
            str::stream() << "Key range min " << _min << " must be less than max " << _max,
            _min < _max);
}

std::string KeyRange::toString() const {
    return str::stream() << "[" << _min << ", " << _max << ")";
}

std::string KeyRange::toString(const ShardKeyPattern& pattern) const {
    return str::stream() << "[" << _min.toString(pattern) << ", " << _max.toString(pattern)
                         << ")";
}

Status validatePartition(const std::vector<KeyRange>& ranges) {
    if (ranges.empty()) {
        return Status(ErrorCodes::BadValue, "A partition must contain at least one range");
    }

    if (!ranges.front().getMin().isGlobalMin()) {
        return Status(ErrorCodes::BadValue,
                      str::stream() << "First range " << ranges.front().toString()
                                    << " does not start at the global minimum");
    }

    if (!ranges.back().getMax().isGlobalMax()) {
        return Status(ErrorCodes::BadValue,
                      str::stream() << "Last range " << ranges.back().toString()
                                    << " does not end at the global maximum");
    }

    for (size_t i = 1; i < ranges.size(); ++i) {
        const auto& prev = ranges[i - 1];
        const auto& curr = ranges[i];
        if (prev.getMax() < curr.getMin()) {
            return Status(ErrorCodes::BadValue,
                          str::stream() << "Gap between ranges " << prev.toString() << " and "
                                        << curr.toString());
        }
        if (curr.getMin() < prev.getMax()) {
            return Status(ErrorCodes::BadValue,
                          str::stream() << "Ranges " << prev.toString() << " and "
                                        << curr.toString() << " overlap");
        }
    }

    return Status::OK();
}

}  // namespace shardplan
