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

#include "shardplan/s/shard_key.h"

#include <ostream>

#include <fmt/format.h>

namespace shardplan {

std::string KeyValue::toString() const {
    if (isMinKey())
        return "MinKey";
    if (isMaxKey())
        return "MaxKey";
    if (isNumber())
        return fmt::format("{}", numberValue());

    std::string quoted;
    quoted.reserve(stringValue().size() + 2);
    quoted.push_back('"');
    for (char c : stringValue()) {
        if (c == '"' || c == '\\')
            quoted.push_back('\\');
        quoted.push_back(c);
    }
    quoted.push_back('"');
    return quoted;
}

std::strong_ordering KeyValue::operator<=>(const KeyValue& other) const {
    if (_value.index() != other._value.index())
        return _value.index() <=> other._value.index();

    if (isNumber())
        return numberValue() <=> other.numberValue();
    if (isString()) {
        const int cmp = stringValue().compare(other.stringValue());
        return cmp <=> 0;
    }
    return std::strong_ordering::equal;
}

std::string ShardKeyPattern::toString() const {
    return fmt::format("{{ {}: 1, {}: 1 }}", primaryField, tiebreakerField);
}

std::string ShardKey::toString(const ShardKeyPattern& pattern) const {
    return fmt::format("{{ {}: {}, {}: {} }}",
                       pattern.primaryField,
                       _primary.toString(),
                       pattern.tiebreakerField,
                       _tiebreaker.toString());
}

std::string ShardKey::toString() const {
    return fmt::format("{{ {}, {} }}", _primary.toString(), _tiebreaker.toString());
}

std::strong_ordering ShardKey::operator<=>(const ShardKey& other) const {
    if (auto cmp = _primary <=> other._primary; cmp != 0)
        return cmp;
    return _tiebreaker <=> other._tiebreaker;
}

std::ostream& operator<<(std::ostream& os, const KeyValue& value) {
    return os << value.toString();
}

std::ostream& operator<<(std::ostream& os, const ShardKey& key) {
    return os << key.toString();
}

}  // namespace shardplan
