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

#include <compare>
#include <concepts>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace shardplan {

struct MinKeyType {
    auto operator<=>(const MinKeyType&) const = default;
};

struct MaxKeyType {
    auto operator<=>(const MaxKeyType&) const = default;
};

inline constexpr MinKeyType MinKey{};
inline constexpr MaxKeyType MaxKey{};

/**
 * The value of one field of a shard key. Values of different types compare in canonical BSON
 * order: MinKey < numbers < strings < MaxKey.
 */
class KeyValue {
public:
    KeyValue() : _value(MinKey) {}
    KeyValue(MinKeyType) : _value(MinKey) {}
    KeyValue(MaxKeyType) : _value(MaxKey) {}
    template <std::integral T>
    requires(!std::is_same_v<T, bool>)
    KeyValue(T value) : _value(static_cast<std::int64_t>(value)) {}
    KeyValue(std::string value) : _value(std::move(value)) {}
    KeyValue(const char* value) : _value(std::string(value)) {}

    bool isMinKey() const {
        return std::holds_alternative<MinKeyType>(_value);
    }

    bool isMaxKey() const {
        return std::holds_alternative<MaxKeyType>(_value);
    }

    bool isNumber() const {
        return std::holds_alternative<std::int64_t>(_value);
    }

    bool isString() const {
        return std::holds_alternative<std::string>(_value);
    }

    std::int64_t numberValue() const {
        return std::get<std::int64_t>(_value);
    }

    const std::string& stringValue() const {
        return std::get<std::string>(_value);
    }

    /**
     * Shell syntax of the value: MinKey, MaxKey, 42 or "abc".
     */
    std::string toString() const;

    std::strong_ordering operator<=>(const KeyValue& other) const;

    bool operator==(const KeyValue& other) const {
        return (*this <=> other) == 0;
    }

private:
    // The alternatives are declared in canonical order so that variant comparison orders
    // values of different types correctly.
    std::variant<MinKeyType, std::int64_t, std::string, MaxKeyType> _value;
};

/**
 * Names the two fields of a composite shard key: the primary field, which routes documents,
 * and the tiebreaker field, which orders documents sharing the same primary value.
 */
struct ShardKeyPattern {
    std::string primaryField = "category_id";
    std::string tiebreakerField = "product_id";

    /**
     * e.g. { category_id: 1, product_id: 1 }
     */
    std::string toString() const;
};

/**
 * A point of the composite key space. Keys compare lexicographically, primary value first.
 */
class ShardKey {
public:
    ShardKey() = default;
    ShardKey(KeyValue primary, KeyValue tiebreaker)
        : _primary(std::move(primary)), _tiebreaker(std::move(tiebreaker)) {}

    /**
     * The smallest key whose primary value is 'value': { value, MinKey }.
     */
    static ShardKey lowestFor(KeyValue value) {
        return ShardKey(std::move(value), MinKey);
    }

    /**
     * { MinKey, MinKey }, the lower bound of the whole key space.
     */
    static ShardKey globalMin() {
        return ShardKey(MinKey, MinKey);
    }

    /**
     * { MaxKey, MaxKey }, the exclusive upper bound of the whole key space.
     */
    static ShardKey globalMax() {
        return ShardKey(MaxKey, MaxKey);
    }

    const KeyValue& primary() const {
        return _primary;
    }

    const KeyValue& tiebreaker() const {
        return _tiebreaker;
    }

    bool isGlobalMin() const {
        return *this == globalMin();
    }

    bool isGlobalMax() const {
        return *this == globalMax();
    }

    /**
     * e.g. { category_id: 3, product_id: MinKey }
     */
    std::string toString(const ShardKeyPattern& pattern) const;

    /**
     * Without field names, e.g. { 3, MinKey }
     */
    std::string toString() const;

    std::strong_ordering operator<=>(const ShardKey& other) const;

    bool operator==(const ShardKey& other) const {
        return (*this <=> other) == 0;
    }

private:
    KeyValue _primary;
    KeyValue _tiebreaker;
};

std::ostream& operator<<(std::ostream& os, const KeyValue& value);
std::ostream& operator<<(std::ostream& os, const ShardKey& key);

}  // namespace shardplan
