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

#include <chrono>
#include <concepts>
#include <string>
#include <string_view>
#include <type_traits>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace shardplan::logv2 {

/**
 * A name/value pair attached to a log line. Values are rendered to text when the attribute is
 * built; 'quoted' tells the encoder whether the text is a JSON string or a bare number/boolean.
 */
struct NamedAttribute {
    std::string name;
    std::string value;
    bool quoted = true;
};

namespace detail {

template <typename T>
concept HasToString = requires(const T& t) {
    { t.toString() } -> std::convertible_to<std::string>;
};

template <typename T>
NamedAttribute makeAttribute(const char* name, const T& value) {
    if constexpr (std::is_same_v<T, bool>) {
        return {name, value ? "true" : "false", false};
    } else if constexpr (std::is_arithmetic_v<T>) {
        return {name, fmt::format("{}", value), false};
    } else if constexpr (std::is_enum_v<T>) {
        return {name, fmt::format("{}", static_cast<std::underlying_type_t<T>>(value)), false};
    } else if constexpr (std::is_convertible_v<const T&, std::string_view>) {
        return {name, std::string(std::string_view(value)), true};
    } else if constexpr (HasToString<T>) {
        return {name, value.toString(), true};
    } else {
        static_assert(fmt::is_formattable<T>::value, "log attribute type is not loggable");
        return {name, fmt::format("{}", value), true};
    }
}

}  // namespace detail

/**
 * Helper to be used inside the logging macros to name attributes, e.g.
 *
 *     LOGV2(9200, "Moved chunk", "range"_attr = range, "to"_attr = shardId);
 */
struct AttrUdl {
    const char* name;

    template <typename T>
    NamedAttribute operator=(const T& value) const {
        return detail::makeAttribute(name, value);
    }
};

namespace literals {

constexpr AttrUdl operator""_attr(const char* name, std::size_t) {
    return AttrUdl{name};
}

}  // namespace literals
}  // namespace shardplan::logv2
