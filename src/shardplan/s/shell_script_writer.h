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

#include "shardplan/s/shard_key.h"

#include <iosfwd>
#include <string>
#include <utility>

namespace shardplan {

class PlacementPlan;

/**
 * Renders a placement plan as a mongosh script an operator can run against a mongos: stop the
 * balancer, shard the collection, split at every interior boundary, move every chunk to its
 * target shard and start the balancer again.
 */
class ShellScriptWriter {
public:
    struct Options {
        // Emit sh.enableSharding() and sh.shardCollection() before splitting.
        bool shardCollection = true;
        // Wrap the placement in sh.stopBalancer() / sh.startBalancer().
        bool suspendBalancer = true;
    };

    explicit ShellScriptWriter(ShardKeyPattern pattern) : ShellScriptWriter(std::move(pattern), {}) {}

    ShellScriptWriter(ShardKeyPattern pattern, Options options)
        : _pattern(std::move(pattern)), _options(options) {}

    void write(const PlacementPlan& plan, std::ostream& out) const;

    std::string toString(const PlacementPlan& plan) const;

private:
    ShardKeyPattern _pattern;
    Options _options;
};

}  // namespace shardplan
