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

#include "shardplan/client/backoff_with_jitter.h"

#include <algorithm>
#include <cmath>
#include <random>

namespace shardplan {

Milliseconds BackoffWithJitter::getMaxDelayForCurrentAttempt() const {
    if (_attemptCount == 0 || _baseBackoff == Milliseconds{0}) {
        return Milliseconds{0};
    }

    return Milliseconds{static_cast<std::int64_t>(
        std::min(static_cast<double>(_maxBackoff.count()),
                 _baseBackoff.count() * std::exp2(static_cast<double>(_attemptCount))))};
}

Milliseconds BackoffWithJitter::getBackoffDelay() const {
    if (_attemptCount == 0) {
        return Milliseconds{0};
    }

    const std::int64_t minDelay = 0;
    const std::int64_t maxDelay = getMaxDelayForCurrentAttempt().count();

    return Milliseconds{std::uniform_int_distribution<std::int64_t>{minDelay, maxDelay}(
        _randomEngine())};
}

XorShift128& BackoffWithJitter::_randomEngine() {
    static thread_local XorShift128 random{SecureRandom{}.nextUInt32()};
    return random;
}

}  // namespace shardplan
