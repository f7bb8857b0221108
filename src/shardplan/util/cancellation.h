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

#include <atomic>
#include <memory>
#include <utility>

namespace shardplan {

namespace detail {
struct CancellationState {
    std::atomic<bool> canceled{false};
};
}  // namespace detail

/**
 * Type representing a token to observe the cancellation state of a CancellationSource. Tokens
 * are cheap to copy and may outlive the source which produced them.
 */
class CancellationToken {
public:
    /**
     * Returns a token which will never be canceled.
     */
    static CancellationToken uncancelable() {
        return CancellationToken(nullptr);
    }

    bool isCanceled() const {
        return _state && _state->canceled.load();
    }

    bool isCancelable() const {
        return _state != nullptr;
    }

private:
    friend class CancellationSource;

    explicit CancellationToken(std::shared_ptr<const detail::CancellationState> state)
        : _state(std::move(state)) {}

    std::shared_ptr<const detail::CancellationState> _state;
};

/**
 * Manages the cancellation state of the tokens it hands out. Calling cancel() is idempotent and
 * may be done from any thread.
 */
class CancellationSource {
public:
    CancellationSource() : _state(std::make_shared<detail::CancellationState>()) {}

    void cancel() {
        _state->canceled.store(true);
    }

    CancellationToken token() const {
        return CancellationToken(_state);
    }

private:
    std::shared_ptr<detail::CancellationState> _state;
};

}  // namespace shardplan
