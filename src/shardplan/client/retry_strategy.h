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
#include "shardplan/client/backoff_with_jitter.h"
#include "shardplan/util/duration.h"

#include <cstdint>
#include <functional>
#include <type_traits>
#include <utility>

namespace shardplan {

/**
 * Interface for implementing retry behavior. Allows user to specify exactly how much time we
 * should wait between retries and if it should retry.
 *
 * At the end of each request, either 'recordFailureAndEvaluateShouldRetry' or 'recordSuccess'
 * must be called. When the retry strategy returns that a retry should be done, it is expected
 * that users perform a wait for the amount of time returned by 'getNextRetryDelay'.
 *
 * Usage example:
 *
 *     Status status = ...;
 *
 *     while(!status.isOK() && strategy.recordFailureAndEvaluateShouldRetry(status)) {
 *         sleepFor(strategy.getNextRetryDelay());
 *         status = ...;
 *     }
 *
 *     if (status.isOK()) {
 *         strategy.recordSuccess();
 *     }
 *
 *  See 'runWithRetryStrategy' for a reference usage of retry strategies.
 */
class RetryStrategy {
public:
    virtual ~RetryStrategy() = default;

    /**
     * Returns true if the request that generated the status should be retried.
     *
     * This function should be called at the end of each failed request.
     */
    [[nodiscard]] virtual bool recordFailureAndEvaluateShouldRetry(const Status& s) = 0;

    /**
     * Records a successful request. Should be called at the end of successful request even if
     * no retries have been performed.
     */
    virtual void recordSuccess() = 0;

    /**
     * Returns a delay amount corresponding to the amount of retries with a jitter applied to it.
     */
    virtual Milliseconds getNextRetryDelay() const = 0;

    /**
     * Number of requests issued so far, the first one included.
     */
    virtual std::int32_t getAttemptCount() const = 0;
};

/**
 * Retries failed requests whose error satisfies the retry criteria, up to a maximum number of
 * retries, waiting with exponential backoff with jitter between them.
 */
class DefaultRetryStrategy final : public RetryStrategy {
public:
    using RetryCriteria = std::function<bool(const Status& s)>;

    /**
     * Retries network errors, timeouts and conflicting metadata operations.
     */
    static bool defaultRetryCriteria(const Status& s);

    struct RetryParameters {
        // Maximum number of retries after initial retriable error.
        std::int32_t maxRetryAttempts;
        // The base of the exponent used when calculating backoff times.
        Milliseconds baseBackoff;
        // The maximum time a single backoff can take.
        Milliseconds maxBackoff;
    };

    explicit DefaultRetryStrategy(RetryParameters retryParameters)
        : DefaultRetryStrategy{defaultRetryCriteria, retryParameters} {}

    DefaultRetryStrategy(RetryCriteria retryCriteria, RetryParameters retryParameters)
        : _retryCriteria{std::move(retryCriteria)},
          _backoffWithJitter{retryParameters.baseBackoff, retryParameters.maxBackoff},
          _maxRetryAttempts{retryParameters.maxRetryAttempts} {}

    [[nodiscard]] bool recordFailureAndEvaluateShouldRetry(const Status& s) override;

    void recordSuccess() override {
        ++_attempts;
    }

    Milliseconds getNextRetryDelay() const override {
        return _backoffWithJitter.getBackoffDelay();
    }

    std::int32_t getAttemptCount() const override {
        return _attempts;
    }

private:
    RetryCriteria _retryCriteria;
    BackoffWithJitter _backoffWithJitter;
    std::int32_t _maxRetryAttempts;
    std::int32_t _attempts = 0;
};

/**
 * Runs 'fn' until it succeeds, returns an error the strategy does not retry, or the strategy
 * runs out of attempts. 'fn' must return Status or StatusWith<T>; the last result is returned.
 */
template <typename Fn>
auto runWithRetryStrategy(RetryStrategy& strategy, Fn&& fn) -> std::invoke_result_t<Fn&> {
    while (true) {
        auto result = fn();

        const Status& status = [&]() -> const Status& {
            if constexpr (std::is_same_v<decltype(result), Status>) {
                return result;
            } else {
                return result.getStatus();
            }
        }();

        if (status.isOK()) {
            strategy.recordSuccess();
            return result;
        }

        if (!strategy.recordFailureAndEvaluateShouldRetry(status)) {
            return result;
        }

        sleepFor(strategy.getNextRetryDelay());
    }
}

}  // namespace shardplan
