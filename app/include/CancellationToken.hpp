/*
 * Cooperative cancellation shared between callers and in-flight requests
 * Part of Fleetmux - a multi-host inference dispatcher with online performance metrics
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef CANCELLATION_TOKEN_HPP
#define CANCELLATION_TOKEN_HPP

#include <atomic>
#include <memory>

/**
 * Copyable handle to a cancellation flag
 *
 * Copies share the same flag. A child token observes its own flag and every
 * ancestor's, so cancelling a run cancels all of its jobs while cancelling
 * one job leaves its siblings running.
 *
 * A default-constructed token can be cancelled like any other.
 */
class CancellationToken {
public:
    CancellationToken()
        : state_(std::make_shared<State>())
    {}

    /**
     * Create a token that is cancelled when this one is
     */
    CancellationToken child() const
    {
        CancellationToken token;
        token.state_->parent = state_;
        return token;
    }

    void cancel() const { state_->cancelled.store(true, std::memory_order_release); }

    bool is_cancelled() const
    {
        for (auto state = state_; state; state = state->parent) {
            if (state->cancelled.load(std::memory_order_acquire)) {
                return true;
            }
        }
        return false;
    }

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::shared_ptr<State> parent;
    };

    std::shared_ptr<State> state_;
};

#endif // CANCELLATION_TOKEN_HPP
