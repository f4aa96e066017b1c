/**
 * @file cancellation.hpp
 * @brief Process-wide cancellation signal shared by every task
 *
 * A CancellationSource owns the signal; CancellationToken is a cheap,
 * copyable view of it handed to the dispatcher and every upload task.
 * Waiting on a token wakes up as soon as the source is cancelled, so
 * poll loops never sleep past a shutdown request.
 *
 * EXAMPLE:
 * CancellationSource source;
 * auto token = source.token();
 * std::thread worker([token] {
 *     while (!token.wait_for(std::chrono::seconds(1))) { ... }
 * });
 * source.cancel();
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace scansync {

namespace detail {

struct CancelState {
    std::mutex mutex;
    std::condition_variable cv;
    bool cancelled = false;
};

} // namespace detail

class CancellationToken {
public:
    /**
     * @brief Token that is never cancelled (no source attached)
     */
    CancellationToken() : state_(std::make_shared<detail::CancelState>()) {}

    bool is_cancelled() const {
        std::lock_guard lock(state_->mutex);
        return state_->cancelled;
    }

    /**
     * @brief Block for up to timeout or until cancelled
     *
     * RETURNS: true if the token is cancelled
     */
    template<typename Rep, typename Period>
    bool wait_for(const std::chrono::duration<Rep, Period>& timeout) const {
        std::unique_lock lock(state_->mutex);
        return state_->cv.wait_for(lock, timeout, [this]() { return state_->cancelled; });
    }

private:
    friend class CancellationSource;

    explicit CancellationToken(std::shared_ptr<detail::CancelState> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::CancelState> state_;
};

class CancellationSource {
public:
    CancellationSource() : state_(std::make_shared<detail::CancelState>()) {}

    CancellationSource(const CancellationSource&) = delete;
    CancellationSource& operator=(const CancellationSource&) = delete;

    CancellationToken token() const { return CancellationToken(state_); }

    /**
     * @brief Signal cancellation and wake every waiter. Idempotent.
     */
    void cancel() {
        {
            std::lock_guard lock(state_->mutex);
            state_->cancelled = true;
        }
        state_->cv.notify_all();
    }

    bool is_cancelled() const {
        std::lock_guard lock(state_->mutex);
        return state_->cancelled;
    }

private:
    std::shared_ptr<detail::CancelState> state_;
};

} // namespace scansync
