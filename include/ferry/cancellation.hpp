/**
 * @file cancellation.hpp
 * @brief Cooperative cancellation and bounded concurrency primitives
 *
 * Ferry - Peer-to-peer encrypted bulk file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * A CancellationToken is a shared atomic flag plus a notification list.
 * Child tokens are cancelled with their parent but can also be cancelled
 * alone, which scopes a failure to one file of a session.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

namespace ferry {

/**
 * @brief Shared cancellation flag
 *
 * Always held by std::shared_ptr; create with CancellationToken::create().
 */
class CancellationToken : public std::enable_shared_from_this<CancellationToken> {
public:
    using CallbackId = uint64_t;

    static std::shared_ptr<CancellationToken> create();

    ~CancellationToken();

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    /**
     * @brief Create a token cancelled whenever this one is
     */
    std::shared_ptr<CancellationToken> create_child();

    /**
     * @brief Raise the flag and run the registered callbacks once
     */
    void cancel();

    bool is_cancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

    /**
     * @brief Register a callback for cancellation
     *
     * Runs immediately on the calling thread if already cancelled.
     *
     * @return Id for remove_callback, 0 if it ran immediately
     */
    CallbackId on_cancel(std::function<void()> callback);

    /**
     * @brief Unregister a callback; unknown ids are ignored
     *
     * If cancellation is delivering callbacks on another thread, returns
     * only after they have finished.
     */
    void remove_callback(CallbackId id);

    /**
     * @brief Block until cancelled or the timeout expires
     * @return true if cancelled
     */
    bool wait_for(std::chrono::milliseconds timeout);

private:
    CancellationToken();

    std::atomic<bool> cancelled_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<CallbackId, std::function<void()>> callbacks_;
    CallbackId next_id_;
    bool callbacks_running_;
    std::thread::id callback_thread_;

    std::weak_ptr<CancellationToken> parent_;
    CallbackId parent_registration_;
};

/**
 * @brief Fixed pool of slots whose acquisition races cancellation
 */
class ConcurrencyLimiter {
public:
    explicit ConcurrencyLimiter(size_t slots);

    ConcurrencyLimiter(const ConcurrencyLimiter&) = delete;
    ConcurrencyLimiter& operator=(const ConcurrencyLimiter&) = delete;

    /**
     * @brief Wait for a free slot
     * @param token Cancellation observed while waiting
     * @return true if a slot was taken, false if the token was cancelled first
     */
    bool acquire(CancellationToken& token);

    /// Return a slot
    void release();

    size_t available() const;
    size_t capacity() const { return capacity_; }

private:
    void wake_all();

    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    size_t available_;
};

} // namespace ferry
