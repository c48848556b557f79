/**
 * @file cancellation.cpp
 * @brief Implementation of cancellation tokens and the concurrency limiter
 *
 * Ferry - Peer-to-peer encrypted bulk file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "ferry/cancellation.hpp"

#include <thread>
#include <vector>

namespace ferry {

// ============================================================================
// CancellationToken
// ============================================================================

std::shared_ptr<CancellationToken> CancellationToken::create() {
    return std::shared_ptr<CancellationToken>(new CancellationToken());
}

CancellationToken::CancellationToken()
    : cancelled_(false)
    , next_id_(1)
    , callbacks_running_(false)
    , parent_registration_(0)
{
}

CancellationToken::~CancellationToken() {
    if (parent_registration_ != 0) {
        if (auto parent = parent_.lock()) {
            parent->remove_callback(parent_registration_);
        }
    }
}

std::shared_ptr<CancellationToken> CancellationToken::create_child() {
    auto child = create();
    std::weak_ptr<CancellationToken> weak_child = child;

    child->parent_ = shared_from_this();
    child->parent_registration_ = on_cancel([weak_child]() {
        if (auto c = weak_child.lock()) {
            c->cancel();
        }
    });

    return child;
}

void CancellationToken::cancel() {
    std::map<CallbackId, std::function<void()>> to_run;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        to_run.swap(callbacks_);
        callbacks_running_ = true;
        callback_thread_ = std::this_thread::get_id();
    }
    cv_.notify_all();

    // Callbacks run outside the lock so they may touch this token
    for (auto& [id, callback] : to_run) {
        callback();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        callbacks_running_ = false;
    }
    cv_.notify_all();
}

CancellationToken::CallbackId CancellationToken::on_cancel(std::function<void()> callback) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!cancelled_.load(std::memory_order_acquire)) {
            CallbackId id = next_id_++;
            callbacks_.emplace(id, std::move(callback));
            return id;
        }
    }

    callback();
    return 0;
}

void CancellationToken::remove_callback(CallbackId id) {
    if (id == 0) {
        return;
    }
    std::unique_lock<std::mutex> lock(mutex_);
    callbacks_.erase(id);

    // A callback swapped out by cancel() may still be running; wait for it
    // so the caller can release whatever it captured
    if (callbacks_running_ && callback_thread_ != std::this_thread::get_id()) {
        cv_.wait(lock, [this]() { return !callbacks_running_; });
    }
}

bool CancellationToken::wait_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this]() { return is_cancelled(); });
}

// ============================================================================
// ConcurrencyLimiter
// ============================================================================

ConcurrencyLimiter::ConcurrencyLimiter(size_t slots)
    : capacity_(slots == 0 ? 1 : slots)
    , available_(slots == 0 ? 1 : slots)
{
}

bool ConcurrencyLimiter::acquire(CancellationToken& token) {
    auto registration = token.on_cancel([this]() { wake_all(); });

    bool acquired = false;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this, &token]() {
            return available_ > 0 || token.is_cancelled();
        });

        if (!token.is_cancelled()) {
            available_--;
            acquired = true;
        }
    }

    token.remove_callback(registration);
    return acquired;
}

void ConcurrencyLimiter::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (available_ < capacity_) {
            available_++;
        }
    }
    cv_.notify_one();
}

size_t ConcurrencyLimiter::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return available_;
}

void ConcurrencyLimiter::wake_all() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
    }
    cv_.notify_all();
}

} // namespace ferry
