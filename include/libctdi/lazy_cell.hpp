#pragma once

#include "exceptions.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>

namespace libctdi {

// ---------------------------------------------------------------
// Threading policies
// ---------------------------------------------------------------

/// Cells may be raced by several threads; first-write races are serialized.
struct thread_safe {};

/// Cells are only ever touched from one thread; no locking.
struct single_thread {};

#if defined(LIBCTDI_THREAD_SAFE) && LIBCTDI_THREAD_SAFE
using default_threading = thread_safe;
#else
using default_threading = single_thread;
#endif

// ---------------------------------------------------------------
// lazy_cell: a slot initialized at most once
// ---------------------------------------------------------------

template <typename T, typename Threading = default_threading>
class lazy_cell;

template <typename T>
class lazy_cell<T, single_thread> {
public:
    lazy_cell() = default;

    lazy_cell(const lazy_cell&) = delete;
    lazy_cell& operator=(const lazy_cell&) = delete;

    /// Returns the stored value, or nullptr while the cell is empty.
    T* get() noexcept { return state_ == state::ready ? &*value_ : nullptr; }
    const T* get() const noexcept { return state_ == state::ready ? &*value_ : nullptr; }

    /// Store `value` if the cell is empty.  Returns false (and drops `value`)
    /// when the cell is already initialized or being initialized.
    bool set(T value) {
        if (state_ != state::empty) return false;
        value_.emplace(std::move(value));
        state_ = state::ready;
        return true;
    }

    /// Returns the stored value, running `init` first if the cell is empty.
    /// If `init` throws, the cell stays empty and the exception propagates.
    template <typename F>
    T& get_or_init(F&& init) {
        if (state_ == state::ready) return *value_;
        if (state_ == state::initializing) throw reentrant_initialization();

        state_ = state::initializing;
        try {
            value_.emplace(std::invoke(std::forward<F>(init)));
        } catch (...) {
            state_ = state::empty;
            throw;
        }
        state_ = state::ready;
        return *value_;
    }

    /// Destroy the stored value and return the cell to empty.
    void reset() noexcept {
        value_.reset();
        state_ = state::empty;
    }

private:
    enum class state { empty, initializing, ready };

    state state_ = state::empty;
    std::optional<T> value_;
};

template <typename T>
class lazy_cell<T, thread_safe> {
public:
    lazy_cell() = default;

    lazy_cell(const lazy_cell&) = delete;
    lazy_cell& operator=(const lazy_cell&) = delete;

    T* get() noexcept {
        return ready_.load(std::memory_order_acquire) ? &*value_ : nullptr;
    }
    const T* get() const noexcept {
        return ready_.load(std::memory_order_acquire) ? &*value_ : nullptr;
    }

    bool set(T value) {
        std::lock_guard lock(mutex_);
        if (state_ != state::empty) return false;
        value_.emplace(std::move(value));
        state_ = state::ready;
        ready_.store(true, std::memory_order_release);
        ready_cv_.notify_all();
        return true;
    }

    /// Returns the stored value, running `init` first if the cell is empty.
    ///
    /// Only the first caller runs `init`; concurrent callers block until it
    /// finishes.  The lock is not held while `init` runs, so initializers may
    /// freely touch other cells.  A caller that re-enters its own cell from
    /// inside `init` gets reentrant_initialization instead of a deadlock.
    /// If `init` throws, the cell returns to empty and one waiter retries.
    template <typename F>
    T& get_or_init(F&& init) {
        if (ready_.load(std::memory_order_acquire)) return *value_;

        std::unique_lock lock(mutex_);
        for (;;) {
            if (state_ == state::ready) return *value_;
            if (state_ == state::empty) break;
            if (owner_ == std::this_thread::get_id()) {
                throw reentrant_initialization();
            }
            ready_cv_.wait(lock);
        }
        state_ = state::initializing;
        owner_ = std::this_thread::get_id();
        lock.unlock();

        std::optional<T> produced;
        try {
            produced.emplace(std::invoke(std::forward<F>(init)));
        } catch (...) {
            {
                std::lock_guard relock(mutex_);
                state_ = state::empty;
                owner_ = std::thread::id{};
            }
            ready_cv_.notify_all();
            throw;
        }

        std::lock_guard relock(mutex_);
        value_.emplace(std::move(*produced));
        state_ = state::ready;
        owner_ = std::thread::id{};
        ready_.store(true, std::memory_order_release);
        ready_cv_.notify_all();
        return *value_;
    }

    /// Destroy the stored value and return the cell to empty.  Must not
    /// race with get_or_init().
    void reset() {
        std::lock_guard lock(mutex_);
        ready_.store(false, std::memory_order_release);
        value_.reset();
        state_ = state::empty;
    }

private:
    enum class state { empty, initializing, ready };

    std::mutex mutex_;
    std::condition_variable ready_cv_;
    state state_ = state::empty;
    std::thread::id owner_;
    std::atomic<bool> ready_{false};
    std::optional<T> value_;
};

} // namespace libctdi
