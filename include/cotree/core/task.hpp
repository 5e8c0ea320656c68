// ============================================================================
// cotree/core/task.hpp - Lazy Coroutine Return Type
// ============================================================================
//
// Task<T> is the coroutine type every node body, Handler callable and
// internal driver in cotree returns. It is:
//
//   LAZY      - initial_suspend is suspend_always; nothing runs until the
//               Task is co_awaited (or its handle resumed by a DetachedTask).
//   MOVE-ONLY - it owns the coroutine frame and destroys it on destruction.
//   CHAINED   - on completion the frame transfers control straight back to
//               the awaiting coroutine (symmetric transfer), so a Job that
//               awaits a Handler that awaits a sleep does not grow the stack.
//
// A body reports failure by returning Err(Fault), not by throwing. An escaped
// exception reaches unhandled_exception() and aborts.
//
// USAGE:
// ------
//   Task<NodeResult> Fetch(Job& self, Args args) {
//       co_await AsyncSleep(10ms, self.GetToken());
//       co_return Ok(std::string("payload"));
//   }
//
// ============================================================================

#pragma once

#include "cotree/core/check.hpp"
#include "cotree/core/coroutine_compat.hpp"

#include <coroutine>
#include <cstdlib>
#include <optional>
#include <utility>

namespace cotree {

template <typename T>
class Task;

namespace detail {

// Shared by both promise flavours: continuation bookkeeping and the final
// awaiter that hands control back to whoever awaited us.
class TaskPromiseBase {
   public:
    std::suspend_always initial_suspend() noexcept { return {}; }

    struct FinalAwaiter {
        bool await_ready() noexcept { return false; }

        template <typename Promise>
        SymmetricTransferResult await_suspend(std::coroutine_handle<Promise> finishing) noexcept {
            auto continuation = static_cast<TaskPromiseBase&>(finishing.promise()).continuation_;
            return SymmetricTransfer(continuation ? continuation : std::noop_coroutine());
        }

        void await_resume() noexcept {}
    };

    FinalAwaiter final_suspend() noexcept { return {}; }

    void unhandled_exception() noexcept { std::abort(); }

    void SetContinuation(std::coroutine_handle<> cont) noexcept {
        COTREE_CHECK(!continuation_, "Task co_awaited twice");
        continuation_ = cont;
    }

   private:
    std::coroutine_handle<> continuation_;
};

}  // namespace detail

template <typename T>
class TaskPromise : public detail::TaskPromiseBase {
   public:
    Task<T> get_return_object() noexcept;

    template <typename U>
    void return_value(U&& value) {
        result_.emplace(std::forward<U>(value));
    }

    T TakeResult() {
        COTREE_CHECK(result_.has_value(), "Task resumed without a value");
        return std::move(*result_);
    }

   private:
    std::optional<T> result_;
};

template <>
class TaskPromise<void> : public detail::TaskPromiseBase {
   public:
    Task<void> get_return_object() noexcept;

    void return_void() noexcept {}

    void TakeResult() noexcept {}
};

template <typename T>
class [[nodiscard("Task must be co_awaited")]] Task {
   public:
    using promise_type = TaskPromise<T>;
    using Handle = std::coroutine_handle<promise_type>;

    explicit Task(Handle handle) noexcept : handle_(handle) {}

    ~Task() {
        if (handle_) {
            handle_.destroy();
        }
    }

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    Task(Task&& other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {}

    Task& operator=(Task&& other) noexcept {
        if (this != &other) {
            if (handle_) {
                handle_.destroy();
            }
            handle_ = std::exchange(other.handle_, nullptr);
        }
        return *this;
    }

    struct Awaiter {
        Handle handle_;

        bool await_ready() noexcept { return false; }

        // Record who is waiting, then jump into the lazy body.
        SymmetricTransferResult await_suspend(std::coroutine_handle<> awaiting) noexcept {
            handle_.promise().SetContinuation(awaiting);
            return SymmetricTransfer(handle_);
        }

        T await_resume() { return handle_.promise().TakeResult(); }
    };

    [[nodiscard]] Awaiter operator co_await() noexcept { return Awaiter{handle_}; }

    [[nodiscard]] Handle GetHandle() const noexcept { return handle_; }

   private:
    Handle handle_;
};

template <typename T>
Task<T> TaskPromise<T>::get_return_object() noexcept {
    return Task<T>{Task<T>::Handle::from_promise(*this)};
}

inline Task<void> TaskPromise<void>::get_return_object() noexcept {
    return Task<void>{Task<void>::Handle::from_promise(*this)};
}

}  // namespace cotree
