// ============================================================================
// cotree/core/detached_task.hpp - Self-Destroying Driver Coroutine
// ============================================================================
//
// Each tracked node execution is driven by one DetachedTask: nobody awaits
// it, it frees its own frame when the driver finishes, and it invokes an
// optional completion callback right before doing so. The Commander uses
// that callback to count driver frames still alive, so Run() does not return
// while a terminated body is still parked on a timer.
//
//   auto driver = MakeDetached(DriveNode(node));
//   driver.SetCallback([&] { --in_flight; });
//   driver.Start();  // runs inline up to the first suspension
//
// ============================================================================

#pragma once

#include "cotree/core/task.hpp"

#include <coroutine>
#include <cstdlib>
#include <functional>
#include <utility>

namespace cotree {

class DetachedTask {
   public:
    struct promise_type {
        std::function<void()> callback;

        DetachedTask get_return_object() noexcept {
            return DetachedTask{std::coroutine_handle<promise_type>::from_promise(*this)};
        }

        std::suspend_always initial_suspend() noexcept { return {}; }

        auto final_suspend() noexcept {
            struct FinalAwaiter {
                bool await_ready() noexcept { return false; }
                void await_suspend(std::coroutine_handle<promise_type> h) noexcept {
                    auto callback = std::move(h.promise().callback);
                    h.destroy();
                    if (callback) {
                        callback();
                    }
                }
                void await_resume() noexcept {}
            };
            return FinalAwaiter{};
        }

        void return_void() noexcept {}

        void unhandled_exception() noexcept { std::abort(); }
    };

    using Handle = std::coroutine_handle<promise_type>;

    explicit DetachedTask(Handle h) noexcept : handle_(h) {}

    DetachedTask(DetachedTask&& other) noexcept
        : handle_(std::exchange(other.handle_, nullptr)), started_(other.started_) {}

    DetachedTask& operator=(DetachedTask&& other) noexcept {
        if (this != &other) {
            if (handle_ && !started_) {
                handle_.destroy();
            }
            handle_ = std::exchange(other.handle_, nullptr);
            started_ = other.started_;
        }
        return *this;
    }

    DetachedTask(const DetachedTask&) = delete;
    DetachedTask& operator=(const DetachedTask&) = delete;

    // Started frames free themselves; only a never-started one is ours.
    ~DetachedTask() {
        if (handle_ && !started_) {
            handle_.destroy();
        }
    }

    // Stays valid until the frame finishes or is destroyed by its keeper.
    Handle GetHandle() const noexcept { return handle_; }

    void SetCallback(std::function<void()> cb) {
        if (handle_) {
            handle_.promise().callback = std::move(cb);
        }
    }

    void Start() {
        if (handle_ && !started_) {
            started_ = true;
            handle_.resume();
        }
    }

   private:
    Handle handle_;
    bool started_ = false;
};

inline DetachedTask MakeDetached(Task<void> task) {
    co_await std::move(task);
}

}  // namespace cotree
