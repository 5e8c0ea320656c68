// ============================================================================
// cotree/sync/event.hpp - Manual-Reset Event With Deferred Wake-Up
// ============================================================================
//
// AsyncEvent backs both halves of the bottom-up barrier:
//   - a node's "resolved" event, awaited through TaskNode::Wait()
//   - a node's "all children resolved" event, awaited by its driver before
//     it takes its terminal transition
//
// Unlike a plain event, Set() does not resume waiters inline. They are
// handed to the current executor (ResumeLater), so Set() can be called in
// the middle of Terminate() or a callback stage without body code running
// before the transition has finished.
//
//   AsyncEvent event;
//   co_await event.Wait();  // suspends until Set()
//   event.Set();            // waiters resume on the next loop turn
//   event.Reset();          // later waiters suspend again
//
// ============================================================================

#pragma once

#include "cotree/io/executor.hpp"

#include <coroutine>
#include <utility>
#include <vector>

namespace cotree {

class AsyncEvent {
   public:
    AsyncEvent() = default;

    AsyncEvent(const AsyncEvent&) = delete;
    AsyncEvent& operator=(const AsyncEvent&) = delete;
    AsyncEvent(AsyncEvent&&) = delete;
    AsyncEvent& operator=(AsyncEvent&&) = delete;

    class WaitAwaitable {
       public:
        explicit WaitAwaitable(AsyncEvent& event) : event_(event) {}

        bool await_ready() const noexcept { return event_.signaled_; }

        void await_suspend(std::coroutine_handle<> h) { event_.waiters_.push_back(h); }

        void await_resume() const noexcept {}

       private:
        AsyncEvent& event_;
    };

    [[nodiscard]] WaitAwaitable Wait() { return WaitAwaitable(*this); }

    void Set() {
        if (signaled_) {
            return;
        }
        signaled_ = true;
        auto to_wake = std::move(waiters_);
        waiters_.clear();
        for (auto h : to_wake) {
            ResumeLater(h);
        }
    }

    void Reset() { signaled_ = false; }

    bool IsSet() const { return signaled_; }

    size_t WaiterCount() const { return waiters_.size(); }

   private:
    bool signaled_ = false;
    std::vector<std::coroutine_handle<>> waiters_;
};

}  // namespace cotree
