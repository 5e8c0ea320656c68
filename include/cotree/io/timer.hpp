// ============================================================================
// cotree/io/timer.hpp - Termination-Aware Sleep
// ============================================================================
//
// AsyncSleep suspends a body for a duration on the current executor. Given a
// TerminationToken it also wakes up as soon as the token fires, so a body
// parked in a long sleep notices a Terminate() right away instead of
// keeping the Commander's Run() busy until the timer expires.
//
// USAGE:
// ------
//   Task<NodeResult> Heartbeat(Job& self, Args) {
//       for (int i = 0; i < 10; ++i) {
//           co_await AsyncSleep(50ms, self.GetToken());
//           if (self.GetToken().IsTerminated()) co_return Ok();
//       }
//       co_return Ok(10);
//   }
//
// Without an executor (outside a loop) the sleep does not suspend at all.
//
// ============================================================================

#pragma once

#include "cotree/core/termination.hpp"
#include "cotree/io/executor.hpp"

#include <chrono>
#include <coroutine>
#include <memory>
#include <utility>

namespace cotree {

class AsyncSleep {
   public:
    template <typename Rep, typename Period>
    explicit AsyncSleep(std::chrono::duration<Rep, Period> duration, TerminationToken token = {})
        : duration_(std::chrono::duration_cast<std::chrono::milliseconds>(duration)), token_(std::move(token)) {}

    bool await_ready() const noexcept { return duration_.count() <= 0 || token_.IsTerminated(); }

    bool await_suspend(std::coroutine_handle<> handle) {
        Executor* executor = GetCurrentExecutor();
        if (!executor) {
            return false;
        }

        // Timer and token race; whichever comes first wakes the body.
        auto wake = std::make_shared<Wake>();
        wake->handle = handle;
        wake->token = token_;

        executor->PostAfter(duration_, [wake] {
            if (wake->done) return;
            wake->done = true;
            wake->token.Unregister(wake->registration);
            wake->handle.resume();
        });

        // Fires from inside Terminate(); defer the resume to the loop.
        wake->registration = wake->token.OnTerminate([wake, executor] {
            if (wake->done) return;
            wake->done = true;
            executor->Schedule(wake->handle);
        });
        return true;
    }

    void await_resume() const noexcept {}

   private:
    struct Wake {
        std::coroutine_handle<> handle;
        TerminationToken token;
        size_t registration = 0;
        bool done = false;
    };

    std::chrono::milliseconds duration_;
    TerminationToken token_;
};

}  // namespace cotree
