// ============================================================================
// cotree/io/executor.hpp - Event Loop Interface
// ============================================================================
//
// The Executor is the loop a Commander drives its tree on. The tree only
// needs four things from it:
//
//   Schedule(handle)          - resume a suspended coroutine on a later turn
//                               (resolution waiters, deferred wake-ups)
//   Post(callback)            - run a callback on a later turn
//                               (launching a submitted node)
//   PostAfter(delay, cb)      - run a callback once a delay elapsed
//                               (AsyncSleep)
//   Run() / Stop()            - block until stopped or out of work
//
// Deferring through the loop instead of resuming inline is what keeps a
// state transition atomic: no body code runs in the middle of Terminate()
// or of a callback stage.
//
// SINGLE-THREADED: an Executor is only touched from the thread that runs it.
// The current one is published in a thread-local slot (ExecutorGuard) so
// awaitables can find it.
//
// ============================================================================

#pragma once

#include <chrono>
#include <coroutine>
#include <functional>

namespace cotree {

class Executor {
   public:
    virtual ~Executor() = default;

    // Blocks until Stop() is called or nothing is queued or pending on a timer.
    virtual void Run() = 0;

    virtual void Stop() = 0;

    [[nodiscard]] virtual bool IsRunning() const = 0;

    virtual void Schedule(std::coroutine_handle<> handle) = 0;

    virtual void Post(std::function<void()> callback) = 0;

    // Callbacks still waiting on their timer when the executor is destroyed
    // are dropped without running.
    virtual void PostAfter(std::chrono::milliseconds delay, std::function<void()> callback) = 0;
};

// nullptr outside of a running loop
[[nodiscard]] Executor* GetCurrentExecutor();

// Publishes an executor for the current scope, restoring the previous one.
class ExecutorGuard {
   public:
    explicit ExecutorGuard(Executor* executor);
    ~ExecutorGuard();

    ExecutorGuard(const ExecutorGuard&) = delete;
    ExecutorGuard& operator=(const ExecutorGuard&) = delete;

   private:
    Executor* previous_;
};

// Resume `handle` through the current executor, or inline when there is none
// (plain SyncWait usage outside a Commander).
void ResumeLater(std::coroutine_handle<> handle);

}  // namespace cotree
