// ============================================================================
// cotree/io/libuv_executor.hpp - libuv-backed Executor
// ============================================================================
//
// The loop every Commander::Run() drives its tree on.
//
// ARCHITECTURE:
// -------------
// - uv_loop_t:  the event loop
// - uv_idle_t:  active only while the ready queue is non-empty; drains it
// - uv_timer_t: one per PostAfter() request, freed when it fires or closes
//
// Run() returns when Stop() is called or when the loop runs out of active
// handles, i.e. nothing is ready and no timer is pending. The Commander uses
// the latter to detect a tree that can no longer make progress.
//
// ============================================================================

#pragma once

#include "cotree/core/error.hpp"
#include "cotree/core/result.hpp"
#include "cotree/io/executor.hpp"

#include <chrono>
#include <coroutine>
#include <deque>
#include <functional>
#include <memory>
#include <uv.h>

namespace cotree {

class LibuvExecutor : public Executor {
   public:
    static Result<std::unique_ptr<LibuvExecutor>, Error> Create();

    ~LibuvExecutor() override;

    LibuvExecutor(const LibuvExecutor&) = delete;
    LibuvExecutor& operator=(const LibuvExecutor&) = delete;

    void Run() override;
    void Stop() override;
    bool IsRunning() const override;

    void Schedule(std::coroutine_handle<> handle) override;
    void Post(std::function<void()> callback) override;
    void PostAfter(std::chrono::milliseconds delay, std::function<void()> callback) override;

   private:
    LibuvExecutor() = default;

    // timer.data points back at the entry
    struct TimerEntry {
        uv_timer_t timer;
        std::function<void()> callback;
    };

    static void OnIdle(uv_idle_t* handle);
    static void OnTimer(uv_timer_t* handle);
    static void OnTimerClosed(uv_handle_t* handle);
    static void CloseAny(uv_handle_t* handle, void* arg);

    void Enqueue(std::function<void()> item);
    void DrainReadyQueue();

    uv_loop_t loop_{};
    uv_idle_t idle_{};
    bool idle_active_ = false;
    bool running_ = false;

    std::deque<std::function<void()>> ready_;
};

}  // namespace cotree
