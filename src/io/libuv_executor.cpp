// ============================================================================
// cotree/io/libuv_executor.cpp - libuv-backed Executor Implementation
// ============================================================================

#include "cotree/io/libuv_executor.hpp"

#include "cotree/core/check.hpp"

#include <utility>

namespace cotree {

// ============================================================================
// Construction / Destruction
// ============================================================================

Result<std::unique_ptr<LibuvExecutor>, Error> LibuvExecutor::Create() {
    auto executor = std::unique_ptr<LibuvExecutor>(new LibuvExecutor());

    if (uv_loop_init(&executor->loop_) != 0) {
        return Err(make_error_code(Errc::IoError));
    }

    if (uv_idle_init(&executor->loop_, &executor->idle_) != 0) {
        uv_loop_close(&executor->loop_);
        return Err(make_error_code(Errc::IoError));
    }
    executor->idle_.data = executor.get();

    return Ok(std::move(executor));
}

LibuvExecutor::~LibuvExecutor() {
    // Timers of abandoned sleeps may be far in the future: close every handle
    // instead of waiting for them, then let the close callbacks run.
    uv_walk(&loop_, CloseAny, nullptr);
    while (uv_run(&loop_, UV_RUN_NOWAIT) != 0) {
    }
    uv_loop_close(&loop_);
}

// ============================================================================
// Loop Control
// ============================================================================

void LibuvExecutor::Run() {
    COTREE_CHECK(!running_, "LibuvExecutor::Run re-entered");
    running_ = true;
    ExecutorGuard guard(this);
    uv_run(&loop_, UV_RUN_DEFAULT);
    running_ = false;
}

void LibuvExecutor::Stop() {
    uv_stop(&loop_);
}

bool LibuvExecutor::IsRunning() const {
    return running_;
}

// ============================================================================
// Scheduling
// ============================================================================

void LibuvExecutor::Schedule(std::coroutine_handle<> handle) {
    Enqueue([handle] { handle.resume(); });
}

void LibuvExecutor::Post(std::function<void()> callback) {
    Enqueue(std::move(callback));
}

void LibuvExecutor::PostAfter(std::chrono::milliseconds delay, std::function<void()> callback) {
    auto* entry = new TimerEntry{};
    entry->callback = std::move(callback);

    if (uv_timer_init(&loop_, &entry->timer) != 0) {
        // Without a timer the callback still has to run; run it next turn.
        Enqueue(std::move(entry->callback));
        delete entry;
        return;
    }
    entry->timer.data = entry;
    uv_timer_start(&entry->timer, OnTimer, static_cast<uint64_t>(delay.count()), 0);
}

void LibuvExecutor::Enqueue(std::function<void()> item) {
    ready_.push_back(std::move(item));
    if (!idle_active_) {
        uv_idle_start(&idle_, OnIdle);
        idle_active_ = true;
    }
}

// ============================================================================
// libuv Callbacks
// ============================================================================

void LibuvExecutor::OnIdle(uv_idle_t* handle) {
    auto* self = static_cast<LibuvExecutor*>(handle->data);
    self->DrainReadyQueue();

    if (self->ready_.empty()) {
        uv_idle_stop(handle);
        self->idle_active_ = false;
    }
}

void LibuvExecutor::OnTimer(uv_timer_t* handle) {
    auto* entry = static_cast<TimerEntry*>(handle->data);
    auto callback = std::move(entry->callback);
    uv_close(reinterpret_cast<uv_handle_t*>(handle), OnTimerClosed);
    if (callback) {
        callback();
    }
}

void LibuvExecutor::OnTimerClosed(uv_handle_t* handle) {
    delete static_cast<TimerEntry*>(handle->data);
}

void LibuvExecutor::CloseAny(uv_handle_t* handle, void* /*arg*/) {
    if (uv_is_closing(handle)) {
        return;
    }
    if (handle->type == UV_TIMER) {
        uv_close(handle, OnTimerClosed);
    } else {
        uv_close(handle, nullptr);
    }
}

// ============================================================================
// Ready Queue
// ============================================================================

void LibuvExecutor::DrainReadyQueue() {
    // Only what was queued before this turn; work queued while draining
    // runs on the next idle tick so timers get a chance in between.
    std::deque<std::function<void()>> batch;
    std::swap(batch, ready_);

    while (!batch.empty()) {
        auto item = std::move(batch.front());
        batch.pop_front();
        item();
    }
}

}  // namespace cotree
