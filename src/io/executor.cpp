// ============================================================================
// cotree/io/executor.cpp - Current-Executor Slot
// ============================================================================

#include "cotree/io/executor.hpp"

namespace cotree {

static thread_local Executor* g_current_executor = nullptr;

Executor* GetCurrentExecutor() {
    return g_current_executor;
}

ExecutorGuard::ExecutorGuard(Executor* executor) : previous_(g_current_executor) {
    g_current_executor = executor;
}

ExecutorGuard::~ExecutorGuard() {
    g_current_executor = previous_;
}

void ResumeLater(std::coroutine_handle<> handle) {
    if (g_current_executor) {
        g_current_executor->Schedule(handle);
    } else {
        handle.resume();
    }
}

}  // namespace cotree
