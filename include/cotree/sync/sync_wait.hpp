// ============================================================================
// cotree/sync/sync_wait.hpp - Run One Coroutine to Completion
// ============================================================================
//
// SyncWait() is the bridge from plain code to a single coroutine that is not
// part of any tree, typically a Handler invoked directly:
//
//   auto handler = Handler::Create("square", Square);
//   auto result = SyncWait(handler->Invoke({std::any(7)}));
//   if (result.IsOk() && result.Value().IsOk()) { ... }
//
// It spins up a private LibuvExecutor, so the coroutine may AsyncSleep. The
// outer Result only fails when the loop itself cannot be created.
//
// Never call SyncWait from inside a running loop.
//
// ============================================================================

#pragma once

#include "cotree/core/check.hpp"
#include "cotree/core/error.hpp"
#include "cotree/core/result.hpp"
#include "cotree/core/task.hpp"
#include "cotree/io/libuv_executor.hpp"

#include <optional>
#include <utility>

namespace cotree {

template <typename T>
Result<T, Error> SyncWait(Task<T> task) {
    auto created = LibuvExecutor::Create();
    if (created.IsErr()) {
        return Err(created.Error());
    }
    auto executor = std::move(created).Value();

    std::optional<T> result;
    auto wrapper = [&]() -> Task<void> { result.emplace(co_await std::move(task)); };
    auto wrapper_task = wrapper();

    executor->Post([&] { wrapper_task.GetHandle().resume(); });
    executor->Run();

    COTREE_CHECK(result.has_value(), "SyncWait: coroutine suspended forever");
    return Ok(std::move(*result));
}

inline Result<void, Error> SyncWait(Task<void> task) {
    auto created = LibuvExecutor::Create();
    if (created.IsErr()) {
        return Err(created.Error());
    }
    auto executor = std::move(created).Value();

    bool done = false;
    auto wrapper = [&]() -> Task<void> {
        co_await std::move(task);
        done = true;
    };
    auto wrapper_task = wrapper();

    executor->Post([&] { wrapper_task.GetHandle().resume(); });
    executor->Run();

    COTREE_CHECK(done, "SyncWait: coroutine suspended forever");
    return Ok();
}

}  // namespace cotree
