// ============================================================================
// cotree/tree/handler.hpp - Reusable Callable Node
// ============================================================================
//
// A Handler wraps a coroutine callable. It can be used two ways:
//
//   TRACKED  - CallHandler(parent, handler, args) attaches it under `parent`,
//              schedules it, and gives it the full lifecycle (status,
//              HandlerStart / HandlerEnd / Exception / Terminate callbacks,
//              participation in the parent's barrier).
//
//   PLAIN    - co_await handler->Invoke(args) just runs the callable and
//              hands back its NodeResult. No status change, no callbacks, no
//              tree edges.
//
// REUSE:
// ------
// A Handler created with `reusable = true` may be tracked-called again once
// its previous cycle resolved. The call resets it (Pending, no result, no
// children, fresh termination token) and re-parents it under the new caller.
// A call made from one of its own terminal-stage callbacks is queued and
// starts right after the current cycle resolved; this is how a Handler edge
// loops back onto itself. A call made after Terminate() while the terminated
// body is still suspended is queued the same way and starts once that body
// returned, so a stale body never sees the next cycle's token.
//
//   auto tick = Handler::Create("tick", Tick, {.reusable = true});
//   AddConditionalEdge(*tick, {{"again", tick}});   // loop until "done"
//   CallHandler(commander, tick, {std::any(0)});
//
// Calling a non-reusable Handler twice fails with ReuseViolation; calling any
// Handler while a cycle is in flight fails with NodeBusy.
//
// ============================================================================

#pragma once

#include "cotree/tree/task_node.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace cotree {

using HandlerCallable = std::function<Task<NodeResult>(Handler& self, Args args)>;

struct HandlerOptions {
    bool reusable = false;
};

class Handler : public TaskNode, public std::enable_shared_from_this<Handler> {
   public:
    static std::shared_ptr<Handler> Create(std::string name, HandlerCallable callable, HandlerOptions options = {});

    // Plain invocation, independent of the tree bookkeeping.
    Task<NodeResult> Invoke(Args args) { return callable_(*this, std::move(args)); }

    const Args& GetArgs() const noexcept { return args_; }

    // Number of tracked calls accepted so far.
    uint64_t CallCount() const noexcept { return calls_; }

    static Result<std::shared_ptr<Handler>, Error> Call(TaskNode& parent, std::shared_ptr<Handler> handler,
                                                        Args args = {}, SubmitOptions options = {});

   private:
    friend class TaskNode;

    struct QueuedCall {
        TaskNode* parent;
        Args args;
        SubmitOptions options;
    };

    Handler(std::string name, HandlerCallable callable, HandlerOptions options);

    Task<NodeResult> StartBody() { return callable_(*this, args_); }

    // Runs after a cycle resolved; starts the call queued during its closing.
    void StartQueuedCall();

    // Reset, re-parent and attach under `parent` for the next cycle.
    void Rearm(TaskNode& parent, Args args, const SubmitOptions& options, bool reserved);

    HandlerCallable callable_;
    Args args_;
    uint64_t calls_ = 0;
    std::optional<QueuedCall> queued_;
};

// Track a call of `handler` under `parent`.
Result<std::shared_ptr<Handler>, Error> CallHandler(TaskNode& parent, std::shared_ptr<Handler> handler,
                                                    Args args = {}, SubmitOptions options = {});

// Wrap `callable` in a fresh one-shot Handler and track it under `parent`.
Result<std::shared_ptr<Handler>, Error> CallHandler(TaskNode& parent, std::string name, HandlerCallable callable,
                                                    Args args = {}, SubmitOptions options = {});

}  // namespace cotree
