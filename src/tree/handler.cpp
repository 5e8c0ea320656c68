// ============================================================================
// cotree/tree/handler.cpp - Tracked Calls and Reuse
// ============================================================================

#include "cotree/tree/handler.hpp"

#include "cotree/core/log.hpp"

#include <utility>

namespace cotree {

Handler::Handler(std::string name, HandlerCallable callable, HandlerOptions options)
    : TaskNode(NodeKind::Handler, std::move(name)), callable_(std::move(callable)) {
    reusable_ = options.reusable;
}

std::shared_ptr<Handler> Handler::Create(std::string name, HandlerCallable callable, HandlerOptions options) {
    return std::shared_ptr<Handler>(new Handler(std::move(name), std::move(callable), options));
}

Result<std::shared_ptr<Handler>, Error> Handler::Call(TaskNode& parent, std::shared_ptr<Handler> handler, Args args,
                                                      SubmitOptions options) {
    if (!handler || !handler->callable_) {
        return Err(make_error_code(Errc::InvalidArgument));
    }
    if (handler->calls_ > 0 && !handler->reusable_) {
        LOG_WARNING(Logger(), "{}#{} is one-shot and was already called", handler->Name(), handler->Id());
        return Err(make_error_code(Errc::ReuseViolation));
    }
    if (!parent.AcceptsChildren()) {
        LOG_WARNING(Logger(), "{}#{} refused handler {}: parent is {}", parent.Name(), parent.Id(), handler->Name(),
                    ToString(parent.Status()));
        return Err(make_error_code(Errc::ParentClosed));
    }

    if (handler->calls_ == 0) {
        if (handler->status_ != NodeStatus::Pending) {
            return Err(make_error_code(Errc::AlreadySubmitted));
        }
        ++handler->calls_;
        handler->args_ = std::move(args);
        Attach(parent, handler, options, false);
        return Ok(std::move(handler));
    }

    // Called from one of its own terminal-stage callbacks, or terminated while
    // the body is still suspended: hold a slot in the caller's barrier and
    // start once this cycle resolved and its driver is gone.
    if ((handler->closing_ && handler->IsTerminal()) || (handler->resolved_ && handler->live_drivers_ > 0)) {
        if (handler->queued_) {
            return Err(make_error_code(Errc::NodeBusy));
        }
        ++handler->calls_;
        parent.ReserveChild();
        handler->queued_ = QueuedCall{&parent, std::move(args), options};
        if (handler->resolved_) {
            // Wait() now follows the queued cycle.
            handler->resolved_event_.Reset();
        }
        LOG_DEBUG(Logger(), "{}#{} call queued under {}#{}", handler->Name(), handler->Id(), parent.Name(), parent.Id());
        return Ok(std::move(handler));
    }

    if (!handler->resolved_) {
        return Err(make_error_code(Errc::NodeBusy));
    }

    ++handler->calls_;
    handler->Rearm(parent, std::move(args), options, false);
    return Ok(std::move(handler));
}

void Handler::StartQueuedCall() {
    if (!queued_) {
        return;
    }
    QueuedCall call = std::move(*queued_);
    queued_.reset();

    if (!call.parent->AcceptsChildren()) {
        LOG_DEBUG(Logger(), "{}#{} queued call dropped: {}#{} is {}", name_, id_, call.parent->Name(), call.parent->Id(),
                  ToString(call.parent->Status()));
        resolved_event_.Set();
        call.parent->ReleaseReservation();
        return;
    }
    Rearm(*call.parent, std::move(call.args), call.options, true);
}

void Handler::Rearm(TaskNode& parent, Args args, const SubmitOptions& options, bool reserved) {
    auto self = shared_from_this();
    TaskNode* previous = parent_;

    Reset();
    args_ = std::move(args);
    // Attach first: the new parent takes ownership before the old one lets go.
    Attach(parent, self, options, reserved);
    if (previous != nullptr && previous != &parent) {
        previous->Detach(*this);
    }
    LOG_DEBUG(Logger(), "{}#{} re-armed for cycle {} under {}#{}", name_, id_, cycle_, parent.Name(), parent.Id());
}

Result<std::shared_ptr<Handler>, Error> CallHandler(TaskNode& parent, std::shared_ptr<Handler> handler, Args args,
                                                    SubmitOptions options) {
    return Handler::Call(parent, std::move(handler), std::move(args), options);
}

Result<std::shared_ptr<Handler>, Error> CallHandler(TaskNode& parent, std::string name, HandlerCallable callable,
                                                    Args args, SubmitOptions options) {
    return Handler::Call(parent, Handler::Create(std::move(name), std::move(callable)), std::move(args), options);
}

}  // namespace cotree
