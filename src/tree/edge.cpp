// ============================================================================
// cotree/tree/edge.cpp - Edge Registration and Firing
// ============================================================================

#include "cotree/tree/edge.hpp"

#include "cotree/core/log.hpp"
#include "cotree/tree/commander.hpp"
#include "cotree/tree/handler.hpp"
#include "cotree/tree/job.hpp"

#include <utility>

namespace cotree {

namespace {

// A target equal to its source is stored as a self-reference so the source's
// own registry does not keep it alive.
struct EdgeTarget {
    std::shared_ptr<TaskNode> node;
    bool self = false;
};

Result<EdgeTarget, Error> MakeTarget(TaskNode& from, std::shared_ptr<TaskNode> to) {
    if (!to || to->Kind() == NodeKind::Commander) {
        return Err(make_error_code(Errc::InvalidEdge));
    }
    if (to.get() != &from) {
        return Ok(EdgeTarget{std::move(to), false});
    }
    if (from.Kind() != NodeKind::Handler || !from.IsReusable()) {
        return Err(make_error_code(Errc::InvalidEdge));
    }
    return Ok(EdgeTarget{nullptr, true});
}

std::shared_ptr<TaskNode> Resolve(TaskNode& from, const EdgeTarget& target) {
    if (target.self) {
        return static_cast<Handler&>(from).shared_from_this();
    }
    return target.node;
}

Result<void, Error> Register(TaskNode& from, CallbackFn fire) {
    if (from.Kind() == NodeKind::Commander) {
        return Err(make_error_code(Errc::InvalidEdge));
    }
    return from.AddCallback(TaskNode::EndStage(from.Kind()), std::move(fire), {}, {}, true);
}

void Connect(TaskNode& from, const std::shared_ptr<TaskNode>& to, const EdgeOptions& options) {
    TaskNode* parent = from.Parent();
    Error error;

    if (parent == nullptr) {
        error = make_error_code(Errc::ParentClosed);
    } else if (to->Kind() == NodeKind::Job) {
        auto job = SubmitJob(*parent, std::static_pointer_cast<Job>(to), options.submit);
        if (job.IsErr()) {
            error = job.Error();
        }
    } else {
        Args args = options.args;
        if (options.forward_result && from.GetResult() != nullptr) {
            args = Args{*from.GetResult()};
        }
        auto handler = CallHandler(*parent, std::static_pointer_cast<Handler>(to), std::move(args), options.submit);
        if (handler.IsErr()) {
            error = handler.Error();
        }
    }

    if (error) {
        LOG_ERROR(Logger(), "edge {}#{} -> {}#{} not scheduled: {}", from.Name(), from.Id(), to->Name(), to->Id(),
                  error.message());
        if (Commander* commander = from.GetCommander()) {
            commander->RecordFault(*to, MakeFault(error, "edge from " + from.Name()));
        }
        return;
    }
    LOG_DEBUG(Logger(), "edge {}#{} -> {}#{}", from.Name(), from.Id(), to->Name(), to->Id());
}

}  // namespace

std::optional<std::string> ResultString(const TaskNode& from) {
    if (const auto* text = from.ResultAs<std::string>()) {
        return *text;
    }
    if (const auto* text = from.ResultAs<const char*>()) {
        return std::string(*text);
    }
    return std::nullopt;
}

Result<void, Error> AddEdge(TaskNode& from, std::shared_ptr<TaskNode> to, EdgeOptions options) {
    auto target = MakeTarget(from, std::move(to));
    if (target.IsErr()) {
        return Err(target.Error());
    }
    return Register(from, [target = std::move(target).Value(), options = std::move(options)](
                              const CallbackContext& ctx) { Connect(*ctx.node, Resolve(*ctx.node, target), options); });
}

Result<void, Error> AddEdge(TaskNode& from, NodeFactory factory, EdgeOptions options) {
    if (!factory) {
        return Err(make_error_code(Errc::InvalidArgument));
    }
    return Register(from, [factory = std::move(factory), options = std::move(options)](const CallbackContext& ctx) {
        auto to = factory(*ctx.node);
        if (!to) {
            LOG_DEBUG(Logger(), "edge factory of {}#{} produced no successor", ctx.node->Name(), ctx.node->Id());
            return;
        }
        if (to->Kind() == NodeKind::Commander) {
            LOG_ERROR(Logger(), "edge factory of {}#{} produced a Commander", ctx.node->Name(), ctx.node->Id());
            if (Commander* commander = ctx.node->GetCommander()) {
                commander->RecordFault(*ctx.node, MakeFault(Errc::InvalidEdge, "edge factory"));
            }
            return;
        }
        Connect(*ctx.node, to, options);
    });
}

Result<void, Error> AddConditionalEdge(TaskNode& from, std::map<std::string, std::shared_ptr<TaskNode>> branches,
                                       BranchSelector selector, EdgeOptions options) {
    if (!selector) {
        return Err(make_error_code(Errc::InvalidArgument));
    }
    std::map<std::string, EdgeTarget> targets;
    for (auto& [key, node] : branches) {
        auto target = MakeTarget(from, std::move(node));
        if (target.IsErr()) {
            return Err(target.Error());
        }
        targets.emplace(key, std::move(target).Value());
    }

    return Register(from, [targets = std::move(targets), selector = std::move(selector),
                           options = std::move(options)](const CallbackContext& ctx) {
        auto key = selector(*ctx.node);
        if (!key) {
            LOG_DEBUG(Logger(), "{}#{}: no branch key in result", ctx.node->Name(), ctx.node->Id());
            return;
        }
        auto it = targets.find(*key);
        if (it == targets.end()) {
            LOG_DEBUG(Logger(), "{}#{}: no branch for \"{}\"", ctx.node->Name(), ctx.node->Id(), *key);
            return;
        }
        Connect(*ctx.node, Resolve(*ctx.node, it->second), options);
    });
}

}  // namespace cotree
