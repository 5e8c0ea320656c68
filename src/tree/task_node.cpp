// ============================================================================
// cotree/tree/task_node.cpp - Node State Machine and Resolution Barrier
// ============================================================================

#include "cotree/tree/task_node.hpp"

#include "cotree/core/check.hpp"
#include "cotree/core/log.hpp"
#include "cotree/tree/commander.hpp"
#include "cotree/tree/handler.hpp"
#include "cotree/tree/job.hpp"

#include <algorithm>
#include <atomic>
#include <utility>

namespace cotree {

namespace {

std::atomic<uint64_t> g_next_node_id{1};

}  // namespace

const char* ToString(NodeStatus status) noexcept {
    switch (status) {
        case NodeStatus::Pending:
            return "Pending";
        case NodeStatus::Running:
            return "Running";
        case NodeStatus::Completed:
            return "Completed";
        case NodeStatus::Failed:
            return "Failed";
        case NodeStatus::Terminated:
            return "Terminated";
    }
    return "Unknown";
}

const char* ToString(NodeKind kind) noexcept {
    switch (kind) {
        case NodeKind::Job:
            return "Job";
        case NodeKind::Handler:
            return "Handler";
        case NodeKind::Commander:
            return "Commander";
    }
    return "Unknown";
}

// ============================================================================
// Construction / Queries
// ============================================================================

TaskNode::TaskNode(NodeKind kind, std::string name)
    : id_(g_next_node_id.fetch_add(1, std::memory_order_relaxed)), name_(std::move(name)), kind_(kind) {
    // No children yet: the barrier is open.
    children_done_.Set();
}

bool TaskNode::IsTerminal() const noexcept {
    return status_ == NodeStatus::Completed || status_ == NodeStatus::Failed || status_ == NodeStatus::Terminated;
}

Stage TaskNode::StartStage(NodeKind kind) noexcept {
    return kind == NodeKind::Handler ? Stage::HandlerStart : Stage::JobStart;
}

Stage TaskNode::EndStage(NodeKind kind) noexcept {
    switch (kind) {
        case NodeKind::Handler:
            return Stage::HandlerEnd;
        case NodeKind::Commander:
            return Stage::CommanderEnd;
        case NodeKind::Job:
            break;
    }
    return Stage::JobEnd;
}

// ============================================================================
// Callbacks
// ============================================================================

Result<void, Error> TaskNode::AddCallback(Stage stage, CallbackFn function, Args args, Kwargs kwargs,
                                          bool inject_node) {
    bool allowed = false;
    switch (kind_) {
        case NodeKind::Job:
        case NodeKind::Handler:
            allowed = stage == StartStage(kind_) || stage == EndStage(kind_) || stage == Stage::Exception ||
                      stage == Stage::Terminate;
            break;
        case NodeKind::Commander:
            allowed = stage == Stage::CommanderEnd || stage == Stage::Terminate;
            break;
    }
    if (!allowed) {
        LOG_WARNING(Logger(), "{}#{}: {} never fires on a {}", name_, id_, ToString(stage), ToString(kind_));
        return Err(make_error_code(Errc::InvalidStage));
    }
    return callbacks_.Register(stage, CallbackBinding{std::move(function), std::move(args), std::move(kwargs),
                                                      inject_node});
}

void TaskNode::FireStage(Stage stage, const Fault* fault) {
    callbacks_.Fire(stage, *this, fault);
}

// ============================================================================
// Attachment
// ============================================================================

bool TaskNode::AcceptsChildren() const noexcept {
    if (terminating_ || resolved_) {
        return false;
    }
    if (kind_ == NodeKind::Commander) {
        return status_ == NodeStatus::Pending || status_ == NodeStatus::Running;
    }
    return status_ == NodeStatus::Running;
}

void TaskNode::Attach(TaskNode& parent, const std::shared_ptr<TaskNode>& child, const SubmitOptions& options,
                      bool reserved) {
    COTREE_CHECK(parent.commander_ != nullptr, "attaching under a node outside any tree");

    child->parent_ = &parent;
    child->commander_ = parent.commander_;
    child->policy_ = options.fault_policy.value_or(parent.commander_->Options().default_fault_policy);

    if (std::find(parent.children_.begin(), parent.children_.end(), child) == parent.children_.end()) {
        parent.children_.push_back(child);
    }
    if (!reserved) {
        parent.ReserveChild();
    }

    LOG_DEBUG(Logger(), "{}#{} attached under {}#{}", child->name_, child->id_, parent.name_, parent.id_);
    parent.commander_->Launch(child);
}

void TaskNode::ReserveChild() {
    ++unresolved_children_;
    children_done_.Reset();
}

void TaskNode::Detach(const TaskNode& child) {
    auto it = std::find_if(children_.begin(), children_.end(),
                           [&child](const std::shared_ptr<TaskNode>& c) { return c.get() == &child; });
    if (it != children_.end()) {
        children_.erase(it);
    }
}

// ============================================================================
// Execution
// ============================================================================

Task<void> TaskNode::Drive(std::shared_ptr<TaskNode> self, uint64_t cycle) {
    // Terminated (or re-armed) before the loop got to us.
    if (self->status_ != NodeStatus::Pending || self->cycle_ != cycle) {
        co_return;
    }

    self->status_ = NodeStatus::Running;
    LOG_DEBUG(Logger(), "{}#{} running", self->name_, self->id_);
    self->FireStage(StartStage(self->kind_));
    if (!self->StillCurrent(cycle)) {
        co_return;
    }

    NodeResult outcome = co_await self->RunBody();
    if (!self->StillCurrent(cycle)) {
        LOG_DEBUG(Logger(), "{}#{} body returned after termination; outcome dropped", self->name_, self->id_);
        co_return;
    }

    // Bottom-up barrier. Children may still be added while we wait
    // (edges attach siblings from end callbacks), hence the loop.
    while (self->unresolved_children_ > 0) {
        co_await self->children_done_.Wait();
        if (!self->StillCurrent(cycle)) {
            co_return;
        }
    }

    self->Finish(std::move(outcome));
}

Task<NodeResult> TaskNode::RunBody() {
    COTREE_CHECK(kind_ != NodeKind::Commander, "the Commander has no body");
    if (kind_ == NodeKind::Handler) {
        return static_cast<Handler*>(this)->StartBody();
    }
    return static_cast<Job*>(this)->StartBody();
}

void TaskNode::Finish(NodeResult outcome) {
    if (outcome.IsOk() && child_fault_) {
        outcome = Err(MakeFault(Errc::ChildFailed, child_fault_origin_ + ": " + child_fault_->Message()));
    }

    closing_ = true;
    if (outcome.IsOk()) {
        result_.emplace(std::move(outcome).Value());
        status_ = NodeStatus::Completed;
        LOG_DEBUG(Logger(), "{}#{} completed", name_, id_);
        FireStage(EndStage(kind_));
    } else {
        error_.emplace(std::move(outcome).Error());
        status_ = NodeStatus::Failed;
        LOG_WARNING(Logger(), "{}#{} failed: {}", name_, id_, error_->Message());
        commander_->RecordFault(*this, *error_);
        FireStage(Stage::Exception, &*error_);
    }
    closing_ = false;

    Resolve();
}

// ============================================================================
// Resolution
// ============================================================================

void TaskNode::Resolve() {
    COTREE_CHECK(!resolved_, "node resolved twice in one cycle");
    COTREE_CHECK(unresolved_children_ == 0, "node resolved before its children");

    resolved_ = true;
    resolution_seq_ = commander_ ? commander_->NextSeq() : 0;
    resolved_event_.Set();
    LOG_DEBUG(Logger(), "{}#{} resolved as {} (seq {})", name_, id_, ToString(status_), resolution_seq_);

    switch (kind_) {
        case NodeKind::Commander:
            static_cast<Commander*>(this)->OnClosed();
            return;
        case NodeKind::Handler:
            if (parent_) {
                parent_->OnChildResolved(*this);
            }
            if (live_drivers_ == 0) {
                static_cast<Handler*>(this)->StartQueuedCall();
            }
            return;
        case NodeKind::Job:
            if (parent_) {
                parent_->OnChildResolved(*this);
            }
            return;
    }
}

void TaskNode::OnChildResolved(const TaskNode& child) {
    if (child.status_ == NodeStatus::Failed && child.policy_ == FaultPolicy::Propagate && !child_fault_) {
        child_fault_ = *child.error_;
        child_fault_origin_ = child.name_;
    }
    ChildSettled();
}

void TaskNode::ChildSettled() {
    COTREE_CHECK(unresolved_children_ > 0, "child settled twice");
    if (--unresolved_children_ > 0) {
        return;
    }
    children_done_.Set();

    // Terminate() resolves us itself once its cascade is over.
    if (resolved_ || terminating_) {
        return;
    }
    if (status_ == NodeStatus::Terminated) {
        Resolve();
    } else if (kind_ == NodeKind::Commander && status_ == NodeStatus::Running) {
        static_cast<Commander*>(this)->Complete();
    }
}

void TaskNode::DriverExited() {
    COTREE_CHECK(live_drivers_ > 0, "driver exit without a driver");
    if (--live_drivers_ > 0) {
        return;
    }
    if (kind_ == NodeKind::Handler && resolved_) {
        static_cast<Handler*>(this)->StartQueuedCall();
    }
}

// ============================================================================
// Termination
// ============================================================================

void TaskNode::Terminate() {
    if (IsTerminal() || resolved_ || terminating_) {
        return;
    }
    terminating_ = true;
    LOG_DEBUG(Logger(), "{}#{} terminating ({} children)", name_, id_, children_.size());

    // Children first. AcceptsChildren() is false from here on, so the list
    // cannot grow under us.
    for (size_t i = 0; i < children_.size(); ++i) {
        auto child = children_[i];
        if (child->parent_ == this && !child->resolved_) {
            child->Terminate();
        }
    }

    status_ = NodeStatus::Terminated;
    termination_.Trigger();

    closing_ = true;
    FireStage(Stage::Terminate);
    closing_ = false;
    terminating_ = false;

    // A child caught in its own closing stage, or a reserved slot, resolves
    // later and brings us along through ChildSettled().
    if (unresolved_children_ == 0) {
        Resolve();
    }
}

void TaskNode::Reset() {
    COTREE_CHECK(reusable_ && resolved_, "Reset of a one-shot or unresolved node");

    status_ = NodeStatus::Pending;
    result_.reset();
    error_.reset();
    child_fault_.reset();
    child_fault_origin_.clear();
    children_.clear();
    unresolved_children_ = 0;
    children_done_.Set();
    resolved_ = false;
    resolution_seq_ = 0;
    resolved_event_.Reset();
    termination_.Renew();
    ++cycle_;
}

// ============================================================================
// Join
// ============================================================================

Task<NodeResult> TaskNode::Join() {
    co_await Wait();
    switch (status_) {
        case NodeStatus::Completed:
            co_return Ok(*result_);
        case NodeStatus::Failed:
            co_return Err(*error_);
        case NodeStatus::Terminated:
            co_return Err(MakeFault(Errc::Terminated, name_));
        default:
            // A reusable Handler already re-armed for its next cycle
            co_return Err(MakeFault(Errc::NodeBusy, name_));
    }
}

}  // namespace cotree
