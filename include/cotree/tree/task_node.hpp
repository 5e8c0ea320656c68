// ============================================================================
// cotree/tree/task_node.hpp - Common Base of Every Tree Entity
// ============================================================================
//
// A TaskNode is one vertex of the task tree: a Job, a Handler, or the
// Commander at the root. The kind is a closed tag (NodeKind); code that needs
// variant-specific behaviour switches on it.
//
// STATE MACHINE:
// --------------
//
//   Pending --start--> Running --body + children done--> Completed | Failed
//      |                  |
//      +----Terminate()---+------------------------------> Terminated
//
//   - Pending->Running fires JobStart / HandlerStart.
//   - When the body returns the node stays Running until every child has
//     resolved, then fires JobEnd / HandlerEnd (Completed) or Exception
//     (Failed). End callbacks therefore always see a closed subtree.
//   - Terminate() terminates the unresolved children first (top-down), then
//     marks the node Terminated and fires the Terminate stage.
//   - Only a reusable Handler leaves a terminal state again (Reset()).
//
// RESOLUTION:
// -----------
// A node is "resolved" once it is terminal AND all of its children are
// resolved. Resolution is reported to the parent, which re-checks its own
// barrier. ResolutionSeq() stamps the order in which nodes resolved.
//
// OWNERSHIP:
// ----------
// Parents own children (shared_ptr); children point back with a raw Parent().
// The Commander that drives a tree must outlive every node it reached.
//
// ============================================================================

#pragma once

#include "cotree/core/error.hpp"
#include "cotree/core/result.hpp"
#include "cotree/core/task.hpp"
#include "cotree/core/termination.hpp"
#include "cotree/sync/event.hpp"
#include "cotree/tree/callback_registry.hpp"

#include <any>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cotree {

class Commander;
class Handler;
class Job;

enum class NodeStatus { Pending, Running, Completed, Failed, Terminated };

enum class NodeKind { Job, Handler, Commander };

// What a failed node does to its parent.
enum class FaultPolicy {
    Propagate,  // parent fails with ChildFailed; at the root, Commander::Run() returns it
    Record,     // only recorded on the node (edges inspect it)
};

const char* ToString(NodeStatus status) noexcept;
const char* ToString(NodeKind kind) noexcept;

using NodeResult = Result<std::any, Fault>;

struct SubmitOptions {
    // Unset: the Commander's default policy
    std::optional<FaultPolicy> fault_policy;
};

class TaskNode {
   public:
    virtual ~TaskNode() = default;

    TaskNode(const TaskNode&) = delete;
    TaskNode& operator=(const TaskNode&) = delete;

    // ========================================================================
    // Identity and shape
    // ========================================================================

    uint64_t Id() const noexcept { return id_; }
    const std::string& Name() const noexcept { return name_; }
    NodeKind Kind() const noexcept { return kind_; }

    TaskNode* Parent() const noexcept { return parent_; }
    const std::vector<std::shared_ptr<TaskNode>>& Children() const noexcept { return children_; }

    // Null until the node was attached somewhere.
    Commander* GetCommander() const noexcept { return commander_; }

    // ========================================================================
    // State
    // ========================================================================

    NodeStatus Status() const noexcept { return status_; }
    bool IsTerminal() const noexcept;
    bool IsResolved() const noexcept { return resolved_; }
    uint64_t ResolutionSeq() const noexcept { return resolution_seq_; }
    bool IsReusable() const noexcept { return reusable_; }
    uint64_t Cycle() const noexcept { return cycle_; }
    FaultPolicy Policy() const noexcept { return policy_; }

    // Present only when Completed / Failed respectively.
    const std::any* GetResult() const noexcept { return result_ ? &*result_ : nullptr; }
    const Fault* GetError() const noexcept { return error_ ? &*error_ : nullptr; }

    template <typename T>
    const T* ResultAs() const noexcept {
        return result_ ? std::any_cast<T>(&*result_) : nullptr;
    }

    // Caller-owned payload; never read by cotree.
    std::any& Data() noexcept { return data_; }
    const std::any& Data() const noexcept { return data_; }

    // ========================================================================
    // Callbacks
    // ========================================================================

    // InvalidStage when `stage` never fires for this kind of node.
    Result<void, Error> AddCallback(Stage stage, CallbackFn function, Args args = {}, Kwargs kwargs = {},
                                    bool inject_node = false);

    CallbackRegistry& Callbacks() noexcept { return callbacks_; }

    // Stage fired by Pending->Running / Running->Completed for this kind.
    static Stage StartStage(NodeKind kind) noexcept;
    static Stage EndStage(NodeKind kind) noexcept;

    // ========================================================================
    // Termination and waiting
    // ========================================================================

    // Cooperative: the body keeps running until it next looks at GetToken(),
    // but the node and its unresolved subtree are Terminated on return.
    void Terminate();

    TerminationToken GetToken() const { return termination_.GetToken(); }

    // Suspends until the node resolved.
    [[nodiscard]] AsyncEvent::WaitAwaitable Wait() { return resolved_event_.Wait(); }

    // Wait() and then the outcome as a NodeResult: the result, the fault, or
    // Errc::Terminated. The caller must keep the node alive.
    Task<NodeResult> Join();

   protected:
    TaskNode(NodeKind kind, std::string name);

    // Reusable Handlers only: clears the finished cycle and re-enters Pending.
    void Reset();

    bool reusable_ = false;

   private:
    friend class Commander;
    friend class Handler;
    friend class Job;

    // Drives one execution cycle; owned by a DetachedTask.
    static Task<void> Drive(std::shared_ptr<TaskNode> self, uint64_t cycle);

    Task<NodeResult> RunBody();
    bool StillCurrent(uint64_t cycle) const noexcept { return status_ == NodeStatus::Running && cycle_ == cycle; }

    // A Running Job or Handler, or a Commander that has not finished.
    bool AcceptsChildren() const noexcept;

    // `reserved`: the parent's slot was already counted by ReserveChild().
    static void Attach(TaskNode& parent, const std::shared_ptr<TaskNode>& child, const SubmitOptions& options,
                       bool reserved);
    void ReserveChild();
    void ReleaseReservation() { ChildSettled(); }
    void Detach(const TaskNode& child);

    void Finish(NodeResult outcome);
    void Resolve();
    void OnChildResolved(const TaskNode& child);
    // One counted child (or reserved slot) is gone; re-check the barrier.
    void ChildSettled();
    void FireStage(Stage stage, const Fault* fault = nullptr);
    // The Commander's driver for this node finished.
    void DriverExited();

    uint64_t id_;
    std::string name_;
    NodeKind kind_;

    TaskNode* parent_ = nullptr;
    Commander* commander_ = nullptr;
    std::vector<std::shared_ptr<TaskNode>> children_;
    size_t unresolved_children_ = 0;

    NodeStatus status_ = NodeStatus::Pending;
    FaultPolicy policy_ = FaultPolicy::Propagate;
    std::optional<std::any> result_;
    std::optional<Fault> error_;
    std::any data_;

    // First fault of a Propagate child, applied when this node finishes
    std::optional<Fault> child_fault_;
    std::string child_fault_origin_;

    bool resolved_ = false;
    bool terminating_ = false;
    bool closing_ = false;  // firing the terminal stage
    uint64_t resolution_seq_ = 0;
    uint64_t cycle_ = 0;
    // Drivers still holding this node. A terminated body can outlive its
    // cycle's resolution until it next observes its token.
    size_t live_drivers_ = 0;

    CallbackRegistry callbacks_;
    TerminationSource termination_;
    AsyncEvent resolved_event_;
    AsyncEvent children_done_;
};

}  // namespace cotree
