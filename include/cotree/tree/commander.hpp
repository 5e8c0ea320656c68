// ============================================================================
// cotree/tree/commander.hpp - Root Scheduler
// ============================================================================
//
// The Commander is the universal ancestor of a task tree. Roots are attached
// with Submit() (before or during Run()), and Run() drives every root and,
// transitively, every descendant on a private libuv loop:
//
//   Commander commander;
//   commander.AddCallback(Stage::CommanderEnd, [](const CallbackContext&) { ... });
//   commander.Submit(Job::Create("ingest", Ingest));
//   commander.Submit(Job::Create("index", Index));
//   auto outcome = commander.Run();   // blocks until both subtrees resolved
//   if (outcome.IsErr()) LOG_ERROR(Logger(), "{}", outcome.Error().Message());
//
// RUN SEMANTICS:
// --------------
// - The Commander resolves exactly when all of its roots resolved; then it
//   fires CommanderEnd once. With no roots that happens immediately.
// - Run() returns after that, once the coroutine frames of bodies that were
//   terminated mid-flight have also finished. Frames still suspended when the
//   loop runs dry can never resume; they are destroyed before Run() returns.
// - Run() returns the first fault that reached the Commander through a
//   root submitted with FaultPolicy::Propagate. Every fault in the tree is
//   also listed in Faults().
// - If the loop runs out of work before the tree resolved (a body awaits
//   something that can never happen), the tree is terminated and Run()
//   returns Errc::Stalled.
//
// A Commander runs once.
//
// ============================================================================

#pragma once

#include "cotree/io/libuv_executor.hpp"
#include "cotree/tree/task_node.hpp"

#include <coroutine>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <quill/core/LogLevel.h>

namespace cotree {

struct CommanderOptions {
    std::string name = "commander";
    FaultPolicy default_fault_policy = FaultPolicy::Propagate;
    // Applied to Logger() when Run() starts.
    std::optional<quill::LogLevel> log_level;
    // Honour COTREE_LOG_LEVEL from the environment when Run() starts.
    bool load_env_log_levels = true;
};

struct FaultRecord {
    uint64_t node_id;
    std::string node_name;
    Fault fault;
};

class Commander : public TaskNode {
   public:
    explicit Commander(CommanderOptions options = {});
    ~Commander() override;

    // Attach a Job or Handler as a root. Handlers are called with no args.
    //   InvalidEdge      - null, or another Commander
    //   AlreadySubmitted - a Job that was attached before
    //   ParentClosed     - the Commander already resolved
    Result<void, Error> Submit(std::shared_ptr<TaskNode> node, SubmitOptions options = {});

    Result<void, Fault> Run();

    const CommanderOptions& Options() const noexcept { return options_; }

    const std::vector<FaultRecord>& Faults() const noexcept { return faults_; }

    // Roots not yet resolved.
    size_t PendingRoots() const noexcept { return unresolved_children_; }

    // Driver coroutines currently alive.
    size_t InFlight() const noexcept { return drivers_.size(); }

    void RecordFault(const TaskNode& node, Fault fault);

   private:
    friend class TaskNode;

    // Schedules the driver for the node's current cycle.
    void Launch(const std::shared_ptr<TaskNode>& node);
    void StartDriver(const std::shared_ptr<TaskNode>& node, uint64_t cycle);

    void Complete();
    void OnClosed();
    void MaybeStop();
    // Destroys driver frames that can no longer be resumed by this tree.
    void ReleaseParkedDrivers();

    uint64_t NextSeq() noexcept { return ++seq_; }

    CommanderOptions options_;
    std::unique_ptr<LibuvExecutor> executor_;
    std::vector<std::shared_ptr<TaskNode>> before_run_;
    std::vector<FaultRecord> faults_;
    // Live driver frames, keyed by launch order
    std::map<uint64_t, std::coroutine_handle<>> drivers_;
    uint64_t next_driver_ = 0;
    uint64_t seq_ = 0;
    bool run_started_ = false;
};

}  // namespace cotree
