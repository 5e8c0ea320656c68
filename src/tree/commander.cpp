// ============================================================================
// cotree/tree/commander.cpp - Root Scheduler Implementation
// ============================================================================

#include "cotree/tree/commander.hpp"

#include "cotree/core/detached_task.hpp"
#include "cotree/core/log.hpp"
#include "cotree/tree/handler.hpp"
#include "cotree/tree/job.hpp"

#include <utility>

namespace cotree {

Commander::Commander(CommanderOptions options)
    : TaskNode(NodeKind::Commander, options.name), options_(std::move(options)) {
    commander_ = this;
}

Commander::~Commander() = default;

// ============================================================================
// Submission
// ============================================================================

Result<void, Error> Commander::Submit(std::shared_ptr<TaskNode> node, SubmitOptions options) {
    if (!node || node->Kind() == NodeKind::Commander) {
        LOG_WARNING(Logger(), "{}: only Jobs and Handlers can be submitted", name_);
        return Err(make_error_code(Errc::InvalidEdge));
    }

    if (node->Kind() == NodeKind::Job) {
        auto job = Job::Submit(*this, std::static_pointer_cast<Job>(std::move(node)), options);
        if (job.IsErr()) {
            return Err(job.Error());
        }
        return Ok();
    }

    auto handler = Handler::Call(*this, std::static_pointer_cast<Handler>(std::move(node)), {}, options);
    if (handler.IsErr()) {
        return Err(handler.Error());
    }
    return Ok();
}

void Commander::RecordFault(const TaskNode& node, Fault fault) {
    faults_.push_back(FaultRecord{node.Id(), node.Name(), std::move(fault)});
}

// ============================================================================
// Run
// ============================================================================

Result<void, Fault> Commander::Run() {
    if (run_started_) {
        return Err(MakeFault(Errc::InvalidArgument, "a Commander runs once"));
    }
    run_started_ = true;

    if (options_.load_env_log_levels) {
        LoadLogLevelFromEnv();
    }
    if (options_.log_level) {
        SetLogLevel(*options_.log_level);
    }

    if (status_ == NodeStatus::Terminated) {
        return Err(MakeFault(Errc::Terminated, name_ + " was terminated before Run()"));
    }

    auto created = LibuvExecutor::Create();
    if (created.IsErr()) {
        LOG_ERROR(Logger(), "{}: cannot create event loop: {}", name_, created.Error().message());
        return Err(MakeFault(created.Error(), "cannot create event loop"));
    }
    executor_ = std::move(created).Value();

    bool stalled = false;
    {
        ExecutorGuard guard(executor_.get());

        status_ = NodeStatus::Running;
        LOG_INFO(Logger(), "{} running {} root(s)", name_, before_run_.size());
        for (auto& node : std::exchange(before_run_, {})) {
            Launch(node);
        }
        if (unresolved_children_ == 0) {
            Complete();
        }

        executor_->Run();

        if (!resolved_) {
            stalled = true;
            LOG_ERROR(Logger(), "{} stalled with {} unresolved root(s); terminating the tree", name_,
                      unresolved_children_);
            Terminate();
            executor_->Run();
        }
        if (!drivers_.empty()) {
            LOG_WARNING(Logger(), "{}: {} body frame(s) never resumed; destroying them", name_, drivers_.size());
            ReleaseParkedDrivers();
        }
    }
    executor_.reset();

    LOG_INFO(Logger(), "{} finished as {} with {} fault(s)", name_, ToString(status_), faults_.size());
    if (stalled) {
        return Err(MakeFault(Errc::Stalled, name_));
    }
    if (child_fault_) {
        return Err(*child_fault_);
    }
    return Ok();
}

// ============================================================================
// Drivers
// ============================================================================

void Commander::Launch(const std::shared_ptr<TaskNode>& node) {
    if (!executor_) {
        before_run_.push_back(node);
        return;
    }
    // Started from the loop, never inline: the caller may be a body or a
    // callback in the middle of its own transition.
    executor_->Post([this, node, cycle = node->Cycle()] { StartDriver(node, cycle); });
}

void Commander::StartDriver(const std::shared_ptr<TaskNode>& node, uint64_t cycle) {
    auto driver = MakeDetached(TaskNode::Drive(node, cycle));
    const uint64_t key = ++next_driver_;
    drivers_.emplace(key, driver.GetHandle());
    ++node->live_drivers_;
    driver.SetCallback([this, key, node] {
        drivers_.erase(key);
        node->DriverExited();
        MaybeStop();
    });
    driver.Start();
}

void Commander::ReleaseParkedDrivers() {
    // Destroying a driver frame destroys the awaited body chain with it and
    // drops the node reference the driver held. Exit callbacks do not run.
    auto parked = std::exchange(drivers_, {});
    for (auto& entry : parked) {
        entry.second.destroy();
    }
}

// ============================================================================
// Closing
// ============================================================================

void Commander::Complete() {
    if (child_fault_) {
        error_ = *child_fault_;
        status_ = NodeStatus::Failed;
    } else {
        status_ = NodeStatus::Completed;
    }
    Resolve();
}

void Commander::OnClosed() {
    LOG_INFO(Logger(), "{} resolved as {}", name_, ToString(status_));
    FireStage(Stage::CommanderEnd);
    MaybeStop();
}

void Commander::MaybeStop() {
    if (resolved_ && drivers_.empty() && executor_) {
        executor_->Stop();
    }
}

}  // namespace cotree
