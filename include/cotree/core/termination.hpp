// ============================================================================
// cotree/core/termination.hpp - Cooperative Termination Signal
// ============================================================================
//
// Terminating a node never preempts its body. Instead every node owns a
// TerminationSource; the body gets a TerminationToken (TaskNode::Token()) and
// observes it at its own suspension points:
//
//   Task<NodeResult> Poll(Job& self, Args) {
//       while (!self.GetToken().IsTerminated()) {
//           co_await AsyncSleep(100ms, self.GetToken());  // wakes early on terminate
//       }
//       co_return Ok();
//   }
//
// Awaitables that can park a body for a long time (AsyncSleep) register an
// OnTerminate callback so the body is woken as soon as the signal fires.
//
// Termination is a signal, not an error: the node gets its own Terminate
// callback stage and never reaches the Exception stage because of it.
//
// The tree runs on a single loop thread, so the state is not locked.
//
// ============================================================================

#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace cotree {

class TerminationState {
   public:
    TerminationState() = default;

    TerminationState(const TerminationState&) = delete;
    TerminationState& operator=(const TerminationState&) = delete;

    bool IsTerminated() const noexcept { return terminated_; }

    void Trigger() {
        if (terminated_) {
            return;
        }
        terminated_ = true;

        // Callbacks may register or unregister others; run a detached copy.
        auto callbacks = std::move(callbacks_);
        callbacks_.clear();
        for (auto& entry : callbacks) {
            entry.second();
        }
    }

    // Returns 0 when the callback ran immediately (already terminated).
    size_t Register(std::function<void()> callback) {
        if (terminated_) {
            callback();
            return 0;
        }
        size_t handle = next_handle_++;
        callbacks_.emplace_back(handle, std::move(callback));
        return handle;
    }

    void Unregister(size_t handle) {
        if (handle == 0) return;
        for (auto it = callbacks_.begin(); it != callbacks_.end(); ++it) {
            if (it->first == handle) {
                callbacks_.erase(it);
                return;
            }
        }
    }

   private:
    bool terminated_ = false;
    std::vector<std::pair<size_t, std::function<void()>>> callbacks_;
    size_t next_handle_ = 1;
};

// Read-only view handed to bodies and awaitables.
class TerminationToken {
   public:
    // A token that never fires
    TerminationToken() = default;

    bool IsTerminated() const noexcept { return state_ && state_->IsTerminated(); }

    bool IsValid() const noexcept { return state_ != nullptr; }

    size_t OnTerminate(std::function<void()> callback) {
        if (state_) {
            return state_->Register(std::move(callback));
        }
        return 0;
    }

    void Unregister(size_t handle) {
        if (state_) {
            state_->Unregister(handle);
        }
    }

   private:
    friend class TerminationSource;

    explicit TerminationToken(std::shared_ptr<TerminationState> state) : state_(std::move(state)) {}

    std::shared_ptr<TerminationState> state_;
};

class TerminationSource {
   public:
    TerminationSource() : state_(std::make_shared<TerminationState>()) {}

    TerminationSource(const TerminationSource&) = delete;
    TerminationSource& operator=(const TerminationSource&) = delete;
    TerminationSource(TerminationSource&&) = default;
    TerminationSource& operator=(TerminationSource&&) = default;

    [[nodiscard]] TerminationToken GetToken() const { return TerminationToken(state_); }

    void Trigger() { state_->Trigger(); }

    bool IsTerminated() const noexcept { return state_->IsTerminated(); }

    // A reusable Handler starting a new cycle gets a fresh state, so a body
    // from the terminated cycle still holding the old token stays terminated.
    void Renew() { state_ = std::make_shared<TerminationState>(); }

   private:
    std::shared_ptr<TerminationState> state_;
};

}  // namespace cotree
