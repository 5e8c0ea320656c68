// ============================================================================
// cotree/tree/callback_registry.hpp - Lifecycle Callback Bindings
// ============================================================================
//
// Every node owns a CallbackRegistry: for each lifecycle Stage an ordered
// list of CallbackBinding records. A binding is a function plus the fixed
// positional/keyword arguments it was registered with, and whether the
// triggering node should be handed to it.
//
// Fire(stage, node) runs the stage's bindings synchronously, in registration
// order; the node's transition is not over until the last one returned.
// Bindings may submit Jobs or call Handlers (that is how edges are built).
// A binding registered while its own stage is firing first runs on the next
// firing.
//
//   node.AddCallback(Stage::JobEnd, [](const CallbackContext& ctx) {
//       auto* from = ctx.node;                                  // injected
//       auto  tag  = std::any_cast<std::string>(ctx.kwargs.at("tag"));
//   }, {}, {{"tag", std::string("audit")}}, /*inject_node=*/true);
//
// ============================================================================

#pragma once

#include "cotree/core/error.hpp"
#include "cotree/core/result.hpp"

#include <any>
#include <array>
#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace cotree {

class TaskNode;

enum class Stage {
    JobStart,
    JobEnd,
    HandlerStart,
    HandlerEnd,
    Exception,
    Terminate,
    CommanderEnd,
};

inline constexpr size_t kStageCount = 7;

const char* ToString(Stage stage) noexcept;

using Args = std::vector<std::any>;
using Kwargs = std::map<std::string, std::any>;

struct CallbackContext {
    Stage stage;
    TaskNode* node;      // null unless the binding asked for injection
    const Args& args;
    const Kwargs& kwargs;
    const Fault* fault;  // set for Stage::Exception only
};

using CallbackFn = std::function<void(const CallbackContext&)>;

struct CallbackBinding {
    CallbackFn function;
    Args args;
    Kwargs kwargs;
    bool inject_node = false;
};

class CallbackRegistry {
   public:
    CallbackRegistry() = default;

    CallbackRegistry(const CallbackRegistry&) = delete;
    CallbackRegistry& operator=(const CallbackRegistry&) = delete;

    // Fails with InvalidArgument for an empty function. Whether the stage is
    // meaningful for the owning node is checked by TaskNode::AddCallback.
    Result<void, Error> Register(Stage stage, CallbackBinding binding);

    void Fire(Stage stage, TaskNode& node, const Fault* fault = nullptr);

    size_t Count(Stage stage) const { return stages_[Index(stage)].size(); }

   private:
    static size_t Index(Stage stage) noexcept { return static_cast<size_t>(stage); }

    std::array<std::vector<CallbackBinding>, kStageCount> stages_;
};

}  // namespace cotree
