// ============================================================================
// cotree/tree/callback_registry.cpp - Lifecycle Callback Bindings
// ============================================================================

#include "cotree/tree/callback_registry.hpp"

#include "cotree/core/log.hpp"
#include "cotree/tree/task_node.hpp"

#include <utility>

namespace cotree {

const char* ToString(Stage stage) noexcept {
    switch (stage) {
        case Stage::JobStart:
            return "at_job_start";
        case Stage::JobEnd:
            return "at_job_end";
        case Stage::HandlerStart:
            return "at_handler_start";
        case Stage::HandlerEnd:
            return "at_handler_end";
        case Stage::Exception:
            return "at_exception";
        case Stage::Terminate:
            return "at_terminate";
        case Stage::CommanderEnd:
            return "at_commander_end";
    }
    return "unknown";
}

Result<void, Error> CallbackRegistry::Register(Stage stage, CallbackBinding binding) {
    if (!binding.function) {
        return Err(make_error_code(Errc::InvalidArgument));
    }
    stages_[Index(stage)].push_back(std::move(binding));
    return Ok();
}

void CallbackRegistry::Fire(Stage stage, TaskNode& node, const Fault* fault) {
    auto& bindings = stages_[Index(stage)];
    const size_t count = bindings.size();
    if (count == 0) {
        return;
    }

    LOG_DEBUG(Logger(), "{}#{} {} ({} callbacks)", node.Name(), node.Id(), ToString(stage), count);

    for (size_t i = 0; i < count; ++i) {
        // Copy: the callback may register more bindings and grow the vector.
        CallbackBinding binding = bindings[i];
        CallbackContext ctx{stage, binding.inject_node ? &node : nullptr, binding.args, binding.kwargs, fault};
        binding.function(ctx);
    }
}

}  // namespace cotree
