// ============================================================================
// cotree/tree/edge.hpp - Declarative Successors
// ============================================================================
//
// An edge schedules a successor when its source node completes. Edges are
// end-stage callbacks: registering one never runs anything, and a source that
// fails or is terminated fires no edges.
//
// The successor is attached under the source's PARENT, so it is a sibling of
// the source and holds the parent's barrier open:
//
//   Task<NodeResult> Pipeline(Job& self, Args) {
//       auto fetch = Job::Create("fetch", Fetch);
//       auto parse = Job::Create("parse", Parse);
//       AddEdge(*fetch, parse);
//       SubmitJob(self, fetch);
//       co_return Ok();   // Pipeline completes after fetch AND parse
//   }
//
// Conditional edges pick one target from the source's result:
//
//   AddConditionalEdge(*check, {{"ok", publish}, {"retry", check}});
//
// With the default selector the result must hold a std::string (or a
// const char*); a key without a branch schedules nothing.
//
// Targets that cannot be attached when the edge fires (a one-shot Handler
// called twice, a closed parent...) are logged and recorded in
// Commander::Faults(); the source keeps its own status.
//
// ============================================================================

#pragma once

#include "cotree/tree/task_node.hpp"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace cotree {

struct EdgeOptions {
    // Arguments for a Handler target
    Args args;
    // Call a Handler target with the source's result as its only argument.
    bool forward_result = false;
    SubmitOptions submit;
};

// Builds the successor when the edge fires. Returning nullptr schedules nothing.
using NodeFactory = std::function<std::shared_ptr<TaskNode>(TaskNode& from)>;

// Picks a branch key from the completed source.
using BranchSelector = std::function<std::optional<std::string>(const TaskNode& from)>;

// The source's result as a string, if it holds one.
std::optional<std::string> ResultString(const TaskNode& from);

// InvalidEdge: `from` is a Commander, or `to` is null or a Commander.
// A Job source may not target itself.
Result<void, Error> AddEdge(TaskNode& from, std::shared_ptr<TaskNode> to, EdgeOptions options = {});

Result<void, Error> AddEdge(TaskNode& from, NodeFactory factory, EdgeOptions options = {});

Result<void, Error> AddConditionalEdge(TaskNode& from, std::map<std::string, std::shared_ptr<TaskNode>> branches,
                                       BranchSelector selector = ResultString, EdgeOptions options = {});

}  // namespace cotree
