// ============================================================================
// cotree/cotree.hpp - Main Include Header
// ============================================================================
//
// This convenience header includes the complete cotree library.
//
// USAGE:
// ------
//   #include <cotree/cotree.hpp>
//   using namespace cotree;
//
// ============================================================================

#pragma once

// Core primitives
#include "cotree/core/detached_task.hpp"
#include "cotree/core/error.hpp"
#include "cotree/core/log.hpp"
#include "cotree/core/result.hpp"
#include "cotree/core/task.hpp"
#include "cotree/core/termination.hpp"

// Executors and timers
#include "cotree/io/executor.hpp"
#include "cotree/io/libuv_executor.hpp"
#include "cotree/io/timer.hpp"

// Synchronization
#include "cotree/sync/event.hpp"
#include "cotree/sync/sync_wait.hpp"

// Task tree
#include "cotree/tree/callback_registry.hpp"
#include "cotree/tree/commander.hpp"
#include "cotree/tree/edge.hpp"
#include "cotree/tree/handler.hpp"
#include "cotree/tree/job.hpp"
#include "cotree/tree/task_node.hpp"
