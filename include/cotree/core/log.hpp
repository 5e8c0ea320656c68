// ============================================================================
// cotree/core/log.hpp - Library Logger
// ============================================================================
//
// cotree logs through quill. All messages go to one logger, "cotree", created
// on first use with a console sink at level Warning; the quill backend thread
// is started along with it. Callers can route cotree into a logger of their
// own with SetLogger().
//
// What gets logged:
//   debug   - node transitions, callback stage firings, edge triggers
//   info    - Commander run start / end
//   warning - node faults, refused submissions
//   error   - edge targets that could not be attached at fire time
//
// USAGE:
// ------
//   LOG_DEBUG(Logger(), "{}#{} running", name, id);
//
// The level can be overridden from the environment (COTREE_LOG_LEVEL=debug)
// via LoadLogLevelFromEnv(); Commander::Run() does this unless disabled in
// its options.
//
// ============================================================================

#pragma once

#include <quill/LogMacros.h>
#include <quill/Logger.h>

namespace cotree {

[[nodiscard]] quill::Logger* Logger();

// Passing nullptr restores the default logger.
void SetLogger(quill::Logger* logger);

void SetLogLevel(quill::LogLevel level);

// Applies COTREE_LOG_LEVEL, if set, to Logger(). Unknown values are reported
// and ignored.
void LoadLogLevelFromEnv();

}  // namespace cotree
