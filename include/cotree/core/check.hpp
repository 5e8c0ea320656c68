// ============================================================================
// cotree/core/check.hpp - Always-On Invariant Checks
// ============================================================================
//
// COTREE_CHECK(cond, msg) guards invariants of the task tree that can only be
// broken by a bug in cotree itself or by misuse of a handle (awaiting a Task
// twice, resuming a frame that already finished). It is never compiled out.
//
// Recoverable conditions (bad edges, reuse of a one-shot Handler, submitting
// under a closed parent) are NOT checked here; they come back as Err(...).
//
// ============================================================================

#pragma once

#include <cstdio>
#include <cstdlib>
#include <source_location>

namespace cotree::detail {

[[noreturn]] inline void CheckFail(const char* cond_str, const char* msg, const std::source_location& loc) {
    // fputs only: this may run while the logger itself is half torn down
    char line_buf[12];
    char* line_end = line_buf + sizeof(line_buf);
    char* p = line_end;
    unsigned int line = loc.line();
    do {
        *--p = static_cast<char>('0' + line % 10);
        line /= 10;
    } while (line != 0);

    std::fputs("COTREE_CHECK(", stderr);
    std::fputs(cond_str, stderr);
    std::fputs(") failed: ", stderr);
    std::fputs(msg, stderr);
    std::fputs("\n  at ", stderr);
    std::fputs(loc.file_name(), stderr);
    std::fputs(":", stderr);
    std::fwrite(p, 1, static_cast<size_t>(line_end - p), stderr);
    std::fputs(" in ", stderr);
    std::fputs(loc.function_name(), stderr);
    std::fputs("\n", stderr);
    std::abort();
}

}  // namespace cotree::detail

#define COTREE_CHECK(cond, msg)                                                       \
    do {                                                                              \
        if (!(cond)) [[unlikely]] {                                                   \
            ::cotree::detail::CheckFail(#cond, msg, std::source_location::current()); \
        }                                                                             \
    } while (0)
