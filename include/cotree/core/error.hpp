// ============================================================================
// cotree/core/error.hpp - Error Codes and Faults
// ============================================================================
//
// Two layers:
//
//   Error  - a std::error_code in the "cotree" category. Returned by the tree
//            API when an operation is refused (bad edge, reuse violation...).
//
//   Fault  - what a node records when its body fails: an Error plus a
//            free-form message. Bodies return Err(MakeFault(...)) instead of
//            throwing; cotree is written exception-free.
//
// USAGE:
// ------
//   Task<NodeResult> Body(Job& self, Args args) {
//       if (args.empty()) co_return Err(MakeFault(Errc::InvalidArgument, "no input"));
//       co_return Ok(std::any(42));
//   }
//
// ============================================================================

#pragma once

#include <string>
#include <system_error>

namespace cotree {

enum class Errc {
    InvalidArgument = 1,
    InvalidEdge,
    InvalidStage,
    ReuseViolation,
    NodeBusy,
    AlreadySubmitted,
    ParentClosed,
    ExecutionFault,
    ChildFailed,
    Terminated,
    Stalled,
    IoError,
};

const std::error_category& CotreeCategory() noexcept;

std::error_code make_error_code(Errc e) noexcept;

using Error = std::error_code;

// A recorded failure of a node body.
struct Fault {
    Error code;
    std::string message;

    // "<category message>: <detail>", or just the category message
    std::string Message() const;
};

Fault MakeFault(Errc code, std::string message = {});
Fault MakeFault(Error code, std::string message = {});

}  // namespace cotree

namespace std {
template <>
struct is_error_code_enum<cotree::Errc> : true_type {};
}  // namespace std
