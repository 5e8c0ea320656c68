// ============================================================================
// cotree/core/coroutine_compat.hpp - Symmetric Transfer Portability Shim
// ============================================================================
//
// Node bodies await children, Handler invocations and other Tasks in deep
// chains. Each hop is a symmetric transfer, which only stays stack-neutral if
// the compiler turns `return handle;` from await_suspend into a tail call.
// GCC with AddressSanitizer does not (GCC bug 100897), so under that
// combination we resume the target directly from a void await_suspend.
//
//   SymmetricTransferResult await_suspend(std::coroutine_handle<> h) noexcept {
//       return SymmetricTransfer(next);
//   }
//
// ============================================================================

#pragma once

#include <coroutine>

namespace cotree {

#if defined(__GNUG__) && !defined(__clang__) && defined(__SANITIZE_ADDRESS__)
#define COTREE_ASAN_SYMMETRIC_TRANSFER_BROKEN 1
#else
#define COTREE_ASAN_SYMMETRIC_TRANSFER_BROKEN 0
#endif

#if COTREE_ASAN_SYMMETRIC_TRANSFER_BROKEN

using SymmetricTransferResult = void;

inline void SymmetricTransfer(std::coroutine_handle<> target) noexcept {
    target.resume();
}

#else

using SymmetricTransferResult = std::coroutine_handle<>;

inline std::coroutine_handle<> SymmetricTransfer(std::coroutine_handle<> target) noexcept {
    return target;
}

#endif

}  // namespace cotree
