// =============================================================
// File: include/linmem/mem/alloc_error.hpp
// =============================================================
#pragma once

#include <cstdint>
#include <string_view>

#include "linmem/compat/expected.hpp"  // linmem_detail::expected / unexpected

namespace linmem::mem {

/**
 * @brief Error codes reported by allocator operations.
 *
 * Every failure is returned as a value; no allocator throws or aborts.
 * BufferTooSmall and InvalidLayout are only produced by setup-time factories.
 */
enum class AllocError : std::uint8_t {
  OutOfMemory = 1,        ///< Backing storage or pool cannot satisfy the request
  UnsupportedOperation,   ///< Policy cannot resize/move/reset; try another strategy
  InvalidRelease,         ///< Pointer not issued by this allocator, or double free
  InvalidAlignment,       ///< Alignment is zero or not a power of two
  BufferTooSmall,         ///< Backing buffer cannot hold the requested layout
  InvalidLayout           ///< Zero slot size/count or count beyond handle range
};

/// @brief Stable snake_case label for logs.
std::string_view to_string(AllocError e) noexcept;

/// @brief Value-or-error result of an allocator operation.
template <class T>
using Result = linmem_detail::expected<T, AllocError>;

/// @brief Success-or-error result of an operation that yields nothing.
using Status = linmem_detail::expected<void, AllocError>;

/// @brief Shorthand for building the error side of Result/Status.
inline linmem_detail::unexpected<AllocError> fail(AllocError e) noexcept {
  return linmem_detail::unexpected<AllocError>(e);
}

} // namespace linmem::mem
