// =============================================================
// File: include/linmem/mem/bump_allocator.hpp
// =============================================================
#pragma once

#include <cstddef>
#include <span>

#include "linmem/mem/allocator.hpp"

namespace linmem::mem {

/**
 * @file bump_allocator.hpp
 * @brief Monotonic allocator over a caller-owned byte buffer.
 *
 * Design:
 *  - allocate() aligns the current position and advances an offset: O(1).
 *  - Individual blocks are never reclaimed; free() is a successful no-op.
 *  - resize_in_place()/reallocate() are unsupported (no record of which
 *    block was handed out last).
 *  - reset() rewinds to the start of the buffer in one step.
 *
 * The buffer must outlive the allocator and must not be shared with another
 * allocator.
 */
class BumpAllocator final : public Allocator {
public:
  /// @brief Manage @p buffer; nothing is allocated or copied.
  explicit BumpAllocator(std::span<std::byte> buffer) noexcept;

  BumpAllocator(BumpAllocator&& other) noexcept;
  BumpAllocator& operator=(BumpAllocator&& other) noexcept;

  /**
   * @brief Carve @p size bytes at the next @p alignment boundary.
   * @return OutOfMemory if the aligned block does not fit; the offset is
   *         left unchanged in that case.
   * @note A zero-byte request still consumes one byte so that successive
   *       zero-byte blocks have distinct addresses. On a full buffer it
   *       therefore fails with OutOfMemory.
   */
  Result<Block> allocate(std::size_t size,
                         std::size_t alignment = kDefaultAlignment) noexcept override;

  /// @brief No-op; use reset() to reclaim memory.
  Status free(Block block) noexcept override;

  /// @brief Rewind the offset to zero, invalidating every issued block.
  Status reset() noexcept override;

  bool        owns(const void* ptr) const noexcept override;
  std::size_t capacity() const noexcept override { return size_; }
  std::size_t used() const noexcept override { return offset_; }

  /// @brief Bytes left after the current offset (before alignment padding).
  std::size_t remaining() const noexcept { return size_ - offset_; }

private:
  std::byte*  base_   = nullptr;  ///< Start of the caller's buffer
  std::size_t size_   = 0;        ///< Buffer length in bytes
  std::size_t offset_ = 0;        ///< Next free byte; 0 <= offset_ <= size_
};

} // namespace linmem::mem
