// =============================================================
// File: include/linmem/mem/pool_allocator.hpp
// =============================================================
#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>

#include "linmem/mem/allocator.hpp"

namespace linmem::mem {

/// @brief Index-based handle for addressing slots in the pool.
using SlotHandle = std::uint32_t;

/**
 * @file pool_allocator.hpp
 * @brief Fixed-size slot allocator over a caller-owned byte buffer.
 *
 * Layout inside the buffer:
 *   [ free flags: slot_count bytes ][ pad to slot_align ][ slot 0 ][ slot 1 ] ...
 *
 * Design:
 *  - Slot count and size are fixed by the factory; nothing grows.
 *  - Handles (slot indices) are the primary identity; raw addresses are only
 *    translated back to a handle at the free()/resize boundary.
 *  - acquire() returns the lowest free slot, so a freed slot is the next one
 *    reused unless a lower one is free.
 *  - free() bounds-checks the address and rejects double frees with
 *    InvalidRelease instead of corrupting the flag array.
 */
class PoolAllocator final : public Allocator {
public:
  /// @brief Buffer size needed for @p slot_count slots of @p slot_size bytes.
  /// @note Includes worst-case alignment padding; assumes no overflow. Use
  ///       checked_required_bytes() for sizes that come from outside.
  static constexpr std::size_t required_bytes(std::size_t slot_size,
                                              std::size_t slot_count,
                                              std::size_t slot_align = kDefaultAlignment) noexcept {
    const std::size_t stride = align_up(slot_size == 0 ? 1 : slot_size, slot_align);
    return slot_count * sizeof(bool) + (slot_align - 1) + slot_count * stride;
  }

  /// @brief required_bytes() that reports overflow instead of wrapping.
  /// @return false if @p slot_align is not a power of two or the total does
  ///         not fit in size_t.
  static constexpr bool checked_required_bytes(std::size_t slot_size,
                                               std::size_t slot_count,
                                               std::size_t slot_align,
                                               std::size_t& out) noexcept {
    constexpr std::size_t max = std::numeric_limits<std::size_t>::max();
    std::size_t stride = 0;
    if (!is_power_of_two(slot_align) ||
        !checked_align_up(slot_size == 0 ? 1 : slot_size, slot_align, stride)) {
      return false;
    }
    const std::size_t per_slot = stride + sizeof(bool);
    if (per_slot < stride || (slot_count != 0 && per_slot > max / slot_count)) {
      return false;
    }
    const std::size_t slots = per_slot * slot_count;
    if (slots > max - (slot_align - 1)) {
      return false;
    }
    out = slots + (slot_align - 1);
    return true;
  }

  /**
   * @brief Factory: validates the layout and seeds every slot as free.
   * @param buffer Caller-owned storage; must outlive the pool.
   * @param slot_size Bytes per slot (> 0).
   * @param slot_count Number of slots (> 0, fits SlotHandle).
   * @param slot_align Alignment of every slot (power of two).
   * @return Pool or InvalidAlignment / InvalidLayout / BufferTooSmall.
   */
  static Result<PoolAllocator> create(std::span<std::byte> buffer,
                                      std::size_t slot_size,
                                      std::size_t slot_count,
                                      std::size_t slot_align = kDefaultAlignment) noexcept;

  /// @brief Empty shell with no slots (use with create()).
  PoolAllocator() noexcept = default;

  PoolAllocator(PoolAllocator&& other) noexcept;
  PoolAllocator& operator=(PoolAllocator&& other) noexcept;

  /// @brief Take the lowest free slot.
  /// @return OutOfMemory if every slot is in use.
  Result<SlotHandle> acquire() noexcept;

  /// @brief Return a slot to the pool.
  /// @return InvalidRelease if @p handle is out of range or already free.
  Status release(SlotHandle handle) noexcept;

  /// @brief Translate an address at the start of a slot into its handle.
  /// @return InvalidRelease if @p ptr is outside the slots or mid-slot.
  Result<SlotHandle> handle_of(const void* ptr) const noexcept;

  /// @brief Full slot storage for @p handle; empty for an out-of-range handle.
  Block slot(SlotHandle handle) const noexcept;

  /**
   * @brief Hand out one slot.
   * @param size Must not exceed slot_size().
   * @param alignment Must not exceed the slot alignment.
   * @return OutOfMemory if the request does not fit a slot or the pool is
   *         exhausted; InvalidAlignment if @p alignment is not a power of two.
   */
  Result<Block> allocate(std::size_t size,
                         std::size_t alignment = kDefaultAlignment) noexcept override;

  /// @brief Succeeds while @p new_size fits the slot backing @p block.
  Status resize_in_place(Block block, std::size_t new_size) noexcept override;

  /// @brief Release the slot backing @p block; an empty block is ignored.
  Status free(Block block) noexcept override;

  /// @brief In-place only: a slot never needs to move to change size.
  Result<Block> reallocate(Block block, std::size_t new_size,
                           std::size_t alignment = kDefaultAlignment) noexcept override;

  /// @brief Mark every slot free.
  Status reset() noexcept override;

  bool        owns(const void* ptr) const noexcept override;
  std::size_t capacity() const noexcept override { return stride_ * count_; }
  std::size_t used() const noexcept override { return stride_ * (count_ - free_count_); }

  std::size_t slot_size() const noexcept { return slot_size_; }
  std::size_t slot_align() const noexcept { return slot_align_; }
  std::size_t slot_count() const noexcept { return count_; }
  std::size_t free_count() const noexcept { return free_count_; }

private:
  /// @brief Handle of a live slot whose storage starts at @p ptr.
  Result<SlotHandle> live_handle_of(const void* ptr) const noexcept;

  std::byte*  slots_      = nullptr;  ///< First slot (aligned to slot_align_)
  bool*       free_flags_ = nullptr;  ///< true = slot available; carved from the buffer head
  std::size_t slot_size_  = 0;        ///< Usable bytes per slot
  std::size_t slot_align_ = 0;        ///< Alignment of every slot
  std::size_t stride_     = 0;        ///< Distance between slots (slot_size_ rounded up)
  std::size_t count_      = 0;        ///< Number of slots
  std::size_t free_count_ = 0;        ///< Slots currently available
  std::size_t first_free_ = 0;        ///< No free slot has a lower index
};

} // namespace linmem::mem
