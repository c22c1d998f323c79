// =============================================================
// File: include/linmem/mem/arena_allocator.hpp
// =============================================================
#pragma once

#include <cstddef>
#include <cstdint>

#include "linmem/mem/allocator.hpp"

namespace linmem::mem {

/**
 * @file arena_allocator.hpp
 * @brief Bulk-reset lifetime policy layered over any inner allocator.
 *
 * The arena adds no allocation logic of its own: every operation forwards to
 * the inner allocator. What it adds is the lifetime contract: reset() frees
 * everything issued since construction or the previous reset in one call.
 *
 * Typical composition:
 *   BumpAllocator bump(buffer);
 *   ArenaAllocator arena(bump);
 *
 * The inner allocator must outlive the arena and should not be used directly
 * while the arena is in use. Moving an arena hands the inner allocator over;
 * the moved-from arena is detached and every call on it fails.
 */
class ArenaAllocator final : public Allocator {
public:
  explicit ArenaAllocator(Allocator& inner) noexcept : inner_(&inner) {}

  ArenaAllocator(ArenaAllocator&& other) noexcept;
  ArenaAllocator& operator=(ArenaAllocator&& other) noexcept;

  Result<Block> allocate(std::size_t size,
                         std::size_t alignment = kDefaultAlignment) noexcept override;
  Status        resize_in_place(Block block, std::size_t new_size) noexcept override;
  Status        free(Block block) noexcept override;
  Result<Block> reallocate(Block block, std::size_t new_size,
                           std::size_t alignment = kDefaultAlignment) noexcept override;

  /**
   * @brief Reset the inner allocator, invalidating every block issued by the arena.
   * @return The inner allocator's status (UnsupportedOperation if it cannot reset).
   */
  Status reset() noexcept override;

  bool        owns(const void* ptr) const noexcept override;
  std::size_t capacity() const noexcept override;
  std::size_t used() const noexcept override;

  /// @brief False once the arena has been moved from.
  bool attached() const noexcept { return inner_ != nullptr; }

  /// @brief Successful allocations since construction or the last reset.
  std::size_t allocation_count() const noexcept { return allocation_count_; }

  /// @brief Number of successful resets; identifies the current lifetime.
  std::uint64_t generation() const noexcept { return generation_; }

  /// @pre attached()
  Allocator&       inner() noexcept { return *inner_; }
  const Allocator& inner() const noexcept { return *inner_; }

private:
  Allocator*    inner_;                ///< Non-owning; null once moved from
  std::size_t   allocation_count_{0};  ///< Live-lifetime allocation count
  std::uint64_t generation_{0};        ///< Incremented on each successful reset
};

} // namespace linmem::mem
