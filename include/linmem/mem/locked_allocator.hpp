// =============================================================
// File: include/linmem/mem/locked_allocator.hpp
// =============================================================
#pragma once

#include <cstddef>
#include <mutex>

#include "linmem/mem/allocator.hpp"

namespace linmem::mem {

/**
 * @file locked_allocator.hpp
 * @brief Mutex-guarded decorator for sharing one allocator across threads.
 *
 * None of the allocators synchronize internally. Wrap the instance once and
 * hand the wrapper (never the inner allocator) to every thread:
 *
 *   BumpAllocator bump(buffer);
 *   LockedAllocator shared(bump);
 *
 * Every call is serialized on one mutex; the lock is held only for the
 * duration of the forwarded call.
 */
class LockedAllocator final : public Allocator {
public:
  explicit LockedAllocator(Allocator& inner) noexcept : inner_(&inner) {}

  Result<Block> allocate(std::size_t size,
                         std::size_t alignment = kDefaultAlignment) noexcept override;
  Status        resize_in_place(Block block, std::size_t new_size) noexcept override;
  Status        free(Block block) noexcept override;
  Result<Block> reallocate(Block block, std::size_t new_size,
                           std::size_t alignment = kDefaultAlignment) noexcept override;
  Status        reset() noexcept override;

  bool        owns(const void* ptr) const noexcept override;
  std::size_t capacity() const noexcept override;
  std::size_t used() const noexcept override;

  /// @brief Inner allocator without locking (caller provides synchronization).
  Allocator& get_underlying() noexcept { return *inner_; }

private:
  Allocator*         inner_;
  mutable std::mutex mu_;
};

} // namespace linmem::mem
