/**
 * @file allocator.hpp
 * @brief Polymorphic allocator contract shared by every allocation policy.
 *
 * Design:
 *  - Client code takes an Allocator& and never names a concrete policy.
 *  - Failures are values (Result/Status); nothing throws.
 *  - resize_in_place/reallocate/reset default to UnsupportedOperation so a
 *    policy only overrides what it can actually do.
 *  - No synchronization: wrap in LockedAllocator before sharing across threads.
 */
#pragma once

#include <cstddef>
#include <limits>
#include <memory>
#include <new>
#include <span>
#include <type_traits>

#include "linmem/mem/alloc_error.hpp"
#include "linmem/mem/mem_primitives.hpp"

namespace linmem::mem {

/// @brief A byte range handed out by an allocator.
using Block = std::span<std::byte>;

/**
 * @brief Abstract allocator interface.
 */
class Allocator {
public:
  virtual ~Allocator() = default;

  Allocator(const Allocator&)            = delete;
  Allocator& operator=(const Allocator&) = delete;

  /**
   * @brief Allocate at least @p size bytes aligned to @p alignment.
   * @param size Requested byte count; zero yields a distinct, usable address.
   * @param alignment Power of two.
   * @return Block of exactly @p size bytes, or OutOfMemory / InvalidAlignment.
   */
  virtual Result<Block> allocate(std::size_t size,
                                 std::size_t alignment = kDefaultAlignment) noexcept = 0;

  /**
   * @brief Grow or shrink @p block without moving it.
   * @return UnsupportedOperation unless the policy overrides it.
   */
  virtual Status resize_in_place(Block block, std::size_t new_size) noexcept;

  /**
   * @brief Release @p block.
   *
   * Policies that cannot reclaim individual blocks succeed without doing
   * anything, so callers may always pair allocate with free.
   */
  virtual Status free(Block block) noexcept = 0;

  /**
   * @brief Resize @p block, relocating and copying its contents if required.
   * @return UnsupportedOperation unless the policy overrides it; the old
   *         block is left untouched on any failure.
   */
  virtual Result<Block> reallocate(Block block, std::size_t new_size,
                                   std::size_t alignment = kDefaultAlignment) noexcept;

  /**
   * @brief Reclaim every outstanding allocation at once.
   * @pre No pointer issued before the call is used afterwards.
   * @return UnsupportedOperation unless the policy overrides it.
   */
  virtual Status reset() noexcept;

  /// @brief True if @p ptr points into storage managed by this allocator.
  virtual bool owns(const void* ptr) const noexcept = 0;

  /// @brief Bytes of backing storage usable for allocations.
  virtual std::size_t capacity() const noexcept = 0;

  /// @brief Bytes currently consumed (including alignment padding).
  virtual std::size_t used() const noexcept = 0;

protected:
  Allocator() = default;
  Allocator(Allocator&&) = default;
  Allocator& operator=(Allocator&&) = default;
};

/**
 * @brief Allocate @p count value-initialised objects of type T.
 *
 * Overflow in count * sizeof(T) is reported as OutOfMemory.
 */
template <class T>
Result<std::span<T>> allocate_array(Allocator& alloc, std::size_t count) noexcept {
  static_assert(std::is_trivially_destructible_v<T>,
                "allocate_array: memory may be reclaimed without running destructors");
  static_assert(std::is_nothrow_default_constructible_v<T>,
                "allocate_array: construction must not throw");

  if (count > std::numeric_limits<std::size_t>::max() / sizeof(T)) {
    return fail(AllocError::OutOfMemory);
  }
  auto block = alloc.allocate(count * sizeof(T), alignof(T));
  if (!block) {
    return fail(block.error());
  }
  T* first = reinterpret_cast<T*>(block->data());
  std::uninitialized_value_construct_n(first, count);
  return std::span<T>(std::launder(first), count);
}

/// @brief Return an array obtained from allocate_array() to @p alloc.
template <class T>
Status free_array(Allocator& alloc, std::span<T> items) noexcept {
  return alloc.free(std::as_writable_bytes(items));
}

} // namespace linmem::mem
