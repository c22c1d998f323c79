// =============================================================
// File: src/linmem/mem/pool_allocator.cpp
// =============================================================
#include "linmem/mem/pool_allocator.hpp"

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <limits>
#include <memory>
#include <new>

namespace linmem::mem {

/**
 * @brief Carve the flag array and slot region out of @p buffer.
 *
 * All arithmetic is overflow-checked; a layout that does not fit is reported
 * as BufferTooSmall and leaves the buffer untouched.
 */
Result<PoolAllocator> PoolAllocator::create(std::span<std::byte> buffer,
                                            std::size_t slot_size,
                                            std::size_t slot_count,
                                            std::size_t slot_align) noexcept {
  if (!is_power_of_two(slot_align)) {
    return fail(AllocError::InvalidAlignment);
  }
  if (slot_size == 0 || slot_count == 0 ||
      slot_count > std::numeric_limits<SlotHandle>::max()) {
    return fail(AllocError::InvalidLayout);
  }
  std::size_t stride = 0;
  if (!checked_align_up(slot_size, slot_align, stride)) {
    return fail(AllocError::InvalidLayout);
  }

  const std::size_t flag_bytes = slot_count * sizeof(bool);
  if (buffer.size() < flag_bytes) {
    return fail(AllocError::BufferTooSmall);
  }
  std::byte* const  after_flags = buffer.data() + flag_bytes;
  const std::size_t padding     = padding_for(after_flags, slot_align);
  const std::size_t rest        = buffer.size() - flag_bytes;
  if (padding > rest || stride > (rest - padding) / slot_count) {
    return fail(AllocError::BufferTooSmall);
  }

  auto* flags = reinterpret_cast<bool*>(buffer.data());
  std::uninitialized_fill_n(flags, slot_count, true);

  PoolAllocator pool;
  pool.free_flags_ = std::launder(flags);
  pool.slots_      = after_flags + padding;
  pool.slot_size_  = slot_size;
  pool.slot_align_ = slot_align;
  pool.stride_     = stride;
  pool.count_      = slot_count;
  pool.free_count_ = slot_count;
  pool.first_free_ = 0;
  return pool;
}

PoolAllocator::PoolAllocator(PoolAllocator&& other) noexcept
  : slots_(other.slots_),
    free_flags_(other.free_flags_),
    slot_size_(other.slot_size_),
    slot_align_(other.slot_align_),
    stride_(other.stride_),
    count_(other.count_),
    free_count_(other.free_count_),
    first_free_(other.first_free_)
{
  other.slots_      = nullptr;
  other.free_flags_ = nullptr;
  other.count_      = 0;
  other.free_count_ = 0;
  other.first_free_ = 0;
}

PoolAllocator& PoolAllocator::operator=(PoolAllocator&& other) noexcept {
  if (this != &other) {
    slots_      = other.slots_;
    free_flags_ = other.free_flags_;
    slot_size_  = other.slot_size_;
    slot_align_ = other.slot_align_;
    stride_     = other.stride_;
    count_      = other.count_;
    free_count_ = other.free_count_;
    first_free_ = other.first_free_;

    other.slots_      = nullptr;
    other.free_flags_ = nullptr;
    other.count_      = 0;
    other.free_count_ = 0;
    other.first_free_ = 0;
  }
  return *this;
}

Result<SlotHandle> PoolAllocator::acquire() noexcept {
  if (free_count_ == 0) {
    return fail(AllocError::OutOfMemory); // pool exhausted
  }
  for (std::size_t i = first_free_; i < count_; ++i) {
    if (free_flags_[i]) {
      free_flags_[i] = false;
      --free_count_;
      first_free_ = i + 1;
      return static_cast<SlotHandle>(i);
    }
  }
  // free_count_ says a slot exists but none was found below count_.
  assert(false && "PoolAllocator: free_count_ out of sync with flags");
  return fail(AllocError::OutOfMemory);
}

Status PoolAllocator::release(SlotHandle handle) noexcept {
  const auto i = static_cast<std::size_t>(handle);
  if (i >= count_ || free_flags_[i]) {
    return fail(AllocError::InvalidRelease);
  }
  free_flags_[i] = true;
  ++free_count_;
  first_free_ = std::min(first_free_, i);
  return {};
}

Result<SlotHandle> PoolAllocator::handle_of(const void* ptr) const noexcept {
  if (!owns(ptr)) {
    return fail(AllocError::InvalidRelease);
  }
  const auto offset = static_cast<std::size_t>(reinterpret_cast<std::uintptr_t>(ptr) -
                                               reinterpret_cast<std::uintptr_t>(slots_));
  if (offset % stride_ != 0) {
    return fail(AllocError::InvalidRelease);
  }
  return static_cast<SlotHandle>(offset / stride_);
}

Result<SlotHandle> PoolAllocator::live_handle_of(const void* ptr) const noexcept {
  auto h = handle_of(ptr);
  if (!h) {
    return h;
  }
  if (free_flags_[*h]) {
    return fail(AllocError::InvalidRelease);
  }
  return h;
}

Block PoolAllocator::slot(SlotHandle handle) const noexcept {
  if (static_cast<std::size_t>(handle) >= count_) {
    return {};
  }
  return Block(slots_ + static_cast<std::size_t>(handle) * stride_, slot_size_);
}

Result<Block> PoolAllocator::allocate(std::size_t size, std::size_t alignment) noexcept {
  if (!is_power_of_two(alignment)) {
    return fail(AllocError::InvalidAlignment);
  }
  if (size > slot_size_ || alignment > slot_align_) {
    return fail(AllocError::OutOfMemory);
  }
  auto h = acquire();
  if (!h) {
    return fail(h.error());
  }
  return slot(*h).first(size);
}

Status PoolAllocator::resize_in_place(Block block, std::size_t new_size) noexcept {
  auto h = live_handle_of(block.data());
  if (!h) {
    return fail(h.error());
  }
  if (new_size > slot_size_) {
    return fail(AllocError::OutOfMemory);
  }
  return {};
}

Status PoolAllocator::free(Block block) noexcept {
  if (block.data() == nullptr) {
    return {};
  }
  auto h = handle_of(block.data());
  if (!h) {
    return fail(h.error());
  }
  return release(*h);
}

Result<Block> PoolAllocator::reallocate(Block block, std::size_t new_size,
                                        std::size_t alignment) noexcept {
  if (!is_power_of_two(alignment)) {
    return fail(AllocError::InvalidAlignment);
  }
  if (alignment > slot_align_) {
    return fail(AllocError::OutOfMemory);
  }
  auto resized = resize_in_place(block, new_size);
  if (!resized) {
    return fail(resized.error());
  }
  return Block(block.data(), new_size);
}

Status PoolAllocator::reset() noexcept {
  std::fill_n(free_flags_, count_, true);
  free_count_ = count_;
  first_free_ = 0;
  return {};
}

bool PoolAllocator::owns(const void* ptr) const noexcept {
  // Integer comparison: ptr may belong to an unrelated object.
  const auto p     = reinterpret_cast<std::uintptr_t>(ptr);
  const auto start = reinterpret_cast<std::uintptr_t>(slots_);
  return slots_ != nullptr && p >= start && p - start < stride_ * count_;
}

} // namespace linmem::mem
