// =============================================================
// File: src/linmem/mem/bump_allocator.cpp
// =============================================================
#include "linmem/mem/bump_allocator.hpp"

#include <cstdint>

namespace linmem::mem {

BumpAllocator::BumpAllocator(std::span<std::byte> buffer) noexcept
  : base_(buffer.data()),
    size_(buffer.size())
{}

BumpAllocator::BumpAllocator(BumpAllocator&& other) noexcept
  : base_(other.base_),
    size_(other.size_),
    offset_(other.offset_)
{
  other.base_   = nullptr;
  other.size_   = 0;
  other.offset_ = 0;
}

BumpAllocator& BumpAllocator::operator=(BumpAllocator&& other) noexcept {
  if (this != &other) {
    base_   = other.base_;
    size_   = other.size_;
    offset_ = other.offset_;
    other.base_   = nullptr;
    other.size_   = 0;
    other.offset_ = 0;
  }
  return *this;
}

Result<Block> BumpAllocator::allocate(std::size_t size, std::size_t alignment) noexcept {
  if (!is_power_of_two(alignment)) {
    return fail(AllocError::InvalidAlignment);
  }

  // Align the address, not the offset: the buffer itself may be unaligned.
  const std::size_t padding   = padding_for(base_ + offset_, alignment);
  const std::size_t reserve   = (size == 0) ? 1 : size;
  const std::size_t available = size_ - offset_;
  if (padding > available || reserve > available - padding) {
    return fail(AllocError::OutOfMemory);
  }

  const std::size_t aligned = offset_ + padding;
  offset_ = aligned + reserve;
  return Block(base_ + aligned, size);
}

Status BumpAllocator::free(Block /*block*/) noexcept {
  return {};
}

Status BumpAllocator::reset() noexcept {
  offset_ = 0;
  return {};
}

bool BumpAllocator::owns(const void* ptr) const noexcept {
  const auto p     = reinterpret_cast<std::uintptr_t>(ptr);
  const auto start = reinterpret_cast<std::uintptr_t>(base_);
  return base_ != nullptr && p >= start && p - start < size_;
}

} // namespace linmem::mem
