// =============================================================
// File: src/linmem/mem/arena_allocator.cpp
// =============================================================
#include "linmem/mem/arena_allocator.hpp"

namespace linmem::mem {

ArenaAllocator::ArenaAllocator(ArenaAllocator&& other) noexcept
  : inner_(other.inner_),
    allocation_count_(other.allocation_count_),
    generation_(other.generation_)
{
  other.inner_            = nullptr;
  other.allocation_count_ = 0;
}

ArenaAllocator& ArenaAllocator::operator=(ArenaAllocator&& other) noexcept {
  if (this != &other) {
    inner_            = other.inner_;
    allocation_count_ = other.allocation_count_;
    generation_       = other.generation_;
    other.inner_            = nullptr;
    other.allocation_count_ = 0;
  }
  return *this;
}

Result<Block> ArenaAllocator::allocate(std::size_t size, std::size_t alignment) noexcept {
  if (!inner_) {
    return fail(AllocError::OutOfMemory);
  }
  auto block = inner_->allocate(size, alignment);
  if (block) {
    ++allocation_count_;
  }
  return block;
}

Status ArenaAllocator::resize_in_place(Block block, std::size_t new_size) noexcept {
  if (!inner_) {
    return fail(AllocError::UnsupportedOperation);
  }
  return inner_->resize_in_place(block, new_size);
}

Status ArenaAllocator::free(Block block) noexcept {
  if (!inner_) {
    return fail(AllocError::InvalidRelease);
  }
  return inner_->free(block);
}

Result<Block> ArenaAllocator::reallocate(Block block, std::size_t new_size,
                                         std::size_t alignment) noexcept {
  if (!inner_) {
    return fail(AllocError::UnsupportedOperation);
  }
  return inner_->reallocate(block, new_size, alignment);
}

Status ArenaAllocator::reset() noexcept {
  if (!inner_) {
    return fail(AllocError::UnsupportedOperation);
  }
  auto status = inner_->reset();
  if (status) {
    allocation_count_ = 0;
    ++generation_;
  }
  return status;
}

bool ArenaAllocator::owns(const void* ptr) const noexcept {
  return inner_ != nullptr && inner_->owns(ptr);
}

std::size_t ArenaAllocator::capacity() const noexcept {
  return inner_ ? inner_->capacity() : 0;
}

std::size_t ArenaAllocator::used() const noexcept {
  return inner_ ? inner_->used() : 0;
}

} // namespace linmem::mem
