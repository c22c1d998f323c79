// =============================================================
// File: src/linmem/mem/locked_allocator.cpp
// =============================================================
#include "linmem/mem/locked_allocator.hpp"

namespace linmem::mem {

// A std::system_error from lock() terminates at the noexcept boundary.

Result<Block> LockedAllocator::allocate(std::size_t size, std::size_t alignment) noexcept {
  std::lock_guard<std::mutex> lk(mu_);
  return inner_->allocate(size, alignment);
}

Status LockedAllocator::resize_in_place(Block block, std::size_t new_size) noexcept {
  std::lock_guard<std::mutex> lk(mu_);
  return inner_->resize_in_place(block, new_size);
}

Status LockedAllocator::free(Block block) noexcept {
  std::lock_guard<std::mutex> lk(mu_);
  return inner_->free(block);
}

Result<Block> LockedAllocator::reallocate(Block block, std::size_t new_size,
                                          std::size_t alignment) noexcept {
  std::lock_guard<std::mutex> lk(mu_);
  return inner_->reallocate(block, new_size, alignment);
}

Status LockedAllocator::reset() noexcept {
  std::lock_guard<std::mutex> lk(mu_);
  return inner_->reset();
}

bool LockedAllocator::owns(const void* ptr) const noexcept {
  std::lock_guard<std::mutex> lk(mu_);
  return inner_->owns(ptr);
}

std::size_t LockedAllocator::capacity() const noexcept {
  std::lock_guard<std::mutex> lk(mu_);
  return inner_->capacity();
}

std::size_t LockedAllocator::used() const noexcept {
  std::lock_guard<std::mutex> lk(mu_);
  return inner_->used();
}

} // namespace linmem::mem
