/**
 * @file allocator.cpp
 * @brief Default behaviour for optional allocator operations, error labels.
 */
#include "linmem/mem/allocator.hpp"

namespace linmem::mem {

std::string_view to_string(AllocError e) noexcept {
  switch (e) {
    case AllocError::OutOfMemory:          return "out_of_memory";
    case AllocError::UnsupportedOperation: return "unsupported_operation";
    case AllocError::InvalidRelease:       return "invalid_release";
    case AllocError::InvalidAlignment:     return "invalid_alignment";
    case AllocError::BufferTooSmall:       return "buffer_too_small";
    case AllocError::InvalidLayout:        return "invalid_layout";
  }
  return "unknown";
}

Status Allocator::resize_in_place(Block, std::size_t) noexcept {
  return fail(AllocError::UnsupportedOperation);
}

Result<Block> Allocator::reallocate(Block, std::size_t, std::size_t) noexcept {
  return fail(AllocError::UnsupportedOperation);
}

Status Allocator::reset() noexcept {
  return fail(AllocError::UnsupportedOperation);
}

} // namespace linmem::mem
