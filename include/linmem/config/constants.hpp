#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for host buffers and allocator layout.
 * @details These values eliminate magic numbers from the codebase. Override via the
 *          Config Loader (YAML file) per deployment.
 */

#include <cstddef>

namespace linmem::config::constants {

// =====================
// Alignment
// =====================
/// Alignment used by callers that do not specify one (matches malloc).
inline constexpr std::size_t DEFAULT_ALIGNMENT = alignof(std::max_align_t);

// =====================
// Host buffer sizes (bytes)
// =====================
inline constexpr std::size_t HEAP_BYTES_DEFAULT  = 64 * 1024;  ///< Bump region handed to general callers
inline constexpr std::size_t ARENA_BYTES_DEFAULT = 16 * 1024;  ///< Bump region behind the request arena

// =====================
// Pool layout
// =====================
inline constexpr std::size_t POOL_SLOT_SIZE_DEFAULT  = 64;                 ///< Bytes per slot
inline constexpr std::size_t POOL_SLOT_COUNT_DEFAULT = 100;                ///< Slots in the pool
inline constexpr std::size_t POOL_SLOT_ALIGN_DEFAULT = DEFAULT_ALIGNMENT;  ///< Slot alignment

// =====================
// Limits accepted from a config file
// =====================
inline constexpr std::size_t MAX_REGION_BYTES    = std::size_t{1} << 30;  ///< Any single host buffer (1 GiB)
inline constexpr std::size_t MAX_POOL_SLOT_COUNT = std::size_t{1} << 20;  ///< Slots in the pool
inline constexpr std::size_t MAX_POOL_SLOT_ALIGN = 4096;                  ///< Slot alignment (one page)

// =====================
// Logging
// =====================
inline constexpr const char* LOG_LEVEL_DEFAULT = "info";  ///< spdlog level name

} // namespace linmem::config::constants
