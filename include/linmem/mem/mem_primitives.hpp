#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>

namespace linmem::mem {

    /// @brief Alignment used when a caller does not ask for one.
    inline constexpr std::size_t kDefaultAlignment = alignof(std::max_align_t);

    /// @brief Alignment primitives shared by every allocator policy.
    ///
    /// All helpers assume @p alignment is a power of two; callers validate
    /// with is_power_of_two() before doing arithmetic.

    /// @brief True for 1, 2, 4, 8, ...; false for 0.
    constexpr bool is_power_of_two(std::size_t value) noexcept {
        return value != 0 && (value & (value - 1)) == 0;
    }

    /// @brief Round @p value up to the next multiple of @p alignment.
    /// @note Wraps on overflow; use checked_align_up() for untrusted sizes.
    constexpr std::size_t align_up(std::size_t value, std::size_t alignment) noexcept {
        return (value + alignment - 1) & ~(alignment - 1);
    }

    /// @brief align_up() that reports overflow instead of wrapping.
    /// @return false if the rounded value does not fit in size_t.
    constexpr bool checked_align_up(std::size_t value, std::size_t alignment,
                                    std::size_t& out) noexcept {
        if (value > std::numeric_limits<std::size_t>::max() - (alignment - 1)) {
            return false;
        }
        out = align_up(value, alignment);
        return true;
    }

    /// @brief Bytes to skip from @p ptr to reach the next @p alignment boundary.
    inline std::size_t padding_for(const void* ptr, std::size_t alignment) noexcept {
        const auto addr = reinterpret_cast<std::uintptr_t>(ptr);
        return static_cast<std::size_t>((alignment - (addr & (alignment - 1))) & (alignment - 1));
    }

    /// @brief True if @p ptr sits on an @p alignment boundary.
    inline bool is_aligned(const void* ptr, std::size_t alignment) noexcept {
        return (reinterpret_cast<std::uintptr_t>(ptr) & (alignment - 1)) == 0;
    }

} // namespace linmem::mem
