#pragma once
/**
 * @file config_loader.hpp
 * @brief Loader facade: named defaults, optionally overridden by a YAML file.
 * @details All defaults reference named constants to avoid magic numbers.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "linmem/compat/expected.hpp"
#include "linmem/config/constants.hpp"

namespace linmem::config {

    /** @struct HeapConfig
     *  @brief Host buffer sizes and pool layout for an allocator setup.
     */
    struct HeapConfig {
        std::size_t heap_bytes      = constants::HEAP_BYTES_DEFAULT;       ///< General bump region
        std::size_t arena_bytes     = constants::ARENA_BYTES_DEFAULT;      ///< Region behind the arena
        std::size_t pool_slot_size  = constants::POOL_SLOT_SIZE_DEFAULT;   ///< Bytes per pool slot
        std::size_t pool_slot_count = constants::POOL_SLOT_COUNT_DEFAULT;  ///< Pool slots
        std::size_t pool_slot_align = constants::POOL_SLOT_ALIGN_DEFAULT;  ///< Pool slot alignment
        std::string log_level       = constants::LOG_LEVEL_DEFAULT;        ///< trace/debug/info/warn/error/off
    };

    /// @brief Reasons a configuration could not be produced.
    enum class ConfigError : std::uint8_t {
        FileNotFound = 1,  ///< Path given but not readable
        ParseError,        ///< Not valid YAML, or not a mapping where one is expected
        UnknownKey,        ///< Key not part of HeapConfig
        InvalidValue       ///< Wrong type, zero or oversized, non-power-of-two alignment, bad log level
    };

    std::string_view to_string(ConfigError e) noexcept;

    /** @class Loader
     *  @brief Source of allocator configuration (defaults or parsed files).
     *
     * Format (every key optional):
     *   heap_bytes: 65536
     *   arena_bytes: 16384
     *   pool:
     *     slot_size: 64
     *     slot_count: 100
     *     slot_align: 16
     *   log_level: debug
     *
     * Sizes are bounded by the MAX_* limits in constants.hpp, and the whole
     * pool buffer must fit MAX_REGION_BYTES.
     */
    class Loader {
    public:
        /// @brief Named defaults from constants.hpp.
        static HeapConfig defaults();

        /**
         * @brief Apply the YAML document @p text on top of defaults().
         * @return HeapConfig, or the first error encountered.
         */
        static linmem_detail::expected<HeapConfig, ConfigError> parse(std::string_view text);

        /**
         * @brief Load configuration from a path or return defaults.
         * @param path File to read; empty means defaults only.
         * @return HeapConfig with populated fields, or FileNotFound / parse errors.
         */
        static linmem_detail::expected<HeapConfig, ConfigError> load_from_file(const std::string& path);
    };

} // namespace linmem::config
