/**
 * @file config_loader.cpp
 * @brief yaml-cpp loader layered over named defaults.
 */
#include "linmem/config/config_loader.hpp"

#include <array>
#include <string>

#include <yaml-cpp/yaml.h>

#include "linmem/mem/pool_allocator.hpp"

namespace linmem::config {

    namespace {

        using Expected = linmem_detail::expected<HeapConfig, ConfigError>;
        using Unexpected = linmem_detail::unexpected<ConfigError>;

        constexpr std::array<std::string_view, 6> kLogLevels = {
            "trace", "debug", "info", "warn", "error", "off"
        };

        /// Positive size no larger than @p max; anything else is InvalidValue.
        bool read_size(const YAML::Node& node, std::size_t max, std::size_t& field) {
            if (!node.IsScalar()) return false;
            std::size_t n = 0;
            try {
                n = node.as<std::size_t>();
            } catch (const YAML::BadConversion&) {
                return false;
            }
            if (n == 0 || n > max) return false;
            field = n;
            return true;
        }

        linmem_detail::expected<void, ConfigError> read_pool(const YAML::Node& pool, HeapConfig& cfg) {
            if (!pool.IsMap()) {
                return Unexpected(ConfigError::ParseError);
            }
            for (const auto& kv : pool) {
                const auto key = kv.first.as<std::string>();
                bool ok = true;
                if (key == "slot_size") {
                    ok = read_size(kv.second, constants::MAX_REGION_BYTES, cfg.pool_slot_size);
                } else if (key == "slot_count") {
                    ok = read_size(kv.second, constants::MAX_POOL_SLOT_COUNT, cfg.pool_slot_count);
                } else if (key == "slot_align") {
                    ok = read_size(kv.second, constants::MAX_POOL_SLOT_ALIGN, cfg.pool_slot_align) &&
                         mem::is_power_of_two(cfg.pool_slot_align);
                } else {
                    return Unexpected(ConfigError::UnknownKey);
                }
                if (!ok) return Unexpected(ConfigError::InvalidValue);
            }
            return {};
        }

        Expected apply(const YAML::Node& root) {
            HeapConfig cfg = Loader::defaults();
            if (root.IsNull()) {
                return cfg;
            }
            if (!root.IsMap()) {
                return Unexpected(ConfigError::ParseError);
            }

            try {
                for (const auto& kv : root) {
                    const auto key = kv.first.as<std::string>();
                    bool ok = true;
                    if (key == "heap_bytes") {
                        ok = read_size(kv.second, constants::MAX_REGION_BYTES, cfg.heap_bytes);
                    } else if (key == "arena_bytes") {
                        ok = read_size(kv.second, constants::MAX_REGION_BYTES, cfg.arena_bytes);
                    } else if (key == "pool") {
                        if (auto st = read_pool(kv.second, cfg); !st) return Unexpected(st.error());
                    } else if (key == "log_level") {
                        ok = false;
                        if (kv.second.IsScalar()) {
                            const auto level = kv.second.as<std::string>();
                            for (auto lvl : kLogLevels) ok = ok || (lvl == level);
                            if (ok) cfg.log_level = level;
                        }
                    } else {
                        return Unexpected(ConfigError::UnknownKey);
                    }
                    if (!ok) return Unexpected(ConfigError::InvalidValue);
                }
            } catch (const YAML::BadConversion&) {
                // Non-scalar mapping key.
                return Unexpected(ConfigError::ParseError);
            }

            // The pool buffer is one host region as well.
            std::size_t pool_bytes = 0;
            if (!mem::PoolAllocator::checked_required_bytes(cfg.pool_slot_size, cfg.pool_slot_count,
                                                            cfg.pool_slot_align, pool_bytes) ||
                pool_bytes > constants::MAX_REGION_BYTES) {
                return Unexpected(ConfigError::InvalidValue);
            }
            return cfg;
        }

    } // namespace

    std::string_view to_string(ConfigError e) noexcept {
        switch (e) {
            case ConfigError::FileNotFound: return "file_not_found";
            case ConfigError::ParseError:   return "parse_error";
            case ConfigError::UnknownKey:   return "unknown_key";
            case ConfigError::InvalidValue: return "invalid_value";
        }
        return "unknown";
    }

    HeapConfig Loader::defaults() {
        return HeapConfig{};
    }

    Expected Loader::parse(std::string_view text) {
        YAML::Node root;
        try {
            root = YAML::Load(std::string(text));
        } catch (const YAML::ParserException&) {
            return Unexpected(ConfigError::ParseError);
        }
        return apply(root);
    }

    Expected Loader::load_from_file(const std::string& path) {
        if (path.empty()) {
            return defaults();
        }
        YAML::Node root;
        try {
            root = YAML::LoadFile(path);
        } catch (const YAML::BadFile&) {
            return Unexpected(ConfigError::FileNotFound);
        } catch (const YAML::ParserException&) {
            return Unexpected(ConfigError::ParseError);
        }
        return apply(root);
    }

} // namespace linmem::config
