#pragma once
/**
 * @file observability.hpp
 * @brief Allocation events + counters, and a decorator that records them.
 * @details The allocators never log; wrap one in ObservedAllocator to get
 *          spdlog output and counters without touching the allocation path.
 */

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "linmem/mem/allocator.hpp"

namespace spdlog { class logger; }

namespace linmem::obs {

    /** @enum AllocOp
     *  @brief Allocator operation that produced an event.
     */
    enum class AllocOp : std::uint8_t {
        Allocate,
        ResizeInPlace,
        Free,
        Reallocate,
        Reset
    };

    std::string_view to_string(AllocOp op) noexcept;

    /** @struct Counters
     *  @brief Per-observer operation counters.
     */
    struct Counters {
        uint64_t allocations{0};       ///< Successful allocate/reallocate calls
        uint64_t bytes_requested{0};   ///< Sum of sizes of successful allocations
        uint64_t frees{0};             ///< Successful free calls (including no-ops)
        uint64_t resets{0};            ///< Successful bulk resets
        uint64_t failures{0};          ///< OutOfMemory / InvalidAlignment results
        uint64_t unsupported{0};       ///< UnsupportedOperation results
        uint64_t invalid_releases{0};  ///< InvalidRelease results
    };

    /** @struct AllocEvent
     *  @brief Payload describing a single allocator call.
     */
    struct AllocEvent {
        std::string_view allocator;                 ///< Label of the observed allocator
        AllocOp          op{AllocOp::Allocate};     ///< Operation performed
        std::size_t      size{0};                   ///< Requested (new) size in bytes
        std::size_t      alignment{0};              ///< Requested alignment (0 if n/a)
        const void*      address{nullptr};          ///< Resulting or released address
        std::optional<mem::AllocError> error;       ///< Set when the call failed
    };

    /** @class Observer
     *  @brief Observability sink interface.
     */
    class Observer {
    public:
        virtual ~Observer() = default;
        /// Record a single allocator event. Called from noexcept allocator
        /// paths, so implementations must not throw.
        virtual void record(const AllocEvent& e) noexcept = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
    };

    /**
     * @brief Observer backed by an spdlog logger.
     * @param logger Destination; nullptr creates a stderr color logger "linmem".
     */
    std::unique_ptr<Observer> make_log_observer(std::shared_ptr<spdlog::logger> logger = nullptr);

    /** @class ObservedAllocator
     *  @brief Forwards every call to an inner allocator and reports it to an Observer.
     */
    class ObservedAllocator final : public mem::Allocator {
    public:
        ObservedAllocator(mem::Allocator& inner, Observer& observer, std::string label);

        ObservedAllocator(ObservedAllocator&&)            = delete;
        ObservedAllocator& operator=(ObservedAllocator&&) = delete;

        mem::Result<mem::Block> allocate(std::size_t size,
                                         std::size_t alignment = mem::kDefaultAlignment) noexcept override;
        mem::Status resize_in_place(mem::Block block, std::size_t new_size) noexcept override;
        mem::Status free(mem::Block block) noexcept override;
        mem::Result<mem::Block> reallocate(mem::Block block, std::size_t new_size,
                                           std::size_t alignment = mem::kDefaultAlignment) noexcept override;
        mem::Status reset() noexcept override;

        bool        owns(const void* ptr) const noexcept override { return inner_->owns(ptr); }
        std::size_t capacity() const noexcept override { return inner_->capacity(); }
        std::size_t used() const noexcept override { return inner_->used(); }

        const std::string& label() const noexcept { return label_; }

    private:
        void emit(AllocOp op, std::size_t size, std::size_t alignment, const void* address,
                  std::optional<mem::AllocError> error) noexcept;

        mem::Allocator* inner_;
        Observer*       observer_;
        std::string     label_;
    };

} // namespace linmem::obs
