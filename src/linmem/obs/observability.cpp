/**
 * @file observability.cpp
 * @brief spdlog-backed Observer and the ObservedAllocator decorator.
 */
#include "linmem/obs/observability.hpp"

#include <mutex>
#include <utility>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace linmem::obs {

    std::string_view to_string(AllocOp op) noexcept {
        switch (op) {
            case AllocOp::Allocate:      return "allocate";
            case AllocOp::ResizeInPlace: return "resize_in_place";
            case AllocOp::Free:          return "free";
            case AllocOp::Reallocate:    return "reallocate";
            case AllocOp::Reset:         return "reset";
        }
        return "unknown";
    }

    class LogObserver : public Observer {
    public:
        explicit LogObserver(std::shared_ptr<spdlog::logger> logger)
            : logger_(std::move(logger)) {}

        // spdlog reports its own failures through its error handler.
        void record(const AllocEvent& e) noexcept override {
            {
                std::lock_guard<std::mutex> lk(mu_);
                count(e);
            }

            if (!e.error) {
                logger_->trace("{} {} size={} align={} -> {}",
                               e.allocator, to_string(e.op), e.size, e.alignment, e.address);
                return;
            }
            const auto err = mem::to_string(*e.error);
            switch (*e.error) {
                case mem::AllocError::UnsupportedOperation:
                    logger_->debug("{} {} size={} not supported",
                                   e.allocator, to_string(e.op), e.size);
                    break;
                case mem::AllocError::InvalidRelease:
                    logger_->warn("{} {} rejected address {}: {}",
                                  e.allocator, to_string(e.op), e.address, err);
                    break;
                default:
                    logger_->warn("{} {} size={} align={} failed: {}",
                                  e.allocator, to_string(e.op), e.size, e.alignment, err);
                    break;
            }
        }

        Counters snapshot() const override {
            std::lock_guard<std::mutex> lk(mu_);
            return ctr_;
        }

    private:
        void count(const AllocEvent& e) {
            if (!e.error) {
                switch (e.op) {
                    case AllocOp::Allocate:
                    case AllocOp::Reallocate:
                        ctr_.allocations++;
                        ctr_.bytes_requested += e.size;
                        break;
                    case AllocOp::Free:
                        ctr_.frees++;
                        break;
                    case AllocOp::Reset:
                        ctr_.resets++;
                        break;
                    case AllocOp::ResizeInPlace:
                        break;
                }
                return;
            }
            switch (*e.error) {
                case mem::AllocError::UnsupportedOperation: ctr_.unsupported++;      break;
                case mem::AllocError::InvalidRelease:       ctr_.invalid_releases++; break;
                default:                                    ctr_.failures++;         break;
            }
        }

        std::shared_ptr<spdlog::logger> logger_;
        mutable std::mutex mu_;
        Counters ctr_;
    };

    std::unique_ptr<Observer> make_log_observer(std::shared_ptr<spdlog::logger> logger) {
        if (!logger) {
            // Not registered globally: each observer owns its logger.
            auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            logger = std::make_shared<spdlog::logger>("linmem", std::move(sink));
            logger->set_level(spdlog::get_level());
        }
        return std::make_unique<LogObserver>(std::move(logger));
    }

    // ------------------------------------------------------------------
    // ObservedAllocator
    // ------------------------------------------------------------------

    ObservedAllocator::ObservedAllocator(mem::Allocator& inner, Observer& observer, std::string label)
        : inner_(&inner), observer_(&observer), label_(std::move(label)) {}

    void ObservedAllocator::emit(AllocOp op, std::size_t size, std::size_t alignment,
                                 const void* address,
                                 std::optional<mem::AllocError> error) noexcept {
        observer_->record(AllocEvent{
            .allocator = label_,
            .op        = op,
            .size      = size,
            .alignment = alignment,
            .address   = address,
            .error     = error,
        });
    }

    mem::Result<mem::Block> ObservedAllocator::allocate(std::size_t size, std::size_t alignment) noexcept {
        auto block = inner_->allocate(size, alignment);
        if (block) {
            emit(AllocOp::Allocate, size, alignment, block->data(), std::nullopt);
        } else {
            emit(AllocOp::Allocate, size, alignment, nullptr, block.error());
        }
        return block;
    }

    mem::Status ObservedAllocator::resize_in_place(mem::Block block, std::size_t new_size) noexcept {
        auto status = inner_->resize_in_place(block, new_size);
        emit(AllocOp::ResizeInPlace, new_size, 0, block.data(),
             status ? std::nullopt : std::optional<mem::AllocError>(status.error()));
        return status;
    }

    mem::Status ObservedAllocator::free(mem::Block block) noexcept {
        auto status = inner_->free(block);
        emit(AllocOp::Free, block.size(), 0, block.data(),
             status ? std::nullopt : std::optional<mem::AllocError>(status.error()));
        return status;
    }

    mem::Result<mem::Block> ObservedAllocator::reallocate(mem::Block block, std::size_t new_size,
                                                          std::size_t alignment) noexcept {
        auto moved = inner_->reallocate(block, new_size, alignment);
        if (moved) {
            emit(AllocOp::Reallocate, new_size, alignment, moved->data(), std::nullopt);
        } else {
            emit(AllocOp::Reallocate, new_size, alignment, block.data(), moved.error());
        }
        return moved;
    }

    mem::Status ObservedAllocator::reset() noexcept {
        auto status = inner_->reset();
        emit(AllocOp::Reset, inner_->capacity(), 0, nullptr,
             status ? std::nullopt : std::optional<mem::AllocError>(status.error()));
        return status;
    }

} // namespace linmem::obs
