#ifndef STITCH_COMMON_CANCELLATION_HPP
#define STITCH_COMMON_CANCELLATION_HPP

#include <atomic>
#include <memory>

#include "errors.hpp"

namespace Stitch::Common {
    // Copies share one flag; checked between windows and between minibatches.
    class CancellationToken {
    public:
        CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

        void cancel() noexcept { flag_->store(true, std::memory_order_relaxed); }

        void reset() noexcept { flag_->store(false, std::memory_order_relaxed); }

        [[nodiscard]] bool cancelled() const noexcept { return flag_->load(std::memory_order_relaxed); }

        void throw_if_cancelled(Stage stage) const
        {
            if (cancelled()) {
                throw CancelledError(stage);
            }
        }

    private:
        std::shared_ptr<std::atomic<bool>> flag_;
    };
}

#endif // STITCH_COMMON_CANCELLATION_HPP
