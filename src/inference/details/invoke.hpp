#ifndef STITCH_INFERENCE_INVOKE_HPP
#define STITCH_INFERENCE_INVOKE_HPP

#include <string>
#include <utility>

#include <torch/torch.h>

#include "../../common/errors.hpp"
#include "../../network.hpp"

namespace Stitch::Inference::Details {
    enum class PredictorStatus {
        Ok,
        ResourceExhausted
    };

    struct PredictorResult {
        PredictorStatus status{PredictorStatus::Ok};
        torch::Tensor scores{};
        std::string message{};

        [[nodiscard]] bool ok() const noexcept { return status == PredictorStatus::Ok; }
    };

    // Separates retryable memory exhaustion from every other failure, which
    // keeps propagating as an exception.
    [[nodiscard]] inline PredictorResult invoke(const Predictor& predictor, const torch::Tensor& batch)
    {
        try {
            return PredictorResult{PredictorStatus::Ok, predictor(batch), {}};
        } catch (const c10::OutOfMemoryError& error) {
            return PredictorResult{PredictorStatus::ResourceExhausted, {}, error.what()};
        } catch (const ResourceExhaustionError& error) {
            return PredictorResult{PredictorStatus::ResourceExhausted, {}, error.what()};
        }
    }
}

#endif // STITCH_INFERENCE_INVOKE_HPP
