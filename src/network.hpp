#ifndef STITCH_NETWORK_HPP
#define STITCH_NETWORK_HPP
/*
 * Network and predictor boundary.
 * ---------------------------------------------------------------------------
 *  - The orchestrator never looks inside the architecture: a Network is any
 *    torch::nn::Module exposing `forward([N, C, *roi]) -> [N, K, *roi]`.
 *  - Inference consumes the narrower Predictor capability, a plain callable.
 *    `as_predictor` binds a Network to an ExecutionContext (device + autocast)
 *    and hands back full-precision scores so accumulation never happens in
 *    reduced precision.
 */
#include <functional>
#include <memory>
#include <string>

#include <torch/torch.h>

#include "common/context.hpp"

namespace Stitch {
    // f([N, C, *roi]) -> [N, K, *roi]; pure and deterministic for fixed parameters.
    using Predictor = std::function<torch::Tensor(const torch::Tensor&)>;

    class Network : public torch::nn::Module {
    public:
        using torch::nn::Module::Module;

        virtual torch::Tensor forward(torch::Tensor input) = 0;
    };

    using NetworkPtr = std::shared_ptr<Network>;

    [[nodiscard]] inline Predictor as_predictor(Network& network, const ExecutionContext& context)
    {
        return [&network, context](const torch::Tensor& input) {
            torch::Tensor scores;
            {
                AutocastGuard autocast(context);
                scores = network.forward(input.to(context.device));
            }
            return scores.to(torch::kFloat32);
        };
    }
}

#endif // STITCH_NETWORK_HPP
