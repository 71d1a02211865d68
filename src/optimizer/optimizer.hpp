#ifndef STITCH_OPTIMIZER_HPP
#define STITCH_OPTIMIZER_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <memory>
#include <variant>

#include "details/adam.hpp"
#include "details/sgd.hpp"
#include "registry.hpp"

namespace Stitch::Optimizer {
    using SGDOptions = Details::SGDOptions;
    using SGDDescriptor = Details::SGDDescriptor;
    using AdamOptions = Details::AdamOptions;
    using AdamDescriptor = Details::AdamDescriptor;
    using AdamWOptions = Details::AdamWOptions;
    using AdamWDescriptor = Details::AdamWDescriptor;

    using Descriptor = std::variant<AdamWDescriptor, AdamDescriptor, SGDDescriptor>;

    [[nodiscard]] constexpr AdamWDescriptor AdamW(const AdamWOptions& options = {}) noexcept { return {options}; }
    [[nodiscard]] constexpr AdamDescriptor Adam(const AdamOptions& options = {}) noexcept { return {options}; }
    [[nodiscard]] constexpr SGDDescriptor SGD(const SGDOptions& options = {}) noexcept { return {options}; }

    // Options are validated here; a bad descriptor throws ConfigurationError before any state is allocated.
    template <class Owner>
    [[nodiscard]] std::unique_ptr<torch::optim::Optimizer> build(Owner& owner, const Descriptor& descriptor)
    {
        return std::visit([&owner](const auto& concrete) { return Details::build_optimizer(owner, concrete); },
                          descriptor);
    }
}

#endif // STITCH_OPTIMIZER_HPP
