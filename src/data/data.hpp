#ifndef STITCH_DATA_HPP
#define STITCH_DATA_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <memory>
#include <vector>

#include "details/stream.hpp"
#include "details/synthetic.hpp"

namespace Stitch::Data {
    using Sample = Details::Sample;
    using Batch = Details::Batch;
    using Stream = Details::Stream;
    using TensorStream = Details::TensorStream;
    using TensorStreamOptions = Details::TensorStreamOptions;
    using SyntheticSpheresOptions = Details::SyntheticSpheresOptions;

    using Details::synthetic_spheres;

    [[nodiscard]] inline auto Tensors(std::vector<Sample> samples, const TensorStreamOptions& options = {})
        -> std::unique_ptr<TensorStream> {
        return std::make_unique<TensorStream>(std::move(samples), options);
    }
}

#endif // STITCH_DATA_HPP
