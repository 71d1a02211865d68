#ifndef STITCH_DATA_STREAM_HPP
#define STITCH_DATA_STREAM_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <numeric>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../common/errors.hpp"
#include "../../common/shape.hpp"

namespace Stitch::Data::Details {
    // image: [C, *S] float; label: [*S] or [1, *S] integer class map.
    struct Sample {
        torch::Tensor image{};
        torch::Tensor label{};
    };

    struct Batch {
        torch::Tensor images{};
        torch::Tensor labels{};
        std::vector<std::size_t> indices{};

        [[nodiscard]] std::int64_t size() const { return images.defined() ? images.size(0) : 0; }
    };

    // Sequence of batches. End of stream is std::nullopt; reset(pass) rewinds for
    // the given pass. The batch order of a pass depends on the pass number only,
    // never on how many passes came before it.
    class Stream {
    public:
        virtual ~Stream() = default;

        virtual void reset(std::size_t pass) = 0;
        [[nodiscard]] virtual std::optional<Batch> next() = 0;

        // Number of batches per pass when known up front.
        [[nodiscard]] virtual std::optional<std::size_t> batches() const { return std::nullopt; }
    };

    struct TensorStreamOptions {
        std::size_t batch_size{1};
        bool shuffle{false};
        std::uint64_t seed{0};
        bool drop_last{false};
    };

    // In-memory samples, batched by stacking. A shuffled pass is permuted by a
    // generator seeded from (seed, pass).
    class TensorStream final : public Stream {
    public:
        TensorStream(std::vector<Sample> samples, TensorStreamOptions options = {})
            : samples_(std::move(samples)), options_(options)
        {
            if (options_.batch_size == 0) {
                throw ConfigurationError("TensorStream batch_size must be at least 1.", Stage::DataStream);
            }
            for (std::size_t index = 0; index < samples_.size(); ++index) {
                if (!samples_[index].image.defined() || !samples_[index].label.defined()) {
                    throw std::invalid_argument("Sample " + std::to_string(index) + " has an undefined image or label.");
                }
            }
            order_.resize(samples_.size());
            reset(0);
        }

        void reset(std::size_t pass) override
        {
            std::iota(order_.begin(), order_.end(), std::size_t{0});
            if (options_.shuffle) {
                std::seed_seq sequence{static_cast<std::uint32_t>(options_.seed),
                                       static_cast<std::uint32_t>(options_.seed >> 32),
                                       static_cast<std::uint32_t>(pass),
                                       static_cast<std::uint32_t>(static_cast<std::uint64_t>(pass) >> 32)};
                std::mt19937_64 generator(sequence);
                std::shuffle(order_.begin(), order_.end(), generator);
            }
            cursor_ = 0;
        }

        [[nodiscard]] std::optional<Batch> next() override
        {
            const auto remaining = order_.size() - cursor_;
            if (remaining == 0 || (options_.drop_last && remaining < options_.batch_size)) {
                return std::nullopt;
            }
            const auto count = std::min(options_.batch_size, remaining);

            Batch batch{};
            std::vector<torch::Tensor> images;
            std::vector<torch::Tensor> labels;
            images.reserve(count);
            labels.reserve(count);
            for (std::size_t offset = 0; offset < count; ++offset) {
                const auto index = order_[cursor_ + offset];
                images.push_back(samples_[index].image);
                labels.push_back(samples_[index].label);
                batch.indices.push_back(index);
            }
            cursor_ += count;

            try {
                batch.images = torch::stack(images);
                batch.labels = torch::stack(labels);
            } catch (const c10::Error& error) {
                throw ShapeMismatchError(Stage::DataStream,
                                         std::string("Samples in one batch differ in shape: ") + error.what_without_backtrace());
            }
            return batch;
        }

        [[nodiscard]] std::optional<std::size_t> batches() const override
        {
            const auto full = samples_.size() / options_.batch_size;
            const bool partial = samples_.size() % options_.batch_size != 0;
            return full + ((partial && !options_.drop_last) ? 1 : 0);
        }

        [[nodiscard]] std::size_t size() const noexcept { return samples_.size(); }
        [[nodiscard]] const Sample& sample(std::size_t index) const { return samples_.at(index); }

    private:
        std::vector<Sample> samples_;
        TensorStreamOptions options_;
        std::vector<std::size_t> order_{};
        std::size_t cursor_{0};
    };
}

#endif // STITCH_DATA_STREAM_HPP
