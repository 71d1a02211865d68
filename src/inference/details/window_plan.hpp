#ifndef STITCH_INFERENCE_WINDOW_PLAN_HPP
#define STITCH_INFERENCE_WINDOW_PLAN_HPP

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

#include "../../common/errors.hpp"
#include "../../common/shape.hpp"

namespace Stitch::Inference::Details {
    struct Window {
        std::vector<std::int64_t> offset{};
        std::vector<std::int64_t> size{};
    };

    // Windows tile `extent`, which is the volume extent grown to roi_size on any
    // axis where the volume was smaller (the inferer pads to it).
    struct WindowPlan {
        std::vector<std::int64_t> volume_extent{};
        std::vector<std::int64_t> extent{};
        std::vector<std::int64_t> roi_size{};
        std::vector<std::int64_t> stride{};
        std::vector<Window> windows{};

        [[nodiscard]] std::size_t size() const noexcept { return windows.size(); }
        [[nodiscard]] bool empty() const noexcept { return windows.empty(); }
        [[nodiscard]] std::size_t spatial_dims() const noexcept { return roi_size.size(); }

        [[nodiscard]] bool requires_padding() const noexcept { return extent != volume_extent; }
    };

    [[nodiscard]] inline std::int64_t window_stride(std::int64_t roi, double overlap) noexcept
    {
        const auto stride = static_cast<std::int64_t>(std::llround(static_cast<double>(roi) * (1.0 - overlap)));
        return std::max<std::int64_t>(stride, 1);
    }

    // Origins step by `stride` from zero; the last window is pulled back flush
    // with the end so the boundary is always covered.
    [[nodiscard]] inline std::vector<std::int64_t> axis_origins(std::int64_t extent, std::int64_t roi, std::int64_t stride)
    {
        std::vector<std::int64_t> origins;
        std::int64_t origin = 0;
        while (true) {
            origins.push_back(origin);
            if (origin + roi >= extent) {
                break;
            }
            origin += stride;
        }

        const auto flush = extent - roi;
        if (origins.back() > flush) {
            origins.back() = flush;
        }
        return origins;
    }

    inline void validate_window_settings(const std::vector<std::int64_t>& roi_size, double overlap)
    {
        if (roi_size.empty()) {
            throw ConfigurationError("roi_size must name at least one spatial axis.", Stage::WindowConstruction);
        }
        for (const auto value : roi_size) {
            if (value <= 0) {
                throw ConfigurationError("roi_size " + Common::format_shape(roi_size) + " must be positive on every axis.",
                                         Stage::WindowConstruction);
            }
        }
        if (!std::isfinite(overlap) || overlap < 0.0 || overlap >= 1.0) {
            std::ostringstream message;
            message << "overlap must lie in [0, 1), got " << overlap << '.';
            throw ConfigurationError(message.str(), Stage::WindowConstruction);
        }
    }

    [[nodiscard]] inline WindowPlan make_window_plan(const std::vector<std::int64_t>& volume_extent,
                                                     const std::vector<std::int64_t>& roi_size,
                                                     double overlap,
                                                     bool allow_padding)
    {
        validate_window_settings(roi_size, overlap);
        if (volume_extent.size() != roi_size.size()) {
            throw ConfigurationError("roi_size " + Common::format_shape(roi_size) + " does not match the "
                                         + std::to_string(volume_extent.size()) + " spatial axes of volume "
                                         + Common::format_shape(volume_extent) + '.',
                                     Stage::WindowConstruction);
        }

        WindowPlan plan{};
        plan.volume_extent = volume_extent;
        plan.roi_size = roi_size;
        plan.extent.reserve(roi_size.size());
        plan.stride.reserve(roi_size.size());

        std::vector<std::vector<std::int64_t>> origins;
        origins.reserve(roi_size.size());
        for (std::size_t axis = 0; axis < roi_size.size(); ++axis) {
            if (volume_extent[axis] <= 0) {
                throw ConfigurationError("Volume " + Common::format_shape(volume_extent) + " is empty along axis "
                                             + std::to_string(axis) + '.',
                                         Stage::WindowConstruction);
            }
            if (roi_size[axis] > volume_extent[axis] && !allow_padding) {
                throw ConfigurationError("roi_size " + Common::format_shape(roi_size) + " exceeds volume "
                                             + Common::format_shape(volume_extent) + " and padding is disabled.",
                                         Stage::WindowConstruction);
            }
            const auto extent = std::max(volume_extent[axis], roi_size[axis]);
            const auto stride = window_stride(roi_size[axis], overlap);
            plan.extent.push_back(extent);
            plan.stride.push_back(stride);
            origins.push_back(axis_origins(extent, roi_size[axis], stride));
        }

        std::size_t total = 1;
        for (const auto& axis : origins) {
            total *= axis.size();
        }
        plan.windows.reserve(total);

        // Row-major walk: the first spatial axis varies slowest.
        std::vector<std::size_t> cursor(origins.size(), 0);
        for (std::size_t index = 0; index < total; ++index) {
            Window window{};
            window.offset.reserve(origins.size());
            for (std::size_t axis = 0; axis < origins.size(); ++axis) {
                window.offset.push_back(origins[axis][cursor[axis]]);
            }
            window.size = roi_size;
            plan.windows.push_back(std::move(window));

            for (std::size_t axis = origins.size(); axis-- > 0;) {
                if (++cursor[axis] < origins[axis].size()) {
                    break;
                }
                cursor[axis] = 0;
            }
        }
        return plan;
    }
}

#endif // STITCH_INFERENCE_WINDOW_PLAN_HPP
