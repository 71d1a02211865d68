#ifndef STITCH_COMMON_CONTEXT_HPP
#define STITCH_COMMON_CONTEXT_HPP
// Execution context threaded through the trainer, validator and inferer.
// -----------------------------------------------------------------------------
//  - Device and precision are resolved once from the configuration and passed
//    by value; nothing below queries CUDA availability or AMP flags on its own.
//  - AutocastGuard / EvalModeGuard are scoped helpers that restore the previous
//    autocast and module-mode state on exit.
#include <sstream>
#include <string>
#include <string_view>

#include <torch/torch.h>
#include <ATen/autocast_mode.h>

#include "errors.hpp"

namespace Stitch {
    enum class Precision {
        Float32,
        Float16,
        BFloat16
    };

    [[nodiscard]] constexpr std::string_view to_string(Precision precision) noexcept
    {
        switch (precision) {
            case Precision::Float16: return "float16";
            case Precision::BFloat16: return "bfloat16";
            case Precision::Float32:
            default: return "float32";
        }
    }

    struct ExecutionContext {
        torch::Device device{torch::kCPU};
        Precision precision{Precision::Float32};

        [[nodiscard]] bool mixed_precision() const noexcept { return precision != Precision::Float32; }

        [[nodiscard]] torch::ScalarType autocast_dtype() const noexcept
        {
            switch (precision) {
                case Precision::Float16: return torch::kFloat16;
                case Precision::BFloat16: return torch::kBFloat16;
                case Precision::Float32:
                default: return torch::kFloat32;
            }
        }

        [[nodiscard]] static ExecutionContext cpu() { return ExecutionContext{}; }

        // device: "auto", "cpu", "cuda" or "cuda:<index>".
        [[nodiscard]] static ExecutionContext resolve(const std::string& device, bool mixed_precision)
        {
            ExecutionContext context{};
            if (device.empty() || device == "auto") {
                context.device = torch::cuda::is_available() ? torch::Device(torch::kCUDA, 0) : torch::Device(torch::kCPU);
            } else {
                try {
                    context.device = torch::Device(device);
                } catch (const c10::Error&) {
                    throw ConfigurationError("Unrecognised device '" + device + "'.");
                }
                if (context.device.is_cuda() && !torch::cuda::is_available()) {
                    throw ConfigurationError("CUDA device '" + device + "' requested but CUDA is unavailable.");
                }
            }

            if (mixed_precision) {
                context.precision = context.device.is_cuda() ? Precision::Float16 : Precision::BFloat16;
            }
            return context;
        }

        [[nodiscard]] std::string describe() const
        {
            std::ostringstream stream;
            stream << device << " (" << to_string(precision) << ')';
            return stream.str();
        }
    };

    class AutocastGuard {
    public:
        AutocastGuard(bool enabled, c10::DeviceType device_type, torch::ScalarType dtype)
            : enabled_(enabled), device_type_(device_type)
        {
            if (enabled_) {
                previous_enabled_ = at::autocast::is_autocast_enabled(device_type_);
                previous_dtype_ = at::autocast::get_autocast_dtype(device_type_);
                at::autocast::set_autocast_dtype(device_type_, dtype);
                at::autocast::set_autocast_enabled(device_type_, true);
            }
        }

        explicit AutocastGuard(const ExecutionContext& context)
            : AutocastGuard(context.mixed_precision(), context.device.type(), context.autocast_dtype()) {}

        AutocastGuard(const AutocastGuard&) = delete;
        AutocastGuard& operator=(const AutocastGuard&) = delete;
        AutocastGuard(AutocastGuard&&) = delete;
        AutocastGuard& operator=(AutocastGuard&&) = delete;

        ~AutocastGuard()
        {
            if (enabled_) {
                at::autocast::set_autocast_enabled(device_type_, previous_enabled_);
                at::autocast::set_autocast_dtype(device_type_, previous_dtype_);
                if (!previous_enabled_) {
                    at::autocast::clear_cache();
                }
            }
        }

    private:
        bool enabled_{false};
        c10::DeviceType device_type_{c10::DeviceType::CPU};
        bool previous_enabled_{false};
        torch::ScalarType previous_dtype_{torch::kFloat32};
    };

    // Puts a module in evaluation mode for the lifetime of the guard.
    class EvalModeGuard {
    public:
        explicit EvalModeGuard(torch::nn::Module& module)
            : module_(module), was_training_(module.is_training())
        {
            module_.eval();
        }

        EvalModeGuard(const EvalModeGuard&) = delete;
        EvalModeGuard& operator=(const EvalModeGuard&) = delete;

        ~EvalModeGuard()
        {
            if (was_training_) {
                module_.train(true);
            }
        }

    private:
        torch::nn::Module& module_;
        bool was_training_;
    };
}

#endif // STITCH_COMMON_CONTEXT_HPP
