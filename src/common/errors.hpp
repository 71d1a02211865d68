#ifndef STITCH_COMMON_ERRORS_HPP
#define STITCH_COMMON_ERRORS_HPP
// Error taxonomy shared by every module.
// -----------------------------------------------------------------------------
//  - Every error raised by the library derives from Stitch::Error and carries
//    the Stage that raised it; what() is prefixed with the stage name so a failed
//    run always names the offending step.
//  - Configuration and shape errors are fatal. Resource exhaustion is the only
//    error the sliding-window inferer retries on its own.
#include <stdexcept>
#include <string>
#include <string_view>

namespace Stitch {
    enum class Stage {
        Configuration,
        WindowConstruction,
        PredictorCall,
        MetricAggregation,
        TrainingStep,
        Validation,
        CheckpointWrite,
        CheckpointRead,
        DataStream
    };

    [[nodiscard]] constexpr std::string_view to_string(Stage stage) noexcept
    {
        switch (stage) {
            case Stage::Configuration: return "configuration";
            case Stage::WindowConstruction: return "window construction";
            case Stage::PredictorCall: return "predictor call";
            case Stage::MetricAggregation: return "metric aggregation";
            case Stage::TrainingStep: return "training step";
            case Stage::Validation: return "validation";
            case Stage::CheckpointWrite: return "checkpoint write";
            case Stage::CheckpointRead: return "checkpoint read";
            case Stage::DataStream: return "data stream";
        }
        return "unknown";
    }

    class Error : public std::runtime_error {
    public:
        Error(Stage stage, const std::string& message)
            : std::runtime_error("[" + std::string(to_string(stage)) + "] " + message),
              stage_(stage) {}

        [[nodiscard]] Stage stage() const noexcept { return stage_; }

    private:
        Stage stage_;
    };

    // Invalid window/overlap/roi or run settings, detected before any compute.
    class ConfigurationError final : public Error {
    public:
        explicit ConfigurationError(const std::string& message, Stage stage = Stage::Configuration)
            : Error(stage, message) {}
    };

    class ShapeMismatchError final : public Error {
    public:
        ShapeMismatchError(Stage stage, const std::string& message) : Error(stage, message) {}
    };

    // Device memory exhausted mid-window.
    class ResourceExhaustionError final : public Error {
    public:
        explicit ResourceExhaustionError(const std::string& message, Stage stage = Stage::PredictorCall)
            : Error(stage, message) {}
    };

    // Loss became non-finite; the last written checkpoint is left untouched.
    class TrainingDivergenceError final : public Error {
    public:
        explicit TrainingDivergenceError(const std::string& message)
            : Error(Stage::TrainingStep, message) {}
    };

    class CancelledError final : public Error {
    public:
        explicit CancelledError(Stage stage) : Error(stage, "operation cancelled") {}
    };
}

#endif // STITCH_COMMON_ERRORS_HPP
