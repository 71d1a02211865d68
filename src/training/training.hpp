#ifndef STITCH_TRAINING_HPP
#define STITCH_TRAINING_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/grad_scaler.hpp"
#include "details/trainer.hpp"

namespace Stitch::Training {
    using GradScalerOptions = Details::GradScalerOptions;
    using GradScaler = Details::GradScaler;
    using TrainerOptions = Details::TrainerOptions;
    using Trainer = Details::Trainer;
}

#endif // STITCH_TRAINING_HPP
