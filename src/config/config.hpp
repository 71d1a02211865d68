#ifndef STITCH_CONFIG_HPP
#define STITCH_CONFIG_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/builders.hpp"
#include "details/run_config.hpp"

namespace Stitch::Config {
    using RunConfig = Details::RunConfig;

    using Details::from_tree;
    using Details::read_json;
    using Details::to_tree;
    using Details::write_json;

    using Details::blend_mode;
    using Details::dice_options;
    using Details::execution_context;
    using Details::flip_options;
    using Details::loss_descriptor;
    using Details::optimizer_descriptor;
    using Details::scheduler_descriptor;
    using Details::sliding_window_options;
}

#endif // STITCH_CONFIG_HPP
