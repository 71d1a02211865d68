#ifndef STITCH_CHECKPOINT_HPP
#define STITCH_CHECKPOINT_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/store.hpp"

namespace Stitch::Checkpoint {
    using Variant = Details::Variant;
    using Metadata = Details::Metadata;
    using StoreOptions = Details::StoreOptions;
    using Store = Details::Store;
}

#endif // STITCH_CHECKPOINT_HPP
