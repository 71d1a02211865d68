#ifndef STITCH_VALIDATION_HPP
#define STITCH_VALIDATION_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/validator.hpp"

namespace Stitch::Validation {
    using Phase = Details::Phase;
    using Artifact = Details::Artifact;
    using ArtifactSink = Details::ArtifactSink;
    using ValidatorOptions = Details::ValidatorOptions;
    using ValidationReport = Details::ValidationReport;
    using Validator = Details::Validator;
}

#endif // STITCH_VALIDATION_HPP
