#ifndef SKETCHFL_COMMON_ERRORS_HH
#define SKETCHFL_COMMON_ERRORS_HH

#include <stdexcept>
#include <string>

namespace sketchfl {

    // Base class of every failure raised by the simulation.
    struct SketchFlError : std::runtime_error {
        explicit SketchFlError(const std::string &what) : std::runtime_error(what) {}
    };

    // A flattened vector does not have the trainable size of the model it is applied to.
    struct FlattenMismatch : SketchFlError {
        using SketchFlError::SketchFlError;
    };

    // Gradient flattening was requested before a backward pass populated the gradients.
    struct MissingGradient : SketchFlError {
        using SketchFlError::SketchFlError;
    };

    // Operands live on different compute contexts and nobody migrated one of them.
    struct PlacementError : SketchFlError {
        using SketchFlError::SketchFlError;
    };

    // An average was requested before any value was accumulated.
    struct DivideByZero : SketchFlError {
        using SketchFlError::SketchFlError;
    };

    struct ConfigError : SketchFlError {
        using SketchFlError::SketchFlError;
    };

} // end namespace sketchfl

#endif //SKETCHFL_COMMON_ERRORS_HH
