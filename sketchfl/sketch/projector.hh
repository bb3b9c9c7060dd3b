#ifndef SKETCHFL_SKETCH_PROJECTOR_HH
#define SKETCHFL_SKETCH_PROJECTOR_HH

#include <mlpack/core.hpp>
#include "sketchfl/common/config.hh"
#include "sketchfl/device/compute_context.hh"

namespace sketchfl {

    namespace sketch {

        using device::ComputeContext;
        using device::DeviceMatrix;

        // Draws the random projection matrices of the rounds.
        // Every entry is an independent N(0, 1) sample; the rows are generated chunkSize at a time.
        class RandomProjector {

        public:
            explicit RandomProjector(const config::SimulationConfig &cfg);

            // Throws ConfigError when chunkSize is zero.
            explicit RandomProjector(size_t chunkSize);

            // A d x f matrix resident on ctx.
            DeviceMatrix GenerateMatrix(size_t d, size_t f, const ComputeContext &ctx) const;

            size_t ChunkSize() const;

        private:
            size_t chunkSize;                   // Rows filled per block
        };

    } // end namespace sketch
} // end namespace sketchfl

#endif //SKETCHFL_SKETCH_PROJECTOR_HH
