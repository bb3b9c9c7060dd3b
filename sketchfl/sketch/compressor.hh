#ifndef SKETCHFL_SKETCH_COMPRESSOR_HH
#define SKETCHFL_SKETCH_COMPRESSOR_HH

#include <mlpack/core.hpp>
#include "sketchfl/common/config.hh"
#include "sketchfl/device/compute_context.hh"

namespace sketchfl {

    namespace sketch {

        using device::ComputeContext;
        using device::DeviceMatrix;

        // An approximate gradient rebuilt from its sketch.
        struct Reconstruction {
            DeviceMatrix gradient;              // G * w, D x 1
            double mse;                         // Mean squared error against the original gradient (diagnostic)
        };

        // Compresses a flattened gradient delta into the weights w = G^T * delta / f and rebuilds G * w.
        class SketchCompressor {

        public:
            explicit SketchCompressor(const config::SimulationConfig &cfg);

            // totalWidth is the configured F, the normaliser of every set of weights.
            explicit SketchCompressor(size_t totalWidth, size_t weightsChunkSize = 1000);

            // G^T * delta / f, accumulated over blocks of weightsChunkSize rows.
            DeviceMatrix ApproximateWeights(const DeviceMatrix &G, const DeviceMatrix &delta, size_t f) const;

            // G * w.
            DeviceMatrix Reconstruct(const DeviceMatrix &G, const DeviceMatrix &w) const;

            // One matrix on one context.
            Reconstruction SingleReconstruct(const DeviceMatrix &G, const DeviceMatrix &delta) const;

            // G1 and G2 on their own contexts. delta is copied to both, the two partial reconstructions are
            // summed on the context of G1.
            Reconstruction SplitReconstruct(const DeviceMatrix &G1, const DeviceMatrix &G2,
                                            const DeviceMatrix &delta) const;

            // Bytes a client would send for one sketch (F single precision floats).
            size_t PayloadBytes() const;

            size_t TotalWidth() const;

        private:
            size_t totalWidth;                  // F
            size_t weightsChunkSize;
        };

        double MeanSquaredError(const arma::mat &a, const arma::mat &b);

    } // end namespace sketch
} // end namespace sketchfl

#endif //SKETCHFL_SKETCH_COMPRESSOR_HH
