#include <algorithm>
#include "sketchfl/sketch/projector.hh"
#include "sketchfl/common/errors.hh"

using namespace sketchfl;
using namespace sketchfl::sketch;


RandomProjector::RandomProjector(const config::SimulationConfig &cfg) : RandomProjector(cfg.chunkSize) {}

RandomProjector::RandomProjector(size_t chunkSize) : chunkSize(chunkSize) {
    if (chunkSize == 0)
        throw ConfigError("RandomProjector: the chunk size must be positive");
}

DeviceMatrix RandomProjector::GenerateMatrix(size_t d, size_t f, const ComputeContext &ctx) const {
    arma::mat G(d, f);
    for (size_t start = 0; start < d; start += chunkSize) {
        const size_t end = std::min(start + chunkSize, d);
        G.rows(start, end - 1) = arma::randn<arma::mat>(end - start, f);
    }
    return DeviceMatrix(std::move(G), ctx);
}

size_t RandomProjector::ChunkSize() const { return chunkSize; }
