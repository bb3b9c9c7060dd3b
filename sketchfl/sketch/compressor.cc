#include <algorithm>
#include "sketchfl/sketch/compressor.hh"
#include "sketchfl/common/errors.hh"

using namespace sketchfl;
using namespace sketchfl::sketch;


SketchCompressor::SketchCompressor(const config::SimulationConfig &cfg) : SketchCompressor(cfg.sketchWidth,
                                                                                           cfg.weightsChunkSize) {}

SketchCompressor::SketchCompressor(size_t totalWidth, size_t weightsChunkSize) : totalWidth(totalWidth),
                                                                                 weightsChunkSize(weightsChunkSize) {
    if (totalWidth == 0)
        throw std::invalid_argument("SketchCompressor: the sketch width must be positive");
    if (weightsChunkSize == 0)
        throw ConfigError("SketchCompressor: the weights chunk size must be positive");
}

DeviceMatrix SketchCompressor::ApproximateWeights(const DeviceMatrix &G, const DeviceMatrix &delta, size_t f) const {
    device::RequireColocated(G, delta, "ApproximateWeights");
    if (f == 0)
        throw std::invalid_argument("ApproximateWeights: f must be positive");
    if (delta.NumElements() != G.Rows())
        throw FlattenMismatch("ApproximateWeights: delta has " + std::to_string(delta.NumElements()) +
                              " elements but the projection matrix has " + std::to_string(G.Rows()) + " rows");

    const arma::mat &g = G.Data();
    const arma::vec d = arma::vectorise(delta.Data());
    arma::vec w(g.n_cols, arma::fill::zeros);
    for (size_t start = 0; start < g.n_rows; start += weightsChunkSize) {
        const size_t end = std::min(start + weightsChunkSize, (size_t) g.n_rows);
        w += g.rows(start, end - 1).t() * d.subvec(start, end - 1);
    }
    w /= (double) f;

    return DeviceMatrix(std::move(w), G.Context());
}

DeviceMatrix SketchCompressor::Reconstruct(const DeviceMatrix &G, const DeviceMatrix &w) const {
    device::RequireColocated(G, w, "Reconstruct");
    if (w.NumElements() != G.Cols())
        throw FlattenMismatch("Reconstruct: " + std::to_string(w.NumElements()) +
                              " weights for a projection matrix with " + std::to_string(G.Cols()) + " columns");

    arma::mat gw = G.Data() * arma::vectorise(w.Data());
    return DeviceMatrix(std::move(gw), G.Context());
}

Reconstruction SketchCompressor::SingleReconstruct(const DeviceMatrix &G, const DeviceMatrix &delta) const {
    DeviceMatrix w = ApproximateWeights(G, delta, totalWidth);
    DeviceMatrix gw = Reconstruct(G, w);
    const double mse = MeanSquaredError(arma::vectorise(delta.Data()), gw.Data());
    return Reconstruction{std::move(gw), mse};
}

Reconstruction SketchCompressor::SplitReconstruct(const DeviceMatrix &G1, const DeviceMatrix &G2,
                                                  const DeviceMatrix &delta) const {
    const DeviceMatrix delta1 = delta.To(G1.Context());
    const DeviceMatrix delta2 = delta.To(G2.Context());

    // Both halves are normalized by the total width.
    DeviceMatrix w1 = ApproximateWeights(G1, delta1, totalWidth);
    DeviceMatrix w2 = ApproximateWeights(G2, delta2, totalWidth);

    DeviceMatrix gw1 = Reconstruct(G1, w1);
    DeviceMatrix gw2 = Reconstruct(G2, w2).To(G1.Context());

    DeviceMatrix gw = device::Add(gw1, gw2);
    const double mse = MeanSquaredError(arma::vectorise(delta1.Data()), gw.Data());
    return Reconstruction{std::move(gw), mse};
}

size_t SketchCompressor::PayloadBytes() const { return totalWidth * sizeof(float); }

size_t SketchCompressor::TotalWidth() const { return totalWidth; }

double sketchfl::sketch::MeanSquaredError(const arma::mat &a, const arma::mat &b) {
    if (a.n_elem != b.n_elem)
        throw FlattenMismatch("MeanSquaredError: operands have " + std::to_string(a.n_elem) + " and " +
                              std::to_string(b.n_elem) + " elements");
    if (a.is_empty())
        return 0.;
    return arma::accu(arma::square(arma::vectorise(a) - arma::vectorise(b))) / (double) a.n_elem;
}
