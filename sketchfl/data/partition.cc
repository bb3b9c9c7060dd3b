#include <algorithm>
#include <cmath>
#include "sketchfl/data/partition.hh"

using namespace sketchfl::data;


namespace {

    // Label frequencies of every node, normalized by the node size.
    arma::mat RealizedDistributions(const arma::urowvec &labels, const std::vector<arma::uvec> &nodeIndices,
                                    arma::uword minLabel, size_t numLabels) {
        arma::mat dist(nodeIndices.size(), numLabels, arma::fill::zeros);
        for (size_t n = 0; n < nodeIndices.size(); n++) {
            if (nodeIndices[n].is_empty())
                continue;
            arma::urowvec nodeLabels = labels.cols(nodeIndices[n]);
            for (size_t i = 0; i < numLabels; i++)
                dist(n, i) = (double) arma::accu(nodeLabels == minLabel + i) / (double) nodeLabels.n_elem;
        }
        return dist;
    }

} // end anonymous namespace


Partition sketchfl::data::DirichletPartition(const arma::urowvec &labels, size_t numNodes, double alpha) {
    if (numNodes == 0)
        throw std::invalid_argument("DirichletPartition: at least one node is required");
    if (alpha <= 0.)
        throw std::invalid_argument("DirichletPartition: the concentration parameter must be positive");

    Partition part;
    part.nodeIndices.assign(numNodes, arma::uvec());
    if (labels.is_empty()) {
        part.labelDistributions.zeros(numNodes, 0);
        return part;
    }

    const arma::uword minLabel = labels.min();
    const size_t numLabels = labels.max() - minLabel + 1;

    // A Dirichlet draw is a vector of Gamma(alpha, 1) draws normalized to sum to one.
    arma::mat proportions = arma::randg<arma::mat>(numNodes, numLabels, arma::distr_param(alpha, 1.0));
    for (size_t n = 0; n < numNodes; n++) {
        const double rowSum = arma::accu(proportions.row(n));
        if (rowSum > 0.)
            proportions.row(n) /= rowSum;
        else
            proportions.row(n).fill(1.0 / (double) numLabels);
    }

    const arma::rowvec sumProbPerLabel = arma::sum(proportions, 0);
    const arma::mat cumulative = arma::cumsum(proportions, 0);

    for (size_t i = 0; i < numLabels; i++) {
        const arma::uvec pointsOfLabel = arma::find(labels == minLabel + i);
        size_t start = 0;
        for (size_t n = 0; n < numNodes; n++) {
            size_t end = (size_t) std::round(pointsOfLabel.n_elem * cumulative(n, i) / sumProbPerLabel(i));
            end = std::min(end, (size_t) pointsOfLabel.n_elem);
            if (n == numNodes - 1)
                end = pointsOfLabel.n_elem;
            if (end > start)
                part.nodeIndices[n] = arma::join_cols(part.nodeIndices[n], pointsOfLabel.subvec(start, end - 1));
            start = std::max(start, end);
        }
    }

    part.labelDistributions = RealizedDistributions(labels, part.nodeIndices, minLabel, numLabels);
    return part;
}

Partition sketchfl::data::IidPartition(const arma::urowvec &labels, size_t numNodes) {
    if (numNodes == 0)
        throw std::invalid_argument("IidPartition: at least one node is required");

    Partition part;
    part.nodeIndices.assign(numNodes, arma::uvec());
    if (labels.is_empty()) {
        part.labelDistributions.zeros(numNodes, 0);
        return part;
    }

    const arma::uvec perm = arma::randperm(labels.n_elem);
    const size_t share = labels.n_elem / numNodes;
    const size_t extra = labels.n_elem % numNodes;
    size_t start = 0;
    for (size_t n = 0; n < numNodes; n++) {
        const size_t count = share + (n < extra ? 1 : 0);
        if (count > 0)
            part.nodeIndices[n] = arma::sort(perm.subvec(start, start + count - 1));
        start += count;
    }

    const arma::uword minLabel = labels.min();
    part.labelDistributions = RealizedDistributions(labels, part.nodeIndices, minLabel,
                                                    labels.max() - minLabel + 1);
    return part;
}
