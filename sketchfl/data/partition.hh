#ifndef SKETCHFL_DATA_PARTITION_HH
#define SKETCHFL_DATA_PARTITION_HH

#include <vector>
#include <mlpack/core.hpp>

namespace sketchfl {

    namespace data {

        struct Partition {
            std::vector<arma::uvec> nodeIndices;    // Data points given to every node
            arma::mat labelDistributions;           // Realized label distribution, one row per node
        };

        // Splits the points among numNodes nodes with a label skew controlled by alpha.
        // Every node draws its label proportions from Dirichlet(alpha, ..., alpha); the points of each label are
        // then handed out in consecutive slices sized by the normalized cumulative proportions of the nodes.
        Partition DirichletPartition(const arma::urowvec &labels, size_t numNodes, double alpha);

        // Shuffles the points and deals them out in near equal shares.
        Partition IidPartition(const arma::urowvec &labels, size_t numNodes);

    } // end namespace data
} // end namespace sketchfl

#endif //SKETCHFL_DATA_PARTITION_HH
