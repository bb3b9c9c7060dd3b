#ifndef SKETCHFL_NETWORKS_SAMPLING_HH
#define SKETCHFL_NETWORKS_SAMPLING_HH

#include <string>
#include <vector>
#include <boost/optional.hpp>
#include <mlpack/core.hpp>

namespace sketchfl {

    namespace networks {

        using std::string;
        using std::vector;

        // How the clients of a round are picked.
        enum class SamplingStrategy {
            Uniform,                            // m clients uniformly, without replacement
            PowerOfChoice,                      // "powd": the m highest-loss clients of d uniform candidates
            Random,                             // every client joins independently with probability m / N
            Arbitrary                           // a deterministic cyclic window of m clients
        };

        // The strategy, or the pair of strategies mixed by probability q, a simulation runs with.
        struct SamplingPlan {
            SamplingStrategy primary;
            boost::optional<SamplingStrategy> alternative;

            explicit SamplingPlan(SamplingStrategy primary);

            SamplingPlan(SamplingStrategy primary, SamplingStrategy alternative);

            bool IsCompound() const;
        };

        // Accepts "uniform", "powd", "random" and "arbitrary". Throws ConfigError otherwise.
        SamplingStrategy ParseSamplingStrategy(const string &name);

        string SamplingStrategyName(SamplingStrategy strategy);

        // Accepts a single strategy name or two names joined by '_' ("uniform_powd").
        SamplingPlan ParseSamplingPlan(const string &type);

        // Compound plans draw one uniform number: below q the primary strategy is used, otherwise the alternative.
        // Single plans return their strategy.
        SamplingStrategy DetermineSampling(double q, const SamplingPlan &plan);

        // Picks the participants of a round.
        class ClientSampler {

        public:
            ClientSampler(size_t numClients, size_t clientsPerRound, size_t powdCandidates);

            // Returns the ids of the selected clients in ascending order.
            // lastLosses holds the most recent local training loss of every client (used by powd only).
            vector<size_t> Select(SamplingStrategy strategy, const vector<double> &lastLosses);

        private:
            vector<size_t> UniformDraw(size_t count) const;

            size_t numClients;                  // N
            size_t clientsPerRound;             // m
            size_t powdCandidates;              // d
            size_t windowStart;                 // First client of the next arbitrary window
        };

    } // end namespace networks
} // end namespace sketchfl

#endif //SKETCHFL_NETWORKS_SAMPLING_HH
