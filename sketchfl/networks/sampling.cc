#include <algorithm>
#include <numeric>
#include "sketchfl/networks/sampling.hh"
#include "sketchfl/common/errors.hh"

using namespace sketchfl;
using namespace sketchfl::networks;


/*********************************************
	Sampling Plan
*********************************************/
SamplingPlan::SamplingPlan(SamplingStrategy primary) : primary(primary) {}

SamplingPlan::SamplingPlan(SamplingStrategy primary, SamplingStrategy alternative) : primary(primary),
                                                                                     alternative(alternative) {}

bool SamplingPlan::IsCompound() const { return alternative.is_initialized(); }

SamplingStrategy sketchfl::networks::ParseSamplingStrategy(const string &name) {
    if (name == "uniform")
        return SamplingStrategy::Uniform;
    if (name == "powd")
        return SamplingStrategy::PowerOfChoice;
    if (name == "random")
        return SamplingStrategy::Random;
    if (name == "arbitrary")
        return SamplingStrategy::Arbitrary;
    throw ConfigError("Unknown sampling strategy '" + name + "'. Acceptable strategies are: "
                                                             "'uniform', 'powd', 'random', 'arbitrary'");
}

string sketchfl::networks::SamplingStrategyName(SamplingStrategy strategy) {
    switch (strategy) {
        case SamplingStrategy::Uniform:
            return "uniform";
        case SamplingStrategy::PowerOfChoice:
            return "powd";
        case SamplingStrategy::Random:
            return "random";
        case SamplingStrategy::Arbitrary:
            return "arbitrary";
    }
    return "unknown";
}

SamplingPlan sketchfl::networks::ParseSamplingPlan(const string &type) {
    size_t sep = type.find('_');
    if (sep == string::npos)
        return SamplingPlan(ParseSamplingStrategy(type));
    if (type.find('_', sep + 1) != string::npos)
        throw ConfigError("Sampling type '" + type + "' mixes more than two strategies");
    return SamplingPlan(ParseSamplingStrategy(type.substr(0, sep)), ParseSamplingStrategy(type.substr(sep + 1)));
}

SamplingStrategy sketchfl::networks::DetermineSampling(double q, const SamplingPlan &plan) {
    if (!plan.IsCompound())
        return plan.primary;
    return (mlpack::math::Random() < q) ? plan.primary : *plan.alternative;
}


/*********************************************
	Client Sampler
*********************************************/
ClientSampler::ClientSampler(size_t numClients, size_t clientsPerRound, size_t powdCandidates)
        : numClients(numClients), clientsPerRound(clientsPerRound), powdCandidates(powdCandidates), windowStart(0) {
    if (numClients == 0 || clientsPerRound == 0 || clientsPerRound > numClients)
        throw ConfigError("Clients per round must be in [1, " + std::to_string(numClients) + "]");
    if (powdCandidates < clientsPerRound || powdCandidates > numClients)
        throw ConfigError("Power-of-choice candidates must be in [clients per round, number of clients]");
}

vector<size_t> ClientSampler::UniformDraw(size_t count) const {
    arma::uvec drawn = arma::randperm(numClients, count);
    return arma::conv_to<vector<size_t> >::from(drawn);
}

vector<size_t> ClientSampler::Select(SamplingStrategy strategy, const vector<double> &lastLosses) {

    vector<size_t> selected;

    switch (strategy) {
        case SamplingStrategy::Uniform:
            selected = UniformDraw(clientsPerRound);
            break;

        case SamplingStrategy::PowerOfChoice: {
            if (lastLosses.size() != numClients)
                throw std::invalid_argument("ClientSampler: powd needs the last loss of every client");
            vector<size_t> candidates = UniformDraw(powdCandidates);
            std::stable_sort(candidates.begin(), candidates.end(), [&lastLosses](size_t a, size_t b) {
                return lastLosses[a] > lastLosses[b];
            });
            selected.assign(candidates.begin(), candidates.begin() + clientsPerRound);
            break;
        }

        case SamplingStrategy::Random: {
            const double p = (double) clientsPerRound / (double) numClients;
            for (size_t c = 0; c < numClients; c++) {
                if (mlpack::math::Random() < p)
                    selected.push_back(c);
            }
            if (selected.empty())
                selected.push_back((size_t) mlpack::math::RandInt(0, (int) numClients));
            break;
        }

        case SamplingStrategy::Arbitrary:
            for (size_t j = 0; j < clientsPerRound; j++)
                selected.push_back((windowStart + j) % numClients);
            windowStart = (windowStart + clientsPerRound) % numClients;
            break;
    }

    std::sort(selected.begin(), selected.end());
    return selected;
}
