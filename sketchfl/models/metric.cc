#include <utility>
#include "sketchfl/models/metric.hh"
#include "sketchfl/common/errors.hh"

using namespace sketchfl;
using namespace sketchfl::models;


Metric::Metric(std::string name) : name(std::move(name)), sum(0.0), n(0) {}

void Metric::Update(double val) {
    sum += val;
    n++;
}

void Metric::Update(const arma::mat &val) { Update(arma::as_scalar(val)); }

double Metric::Avg() const {
    if (n == 0)
        throw DivideByZero("Metric '" + name + "' has no updates to average");
    return sum / (double) n;
}

void Metric::Reset() {
    sum = 0.0;
    n = 0;
}

const std::string &Metric::Name() const { return name; }

double Metric::Sum() const { return sum; }

size_t Metric::Count() const { return n; }
