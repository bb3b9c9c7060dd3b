#include "sketchfl/models/flattening.hh"
#include "sketchfl/common/errors.hh"

using namespace sketchfl;
using namespace sketchfl::models;


size_t sketchfl::models::TrainableSize(const Model &model) {
    size_t d = 0;
    for (const auto &p : model.Parameters()) {
        if (p.trainable)
            d += p.value.n_elem;
    }
    return d;
}

arma::vec sketchfl::models::Flatten(const Model &model) {
    arma::vec flat(TrainableSize(model));
    size_t start = 0;
    for (const auto &p : model.Parameters()) {
        if (!p.trainable || p.value.is_empty())
            continue;
        flat.subvec(start, start + p.value.n_elem - 1) = arma::vectorise(p.value);
        start += p.value.n_elem;
    }
    return flat;
}

void sketchfl::models::Unflatten(Model &model, const arma::mat &flat) {
    const size_t d = TrainableSize(model);
    if (flat.n_elem != d)
        throw FlattenMismatch("Unflatten: got " + std::to_string(flat.n_elem) + " values for a model with " +
                              std::to_string(d) + " trainable parameters");

    size_t start = 0;
    for (auto &p : model.Parameters()) {
        if (!p.trainable || p.value.is_empty())
            continue;
        p.value = arma::mat(flat.memptr() + start, p.value.n_rows, p.value.n_cols);
        if (p.HasGradient())
            p.grad.zeros();
        start += p.value.n_elem;
    }
}

arma::vec sketchfl::models::FlattenGradient(const Model &model) {
    arma::vec flat(TrainableSize(model));
    size_t start = 0;
    for (const auto &p : model.Parameters()) {
        if (!p.trainable || p.value.is_empty())
            continue;
        if (!p.HasGradient())
            throw MissingGradient("FlattenGradient: parameter '" + p.name + "' has no gradient, run a backward pass first");
        if (p.grad.n_elem != p.value.n_elem)
            throw FlattenMismatch("FlattenGradient: gradient of '" + p.name + "' does not match its value shape");
        flat.subvec(start, start + p.value.n_elem - 1) = arma::vectorise(p.grad);
        start += p.value.n_elem;
    }
    return flat;
}
