#include <utility>
#include "sketchfl/device/compute_context.hh"
#include "sketchfl/common/errors.hh"

using namespace sketchfl;
using namespace sketchfl::device;


/*********************************************
	Compute Context
*********************************************/
ComputeContext::ComputeContext() : kind("cpu"), index(-1) {}

ComputeContext::ComputeContext(string kind, int index) : kind(std::move(kind)), index(index) {
    // There is a single host.
    if (IsHost())
        this->index = -1;
}

ComputeContext ComputeContext::Parse(const string &name) {

    if (name == "cpu")
        return ComputeContext();

    size_t colon = name.find(':');
    if (colon == string::npos || colon == 0 || colon + 1 == name.size())
        throw ConfigError("Malformed compute context '" + name + "', expected 'cpu' or '<kind>:<index>'");

    if (name.compare(0, colon, "cpu") == 0)
        throw ConfigError("Malformed compute context '" + name + "', the host takes no device ordinal");

    int ordinal;
    try {
        size_t used = 0;
        ordinal = std::stoi(name.substr(colon + 1), &used);
        if (used != name.size() - colon - 1 || ordinal < 0)
            throw ConfigError("Malformed device ordinal in '" + name + "'");
    } catch (const std::logic_error &) {
        throw ConfigError("Malformed device ordinal in '" + name + "'");
    }

    return ComputeContext(name.substr(0, colon), ordinal);
}

const string &ComputeContext::Kind() const { return kind; }

int ComputeContext::Index() const { return index; }

string ComputeContext::Name() const { return IsHost() ? kind : kind + ":" + std::to_string(index); }

bool ComputeContext::IsHost() const { return kind == "cpu"; }

bool ComputeContext::operator==(const ComputeContext &other) const {
    return kind == other.kind && index == other.index;
}

bool ComputeContext::operator!=(const ComputeContext &other) const { return !(*this == other); }


/*********************************************
	Device Matrix
*********************************************/
DeviceMatrix::DeviceMatrix() = default;

DeviceMatrix::DeviceMatrix(arma::mat data, ComputeContext ctx) : data(std::move(data)), context(std::move(ctx)) {}

DeviceMatrix DeviceMatrix::To(const ComputeContext &ctx) const { return DeviceMatrix(data, ctx); }

const arma::mat &DeviceMatrix::Data() const { return data; }

arma::mat &DeviceMatrix::Data() { return data; }

const ComputeContext &DeviceMatrix::Context() const { return context; }

size_t DeviceMatrix::Rows() const { return data.n_rows; }

size_t DeviceMatrix::Cols() const { return data.n_cols; }

size_t DeviceMatrix::NumElements() const { return data.n_elem; }

bool DeviceMatrix::Empty() const { return data.is_empty(); }


/*********************************************
	Colocated arithmetic
*********************************************/
void sketchfl::device::RequireColocated(const DeviceMatrix &a, const DeviceMatrix &b, const string &operation) {
    if (a.Context() != b.Context())
        throw PlacementError(operation + ": operands live on " + a.Context().Name() + " and " +
                             b.Context().Name() + "; migrate one of them first");
}

DeviceMatrix sketchfl::device::Add(const DeviceMatrix &a, const DeviceMatrix &b) {
    RequireColocated(a, b, "Add");
    return DeviceMatrix(a.Data() + b.Data(), a.Context());
}

void sketchfl::device::Axpy(double alpha, const DeviceMatrix &x, DeviceMatrix &y) {
    RequireColocated(x, y, "Axpy");
    y.Data() += alpha * x.Data();
}
