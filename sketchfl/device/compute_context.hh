#ifndef SKETCHFL_DEVICE_COMPUTE_CONTEXT_HH
#define SKETCHFL_DEVICE_COMPUTE_CONTEXT_HH

#include <string>
#include <mlpack/core.hpp>

namespace sketchfl {

    namespace device {

        using std::string;

        // A simulated processing unit on which matrices reside ("cpu", "cuda:0", "cuda:1", ...).
        // Operations require their operands to live on the same context.
        class ComputeContext {

        public:
            // The host context.
            ComputeContext();

            // A "cpu" kind always yields the host, whatever the index.
            ComputeContext(string kind, int index);

            // Parses "cpu" or "<kind>:<index>". Throws ConfigError on malformed names and on "cpu:<index>".
            static ComputeContext Parse(const string &name);

            const string &Kind() const;

            int Index() const;

            string Name() const;

            bool IsHost() const;

            bool operator==(const ComputeContext &other) const;

            bool operator!=(const ComputeContext &other) const;

        private:
            string kind;                    // "cpu", "cuda", ...
            int index;                      // Device ordinal, -1 for the host
        };

        // A matrix tagged with the context it resides on.
        // Copies stay on the same context; moving to another context is explicit through To().
        class DeviceMatrix {

        public:
            DeviceMatrix();

            DeviceMatrix(arma::mat data, ComputeContext ctx);

            // Returns a copy of this matrix resident on ctx.
            DeviceMatrix To(const ComputeContext &ctx) const;

            const arma::mat &Data() const;

            arma::mat &Data();

            const ComputeContext &Context() const;

            size_t Rows() const;

            size_t Cols() const;

            size_t NumElements() const;

            bool Empty() const;

        private:
            arma::mat data;
            ComputeContext context;
        };

        // Throws PlacementError when a and b do not share a context.
        void RequireColocated(const DeviceMatrix &a, const DeviceMatrix &b, const string &operation);

        // a + b, both on the same context.
        DeviceMatrix Add(const DeviceMatrix &a, const DeviceMatrix &b);

        // y += alpha * x, both on the same context.
        void Axpy(double alpha, const DeviceMatrix &x, DeviceMatrix &y);

    } // end namespace device
} // end namespace sketchfl

#endif //SKETCHFL_DEVICE_COMPUTE_CONTEXT_HH
