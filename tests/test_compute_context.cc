#include <gtest/gtest.h>
#include "sketchfl/common/errors.hh"
#include "sketchfl/device/compute_context.hh"

using namespace sketchfl;
using namespace sketchfl::device;

class ComputeContextTest : public ::testing::Test {
protected:
    void SetUp() override {
        values = arma::mat(3, 1);
        values(0, 0) = 1.0;
        values(1, 0) = -2.0;
        values(2, 0) = 0.5;
    }

    arma::mat values;
};

TEST_F(ComputeContextTest, HostHasASingleIdentity) {
    ComputeContext host = ComputeContext::Parse("cpu");
    EXPECT_TRUE(host.IsHost());
    EXPECT_EQ(host, ComputeContext());
    EXPECT_EQ(host.Index(), -1);
    EXPECT_EQ(host.Name(), "cpu");

    EXPECT_EQ(ComputeContext("cpu", 0), ComputeContext());
    EXPECT_EQ(ComputeContext("cpu", 3).Index(), -1);
}

TEST_F(ComputeContextTest, HostOrdinalIsRejected) {
    EXPECT_THROW(ComputeContext::Parse("cpu:0"), ConfigError);
    EXPECT_THROW(ComputeContext::Parse("cpu:1"), ConfigError);
}

TEST_F(ComputeContextTest, DeviceNamesRoundTrip) {
    ComputeContext gpu = ComputeContext::Parse("cuda:1");
    EXPECT_FALSE(gpu.IsHost());
    EXPECT_EQ(gpu.Kind(), "cuda");
    EXPECT_EQ(gpu.Index(), 1);
    EXPECT_EQ(gpu.Name(), "cuda:1");
    EXPECT_NE(gpu, ComputeContext::Parse("cuda:0"));
    EXPECT_NE(gpu, ComputeContext());
}

TEST_F(ComputeContextTest, MalformedNamesAreRejected) {
    for (const char *name : {"cuda", "cuda:", ":1", "cuda:x", "cuda:-1", "cuda:1x", ""})
        EXPECT_THROW(ComputeContext::Parse(name), ConfigError) << name;
}

TEST_F(ComputeContextTest, ArithmeticNeedsColocatedOperands) {
    DeviceMatrix onHost(values, ComputeContext());
    DeviceMatrix onGpu(values, ComputeContext::Parse("cuda:0"));

    EXPECT_THROW(Add(onHost, onGpu), PlacementError);
    EXPECT_THROW(Axpy(1.0, onGpu, onHost), PlacementError);

    DeviceMatrix migrated = onGpu.To(ComputeContext());
    EXPECT_EQ(migrated.Context(), ComputeContext());
    EXPECT_EQ(onGpu.Context().Name(), "cuda:0");

    Axpy(-2.0, migrated, onHost);
    EXPECT_TRUE(arma::approx_equal(onHost.Data(), -values, "absdiff", 1e-15));

    DeviceMatrix sum = Add(onHost, migrated);
    EXPECT_TRUE(arma::approx_equal(sum.Data(), arma::mat(3, 1, arma::fill::zeros), "absdiff", 1e-15));
}
