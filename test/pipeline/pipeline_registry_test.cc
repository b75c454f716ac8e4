#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "absl/strings/numbers.h"

#include "pipeline/element_util.h"
#include "pipeline/pipeline.h"
#include "pipeline/pipeline_registry.h"

using namespace Snapstream;
using ::testing::ElementsAre;

namespace {

// Squares of 0..n-1, n taken from the config bytes.
class SquaresSource : public IndexedSource {
public:
    explicit SquaresSource(int64_t n) : n_(n) {}

    int64_t size() const override { return n_; }

    snapshot_protocol::ElementSpec element_spec() const override {
        snapshot_protocol::ElementSpec spec;
        spec.add_component_types(snapshot_protocol::DT_INT64);
        return spec;
    }

    absl::Status Get(int64_t i, snapshot_protocol::Element* element) const override {
        element->add_components()->set_int64_value(i * i);
        return absl::OkStatus();
    }

private:
    int64_t n_;
};

absl::StatusOr<std::unique_ptr<IndexedSource>> MakeSquares(const std::string& config) {
    int64_t n = 0;
    if (!absl::SimpleAtoi(config, &n) || n < 0) {
        return absl::InvalidArgumentError("squares: config must be a non-negative count");
    }
    return std::unique_ptr<IndexedSource>(new SquaresSource(n));
}

snapshot_protocol::PipelineDescriptor Custom(const std::string& name, const std::string& config) {
    snapshot_protocol::PipelineDescriptor descriptor;
    descriptor.mutable_custom()->set_name(name);
    descriptor.mutable_custom()->set_config(config);
    return descriptor;
}

} // namespace

class PipelineRegistryTest : public ::testing::Test {
protected:
    PipelineRegistry registry_;
};

TEST_F(PipelineRegistryTest, CustomSourceRunsThroughTransforms) {
    ASSERT_TRUE(registry_.Register("squares", MakeSquares).ok());
    auto descriptor = Custom("squares", "4");
    descriptor.set_num_splits(2);
    descriptor.set_repetitions(2);

    auto pipeline = BuildPipeline(descriptor, &registry_);
    ASSERT_TRUE(pipeline.ok()) << pipeline.status();
    std::vector<snapshot_protocol::Element> out;
    ASSERT_TRUE(RunPipeline(**pipeline, &out).ok());
    EXPECT_THAT(Int64Values(out), ElementsAre(0, 1, 4, 9, 0, 1, 4, 9));
}

TEST_F(PipelineRegistryTest, UnknownNameIsNotFound) {
    EXPECT_TRUE(absl::IsNotFound(BuildPipeline(Custom("cubes", "3"), &registry_).status()));
}

TEST_F(PipelineRegistryTest, FactoryErrorsPropagate) {
    ASSERT_TRUE(registry_.Register("squares", MakeSquares).ok());
    EXPECT_TRUE(absl::IsInvalidArgument(BuildPipeline(Custom("squares", "many"), &registry_).status()));
}

TEST_F(PipelineRegistryTest, NamesAreUnique) {
    ASSERT_TRUE(registry_.Register("squares", MakeSquares).ok());
    EXPECT_TRUE(absl::IsAlreadyExists(registry_.Register("squares", MakeSquares)));
    ASSERT_TRUE(registry_.Register("more_squares", MakeSquares).ok());
    EXPECT_THAT(registry_.RegisteredNames(), ElementsAre("more_squares", "squares"));

    registry_.Unregister("squares");
    EXPECT_THAT(registry_.RegisteredNames(), ElementsAre("more_squares"));
    EXPECT_TRUE(registry_.Register("squares", MakeSquares).ok());
}

TEST_F(PipelineRegistryTest, BuiltinsNeedNoRegistration) {
    snapshot_protocol::PipelineDescriptor descriptor;
    descriptor.mutable_range()->set_stop(3);
    EXPECT_TRUE(BuildPipeline(descriptor, &registry_).ok());
}
