#include <gtest/gtest.h>

#include "combiner.hpp"
#include "errors.hpp"
#include "hash_projector.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <string>
#include <vector>

class CombinerTest : public ::testing::Test {
protected:
    std::vector<float> a = normalize({1.0f, 2.0f, 0.0f, 0.0f, 3.0f});
    std::vector<float> b = normalize({0.0f, 1.0f, 4.0f, 1.0f, 0.0f});
    std::vector<float> c = normalize({2.0f, 0.0f, 0.0f, 5.0f, 1.0f});

    static void expect_near(const std::vector<float>& x, const std::vector<float>& y) {
        ASSERT_EQ(x.size(), y.size());
        for (size_t i = 0; i < x.size(); ++i) {
            EXPECT_NEAR(x[i], y[i], 1e-6) << "at " << i;
        }
    }
};

TEST_F(CombinerTest, SingleWeightedGeneratorReproducesItsOutput) {
    expect_near(combine({{a, 1.0f}, {b, 0.0f}, {c, 0.0f}}), a);
    expect_near(combine({{a, 0.0f}, {b, 0.0f}, {c, 1.0f}}), c);
}

TEST_F(CombinerTest, ResultIsUnitLength) {
    EXPECT_NEAR(magnitude(combine({{a, 0.3f}, {b, 1.2f}, {c, 0.7f}})), 1.0f, 1e-6);
}

TEST_F(CombinerTest, InvariantToGlobalRescaling) {
    expect_near(combine({{a, 1.0f}, {b, 2.0f}, {c, 0.5f}}),
                combine({{a, 4.0f}, {b, 8.0f}, {c, 2.0f}}));
}

TEST_F(CombinerTest, SensitiveToRelativeReweighting) {
    std::vector<float> x = combine({{a, 1.0f}, {b, 2.0f}});
    std::vector<float> y = combine({{a, 2.0f}, {b, 1.0f}});

    float max_diff = 0.0f;
    for (size_t i = 0; i < x.size(); ++i) {
        max_diff = std::max(max_diff, std::fabs(x[i] - y[i]));
    }
    EXPECT_GT(max_diff, 1e-2f);
}

TEST_F(CombinerTest, AllZeroWeightsGiveZeroVector) {
    std::vector<float> out = combine({{a, 0.0f}, {b, 0.0f}});
    EXPECT_EQ(out, std::vector<float>(a.size(), 0.0f));
}

TEST_F(CombinerTest, UnequalLengthsThrow) {
    EXPECT_THROW(combine({{a, 1.0f}, {std::vector<float>(3, 1.0f), 1.0f}}), DimensionMismatchError);
    EXPECT_THROW(combine(std::vector<WeightedVector>{}), DimensionMismatchError);
}

TEST_F(CombinerTest, NamedGeneratorsDefaultToZeroWeight) {
    std::map<std::string, std::vector<float>> outputs = {{"enhanced", a}, {"primary_key_aware", b}};
    expect_near(combine(outputs, {{"enhanced", 2.0f}}), a);
}

TEST_F(CombinerTest, NamedWeightWithoutOutputThrows) {
    std::map<std::string, std::vector<float>> outputs = {{"enhanced", a}};
    EXPECT_THROW(combine(outputs, {{"enhanced", 1.0f}, {"learned", 0.5f}}), ConfigurationError);
    EXPECT_NO_THROW(combine(outputs, {{"enhanced", 1.0f}, {"learned", 0.0f}}));
}

TEST_F(CombinerTest, NamedOutputsMustShareLength) {
    std::map<std::string, std::vector<float>> outputs = {{"enhanced", a}, {"learned", {1.0f}}};
    EXPECT_THROW(combine(outputs, {{"enhanced", 1.0f}}), DimensionMismatchError);
}
