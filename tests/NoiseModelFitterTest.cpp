#include "estimate/NoiseModelFitter.hpp"

#include <cmath>
#include <gtest/gtest.h>
#include <vector>

namespace gatvst {
namespace {

StatsSample sample(double mean, double variance) {
  return StatsSample{mean, variance, 64, false};
}

// variance = slope * mean + intercept for mean = first..last
std::vector<StatsSample> line(double slope, double intercept, int first,
                              int last) {
  std::vector<StatsSample> samples;
  for (int m = first; m <= last; ++m) {
    samples.push_back(sample(m, slope * m + intercept));
  }
  return samples;
}

TEST(NoiseModelFitterTest, RecoversExactLine) {
  auto model = NoiseModelFitter::fit(line(2.0, 5.0, 1, 20), {});
  ASSERT_TRUE(model.has_value());
  EXPECT_NEAR(model->alpha, 2.0, 1e-9);
  EXPECT_NEAR(model->sigma_sq, 5.0, 1e-9);
  EXPECT_EQ(model->samples_total, 20u);
  EXPECT_EQ(model->samples_used, 20u);
  EXPECT_FALSE(model->low_confidence);
  EXPECT_FALSE(model->alpha_clamped);
  EXPECT_FALSE(model->sigma_sq_clamped);
}

TEST(NoiseModelFitterTest, RejectsOutliers) {
  auto samples = line(2.0, 5.0, 1, 20);
  for (int m : {5, 10, 15}) {
    samples.push_back(sample(m, 2.0 * m + 5.0 + 1000.0));
  }

  auto robust = NoiseModelFitter::fit(samples, {});
  ASSERT_TRUE(robust.has_value());
  EXPECT_NEAR(robust->alpha, 2.0, 1e-6);
  EXPECT_NEAR(robust->sigma_sq, 5.0, 1e-6);
  EXPECT_EQ(robust->samples_used, 20u);
  EXPECT_GT(robust->iterations, 1);

  EstimationParams ols;
  ols.fit.method = FitMethod::ORDINARY_LEAST_SQUARES;
  auto plain = NoiseModelFitter::fit(samples, ols);
  ASSERT_TRUE(plain.has_value());
  EXPECT_EQ(plain->samples_used, 23u);
  EXPECT_GT(std::abs(plain->sigma_sq - 5.0), 100.0);
}

TEST(NoiseModelFitterTest, IgnoresDegenerateSamples) {
  auto samples = line(1.5, 12.0, 10, 30);
  samples.push_back(StatsSample{4095.0, 0.0, 64, true});
  samples.push_back(StatsSample{0.0, 1e6, 64, true});

  auto model = NoiseModelFitter::fit(samples, {});
  ASSERT_TRUE(model.has_value());
  EXPECT_NEAR(model->alpha, 1.5, 1e-9);
  EXPECT_NEAR(model->sigma_sq, 12.0, 1e-9);
  EXPECT_EQ(model->samples_total, 23u);
  EXPECT_EQ(model->samples_degenerate, 2u);
  EXPECT_EQ(model->samples_used, 21u);
}

TEST(NoiseModelFitterTest, FailsWithTooFewSamples) {
  auto samples = line(2.0, 5.0, 1, 5);
  samples.push_back(StatsSample{7.0, 0.0, 64, true});
  samples.push_back(StatsSample{8.0, 0.0, 64, true});
  samples.push_back(StatsSample{9.0, 0.0, 64, true});

  auto model = NoiseModelFitter::fit(samples, {});
  ASSERT_FALSE(model.has_value());
  EXPECT_EQ(model.error().code, ProcessError::Code::INSUFFICIENT_SAMPLES);

  auto none = NoiseModelFitter::fit({}, {});
  ASSERT_FALSE(none.has_value());
  EXPECT_EQ(none.error().code, ProcessError::Code::INSUFFICIENT_SAMPLES);
}

TEST(NoiseModelFitterTest, ClampsNegativeGain) {
  auto model = NoiseModelFitter::fit(line(-2.0, 100.0, 1, 20), {});
  ASSERT_TRUE(model.has_value());
  EXPECT_EQ(model->alpha, 0.0);
  EXPECT_TRUE(model->alpha_clamped);
  EXPECT_TRUE(model->low_confidence);
  // Mean variance of 100 - 2m over m = 1..20
  EXPECT_NEAR(model->sigma_sq, 79.0, 1e-9);
  EXPECT_TRUE(model->isValid());
}

TEST(NoiseModelFitterTest, ClampsNegativeGaussianVariance) {
  auto model = NoiseModelFitter::fit(line(2.0, -50.0, 30, 60), {});
  ASSERT_TRUE(model.has_value());
  EXPECT_NEAR(model->alpha, 2.0, 1e-9);
  EXPECT_EQ(model->sigma_sq, 0.0);
  EXPECT_TRUE(model->sigma_sq_clamped);
  EXPECT_FALSE(model->alpha_clamped);
  EXPECT_TRUE(model->low_confidence);
}

TEST(NoiseModelFitterTest, SingleMeanIsLowConfidence) {
  std::vector<StatsSample> samples;
  for (int i = 0; i < 20; ++i) {
    samples.push_back(sample(50.0, 20.0 + i % 5));
  }

  auto model = NoiseModelFitter::fit(samples, {});
  ASSERT_TRUE(model.has_value());
  EXPECT_EQ(model->alpha, 0.0);
  EXPECT_NEAR(model->sigma_sq, 22.0, 1e-9);
  EXPECT_TRUE(model->low_confidence);
}

TEST(NoiseModelFitterTest, KnownGaussianMeanShiftsIntercept) {
  // variance = 2 * (mean - 10) + 30, i.e. sigma_sq = 30 around mu = 10
  EstimationParams params;
  params.gaussian_mean = 10.0;
  auto model = NoiseModelFitter::fit(line(2.0, 10.0, 15, 40), params);
  ASSERT_TRUE(model.has_value());
  EXPECT_NEAR(model->alpha, 2.0, 1e-9);
  EXPECT_NEAR(model->sigma_sq, 30.0, 1e-9);
}

TEST(NoiseModelFitterTest, RejectsInvalidParameters) {
  const auto samples = line(2.0, 5.0, 1, 20);

  EstimationParams threshold;
  threshold.fit.rejection_threshold = 0.0;
  EstimationParams iterations;
  iterations.fit.max_iterations = 0;
  EstimationParams minimum;
  minimum.min_valid_samples = 1;

  for (const auto &params : {threshold, iterations, minimum}) {
    auto model = NoiseModelFitter::fit(samples, params);
    ASSERT_FALSE(model.has_value());
    EXPECT_EQ(model.error().code, ProcessError::Code::INVALID_ARGUMENT);
  }
}

} // namespace
} // namespace gatvst
