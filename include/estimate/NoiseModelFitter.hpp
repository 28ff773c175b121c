#pragma once

#include <cstddef>
#include <expected>
#include <vector>

#include "CoreTypes.hpp"
#include "Parameters.hpp"
#include "core/ProcessError.hpp"

namespace gatvst {

/**
 * @brief Fits variance = alpha * mean + sigma_sq to patch statistics.
 */
class NoiseModelFitter {
public:
  /**
   * @brief Straight line fitted by least squares.
   */
  struct LineFit {
    double slope = 0.0;
    double intercept = 0.0;
    bool flat = false; ///< All abscissae equal, slope fixed at 0
  };

  /**
   * @brief Fit a noise model to a completed set of samples.
   *
   * Degenerate samples are dropped first. With ITERATIVE_OUTLIER_REJECTION
   * the line is refit on the samples whose residual lies within
   * rejection_threshold robust standard deviations until the inlier set is
   * stable. A negative gain is clamped to 0 (sigma_sq then becomes the mean
   * inlier variance) and a negative sigma_sq is clamped to 0; both mark the
   * model low-confidence.
   *
   * @param samples Statistics of every sampled patch
   * @param params Estimation parameters (min_valid_samples, gaussian_mean,
   * fit)
   * @return The model, INSUFFICIENT_SAMPLES if fewer than min_valid_samples
   * samples are usable, or INVALID_ARGUMENT for bad parameters
   */
  static std::expected<NoiseModel, ProcessError>
  fit(const std::vector<StatsSample> &samples, const EstimationParams &params);

  /**
   * @brief Ordinary least squares over the given sample indices.
   */
  static LineFit leastSquares(const std::vector<StatsSample> &samples,
                              const std::vector<std::size_t> &indices);

private:
  static double median(std::vector<double> values);
};

} // namespace gatvst
