#pragma once

#include <cstddef>

namespace gatvst {

/**
 * @brief Regression used to fit variance against mean.
 */
enum class FitMethod {
  ORDINARY_LEAST_SQUARES,     ///< Plain OLS over every valid sample
  ITERATIVE_OUTLIER_REJECTION ///< OLS refit after MAD-based residual clipping
};

/**
 * @brief Parameters of the variance/mean regression.
 */
struct FitParams {
  FitMethod method = FitMethod::ITERATIVE_OUTLIER_REJECTION;
  double rejection_threshold = 3.0; ///< Reject |residual| > k * robust scale
  int max_iterations = 10;          ///< Upper bound on refits

  [[nodiscard]] bool isValid() const noexcept {
    return rejection_threshold > 0.0 && max_iterations > 0;
  }
};

/**
 * @brief Parameters of a noise model estimation run.
 */
struct EstimationParams {
  int patch_size = 8;                ///< Patch side length in pixels
  int spatial_stride = 8;            ///< Distance between patch origins
  int temporal_stride = 1;           ///< Use frames 0, T, 2T, ...
  std::size_t min_valid_samples = 8; ///< Minimum inliers for a fit
  double degenerate_variance = 1e-10; ///< Variance at or below is degenerate
  double gaussian_mean = 0.0; ///< Known mean of the Gaussian component
  FitParams fit;
  bool parallel_execution = true; ///< Compute patches with TBB
  int thread_count = 0;           ///< Worker cap (0 means TBB default)

  [[nodiscard]] bool isValid() const noexcept {
    return patch_size > 0 && spatial_stride > 0 && temporal_stride > 0 &&
           min_valid_samples >= 2 && degenerate_variance >= 0.0 &&
           thread_count >= 0 && fit.isValid();
  }
};

} // namespace gatvst
