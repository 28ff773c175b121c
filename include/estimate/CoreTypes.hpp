#pragma once

#include <cmath>
#include <cstddef>
#include <opencv2/core.hpp>

namespace gatvst {

/**
 * @brief Square spatial region of a frame used as one statistics sample.
 */
struct Patch {
  int row = 0;  ///< Top row of the patch
  int col = 0;  ///< Left column of the patch
  int size = 0; ///< Side length in pixels

  [[nodiscard]] cv::Rect toRect() const noexcept {
    return cv::Rect(col, row, size, size);
  }

  bool operator==(const Patch &other) const noexcept = default;
};

/**
 * @brief Local mean and unbiased variance of one patch pooled over a
 * temporal subsample.
 */
struct StatsSample {
  double mean = 0.0;       ///< Pooled sample mean
  double variance = 0.0;   ///< Pooled unbiased sample variance
  std::size_t count = 0;   ///< Number of pixels pooled
  bool degenerate = false; ///< Variance too small to carry noise information
};

/**
 * @brief Fitted mixed Poisson-Gaussian noise model.
 *
 * variance = alpha * mean + sigma_sq, where alpha is the Poisson gain and
 * sigma_sq the Gaussian readout variance. Produced once per estimation run
 * and passed by value to the transforms.
 */
struct NoiseModel {
  double alpha = 1.0;    ///< Poisson gain
  double sigma_sq = 0.0; ///< Gaussian noise variance

  bool alpha_clamped = false;    ///< Fitted gain was negative and set to 0
  bool sigma_sq_clamped = false; ///< Fitted variance was negative and set to 0
  bool low_confidence = false;   ///< Any clamp happened

  std::size_t samples_total = 0;      ///< Patches sampled
  std::size_t samples_degenerate = 0; ///< Patches excluded as degenerate
  std::size_t samples_used = 0;       ///< Inliers of the final fit
  int iterations = 0;                 ///< Fit iterations performed
  double residual_scale = 0.0;        ///< Robust scale of the final residuals

  /**
   * @brief Check that the model can drive a transform.
   *
   * @return True if both parameters are finite and non-negative and at
   * least one of them is positive.
   */
  [[nodiscard]] bool isValid() const noexcept {
    return std::isfinite(alpha) && std::isfinite(sigma_sq) && alpha >= 0.0 &&
           sigma_sq >= 0.0 && (alpha > 0.0 || sigma_sq > 0.0);
  }
};

} // namespace gatvst
