#pragma once

#include <expected>
#include <opencv2/core.hpp>

#include "Parameters.hpp"
#include "TransformTypes.hpp"
#include "core/Movie.hpp"
#include "core/ProcessError.hpp"
#include "estimate/CoreTypes.hpp"

namespace gatvst {

/**
 * @class ForwardGAT
 * @brief Generalized Anscombe transform for mixed Poisson-Gaussian noise.
 *
 * z = (2 / alpha) * sqrt(max(0, alpha * y + 3/8 * alpha^2 + sigma_sq -
 * alpha * mu))
 *
 * A negative radicand is clamped to 0, which biases the lowest intensities
 * upwards; the number of clamped pixels is logged. With alpha == 0 the
 * noise is purely Gaussian and the transform reduces to
 * z = (y - mu) / sqrt(sigma_sq).
 */
class ForwardGAT {
public:
  /**
   * @brief Transform a whole movie.
   * @param movie Raw movie
   * @param model Noise model, must satisfy NoiseModel::isValid()
   * @param params Offset mu and parallelism
   * @return The transformed movie, or INVALID_ARGUMENT before any pixel
   * is written
   */
  static std::expected<TransformedMovie, ProcessError>
  apply(const Movie &movie, const NoiseModel &model,
        const TransformParams &params = {});

  /**
   * @brief Transform one frame into dst.
   * @return Number of pixels whose radicand was clamped
   */
  static std::size_t applyFrame(const cv::Mat &src, cv::Mat &dst,
                                const NoiseModel &model, double mu);

  /**
   * @brief Scalar form of the transform.
   * @return z for y, or NaN when the model fails NoiseModel::isValid()
   */
  [[nodiscard]] static double value(double y, const NoiseModel &model,
                                    double mu = 0.0) noexcept;
};

/**
 * @brief forward_transform(movie, noise_model, mu)
 */
std::expected<TransformedMovie, ProcessError>
forwardTransform(const Movie &movie, const NoiseModel &model, double mu = 0.0);

std::expected<TransformedMovie, ProcessError>
forwardTransform(const Movie &movie, const NoiseModel &model,
                 const TransformParams &params);

} // namespace gatvst
