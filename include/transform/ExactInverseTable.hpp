#pragma once

#include <expected>
#include <vector>

#include "Parameters.hpp"
#include "core/ProcessError.hpp"

namespace gatvst {

/**
 * @class ExactInverseTable
 * @brief Tabulated exact unbiased inverse of the unit-gain GAT.
 *
 * Works on the normalized model y_n = p + n with p ~ Poisson(lambda) and
 * n ~ N(0, s), s = sigma_sq / alpha^2, and the transform
 * f(y_n) = 2 * sqrt(max(0, y_n + 3/8 + s)). The table holds E[f | lambda]
 * on a grid of lambda values; since the expectation is strictly increasing
 * in lambda, a transformed value is inverted by binary search and linear
 * interpolation.
 */
class ExactInverseTable {
public:
  /**
   * @brief Tabulate E[f | lambda] for a normalized Gaussian variance s.
   *
   * Grid nodes are spaced quadratically so the low-count region, where
   * the expectation bends most, is sampled densely.
   *
   * @param s Normalized Gaussian variance sigma_sq / alpha^2 (>= 0)
   * @param params table_size, table_max_intensity, quadrature_nodes and
   * parallelism
   * @return The table, or INVALID_ARGUMENT for bad parameters
   */
  static std::expected<ExactInverseTable, ProcessError>
  build(double s, const TransformParams &params);

  /**
   * @brief Unbiased photon count for a transformed value D.
   *
   * Below the table the result is 0; above it the closed-form asymptotic
   * inverse takes over.
   */
  [[nodiscard]] double invert(double d) const noexcept;

  /**
   * @brief E[f | lambda] by direct evaluation of the Poisson series.
   *
   * Valid for any finite lambda >= 0, including intensities above the
   * tabulated range.
   */
  [[nodiscard]] double expectation(double lambda) const noexcept;

  [[nodiscard]] const std::vector<double> &intensities() const noexcept {
    return m_lambda;
  }
  [[nodiscard]] const std::vector<double> &expectations() const noexcept {
    return m_expectation;
  }
  [[nodiscard]] double normalizedVariance() const noexcept { return m_s; }

  /**
   * @brief Closed-form approximation of the exact unbiased inverse in
   * normalized units (Makitalo and Foi, 2013), clamped at 0.
   */
  [[nodiscard]] static double closedFormInverse(double d, double s) noexcept;

private:
  ExactInverseTable() = default;

  /// Gaussian expectation of f at photon count k.
  double quadrature(int k) const noexcept;
  double transformedAt(int k) const noexcept;

  double m_s = 0.0;
  std::vector<double> m_nodes;   ///< Gaussian quadrature abscissae
  std::vector<double> m_weights; ///< Normalized quadrature weights
  std::vector<double> m_transformed; ///< f at counts 0..maxCount
  std::vector<double> m_lambda;
  std::vector<double> m_expectation;
};

} // namespace gatvst
