#include "transform/ExactInverseTable.hpp"
#include "Logging.hpp"
#include "core/ProcessingUtils.hpp"
#include <algorithm>
#include <cmath>
#include <fmt/format.h>

namespace gatvst {

namespace {
constexpr double kThreeEighths = 0.375;
// Poisson terms further than this many standard deviations (plus a fixed
// margin for small counts) from lambda are negligible.
constexpr double kPoissonSpan = 8.0;
constexpr double kPoissonMargin = 10.0;
// Gaussian quadrature covers +/- this many standard deviations.
constexpr double kGaussianSpan = 6.0;
} // namespace

double ExactInverseTable::closedFormInverse(double d, double s) noexcept {
  // Below 2*sqrt(3/8) the series terms in 1/D diverge; such values come
  // from zero counts.
  if (!(d >= 2.0 * std::sqrt(kThreeEighths))) {
    return 0.0;
  }
  const double k = std::sqrt(1.5);
  const double inv = 1.0 / d;
  const double y = 0.25 * d * d + 0.25 * k * inv - 1.375 * inv * inv +
                   0.625 * k * inv * inv * inv - 0.125 - s;
  return std::max(0.0, y);
}

std::expected<ExactInverseTable, ProcessError>
ExactInverseTable::build(double s, const TransformParams &params) {
  const auto &logger = Logger::getInstance();

  if (!std::isfinite(s) || s < 0.0) {
    logger->error("Invalid normalized variance: {}", s);
    return std::unexpected(ProcessError{
        ProcessError::Code::INVALID_ARGUMENT,
        fmt::format("Normalized Gaussian variance must be >= 0, got {}", s)});
  }
  if (!params.isValid()) {
    logger->error("Invalid table parameters: size={}, max={}, nodes={}",
                  params.table_size, params.table_max_intensity,
                  params.quadrature_nodes);
    return std::unexpected(ProcessError{
        ProcessError::Code::INVALID_ARGUMENT,
        fmt::format("Invalid lookup table parameters: size {}, max intensity "
                    "{}, quadrature nodes {}",
                    params.table_size, params.table_max_intensity,
                    params.quadrature_nodes)});
  }

  ProcUtils::ScopedTimer timer("Exact inverse table");

  ExactInverseTable table;
  table.m_s = s;

  const double lambdaMax = params.table_max_intensity;
  const int maxCount = static_cast<int>(std::ceil(
      lambdaMax + kPoissonSpan * std::sqrt(lambdaMax) + kPoissonMargin));

  // Gaussian quadrature of f at each integer photon count.
  if (s > 0.0) {
    const int n = params.quadrature_nodes;
    const double sigma = std::sqrt(s);
    double total = 0.0;
    for (int q = 0; q < n; ++q) {
      const double u = -kGaussianSpan + 2.0 * kGaussianSpan * q / (n - 1);
      table.m_nodes.push_back(sigma * u);
      table.m_weights.push_back(std::exp(-0.5 * u * u));
      total += table.m_weights.back();
    }
    for (auto &w : table.m_weights) {
      w /= total;
    }
  } else {
    table.m_nodes.push_back(0.0);
    table.m_weights.push_back(1.0);
  }

  table.m_transformed.resize(static_cast<std::size_t>(maxCount) + 1);
  for (int k = 0; k <= maxCount; ++k) {
    table.m_transformed[k] = table.quadrature(k);
  }

  const int size = params.table_size;
  table.m_lambda.resize(size);
  table.m_expectation.resize(size);
  ProcUtils::parallelRange(0, size, params.parallel_execution,
                           params.thread_count, [&](int begin, int end) {
                             for (int i = begin; i < end; ++i) {
                               const double x =
                                   static_cast<double>(i) / (size - 1);
                               table.m_lambda[i] = lambdaMax * x * x;
                               table.m_expectation[i] =
                                   table.expectation(table.m_lambda[i]);
                             }
                           });

  logger->debug("Exact inverse table: {} nodes over [0, {}], s={:.6g}, "
                "E[f] in [{:.6g}, {:.6g}]",
                size, lambdaMax, s, table.m_expectation.front(),
                table.m_expectation.back());
  return table;
}

double ExactInverseTable::quadrature(int k) const noexcept {
  double e = 0.0;
  for (std::size_t q = 0; q < m_nodes.size(); ++q) {
    const double radicand = k + m_nodes[q] + kThreeEighths + m_s;
    e += m_weights[q] * 2.0 * std::sqrt(std::max(0.0, radicand));
  }
  return e;
}

double ExactInverseTable::transformedAt(int k) const noexcept {
  if (k < static_cast<int>(m_transformed.size())) {
    return m_transformed[k];
  }
  return quadrature(k);
}

double ExactInverseTable::expectation(double lambda) const noexcept {
  if (m_transformed.empty() || !std::isfinite(lambda)) {
    return 0.0;
  }
  if (lambda <= 0.0) {
    return m_transformed.front();
  }

  // Counts past the precomputed range are evaluated on demand.
  const double span = kPoissonSpan * std::sqrt(lambda) + kPoissonMargin;
  const int lo = std::max(0, static_cast<int>(std::floor(lambda - span)));
  const int hi = static_cast<int>(std::ceil(lambda + span));

  const double logLambda = std::log(lambda);
  double sum = 0.0;
  double mass = 0.0;
  for (int k = lo; k <= hi; ++k) {
    const double p = std::exp(k * logLambda - lambda - std::lgamma(k + 1.0));
    sum += p * transformedAt(k);
    mass += p;
  }
  return mass > 0.0 ? sum / mass : m_transformed.front();
}

double ExactInverseTable::invert(double d) const noexcept {
  if (m_expectation.empty() || !(d > m_expectation.front())) {
    return 0.0;
  }
  if (d >= m_expectation.back()) {
    return closedFormInverse(d, m_s);
  }

  const auto it =
      std::upper_bound(m_expectation.begin(), m_expectation.end(), d);
  const auto hi = static_cast<std::size_t>(it - m_expectation.begin());
  const auto lo = hi - 1;
  const double t = (d - m_expectation[lo]) /
                   (m_expectation[hi] - m_expectation[lo]);
  return m_lambda[lo] + t * (m_lambda[hi] - m_lambda[lo]);
}

} // namespace gatvst
