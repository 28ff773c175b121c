#include "transform/InverseAlgorithm.hpp"
#include <cmath>

namespace gatvst {

// InverseAlgorithm
InverseAlgorithm::InverseAlgorithm(const NoiseModel &model, double mu)
    : m_model(model), m_mu(mu) {}

double InverseAlgorithm::normalizedVariance() const noexcept {
  return m_model.sigma_sq / (m_model.alpha * m_model.alpha);
}

void InverseAlgorithm::processFrame(const cv::Mat &src, cv::Mat &dst) const {
  dst.create(src.size(), CV_64FC1);
  for (int r = 0; r < src.rows; ++r) {
    const double *in = src.ptr<double>(r);
    double *out = dst.ptr<double>(r);
    for (int c = 0; c < src.cols; ++c) {
      out[c] = invert(in[c]);
    }
  }
}

// AlgebraicInverse
AlgebraicInverse::AlgebraicInverse(const NoiseModel &model, double mu)
    : InverseAlgorithm(model, mu) {}

double AlgebraicInverse::invert(double z) const noexcept {
  const double alpha = m_model.alpha;
  return 0.25 * alpha * z * z - 0.375 * alpha - m_model.sigma_sq / alpha +
         m_mu;
}

void AlgebraicInverse::processFrame(const cv::Mat &src, cv::Mat &dst) const {
  const double alpha = m_model.alpha;
  cv::multiply(src, src, dst, 0.25 * alpha, CV_64F);
  dst += -0.375 * alpha - m_model.sigma_sq / alpha + m_mu;
}

// AsymptoticUnbiasedInverse
AsymptoticUnbiasedInverse::AsymptoticUnbiasedInverse(const NoiseModel &model,
                                                     double mu)
    : InverseAlgorithm(model, mu) {}

double AsymptoticUnbiasedInverse::invert(double z) const noexcept {
  return denormalize(
      ExactInverseTable::closedFormInverse(z, normalizedVariance()));
}

// ExactUnbiasedInverse
ExactUnbiasedInverse::ExactUnbiasedInverse(const NoiseModel &model, double mu,
                                           ExactInverseTable table)
    : InverseAlgorithm(model, mu), m_table(std::move(table)) {}

double ExactUnbiasedInverse::invert(double z) const noexcept {
  return denormalize(m_table.invert(z));
}

// GaussianInverse
GaussianInverse::GaussianInverse(const NoiseModel &model, double mu,
                                 InverseMethod requested)
    : InverseAlgorithm(model, mu), m_requested(requested) {}

double GaussianInverse::invert(double z) const noexcept {
  return std::sqrt(m_model.sigma_sq) * z + m_mu;
}

void GaussianInverse::processFrame(const cv::Mat &src, cv::Mat &dst) const {
  src.convertTo(dst, CV_64F, std::sqrt(m_model.sigma_sq), m_mu);
}

} // namespace gatvst
