#ifndef GATVST_INVERSEALGORITHM_HPP
#define GATVST_INVERSEALGORITHM_HPP

#include <opencv2/core.hpp>

#include "Enums.hpp"
#include "ExactInverseTable.hpp"
#include "estimate/CoreTypes.hpp"

namespace gatvst {

// Base class of all inverse transforms. Instances are immutable once built
// and may be shared between threads.
class InverseAlgorithm {
public:
  InverseAlgorithm(const NoiseModel &model, double mu);
  virtual ~InverseAlgorithm() = default;

  virtual InverseMethod method() const noexcept = 0;

  // Intensity estimate for one transformed value
  virtual double invert(double z) const noexcept = 0;

  virtual void processFrame(const cv::Mat &src, cv::Mat &dst) const;

protected:
  // Normalized photon count back to the intensity scale
  double denormalize(double lambda) const noexcept {
    return m_model.alpha * lambda + m_mu;
  }
  double normalizedVariance() const noexcept;

  NoiseModel m_model;
  double m_mu;
};

class AlgebraicInverse : public InverseAlgorithm {
public:
  AlgebraicInverse(const NoiseModel &model, double mu);
  InverseMethod method() const noexcept override {
    return InverseMethod::Algebraic;
  }
  double invert(double z) const noexcept override;
  void processFrame(const cv::Mat &src, cv::Mat &dst) const override;
};

class AsymptoticUnbiasedInverse : public InverseAlgorithm {
public:
  AsymptoticUnbiasedInverse(const NoiseModel &model, double mu);
  InverseMethod method() const noexcept override {
    return InverseMethod::AsymptoticUnbiased;
  }
  double invert(double z) const noexcept override;
};

class ExactUnbiasedInverse : public InverseAlgorithm {
public:
  ExactUnbiasedInverse(const NoiseModel &model, double mu,
                       ExactInverseTable table);
  InverseMethod method() const noexcept override {
    return InverseMethod::ExactUnbiased;
  }
  double invert(double z) const noexcept override;

private:
  ExactInverseTable m_table;
};

// alpha == 0: the forward transform is affine and every method inverts it
// exactly.
class GaussianInverse : public InverseAlgorithm {
public:
  GaussianInverse(const NoiseModel &model, double mu, InverseMethod requested);
  InverseMethod method() const noexcept override { return m_requested; }
  double invert(double z) const noexcept override;
  void processFrame(const cv::Mat &src, cv::Mat &dst) const override;

private:
  InverseMethod m_requested;
};

} // namespace gatvst

#endif // GATVST_INVERSEALGORITHM_HPP
