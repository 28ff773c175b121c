#include "estimate/NoiseModelFitter.hpp"
#include "Logging.hpp"
#include <algorithm>
#include <cmath>
#include <fmt/format.h>

namespace gatvst {

namespace {
// Converts a median absolute deviation into a Gaussian standard deviation.
constexpr double kMadToSigma = 1.4826;
// Relative floor on the robust scale so exact data is not clipped by
// rounding noise.
constexpr double kScaleFloor = 1e-9;
} // namespace

double NoiseModelFitter::median(std::vector<double> values) {
  if (values.empty()) {
    return 0.0;
  }
  const auto mid = values.size() / 2;
  std::nth_element(values.begin(), values.begin() + mid, values.end());
  double m = values[mid];
  if (values.size() % 2 == 0) {
    m = 0.5 * (m + *std::max_element(values.begin(), values.begin() + mid));
  }
  return m;
}

NoiseModelFitter::LineFit
NoiseModelFitter::leastSquares(const std::vector<StatsSample> &samples,
                               const std::vector<std::size_t> &indices) {
  LineFit line;
  if (indices.empty()) {
    return line;
  }

  const double n = static_cast<double>(indices.size());
  double meanX = 0.0;
  double meanY = 0.0;
  for (auto i : indices) {
    meanX += samples[i].mean;
    meanY += samples[i].variance;
  }
  meanX /= n;
  meanY /= n;

  double sxx = 0.0;
  double sxy = 0.0;
  for (auto i : indices) {
    const double dx = samples[i].mean - meanX;
    sxx += dx * dx;
    sxy += dx * (samples[i].variance - meanY);
  }

  const double tolerance = 1e-12 * std::max(1.0, meanX * meanX) * n;
  if (sxx <= tolerance) {
    line.flat = true;
    line.slope = 0.0;
    line.intercept = meanY;
    return line;
  }

  line.slope = sxy / sxx;
  line.intercept = meanY - line.slope * meanX;
  return line;
}

std::expected<NoiseModel, ProcessError>
NoiseModelFitter::fit(const std::vector<StatsSample> &samples,
                      const EstimationParams &params) {
  const auto &logger = Logger::getInstance();

  if (!params.fit.isValid() || params.min_valid_samples < 2) {
    logger->error("Invalid fit parameters: threshold={}, max_iterations={}, "
                  "min_valid_samples={}",
                  params.fit.rejection_threshold, params.fit.max_iterations,
                  params.min_valid_samples);
    return std::unexpected(ProcessError{ProcessError::Code::INVALID_ARGUMENT,
                                        "Invalid noise model fit parameters"});
  }

  NoiseModel model;
  model.samples_total = samples.size();

  std::vector<std::size_t> valid;
  valid.reserve(samples.size());
  for (std::size_t i = 0; i < samples.size(); ++i) {
    if (!samples[i].degenerate) {
      valid.push_back(i);
    }
  }
  model.samples_degenerate = samples.size() - valid.size();

  logger->debug("Fitting noise model: {} samples, {} degenerate",
                model.samples_total, model.samples_degenerate);

  if (valid.size() < params.min_valid_samples) {
    logger->error("Only {} valid samples, {} required", valid.size(),
                  params.min_valid_samples);
    return std::unexpected(ProcessError{
        ProcessError::Code::INSUFFICIENT_SAMPLES,
        fmt::format("{} of {} samples are usable, at least {} required",
                    valid.size(), samples.size(), params.min_valid_samples)});
  }

  std::vector<std::size_t> inliers = valid;
  LineFit line = leastSquares(samples, inliers);
  model.iterations = 1;

  if (params.fit.method == FitMethod::ITERATIVE_OUTLIER_REJECTION) {
    std::vector<double> residuals(valid.size());
    std::vector<double> inlierResiduals;

    while (model.iterations < params.fit.max_iterations) {
      for (std::size_t k = 0; k < valid.size(); ++k) {
        const auto &s = samples[valid[k]];
        residuals[k] = s.variance - (line.slope * s.mean + line.intercept);
      }

      inlierResiduals.clear();
      double meanVariance = 0.0;
      for (std::size_t k = 0, j = 0; k < valid.size(); ++k) {
        if (j < inliers.size() && inliers[j] == valid[k]) {
          inlierResiduals.push_back(residuals[k]);
          meanVariance += samples[valid[k]].variance;
          ++j;
        }
      }
      meanVariance /= static_cast<double>(inliers.size());

      const double center = median(inlierResiduals);
      for (auto &r : inlierResiduals) {
        r = std::abs(r - center);
      }
      const double scale =
          std::max(kMadToSigma * median(inlierResiduals),
                   kScaleFloor * std::max(1.0, std::abs(meanVariance)));
      model.residual_scale = scale;

      const double limit = params.fit.rejection_threshold * scale;
      std::vector<std::size_t> next;
      next.reserve(valid.size());
      for (std::size_t k = 0; k < valid.size(); ++k) {
        if (std::abs(residuals[k] - center) <= limit) {
          next.push_back(valid[k]);
        }
      }

      if (next == inliers) {
        break;
      }
      if (next.size() < params.min_valid_samples) {
        logger->error("Outlier rejection left {} samples, {} required",
                      next.size(), params.min_valid_samples);
        return std::unexpected(ProcessError{
            ProcessError::Code::INSUFFICIENT_SAMPLES,
            fmt::format("{} samples survived outlier rejection, at least {} "
                        "required",
                        next.size(), params.min_valid_samples)});
      }

      logger->debug("Iteration {}: {} -> {} inliers (scale {:.4g})",
                    model.iterations, inliers.size(), next.size(), scale);
      inliers = std::move(next);
      line = leastSquares(samples, inliers);
      ++model.iterations;
    }
  }

  model.samples_used = inliers.size();
  if (line.flat) {
    logger->warn("All {} inlier patches share one mean; gain is unresolved",
                 inliers.size());
    model.low_confidence = true;
  }

  // The fitted intercept is sigma_sq - alpha * mu.
  model.alpha = line.slope;
  model.sigma_sq = line.intercept + line.slope * params.gaussian_mean;

  if (model.alpha < 0.0) {
    logger->warn("Fitted gain {:.6g} is negative, clamping to 0", model.alpha);
    double meanVariance = 0.0;
    for (auto i : inliers) {
      meanVariance += samples[i].variance;
    }
    model.alpha = 0.0;
    model.sigma_sq = meanVariance / static_cast<double>(inliers.size());
    model.alpha_clamped = true;
    model.low_confidence = true;
  }
  if (model.sigma_sq < 0.0) {
    logger->warn("Fitted Gaussian variance {:.6g} is negative, clamping to 0",
                 model.sigma_sq);
    model.sigma_sq = 0.0;
    model.sigma_sq_clamped = true;
    model.low_confidence = true;
  }

  logger->info("Noise model: alpha={:.6g}, sigma_sq={:.6g} ({} of {} samples, "
               "{} iterations{})",
               model.alpha, model.sigma_sq, model.samples_used,
               model.samples_total, model.iterations,
               model.low_confidence ? ", low confidence" : "");
  return model;
}

} // namespace gatvst
