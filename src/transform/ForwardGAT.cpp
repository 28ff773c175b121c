#include "transform/ForwardGAT.hpp"
#include "Logging.hpp"
#include "core/ProcessingUtils.hpp"
#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <limits>
#include <numeric>
#include <vector>

namespace gatvst {

double ForwardGAT::value(double y, const NoiseModel &model,
                         double mu) noexcept {
  if (!model.isValid()) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  const double alpha = model.alpha;
  if (alpha == 0.0) {
    return (y - mu) / std::sqrt(model.sigma_sq);
  }
  const double radicand =
      alpha * y + 0.375 * alpha * alpha + model.sigma_sq - alpha * mu;
  return (2.0 / alpha) * std::sqrt(std::max(0.0, radicand));
}

std::size_t ForwardGAT::applyFrame(const cv::Mat &src, cv::Mat &dst,
                                   const NoiseModel &model, double mu) {
  const double alpha = model.alpha;
  if (alpha == 0.0) {
    const double sigma = std::sqrt(model.sigma_sq);
    src.convertTo(dst, CV_64F, 1.0 / sigma, -mu / sigma);
    return 0;
  }

  // alpha * y + (3/8 alpha^2 + sigma_sq - alpha * mu)
  cv::Mat radicand;
  src.convertTo(radicand, CV_64F, alpha,
                0.375 * alpha * alpha + model.sigma_sq - alpha * mu);
  const auto clamped =
      static_cast<std::size_t>(cv::countNonZero(radicand < 0.0));
  cv::max(radicand, 0.0, radicand);
  cv::sqrt(radicand, dst);
  dst *= 2.0 / alpha;
  return clamped;
}

std::expected<TransformedMovie, ProcessError>
ForwardGAT::apply(const Movie &movie, const NoiseModel &model,
                  const TransformParams &params) {
  const auto &logger = Logger::getInstance();
  logger->info("Starting forward GAT");

  if (movie.empty()) {
    logger->error("Input movie is empty");
    return std::unexpected(ProcessError{ProcessError::Code::INVALID_ARGUMENT,
                                        "Input movie is empty"});
  }
  if (!model.isValid()) {
    logger->error("Invalid noise model: alpha={}, sigma_sq={}", model.alpha,
                  model.sigma_sq);
    return std::unexpected(ProcessError{
        ProcessError::Code::INVALID_ARGUMENT,
        fmt::format("Invalid noise model: alpha={}, sigma_sq={}", model.alpha,
                    model.sigma_sq)});
  }
  if (!std::isfinite(params.mu) || params.thread_count < 0) {
    logger->error("Invalid transform parameters: mu={}, threads={}",
                  params.mu, params.thread_count);
    return std::unexpected(ProcessError{ProcessError::Code::INVALID_ARGUMENT,
                                        "Invalid transform parameters"});
  }

  try {
    ProcUtils::ScopedTimer timer("Forward GAT");

    std::vector<cv::Mat> frames(movie.frameCount());
    std::vector<std::size_t> clamped(movie.frameCount(), 0);

    ProcUtils::parallelRange(0, movie.frameCount(), params.parallel_execution,
                             params.thread_count, [&](int begin, int end) {
                               for (int t = begin; t < end; ++t) {
                                 clamped[t] = applyFrame(movie.frame(t),
                                                         frames[t], model,
                                                         params.mu);
                               }
                             });

    const std::size_t totalClamped =
        std::accumulate(clamped.begin(), clamped.end(), std::size_t{0});
    if (totalClamped > 0) {
      logger->warn("{} of {} pixels fell below the transform domain and were "
                   "clamped to 0",
                   totalClamped, movie.pixelCount());
    }

    auto out = Movie::adopt(std::move(frames));
    if (!out) {
      return std::unexpected(out.error());
    }

    logger->info("Forward GAT applied to {} frames (alpha={:.6g}, "
                 "sigma_sq={:.6g}, mu={:.6g})",
                 movie.frameCount(), model.alpha, model.sigma_sq, params.mu);
    return TransformedMovie{std::move(*out), model, params.mu};
  } catch (const cv::Exception &e) {
    logger->error("OpenCV exception in forward GAT: {}", e.what());
    return std::unexpected(
        ProcessError{ProcessError::Code::PROCESSING_FAILED,
                     fmt::format("OpenCV exception: {}", e.what())});
  } catch (const std::exception &e) {
    logger->error("Exception in forward GAT: {}", e.what());
    return std::unexpected(
        ProcessError{ProcessError::Code::PROCESSING_FAILED,
                     fmt::format("Exception: {}", e.what())});
  }
}

std::expected<TransformedMovie, ProcessError>
forwardTransform(const Movie &movie, const NoiseModel &model, double mu) {
  TransformParams params;
  params.mu = mu;
  return ForwardGAT::apply(movie, model, params);
}

std::expected<TransformedMovie, ProcessError>
forwardTransform(const Movie &movie, const NoiseModel &model,
                 const TransformParams &params) {
  return ForwardGAT::apply(movie, model, params);
}

} // namespace gatvst
