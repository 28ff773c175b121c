#include "estimate/LocalStatsEstimator.hpp"
#include "Logging.hpp"
#include "core/ProcessingUtils.hpp"
#include <cmath>
#include <fmt/format.h>

namespace gatvst {

StatsSample LocalStatsEstimator::compute(const Movie &movie,
                                         const Patch &patch,
                                         int temporal_stride,
                                         double degenerate_variance) {
  StatsSample sample;
  const cv::Rect roi = patch.toRect();

  // Two passes keep the variance accurate for bright, low-noise patches.
  double sum = 0.0;
  std::size_t count = 0;
  for (int t = 0; t < movie.frameCount(); t += temporal_stride) {
    const cv::Mat block = movie.frame(t)(roi);
    for (int r = 0; r < block.rows; ++r) {
      const double *p = block.ptr<double>(r);
      for (int c = 0; c < block.cols; ++c) {
        sum += p[c];
      }
    }
    count += static_cast<std::size_t>(block.rows) * block.cols;
  }

  sample.count = count;
  if (count < 2) {
    sample.degenerate = true;
    return sample;
  }
  sample.mean = sum / static_cast<double>(count);

  double squares = 0.0;
  for (int t = 0; t < movie.frameCount(); t += temporal_stride) {
    const cv::Mat block = movie.frame(t)(roi);
    for (int r = 0; r < block.rows; ++r) {
      const double *p = block.ptr<double>(r);
      for (int c = 0; c < block.cols; ++c) {
        const double d = p[c] - sample.mean;
        squares += d * d;
      }
    }
  }
  sample.variance = squares / static_cast<double>(count - 1);

  sample.degenerate = !std::isfinite(sample.mean) ||
                      !std::isfinite(sample.variance) ||
                      sample.variance <= degenerate_variance;
  return sample;
}

std::expected<std::vector<StatsSample>, ProcessError>
LocalStatsEstimator::collect(const Movie &movie, const PatchSampler &sampler,
                             const EstimationParams &params) {
  const auto &logger = Logger::getInstance();

  if (movie.empty()) {
    logger->error("Cannot collect statistics from an empty movie");
    return std::unexpected(ProcessError{ProcessError::Code::INVALID_ARGUMENT,
                                        "Movie is empty"});
  }
  if (params.temporal_stride <= 0) {
    logger->error("Invalid temporal stride: {}", params.temporal_stride);
    return std::unexpected(ProcessError{
        ProcessError::Code::INVALID_ARGUMENT,
        fmt::format("Temporal stride must be positive, got {}",
                    params.temporal_stride)});
  }
  if (!sampler.empty()) {
    const Patch last = sampler[sampler.size() - 1];
    if (last.row + last.size > movie.height() ||
        last.col + last.size > movie.width()) {
      logger->error("Patch grid exceeds the {}x{} frame", movie.width(),
                    movie.height());
      return std::unexpected(ProcessError{
          ProcessError::Code::INVALID_ARGUMENT,
          "Patch grid does not fit the movie frame size"});
    }
  }

  try {
    ProcUtils::ScopedTimer timer("Local statistics");
    std::vector<StatsSample> samples(sampler.size());

    ProcUtils::parallelRange(
        0, static_cast<int>(samples.size()), params.parallel_execution,
        params.thread_count, [&](int begin, int end) {
          for (int i = begin; i < end; ++i) {
            samples[i] = compute(movie, sampler[i], params.temporal_stride,
                                 params.degenerate_variance);
          }
        });

    logger->debug("Collected {} patch samples over {} frames (stride {})",
                  samples.size(), movie.frameCount(), params.temporal_stride);
    return samples;
  } catch (const cv::Exception &e) {
    logger->error("OpenCV exception in collect: {}", e.what());
    return std::unexpected(
        ProcessError{ProcessError::Code::PROCESSING_FAILED,
                     fmt::format("OpenCV exception: {}", e.what())});
  } catch (const std::exception &e) {
    logger->error("Exception in collect: {}", e.what());
    return std::unexpected(
        ProcessError{ProcessError::Code::PROCESSING_FAILED,
                     fmt::format("Exception: {}", e.what())});
  }
}

} // namespace gatvst
