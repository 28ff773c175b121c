#include "estimate/NoiseEstimator.hpp"
#include "Logging.hpp"
#include "core/ProcessingUtils.hpp"
#include "estimate/LocalStatsEstimator.hpp"
#include "estimate/NoiseModelFitter.hpp"
#include "estimate/PatchSampler.hpp"
#include <fmt/format.h>

namespace gatvst {

std::expected<NoiseModel, ProcessError>
estimateNoiseModel(const Movie &movie, const EstimationParams &params) {
  const auto &logger = Logger::getInstance();
  logger->info("Starting noise model estimation");

  if (movie.empty()) {
    logger->error("Input movie is empty");
    return std::unexpected(ProcessError{ProcessError::Code::INVALID_ARGUMENT,
                                        "Input movie is empty"});
  }
  if (!params.isValid()) {
    logger->error("Invalid estimation parameters: patch={}, stride={}, "
                  "temporal_stride={}, min_valid_samples={}",
                  params.patch_size, params.spatial_stride,
                  params.temporal_stride, params.min_valid_samples);
    return std::unexpected(ProcessError{
        ProcessError::Code::INVALID_ARGUMENT,
        fmt::format("Invalid estimation parameters: patch size {}, spatial "
                    "stride {}, temporal stride {}, min valid samples {}",
                    params.patch_size, params.spatial_stride,
                    params.temporal_stride, params.min_valid_samples)});
  }

  ProcUtils::ScopedTimer timer("Noise model estimation");

  auto sampler = PatchSampler::create(movie.height(), movie.width(),
                                      params.patch_size, params.spatial_stride);
  if (!sampler) {
    return std::unexpected(sampler.error());
  }
  if (sampler->empty()) {
    logger->error("Patch size {} does not fit a {}x{} frame",
                  params.patch_size, movie.width(), movie.height());
    return std::unexpected(ProcessError{
        ProcessError::Code::INSUFFICIENT_SAMPLES,
        fmt::format("No {}px patch fits a {}x{} frame", params.patch_size,
                    movie.width(), movie.height())});
  }

  auto samples = LocalStatsEstimator::collect(movie, *sampler, params);
  if (!samples) {
    return std::unexpected(samples.error());
  }

  return NoiseModelFitter::fit(*samples, params);
}

std::expected<NoiseModel, ProcessError>
estimateNoiseModel(const Movie &movie, int patch_size, int spatial_stride,
                   int temporal_stride, std::size_t min_valid_samples) {
  EstimationParams params;
  params.patch_size = patch_size;
  params.spatial_stride = spatial_stride;
  params.temporal_stride = temporal_stride;
  params.min_valid_samples = min_valid_samples;
  return estimateNoiseModel(movie, params);
}

std::future<std::expected<NoiseModel, ProcessError>>
estimateNoiseModelAsync(const Movie &movie, const EstimationParams &params) {
  return std::async(std::launch::async, [movie, params]() {
    return estimateNoiseModel(movie, params);
  });
}

} // namespace gatvst
