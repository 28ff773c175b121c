#pragma once

#include <expected>
#include <vector>

#include "CoreTypes.hpp"
#include "Parameters.hpp"
#include "PatchSampler.hpp"
#include "core/Movie.hpp"
#include "core/ProcessError.hpp"

namespace gatvst {

/**
 * @brief Computes per-patch mean/variance pairs from a movie.
 */
class LocalStatsEstimator {
public:
  /**
   * @brief Pooled statistics of one patch over frames 0, T, 2T, ...
   *
   * Space and the strided time axis are flattened into a single sample.
   * The variance is the unbiased (n - 1) estimate. A sample whose variance
   * is not finite or is at or below degenerate_variance is flagged
   * degenerate.
   *
   * @param movie Source movie
   * @param patch Patch inside the frame bounds
   * @param temporal_stride Frame step, must be positive
   * @param degenerate_variance Variance floor for a usable sample
   * @return The sample statistics
   */
  static StatsSample compute(const Movie &movie, const Patch &patch,
                             int temporal_stride, double degenerate_variance);

  /**
   * @brief Statistics of every patch of the sampler.
   *
   * Each patch writes only its own slot of the result, so patches are
   * processed in parallel when params.parallel_execution is set. The call
   * returns after all patches are done.
   *
   * @param movie Source movie
   * @param sampler Patch grid built for the movie's frame size
   * @param params Estimation parameters (temporal stride, degenerate floor,
   * parallelism)
   * @return One sample per patch in grid order, or INVALID_ARGUMENT if the
   * movie or parameters are unusable
   */
  static std::expected<std::vector<StatsSample>, ProcessError>
  collect(const Movie &movie, const PatchSampler &sampler,
          const EstimationParams &params);
};

} // namespace gatvst
