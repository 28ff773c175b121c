#pragma once

#include <cstddef>
#include <expected>
#include <future>

#include "CoreTypes.hpp"
#include "Parameters.hpp"
#include "core/Movie.hpp"
#include "core/ProcessError.hpp"

namespace gatvst {

/**
 * @brief Estimate the mixed Poisson-Gaussian noise model of a movie.
 *
 * Samples patches on a regular grid, computes their pooled statistics over
 * the strided frames and fits the variance/mean line. Nothing is returned
 * unless the fit succeeded.
 *
 * @param movie Raw movie
 * @param params Estimation parameters
 * @return The fitted model, INVALID_ARGUMENT for bad parameters or
 * INSUFFICIENT_SAMPLES when too few patches carry usable noise
 */
std::expected<NoiseModel, ProcessError>
estimateNoiseModel(const Movie &movie, const EstimationParams &params = {});

/**
 * @brief Convenience overload taking the sampling parameters directly.
 */
std::expected<NoiseModel, ProcessError>
estimateNoiseModel(const Movie &movie, int patch_size, int spatial_stride,
                   int temporal_stride, std::size_t min_valid_samples);

/**
 * @brief Asynchronous version of estimateNoiseModel.
 *
 * The task holds its own handle to the movie's (immutable) frame buffers.
 */
std::future<std::expected<NoiseModel, ProcessError>>
estimateNoiseModelAsync(const Movie &movie, const EstimationParams &params);

} // namespace gatvst
