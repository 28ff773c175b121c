#pragma once

#include <cstdint>
#include <functional>
#include <vector>

#include "core/Movie.hpp"

namespace gatvst::test {

/// Movie whose every pixel holds value.
Movie constantMovie(int frames, int height, int width, double value);

/// Movie built from frames that are known to be valid.
Movie movieFrom(const std::vector<cv::Mat> &frames);

/**
 * @brief Synthetic y = alpha * Poisson(x) + N(mu, sigma_sq) movie.
 *
 * The photon flux x is constant over block x block tiles and drawn
 * uniformly from [flux_min, flux_max] per tile. structure, if set, adds a
 * static offset (tile index, row in tile, col in tile) to every frame.
 */
struct SyntheticMovie {
  int frames = 100;
  int height = 64;
  int width = 64;
  int block = 8;
  double alpha = 1.0;
  double sigma_sq = 0.0;
  double mu = 0.0;
  double flux_min = 5.0;
  double flux_max = 100.0;
  std::uint32_t seed = 42;
  std::function<double(int, int, int)> structure;

  Movie generate() const;
};

} // namespace gatvst::test
