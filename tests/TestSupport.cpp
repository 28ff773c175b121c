#include "TestSupport.hpp"

#include <algorithm>
#include <cmath>
#include <random>

namespace gatvst::test {

Movie constantMovie(int frames, int height, int width, double value) {
  std::vector<cv::Mat> raw(frames, cv::Mat());
  for (auto &f : raw) {
    f = cv::Mat(height, width, CV_64F, cv::Scalar(value));
  }
  return movieFrom(raw);
}

Movie movieFrom(const std::vector<cv::Mat> &frames) {
  return Movie::fromFrames(frames).value();
}

Movie SyntheticMovie::generate() const {
  std::mt19937 gen(seed);
  std::uniform_real_distribution<double> fluxDist(flux_min, flux_max);
  std::normal_distribution<double> readout(
      mu, sigma_sq > 0.0 ? std::sqrt(sigma_sq) : 1.0);

  const int tileRows = (height + block - 1) / block;
  const int tileCols = (width + block - 1) / block;
  std::vector<double> flux(static_cast<std::size_t>(tileRows) * tileCols);
  for (auto &x : flux) {
    x = fluxDist(gen);
  }

  std::vector<cv::Mat> raw(frames);
  for (auto &f : raw) {
    f.create(height, width, CV_64F);
    for (int tr = 0; tr < tileRows; ++tr) {
      for (int tc = 0; tc < tileCols; ++tc) {
        const int tile = tr * tileCols + tc;
        std::poisson_distribution<int> photons(flux[tile]);
        for (int r = tr * block; r < std::min(height, (tr + 1) * block); ++r) {
          auto *row = f.ptr<double>(r);
          for (int c = tc * block; c < std::min(width, (tc + 1) * block);
               ++c) {
            double y = alpha * photons(gen);
            if (sigma_sq > 0.0) {
              y += readout(gen);
            } else {
              y += mu;
            }
            if (structure) {
              y += structure(tile, r - tr * block, c - tc * block);
            }
            row[c] = y;
          }
        }
      }
    }
  }
  return movieFrom(raw);
}

} // namespace gatvst::test
