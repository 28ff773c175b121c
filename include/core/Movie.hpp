#pragma once

#include <cstddef>
#include <expected>
#include <opencv2/core.hpp>
#include <vector>

#include "ProcessError.hpp"

namespace gatvst {

/**
 * @class Movie
 * @brief Immutable stack of single-channel frames with identical size.
 *
 * Every frame is stored as CV_64FC1. The same type carries raw intensities
 * and values on the variance-stabilized scale.
 */
class Movie {
public:
  Movie() = default;

  /**
   * @brief Build a movie from caller-owned frames.
   *
   * Frames are deep-copied and converted to double precision, so later
   * writes to the input do not reach the movie.
   *
   * @param frames Frames in temporal order
   * @return The movie, or INVALID_ARGUMENT if the frames are empty,
   * multi-channel or of different sizes
   */
  static std::expected<Movie, ProcessError>
  fromFrames(const std::vector<cv::Mat> &frames);

  /**
   * @brief Take ownership of freshly produced CV_64FC1 frames without
   * copying them.
   *
   * The caller must not keep other handles to the frame buffers.
   */
  static std::expected<Movie, ProcessError>
  adopt(std::vector<cv::Mat> &&frames);

  [[nodiscard]] int frameCount() const noexcept {
    return static_cast<int>(m_frames.size());
  }
  [[nodiscard]] int height() const noexcept { return m_height; }
  [[nodiscard]] int width() const noexcept { return m_width; }
  [[nodiscard]] bool empty() const noexcept { return m_frames.empty(); }
  [[nodiscard]] std::size_t pixelCount() const noexcept {
    return m_frames.size() * static_cast<std::size_t>(m_height) *
           static_cast<std::size_t>(m_width);
  }

  [[nodiscard]] const cv::Mat &frame(int t) const { return m_frames.at(t); }
  [[nodiscard]] const std::vector<cv::Mat> &frames() const noexcept {
    return m_frames;
  }

  [[nodiscard]] double at(int t, int row, int col) const {
    return m_frames.at(t).at<double>(row, col);
  }

  /// Mean intensity over every pixel of every frame.
  [[nodiscard]] double mean() const;

private:
  explicit Movie(std::vector<cv::Mat> frames);

  static std::expected<void, ProcessError>
  validateFrames(const std::vector<cv::Mat> &frames);

  std::vector<cv::Mat> m_frames;
  int m_height = 0;
  int m_width = 0;
};

} // namespace gatvst
