#include "core/Movie.hpp"
#include "Logging.hpp"
#include "core/ProcessingUtils.hpp"
#include <fmt/format.h>

namespace gatvst {

Movie::Movie(std::vector<cv::Mat> frames) : m_frames(std::move(frames)) {
  if (!m_frames.empty()) {
    m_height = m_frames.front().rows;
    m_width = m_frames.front().cols;
  }
}

std::expected<void, ProcessError>
Movie::validateFrames(const std::vector<cv::Mat> &frames) {
  const auto &logger = Logger::getInstance();

  if (frames.empty()) {
    logger->error("Movie has no frames");
    return std::unexpected(ProcessError{ProcessError::Code::INVALID_ARGUMENT,
                                        "Movie must contain at least one frame"});
  }

  const cv::Size size = frames.front().size();
  if (size.width <= 0 || size.height <= 0) {
    logger->error("Movie frames have non-positive dimensions {}x{}",
                  size.width, size.height);
    return std::unexpected(ProcessError{
        ProcessError::Code::INVALID_ARGUMENT,
        fmt::format("Frame dimensions must be positive, got {}x{}",
                    size.width, size.height)});
  }

  for (std::size_t t = 0; t < frames.size(); ++t) {
    const cv::Mat &f = frames[t];
    if (!ProcUtils::isValidMatrix(f) || f.channels() != 1) {
      logger->error("Frame {} is empty or has {} channels", t, f.channels());
      return std::unexpected(ProcessError{
          ProcessError::Code::INVALID_ARGUMENT,
          fmt::format("Frame {} must be a non-empty single-channel matrix",
                      t)});
    }
    if (f.size() != size) {
      logger->error("Frame {} size {}x{} differs from {}x{}", t, f.cols,
                    f.rows, size.width, size.height);
      return std::unexpected(ProcessError{
          ProcessError::Code::INVALID_ARGUMENT,
          fmt::format("Frame {} is {}x{}, expected {}x{}", t, f.cols, f.rows,
                      size.width, size.height)});
    }
  }
  return {};
}

std::expected<Movie, ProcessError>
Movie::fromFrames(const std::vector<cv::Mat> &frames) {
  auto valid = validateFrames(frames);
  if (!valid) {
    return std::unexpected(valid.error());
  }

  try {
    std::vector<cv::Mat> owned;
    owned.reserve(frames.size());
    for (const auto &f : frames) {
      cv::Mat copy;
      if (f.depth() == CV_64F) {
        copy = f.clone();
      } else {
        f.convertTo(copy, CV_64F);
      }
      owned.push_back(std::move(copy));
    }
    return Movie(std::move(owned));
  } catch (const cv::Exception &e) {
    Logger::getInstance()->error("OpenCV error while copying frames: {}",
                                 e.what());
    return std::unexpected(
        ProcessError{ProcessError::Code::PROCESSING_FAILED,
                     fmt::format("OpenCV exception: {}", e.what())});
  }
}

std::expected<Movie, ProcessError> Movie::adopt(std::vector<cv::Mat> &&frames) {
  auto valid = validateFrames(frames);
  if (!valid) {
    return std::unexpected(valid.error());
  }
  for (const auto &f : frames) {
    if (f.type() != CV_64FC1) {
      return std::unexpected(ProcessError{
          ProcessError::Code::INVALID_ARGUMENT,
          "Adopted frames must already be CV_64FC1"});
    }
  }
  return Movie(std::move(frames));
}

double Movie::mean() const {
  if (m_frames.empty()) {
    return 0.0;
  }
  double sum = 0.0;
  for (const auto &f : m_frames) {
    sum += cv::sum(f)[0];
  }
  return sum / static_cast<double>(pixelCount());
}

} // namespace gatvst
