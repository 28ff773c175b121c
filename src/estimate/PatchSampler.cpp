#include "estimate/PatchSampler.hpp"
#include "Logging.hpp"
#include <fmt/format.h>

namespace gatvst {

namespace {
// Count of origins o = 0, s, 2s, ... with o + p <= extent.
int gridCount(int extent, int patch_size, int stride) noexcept {
  if (extent < patch_size) {
    return 0;
  }
  return (extent - patch_size) / stride + 1;
}
} // namespace

PatchSampler::PatchSampler(int height, int width, int patch_size, int stride)
    : m_height(height), m_width(width), m_patch_size(patch_size),
      m_stride(stride), m_rows(gridCount(height, patch_size, stride)),
      m_cols(gridCount(width, patch_size, stride)) {}

std::expected<PatchSampler, ProcessError>
PatchSampler::create(int height, int width, int patch_size, int stride) {
  const auto &logger = Logger::getInstance();

  if (height <= 0 || width <= 0) {
    logger->error("Invalid frame dimensions: {}x{}", width, height);
    return std::unexpected(ProcessError{
        ProcessError::Code::INVALID_ARGUMENT,
        fmt::format("Frame dimensions must be positive, got {}x{}", width,
                    height)});
  }
  if (patch_size <= 0) {
    logger->error("Invalid patch size: {}", patch_size);
    return std::unexpected(ProcessError{
        ProcessError::Code::INVALID_ARGUMENT,
        fmt::format("Patch size must be positive, got {}", patch_size)});
  }
  if (stride <= 0) {
    logger->error("Invalid spatial stride: {}", stride);
    return std::unexpected(ProcessError{
        ProcessError::Code::INVALID_ARGUMENT,
        fmt::format("Spatial stride must be positive, got {}", stride)});
  }

  PatchSampler sampler(height, width, patch_size, stride);
  logger->debug("Patch grid {}x{} ({} patches of {} px, stride {}) over {}x{}",
                sampler.rows(), sampler.cols(), sampler.size(), patch_size,
                stride, width, height);
  return sampler;
}

Patch PatchSampler::operator[](std::size_t index) const noexcept {
  if (m_cols == 0) {
    return Patch{0, 0, m_patch_size};
  }
  const auto gridRow = static_cast<int>(index / static_cast<std::size_t>(m_cols));
  const auto gridCol = static_cast<int>(index % static_cast<std::size_t>(m_cols));
  return Patch{gridRow * m_stride, gridCol * m_stride, m_patch_size};
}

} // namespace gatvst
