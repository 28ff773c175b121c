#pragma once

#include <cstddef>
#include <expected>
#include <iterator>

#include "CoreTypes.hpp"
#include "core/ProcessError.hpp"

namespace gatvst {

/**
 * @class PatchSampler
 * @brief Regular grid of patch origins over an H x W frame.
 *
 * The grid is a pure function of (height, width, patch size, stride).
 * Patches that would cross the right or bottom border are discarded rather
 * than truncated. The sampler only describes coordinates; it holds no pixel
 * data and no iteration state, so any number of threads can index it at
 * once and it can be walked again from the start.
 */
class PatchSampler {
public:
  class Iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Patch;
    using difference_type = std::ptrdiff_t;
    using pointer = const Patch *;
    using reference = Patch;

    Iterator() = default;
    Iterator(const PatchSampler *sampler, std::size_t index)
        : m_sampler(sampler), m_index(index) {}

    Patch operator*() const { return (*m_sampler)[m_index]; }
    Iterator &operator++() {
      ++m_index;
      return *this;
    }
    Iterator operator++(int) {
      Iterator tmp = *this;
      ++m_index;
      return tmp;
    }
    bool operator==(const Iterator &other) const noexcept {
      return m_index == other.m_index;
    }

  private:
    const PatchSampler *m_sampler = nullptr;
    std::size_t m_index = 0;
  };

  /**
   * @brief Validate the arguments and build a sampler.
   * @param height Frame height
   * @param width Frame width
   * @param patch_size Patch side length
   * @param stride Distance between consecutive patch origins
   * @return The sampler, or INVALID_ARGUMENT for any non-positive argument
   */
  static std::expected<PatchSampler, ProcessError>
  create(int height, int width, int patch_size, int stride);

  /// Number of patch rows in the grid.
  [[nodiscard]] int rows() const noexcept { return m_rows; }
  /// Number of patch columns in the grid.
  [[nodiscard]] int cols() const noexcept { return m_cols; }
  [[nodiscard]] std::size_t size() const noexcept {
    return static_cast<std::size_t>(m_rows) * static_cast<std::size_t>(m_cols);
  }
  [[nodiscard]] bool empty() const noexcept { return size() == 0; }

  [[nodiscard]] int patchSize() const noexcept { return m_patch_size; }
  [[nodiscard]] int stride() const noexcept { return m_stride; }

  /// Patch number index in row-major grid order.
  [[nodiscard]] Patch operator[](std::size_t index) const noexcept;

  [[nodiscard]] Iterator begin() const noexcept { return Iterator(this, 0); }
  [[nodiscard]] Iterator end() const noexcept {
    return Iterator(this, size());
  }

private:
  PatchSampler(int height, int width, int patch_size, int stride);

  int m_height;
  int m_width;
  int m_patch_size;
  int m_stride;
  int m_rows;
  int m_cols;
};

} // namespace gatvst
