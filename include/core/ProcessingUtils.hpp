// ProcessingUtils.hpp
#pragma once

#include <chrono>
#include <functional>
#include <opencv2/core.hpp>
#include <string>
#include <string_view>

namespace gatvst {

/**
 * @namespace ProcUtils
 * @brief Helpers shared by the estimation and transform stages
 */
namespace ProcUtils {
/**
 * @brief Check that a matrix is non-empty and backed by data
 */
bool isValidMatrix(const cv::Mat &mat) noexcept;

/**
 * @brief Run body over [begin, end) in contiguous chunks.
 *
 * With parallel set, chunks are scheduled by TBB and thread_count (if > 0)
 * caps the worker count for the duration of the call. The call returns only
 * after every chunk has finished.
 */
void parallelRange(int begin, int end, bool parallel, int thread_count,
                   const std::function<void(int, int)> &body);

/**
 * @struct ScopedTimer
 * @brief Logs how long an operation took when it goes out of scope
 */
struct ScopedTimer {
  std::string operation; ///< Name of the timed operation
  std::chrono::steady_clock::time_point start; ///< Start of the operation

  explicit ScopedTimer(std::string_view op);
  ~ScopedTimer();

  ScopedTimer(const ScopedTimer &) = delete;
  ScopedTimer &operator=(const ScopedTimer &) = delete;
};
} // namespace ProcUtils

} // namespace gatvst
