// ProcessingUtils.cpp
#include "core/ProcessingUtils.hpp"
#include "Logging.hpp"
#include <optional>
#include <tbb/blocked_range.h>
#include <tbb/global_control.h>
#include <tbb/parallel_for.h>

namespace gatvst {
namespace ProcUtils {

bool isValidMatrix(const cv::Mat &mat) noexcept {
  return !mat.empty() && mat.data != nullptr;
}

void parallelRange(int begin, int end, bool parallel, int thread_count,
                   const std::function<void(int, int)> &body) {
  if (end <= begin) {
    return;
  }

  if (!parallel || thread_count == 1) {
    body(begin, end);
    return;
  }

  std::optional<tbb::global_control> control;
  if (thread_count > 0) {
    control.emplace(tbb::global_control::max_allowed_parallelism,
                    static_cast<std::size_t>(thread_count));
  }

  tbb::parallel_for(tbb::blocked_range<int>(begin, end),
                    [&](const tbb::blocked_range<int> &range) {
                      body(range.begin(), range.end());
                    });
}

ScopedTimer::ScopedTimer(std::string_view op)
    : operation(op), start(std::chrono::steady_clock::now()) {
  Logger::getInstance()->debug("Starting operation: {}", operation);
}

ScopedTimer::~ScopedTimer() {
  auto duration = std::chrono::steady_clock::now() - start;
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(duration);
  Logger::getInstance()->debug("{} took {} ms", operation, ms.count());
}

} // namespace ProcUtils
} // namespace gatvst
