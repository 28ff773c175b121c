// ProcessError.hpp
#pragma once

#include <string>

namespace gatvst {

/**
 * @struct ProcessError
 * @brief Error code and description returned by every fallible operation
 */
struct ProcessError {
  enum class Code {
    INVALID_ARGUMENT,     ///< Bad parameter, unknown method or bad shape
    INSUFFICIENT_SAMPLES, ///< Too few usable patches to fit a noise model
    PROCESSING_FAILED     ///< An OpenCV or standard exception escaped
  };

  Code code;
  std::string message;
};

/**
 * @brief Human-readable name of an error code.
 */
constexpr const char *errorCodeName(ProcessError::Code code) noexcept {
  switch (code) {
  case ProcessError::Code::INVALID_ARGUMENT:
    return "InvalidArgument";
  case ProcessError::Code::INSUFFICIENT_SAMPLES:
    return "InsufficientSamples";
  case ProcessError::Code::PROCESSING_FAILED:
    return "ProcessingFailed";
  }
  return "Unknown";
}

} // namespace gatvst
