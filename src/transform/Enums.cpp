#include "transform/Enums.hpp"
#include "Logging.hpp"
#include <fmt/format.h>

namespace gatvst {

const char *inverseMethodName(InverseMethod method) noexcept {
  switch (method) {
  case InverseMethod::ExactUnbiased:
    return "exact_unbiased";
  case InverseMethod::AsymptoticUnbiased:
    return "asymptotic_unbiased";
  case InverseMethod::Algebraic:
    return "algebraic";
  }
  return "unknown";
}

bool isKnownInverseMethod(InverseMethod method) noexcept {
  switch (method) {
  case InverseMethod::ExactUnbiased:
  case InverseMethod::AsymptoticUnbiased:
  case InverseMethod::Algebraic:
    return true;
  }
  return false;
}

std::expected<InverseMethod, ProcessError>
parseInverseMethod(std::string_view name) {
  for (auto method : {InverseMethod::ExactUnbiased,
                      InverseMethod::AsymptoticUnbiased,
                      InverseMethod::Algebraic}) {
    if (name == inverseMethodName(method)) {
      return method;
    }
  }
  Logger::getInstance()->error("Unknown inverse method '{}'", name);
  return std::unexpected(ProcessError{
      ProcessError::Code::INVALID_ARGUMENT,
      fmt::format("Unknown inverse method '{}', expected exact_unbiased, "
                  "asymptotic_unbiased or algebraic",
                  name)});
}

} // namespace gatvst
