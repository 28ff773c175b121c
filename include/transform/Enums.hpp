#pragma once

#include <expected>
#include <string_view>

#include "core/ProcessError.hpp"

namespace gatvst {

/**
 * @brief Inverse of the generalized Anscombe transform.
 */
enum class InverseMethod {
  ExactUnbiased,      ///< Table of E[f(z) | y], inverted by interpolation
  AsymptoticUnbiased, ///< Closed-form approximation of the exact inverse
  Algebraic           ///< Direct algebraic inverse of the forward formula
};

/**
 * @brief Canonical name of a method ("exact_unbiased", ...).
 * @return The name, or "unknown" for a value outside the enumeration
 */
const char *inverseMethodName(InverseMethod method) noexcept;

/**
 * @brief Check that a value is one of the enumerators.
 */
bool isKnownInverseMethod(InverseMethod method) noexcept;

/**
 * @brief Parse a canonical method name.
 * @return The method, or INVALID_ARGUMENT for any other string
 */
std::expected<InverseMethod, ProcessError>
parseInverseMethod(std::string_view name);

} // namespace gatvst
