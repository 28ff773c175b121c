#pragma once

#include "Enums.hpp"
#include "core/Movie.hpp"
#include "estimate/CoreTypes.hpp"

namespace gatvst {

/**
 * @brief Movie on the variance-stabilized scale, with the parameters that
 * produced it.
 */
struct TransformedMovie {
  Movie movie;
  NoiseModel model;
  double mu = 0.0;
};

/**
 * @brief Movie brought back to the intensity scale, with the inverse used.
 */
struct ReconstructedMovie {
  Movie movie;
  InverseMethod method = InverseMethod::ExactUnbiased;
  double mu = 0.0;
};

} // namespace gatvst
