#pragma once

#include <expected>
#include <memory>
#include <string>
#include <string_view>

#include "Enums.hpp"
#include "Parameters.hpp"
#include "TransformTypes.hpp"
#include "core/Movie.hpp"
#include "core/ProcessError.hpp"
#include "estimate/CoreTypes.hpp"

namespace gatvst {

class InverseAlgorithm;

/**
 * @class InverseGAT
 * @brief Inverse generalized Anscombe transform with a fixed method and
 * noise model.
 *
 * All validation and setup (including the exact unbiased lookup table)
 * happens in create(); apply() can then be called on any number of movies
 * and always uses the same method.
 */
class InverseGAT {
public:
  /**
   * @brief Validate the arguments and prepare the chosen inverse.
   * @param model Noise model used by the forward transform
   * @param method Inverse method
   * @param params Offset mu, lookup table and parallelism settings
   * @return The prepared inverse, or INVALID_ARGUMENT for an unknown method,
   * an invalid model or invalid parameters
   */
  static std::expected<InverseGAT, ProcessError>
  create(const NoiseModel &model, InverseMethod method,
         const TransformParams &params = {});

  /**
   * @brief Same as above with the method given by name.
   */
  static std::expected<InverseGAT, ProcessError>
  create(const NoiseModel &model, std::string_view method,
         const TransformParams &params = {});

  /**
   * @brief Invert a transformed movie.
   * @return The reconstructed movie tagged with the method used
   */
  std::expected<ReconstructedMovie, ProcessError>
  apply(const Movie &transformed) const;

  /// Intensity estimate for a single transformed value.
  [[nodiscard]] double invert(double z) const noexcept;

  [[nodiscard]] InverseMethod method() const noexcept;
  [[nodiscard]] std::string getMethodName() const;
  [[nodiscard]] const NoiseModel &model() const noexcept { return m_model; }
  [[nodiscard]] const TransformParams &params() const noexcept {
    return m_params;
  }

private:
  InverseGAT(const NoiseModel &model, const TransformParams &params,
             std::shared_ptr<const InverseAlgorithm> algorithm);

  NoiseModel m_model;
  TransformParams m_params;
  std::shared_ptr<const InverseAlgorithm> m_algorithm;
};

/**
 * @brief inverse_transform(transformed_movie, noise_model, method, mu)
 */
std::expected<ReconstructedMovie, ProcessError>
inverseTransform(const Movie &transformed, const NoiseModel &model,
                 InverseMethod method, double mu = 0.0);

std::expected<ReconstructedMovie, ProcessError>
inverseTransform(const Movie &transformed, const NoiseModel &model,
                 std::string_view method, double mu = 0.0);

std::expected<ReconstructedMovie, ProcessError>
inverseTransform(const Movie &transformed, const NoiseModel &model,
                 InverseMethod method, const TransformParams &params);

/**
 * @brief Invert using the model and offset recorded by the forward pass.
 */
std::expected<ReconstructedMovie, ProcessError>
inverseTransform(const TransformedMovie &transformed, InverseMethod method);

} // namespace gatvst
