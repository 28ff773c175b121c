#pragma once

namespace gatvst {

/**
 * @brief Parameters shared by the forward and inverse transforms.
 */
struct TransformParams {
  double mu = 0.0; ///< Mean of the Gaussian noise component

  bool parallel_execution = true; ///< Process frames with TBB
  int thread_count = 0;           ///< Worker cap (0 means TBB default)

  // Exact unbiased inverse lookup table, in normalized photon units
  int table_size = 1024;              ///< Number of tabulated intensities
  double table_max_intensity = 256.0; ///< Largest tabulated intensity
  int quadrature_nodes = 49;          ///< Nodes of the Gaussian integral

  [[nodiscard]] bool isValid() const noexcept {
    return thread_count >= 0 && table_size >= 2 &&
           table_max_intensity > 0.0 && quadrature_nodes >= 3;
  }
};

} // namespace gatvst
