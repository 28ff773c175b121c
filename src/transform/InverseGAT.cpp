#include "transform/InverseGAT.hpp"
#include "Logging.hpp"
#include "core/ProcessingUtils.hpp"
#include "transform/ExactInverseTable.hpp"
#include "transform/InverseAlgorithm.hpp"
#include <cmath>
#include <fmt/format.h>
#include <vector>

namespace gatvst {

InverseGAT::InverseGAT(const NoiseModel &model, const TransformParams &params,
                       std::shared_ptr<const InverseAlgorithm> algorithm)
    : m_model(model), m_params(params), m_algorithm(std::move(algorithm)) {}

std::expected<InverseGAT, ProcessError>
InverseGAT::create(const NoiseModel &model, InverseMethod method,
                   const TransformParams &params) {
  const auto &logger = Logger::getInstance();

  if (!isKnownInverseMethod(method)) {
    logger->error("Unknown inverse method value {}", static_cast<int>(method));
    return std::unexpected(ProcessError{
        ProcessError::Code::INVALID_ARGUMENT,
        fmt::format("Unknown inverse method value {}",
                    static_cast<int>(method))});
  }
  if (!model.isValid()) {
    logger->error("Invalid noise model: alpha={}, sigma_sq={}", model.alpha,
                  model.sigma_sq);
    return std::unexpected(ProcessError{
        ProcessError::Code::INVALID_ARGUMENT,
        fmt::format("Invalid noise model: alpha={}, sigma_sq={}", model.alpha,
                    model.sigma_sq)});
  }
  if (!std::isfinite(params.mu) || !params.isValid()) {
    logger->error("Invalid transform parameters: mu={}, threads={}, "
                  "table_size={}",
                  params.mu, params.thread_count, params.table_size);
    return std::unexpected(ProcessError{ProcessError::Code::INVALID_ARGUMENT,
                                        "Invalid transform parameters"});
  }

  std::shared_ptr<const InverseAlgorithm> algorithm;
  if (model.alpha == 0.0) {
    logger->debug("Gain is 0, using the Gaussian inverse for {}",
                  inverseMethodName(method));
    algorithm = std::make_shared<GaussianInverse>(model, params.mu, method);
  } else {
    switch (method) {
    case InverseMethod::Algebraic:
      algorithm = std::make_shared<AlgebraicInverse>(model, params.mu);
      break;
    case InverseMethod::AsymptoticUnbiased:
      algorithm =
          std::make_shared<AsymptoticUnbiasedInverse>(model, params.mu);
      break;
    case InverseMethod::ExactUnbiased: {
      const double s = model.sigma_sq / (model.alpha * model.alpha);
      auto table = ExactInverseTable::build(s, params);
      if (!table) {
        return std::unexpected(table.error());
      }
      algorithm = std::make_shared<ExactUnbiasedInverse>(model, params.mu,
                                                         std::move(*table));
      break;
    }
    }
  }

  logger->debug("Prepared {} inverse (alpha={:.6g}, sigma_sq={:.6g}, "
                "mu={:.6g})",
                inverseMethodName(method), model.alpha, model.sigma_sq,
                params.mu);
  return InverseGAT(model, params, std::move(algorithm));
}

std::expected<InverseGAT, ProcessError>
InverseGAT::create(const NoiseModel &model, std::string_view method,
                   const TransformParams &params) {
  auto parsed = parseInverseMethod(method);
  if (!parsed) {
    return std::unexpected(parsed.error());
  }
  return create(model, *parsed, params);
}

double InverseGAT::invert(double z) const noexcept {
  return m_algorithm->invert(z);
}

InverseMethod InverseGAT::method() const noexcept {
  return m_algorithm->method();
}

std::string InverseGAT::getMethodName() const {
  return inverseMethodName(method());
}

std::expected<ReconstructedMovie, ProcessError>
InverseGAT::apply(const Movie &transformed) const {
  const auto &logger = Logger::getInstance();
  logger->info("Starting {} inverse GAT", getMethodName());

  if (transformed.empty()) {
    logger->error("Transformed movie is empty");
    return std::unexpected(ProcessError{ProcessError::Code::INVALID_ARGUMENT,
                                        "Transformed movie is empty"});
  }

  try {
    ProcUtils::ScopedTimer timer("Inverse GAT");

    std::vector<cv::Mat> frames(transformed.frameCount());
    ProcUtils::parallelRange(0, transformed.frameCount(),
                             m_params.parallel_execution,
                             m_params.thread_count, [&](int begin, int end) {
                               for (int t = begin; t < end; ++t) {
                                 m_algorithm->processFrame(
                                     transformed.frame(t), frames[t]);
                               }
                             });

    auto out = Movie::adopt(std::move(frames));
    if (!out) {
      return std::unexpected(out.error());
    }

    logger->info("Inverse GAT ({}) applied to {} frames", getMethodName(),
                 transformed.frameCount());
    return ReconstructedMovie{std::move(*out), method(), m_params.mu};
  } catch (const cv::Exception &e) {
    logger->error("OpenCV exception in inverse GAT: {}", e.what());
    return std::unexpected(
        ProcessError{ProcessError::Code::PROCESSING_FAILED,
                     fmt::format("OpenCV exception: {}", e.what())});
  } catch (const std::exception &e) {
    logger->error("Exception in inverse GAT: {}", e.what());
    return std::unexpected(
        ProcessError{ProcessError::Code::PROCESSING_FAILED,
                     fmt::format("Exception: {}", e.what())});
  }
}

std::expected<ReconstructedMovie, ProcessError>
inverseTransform(const Movie &transformed, const NoiseModel &model,
                 InverseMethod method, const TransformParams &params) {
  if (transformed.empty()) {
    Logger::getInstance()->error("Transformed movie is empty");
    return std::unexpected(ProcessError{ProcessError::Code::INVALID_ARGUMENT,
                                        "Transformed movie is empty"});
  }
  auto inverse = InverseGAT::create(model, method, params);
  if (!inverse) {
    return std::unexpected(inverse.error());
  }
  return inverse->apply(transformed);
}

std::expected<ReconstructedMovie, ProcessError>
inverseTransform(const Movie &transformed, const NoiseModel &model,
                 InverseMethod method, double mu) {
  TransformParams params;
  params.mu = mu;
  return inverseTransform(transformed, model, method, params);
}

std::expected<ReconstructedMovie, ProcessError>
inverseTransform(const Movie &transformed, const NoiseModel &model,
                 std::string_view method, double mu) {
  auto parsed = parseInverseMethod(method);
  if (!parsed) {
    return std::unexpected(parsed.error());
  }
  return inverseTransform(transformed, model, *parsed, mu);
}

std::expected<ReconstructedMovie, ProcessError>
inverseTransform(const TransformedMovie &transformed, InverseMethod method) {
  return inverseTransform(transformed.movie, transformed.model, method,
                          transformed.mu);
}

} // namespace gatvst
