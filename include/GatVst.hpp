#pragma once

#include "Logging.hpp"
#include "core/Movie.hpp"
#include "core/ProcessError.hpp"
#include "estimate/CoreTypes.hpp"
#include "estimate/LocalStatsEstimator.hpp"
#include "estimate/NoiseEstimator.hpp"
#include "estimate/NoiseModelFitter.hpp"
#include "estimate/Parameters.hpp"
#include "estimate/PatchSampler.hpp"
#include "transform/Enums.hpp"
#include "transform/ForwardGAT.hpp"
#include "transform/InverseGAT.hpp"
#include "transform/Parameters.hpp"
#include "transform/TransformTypes.hpp"
