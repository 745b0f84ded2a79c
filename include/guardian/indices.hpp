#pragma once

#include "config.hpp"
#include "policy_engine.hpp"

namespace guardian {

// 1 - risk clamped to [floor, baseline]; exactly baseline when nothing fired.
// Throws std::invalid_argument for a post-phase verdict.
double protection_index(const Verdict& pre, const IndexCalibration& calibration);

// reversible ? 1 - risk : 0, within [0,1]. Throws std::invalid_argument for a pre-phase verdict.
double moral_health_index(const Verdict& post);

} // namespace guardian
