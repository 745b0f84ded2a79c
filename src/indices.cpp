#include "../include/guardian/indices.hpp"

#include <algorithm>
#include <stdexcept>

namespace guardian {

double protection_index(const Verdict& pre, const IndexCalibration& calibration) {
    if (pre.phase != Phase::Pre) {
        throw std::invalid_argument("protection index requires a pre-check verdict");
    }
    if (pre.fired.empty()) {
        return calibration.protection_baseline;
    }
    return std::clamp(1.0 - pre.risk, calibration.protection_floor, calibration.protection_baseline);
}

double moral_health_index(const Verdict& post) {
    if (post.phase != Phase::Post) {
        throw std::invalid_argument("moral health index requires a post-check verdict");
    }
    if (!post.reversible) {
        return 0.0;
    }
    return std::clamp(1.0 - post.risk, 0.0, 1.0);
}

} // namespace guardian
