#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "lorentz/types.hpp"

namespace lorentz {

namespace constants {

constexpr double kPi = 3.14159265358979323846;
constexpr double kElectronMass_kg = 9.109e-31;
constexpr double kElectronCharge_C = -1.602e-19;

constexpr double kDefaultEnergyRelativeTolerance = 1.0e-3;
constexpr double kDefaultEnergyAbsoluteTolerance_J = 1.0e-12;

}  // namespace constants

enum class ToleranceMode : uint8_t {
    Either = 0,
    Both = 1,
};

inline const char* ToleranceModeName(ToleranceMode mode) {
    switch (mode) {
        case ToleranceMode::Either:
            return "either";
        case ToleranceMode::Both:
            return "both";
    }
    return "unknown";
}

inline bool ParseToleranceMode(std::string_view text, ToleranceMode* outMode) {
    if (text == "either" || text == "EITHER") {
        *outMode = ToleranceMode::Either;
        return true;
    }
    if (text == "both" || text == "BOTH") {
        *outMode = ToleranceMode::Both;
        return true;
    }
    return false;
}

struct SimulationConfig {
    double timeStep_s = 5.0e-12;
    double totalDuration_s = 1.0e-9;
    bool recordTrajectory = true;

    // Truncates: 10 / 3 gives 3 steps.
    std::size_t StepCount() const;
};

struct EnergyTolerance {
    double relative = constants::kDefaultEnergyRelativeTolerance;
    double absolute_J = constants::kDefaultEnergyAbsoluteTolerance_J;
    ToleranceMode mode = ToleranceMode::Either;
};

struct SessionConfig {
    Vec2 electricField_VPerM = Vec2(0.0, 0.0);
    Vec3 magneticField_T = Vec3(0.0, 0.0, 0.1);
    double timeStep_s = 5.0e-12;
    double maxFrameTime_s = 1.0e-6;
    std::size_t trailLength = 500;
};

}  // namespace lorentz
