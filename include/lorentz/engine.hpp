#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "lorentz/config.hpp"
#include "lorentz/fields.hpp"
#include "lorentz/integrator.hpp"
#include "lorentz/particle.hpp"

namespace lorentz {

enum class RunStatus : uint8_t {
    Ok = 0,
    InvalidConfiguration = 1,
    InvalidParticle = 2,
};

inline const char* RunStatusName(RunStatus status) {
    switch (status) {
        case RunStatus::Ok:
            return "ok";
        case RunStatus::InvalidConfiguration:
            return "invalid-configuration";
        case RunStatus::InvalidParticle:
            return "invalid-particle";
    }
    return "unknown";
}

struct SimulationResult {
    std::vector<State> finalStates;
    // One entry per particle; each is empty unless trajectories were recorded.
    std::vector<Trajectory> trajectories;
};

// False for NaN, infinite, negative, or counts that do not fit in std::size_t.
bool StepCountRepresentable(double steps);

bool ValidateSimulationConfig(const SimulationConfig& config, std::string* errorOut = nullptr);

class SimulationEngine {
public:
    // Both fields are held by reference and must outlive the engine.
    SimulationEngine(const IElectricField& electricField, const IMagneticField& magneticField);

    // Advances every particle in lockstep for config.StepCount() RK4 steps and writes the final
    // kinematics back into `particles`. On any non-Ok status nothing is stepped or modified.
    RunStatus Run(
        std::vector<Particle>& particles,
        const SimulationConfig& config,
        double startTime_s,
        SimulationResult* outResult,
        std::string* errorOut = nullptr) const;

    AccelerationFn AccelerationFor(const Particle& particle) const;

    const IElectricField& ElectricField() const { return electricField_; }
    const IMagneticField& MagneticField() const { return magneticField_; }

private:
    const IElectricField& electricField_;
    const IMagneticField& magneticField_;
};

}  // namespace lorentz
