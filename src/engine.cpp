#include "lorentz/engine.hpp"

#include <cmath>
#include <limits>
#include <sstream>
#include <utility>

#include "lorentz/lorentz_force.hpp"

namespace lorentz {

std::size_t SimulationConfig::StepCount() const {
    if (!(timeStep_s > 0.0) || !(totalDuration_s > 0.0)) {
        return 0;
    }
    const double steps = std::floor(totalDuration_s / timeStep_s);
    if (!StepCountRepresentable(steps)) {
        return 0;
    }
    return static_cast<std::size_t>(steps);
}

bool StepCountRepresentable(double steps) {
    return std::isfinite(steps) && steps >= 0.0 &&
           steps < static_cast<double>(std::numeric_limits<std::size_t>::max());
}

bool ValidateSimulationConfig(const SimulationConfig& config, std::string* errorOut) {
    if (!std::isfinite(config.timeStep_s) || config.timeStep_s <= 0.0) {
        if (errorOut != nullptr) {
            std::ostringstream oss;
            oss << "timeStep_s must be positive and finite, got " << config.timeStep_s;
            *errorOut = oss.str();
        }
        return false;
    }
    if (!std::isfinite(config.totalDuration_s) || config.totalDuration_s <= 0.0) {
        if (errorOut != nullptr) {
            std::ostringstream oss;
            oss << "totalDuration_s must be positive and finite, got " << config.totalDuration_s;
            *errorOut = oss.str();
        }
        return false;
    }
    if (!StepCountRepresentable(std::floor(config.totalDuration_s / config.timeStep_s))) {
        if (errorOut != nullptr) {
            std::ostringstream oss;
            oss << "totalDuration_s / timeStep_s is not a representable step count: " << config.totalDuration_s
                << " / " << config.timeStep_s;
            *errorOut = oss.str();
        }
        return false;
    }
    return true;
}

SimulationEngine::SimulationEngine(const IElectricField& electricField, const IMagneticField& magneticField)
    : electricField_(electricField), magneticField_(magneticField) {}

AccelerationFn SimulationEngine::AccelerationFor(const Particle& particle) const {
    const double charge_C = particle.charge_C;
    const double mass_kg = particle.mass_kg;
    const IElectricField* electricField = &electricField_;
    const IMagneticField* magneticField = &magneticField_;

    return [charge_C, mass_kg, electricField, magneticField](
               double time_s, const Vec2& position_m, const Vec2& velocity_mPerS) {
        const Vec2 force_N =
            LorentzForce(charge_C, velocity_mPerS, *electricField, *magneticField, time_s, position_m);
        return Vec2(force_N.x / mass_kg, force_N.y / mass_kg);
    };
}

RunStatus SimulationEngine::Run(
    std::vector<Particle>& particles,
    const SimulationConfig& config,
    double startTime_s,
    SimulationResult* outResult,
    std::string* errorOut) const {
    if (!ValidateSimulationConfig(config, errorOut)) {
        return RunStatus::InvalidConfiguration;
    }
    for (const Particle& particle : particles) {
        if (!IsValidParticle(particle, errorOut)) {
            return RunStatus::InvalidParticle;
        }
    }

    const std::size_t stepCount = config.StepCount();
    const std::size_t particleCount = particles.size();

    std::vector<State> states;
    std::vector<AccelerationFn> accelerations;
    std::vector<Trajectory> trajectories(particleCount);
    states.reserve(particleCount);
    accelerations.reserve(particleCount);

    for (std::size_t i = 0; i < particleCount; ++i) {
        State initial;
        initial.time_s = startTime_s;
        initial.position_m = particles[i].position_m;
        initial.velocity_mPerS = particles[i].velocity_mPerS;
        states.push_back(initial);
        accelerations.push_back(AccelerationFor(particles[i]));

        if (config.recordTrajectory) {
            trajectories[i].reserve(stepCount + 1);
            trajectories[i].push_back(initial);
        }
    }

    for (std::size_t step = 0; step < stepCount; ++step) {
        // Each particle reads only its own previous state, so the order within a step is free.
        for (std::size_t i = 0; i < particleCount; ++i) {
            states[i] = Rk4Step(states[i], config.timeStep_s, accelerations[i]);
            if (config.recordTrajectory) {
                trajectories[i].push_back(states[i]);
            }
        }
    }

    for (std::size_t i = 0; i < particleCount; ++i) {
        particles[i].position_m = states[i].position_m;
        particles[i].velocity_mPerS = states[i].velocity_mPerS;
    }

    if (outResult != nullptr) {
        outResult->finalStates = std::move(states);
        outResult->trajectories = std::move(trajectories);
    }
    return RunStatus::Ok;
}

}  // namespace lorentz
