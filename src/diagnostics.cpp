#include "lorentz/diagnostics.hpp"

#include <algorithm>
#include <cmath>

namespace lorentz {

double KineticEnergy(double mass_kg, const Vec2& velocity_mPerS) {
    return 0.5 * mass_kg * Vec2::Dot(velocity_mPerS, velocity_mPerS);
}

EnergyDeviation ParticleEnergyDeviation(double mass_kg, const Trajectory& trajectory) {
    EnergyDeviation deviation;
    if (trajectory.empty()) {
        return deviation;
    }

    const double e0_J = KineticEnergy(mass_kg, trajectory.front().velocity_mPerS);
    const double denominator = (e0_J != 0.0) ? e0_J : 1.0;

    for (const State& sample : trajectory) {
        const double absolute_J = std::abs(KineticEnergy(mass_kg, sample.velocity_mPerS) - e0_J);
        deviation.maxAbsolute_J = std::max(deviation.maxAbsolute_J, absolute_J);
        deviation.maxRelative = std::max(deviation.maxRelative, absolute_J / denominator);
    }
    return deviation;
}

bool WithinTolerance(const EnergyDeviation& deviation, const EnergyTolerance& tolerance) {
    const bool relativeOk = deviation.maxRelative <= tolerance.relative;
    const bool absoluteOk = deviation.maxAbsolute_J <= tolerance.absolute_J;
    switch (tolerance.mode) {
        case ToleranceMode::Either:
            return relativeOk || absoluteOk;
        case ToleranceMode::Both:
            return relativeOk && absoluteOk;
    }
    return false;
}

EnergyConservationCheck VerifyMagneticEnergyConservation(
    const std::vector<Particle>& particles,
    const std::vector<Trajectory>& trajectories,
    const EnergyTolerance& tolerance) {
    EnergyConservationCheck check;
    const std::size_t count = std::min(particles.size(), trajectories.size());
    check.maxRelativeDeviation.reserve(count);
    check.maxAbsoluteDeviation_J.reserve(count);

    for (std::size_t i = 0; i < count; ++i) {
        const EnergyDeviation deviation = ParticleEnergyDeviation(particles[i].mass_kg, trajectories[i]);
        check.maxRelativeDeviation.push_back(deviation.maxRelative);
        check.maxAbsoluteDeviation_J.push_back(deviation.maxAbsolute_J);
        if (!WithinTolerance(deviation, tolerance)) {
            check.passed = false;
        }
    }
    return check;
}

}  // namespace lorentz
