#pragma once

#include <vector>

#include "lorentz/config.hpp"
#include "lorentz/integrator.hpp"
#include "lorentz/particle.hpp"

namespace lorentz {

double KineticEnergy(double mass_kg, const Vec2& velocity_mPerS);

struct EnergyDeviation {
    double maxRelative = 0.0;
    double maxAbsolute_J = 0.0;
};

struct EnergyConservationCheck {
    bool passed = true;
    std::vector<double> maxRelativeDeviation;
    std::vector<double> maxAbsoluteDeviation_J;
};

// Deviation of 0.5 m |v|^2 from its value at the first sample. Empty input yields zeros.
EnergyDeviation ParticleEnergyDeviation(double mass_kg, const Trajectory& trajectory);

bool WithinTolerance(const EnergyDeviation& deviation, const EnergyTolerance& tolerance);

// Magnetic-only check (E == 0): kinetic energy of each particle must stay near its initial value.
// Particles and trajectories are paired by index up to the shorter of the two.
EnergyConservationCheck VerifyMagneticEnergyConservation(
    const std::vector<Particle>& particles,
    const std::vector<Trajectory>& trajectories,
    const EnergyTolerance& tolerance = EnergyTolerance{});

}  // namespace lorentz
