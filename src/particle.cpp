#include "lorentz/particle.hpp"

#include <cmath>
#include <sstream>

#include "lorentz/config.hpp"

namespace lorentz {

Particle MakeElectron(uint32_t id, const Vec2& position_m, const Vec2& velocity_mPerS) {
    Particle electron;
    electron.id = id;
    electron.position_m = position_m;
    electron.velocity_mPerS = velocity_mPerS;
    electron.mass_kg = constants::kElectronMass_kg;
    electron.charge_C = constants::kElectronCharge_C;
    return electron;
}

bool IsValidParticle(const Particle& particle, std::string* errorOut) {
    if (!std::isfinite(particle.mass_kg) || particle.mass_kg <= 0.0) {
        if (errorOut != nullptr) {
            std::ostringstream oss;
            oss << "particle " << particle.id << " has non-positive or non-finite mass_kg=" << particle.mass_kg;
            *errorOut = oss.str();
        }
        return false;
    }
    return true;
}

bool IsFiniteKinematics(const std::vector<Particle>& particles) {
    for (const Particle& particle : particles) {
        if (!particle.position_m.IsFinite() || !particle.velocity_mPerS.IsFinite()) {
            return false;
        }
    }
    return true;
}

}  // namespace lorentz
