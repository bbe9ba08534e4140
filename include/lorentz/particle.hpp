#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "lorentz/types.hpp"

namespace lorentz {

struct Particle {
    uint32_t id = 0;
    Vec2 position_m;
    Vec2 velocity_mPerS;
    double mass_kg = 0.0;
    double charge_C = 0.0;

    void SetPosition(const Vec2& position) { position_m = position; }
    void SetVelocity(const Vec2& velocity) { velocity_mPerS = velocity; }
    void Translate(const Vec2& delta_m) { position_m = position_m + delta_m; }
    void AdjustVelocity(const Vec2& delta_mPerS) { velocity_mPerS = velocity_mPerS + delta_mPerS; }
};

Particle MakeElectron(uint32_t id, const Vec2& position_m, const Vec2& velocity_mPerS);

// Mass must be finite and positive; charge may be zero.
bool IsValidParticle(const Particle& particle, std::string* errorOut = nullptr);

bool IsFiniteKinematics(const std::vector<Particle>& particles);

}  // namespace lorentz
