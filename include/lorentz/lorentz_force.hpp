#pragma once

#include "lorentz/fields.hpp"

namespace lorentz {

// v x B with v = (vx, vy, 0).
Vec3 CrossInPlane(const Vec2& velocity, const Vec3& magneticField_T);

// In-plane part of q (E + v x B), in newtons. The out-of-plane component is dropped.
Vec2 LorentzForce(
    double charge_C,
    const Vec2& velocity_mPerS,
    const IElectricField& electricField,
    const IMagneticField& magneticField,
    double time_s,
    const Vec2& position_m);

}  // namespace lorentz
