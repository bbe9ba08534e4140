#include "lorentz/lorentz_force.hpp"

namespace lorentz {

Vec3 CrossInPlane(const Vec2& velocity, const Vec3& magneticField_T) {
    return Vec3(
        velocity.y * magneticField_T.z,
        -velocity.x * magneticField_T.z,
        (velocity.x * magneticField_T.y) - (velocity.y * magneticField_T.x));
}

Vec2 LorentzForce(
    double charge_C,
    const Vec2& velocity_mPerS,
    const IElectricField& electricField,
    const IMagneticField& magneticField,
    double time_s,
    const Vec2& position_m) {
    const Vec2 E = electricField.FieldAt(time_s, position_m);
    const Vec3 B = magneticField.FieldAt(time_s, position_m);
    const Vec3 vCrossB = CrossInPlane(velocity_mPerS, B);

    return Vec2(charge_C * (E.x + vCrossB.x), charge_C * (E.y + vCrossB.y));
}

}  // namespace lorentz
