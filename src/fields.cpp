#include "lorentz/fields.hpp"

namespace lorentz {

Vec2 UniformElectricField::FieldAt(double time_s, const Vec2& position_m) const {
    (void)time_s;
    (void)position_m;
    return field_VPerM_;
}

void UniformElectricField::AdjustField(const Vec2& delta_VPerM) {
    field_VPerM_ = field_VPerM_ + delta_VPerM;
}

Vec3 UniformMagneticField::FieldAt(double time_s, const Vec2& position_m) const {
    (void)time_s;
    (void)position_m;
    return field_T_;
}

void UniformMagneticField::AdjustField(const Vec3& delta_T) {
    field_T_ = field_T_ + delta_T;
}

}  // namespace lorentz
