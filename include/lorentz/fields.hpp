#pragma once

#include "lorentz/types.hpp"

namespace lorentz {

class IElectricField {
public:
    virtual ~IElectricField() = default;

    // In-plane field in V/m.
    virtual Vec2 FieldAt(double time_s, const Vec2& position_m) const = 0;
};

class IMagneticField {
public:
    virtual ~IMagneticField() = default;

    // Full 3D field in tesla; Bz is what bends in-plane motion.
    virtual Vec3 FieldAt(double time_s, const Vec2& position_m) const = 0;
};

class UniformElectricField final : public IElectricField {
public:
    explicit UniformElectricField(const Vec2& field_VPerM = Vec2::Zero()) : field_VPerM_(field_VPerM) {}

    Vec2 FieldAt(double time_s, const Vec2& position_m) const override;

    const Vec2& Field() const { return field_VPerM_; }
    void SetField(const Vec2& field_VPerM) { field_VPerM_ = field_VPerM; }
    void AdjustField(const Vec2& delta_VPerM);

private:
    Vec2 field_VPerM_;
};

class UniformMagneticField final : public IMagneticField {
public:
    explicit UniformMagneticField(const Vec3& field_T = Vec3::Zero()) : field_T_(field_T) {}

    Vec3 FieldAt(double time_s, const Vec2& position_m) const override;

    const Vec3& Field() const { return field_T_; }
    void SetField(const Vec3& field_T) { field_T_ = field_T; }
    void AdjustField(const Vec3& delta_T);

private:
    Vec3 field_T_;
};

}  // namespace lorentz
