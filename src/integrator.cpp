#include "lorentz/integrator.hpp"

namespace lorentz {

State Rk4Step(const State& state, double dt_s, const AccelerationFn& acceleration) {
    const double halfDt = 0.5 * dt_s;
    const double t0 = state.time_s;
    const Vec2& x0 = state.position_m;
    const Vec2& v0 = state.velocity_mPerS;

    // x' = v, so each stage's position slope is the stage velocity.
    const Vec2 k1x = v0;
    const Vec2 k1v = acceleration(t0, x0, v0);

    const Vec2 k2x = v0 + (k1v * halfDt);
    const Vec2 k2v = acceleration(t0 + halfDt, x0 + (k1x * halfDt), k2x);

    const Vec2 k3x = v0 + (k2v * halfDt);
    const Vec2 k3v = acceleration(t0 + halfDt, x0 + (k2x * halfDt), k3x);

    const Vec2 k4x = v0 + (k3v * dt_s);
    const Vec2 k4v = acceleration(t0 + dt_s, x0 + (k3x * dt_s), k4x);

    const double sixthDt = dt_s / 6.0;
    State next;
    next.time_s = t0 + dt_s;
    next.position_m = x0 + ((k1x + (k2x * 2.0) + (k3x * 2.0) + k4x) * sixthDt);
    next.velocity_mPerS = v0 + ((k1v + (k2v * 2.0) + (k3v * 2.0) + k4v) * sixthDt);
    return next;
}

}  // namespace lorentz
