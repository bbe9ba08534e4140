#pragma once

#include <functional>
#include <vector>

#include "lorentz/types.hpp"

namespace lorentz {

struct State {
    double time_s = 0.0;
    Vec2 position_m;
    Vec2 velocity_mPerS;
};

using Trajectory = std::vector<State>;

// a(t, x, v) in m/s^2.
using AccelerationFn = std::function<Vec2(double time_s, const Vec2& position_m, const Vec2& velocity_mPerS)>;

// One classical fourth-order Runge-Kutta step of x' = v, v' = a(t, x, v).
// Pure: identical inputs give bit-identical outputs. dt_s > 0 is the caller's job.
State Rk4Step(const State& state, double dt_s, const AccelerationFn& acceleration);

}  // namespace lorentz
