#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <unordered_map>
#include <vector>

#include "lorentz/config.hpp"
#include "lorentz/engine.hpp"
#include "lorentz/fields.hpp"
#include "lorentz/particle.hpp"

namespace lorentz {

struct SessionSnapshot {
    uint64_t frame = 0;
    double time_s = 0.0;
    std::size_t particleCount = 0;
    double totalKinetic_J = 0.0;
    double meanSpeed_mPerS = 0.0;
    Vec2 electricField_VPerM;
    Vec3 magneticField_T;
    bool finite = true;
};

// Frame-by-frame driver for a viewer: owns the fields, the engine and the particles, applies
// incremental adjustments between frames and keeps per-particle trails keyed by particle id.
class InteractiveSession {
public:
    InteractiveSession(const SessionConfig& config, std::vector<Particle> particles);

    InteractiveSession(const InteractiveSession&) = delete;
    InteractiveSession& operator=(const InteractiveSession&) = delete;

    RunStatus AdvanceFrame(std::string* errorOut = nullptr);
    // At least 1; 0 only when maxFrameTime_s / timeStep_s overflows std::size_t.
    std::size_t StepsPerFrame() const;

    void AdjustElectricField(const Vec2& delta_VPerM);
    void AdjustMagneticFieldZ(double delta_T);
    void AdjustVelocities(const Vec2& delta_mPerS);
    void Reset();

    void SetPaused(bool paused) { paused_ = paused; }
    bool Paused() const { return paused_; }

    SessionSnapshot Snapshot() const;
    bool HasFiniteState() const;
    void PrintTelemetry() const;

    const std::vector<Particle>& Particles() const { return particles_; }
    std::vector<Particle>& MutableParticles() { return particles_; }
    const std::deque<Vec2>& TrailFor(uint32_t particleId) const;
    double TimeSeconds() const { return time_s_; }
    uint64_t FrameCount() const { return frame_; }

    const UniformElectricField& ElectricField() const { return electricField_; }
    const UniformMagneticField& MagneticField() const { return magneticField_; }
    const SimulationEngine& Engine() const { return engine_; }
    const SessionConfig& Config() const { return config_; }

private:
    void RecordTrails();

    SessionConfig config_;
    UniformElectricField electricField_;
    UniformMagneticField magneticField_;
    SimulationEngine engine_;

    std::vector<Particle> particles_;
    std::vector<Particle> initialParticles_;
    std::unordered_map<uint32_t, std::deque<Vec2>> trails_;

    double time_s_ = 0.0;
    uint64_t frame_ = 0;
    bool paused_ = false;
};

}  // namespace lorentz
