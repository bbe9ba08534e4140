#include "lorentz/session.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

#include "lorentz/diagnostics.hpp"

namespace lorentz {

namespace {

const std::deque<Vec2> kEmptyTrail;

}  // namespace

InteractiveSession::InteractiveSession(const SessionConfig& config, std::vector<Particle> particles)
    : config_(config),
      electricField_(config.electricField_VPerM),
      magneticField_(config.magneticField_T),
      engine_(electricField_, magneticField_),
      particles_(std::move(particles)),
      initialParticles_(particles_) {
    RecordTrails();
}

std::size_t InteractiveSession::StepsPerFrame() const {
    if (!(config_.timeStep_s > 0.0) || !(config_.maxFrameTime_s > 0.0)) {
        return 1;
    }
    const double steps = std::floor(config_.maxFrameTime_s / config_.timeStep_s);
    if (!StepCountRepresentable(steps)) {
        return 0;
    }
    return std::max<std::size_t>(1, static_cast<std::size_t>(steps));
}

RunStatus InteractiveSession::AdvanceFrame(std::string* errorOut) {
    if (paused_) {
        return RunStatus::Ok;
    }

    const std::size_t steps = StepsPerFrame();
    if (steps == 0) {
        if (errorOut != nullptr) {
            std::ostringstream oss;
            oss << "maxFrameTime_s / timeStep_s is not a representable step count: " << config_.maxFrameTime_s
                << " / " << config_.timeStep_s;
            *errorOut = oss.str();
        }
        return RunStatus::InvalidConfiguration;
    }
    SimulationConfig frameConfig;
    frameConfig.timeStep_s = config_.timeStep_s;
    // Half a step of slack keeps floor(duration / dt) from landing one short.
    frameConfig.totalDuration_s = (static_cast<double>(steps) + 0.5) * config_.timeStep_s;
    frameConfig.recordTrajectory = false;

    SimulationResult result;
    const RunStatus status = engine_.Run(particles_, frameConfig, time_s_, &result, errorOut);
    if (status != RunStatus::Ok) {
        return status;
    }

    if (!result.finalStates.empty()) {
        time_s_ = result.finalStates.front().time_s;
    } else {
        time_s_ += static_cast<double>(steps) * config_.timeStep_s;
    }
    ++frame_;
    RecordTrails();
    return RunStatus::Ok;
}

void InteractiveSession::RecordTrails() {
    if (config_.trailLength == 0) {
        return;
    }
    for (const Particle& particle : particles_) {
        std::deque<Vec2>& trail = trails_[particle.id];
        trail.push_back(particle.position_m);
        while (trail.size() > config_.trailLength) {
            trail.pop_front();
        }
    }
}

const std::deque<Vec2>& InteractiveSession::TrailFor(uint32_t particleId) const {
    const auto it = trails_.find(particleId);
    return (it == trails_.end()) ? kEmptyTrail : it->second;
}

void InteractiveSession::AdjustElectricField(const Vec2& delta_VPerM) {
    electricField_.AdjustField(delta_VPerM);
}

void InteractiveSession::AdjustMagneticFieldZ(double delta_T) {
    magneticField_.AdjustField(Vec3(0.0, 0.0, delta_T));
}

void InteractiveSession::AdjustVelocities(const Vec2& delta_mPerS) {
    for (Particle& particle : particles_) {
        particle.AdjustVelocity(delta_mPerS);
    }
}

void InteractiveSession::Reset() {
    electricField_.SetField(config_.electricField_VPerM);
    magneticField_.SetField(config_.magneticField_T);
    particles_ = initialParticles_;
    time_s_ = 0.0;
    frame_ = 0;
    trails_.clear();
    RecordTrails();
}

SessionSnapshot InteractiveSession::Snapshot() const {
    SessionSnapshot snapshot;
    snapshot.frame = frame_;
    snapshot.time_s = time_s_;
    snapshot.particleCount = particles_.size();
    snapshot.electricField_VPerM = electricField_.Field();
    snapshot.magneticField_T = magneticField_.Field();

    double speedSum = 0.0;
    for (const Particle& particle : particles_) {
        snapshot.totalKinetic_J += KineticEnergy(particle.mass_kg, particle.velocity_mPerS);
        speedSum += particle.velocity_mPerS.Magnitude();
    }
    if (!particles_.empty()) {
        snapshot.meanSpeed_mPerS = speedSum / static_cast<double>(particles_.size());
    }

    snapshot.finite = IsFiniteKinematics(particles_) && std::isfinite(snapshot.time_s) &&
                      std::isfinite(snapshot.totalKinetic_J);
    return snapshot;
}

bool InteractiveSession::HasFiniteState() const {
    return Snapshot().finite;
}

}  // namespace lorentz
