#include <cstddef>
#include <iostream>
#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "lorentz/session.hpp"

namespace {

using lorentz::InteractiveSession;
using lorentz::Particle;
using lorentz::RunStatus;
using lorentz::SessionConfig;
using lorentz::Vec2;
using lorentz::Vec3;

SessionConfig SmallFrameConfig() {
    SessionConfig config;
    config.timeStep_s = 5.0e-12;
    config.maxFrameTime_s = 1.0e-10;
    config.trailLength = 4;
    return config;
}

std::vector<Particle> TwoElectrons() {
    return {
        lorentz::MakeElectron(7, Vec2::Zero(), Vec2(1.0e5, 0.0)),
        lorentz::MakeElectron(42, Vec2(1.0e-5, 0.0), Vec2(0.0, 5.0e4)),
    };
}

}  // namespace

TEST(SessionTest, StepsPerFrameTruncatesWithFloorOfOne) {
    SessionConfig config = SmallFrameConfig();
    EXPECT_EQ(InteractiveSession(config, {}).StepsPerFrame(), static_cast<std::size_t>(20));

    config.maxFrameTime_s = 1.0e-13;
    EXPECT_EQ(InteractiveSession(config, {}).StepsPerFrame(), static_cast<std::size_t>(1));
}

TEST(SessionTest, OverflowingFrameRatioIsRejected) {
    SessionConfig config = SmallFrameConfig();
    config.timeStep_s = 1.0e-300;
    config.maxFrameTime_s = 1.0e300;
    InteractiveSession session(config, TwoElectrons());
    EXPECT_EQ(session.StepsPerFrame(), static_cast<std::size_t>(0));

    std::string error;
    EXPECT_EQ(session.AdvanceFrame(&error), RunStatus::InvalidConfiguration);
    EXPECT_NE(error.find("step count"), std::string::npos);
    EXPECT_EQ(session.FrameCount(), static_cast<uint64_t>(0));
    EXPECT_EQ(session.Particles()[0].position_m, Vec2::Zero());
}

TEST(SessionTest, DirectParticleEditsAreStepped) {
    InteractiveSession session(SmallFrameConfig(), TwoElectrons());
    session.MutableParticles()[0].SetVelocity(Vec2::Zero());
    session.AdjustMagneticFieldZ(-0.1);

    ASSERT_EQ(session.AdvanceFrame(), RunStatus::Ok);
    EXPECT_EQ(session.Particles()[0].position_m, Vec2::Zero());
    EXPECT_NE(session.Particles()[1].position_m, Vec2(1.0e-5, 0.0));
}

TEST(SessionTest, TelemetryLeavesStreamPrecisionUntouched) {
    InteractiveSession session(SmallFrameConfig(), TwoElectrons());
    const std::streamsize saved = std::cout.precision(3);

    session.PrintTelemetry();
    EXPECT_EQ(std::cout.precision(), static_cast<std::streamsize>(3));
    std::cout.precision(saved);
}

TEST(SessionTest, AdvanceFrameMovesTimeByWholeSteps) {
    InteractiveSession session(SmallFrameConfig(), TwoElectrons());

    ASSERT_EQ(session.AdvanceFrame(), RunStatus::Ok);
    EXPECT_NEAR(session.TimeSeconds(), 1.0e-10, 1.0e-20);
    ASSERT_EQ(session.AdvanceFrame(), RunStatus::Ok);
    EXPECT_NEAR(session.TimeSeconds(), 2.0e-10, 1.0e-20);
    EXPECT_EQ(session.FrameCount(), static_cast<uint64_t>(2));
    EXPECT_NE(session.Particles()[0].position_m, Vec2::Zero());
}

TEST(SessionTest, PausedSessionDoesNotStep) {
    InteractiveSession session(SmallFrameConfig(), TwoElectrons());
    EXPECT_FALSE(session.Paused());
    session.SetPaused(true);
    EXPECT_TRUE(session.Paused());

    ASSERT_EQ(session.AdvanceFrame(), RunStatus::Ok);
    EXPECT_EQ(session.TimeSeconds(), 0.0);
    EXPECT_EQ(session.Particles()[0].position_m, Vec2::Zero());

    session.SetPaused(false);
    ASSERT_EQ(session.AdvanceFrame(), RunStatus::Ok);
    EXPECT_GT(session.TimeSeconds(), 0.0);
}

TEST(SessionTest, FieldAdjustmentsAreIncrementalAndVisibleToEngine) {
    InteractiveSession session(SmallFrameConfig(), TwoElectrons());

    session.AdjustMagneticFieldZ(0.05);
    session.AdjustMagneticFieldZ(0.05);
    EXPECT_NEAR(session.MagneticField().Field().z, 0.2, 1.0e-15);
    EXPECT_NEAR(session.Engine().MagneticField().FieldAt(0.0, Vec2::Zero()).z, 0.2, 1.0e-15);

    session.AdjustElectricField(Vec2(10.0, -5.0));
    EXPECT_EQ(session.Engine().ElectricField().FieldAt(0.0, Vec2::Zero()), Vec2(10.0, -5.0));
}

TEST(SessionTest, VelocityAdjustmentAppliesToEveryParticle) {
    InteractiveSession session(SmallFrameConfig(), TwoElectrons());
    session.AdjustVelocities(Vec2(100.0, -100.0));

    EXPECT_EQ(session.Particles()[0].velocity_mPerS, Vec2(1.0e5 + 100.0, -100.0));
    EXPECT_EQ(session.Particles()[1].velocity_mPerS, Vec2(100.0, 5.0e4 - 100.0));
}

TEST(SessionTest, ResetRestoresInitialFieldsKinematicsAndTrails) {
    InteractiveSession session(SmallFrameConfig(), TwoElectrons());
    session.AdjustMagneticFieldZ(0.3);
    session.AdjustElectricField(Vec2(1.0, 1.0));
    session.AdjustVelocities(Vec2(10.0, 0.0));
    for (int i = 0; i < 3; ++i) {
        ASSERT_EQ(session.AdvanceFrame(), RunStatus::Ok);
    }

    session.Reset();

    EXPECT_EQ(session.TimeSeconds(), 0.0);
    EXPECT_EQ(session.FrameCount(), static_cast<uint64_t>(0));
    EXPECT_EQ(session.MagneticField().Field(), Vec3(0.0, 0.0, 0.1));
    EXPECT_EQ(session.ElectricField().Field(), Vec2::Zero());
    EXPECT_EQ(session.Particles()[0].position_m, Vec2::Zero());
    EXPECT_EQ(session.Particles()[0].velocity_mPerS, Vec2(1.0e5, 0.0));
    EXPECT_EQ(session.Particles()[1].position_m, Vec2(1.0e-5, 0.0));
    EXPECT_EQ(session.TrailFor(7).size(), static_cast<std::size_t>(1));
}

TEST(SessionTest, TrailsAreKeyedByIdAndBounded) {
    InteractiveSession session(SmallFrameConfig(), TwoElectrons());
    EXPECT_EQ(session.TrailFor(7).size(), static_cast<std::size_t>(1));
    EXPECT_EQ(session.TrailFor(42).size(), static_cast<std::size_t>(1));
    EXPECT_TRUE(session.TrailFor(0).empty());

    for (int i = 0; i < 10; ++i) {
        ASSERT_EQ(session.AdvanceFrame(), RunStatus::Ok);
    }

    EXPECT_EQ(session.TrailFor(7).size(), static_cast<std::size_t>(4));
    EXPECT_EQ(session.TrailFor(7).back(), session.Particles()[0].position_m);
    EXPECT_EQ(session.TrailFor(42).back(), session.Particles()[1].position_m);
}

TEST(SessionTest, InvalidParticleSurfacesAsRunStatus) {
    std::vector<Particle> particles = TwoElectrons();
    particles[1].mass_kg = 0.0;
    InteractiveSession session(SmallFrameConfig(), particles);

    std::string error;
    EXPECT_EQ(session.AdvanceFrame(&error), RunStatus::InvalidParticle);
    EXPECT_FALSE(error.empty());
    EXPECT_EQ(session.TimeSeconds(), 0.0);
    EXPECT_EQ(session.FrameCount(), static_cast<uint64_t>(0));
}

TEST(SessionTest, SnapshotSummarizesKinematicsAndFields) {
    InteractiveSession session(SmallFrameConfig(), TwoElectrons());
    const lorentz::SessionSnapshot snapshot = session.Snapshot();

    const double expectedKinetic_J =
        0.5 * lorentz::constants::kElectronMass_kg * ((1.0e5 * 1.0e5) + (5.0e4 * 5.0e4));
    EXPECT_EQ(snapshot.particleCount, static_cast<std::size_t>(2));
    EXPECT_NEAR(snapshot.totalKinetic_J, expectedKinetic_J, expectedKinetic_J * 1.0e-12);
    EXPECT_DOUBLE_EQ(snapshot.meanSpeed_mPerS, 7.5e4);
    EXPECT_EQ(snapshot.magneticField_T, Vec3(0.0, 0.0, 0.1));
    EXPECT_TRUE(snapshot.finite);
    EXPECT_TRUE(session.HasFiniteState());
}

TEST(SessionTest, MagneticOnlyFramesPreserveSpeed) {
    InteractiveSession session(SmallFrameConfig(), TwoElectrons());
    for (int i = 0; i < 20; ++i) {
        ASSERT_EQ(session.AdvanceFrame(), RunStatus::Ok);
    }
    EXPECT_NEAR(session.Particles()[0].velocity_mPerS.Magnitude(), 1.0e5, 1.0);
    EXPECT_NEAR(session.Particles()[1].velocity_mPerS.Magnitude(), 5.0e4, 0.5);
}
