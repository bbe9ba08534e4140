#include "lorentz/diagnostics.hpp"
#include "lorentz/session.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

namespace {

using lorentz::EnergyTolerance;
using lorentz::Particle;
using lorentz::RunStatus;
using lorentz::SessionConfig;
using lorentz::ToleranceMode;
using lorentz::Vec2;
using lorentz::Vec3;

struct CliOptions {
    SessionConfig sessionConfig;
    Vec2 initialVelocity_mPerS = Vec2(1.0e5, 0.0);
    int frames = 30;
    int telemetryEveryNFrames = 10;
    EnergyTolerance energyTolerance;
    bool energyCheck = true;
    bool helpRequested = false;
};

bool ParseInt(const char* text, int* outValue) {
    char* end = nullptr;
    errno = 0;
    const long parsed = std::strtol(text, &end, 10);
    if (errno != 0 || end == text || *end != '\0' || parsed < std::numeric_limits<int>::min() ||
        parsed > std::numeric_limits<int>::max()) {
        return false;
    }
    *outValue = static_cast<int>(parsed);
    return true;
}

bool ParseDouble(const char* text, double* outValue) {
    char* end = nullptr;
    errno = 0;
    const double parsed = std::strtod(text, &end);
    if (errno != 0 || end == text || *end != '\0' || !std::isfinite(parsed)) {
        return false;
    }
    *outValue = parsed;
    return true;
}

void PrintUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [options]\n"
              << "  --ex <V/m>            electric field Ex (default 0)\n"
              << "  --ey <V/m>            electric field Ey (default 0)\n"
              << "  --bz <T>              magnetic field Bz (default 0.1)\n"
              << "  --v0x <m/s>           initial velocity vx (default 1e5)\n"
              << "  --v0y <m/s>           initial velocity vy (default 0)\n"
              << "  --dt <seconds>        physics time step (default 5e-12)\n"
              << "  --frame-dt <seconds>  simulated time per frame (default 1e-6)\n"
              << "  --frames <int>        frames to advance (default 30)\n"
              << "  --telemetry-every <int>\n"
              << "  --energy-check <either|both>\n"
              << "  --no-energy-check\n"
              << "  --help\n";
}

bool ParseArgs(int argc, char** argv, CliOptions* options) {
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg(argv[i]);
        auto needValue = [&](const char* optionName) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << optionName << "\n";
                return nullptr;
            }
            return argv[++i];
        };
        auto parseDoubleOption = [&](const char* optionName, double* outValue) -> bool {
            const char* value = needValue(optionName);
            if (value == nullptr) {
                return false;
            }
            if (!ParseDouble(value, outValue)) {
                std::cerr << "Invalid value for " << optionName << ": " << value << "\n";
                return false;
            }
            return true;
        };

        if (arg == "--help") {
            PrintUsage(argv[0]);
            options->helpRequested = true;
            return false;
        }
        if (arg == "--ex") {
            if (!parseDoubleOption("--ex", &options->sessionConfig.electricField_VPerM.x)) {
                return false;
            }
            continue;
        }
        if (arg == "--ey") {
            if (!parseDoubleOption("--ey", &options->sessionConfig.electricField_VPerM.y)) {
                return false;
            }
            continue;
        }
        if (arg == "--bz") {
            if (!parseDoubleOption("--bz", &options->sessionConfig.magneticField_T.z)) {
                return false;
            }
            continue;
        }
        if (arg == "--v0x") {
            if (!parseDoubleOption("--v0x", &options->initialVelocity_mPerS.x)) {
                return false;
            }
            continue;
        }
        if (arg == "--v0y") {
            if (!parseDoubleOption("--v0y", &options->initialVelocity_mPerS.y)) {
                return false;
            }
            continue;
        }
        if (arg == "--dt") {
            double dt_s = 0.0;
            if (!parseDoubleOption("--dt", &dt_s)) {
                return false;
            }
            if (dt_s <= 0.0) {
                std::cerr << "Invalid dt: " << dt_s << " (expected > 0)\n";
                return false;
            }
            options->sessionConfig.timeStep_s = dt_s;
            continue;
        }
        if (arg == "--frame-dt") {
            double frameDt_s = 0.0;
            if (!parseDoubleOption("--frame-dt", &frameDt_s)) {
                return false;
            }
            if (frameDt_s <= 0.0) {
                std::cerr << "Invalid frame-dt: " << frameDt_s << " (expected > 0)\n";
                return false;
            }
            options->sessionConfig.maxFrameTime_s = frameDt_s;
            continue;
        }
        if (arg == "--frames") {
            const char* value = needValue("--frames");
            if (value == nullptr) {
                return false;
            }
            int frames = 0;
            if (!ParseInt(value, &frames) || frames < 0) {
                std::cerr << "Invalid frames: " << value << "\n";
                return false;
            }
            options->frames = frames;
            continue;
        }
        if (arg == "--telemetry-every") {
            const char* value = needValue("--telemetry-every");
            if (value == nullptr) {
                return false;
            }
            int cadence = 0;
            if (!ParseInt(value, &cadence) || cadence <= 0) {
                std::cerr << "Invalid telemetry cadence: " << value << "\n";
                return false;
            }
            options->telemetryEveryNFrames = cadence;
            continue;
        }
        if (arg == "--energy-check") {
            const char* value = needValue("--energy-check");
            if (value == nullptr) {
                return false;
            }
            ToleranceMode mode = ToleranceMode::Either;
            if (!lorentz::ParseToleranceMode(value, &mode)) {
                std::cerr << "Invalid energy-check mode: " << value << "\n";
                return false;
            }
            options->energyTolerance.mode = mode;
            options->energyCheck = true;
            continue;
        }
        if (arg == "--no-energy-check") {
            options->energyCheck = false;
            continue;
        }

        std::cerr << "Unknown option: " << arg << "\n";
        return false;
    }
    return true;
}

// Runs one cyclotron period with trajectory recording and checks kinetic energy drift.
int RunEnergyCheck(const CliOptions& options, const Particle& initialElectron) {
    const SessionConfig& sessionConfig = options.sessionConfig;
    const Vec2& e = sessionConfig.electricField_VPerM;
    if (e.x != 0.0 || e.y != 0.0) {
        std::cout << "ENERGY CHECK | skipped reason=electric-field-present\n";
        return 0;
    }
    const double bz_T = std::abs(sessionConfig.magneticField_T.z);
    if (bz_T == 0.0) {
        std::cout << "ENERGY CHECK | skipped reason=no-bz\n";
        return 0;
    }

    const double period_s =
        (2.0 * lorentz::constants::kPi * initialElectron.mass_kg) / (std::abs(initialElectron.charge_C) * bz_T);

    lorentz::UniformElectricField electricField(e);
    lorentz::UniformMagneticField magneticField(sessionConfig.magneticField_T);
    lorentz::SimulationEngine engine(electricField, magneticField);

    lorentz::SimulationConfig config;
    config.timeStep_s = sessionConfig.timeStep_s;
    config.totalDuration_s = period_s;
    config.recordTrajectory = true;

    std::vector<Particle> particles{initialElectron};
    lorentz::SimulationResult result;
    std::string error;
    const RunStatus status = engine.Run(particles, config, 0.0, &result, &error);
    if (status != RunStatus::Ok) {
        std::cerr << "Energy check run failed (" << lorentz::RunStatusName(status) << "): " << error << "\n";
        return 1;
    }

    const lorentz::EnergyConservationCheck check =
        lorentz::VerifyMagneticEnergyConservation(particles, result.trajectories, options.energyTolerance);
    std::cout << std::scientific << "ENERGY CHECK | passed=" << (check.passed ? "true" : "false")
              << " mode=" << lorentz::ToleranceModeName(options.energyTolerance.mode)
              << " period_s=" << period_s << " steps=" << config.StepCount()
              << " max_rel=" << check.maxRelativeDeviation.front()
              << " max_abs_J=" << check.maxAbsoluteDeviation_J.front() << "\n"
              << std::defaultfloat;
    return check.passed ? 0 : 2;
}

}  // namespace

int main(int argc, char** argv) {
    CliOptions options;
    if (!ParseArgs(argc, argv, &options)) {
        return options.helpRequested ? 0 : 1;
    }

    const Particle electron = lorentz::MakeElectron(0, Vec2::Zero(), options.initialVelocity_mPerS);
    lorentz::InteractiveSession session(options.sessionConfig, std::vector<Particle>{electron});

    const SessionConfig& config = options.sessionConfig;
    std::cout << "--- INITIALIZING ELECTRON SIMULATION ---\n";
    std::cout << "RUN MANIFEST | ex=" << config.electricField_VPerM.x << " ey=" << config.electricField_VPerM.y
              << " bz=" << config.magneticField_T.z << " v0x=" << options.initialVelocity_mPerS.x
              << " v0y=" << options.initialVelocity_mPerS.y << " dt_s=" << config.timeStep_s
              << " frame_dt_s=" << config.maxFrameTime_s << " steps_per_frame=" << session.StepsPerFrame()
              << " frames=" << options.frames << " telemetry_every=" << options.telemetryEveryNFrames << "\n";
    std::cout << "------------------------------------------------------------\n";

    session.PrintTelemetry();
    for (int frame = 1; frame <= options.frames; ++frame) {
        std::string error;
        const RunStatus status = session.AdvanceFrame(&error);
        if (status != RunStatus::Ok) {
            std::cerr << "Frame " << frame << " failed (" << lorentz::RunStatusName(status) << "): " << error << "\n";
            return 1;
        }
        if (frame % options.telemetryEveryNFrames == 0) {
            session.PrintTelemetry();
        }
    }

    if (!session.HasFiniteState()) {
        std::cerr << "Non-finite particle state after " << options.frames << " frames\n";
        return 1;
    }

    int exitCode = 0;
    if (options.energyCheck) {
        exitCode = RunEnergyCheck(options, electron);
    }

    std::cout << "------------------------------------------------------------\n";
    std::cout << "Simulation Complete.\n";
    return exitCode;
}
