#include "lorentz/session.hpp"

#include <iomanip>
#include <iostream>

namespace lorentz {

void InteractiveSession::PrintTelemetry() const {
    const SessionSnapshot snapshot = Snapshot();
    const std::streamsize previousPrecision = std::cout.precision();

    std::cout << "[Frame " << std::setw(5) << snapshot.frame << " | Time " << std::scientific
              << std::setprecision(6) << snapshot.time_s << " s] "
              << "Particles: " << snapshot.particleCount << " | "
              << "E_V_per_m: (" << snapshot.electricField_VPerM.x << ", " << snapshot.electricField_VPerM.y << ") "
              << "B_T: (" << snapshot.magneticField_T.x << ", " << snapshot.magneticField_T.y << ", "
              << snapshot.magneticField_T.z << ") | "
              << "kinetic_J: " << snapshot.totalKinetic_J
              << " mean_speed_m_per_s: " << snapshot.meanSpeed_mPerS
              << " finite: " << (snapshot.finite ? "true" : "false") << '\n'
              << std::defaultfloat << std::setprecision(previousPrecision);
}

}  // namespace lorentz
