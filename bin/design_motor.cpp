#include <iostream>
#include <iomanip>
#include <fstream>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include "design/motor_designer.hpp"
#include "utils/config_loader.hpp"
#include "utils/errors.hpp"

using namespace srm_design;

namespace {

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " <config.yaml> [--out-dir DIR] [--no-csv] [--verbose]\n"
              << "\n"
              << "Sizes a solid rocket motor (thrust, nozzle, BATES grain) for the target\n"
              << "apogee in the configuration and writes trajectory.csv and ballistics.csv.\n";
}

void writeTrajectoryCsv(const std::string& path, const TrajectoryResult& trajectory) {
    std::ofstream csv_file(path);
    if (!csv_file) {
        throw InvalidInput("cannot write " + path);
    }
    csv_file << std::setprecision(10);
    csv_file << "t,altitude,velocity,acceleration,mass,thrust,drag,mach,dynamic_pressure,chamber_pressure\n";
    for (const auto& s : trajectory.samples) {
        csv_file << s.t << "," << s.altitude << "," << s.velocity << "," << s.acceleration << ","
                 << s.mass << "," << s.thrust << "," << s.drag << "," << s.mach << ","
                 << s.dynamic_pressure << "," << s.chamber_pressure << "\n";
    }
}

void writeBallisticsCsv(const std::string& path, const design::BallisticsResult& ballistics) {
    std::ofstream csv_file(path);
    if (!csv_file) {
        throw InvalidInput("cannot write " + path);
    }
    csv_file << std::setprecision(10);
    csv_file << "t,regression,core_diameter,segment_length,burn_area,kn,chamber_pressure,"
                "burn_rate,mass_flow,thrust,propellant_remaining\n";
    for (const auto& s : ballistics.samples) {
        csv_file << s.t << "," << s.regression << "," << s.core_diameter << "," << s.segment_length << ","
                 << s.burn_area << "," << s.kn << "," << s.chamber_pressure << "," << s.burn_rate << ","
                 << s.mass_flow << "," << s.thrust << "," << s.propellant_remaining << "\n";
    }
}

void printSummary(const design::DesignResult& r) {
    std::cout << std::fixed << std::setprecision(3);
    std::cout << "=== Motor Design ===" << std::endl;
    std::cout << "Target apogee:        " << r.target_altitude << " m" << std::endl;
    std::cout << "Average thrust:       " << r.average_thrust << " N" << std::endl;
    std::cout << "Total impulse:        " << r.total_impulse << " Ns" << std::endl;
    std::cout << "Mass flow:            " << r.mass_flow << " kg/s" << std::endl;
    std::cout << "Required Isp:         " << r.required_isp << " s" << std::endl;
    std::cout << "Apogee (const. F):    " << r.trajectory.apogee_altitude << " m at "
              << r.trajectory.apogee_time << " s" << std::endl;
    std::cout << "Max velocity:         " << r.trajectory.max_velocity << " m/s" << std::endl;
    std::cout << "Max acceleration:     " << r.trajectory.max_acceleration / kStandardGravity << " g" << std::endl;
    std::cout << "Optimizer:            " << r.optimization.iterations << " iterations, "
              << r.optimization.evaluations << " evaluations" << std::endl;

    std::cout << "\n--- Nozzle ---" << std::endl;
    std::cout << "Chamber pressure:     " << r.nozzle.chamber_pressure * 1e-6 << " MPa" << std::endl;
    std::cout << "Throat diameter:      " << r.nozzle.throat_diameter * 1e3 << " mm" << std::endl;
    std::cout << "Exit diameter:        " << r.nozzle.exit_diameter * 1e3 << " mm" << std::endl;
    std::cout << "Expansion ratio:      " << r.nozzle.expansion_ratio << std::endl;
    std::cout << "Exit Mach:            " << r.nozzle.exit_mach << std::endl;
    std::cout << "Thrust coefficient:   " << r.nozzle.thrust_coefficient << std::endl;
    std::cout << "Delivered Isp:        " << r.nozzle.specific_impulse << " s" << std::endl;

    std::cout << "\n--- Grain (BATES) ---" << std::endl;
    std::cout << "Segments:             " << r.grain.segments << std::endl;
    std::cout << "Outer diameter:       " << r.grain.outer_diameter * 1e3 << " mm" << std::endl;
    std::cout << "Core diameter:        " << r.grain.core_diameter * 1e3 << " mm" << std::endl;
    std::cout << "Segment length:       " << r.grain.segment_length * 1e3 << " mm" << std::endl;
    std::cout << "Port/throat ratio:    " << r.grain_sizing.port_to_throat_ratio << std::endl;
    std::cout << "L/D:                  " << r.grain_sizing.length_to_diameter << std::endl;
    std::cout << "Erosive risk:         " << (r.grain_sizing.erosive_risk ? "yes" : "no") << std::endl;

    std::cout << "\n--- Ballistics ---" << std::endl;
    std::cout << "Burn time:            " << r.ballistics.burn_time << " s" << std::endl;
    std::cout << "Peak pressure:        " << r.ballistics.peak_pressure * 1e-6 << " MPa" << std::endl;
    std::cout << "Average pressure:     " << r.ballistics.average_pressure * 1e-6 << " MPa" << std::endl;
    std::cout << "Total impulse:        " << r.ballistics.total_impulse << " Ns" << std::endl;
    std::cout << "Propellant consumed:  " << r.ballistics.propellant_consumed << " kg" << std::endl;

    if (r.has_verification) {
        std::cout << "\n--- Verification flight ---" << std::endl;
        std::cout << "Apogee:               " << r.verification.apogee_altitude << " m at "
                  << r.verification.apogee_time << " s" << std::endl;
    }
    for (const auto& w : r.warnings) {
        std::cout << "WARNING: " << w << std::endl;
    }
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path;
    std::string out_dir = ".";
    bool write_csv = true;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--verbose" || arg == "-v") {
            spdlog::set_level(spdlog::level::debug);
        } else if (arg == "--no-csv") {
            write_csv = false;
        } else if (arg == "--out-dir" && i + 1 < argc) {
            out_dir = argv[++i];
        } else if (config_path.empty() && arg.rfind("-", 0) != 0) {
            config_path = arg;
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            printUsage(argv[0]);
            return 2;
        }
    }
    if (config_path.empty()) {
        printUsage(argv[0]);
        return 2;
    }

    try {
        design::DesignConfig config = config::loadDesignConfig(config_path);
        design::DesignResult result = design::designMotor(config);
        printSummary(result);

        if (write_csv) {
            writeTrajectoryCsv(out_dir + "/trajectory.csv", result.trajectory);
            writeBallisticsCsv(out_dir + "/ballistics.csv", result.ballistics);
            std::cout << "\nTime series saved to " << out_dir << "/trajectory.csv and "
                      << out_dir << "/ballistics.csv" << std::endl;
        }
    } catch (const NonConvergence& e) {
        spdlog::error("{}: {} (best candidate {}, value {})", toString(e.kind()), e.what(),
                      e.bestCandidate(), e.bestValue());
        return 1;
    } catch (const DesignError& e) {
        spdlog::error("{}: {}", toString(e.kind()), e.what());
        return 1;
    }
    return 0;
}
