// anomaly_check.cpp
// Print the anomaly cancellation report for one fermion spectrum
//
// Usage:
//   ./anomaly_check [--model sm|sm-nu|custom] [--json spectrum.json] [--test]
//
//   sm      : one SM generation (default)
//   sm-nu   : one SM generation + right-handed neutrino
//   custom  : {"fermions": [...]} from --json
//   --test  : SM, SM + nu_R, SM + vector-like quark doublet, broken Q_L
//
// Exit status: 0 anomaly-free, 2 anomalies remain, 1 usage / input error
//
// Compile:
//   g++ -std=c++17 -O2 -o anomaly_check anomaly_check.cpp \
//       -I/usr/include/eigen3 -I. -lcrypto

#include <iostream>
#include <string>
#include <vector>

#include "fermion.h"
#include "anomaly_checker.h"

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [--model sm|sm-nu|custom] [--json FILE] [--test]\n"
              << "Options:\n"
              << "  --model M   Model to check: sm (default), sm-nu, custom\n"
              << "  --json F    Spectrum file for --model custom ({\"fermions\": [...]})\n"
              << "  --test      Run the built-in model variations\n";
}

void run_model_variations() {
    std::cout << "Testing Model Variations\n" << std::string(40, '=') << "\n";

    std::cout << "\n1. Standard Model (no ν_R):\n";
    AnomalyChecker sm(standard_model_spectrum(false));
    std::cout << sm.generate_report();

    std::cout << "\n2. Standard Model (with ν_R):\n";
    AnomalyChecker sm_nu(standard_model_spectrum(true));
    std::cout << sm_nu.generate_report();

    std::cout << "\n3. SM + Vector-like quark doublet:\n";
    Spectrum vlq = standard_model_spectrum(false);
    vlq.push_back(Fermion("Q'_L", 3, 2, make_rational(1, 6), 1));
    vlq.push_back(Fermion("Q'_R", 3, 2, make_rational(1, 6), -1));
    AnomalyChecker vlq_checker(vlq);
    std::cout << vlq_checker.generate_report();

    std::cout << "\n4. Broken model (wrong hypercharge):\n";
    Spectrum broken = standard_model_spectrum(false);
    broken[0] = broken[0].with_hypercharge(make_rational(1, 3));
    AnomalyChecker broken_checker(broken);
    CancellationResult res = broken_checker.verify_cancellation();
    std::cout << "Anomalies cancel: " << (res.all_cancel ? "true" : "false") << "\n";
    if (!res.all_cancel) {
        std::cout << "Failed anomalies:";
        for (size_t i = 0; i < res.failures.size() && i < 3; i++)
            std::cout << (i ? ", " : " ") << res.failures[i];
        std::cout << "\n";
    }
}

int main(int argc, char** argv) {
    std::string model = "sm";
    std::string json_file;
    bool test = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--model" && i + 1 < argc) model = argv[++i];
        else if (arg == "--json" && i + 1 < argc) json_file = argv[++i];
        else if (arg == "--test") test = true;
        else if (arg == "-h" || arg == "--help") { print_usage(argv[0]); return 0; }
        else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (test) {
        run_model_variations();
        return 0;
    }

    Spectrum fermions;
    try {
        if (model == "sm") {
            fermions = standard_model_spectrum(false);
        } else if (model == "sm-nu") {
            fermions = standard_model_spectrum(true);
        } else if (model == "custom" && !json_file.empty()) {
            fermions = load_spectrum_file(json_file);
        } else if (model == "custom") {
            std::cerr << "Custom model requires --json parameter\n";
            return 1;
        } else {
            std::cerr << "Unknown model: " << model << "\n";
            print_usage(argv[0]);
            return 1;
        }
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const ValidationError& e) {
        std::cerr << "Invalid fermion (" << e.field() << "): " << e.what() << "\n";
        return 1;
    }

    AnomalyChecker checker(fermions);
    std::cout << checker.generate_report();
    return checker.is_anomaly_free() ? 0 : 2;
}
