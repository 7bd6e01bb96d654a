// param_scan.cpp
// Scan blocks A / B / B' / C for anomaly-free extensions of a template spectrum
//
// Usage:
//   ./param_scan <template.json> [options]
//
// Template: {"base_spectrum": [...], "scan_config": {...}}
// Output:
//   <results-dir>/<tag>_<sha1[0:10]>.json   one file per anomaly-free model
//   <output>                                export of all models + config
//
// Compile:
//   g++ -std=c++17 -O2 -pthread -o param_scan param_scan.cpp \
//       -I/usr/include/eigen3 -I. -lcrypto

#include <algorithm>
#include <iostream>
#include <string>
#include <thread>

#include "fermion.h"
#include "candidate_generator.h"
#include "result_store.h"
#include "param_space_scanner.h"

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <template.json> [options]\n"
              << "Options:\n"
              << "  --output F        Export file (default: anomaly_free_models.json)\n"
              << "  --results-dir D   Per-model result files (default: results)\n"
              << "  --max-display N   Models listed per category (default: 20)\n"
              << "  --hyper-max K     k_max for the Y = k/6 grid (default: 6)\n"
              << "  --limit N         Stop after the block that reaches N models\n"
              << "  --quick           su3 {1,3}, su2 {1,2}, k_max 3\n"
              << "  --threads N       Worker threads per block (0 = all cores)\n"
              << "  -v, --verbose     List every hit as it is recorded\n";
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string template_file = argv[1];
    std::string output_file = "anomaly_free_models.json";
    std::string results_dir = "results";
    int max_display = 20;
    int hyper_max = -1;
    int limit = -1;
    int threads = 1;
    bool quick = false, verbose = false;

    try {
        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--output" && i + 1 < argc) output_file = argv[++i];
            else if (arg == "--results-dir" && i + 1 < argc) results_dir = argv[++i];
            else if (arg == "--max-display" && i + 1 < argc) max_display = std::stoi(argv[++i]);
            else if (arg == "--hyper-max" && i + 1 < argc) hyper_max = std::stoi(argv[++i]);
            else if (arg == "--limit" && i + 1 < argc) limit = std::stoi(argv[++i]);
            else if (arg == "--threads" && i + 1 < argc) threads = std::stoi(argv[++i]);
            else if (arg == "--quick") quick = true;
            else if (arg == "-v" || arg == "--verbose") verbose = true;
            else {
                std::cerr << "Unknown argument: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Bad numeric argument: " << e.what() << "\n";
        return 1;
    }
    if (limit == 0 || limit < -1 || hyper_max < -1 || max_display < 0) {
        std::cerr << "--limit must be positive; --hyper-max and --max-display non-negative\n";
        return 1;
    }

    Spectrum base;
    ScanConfig config;
    try {
        nlohmann::json t = load_json_file(template_file);
        if (!t.is_object()) throw ConfigError(template_file + ": template must be an object");
        base = spectrum_from_json(t.value("base_spectrum", nlohmann::json::array()));
        config = scan_config_from_json(t.value("scan_config", nlohmann::json::object()));
    } catch (const ConfigError& e) {
        std::cerr << "Error loading template file: " << e.what() << "\n";
        return 1;
    } catch (const ValidationError& e) {
        std::cerr << "Invalid base fermion (" << e.field() << "): " << e.what() << "\n";
        return 1;
    }

    if (quick) {
        config.hypercharge = HyperchargePolicy();
        config.hypercharge.include_standard = false;
        config.su3_values = {1, 3};
        config.su2_values = {1, 2};
        config.hypercharge.k_max = 3;
    }
    if (hyper_max >= 0) config.hypercharge.k_max = hyper_max;
    if (limit > 0) config.limit = limit;
    config.num_threads = threads > 0 ? threads : std::max(1u, std::thread::hardware_concurrency());
    config.verbose = verbose;

    std::cout << "Template:        " << template_file << "\n";
    std::cout << "Base fermions:   " << base.size() << "\n";
    std::cout << "Results dir:     " << results_dir << "\n";
    std::cout << "Threads:         " << config.num_threads << "\n\n";

    DirectoryResultSink sink(results_dir);
    ParameterSpaceScanner scanner(base, config, sink);
    scanner.run_comprehensive_scan();
    scanner.print_anomaly_free_models(std::cout, max_display);

    if (!scanner.anomaly_free_models().empty()) {
        try {
            write_json_file(output_file, export_results(base, config, scanner.anomaly_free_models()));
            std::cout << "\nResults exported to " << output_file << "\n";
        } catch (const ConfigError& e) {
            std::cerr << e.what() << "\n";
            return 1;
        }
    }

    std::cout << "\nScan complete!\n";
    std::cout << "Individual model files saved in: " << results_dir << "/ ("
              << sink.written() << " written";
    if (sink.failed() > 0) std::cout << ", " << sink.failed() << " failed";
    std::cout << ")\n";
    return 0;
}
