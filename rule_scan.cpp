// rule_scan.cpp
// Rule-driven parameter scans: YAML rule book + JSON spectrum template
//
// Usage:
//   ./rule_scan <rules.yaml> <template.json> [-r RULE | -b RULE...] [options]
//
// Without -r / -b (or with --list-rules) the available rules are listed.
// Output (-o, default rule_scan_results/):
//   scan_summary_<rule>.json, models_<rule>.json, batch_scan_summary.json
//
// Compile:
//   g++ -std=c++17 -O2 -pthread -o rule_scan rule_scan.cpp \
//       -I/usr/include/eigen3 -I. -lyaml-cpp -lcrypto

#include <algorithm>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "result_store.h"
#include "scan_rules.h"
#include "rule_scanner.h"

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <rules.yaml> <template.json> [options]\n"
              << "Options:\n"
              << "  -r, --rule R        Run one rule\n"
              << "  -b, --batch R...    Run several rules in sequence\n"
              << "  -o, --output D      Summary directory (default: rule_scan_results)\n"
              << "  --results-dir D     Per-model result files (default: <output>/results)\n"
              << "  --hyper-max K       Override k_max of the hypercharge grid\n"
              << "  --limit N           Stop after the block that reaches N models\n"
              << "  --threads N         Worker threads per block (0 = all cores)\n"
              << "  --list-rules        List available rules and exit\n"
              << "  -v, --verbose       List every hit as it is recorded\n";
}

void list_rules(const RuleBook& book) {
    std::cout << "\nAvailable rules:\n" << std::string(60, '=') << "\n";
    for (const auto& [name, desc] : book.list_rules()) {
        const ScanRule& r = book.rule(name);
        std::cout << "\n" << name << ":\n  " << desc << "\n";
        std::cout << "  base: " << r.base_spectrum << ", blocks:";
        for (const auto& b : r.blocks) std::cout << " " << b;
        if (r.hypercharge) std::cout << ", hypercharge: " << constraint_kind_name(r.hypercharge->kind);
        std::cout << "\n";
    }
}

int main(int argc, char** argv) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    std::string rule_file = argv[1];
    std::string template_file = argv[2];
    std::string rule;
    std::vector<std::string> batch;
    std::string output_dir = "rule_scan_results";
    std::string results_dir;
    bool list_only = false;
    RuleScanOptions opts;

    try {
        for (int i = 3; i < argc; ++i) {
            std::string arg = argv[i];
            if ((arg == "-r" || arg == "--rule") && i + 1 < argc) rule = argv[++i];
            else if (arg == "-b" || arg == "--batch") {
                while (i + 1 < argc && argv[i + 1][0] != '-') batch.push_back(argv[++i]);
            }
            else if ((arg == "-o" || arg == "--output") && i + 1 < argc) output_dir = argv[++i];
            else if (arg == "--results-dir" && i + 1 < argc) results_dir = argv[++i];
            else if (arg == "--hyper-max" && i + 1 < argc) opts.hyper_max = std::stoi(argv[++i]);
            else if (arg == "--limit" && i + 1 < argc) opts.limit = std::stoi(argv[++i]);
            else if (arg == "--threads" && i + 1 < argc) opts.num_threads = std::stoi(argv[++i]);
            else if (arg == "--list-rules") list_only = true;
            else if (arg == "-v" || arg == "--verbose") opts.verbose = true;
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
    if ((opts.limit && *opts.limit <= 0) || (opts.hyper_max && *opts.hyper_max < 0)) {
        std::cerr << "--limit must be positive and --hyper-max non-negative\n";
        return 1;
    }
    if (opts.num_threads <= 0) opts.num_threads = std::max(1u, std::thread::hardware_concurrency());

    RuleBook book;
    try {
        book = RuleBook::load(rule_file);
    } catch (const ConfigError& e) {
        std::cerr << "Error initializing scanner: " << e.what() << "\n";
        return 1;
    }

    if (list_only || (rule.empty() && batch.empty())) {
        list_rules(book);
        if (!list_only) {
            std::cout << "\nUse -r RULE_NAME to run a specific rule\n";
            std::cout << "Use -b RULE1 RULE2 ... for batch scanning\n";
        }
        return 0;
    }

    opts.output_dir = output_dir;
    if (results_dir.empty()) results_dir = (fs::path(output_dir) / "results").string();

    try {
        RuleBasedScanner scanner(book, template_file);
        DirectoryResultSink sink(results_dir);
        if (!batch.empty()) {
            scanner.batch_scan(batch, sink, opts);
        } else {
            scanner.scan_with_rule(rule, sink, opts);
        }
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const ValidationError& e) {
        std::cerr << "Invalid fermion (" << e.field() << "): " << e.what() << "\n";
        return 1;
    } catch (const fs::filesystem_error& e) {
        std::cerr << "Cannot write output: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\nResults saved to: " << output_dir << "/\n";
    return 0;
}
