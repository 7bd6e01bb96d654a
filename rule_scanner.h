// rule_scanner.h
// Run named YAML rules against a JSON spectrum template
//
//   rule -> ScanConfig (scan_rules.h) -> ParameterSpaceScanner -> summary
//
// Base spectrum selector:
//   "standard_model" : template's base_spectrum
//   anything else    : <template dir>/<selector>.json if present,
//                      otherwise the template's base_spectrum

#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "fermion.h"
#include "candidate_generator.h"
#include "result_store.h"
#include "param_space_scanner.h"
#include "scan_rules.h"

struct RuleScanOptions {
    std::optional<int> hyper_max;
    std::optional<int> limit;
    std::optional<fs::path> output_dir;     // summaries + model exports
    int num_threads = 1;
    bool verbose = false;
};

struct RuleScanSummary {
    std::string rule_name;
    std::string rule_description;
    std::string base_spectrum;
    long long total_configurations_tested = 0;
    int anomaly_free_models_found = 0;
    double scan_time_seconds = 0.0;
    std::vector<std::string> blocks_used;
    std::map<std::string, int> models_by_type;
};

inline nlohmann::json summary_to_json(const RuleScanSummary& s) {
    return {
        {"rule_name", s.rule_name},
        {"rule_description", s.rule_description},
        {"base_spectrum", s.base_spectrum},
        {"total_configurations_tested", s.total_configurations_tested},
        {"anomaly_free_models_found", s.anomaly_free_models_found},
        {"scan_time_seconds", s.scan_time_seconds},
        {"blocks_used", s.blocks_used},
        {"models_by_type", s.models_by_type}
    };
}

inline void print_summary(std::ostream& out, const RuleScanSummary& s) {
    const std::string rule(60, '=');
    out << "\n" << rule << "\nSCAN COMPLETE\n" << rule << "\n";
    out << "Rule: " << s.rule_name << "\n";
    out << "Description: " << s.rule_description << "\n";
    out << "Base spectrum: " << s.base_spectrum << "\n";
    out << "Total configurations tested: " << s.total_configurations_tested << "\n";
    out << "Anomaly-free models found: " << s.anomaly_free_models_found << "\n";
    std::ios::fmtflags flags = out.flags();
    std::streamsize prec = out.precision();
    out << "Scan time: " << std::fixed << std::setprecision(2) << s.scan_time_seconds << " seconds\n";
    out.flags(flags);
    out.precision(prec);

    out << "\nModels by type:\n";
    for (const auto& [type, count] : s.models_by_type)
        if (count > 0) out << "  " << type << ": " << count << "\n";
}

class RuleBasedScanner {
public:
    // Throws ConfigError when the template cannot be read
    RuleBasedScanner(const RuleBook& rules, fs::path template_path)
        : rules_(rules), template_path_(std::move(template_path)) {
        nlohmann::json t = load_json_file(template_path_.string());
        if (!t.is_object()) throw ConfigError(template_path_.string() + ": template must be an object");
        template_base_ = spectrum_from_json(t.value("base_spectrum", nlohmann::json::array()));
    }

    const RuleBook& rules() const { return rules_; }
    const Spectrum& template_base() const { return template_base_; }

    Spectrum base_spectrum_for(const std::string& selector) const {
        if (selector == "standard_model") return template_base_;
        fs::path alt = template_path_.parent_path() / (selector + ".json");
        if (fs::exists(alt)) {
            nlohmann::json t = load_json_file(alt.string());
            return spectrum_from_json(t.value("base_spectrum", nlohmann::json::array()));
        }
        std::cerr << "Base spectrum '" << selector << "' not found next to "
                  << template_path_.string() << ", using template base\n";
        return template_base_;
    }

    RuleScanSummary scan_with_rule(const std::string& name, ResultSink& sink,
                                   const RuleScanOptions& opts = {},
                                   std::ostream& log = std::cout) const {
        const ScanRule& rule = rules_.rule(name);
        ScanConfig cfg = rules_.get_scan_configuration(name);
        if (opts.hyper_max) cfg.hypercharge.k_max = *opts.hyper_max;
        cfg.limit = opts.limit;
        cfg.num_threads = opts.num_threads;
        cfg.verbose = opts.verbose;

        Spectrum base = base_spectrum_for(rule.base_spectrum);

        log << "\nRunning scan with rule: " << name << "\n";
        log << "Description: " << rule.description << "\n";
        log << "Enabled blocks:";
        for (const auto& b : cfg.enabled_blocks) log << " " << b;
        log << "\n" << std::string(60, '=') << "\n";

        auto start = std::chrono::steady_clock::now();

        ParameterSpaceScanner scanner(base, cfg, sink, log);
        scanner.run_comprehensive_scan();

        std::vector<Spectrum> sets = rules_.get_physics_sets(name);
        if (!sets.empty()) {
            log << "\nTesting " << sets.size() << " physics-motivated sets...\n";
            scanner.scan_physics_sets(sets);
        }

        std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;

        RuleScanSummary s;
        s.rule_name = name;
        s.rule_description = rule.description;
        s.base_spectrum = rule.base_spectrum;
        s.total_configurations_tested = scanner.tested_configurations();
        s.anomaly_free_models_found = static_cast<int>(scanner.anomaly_free_models().size());
        s.scan_time_seconds = elapsed.count();
        s.blocks_used = cfg.enabled_blocks;
        s.models_by_type = scanner.models_by_type();

        if (opts.output_dir) {
            fs::create_directories(*opts.output_dir);
            write_json_file(*opts.output_dir / ("scan_summary_" + name + ".json"), summary_to_json(s));
            if (!scanner.anomaly_free_models().empty()) {
                fs::path models = *opts.output_dir / ("models_" + name + ".json");
                write_json_file(models, export_results(base, cfg, scanner.anomaly_free_models()));
                log << "\nResults exported to " << models.string() << "\n";
            }
        }

        print_summary(log, s);
        return s;
    }

    // Unknown rules are reported and skipped
    std::vector<RuleScanSummary> batch_scan(const std::vector<std::string>& names, ResultSink& sink,
                                            const RuleScanOptions& opts = {},
                                            std::ostream& log = std::cout) const {
        std::vector<RuleScanSummary> all;
        const std::string hashes(60, '#');
        for (const auto& name : names) {
            log << "\n" << hashes << "\n# Batch scan: " << name << "\n" << hashes << "\n";
            try {
                all.push_back(scan_with_rule(name, sink, opts, log));
            } catch (const ConfigError& e) {
                std::cerr << "Error loading rule '" << name << "': " << e.what() << "\n";
            }
        }

        if (opts.output_dir && !all.empty()) {
            nlohmann::json results = nlohmann::json::array();
            int total_models = 0;
            double total_time = 0.0;
            for (const auto& s : all) {
                results.push_back(summary_to_json(s));
                total_models += s.anomaly_free_models_found;
                total_time += s.scan_time_seconds;
            }
            fs::create_directories(*opts.output_dir);
            write_json_file(*opts.output_dir / "batch_scan_summary.json", {
                {"batch_scan_results", results},
                {"total_models", total_models},
                {"total_time", total_time}
            });
        }
        return all;
    }

private:
    const RuleBook& rules_;
    fs::path template_path_;
    Spectrum template_base_;
};
