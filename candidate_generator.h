// candidate_generator.h
// Scan configuration + candidate axes for the parameter-space scanner
//
// Axes:
//   hypercharge : k/6 grid | explicit list | standard list, plus numerator range
//   su3 x su2   : allow-lists (Block B) or the curated Block A list
//   forbidden   : (su3, su2[, Y]) cells removed from Block B
//
// Cells are plain quantum numbers. Fermion construction (and therefore
// validation) happens in the scanner, one cell at a time.

#pragma once

#include <nlohmann/json.hpp>

#include <algorithm>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "rational.h"
#include "anomaly_tables.h"
#include "fermion.h"

// ============================================================================
// Configuration
// ============================================================================

struct HyperchargePolicy {
    bool use_k_over_6 = true;
    int k_max = 6;                              // Y = k/6, k in [-k_max, k_max]
    std::optional<double> abs_max;              // unset: 1.0 (Block A), 2.0 (Block B)
    bool include_standard = true;               // used when not on the grid and no custom list
    std::vector<Rational> custom_values;
    std::optional<std::pair<long long, long long>> numerator_range;
    std::vector<long long> denominators = {1, 2, 3, 6};
};

constexpr double kBlockAAbsMax = 1.0;
constexpr double kBlockBAbsMax = 2.0;

struct ForbiddenCombination {
    int su3;
    int su2;
    std::optional<Rational> hypercharge;        // unset: any Y
};

struct ScanConfig {
    HyperchargePolicy hypercharge;
    std::vector<int> su3_values = {1, 3, 6, 8};
    std::vector<int> su2_values = {1, 2, 3};
    std::vector<ForbiddenCombination> forbidden_combinations;
    std::vector<std::string> enabled_blocks = {"A", "B", "C"};
    bool scan_block_a_pairs = true;
    std::optional<int> limit;

    // Runtime
    int num_threads = 1;
    bool verbose = false;

    bool block_enabled(const std::string& b) const {
        return std::find(enabled_blocks.begin(), enabled_blocks.end(), b) != enabled_blocks.end();
    }
};

// Throws ConfigError on a block name other than A, B, C
inline void validate_blocks(const std::vector<std::string>& blocks) {
    for (const auto& b : blocks)
        if (b != "A" && b != "B" && b != "C")
            throw ConfigError("Unknown block: " + b);
}

// ============================================================================
// Hypercharge axis
// ============================================================================

inline const std::vector<Rational>& standard_hypercharges() {
    static const std::vector<Rational> values = {
        make_rational(0),
        make_rational(1, 6), make_rational(-1, 6),
        make_rational(1, 3), make_rational(-1, 3),
        make_rational(1, 2), make_rational(-1, 2),
        make_rational(2, 3), make_rational(-2, 3),
        make_rational(1), make_rational(-1),
        make_rational(5, 6), make_rational(-5, 6),
    };
    return values;
}

inline void sort_unique(std::vector<Rational>& v) {
    std::sort(v.begin(), v.end());
    v.erase(std::unique(v.begin(), v.end()), v.end());
}

inline bool within_abs_max(const Rational& y, double abs_max) {
    return rational_to_double(rational_abs(y)) <= abs_max;
}

// k/6 grid restricted to |Y| <= abs_max
inline std::vector<Rational> k_over_6_grid(int k_max, double abs_max) {
    std::vector<Rational> values;
    for (int k = -k_max; k <= k_max; k++) {
        Rational y = make_rational(k, 6);
        if (within_abs_max(y, abs_max)) values.push_back(y);
    }
    return values;
}

// Sorted, deduplicated hypercharges for the Block B cross product
inline std::vector<Rational> generate_hypercharge_values(const HyperchargePolicy& p) {
    std::vector<Rational> values;

    if (p.use_k_over_6) {
        values = k_over_6_grid(p.k_max, p.abs_max.value_or(kBlockBAbsMax));
    } else if (!p.custom_values.empty()) {
        values = p.custom_values;
    } else if (p.include_standard) {
        values = standard_hypercharges();
    }

    if (p.numerator_range) {
        for (long long num = p.numerator_range->first; num <= p.numerator_range->second; num++)
            for (long long den : p.denominators)
                if (den != 0) values.push_back(make_rational(num, den));
    }

    sort_unique(values);
    return values;
}

// ============================================================================
// Candidate cells
// ============================================================================

struct CandidateCell {
    int su3;
    int su2;
    Rational hypercharge;
    int k = 0;                  // grid index, Block A only
};

inline bool is_forbidden(const ScanConfig& cfg, int su3, int su2, const Rational& y) {
    for (const auto& fc : cfg.forbidden_combinations) {
        if (fc.su3 != su3 || fc.su2 != su2) continue;
        if (!fc.hypercharge || *fc.hypercharge == y) return true;
    }
    return false;
}

// Block A: curated (su3, su2) list x k/6 grid, |Y| <= abs_max (default 1.0)
inline std::vector<CandidateCell> single_addition_cells(const ScanConfig& cfg) {
    std::vector<CandidateCell> cells;
    const int k_max = cfg.hypercharge.k_max;
    const double abs_max = cfg.hypercharge.abs_max.value_or(kBlockAAbsMax);
    for (const auto& [su3, su2] : kSingleAdditionReps) {
        for (int k = -k_max; k <= k_max; k++) {
            Rational y = make_rational(k, 6);
            if (!within_abs_max(y, abs_max)) continue;
            cells.push_back({su3, su2, y, k});
        }
    }
    return cells;
}

// Block B: hypercharge x su3 x su2, minus forbidden cells
inline std::vector<CandidateCell> vector_like_cells(const ScanConfig& cfg) {
    std::vector<CandidateCell> cells;
    for (const Rational& y : generate_hypercharge_values(cfg.hypercharge))
        for (int su3 : cfg.su3_values)
            for (int su2 : cfg.su2_values)
                if (!is_forbidden(cfg, su3, su2, y))
                    cells.push_back({su3, su2, y});
    return cells;
}

// ============================================================================
// JSON <-> ScanConfig  (template "scan_config" object)
// ============================================================================

inline std::vector<int> int_list_from_json(const nlohmann::json& j, const std::string& what) {
    if (!j.is_array()) throw ConfigError(what + " must be a list");
    std::vector<int> out;
    for (const auto& v : j) {
        if (!v.is_number_integer()) throw ConfigError(what + " must contain integers");
        out.push_back(v.get<int>());
    }
    return out;
}

inline HyperchargePolicy hypercharge_policy_from_json(const nlohmann::json& j) {
    HyperchargePolicy p;
    if (!j.is_object()) throw ConfigError("scan_config.hypercharge must be an object");
    try {
        if (j.contains("custom_values")) {
            for (const auto& v : j.at("custom_values"))
                p.custom_values.push_back(rational_from_json(v));
            p.use_k_over_6 = false;
        }
        p.use_k_over_6 = j.value("use_k_over_6", p.use_k_over_6);
        p.k_max = j.value("k_max", p.k_max);
        if (j.contains("abs_max")) p.abs_max = j.at("abs_max").get<double>();
        p.include_standard = j.value("include_standard", p.include_standard);
        if (j.contains("range")) {
            const auto& r = j.at("range");
            if (!r.is_array() || r.size() != 2)
                throw ConfigError("scan_config.hypercharge.range must be [lo, hi]");
            p.numerator_range = std::make_pair(r[0].get<long long>(), r[1].get<long long>());
        }
        if (j.contains("denominators")) {
            p.denominators.clear();
            for (const auto& d : j.at("denominators")) p.denominators.push_back(d.get<long long>());
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Malformed scan_config.hypercharge: ") + e.what());
    }
    if (p.k_max < 0) throw ConfigError("scan_config.hypercharge.k_max must be non-negative");
    return p;
}

inline ScanConfig scan_config_from_json(const nlohmann::json& j) {
    ScanConfig cfg;
    if (j.is_null()) return cfg;
    if (!j.is_object()) throw ConfigError("scan_config must be an object");
    try {
        if (j.contains("hypercharge"))
            cfg.hypercharge = hypercharge_policy_from_json(j.at("hypercharge"));
        if (j.contains("su3_rep") && j.at("su3_rep").contains("values"))
            cfg.su3_values = int_list_from_json(j.at("su3_rep").at("values"), "su3_rep.values");
        if (j.contains("su2_rep") && j.at("su2_rep").contains("values"))
            cfg.su2_values = int_list_from_json(j.at("su2_rep").at("values"), "su2_rep.values");
        if (j.contains("forbidden_combinations")) {
            for (const auto& fc : j.at("forbidden_combinations")) {
                ForbiddenCombination f{fc.at("su3").get<int>(), fc.at("su2").get<int>(), std::nullopt};
                if (fc.contains("hypercharge")) f.hypercharge = rational_from_json(fc.at("hypercharge"));
                cfg.forbidden_combinations.push_back(f);
            }
        }
        if (j.contains("enabled_blocks"))
            cfg.enabled_blocks = j.at("enabled_blocks").get<std::vector<std::string>>();
        cfg.scan_block_a_pairs = j.value("scan_block_a_pairs", cfg.scan_block_a_pairs);
        if (j.contains("limit") && !j.at("limit").is_null()) cfg.limit = j.at("limit").get<int>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Malformed scan_config: ") + e.what());
    }
    validate_blocks(cfg.enabled_blocks);
    return cfg;
}

inline nlohmann::json scan_config_to_json(const ScanConfig& cfg) {
    nlohmann::json hc;
    const HyperchargePolicy& p = cfg.hypercharge;
    hc["use_k_over_6"] = p.use_k_over_6;
    hc["k_max"] = p.k_max;
    if (p.abs_max) hc["abs_max"] = *p.abs_max;
    hc["include_standard"] = p.include_standard;
    if (!p.custom_values.empty()) {
        nlohmann::json vals = nlohmann::json::array();
        for (const auto& v : p.custom_values) vals.push_back(rational_str(v));
        hc["custom_values"] = vals;
    }
    if (p.numerator_range) {
        hc["range"] = {p.numerator_range->first, p.numerator_range->second};
        hc["denominators"] = p.denominators;
    }

    nlohmann::json j;
    j["hypercharge"] = hc;
    j["su3_rep"] = {{"values", cfg.su3_values}};
    j["su2_rep"] = {{"values", cfg.su2_values}};
    if (!cfg.forbidden_combinations.empty()) {
        nlohmann::json fcs = nlohmann::json::array();
        for (const auto& fc : cfg.forbidden_combinations) {
            nlohmann::json e = {{"su3", fc.su3}, {"su2", fc.su2}};
            if (fc.hypercharge) e["hypercharge"] = rational_str(*fc.hypercharge);
            fcs.push_back(e);
        }
        j["forbidden_combinations"] = fcs;
    }
    j["enabled_blocks"] = cfg.enabled_blocks;
    j["scan_block_a_pairs"] = cfg.scan_block_a_pairs;
    if (cfg.limit) j["limit"] = *cfg.limit;
    return j;
}
