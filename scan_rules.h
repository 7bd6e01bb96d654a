// scan_rules.h
// Named scan rules from YAML -> ScanConfig
//
// File layout:
//   rule_sets:
//     - name: "vector_like_search"          (required)
//       description: "..."
//       base_spectrum: "standard_model"     (default)
//       blocks: ["A", "B", "C"]             (default)
//       constraints:
//         hypercharge: {type: grid, k_max: 12, denominator: 6, exclude: [...]}
//         su3_rep: {values: [1, 3], forbidden_combinations: [{su3: 3, su2: 2}]}
//         su2_rep: {values: [1, 2]}
//       symmetry_requirements:
//         - {type: parity, pairs: ["Q_L:Q_R"]}
//       physics_motivated_sets:
//         - {name: "...", fermions: [{name, su3_rep, su2_rep, hypercharge, ...}]}
//       <any other scalar key>: metadata  (scan_block_a_pairs is honored)
//
// Hypercharge kinds (default: range):
//   exact / set : explicit values
//   integer     : lo..hi            (range default [0, 5])
//   rational    : n/d in [lo, hi]   (range [-2, 2], denominators [1, 2, 3, 6])
//   range       : same as rational
//   grid        : k/denominator, |k| <= k_max  (k_max 6, denominator 6)
//   exclude     : k/6 grid, |k| <= 6
// Every kind accepts `exclude: [...]`.

#pragma once

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "rational.h"
#include "fermion.h"
#include "candidate_generator.h"
#include "result_store.h"

// ============================================================================
// Constraint types
// ============================================================================

enum class ConstraintKind { Exact, Set, Integer, Rational, Range, Grid, Exclude };

inline const char* constraint_kind_name(ConstraintKind k) {
    switch (k) {
        case ConstraintKind::Exact:    return "exact";
        case ConstraintKind::Set:      return "set";
        case ConstraintKind::Integer:  return "integer";
        case ConstraintKind::Rational: return "rational";
        case ConstraintKind::Range:    return "range";
        case ConstraintKind::Grid:     return "grid";
        case ConstraintKind::Exclude:  return "exclude";
    }
    return "unknown";
}

inline ConstraintKind parse_constraint_kind(const std::string& s) {
    if (s == "exact")    return ConstraintKind::Exact;
    if (s == "set")      return ConstraintKind::Set;
    if (s == "integer")  return ConstraintKind::Integer;
    if (s == "rational") return ConstraintKind::Rational;
    if (s == "range")    return ConstraintKind::Range;
    if (s == "grid")     return ConstraintKind::Grid;
    if (s == "exclude")  return ConstraintKind::Exclude;
    throw ConfigError("Unknown hypercharge constraint type: " + s);
}

// exact, set
struct ValueList {
    std::vector<Rational> values;
};

// integer
struct IntegerRange {
    long long lo = 0;
    long long hi = 5;
};

// rational, range
struct RationalRange {
    Rational lo = -2;
    Rational hi = 2;
    std::vector<long long> denominators = {1, 2, 3, 6};
};

// grid
struct GridSpec {
    int k_max = 6;
    long long denominator = 6;
};

// exclude: default k/6 grid
struct DefaultGrid {};

using HyperchargeSpec = std::variant<ValueList, IntegerRange, RationalRange, GridSpec, DefaultGrid>;

namespace rules_detail {

inline Integer floor_div(const Integer& n, const Integer& d) {
    Integer q = n / d;
    if ((n % d != 0) && ((n < 0) != (d < 0))) q -= 1;
    return q;
}

inline Integer floor_rational(const Rational& q) {
    return floor_div(boost::multiprecision::numerator(q), boost::multiprecision::denominator(q));
}

inline Integer ceil_rational(const Rational& q) {
    return -floor_rational(Rational(-q));
}

inline std::vector<Rational> grid_values(int k_max, long long den) {
    std::vector<Rational> v;
    for (int k = -k_max; k <= k_max; k++) v.push_back(make_rational(k, den));
    return v;
}

struct ValueGenerator {
    std::vector<Rational> operator()(const ValueList& s) const {
        return s.values;
    }
    std::vector<Rational> operator()(const IntegerRange& s) const {
        std::vector<Rational> v;
        for (long long i = s.lo; i <= s.hi; i++) v.push_back(make_rational(i));
        return v;
    }
    std::vector<Rational> operator()(const RationalRange& s) const {
        std::vector<Rational> v;
        for (long long den : s.denominators) {
            if (den <= 0) continue;
            Integer lo = ceil_rational(Rational(s.lo * den));
            Integer hi = floor_rational(Rational(s.hi * den));
            for (Integer num = lo; num <= hi; num += 1)
                v.push_back(make_rational(num, Integer(den)));
        }
        return v;
    }
    std::vector<Rational> operator()(const GridSpec& s) const {
        return grid_values(s.k_max, s.denominator);
    }
    std::vector<Rational> operator()(const DefaultGrid&) const {
        return grid_values(6, 6);
    }
};

}  // namespace rules_detail

struct HyperchargeConstraint {
    ConstraintKind kind = ConstraintKind::Range;
    HyperchargeSpec spec = RationalRange{};
    std::vector<Rational> exclude;

    // Sorted, deduplicated, before exclusions
    std::vector<Rational> generate_values() const {
        std::vector<Rational> v = std::visit(rules_detail::ValueGenerator{}, spec);
        sort_unique(v);
        return v;
    }

    std::vector<Rational> allowed_values() const {
        std::vector<Rational> v = generate_values();
        v.erase(std::remove_if(v.begin(), v.end(), [&](const Rational& y) {
                    return std::find(exclude.begin(), exclude.end(), y) != exclude.end();
                }), v.end());
        return v;
    }

    // grid over k/6 with nothing excluded
    bool is_plain_k_over_6_grid() const {
        const GridSpec* g = std::get_if<GridSpec>(&spec);
        return g && g->denominator == 6 && exclude.empty();
    }
};

struct RepresentationConstraint {
    std::vector<int> allowed_values;
    std::vector<ForbiddenCombination> forbidden_combinations;

    bool allows(int dim) const {
        return std::find(allowed_values.begin(), allowed_values.end(), dim) != allowed_values.end();
    }
};

enum class SymmetryType { Parity, ChargeConjugation, Family, Custodial, Discrete };

inline SymmetryType parse_symmetry_type(const std::string& s) {
    if (s == "parity")             return SymmetryType::Parity;
    if (s == "charge_conjugation") return SymmetryType::ChargeConjugation;
    if (s == "family")             return SymmetryType::Family;
    if (s == "custodial")          return SymmetryType::Custodial;
    if (s == "discrete")           return SymmetryType::Discrete;
    throw ConfigError("Unknown symmetry type: " + s);
}

inline const char* symmetry_type_name(SymmetryType t) {
    switch (t) {
        case SymmetryType::Parity:            return "parity";
        case SymmetryType::ChargeConjugation: return "charge_conjugation";
        case SymmetryType::Family:            return "family";
        case SymmetryType::Custodial:         return "custodial";
        case SymmetryType::Discrete:          return "discrete";
    }
    return "unknown";
}

struct SymmetryRequirement {
    SymmetryType type;
    std::vector<std::pair<std::string, std::string>> pairs;     // "L:R"
    std::map<std::string, std::string> constraints;             // scalar entries only
};

struct PhysicsSet {
    std::string name;
    Spectrum fermions;
};

struct ScanRule {
    std::string name;
    std::string description;
    std::string base_spectrum = "standard_model";
    std::vector<std::string> blocks = {"A", "B", "C"};
    std::optional<HyperchargeConstraint> hypercharge;
    std::optional<RepresentationConstraint> su3;
    std::optional<RepresentationConstraint> su2;
    std::vector<SymmetryRequirement> symmetry_requirements;
    std::vector<PhysicsSet> physics_sets;
    std::map<std::string, std::string> metadata;
    std::optional<bool> scan_block_a_pairs;
};

struct SetValidation {
    bool valid = true;
    std::vector<std::string> violations;
};

// ############################################################################
// YAML PARSING
// ############################################################################

namespace rules_detail {

inline std::string scalar(const YAML::Node& n) {
    if (!n.IsScalar()) throw ConfigError("Expected a scalar value");
    return n.Scalar();
}

inline Rational yaml_rational(const YAML::Node& n) {
    try {
        return parse_rational(scalar(n));
    } catch (const std::invalid_argument& e) {
        throw ConfigError(e.what());
    }
}

inline std::vector<Rational> yaml_rationals(const YAML::Node& n) {
    if (!n.IsSequence()) throw ConfigError("Expected a list of hypercharges");
    std::vector<Rational> out;
    for (const auto& v : n) out.push_back(yaml_rational(v));
    return out;
}

inline std::pair<YAML::Node, YAML::Node> yaml_bounds(const YAML::Node& n) {
    if (!n.IsSequence() || n.size() != 2) throw ConfigError("range must be [lo, hi]");
    return {n[0], n[1]};
}

inline HyperchargeConstraint parse_hypercharge(const YAML::Node& n) {
    HyperchargeConstraint hc;
    hc.kind = n["type"] ? parse_constraint_kind(n["type"].as<std::string>()) : ConstraintKind::Range;

    switch (hc.kind) {
        case ConstraintKind::Exact:
        case ConstraintKind::Set: {
            ValueList s;
            if (n["values"]) s.values = yaml_rationals(n["values"]);
            hc.spec = s;
            break;
        }
        case ConstraintKind::Integer: {
            IntegerRange s;
            if (n["range"]) {
                auto [lo, hi] = yaml_bounds(n["range"]);
                s.lo = lo.as<long long>();
                s.hi = hi.as<long long>();
            }
            hc.spec = s;
            break;
        }
        case ConstraintKind::Rational:
        case ConstraintKind::Range: {
            RationalRange s;
            if (n["range"]) {
                auto [lo, hi] = yaml_bounds(n["range"]);
                s.lo = yaml_rational(lo);
                s.hi = yaml_rational(hi);
            }
            if (n["denominators"]) s.denominators = n["denominators"].as<std::vector<long long>>();
            hc.spec = s;
            break;
        }
        case ConstraintKind::Grid: {
            GridSpec s;
            if (n["k_max"]) s.k_max = n["k_max"].as<int>();
            if (n["denominator"]) s.denominator = n["denominator"].as<long long>();
            if (s.denominator == 0) throw ConfigError("grid denominator must be nonzero");
            hc.spec = s;
            break;
        }
        case ConstraintKind::Exclude:
            hc.spec = DefaultGrid{};
            break;
    }

    if (n["exclude"]) hc.exclude = yaml_rationals(n["exclude"]);
    return hc;
}

inline RepresentationConstraint parse_representation(const YAML::Node& n, std::vector<int> defaults) {
    RepresentationConstraint rc;
    rc.allowed_values = n["values"] ? n["values"].as<std::vector<int>>() : std::move(defaults);
    if (n["forbidden_combinations"]) {
        for (const auto& c : n["forbidden_combinations"]) {
            if (!c.IsMap()) continue;
            ForbiddenCombination fc{c["su3"] ? c["su3"].as<int>() : 0,
                                    c["su2"] ? c["su2"].as<int>() : 0,
                                    std::nullopt};
            if (c["hypercharge"]) fc.hypercharge = yaml_rational(c["hypercharge"]);
            rc.forbidden_combinations.push_back(fc);
        }
    }
    return rc;
}

inline SymmetryRequirement parse_symmetry(const YAML::Node& n) {
    if (!n["type"]) throw ConfigError("Symmetry requirement without 'type'");
    SymmetryRequirement req{parse_symmetry_type(n["type"].as<std::string>()), {}, {}};
    if (n["pairs"]) {
        for (const auto& p : n["pairs"]) {
            std::string s = p.as<std::string>();
            size_t colon = s.find(':');
            if (colon == std::string::npos) throw ConfigError("Symmetry pair must be 'left:right', got " + s);
            req.pairs.emplace_back(s.substr(0, colon), s.substr(colon + 1));
        }
    }
    if (n["constraints"] && n["constraints"].IsMap()) {
        for (const auto& kv : n["constraints"])
            if (kv.second.IsScalar())
                req.constraints[kv.first.as<std::string>()] = kv.second.Scalar();
    }
    return req;
}

inline Fermion parse_fermion(const YAML::Node& n) {
    if (!n["name"] || !n["su3_rep"] || !n["su2_rep"] || !n["hypercharge"])
        throw ConfigError("Fermion entry needs name, su3_rep, su2_rep, hypercharge");
    return Fermion(n["name"].as<std::string>(),
                   n["su3_rep"].as<int>(),
                   n["su2_rep"].as<int>(),
                   yaml_rational(n["hypercharge"]),
                   n["chirality"] ? n["chirality"].as<int>() : 1,
                   n["generations"] ? n["generations"].as<int>() : 1);
}

inline bool is_reserved_key(const std::string& k) {
    static const std::vector<std::string> keys = {
        "name", "description", "base_spectrum", "blocks", "constraints",
        "symmetry_requirements", "physics_motivated_sets"
    };
    return std::find(keys.begin(), keys.end(), k) != keys.end();
}

inline ScanRule parse_rule(const YAML::Node& n) {
    if (!n.IsMap() || !n["name"] || n["name"].as<std::string>().empty())
        throw ConfigError("Rule must have a 'name' field");

    ScanRule rule;
    rule.name = n["name"].as<std::string>();
    if (n["description"]) rule.description = n["description"].as<std::string>();
    if (n["base_spectrum"]) rule.base_spectrum = n["base_spectrum"].as<std::string>();
    if (n["blocks"]) rule.blocks = n["blocks"].as<std::vector<std::string>>();
    validate_blocks(rule.blocks);

    if (const YAML::Node c = n["constraints"]) {
        if (c["hypercharge"]) rule.hypercharge = parse_hypercharge(c["hypercharge"]);
        if (c["su3_rep"]) rule.su3 = parse_representation(c["su3_rep"], {1, 3, 6, 8});
        if (c["su2_rep"]) rule.su2 = parse_representation(c["su2_rep"], {1, 2, 3});
    }

    if (n["symmetry_requirements"])
        for (const auto& s : n["symmetry_requirements"])
            rule.symmetry_requirements.push_back(parse_symmetry(s));

    if (n["physics_motivated_sets"]) {
        for (const auto& s : n["physics_motivated_sets"]) {
            PhysicsSet ps;
            if (s["name"]) ps.name = s["name"].as<std::string>();
            if (s["fermions"]) {
                try {
                    for (const auto& f : s["fermions"]) ps.fermions.push_back(parse_fermion(f));
                } catch (const ValidationError& e) {
                    throw ConfigError("Rule '" + rule.name + "', set '" + ps.name + "': " + e.what());
                }
            }
            rule.physics_sets.push_back(ps);
        }
    }

    for (const auto& kv : n) {
        std::string key = kv.first.as<std::string>();
        if (is_reserved_key(key) || !kv.second.IsScalar()) continue;
        rule.metadata[key] = kv.second.Scalar();
        if (key == "scan_block_a_pairs") rule.scan_block_a_pairs = kv.second.as<bool>();
    }
    return rule;
}

}  // namespace rules_detail

// ############################################################################
// RULE BOOK
// ############################################################################

class RuleBook {
public:
    // Throws ConfigError: missing file, bad YAML, no rule_sets, bad rule
    static RuleBook load(const std::string& path) {
        YAML::Node root;
        try {
            root = YAML::LoadFile(path);
        } catch (const YAML::BadFile&) {
            throw ConfigError("Rule file not found: " + path);
        } catch (const YAML::Exception& e) {
            throw ConfigError("Invalid YAML in " + path + ": " + e.what());
        }
        try {
            return from_yaml(root);
        } catch (const YAML::Exception& e) {
            throw ConfigError("Malformed rule in " + path + ": " + e.what());
        }
    }

    static RuleBook load_string(const std::string& text) {
        try {
            return from_yaml(YAML::Load(text));
        } catch (const YAML::Exception& e) {
            throw ConfigError(std::string("Invalid YAML: ") + e.what());
        }
    }

    size_t size() const { return order_.size(); }
    bool has_rule(const std::string& name) const { return rules_.count(name) > 0; }

    const ScanRule& rule(const std::string& name) const {
        auto it = rules_.find(name);
        if (it == rules_.end()) throw ConfigError("Unknown rule: " + name);
        return it->second;
    }

    // (name, description) in file order
    std::vector<std::pair<std::string, std::string>> list_rules() const {
        std::vector<std::pair<std::string, std::string>> out;
        for (const auto& name : order_) out.emplace_back(name, rules_.at(name).description);
        return out;
    }

    ScanConfig get_scan_configuration(const std::string& name) const {
        const ScanRule& r = rule(name);
        ScanConfig cfg;

        if (r.hypercharge) {
            const HyperchargeConstraint& hc = *r.hypercharge;
            if (hc.is_plain_k_over_6_grid()) {
                cfg.hypercharge.use_k_over_6 = true;
                cfg.hypercharge.k_max = std::get<GridSpec>(hc.spec).k_max;
            } else {
                cfg.hypercharge.use_k_over_6 = false;
                cfg.hypercharge.include_standard = false;
                cfg.hypercharge.custom_values = hc.allowed_values();
            }
        }

        if (r.su3) {
            cfg.su3_values = r.su3->allowed_values;
            append(cfg.forbidden_combinations, r.su3->forbidden_combinations);
        }
        if (r.su2) {
            cfg.su2_values = r.su2->allowed_values;
            append(cfg.forbidden_combinations, r.su2->forbidden_combinations);
        }

        cfg.enabled_blocks = r.blocks;
        if (r.scan_block_a_pairs) cfg.scan_block_a_pairs = *r.scan_block_a_pairs;
        return cfg;
    }

    std::vector<Spectrum> get_physics_sets(const std::string& name) const {
        std::vector<Spectrum> out;
        for (const auto& ps : rule(name).physics_sets)
            if (!ps.fermions.empty()) out.push_back(ps.fermions);
        return out;
    }

    SetValidation validate_fermion_set(const Spectrum& fermions, const std::string& name) const {
        const ScanRule& r = rule(name);
        SetValidation res;
        auto violate = [&](const std::string& msg) {
            res.valid = false;
            res.violations.push_back(msg);
        };

        std::vector<Rational> allowed_y;
        if (r.hypercharge) allowed_y = r.hypercharge->allowed_values();

        for (const auto& f : fermions) {
            if (r.su3 && !r.su3->allows(f.su3_rep()))
                violate(f.name() + ": SU(3) rep " + std::to_string(f.su3_rep()) + " not allowed");
            if (r.su2 && !r.su2->allows(f.su2_rep()))
                violate(f.name() + ": SU(2) rep " + std::to_string(f.su2_rep()) + " not allowed");
            if (r.hypercharge && std::find(allowed_y.begin(), allowed_y.end(), f.hypercharge()) == allowed_y.end())
                violate(f.name() + ": Hypercharge " + rational_str(f.hypercharge()) + " not allowed");
        }

        for (const auto& req : r.symmetry_requirements) {
            if (req.type != SymmetryType::Parity) continue;
            for (const auto& [left, right] : req.pairs) {
                const Fermion* l = find_fermion(fermions, left);
                const Fermion* rr = find_fermion(fermions, right);
                if (!l || !rr) {
                    violate("Parity pair (" + left + ", " + right + ") incomplete");
                } else if (l->su3_rep() != rr->su3_rep() || l->su2_rep() != rr->su2_rep()) {
                    violate("Parity pair (" + left + ", " + right + ") has mismatched representations");
                }
            }
        }
        return res;
    }

    nlohmann::json rule_to_json(const std::string& name) const {
        const ScanRule& r = rule(name);
        nlohmann::json j = scan_config_to_json(get_scan_configuration(name));
        j["rule_metadata"] = {
            {"name", r.name},
            {"description", r.description},
            {"base_spectrum", r.base_spectrum}
        };
        if (r.hypercharge) j["rule_metadata"]["hypercharge_type"] = constraint_kind_name(r.hypercharge->kind);
        if (!r.symmetry_requirements.empty()) {
            nlohmann::json syms = nlohmann::json::array();
            for (const auto& req : r.symmetry_requirements) syms.push_back(symmetry_type_name(req.type));
            j["rule_metadata"]["symmetry_requirements"] = syms;
        }
        for (const auto& [k, v] : r.metadata) j["rule_metadata"][k] = v;
        return j;
    }

    void export_rule(const std::string& name, const std::string& path) const {
        write_json_file(path, rule_to_json(name));
    }

private:
    static RuleBook from_yaml(const YAML::Node& root) {
        if (!root.IsMap() || !root["rule_sets"] || !root["rule_sets"].IsSequence())
            throw ConfigError("YAML file must contain 'rule_sets' key");
        RuleBook book;
        for (const auto& n : root["rule_sets"]) {
            ScanRule r = rules_detail::parse_rule(n);
            if (!book.rules_.count(r.name)) book.order_.push_back(r.name);
            book.rules_[r.name] = r;
        }
        return book;
    }

    static void append(std::vector<ForbiddenCombination>& dst, const std::vector<ForbiddenCombination>& src) {
        dst.insert(dst.end(), src.begin(), src.end());
    }

    static const Fermion* find_fermion(const Spectrum& s, const std::string& name) {
        for (const auto& f : s)
            if (f.name() == name) return &f;
        return nullptr;
    }

    std::map<std::string, ScanRule> rules_;
    std::vector<std::string> order_;
};
