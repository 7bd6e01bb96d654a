// fermion.h
// Chiral fermion record + spectrum I/O
//
// A Fermion is validated at construction and immutable afterwards.
// Variants ("broken" test spectra, conjugate partners) are built with the
// with_*() helpers, which return new validated records.
//
// JSON form (one entry of "fermions" / "base_spectrum"):
//   {"name": "Q_L", "su3_rep": 3, "su2_rep": 2, "hypercharge": "1/6",
//    "chirality": 1, "generations": 1}
// chirality and generations are optional (default 1).

#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>
#include <fstream>
#include <stdexcept>
#include <utility>

#include "rational.h"
#include "anomaly_tables.h"

// ============================================================================
// Errors
// ============================================================================

// Bad quantum numbers for a single fermion. Aborts that construction only.
class ValidationError : public std::invalid_argument {
public:
    ValidationError(std::string field, const std::string& what)
        : std::invalid_argument(what), field_(std::move(field)) {}
    const std::string& field() const { return field_; }
private:
    std::string field_;
};

// Unknown rule, malformed constraint, unreadable template...
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// ============================================================================
// Fermion
// ============================================================================

class Fermion {
public:
    Fermion(std::string name, int su3_rep, int su2_rep, Rational hypercharge,
            int chirality = 1, int generations = 1)
        : name_(std::move(name)), su3_rep_(su3_rep), su2_rep_(su2_rep),
          hypercharge_(std::move(hypercharge)), chirality_(chirality),
          generations_(generations) {
        validate();
    }

    const std::string& name() const { return name_; }
    int su3_rep() const { return su3_rep_; }
    int su2_rep() const { return su2_rep_; }
    const Rational& hypercharge() const { return hypercharge_; }
    int chirality() const { return chirality_; }
    int generations() const { return generations_; }

    // chirality * generations
    long long weight() const { return static_cast<long long>(chirality_) * generations_; }

    Fermion with_name(std::string name) const {
        return Fermion(std::move(name), su3_rep_, su2_rep_, hypercharge_, chirality_, generations_);
    }
    Fermion with_hypercharge(Rational y) const {
        return Fermion(name_, su3_rep_, su2_rep_, std::move(y), chirality_, generations_);
    }
    Fermion with_chirality(int chi) const {
        return Fermion(name_, su3_rep_, su2_rep_, hypercharge_, chi, generations_);
    }
    Fermion with_generations(int n) const {
        return Fermion(name_, su3_rep_, su2_rep_, hypercharge_, chirality_, n);
    }

    // Same quantum numbers, opposite chirality, single copy
    Fermion conjugate(const std::string& suffix = "bar") const {
        return Fermion(name_ + suffix, su3_rep_, su2_rep_, hypercharge_, -chirality_);
    }

    bool operator==(const Fermion& o) const {
        return name_ == o.name_ && su3_rep_ == o.su3_rep_ && su2_rep_ == o.su2_rep_
            && hypercharge_ == o.hypercharge_ && chirality_ == o.chirality_
            && generations_ == o.generations_;
    }
    bool operator!=(const Fermion& o) const { return !(*this == o); }

    // "(3, 2)_1/6"
    std::string quantum_numbers() const {
        return "(" + std::to_string(su3_rep_) + ", " + std::to_string(su2_rep_) + ")_"
             + rational_str(hypercharge_);
    }

    // "(3,2,1/6,1)"
    std::string signature() const {
        return "(" + std::to_string(su3_rep_) + "," + std::to_string(su2_rep_) + ","
             + rational_str(hypercharge_) + "," + std::to_string(chirality_) + ")";
    }

private:
    void validate() const {
        if (!is_su3_rep(su3_rep_))
            throw ValidationError("su3_rep", "Unsupported SU(3) representation: " + std::to_string(su3_rep_));
        if (!is_su2_rep(su2_rep_))
            throw ValidationError("su2_rep", "Unsupported SU(2) representation: " + std::to_string(su2_rep_));
        if (chirality_ != 1 && chirality_ != -1)
            throw ValidationError("chirality", "Chirality must be ±1, got " + std::to_string(chirality_));
        if (generations_ < 1)
            throw ValidationError("generations", "Generations must be positive, got " + std::to_string(generations_));
    }

    std::string name_;
    int su3_rep_;
    int su2_rep_;
    Rational hypercharge_;
    int chirality_;
    int generations_;
};

using Spectrum = std::vector<Fermion>;

inline Spectrum concat(const Spectrum& base, const Spectrum& extra) {
    Spectrum s = base;
    s.insert(s.end(), extra.begin(), extra.end());
    return s;
}

// ============================================================================
// Standard Model, one generation
// ============================================================================

inline Spectrum standard_model_spectrum(bool include_right_neutrino = false) {
    Spectrum s = {
        // Quarks
        Fermion("Q_L", 3, 2, make_rational(1, 6),  1),
        Fermion("u_R", 3, 1, make_rational(2, 3), -1),
        Fermion("d_R", 3, 1, make_rational(-1, 3), -1),
        // Leptons
        Fermion("L_L", 1, 2, make_rational(-1, 2), 1),
        Fermion("e_R", 1, 1, make_rational(-1),   -1),
    };
    if (include_right_neutrino)
        s.push_back(Fermion("ν_R", 1, 1, make_rational(0), -1));
    return s;
}

// ============================================================================
// JSON
// ============================================================================

// Accepts "n/d" / decimal strings and JSON integers or floats.
inline Rational rational_from_json(const nlohmann::json& j) {
    try {
        if (j.is_string()) return parse_rational(j.get<std::string>());
        if (j.is_number_integer()) return make_rational(j.get<long long>());
        if (j.is_number_float()) return parse_rational(j.dump());
    } catch (const std::invalid_argument& e) {
        throw ConfigError(e.what());
    }
    throw ConfigError("Cannot parse fraction from: " + j.dump());
}

inline nlohmann::json fermion_to_json(const Fermion& f) {
    return {
        {"name", f.name()},
        {"su3_rep", f.su3_rep()},
        {"su2_rep", f.su2_rep()},
        {"hypercharge", rational_str(f.hypercharge())},
        {"chirality", f.chirality()},
        {"generations", f.generations()}
    };
}

inline nlohmann::json spectrum_to_json(const Spectrum& s) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& f : s) arr.push_back(fermion_to_json(f));
    return arr;
}

// Malformed entries -> ConfigError; bad quantum numbers -> ValidationError
inline Fermion fermion_from_json(const nlohmann::json& j) {
    std::string name;
    int su3 = 0, su2 = 0, chi = 1, gen = 1;
    Rational y;
    try {
        name = j.at("name").get<std::string>();
        su3 = j.at("su3_rep").get<int>();
        su2 = j.at("su2_rep").get<int>();
        y = rational_from_json(j.at("hypercharge"));
        if (j.contains("chirality")) chi = j.at("chirality").get<int>();
        if (j.contains("generations")) gen = j.at("generations").get<int>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Malformed fermion entry: ") + e.what());
    }
    return Fermion(name, su3, su2, y, chi, gen);
}

inline Spectrum spectrum_from_json(const nlohmann::json& arr) {
    if (!arr.is_array()) throw ConfigError("Spectrum must be a JSON array");
    Spectrum s;
    for (const auto& j : arr) s.push_back(fermion_from_json(j));
    return s;
}

inline nlohmann::json load_json_file(const std::string& filename) {
    std::ifstream fin(filename);
    if (!fin) throw ConfigError("Cannot open " + filename);
    try {
        return nlohmann::json::parse(fin);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Invalid JSON in " + filename + ": " + e.what());
    }
}

// {"fermions": [...]} as used by anomaly_check --json
inline Spectrum load_spectrum_file(const std::string& filename) {
    nlohmann::json j = load_json_file(filename);
    if (!j.is_object() || !j.contains("fermions"))
        throw ConfigError(filename + ": missing 'fermions' array");
    return spectrum_from_json(j.at("fermions"));
}
