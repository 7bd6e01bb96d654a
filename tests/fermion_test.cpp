// Tests for Fermion validation, derived copies and JSON I/O.

#include "fermion.h"

#include <gtest/gtest.h>

#include <string>

#include "test_helpers.h"

namespace {

// ============================================================================
// Helpers
// ============================================================================

std::string validation_field(const std::string& name, int su3, int su2, int chi, int gen) {
    try {
        Fermion f(name, su3, su2, make_rational(0), chi, gen);
    } catch (const ValidationError& e) {
        return e.field() + ": " + e.what();
    }
    return "";
}

// ============================================================================
// Construction
// ============================================================================

TEST(FermionTest, StoresQuantumNumbers) {
    Fermion q("Q_L", 3, 2, make_rational(1, 6), 1, 3);
    EXPECT_EQ(q.name(), "Q_L");
    EXPECT_EQ(q.su3_rep(), 3);
    EXPECT_EQ(q.su2_rep(), 2);
    EXPECT_EQ(q.hypercharge(), make_rational(1, 6));
    EXPECT_EQ(q.chirality(), 1);
    EXPECT_EQ(q.generations(), 3);
    EXPECT_EQ(q.weight(), 3);
    EXPECT_EQ(Fermion("u_R", 3, 1, make_rational(2, 3), -1, 2).weight(), -2);
    EXPECT_EQ(Fermion("X", 8, 3, make_rational(0), -1, 2147483647).weight(), -2147483647LL);
}

TEST(FermionTest, RejectsUnsupportedQuantumNumbers) {
    EXPECT_EQ(validation_field("X", 5, 1, 1, 1), "su3_rep: Unsupported SU(3) representation: 5");
    EXPECT_EQ(validation_field("X", 1, 4, 1, 1), "su2_rep: Unsupported SU(2) representation: 4");
    EXPECT_EQ(validation_field("X", 1, 1, 0, 1), "chirality: Chirality must be ±1, got 0");
    EXPECT_EQ(validation_field("X", 1, 1, 1, 0), "generations: Generations must be positive, got 0");
    EXPECT_EQ(validation_field("X", 8, 3, -1, 2), "");
}

TEST(FermionTest, ValidationErrorIsInvalidArgument) {
    EXPECT_THROW(Fermion("X", 2, 1, make_rational(0)), std::invalid_argument);
}

TEST(FermionTest, DerivedCopiesLeaveOriginalUntouched) {
    Fermion q("Q_L", 3, 2, make_rational(1, 6));
    Fermion q2 = q.with_hypercharge(make_rational(1, 3));
    EXPECT_EQ(q.hypercharge(), make_rational(1, 6));
    EXPECT_EQ(q2.hypercharge(), make_rational(1, 3));
    EXPECT_EQ(q.with_chirality(-1).chirality(), -1);
    EXPECT_EQ(q.with_generations(3).generations(), 3);
    EXPECT_EQ(q.with_name("Q'").name(), "Q'");
    EXPECT_THROW(q.with_chirality(2), ValidationError);
}

TEST(FermionTest, ConjugateFlipsChirality) {
    Fermion x("X_L", 1, 2, make_rational(-1, 2), 1, 3);
    Fermion xb = x.conjugate();
    EXPECT_EQ(xb.name(), "X_Lbar");
    EXPECT_EQ(xb.chirality(), -1);
    EXPECT_EQ(xb.generations(), 1);
    EXPECT_EQ(xb.hypercharge(), x.hypercharge());
    EXPECT_EQ(x.conjugate("_c").name(), "X_L_c");
}

TEST(FermionTest, TextForms) {
    Fermion q("Q_L", 3, 2, make_rational(1, 6));
    EXPECT_EQ(q.quantum_numbers(), "(3, 2)_1/6");
    EXPECT_EQ(q.signature(), "(3,2,1/6,1)");
    EXPECT_EQ(Fermion("e_R", 1, 1, make_rational(-1), -1).signature(), "(1,1,-1,-1)");
}

TEST(FermionTest, StandardModelSpectrum) {
    Spectrum sm = standard_model_spectrum();
    ASSERT_EQ(sm.size(), 5u);
    EXPECT_EQ(sm[0].name(), "Q_L");
    EXPECT_EQ(sm[4].name(), "e_R");

    Spectrum sm_nu = standard_model_spectrum(true);
    ASSERT_EQ(sm_nu.size(), 6u);
    EXPECT_EQ(sm_nu.back().name(), "ν_R");
    EXPECT_EQ(sm_nu.back().hypercharge(), make_rational(0));
    EXPECT_EQ(sm_nu.back().chirality(), -1);
}

TEST(FermionTest, ConcatAppends) {
    Spectrum s = concat(standard_model_spectrum(), {Fermion("N", 1, 1, make_rational(0), -1)});
    ASSERT_EQ(s.size(), 6u);
    EXPECT_EQ(s.back().name(), "N");
}

// ============================================================================
// JSON
// ============================================================================

TEST(FermionJsonTest, AcceptsStringIntegerAndFloatHypercharges) {
    EXPECT_EQ(rational_from_json(nlohmann::json("1/6")), make_rational(1, 6));
    EXPECT_EQ(rational_from_json(nlohmann::json(-1)), make_rational(-1));
    EXPECT_EQ(rational_from_json(nlohmann::json(0.5)), make_rational(1, 2));
    EXPECT_THROW(rational_from_json(nlohmann::json("x")), ConfigError);
    EXPECT_THROW(rational_from_json(nlohmann::json::array()), ConfigError);
}

TEST(FermionJsonTest, ParsesEntryWithDefaults) {
    auto j = nlohmann::json::parse(R"({"name": "L_L", "su3_rep": 1, "su2_rep": 2, "hypercharge": "-1/2"})");
    Fermion f = fermion_from_json(j);
    EXPECT_EQ(f.name(), "L_L");
    EXPECT_EQ(f.hypercharge(), make_rational(-1, 2));
    EXPECT_EQ(f.chirality(), 1);
    EXPECT_EQ(f.generations(), 1);
}

TEST(FermionJsonTest, RoundTripsThroughJson) {
    Fermion u("u_R", 3, 1, make_rational(2, 3), -1, 3);
    EXPECT_EQ(fermion_from_json(fermion_to_json(u)), u);
    EXPECT_EQ(fermion_to_json(u).at("hypercharge"), "2/3");
}

TEST(FermionJsonTest, MalformedEntries) {
    auto missing = nlohmann::json::parse(R"({"name": "X", "su2_rep": 1, "hypercharge": 0})");
    EXPECT_THROW(fermion_from_json(missing), ConfigError);

    auto wrong_type = nlohmann::json::parse(R"({"name": "X", "su3_rep": "three", "su2_rep": 1, "hypercharge": 0})");
    EXPECT_THROW(fermion_from_json(wrong_type), ConfigError);

    auto bad_rep = nlohmann::json::parse(R"({"name": "X", "su3_rep": 10, "su2_rep": 1, "hypercharge": 0})");
    EXPECT_THROW(fermion_from_json(bad_rep), ValidationError);

    EXPECT_THROW(spectrum_from_json(nlohmann::json::object()), ConfigError);
}

TEST(FermionJsonTest, LoadsSpectrumFile) {
    test_helpers::TempDir dir;
    auto good = dir.write("model.json", nlohmann::json{{"fermions", spectrum_to_json(standard_model_spectrum(true))}}.dump());
    EXPECT_EQ(load_spectrum_file(good.string()), standard_model_spectrum(true));

    auto no_fermions = dir.write("empty.json", "{}");
    EXPECT_THROW(load_spectrum_file(no_fermions.string()), ConfigError);

    auto broken = dir.write("broken.json", "{\"fermions\": [");
    EXPECT_THROW(load_spectrum_file(broken.string()), ConfigError);

    EXPECT_THROW(load_spectrum_file((dir.path() / "missing.json").string()), ConfigError);
}

}  // namespace
