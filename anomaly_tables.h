// anomaly_tables.h
// Group-theory tables for 4D gauge/gravitational anomaly coefficients
//
// Dynkin indices are stored doubled (2T) so every entry is an integer:
//   SU(2): 2T(n) = (n^3 - n) / 6
//   SU(3): 2T from table {1:0, 3:1, 6:5, 8:6}
// Halving happens once, after the exact rational sum.

#pragma once

#include <array>
#include <utility>

#include "rational.h"

// ============================================================================
// ANOMALY COEFFICIENTS
// ============================================================================

enum class Anomaly {
    U1,             // [U(1)_Y]
    U1Cubed,        // [U(1)_Y]^3
    U1SU2Sq,        // [U(1)_Y][SU(2)]^2
    U1SU3Sq,        // [U(1)_Y][SU(3)]^2
    SU2Cubed,       // [SU(2)]^3
    SU3Cubed,       // [SU(3)]^3
    GravU1          // [Gravity]^2[U(1)_Y]
};

constexpr int kNumAnomalies = 7;

constexpr std::array<Anomaly, kNumAnomalies> kAllAnomalies = {
    Anomaly::U1, Anomaly::U1Cubed, Anomaly::U1SU2Sq, Anomaly::U1SU3Sq,
    Anomaly::SU2Cubed, Anomaly::SU3Cubed, Anomaly::GravU1
};

inline const char* anomaly_name(Anomaly a) {
    switch (a) {
        case Anomaly::U1:       return "[U(1)_Y]";
        case Anomaly::U1Cubed:  return "[U(1)_Y]³";
        case Anomaly::U1SU2Sq:  return "[U(1)_Y][SU(2)]²";
        case Anomaly::U1SU3Sq:  return "[U(1)_Y][SU(3)]²";
        case Anomaly::SU2Cubed: return "[SU(2)]³";
        case Anomaly::SU3Cubed: return "[SU(3)]³";
        case Anomaly::GravU1:   return "[Gravity]²[U(1)_Y]";
    }
    return "Unknown";
}

// Power of Y multiplying the group factor of each coefficient
inline int hypercharge_power(Anomaly a) {
    switch (a) {
        case Anomaly::U1:       return 1;
        case Anomaly::U1Cubed:  return 3;
        case Anomaly::U1SU2Sq:  return 1;
        case Anomaly::U1SU3Sq:  return 1;
        case Anomaly::SU2Cubed: return 0;
        case Anomaly::SU3Cubed: return 0;
        case Anomaly::GravU1:   return 1;
    }
    return 0;
}

// Scale of every group factor (doubled Dynkin indices)
constexpr int kFactorScale = 2;

// ============================================================================
// SU(2) TABLES
// param = representation dimension
// ============================================================================

inline int su2_dynkin_index_x2(int dim) {
    switch (dim) {
        case 1: return 0;
        case 2: return 1;   // 1/2
        case 3: return 4;   // 2
        default: return (dim * dim * dim - dim) / 6;
    }
}

// No independent cubic Casimir for SU(2)
inline int su2_cubic_coeff_x2(int dim) {
    (void)dim;
    return 0;
}

inline Rational su2_dynkin_index(int dim) {
    return make_rational(su2_dynkin_index_x2(dim), kFactorScale);
}

inline Rational su2_cubic_coeff(int dim) {
    return make_rational(su2_cubic_coeff_x2(dim), kFactorScale);
}

// ============================================================================
// SU(3) TABLES
// Unlisted dimensions contribute 0.
// ============================================================================

inline int su3_dynkin_index_x2(int dim) {
    switch (dim) {
        case 1: return 0;   // singlet
        case 3: return 1;   // fundamental, 1/2
        case 6: return 5;   // symmetric, 5/2
        case 8: return 6;   // adjoint, 3
        default: return 0;
    }
}

inline Rational su3_dynkin_index(int dim) {
    return make_rational(su3_dynkin_index_x2(dim), kFactorScale);
}

// ============================================================================
// REPRESENTATIONS ACCEPTED BY THE FERMION VALIDATOR
// ============================================================================

constexpr std::array<int, 4> kSU3Reps = {1, 3, 6, 8};
constexpr std::array<int, 3> kSU2Reps = {1, 2, 3};

inline bool is_su3_rep(int dim) {
    for (int d : kSU3Reps) if (d == dim) return true;
    return false;
}

inline bool is_su2_rep(int dim) {
    for (int d : kSU2Reps) if (d == dim) return true;
    return false;
}

// Block A: (su3, su2) combinations scanned for single additions
constexpr std::array<std::pair<int, int>, 7> kSingleAdditionReps = {{
    {1, 1}, {1, 2}, {1, 3},
    {3, 1}, {3, 2},
    {6, 1}, {8, 1}
}};

// Block C: Higgsino-style hypercharges, Y = num/den
constexpr std::array<std::pair<int, int>, 3> kHiggsinoHypercharges = {{
    {1, 2}, {1, 1}, {3, 2}
}};
