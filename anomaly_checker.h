// anomaly_checker.h
// Gauge / gravitational anomaly coefficients for SU(3) x SU(2) x U(1)_Y
//
// Pipeline:
//   1. Group-factor matrix G (n x 7, integers): doubled Dynkin indices and
//      representation dimensions per fermion (anomaly_tables.h)
//   2. W = diag(chirality * generations) * G
//   3. coef_j = (1/2) * sum_i W(i,j) * Y_i^p_j     (exact, p from hypercharge_power)
//   4. Judgment: |double(coef_j)| <= tol for every j

#pragma once

#include <Eigen/Dense>

#include <array>
#include <string>
#include <vector>
#include <sstream>
#include <cmath>

#include "rational.h"
#include "anomaly_tables.h"
#include "fermion.h"

using AnomalyMap = std::array<Rational, kNumAnomalies>;

// |G| <= 48 fits int; weights reach chirality * INT_MAX generations, so the
// weighted product runs in long long.
using WeightVector = Eigen::Matrix<long long, Eigen::Dynamic, 1>;
using WeightedFactors = Eigen::Matrix<long long, Eigen::Dynamic, Eigen::Dynamic>;

inline const Rational& coefficient(const AnomalyMap& m, Anomaly a) {
    return m[static_cast<int>(a)];
}

struct CancellationResult {
    bool all_cancel = true;
    std::vector<std::string> failures;   // "<name> = <exact value>"
};

// ############################################################################
// PART 1: GROUP FACTORS
// ############################################################################

// Column j of row i = 2 * (group part of coefficient j) for fermion i
inline Eigen::MatrixXi group_factor_matrix(const Spectrum& fermions) {
    const int n = static_cast<int>(fermions.size());
    Eigen::MatrixXi G = Eigen::MatrixXi::Zero(n, kNumAnomalies);
    for (int i = 0; i < n; i++) {
        const Fermion& f = fermions[i];
        const int d3 = f.su3_rep();
        const int d2 = f.su2_rep();
        const int dim = kFactorScale * d3 * d2;
        G(i, static_cast<int>(Anomaly::U1))       = dim;
        G(i, static_cast<int>(Anomaly::U1Cubed))  = dim;
        G(i, static_cast<int>(Anomaly::U1SU2Sq))  = d3 * su2_dynkin_index_x2(d2);
        G(i, static_cast<int>(Anomaly::U1SU3Sq))  = d2 * su3_dynkin_index_x2(d3);
        G(i, static_cast<int>(Anomaly::SU2Cubed)) = d3 * su2_cubic_coeff_x2(d2);
        // [SU(3)]^3 reuses the Dynkin table
        G(i, static_cast<int>(Anomaly::SU3Cubed)) = d2 * su3_dynkin_index_x2(d3);
        G(i, static_cast<int>(Anomaly::GravU1))   = dim;
    }
    return G;
}

inline WeightVector chiral_weights(const Spectrum& fermions) {
    WeightVector w(static_cast<int>(fermions.size()));
    for (size_t i = 0; i < fermions.size(); i++) w(i) = fermions[i].weight();
    return w;
}

// ############################################################################
// PART 2: COEFFICIENTS
// ############################################################################

inline AnomalyMap compute_anomalies(const Spectrum& fermions) {
    AnomalyMap coef;
    coef.fill(Rational(0));
    if (fermions.empty()) return coef;

    WeightedFactors W = chiral_weights(fermions).asDiagonal()
                      * group_factor_matrix(fermions).cast<long long>();

    for (int i = 0; i < W.rows(); i++) {
        const Rational& y = fermions[i].hypercharge();
        for (Anomaly a : kAllAnomalies) {
            int j = static_cast<int>(a);
            if (W(i, j) == 0) continue;
            coef[j] += Rational(W(i, j)) * rational_pow(y, hypercharge_power(a));
        }
    }
    for (auto& c : coef) c /= kFactorScale;
    return coef;
}

// tol == 0 demands exact zero after conversion to double
inline CancellationResult verify_cancellation(const AnomalyMap& anomalies, double tol = 1e-10) {
    CancellationResult res;
    for (Anomaly a : kAllAnomalies) {
        const Rational& v = coefficient(anomalies, a);
        if (std::abs(rational_to_double(v)) > tol) {
            res.all_cancel = false;
            res.failures.push_back(std::string(anomaly_name(a)) + " = " + rational_str(v));
        }
    }
    return res;
}

// ############################################################################
// PART 3: CHECKER
// ############################################################################

class AnomalyChecker {
public:
    explicit AnomalyChecker(Spectrum fermions)
        : fermions_(std::move(fermions)) {}

    const Spectrum& fermions() const { return fermions_; }

    // Memoized. Fermions are immutable, so the cache only needs clearing
    // through recompute().
    const AnomalyMap& compute_all_anomalies() {
        if (!cached_) {
            anomalies_ = compute_anomalies(fermions_);
            cached_ = true;
        }
        return anomalies_;
    }

    const AnomalyMap& recompute() {
        cached_ = false;
        return compute_all_anomalies();
    }

    CancellationResult verify_cancellation(double tol = 1e-10) {
        return ::verify_cancellation(compute_all_anomalies(), tol);
    }

    bool is_anomaly_free(double tol = 1e-10) {
        return verify_cancellation(tol).all_cancel;
    }

    std::string generate_report(double tol = 1e-10) {
        std::ostringstream ss;
        const std::string rule(60, '=');
        const std::string dash(60, '-');

        ss << rule << "\n";
        ss << "ANOMALY CANCELLATION REPORT\n";
        ss << rule << "\n\n";

        ss << "Fermion Content:\n";
        ss << dash << "\n";
        for (const auto& f : fermions_) {
            ss << "  " << f.name() << ": " << f.quantum_numbers()
               << " [" << (f.chirality() == 1 ? "L" : "R") << "]";
            if (f.generations() > 1) ss << " x" << f.generations();
            ss << "\n";
        }

        ss << "\nAnomaly Coefficients:\n";
        ss << dash << "\n";
        const AnomalyMap& m = compute_all_anomalies();
        for (Anomaly a : kAllAnomalies) {
            const Rational& v = coefficient(m, a);
            bool ok = std::abs(rational_to_double(v)) <= tol;
            ss << "  " << anomaly_name(a) << ": " << rational_str(v)
               << " " << (ok ? "✓" : "✗") << "\n";
        }

        ss << "\n" << rule << "\n";
        CancellationResult res = verify_cancellation(tol);
        if (res.all_cancel) {
            ss << "✓ All anomalies cancel - Model is consistent!\n";
        } else {
            ss << "✗ Anomalies do not cancel:\n";
            for (const auto& f : res.failures) ss << "  - " << f << "\n";
        }
        ss << rule << "\n";
        return ss.str();
    }

private:
    Spectrum fermions_;
    AnomalyMap anomalies_;
    bool cached_ = false;
};
