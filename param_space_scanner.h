// param_space_scanner.h
// Staged search for anomaly-free extensions of a base spectrum
//
// Blocks (run_comprehensive_scan order):
//   A  : single fermion, curated (su3, su2) x k/6 grid x chirality
//   B  : vector-like pair X_L + X_R over the full configured cross product
//   B' : F + Fbar for every Block A hit F
//   C  : Higgsino-style (1,2) pair Hu(+Y), Hd(-Y), Y in {1/2, 1, 3/2}
// Physics-motivated sets (rule layer) are tested on demand.
//
// Every block builds its candidate list first, evaluates it (optionally on
// worker threads), then records hits in candidate order. The result limit
// is checked between blocks only.

#pragma once

#include <algorithm>
#include <atomic>
#include <initializer_list>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "fermion.h"
#include "anomaly_checker.h"
#include "candidate_generator.h"
#include "result_store.h"

// ############################################################################
// PART 1: TRIALS
// ############################################################################

// One spectrum to test: base + added fermions
struct ScanTrial {
    Spectrum added;
    std::string tag;
    std::string description;
};

struct TrialOutcome {
    AnomalyMap anomalies;
    bool passes = false;
};

// Evaluate trials on `num_threads` workers; outcome i belongs to trial i
inline std::vector<TrialOutcome> evaluate_trials(const Spectrum& base,
                                                 const std::vector<ScanTrial>& trials,
                                                 int num_threads) {
    std::vector<TrialOutcome> out(trials.size());
    std::atomic<size_t> next{0};

    auto worker = [&]() {
        for (size_t i = next.fetch_add(1); i < trials.size(); i = next.fetch_add(1)) {
            out[i].anomalies = compute_anomalies(concat(base, trials[i].added));
            out[i].passes = verify_cancellation(out[i].anomalies).all_cancel;
        }
    };

    int n_workers = std::max(1, std::min<int>(num_threads, static_cast<int>(trials.size())));
    std::vector<std::thread> pool;
    for (int t = 1; t < n_workers; t++) pool.emplace_back(worker);
    worker();
    for (auto& th : pool) th.join();
    return out;
}

// ############################################################################
// PART 2: SCANNER
// ############################################################################

class ParameterSpaceScanner {
public:
    ParameterSpaceScanner(Spectrum base, ScanConfig config, ResultSink& sink,
                          std::ostream& log = std::cout)
        : base_(std::move(base)), config_(std::move(config)), sink_(sink), log_(log) {
        validate_blocks(config_.enabled_blocks);
    }

    const Spectrum& base() const { return base_; }
    const ScanConfig& config() const { return config_; }
    const std::vector<ScanResult>& results() const { return results_; }
    const std::vector<ScanResult>& anomaly_free_models() const { return anomaly_free_models_; }
    const std::vector<Fermion>& block_a_hits() const { return block_a_hits_; }
    long long tested_configurations() const { return tested_; }
    int skipped_candidates() const { return skipped_; }

    bool limit_reached() const {
        return config_.limit && static_cast<int>(anomaly_free_models_.size()) >= *config_.limit;
    }

    // ========================================================================
    // Block A
    // ========================================================================

    // Re-running replaces the Block B' seeds from the previous run
    std::vector<ScanResult> scan_single_additions() {
        block_a_hits_.clear();
        std::vector<ScanTrial> trials;
        for (const auto& cell : single_addition_cells(config_)) {
            for (int chi : {1, -1}) {
                std::string suffix = std::to_string(cell.su3) + std::to_string(cell.su2);
                std::string name = "X_" + suffix + "_" + std::to_string(cell.k) + "_" + (chi == 1 ? "L" : "R");
                try {
                    Fermion f(name, cell.su3, cell.su2, cell.hypercharge, chi);
                    trials.push_back({{f},
                                      "single_" + suffix + "_" + std::to_string(cell.k) + "_" + std::to_string(chi),
                                      "Single fermion: " + f.quantum_numbers() + " × " + std::to_string(chi)});
                } catch (const ValidationError& e) {
                    skip(e);
                }
            }
        }

        auto hits = run_trials(trials, ScanBlock::SingleAddition);
        for (const auto& r : hits) block_a_hits_.push_back(r.spectrum.back());
        log_ << "Block A: Found " << hits.size() << " anomaly-free single fermion additions\n";
        return hits;
    }

    // ========================================================================
    // Block B
    // ========================================================================

    std::vector<ScanResult> scan_vector_like_pairs() {
        std::vector<ScanTrial> trials;
        for (const auto& cell : vector_like_cells(config_)) {
            try {
                Fermion left("X_L", cell.su3, cell.su2, cell.hypercharge, 1);
                Fermion right("X_R", cell.su3, cell.su2, cell.hypercharge, -1);
                trials.push_back({{left, right},
                                  "vector_like_" + hypercharge_tag(cell.su3, cell.su2, cell.hypercharge),
                                  "Vector-like pair: " + left.quantum_numbers()});
            } catch (const ValidationError& e) {
                skip(e);
            }
        }

        auto hits = run_trials(trials, ScanBlock::VectorLike);
        log_ << "Found " << hits.size() << " anomaly-free vector-like models\n";
        return hits;
    }

    // ========================================================================
    // Block B': conjugate partners of Block A hits
    // ========================================================================

    std::vector<ScanResult> scan_block_a_pairs() {
        std::vector<ScanTrial> trials;
        for (const Fermion& f : block_a_hits_) {
            Fermion fbar = f.conjugate("bar");
            trials.push_back({{f, fbar},
                              "vector_like_" + hypercharge_tag(f.su3_rep(), f.su2_rep(), f.hypercharge()),
                              "Vector-like pair from Block A: " + f.quantum_numbers()});
        }

        auto hits = run_trials(trials, ScanBlock::VectorLikeFromA);
        log_ << "Found " << hits.size() << " additional vector-like models from Block A seeds\n";
        return hits;
    }

    // ========================================================================
    // Block C
    // ========================================================================

    std::vector<ScanResult> scan_chiral_pairs() {
        std::vector<ScanTrial> trials;
        for (const auto& [num, den] : kHiggsinoHypercharges) {
            Rational y = make_rational(num, den);
            Fermion hu("Hu", 1, 2, y, 1);
            Fermion hd("Hd", 1, 2, Rational(-y), 1);
            trials.push_back({{hu, hd},
                              "higgsino_" + std::to_string(num) + "_" + std::to_string(den),
                              "Chiral pair: (1, 2)_[+" + rational_str(y) + ", -" + rational_str(y) + "]"});
        }

        auto hits = run_trials(trials, ScanBlock::ChiralPair);
        log_ << "Found " << hits.size() << " anomaly-free Higgsino models\n";
        return hits;
    }

    // ========================================================================
    // Physics-motivated sets (1-based numbering)
    // ========================================================================

    std::vector<ScanResult> scan_physics_sets(const std::vector<Spectrum>& sets) {
        std::vector<ScanTrial> trials;
        for (size_t i = 0; i < sets.size(); i++) {
            std::string idx = std::to_string(i + 1);
            trials.push_back({sets[i], "physics_set_" + idx, "Physics-motivated set " + idx});
        }
        auto hits = run_trials(trials, ScanBlock::PhysicsSet);
        log_ << "Physics-motivated sets: " << hits.size() << " of " << sets.size() << " anomaly-free\n";
        return hits;
    }

    // ========================================================================
    // Full run
    // ========================================================================

    void run_comprehensive_scan() {
        const std::string rule(60, '=');
        log_ << "Starting comprehensive parameter space scan...\n" << rule << "\n";

        if (config_.block_enabled("A")) {
            log_ << "\nBlock A: Scanning single fermion additions...\n";
            scan_single_additions();
            if (stop_at_limit()) return;
        }

        if (config_.block_enabled("B")) {
            log_ << "\nBlock B: Scanning vector-like fermion pairs (exhaustive)...\n";
            scan_vector_like_pairs();
            if (stop_at_limit()) return;
        }

        if (!block_a_hits_.empty() && config_.scan_block_a_pairs) {
            log_ << "\nBlock B-prime: Vector-like partners of Block A hits...\n";
            scan_block_a_pairs();
            if (stop_at_limit()) return;
        }

        if (config_.block_enabled("C")) {
            log_ << "\nBlock C: Scanning Higgsino-style chiral pairs...\n";
            scan_chiral_pairs();
        }

        log_ << "\nTotal configurations scanned: " << tested_ << "\n";
        log_ << "Anomaly-free models found: " << anomaly_free_models_.size() << "\n";
        if (skipped_ > 0) log_ << "Invalid candidates skipped: " << skipped_ << "\n";
    }

    // single_fermion / vector_like / chiral_pair / physics_motivated
    std::map<std::string, int> models_by_type() const {
        std::map<std::string, int> counts = {
            {"single_fermion", 0}, {"vector_like", 0}, {"chiral_pair", 0}, {"physics_motivated", 0}
        };
        for (const auto& m : anomaly_free_models_) {
            ScanBlock b = (m.block == ScanBlock::VectorLikeFromA) ? ScanBlock::VectorLike : m.block;
            counts[scan_block_name(b)]++;
        }
        return counts;
    }

    // ========================================================================
    // Report
    // ========================================================================

    void print_anomaly_free_models(std::ostream& out, int max_display = 20) const {
        const std::string rule(60, '=');
        const std::string dash(40, '-');

        out << "\n" << rule << "\nANOMALY-FREE MODELS DISCOVERED\n" << rule << "\n";
        if (anomaly_free_models_.empty()) {
            out << "No anomaly-free models found in the scan range.\n";
            return;
        }

        auto print_group = [&](const std::string& title, std::initializer_list<ScanBlock> blocks) {
            std::vector<const ScanResult*> group;
            for (const auto& m : anomaly_free_models_)
                if (std::find(blocks.begin(), blocks.end(), m.block) != blocks.end())
                    group.push_back(&m);
            if (group.empty()) return;

            out << "\n" << title << "\n" << dash << "\n";
            int shown = std::min<int>(max_display, static_cast<int>(group.size()));
            for (int i = 0; i < shown; i++)
                out << (i + 1) << ". " << group[i]->description << "\n";
            if (static_cast<int>(group.size()) > max_display)
                out << "   ... and " << (group.size() - max_display) << " more\n";
        };

        print_group("Block A - Single fermion additions:", {ScanBlock::SingleAddition});
        print_group("Block B - Vector-like fermion pairs:", {ScanBlock::VectorLike, ScanBlock::VectorLikeFromA});
        print_group("Block C - Higgsino-style chiral pairs:", {ScanBlock::ChiralPair});
        print_group("Physics-motivated sets:", {ScanBlock::PhysicsSet});

        out << "\n" << rule << "\nVERIFICATION OF KNOWN MODELS\n" << rule << "\n";

        auto found = [&](std::initializer_list<ScanBlock> blocks, const std::string& text) {
            for (const auto& m : anomaly_free_models_)
                if (std::find(blocks.begin(), blocks.end(), m.block) != blocks.end()
                    && m.description.find(text) != std::string::npos)
                    return true;
            return false;
        };

        if (found({ScanBlock::SingleAddition}, "(1, 1)_0 × -1"))
            out << "✓ Found right-handed neutrino: (1, 1)_0 × -1\n";
        if (found({ScanBlock::VectorLike, ScanBlock::VectorLikeFromA}, "(1, 2)_-1/2"))
            out << "✓ Found vector-like lepton doublet: (1, 2)_-1/2\n";
        if (found({ScanBlock::ChiralPair}, "(1, 2)_[+1/2, -1/2]"))
            out << "✓ Found MSSM Higgsino pair: (1, 2)_[+1/2, -1/2]\n";
        if (found({ScanBlock::VectorLike, ScanBlock::VectorLikeFromA}, "(3, 2)_1/6"))
            out << "✓ Found vector-like quark doublet: (3, 2)_1/6\n";
    }

private:
    // "<su3><su2>_<num>_<den>"
    static std::string hypercharge_tag(int su3, int su2, const Rational& y) {
        return std::to_string(su3) + std::to_string(su2) + "_"
             + boost::multiprecision::numerator(y).str() + "_"
             + boost::multiprecision::denominator(y).str();
    }

    void skip(const ValidationError& e) {
        skipped_++;
        std::cerr << "Skipping candidate (" << e.field() << "): " << e.what() << "\n";
    }

    bool stop_at_limit() {
        if (!limit_reached()) return false;
        log_ << "Reached limit of " << *config_.limit << " models. Stopping scan.\n";
        return true;
    }

    std::vector<ScanResult> run_trials(const std::vector<ScanTrial>& trials, ScanBlock block) {
        std::vector<TrialOutcome> outcomes = evaluate_trials(base_, trials, config_.num_threads);
        tested_ += static_cast<long long>(trials.size());

        std::vector<ScanResult> hits;
        for (size_t i = 0; i < trials.size(); i++) {
            if (!outcomes[i].passes) continue;
            ScanResult r;
            r.spectrum = concat(base_, trials[i].added);
            r.anomalies = outcomes[i].anomalies;
            r.is_anomaly_free = true;
            r.description = trials[i].description;
            r.block = block;
            r.result_id = sink_.persist(r.spectrum, trials[i].tag);
            if (config_.verbose) log_ << "  + " << r.description << "  [" << r.result_id << "]\n";
            hits.push_back(r);
        }

        results_.insert(results_.end(), hits.begin(), hits.end());
        anomaly_free_models_.insert(anomaly_free_models_.end(), hits.begin(), hits.end());
        return hits;
    }

    Spectrum base_;
    ScanConfig config_;
    ResultSink& sink_;
    std::ostream& log_;

    std::vector<ScanResult> results_;
    std::vector<ScanResult> anomaly_free_models_;
    std::vector<Fermion> block_a_hits_;
    long long tested_ = 0;
    int skipped_ = 0;
};
