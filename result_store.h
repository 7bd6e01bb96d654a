// result_store.h
// Content-addressed persistence of anomaly-free spectra
//
//   canonical = compact JSON array of fermion objects, keys sorted,
//               hypercharge as exact "n/d" text
//   id        = <tag>_<first 10 hex of SHA-1(canonical)>.json
//   payload   = {"tag", "is_anomaly_free": true, "fermions"}
//
// Persistence goes through a ResultSink so the scanner never touches the
// filesystem on its own.

#pragma once

#include <nlohmann/json.hpp>
#include <openssl/evp.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "fermion.h"
#include "anomaly_checker.h"
#include "candidate_generator.h"

namespace fs = std::filesystem;

// ============================================================================
// Scan results
// ============================================================================

enum class ScanBlock {
    SingleAddition,     // Block A
    VectorLike,         // Block B
    VectorLikeFromA,    // Block B'
    ChiralPair,         // Block C
    PhysicsSet          // rule-supplied sets
};

inline const char* scan_block_name(ScanBlock b) {
    switch (b) {
        case ScanBlock::SingleAddition:  return "single_fermion";
        case ScanBlock::VectorLike:      return "vector_like";
        case ScanBlock::VectorLikeFromA: return "vector_like_from_a";
        case ScanBlock::ChiralPair:      return "chiral_pair";
        case ScanBlock::PhysicsSet:      return "physics_motivated";
    }
    return "unknown";
}

struct ScanResult {
    Spectrum spectrum;
    AnomalyMap anomalies;
    bool is_anomaly_free = true;
    std::string description;
    ScanBlock block = ScanBlock::SingleAddition;
    std::string result_id;
};

// ============================================================================
// Canonical form + hash
// ============================================================================

struct ResultRecord {
    std::string canonical;
    std::string sha1;           // 40 hex chars
    std::string filename;       // <tag>_<sha1[0:10]>.json
    nlohmann::json payload;
};

inline std::string sha1_hex(const std::string& data) {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), md, &len, EVP_sha1(), nullptr) != 1)
        throw std::runtime_error("SHA-1 digest failed");
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(2 * len);
    for (unsigned int i = 0; i < len; i++) {
        out += hex[md[i] >> 4];
        out += hex[md[i] & 0xf];
    }
    return out;
}

// nlohmann::json objects keep keys sorted, so dump() is canonical
inline ResultRecord dump_result(const Spectrum& spectrum, const std::string& tag) {
    ResultRecord rec;
    nlohmann::json fermions = spectrum_to_json(spectrum);
    rec.canonical = fermions.dump();
    rec.sha1 = sha1_hex(rec.canonical);
    rec.filename = tag + "_" + rec.sha1.substr(0, 10) + ".json";
    rec.payload = {
        {"tag", tag},
        {"is_anomaly_free", true},
        {"fermions", fermions}
    };
    return rec;
}

// ============================================================================
// Sinks
// ============================================================================

class ResultSink {
public:
    virtual ~ResultSink() = default;
    // Returns the result identifier (the record filename)
    virtual std::string persist(const Spectrum& spectrum, const std::string& tag) = 0;
};

// Writes one JSON file per record under `dir`. Write failures are reported
// and the scan continues.
class DirectoryResultSink : public ResultSink {
public:
    explicit DirectoryResultSink(fs::path dir) : dir_(std::move(dir)) {}

    const fs::path& directory() const { return dir_; }
    int written() const { return written_; }
    int failed() const { return failed_; }

    std::string persist(const Spectrum& spectrum, const std::string& tag) override {
        ResultRecord rec = dump_result(spectrum, tag);
        std::lock_guard<std::mutex> lock(mtx_);

        std::error_code ec;
        fs::create_directories(dir_, ec);
        if (ec) {
            std::cerr << "Cannot create " << dir_.string() << ": " << ec.message() << "\n";
            failed_++;
            return rec.filename;
        }

        fs::path path = dir_ / rec.filename;
        std::ofstream fout(path);
        if (!fout) {
            std::cerr << "Cannot open: " << path.string() << "\n";
            failed_++;
            return rec.filename;
        }
        fout << rec.payload.dump(2) << "\n";
        fout.flush();
        if (!fout) {
            std::cerr << "Cannot write: " << path.string() << "\n";
            failed_++;
            return rec.filename;
        }
        written_++;
        return rec.filename;
    }

private:
    fs::path dir_;
    std::mutex mtx_;
    int written_ = 0;
    int failed_ = 0;
};

// Keeps records in memory, keyed by identifier
class MemoryResultSink : public ResultSink {
public:
    std::string persist(const Spectrum& spectrum, const std::string& tag) override {
        ResultRecord rec = dump_result(spectrum, tag);
        std::lock_guard<std::mutex> lock(mtx_);
        order_.push_back(rec.filename);
        records_[rec.filename] = rec;
        return rec.filename;
    }

    const std::map<std::string, ResultRecord>& records() const { return records_; }
    // Identifiers in persist() order, repeats included
    const std::vector<std::string>& persisted() const { return order_; }
    bool contains(const std::string& id) const { return records_.count(id) > 0; }

private:
    std::mutex mtx_;
    std::map<std::string, ResultRecord> records_;
    std::vector<std::string> order_;
};

// ============================================================================
// Run export
// ============================================================================

// Fermions of `spectrum` whose name does not appear in `base`
inline Spectrum new_fermions(const Spectrum& spectrum, const Spectrum& base) {
    std::set<std::string> base_names;
    for (const auto& f : base) base_names.insert(f.name());
    Spectrum out;
    for (const auto& f : spectrum)
        if (!base_names.count(f.name())) out.push_back(f);
    return out;
}

inline nlohmann::json export_results(const Spectrum& base, const ScanConfig& config,
                                     const std::vector<ScanResult>& models) {
    nlohmann::json doc;
    doc["scan_config"] = scan_config_to_json(config);
    doc["base_spectrum"] = spectrum_to_json(base);

    nlohmann::json arr = nlohmann::json::array();
    for (const auto& m : models) {
        nlohmann::json sig = nlohmann::json::array();
        for (const auto& f : new_fermions(m.spectrum, base)) sig.push_back(f.signature());

        arr.push_back({
            {"description", m.description},
            {"stage", scan_block_name(m.block)},
            {"result_id", m.result_id},
            {"signature", sig},
            {"fermions", spectrum_to_json(m.spectrum)},
            {"is_anomaly_free", m.is_anomaly_free}
        });
    }
    doc["anomaly_free_models"] = arr;
    return doc;
}

// Throws ConfigError when the file cannot be written
inline void write_json_file(const fs::path& path, const nlohmann::json& j) {
    std::ofstream fout(path);
    if (!fout) throw ConfigError("Cannot open " + path.string() + " for writing");
    fout << j.dump(2) << "\n";
}
