// Tests for content-addressed result records, sinks and the run export.

#include "result_store.h"

#include <gtest/gtest.h>

#include <fstream>
#include <regex>

#include "test_helpers.h"

namespace {

// ============================================================================
// Helpers
// ============================================================================

Spectrum sm_plus_singlet(int chirality) {
    return concat(standard_model_spectrum(), {Fermion("X_11_0_L", 1, 1, make_rational(0), chirality)});
}

nlohmann::json read_json(const fs::path& p) {
    std::ifstream in(p);
    return nlohmann::json::parse(in);
}

// ============================================================================
// Records
// ============================================================================

TEST(ResultRecordTest, Sha1KnownVectors) {
    EXPECT_EQ(sha1_hex(""), "da39a3ee5e6b4b0d3255bfef95601890afd80709");
    EXPECT_EQ(sha1_hex("abc"), "a9993e364706816aba3e25717850c26c9cd0d89d");
}

TEST(ResultRecordTest, CanonicalFormHasSortedKeysAndExactHypercharge) {
    ResultRecord rec = dump_result({Fermion("Q_L", 3, 2, make_rational(1, 6))}, "t");
    EXPECT_EQ(rec.canonical,
              R"([{"chirality":1,"generations":1,"hypercharge":"1/6","name":"Q_L","su2_rep":2,"su3_rep":3}])");
    EXPECT_EQ(rec.sha1, sha1_hex(rec.canonical));
}

TEST(ResultRecordTest, SameSpectrumSameIdentifier) {
    ResultRecord a = dump_result(sm_plus_singlet(1), "single_11_0_1");
    ResultRecord b = dump_result(sm_plus_singlet(1), "single_11_0_1");
    EXPECT_EQ(a.sha1, b.sha1);
    EXPECT_EQ(a.filename, b.filename);

    ResultRecord c = dump_result(sm_plus_singlet(-1), "single_11_0_1");
    EXPECT_NE(a.sha1, c.sha1);
}

TEST(ResultRecordTest, FilenameAndPayload) {
    ResultRecord rec = dump_result(sm_plus_singlet(1), "single_11_0_1");
    EXPECT_TRUE(std::regex_match(rec.filename, std::regex("single_11_0_1_[0-9a-f]{10}\\.json")));
    EXPECT_EQ(rec.filename.substr(14, 10), rec.sha1.substr(0, 10));
    EXPECT_EQ(rec.payload.at("tag"), "single_11_0_1");
    EXPECT_EQ(rec.payload.at("is_anomaly_free"), true);
    EXPECT_EQ(rec.payload.at("fermions").size(), 6u);
}

TEST(ResultRecordTest, BlockNames) {
    EXPECT_STREQ(scan_block_name(ScanBlock::SingleAddition), "single_fermion");
    EXPECT_STREQ(scan_block_name(ScanBlock::VectorLikeFromA), "vector_like_from_a");
    EXPECT_STREQ(scan_block_name(ScanBlock::PhysicsSet), "physics_motivated");
}

// ============================================================================
// Sinks
// ============================================================================

TEST(MemoryResultSinkTest, DeduplicatesRecordsButKeepsOrder) {
    MemoryResultSink sink;
    std::string id1 = sink.persist(sm_plus_singlet(1), "a");
    std::string id2 = sink.persist(sm_plus_singlet(1), "a");
    std::string id3 = sink.persist(sm_plus_singlet(-1), "a");
    EXPECT_EQ(id1, id2);
    EXPECT_NE(id1, id3);
    EXPECT_EQ(sink.records().size(), 2u);
    EXPECT_EQ(sink.persisted().size(), 3u);
    EXPECT_TRUE(sink.contains(id3));
    EXPECT_FALSE(sink.contains("missing.json"));
}

TEST(DirectoryResultSinkTest, WritesOneFilePerRecord) {
    test_helpers::TempDir dir;
    DirectoryResultSink sink(dir.path() / "results");
    std::string id = sink.persist(sm_plus_singlet(1), "single_11_0_1");
    sink.persist(sm_plus_singlet(1), "single_11_0_1");

    fs::path file = dir.path() / "results" / id;
    ASSERT_TRUE(fs::exists(file));
    nlohmann::json j = read_json(file);
    EXPECT_EQ(j.at("tag"), "single_11_0_1");
    EXPECT_EQ(j.at("fermions").size(), 6u);
    EXPECT_EQ(sink.written(), 2);
    EXPECT_EQ(sink.failed(), 0);
}

TEST(DirectoryResultSinkTest, ReportsFailureAndContinues) {
    test_helpers::TempDir dir;
    fs::path blocker = dir.write("blocker", "not a directory");
    DirectoryResultSink sink(blocker / "results");
    std::string id = sink.persist(sm_plus_singlet(1), "x");
    EXPECT_EQ(id, dump_result(sm_plus_singlet(1), "x").filename);
    EXPECT_EQ(sink.written(), 0);
    EXPECT_EQ(sink.failed(), 1);
}

TEST(DirectoryResultSinkTest, CountsShortWriteAsFailure) {
    if (!fs::exists("/dev/full")) GTEST_SKIP() << "/dev/full not available";
    test_helpers::TempDir dir;
    std::string name = dump_result(sm_plus_singlet(1), "full").filename;
    fs::create_symlink("/dev/full", dir.path() / name);

    DirectoryResultSink sink(dir.path());
    EXPECT_EQ(sink.persist(sm_plus_singlet(1), "full"), name);
    EXPECT_EQ(sink.written(), 0);
    EXPECT_EQ(sink.failed(), 1);
}

// ============================================================================
// Export
// ============================================================================

TEST(ExportTest, NewFermionsExcludeBaseNames) {
    Spectrum added = new_fermions(sm_plus_singlet(1), standard_model_spectrum());
    ASSERT_EQ(added.size(), 1u);
    EXPECT_EQ(added[0].name(), "X_11_0_L");
}

TEST(ExportTest, DocumentLayout) {
    ScanResult r;
    r.spectrum = sm_plus_singlet(-1);
    r.anomalies = compute_anomalies(r.spectrum);
    r.description = "Single fermion: (1, 1)_0 × -1";
    r.block = ScanBlock::SingleAddition;
    r.result_id = dump_result(r.spectrum, "single_11_0_-1").filename;

    ScanConfig cfg;
    nlohmann::json doc = export_results(standard_model_spectrum(), cfg, {r});
    EXPECT_EQ(doc.at("base_spectrum").size(), 5u);
    EXPECT_EQ(doc.at("scan_config").at("enabled_blocks").size(), 3u);

    const auto& m = doc.at("anomaly_free_models").at(0);
    EXPECT_EQ(m.at("stage"), "single_fermion");
    EXPECT_EQ(m.at("result_id"), r.result_id);
    EXPECT_EQ(m.at("signature"), nlohmann::json::array({"(1,1,0,-1)"}));
    EXPECT_EQ(m.at("fermions").size(), 6u);
    EXPECT_EQ(m.at("is_anomaly_free"), true);
}

TEST(ExportTest, WriteJsonFileFailsOnBadPath) {
    test_helpers::TempDir dir;
    fs::path blocker = dir.write("blocker", "");
    EXPECT_THROW(write_json_file(blocker / "out.json", nlohmann::json::object()), ConfigError);

    write_json_file(dir.path() / "out.json", {{"k", 1}});
    EXPECT_EQ(read_json(dir.path() / "out.json").at("k"), 1);
}

}  // namespace
