// Tests for rule-driven scans against the bundled templates and rule files.

#include "rule_scanner.h"

#include <gtest/gtest.h>

#include <fstream>
#include <sstream>
#include <string>

#include "test_helpers.h"

namespace {

// ============================================================================
// Helpers
// ============================================================================

fs::path sm_template() {
    return test_helpers::source_path("templates/sm_template.json");
}

RuleBook all_rules() {
    RuleBook book = RuleBook::load(test_helpers::source_path("rules/scanner_rules.yaml").string());
    return book;
}

RuleBook dark_rules() {
    return RuleBook::load(test_helpers::source_path("rules/dark_sector_rules.yaml").string());
}

nlohmann::json read_json(const fs::path& p) {
    std::ifstream in(p);
    return nlohmann::json::parse(in);
}

// ============================================================================
// Base spectrum selection
// ============================================================================

TEST(RuleBasedScannerTest, ResolvesBaseSpectra) {
    RuleBook book = all_rules();
    RuleBasedScanner scanner(book, sm_template());
    EXPECT_EQ(scanner.template_base(), standard_model_spectrum());
    EXPECT_EQ(scanner.base_spectrum_for("standard_model").size(), 5u);

    Spectrum lr = scanner.base_spectrum_for("left_right_template");
    ASSERT_EQ(lr.size(), 6u);
    EXPECT_EQ(lr.back().name(), "nu_R");

    EXPECT_EQ(scanner.base_spectrum_for("no_such_template"), scanner.template_base());
}

TEST(RuleBasedScannerTest, MissingTemplate) {
    RuleBook book = all_rules();
    EXPECT_THROW(RuleBasedScanner(book, "/nonexistent/template.json"), ConfigError);
}

// ============================================================================
// Single rule
// ============================================================================

TEST(RuleBasedScannerTest, VectorLikeSearchOnWideGrid) {
    RuleBook book = all_rules();
    RuleBasedScanner scanner(book, sm_template());
    MemoryResultSink sink;
    std::ostringstream log;

    RuleScanSummary s = scanner.scan_with_rule("vector_like_search", sink, {}, log);
    EXPECT_EQ(s.anomaly_free_models_found, 300);
    EXPECT_EQ(s.total_configurations_tested, 300);
    EXPECT_EQ(s.blocks_used, (std::vector<std::string>{"B"}));
    EXPECT_EQ(s.models_by_type.at("vector_like"), 300);
    EXPECT_EQ(s.models_by_type.at("single_fermion"), 0);
}

TEST(RuleBasedScannerTest, HyperMaxOverridesGrid) {
    RuleBook book = all_rules();
    RuleBasedScanner scanner(book, sm_template());
    MemoryResultSink sink;
    std::ostringstream log;
    RuleScanOptions opts;
    opts.hyper_max = 6;

    RuleScanSummary s = scanner.scan_with_rule("vector_like_search", sink, opts, log);
    EXPECT_EQ(s.anomaly_free_models_found, 156);
    EXPECT_NE(log.str().find("SCAN COMPLETE"), std::string::npos);
    EXPECT_NE(log.str().find("Anomaly-free models found: 156"), std::string::npos);
}

TEST(RuleBasedScannerTest, DarkSectorWithPhysicsSet) {
    RuleBook book = dark_rules();
    RuleBasedScanner scanner(book, sm_template());
    MemoryResultSink sink;
    std::ostringstream log;

    RuleScanSummary s = scanner.scan_with_rule("minimal_dark_sector", sink, {}, log);
    // A: 6, B: 5 Y x su3 {1, 8}, B': 6, physics set: 1
    EXPECT_EQ(s.anomaly_free_models_found, 23);
    EXPECT_EQ(s.total_configurations_tested, 199);
    EXPECT_EQ(s.models_by_type.at("single_fermion"), 6);
    EXPECT_EQ(s.models_by_type.at("vector_like"), 16);
    EXPECT_EQ(s.models_by_type.at("physics_motivated"), 1);
    EXPECT_EQ(s.base_spectrum, "standard_model");
    EXPECT_EQ(s.rule_description, "Minimal dark sector with integer electric charges");
}

TEST(RuleBasedScannerTest, LimitStillTestsPhysicsSets) {
    RuleBook book = dark_rules();
    RuleBasedScanner scanner(book, sm_template());
    MemoryResultSink sink;
    std::ostringstream log;
    RuleScanOptions opts;
    opts.limit = 3;

    RuleScanSummary s = scanner.scan_with_rule("minimal_dark_sector", sink, opts, log);
    EXPECT_EQ(s.anomaly_free_models_found, 7);
    EXPECT_EQ(s.total_configurations_tested, 183);
}

TEST(RuleBasedScannerTest, WritesSummaryAndModels) {
    test_helpers::TempDir dir;
    RuleBook book = dark_rules();
    RuleBasedScanner scanner(book, sm_template());
    MemoryResultSink sink;
    std::ostringstream log;
    RuleScanOptions opts;
    opts.output_dir = dir.path() / "out";

    scanner.scan_with_rule("minimal_dark_sector", sink, opts, log);

    nlohmann::json summary = read_json(dir.path() / "out" / "scan_summary_minimal_dark_sector.json");
    EXPECT_EQ(summary.at("rule_name"), "minimal_dark_sector");
    EXPECT_EQ(summary.at("anomaly_free_models_found"), 23);
    EXPECT_EQ(summary.at("blocks_used"), nlohmann::json::array({"A", "B"}));

    nlohmann::json models = read_json(dir.path() / "out" / "models_minimal_dark_sector.json");
    EXPECT_EQ(models.at("anomaly_free_models").size(), 23u);
    EXPECT_EQ(models.at("anomaly_free_models").back().at("stage"), "physics_motivated");
    EXPECT_EQ(models.at("anomaly_free_models").back().at("signature"), nlohmann::json::array({"(1,1,0,1)"}));
}

TEST(RuleBasedScannerTest, UnknownRuleThrows) {
    RuleBook book = dark_rules();
    RuleBasedScanner scanner(book, sm_template());
    MemoryResultSink sink;
    std::ostringstream log;
    EXPECT_THROW(scanner.scan_with_rule("nope", sink, {}, log), ConfigError);
}

// ============================================================================
// Batch
// ============================================================================

TEST(RuleBasedScannerTest, BatchSkipsUnknownRules) {
    test_helpers::TempDir dir;
    RuleBook book = dark_rules();
    RuleBasedScanner scanner(book, sm_template());
    MemoryResultSink sink;
    std::ostringstream log;
    RuleScanOptions opts;
    opts.output_dir = dir.path();

    std::vector<RuleScanSummary> all =
        scanner.batch_scan({"minimal_dark_sector", "nope", "extended_dark_sector"}, sink, opts, log);
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].rule_name, "minimal_dark_sector");
    EXPECT_EQ(all[1].rule_name, "extended_dark_sector");

    nlohmann::json batch = read_json(dir.path() / "batch_scan_summary.json");
    EXPECT_EQ(batch.at("batch_scan_results").size(), 2u);
    EXPECT_EQ(batch.at("total_models"), all[0].anomaly_free_models_found + all[1].anomaly_free_models_found);
    EXPECT_TRUE(fs::exists(dir.path() / "scan_summary_extended_dark_sector.json"));
}

TEST(RuleBasedScannerTest, SummaryJsonLayout) {
    RuleScanSummary s;
    s.rule_name = "r";
    s.total_configurations_tested = 10;
    s.models_by_type = {{"vector_like", 2}};
    nlohmann::json j = summary_to_json(s);
    EXPECT_EQ(j.at("rule_name"), "r");
    EXPECT_EQ(j.at("total_configurations_tested"), 10);
    EXPECT_EQ(j.at("models_by_type").at("vector_like"), 2);

    std::ostringstream out;
    out.precision(3);
    print_summary(out, s);
    EXPECT_NE(out.str().find("  vector_like: 2"), std::string::npos);
    EXPECT_EQ(out.precision(), 3);
}

}  // namespace
