// EN: Unit tests for the dry run report - text summary, JSON export and pluggable generators
// FR: Tests unitaires pour le rapport de simulation - résumé texte, export JSON et générateurs enfichables

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "orchestrator/dry_run_system.hpp"
#include "csv/combine_errors.hpp"
#include "infrastructure/logging/logger.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace ConCat;
using namespace testing;

namespace {

// EN: Mock classes for testing
// FR: Classes mock pour les tests
class MockReportGenerator : public detail::IReportGenerator {
public:
    MOCK_METHOD(std::string, generateReport, (const DryRunSummary& summary), (override));
    MOCK_METHOD(bool, exportToFile, (const std::string& report, const std::string& file_path), (override));
};

} // namespace

class DryRunSystemTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
        test_dir_ = std::filesystem::temp_directory_path() / "concat_dry_run_test";
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);

        summary_.files = {"/data/a.csv", "/data/b.csv"};
        summary_.extension = "csv";
        summary_.delimiters = {','};
        summary_.columns = {"id", "name"};
        summary_.output_path = "merged.csv";
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    std::filesystem::path test_dir_;
    DryRunSummary summary_;
};

TEST_F(DryRunSystemTest, TextSummaryForReconciledSchema) {
    DryRunSystem system;
    std::string text = system.generateReport(summary_);

    EXPECT_EQ(text,
              "[DRY-RUN] Summary:\n"
              "  Files: 2\n"
              "  Extension: .csv\n"
              "  Unified delimiter: ','\n"
              "  Schema policy: strict\n"
              "  Columns: ['id', 'name']\n"
              "  Source column: ON | name='source_file' | mode=name\n"
              "  Output: merged.csv (delim=comma, header=True)\n");
}

TEST_F(DryRunSystemTest, TextSummaryForRequestedColumnsWithSkips) {
    summary_.mode = CSV::SchemaMode::REQUESTED;
    summary_.missing_policy = CSV::MissingPolicy::SKIP;
    summary_.case_insensitive = true;
    summary_.columns = {"id", "score"};
    summary_.skipped = {{"b.csv", {"score"}}};
    summary_.delimiters = {',', '\t'};
    summary_.source_column.enabled = false;

    std::string text = DryRunSystem().generateReport(summary_);
    EXPECT_THAT(text, HasSubstr("  Delimiters: [',', '\\t']\n"));
    EXPECT_THAT(text, HasSubstr("  Columns mode: ['id', 'score']\n"));
    EXPECT_THAT(text, HasSubstr("  Missing-policy: skip\n"));
    EXPECT_THAT(text, HasSubstr("  Case-insensitive: True\n"));
    EXPECT_THAT(text, HasSubstr("    - b.csv: missing ['score']\n"));
    EXPECT_THAT(text, HasSubstr("Source column: OFF"));
    EXPECT_THAT(text, Not(HasSubstr("Schema policy")));
}

TEST_F(DryRunSystemTest, NormalizationIsReported) {
    summary_.normalized_to = '\t';
    summary_.delimiters = {'\t'};
    std::string text = DryRunSystem().generateReport(summary_);
    EXPECT_THAT(text, HasSubstr("Unified delimiter: '\\t' (normalized to tab)"));
}

TEST_F(DryRunSystemTest, JsonReportCarriesTheWholeSummary) {
    summary_.mode = CSV::SchemaMode::REQUESTED;
    summary_.missing_policy = CSV::MissingPolicy::FILLNA;
    summary_.rows_written = 12;
    summary_.dry_run = false;

    detail::JsonReportGenerator generator;
    auto json = generator.convertSummaryToJson(summary_);

    EXPECT_FALSE(json["dry_run"].get<bool>());
    EXPECT_EQ(json["file_count"].get<size_t>(), 2u);
    EXPECT_EQ(json["delimiters"][0].get<std::string>(), "comma");
    EXPECT_TRUE(json["normalized_to"].is_null());
    EXPECT_EQ(json["schema"]["mode"].get<std::string>(), "requested");
    EXPECT_EQ(json["schema"]["missing_policy"].get<std::string>(), "fillna");
    EXPECT_FALSE(json["schema"].contains("policy"));
    EXPECT_EQ(json["output"]["path"].get<std::string>(), "merged.csv");
    EXPECT_EQ(json["rows_written"].get<size_t>(), 12u);

    auto parsed = nlohmann::json::parse(generator.generateReport(summary_));
    EXPECT_EQ(parsed["schema"]["columns"], json["schema"]["columns"]);
}

TEST_F(DryRunSystemTest, PresentPrintsAndExportsJson) {
    auto report_path = test_dir_ / "reports" / "plan.json";
    DryRunConfig config;
    config.report_json_path = report_path.string();
    DryRunSystem system(config);

    std::ostringstream out;
    system.present(summary_, out);

    EXPECT_THAT(out.str(), StartsWith("[DRY-RUN] Summary:\n"));
    ASSERT_TRUE(std::filesystem::exists(report_path));

    std::ifstream in(report_path);
    auto json = nlohmann::json::parse(in);
    EXPECT_TRUE(json["dry_run"].get<bool>());
    EXPECT_EQ(json["files"].size(), 2u);
    EXPECT_FALSE(json.contains("rows_written"));
}

TEST_F(DryRunSystemTest, PresentFailsWhenReportCannotBeWritten) {
    std::ofstream(test_dir_ / "blocker") << "x";
    DryRunConfig config;
    config.report_json_path = (test_dir_ / "blocker" / "plan.json").string();
    DryRunSystem system(config);

    std::ostringstream out;
    EXPECT_THROW(system.present(summary_, out), CSV::IoError);
}

TEST_F(DryRunSystemTest, CustomGeneratorsCanBeRegistered) {
    auto mock = std::make_unique<StrictMock<MockReportGenerator>>();
    EXPECT_CALL(*mock, generateReport(_)).WillOnce(Return("custom"));
    EXPECT_CALL(*mock, exportToFile("custom", "/dev/null")).WillOnce(Return(true));

    DryRunSystem system;
    system.registerReportGenerator("custom", std::move(mock));
    EXPECT_TRUE(system.exportReport(summary_, "/dev/null", "custom"));

    EXPECT_THROW(system.generateReport(summary_, "xml"), std::invalid_argument);
    EXPECT_THROW(system.registerReportGenerator("null", nullptr), std::invalid_argument);
}

TEST_F(DryRunSystemTest, Utilities) {
    EXPECT_EQ(CSV::formatNameList({}), "[]");
    EXPECT_EQ(CSV::formatNameList({"a", "b"}), "['a', 'b']");
    EXPECT_EQ(DryRunUtils::boolToString(false), "False");
}
