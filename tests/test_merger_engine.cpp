// EN: Unit tests for MergerEngine - projection, source column, chunking and failure cleanup
// FR: Tests unitaires pour MergerEngine - projection, colonne source, découpage et nettoyage sur échec

#include <gtest/gtest.h>
#include "csv/merger_engine.hpp"
#include "csv/combine_errors.hpp"
#include "infrastructure/logging/logger.hpp"
#include "infrastructure/system/signal_handler.hpp"

#include <csignal>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <zlib.h>

using namespace ConCat;
using namespace ConCat::CSV;
namespace fs = std::filesystem;

using Header = std::vector<std::string>;

// EN: Test fixture for MergerEngine tests
// FR: Fixture de test pour les tests MergerEngine
class MergerEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
        SignalHandler::getInstance().reset();
        test_dir_ = fs::temp_directory_path() / "concat_merger_test";
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);
    }

    void TearDown() override {
        SignalHandler::getInstance().reset();
        fs::remove_all(test_dir_);
    }

    SourceFile source(const std::string& name, const std::string& content, char delimiter, Header header) {
        auto path = test_dir_ / name;
        std::ofstream(path, std::ios::binary) << content;
        return SourceFile(path, path, delimiter, std::move(header));
    }

    MergeConfig configFor(const std::string& output) const {
        MergeConfig config;
        config.output_path = test_dir_ / output;
        return config;
    }

    static std::string readText(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    fs::path test_dir_;
};

TEST_F(MergerEngineTest, MergesFilesWithSourceColumn) {
    auto a = source("a.csv", "id,name\n1,Ann\n2,Bo\n", ',', {"id", "name"});
    auto b = source("b.csv", "name,id\nCy,3\n", ',', {"name", "id"});
    auto plan = SchemaReconciler::planReconciled({a, b}, SchemaPolicy::STRICT);

    MergerEngine engine(configFor("out.csv"));
    EXPECT_EQ(engine.merge(plan), 3u);

    EXPECT_EQ(readText(test_dir_ / "out.csv"),
              "source_file,id,name\n"
              "a.csv,1,Ann\n"
              "a.csv,2,Bo\n"
              "b.csv,3,Cy\n");
    EXPECT_EQ(engine.getStatistics().getFilesProcessed(), 2u);
}

TEST_F(MergerEngineTest, UnionFillsAbsentColumnsWithEmptyValues) {
    auto a = source("a.csv", "id,name\n1,Ann\n", ',', {"id", "name"});
    auto b = source("b.tsv", "id\temail\n2\tb@x.org\n", '\t', {"id", "email"});
    auto plan = SchemaReconciler::planReconciled({a, b}, SchemaPolicy::UNION);

    auto config = configFor("union.tsv");
    config.output_delimiter = '\t';
    config.source_column.enabled = false;
    MergerEngine engine(config);
    engine.merge(plan);

    EXPECT_EQ(readText(test_dir_ / "union.tsv"),
              "id\tname\temail\n"
              "1\tAnn\t\n"
              "2\t\tb@x.org\n");
}

TEST_F(MergerEngineTest, ShortRowsPaddedAndLongRowsTruncated) {
    auto a = source("ragged.csv", "a,b,c\n1,2\n1,2,3,4,5\n\n7,8,9\n", ',', {"a", "b", "c"});
    auto plan = SchemaReconciler::planReconciled({a}, SchemaPolicy::STRICT);

    auto config = configFor("ragged_out.csv");
    config.source_column.enabled = false;
    MergerEngine engine(config);
    EXPECT_EQ(engine.merge(plan), 3u);

    EXPECT_EQ(readText(test_dir_ / "ragged_out.csv"), "a,b,c\n1,2,\n1,2,3\n7,8,9\n");
    EXPECT_EQ(engine.getStatistics().getMalformedRows(), 1u);
    EXPECT_EQ(engine.getStatistics().getPaddedRows(), 1u);
}

TEST_F(MergerEngineTest, RequestedColumnsFollowRequestedOrder) {
    auto a = source("a.csv", "id,name,score\n1,Ann,9\n", ',', {"id", "name", "score"});
    auto b = source("b.csv", "name,id\nBo,2\n", ',', {"name", "id"});
    auto plan = SchemaReconciler::planRequested({a, b}, {"score", "id"}, false, MissingPolicy::FILLNA);

    auto config = configFor("requested.csv");
    config.source_column.mode = SourceColumnMode::STEM;
    config.source_column.name = "origin";
    MergerEngine engine(config);
    engine.merge(plan);

    EXPECT_EQ(readText(test_dir_ / "requested.csv"), "origin,score,id\na,9,1\nb,,2\n");
}

TEST_F(MergerEngineTest, HeaderWrittenEvenWithoutRows) {
    auto a = source("empty_rows.csv", "id,name\n\n", ',', {"id", "name"});
    auto plan = SchemaReconciler::planReconciled({a}, SchemaPolicy::STRICT);

    MergerEngine engine(configFor("header_only.csv"));
    EXPECT_EQ(engine.merge(plan), 0u);
    EXPECT_EQ(readText(test_dir_ / "header_only.csv"), "source_file,id,name\n");
}

TEST_F(MergerEngineTest, HeaderCanBeSuppressed) {
    auto a = source("a.csv", "id\n1\n", ',', {"id"});
    auto plan = SchemaReconciler::planReconciled({a}, SchemaPolicy::STRICT);

    auto config = configFor("noheader.csv");
    config.write_header = false;
    config.source_column.enabled = false;
    MergerEngine(config).merge(plan);
    EXPECT_EQ(readText(test_dir_ / "noheader.csv"), "1\n");
}

TEST_F(MergerEngineTest, SmallChunksGiveSameOutput) {
    std::string content = "id,v\n";
    for (int i = 0; i < 25; ++i) {
        content += std::to_string(i) + ",x" + std::to_string(i) + "\n";
    }
    auto a = source("many.csv", content, ',', {"id", "v"});
    auto plan = SchemaReconciler::planReconciled({a}, SchemaPolicy::STRICT);

    auto small = configFor("small.csv");
    small.chunk_size = 4;
    MergerEngine small_engine(small);
    small_engine.merge(plan);

    auto large = configFor("large.csv");
    MergerEngine(large).merge(plan);

    EXPECT_EQ(readText(test_dir_ / "small.csv"), readText(test_dir_ / "large.csv"));
    EXPECT_EQ(small_engine.getStatistics().getChunksProcessed(), 7u);
    EXPECT_EQ(small_engine.getStatistics().getRowsRead(), 25u);
}

TEST_F(MergerEngineTest, GzipOutputFromExtension) {
    auto a = source("a.csv", "id\n1\n", ',', {"id"});
    auto plan = SchemaReconciler::planReconciled({a}, SchemaPolicy::STRICT);

    MergerEngine(configFor("out.csv.gz")).merge(plan);

    gzFile file = gzopen((test_dir_ / "out.csv.gz").string().c_str(), "rb");
    ASSERT_NE(file, nullptr);
    char buffer[256];
    int read = gzread(file, buffer, sizeof(buffer));
    gzclose(file);
    ASSERT_GT(read, 0);
    EXPECT_EQ(std::string(buffer, static_cast<size_t>(read)), "source_file,id\na.csv,1\n");
}

TEST_F(MergerEngineTest, InterruptRemovesPartialOutput) {
    auto a = source("a.csv", "id\n1\n", ',', {"id"});
    auto plan = SchemaReconciler::planReconciled({a}, SchemaPolicy::STRICT);
    SignalHandler::getInstance().triggerShutdown(SIGINT);

    MergerEngine engine(configFor("interrupted.csv"));
    EXPECT_THROW(engine.merge(plan), InterruptedError);
    EXPECT_FALSE(fs::exists(test_dir_ / "interrupted.csv"));
}

TEST_F(MergerEngineTest, MissingInputRemovesPartialOutput) {
    auto a = source("a.csv", "id\n1\n", ',', {"id"});
    SourceFile gone(test_dir_ / "gone.csv", test_dir_ / "gone.csv", ',', {"id"});
    auto plan = SchemaReconciler::planReconciled({a, gone}, SchemaPolicy::STRICT);

    MergerEngine engine(configFor("partial.csv"));
    EXPECT_THROW(engine.merge(plan), IoError);
    EXPECT_FALSE(fs::exists(test_dir_ / "partial.csv"));
}

TEST_F(MergerEngineTest, SourceColumnCollisionRejected) {
    auto a = source("a.csv", "source_file,id\nx,1\n", ',', {"source_file", "id"});
    auto plan = SchemaReconciler::planReconciled({a}, SchemaPolicy::STRICT);

    MergerEngine engine(configFor("collide.csv"));
    EXPECT_THROW(engine.outputColumns(plan), ConfigurationError);

    auto renamed = configFor("collide.csv");
    renamed.source_column.name = "origin";
    EXPECT_EQ(MergerEngine(renamed).outputColumns(plan), (Header{"origin", "source_file", "id"}));
}

TEST_F(MergerEngineTest, ConfigValidation) {
    MergeConfig no_output;
    EXPECT_THROW(MergerEngine{no_output}, ConfigurationError);

    auto zero_chunk = configFor("x.csv");
    zero_chunk.chunk_size = 0;
    EXPECT_THROW(MergerEngine{zero_chunk}, ConfigurationError);

    auto unnamed = configFor("x.csv");
    unnamed.source_column.name = "";
    EXPECT_THROW(MergerEngine{unnamed}, ConfigurationError);
    unnamed.source_column.enabled = false;
    EXPECT_NO_THROW(MergerEngine{unnamed});
}

TEST_F(MergerEngineTest, ProjectRowUsesMapping) {
    ColumnMapping mapping;
    mapping.source_index = {2, std::nullopt, 0, 9};
    EXPECT_EQ(MergerEngine::projectRow({"a", "b", "c"}, mapping), (Record{"c", "", "a", ""}));
}

TEST_F(MergerEngineTest, StatisticsReport) {
    auto a = source("a.csv", "id\n1\n2\n", ',', {"id"});
    auto plan = SchemaReconciler::planReconciled({a}, SchemaPolicy::STRICT);
    MergerEngine engine(configFor("stats.csv"));
    engine.merge(plan);

    const auto& stats = engine.getStatistics();
    EXPECT_EQ(stats.getRowsWritten(), 2u);
    EXPECT_GT(stats.getBytesRead(), 0u);
    EXPECT_EQ(stats.getPhaseTimings().count("merge"), 1u);
    EXPECT_NE(stats.generateReport().find("=== Merge Statistics ==="), std::string::npos);
}
