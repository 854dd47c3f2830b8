// EN: Unit tests for Normalizer - concurrent delimiter rewrite into a scoped workspace
// FR: Tests unitaires pour Normalizer - réécriture concurrente des délimiteurs dans un espace scopé

#include <gtest/gtest.h>
#include "csv/normalizer.hpp"
#include "csv/combine_errors.hpp"
#include "infrastructure/logging/logger.hpp"
#include "infrastructure/system/signal_handler.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace ConCat;
using namespace ConCat::CSV;
namespace fs = std::filesystem;

using Header = std::vector<std::string>;

class NormalizerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
        SignalHandler::getInstance().reset();
        test_dir_ = fs::temp_directory_path() / "concat_normalizer_test";
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);
    }

    void TearDown() override {
        SignalHandler::getInstance().reset();
        fs::remove_all(test_dir_);
    }

    SourceFile source(const std::string& name, const std::string& content, char delimiter, Header header) {
        auto path = test_dir_ / name;
        fs::create_directories(path.parent_path());
        std::ofstream(path, std::ios::binary) << content;
        return SourceFile(path, path, delimiter, std::move(header));
    }

    static std::string readText(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    fs::path test_dir_;
};

TEST_F(NormalizerTest, RewritesMixedDelimitersToTarget) {
    std::vector<SourceFile> files = {
        source("a.csv", "id,name\n1,Ann\n", ',', {"id", "name"}),
        source("b.csv", "id\tname\n2\tBo\n3\t\"x\ty\"\n", '\t', {"id", "name"}),
        source("c.csv", "id;name\n4;\"Smith, J\"\n", ';', {"id", "name"})
    };

    NormalizerConfig config;
    config.target_delimiter = ',';
    config.chunk_size = 1;
    config.thread_count = 2;

    ScopedWorkspace workspace("concat_norm_", test_dir_);
    auto normalized = Normalizer(config).normalize(files, workspace);

    ASSERT_EQ(normalized.size(), 3u);
    for (size_t i = 0; i < normalized.size(); ++i) {
        EXPECT_EQ(normalized[i].origin(), files[i].origin());
        EXPECT_EQ(normalized[i].delimiter(), ',');
        EXPECT_EQ(normalized[i].header(), (Header{"id", "name"}));
        EXPECT_EQ(normalized[i].path().parent_path(), workspace.path());
    }
    EXPECT_EQ(normalized[0].path().filename(), "0_a.csv");
    EXPECT_EQ(readText(normalized[1].path()), "id,name\n2,Bo\n3,x\ty\n");
    EXPECT_EQ(readText(normalized[2].path()), "id,name\n4,\"Smith, J\"\n");
}

TEST_F(NormalizerTest, SameBasenamesDoNotCollide) {
    std::vector<SourceFile> files = {
        source("2024/data.csv", "id;v\n1;a\n", ';', {"id", "v"}),
        source("2025/data.csv", "id,v\n2,b\n", ',', {"id", "v"})
    };
    NormalizerConfig config;
    config.target_delimiter = '|';

    ScopedWorkspace workspace("concat_norm_", test_dir_);
    auto normalized = Normalizer(config).normalize(files, workspace);

    ASSERT_EQ(normalized.size(), 2u);
    EXPECT_NE(normalized[0].path(), normalized[1].path());
    EXPECT_EQ(readText(normalized[0].path()), "id|v\n1|a\n");
    EXPECT_EQ(readText(normalized[1].path()), "id|v\n2|b\n");
}

TEST_F(NormalizerTest, RowsFitHeaderWidth) {
    auto file = source("ragged.csv", "a,b,c\n1,2\n1,2,3,4\n", ',', {"a", "b", "c"});
    auto destination = test_dir_ / "out.tsv";

    auto result = Normalizer::rewriteFile(file, destination, '\t', 10);
    EXPECT_EQ(result.rows_written, 2u);
    EXPECT_EQ(result.malformed_rows, 1u);
    EXPECT_EQ(readText(destination), "a\tb\tc\n1\t2\t\n1\t2\t3\n");
}

TEST_F(NormalizerTest, FailureSurfacesAfterAllTasksFinish) {
    std::vector<SourceFile> files = {
        source("ok.csv", "id\n1\n", ',', {"id"}),
        SourceFile(test_dir_ / "gone.csv", test_dir_ / "gone.csv", ';', {"id"})
    };
    NormalizerConfig config;
    ScopedWorkspace workspace("concat_norm_", test_dir_);

    EXPECT_THROW(Normalizer(config).normalize(files, workspace), IoError);
    EXPECT_TRUE(fs::exists(workspace.path() / "0_ok.csv"));
}

TEST_F(NormalizerTest, InterruptStopsRewrite) {
    auto file = source("a.csv", "id\n1\n2\n", ',', {"id"});
    SignalHandler::getInstance().triggerShutdown();

    EXPECT_THROW(Normalizer::rewriteFile(file, test_dir_ / "x.csv", ';', 1), InterruptedError);
}

TEST_F(NormalizerTest, InvalidConfigurationRejected) {
    NormalizerConfig zero_chunk;
    zero_chunk.chunk_size = 0;
    EXPECT_THROW(Normalizer{zero_chunk}, ConfigurationError);

    NormalizerConfig zero_threads;
    zero_threads.thread_count = 0;
    EXPECT_THROW(Normalizer{zero_threads}, ConfigurationError);
}

TEST_F(NormalizerTest, Helpers) {
    EXPECT_EQ(Normalizer::scratchName(3, "/in/x/report.csv"), "3_report.csv");

    std::vector<SourceFile> files = {
        SourceFile("a", "a", ';', {}),
        SourceFile("b", "b", ',', {}),
        SourceFile("c", "c", ';', {})
    };
    EXPECT_EQ(Normalizer::distinctDelimiters(files), (std::vector<char>{';', ','}));
}
