// EN: Unit tests for PathResolver - directory, glob and file-list discovery with extension filtering
// FR: Tests unitaires pour PathResolver - découverte par répertoire, glob et liste avec filtrage d'extension

#include <gtest/gtest.h>
#include "csv/path_resolver.hpp"
#include "csv/combine_errors.hpp"
#include "infrastructure/logging/logger.hpp"

#include <filesystem>
#include <fstream>

using namespace ConCat::CSV;
namespace fs = std::filesystem;

class PathResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        ConCat::Logger::getInstance().setLogLevel(ConCat::LogLevel::ERROR);
        test_dir_ = fs::weakly_canonical(fs::temp_directory_path() / "concat_discovery_test");
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);
    }

    void TearDown() override {
        fs::remove_all(test_dir_);
    }

    fs::path touch(const std::string& name) {
        auto path = test_dir_ / name;
        fs::create_directories(path.parent_path());
        std::ofstream(path) << "id\n1\n";
        return path;
    }

    static DiscoveryRequest inDirectory(const fs::path& dir) {
        DiscoveryRequest request;
        request.mode = InputMode::DIRECTORY;
        request.directory = dir;
        return request;
    }

    fs::path test_dir_;
};

TEST_F(PathResolverTest, DirectoryModeListsRegularFilesSorted) {
    touch("b.csv");
    touch("a.csv");
    touch("nested/c.csv");

    PathResolver resolver;
    auto result = resolver.resolve(inDirectory(test_dir_));

    ASSERT_EQ(result.files.size(), 2u);
    EXPECT_EQ(result.files[0], test_dir_ / "a.csv");
    EXPECT_EQ(result.files[1], test_dir_ / "b.csv");
    EXPECT_EQ(result.extension, "csv");
}

TEST_F(PathResolverTest, RequiredExtensionFiltersCaseInsensitively) {
    touch("a.csv");
    touch("b.tsv");
    touch("c.CSV");

    auto request = inDirectory(test_dir_);
    request.extension = ".Csv";
    auto result = PathResolver().resolve(request);

    ASSERT_EQ(result.files.size(), 2u);
    EXPECT_EQ(result.files[0].filename(), "a.csv");
    EXPECT_EQ(result.files[1].filename(), "c.CSV");
    EXPECT_EQ(result.extension, "csv");
}

TEST_F(PathResolverTest, MixedExtensionsWithoutRequirementConflict) {
    touch("a.csv");
    touch("b.tsv");

    try {
        PathResolver().resolve(inDirectory(test_dir_));
        FAIL() << "expected ExtensionConflictError";
    } catch (const ExtensionConflictError& e) {
        EXPECT_NE(std::string(e.what()).find("['csv', 'tsv']"), std::string::npos);
        EXPECT_EQ(e.code(), CombineErrorCode::EXTENSION_CONFLICT);
    }
}

TEST_F(PathResolverTest, EmptyInputsRaiseNoInput) {
    EXPECT_THROW(PathResolver().resolve(inDirectory(test_dir_)), NoInputError);

    touch("a.txt");
    auto request = inDirectory(test_dir_);
    request.extension = "csv";
    try {
        PathResolver().resolve(request);
        FAIL() << "expected NoInputError";
    } catch (const NoInputError& e) {
        EXPECT_EQ(std::string(e.what()), "No *.csv files after filtering. Check inputs/--extension.");
    }
}

TEST_F(PathResolverTest, MissingDirectoryIsDiscoveryError) {
    EXPECT_THROW(PathResolver().resolve(inDirectory(test_dir_ / "absent")), DiscoveryError);
}

TEST_F(PathResolverTest, FileListReportsEveryMissingFile) {
    auto present = touch("a.csv");

    DiscoveryRequest request;
    request.mode = InputMode::FILES;
    request.files = {present, test_dir_ / "x.csv", test_dir_ / "y.csv"};

    try {
        PathResolver().resolve(request);
        FAIL() << "expected DiscoveryError";
    } catch (const DiscoveryError& e) {
        std::string message = e.what();
        EXPECT_NE(message.find("x.csv"), std::string::npos);
        EXPECT_NE(message.find("y.csv"), std::string::npos);
    }
}

TEST_F(PathResolverTest, FileListDeduplicatesEquivalentPaths) {
    auto a = touch("a.csv");
    touch("sub/keep");

    DiscoveryRequest request;
    request.mode = InputMode::FILES;
    request.files = {a, test_dir_ / "sub" / ".." / "a.csv"};

    auto result = PathResolver().resolve(request);
    ASSERT_EQ(result.files.size(), 1u);
    EXPECT_EQ(result.files.front(), a);
}

TEST_F(PathResolverTest, DirectoryInFileListIsRejected) {
    fs::create_directories(test_dir_ / "dir.csv");
    DiscoveryRequest request;
    request.mode = InputMode::FILES;
    request.files = {test_dir_ / "dir.csv"};
    EXPECT_THROW(PathResolver().resolve(request), DiscoveryError);
}

TEST_F(PathResolverTest, GlobPatternsExpandAndMerge) {
    touch("2024/jan.csv");
    touch("2024/feb.csv");
    touch("2025/jan.csv");
    touch("2025/notes.txt");

    DiscoveryRequest request;
    request.mode = InputMode::GLOB;
    request.patterns = {(test_dir_ / "2024" / "*.csv").string(),
                        (test_dir_ / "2025" / "*").string(),
                        (test_dir_ / "none" / "*.csv").string()};
    request.extension = "csv";

    auto result = PathResolver().resolve(request);
    ASSERT_EQ(result.files.size(), 3u);
    EXPECT_EQ(result.files[0], test_dir_ / "2024" / "feb.csv");
    EXPECT_EQ(result.files[1], test_dir_ / "2024" / "jan.csv");
    EXPECT_EQ(result.files[2], test_dir_ / "2025" / "jan.csv");
}

TEST_F(PathResolverTest, GlobAcceptsAlreadyExpandedPaths) {
    auto a = touch("a.csv");
    DiscoveryRequest request;
    request.mode = InputMode::GLOB;
    request.patterns = {a.string()};

    auto result = PathResolver().resolve(request);
    ASSERT_EQ(result.files.size(), 1u);
    EXPECT_EQ(result.files.front(), a);
}

TEST_F(PathResolverTest, ExtensionHelpers) {
    EXPECT_EQ(PathResolver::normalizeExtension(".CSV"), "csv");
    EXPECT_EQ(PathResolver::normalizeExtension("tsv"), "tsv");
    EXPECT_EQ(PathResolver::extensionOf("data/x.Tsv"), "tsv");
    EXPECT_EQ(PathResolver::extensionOf("README"), "");
    EXPECT_EQ(inputModeToString(InputMode::GLOB), "glob");
    EXPECT_TRUE(PathResolver::expandGlob((test_dir_ / "*.nothing").string()).empty());
}
