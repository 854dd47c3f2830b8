// EN: Unit tests for the command line parser and its configuration overrides
// FR: Tests unitaires pour l'analyseur de ligne de commande et ses surcharges de configuration

#include <gtest/gtest.h>
#include "infrastructure/cli/config_override.hpp"
#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"
#include "orchestrator/combine_job.hpp"

using namespace ConCat;
using namespace ConCat::CLI;

class ConfigOverrideTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
        ConfigManager::getInstance().reset();

        parser_ = std::make_unique<ConfigOverrideParser>();
        parser_->setProgramName("concat");
        parser_->setVersionInfo("1.0.0", "test");

        CliOptionDefinition out;
        out.long_name = "out";
        out.short_name = 'o';
        out.config_path = "combine.out";
        out.description = "Output file";
        parser_->addOption(out);

        CliOptionDefinition chunks;
        chunks.long_name = "chunksize";
        chunks.type = CliOptionType::INTEGER;
        chunks.config_path = "combine.chunksize";
        chunks.default_value = "200000";
        chunks.constraint = CliOptionConstraint::POSITIVE;
        parser_->addOption(chunks);

        CliOptionDefinition schema;
        schema.long_name = "schema";
        schema.config_path = "combine.schema";
        schema.default_value = "strict";
        schema.constraint = CliOptionConstraint::ENUM_VALUES;
        schema.enum_values = {"strict", "union", "intersection"};
        parser_->addOption(schema);

        CliOptionDefinition columns;
        columns.long_name = "columns";
        columns.type = CliOptionType::STRING_LIST;
        columns.config_path = "combine.columns";
        parser_->addOption(columns);

        CliOptionDefinition no_header;
        no_header.long_name = "no-header";
        no_header.type = CliOptionType::BOOLEAN;
        no_header.config_path = "combine.no_header";
        parser_->addOption(no_header);

        CliOptionDefinition directory;
        directory.long_name = "directory";
        directory.short_name = 'd';
        directory.config_path = "combine.directory";
        directory.exclusive_group = "input";
        parser_->addOption(directory);

        CliOptionDefinition files;
        files.long_name = "input-files";
        files.short_name = 'i';
        files.type = CliOptionType::STRING_LIST;
        files.config_path = "combine.input_files";
        files.exclusive_group = "input";
        parser_->addOption(files);

        parser_->addExclusiveGroup("input", true);
    }

    void TearDown() override {
        ConfigManager::getInstance().reset();
    }

    std::unique_ptr<ConfigOverrideParser> parser_;
};

TEST_F(ConfigOverrideTest, ParsesTypedValuesIntoOverrides) {
    auto result = parser_->parse({"combine", "-d", "data", "-o", "out.csv", "--chunksize", "500",
                                  "--schema=union", "--no-header"});
    ASSERT_TRUE(result.ok()) << (result.errors.empty() ? "" : result.errors.front());

    EXPECT_EQ(result.positionals, (std::vector<std::string>{"combine"}));
    EXPECT_EQ(result.overrides.at("combine.directory").as<std::string>(), "data");
    EXPECT_EQ(result.overrides.at("combine.out").as<std::string>(), "out.csv");
    EXPECT_EQ(result.overrides.at("combine.chunksize").as<int>(), 500);
    EXPECT_EQ(result.overrides.at("combine.schema").as<std::string>(), "union");
    EXPECT_TRUE(result.overrides.at("combine.no_header").as<bool>());
}

TEST_F(ConfigOverrideTest, ListOptionsTakeSpaceAndCommaSeparatedValues) {
    auto result = parser_->parse({"-i", "a.csv", "b.csv", "--columns", "id,name", "score", "-o", "x.csv"});
    ASSERT_TRUE(result.ok());

    EXPECT_EQ(result.overrides.at("combine.input_files").as<std::vector<std::string>>(),
              (std::vector<std::string>{"a.csv", "b.csv"}));
    EXPECT_EQ(result.overrides.at("combine.columns").as<std::vector<std::string>>(),
              (std::vector<std::string>{"id", "name", "score"}));
}

TEST_F(ConfigOverrideTest, RejectsUnknownOptionsAndBadValues) {
    auto unknown = parser_->parse({"-d", "x", "--shuffle"});
    EXPECT_EQ(unknown.status, CliParseStatus::INVALID_OPTION);

    auto not_a_number = parser_->parse({"-d", "x", "--chunksize", "lots"});
    EXPECT_EQ(not_a_number.status, CliParseStatus::INVALID_VALUE);

    auto zero = parser_->parse({"-d", "x", "--chunksize", "0"});
    EXPECT_EQ(zero.status, CliParseStatus::CONSTRAINT_VIOLATION);

    auto negative = parser_->parse({"-d", "x", "--chunksize", "-5"});
    EXPECT_EQ(negative.status, CliParseStatus::CONSTRAINT_VIOLATION);

    auto choice = parser_->parse({"-d", "x", "--schema", "outer"});
    EXPECT_EQ(choice.status, CliParseStatus::CONSTRAINT_VIOLATION);
    ASSERT_FALSE(choice.errors.empty());
    EXPECT_NE(choice.errors.front().find("invalid choice 'outer'"), std::string::npos);

    auto missing = parser_->parse({"-d", "x", "--out"});
    EXPECT_EQ(missing.status, CliParseStatus::MISSING_VALUE);

    auto duplicate = parser_->parse({"-d", "x", "-o", "a", "--out", "b"});
    EXPECT_EQ(duplicate.status, CliParseStatus::DUPLICATE_OPTION);

    auto flag_value = parser_->parse({"-d", "x", "--no-header=yes"});
    EXPECT_EQ(flag_value.status, CliParseStatus::INVALID_VALUE);
}

TEST_F(ConfigOverrideTest, EnforcesExclusiveGroups) {
    auto both = parser_->parse({"-d", "data", "-i", "a.csv"});
    EXPECT_EQ(both.status, CliParseStatus::CONSTRAINT_VIOLATION);
    ASSERT_FALSE(both.errors.empty());
    EXPECT_NE(both.errors.front().find("mutually exclusive"), std::string::npos);

    auto none = parser_->parse({"-o", "out.csv"});
    EXPECT_EQ(none.status, CliParseStatus::MISSING_VALUE);
    ASSERT_FALSE(none.errors.empty());
    EXPECT_NE(none.errors.front().find("One of --directory, --input-files is required"), std::string::npos);
}

TEST_F(ConfigOverrideTest, HelpAndVersionShortCircuit) {
    auto help = parser_->parse({"--bogus", "--help"});
    EXPECT_EQ(help.status, CliParseStatus::HELP_REQUESTED);
    EXPECT_NE(help.help_text.find("--chunksize"), std::string::npos);
    EXPECT_NE(help.help_text.find("(default: 200000)"), std::string::npos);

    auto version = parser_->parse({"-v"});
    EXPECT_EQ(version.status, CliParseStatus::VERSION_REQUESTED);
    EXPECT_EQ(version.version_text, "concat 1.0.0 (test)\n");
}

TEST_F(ConfigOverrideTest, RejectsDuplicateAndReservedDefinitions) {
    CliOptionDefinition again;
    again.long_name = "out";
    EXPECT_THROW(parser_->addOption(again), std::invalid_argument);

    CliOptionDefinition short_clash;
    short_clash.long_name = "output";
    short_clash.short_name = 'o';
    EXPECT_THROW(parser_->addOption(short_clash), std::invalid_argument);

    CliOptionDefinition reserved;
    reserved.long_name = "help";
    EXPECT_THROW(parser_->addOption(reserved), std::invalid_argument);
}

TEST_F(ConfigOverrideTest, DefaultsThenOverridesLayerIntoConfig) {
    auto& config = ConfigManager::getInstance();
    parser_->applyDefaults(config);

    EXPECT_EQ(config.get("combine", "chunksize").as<int>(), 200000);
    EXPECT_EQ(config.get("combine", "schema").as<std::string>(), "strict");
    EXPECT_FALSE(config.get("combine", "no_header").as<bool>());
    EXPECT_TRUE(config.get("combine", "columns").as<std::vector<std::string>>().empty());
    EXPECT_EQ(config.get("combine", "out").as<std::string>(), "");

    config.loadFromString("combine:\n  schema: intersection\n  chunksize: 10\n");
    auto result = parser_->parse({"-d", "data", "--chunksize", "20"});
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(ConfigOverrideParser::applyOverrides(result, config), 2u);

    EXPECT_EQ(config.get("combine", "chunksize").as<int>(), 20);
    EXPECT_EQ(config.get("combine", "schema").as<std::string>(), "intersection");
    EXPECT_EQ(config.get("combine", "directory").as<std::string>(), "data");
}

TEST_F(ConfigOverrideTest, UtilityHelpers) {
    EXPECT_EQ(ConfigOverrideUtils::splitCommaList(" a, b ,,c "), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_TRUE(ConfigOverrideUtils::isShortOption("-o"));
    EXPECT_FALSE(ConfigOverrideUtils::isShortOption("-5"));
    EXPECT_TRUE(ConfigOverrideUtils::isLongOption("--out"));
    EXPECT_FALSE(ConfigOverrideUtils::isLongOption("--"));
    EXPECT_EQ(ConfigOverrideUtils::extractOptionName("--out=x.csv"), "out");
    EXPECT_EQ(ConfigOverrideUtils::cliParseStatusToString(CliParseStatus::DUPLICATE_OPTION), "DUPLICATE_OPTION");
}

TEST_F(ConfigOverrideTest, CombineOptionTableParsesFullCommandLine) {
    ConfigOverrideParser parser;
    parser.addOptions(CombineOptions::optionDefinitions());
    parser.addExclusiveGroup("input", false);

    auto result = parser.parse({"combine", "--glob", "data/*.csv", "logs/*.csv", "-o", "merged.csv.gz",
                                "--normalize", "tab", "--columns", "id,score", "--missing-policy", "fillna",
                                "--case-insensitive", "--source-col-mode", "stem", "-T", "2",
                                "--out-delim", "pipe", "--dry-run", "--config", "concat.yaml", "-V"});
    ASSERT_TRUE(result.ok()) << (result.errors.empty() ? "" : result.errors.front());

    EXPECT_EQ(result.overrides.at("combine.glob").as<std::vector<std::string>>(),
              (std::vector<std::string>{"data/*.csv", "logs/*.csv"}));
    EXPECT_EQ(result.overrides.at("combine.normalize").as<std::string>(), "tab");
    EXPECT_EQ(result.overrides.at("combine.threads").as<int>(), 2);
    EXPECT_TRUE(result.overrides.at("logging.verbose").as<bool>());

    auto bad_delim = parser.parse({"-d", "x", "--out-delim", "colon"});
    EXPECT_EQ(bad_delim.status, CliParseStatus::CONSTRAINT_VIOLATION);

    auto two_inputs = parser.parse({"-d", "x", "--glob", "*.csv"});
    EXPECT_EQ(two_inputs.status, CliParseStatus::CONSTRAINT_VIOLATION);
}
