// ==============================================================================
// test_cli_gtest.cpp - Тесты CLI модуля (GoogleTest)
// ==============================================================================
//
// Тесты: TST-CLI-001..TST-CLI-016
//
// ==============================================================================

#include "codecollector/cli.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace codecollector::cli::test {

// ==============================================================================
// Вспомогательные функции
// ==============================================================================

// Конвертация вектора строк в argc/argv
struct Args {
    std::vector<std::string> strings;
    std::vector<char*> ptrs;

    explicit Args(std::initializer_list<std::string> args) : strings(args) {
        for (auto& s : strings) {
            ptrs.push_back(s.data());
        }
        ptrs.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(strings.size()); }

    char** argv() { return ptrs.data(); }
};

ParseResult parse_args(Args&& args) {
    return parse(args.argc(), args.argv());
}

// ==============================================================================
// TST-CLI-001: Без аргументов
// ==============================================================================

TEST(CliTest, TST_CLI_001_NoArguments_HelpToStderrExitTwo) {
    ParseResult result = parse_args(Args{"codecollector"});

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_EQ(result.diagnostic.stderr_message, render_help());
}

// ==============================================================================
// TST-CLI-002: help / version
// ==============================================================================

TEST(CliTest, TST_CLI_002_HelpAndVersion) {
    ParseResult help = parse_args(Args{"codecollector", "--help"});
    ParseResult version = parse_args(Args{"codecollector", "-V"});

    ASSERT_TRUE(help.ok);
    EXPECT_TRUE(std::holds_alternative<HelpCommand>(help.command));
    ASSERT_TRUE(version.ok);
    EXPECT_TRUE(std::holds_alternative<VersionCommand>(version.command));
    EXPECT_EQ(render_version(), "codecollector 1.0.0\n");
}

TEST(CliTest, TST_CLI_003_HelpSubcommand) {
    ParseResult collect = parse_args(Args{"codecollector", "help", "collect"});
    ParseResult cache_list = parse_args(Args{"codecollector", "help", "cache", "list"});
    ParseResult inline_help = parse_args(Args{"codecollector", "analyze", "--help"});

    ASSERT_TRUE(collect.ok);
    EXPECT_EQ(std::get<HelpCommand>(collect.command).command, std::string("collect"));
    EXPECT_EQ(std::get<HelpCommand>(cache_list.command).command, std::string("cache list"));
    EXPECT_EQ(std::get<HelpCommand>(inline_help.command).command, std::string("analyze"));
}

TEST(CliTest, TST_CLI_004_RenderHelp_Texts) {
    EXPECT_NE(render_help().find("Usage: codecollector [OPTIONS] <COMMAND>"), std::string::npos);
    EXPECT_NE(render_help(std::string("collect")).find("--no-cache"), std::string::npos);
    EXPECT_NE(render_help(std::string("cache clear")).find("[PROJECT]"), std::string::npos);
    EXPECT_EQ(render_help(std::string("bogus")), "error: unrecognized subcommand 'bogus'\n");
}

// ==============================================================================
// TST-CLI-005: collect
// ==============================================================================

TEST(CliTest, TST_CLI_005_Collect_Defaults) {
    ParseResult result = parse_args(Args{"codecollector", "collect"});

    ASSERT_TRUE(result.ok) << result.diagnostic.stderr_message;
    const auto& cmd = std::get<CollectCommand>(result.command);
    EXPECT_EQ(cmd.path, std::filesystem::path("."));
    EXPECT_TRUE(cmd.include.empty());
    EXPECT_FALSE(cmd.output.has_value());
    EXPECT_FALSE(cmd.no_cache);
    EXPECT_FALSE(cmd.format.has_value());
    EXPECT_FALSE(cmd.no_analysis);
}

TEST(CliTest, TST_CLI_006_Collect_AllOptions) {
    ParseResult result = parse_args(Args{"codecollector", "--no-banner", "collect", "src",
                                         "-i", "*.py", "--include=*.md", "-e", "tests/",
                                         "-t", "py", "--file-type", ".rs", "-o", "out.txt",
                                         "--no-cache", "--cache-dir", "/tmp/cc",
                                         "--format=indexed", "--config", "cc.yml",
                                         "--no-analysis", "-v"});

    ASSERT_TRUE(result.ok) << result.diagnostic.stderr_message;
    EXPECT_TRUE(result.global.no_banner);
    EXPECT_EQ(result.global.verbose, 1);

    const auto& cmd = std::get<CollectCommand>(result.command);
    EXPECT_EQ(cmd.path, std::filesystem::path("src"));
    EXPECT_EQ(cmd.include, (std::vector<std::string>{"*.py", "*.md"}));
    EXPECT_EQ(cmd.exclude, (std::vector<std::string>{"tests/"}));
    EXPECT_EQ(cmd.file_types, (std::vector<std::string>{"*.py", "*.rs"}));
    EXPECT_EQ(*cmd.output, std::filesystem::path("out.txt"));
    EXPECT_TRUE(cmd.no_cache);
    EXPECT_EQ(*cmd.cache_dir, std::filesystem::path("/tmp/cc"));
    EXPECT_EQ(*cmd.format, "indexed");
    EXPECT_EQ(*cmd.config, std::filesystem::path("cc.yml"));
    EXPECT_TRUE(cmd.no_analysis);
}

TEST(CliTest, TST_CLI_007_Collect_MissingValue) {
    ParseResult result = parse_args(Args{"codecollector", "collect", "-o"});

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_EQ(result.diagnostic.stderr_message,
              "error: a value is required for '--output <FILE>' but none was supplied\n\n"
              "Usage: codecollector collect [OPTIONS] [PATH]\n\n"
              "For more information, try '--help'.\n");
}

TEST(CliTest, TST_CLI_008_Collect_InvalidFormat) {
    ParseResult result = parse_args(Args{"codecollector", "collect", "--format", "markdown"});

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.diagnostic.stderr_message.find(
                  "invalid value 'markdown' for '--format <FORMAT>'"),
              std::string::npos);
    EXPECT_NE(result.diagnostic.stderr_message.find("[possible values: standard, indexed]"),
              std::string::npos);
}

TEST(CliTest, TST_CLI_009_Collect_SecondPathRejected) {
    ParseResult result = parse_args(Args{"codecollector", "collect", "a", "b"});

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.diagnostic.stderr_message.find("unexpected argument 'b' found"),
              std::string::npos);
}

// ==============================================================================
// TST-CLI-010: analyze
// ==============================================================================

TEST(CliTest, TST_CLI_010_Analyze_FilesAndJson) {
    ParseResult result = parse_args(Args{"codecollector", "analyze", "a.txt", "--json", "b.txt"});

    ASSERT_TRUE(result.ok);
    const auto& cmd = std::get<AnalyzeCommand>(result.command);
    ASSERT_EQ(cmd.files.size(), 2u);
    EXPECT_EQ(cmd.files[1], std::filesystem::path("b.txt"));
    EXPECT_TRUE(cmd.json);
}

TEST(CliTest, TST_CLI_011_Analyze_BritishSpellingAlias) {
    ParseResult result = parse_args(Args{"codecollector", "analyse", "report.txt"});

    ASSERT_TRUE(result.ok);
    EXPECT_TRUE(std::holds_alternative<AnalyzeCommand>(result.command));
}

TEST(CliTest, TST_CLI_012_Analyze_NoFiles) {
    ParseResult result = parse_args(Args{"codecollector", "analyze", "-j"});

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_EQ(result.diagnostic.stderr_message.rfind(
                  "error: the following required arguments were not provided:\n  <FILE>...", 0),
              0u);
}

// ==============================================================================
// TST-CLI-013: cache
// ==============================================================================

TEST(CliTest, TST_CLI_013_CacheList) {
    ParseResult result =
        parse_args(Args{"codecollector", "cache", "list", "--json", "--cache-dir=/tmp/cc"});

    ASSERT_TRUE(result.ok);
    const auto& cmd = std::get<CacheListCommand>(result.command);
    EXPECT_TRUE(cmd.json);
    EXPECT_EQ(*cmd.cache_dir, std::filesystem::path("/tmp/cc"));
}

TEST(CliTest, TST_CLI_014_CacheClear_WithAndWithoutProject) {
    ParseResult all = parse_args(Args{"codecollector", "cache", "clear"});
    ParseResult one = parse_args(Args{"codecollector", "-q", "cache", "clear", "myapp"});

    ASSERT_TRUE(all.ok);
    EXPECT_FALSE(std::get<CacheClearCommand>(all.command).project.has_value());
    ASSERT_TRUE(one.ok);
    EXPECT_TRUE(one.global.quiet);
    EXPECT_EQ(*std::get<CacheClearCommand>(one.command).project, "myapp");
}

TEST(CliTest, TST_CLI_015_Cache_NoSubcommandIsHelp_UnknownIsError) {
    ParseResult bare = parse_args(Args{"codecollector", "cache"});
    ParseResult unknown = parse_args(Args{"codecollector", "cache", "purge"});

    ASSERT_TRUE(bare.ok);
    EXPECT_EQ(std::get<HelpCommand>(bare.command).command, std::string("cache"));
    EXPECT_FALSE(unknown.ok);
    EXPECT_NE(unknown.diagnostic.stderr_message.find("unrecognized subcommand 'purge'"),
              std::string::npos);
}

// ==============================================================================
// TST-CLI-016: ошибки верхнего уровня
// ==============================================================================

TEST(CliTest, TST_CLI_016_UnknownSubcommandAndFlag) {
    ParseResult sub = parse_args(Args{"codecollector", "deploy"});
    ParseResult flag = parse_args(Args{"codecollector", "--frobnicate"});

    EXPECT_FALSE(sub.ok);
    EXPECT_EQ(sub.diagnostic.exit_code, 2);
    EXPECT_EQ(sub.diagnostic.stderr_message.rfind("error: unrecognized subcommand 'deploy'", 0), 0u);
    EXPECT_FALSE(flag.ok);
    EXPECT_EQ(flag.diagnostic.exit_code, 2);
    EXPECT_NE(flag.diagnostic.stderr_message.find("unexpected argument '--frobnicate' found"),
              std::string::npos);
}

}  // namespace codecollector::cli::test
