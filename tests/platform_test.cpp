// Command line, environment, file access and logging setup

#include "json_formatter_platform.hpp"
#include "json_formatter_core.hpp"

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <cstdlib>
#include <initializer_list>
#include <string>
#include <vector>

// Owns a mutable argv built from string literals.
class ArgList
{
public:
    ArgList(std::initializer_list<const char *> args)
    {
        for (const char *a : args)
            storage.emplace_back(a);
        for (auto &s : storage)
            pointers.push_back(&s[0]);
        pointers.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(storage.size()); }
    char **argv() { return pointers.data(); }

private:
    std::vector<std::string> storage;
    std::vector<char *> pointers;
};

class PlatformTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        unsetenv("JSON_FORMATTER_LOG");
        unsetenv("JSON_FORMATTER_LOG_LEVEL");
        const char *term = std::getenv("TERM");
        savedTerm = term ? term : "";
        hadTerm = term != nullptr;
    }

    void TearDown() override
    {
        unsetenv("JSON_FORMATTER_LOG");
        unsetenv("JSON_FORMATTER_LOG_LEVEL");
        unsetenv("NO_OSC52");
        if (hadTerm)
            setenv("TERM", savedTerm.c_str(), 1);
        else
            unsetenv("TERM");
    }

    std::string savedTerm;
    bool hadTerm = false;
};

TEST_F(PlatformTest, DefaultsWithNoArguments)
{
    ArgList args{"json-format"};
    AppConfig config = parseCommandLine(args.argc(), args.argv());
    EXPECT_FALSE(config.showHelp);
    EXPECT_FALSE(config.compact);
    EXPECT_TRUE(config.expandNested);
    EXPECT_FALSE(config.printTree);
    EXPECT_TRUE(config.findPattern.empty());
    EXPECT_TRUE(config.logFile.empty());
    EXPECT_TRUE(config.files.empty());
}

TEST_F(PlatformTest, ParsesOptionsAndFiles)
{
    ArgList args{"json-format", "-c", "--no-expand", "a.json", "--find", "key", "-t", "-", "--log-level", "debug"};
    AppConfig config = parseCommandLine(args.argc(), args.argv());
    EXPECT_TRUE(config.compact);
    EXPECT_FALSE(config.expandNested);
    EXPECT_TRUE(config.printTree);
    EXPECT_EQ(config.findPattern, "key");
    EXPECT_EQ(config.logLevel, "debug");
    EXPECT_EQ(config.files, (std::vector<std::string>{"a.json", "-"}));
}

TEST_F(PlatformTest, DoubleDashEndsOptions)
{
    ArgList args{"json-format", "--", "-c", "--help"};
    AppConfig config = parseCommandLine(args.argc(), args.argv());
    EXPECT_FALSE(config.compact);
    EXPECT_FALSE(config.showHelp);
    EXPECT_EQ(config.files, (std::vector<std::string>{"-c", "--help"}));
}

TEST_F(PlatformTest, RejectsBadArguments)
{
    ArgList unknown{"json-format", "--bogus"};
    EXPECT_THROW(parseCommandLine(unknown.argc(), unknown.argv()), std::invalid_argument);

    ArgList missing{"json-format", "--find"};
    EXPECT_THROW(parseCommandLine(missing.argc(), missing.argv()), std::invalid_argument);

    ArgList level{"json-format", "--log-level", "loud"};
    EXPECT_THROW(parseCommandLine(level.argc(), level.argv()), std::invalid_argument);
}

TEST_F(PlatformTest, EnvironmentIsOverriddenByOptions)
{
    setenv("JSON_FORMATTER_LOG", "/tmp/from-env.log", 1);
    setenv("JSON_FORMATTER_LOG_LEVEL", "error", 1);

    ArgList plain{"json-format"};
    AppConfig config = parseCommandLine(plain.argc(), plain.argv());
    EXPECT_EQ(config.logFile, "/tmp/from-env.log");
    EXPECT_EQ(config.logLevel, "error");

    ArgList overridden{"json-format", "--log-file", "/tmp/from-cli.log"};
    config = parseCommandLine(overridden.argc(), overridden.argv());
    EXPECT_EQ(config.logFile, "/tmp/from-cli.log");
    EXPECT_EQ(config.logLevel, "error");
}

TEST_F(PlatformTest, WritesAndReadsFiles)
{
    std::string path = testing::TempDir() + "json_formatter_platform_test.json";
    writeTextFile(path, "{\"name\": \"日本\"}");
    EXPECT_EQ(readTextFile(path), "{\"name\": \"日本\"}");
    writeTextFile(path, "[]");
    EXPECT_EQ(readTextFile(path), "[]");
    std::remove(path.c_str());
}

TEST_F(PlatformTest, MissingFileRaisesFileError)
{
    std::string path = testing::TempDir() + "json_formatter_no_such_file.json";
    try
    {
        readTextFile(path);
        FAIL() << "expected FileError";
    }
    catch (const FileError &ex)
    {
        EXPECT_EQ(ex.path(), path);
    }
}

TEST_F(PlatformTest, RejectsInvalidUtf8File)
{
    std::string path = testing::TempDir() + "json_formatter_latin1.json";
    writeTextFile(path, "\"caf\xe9\"");
    EXPECT_THROW(readTextFile(path), FileError);
    std::remove(path.c_str());
}

TEST_F(PlatformTest, Utf8Validation)
{
    EXPECT_TRUE(isValidUtf8(""));
    EXPECT_TRUE(isValidUtf8("plain ascii"));
    EXPECT_TRUE(isValidUtf8("日本 \xf0\x9f\x98\x80"));
    EXPECT_FALSE(isValidUtf8("\xff"));
    EXPECT_FALSE(isValidUtf8("\xe6\x97"));
    EXPECT_FALSE(isValidUtf8("\xc0\xaf"));
    EXPECT_FALSE(isValidUtf8("\xed\xa0\x80"));
    EXPECT_FALSE(isValidUtf8("ok \xf0\x9f\x98"));
    EXPECT_FALSE(isValidUtf8("\xf4\x90\x80\x80"));
}

TEST_F(PlatformTest, ClipboardDetectionFollowsTerminal)
{
    unsetenv("NO_OSC52");
    setenv("TERM", "xterm-256color", 1);
    EXPECT_TRUE(osc52Likely());
    EXPECT_EQ(getClipboardStatusMessage(), "JSON result copied to clipboard!");

    setenv("TERM", "dumb", 1);
    EXPECT_FALSE(osc52Likely());

    setenv("TERM", "xterm", 1);
    setenv("NO_OSC52", "1", 1);
    EXPECT_FALSE(osc52Likely());
    EXPECT_FALSE(copyToClipboard("{}"));
}

TEST_F(PlatformTest, LogsToConfiguredFile)
{
    std::string path = testing::TempDir() + "json_formatter_log_test.log";
    std::remove(path.c_str());

    AppConfig config;
    config.logFile = path;
    config.logLevel = "debug";
    initLogging(config, true);
    spdlog::info("log marker {}", 42);
    spdlog::default_logger()->flush();
    EXPECT_NE(readTextFile(path).find("log marker 42"), std::string::npos);

    initLogging(AppConfig(), true);
    EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::info);
    std::remove(path.c_str());
}
