// json-format command line behaviour

#include "json_formatter_cli.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <initializer_list>
#include <sstream>
#include <string>
#include <vector>

// Runs json-format with the given arguments and stdin text.
class CliTest : public ::testing::Test
{
protected:
    int run(std::initializer_list<const char *> args, const std::string &input = std::string())
    {
        std::vector<std::string> storage{"json-format"};
        for (const char *a : args)
            storage.emplace_back(a);
        std::vector<char *> argv;
        for (auto &s : storage)
            argv.push_back(&s[0]);
        argv.push_back(nullptr);

        std::istringstream in(input);
        out.str("");
        err.str("");
        return runCommandLine(static_cast<int>(storage.size()), argv.data(), in, out, err);
    }

    std::ostringstream out;
    std::ostringstream err;
};

TEST_F(CliTest, FormatsStdinWhenNoFilesGiven)
{
    EXPECT_EQ(run({}, R"({"a":1,"b":[true]})"), 0);
    EXPECT_EQ(out.str(), "{\n    \"a\": 1,\n    \"b\": [\n        true\n    ]\n}\n");
    EXPECT_EQ(err.str(), "");

    EXPECT_EQ(run({"-"}, "[]"), 0);
    EXPECT_EQ(out.str(), "[]\n");
}

TEST_F(CliTest, CompactAndNoExpand)
{
    const std::string input = R"({"x" : "{\"y\":2}"})";
    EXPECT_EQ(run({"-c"}, input), 0);
    EXPECT_EQ(out.str(), "{\"x\":{\"y\":2}}\n");

    EXPECT_EQ(run({"--compact", "--no-expand"}, input), 0);
    EXPECT_EQ(out.str(), "{\"x\":\"{\\\"y\\\":2}\"}\n");
}

TEST_F(CliTest, PrintsTree)
{
    EXPECT_EQ(run({"--tree"}, R"({"a":[1],"b":"{\"c\":null}"})"), 0);
    EXPECT_EQ(out.str(), "(dictionary, 2 keys)\n"
                         "├── a (list, 1 item)\n"
                         "│   └── [0]: 1\n"
                         "└── b (dictionary, 1 key)\n"
                         "    └── c: null\n");
}

TEST_F(CliTest, FindListsMatchesWithPositions)
{
    EXPECT_EQ(run({"--find", "id"}, R"({"id":1,"idx":"日本id"})"), 0);
    EXPECT_EQ(out.str(), "(stdin):2:6:     \"id\": 1,\n"
                         "(stdin):3:6:     \"idx\": \"日本id\"\n"
                         "(stdin):3:15:     \"idx\": \"日本id\"\n");

    EXPECT_EQ(run({"-f", "zz"}, "[1]"), 0);
    EXPECT_EQ(out.str(), "");
}

TEST_F(CliTest, MatchOnFirstLine)
{
    std::ostringstream lines;
    printMatches("doc", "abc\nxbc", "bc", lines);
    EXPECT_EQ(lines.str(), "doc:1:2: abc\ndoc:2:2: xbc\n");

    lines.str("");
    printMatches("doc", "abc", "a", lines);
    EXPECT_EQ(lines.str(), "doc:1:1: abc\n");
}

TEST_F(CliTest, ParseErrorGoesToStderrWithExitOne)
{
    EXPECT_EQ(run({}, "{\n  \"a\": tru\n}"), 1);
    EXPECT_EQ(out.str(), "");
    EXPECT_EQ(err.str().rfind("(stdin): error at line 2, column 8: ", 0), 0u) << err.str();
}

TEST_F(CliTest, InvalidUtf8OnStdin)
{
    EXPECT_EQ(run({}, "\"caf\xe9\""), 1);
    EXPECT_EQ(err.str(), "(stdin): input is not valid UTF-8 text\n");
}

TEST_F(CliTest, BadArgumentsExitTwo)
{
    EXPECT_EQ(run({"--bogus"}), 2);
    EXPECT_EQ(out.str(), "");
    EXPECT_EQ(err.str().rfind("json-format: ", 0), 0u);
    EXPECT_NE(err.str().find("USAGE:"), std::string::npos);

    EXPECT_EQ(run({"--find"}), 2);
}

TEST_F(CliTest, HelpAndVersion)
{
    EXPECT_EQ(run({"--help"}), 0);
    EXPECT_NE(out.str().find("--no-expand"), std::string::npos);
    EXPECT_EQ(err.str(), "");

    EXPECT_EQ(run({"--version"}), 0);
    EXPECT_EQ(out.str(), std::string("json-format version ") + JSON_FORMATTER_VERSION + "\n");
}

TEST_F(CliTest, FailedFileDoesNotStopOthers)
{
    std::string good = testing::TempDir() + "json_formatter_cli_good.json";
    std::string missing = testing::TempDir() + "json_formatter_cli_missing.json";
    std::remove(missing.c_str());
    writeTextFile(good, "[1,2]");

    EXPECT_EQ(run({missing.c_str(), good.c_str()}), 1);
    EXPECT_EQ(out.str(), "[\n    1,\n    2\n]\n");
    EXPECT_EQ(err.str().rfind("Failed to open file: " + missing, 0), 0u) << err.str();

    EXPECT_EQ(run({"-c", good.c_str(), good.c_str()}), 0);
    EXPECT_EQ(out.str(), "[1,2]\n[1,2]\n");
    std::remove(good.c_str());
}

TEST_F(CliTest, ProcessDocumentReportsThroughStreams)
{
    AppConfig config;
    config.compact = true;
    std::ostringstream docOut;
    std::ostringstream docErr;
    EXPECT_TRUE(processDocument("a.json", "[NaN]", config, docOut, docErr));
    EXPECT_EQ(docOut.str(), "[NaN]\n");

    EXPECT_FALSE(processDocument("b.json", R"({"日本":})", config, docOut, docErr));
    EXPECT_EQ(docErr.str().rfind("b.json: error at line 1, column 7: ", 0), 0u) << docErr.str();
}
