// Command line front end: format, compact, print the display tree or
// search the formatted output of one or more JSON documents.
#include "json_formatter_cli.hpp"
#include "json_formatter_search.hpp"

#include <spdlog/spdlog.h>

#include <sstream>
#include <utility>
#include <vector>

void printTree(const TreeNode &root, std::ostream &out)
{
    std::vector<const TreeNode *> visible;
    collectVisible(&root, visible);
    for (const TreeNode *node : visible)
        out << buildPrefix(node) << displayLabel(*node) << "\n";
}

void printMatches(const std::string &name, const std::string &text, const std::string &pattern,
                  std::ostream &out)
{
    SearchSession session = searchText(text, pattern);
    for (const SearchMatch &m : session.matches)
    {
        size_t lineStart = (m.start == 0) ? std::string::npos : text.rfind('\n', m.start - 1);
        lineStart = (lineStart == std::string::npos) ? 0 : lineStart + 1;
        size_t lineEnd = text.find('\n', m.start);
        out << name << ":" << offsetToLine(text, m.start) << ":" << offsetToColumn(text, m.start) << ": "
            << text.substr(lineStart, lineEnd == std::string::npos ? std::string::npos : lineEnd - lineStart)
            << "\n";
    }
    spdlog::info("{}: {} matches for '{}'", name, session.matches.size(), pattern);
}

bool processDocument(const std::string &name, const std::string &contents, const AppConfig &config,
                     std::ostream &out, std::ostream &err)
{
    json doc;
    try
    {
        doc = parseJson(contents);
    }
    catch (const JsonParseError &ex)
    {
        err << name << ": error at line " << ex.line() << ", column " << ex.column() << ": " << ex.detail()
            << std::endl;
        return false;
    }
    if (config.expandNested)
        doc = expandNested(doc);

    if (config.printTree)
    {
        printTree(*projectTree(doc), out);
        return true;
    }

    std::string text = serializeJson(doc, config.compact ? SerializeMode::Compact : SerializeMode::Pretty);
    if (!config.findPattern.empty())
        printMatches(name, text, config.findPattern, out);
    else
        out << text << "\n";
    return true;
}

int runCommandLine(int argc, char **argv, std::istream &in, std::ostream &out, std::ostream &err)
{
    const char *progName = argc > 0 ? argv[0] : "json-format";
    AppConfig config;
    try
    {
        config = parseCommandLine(argc, argv);
    }
    catch (const std::invalid_argument &ex)
    {
        err << progName << ": " << ex.what() << "\n\n";
        showUsage(progName, false, err);
        return 2;
    }
    if (config.showHelp)
    {
        showUsage(progName, false, out);
        return 0;
    }
    if (config.showVersion)
    {
        out << "json-format version " << JSON_FORMATTER_VERSION << "\n";
        return 0;
    }

    try
    {
        initLogging(config, false);
    }
    catch (const std::exception &ex)
    {
        err << "Cannot set up logging: " << ex.what() << std::endl;
        return 1;
    }

    std::vector<std::pair<std::string, std::string>> inputs;
    bool failed = false;
    if (config.files.empty())
        config.files.push_back("-");
    for (const std::string &name : config.files)
    {
        if (name == "-")
        {
            std::ostringstream ss;
            ss << in.rdbuf();
            if (!isValidUtf8(ss.str()))
            {
                err << "(stdin): input is not valid UTF-8 text" << std::endl;
                failed = true;
                continue;
            }
            inputs.emplace_back("(stdin)", ss.str());
            continue;
        }
        try
        {
            inputs.emplace_back(name, readTextFile(name));
        }
        catch (const FileError &ex)
        {
            err << "Failed to open file: " << ex.what() << std::endl;
            failed = true;
        }
    }

    for (const auto &input : inputs)
    {
        if (!processDocument(input.first, input.second, config, out, err))
            failed = true;
    }
    return failed ? 1 : 0;
}
