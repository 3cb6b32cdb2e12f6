// Per-window formatting pipeline and the window registry
#include "json_formatter_document.hpp"

#include "json_formatter_platform.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

std::string trimWhitespace(const std::string &s)
{
    const char *ws = " \t\n\r\f\v";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos)
        return std::string();
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

bool FormatterDocument::format(const std::string &input, bool reportErrors)
{
    if (trimWhitespace(input).empty())
    {
        clear();
        return true;
    }
    try
    {
        // surrounding whitespace is valid JSON, so positions stay
        // relative to what the user typed
        json parsed = parseJson(input);
        setDocument(expandNested(parsed));
        setResult(serializeJson(document, SerializeMode::Pretty));
        spdlog::debug("Formatted document with {} tree nodes", countNodes(*root));
        return true;
    }
    catch (const JsonParseError &ex)
    {
        if (reportErrors)
        {
            spdlog::warn("Format failed: {}", ex.what());
            throw;
        }
        spdlog::debug("Live format skipped: {}", ex.what());
        clear();
        return false;
    }
}

void FormatterDocument::compress(const std::string &input)
{
    if (trimWhitespace(input).empty())
        return;
    json parsed;
    try
    {
        parsed = parseJson(input);
    }
    catch (const JsonParseError &ex)
    {
        spdlog::warn("Compress failed: {}", ex.what());
        throw;
    }
    std::string compact = serializeJson(parsed, SerializeMode::Compact);
    setDocument(std::move(parsed));
    setResult(std::move(compact));
}

void FormatterDocument::selectNode(const TreeNode *node)
{
    if (node == nullptr)
        return;
    try
    {
        setResult(serializeJson(reconstructJson(*node), SerializeMode::Pretty));
    }
    catch (const std::exception &ex)
    {
        spdlog::warn("Could not rebuild JSON for '{}': {}", node->label, ex.what());
        setResult(displayLabel(*node));
    }
}

bool FormatterDocument::saveResult(const std::string &path) const
{
    std::string text = trimWhitespace(result);
    if (text.empty())
        return false;
    writeTextFile(path, text);
    return true;
}

bool FormatterDocument::copyResult() const
{
    if (result.empty())
        return false;
    return copyToClipboard(result);
}

void FormatterDocument::clear()
{
    root.reset();
    document = json();
    setResult(std::string());
}

void FormatterDocument::setDocument(json value)
{
    // the tree points into the old document
    root.reset();
    document = std::move(value);
    root = projectTree(document);
}

void FormatterDocument::setResult(std::string text)
{
    result = std::move(text);
    cursorOffset = std::min(cursorOffset, result.size());
    session = searchText(result, session.pattern);
}

void FormatterDocument::setSearchPattern(const std::string &pattern)
{
    session = searchText(result, pattern);
    spdlog::debug("Search '{}' found {} matches", pattern, session.matches.size());
}

void FormatterDocument::findNext()
{
    nextMatch(session);
}

void FormatterDocument::findPrevious()
{
    prevMatch(session);
}

void FormatterDocument::endSearch()
{
    session = SearchSession();
}

void FormatterDocument::setCursor(size_t offset)
{
    cursorOffset = std::min(offset, result.size());
}

std::vector<HighlightRange> FormatterDocument::highlights() const
{
    return composeHighlights(&session, cursorOffset);
}

int WindowRegistry::create()
{
    ++counter;
    open.push_back(counter);
    spdlog::info("Opened window {}", counter);
    return counter;
}

bool WindowRegistry::destroy(int id)
{
    auto it = std::find(open.begin(), open.end(), id);
    if (it == open.end())
        return false;
    open.erase(it);
    spdlog::info("Closed window {}, {} still open", id, open.size());
    return true;
}

bool WindowRegistry::contains(int id) const
{
    return std::find(open.begin(), open.end(), id) != open.end();
}

std::string windowTitle(int id)
{
    std::string title = "JSON Formatter";
    if (id > 1)
        title += " " + std::to_string(id);
    return title;
}
