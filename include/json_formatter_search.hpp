#pragma once

#include <cstddef>
#include <string>
#include <vector>

struct SearchMatch
{
    size_t start = 0;
    size_t length = 0;

    bool operator==(const SearchMatch &other) const { return start == other.start && length == other.length; }
};

// Literal matches of one pattern in one buffer.  Offsets are byte
// offsets into the UTF-8 text.  currentIndex is -1 when there are no
// matches.
struct SearchSession
{
    std::string pattern;
    std::vector<SearchMatch> matches;
    int currentIndex = -1;

    bool active() const { return !pattern.empty(); }
    const SearchMatch *current() const
    {
        return currentIndex >= 0 ? &matches[static_cast<size_t>(currentIndex)] : nullptr;
    }
};

enum class HighlightLayer
{
    CurrentLine,
    Match,
    CurrentMatch
};

struct HighlightRange
{
    HighlightLayer layer = HighlightLayer::CurrentLine;
    size_t start = 0;
    size_t length = 0;
};

enum class SyntaxRole
{
    Key,
    String,
    Number,
    Boolean,
    Null
};

struct SyntaxSpan
{
    SyntaxRole role = SyntaxRole::Key;
    size_t start = 0;
    size_t length = 0;
};

SearchSession searchText(const std::string &text, const std::string &pattern);
void nextMatch(SearchSession &session);
void prevMatch(SearchSession &session);

std::vector<HighlightRange> composeHighlights(const SearchSession *session, size_t cursorOffset);
std::vector<SyntaxSpan> highlightJsonSyntax(const std::string &line);
