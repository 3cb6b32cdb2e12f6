// Text search and highlight layering for the result view
#include "json_formatter_search.hpp"

#include <regex>

// Scan for non-overlapping occurrences of pattern, left to right.  After
// a hit the scan resumes at the end of that hit, so "aba" is found once
// in "ababab".
SearchSession searchText(const std::string &text, const std::string &pattern)
{
    SearchSession session;
    session.pattern = pattern;
    if (pattern.empty())
        return session;

    size_t pos = text.find(pattern);
    while (pos != std::string::npos)
    {
        session.matches.push_back({pos, pattern.size()});
        pos = text.find(pattern, pos + pattern.size());
    }
    if (!session.matches.empty())
        session.currentIndex = 0;
    return session;
}

void nextMatch(SearchSession &session)
{
    if (session.matches.empty())
        return;
    session.currentIndex = (session.currentIndex + 1) % static_cast<int>(session.matches.size());
}

void prevMatch(SearchSession &session)
{
    if (session.matches.empty())
        return;
    int count = static_cast<int>(session.matches.size());
    session.currentIndex = (session.currentIndex - 1 + count) % count;
}

// Ranges in painting order: later entries are drawn over earlier ones.
std::vector<HighlightRange> composeHighlights(const SearchSession *session, size_t cursorOffset)
{
    std::vector<HighlightRange> ranges;
    const SearchMatch *current = (session && session->active()) ? session->current() : nullptr;

    ranges.push_back({HighlightLayer::CurrentLine, current ? current->start : cursorOffset, 0});
    if (!session || !session->active())
        return ranges;

    for (const SearchMatch &m : session->matches)
        ranges.push_back({HighlightLayer::Match, m.start, m.length});
    if (current)
        ranges.push_back({HighlightLayer::CurrentMatch, current->start, current->length});
    return ranges;
}

static void collectGroup(const std::string &line, const std::regex &re, size_t group,
                         std::vector<SyntaxSpan> &out, SyntaxRole role)
{
    for (auto it = std::sregex_iterator(line.begin(), line.end(), re); it != std::sregex_iterator(); ++it)
    {
        const std::smatch &m = *it;
        if (m[group].length() == 0)
            continue;
        out.push_back({role, static_cast<size_t>(m.position(group)), static_cast<size_t>(m.length(group))});
    }
}

// Token colouring for one line of formatted JSON.  Spans are ordered so
// that later ones take precedence.
std::vector<SyntaxSpan> highlightJsonSyntax(const std::string &line)
{
    static const std::regex keyRe("\"(.*?)\"\\s*:");
    static const std::regex stringRe(":\\s*\"([^\"]*)\"");
    static const std::regex literalRe(":\\s*(true|false|null)(?=[,\\}\\]]|\\s*$)");
    static const std::regex numberRe(":\\s*(-?\\d+(?:\\.\\d+)?(?:[eE][+-]?\\d+)?)(?=[,\\}\\]]|\\s*$)");

    std::vector<SyntaxSpan> spans;
    collectGroup(line, keyRe, 1, spans, SyntaxRole::Key);
    collectGroup(line, stringRe, 1, spans, SyntaxRole::String);

    for (auto it = std::sregex_iterator(line.begin(), line.end(), literalRe); it != std::sregex_iterator(); ++it)
    {
        const std::smatch &m = *it;
        SyntaxRole role = (m.str(1) == "null") ? SyntaxRole::Null : SyntaxRole::Boolean;
        spans.push_back({role, static_cast<size_t>(m.position(1)), static_cast<size_t>(m.length(1))});
    }

    collectGroup(line, numberRe, 1, spans, SyntaxRole::Number);
    return spans;
}
