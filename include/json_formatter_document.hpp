#pragma once

#include "json_formatter_core.hpp"
#include "json_formatter_search.hpp"

#include <memory>
#include <string>
#include <vector>

// State behind one formatter window: the parsed document, its display
// tree, the text shown in the result view and the search over it.
class FormatterDocument
{
public:
    // Parse, expand and project the input.  With reportErrors a parse
    // failure propagates as JsonParseError; without it the views are
    // cleared and false is returned.
    bool format(const std::string &input, bool reportErrors);

    // Compact the input without expanding nested strings.  Parse
    // failures always propagate.
    void compress(const std::string &input);

    // Show the JSON regenerated from a node of the current tree.
    void selectNode(const TreeNode *node);

    // Writes the trimmed result; returns false when there is nothing to save.
    bool saveResult(const std::string &path) const;

    // Sends the whole result to the terminal clipboard.
    bool copyResult() const;

    void clear();

    const TreeNode *tree() const { return root.get(); }
    TreeNode *tree() { return root.get(); }
    const json &value() const { return document; }
    const std::string &resultText() const { return result; }
    bool hasResult() const { return !result.empty(); }

    void setSearchPattern(const std::string &pattern);
    void findNext();
    void findPrevious();
    void endSearch();
    const SearchSession &search() const { return session; }

    void setCursor(size_t offset);
    size_t cursor() const { return cursorOffset; }
    std::vector<HighlightRange> highlights() const;

private:
    void setResult(std::string text);
    void setDocument(json value);

    json document;
    std::unique_ptr<TreeNode> root;
    std::string result;
    SearchSession session;
    size_t cursorOffset = 0;
};

// Replaces the process-wide window list: hands out increasing window
// numbers and tracks which windows are still open.  Numbers are never
// reused.
class WindowRegistry
{
public:
    int create();
    bool destroy(int id);
    bool contains(int id) const;
    size_t size() const { return open.size(); }
    int created() const { return counter; }

private:
    int counter = 0;
    std::vector<int> open;
};

std::string windowTitle(int id);
std::string trimWhitespace(const std::string &s);
