#pragma once

#include <nlohmann/json.hpp>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::ordered_json;

// Raised when text is not valid JSON.  Line and column are 1-based and
// point at the start of the offending token; the column counts characters.
// offset() is the byte offset of the same position.
class JsonParseError : public std::runtime_error
{
public:
    JsonParseError(const std::string &detail, size_t line, size_t column, size_t offset);

    size_t line() const { return errLine; }
    size_t column() const { return errColumn; }
    size_t offset() const { return errOffset; }
    const std::string &detail() const { return errDetail; }

private:
    std::string errDetail;
    size_t errLine;
    size_t errColumn;
    size_t errOffset;
};

enum class SerializeMode
{
    Pretty,
    Compact
};

enum class NodeKind
{
    Object,
    Array,
    Scalar
};

// What the label of a node stands for.
enum class KeyKind
{
    None,  // root
    Key,   // object member
    Index  // array element, label is "[i]"
};

// One node of the display tree.  Nodes point into the value they were
// projected from; that value must outlive the tree.
struct TreeNode
{
    NodeKind kind = NodeKind::Scalar;
    const json *value = nullptr;
    TreeNode *parent = nullptr;
    std::vector<std::unique_ptr<TreeNode>> children;
    KeyKind keyKind = KeyKind::None;
    std::string label;
    bool expanded = false;
    bool isLastChild = false;

    bool hasLabel() const { return keyKind != KeyKind::None; }
    bool isLeaf() const { return children.empty(); }
};

json parseJson(const std::string &text);
std::string serializeJson(const json &value, SerializeMode mode);
json expandNested(const json &value);
std::unique_ptr<TreeNode> projectTree(const json &value);
json reconstructJson(const TreeNode &node);

size_t offsetToLine(const std::string &text, size_t offset);
size_t offsetToColumn(const std::string &text, size_t offset);

int getDisplayWidth(const std::string &str);
size_t utf8SequenceLength(unsigned char lead);
bool isValidUtf8(const std::string &text);

std::string displayLabel(const TreeNode &node);
std::string buildPrefix(const TreeNode *node);
void collectVisible(const TreeNode *node, std::vector<const TreeNode *> &out);
size_t countNodes(const TreeNode &node);
void expandAll(TreeNode *node);
void collapseAll(TreeNode *node, bool keepRoot);
void expandToLevel(TreeNode *node, int targetLevel, int currentLevel = 0);
