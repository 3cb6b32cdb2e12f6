// Value model and display tree shared by the json-formatter front ends
#include "json_formatter_core.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <string>
#include <utility>
#include <vector>
#include <wchar.h>

JsonParseError::JsonParseError(const std::string &detail, size_t line, size_t column, size_t offset)
    : std::runtime_error(detail + " at line " + std::to_string(line) + ", column " + std::to_string(column)),
      errDetail(detail), errLine(line), errColumn(column), errOffset(offset)
{
}

size_t offsetToLine(const std::string &text, size_t offset)
{
    offset = std::min(offset, text.size());
    return 1 + static_cast<size_t>(std::count(text.begin(), text.begin() + offset, '\n'));
}

// Columns count characters, not bytes: UTF-8 continuation bytes are skipped.
size_t offsetToColumn(const std::string &text, size_t offset)
{
    offset = std::min(offset, text.size());
    size_t lineStart = (offset == 0) ? std::string::npos : text.rfind('\n', offset - 1);
    lineStart = (lineStart == std::string::npos) ? 0 : lineStart + 1;
    size_t column = 1;
    for (size_t i = lineStart; i < offset; ++i)
    {
        if ((static_cast<unsigned char>(text[i]) & 0xC0) != 0x80)
            ++column;
    }
    return column;
}

// A NaN/Infinity literal that was quoted before handing the text to
// nlohmann::json.  stringIndex is the position of the quoted literal
// among all string tokens of the rewritten text.
struct Substitution
{
    size_t processedStart;
    size_t processedLength;
    size_t originalStart;
    size_t originalLength;
    size_t stringIndex;
    double value;
};

static size_t mapToOriginal(size_t pos, const std::vector<Substitution> &subs)
{
    size_t mapped = pos;
    for (const Substitution &s : subs)
    {
        if (pos < s.processedStart)
            break;
        if (pos < s.processedStart + s.processedLength)
            return s.originalStart;
        mapped = s.originalStart + s.originalLength + (pos - s.processedStart - s.processedLength);
    }
    return mapped;
}

// Drop the "[json.exception.parse_error.101] parse error at line 1,
// column 6: " prefix nlohmann puts in front of the actual reason.
static std::string stripExceptionPrefix(const std::string &what)
{
    std::string msg = what;
    size_t bracket = msg.find("] ");
    if (msg.rfind("[json.exception.", 0) == 0 && bracket != std::string::npos)
        msg = msg.substr(bracket + 2);
    size_t columnPos = msg.find("column ");
    if (msg.rfind("parse error", 0) == 0 && columnPos != std::string::npos)
    {
        size_t colon = msg.find(": ", columnPos);
        if (colon != std::string::npos)
            msg = msg.substr(colon + 2);
    }
    return msg;
}

static char lastSignificant(const std::string &s)
{
    for (size_t i = s.size(); i > 0; --i)
    {
        char c = s[i - 1];
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r')
            return c;
    }
    return '\0';
}

static bool isWordChar(char c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' ||
           c == '+' || c == '-' || c == '.' || static_cast<unsigned char>(c) >= 0x80;
}

// nlohmann reports the position after the last character it read.  Walk
// back to where the offending token starts: the opening quote of a string
// that is still open, the first character of a bare word, or the failing
// character itself.  A literal or number that failed to scan has already
// consumed the character that broke it.
static size_t tokenStart(const std::string &text, size_t position, bool brokenWord)
{
    size_t end = std::min(position, text.size());
    size_t last = (position > text.size() || end == 0) ? end : end - 1;

    bool inString = false;
    size_t quote = 0;
    for (size_t i = 0; i < last; ++i)
    {
        if (inString)
        {
            if (text[i] == '\\')
                ++i;
            else if (text[i] == '"')
                inString = false;
        }
        else if (text[i] == '"')
        {
            inString = true;
            quote = i;
        }
    }
    if (inString)
        return quote;
    if (brokenWord && last < text.size() && !isWordChar(text[last]) && last > 0 && isWordChar(text[last - 1]))
        --last;
    if (last == text.size() || !isWordChar(text[last]))
        return last;
    while (last > 0 && isWordChar(text[last - 1]))
        --last;
    return last;
}

// Builds the document from SAX events the way nlohmann's DOM parser
// does, turning the quoted NaN/Infinity literals back into numbers.  They
// are recognised by their position in the token stream, so user strings
// with the same text stay strings.
class SpecialLiteralSax : public nlohmann::json_sax<json>
{
public:
    SpecialLiteralSax(json &target, const std::vector<Substitution> &substitutions)
        : root(target), subs(substitutions) {}

    bool null() override { return put(json()) != nullptr; }
    bool boolean(bool val) override { return put(json(val)) != nullptr; }
    bool number_integer(number_integer_t val) override { return put(json(val)) != nullptr; }
    bool number_unsigned(number_unsigned_t val) override { return put(json(val)) != nullptr; }
    bool number_float(number_float_t val, const string_t &) override { return put(json(val)) != nullptr; }
    bool binary(binary_t &val) override { return put(json::binary(val)) != nullptr; }

    bool string(string_t &val) override
    {
        if (const Substitution *s = nextString())
            return put(json(s->value)) != nullptr;
        return put(json(std::move(val))) != nullptr;
    }

    bool key(string_t &val) override
    {
        if (const Substitution *s = nextString())
        {
            literalKey = s;
            return false;
        }
        pendingKey = std::move(val);
        return true;
    }

    bool start_object(std::size_t) override
    {
        stack.push_back(put(json::object()));
        return true;
    }

    bool start_array(std::size_t) override
    {
        stack.push_back(put(json::array()));
        return true;
    }

    bool end_object() override
    {
        stack.pop_back();
        return true;
    }

    bool end_array() override
    {
        stack.pop_back();
        return true;
    }

    bool parse_error(std::size_t position, const std::string &, const nlohmann::detail::exception &ex) override
    {
        errorPosition = position;
        errorMessage = stripExceptionPrefix(ex.what());
        failed = true;
        return false;
    }

    const Substitution *literalKey = nullptr;
    bool failed = false;
    size_t errorPosition = 0;
    std::string errorMessage;

private:
    const Substitution *nextString()
    {
        size_t index = stringCount++;
        if (nextSub < subs.size() && subs[nextSub].stringIndex == index)
            return &subs[nextSub++];
        return nullptr;
    }

    json *put(json value)
    {
        if (stack.empty())
        {
            root = std::move(value);
            return &root;
        }
        json &top = *stack.back();
        if (top.is_array())
        {
            top.push_back(std::move(value));
            return &top.back();
        }
        json &slot = top[pendingKey];
        slot = std::move(value);
        return &slot;
    }

    json &root;
    const std::vector<Substitution> &subs;
    std::vector<json *> stack;
    std::string pendingKey;
    size_t stringCount = 0;
    size_t nextSub = 0;
};

// Parse JSON while accepting NaN/Infinity literals.  Literals in value
// position are quoted before parsing and turned back into numbers by the
// SAX handler.  Error positions are reported against the caller's text.
json parseJson(const std::string &contents)
{
    std::string processed;
    processed.reserve(contents.size());
    std::vector<Substitution> subs;
    size_t stringCount = 0;
    bool inString = false;
    for (size_t i = 0; i < contents.size();)
    {
        char c = contents[i];
        if (inString)
        {
            processed.push_back(c);
            if (c == '\\')
            {
                ++i;
                if (i < contents.size())
                    processed.push_back(contents[i]);
                ++i;
            }
            else
            {
                if (c == '"')
                    inString = false;
                ++i;
            }
            continue;
        }
        if (c == '"')
        {
            inString = true;
            ++stringCount;
            processed.push_back(c);
            ++i;
            continue;
        }

        size_t literalLength = 0;
        double value = 0.0;
        if (contents.compare(i, 3, "NaN") == 0)
        {
            literalLength = 3;
            value = std::numeric_limits<double>::quiet_NaN();
        }
        else if (contents.compare(i, 8, "Infinity") == 0)
        {
            literalLength = 8;
            value = std::numeric_limits<double>::infinity();
        }
        else if (contents.compare(i, 9, "-Infinity") == 0)
        {
            literalLength = 9;
            value = -std::numeric_limits<double>::infinity();
        }

        char prev = lastSignificant(processed);
        bool valuePosition = prev == '\0' || prev == ':' || prev == '[' || prev == ',';
        if (literalLength > 0 && valuePosition)
        {
            std::string quoted = "\"" + contents.substr(i, literalLength) + "\"";
            subs.push_back({processed.size(), quoted.size(), i, literalLength, stringCount++, value});
            processed += quoted;
            i += literalLength;
        }
        else
        {
            processed.push_back(c);
            ++i;
        }
    }

    json j;
    SpecialLiteralSax sax(j, subs);
    bool ok = json::sax_parse(processed, &sax);
    if (sax.literalKey)
    {
        size_t offset = sax.literalKey->originalStart;
        std::string literal = contents.substr(offset, sax.literalKey->originalLength);
        throw JsonParseError("syntax error while parsing object key - unexpected " + literal +
                                 "; expected string literal",
                             offsetToLine(contents, offset), offsetToColumn(contents, offset), offset);
    }
    if (!ok || sax.failed)
    {
        std::string detail = sax.errorMessage.empty() ? std::string("syntax error") : sax.errorMessage;
        bool brokenWord = detail.find("invalid literal") != std::string::npos ||
                          detail.find("invalid number") != std::string::npos;
        size_t start = tokenStart(processed, sax.errorPosition, brokenWord);
        size_t offset = std::min(mapToOriginal(start, subs), contents.size());
        throw JsonParseError(detail, offsetToLine(contents, offset), offsetToColumn(contents, offset), offset);
    }
    return j;
}

static std::string dumpString(const std::string &s)
{
    return json(s).dump(-1, ' ', false, json::error_handler_t::replace);
}

static void writeValue(std::string &out, const json &j, SerializeMode mode, int indent)
{
    const bool pretty = (mode == SerializeMode::Pretty);
    switch (j.type())
    {
    case json::value_t::object:
    {
        if (j.empty())
        {
            out += "{}";
            return;
        }
        out += '{';
        for (auto it = j.cbegin(); it != j.cend(); ++it)
        {
            if (it != j.cbegin())
                out += ',';
            if (pretty)
            {
                out += '\n';
                out.append(indent + 4, ' ');
            }
            out += dumpString(it.key());
            out += pretty ? ": " : ":";
            writeValue(out, it.value(), mode, indent + 4);
        }
        if (pretty)
        {
            out += '\n';
            out.append(indent, ' ');
        }
        out += '}';
        break;
    }
    case json::value_t::array:
    {
        if (j.empty())
        {
            out += "[]";
            return;
        }
        out += '[';
        for (size_t i = 0; i < j.size(); ++i)
        {
            if (i > 0)
                out += ',';
            if (pretty)
            {
                out += '\n';
                out.append(indent + 4, ' ');
            }
            writeValue(out, j[i], mode, indent + 4);
        }
        if (pretty)
        {
            out += '\n';
            out.append(indent, ' ');
        }
        out += ']';
        break;
    }
    case json::value_t::string:
        out += dumpString(j.get_ref<const json::string_t &>());
        break;
    case json::value_t::number_float:
    {
        double d = j.get<double>();
        if (std::isnan(d))
            out += "NaN";
        else if (std::isinf(d))
            out += (d > 0 ? "Infinity" : "-Infinity");
        else
            out += j.dump();
        break;
    }
    case json::value_t::boolean:
    case json::value_t::number_integer:
    case json::value_t::number_unsigned:
        out += j.dump();
        break;
    case json::value_t::null:
    case json::value_t::discarded:
        out += "null";
        break;
    case json::value_t::binary:
        out += j.dump(-1, ' ', false, json::error_handler_t::replace);
        break;
    }
}

std::string serializeJson(const json &value, SerializeMode mode)
{
    std::string out;
    writeValue(out, value, mode, 0);
    return out;
}

// Re-parse every string leaf that holds JSON text of its own.  The
// replacement is expanded again, so doubly encoded documents unfold
// completely.
static json expandMember(const json &value)
{
    switch (value.type())
    {
    case json::value_t::object:
    {
        json out = json::object();
        for (auto it = value.cbegin(); it != value.cend(); ++it)
            out[it.key()] = expandMember(it.value());
        return out;
    }
    case json::value_t::array:
    {
        json out = json::array();
        for (const auto &el : value)
            out.push_back(expandMember(el));
        return out;
    }
    case json::value_t::string:
    {
        json parsed;
        try
        {
            parsed = parseJson(value.get_ref<const json::string_t &>());
        }
        catch (const JsonParseError &)
        {
            return value;
        }
        return expandMember(parsed);
    }
    case json::value_t::null:
    case json::value_t::boolean:
    case json::value_t::number_integer:
    case json::value_t::number_unsigned:
    case json::value_t::number_float:
    case json::value_t::binary:
    case json::value_t::discarded:
        return value;
    }
    return value;
}

// A string at the root is left as it is: only strings held by an object
// or array are replaced by the document they encode.
json expandNested(const json &value)
{
    if (value.is_string())
        return value;
    return expandMember(value);
}

static std::unique_ptr<TreeNode> buildNode(const json *j, KeyKind keyKind, const std::string &label,
                                           TreeNode *parent)
{
    auto node = std::make_unique<TreeNode>();
    node->value = j;
    node->parent = parent;
    node->keyKind = keyKind;
    node->label = label;
    switch (j->type())
    {
    case json::value_t::object:
        node->kind = NodeKind::Object;
        node->children.reserve(j->size());
        for (auto it = j->begin(); it != j->end(); ++it)
            node->children.push_back(buildNode(&it.value(), KeyKind::Key, it.key(), node.get()));
        break;
    case json::value_t::array:
    {
        node->kind = NodeKind::Array;
        node->children.reserve(j->size());
        size_t idx = 0;
        for (auto it = j->begin(); it != j->end(); ++it, ++idx)
        {
            std::string childLabel = "[" + std::to_string(idx) + "]";
            node->children.push_back(buildNode(&(*it), KeyKind::Index, childLabel, node.get()));
        }
        break;
    }
    case json::value_t::null:
    case json::value_t::boolean:
    case json::value_t::number_integer:
    case json::value_t::number_unsigned:
    case json::value_t::number_float:
    case json::value_t::string:
    case json::value_t::binary:
    case json::value_t::discarded:
        node->kind = NodeKind::Scalar;
        break;
    }
    node->expanded = (node->kind != NodeKind::Scalar);
    for (size_t i = 0; i < node->children.size(); ++i)
        node->children[i]->isLastChild = (i == node->children.size() - 1);
    return node;
}

// Build a tree of TreeNode objects mirroring the structure of a JSON
// document.  The root carries no label.
std::unique_ptr<TreeNode> projectTree(const json &value)
{
    return buildNode(&value, KeyKind::None, std::string(), nullptr);
}

// Regenerate the JSON fragment rooted at a node.  Whether a branch is a
// list is decided from the child labels alone, so an object whose keys
// all start with '[' comes back as an array.
json reconstructJson(const TreeNode &node)
{
    if (node.value == nullptr)
        throw std::logic_error("tree node '" + node.label + "' carries no value");

    if (node.isLeaf())
    {
        if (node.kind == NodeKind::Scalar && node.keyKind == KeyKind::Key)
        {
            json wrapped = json::object();
            wrapped[node.label] = *node.value;
            return wrapped;
        }
        return *node.value;
    }

    bool isList = std::all_of(node.children.begin(), node.children.end(),
                              [](const std::unique_ptr<TreeNode> &child)
                              { return child->label.rfind('[', 0) == 0; });
    if (isList)
    {
        json result = json::array();
        for (const auto &child : node.children)
            result.push_back(reconstructJson(*child));
        return result;
    }

    json result = json::object();
    for (const auto &child : node.children)
    {
        std::string key = child->label.substr(0, child->label.find(':'));
        json value = reconstructJson(*child);
        // undo the {key: value} wrapping of keyed leaves
        if (value.is_object() && value.size() == 1 && value.begin().key() == key)
        {
            json inner = value.begin().value();
            value = std::move(inner);
        }
        result[key] = std::move(value);
    }
    return result;
}

// Calculate the display width of a UTF-8 string (handles Unicode properly)
int getDisplayWidth(const std::string &str)
{
    std::vector<wchar_t> wstr(str.length() + 1);
    size_t result = mbstowcs(wstr.data(), str.c_str(), str.length());
    if (result == static_cast<size_t>(-1))
        return static_cast<int>(str.length());
    wstr[result] = L'\0';

    // wcswidth returns -1 for unprintable characters
    int width = wcswidth(wstr.data(), result);
    return (width >= 0) ? width : static_cast<int>(str.length());
}

size_t utf8SequenceLength(unsigned char lead)
{
    if (lead < 0x80)
        return 1;
    if ((lead & 0xE0) == 0xC0)
        return 2;
    if ((lead & 0xF0) == 0xE0)
        return 3;
    if ((lead & 0xF8) == 0xF0)
        return 4;
    return 0;
}

// nlohmann's serializer rejects malformed sequences, overlong forms and
// surrogates with type_error 316.
bool isValidUtf8(const std::string &text)
{
    try
    {
        json(text).dump();
    }
    catch (const json::type_error &)
    {
        return false;
    }
    return true;
}

static std::string escapeForDisplay(const std::string &s)
{
    std::string out;
    for (char c : s)
    {
        if (c == '\\')
            out += "\\\\";
        else if (c == '\"')
            out += "\\\"";
        else if (c == '\n')
            out += "\\n";
        else if (c == '\r')
            out += "\\r";
        else if (c == '\t')
            out += "\\t";
        else if (static_cast<unsigned char>(c) < 0x20)
        {
            static const char hex[] = "0123456789abcdef";
            out += "\\u00";
            out += hex[(c >> 4) & 0x0F];
            out += hex[c & 0x0F];
        }
        else
            out += c;
    }
    return out;
}

// Outline text for a node: containers show their size, scalars their value.
std::string displayLabel(const TreeNode &node)
{
    const json *v = node.value;
    std::string prefix = node.hasLabel() ? node.label : std::string();
    if (v == nullptr)
        return prefix;

    switch (node.kind)
    {
    case NodeKind::Object:
    {
        size_t count = v->size();
        std::string type = "dictionary, " + std::to_string(count) + (count == 1 ? " key" : " keys");
        return node.hasLabel() ? prefix + " (" + type + ")" : "(" + type + ")";
    }
    case NodeKind::Array:
    {
        size_t count = v->size();
        std::string type = "list, " + std::to_string(count) + (count == 1 ? " item" : " items");
        return node.hasLabel() ? prefix + " (" + type + ")" : "(" + type + ")";
    }
    case NodeKind::Scalar:
        break;
    }

    std::string text;
    if (v->is_string())
        text = "\"" + escapeForDisplay(v->get_ref<const json::string_t &>()) + "\"";
    else
        text = serializeJson(*v, SerializeMode::Compact);
    return node.hasLabel() ? prefix + ": " + text : text;
}

// Build the tree prefix for a node.  This string contains the
// vertical bar and branch characters needed to draw a proper tree.
std::string buildPrefix(const TreeNode *node)
{
    std::string prefix;
    for (const TreeNode *cur = node; cur->parent != nullptr; cur = cur->parent)
    {
        const TreeNode *parent = cur->parent;
        // the root has no branch of its own
        if (parent->parent != nullptr)
            prefix = std::string(parent->isLastChild ? "    " : "│   ") + prefix;
    }
    if (node->parent != nullptr)
        prefix += node->isLastChild ? "└── " : "├── ";
    return prefix;
}

// Recursively collect all nodes that are currently visible.  A node is
// visible if it is the root or its parent is expanded.
void collectVisible(const TreeNode *node, std::vector<const TreeNode *> &out)
{
    out.push_back(node);
    if (node->expanded)
    {
        for (const auto &child : node->children)
            collectVisible(child.get(), out);
    }
}

size_t countNodes(const TreeNode &node)
{
    size_t total = 1;
    for (const auto &child : node.children)
        total += countNodes(*child);
    return total;
}

void expandAll(TreeNode *node)
{
    if (!node->isLeaf())
        node->expanded = true;
    for (auto &child : node->children)
        expandAll(child.get());
}

// Collapse every branch of the given node.  When keepRoot is true the
// node itself stays open so the top-level structure remains visible.
void collapseAll(TreeNode *node, bool keepRoot)
{
    if (!keepRoot && !node->isLeaf())
        node->expanded = false;
    for (auto &child : node->children)
        collapseAll(child.get(), false);
}

// Expand nodes up to a specific nesting level.  Level 0 collapses
// everything, level 1 shows only the children of the root, etc.
void expandToLevel(TreeNode *node, int targetLevel, int currentLevel)
{
    if (node->isLeaf())
        return;
    if (currentLevel < targetLevel)
    {
        node->expanded = true;
        for (auto &child : node->children)
            expandToLevel(child.get(), targetLevel, currentLevel + 1);
    }
    else
    {
        collapseAll(node, false);
    }
}
