#include "json_formatter_core.hpp"
#include "json_formatter_document.hpp"
#include "json_formatter_platform.hpp"
#include "json_formatter_search.hpp"

#define Uses_TApplication
#define Uses_TKeys
#define Uses_TMenuBar
#define Uses_TMenu
#define Uses_TSubMenu
#define Uses_TMenuItem
#define Uses_TDialog
#define Uses_TFileDialog
#define Uses_TOutline
#define Uses_TScrollBar
#define Uses_TScroller
#define Uses_TInputLine
#define Uses_TLabel
#define Uses_TEditor
#define Uses_TFileEditor
#define Uses_TWindow
#define Uses_TDrawBuffer
#define Uses_TEvent
#define Uses_TStatusLine
#define Uses_TStatusItem
#define Uses_TStatusDef
#define Uses_TDeskTop
#define Uses_MsgBox
#include <tvision/tv.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <clocale>
#include <iostream>
#include <string>
#include <vector>

static constexpr const char *kPlaceholderText = "JSON tree (expand/collapse); select a node to show its JSON";

static const ushort cmNewWindow = 1000;
static const ushort cmFormat = 1001;
static const ushort cmCompress = 1002;
static const ushort cmCopyResult = 1003;
static const ushort cmSaveResult = 1004;
static const ushort cmFindText = 1005;
static const ushort cmFindNext = 1006;
static const ushort cmFindPrev = 1007;
static const ushort cmEndSearch = 1008;
static const ushort cmExpandAll = 1009;
static const ushort cmCollapseAll = 1010;
static const ushort cmAbout = 1011;
static const ushort cmLevel1 = 1101;
static const ushort cmLevel2 = 1102;
static const ushort cmLevel3 = 1103;

// Broadcasts between the panes of a window
static const ushort cmInputChanged = 1200;
static const ushort cmNodeSelected = 1201;
static const ushort cmSearchChanged = 1202;

// Colors of the result view, taken from the dark editor theme
namespace ColorScheme
{
    const TColorRGB BACKGROUND(0x2B2B2B);
    const TColorRGB CURRENT_LINE_BG(0x3C3C3C);
    const TColorRGB MATCH_BG(0x6B5B00);
    const TColorRGB CURRENT_MATCH_BG(0x4B5CC4);

    const TColorRGB TEXT_FG(0xF8F8F2);
    const TColorRGB KEY_FG(0x1E90FF);
    const TColorRGB STRING_FG(0xFFA500);
    const TColorRGB NUMBER_FG(0x56B6C2);
    const TColorRGB BOOLEAN_FG(0xE5C07B);
    const TColorRGB NULL_FG(0xFF1493);
    const TColorRGB CURRENT_MATCH_FG(0xFFFFFF);
}

static TColorAttr syntaxAttr(SyntaxRole role, bool currentLine)
{
    TColorRGB bg = currentLine ? ColorScheme::CURRENT_LINE_BG : ColorScheme::BACKGROUND;
    switch (role)
    {
    case SyntaxRole::Key:
        return TColorAttr(ColorScheme::KEY_FG, bg);
    case SyntaxRole::String:
        return TColorAttr(ColorScheme::STRING_FG, bg);
    case SyntaxRole::Number:
        return TColorAttr(ColorScheme::NUMBER_FG, bg);
    case SyntaxRole::Boolean:
        return TColorAttr(ColorScheme::BOOLEAN_FG, bg);
    case SyntaxRole::Null:
        return TColorAttr(ColorScheme::NULL_FG, bg);
    }
    return TColorAttr(ColorScheme::TEXT_FG, bg);
}

class JsonTNode : public TNode
{
public:
    TreeNode *treeNode;
    JsonTNode *parent = nullptr;
    JsonTNode(TreeNode *n, TStringView text, JsonTNode *children = nullptr,
              JsonTNode *next = nullptr, Boolean exp = True)
        : TNode(text, children, next, exp), treeNode(n) {}
};

static void disposeTree(TNode *node)
{
    while (node)
    {
        TNode *next = node->next;
        disposeTree(node->childList);
        delete node;
        node = next;
    }
}

static JsonTNode *buildOutlineNodes(TreeNode *n)
{
    JsonTNode *firstChild = nullptr;
    JsonTNode *prev = nullptr;
    std::vector<JsonTNode *> createdChildren;
    for (const auto &c : n->children)
    {
        JsonTNode *child = buildOutlineNodes(c.get());
        createdChildren.push_back(child);
        if (!firstChild)
            firstChild = child;
        else
            prev->next = child;
        prev = child;
    }
    std::string label = displayLabel(*n);
    auto node = new JsonTNode(n, label.c_str(), firstChild, nullptr, n->expanded ? True : False);
    for (auto *child : createdChildren)
        child->parent = node;
    return node;
}

static void syncExpanded(JsonTNode *n)
{
    if (!n)
        return;
    if (n->treeNode)
        n->expanded = n->treeNode->expanded ? True : False;
    for (JsonTNode *c = static_cast<JsonTNode *>(n->childList); c; c = static_cast<JsonTNode *>(c->next))
        syncExpanded(c);
}

class JsonOutline : public TOutline
{
public:
    JsonOutline(TRect r, TScrollBar *h, TScrollBar *v, JsonTNode *aRoot)
        : TOutline(r, h, v, aRoot) {}

    JsonTNode *jsonRoot() { return static_cast<JsonTNode *>(root); }

    JsonTNode *focusedNode()
    {
        return static_cast<JsonTNode *>(getNode(foc));
    }

    void setRoot(JsonTNode *newRoot)
    {
        disposeTree(root);
        root = newRoot;
        foc = 0;
        update();
        drawView();
    }

    void syncExpansion()
    {
        syncExpanded(jsonRoot());
        update();
        drawView();
    }

    void focusNode(JsonTNode *target)
    {
        struct Finder
        {
            JsonTNode *target;
            int index = 0;
            int found = -1;
        } finder{target};

        forEach([](TOutlineViewer *, TNode *node, int, int, long, ushort, void *arg) -> Boolean
                {
            auto &f = *static_cast<Finder *>(arg);
            if (node == f.target)
            {
                f.found = f.index;
                return True;
            }
            ++f.index;
            return False; }, &finder);

        if (finder.found >= 0)
        {
            foc = finder.found;
            scrollTo(0, finder.found);
            drawView();
            focused(finder.found);
        }
    }

    virtual void adjust(TNode *node, Boolean expand) override
    {
        TOutline::adjust(node, expand);
        JsonTNode *n = static_cast<JsonTNode *>(node);
        if (n->treeNode && !n->treeNode->isLeaf())
            n->treeNode->expanded = expand == True;
    }

    virtual void selected(int i) override
    {
        TOutline::selected(i);
        notifySelection(static_cast<JsonTNode *>(getNode(i)));
    }

    virtual void handleEvent(TEvent &event) override
    {
        if (event.what == evMouseDown && (event.mouse.buttons & mbLeftButton))
        {
            int clickX = event.mouse.where.x;
            TOutline::handleEvent(event);
            JsonTNode *node = focusedNode();
            if (node && node->treeNode)
            {
                int depth = 0;
                for (const TreeNode *p = node->treeNode; p && p->parent; p = p->parent)
                    ++depth;
                int prefixWidth = depth * 2 + 2;
                if (clickX < prefixWidth && node->childList)
                {
                    node->expanded = node->expanded ? False : True;
                    node->treeNode->expanded = node->expanded == True;
                    update();
                    drawView();
                }
                else
                    notifySelection(node);
            }
        }
        else if (event.what == evKeyDown)
        {
            JsonTNode *node = focusedNode();
            switch (event.keyDown.keyCode)
            {
            case kbLeft:
                if (node)
                {
                    if (node->expanded && node->childList)
                        adjustAndRedraw(node, False);
                    else if (node->parent)
                        focusNode(node->parent);
                }
                clearEvent(event);
                break;
            case kbRight:
                if (node)
                {
                    if (!node->expanded && node->childList)
                        adjustAndRedraw(node, True);
                    else if (node->childList)
                        focusNode(static_cast<JsonTNode *>(node->childList));
                }
                clearEvent(event);
                break;
            default:
                TOutline::handleEvent(event);
            }
        }
        else
            TOutline::handleEvent(event);
    }

private:
    void adjustAndRedraw(JsonTNode *node, Boolean expand)
    {
        adjust(node, expand);
        update();
        drawView();
    }

    void notifySelection(JsonTNode *node)
    {
        if (node && node->treeNode)
            message(owner, evBroadcast, cmNodeSelected, node);
    }
};

// Input pane.  Every edit is announced to the owning window.
class InputEditor : public TFileEditor
{
public:
    InputEditor(const TRect &r, TScrollBar *h, TScrollBar *v)
        : TFileEditor(r, h, v, nullptr, TStringView()) {}

    std::string text()
    {
        std::string out;
        out.reserve(bufLen);
        for (uint i = 0; i < bufLen; ++i)
            out.push_back(bufChar(i));
        return out;
    }

    bool setText(const std::string &contents)
    {
        setSelect(0, bufLen, False);
        Boolean ok = insertText(contents.data(), static_cast<uint>(contents.size()), False);
        modified = False;
        return ok == True;
    }

    // The input is scratch text, closing never prompts to save it.
    virtual Boolean valid(ushort command) override
    {
        return command == cmValid ? isValid : True;
    }

    virtual void handleEvent(TEvent &event) override
    {
        modified = False;
        TFileEditor::handleEvent(event);
        if (modified)
            message(owner, evBroadcast, cmInputChanged, this);
    }
};

// Formatted result with syntax colours, search highlights and a
// current-line marker.
class ResultView : public TScroller
{
public:
    ResultView(const TRect &r, TScrollBar *h, TScrollBar *v, FormatterDocument &doc)
        : TScroller(r, h, v), document(doc)
    {
        refresh();
    }

    void refresh()
    {
        const std::string &text = document.resultText();
        lineStarts.assign(1, 0);
        for (size_t i = 0; i < text.size(); ++i)
        {
            if (text[i] == '\n')
                lineStarts.push_back(i + 1);
        }
        int width = 0;
        for (size_t line = 0; line < lineStarts.size(); ++line)
            width = std::max(width, getDisplayWidth(text.substr(lineStarts[line], lineLength(line))));
        setLimit(width + 1, static_cast<int>(lineStarts.size()));
        drawView();
    }

    // Scroll so that the byte at offset is on screen.
    void showOffset(size_t offset)
    {
        size_t line = lineOf(offset);
        int row = static_cast<int>(line);
        int top = delta.y;
        if (row < delta.y || row >= delta.y + size.y)
            top = std::max(0, row - size.y / 2);

        const std::string &text = document.resultText();
        int col = getDisplayWidth(text.substr(lineStarts[line], offset - lineStarts[line]));
        int left = delta.x;
        if (col < delta.x || col >= delta.x + size.x)
            left = std::max(0, col - size.x / 4);
        scrollTo(left, top);
        drawView();
    }

    virtual void draw() override
    {
        const std::string &text = document.resultText();
        std::vector<HighlightRange> ranges = document.highlights();
        size_t anchorLine = lineOf(ranges.front().start);

        for (int y = 0; y < size.y; ++y)
        {
            TDrawBuffer b;
            size_t line = static_cast<size_t>(delta.y + y);
            bool isCurrent = (line == anchorLine);
            TColorAttr background(ColorScheme::TEXT_FG,
                                  isCurrent ? ColorScheme::CURRENT_LINE_BG : ColorScheme::BACKGROUND);
            b.moveChar(0, ' ', background, size.x);

            if (line < lineStarts.size())
            {
                size_t start = lineStarts[line];
                size_t len = lineLength(line);
                std::string lineText = text.substr(start, len);
                std::vector<TColorAttr> attrs(len, background);
                for (const SyntaxSpan &s : highlightJsonSyntax(lineText))
                    std::fill(attrs.begin() + s.start, attrs.begin() + s.start + s.length, syntaxAttr(s.role, isCurrent));
                for (const HighlightRange &r : ranges)
                {
                    if (r.layer == HighlightLayer::CurrentLine || r.start + r.length <= start || r.start >= start + len)
                        continue;
                    size_t from = std::max(r.start, start) - start;
                    size_t to = std::min(r.start + r.length, start + len) - start;
                    TColorAttr attr = (r.layer == HighlightLayer::CurrentMatch)
                                          ? TColorAttr(ColorScheme::CURRENT_MATCH_FG, ColorScheme::CURRENT_MATCH_BG, slBold)
                                          : TColorAttr(ColorScheme::TEXT_FG, ColorScheme::MATCH_BG);
                    std::fill(attrs.begin() + from, attrs.begin() + to, attr);
                }

                int col = -delta.x;
                for (size_t i = 0; i < len && col < size.x;)
                {
                    size_t n = utf8SequenceLength(static_cast<unsigned char>(lineText[i]));
                    if (n == 0 || i + n > len)
                        n = 1;
                    std::string ch = lineText.substr(i, n);
                    int w = getDisplayWidth(ch);
                    if (col >= 0 && col + w <= size.x)
                        b.moveStr(static_cast<ushort>(col), TStringView(ch.data(), ch.size()), attrs[i]);
                    col += w;
                    i += n;
                }
            }
            writeLine(0, y, size.x, 1, b);
        }
    }

    virtual void handleEvent(TEvent &event) override
    {
        TScroller::handleEvent(event);
        if (event.what == evMouseDown)
        {
            TPoint local = makeLocal(event.mouse.where);
            moveCursorTo(delta.y + local.y);
            clearEvent(event);
        }
        else if (event.what == evKeyDown)
        {
            int line = static_cast<int>(lineOf(document.cursor()));
            switch (event.keyDown.keyCode)
            {
            case kbUp:
                moveCursorTo(line - 1);
                break;
            case kbDown:
                moveCursorTo(line + 1);
                break;
            case kbPgUp:
                moveCursorTo(line - size.y);
                break;
            case kbPgDn:
                moveCursorTo(line + size.y);
                break;
            case kbHome:
                moveCursorTo(0);
                break;
            case kbEnd:
                moveCursorTo(static_cast<int>(lineStarts.size()) - 1);
                break;
            case kbLeft:
                scrollTo(std::max(0, delta.x - 1), delta.y);
                break;
            case kbRight:
                scrollTo(delta.x + 1, delta.y);
                break;
            default:
                return;
            }
            clearEvent(event);
        }
    }

private:
    size_t lineOf(size_t offset) const
    {
        auto it = std::upper_bound(lineStarts.begin(), lineStarts.end(), offset);
        return static_cast<size_t>(it - lineStarts.begin()) - 1;
    }

    size_t lineLength(size_t line) const
    {
        size_t end = (line + 1 < lineStarts.size()) ? lineStarts[line + 1] - 1 : document.resultText().size();
        return end - lineStarts[line];
    }

    void moveCursorTo(int line)
    {
        int last = static_cast<int>(lineStarts.size()) - 1;
        line = std::max(0, std::min(line, last));
        document.setCursor(lineStarts[static_cast<size_t>(line)]);
        showOffset(document.cursor());
    }

    FormatterDocument &document;
    std::vector<size_t> lineStarts;
};

// Live search field: every change re-runs the search.
class SearchLine : public TInputLine
{
public:
    explicit SearchLine(const TRect &r) : TInputLine(r, 255) {}

    std::string pattern() const { return data; }

    void clearPattern()
    {
        data[0] = '\0';
        selectAll(True);
        drawView();
    }

    virtual void handleEvent(TEvent &event) override
    {
        if (event.what == evKeyDown)
        {
            switch (event.keyDown.keyCode)
            {
            case kbEnter:
                message(owner, evCommand, cmFindNext, this);
                clearEvent(event);
                return;
            case kbEsc:
                message(owner, evCommand, cmEndSearch, this);
                clearEvent(event);
                return;
            default:
                break;
            }
        }
        std::string before = data;
        TInputLine::handleEvent(event);
        if (before != data)
            message(owner, evBroadcast, cmSearchChanged, this);
    }
};

class JsonStatusLine : public TStatusLine
{
public:
    JsonStatusLine(TRect r) : TStatusLine(r, *new TStatusDef(0, 0xFFFF, nullptr)) { setSearchState(SearchSession()); }

    void setSearchState(const SearchSession &s)
    {
        disposeItems(items);
        TStatusItem *chain = nullptr;
        if (!s.active())
        {
            auto *i1 = new TStatusItem("~Ctrl-N~ New", kbCtrlN, cmNewWindow);
            auto *i2 = new TStatusItem("~F2~ Open", kbF2, cmOpen);
            auto *i3 = new TStatusItem("~F5~ Format", kbF5, cmFormat);
            auto *i4 = new TStatusItem("~F6~ Compress", kbF6, cmCompress);
            auto *i5 = new TStatusItem("~Alt-X~ Quit", kbAltX, cmQuit);
            i1->next = i2;
            i2->next = i3;
            i3->next = i4;
            i4->next = i5;
            chain = i1;
        }
        else
        {
            std::string info = "search '" + s.pattern + "' " +
                               std::to_string(s.currentIndex + 1) + "/" +
                               std::to_string(s.matches.size());
            auto *i1 = new TStatusItem(info.c_str(), kbNoKey, 0);
            auto *i2 = new TStatusItem("~F3~ Next", kbF3, cmFindNext);
            auto *i3 = new TStatusItem("~Shift-F3~ Prev", kbShiftF3, cmFindPrev);
            auto *i4 = new TStatusItem("~Esc~ End Search", kbEsc, cmEndSearch);
            i1->next = i2;
            i2->next = i3;
            i3->next = i4;
            chain = i1;
        }
        items = chain;
        defs->items = items;
        drawView();
    }

private:
    void disposeItems(TStatusItem *item)
    {
        while (item)
        {
            TStatusItem *next = item->next;
            delete item;
            item = next;
        }
    }
};

static void updateStatusBar(const SearchSession &session)
{
    if (TProgram::statusLine)
        static_cast<JsonStatusLine *>(TProgram::statusLine)->setSearchState(session);
}

// One independent formatter: input editor, tree, result view and search
// bar sharing a FormatterDocument.
class FormatterWindow : public TWindow
{
public:
    FormatterWindow(const TRect &bounds, WindowRegistry &reg, int windowId);
    ~FormatterWindow();

    virtual void handleEvent(TEvent &event) override;
    virtual void setState(ushort aState, Boolean enable) override;

    bool loadFile(const std::string &name);

private:
    void refreshFromInput(bool reportErrors);
    void rebuildOutline();
    void refreshResult();
    void runFormat();
    void runCompress();
    void openFile();
    void saveResult();
    void copyResult();
    void startSearch();
    void endSearch();
    void showCurrentMatch();
    void applyTreeLayout();

    WindowRegistry &registry;
    int id;
    FormatterDocument document;
    InputEditor *input = nullptr;
    JsonOutline *outline = nullptr;
    ResultView *resultView = nullptr;
    TLabel *searchLabel = nullptr;
    SearchLine *searchLine = nullptr;
};

FormatterWindow::FormatterWindow(const TRect &bounds, WindowRegistry &reg, int windowId)
    : TWindowInit(&TWindow::initFrame),
      TWindow(bounds, windowTitle(windowId).c_str(), wnNoNumber),
      registry(reg), id(windowId)
{
    flags |= wfGrow;
    TRect c = getExtent();
    int width = c.b.x - 2;
    int bottom = c.b.y - 2; // last row is the search bar
    int inputWidth = std::max(10, width / 5);
    int treeWidth = std::max(10, width * 2 / 5);

    int x0 = 1;
    int x1 = x0 + inputWidth;
    int x2 = x1 + treeWidth;
    int x3 = c.b.x - 1;

    // input: one fifth, tree and result: two fifths each
    auto *inH = new TScrollBar(TRect(x0, bottom - 1, x1 - 1, bottom));
    inH->growMode = gfGrowLoY | gfGrowHiY;
    auto *inV = new TScrollBar(TRect(x1 - 1, 1, x1, bottom - 1));
    inV->growMode = gfGrowHiY;
    input = new InputEditor(TRect(x0, 1, x1 - 1, bottom - 1), inH, inV);
    input->growMode = gfGrowHiY;

    auto *treeH = new TScrollBar(TRect(x1, bottom - 1, x2 - 1, bottom));
    treeH->growMode = gfGrowLoY | gfGrowHiY;
    auto *treeV = new TScrollBar(TRect(x2 - 1, 1, x2, bottom - 1));
    treeV->growMode = gfGrowHiY;
    outline = new JsonOutline(TRect(x1, 1, x2 - 1, bottom - 1), treeH, treeV, new JsonTNode(nullptr, kPlaceholderText));
    outline->growMode = gfGrowHiY;

    auto *resH = new TScrollBar(TRect(x2, bottom - 1, x3 - 1, bottom));
    resH->growMode = gfGrowLoY | gfGrowHiY | gfGrowHiX;
    auto *resV = new TScrollBar(TRect(x3 - 1, 1, x3, bottom - 1));
    resV->growMode = gfGrowLoX | gfGrowHiX | gfGrowHiY;
    resultView = new ResultView(TRect(x2, 1, x3 - 1, bottom - 1), resH, resV, document);
    resultView->growMode = gfGrowHiX | gfGrowHiY;

    searchLine = new SearchLine(TRect(x0 + 7, bottom, x3, bottom + 1));
    searchLine->growMode = gfGrowLoY | gfGrowHiY | gfGrowHiX;
    searchLabel = new TLabel(TRect(x0, bottom, x0 + 7, bottom + 1), "Find:", searchLine);
    searchLabel->growMode = gfGrowLoY | gfGrowHiY;

    insert(inH);
    insert(inV);
    insert(treeH);
    insert(treeV);
    insert(resH);
    insert(resV);
    insert(outline);
    insert(resultView);
    insert(searchLabel);
    insert(searchLine);
    insert(input);
    searchLabel->hide();
    searchLine->hide();
    input->select();
}

FormatterWindow::~FormatterWindow()
{
    if (!registry.destroy(id))
        spdlog::warn("Window {} was not registered", id);
}

void FormatterWindow::setState(ushort aState, Boolean enable)
{
    TWindow::setState(aState, enable);
    if ((aState & sfActive) && enable)
        updateStatusBar(document.search());
}

bool FormatterWindow::loadFile(const std::string &name)
{
    std::string contents;
    try
    {
        contents = readTextFile(name);
    }
    catch (const FileError &ex)
    {
        spdlog::error("Failed to open file: {}", ex.what());
        messageBox((std::string("Could not open file\n") + ex.what()).c_str(), mfError | mfOKButton);
        return false;
    }
    if (!input->setText(contents))
    {
        messageBox("File is too large for the editor", mfError | mfOKButton);
        return false;
    }
    refreshFromInput(false);
    return true;
}

void FormatterWindow::refreshFromInput(bool reportErrors)
{
    document.format(input->text(), reportErrors);
    rebuildOutline();
    refreshResult();
}

void FormatterWindow::rebuildOutline()
{
    TreeNode *tree = document.tree();
    outline->setRoot(tree ? buildOutlineNodes(tree) : new JsonTNode(nullptr, kPlaceholderText));
}

void FormatterWindow::refreshResult()
{
    resultView->refresh();
    showCurrentMatch();
    updateStatusBar(document.search());
}

void FormatterWindow::showCurrentMatch()
{
    const SearchMatch *current = document.search().current();
    if (current)
        resultView->showOffset(current->start);
    else
        resultView->drawView();
}

void FormatterWindow::runFormat()
{
    try
    {
        refreshFromInput(true);
    }
    catch (const JsonParseError &ex)
    {
        std::string msg = "Format failed\n" + ex.detail() + "\nLine: " + std::to_string(ex.line()) +
                          ", Column: " + std::to_string(ex.column());
        messageBox(msg.c_str(), mfError | mfOKButton);
    }
}

void FormatterWindow::runCompress()
{
    try
    {
        document.compress(input->text());
    }
    catch (const JsonParseError &ex)
    {
        std::string msg = "Compress failed\n" + ex.detail() + "\nLine: " + std::to_string(ex.line()) +
                          ", Column: " + std::to_string(ex.column());
        messageBox(msg.c_str(), mfError | mfOKButton);
        return;
    }
    rebuildOutline();
    refreshResult();
}

void FormatterWindow::openFile()
{
    const size_t maxLen = 1024;
    char name[maxLen];
    name[0] = '\0';
    if (TProgram::application->executeDialog(
            new TFileDialog("*.json", "Open JSON file", "~N~ame", fdOpenButton, 1), name) != cmCancel)
        loadFile(name);
}

void FormatterWindow::saveResult()
{
    if (!document.hasResult())
        return;
    const size_t maxLen = 1024;
    char name[maxLen];
    name[0] = '\0';
    if (TProgram::application->executeDialog(
            new TFileDialog("*.json", "Save result", "~N~ame", fdOKButton, 2), name) == cmCancel)
        return;
    try
    {
        if (!document.saveResult(name))
            messageBox("Nothing to save", mfInformation | mfOKButton);
    }
    catch (const FileError &ex)
    {
        spdlog::error("Failed to save result: {}", ex.what());
        messageBox((std::string("Save failed\n") + ex.what()).c_str(), mfError | mfOKButton);
    }
}

void FormatterWindow::copyResult()
{
    if (!document.hasResult())
        return;
    if (document.copyResult())
        messageBox(getClipboardStatusMessage().c_str(), mfInformation | mfOKButton);
    else if (osc52Likely())
        messageBox("Could not send the result to the terminal clipboard", mfError | mfOKButton);
    else
        messageBox(getClipboardStatusMessage().c_str(), mfWarning | mfOKButton);
}

void FormatterWindow::startSearch()
{
    searchLabel->show();
    searchLine->show();
    searchLine->select();
    document.setSearchPattern(searchLine->pattern());
    showCurrentMatch();
    updateStatusBar(document.search());
}

void FormatterWindow::endSearch()
{
    document.endSearch();
    searchLine->clearPattern();
    searchLabel->hide();
    searchLine->hide();
    resultView->select();
    resultView->drawView();
    updateStatusBar(document.search());
}

void FormatterWindow::applyTreeLayout()
{
    outline->syncExpansion();
}

void FormatterWindow::handleEvent(TEvent &event)
{
    TWindow::handleEvent(event);
    if (event.what == evBroadcast)
    {
        switch (event.message.command)
        {
        case cmInputChanged:
            if (event.message.infoPtr != input)
                return;
            refreshFromInput(false);
            break;
        case cmNodeSelected:
            document.selectNode(static_cast<JsonTNode *>(event.message.infoPtr)->treeNode);
            refreshResult();
            break;
        case cmSearchChanged:
            if (event.message.infoPtr != searchLine)
                return;
            document.setSearchPattern(searchLine->pattern());
            showCurrentMatch();
            updateStatusBar(document.search());
            break;
        default:
            return;
        }
        clearEvent(event);
    }
    else if (event.what == evCommand)
    {
        switch (event.message.command)
        {
        case cmOpen:
            openFile();
            break;
        case cmSaveResult:
            saveResult();
            break;
        case cmFormat:
            runFormat();
            break;
        case cmCompress:
            runCompress();
            break;
        case cmCopyResult:
            copyResult();
            break;
        case cmFindText:
            startSearch();
            break;
        case cmFindNext:
        case cmFindPrev:
            if (event.message.command == cmFindNext)
                document.findNext();
            else
                document.findPrevious();
            showCurrentMatch();
            updateStatusBar(document.search());
            break;
        case cmEndSearch:
            endSearch();
            break;
        case cmExpandAll:
            if (document.tree())
                expandAll(document.tree());
            applyTreeLayout();
            break;
        case cmCollapseAll:
            if (document.tree())
                collapseAll(document.tree(), true);
            applyTreeLayout();
            break;
        case cmLevel1:
        case cmLevel2:
        case cmLevel3:
            if (document.tree())
                expandToLevel(document.tree(), event.message.command - cmLevel1 + 1, 0);
            applyTreeLayout();
            break;
        default:
            return;
        }
        clearEvent(event);
    }
}

class JsonFormatterApp : public TApplication
{
public:
    explicit JsonFormatterApp(const AppConfig &config);

    virtual void handleEvent(TEvent &event) override;
    static TMenuBar *initMenuBar(TRect r);
    static TStatusLine *initStatusLine(TRect r);

private:
    FormatterWindow *newWindow();

    WindowRegistry registry;
};

JsonFormatterApp::JsonFormatterApp(const AppConfig &config)
    : TProgInit(&JsonFormatterApp::initStatusLine, &JsonFormatterApp::initMenuBar, &TApplication::initDeskTop),
      TApplication()
{
    if (config.files.empty())
    {
        newWindow();
        return;
    }
    for (const std::string &name : config.files)
    {
        FormatterWindow *win = newWindow();
        if (win)
            win->loadFile(name);
    }
}

FormatterWindow *JsonFormatterApp::newWindow()
{
    int id = registry.create();
    TRect r = deskTop->getExtent();
    int offset = (id - 1) % 4;
    r.a.x += offset;
    r.a.y += offset;
    auto *win = new FormatterWindow(r, registry, id);
    deskTop->insert(win);
    return win;
}

void JsonFormatterApp::handleEvent(TEvent &event)
{
    TApplication::handleEvent(event);
    if (event.what == evCommand)
    {
        switch (event.message.command)
        {
        case cmNewWindow:
            newWindow();
            break;
        case cmAbout:
        {
            std::string msg = std::string("json-formatter-app ") + JSON_FORMATTER_VERSION +
                              "\nFormat, compress and browse JSON as a tree";
            messageBox(msg.c_str(), mfInformation | mfOKButton);
            break;
        }
        default:
            return;
        }
        clearEvent(event);
    }
}

TMenuBar *JsonFormatterApp::initMenuBar(TRect r)
{
    r.b.y = r.a.y + 1;
    return new TMenuBar(r,
                        *new TSubMenu("~F~ile", hcNoContext) +
                            *new TMenuItem("~N~ew window", cmNewWindow, kbCtrlN, hcNoContext, "Ctrl-N") +
                            *new TMenuItem("~O~pen", cmOpen, kbF2, hcNoContext, "F2") +
                            *new TMenuItem("~S~ave result", cmSaveResult, kbF4, hcNoContext, "F4") +
                            *new TMenuItem("~C~lose", cmClose, kbAltF3, hcNoContext, "Alt-F3") +
                            newLine() +
                            *new TMenuItem("E~x~it", cmQuit, kbAltX, hcNoContext, "Alt-X") +
                            *new TSubMenu("~E~dit", hcNoContext) +
                            *new TMenuItem("~F~ormat", cmFormat, kbF5, hcNoContext, "F5") +
                            *new TMenuItem("Co~m~press", cmCompress, kbF6, hcNoContext, "F6") +
                            *new TMenuItem("~C~opy result", cmCopyResult, kbAltC, hcNoContext, "Alt-C") +
                            *new TSubMenu("~S~earch", hcNoContext) +
                            *new TMenuItem("~F~ind", cmFindText, kbCtrlF, hcNoContext, "Ctrl-F") +
                            *new TMenuItem("Find ~N~ext", cmFindNext, kbF3, hcNoContext, "F3") +
                            *new TMenuItem("Find ~P~rev", cmFindPrev, kbShiftF3, hcNoContext, "Shift-F3") +
                            *new TMenuItem("~E~nd Search", cmEndSearch, kbNoKey, hcNoContext, "Esc") +
                            *new TSubMenu("~V~iew", hcNoContext) +
                            *new TMenuItem("~E~xpand all", cmExpandAll, kbNoKey, hcNoContext) +
                            *new TMenuItem("~C~ollapse all", cmCollapseAll, kbNoKey, hcNoContext) +
                            *new TMenuItem("Level ~1~", cmLevel1, kbNoKey, hcNoContext) +
                            *new TMenuItem("Level ~2~", cmLevel2, kbNoKey, hcNoContext) +
                            *new TMenuItem("Level ~3~", cmLevel3, kbNoKey, hcNoContext) +
                            *new TSubMenu("~H~elp", hcNoContext) +
                            *new TMenuItem("~A~bout", cmAbout, kbF1, hcNoContext, "F1"));
}

TStatusLine *JsonFormatterApp::initStatusLine(TRect r)
{
    r.a.y = r.b.y - 1;
    return new JsonStatusLine(r);
}

int main(int argc, char **argv)
{
    setlocale(LC_ALL, "");

    AppConfig config;
    try
    {
        config = parseCommandLine(argc, argv);
    }
    catch (const std::invalid_argument &ex)
    {
        std::cerr << argv[0] << ": " << ex.what() << "\n\n";
        showUsage(argv[0], true);
        return 2;
    }
    if (config.showHelp)
    {
        showUsage(argv[0], true);
        return 0;
    }
    if (config.showVersion)
    {
        std::cout << "json-formatter-app version " << JSON_FORMATTER_VERSION << "\n";
        return 0;
    }
    try
    {
        initLogging(config, true);
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Cannot set up logging: " << ex.what() << std::endl;
        return 1;
    }

    JsonFormatterApp app(config);
    app.run();
    app.shutDown();
    return 0;
}
