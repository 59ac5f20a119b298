#pragma once

#include <string>
#include <vector>
#include <optional>
#include <gumbo.h>

namespace site_mirror::crawler {

// Half-open byte range [begin, end) of the original HTML source.
struct SourceSpan {
    size_t begin = 0;
    size_t end = 0;
};

// Parsed view of one HTML page. Gumbo keeps pointers into the source
// buffer, which lets callers locate tags, attribute values and text in the
// original bytes and edit the page without re-serializing the tree.
class HtmlDocument {
public:
    explicit HtmlDocument(std::string html);
    ~HtmlDocument();

    HtmlDocument(const HtmlDocument&) = delete;
    HtmlDocument& operator=(const HtmlDocument&) = delete;

    const std::string& source() const { return html; }

    const GumboNode* root() const;

    // Elements written in the source, in document order. Elements the parser
    // synthesized (implied <html>, <tbody>, adoption-agency clones) are
    // skipped, their children are not.
    std::vector<const GumboNode*> elements() const;

    std::vector<const GumboNode*> elementsByTag(GumboTag tag) const;

    // Start tag through end tag (or through the start tag for void elements)
    std::optional<SourceSpan> elementSpan(const GumboNode* node) const;

    // Attribute value as written, including quotes
    std::optional<SourceSpan> attributeValueSpan(const GumboAttribute* attribute) const;

    // Raw text of a text node, e.g. the contents of a <style> block
    std::optional<SourceSpan> textSpan(const GumboNode* node) const;

    // Offset just past the '>' of the start tag
    std::optional<size_t> startTagEnd(const GumboNode* node) const;

    // Offset of the explicit end tag, if the source has one
    std::optional<size_t> endTagBegin(const GumboNode* node) const;

    // Text of the first <title>, whitespace collapsed
    std::optional<std::string> title() const;

    static const GumboAttribute* findAttribute(const GumboNode* node, const char* name);
    static std::optional<std::string> attribute(const GumboNode* node, const char* name);

    // Lower-case tag name, also for tags gumbo does not know
    static std::string tagName(const GumboNode* node);

    static std::vector<std::string> classList(const GumboNode* node);

    // Text content without <script>/<style>, whitespace collapsed and trimmed
    static std::string visibleText(const GumboNode* node);

private:
    bool inSource(const char* data) const;
    size_t offsetOf(const char* data) const;
    void collectElements(const GumboNode* node, std::vector<const GumboNode*>& out) const;

    std::string html;
    GumboOutput* output;
};

// Collects replacements against a source buffer and applies them in one pass.
// An edit that starts inside a range already replaced is dropped, so
// removing an element also discards edits to its descendants.
class HtmlEditor {
public:
    explicit HtmlEditor(const std::string& source);

    void replace(const SourceSpan& span, std::string replacement);
    void remove(const SourceSpan& span);
    void insert(size_t offset, std::string text);

    // Replaces a quoted or unquoted attribute value with a double-quoted one
    void setAttributeValue(const SourceSpan& valueSpan, const std::string& value);

    size_t editCount() const { return edits.size(); }

    std::string apply() const;

    static std::string escapeAttribute(const std::string& value);

private:
    struct Edit {
        SourceSpan span;
        std::string replacement;
    };

    const std::string& source;
    std::vector<Edit> edits;
};

} // namespace site_mirror::crawler
