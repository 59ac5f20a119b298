#include "HtmlDocument.h"
#include "../../include/Logger.h"
#include <algorithm>
#include <cctype>

namespace site_mirror::crawler {

namespace {

bool isVoidTag(GumboTag tag) {
    switch (tag) {
        case GUMBO_TAG_AREA:
        case GUMBO_TAG_BASE:
        case GUMBO_TAG_BR:
        case GUMBO_TAG_COL:
        case GUMBO_TAG_EMBED:
        case GUMBO_TAG_HR:
        case GUMBO_TAG_IMG:
        case GUMBO_TAG_INPUT:
        case GUMBO_TAG_LINK:
        case GUMBO_TAG_META:
        case GUMBO_TAG_PARAM:
        case GUMBO_TAG_SOURCE:
        case GUMBO_TAG_TRACK:
        case GUMBO_TAG_WBR:
            return true;
        default:
            return false;
    }
}

bool isElementLike(const GumboNode* node) {
    return node->type == GUMBO_NODE_ELEMENT || node->type == GUMBO_NODE_TEMPLATE;
}

void appendText(const GumboNode* node, std::string& text) {
    if (node->type == GUMBO_NODE_TEXT || node->type == GUMBO_NODE_WHITESPACE ||
        node->type == GUMBO_NODE_CDATA) {
        text += node->v.text.text;
        text += ' ';
    } else if (isElementLike(node)) {
        if (node->v.element.tag == GUMBO_TAG_SCRIPT || node->v.element.tag == GUMBO_TAG_STYLE) {
            return;
        }
        for (unsigned int i = 0; i < node->v.element.children.length; ++i) {
            appendText(static_cast<const GumboNode*>(node->v.element.children.data[i]), text);
        }
    }
}

std::string collapseWhitespace(const std::string& text) {
    std::string result;
    bool pendingSpace = false;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pendingSpace = !result.empty();
            continue;
        }
        if (pendingSpace) {
            result += ' ';
            pendingSpace = false;
        }
        result += c;
    }
    return result;
}

} // namespace

HtmlDocument::HtmlDocument(std::string source)
    : html(std::move(source))
    , output(gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size())) {
    if (!output) {
        LOG_ERROR("Failed to parse HTML with Gumbo (" + std::to_string(html.size()) + " bytes)");
    }
}

HtmlDocument::~HtmlDocument() {
    if (output) {
        gumbo_destroy_output(&kGumboDefaultOptions, output);
    }
}

const GumboNode* HtmlDocument::root() const {
    return output ? output->root : nullptr;
}

bool HtmlDocument::inSource(const char* data) const {
    return data != nullptr && data >= html.data() && data <= html.data() + html.size();
}

size_t HtmlDocument::offsetOf(const char* data) const {
    return static_cast<size_t>(data - html.data());
}

void HtmlDocument::collectElements(const GumboNode* node, std::vector<const GumboNode*>& out) const {
    if (!isElementLike(node)) {
        return;
    }
    const GumboElement& element = node->v.element;
    bool synthesized = (node->parse_flags & GUMBO_INSERTION_BY_PARSER) != 0 ||
                       element.original_tag.length == 0 || !inSource(element.original_tag.data);
    if (!synthesized) {
        out.push_back(node);
    }
    for (unsigned int i = 0; i < element.children.length; ++i) {
        collectElements(static_cast<const GumboNode*>(element.children.data[i]), out);
    }
}

std::vector<const GumboNode*> HtmlDocument::elements() const {
    std::vector<const GumboNode*> result;
    if (output) {
        collectElements(output->root, result);
    }
    return result;
}

std::vector<const GumboNode*> HtmlDocument::elementsByTag(GumboTag tag) const {
    std::vector<const GumboNode*> result;
    for (const GumboNode* node : elements()) {
        if (node->v.element.tag == tag) {
            result.push_back(node);
        }
    }
    return result;
}

std::optional<SourceSpan> HtmlDocument::elementSpan(const GumboNode* node) const {
    if (!node || !isElementLike(node)) {
        return std::nullopt;
    }
    const GumboElement& element = node->v.element;
    if (element.original_tag.length == 0 || !inSource(element.original_tag.data)) {
        return std::nullopt;
    }

    SourceSpan span;
    span.begin = offsetOf(element.original_tag.data);
    size_t tagEnd = span.begin + element.original_tag.length;

    if (element.original_end_tag.length > 0 && inSource(element.original_end_tag.data)) {
        span.end = offsetOf(element.original_end_tag.data) + element.original_end_tag.length;
    } else if (isVoidTag(element.tag)) {
        span.end = tagEnd;
    } else {
        // Implicitly closed: the element runs up to the token that closed it
        span.end = element.end_pos.offset;
    }

    if (span.end < tagEnd || span.end > html.size()) {
        span.end = tagEnd;
    }
    return span;
}

std::optional<SourceSpan> HtmlDocument::attributeValueSpan(const GumboAttribute* attribute) const {
    if (!attribute || attribute->original_value.length == 0 || !inSource(attribute->original_value.data)) {
        return std::nullopt;
    }
    size_t begin = offsetOf(attribute->original_value.data);
    return SourceSpan{begin, begin + attribute->original_value.length};
}

std::optional<SourceSpan> HtmlDocument::textSpan(const GumboNode* node) const {
    if (!node || (node->type != GUMBO_NODE_TEXT && node->type != GUMBO_NODE_WHITESPACE &&
                  node->type != GUMBO_NODE_CDATA)) {
        return std::nullopt;
    }
    const GumboStringPiece& original = node->v.text.original_text;
    if (original.length == 0 || !inSource(original.data)) {
        return std::nullopt;
    }
    size_t begin = offsetOf(original.data);
    return SourceSpan{begin, begin + original.length};
}

std::optional<size_t> HtmlDocument::startTagEnd(const GumboNode* node) const {
    if (!node || !isElementLike(node)) {
        return std::nullopt;
    }
    const GumboStringPiece& tag = node->v.element.original_tag;
    if (tag.length == 0 || !inSource(tag.data)) {
        return std::nullopt;
    }
    return offsetOf(tag.data) + tag.length;
}

std::optional<size_t> HtmlDocument::endTagBegin(const GumboNode* node) const {
    if (!node || !isElementLike(node)) {
        return std::nullopt;
    }
    const GumboStringPiece& tag = node->v.element.original_end_tag;
    if (tag.length == 0 || !inSource(tag.data)) {
        return std::nullopt;
    }
    return offsetOf(tag.data);
}

std::optional<std::string> HtmlDocument::title() const {
    for (const GumboNode* node : elementsByTag(GUMBO_TAG_TITLE)) {
        std::string text;
        for (unsigned int i = 0; i < node->v.element.children.length; ++i) {
            const GumboNode* child = static_cast<const GumboNode*>(node->v.element.children.data[i]);
            if (child->type == GUMBO_NODE_TEXT || child->type == GUMBO_NODE_WHITESPACE) {
                text += child->v.text.text;
            }
        }
        text = collapseWhitespace(text);
        if (!text.empty()) {
            return text;
        }
    }
    return std::nullopt;
}

const GumboAttribute* HtmlDocument::findAttribute(const GumboNode* node, const char* name) {
    if (!node || !isElementLike(node)) {
        return nullptr;
    }
    return gumbo_get_attribute(&node->v.element.attributes, name);
}

std::optional<std::string> HtmlDocument::attribute(const GumboNode* node, const char* name) {
    const GumboAttribute* attr = findAttribute(node, name);
    if (!attr) {
        return std::nullopt;
    }
    return std::string(attr->value);
}

std::string HtmlDocument::tagName(const GumboNode* node) {
    if (!node || !isElementLike(node)) {
        return "";
    }
    const GumboElement& element = node->v.element;
    if (element.tag != GUMBO_TAG_UNKNOWN) {
        return gumbo_normalized_tagname(element.tag);
    }

    std::string name;
    const GumboStringPiece& original = element.original_tag;
    for (size_t i = 1; i < original.length; ++i) {
        unsigned char c = static_cast<unsigned char>(original.data[i]);
        if (!std::isalnum(c) && c != '-' && c != '_' && c != ':') {
            break;
        }
        name += static_cast<char>(std::tolower(c));
    }
    return name;
}

std::vector<std::string> HtmlDocument::classList(const GumboNode* node) {
    std::vector<std::string> classes;
    auto value = attribute(node, "class");
    if (!value) {
        return classes;
    }
    std::string current;
    for (char c : *value) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!current.empty()) {
                classes.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        classes.push_back(current);
    }
    return classes;
}

std::string HtmlDocument::visibleText(const GumboNode* node) {
    std::string text;
    if (node) {
        appendText(node, text);
    }
    return collapseWhitespace(text);
}

HtmlEditor::HtmlEditor(const std::string& source)
    : source(source) {
}

void HtmlEditor::replace(const SourceSpan& span, std::string replacement) {
    if (span.begin > span.end || span.end > source.size()) {
        LOG_WARNING("Ignoring HTML edit outside of the document");
        return;
    }
    edits.push_back(Edit{span, std::move(replacement)});
}

void HtmlEditor::remove(const SourceSpan& span) {
    replace(span, "");
}

void HtmlEditor::insert(size_t offset, std::string text) {
    replace(SourceSpan{offset, offset}, std::move(text));
}

void HtmlEditor::setAttributeValue(const SourceSpan& valueSpan, const std::string& value) {
    replace(valueSpan, "\"" + escapeAttribute(value) + "\"");
}

std::string HtmlEditor::apply() const {
    std::vector<Edit> ordered = edits;
    // Insertions first at equal offsets, then the widest range
    std::stable_sort(ordered.begin(), ordered.end(), [](const Edit& a, const Edit& b) {
        if (a.span.begin != b.span.begin) {
            return a.span.begin < b.span.begin;
        }
        size_t widthA = a.span.end - a.span.begin;
        size_t widthB = b.span.end - b.span.begin;
        if ((widthA == 0) != (widthB == 0)) {
            return widthA == 0;
        }
        return widthA > widthB;
    });

    std::string result;
    result.reserve(source.size());
    size_t cursor = 0;
    size_t skipped = 0;
    for (const auto& edit : ordered) {
        if (edit.span.begin < cursor) {
            skipped++;
            continue;
        }
        result.append(source, cursor, edit.span.begin - cursor);
        result += edit.replacement;
        cursor = edit.span.end;
    }
    result.append(source, cursor, std::string::npos);

    if (skipped > 0) {
        LOG_DEBUG("Dropped " + std::to_string(skipped) + " HTML edits nested in replaced ranges");
    }
    return result;
}

std::string HtmlEditor::escapeAttribute(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '&': escaped += "&amp;"; break;
            case '"': escaped += "&quot;"; break;
            default: escaped += c; break;
        }
    }
    return escaped;
}

} // namespace site_mirror::crawler
