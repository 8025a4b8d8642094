//
// svelteformat_embed.cpp
// SvelteFormat - Embedded Code Formatters Implementation
//

#include "svelteformat_embed.h"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>

namespace SvelteFormat {

const char* embeddedKindToString(EmbeddedKind kind) {
    switch (kind) {
        case EmbeddedKind::SCRIPT: return "script";
        case EmbeddedKind::STYLE: return "style";
    }
    return "unknown";
}

// =============================================================================
// Text Helpers
// =============================================================================

static std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::string current;
    for (char c : text) {
        if (c == '\n') {
            lines.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    lines.push_back(current);
    return lines;
}

static std::string joinLines(const std::vector<std::string>& lines) {
    std::string out;
    for (size_t i = 0; i < lines.size(); i++) {
        if (i > 0) {
            out += '\n';
        }
        out += lines[i];
    }
    return out;
}

static bool isBlankLine(const std::string& line) {
    return line.find_first_not_of(" \t\r\f\v") == std::string::npos;
}

static std::string rightTrim(const std::string& line) {
    size_t end = line.find_last_not_of(" \t\r\f\v");
    return end == std::string::npos ? "" : line.substr(0, end + 1);
}

std::string dedentText(const std::string& text) {
    std::vector<std::string> lines = splitLines(text);

    // Longest whitespace prefix shared by all non-blank lines
    bool first = true;
    std::string common;
    for (const auto& line : lines) {
        if (isBlankLine(line)) {
            continue;
        }
        size_t indentEnd = line.find_first_not_of(" \t");
        std::string indent = line.substr(0, indentEnd);
        if (first) {
            common = indent;
            first = false;
            continue;
        }
        size_t shared = 0;
        while (shared < common.size() && shared < indent.size() && common[shared] == indent[shared]) {
            shared++;
        }
        common.resize(shared);
    }

    for (auto& line : lines) {
        if (isBlankLine(line)) {
            line.clear();
        } else {
            line.erase(0, common.size());
        }
    }
    return joinLines(lines);
}

std::string indentText(const std::string& text, const std::string& prefix) {
    std::vector<std::string> lines = splitLines(text);
    for (auto& line : lines) {
        if (!line.empty()) {
            line = prefix + line;
        }
    }
    return joinLines(lines);
}

// =============================================================================
// Built-in Formatters
// =============================================================================

std::string DefaultExpressionFormatter::format(const std::string& code) {
    size_t first = code.find_first_not_of(" \t\n\r\f\v");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = code.find_last_not_of(" \t\n\r\f\v");
    return code.substr(first, last - first + 1);
}

std::string IndentNormalizingFormatter::format(const std::string& code, const EmbeddedRequest& request) {
    (void)request;

    std::vector<std::string> lines = splitLines(code);
    for (auto& line : lines) {
        line = rightTrim(line);
    }

    size_t begin = 0;
    while (begin < lines.size() && lines[begin].empty()) {
        begin++;
    }
    size_t end = lines.size();
    while (end > begin && lines[end - 1].empty()) {
        end--;
    }

    std::vector<std::string> kept(lines.begin() + begin, lines.begin() + end);
    return dedentText(joinLines(kept));
}

// =============================================================================
// Languages
// =============================================================================

std::string declaredLanguage(const std::vector<NodePtr>& attributes) {
    const std::string* value = findAttributeText(attributes, "lang");
    if (!value) {
        value = findAttributeText(attributes, "type");
    }
    if (!value) {
        return "";
    }

    std::string lang = *value;
    if (lang.compare(0, 5, "text/") == 0) {
        lang = lang.substr(5);
    } else if (lang.compare(0, 12, "application/") == 0) {
        lang = lang.substr(12);
    }
    if (lang == "module") {
        lang = "javascript";
    }
    return lang;
}

bool isSupportedLanguage(EmbeddedKind kind, const std::string& lang) {
    if (lang.empty()) {
        return true;
    }
    switch (kind) {
        case EmbeddedKind::SCRIPT:
            return lang == "js" || lang == "javascript" || lang == "ts" ||
                   lang == "typescript" || lang == "babel";
        case EmbeddedKind::STYLE:
            return lang == "css" || lang == "scss" || lang == "less" || lang == "postcss";
    }
    return false;
}

bool isSupportedTemplateLanguage(const std::string& lang) {
    return lang.empty() || lang == "html" || lang == "svelte";
}

// =============================================================================
// Registry
// =============================================================================

EmbeddedFormatterRegistry::EmbeddedFormatterRegistry()
    : m_scriptFormatter(std::make_shared<IndentNormalizingFormatter>())
    , m_styleFormatter(std::make_shared<IndentNormalizingFormatter>())
    , m_expressionFormatter(std::make_shared<DefaultExpressionFormatter>())
    , m_verbose(false)
{
}

void EmbeddedFormatterRegistry::setFormatter(EmbeddedKind kind, std::shared_ptr<EmbeddedFormatter> formatter) {
    if (kind == EmbeddedKind::SCRIPT) {
        m_scriptFormatter = std::move(formatter);
    } else {
        m_styleFormatter = std::move(formatter);
    }
}

std::shared_ptr<EmbeddedFormatter> EmbeddedFormatterRegistry::getFormatter(EmbeddedKind kind) const {
    return kind == EmbeddedKind::SCRIPT ? m_scriptFormatter : m_styleFormatter;
}

void EmbeddedFormatterRegistry::setExpressionFormatter(std::shared_ptr<ExpressionFormatter> formatter) {
    m_expressionFormatter = std::move(formatter);
}

std::shared_ptr<ExpressionFormatter> EmbeddedFormatterRegistry::getExpressionFormatter() const {
    return m_expressionFormatter;
}

std::string EmbeddedFormatterRegistry::formatExpression(const std::string& code) const {
    return m_expressionFormatter->format(code);
}

static bool containsCaseInsensitive(const std::string& haystack, const std::string& needle) {
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                          [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) ==
                                     std::tolower(static_cast<unsigned char>(b));
                          });
    return it != haystack.end();
}

EmbeddedResult EmbeddedFormatterRegistry::format(const std::string& code, const EmbeddedRequest& request) const {
    EmbeddedResult result;
    result.text = code;

    const char* kindName = embeddedKindToString(request.kind);

    if (!isSupportedLanguage(request.kind, request.lang)) {
        if (m_verbose) {
            std::cerr << "Keeping <" << kindName << " lang=\"" << request.lang
                      << "\"> verbatim (unsupported language)" << std::endl;
        }
        return result;
    }

    const std::shared_ptr<EmbeddedFormatter>& formatter =
        request.kind == EmbeddedKind::SCRIPT ? m_scriptFormatter : m_styleFormatter;

    std::string formatted;
    try {
        formatted = formatter->format(code, request);
    } catch (const std::exception& e) {
        std::cerr << "Warning: " << formatter->getName() << " failed on <" << kindName
                  << ">: " << e.what() << "; keeping original text" << std::endl;
        return result;
    }

    std::string endTag = std::string("</") + kindName;
    if (containsCaseInsensitive(formatted, endTag)) {
        throw EmbedError(formatter->getName() + " produced '" + endTag +
                         "' inside a <" + kindName + "> block");
    }

    if (m_verbose) {
        std::cerr << "Formatted <" << kindName << "> with " << formatter->getName() << std::endl;
    }

    result.formatted = true;
    result.text = formatted;
    return result;
}

} // namespace SvelteFormat
