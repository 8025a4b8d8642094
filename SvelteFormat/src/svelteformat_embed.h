//
// svelteformat_embed.h
// SvelteFormat - Embedded Code Formatters
//
// Seams for the formatters of the sublanguages embedded in component
// markup: script and style bodies, and the expressions inside tags.
// The registry owns the formatter chosen for each container kind and
// applies the language allow-list and the failure policy.
//

#ifndef SVELTEFORMAT_EMBED_H
#define SVELTEFORMAT_EMBED_H

#include "svelteformat_ast.h"
#include <string>
#include <memory>
#include <stdexcept>

namespace SvelteFormat {

// =============================================================================
// Requests and Errors
// =============================================================================

enum class EmbeddedKind {
    SCRIPT,
    STYLE
};

const char* embeddedKindToString(EmbeddedKind kind);

struct EmbeddedRequest {
    EmbeddedKind kind;
    std::string lang;       // normalised language, empty if undeclared

    EmbeddedRequest(EmbeddedKind k, const std::string& l = "")
        : kind(k), lang(l) {}
};

// Formatted output that cannot be embedded back without breaking the markup
class EmbedError : public std::runtime_error {
public:
    explicit EmbedError(const std::string& msg) : std::runtime_error(msg) {}
};

// =============================================================================
// Expression Formatter
// =============================================================================

class ExpressionFormatter {
public:
    virtual ~ExpressionFormatter() = default;

    // Format the source text of one expression
    virtual std::string format(const std::string& code) = 0;
};

// Trims surrounding whitespace and otherwise keeps the expression as written
class DefaultExpressionFormatter : public ExpressionFormatter {
public:
    std::string format(const std::string& code) override;
};

// =============================================================================
// Embedded Formatter
// =============================================================================

class EmbeddedFormatter {
public:
    virtual ~EmbeddedFormatter() = default;

    virtual std::string getName() const = 0;

    // Format a script or style body. May throw; the registry turns a
    // failure into verbatim passthrough.
    virtual std::string format(const std::string& code, const EmbeddedRequest& request) = 0;
};

// Built-in formatter: drops blank lines at both ends, removes the
// indentation common to all lines and strips trailing whitespace
class IndentNormalizingFormatter : public EmbeddedFormatter {
public:
    std::string getName() const override { return "indent-normalizer"; }
    std::string format(const std::string& code, const EmbeddedRequest& request) override;
};

// Remove the indentation shared by every non-blank line
std::string dedentText(const std::string& text);

// Prefix every non-blank line with prefix
std::string indentText(const std::string& text, const std::string& prefix);

// =============================================================================
// Languages
// =============================================================================

// Language declared by a lang or type attribute, with any "text/" or
// "application/" prefix removed; "module" maps to "javascript"
std::string declaredLanguage(const std::vector<NodePtr>& attributes);

// Allow-lists: script (js, javascript, ts, typescript, babel), style (css,
// scss, less, postcss); an empty language is always supported
bool isSupportedLanguage(EmbeddedKind kind, const std::string& lang);

// <template lang=...>: html and svelte only
bool isSupportedTemplateLanguage(const std::string& lang);

// =============================================================================
// Registry
// =============================================================================

struct EmbeddedResult {
    bool formatted;        // false: reproduce the region verbatim
    std::string text;

    EmbeddedResult() : formatted(false) {}
};

class EmbeddedFormatterRegistry {
public:
    // Installs IndentNormalizingFormatter for both kinds and the default
    // expression formatter
    EmbeddedFormatterRegistry();

    void setFormatter(EmbeddedKind kind, std::shared_ptr<EmbeddedFormatter> formatter);
    std::shared_ptr<EmbeddedFormatter> getFormatter(EmbeddedKind kind) const;

    void setExpressionFormatter(std::shared_ptr<ExpressionFormatter> formatter);
    std::shared_ptr<ExpressionFormatter> getExpressionFormatter() const;

    // Format an expression
    std::string formatExpression(const std::string& code) const;

    // Format a body under the allow-list and failure policy. Unsupported
    // languages and formatter exceptions give formatted == false; output
    // containing the container's own end tag throws EmbedError.
    EmbeddedResult format(const std::string& code, const EmbeddedRequest& request) const;

    void setVerbose(bool verbose) { m_verbose = verbose; }

private:
    std::shared_ptr<EmbeddedFormatter> m_scriptFormatter;
    std::shared_ptr<EmbeddedFormatter> m_styleFormatter;
    std::shared_ptr<ExpressionFormatter> m_expressionFormatter;
    bool m_verbose;
};

} // namespace SvelteFormat

#endif // SVELTEFORMAT_EMBED_H
