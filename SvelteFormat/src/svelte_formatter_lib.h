//
// svelte_formatter_lib.h
// SvelteFormat - Component Formatter Library Interface
//
// Library interface for pretty-printing component markup. This can be used
// by editors, IDEs, and other tools.
//

#ifndef SVELTE_FORMATTER_LIB_H
#define SVELTE_FORMATTER_LIB_H

#include "svelteformat_options.h"
#include <string>

namespace SvelteFormat {

class EmbeddedFormatterRegistry;

// =============================================================================
// Formatter Result
// =============================================================================

struct FormatterResult {
    bool success;                  // True if formatting succeeded
    std::string formatted_code;    // The formatted component
    std::string error_message;     // Error message if failed
    size_t error_start;            // Byte range of a parse error in the
    size_t error_end;              // preprocessed text (0, 0 otherwise)

    FormatterResult()
        : success(false)
        , error_start(0)
        , error_end(0)
    {}
};

// =============================================================================
// Main Formatter Functions
// =============================================================================

/// Format component source. Never throws.
/// @param source_code The component source to format
/// @param options Layout options
/// @param registry Optional embedded/expression formatters (plugins); the
///        built-in formatters are used when null
/// @return FormatterResult with formatted code or error
FormatterResult formatSvelteCode(const std::string& source_code,
                                 const FormatterOptions& options = FormatterOptions(),
                                 const EmbeddedFormatterRegistry* registry = nullptr);

/// Format component source, propagating ParseError, EmbedError,
/// PrinterError and any plugin error to the caller
std::string formatSvelteCodeOrThrow(const std::string& source_code,
                                    const FormatterOptions& options = FormatterOptions(),
                                    const EmbeddedFormatterRegistry* registry = nullptr);

/// Format component source in-place (convenience function)
/// @return True if successful, false otherwise (source left untouched)
bool formatSvelteCodeInPlace(std::string& source_code,
                             const FormatterOptions& options = FormatterOptions(),
                             const EmbeddedFormatterRegistry* registry = nullptr);

/// Quick format with preset (convenience functions)
FormatterResult formatStrict(const std::string& source_code);
FormatterResult formatCompact(const std::string& source_code);

// =============================================================================
// Validation Functions
// =============================================================================

/// True if formatting would leave the source unchanged. Sources that fail
/// to format are reported as not formatted.
bool isFormatted(const std::string& source_code,
                 const FormatterOptions& options = FormatterOptions(),
                 const EmbeddedFormatterRegistry* registry = nullptr);

} // namespace SvelteFormat

#endif // SVELTE_FORMATTER_LIB_H
