//
// svelte_formatter_lib.cpp
// SvelteFormat - Component Formatter Library Implementation
//
// preprocess (snip script/style bodies) -> parse -> print -> render
//

#include "svelte_formatter_lib.h"
#include "svelteformat_embed.h"
#include "svelteformat_parser.h"
#include "svelteformat_printer.h"
#include "svelteformat_renderer.h"
#include "svelteformat_snip.h"
#include <iostream>

namespace SvelteFormat {

std::string formatSvelteCodeOrThrow(const std::string& source_code,
                                    const FormatterOptions& options,
                                    const EmbeddedFormatterRegistry* registry) {
    EmbeddedFormatterRegistry builtins;
    builtins.setVerbose(options.verbose);
    const EmbeddedFormatterRegistry& formatters = registry ? *registry : builtins;

    if (options.verbose) {
        std::cerr << "Source size: " << source_code.length() << " bytes\n";
    }

    PreprocessedSource preprocessed = preprocessSource(source_code);
    const std::string& text = preprocessed.text;

    if (options.verbose) {
        std::cerr << "Parsing...\n";
    }

    Parser parser;
    std::unique_ptr<RootNode> root = parser.parse(text);
    if (!root) {
        if (parser.hasErrors()) {
            // Report against the source the caller passed in
            const ParseError& e = parser.getErrors().front();
            throw ParseError(e.what(), preprocessed.toOriginal(e.start), preprocessed.toOriginal(e.end));
        }
        throw ParseError("Parser produced no tree", 0, 0);
    }

    if (options.verbose) {
        std::cerr << "Printing...\n";
    }

    Printer printer(text, options, formatters);
    Doc doc = printer.print(*root);

    RenderOptions renderOptions;
    renderOptions.print_width = options.print_width;
    renderOptions.tab_width = options.tab_width;
    renderOptions.use_tabs = options.use_tabs;

    std::string formatted = renderDoc(doc, renderOptions);

    if (options.verbose) {
        std::cerr << "Formatted size: " << formatted.length() << " bytes\n";
    }
    return formatted;
}

FormatterResult formatSvelteCode(const std::string& source_code,
                                 const FormatterOptions& options,
                                 const EmbeddedFormatterRegistry* registry) {
    FormatterResult result;

    try {
        result.formatted_code = formatSvelteCodeOrThrow(source_code, options, registry);
        result.success = true;
    } catch (const ParseError& e) {
        result.error_message = e.toString(source_code);
        result.error_start = e.start;
        result.error_end = e.end;
    } catch (const EmbedError& e) {
        result.error_message = std::string("Embed Error: ") + e.what();
    } catch (const PrinterError& e) {
        result.error_message = std::string("Internal Error: ") + e.what();
    } catch (const std::exception& e) {
        result.error_message = std::string("Error: ") + e.what();
    }

    return result;
}

bool formatSvelteCodeInPlace(std::string& source_code,
                             const FormatterOptions& options,
                             const EmbeddedFormatterRegistry* registry) {
    FormatterResult result = formatSvelteCode(source_code, options, registry);
    if (result.success) {
        source_code = result.formatted_code;
    }
    return result.success;
}

FormatterResult formatStrict(const std::string& source_code) {
    return formatSvelteCode(source_code, FormatterOptions::Strict());
}

FormatterResult formatCompact(const std::string& source_code) {
    return formatSvelteCode(source_code, FormatterOptions::Compact());
}

bool isFormatted(const std::string& source_code,
                 const FormatterOptions& options,
                 const EmbeddedFormatterRegistry* registry) {
    FormatterResult result = formatSvelteCode(source_code, options, registry);
    return result.success && result.formatted_code == source_code;
}

} // namespace SvelteFormat
