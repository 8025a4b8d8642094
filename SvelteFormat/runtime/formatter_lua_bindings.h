//
// formatter_lua_bindings.h
// SvelteFormat Runtime - Lua Formatter Plugins and Configuration
//
// Scripted formatters run in LuaJIT. A plugin file defines any of the
// global functions
//
//   format_script(code, lang)   -> string or nil
//   format_style(code, lang)    -> string or nil
//   format_expression(code)     -> string or nil
//
// where nil leaves the code to the formatter installed before the plugin.
// Scripts see a `sveltefmt` table with `version`, `dedent(text)` and
// `indent(text, prefix)`.
//
// Configuration files are Lua chunks too: they return a table of options
// (or set a global `options` table) keyed by the FormatterOptions names.
//

#ifndef FORMATTER_LUA_BINDINGS_H
#define FORMATTER_LUA_BINDINGS_H

#include "../src/svelteformat_embed.h"
#include "../src/svelteformat_options.h"
#include <lua.hpp>
#include <memory>
#include <stdexcept>
#include <string>

namespace SvelteFormat {

// =============================================================================
// Errors
// =============================================================================

// A Lua file failed to load, or a Lua function raised an error
class LuaError : public std::runtime_error {
public:
    explicit LuaError(const std::string& msg) : std::runtime_error(msg) {}
};

// A configuration value has the wrong type or an invalid value
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

// =============================================================================
// Lua Formatter Plugin
// =============================================================================

class LuaFormatterPlugin {
public:
    // Runs the file in a fresh Lua state; throws LuaError on failure
    explicit LuaFormatterPlugin(const std::string& filepath);
    ~LuaFormatterPlugin();

    LuaFormatterPlugin(const LuaFormatterPlugin&) = delete;
    LuaFormatterPlugin& operator=(const LuaFormatterPlugin&) = delete;

    // File name without directory and extension
    std::string getName() const;

    bool hasScriptFormatter() const { return hasGlobalFunction("format_script"); }
    bool hasStyleFormatter() const { return hasGlobalFunction("format_style"); }
    bool hasExpressionFormatter() const { return hasGlobalFunction("format_expression"); }

    // Call a formatter function. Returns false when the function is missing
    // or returned nil; throws LuaError when it raised an error or returned
    // anything but a string.
    bool callFormatter(const char* function, const std::string& code,
                       const std::string* lang, std::string& out);

private:
    bool hasGlobalFunction(const char* name) const;

    lua_State* m_L;
    std::string m_filePath;
};

// Script/style formatter backed by a plugin; defers to fallback on nil
class LuaEmbeddedFormatter : public EmbeddedFormatter {
public:
    LuaEmbeddedFormatter(std::shared_ptr<LuaFormatterPlugin> plugin,
                         std::shared_ptr<EmbeddedFormatter> fallback);

    std::string getName() const override;
    std::string format(const std::string& code, const EmbeddedRequest& request) override;

private:
    std::shared_ptr<LuaFormatterPlugin> m_plugin;
    std::shared_ptr<EmbeddedFormatter> m_fallback;
};

// Expression formatter backed by a plugin; defers to fallback on nil or error
class LuaExpressionFormatter : public ExpressionFormatter {
public:
    LuaExpressionFormatter(std::shared_ptr<LuaFormatterPlugin> plugin,
                           std::shared_ptr<ExpressionFormatter> fallback);

    std::string format(const std::string& code) override;

private:
    std::shared_ptr<LuaFormatterPlugin> m_plugin;
    std::shared_ptr<ExpressionFormatter> m_fallback;
};

// =============================================================================
// Registration and Configuration
// =============================================================================

// Register the `sveltefmt` helper table in a Lua state
void registerFormatterBindings(lua_State* L);

// Apply the options of a Lua configuration file on top of `options`.
// Unknown keys are reported as warnings; throws ConfigError for load
// failures and ill-typed values.
void loadOptionsFromLuaFile(const std::string& path, FormatterOptions& options);

} // namespace SvelteFormat

#endif // FORMATTER_LUA_BINDINGS_H
