//
// formatter_lua_bindings.cpp
// SvelteFormat Runtime - Lua Formatter Plugins and Configuration
//

#include "formatter_lua_bindings.h"
#include <iostream>

namespace SvelteFormat {

// Pop the error message a failed load/pcall left on the stack
static std::string popErrorMessage(lua_State* L) {
    const char* msg = lua_tostring(L, -1);
    std::string result = msg ? msg : "unknown Lua error";
    lua_pop(L, 1);
    return result;
}

// =============================================================================
// sveltefmt Helper Table
// =============================================================================

static int lua_sveltefmt_dedent(lua_State* L) {
    size_t len = 0;
    const char* text = luaL_checklstring(L, 1, &len);
    std::string result = dedentText(std::string(text, len));
    lua_pushlstring(L, result.data(), result.size());
    return 1;
}

static int lua_sveltefmt_indent(lua_State* L) {
    size_t len = 0;
    const char* text = luaL_checklstring(L, 1, &len);
    const char* prefix = luaL_optstring(L, 2, "  ");
    std::string result = indentText(std::string(text, len), prefix);
    lua_pushlstring(L, result.data(), result.size());
    return 1;
}

static const luaL_Reg sveltefmt_functions[] = {
    {"dedent", lua_sveltefmt_dedent},
    {"indent", lua_sveltefmt_indent},
    {nullptr, nullptr}
};

void registerFormatterBindings(lua_State* L) {
    luaL_register(L, "sveltefmt", sveltefmt_functions);
    lua_pushstring(L, SVELTEFORMAT_VERSION);
    lua_setfield(L, -2, "version");
    lua_pop(L, 1);
}

// =============================================================================
// LuaFormatterPlugin
// =============================================================================

LuaFormatterPlugin::LuaFormatterPlugin(const std::string& filepath)
    : m_L(nullptr)
    , m_filePath(filepath)
{
    m_L = luaL_newstate();
    if (!m_L) {
        throw LuaError("Cannot create Lua state");
    }

    luaL_openlibs(m_L);
    registerFormatterBindings(m_L);

    if (luaL_loadfile(m_L, filepath.c_str()) != 0 || lua_pcall(m_L, 0, 0, 0) != 0) {
        std::string msg = popErrorMessage(m_L);
        lua_close(m_L);
        m_L = nullptr;
        throw LuaError(msg);
    }
}

LuaFormatterPlugin::~LuaFormatterPlugin() {
    if (m_L) {
        lua_close(m_L);
    }
}

std::string LuaFormatterPlugin::getName() const {
    size_t slash = m_filePath.find_last_of("/\\");
    std::string name = slash == std::string::npos ? m_filePath : m_filePath.substr(slash + 1);
    size_t dot = name.rfind('.');
    if (dot != std::string::npos && dot > 0) {
        name = name.substr(0, dot);
    }
    return name;
}

bool LuaFormatterPlugin::hasGlobalFunction(const char* name) const {
    lua_getglobal(m_L, name);
    bool found = lua_isfunction(m_L, -1);
    lua_pop(m_L, 1);
    return found;
}

bool LuaFormatterPlugin::callFormatter(const char* function, const std::string& code,
                                       const std::string* lang, std::string& out) {
    lua_getglobal(m_L, function);
    if (!lua_isfunction(m_L, -1)) {
        lua_pop(m_L, 1);
        return false;
    }

    lua_pushlstring(m_L, code.data(), code.size());
    int nargs = 1;
    if (lang) {
        lua_pushlstring(m_L, lang->data(), lang->size());
        nargs++;
    }

    if (lua_pcall(m_L, nargs, 1, 0) != 0) {
        throw LuaError(getName() + ": " + function + ": " + popErrorMessage(m_L));
    }

    int type = lua_type(m_L, -1);
    if (type == LUA_TNIL) {
        lua_pop(m_L, 1);
        return false;
    }
    if (type != LUA_TSTRING) {
        lua_pop(m_L, 1);
        throw LuaError(getName() + ": " + function + " must return a string or nil");
    }

    size_t len = 0;
    const char* result = lua_tolstring(m_L, -1, &len);
    out.assign(result, len);
    lua_pop(m_L, 1);
    return true;
}

// =============================================================================
// Formatter Adapters
// =============================================================================

LuaEmbeddedFormatter::LuaEmbeddedFormatter(std::shared_ptr<LuaFormatterPlugin> plugin,
                                           std::shared_ptr<EmbeddedFormatter> fallback)
    : m_plugin(plugin)
    , m_fallback(fallback)
{
}

std::string LuaEmbeddedFormatter::getName() const {
    return "lua:" + m_plugin->getName();
}

std::string LuaEmbeddedFormatter::format(const std::string& code, const EmbeddedRequest& request) {
    const char* function = request.kind == EmbeddedKind::SCRIPT ? "format_script" : "format_style";

    std::string formatted;
    if (m_plugin->callFormatter(function, code, &request.lang, formatted)) {
        return formatted;
    }
    return m_fallback ? m_fallback->format(code, request) : code;
}

LuaExpressionFormatter::LuaExpressionFormatter(std::shared_ptr<LuaFormatterPlugin> plugin,
                                               std::shared_ptr<ExpressionFormatter> fallback)
    : m_plugin(plugin)
    , m_fallback(fallback)
{
}

std::string LuaExpressionFormatter::format(const std::string& code) {
    std::string formatted;
    try {
        if (m_plugin->callFormatter("format_expression", code, nullptr, formatted)) {
            return formatted;
        }
    } catch (const LuaError& e) {
        std::cerr << "Warning: " << e.what() << "; keeping expression unchanged" << std::endl;
    }
    return m_fallback ? m_fallback->format(code) : code;
}

// =============================================================================
// Configuration Files
// =============================================================================

namespace {

// Closes the configuration state on every exit path
class LuaStateGuard {
public:
    explicit LuaStateGuard(lua_State* L) : m_L(L) {}
    ~LuaStateGuard() { if (m_L) lua_close(m_L); }

    LuaStateGuard(const LuaStateGuard&) = delete;
    LuaStateGuard& operator=(const LuaStateGuard&) = delete;

private:
    lua_State* m_L;
};

int readIntegerOption(lua_State* L, const std::string& path, const std::string& key) {
    if (lua_type(L, -1) != LUA_TNUMBER) {
        throw ConfigError(path + ": option '" + key + "' must be a number");
    }
    lua_Number value = lua_tonumber(L, -1);
    int integer = static_cast<int>(value);
    if (static_cast<lua_Number>(integer) != value || integer <= 0) {
        throw ConfigError(path + ": option '" + key + "' must be a positive integer");
    }
    return integer;
}

bool readBooleanOption(lua_State* L, const std::string& path, const std::string& key) {
    if (lua_type(L, -1) != LUA_TBOOLEAN) {
        throw ConfigError(path + ": option '" + key + "' must be true or false");
    }
    return lua_toboolean(L, -1) != 0;
}

// Value of `key` is on top of the stack
void applyOption(lua_State* L, const std::string& path, const std::string& key,
                 FormatterOptions& options) {
    if (key == "print_width") {
        options.print_width = readIntegerOption(L, path, key);
    } else if (key == "tab_width") {
        options.tab_width = readIntegerOption(L, path, key);
    } else if (key == "use_tabs") {
        options.use_tabs = readBooleanOption(L, path, key);
    } else if (key == "sort_order") {
        if (lua_type(L, -1) != LUA_TSTRING) {
            throw ConfigError(path + ": option 'sort_order' must be a string");
        }
        try {
            options.sort_order = parseSortOrder(lua_tostring(L, -1));
        } catch (const std::invalid_argument& e) {
            throw ConfigError(path + ": " + e.what());
        }
    } else if (key == "strict_mode") {
        options.strict_mode = readBooleanOption(L, path, key);
    } else if (key == "bracket_new_line") {
        options.bracket_new_line = readBooleanOption(L, path, key);
    } else if (key == "allow_shorthand") {
        options.allow_shorthand = readBooleanOption(L, path, key);
    } else if (key == "indent_script_and_style") {
        options.indent_script_and_style = readBooleanOption(L, path, key);
    } else if (key == "verbose") {
        options.verbose = readBooleanOption(L, path, key);
    } else {
        std::cerr << "Warning: " << path << ": unknown option '" << key << "' ignored" << std::endl;
    }
}

} // namespace

void loadOptionsFromLuaFile(const std::string& path, FormatterOptions& options) {
    lua_State* L = luaL_newstate();
    if (!L) {
        throw ConfigError("Cannot create Lua state");
    }
    LuaStateGuard guard(L);

    luaL_openlibs(L);
    registerFormatterBindings(L);

    if (luaL_loadfile(L, path.c_str()) != 0 || lua_pcall(L, 0, 1, 0) != 0) {
        throw ConfigError(popErrorMessage(L));
    }

    if (!lua_istable(L, -1)) {
        lua_pop(L, 1);
        lua_getglobal(L, "options");
    }
    if (!lua_istable(L, -1)) {
        throw ConfigError(path + ": configuration must return a table or set a global 'options' table");
    }

    // Apply into a copy so a bad value leaves the caller's options untouched
    FormatterOptions loaded = options;

    lua_pushnil(L);
    while (lua_next(L, -2) != 0) {
        if (lua_type(L, -2) != LUA_TSTRING) {
            std::cerr << "Warning: " << path << ": non-string option key ignored" << std::endl;
        } else {
            applyOption(L, path, lua_tostring(L, -2), loaded);
        }
        lua_pop(L, 1);
    }

    options = loaded;
}

} // namespace SvelteFormat
