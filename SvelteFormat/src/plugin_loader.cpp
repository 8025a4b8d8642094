//
// plugin_loader.cpp
// SvelteFormat - Plugin Loader Implementation
//
// =============================================================================
// NOTES FOR PLUGIN AUTHORS
// =============================================================================
//
// Each plugin file runs once, in its own Lua state, when it is loaded. It
// must define its formatters as GLOBAL functions:
//
//    Good:  function format_style(code, lang) ... end
//    Bad:   function M.format_style(code, lang) ... end
//
// A formatter returns the new text, or nil to hand the code to whatever was
// installed before the plugin (another plugin or the built-in formatter).
//
// Example:
//   function format_style(code, lang)
//       if lang ~= "" and lang ~= "css" then return nil end
//       return (code:gsub(";%s*", ";\n"))
//   end
//
// =============================================================================
//

#include "plugin_loader.h"
#include "../runtime/formatter_lua_bindings.h"
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <memory>

namespace SvelteFormat {

namespace fs = std::filesystem;

PluginLoader::PluginLoader()
    : m_verbose(false) {
}

// =============================================================================
// Loading Plugins
// =============================================================================

int PluginLoader::loadPluginsFromDirectory(const std::string& directory,
                                           EmbeddedFormatterRegistry& registry) {
    std::error_code ec;
    if (!fs::exists(directory, ec) || !fs::is_directory(directory, ec)) {
        std::cerr << "Warning: Plugin directory not found: " << directory << std::endl;
        return 0;
    }

    std::vector<std::string> pluginFiles = scanDirectoryForPlugins(directory);
    int loadedCount = 0;

    for (const auto& filepath : pluginFiles) {
        if (loadPlugin(filepath, registry)) {
            loadedCount++;
        }
    }

    if (m_verbose && loadedCount > 0) {
        std::cerr << "Loading plugins [";
        bool first = true;
        for (const auto& plugin : m_plugins) {
            if (!first) std::cerr << ", ";
            std::cerr << plugin.name << " (" << plugin.functions.size() << ")";
            first = false;
        }
        std::cerr << "]" << std::endl;
    }

    return loadedCount;
}

bool PluginLoader::loadPlugin(const std::string& filepath, EmbeddedFormatterRegistry& registry) {
    PluginInfo info;
    info.filePath = filepath;
    info.fileName = fs::path(filepath).filename().string();
    info.name = fs::path(filepath).stem().string();

    std::shared_ptr<LuaFormatterPlugin> plugin;
    try {
        plugin = std::make_shared<LuaFormatterPlugin>(filepath);
    } catch (const LuaError& e) {
        info.loadError = e.what();
        addFailedPlugin(info);
        return false;
    }

    bool script = plugin->hasScriptFormatter();
    bool style = plugin->hasStyleFormatter();
    bool expression = plugin->hasExpressionFormatter();
    if (!script && !style && !expression) {
        info.loadError = "Defines none of format_script, format_style or format_expression";
        addFailedPlugin(info);
        return false;
    }

    if (script) {
        registry.setFormatter(EmbeddedKind::SCRIPT,
                              std::make_shared<LuaEmbeddedFormatter>(
                                  plugin, registry.getFormatter(EmbeddedKind::SCRIPT)));
        info.functions.push_back("format_script");
    }
    if (style) {
        registry.setFormatter(EmbeddedKind::STYLE,
                              std::make_shared<LuaEmbeddedFormatter>(
                                  plugin, registry.getFormatter(EmbeddedKind::STYLE)));
        info.functions.push_back("format_style");
    }
    if (expression) {
        registry.setExpressionFormatter(std::make_shared<LuaExpressionFormatter>(
            plugin, registry.getExpressionFormatter()));
        info.functions.push_back("format_expression");
    }

    info.loadedSuccessfully = true;
    m_plugins.push_back(info);
    return true;
}

// =============================================================================
// Internal Helper Methods
// =============================================================================

std::vector<std::string> PluginLoader::scanDirectoryForPlugins(const std::string& directory) const {
    std::vector<std::string> files;
    std::error_code ec;

    for (const auto& entry : fs::directory_iterator(directory, ec)) {
        if (entry.is_regular_file(ec) && isPluginFile(entry.path().filename().string())) {
            files.push_back(entry.path().string());
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

bool PluginLoader::isPluginFile(const std::string& filename) const {
    const std::string ext = ".lua";
    return filename.size() > ext.size() &&
           filename.compare(filename.size() - ext.size(), ext.size(), ext) == 0;
}

void PluginLoader::addFailedPlugin(const PluginInfo& info) {
    std::cerr << "Warning: Failed to load plugin " << info.fileName << ": "
              << info.loadError << std::endl;
    m_failedPlugins.push_back(info);
}

} // namespace SvelteFormat
