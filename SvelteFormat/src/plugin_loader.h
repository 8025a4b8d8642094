//
// plugin_loader.h
// SvelteFormat - Plugin Loader for Scripted Formatters
//
// Loads Lua formatter plugins from files or a plugin directory and installs
// their formatters into a registry. Each plugin wraps the formatter that was
// installed before it, so plugins loaded later take precedence and defer to
// earlier ones by returning nil.
//

#ifndef SVELTEFORMAT_PLUGIN_LOADER_H
#define SVELTEFORMAT_PLUGIN_LOADER_H

#include "svelteformat_embed.h"
#include <string>
#include <vector>

namespace SvelteFormat {

// =============================================================================
// Plugin Information Structure
// =============================================================================

struct PluginInfo {
    std::string name;                    // File name without extension
    std::string filePath;                // Full path to plugin file
    std::string fileName;                // Just the filename
    std::vector<std::string> functions;  // Formatter functions the plugin defines
    bool loadedSuccessfully;             // True if the file ran and was registered
    std::string loadError;               // Error message if load failed

    PluginInfo()
        : loadedSuccessfully(false) {}
};

// =============================================================================
// Plugin Loader Class
// =============================================================================

class PluginLoader {
public:
    PluginLoader();

    // Load every *.lua file of a directory, in file name order
    // Returns number of successfully loaded plugins
    int loadPluginsFromDirectory(const std::string& directory,
                                 EmbeddedFormatterRegistry& registry);

    // Load a single plugin file
    // Returns true if plugin loaded successfully
    bool loadPlugin(const std::string& filepath, EmbeddedFormatterRegistry& registry);

    const std::vector<PluginInfo>& getLoadedPlugins() const { return m_plugins; }
    const std::vector<PluginInfo>& getFailedPlugins() const { return m_failedPlugins; }

    size_t getLoadedPluginCount() const { return m_plugins.size(); }
    size_t getFailedPluginCount() const { return m_failedPlugins.size(); }

    void setVerbose(bool verbose) { m_verbose = verbose; }

private:
    // Scan a directory for plugin files, sorted by name
    std::vector<std::string> scanDirectoryForPlugins(const std::string& directory) const;

    // Check if a file is a plugin script
    bool isPluginFile(const std::string& filename) const;

    void addFailedPlugin(const PluginInfo& info);

    std::vector<PluginInfo> m_plugins;        // Successfully loaded plugins
    std::vector<PluginInfo> m_failedPlugins;  // Plugins that failed to load
    bool m_verbose;
};

} // namespace SvelteFormat

#endif // SVELTEFORMAT_PLUGIN_LOADER_H
