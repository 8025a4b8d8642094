//
// SvelteFormat command line tool (sveltefmt)
// Pretty-prints component files to stdout, in place, or checks them
//

#include "svelte_formatter_lib.h"
#include "svelteformat_embed.h"
#include "plugin_loader.h"
#include "../runtime/formatter_lua_bindings.h"
#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <cstring>
#include <cstdlib>

using namespace SvelteFormat;

static const int EXIT_FORMAT_ERROR = 1;
static const int EXIT_USAGE_ERROR = 2;
static const int EXIT_CHECK_FAILED = 3;

void printUsage(const char* programName) {
    std::cerr << "SvelteFormat " << SVELTEFORMAT_VERSION << " - Formats component markup files\n\n";
    std::cerr << "Usage: " << programName << " [options] <file...>\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  --print-width N           Target line width (default: 80)\n";
    std::cerr << "  --tab-width N             Columns per indentation level (default: 2)\n";
    std::cerr << "  --use-tabs                Indent with tabs\n";
    std::cerr << "  --sort-order ORDER        Section order, e.g. scripts-styles-markup\n";
    std::cerr << "  --strict                  Quote expressions, self-close void elements only\n";
    std::cerr << "  --bracket-new-line        Put the '>' of a broken start tag on its own line\n";
    std::cerr << "  --no-shorthand            Print {a} attributes as a={a}\n";
    std::cerr << "  --no-indent-script-style  Do not indent script and style bodies\n";
    std::cerr << "  --config FILE             Read options from a Lua configuration file\n";
    std::cerr << "  --plugin FILE             Load a Lua formatter plugin\n";
    std::cerr << "  --plugin-dir DIR          Load every *.lua plugin in DIR\n";
    std::cerr << "  -w, --write               Rewrite files in place\n";
    std::cerr << "  -c, --check               Exit with status 3 if a file is not formatted\n";
    std::cerr << "  -v, --verbose             Verbose output\n";
    std::cerr << "  -h, --help                Show this help message\n";
    std::cerr << "\nUse - as file name to read standard input.\n";
    std::cerr << "Options given on the command line override the configuration file.\n";
    std::cerr << "\nExamples:\n";
    std::cerr << "  " << programName << " App.svelte                 # Print formatted file\n";
    std::cerr << "  " << programName << " -w src/*.svelte            # Format in place\n";
    std::cerr << "  " << programName << " -c --strict App.svelte     # Check strict formatting\n";
    std::cerr << "  " << programName << " --plugin css.lua App.svelte # Format styles with a plugin\n";
}

static bool parsePositiveInt(const char* text, int& out) {
    char* end = nullptr;
    long value = std::strtol(text, &end, 10);
    if (end == text || *end != '\0' || value <= 0 || value > 10000) {
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

static bool readSource(const std::string& inputFile, std::string& source) {
    if (inputFile == "-") {
        std::ostringstream buffer;
        buffer << std::cin.rdbuf();
        source = buffer.str();
        return true;
    }

    std::ifstream file(inputFile, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }
    source.assign((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return true;
}

static bool writeSource(const std::string& outputFile, const std::string& text) {
    std::ofstream file(outputFile, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return false;
    }
    file << text;
    return file.good();
}

// Flags taking a value; their argument is never an input file
static bool takesValue(const char* arg) {
    return strcmp(arg, "--print-width") == 0 || strcmp(arg, "--tab-width") == 0 ||
           strcmp(arg, "--sort-order") == 0 || strcmp(arg, "--config") == 0 ||
           strcmp(arg, "--plugin") == 0 || strcmp(arg, "--plugin-dir") == 0;
}

int main(int argc, char** argv) {
    FormatterOptions options;
    std::vector<std::string> inputFiles;
    std::vector<std::string> pluginFiles;
    std::vector<std::string> pluginDirs;
    bool writeInPlace = false;
    bool checkOnly = false;

    // The configuration file is applied first so that flags override it
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "--config") == 0) {
            if (i + 1 >= argc) {
                std::cerr << "Error: --config requires a file name\n";
                return EXIT_USAGE_ERROR;
            }
            try {
                loadOptionsFromLuaFile(argv[i + 1], options);
            } catch (const ConfigError& e) {
                std::cerr << "Error: " << e.what() << "\n";
                return EXIT_USAGE_ERROR;
            }
        }
        if (takesValue(argv[i])) {
            i++;
        }
    }

    // Parse command line arguments
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            printUsage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--verbose") == 0) {
            options.verbose = true;
        } else if (strcmp(argv[i], "-w") == 0 || strcmp(argv[i], "--write") == 0) {
            writeInPlace = true;
        } else if (strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "--check") == 0) {
            checkOnly = true;
        } else if (strcmp(argv[i], "--use-tabs") == 0) {
            options.use_tabs = true;
        } else if (strcmp(argv[i], "--strict") == 0) {
            options.strict_mode = true;
        } else if (strcmp(argv[i], "--bracket-new-line") == 0) {
            options.bracket_new_line = true;
        } else if (strcmp(argv[i], "--no-shorthand") == 0) {
            options.allow_shorthand = false;
        } else if (strcmp(argv[i], "--no-indent-script-style") == 0) {
            options.indent_script_and_style = false;
        } else if (takesValue(argv[i])) {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << argv[i] << " requires a value\n";
                return EXIT_USAGE_ERROR;
            }
            const char* flag = argv[i];
            const char* value = argv[++i];
            if (strcmp(flag, "--print-width") == 0) {
                if (!parsePositiveInt(value, options.print_width)) {
                    std::cerr << "Error: Invalid print width: " << value << "\n";
                    return EXIT_USAGE_ERROR;
                }
            } else if (strcmp(flag, "--tab-width") == 0) {
                if (!parsePositiveInt(value, options.tab_width)) {
                    std::cerr << "Error: Invalid tab width: " << value << "\n";
                    return EXIT_USAGE_ERROR;
                }
            } else if (strcmp(flag, "--sort-order") == 0) {
                try {
                    options.sort_order = parseSortOrder(value);
                } catch (const std::invalid_argument& e) {
                    std::cerr << "Error: " << e.what() << "\n";
                    return EXIT_USAGE_ERROR;
                }
            } else if (strcmp(flag, "--plugin") == 0) {
                pluginFiles.push_back(value);
            } else if (strcmp(flag, "--plugin-dir") == 0) {
                pluginDirs.push_back(value);
            }
            // --config was applied above
        } else if (argv[i][0] == '-' && argv[i][1] != '\0') {
            std::cerr << "Error: Unknown option: " << argv[i] << "\n";
            printUsage(argv[0]);
            return EXIT_USAGE_ERROR;
        } else {
            inputFiles.push_back(argv[i]);
        }
    }

    if (inputFiles.empty()) {
        std::cerr << "Error: No input file specified\n\n";
        printUsage(argv[0]);
        return EXIT_USAGE_ERROR;
    }

    if (writeInPlace && checkOnly) {
        std::cerr << "Error: --write and --check cannot be combined\n";
        return EXIT_USAGE_ERROR;
    }

    EmbeddedFormatterRegistry registry;
    registry.setVerbose(options.verbose);

    PluginLoader loader;
    loader.setVerbose(options.verbose);
    for (const auto& dir : pluginDirs) {
        loader.loadPluginsFromDirectory(dir, registry);
    }
    for (const auto& file : pluginFiles) {
        loader.loadPlugin(file, registry);
    }

    int exitCode = 0;

    for (const auto& inputFile : inputFiles) {
        if (options.verbose) {
            std::cerr << "Reading: " << inputFile << "\n";
        }

        std::string source;
        if (!readSource(inputFile, source)) {
            std::cerr << "Error: Cannot open file: " << inputFile << "\n";
            exitCode = EXIT_FORMAT_ERROR;
            continue;
        }

        FormatterResult result = formatSvelteCode(source, options, &registry);
        if (!result.success) {
            std::cerr << inputFile << ": " << result.error_message << "\n";
            exitCode = EXIT_FORMAT_ERROR;
            continue;
        }

        if (checkOnly) {
            if (result.formatted_code != source) {
                std::cerr << "Not formatted: " << inputFile << "\n";
                if (exitCode == 0) {
                    exitCode = EXIT_CHECK_FAILED;
                }
            }
        } else if (writeInPlace && inputFile != "-") {
            if (result.formatted_code != source && !writeSource(inputFile, result.formatted_code)) {
                std::cerr << "Error: Cannot write file: " << inputFile << "\n";
                exitCode = EXIT_FORMAT_ERROR;
            } else if (options.verbose) {
                std::cerr << "Wrote: " << inputFile << "\n";
            }
        } else {
            std::cout << result.formatted_code;
        }
    }

    return exitCode;
}
