#pragma once
// include/ozzoo/app/CommandLineArgs.h

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ozzoo::app {

// Parsed command-line arguments shared by ozzoo-cli and ozzoo-gui.
//
// Notes:
//   - Option names are case-insensitive; values are not.
//   - Both "--flag=value" and "--flag value" forms are supported.
struct CommandLineArgs
{
    bool showHelp = false;                  // --help / -h
    bool emptyZoo = false;                  // --empty (no starter enclosures/animals)

    std::optional<std::string>   configPath; // --config <file>
    std::optional<std::uint64_t> seed;       // --seed <n>
    std::optional<int>           days;       // --days <n>
    std::optional<std::string>   report;     // --report <text|pdf>
    std::optional<std::string>   outPath;    // --out <file>
    std::optional<int>           intervalMs; // --interval-ms <n>
    std::optional<std::string>   logLevel;   // --log-level <level>

    std::optional<int> width;                // --width <px>
    std::optional<int> height;               // --height <px>

    // Unknown or malformed args, kept so the caller can show a useful error.
    std::vector<std::string> unknown;
};

[[nodiscard]] CommandLineArgs ParseCommandLineArgs(int argc, const char* const* argv);

[[nodiscard]] std::string BuildCommandLineHelpText(const std::string& programName);

} // namespace ozzoo::app
