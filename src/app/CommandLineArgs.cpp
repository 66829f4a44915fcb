#include "ozzoo/app/CommandLineArgs.h"
#include "ozzoo/util/Text.h"

#include <charconv>
#include <sstream>
#include <string_view>

namespace ozzoo::app {

namespace {

[[nodiscard]] bool StartsWith(std::string_view s, std::string_view prefix)
{
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

// Accepts "--opt=value".
[[nodiscard]] bool ConsumeValue(std::string_view arg, std::string_view prefix, std::string_view& outValue)
{
    if (!StartsWith(arg, prefix))
        return false;

    const std::size_t n = prefix.size();
    if (arg.size() == n || arg[n] != '=')
        return false;

    outValue = arg.substr(n + 1);
    return true;
}

[[nodiscard]] std::optional<std::uint64_t> ParseU64(std::string_view s)
{
    s = util::Trim(s);
    int base = 10;
    if (s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X'))
    {
        s.remove_prefix(2);
        base = 16;
    }
    std::uint64_t v = 0;
    const char* end = s.data() + s.size();
    const auto [ptr, ec] = std::from_chars(s.data(), end, v, base);
    if (s.empty() || ec != std::errc{} || ptr != end)
        return std::nullopt;
    return v;
}

} // namespace

CommandLineArgs ParseCommandLineArgs(int argc, const char* const* argv)
{
    CommandLineArgs out;
    if (argc <= 1 || argv == nullptr)
        return out;

    auto addUnknown = [&](std::string_view raw) {
        out.unknown.emplace_back(raw);
    };

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view raw(argv[i] ? argv[i] : "");
        if (raw.empty())
            continue;

        // Only the option name is case-folded; the value after '=' keeps its case.
        const std::size_t eq = raw.find('=');
        std::string lowered = util::ToLower(raw.substr(0, eq));
        if (eq != std::string_view::npos)
            lowered.append(raw.substr(eq));
        const std::string_view arg(lowered);

        // Help
        if (arg == "--help" || arg == "-h" || arg == "-?") {
            out.showHelp = true;
            continue;
        }

        // Simple flags
        if (arg == "--empty" || arg == "--empty-zoo") { out.emptyZoo = true; continue; }

        std::string_view value;

        const auto nextValue = [&]() -> std::optional<std::string_view> {
            if (i + 1 >= argc || argv[i + 1] == nullptr) {
                addUnknown(raw);
                return std::nullopt;
            }
            ++i;
            return std::string_view(argv[i]);
        };

        const auto intInto = [&](std::optional<int>& dst, std::string_view v) {
            const auto parsed = util::ParseInt(v);
            if (!parsed) {
                addUnknown(raw);
                return;
            }
            dst = *parsed;
        };

        const auto stringInto = [&](std::optional<std::string>& dst, std::string_view v) {
            if (v.empty()) {
                addUnknown(raw);
                return;
            }
            dst = std::string(v);
        };

        const auto option = [&](std::string_view name, auto&& apply) -> bool {
            if (arg == name) {
                if (auto v = nextValue())
                    apply(*v);
                return true;
            }
            if (ConsumeValue(arg, name, value)) {
                apply(value);
                return true;
            }
            return false;
        };

        if (option("--config", [&](std::string_view v) { stringInto(out.configPath, v); })) continue;
        if (option("--report", [&](std::string_view v) { stringInto(out.report, util::ToLower(v)); })) continue;
        if (option("--out", [&](std::string_view v) { stringInto(out.outPath, v); })) continue;
        if (option("--log-level", [&](std::string_view v) { stringInto(out.logLevel, util::ToLower(v)); })) continue;
        if (option("--days", [&](std::string_view v) { intInto(out.days, v); })) continue;
        if (option("--interval-ms", [&](std::string_view v) { intInto(out.intervalMs, v); })) continue;
        if (option("--width", [&](std::string_view v) { intInto(out.width, v); })) continue;
        if (option("--height", [&](std::string_view v) { intInto(out.height, v); })) continue;
        if (option("--seed", [&](std::string_view v) {
                const auto parsed = ParseU64(v);
                if (!parsed) {
                    addUnknown(raw);
                    return;
                }
                out.seed = *parsed;
            }))
            continue;

        // Anything else is unknown.
        addUnknown(raw);
    }

    return out;
}

std::string BuildCommandLineHelpText(const std::string& programName)
{
    std::ostringstream oss;
    oss << "OzZoo - Command Line Options\n\n";
    oss << "Simulation\n";
    oss << "  --config <file>              Settings file (default ozzoo_settings.json)\n";
    oss << "  --seed <n>                   RNG seed (decimal or 0x hex)\n";
    oss << "  --days <n>                   Advance n days, then exit (CLI) or open there (GUI)\n";
    oss << "  --interval-ms <n>            Auto-advance interval in milliseconds\n";
    oss << "  --empty                      Start without enclosures, animals or stock\n\n";

    oss << "Reports\n";
    oss << "  --report <text|pdf>          Write a report when done (GUI: on exit)\n";
    oss << "  --out <file>                 Report destination (CLI text defaults to stdout)\n\n";

    oss << "Window (GUI)\n";
    oss << "  --width <px>                 Initial window width\n";
    oss << "  --height <px>                Initial window height\n\n";

    oss << "Misc\n";
    oss << "  --log-level <level>          trace, debug, info, warn, error\n";
    oss << "  --help, -h                   Show this help\n\n";

    oss << "Examples\n";
    oss << "  " << programName << " --days 30 --report text\n";
    oss << "  " << programName << " --seed 42 --days 90 --report pdf --out zoo.pdf\n";
    return oss.str();
}

} // namespace ozzoo::app
