#pragma once
// include/ozzoo/core/Settings.h
//
// Persisted game settings (settings.json). The loader is forgiving: unknown
// keys are ignored and a value of the wrong type or out of range keeps the
// current value, field by field. Nothing here throws.

#include "ozzoo/sim/Tuning.h"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace ozzoo {

inline constexpr int kMinWindowWidth  = 640;
inline constexpr int kMinWindowHeight = 360;
inline constexpr int kMaxWindowWidth  = 7680;
inline constexpr int kMaxWindowHeight = 4320;

inline constexpr int kMinTickIntervalMs = 100;
inline constexpr int kMaxTickIntervalMs = 60000;

// Upper bounds for integer tuning values read from the file.
inline constexpr int kMaxDailyVisitors       = 10000;
inline constexpr int kMaxUpgradeCapacityStep = 100;

struct Settings
{
    // Window
    int  windowWidth = 1280;
    int  windowHeight = 800;
    bool vsync = true;

    // Simulation
    int           tickIntervalMs = 2500;   // auto mode
    std::uint64_t seed = 0x0CA1A;
    double        startingBalance = 2000.0;
    bool          starterContent = true;

    // Logging
    std::string logDirectory = "logs";
    std::string logLevel = "info";
    bool        asyncLogging = false;

    Tuning tuning{};
};

[[nodiscard]] std::filesystem::path DefaultSettingsPath();

// Returns true when the text parsed as a JSON object. Fields that are missing
// or invalid leave `out` untouched.
[[nodiscard]] bool ParseSettings(std::string_view text, Settings& out) noexcept;

// Returns true if the file existed and parsed. On failure `out` is unchanged.
[[nodiscard]] bool LoadSettings(const std::filesystem::path& path, Settings& out) noexcept;

[[nodiscard]] std::string SettingsToJson(const Settings& settings);

// Writes through a temporary file and renames it into place.
[[nodiscard]] bool SaveSettings(const std::filesystem::path& path, const Settings& settings) noexcept;

} // namespace ozzoo
