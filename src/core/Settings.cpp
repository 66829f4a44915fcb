#include "ozzoo/core/Settings.h"
#include "ozzoo/core/Log.h"

#include <spdlog/spdlog.h>

#include <nlohmann/json.hpp>

#include <cmath>
#include <exception>
#include <fstream>
#include <limits>
#include <sstream>
#include <system_error>
#include <type_traits>

namespace ozzoo {

namespace {
    constexpr int kSettingsSchemaVersion = 1;

    constexpr std::size_t kMaxSettingsBytes = 1u * 1024u * 1024u;

    // Calls fn(key, field) for every tunable constant. Shared by load and save
    // so the two can never drift apart.
    template <class TuningT, class Fn>
    void VisitTuning(TuningT& t, Fn&& fn)
    {
        fn("hungerPerDayMin", t.hungerPerDayMin);
        fn("hungerPerDayMax", t.hungerPerDayMax);
        fn("unfedHungerPenalty", t.unfedHungerPenalty);
        fn("hungryThreshold", t.hungryThreshold);
        fn("hungryHappinessFactor", t.hungryHappinessFactor);
        fn("starvingThreshold", t.starvingThreshold);
        fn("starvingHealthFactor", t.starvingHealthFactor);
        fn("wellFedThreshold", t.wellFedThreshold);
        fn("contentHappiness", t.contentHappiness);
        fn("wellFedHealthRegen", t.wellFedHealthRegen);
        fn("lonelyHappinessLoss", t.lonelyHappinessLoss);
        fn("oldAgeHealthLoss", t.oldAgeHealthLoss);
        fn("criticalHealth", t.criticalHealth);
        fn("newbornHealth", t.newbornHealth);
        fn("newbornHappiness", t.newbornHappiness);
        fn("autoFeed", t.autoFeed);
        fn("autoFeedFactor", t.autoFeedFactor);

        fn("refusedHungerRelief", t.refusedHungerRelief);
        fn("refusedHappinessLoss", t.refusedHappinessLoss);
        fn("fedHappinessFactor", t.fedHappinessFactor);
        fn("fedHappinessCap", t.fedHappinessCap);
        fn("fedHealthFactor", t.fedHealthFactor);
        fn("fedHealthCap", t.fedHealthCap);

        fn("breedMinHealth", t.breedMinHealth);
        fn("breedMinHappiness", t.breedMinHappiness);

        fn("cleanlinessDecayBase", t.cleanlinessDecayBase);
        fn("cleanlinessDecayPerAnimal", t.cleanlinessDecayPerAnimal);
        fn("dirtyThreshold", t.dirtyThreshold);
        fn("dirtyHappinessLoss", t.dirtyHappinessLoss);
        fn("dirtyHealthLoss", t.dirtyHealthLoss);
        fn("cleanCostBase", t.cleanCostBase);
        fn("upgradeCostPerLevel", t.upgradeCostPerLevel);
        fn("upgradeCapacityStep", t.upgradeCapacityStep);
        fn("upgradeDecayResistanceStep", t.upgradeDecayResistanceStep);
        fn("maxDecayResistance", t.maxDecayResistance);
        fn("upgradeHappinessBonus", t.upgradeHappinessBonus);

        fn("minVisitors", t.minVisitors);
        fn("maxVisitors", t.maxVisitors);
        fn("visitorJitterMin", t.visitorJitterMin);
        fn("visitorJitterMax", t.visitorJitterMax);
        fn("ticketPrice", t.ticketPrice);
        fn("concessionSpendMin", t.concessionSpendMin);
        fn("concessionSpendMax", t.concessionSpendMax);

        fn("heatwaveChance", t.heatwaveChance);
        fn("donationChance", t.donationChance);
        fn("escapeChance", t.escapeChance);
        fn("heatwaveCleanlinessLoss", t.heatwaveCleanlinessLoss);
        fn("heatwaveHungerGain", t.heatwaveHungerGain);
        fn("heatwaveHealthLoss", t.heatwaveHealthLoss);
        fn("heatwaveHappinessLoss", t.heatwaveHappinessLoss);
        fn("heatwaveCoolingCost", t.heatwaveCoolingCost);
        fn("donationMinBalance", t.donationMinBalance);
        fn("donationMin", t.donationMin);
        fn("donationMax", t.donationMax);
        fn("escapeRepairCost", t.escapeRepairCost);

        fn("upkeepPerAnimal", t.upkeepPerAnimal);
        fn("upkeepPerEnclosure", t.upkeepPerEnclosure);

        fn("saleFraction", t.saleFraction);
    }

    // Every tuning value is a non-negative quantity; anything else is ignored.
    template <class T>
    void ReadTuningValue(const nlohmann::json& obj, const char* key, T& field)
    {
        const auto it = obj.find(key);
        if (it == obj.end())
            return;

        if constexpr (std::is_same_v<T, bool>)
        {
            if (it->is_boolean())
                field = it->get<bool>();
        }
        else if constexpr (std::is_integral_v<T>)
        {
            // Non-negative integers parse as unsigned; anything wider than T is rejected.
            if (it->is_number_unsigned() &&
                it->get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<T>::max()))
                field = static_cast<T>(it->get<std::uint64_t>());
        }
        else
        {
            if (!it->is_number())
                return;
            const double v = it->get<double>();
            if (std::isfinite(v) && v >= 0.0)
                field = static_cast<T>(v);
        }
    }

    void ReadTuning(const nlohmann::json& obj, Tuning& t)
    {
        const Tuning defaults{};
        const Tuning previous = t;
        VisitTuning(t, [&](const char* key, auto& field) { ReadTuningValue(obj, key, field); });

        if (t.minVisitors > kMaxDailyVisitors)
            t.minVisitors = previous.minVisitors;
        if (t.maxVisitors > kMaxDailyVisitors)
            t.maxVisitors = previous.maxVisitors;
        if (t.upgradeCapacityStep > kMaxUpgradeCapacityStep)
            t.upgradeCapacityStep = previous.upgradeCapacityStep;

        // Ranges must stay ordered; an inverted pair falls back to the shipped values.
        if (t.hungerPerDayMin > t.hungerPerDayMax)
        {
            t.hungerPerDayMin = defaults.hungerPerDayMin;
            t.hungerPerDayMax = defaults.hungerPerDayMax;
        }
        if (t.minVisitors > t.maxVisitors)
        {
            t.minVisitors = defaults.minVisitors;
            t.maxVisitors = defaults.maxVisitors;
        }
        if (t.visitorJitterMin > t.visitorJitterMax)
        {
            t.visitorJitterMin = defaults.visitorJitterMin;
            t.visitorJitterMax = defaults.visitorJitterMax;
        }
        if (t.concessionSpendMin > t.concessionSpendMax)
        {
            t.concessionSpendMin = defaults.concessionSpendMin;
            t.concessionSpendMax = defaults.concessionSpendMax;
        }
        if (t.donationMin > t.donationMax)
        {
            t.donationMin = defaults.donationMin;
            t.donationMax = defaults.donationMax;
        }
        if (t.heatwaveChance + t.donationChance + t.escapeChance > 1.0)
        {
            t.heatwaveChance = defaults.heatwaveChance;
            t.donationChance = defaults.donationChance;
            t.escapeChance = defaults.escapeChance;
        }
        if (t.maxDecayResistance > 1.0f)
            t.maxDecayResistance = defaults.maxDecayResistance;
        if (t.saleFraction > 1.0)
            t.saleFraction = defaults.saleFraction;
    }

    // Clamps any JSON integer into [lo, hi] without narrowing it first.
    int ClampInt(const nlohmann::json& v, int lo, int hi)
    {
        if (v.is_number_unsigned())
        {
            const std::uint64_t u = v.get<std::uint64_t>();
            if (u > static_cast<std::uint64_t>(hi)) return hi;
            return static_cast<int>(u) < lo ? lo : static_cast<int>(u);
        }
        const std::int64_t s = v.get<std::int64_t>();
        if (s < lo) return lo;
        if (s > hi) return hi;
        return static_cast<int>(s);
    }

    bool ReadFileToString(const std::filesystem::path& p, std::string& out) noexcept
    {
        out.clear();

        std::error_code ec;
        const auto size = std::filesystem::file_size(p, ec);
        if (ec || size == 0 || size > kMaxSettingsBytes)
            return false;

        std::ifstream in(p, std::ios::binary);
        if (!in)
            return false;

        std::ostringstream ss;
        ss << in.rdbuf();
        out = ss.str();
        return !out.empty();
    }
}

std::filesystem::path DefaultSettingsPath()
{
    return std::filesystem::path("ozzoo_settings.json");
}

bool ParseSettings(std::string_view text, Settings& out) noexcept
{
    try
    {
        // Allow // comments, and avoid exceptions on malformed input.
        nlohmann::json j = nlohmann::json::parse(text.begin(), text.end(), nullptr, false,
                                                 /*ignore_comments*/ true);
        if (j.is_discarded() || !j.is_object())
            return false;

        Settings tmp = out;

        if (const auto it = j.find("window"); it != j.end() && it->is_object())
        {
            if (auto w = it->find("width"); w != it->end() && w->is_number_integer())
                tmp.windowWidth = ClampInt(*w, kMinWindowWidth, kMaxWindowWidth);
            if (auto h = it->find("height"); h != it->end() && h->is_number_integer())
                tmp.windowHeight = ClampInt(*h, kMinWindowHeight, kMaxWindowHeight);
            if (auto v = it->find("vsync"); v != it->end() && v->is_boolean())
                tmp.vsync = v->get<bool>();
        }

        if (const auto it = j.find("simulation"); it != j.end() && it->is_object())
        {
            if (auto t = it->find("tickIntervalMs"); t != it->end() && t->is_number_integer())
                tmp.tickIntervalMs = ClampInt(*t, kMinTickIntervalMs, kMaxTickIntervalMs);
            if (auto s = it->find("seed"); s != it->end() && s->is_number_unsigned())
                tmp.seed = s->get<std::uint64_t>();
            if (auto b = it->find("startingBalance"); b != it->end() && b->is_number())
            {
                const double v = b->get<double>();
                if (std::isfinite(v) && v >= 0.0)
                    tmp.startingBalance = v;
            }
            if (auto c = it->find("starterContent"); c != it->end() && c->is_boolean())
                tmp.starterContent = c->get<bool>();
        }

        if (const auto it = j.find("logging"); it != j.end() && it->is_object())
        {
            if (auto d = it->find("directory"); d != it->end() && d->is_string() &&
                                                !d->get<std::string>().empty())
                tmp.logDirectory = d->get<std::string>();
            if (auto l = it->find("level"); l != it->end() && l->is_string() &&
                                            logging::ParseLevel(l->get<std::string>()))
                tmp.logLevel = l->get<std::string>();
            if (auto a = it->find("async"); a != it->end() && a->is_boolean())
                tmp.asyncLogging = a->get<bool>();
        }

        if (const auto it = j.find("tuning"); it != j.end() && it->is_object())
            ReadTuning(*it, tmp.tuning);

        out = std::move(tmp);
        return true;
    }
    catch (const std::exception& ex)
    {
        spdlog::warn("Settings rejected: {}", ex.what());
        return false;
    }
}

bool LoadSettings(const std::filesystem::path& path, Settings& out) noexcept
{
    std::string text;
    if (!ReadFileToString(path, text))
        return false;

    if (!ParseSettings(text, out))
    {
        spdlog::warn("Ignoring unreadable settings file {}", path.string());
        return false;
    }
    return true;
}

std::string SettingsToJson(const Settings& settings)
{
    nlohmann::json j;
    j["version"] = kSettingsSchemaVersion;
    j["window"] = {
        {"width", settings.windowWidth},
        {"height", settings.windowHeight},
        {"vsync", settings.vsync},
    };
    j["simulation"] = {
        {"tickIntervalMs", settings.tickIntervalMs},
        {"seed", settings.seed},
        {"startingBalance", settings.startingBalance},
        {"starterContent", settings.starterContent},
    };
    j["logging"] = {
        {"directory", settings.logDirectory},
        {"level", settings.logLevel},
        {"async", settings.asyncLogging},
    };

    nlohmann::json tuning = nlohmann::json::object();
    VisitTuning(settings.tuning, [&](const char* key, const auto& field) { tuning[key] = field; });
    j["tuning"] = std::move(tuning);

    std::string payload = j.dump(4);
    payload.push_back('\n');
    return payload;
}

bool SaveSettings(const std::filesystem::path& path, const Settings& settings) noexcept
{
    try
    {
        std::error_code ec;
        if (path.has_parent_path())
            std::filesystem::create_directories(path.parent_path(), ec);

        auto tmpPath = path;
        tmpPath += ".tmp";
        {
            std::ofstream outFile(tmpPath, std::ios::binary | std::ios::trunc);
            if (!outFile)
                return false;
            outFile << SettingsToJson(settings);
            if (!outFile)
                return false;
        }

        std::filesystem::rename(tmpPath, path, ec);
        if (ec)
        {
            spdlog::warn("Could not write settings to {}: {}", path.string(), ec.message());
            std::filesystem::remove(tmpPath, ec);
            return false;
        }
        return true;
    }
    catch (const std::exception& ex)
    {
        spdlog::warn("Could not save settings: {}", ex.what());
        return false;
    }
}

} // namespace ozzoo
