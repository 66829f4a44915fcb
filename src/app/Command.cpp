#include "ozzoo/app/Command.h"
#include "ozzoo/util/Text.h"

#include <format>
#include <optional>
#include <vector>

namespace ozzoo::app {

namespace {

constexpr int kMaxAdvanceDays = 3650;
constexpr int kMaxQuantity = 10000;

std::unexpected<ZooError> Usage(std::string_view usage)
{
    return Fail(ZooError::Code::InvalidAction, std::format("Usage: {}", usage));
}

Result<int> ParseCount(std::string_view text, int maxValue, std::string_view what)
{
    const std::optional<int> v = util::ParseInt(text);
    if (!v || *v <= 0 || *v > maxValue)
        return Fail(ZooError::Code::InvalidAction,
                    std::format("{} must be a number between 1 and {} (got '{}')", what, maxValue, text));
    return *v;
}

Result<EnclosureId> ParseEnclosureNumber(std::string_view text)
{
    std::string_view t = util::Trim(text);
    if (!t.empty() && t.front() == '#')
        t.remove_prefix(1);
    const std::optional<int> v = util::ParseInt(t);
    if (!v || *v <= 0)
        return Fail(ZooError::Code::InvalidAction, std::format("'{}' is not an enclosure number", text));
    return static_cast<EnclosureId>(*v - 1);
}

} // namespace

const char* CommandName(CommandKind k) noexcept
{
    switch (k)
    {
    case CommandKind::Advance:     return "advance";
    case CommandKind::Feed:        return "feed";
    case CommandKind::Medicine:    return "medicine";
    case CommandKind::Breed:       return "breed";
    case CommandKind::BuyFood:     return "buy-food";
    case CommandKind::BuyMedicine: return "buy-medicine";
    case CommandKind::BuyAnimal:   return "buy-animal";
    case CommandKind::Sell:        return "sell";
    case CommandKind::Move:        return "move";
    case CommandKind::Clean:       return "clean";
    case CommandKind::Upgrade:     return "upgrade";
    case CommandKind::Report:      return "report";
    case CommandKind::Auto:        return "auto";
    case CommandKind::Help:        return "help";
    }
    return "?";
}

const char* CommandHelpText() noexcept
{
    return "Commands:\n"
           "  advance [n]                      run n days (default 1)\n"
           "  feed <animal> <food>             eucalyptus, herbivore_food, seeds, meaty_food, general_food\n"
           "  medicine <animal>\n"
           "  breed <animal> <animal>\n"
           "  buy-food <food> <qty>\n"
           "  buy-medicine <qty>\n"
           "  buy-animal <species> <enclosure>  koala, kangaroo, eagle\n"
           "  sell <animal>\n"
           "  move <animal> <enclosure>\n"
           "  clean <enclosure>\n"
           "  upgrade <enclosure>\n"
           "  report <text|pdf> [path]\n"
           "  auto on|off                      GUI only\n"
           "  help\n"
           "Animals by name or id, enclosures by number (1, 2, ...).\n";
}

Result<Command> ParseCommand(std::string_view line)
{
    const std::vector<std::string_view> words = util::SplitWords(line);
    if (words.empty())
        return Fail(ZooError::Code::InvalidAction, "Empty command");

    const std::string verb = util::NormalizeKey(words[0]);
    const std::size_t argc = words.size() - 1;
    const auto arg = [&](std::size_t i) { return words[i + 1]; };

    Command cmd{};

    if (verb == "advance" || verb == "next" || verb == "next_day")
    {
        if (argc > 1)
            return Usage("advance [n]");
        cmd.kind = CommandKind::Advance;
        if (argc == 1)
        {
            auto n = ParseCount(arg(0), kMaxAdvanceDays, "Days");
            if (!n)
                return std::unexpected(n.error());
            cmd.count = *n;
        }
        return cmd;
    }

    if (verb == "feed")
    {
        if (argc != 2)
            return Usage("feed <animal> <food>");
        auto food = ParseFoodType(arg(1));
        if (!food)
            return std::unexpected(food.error());
        cmd.kind = CommandKind::Feed;
        cmd.animal = std::string(arg(0));
        cmd.food = *food;
        return cmd;
    }

    if (verb == "medicine" || verb == "medicate" || verb == "treat")
    {
        if (argc != 1)
            return Usage("medicine <animal>");
        cmd.kind = CommandKind::Medicine;
        cmd.animal = std::string(arg(0));
        return cmd;
    }

    if (verb == "breed")
    {
        if (argc != 2)
            return Usage("breed <animal> <animal>");
        cmd.kind = CommandKind::Breed;
        cmd.animal = std::string(arg(0));
        cmd.otherAnimal = std::string(arg(1));
        return cmd;
    }

    if (verb == "buy_food")
    {
        if (argc != 2)
            return Usage("buy-food <food> <qty>");
        auto food = ParseFoodType(arg(0));
        if (!food)
            return std::unexpected(food.error());
        auto qty = ParseCount(arg(1), kMaxQuantity, "Quantity");
        if (!qty)
            return std::unexpected(qty.error());
        cmd.kind = CommandKind::BuyFood;
        cmd.food = *food;
        cmd.count = *qty;
        return cmd;
    }

    if (verb == "buy_medicine")
    {
        if (argc != 1)
            return Usage("buy-medicine <qty>");
        auto qty = ParseCount(arg(0), kMaxQuantity, "Quantity");
        if (!qty)
            return std::unexpected(qty.error());
        cmd.kind = CommandKind::BuyMedicine;
        cmd.count = *qty;
        return cmd;
    }

    if (verb == "buy_animal")
    {
        if (argc != 2)
            return Usage("buy-animal <species> <enclosure>");
        auto species = ParseSpecies(arg(0));
        if (!species)
            return std::unexpected(species.error());
        auto enc = ParseEnclosureNumber(arg(1));
        if (!enc)
            return std::unexpected(enc.error());
        cmd.kind = CommandKind::BuyAnimal;
        cmd.species = *species;
        cmd.enclosure = *enc;
        return cmd;
    }

    if (verb == "sell")
    {
        if (argc != 1)
            return Usage("sell <animal>");
        cmd.kind = CommandKind::Sell;
        cmd.animal = std::string(arg(0));
        return cmd;
    }

    if (verb == "move")
    {
        if (argc != 2)
            return Usage("move <animal> <enclosure>");
        auto enc = ParseEnclosureNumber(arg(1));
        if (!enc)
            return std::unexpected(enc.error());
        cmd.kind = CommandKind::Move;
        cmd.animal = std::string(arg(0));
        cmd.enclosure = *enc;
        return cmd;
    }

    if (verb == "clean" || verb == "upgrade")
    {
        if (argc != 1)
            return Usage(verb == "clean" ? "clean <enclosure>" : "upgrade <enclosure>");
        auto enc = ParseEnclosureNumber(arg(0));
        if (!enc)
            return std::unexpected(enc.error());
        cmd.kind = (verb == "clean") ? CommandKind::Clean : CommandKind::Upgrade;
        cmd.enclosure = *enc;
        return cmd;
    }

    if (verb == "report")
    {
        if (argc < 1 || argc > 2)
            return Usage("report <text|pdf> [path]");
        auto format = report::ParseReportFormat(arg(0));
        if (!format)
            return std::unexpected(format.error());
        cmd.kind = CommandKind::Report;
        cmd.format = *format;
        if (argc == 2)
            cmd.path = std::string(arg(1));
        return cmd;
    }

    if (verb == "auto")
    {
        const std::string mode = argc == 1 ? util::ToLower(arg(0)) : std::string();
        if (mode != "on" && mode != "off")
            return Usage("auto on|off");
        cmd.kind = CommandKind::Auto;
        cmd.on = (mode == "on");
        return cmd;
    }

    if (verb == "help" || verb == "?")
    {
        cmd.kind = CommandKind::Help;
        return cmd;
    }

    return Fail(ZooError::Code::InvalidAction,
                std::format("Unknown command '{}'. Type 'help' for a list.", words[0]));
}

} // namespace ozzoo::app
