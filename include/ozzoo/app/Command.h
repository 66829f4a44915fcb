#pragma once
// include/ozzoo/app/Command.h
//
// One player command, parsed from a text line such as
//   "feed Kiki eucalyptus" or "buy-animal koala 1".
// Animals stay as text here (name or serial); they are resolved against the
// zoo at dispatch time. Enclosures are 1-based on the wire, 0-based here.

#include "ozzoo/report/ZooReport.h"
#include "ozzoo/sim/Components.h"
#include "ozzoo/sim/Food.h"
#include "ozzoo/sim/Species.h"
#include "ozzoo/sim/ZooError.h"

#include <cstdint>
#include <string>
#include <string_view>

namespace ozzoo::app {

enum class CommandKind : std::uint8_t
{
    Advance = 0,
    Feed,
    Medicine,
    Breed,
    BuyFood,
    BuyMedicine,
    BuyAnimal,
    Sell,
    Move,
    Clean,
    Upgrade,
    Report,
    Auto,
    Help,
};

[[nodiscard]] const char* CommandName(CommandKind k) noexcept;

struct Command
{
    CommandKind          kind = CommandKind::Help;
    int                  count = 1;             // advance days, purchase quantity
    std::string          animal;                // feed, medicine, breed, sell, move
    std::string          otherAnimal;           // breed
    FoodType             food = FoodType::Eucalyptus;
    Species              species = Species::Koala;
    EnclosureId          enclosure = kNoEnclosure;
    report::ReportFormat format = report::ReportFormat::Text;
    std::string          path;                  // report destination, empty = default
    bool                 on = false;            // auto
};

// Case-insensitive. Malformed lines fail with InvalidAction.
[[nodiscard]] Result<Command> ParseCommand(std::string_view line);

[[nodiscard]] const char* CommandHelpText() noexcept;

} // namespace ozzoo::app
