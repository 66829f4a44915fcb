#include "ozzoo/sim/Food.h"
#include "ozzoo/util/Text.h"

#include <string>

namespace ozzoo {

namespace {

constexpr std::array<FoodInfo, kFoodTypeCount> kFoodTable = {{
    { FoodType::Eucalyptus,    "eucalyptus",     30.0f, 3.0 },
    { FoodType::HerbivoreFood, "herbivore_food", 25.0f, 2.0 },
    { FoodType::Seeds,         "seeds",          15.0f, 1.5 },
    { FoodType::MeatyFood,     "meaty_food",     35.0f, 4.0 },
    { FoodType::GeneralFood,   "general_food",   20.0f, 2.5 },
}};

} // namespace

const FoodInfo& GetFoodInfo(FoodType f) noexcept
{
    const auto i = static_cast<std::size_t>(f);
    return kFoodTable[i < kFoodTable.size() ? i : 0];
}

std::string_view FoodKey(FoodType f) noexcept
{
    return GetFoodInfo(f).key;
}

Result<FoodType> ParseFoodType(std::string_view text)
{
    const std::string key = util::NormalizeKey(text);
    for (const FoodInfo& info : kFoodTable)
    {
        if (key == info.key)
            return info.type;
    }
    // Short forms used in the command console.
    if (key == "herbivore") return FoodType::HerbivoreFood;
    if (key == "meat" || key == "meaty") return FoodType::MeatyFood;
    if (key == "general") return FoodType::GeneralFood;

    return Fail(ZooError::Code::InvalidAction, "Unknown food type '" + std::string(text) + "'");
}

} // namespace ozzoo
