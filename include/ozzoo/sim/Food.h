#pragma once
// include/ozzoo/sim/Food.h

#include "ozzoo/sim/ZooError.h"

#include <array>
#include <cstdint>
#include <string_view>

namespace ozzoo {

enum class FoodType : std::uint8_t
{
    Eucalyptus = 0,
    HerbivoreFood,
    Seeds,
    MeatyFood,
    GeneralFood,
    Count
};

inline constexpr std::size_t kFoodTypeCount = static_cast<std::size_t>(FoodType::Count);

inline constexpr std::array<FoodType, kFoodTypeCount> kAllFoodTypes = {
    FoodType::Eucalyptus, FoodType::HerbivoreFood, FoodType::Seeds,
    FoodType::MeatyFood,  FoodType::GeneralFood,
};

struct FoodInfo
{
    FoodType         type;
    std::string_view key;        // "eucalyptus", "meaty_food", ...
    float            nutrition;  // hunger removed by one ration
    double           unitPrice;
};

[[nodiscard]] const FoodInfo& GetFoodInfo(FoodType f) noexcept;
[[nodiscard]] std::string_view FoodKey(FoodType f) noexcept;

// Accepts the canonical key, case-insensitive; '-' and ' ' are treated as '_'.
[[nodiscard]] Result<FoodType> ParseFoodType(std::string_view text);

// Bit set of food types, used by species diet tables.
using FoodMask = std::uint8_t;

[[nodiscard]] constexpr FoodMask FoodBit(FoodType f) noexcept
{
    return static_cast<FoodMask>(1u << static_cast<unsigned>(f));
}

struct Medicine
{
    std::string_view name = "basic_med";
    float            healing = 15.0f;
    double           unitPrice = 30.0;
};

} // namespace ozzoo
