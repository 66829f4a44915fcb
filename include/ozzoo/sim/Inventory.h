#pragma once
// include/ozzoo/sim/Inventory.h

#include "ozzoo/sim/Food.h"

#include <array>

namespace ozzoo {

struct Inventory
{
    std::array<int, kFoodTypeCount> food{};
    int medicine = 0;

    [[nodiscard]] int& units(FoodType f) noexcept { return food[static_cast<std::size_t>(f)]; }
    [[nodiscard]] int units(FoodType f) const noexcept { return food[static_cast<std::size_t>(f)]; }

    // Takes one ration if available.
    bool take(FoodType f) noexcept
    {
        int& n = units(f);
        if (n <= 0)
            return false;
        --n;
        return true;
    }

    bool takeMedicine() noexcept
    {
        if (medicine <= 0)
            return false;
        --medicine;
        return true;
    }
};

} // namespace ozzoo
