#pragma once
// include/ozzoo/sim/Enclosure.h

#include "ozzoo/sim/Components.h"
#include "ozzoo/sim/Species.h"
#include "ozzoo/sim/Tuning.h"
#include "ozzoo/sim/ZooError.h"

#include <cstddef>
#include <string>
#include <vector>

namespace ozzoo {

// Holds references to animals; the registry owns them. Contents never exceed
// capacity and only habitat-compatible species are admitted.
class Enclosure
{
public:
    Enclosure(EnclosureId id, std::string name, Habitat habitat, int capacity,
              float cleanliness = 100.0f);

    [[nodiscard]] EnclosureId id() const noexcept { return m_id; }
    [[nodiscard]] const std::string& name() const noexcept { return m_name; }
    [[nodiscard]] Habitat habitat() const noexcept { return m_habitat; }
    [[nodiscard]] int capacity() const noexcept { return m_capacity; }
    [[nodiscard]] float cleanliness() const noexcept { return m_cleanliness; }
    [[nodiscard]] int upgradeLevel() const noexcept { return m_upgradeLevel; }
    [[nodiscard]] float decayResistance() const noexcept { return m_decayResistance; }
    [[nodiscard]] const std::vector<AnimalId>& animals() const noexcept { return m_animals; }
    [[nodiscard]] std::size_t size() const noexcept { return m_animals.size(); }
    [[nodiscard]] bool full() const noexcept { return static_cast<int>(m_animals.size()) >= m_capacity; }
    [[nodiscard]] bool contains(AnimalId a) const noexcept;

    // Checks capacity, then habitat compatibility, without modifying anything.
    [[nodiscard]] Status canAdmit(Species species) const;

    [[nodiscard]] Status add(AnimalId animal, Species species);
    bool remove(AnimalId animal) noexcept;

    void setCleanliness(float value) noexcept;

    // One day of dirt: (base + perAnimal * n) * (1 - decayResistance).
    void decay(const Tuning& t) noexcept;

    [[nodiscard]] double cleaningCost(const Tuning& t) const noexcept;
    [[nodiscard]] double upgradeCost(const Tuning& t) const noexcept;

    void clean() noexcept { m_cleanliness = 100.0f; }

    // Capacity, level and decay resistance; animal bonuses are applied by the zoo.
    void upgrade(const Tuning& t) noexcept;

private:
    EnclosureId           m_id = 0;
    std::string           m_name;
    Habitat               m_habitat = Habitat::Forest;
    int                   m_capacity = 0;
    float                 m_cleanliness = 100.0f;
    int                   m_upgradeLevel = 1;
    float                 m_decayResistance = 0.0f;
    std::vector<AnimalId> m_animals;
};

} // namespace ozzoo
