#include "ozzoo/sim/Enclosure.h"

#include <algorithm>
#include <string>
#include <utility>

namespace ozzoo {

Enclosure::Enclosure(EnclosureId id, std::string name, Habitat habitat, int capacity,
                     float cleanliness)
    : m_id(id)
    , m_name(std::move(name))
    , m_habitat(habitat)
    , m_capacity(std::max(0, capacity))
    , m_cleanliness(ClampLevel(cleanliness))
{
}

bool Enclosure::contains(AnimalId a) const noexcept
{
    return std::find(m_animals.begin(), m_animals.end(), a) != m_animals.end();
}

Status Enclosure::canAdmit(Species species) const
{
    if (full())
    {
        return Fail(ZooError::Code::CapacityExceeded,
                    m_name + " is full (" + std::to_string(m_animals.size()) + "/" +
                    std::to_string(m_capacity) + ")");
    }
    if (!HabitatAccepts(m_habitat, species))
    {
        return Fail(ZooError::Code::SpeciesIncompatibility,
                    std::string(SpeciesName(species)) + " cannot live in " + m_name +
                    " (" + HabitatName(m_habitat) + ")");
    }
    return {};
}

Status Enclosure::add(AnimalId animal, Species species)
{
    if (contains(animal))
        return Fail(ZooError::Code::InvalidAction, "Animal is already in " + m_name);

    if (auto ok = canAdmit(species); !ok)
        return ok;

    m_animals.push_back(animal);
    return {};
}

bool Enclosure::remove(AnimalId animal) noexcept
{
    const auto it = std::find(m_animals.begin(), m_animals.end(), animal);
    if (it == m_animals.end())
        return false;
    m_animals.erase(it);
    return true;
}

void Enclosure::setCleanliness(float value) noexcept
{
    m_cleanliness = ClampLevel(value);
}

void Enclosure::decay(const Tuning& t) noexcept
{
    const float dirt = (t.cleanlinessDecayBase +
                        t.cleanlinessDecayPerAnimal * static_cast<float>(m_animals.size())) *
                       (1.0f - m_decayResistance);
    setCleanliness(m_cleanliness - dirt);
}

double Enclosure::cleaningCost(const Tuning& t) const noexcept
{
    return t.cleanCostBase * (1.0 + static_cast<double>(m_animals.size()) / 2.0);
}

double Enclosure::upgradeCost(const Tuning& t) const noexcept
{
    return t.upgradeCostPerLevel * static_cast<double>(m_upgradeLevel);
}

void Enclosure::upgrade(const Tuning& t) noexcept
{
    ++m_upgradeLevel;
    m_capacity += t.upgradeCapacityStep;
    m_decayResistance = std::min(t.maxDecayResistance,
                                 m_decayResistance + t.upgradeDecayResistanceStep);
}

} // namespace ozzoo
