#include "ozzoo/sim/AnimalFactory.h"
#include "ozzoo/sim/AnimalSystem.h"

#include <string>

namespace ozzoo {

AnimalId AnimalFactory::create(Species species, const AnimalSpawn& spawn)
{
    const std::uint32_t serial = m_nextSerial++;

    AnimalInfo info{};
    info.serial = serial;
    info.species = species;
    info.sex = spawn.sex ? *spawn.sex : (m_rng.chance(0.5) ? Sex::Male : Sex::Female);
    info.name = spawn.name.empty()
        ? std::string(SpeciesName(species)) + "-" + std::to_string(serial)
        : spawn.name;

    const AnimalId e = m_registry.create();
    m_registry.emplace<AnimalInfo>(e, std::move(info));
    m_registry.emplace<Vitals>(e, ClampLevel(spawn.hunger), ClampLevel(spawn.health),
                               ClampLevel(spawn.happiness));
    m_registry.emplace<Age>(e, spawn.ageDays < 0 ? 0 : spawn.ageDays);
    m_registry.emplace<Pregnancy>(e);
    m_registry.emplace<Housing>(e);
    m_registry.emplace<HealthWatch>(e);
    return e;
}

Result<AnimalId> AnimalFactory::create(std::string_view speciesName, const AnimalSpawn& spawn)
{
    auto species = ParseSpecies(speciesName);
    if (!species)
        return std::unexpected(species.error());
    return create(*species, spawn);
}

} // namespace ozzoo
