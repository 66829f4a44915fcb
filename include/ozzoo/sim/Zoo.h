#pragma once
// include/ozzoo/sim/Zoo.h
//
// The zoo orchestrator. Owns the animal registry, enclosures, ledger,
// inventory and event log, and runs one simulated day at a time:
//
//   animals -> enclosures -> visitors -> random event -> settlement -> day + 1
//
// Player commands return Status/Result; a failed command leaves every piece
// of state untouched.

#include "ozzoo/core/Rng.h"
#include "ozzoo/sim/AnimalFactory.h"
#include "ozzoo/sim/AnimalSystem.h"
#include "ozzoo/sim/Components.h"
#include "ozzoo/sim/Enclosure.h"
#include "ozzoo/sim/EventEngine.h"
#include "ozzoo/sim/Events.h"
#include "ozzoo/sim/FinanceLedger.h"
#include "ozzoo/sim/HealthMonitor.h"
#include "ozzoo/sim/Inventory.h"
#include "ozzoo/sim/Tuning.h"
#include "ozzoo/sim/VisitorModel.h"
#include "ozzoo/sim/ZooError.h"
#include "ozzoo/util/NotificationLog.h"

#include <entt/entt.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ozzoo {

struct ZooSetup
{
    std::string     name = "OzZoo";
    double          startingBalance = 2000.0;
    OverdraftPolicy overdraft = OverdraftPolicy::Deny;
    rng::Seed       seed = 0x0CA1A;
    bool            starterContent = true;   // default enclosures, animals and stock
    Tuning          tuning{};
};

struct DayReport
{
    int                      day = 0;
    VisitorDay               visitors{};
    ZooEventKind             event = ZooEventKind::None;
    double                   openingBalance = 0.0;
    double                   closingBalance = 0.0;
    double                   income = 0.0;
    double                   expenses = 0.0;
    int                      births = 0;
    int                      deaths = 0;
    std::vector<std::string> lines;
};

struct BreedOutcome
{
    bool     conceived = false;
    AnimalId mother = entt::null;
};

class Zoo
{
public:
    explicit Zoo(const ZooSetup& setup = {});
    ~Zoo();

    Zoo(const Zoo&) = delete;
    Zoo& operator=(const Zoo&) = delete;

    // Day tick ---------------------------------------------------------------
    // Returns a copy of the day just closed; the same record is kept in dayHistory().
    DayReport runDay();
    [[nodiscard]] bool dayInProgress() const noexcept { return m_inDay; }

    // Player commands --------------------------------------------------------
    [[nodiscard]] Result<FeedOutcome>  feed(AnimalId animal, FoodType food);
    [[nodiscard]] Status               giveMedicine(AnimalId animal);
    [[nodiscard]] Result<BreedOutcome> breed(AnimalId a, AnimalId b);
    [[nodiscard]] Status               buyFood(FoodType food, int quantity);
    [[nodiscard]] Status               buyMedicine(int quantity);
    [[nodiscard]] Result<AnimalId>     buyAnimal(Species species, EnclosureId enclosure);
    [[nodiscard]] Result<AnimalId>     buyAnimal(std::string_view speciesName, EnclosureId enclosure);
    [[nodiscard]] Status               sellAnimal(AnimalId animal);
    [[nodiscard]] Status               moveAnimal(AnimalId animal, EnclosureId target);
    [[nodiscard]] Status               clean(EnclosureId enclosure);
    [[nodiscard]] Status               upgrade(EnclosureId enclosure);

    // Construction helpers (free of charge) -----------------------------------
    EnclosureId addEnclosure(std::string name, Habitat habitat, int capacity,
                             float cleanliness = 100.0f);
    [[nodiscard]] Result<AnimalId> placeNewAnimal(Species species, EnclosureId enclosure,
                                                  const AnimalSpawn& spawn = {});

    // Forces an incident outside the daily draw (debug menu, tests).
    void triggerEvent(ZooEventKind kind);

    // Queries ----------------------------------------------------------------
    [[nodiscard]] const std::string& name() const noexcept { return m_name; }
    [[nodiscard]] int day() const noexcept { return m_day; }
    [[nodiscard]] const Tuning& tuning() const noexcept { return m_tuning; }

    [[nodiscard]] FinanceLedger& ledger() noexcept { return m_ledger; }
    [[nodiscard]] const FinanceLedger& ledger() const noexcept { return m_ledger; }

    [[nodiscard]] Inventory& inventory() noexcept { return m_inventory; }
    [[nodiscard]] const Inventory& inventory() const noexcept { return m_inventory; }

    [[nodiscard]] const std::vector<Enclosure>& enclosures() const noexcept { return m_enclosures; }
    [[nodiscard]] const Enclosure* enclosure(EnclosureId id) const noexcept;

    [[nodiscard]] entt::registry& registry() noexcept { return m_registry; }
    [[nodiscard]] const entt::registry& registry() const noexcept { return m_registry; }
    [[nodiscard]] entt::dispatcher& events() noexcept { return m_dispatcher; }

    [[nodiscard]] util::NotificationLog& notifications() noexcept { return m_notifications; }
    [[nodiscard]] const util::NotificationLog& notifications() const noexcept { return m_notifications; }

    [[nodiscard]] const std::vector<DayReport>& dayHistory() const noexcept { return m_history; }
    [[nodiscard]] const DayReport* lastDay() const noexcept;

    [[nodiscard]] bool isAlive(AnimalId animal) const noexcept;
    [[nodiscard]] std::vector<AnimalId> animals() const;        // living, by serial
    [[nodiscard]] std::size_t animalCount() const noexcept;
    [[nodiscard]] std::optional<AnimalId> findAnimal(std::string_view nameOrSerial) const;
    [[nodiscard]] std::string describe(AnimalId animal) const;  // "Kiki (Koala #1)"

    [[nodiscard]] const HealthMonitor& healthMonitor() const noexcept { return m_monitor; }

private:
    void createDefaultSetup();

    void log(std::string text,
             util::NotifySeverity severity = util::NotifySeverity::Info,
             util::NotifyTarget target = util::NotifyTarget::None());

    [[nodiscard]] Status requireAlive(AnimalId animal, std::string_view action) const;
    [[nodiscard]] Result<Enclosure*> findEnclosure(EnclosureId id);

    // Removes the animal from its enclosure, publishes AnimalDied and destroys it.
    void destroyAnimal(AnimalId animal, const std::string& cause);

    // Sale or escape: detaches and destroys without a death notice.
    void releaseAnimal(AnimalId animal);

    // Health observer pass: raises HealthCritical once per dip and reaps the dead.
    void watchHealth();

    void deliver(AnimalId mother);
    void applyEnclosureEffects();
    void settleFinances();
    [[nodiscard]] EventContext eventContext();

    std::string            m_name;
    Tuning                 m_tuning;
    rng::Pcg32             m_rng;
    entt::registry         m_registry;
    entt::dispatcher       m_dispatcher;
    AnimalFactory          m_factory;
    FinanceLedger          m_ledger;
    Inventory              m_inventory;
    std::vector<Enclosure> m_enclosures;
    AnimalSystem           m_animalSystem;
    EventEngine            m_eventEngine;
    util::NotificationLog  m_notifications;
    HealthMonitor          m_monitor;
    std::vector<DayReport> m_history;
    DayReport              m_current;
    int                    m_day = 1;
    bool                   m_inDay = false;
};

} // namespace ozzoo
