#include "ozzoo/sim/Zoo.h"
#include "ozzoo/core/Profiling.h"
#include "ozzoo/util/Text.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <format>
#include <utility>

namespace ozzoo {

namespace {

constexpr float kToastSeconds = 4.0f;

const char* CauseOfDeath(const Vitals& v, const Age& age, const SpeciesTraits& traits,
                         const Tuning& t) noexcept
{
    if (v.hunger >= t.starvingThreshold)
        return "starvation";
    if (age.years() > static_cast<float>(traits.maxAgeYears))
        return "old age";
    return "poor health";
}

} // namespace

Zoo::Zoo(const ZooSetup& setup)
    : m_name(setup.name)
    , m_tuning(setup.tuning)
    , m_rng(setup.seed)
    , m_factory(m_registry, m_rng)
    , m_ledger(setup.startingBalance, setup.overdraft)
    , m_monitor([this](std::string text, util::NotifySeverity sev, util::NotifyTarget target) {
          log(std::move(text), sev, target);
      })
{
    m_dispatcher.sink<evt::HealthCritical>().connect<&HealthMonitor::onCritical>(m_monitor);
    m_dispatcher.sink<evt::AnimalDied>().connect<&HealthMonitor::onDied>(m_monitor);
    m_dispatcher.sink<evt::AnimalBorn>().connect<&HealthMonitor::onBorn>(m_monitor);

    m_ledger.setDay(m_day);

    if (setup.starterContent)
        createDefaultSetup();

    spdlog::info("Zoo '{}' opened: {} enclosures, {} animals, balance ${:.2f} (seed {})",
                 m_name, m_enclosures.size(), animalCount(), m_ledger.balance(), setup.seed);
}

Zoo::~Zoo()
{
    m_dispatcher.sink<evt::HealthCritical>().disconnect(m_monitor);
    m_dispatcher.sink<evt::AnimalDied>().disconnect(m_monitor);
    m_dispatcher.sink<evt::AnimalBorn>().disconnect(m_monitor);
}

void Zoo::createDefaultSetup()
{
    const EnclosureId forest    = addEnclosure("Forest Enclosure", Habitat::Forest, 4);
    const EnclosureId grassland = addEnclosure("Grassland Enclosure", Habitat::Grassland, 5);
    const EnclosureId aviary    = addEnclosure("Aviary", Habitat::Aviary, 6);

    const auto place = [this](Species species, EnclosureId enc, std::string name, int years, Sex sex) {
        AnimalSpawn spawn{};
        spawn.name = std::move(name);
        spawn.ageDays = years * 365;
        spawn.sex = sex;
        if (auto placed = placeNewAnimal(species, enc, spawn); !placed)
            spdlog::error("Starter animal {} not placed: {}", spawn.name, placed.error().message);
    };

    place(Species::Koala, forest, "Kiki", 2, Sex::Female);
    place(Species::Koala, forest, "Koko", 3, Sex::Male);
    place(Species::Kangaroo, grassland, "Joey", 4, Sex::Male);
    place(Species::WedgeTailedEagle, aviary, "Aerie", 5, Sex::Female);

    m_inventory.units(FoodType::Eucalyptus)    = 20;
    m_inventory.units(FoodType::HerbivoreFood) = 30;
    m_inventory.units(FoodType::Seeds)         = 20;
    m_inventory.units(FoodType::MeatyFood)     = 10;
    m_inventory.units(FoodType::GeneralFood)   = 25;
    m_inventory.medicine = 5;
}

// ---------------------------------------------------------------------------
// Day tick
// ---------------------------------------------------------------------------

DayReport Zoo::runDay()
{
    OZZOO_TRACY_ZONE("Zoo::runDay");

    if (m_inDay)
    {
        spdlog::warn("Day {} is already running; tick request ignored", m_day);
        return m_current;
    }

    m_inDay = true;
    m_current = DayReport{};
    m_current.day = m_day;
    m_current.openingBalance = m_ledger.balance();
    m_ledger.setDay(m_day);

    spdlog::debug("Day {} begins (balance ${:.2f})", m_day, m_current.openingBalance);

    // Animals
    const AnimalDayResult animalsDay =
        m_animalSystem.updateDay(m_registry, m_enclosures, m_inventory, m_tuning, m_rng);
    if (animalsDay.unfed > 0)
        log(std::format("{} animal(s) went unfed: no suitable food in stock.", animalsDay.unfed),
            util::NotifySeverity::Warning);
    watchHealth();

    for (const AnimalId mother : animalsDay.deliveries)
    {
        if (isAlive(mother))
            deliver(mother);
    }

    // Enclosures
    applyEnclosureEffects();
    watchHealth();

    // Visitors
    const float attractiveness = AttractivenessScore(m_enclosures, m_registry);
    m_current.visitors = SimulateVisitors(attractiveness, m_tuning, m_rng);
    if (m_current.visitors.total() > 0.0)
    {
        if (auto ok = m_ledger.credit(m_current.visitors.total(), "Visitor tickets and concessions"); !ok)
            log("Visitor income not booked: " + ok.error().message, util::NotifySeverity::Error);
    }
    log(std::format("{} visitors (attractiveness {:.0f}) spent ${:.2f}.", m_current.visitors.count,
                    m_current.visitors.attractiveness, m_current.visitors.total()));

    // Random incident
    EventContext ctx = eventContext();
    m_current.event = m_eventEngine.runDay(ctx);
    watchHealth();

    settleFinances();

    m_history.push_back(m_current);
    ++m_day;
    m_ledger.setDay(m_day);
    m_inDay = false;

    spdlog::info("Day {} closed: {} visitors, event {}, balance ${:.2f}", m_history.back().day,
                 m_history.back().visitors.count, ZooEventName(m_history.back().event),
                 m_history.back().closingBalance);
    return m_history.back();
}

void Zoo::watchHealth()
{
    std::vector<AnimalId> dead;

    auto view = m_registry.view<AnimalInfo, Vitals, HealthWatch>();
    for (auto [e, info, v, watch] : view.each())
    {
        if (v.health <= 0.0f)
        {
            dead.push_back(e);
            continue;
        }

        if (v.health < m_tuning.criticalHealth)
        {
            if (!watch.critical)
            {
                watch.critical = true;
                m_dispatcher.trigger(evt::HealthCritical{ e, info.name, v.health });
            }
        }
        else
        {
            watch.critical = false;
        }
    }

    for (const AnimalId e : dead)
    {
        const char* cause = CauseOfDeath(m_registry.get<Vitals>(e), m_registry.get<Age>(e),
                                         GetTraits(m_registry.get<AnimalInfo>(e).species), m_tuning);
        destroyAnimal(e, cause);
    }
}

void Zoo::deliver(AnimalId mother)
{
    const AnimalInfo momInfo = m_registry.get<AnimalInfo>(mother);
    const EnclosureId encId = m_registry.get<Housing>(mother).enclosure;

    auto enc = findEnclosure(encId);
    if (!enc)
        return;

    if (auto room = (*enc)->canAdmit(momInfo.species); !room)
    {
        log(std::format("{}'s newborn was lost: {}.", momInfo.name, room.error().message),
            util::NotifySeverity::Warning, util::NotifyTarget::Enclosure(encId));
        return;
    }

    AnimalSpawn spawn{};
    spawn.health = m_tuning.newbornHealth;
    spawn.happiness = m_tuning.newbornHappiness;

    const AnimalId baby = m_factory.create(momInfo.species, spawn);
    if (auto added = (*enc)->add(baby, momInfo.species); !added)
    {
        spdlog::error("Newborn could not be housed: {}", added.error().message);
        m_registry.destroy(baby);
        return;
    }
    m_registry.get<Housing>(baby).enclosure = encId;

    if (m_inDay)
        ++m_current.births;

    const AnimalInfo& babyInfo = m_registry.get<AnimalInfo>(baby);
    log(std::format("{} gave birth to {} ({}) in {}.", momInfo.name, babyInfo.name,
                    SexName(babyInfo.sex), (*enc)->name()),
        util::NotifySeverity::Info, util::NotifyTarget::Animal(babyInfo.serial));

    m_dispatcher.trigger(evt::AnimalBorn{ baby, mother, encId });
}

void Zoo::applyEnclosureEffects()
{
    for (Enclosure& enc : m_enclosures)
    {
        enc.decay(m_tuning);
        if (enc.cleanliness() >= m_tuning.dirtyThreshold || enc.size() == 0)
            continue;

        for (const AnimalId a : enc.animals())
        {
            auto& v = m_registry.get<Vitals>(a);
            v.happiness = ClampLevel(v.happiness - m_tuning.dirtyHappinessLoss);
            v.health    = ClampLevel(v.health - m_tuning.dirtyHealthLoss);
        }
        log(std::format("{} is dirty ({:.0f}%). Animals are unhappy.", enc.name(), enc.cleanliness()),
            util::NotifySeverity::Warning, util::NotifyTarget::Enclosure(enc.id()));
    }
}

void Zoo::settleFinances()
{
    const double upkeep = m_tuning.upkeepPerAnimal * static_cast<double>(animalCount()) +
                          m_tuning.upkeepPerEnclosure * static_cast<double>(m_enclosures.size());
    if (upkeep > 0.0)
    {
        if (auto ok = m_ledger.charge(upkeep, "Daily upkeep"); !ok)
            log("Upkeep not booked: " + ok.error().message, util::NotifySeverity::Error);
    }

    m_current.closingBalance = m_ledger.balance();
    m_current.income = m_ledger.incomeOn(m_day);
    m_current.expenses = m_ledger.expensesOn(m_day);

    if (m_ledger.balance() < 0.0)
        log(std::format("The zoo is in debt (${:.2f}). Cut costs or attract visitors.", m_ledger.balance()),
            util::NotifySeverity::Warning);
}

EventContext Zoo::eventContext()
{
    return EventContext{
        m_registry,
        m_enclosures,
        m_ledger,
        m_tuning,
        m_rng,
        [this](AnimalId animal, const std::string&) { releaseAnimal(animal); },
        [this](const std::string& text, util::NotifySeverity sev) { log(text, sev); },
    };
}

void Zoo::triggerEvent(ZooEventKind kind)
{
    EventContext ctx = eventContext();
    m_eventEngine.apply(kind, ctx);
    if (m_inDay)
        m_current.event = kind;
    watchHealth();
}

// ---------------------------------------------------------------------------
// Player commands
// ---------------------------------------------------------------------------

Result<FeedOutcome> Zoo::feed(AnimalId animal, FoodType food)
{
    if (auto ok = requireAlive(animal, "feed"); !ok)
        return std::unexpected(ok.error());

    const AnimalInfo& info = m_registry.get<AnimalInfo>(animal);
    const FoodInfo& fi = GetFoodInfo(food);

    if (!m_inventory.take(food))
    {
        if (auto paid = m_ledger.debit(fi.unitPrice, std::format("Bought 1 {} to feed {}", fi.key, info.name)); !paid)
            return std::unexpected(paid.error());
    }

    const FeedOutcome out = ApplyFood(m_registry.get<Vitals>(animal), info.species, food, 1.0f, m_tuning);
    if (out.accepted)
        log(std::format("Fed {} with {}.", info.name, fi.key), util::NotifySeverity::Info,
            util::NotifyTarget::Animal(info.serial));
    else
        log(std::format("{} refused the {}.", info.name, fi.key), util::NotifySeverity::Warning,
            util::NotifyTarget::Animal(info.serial));
    return out;
}

Status Zoo::giveMedicine(AnimalId animal)
{
    if (auto ok = requireAlive(animal, "treat"); !ok)
        return ok;

    const Medicine med{};
    const AnimalInfo& info = m_registry.get<AnimalInfo>(animal);

    if (!m_inventory.takeMedicine())
    {
        if (auto paid = m_ledger.debit(med.unitPrice, std::format("Bought 1 {} for {}", med.name, info.name)); !paid)
            return paid;
    }

    ApplyMedicine(m_registry.get<Vitals>(animal), med);
    log(std::format("Gave {} to {} (health {:.0f}).", med.name, info.name,
                    m_registry.get<Vitals>(animal).health),
        util::NotifySeverity::Info, util::NotifyTarget::Animal(info.serial));
    return {};
}

Result<BreedOutcome> Zoo::breed(AnimalId a, AnimalId b)
{
    if (auto ok = requireAlive(a, "breed"); !ok)
        return std::unexpected(ok.error());
    if (auto ok = requireAlive(b, "breed"); !ok)
        return std::unexpected(ok.error());
    if (a == b)
        return Fail(ZooError::Code::InvalidAction, "An animal cannot breed with itself");

    const AnimalInfo& ia = m_registry.get<AnimalInfo>(a);
    const AnimalInfo& ib = m_registry.get<AnimalInfo>(b);
    const EnclosureId encId = m_registry.get<Housing>(a).enclosure;

    if (encId == kNoEnclosure || encId != m_registry.get<Housing>(b).enclosure)
        return Fail(ZooError::Code::InvalidAction,
                    std::format("{} and {} are not in the same enclosure", ia.name, ib.name));
    if (ia.species != ib.species)
        return Fail(ZooError::Code::SpeciesIncompatibility,
                    std::format("{} ({}) and {} ({}) are different species", ia.name,
                                SpeciesName(ia.species), ib.name, SpeciesName(ib.species)));
    if (ia.sex == ib.sex)
        return Fail(ZooError::Code::SpeciesIncompatibility,
                    std::format("{} and {} are both {}", ia.name, ib.name, SexName(ia.sex)));

    for (const AnimalId e : { a, b })
    {
        const AnimalInfo& info = m_registry.get<AnimalInfo>(e);
        const Vitals& v = m_registry.get<Vitals>(e);
        if (v.health < m_tuning.breedMinHealth || v.happiness < m_tuning.breedMinHappiness)
            return Fail(ZooError::Code::InvalidAction,
                        std::format("{} is not fit to breed (health {:.0f}, happiness {:.0f})",
                                    info.name, v.health, v.happiness));
        if (m_registry.get<Pregnancy>(e).active)
            return Fail(ZooError::Code::InvalidAction, info.name + " is already pregnant");
    }

    const Enclosure& enc = m_enclosures[encId];
    const auto pending = std::count_if(enc.animals().begin(), enc.animals().end(), [this](AnimalId e) {
        return m_registry.get<Pregnancy>(e).active;
    });
    if (static_cast<int>(enc.size()) + static_cast<int>(pending) + 1 > enc.capacity())
        return Fail(ZooError::Code::CapacityExceeded,
                    std::format("{} has no room for offspring", enc.name()));

    const Vitals& va = m_registry.get<Vitals>(a);
    const Vitals& vb = m_registry.get<Vitals>(b);
    const double chance = (static_cast<double>(va.happiness) + static_cast<double>(vb.happiness)) / 200.0;

    BreedOutcome out{};
    out.mother = (ia.sex == Sex::Female) ? a : b;
    out.conceived = m_rng.chance(chance);

    if (out.conceived)
    {
        m_registry.get<Pregnancy>(out.mother) = Pregnancy{ true, 0 };
        log(std::format("{} and {} are expecting!", ia.name, ib.name), util::NotifySeverity::Info,
            util::NotifyTarget::Animal(m_registry.get<AnimalInfo>(out.mother).serial));
    }
    else
    {
        log(std::format("{} and {} did not conceive this time.", ia.name, ib.name));
    }
    return out;
}

Status Zoo::buyFood(FoodType food, int quantity)
{
    if (quantity <= 0)
        return Fail(ZooError::Code::InvalidAction, "Quantity must be positive");

    const FoodInfo& fi = GetFoodInfo(food);
    const double cost = fi.unitPrice * quantity;
    if (auto paid = m_ledger.debit(cost, std::format("Bought {} x {}", quantity, fi.key)); !paid)
        return paid;

    m_inventory.units(food) += quantity;
    log(std::format("Bought {} {} for ${:.2f}.", quantity, fi.key, cost));
    return {};
}

Status Zoo::buyMedicine(int quantity)
{
    if (quantity <= 0)
        return Fail(ZooError::Code::InvalidAction, "Quantity must be positive");

    const Medicine med{};
    const double cost = med.unitPrice * quantity;
    if (auto paid = m_ledger.debit(cost, std::format("Bought {} x {}", quantity, med.name)); !paid)
        return paid;

    m_inventory.medicine += quantity;
    log(std::format("Bought {} {} for ${:.2f}.", quantity, med.name, cost));
    return {};
}

Result<AnimalId> Zoo::buyAnimal(Species species, EnclosureId enclosure)
{
    auto enc = findEnclosure(enclosure);
    if (!enc)
        return std::unexpected(enc.error());
    if (auto room = (*enc)->canAdmit(species); !room)
        return std::unexpected(room.error());

    const double price = GetTraits(species).price;
    if (auto paid = m_ledger.debit(price, std::format("Bought a {}", SpeciesName(species))); !paid)
        return std::unexpected(paid.error());

    auto placed = placeNewAnimal(species, enclosure);
    if (!placed)
    {
        // Unreachable after canAdmit; refund so the ledger stays consistent.
        if (auto refund = m_ledger.credit(price, "Refund: animal could not be placed"); !refund)
            spdlog::error("Refund failed: {}", refund.error().message);
        return placed;
    }

    log(std::format("Bought {} for ${:.2f} and placed it in {}.", describe(*placed), price, (*enc)->name()),
        util::NotifySeverity::Info, util::NotifyTarget::Animal(m_registry.get<AnimalInfo>(*placed).serial));
    return placed;
}

Result<AnimalId> Zoo::buyAnimal(std::string_view speciesName, EnclosureId enclosure)
{
    auto species = ParseSpecies(speciesName);
    if (!species)
        return std::unexpected(species.error());
    return buyAnimal(*species, enclosure);
}

Status Zoo::sellAnimal(AnimalId animal)
{
    if (auto ok = requireAlive(animal, "sell"); !ok)
        return ok;

    const std::string who = describe(animal);
    const double price = GetTraits(m_registry.get<AnimalInfo>(animal).species).price * m_tuning.saleFraction;
    if (auto paid = m_ledger.credit(price, "Sold " + who); !paid)
        return paid;

    releaseAnimal(animal);
    log(std::format("Sold {} for ${:.2f}.", who, price));
    return {};
}

Status Zoo::moveAnimal(AnimalId animal, EnclosureId target)
{
    if (auto ok = requireAlive(animal, "move"); !ok)
        return ok;

    auto dest = findEnclosure(target);
    if (!dest)
        return std::unexpected(dest.error());

    auto& housing = m_registry.get<Housing>(animal);
    const AnimalInfo& info = m_registry.get<AnimalInfo>(animal);
    if (housing.enclosure == target)
        return Fail(ZooError::Code::InvalidAction, std::format("{} is already in {}", info.name, (*dest)->name()));

    if (auto ok = (*dest)->add(animal, info.species); !ok)
        return ok;

    if (housing.enclosure < m_enclosures.size())
        m_enclosures[housing.enclosure].remove(animal);
    housing.enclosure = target;

    log(std::format("Moved {} to {}.", info.name, (*dest)->name()), util::NotifySeverity::Info,
        util::NotifyTarget::Animal(info.serial));
    return {};
}

Status Zoo::clean(EnclosureId enclosure)
{
    auto enc = findEnclosure(enclosure);
    if (!enc)
        return std::unexpected(enc.error());

    const double cost = (*enc)->cleaningCost(m_tuning);
    if (auto paid = m_ledger.debit(cost, "Cleaned " + (*enc)->name()); !paid)
        return paid;

    (*enc)->clean();
    log(std::format("Cleaned {} for ${:.2f}.", (*enc)->name(), cost), util::NotifySeverity::Info,
        util::NotifyTarget::Enclosure(enclosure));
    return {};
}

Status Zoo::upgrade(EnclosureId enclosure)
{
    auto enc = findEnclosure(enclosure);
    if (!enc)
        return std::unexpected(enc.error());

    const double cost = (*enc)->upgradeCost(m_tuning);
    if (auto paid = m_ledger.debit(cost, std::format("Upgraded {} to level {}", (*enc)->name(),
                                                     (*enc)->upgradeLevel() + 1)); !paid)
        return paid;

    (*enc)->upgrade(m_tuning);
    for (const AnimalId a : (*enc)->animals())
    {
        auto& v = m_registry.get<Vitals>(a);
        v.happiness = ClampLevel(v.happiness + m_tuning.upgradeHappinessBonus);
    }

    log(std::format("Upgraded {} to level {} (capacity {}).", (*enc)->name(), (*enc)->upgradeLevel(),
                    (*enc)->capacity()),
        util::NotifySeverity::Info, util::NotifyTarget::Enclosure(enclosure));
    return {};
}

// ---------------------------------------------------------------------------
// Construction helpers
// ---------------------------------------------------------------------------

EnclosureId Zoo::addEnclosure(std::string name, Habitat habitat, int capacity, float cleanliness)
{
    const auto id = static_cast<EnclosureId>(m_enclosures.size());
    m_enclosures.emplace_back(id, std::move(name), habitat, capacity, cleanliness);
    return id;
}

Result<AnimalId> Zoo::placeNewAnimal(Species species, EnclosureId enclosure, const AnimalSpawn& spawn)
{
    auto enc = findEnclosure(enclosure);
    if (!enc)
        return std::unexpected(enc.error());
    if (auto room = (*enc)->canAdmit(species); !room)
        return std::unexpected(room.error());

    const AnimalId e = m_factory.create(species, spawn);
    if (auto added = (*enc)->add(e, species); !added)
    {
        m_registry.destroy(e);
        return std::unexpected(added.error());
    }
    m_registry.get<Housing>(e).enclosure = enclosure;
    return e;
}

// ---------------------------------------------------------------------------
// Removal
// ---------------------------------------------------------------------------

void Zoo::releaseAnimal(AnimalId animal)
{
    if (!m_registry.valid(animal))
        return;

    const EnclosureId encId = m_registry.get<Housing>(animal).enclosure;
    if (encId < m_enclosures.size())
        m_enclosures[encId].remove(animal);
    m_registry.destroy(animal);
}

void Zoo::destroyAnimal(AnimalId animal, const std::string& cause)
{
    if (!m_registry.valid(animal))
        return;

    const AnimalInfo& info = m_registry.get<AnimalInfo>(animal);
    m_dispatcher.trigger(evt::AnimalDied{ animal, info.name, info.species, cause });

    if (m_inDay)
        ++m_current.deaths;
    releaseAnimal(animal);
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

const Enclosure* Zoo::enclosure(EnclosureId id) const noexcept
{
    return id < m_enclosures.size() ? &m_enclosures[id] : nullptr;
}

const DayReport* Zoo::lastDay() const noexcept
{
    return m_history.empty() ? nullptr : &m_history.back();
}

bool Zoo::isAlive(AnimalId animal) const noexcept
{
    if (!m_registry.valid(animal))
        return false;
    const Vitals* v = m_registry.try_get<Vitals>(animal);
    return v != nullptr && v->health > 0.0f;
}

std::vector<AnimalId> Zoo::animals() const
{
    std::vector<AnimalId> out;
    auto view = m_registry.view<AnimalInfo, Vitals>();
    for (auto [e, info, v] : view.each())
    {
        if (v.health > 0.0f)
            out.push_back(e);
    }
    std::sort(out.begin(), out.end(), [this](AnimalId l, AnimalId r) {
        return m_registry.get<AnimalInfo>(l).serial < m_registry.get<AnimalInfo>(r).serial;
    });
    return out;
}

std::size_t Zoo::animalCount() const noexcept
{
    std::size_t n = 0;
    auto view = m_registry.view<Vitals>();
    for (auto [e, v] : view.each())
    {
        if (v.health > 0.0f)
            ++n;
    }
    return n;
}

std::optional<AnimalId> Zoo::findAnimal(std::string_view nameOrSerial) const
{
    const std::string_view key = util::Trim(nameOrSerial);
    if (key.empty())
        return std::nullopt;

    const std::optional<int> serial = util::ParseInt(key);
    const std::string lowered = util::ToLower(key);

    for (const AnimalId e : animals())
    {
        const AnimalInfo& info = m_registry.get<AnimalInfo>(e);
        if (serial ? info.serial == static_cast<std::uint32_t>(*serial)
                   : util::ToLower(info.name) == lowered)
            return e;
    }
    return std::nullopt;
}

std::string Zoo::describe(AnimalId animal) const
{
    if (!m_registry.valid(animal))
        return "<gone>";
    const AnimalInfo& info = m_registry.get<AnimalInfo>(animal);
    return std::format("{} ({} #{})", info.name, SpeciesName(info.species), info.serial);
}

// ---------------------------------------------------------------------------
// Internals
// ---------------------------------------------------------------------------

void Zoo::log(std::string text, util::NotifySeverity severity, util::NotifyTarget target)
{
    switch (severity)
    {
    case util::NotifySeverity::Info:    spdlog::info("[day {}] {}", m_day, text); break;
    case util::NotifySeverity::Warning: spdlog::warn("[day {}] {}", m_day, text); break;
    case util::NotifySeverity::Error:   spdlog::error("[day {}] {}", m_day, text); break;
    }

    if (m_inDay)
        m_current.lines.push_back(text);

    const float ttl = (severity == util::NotifySeverity::Info) ? 0.0f : kToastSeconds;
    m_notifications.push(std::move(text), severity, m_day, ttl, target);
}

Status Zoo::requireAlive(AnimalId animal, std::string_view action) const
{
    if (!isAlive(animal))
        return Fail(ZooError::Code::InvalidAction,
                    std::format("Cannot {}: the animal is no longer alive", action));
    return {};
}

Result<Enclosure*> Zoo::findEnclosure(EnclosureId id)
{
    if (id >= m_enclosures.size())
        return Fail(ZooError::Code::InvalidAction, std::format("There is no enclosure #{}", id + 1));
    return &m_enclosures[id];
}

} // namespace ozzoo
