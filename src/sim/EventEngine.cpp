#include "ozzoo/sim/EventEngine.h"

#include <format>
#include <string>
#include <vector>

namespace ozzoo {

const char* ZooEventName(ZooEventKind k) noexcept
{
    switch (k)
    {
    case ZooEventKind::None:     return "quiet day";
    case ZooEventKind::Heatwave: return "heatwave";
    case ZooEventKind::Donation: return "donation";
    case ZooEventKind::Escape:   return "escape";
    }
    return "?";
}

ZooEventKind EventEngine::draw(const Tuning& t, rng::Pcg32& rng) const
{
    const double r = rng.unit();
    double edge = t.heatwaveChance;
    if (r < edge) return ZooEventKind::Heatwave;
    edge += t.donationChance;
    if (r < edge) return ZooEventKind::Donation;
    edge += t.escapeChance;
    if (r < edge) return ZooEventKind::Escape;
    return ZooEventKind::None;
}

ZooEventKind EventEngine::runDay(EventContext& ctx) const
{
    const ZooEventKind kind = draw(ctx.tuning, ctx.rng);
    apply(kind, ctx);
    return kind;
}

void EventEngine::apply(ZooEventKind kind, EventContext& ctx) const
{
    switch (kind)
    {
    case ZooEventKind::None:     break;
    case ZooEventKind::Heatwave: heatwave(ctx); break;
    case ZooEventKind::Donation: donation(ctx); break;
    case ZooEventKind::Escape:   escape(ctx); break;
    }
}

void EventEngine::heatwave(EventContext& ctx) const
{
    const Tuning& t = ctx.tuning;
    for (Enclosure& enc : ctx.enclosures)
    {
        enc.setCleanliness(enc.cleanliness() - t.heatwaveCleanlinessLoss);
        for (const AnimalId a : enc.animals())
        {
            if (!ctx.registry.valid(a))
                continue;
            auto& v = ctx.registry.get<Vitals>(a);
            v.hunger    = ClampLevel(v.hunger + t.heatwaveHungerGain);
            v.health    = ClampLevel(v.health - t.heatwaveHealthLoss);
            v.happiness = ClampLevel(v.happiness - t.heatwaveHappinessLoss);
        }
    }

    // Cooling is not optional; it may push the zoo into debt.
    if (auto paid = ctx.ledger.charge(t.heatwaveCoolingCost, "Heatwave emergency cooling"); !paid)
        ctx.log("Heatwave cooling could not be booked: " + paid.error().message, util::NotifySeverity::Error);

    ctx.log("Heatwave: animals are stressed; cooling expenses paid.", util::NotifySeverity::Warning);
}

void EventEngine::donation(EventContext& ctx) const
{
    const Tuning& t = ctx.tuning;
    if (ctx.ledger.balance() <= t.donationMinBalance)
    {
        ctx.log("A donor visited but was not convinced the zoo is doing well.", util::NotifySeverity::Info);
        return;
    }

    const double amount = ctx.rng.uniform(t.donationMin, t.donationMax);
    if (auto ok = ctx.ledger.credit(amount, "Donation"); !ok)
    {
        ctx.log("Donation rejected: " + ok.error().message, util::NotifySeverity::Error);
        return;
    }

    ctx.log(std::format("A generous donor gave ${:.2f}!", amount), util::NotifySeverity::Info);
}

void EventEngine::escape(EventContext& ctx) const
{
    std::vector<Enclosure*> occupied;
    for (Enclosure& enc : ctx.enclosures)
    {
        if (enc.size() > 0)
            occupied.push_back(&enc);
    }
    if (occupied.empty())
    {
        ctx.log("Keepers found a hole in a fence, but nobody was home to escape.", util::NotifySeverity::Info);
        return;
    }

    Enclosure& enc = *occupied[ctx.rng.index(occupied.size())];
    const AnimalId runaway = enc.animals()[ctx.rng.index(enc.size())];
    const std::string who = ctx.registry.get<AnimalInfo>(runaway).name;
    const std::string where = enc.name();

    ctx.removeAnimal(runaway, "escaped from " + where);
    ctx.log(who + " escaped from " + where + " and could not be recovered.", util::NotifySeverity::Warning);

    if (auto repaired = ctx.ledger.debit(ctx.tuning.escapeRepairCost, "Escape incident repairs"); !repaired)
        ctx.log("Fence repairs postponed: " + repaired.error().message, util::NotifySeverity::Warning);
}

} // namespace ozzoo
