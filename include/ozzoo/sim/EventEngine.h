#pragma once
// include/ozzoo/sim/EventEngine.h
//
// Random daily incidents. One draw per day against the cumulative
// probabilities in Tuning; at most one incident fires.

#include "ozzoo/core/Rng.h"
#include "ozzoo/sim/Components.h"
#include "ozzoo/sim/Enclosure.h"
#include "ozzoo/sim/FinanceLedger.h"
#include "ozzoo/sim/Tuning.h"
#include "ozzoo/util/NotificationLog.h"

#include <entt/entt.hpp>

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace ozzoo {

enum class ZooEventKind : std::uint8_t
{
    None = 0,
    Heatwave,
    Donation,
    Escape,
};

[[nodiscard]] const char* ZooEventName(ZooEventKind k) noexcept;

// What the engine may touch. Removal and logging go back through the zoo so
// enclosure membership and the day report stay consistent.
struct EventContext
{
    entt::registry&         registry;
    std::vector<Enclosure>& enclosures;
    FinanceLedger&          ledger;
    const Tuning&           tuning;
    rng::Pcg32&             rng;

    std::function<void(AnimalId, const std::string& cause)>        removeAnimal;
    std::function<void(const std::string&, util::NotifySeverity)>  log;
};

class EventEngine
{
public:
    [[nodiscard]] ZooEventKind draw(const Tuning& t, rng::Pcg32& rng) const;

    // Draw and apply. Returns the kind that fired (None on a quiet day).
    ZooEventKind runDay(EventContext& ctx) const;

    void apply(ZooEventKind kind, EventContext& ctx) const;

private:
    void heatwave(EventContext& ctx) const;
    void donation(EventContext& ctx) const;
    void escape(EventContext& ctx) const;
};

} // namespace ozzoo
