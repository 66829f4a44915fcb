#pragma once
// include/ozzoo/sim/Events.h
//
// Events published on the zoo dispatcher. Listeners subscribe through
// Zoo::events().sink<T>().connect<...>() and are invoked synchronously.

#include "ozzoo/sim/Components.h"

#include <string>

namespace ozzoo::evt {

// Health dropped below the critical threshold this day.
struct HealthCritical { AnimalId animal; std::string name; float health; };

// Published right before the entity is destroyed; `animal` is still valid
// inside the handler.
struct AnimalDied     { AnimalId animal; std::string name; Species species; std::string cause; };

struct AnimalBorn     { AnimalId animal; AnimalId mother; EnclosureId enclosure; };

} // namespace ozzoo::evt
