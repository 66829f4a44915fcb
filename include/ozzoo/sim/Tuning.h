#pragma once
// include/ozzoo/sim/Tuning.h
//
// Every numeric constant of the simulation. Defaults are the shipped balance;
// the settings file may override any of them (see core/Settings.h).

namespace ozzoo {

struct Tuning
{
    // Animals
    float hungerPerDayMin        = 5.0f;
    float hungerPerDayMax        = 15.0f;
    float unfedHungerPenalty     = 5.0f;
    float hungryThreshold        = 50.0f;  // happiness drains above this
    float hungryHappinessFactor  = 0.1f;
    float starvingThreshold      = 80.0f;  // health drains above this
    float starvingHealthFactor   = 0.5f;
    float wellFedThreshold       = 30.0f;
    float contentHappiness       = 60.0f;
    float wellFedHealthRegen     = 0.5f;
    float lonelyHappinessLoss    = 1.0f;
    float oldAgeHealthLoss       = 1.0f;
    float criticalHealth         = 30.0f;
    float newbornHealth          = 80.0f;
    float newbornHappiness       = 80.0f;
    bool  autoFeed               = true;
    float autoFeedFactor         = 0.8f;

    // Feeding / medicine
    float refusedHungerRelief    = 5.0f;
    float refusedHappinessLoss   = 5.0f;
    float fedHappinessFactor     = 0.3f;
    float fedHappinessCap        = 10.0f;
    float fedHealthFactor        = 0.1f;
    float fedHealthCap           = 5.0f;

    // Breeding
    float breedMinHealth         = 60.0f;
    float breedMinHappiness      = 50.0f;

    // Enclosures
    float cleanlinessDecayBase      = 2.0f;
    float cleanlinessDecayPerAnimal = 0.5f;
    float dirtyThreshold            = 30.0f;
    float dirtyHappinessLoss        = 1.0f;
    float dirtyHealthLoss           = 0.3f;
    double cleanCostBase            = 20.0;
    double upgradeCostPerLevel      = 200.0;
    int   upgradeCapacityStep       = 2;
    float upgradeDecayResistanceStep = 0.1f;
    float maxDecayResistance        = 0.5f;
    float upgradeHappinessBonus     = 5.0f;

    // Visitors
    int    minVisitors           = 5;
    int    maxVisitors           = 40;
    float  visitorJitterMin      = 0.8f;
    float  visitorJitterMax      = 1.2f;
    double ticketPrice           = 25.0;
    double concessionSpendMin    = 5.0;
    double concessionSpendMax    = 25.0;

    // Events
    double heatwaveChance        = 0.06;
    double donationChance        = 0.06;
    double escapeChance          = 0.06;
    float  heatwaveCleanlinessLoss = 15.0f;
    float  heatwaveHungerGain    = 10.0f;
    float  heatwaveHealthLoss    = 5.0f;
    float  heatwaveHappinessLoss = 10.0f;
    double heatwaveCoolingCost   = 200.0;
    double donationMinBalance    = 1000.0;
    double donationMin           = 100.0;
    double donationMax           = 500.0;
    double escapeRepairCost      = 50.0;

    // Settlement
    double upkeepPerAnimal       = 4.0;
    double upkeepPerEnclosure    = 10.0;

    // Trading
    double saleFraction          = 0.5;
};

} // namespace ozzoo
