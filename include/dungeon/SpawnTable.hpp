/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SPAWN_TABLE_HPP
#define SPAWN_TABLE_HPP

/**
 * @file SpawnTable.hpp
 * @brief Declarative list of what a floor should contain
 *
 * A SpawnTable only describes intent: which payloads, how many, and with
 * which selection policy. SpawnResolver turns it into concrete placements.
 * Rules resolve by category (doors, obstacles, NPCs, guaranteed mobs,
 * weighted mobs) and keep their declared order within a category.
 */

#include "dungeon/GridTypes.hpp"
#include "utils/IntRange.hpp"
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace DelveEngine {

class JsonValue;
class MobRegistry;

/// Resolution order; lower values are placed first
enum class SpawnCategory : uint8_t {
    Door = 0,
    Obstacle = 1,
    Npc = 2,
    GuaranteedMob = 3,
    WeightedMob = 4
};

enum class SpawnPolicy : uint8_t {
    Guaranteed,   // Exactly `count`
    CountRange,   // Count sampled uniformly from `range`
    Chance,       // One Bernoulli trial for a single instance
    Fixed         // One instance at `position`
};

enum class SpawnTarget : uint8_t {
    Chest,
    Stairs,
    Rock,
    Forge,
    Anvil,
    Npc,
    Mob,
    WeightedMobs
};

struct WeightedMobEntry {
    std::string mobId;
    int weight{0};
};

struct SpawnRule {
    SpawnTarget target{SpawnTarget::Chest};
    SpawnPolicy policy{SpawnPolicy::CountRange};
    std::string mobId;                      // Npc and Mob targets
    int count{0};                           // Guaranteed
    IntRange range{0, 0};                   // CountRange
    double chance{0.0};                     // Chance
    GridPosition position{};                // Fixed
    std::vector<WeightedMobEntry> entries;  // WeightedMobs

    SpawnCategory getCategory() const;

    /// "Rock 0..=4", "Mob dwarf_king x1", "Npc merchant @0.33", ...
    std::string describe() const;
};

class SpawnTable {
public:
    SpawnTable() = default;

    // Builder API; each call appends a rule (weighted mob calls share one pool)
    SpawnTable& chest(IntRange count);
    SpawnTable& stairs(IntRange count);
    SpawnTable& rock(IntRange count);
    SpawnTable& forge(IntRange count);
    SpawnTable& anvil(IntRange count);
    SpawnTable& forgeChance(double chance);
    SpawnTable& anvilChance(double chance);
    SpawnTable& npc(const std::string& mobId, IntRange count);
    SpawnTable& npcChance(const std::string& mobId, double chance);
    SpawnTable& guaranteedMob(const std::string& mobId, int count);
    SpawnTable& mob(const std::string& mobId, int weight);
    SpawnTable& mobCount(IntRange count);
    SpawnTable& fixed(SpawnTarget target, GridPosition position,
                      const std::string& mobId = std::string());

    SpawnTable& addRule(SpawnRule rule);

    /**
     * @brief Reject malformed rules
     *
     * Checks inverted or negative counts, chances outside [0, 1], negative
     * weights, an empty weighted pool with a non-zero count, and (when a
     * registry is given) unknown mob ids.
     *
     * @throws std::invalid_argument describing the first bad rule
     */
    void validate(const MobRegistry* registry = nullptr) const;

    const std::vector<SpawnRule>& getRules() const { return m_rules; }

    /// Rules sorted by category, declared order kept within a category
    std::vector<const SpawnRule*> getResolutionOrder() const;

    bool isEmpty() const { return m_rules.empty(); }

    /**
     * @brief The default dungeon floor table
     * @param isFinalFloor Final floors have no stairs
     */
    static SpawnTable standardFloor(bool isFinalFloor);

    /**
     * @brief Parse an array of rule objects
     * @throws std::invalid_argument on unknown kinds or missing fields
     */
    static SpawnTable fromJson(const JsonValue& rules);

private:
    SpawnRule& weightedRule();

    std::vector<SpawnRule> m_rules;
};

const char* spawnTargetName(SpawnTarget target);
std::optional<SpawnTarget> spawnTargetFromName(const std::string& name);

inline std::ostream& operator<<(std::ostream& os, const SpawnCategory& category) {
    switch (category) {
        case SpawnCategory::Door: return os << "Door";
        case SpawnCategory::Obstacle: return os << "Obstacle";
        case SpawnCategory::Npc: return os << "Npc";
        case SpawnCategory::GuaranteedMob: return os << "GuaranteedMob";
        case SpawnCategory::WeightedMob: return os << "WeightedMob";
        default: return os << "UNKNOWN";
    }
}

inline std::ostream& operator<<(std::ostream& os, const SpawnPolicy& policy) {
    switch (policy) {
        case SpawnPolicy::Guaranteed: return os << "Guaranteed";
        case SpawnPolicy::CountRange: return os << "CountRange";
        case SpawnPolicy::Chance: return os << "Chance";
        case SpawnPolicy::Fixed: return os << "Fixed";
        default: return os << "UNKNOWN";
    }
}

inline std::ostream& operator<<(std::ostream& os, const SpawnTarget& target) {
    return os << spawnTargetName(target);
}

} // namespace DelveEngine

#endif // SPAWN_TABLE_HPP
