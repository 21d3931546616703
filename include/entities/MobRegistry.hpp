/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MOB_REGISTRY_HPP
#define MOB_REGISTRY_HPP

#include "combat/CombatTypes.hpp"
#include "combat/LootTable.hpp"
#include "dungeon/GridTypes.hpp"
#include "utils/IntRange.hpp"
#include "utils/RandomSource.hpp"
#include <boost/container/flat_map.hpp>
#include <optional>
#include <string>
#include <vector>

namespace DelveEngine {

class JsonValue;

/**
 * @brief Static description of a mob kind; every range is rolled per instance
 */
struct MobSpec {
    std::string id;
    std::string name;
    MobQuality quality{MobQuality::Normal};
    IntRange maxHealth{1, 1};
    IntRange attack{0, 0};       // Base attack value; variance is added on top
    IntRange defense{0, 0};
    IntRange droppedGold{0, 0};
    IntRange droppedXp{0, 0};
    LootTable loot;
    GridSize size{1, 1};

    /// Copy with every stat range scaled and rounded (deeper floors)
    MobSpec withMultiplier(double multiplier) const;

    /// Throws std::invalid_argument on an inverted range or bad footprint
    void validate() const;
};

/**
 * @brief Immutable id -> MobSpec map
 *
 * Built once (from JSON or a list of specs) and only read afterwards.
 */
class MobRegistry {
public:
    MobRegistry() = default;

    /// @throws std::invalid_argument on an invalid spec or duplicate id
    explicit MobRegistry(std::vector<MobSpec> specs);

    /**
     * @brief Parse {"mobs": [...]}
     * @throws std::invalid_argument on malformed content
     */
    static MobRegistry fromJson(const JsonValue& root);

    /**
     * @brief Load a registry file
     * @return std::nullopt (logged) if the file is missing, unparsable or malformed
     */
    static std::optional<MobRegistry> loadFromFile(const std::string& path);

    const MobSpec* getSpec(const std::string& id) const;
    bool contains(const std::string& id) const { return m_specs.count(id) != 0; }
    size_t size() const { return m_specs.size(); }
    std::vector<std::string> getIds() const;

    /// Footprint of the mob kind, 1x1 for unknown ids
    GridSize getSize(const std::string& id) const;

    /**
     * @brief Roll a fresh instance of a mob
     * @param multiplier Stat scale applied before rolling
     * @return std::nullopt for an unknown id
     */
    std::optional<MobInstance> instantiate(const std::string& id, RandomSource& rng,
                                           double multiplier = 1.0) const;

    static MobInstance rollInstance(const MobSpec& spec, RandomSource& rng);

private:
    boost::container::flat_map<std::string, MobSpec> m_specs;
};

} // namespace DelveEngine

#endif // MOB_REGISTRY_HPP
