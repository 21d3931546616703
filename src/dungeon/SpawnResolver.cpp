/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "dungeon/SpawnResolver.hpp"
#include "core/Logger.hpp"
#include "entities/MobRegistry.hpp"
#include <algorithm>
#include <sstream>

namespace DelveEngine {

size_t SpawnReport::countOf(EntityCategory category) const {
    return static_cast<size_t>(
        std::count_if(placements.begin(), placements.end(),
                      [category](const Placement& p) { return getCategory(p.entity) == category; }));
}

size_t SpawnReport::countMobs(const std::string& mobId) const {
    return static_cast<size_t>(
        std::count_if(placements.begin(), placements.end(), [&mobId](const Placement& p) {
            const auto* mob = std::get_if<MobEntity>(&p.entity);
            return mob && mob->mobId == mobId;
        }));
}

SpawnResolver::SpawnResolver(const ITerrainOracle& terrain, GridOccupancy& occupancy,
                             const MobRegistry* registry, RandomSource& rng,
                             IdAllocator allocateId)
    : m_terrain(terrain), m_occupancy(occupancy), mp_registry(registry), m_rng(rng),
      m_allocateId(std::move(allocateId)) {
    if (!m_allocateId) {
        EntityId next = 1;
        for (const auto& [id, footprint] : m_occupancy.placements()) {
            next = std::max(next, id + 1);
        }
        m_allocateId = [next]() mutable { return next++; };
    }
}

SpawnReport SpawnResolver::resolve(const SpawnTable& table) {
    SpawnReport report;

    buildPool();
    SPAWN_DEBUG("Candidate pool holds " + std::to_string(m_poolCount) + " cells");

    placeDoors(report);

    for (const SpawnRule* rule : table.getResolutionOrder()) {
        resolveRule(*rule, report);
    }

    SPAWN_INFO("Placed " + std::to_string(report.placements.size()) + " entities, " +
               std::to_string(report.shortfalls.size()) + " shortfall(s), " +
               std::to_string(m_poolCount) + " candidate cells left");
    return report;
}

void SpawnResolver::buildPool() {
    const int width = m_occupancy.getWidth();
    const int height = m_occupancy.getHeight();
    m_pool.assign(static_cast<size_t>(width) * static_cast<size_t>(height), 0);
    m_poolCount = 0;

    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            if (m_terrain.isWalkable(x, y) && m_terrain.canSpawnEntity(x, y) &&
                !m_occupancy.isOccupied(x, y)) {
                m_pool[static_cast<size_t>(y) * static_cast<size_t>(width) +
                       static_cast<size_t>(x)] = 1;
                ++m_poolCount;
            }
        }
    }
}

bool SpawnResolver::inPool(int x, int y) const {
    if (!m_occupancy.inBounds(x, y)) {
        return false;
    }
    return m_pool[static_cast<size_t>(y) * static_cast<size_t>(m_occupancy.getWidth()) +
                  static_cast<size_t>(x)] != 0;
}

void SpawnResolver::removeFromPool(GridPosition pos, GridSize size) {
    Footprint{pos, size}.forEachCell([this](int x, int y) {
        if (inPool(x, y)) {
            m_pool[static_cast<size_t>(y) * static_cast<size_t>(m_occupancy.getWidth()) +
                   static_cast<size_t>(x)] = 0;
            --m_poolCount;
        }
    });
}

std::vector<GridPosition> SpawnResolver::validOrigins(GridSize size) const {
    std::vector<GridPosition> origins;
    if (!size.isValid() || m_poolCount < static_cast<size_t>(size.cellCount())) {
        return origins;
    }

    const int width = m_occupancy.getWidth();
    const int height = m_occupancy.getHeight();
    for (int y = 0; y + size.height <= height; ++y) {
        for (int x = 0; x + size.width <= width; ++x) {
            bool fits = true;
            Footprint{GridPosition{x, y}, size}.forEachCell(
                [&](int cx, int cy) { fits = fits && inPool(cx, cy); });
            if (fits) {
                origins.emplace_back(x, y);
            }
        }
    }
    return origins;
}

void SpawnResolver::placeDoors(SpawnReport& report) {
    const auto doors = m_terrain.getDoorCells();
    if (doors.empty()) {
        return;
    }

    RuleOutcome outcome{"door", SpawnCategory::Door, static_cast<int>(doors.size()), 0};
    OccupancyResult lastFailure = OccupancyResult::Success;
    for (const auto& cell : doors) {
        OccupancyResult result = commit(DoorEntity{}, cell, GridSize::single(), report);
        if (result == OccupancyResult::Success) {
            ++outcome.placed;
        } else {
            lastFailure = result;
        }
    }

    if (outcome.placed < outcome.requested) {
        SPAWN_WARN("Placed " + std::to_string(outcome.placed) + " of " +
                   std::to_string(outcome.requested) + " doors");
        report.shortfalls.push_back(SpawnShortfall{
            outcome.rule, SpawnCategory::Door, outcome.requested, outcome.placed,
            lastFailure == OccupancyResult::Conflict ? SpawnIssue::OccupancyConflict
                                                     : SpawnIssue::InvalidFootprint});
    }
    report.rules.push_back(outcome);
}

int SpawnResolver::sampleCount(const SpawnRule& rule) {
    switch (rule.policy) {
        case SpawnPolicy::Guaranteed:
            return std::max(0, rule.count);
        case SpawnPolicy::CountRange:
            return std::max(0, rule.range.roll(m_rng));
        case SpawnPolicy::Chance:
            return m_rng.chance(rule.chance) ? 1 : 0;
        case SpawnPolicy::Fixed:
            return 1;
    }
    return 0;
}

const WeightedMobEntry* SpawnResolver::selectWeighted(const SpawnRule& rule, int totalWeight) {
    const int roll = m_rng.intInRange(0, totalWeight - 1);
    int cumulative = 0;
    for (const auto& entry : rule.entries) {
        cumulative += std::max(0, entry.weight);
        if (roll < cumulative) {
            return &entry;
        }
    }
    return rule.entries.empty() ? nullptr : &rule.entries.front();
}

GridSize SpawnResolver::sizeFor(SpawnTarget target, const std::string& mobId) const {
    if (target == SpawnTarget::Mob || target == SpawnTarget::WeightedMobs) {
        return mp_registry ? mp_registry->getSize(mobId) : GridSize::single();
    }
    return GridSize::single();
}

DungeonEntity SpawnResolver::makePayload(const SpawnRule& rule, const std::string& mobId) {
    switch (rule.target) {
        case SpawnTarget::Chest:
            return ChestEntity{static_cast<uint8_t>(m_rng.intInRange(0, CHEST_VARIANT_COUNT - 1))};
        case SpawnTarget::Stairs:
            return StairsEntity{};
        case SpawnTarget::Rock: {
            RockEntity rock;
            rock.rockType = ALL_ROCK_TYPES[m_rng.index(ALL_ROCK_TYPES.size())];
            rock.spriteVariant =
                static_cast<uint8_t>(m_rng.intInRange(0, ROCK_SPRITE_VARIANT_COUNT - 1));
            return rock;
        }
        case SpawnTarget::Forge:
            return CraftingStationEntity{CraftingStationType::Forge};
        case SpawnTarget::Anvil:
            return CraftingStationEntity{CraftingStationType::Anvil};
        case SpawnTarget::Npc:
            return NpcEntity{mobId};
        case SpawnTarget::Mob:
        case SpawnTarget::WeightedMobs:
            return MobEntity{mobId};
    }
    return StairsEntity{};
}

OccupancyResult SpawnResolver::commit(const DungeonEntity& entity, GridPosition pos,
                                      GridSize size, SpawnReport& report) {
    const EntityId id = m_allocateId();
    OccupancyResult result = m_occupancy.occupy(pos, size, id);
    if (result != OccupancyResult::Success) {
        return result;
    }

    removeFromPool(pos, size);
    report.placements.push_back(Placement{id, entity, pos, size});
    return result;
}

void SpawnResolver::recordShortfall(const SpawnRule& rule, int requested, int placed,
                                    SpawnIssue issue, SpawnReport& report) {
    std::ostringstream oss;
    oss << "Rule '" << rule.describe() << "' placed " << placed << " of " << requested << " ("
        << issue << ")";
    SPAWN_WARN(oss.str());

    report.shortfalls.push_back(
        SpawnShortfall{rule.describe(), rule.getCategory(), requested, placed, issue});
}

void SpawnResolver::resolveFixed(const SpawnRule& rule, SpawnReport& report) {
    RuleOutcome outcome{rule.describe(), rule.getCategory(), 1, 0};
    const GridSize size = sizeFor(rule.target, rule.mobId);

    bool walkable = m_occupancy.footprintInBounds(rule.position, size);
    if (walkable) {
        Footprint{rule.position, size}.forEachCell(
            [&](int x, int y) { walkable = walkable && m_terrain.isWalkable(x, y); });
    }

    if (!walkable) {
        recordShortfall(rule, 1, 0, SpawnIssue::InvalidFootprint, report);
    } else {
        OccupancyResult result =
            commit(makePayload(rule, rule.mobId), rule.position, size, report);
        if (result == OccupancyResult::Success) {
            outcome.placed = 1;
        } else {
            recordShortfall(rule, 1, 0,
                            result == OccupancyResult::Conflict ? SpawnIssue::OccupancyConflict
                                                                : SpawnIssue::InvalidFootprint,
                            report);
        }
    }
    report.rules.push_back(outcome);
}

void SpawnResolver::resolveRule(const SpawnRule& rule, SpawnReport& report) {
    if (rule.policy == SpawnPolicy::Fixed) {
        resolveFixed(rule, report);
        return;
    }

    int totalWeight = 0;
    if (rule.target == SpawnTarget::WeightedMobs) {
        for (const auto& entry : rule.entries) {
            totalWeight += std::max(0, entry.weight);
        }
        if (totalWeight == 0) {
            SPAWN_DEBUG("Weighted pool '" + rule.describe() + "' has no weight, skipping");
            report.rules.push_back(RuleOutcome{rule.describe(), rule.getCategory(), 0, 0});
            return;
        }
    }

    const int requested = sampleCount(rule);
    RuleOutcome outcome{rule.describe(), rule.getCategory(), requested, 0};

    for (int slot = 0; slot < requested; ++slot) {
        std::string mobId = rule.mobId;
        if (rule.target == SpawnTarget::WeightedMobs) {
            const WeightedMobEntry* entry = selectWeighted(rule, totalWeight);
            if (!entry) {
                break;
            }
            mobId = entry->mobId;
        }

        const GridSize size = sizeFor(rule.target, mobId);
        const auto origins = validOrigins(size);
        if (origins.empty()) {
            recordShortfall(rule, requested, outcome.placed, SpawnIssue::InsufficientSpace,
                            report);
            break;
        }

        const GridPosition origin = origins[m_rng.index(origins.size())];
        OccupancyResult result = commit(makePayload(rule, mobId), origin, size, report);
        if (result != OccupancyResult::Success) {
            // Pool and grid disagree; stop rather than retry blindly
            SPAWN_ERROR("Occupancy rejected a pool cell for '" + rule.describe() + "'");
            recordShortfall(rule, requested, outcome.placed,
                            result == OccupancyResult::Conflict ? SpawnIssue::OccupancyConflict
                                                                : SpawnIssue::InvalidFootprint,
                            report);
            break;
        }
        ++outcome.placed;
    }

    report.rules.push_back(outcome);
}

} // namespace DelveEngine
