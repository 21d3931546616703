/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef DUNGEON_ENTITY_HPP
#define DUNGEON_ENTITY_HPP

/**
 * @file DungeonEntity.hpp
 * @brief Kind-specific payloads for everything that can be placed on a floor
 *
 * A placed entity is a std::variant over plain payload structs. Code that
 * needs kind-specific behaviour dispatches with std::visit; code that only
 * needs the coarse grouping (spawn ordering, movement interaction) uses
 * getCategory().
 */

#include <array>
#include <cstdint>
#include <ostream>
#include <string>
#include <variant>

namespace DelveEngine {

enum class RockType : uint8_t { Coal, Copper, Iron, Gold };

constexpr std::array<RockType, 4> ALL_ROCK_TYPES{RockType::Coal, RockType::Copper,
                                                 RockType::Iron, RockType::Gold};
constexpr int CHEST_VARIANT_COUNT = 4;
constexpr int ROCK_SPRITE_VARIANT_COUNT = 2;

enum class CraftingStationType : uint8_t { Forge, Anvil };

struct DoorEntity {
    bool operator==(const DoorEntity&) const = default;
};

struct ChestEntity {
    uint8_t variant{0};
    bool operator==(const ChestEntity&) const = default;
};

struct StairsEntity {
    bool operator==(const StairsEntity&) const = default;
};

struct RockEntity {
    RockType rockType{RockType::Coal};
    uint8_t spriteVariant{0};
    bool operator==(const RockEntity&) const = default;
};

struct CraftingStationEntity {
    CraftingStationType stationType{CraftingStationType::Forge};
    bool operator==(const CraftingStationEntity&) const = default;
};

/// Non-combat character that blocks movement (merchant etc.)
struct NpcEntity {
    std::string mobId;
    bool operator==(const NpcEntity&) const = default;
};

struct MobEntity {
    std::string mobId;
    bool operator==(const MobEntity&) const = default;
};

using DungeonEntity = std::variant<DoorEntity, ChestEntity, StairsEntity, RockEntity,
                                   CraftingStationEntity, NpcEntity, MobEntity>;

/// Coarse grouping used by movement interaction and reporting
enum class EntityCategory : uint8_t {
    Door,
    Obstacle,   // Chests, stairs, rocks, crafting stations
    Npc,
    Mob
};

EntityCategory getCategory(const DungeonEntity& entity);

/// Short display name ("Chest", "Mob:goblin", ...)
std::string describeEntity(const DungeonEntity& entity);

/// Single glyph used by the headless map printer
char entityGlyph(const DungeonEntity& entity);

const char* rockTypeName(RockType type);
const char* craftingStationName(CraftingStationType type);

inline bool isMob(const DungeonEntity& entity) {
    return std::holds_alternative<MobEntity>(entity);
}

// Stream operators for test output
inline std::ostream& operator<<(std::ostream& os, const EntityCategory& category) {
    switch (category) {
        case EntityCategory::Door: return os << "Door";
        case EntityCategory::Obstacle: return os << "Obstacle";
        case EntityCategory::Npc: return os << "Npc";
        case EntityCategory::Mob: return os << "Mob";
        default: return os << "UNKNOWN";
    }
}

inline std::ostream& operator<<(std::ostream& os, const DungeonEntity& entity) {
    return os << describeEntity(entity);
}

} // namespace DelveEngine

#endif // DUNGEON_ENTITY_HPP
