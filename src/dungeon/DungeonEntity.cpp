/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "dungeon/DungeonEntity.hpp"

namespace DelveEngine {

namespace {
template <class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;
} // namespace

EntityCategory getCategory(const DungeonEntity& entity) {
    return std::visit(
        Overloaded{
            [](const DoorEntity&) { return EntityCategory::Door; },
            [](const NpcEntity&) { return EntityCategory::Npc; },
            [](const MobEntity&) { return EntityCategory::Mob; },
            [](const auto&) { return EntityCategory::Obstacle; },
        },
        entity);
}

const char* rockTypeName(RockType type) {
    switch (type) {
        case RockType::Coal: return "Coal";
        case RockType::Copper: return "Copper";
        case RockType::Iron: return "Iron";
        case RockType::Gold: return "Gold";
    }
    return "Unknown";
}

const char* craftingStationName(CraftingStationType type) {
    switch (type) {
        case CraftingStationType::Forge: return "Forge";
        case CraftingStationType::Anvil: return "Anvil";
    }
    return "Unknown";
}

std::string describeEntity(const DungeonEntity& entity) {
    return std::visit(
        Overloaded{
            [](const DoorEntity&) { return std::string("Door"); },
            [](const ChestEntity& c) {
                return "Chest#" + std::to_string(static_cast<int>(c.variant));
            },
            [](const StairsEntity&) { return std::string("Stairs"); },
            [](const RockEntity& r) { return std::string("Rock:") + rockTypeName(r.rockType); },
            [](const CraftingStationEntity& s) {
                return std::string(craftingStationName(s.stationType));
            },
            [](const NpcEntity& n) { return "Npc:" + n.mobId; },
            [](const MobEntity& m) { return "Mob:" + m.mobId; },
        },
        entity);
}

char entityGlyph(const DungeonEntity& entity) {
    return std::visit(
        Overloaded{
            [](const DoorEntity&) { return 'D'; },
            [](const ChestEntity&) { return 'C'; },
            [](const StairsEntity&) { return '>'; },
            [](const RockEntity&) { return '*'; },
            [](const CraftingStationEntity& s) {
                return s.stationType == CraftingStationType::Forge ? 'F' : 'A';
            },
            [](const NpcEntity&) { return 'N'; },
            [](const MobEntity& m) {
                return m.mobId.empty() ? 'm' : m.mobId.front();
            },
        },
        entity);
}

} // namespace DelveEngine
