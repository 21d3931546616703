/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "combat/CombatEncounter.hpp"
#include "combat/CombatRules.hpp"
#include "core/Logger.hpp"
#include "entities/MineableLoot.hpp"
#include "entities/MobRegistry.hpp"
#include "managers/SettingsManager.hpp"
#include "world/FloorCatalog.hpp"
#include "world/FloorState.hpp"
#include <boost/container/flat_map.hpp>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#ifndef DELVE_APP_NAME
#define DELVE_APP_NAME "delve_sim"
#endif

namespace {

const std::string DEFAULT_SETTINGS_PATH{"res/settings.json"};

struct SimOptions {
  std::string settingsPath{DEFAULT_SETTINGS_PATH};
  std::optional<uint32_t> seed;
  std::optional<std::string> floor;
  std::optional<std::string> savePath;
  std::optional<std::string> logPath;
  bool showHelp{false};
};

void printUsage() {
  std::cout << "Usage: " << DELVE_APP_NAME
            << " [--settings <path>] [--seed <n>] [--floor <name>] [--save <path>]"
               " [--log <path>]\n";
}

// Returns nullopt after printing usage on a bad command line
std::optional<SimOptions> parseArgs(int argc, char* argv[]) {
  SimOptions options;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      options.showHelp = true;
      return options;
    }
    if (i + 1 >= argc) {
      SIM_ERROR("Missing value for " + arg);
      printUsage();
      return std::nullopt;
    }

    const std::string value = argv[++i];
    if (arg == "--settings") {
      options.settingsPath = value;
    } else if (arg == "--seed") {
      try {
        options.seed = static_cast<uint32_t>(std::stoul(value));
      } catch (const std::exception&) {
        SIM_ERROR("Seed must be a non-negative integer: " + value);
        return std::nullopt;
      }
    } else if (arg == "--floor") {
      options.floor = value;
    } else if (arg == "--save") {
      options.savePath = value;
    } else if (arg == "--log") {
      options.logPath = value;
    } else {
      SIM_ERROR("Unknown argument: " + arg);
      printUsage();
      return std::nullopt;
    }
  }
  return options;
}

DelveEngine::PlayerCombatant playerFromSettings(const DelveEngine::SettingsManager& settings) {
  using DelveEngine::CombatRules::attackRangeFromValue;

  DelveEngine::PlayerCombatant player;
  player.name = settings.get<std::string>("player", "name", "Player");
  player.stats.maxHealth = settings.get<int>("player", "max_health", 100);
  player.stats.health = player.stats.maxHealth;
  player.stats.attack = attackRangeFromValue(settings.get<int>("player", "attack", 10));
  player.stats.defense = settings.get<int>("player", "defense", 0);
  player.stats.goldFind = settings.get<int>("player", "gold_find", 0);
  player.stats.magicFind = settings.get<int>("player", "magic_find", 0);
  player.gold = settings.get<int>("player", "gold", 0);
  return player;
}

void printReport(const DelveEngine::SpawnReport& report) {
  for (const auto& rule : report.rules) {
    std::cout << "  " << rule.category << " " << rule.rule << ": " << rule.placed << "/"
              << rule.requested << "\n";
  }
  for (const auto& shortfall : report.shortfalls) {
    std::cout << "  shortfall: " << shortfall.rule << " (" << shortfall.issue << ")\n";
  }
}

// Fights every mob on the floor in id order; false once the player is defeated
bool fightFloor(DelveEngine::FloorState& floor, const DelveEngine::MobRegistry& registry,
                DelveEngine::PlayerCombatant& player, double difficulty, int maxRounds) {
  using namespace DelveEngine;

  for (EntityId mobEntity : floor.getMobIds()) {
    const auto* payload = std::get_if<MobEntity>(floor.getEntity(mobEntity));
    if (!payload) {
      continue;
    }

    auto mob = registry.instantiate(payload->mobId, floor.getRandom(), difficulty);
    if (!mob) {
      SIM_WARN("Skipping unknown mob '" + payload->mobId + "'");
      continue;
    }

    std::cout << "\n" << player.name << " engages " << mob->name << " (" << mob->stats.health
              << " hp)\n";

    CombatEncounter encounter(player, std::move(*mob), mobEntity, floor.getRandom());
    if (!encounter.start()) {
      SIM_ERROR("Encounter with entity " + std::to_string(mobEntity) + " refused to start");
      continue;
    }

    while (!encounter.isOver()) {
      if (encounter.getRoundCount() >= maxRounds) {
        for (const auto& event : encounter.cancel()) {
          std::cout << "  " << event.describe() << "\n";
        }
        break;
      }
      for (const auto& event : encounter.attack()) {
        std::cout << "  " << event.describe() << "\n";
      }
    }

    if (encounter.getState() == EncounterState::VictoryPending) {
      floor.removeEntity(mobEntity);
    } else if (encounter.getState() == EncounterState::DefeatPending) {
      std::cout << player.name << " was defeated and wakes at full health with "
                << player.gold << " gold\n";
      return false;
    }
  }
  return true;
}

// Breaks every chest and rock left on the floor; drops are tallied per item
void lootFloor(DelveEngine::FloorState& floor, const DelveEngine::MineableLoot& loot,
               DelveEngine::PlayerCombatant& player) {
  using namespace DelveEngine;

  std::vector<EntityId> targets;
  for (EntityId id = 1; id < floor.getNextId(); ++id) {
    const DungeonEntity* entity = floor.getEntity(id);
    if (entity && (std::holds_alternative<RockEntity>(*entity) ||
                   std::holds_alternative<ChestEntity>(*entity))) {
      targets.push_back(id);
    }
  }

  boost::container::flat_map<std::string, int> totals;
  int miningXp = 0;
  for (EntityId id : targets) {
    auto result = floor.mineEntity(id, loot, player.stats.magicFind);
    if (!result) {
      continue;
    }
    std::cout << "  " << result->description << ":";
    for (const auto& drop : result->drops) {
      std::cout << " " << drop;
      totals[drop.itemId] += drop.quantity;
    }
    std::cout << (result->drops.empty() ? " nothing\n" : "\n");
    miningXp += result->miningXp;
  }

  player.xp += miningXp;
  std::cout << "Looted " << targets.size() << " object(s) for " << miningXp << " mining xp\n";
  for (const auto& [item, quantity] : totals) {
    std::cout << "  " << item << " x" << quantity << "\n";
  }
}

bool writeSnapshot(const DelveEngine::FloorState& floor, const DelveEngine::FloorDefinition& def,
                   const std::string& path) {
  {
    std::ofstream out(path, std::ios::binary);
    if (!out.is_open()) {
      SIM_ERROR("Cannot open snapshot file: " + path);
      return false;
    }
    if (!floor.saveSnapshot(out)) {
      return false;
    }
  }

  std::ifstream in(path, std::ios::binary);
  auto restored = DelveEngine::FloorState::loadSnapshot(in, def.buildTerrain());
  if (!restored) {
    SIM_ERROR("Snapshot written to " + path + " could not be read back");
    return false;
  }
  if (restored->renderAscii() != floor.renderAscii()) {
    SIM_ERROR("Snapshot round trip changed the floor layout");
    return false;
  }
  SIM_INFO("Snapshot saved to " + path);
  return true;
}

} // namespace

int main(int argc, char* argv[]) {
  using namespace DelveEngine;

  auto options = parseArgs(argc, argv);
  if (!options) {
    return 1;
  }
  if (options->showHelp) {
    printUsage();
    return 0;
  }

  SettingsManager settings;
  if (!settings.loadFromFile(options->settingsPath)) {
    SIM_WARN("Failed to load " + options->settingsPath + " - using defaults");
  }

  const std::string logPath =
      options->logPath.value_or(settings.get<std::string>("logging", "file", ""));
  if (!logPath.empty() && !Logger::SetLogFile(logPath)) {
    SIM_WARN("Continuing without log file " + logPath);
  }

  const std::string mobsPath = settings.get<std::string>("data", "mobs", "res/data/mobs.json");
  const std::string floorsPath =
      settings.get<std::string>("data", "floors", "res/data/floors.json");

  const std::string mineablesPath =
      settings.get<std::string>("data", "mineables", "res/data/mineables.json");

  auto registry = MobRegistry::loadFromFile(mobsPath);
  auto catalog = FloorCatalog::loadFromFile(floorsPath);
  auto mineables = MineableLoot::loadFromFile(mineablesPath);
  if (!registry || !catalog || !mineables) {
    SIM_CRITICAL("Game data failed to load");
    return 1;
  }

  const std::string floorName =
      options->floor.value_or(settings.get<std::string>("simulation", "floor", "entrance"));
  const FloorDefinition* def = catalog->find(floorName);
  if (!def) {
    SIM_CRITICAL("Unknown floor '" + floorName + "'");
    return 1;
  }

  try {
    def->spawnTable.validate(&*registry);
  } catch (const std::invalid_argument& e) {
    SIM_CRITICAL(std::string("Floor '") + floorName + "' has a bad spawn table: " + e.what());
    return 1;
  }

  auto terrain = def->buildTerrain();
  if (!terrain) {
    return 1;
  }

  const uint32_t seed = options->seed.value_or(
      static_cast<uint32_t>(settings.get<int>("simulation", "seed", 1)));
  FloorState floor(std::move(terrain), seed);

  SIM_INFO("Generating floor '" + floorName + "' with seed " + std::to_string(seed));
  SpawnReport report = floor.populate(def->spawnTable, &*registry);

  std::cout << "Floor '" << floorName << "' (seed " << seed << ")\n" << floor.renderAscii();
  printReport(report);

  if (options->savePath && !writeSnapshot(floor, *def, *options->savePath)) {
    return 1;
  }

  PlayerCombatant player = playerFromSettings(settings);
  const int maxRounds = settings.get<int>("simulation", "max_rounds", 200);
  const bool survived = fightFloor(floor, *registry, player, def->difficulty, maxRounds);
  if (survived) {
    std::cout << "\n";
    lootFloor(floor, *mineables, player);
  }

  std::cout << "\n" << floor.renderAscii();
  std::cout << player.name << ": " << player.stats.health << "/" << player.stats.maxHealth
            << " hp, " << player.gold << " gold, " << player.xp << " xp"
            << (survived ? "" : " (defeated)") << "\n";
  std::cout << Logger::GetCount(LogLevel::ERROR_LEVEL) << " error(s), "
            << Logger::GetCount(LogLevel::WARNING) << " warning(s) logged\n";
  return 0;
}
