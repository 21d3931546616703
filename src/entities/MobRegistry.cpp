/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/MobRegistry.hpp"
#include "combat/CombatRules.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <cmath>
#include <stdexcept>

namespace DelveEngine {

namespace {

IntRange scaleRange(IntRange range, double multiplier) {
    return IntRange{static_cast<int>(std::lround(range.min * multiplier)),
                    static_cast<int>(std::lround(range.max * multiplier))};
}

IntRange requireRange(const JsonValue& mob, const std::string& key, const std::string& id) {
    const JsonValue& value = mob[key];
    if (value.isNumber()) {
        return IntRange::exactly(value.asInt());
    }
    if (value.isArray() && value.size() == 2 && value[0].isNumber() && value[1].isNumber()) {
        return IntRange{value[0].asInt(), value[1].asInt()};
    }
    throw std::invalid_argument("Mob '" + id + "' needs '" + key +
                                "' as a number or [min, max]");
}

MobQuality parseQuality(const std::string& text, const std::string& id) {
    if (text == "Normal") {
        return MobQuality::Normal;
    }
    if (text == "Boss") {
        return MobQuality::Boss;
    }
    throw std::invalid_argument("Mob '" + id + "' has unknown quality '" + text + "'");
}

MobSpec specFromJson(const JsonValue& mob) {
    if (!mob.isObject() || !mob["id"].isString()) {
        throw std::invalid_argument("Mob entry without a string id: " + mob.toString());
    }

    MobSpec spec;
    spec.id = mob["id"].asString();
    spec.name = mob.getString("name", spec.id);
    spec.quality = parseQuality(mob.getString("quality", "Normal"), spec.id);
    spec.maxHealth = requireRange(mob, "max_health", spec.id);
    spec.attack = requireRange(mob, "attack", spec.id);
    spec.defense = requireRange(mob, "defense", spec.id);
    spec.droppedGold = requireRange(mob, "dropped_gold", spec.id);
    spec.droppedXp = requireRange(mob, "dropped_xp", spec.id);
    spec.loot = LootTable::fromJson(mob["loot"]);

    const JsonValue& size = mob["size"];
    if (!size.isNull()) {
        if (!size.isArray() || size.size() != 2 || !size[0].isNumber() || !size[1].isNumber()) {
            throw std::invalid_argument("Mob '" + spec.id + "' needs 'size' as [width, height]");
        }
        spec.size = GridSize{size[0].asInt(), size[1].asInt()};
    }

    return spec;
}

} // namespace

MobSpec MobSpec::withMultiplier(double multiplier) const {
    MobSpec scaled = *this;
    scaled.maxHealth = scaleRange(maxHealth, multiplier);
    scaled.attack = scaleRange(attack, multiplier);
    scaled.defense = scaleRange(defense, multiplier);
    scaled.droppedGold = scaleRange(droppedGold, multiplier);
    scaled.droppedXp = scaleRange(droppedXp, multiplier);
    return scaled;
}

void MobSpec::validate() const {
    if (id.empty()) {
        throw std::invalid_argument("Mob spec has an empty id");
    }
    const std::pair<const char*, IntRange> ranges[] = {
        {"max_health", maxHealth}, {"attack", attack},         {"defense", defense},
        {"dropped_gold", droppedGold}, {"dropped_xp", droppedXp}};
    for (const auto& [label, range] : ranges) {
        if (!range.isValid() || range.min < 0) {
            throw std::invalid_argument("Mob '" + id + "' has an invalid " + label + " range");
        }
    }
    if (maxHealth.min < 1) {
        throw std::invalid_argument("Mob '" + id + "' must have at least 1 max health");
    }
    if (!size.isValid()) {
        throw std::invalid_argument("Mob '" + id + "' has an invalid footprint");
    }
}

MobRegistry::MobRegistry(std::vector<MobSpec> specs) {
    m_specs.reserve(specs.size());
    for (auto& spec : specs) {
        spec.validate();
        const std::string id = spec.id;
        if (!m_specs.emplace(id, std::move(spec)).second) {
            throw std::invalid_argument("Duplicate mob id '" + id + "'");
        }
    }
    REGISTRY_DEBUG("Registered " + std::to_string(m_specs.size()) + " mob specs");
}

MobRegistry MobRegistry::fromJson(const JsonValue& root) {
    const JsonArray* mobs = root["mobs"].tryAsArray();
    if (!mobs) {
        throw std::invalid_argument("Mob registry JSON needs a 'mobs' array");
    }

    std::vector<MobSpec> specs;
    specs.reserve(mobs->size());
    for (const auto& mob : *mobs) {
        specs.push_back(specFromJson(mob));
    }
    return MobRegistry(std::move(specs));
}

std::optional<MobRegistry> MobRegistry::loadFromFile(const std::string& path) {
    JsonReader reader;
    if (!reader.loadFromFile(path)) {
        REGISTRY_ERROR("MobRegistry::loadFromFile - Failed to load " + path + ": " +
                       reader.getLastError());
        return std::nullopt;
    }

    try {
        MobRegistry registry = fromJson(reader.getRoot());
        REGISTRY_INFO("Loaded " + std::to_string(registry.size()) + " mobs from " + path);
        return registry;
    } catch (const std::invalid_argument& e) {
        REGISTRY_ERROR("MobRegistry::loadFromFile - " + path + ": " + e.what());
        return std::nullopt;
    }
}

const MobSpec* MobRegistry::getSpec(const std::string& id) const {
    auto it = m_specs.find(id);
    return it != m_specs.end() ? &it->second : nullptr;
}

std::vector<std::string> MobRegistry::getIds() const {
    std::vector<std::string> ids;
    ids.reserve(m_specs.size());
    for (const auto& [id, spec] : m_specs) {
        ids.push_back(id);
    }
    return ids;
}

GridSize MobRegistry::getSize(const std::string& id) const {
    const MobSpec* spec = getSpec(id);
    return spec ? spec->size : GridSize::single();
}

std::optional<MobInstance> MobRegistry::instantiate(const std::string& id, RandomSource& rng,
                                                    double multiplier) const {
    const MobSpec* spec = getSpec(id);
    if (!spec) {
        REGISTRY_WARN("MobRegistry::instantiate - Unknown mob id '" + id + "'");
        return std::nullopt;
    }
    if (multiplier == 1.0) {
        return rollInstance(*spec, rng);
    }
    return rollInstance(spec->withMultiplier(multiplier), rng);
}

MobInstance MobRegistry::rollInstance(const MobSpec& spec, RandomSource& rng) {
    MobInstance mob;
    mob.mobId = spec.id;
    mob.name = spec.name;
    mob.quality = spec.quality;
    mob.stats.maxHealth = spec.maxHealth.roll(rng);
    mob.stats.health = mob.stats.maxHealth;
    mob.stats.attack = CombatRules::attackRangeFromValue(spec.attack.roll(rng));
    mob.stats.defense = spec.defense.roll(rng);
    mob.baseGold = spec.droppedGold.roll(rng);
    mob.baseXp = spec.droppedXp.roll(rng);
    mob.loot = spec.loot;
    return mob;
}

} // namespace DelveEngine
