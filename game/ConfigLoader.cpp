#include "ConfigLoader.h"

#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>

#include "../engine/core/Logger.h"

namespace Zen {

namespace {
constexpr float kInf = std::numeric_limits<float>::infinity();
constexpr float kMinPositive = std::numeric_limits<float>::min();

void readFloat(const nlohmann::json& obj, const char* section, const char* key, float& dst,
               float minValue = -kInf, float maxValue = kInf) {
    if (!obj.contains(key)) return;
    const auto& v = obj[key];
    if (!v.is_number()) {
        Engine::logWarn(std::string("Config ") + section + "." + key + " is not a number; using default.");
        return;
    }
    const double wide = v.get<double>();
    if (!std::isfinite(wide) || std::abs(wide) > std::numeric_limits<float>::max()) {
        Engine::logWarn(std::string("Config ") + section + "." + key + " is not representable; using default.");
        return;
    }
    const auto value = static_cast<float>(wide);
    if (!(value >= minValue && value <= maxValue)) {
        Engine::logWarn(std::string("Config ") + section + "." + key + " out of range; using default.");
        return;
    }
    dst = value;
}

void readInt(const nlohmann::json& obj, const char* section, const char* key, int& dst, int minValue = 0) {
    if (!obj.contains(key)) return;
    const auto& v = obj[key];
    if (!v.is_number_integer()) {
        Engine::logWarn(std::string("Config ") + section + "." + key + " is not an integer; using default.");
        return;
    }
    constexpr auto kIntMax = static_cast<std::uint64_t>(std::numeric_limits<int>::max());
    if (v.is_number_unsigned() && v.get<std::uint64_t>() > kIntMax) {
        Engine::logWarn(std::string("Config ") + section + "." + key + " out of range; using default.");
        return;
    }
    const std::int64_t value = v.get<std::int64_t>();
    if (value < minValue || value > std::numeric_limits<int>::max()) {
        Engine::logWarn(std::string("Config ") + section + "." + key + " out of range; using default.");
        return;
    }
    dst = static_cast<int>(value);
}

const nlohmann::json* section(const nlohmann::json& j, const char* name) {
    if (!j.contains(name)) return nullptr;
    const auto& s = j[name];
    if (!s.is_object()) {
        Engine::logWarn(std::string("Config section '") + name + "' is not an object; ignored.");
        return nullptr;
    }
    return &s;
}

template <typename Enum, typename Parser>
void readEnum(const nlohmann::json& obj, const char* key, Enum& dst, Parser parse) {
    if (!obj.contains(key)) return;
    const auto& v = obj[key];
    if (!v.is_string()) {
        Engine::logWarn(std::string("Config ") + key + " is not a string; using default.");
        return;
    }
    if (auto parsed = parse(v.get<std::string>())) {
        dst = *parsed;
    } else {
        Engine::logWarn("Unknown " + std::string(key) + " '" + v.get<std::string>() + "'; using default.");
    }
}

nlohmann::json balanceToJson(const EnergyBalance& b) {
    return {{"calm", b.calm}, {"vibrant", b.vibrant}, {"intense", b.intense}};
}
}  // namespace

std::optional<GameConfig> ConfigLoader::loadFromFile(const std::string& path, const GameConfig& base) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return std::nullopt;
    }

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        Engine::logWarn("Failed to parse " + path + ": " + e.what());
        return std::nullopt;
    }
    if (!j.is_object()) {
        Engine::logWarn("Config root in " + path + " is not an object.");
        return std::nullopt;
    }
    return applyOverrides(base, j);
}

GameConfig ConfigLoader::applyOverrides(const GameConfig& base, const nlohmann::json& j) {
    GameConfig cfg = base;
    if (!j.is_object()) {
        if (!j.is_null()) {
            Engine::logWarn("Config overrides must be an object; ignored.");
        }
        return cfg;
    }

    if (j.contains("mode")) {
        std::optional<GameMode> mode;
        if (j["mode"].is_string()) {
            mode = gameModeFromString(j["mode"].get<std::string>());
        }
        if (mode) {
            // The preset replaces the tuning; identity fields carry over.
            const auto difficulty = cfg.difficulty;
            const auto seed = cfg.seed;
            const auto debug = cfg.debugMode;
            cfg = makePreset(*mode);
            cfg.difficulty = difficulty;
            cfg.seed = seed;
            cfg.debugMode = debug;
        } else {
            Engine::logWarn("Config mode is not a known game mode; using default.");
        }
    }
    readEnum(j, "difficulty", cfg.difficulty, difficultyFromString);
    if (j.contains("seed")) {
        if (j["seed"].is_number_unsigned() &&
            j["seed"].get<std::uint64_t>() <= std::numeric_limits<std::uint32_t>::max()) {
            cfg.seed = static_cast<std::uint32_t>(j["seed"].get<std::uint64_t>());
        } else {
            Engine::logWarn("Config seed is not a 32-bit unsigned integer; using default.");
        }
    }
    if (j.contains("debugMode")) {
        if (j["debugMode"].is_boolean()) {
            cfg.debugMode = j["debugMode"].get<bool>();
        } else {
            Engine::logWarn("Config debugMode is not a boolean; using default.");
        }
    }

    if (const auto* p = section(j, "physics")) {
        auto& ph = cfg.physics;
        readFloat(*p, "physics", "gravity", ph.gravity);
        readFloat(*p, "physics", "friction", ph.friction, 0.0f, 1.0f);
        readFloat(*p, "physics", "maxSpeed", ph.maxSpeed, 0.0f);
        readFloat(*p, "physics", "impulseForce", ph.impulseForce, 0.0f);
        readFloat(*p, "physics", "damping", ph.damping, 0.0f, 1.0f);
        readFloat(*p, "physics", "waveSpeed", ph.waveSpeed, 0.0f);
        readFloat(*p, "physics", "maxWaveDistance", ph.maxWaveDistance, 0.0f);
        readFloat(*p, "physics", "bounceRestitution", ph.bounceRestitution, 0.0f, 1.0f);
    }
    if (const auto* s = section(j, "spawning")) {
        auto& sp = cfg.spawning;
        readFloat(*s, "spawning", "dissonanceRate", sp.dissonanceRate);
        readFloat(*s, "spawning", "amplifierRate", sp.amplifierRate);
        readInt(*s, "spawning", "maxDissonances", sp.maxDissonances);
        readInt(*s, "spawning", "maxAmplifiers", sp.maxAmplifiers);
        readInt(*s, "spawning", "initialResonators", sp.initialResonators);
        readInt(*s, "spawning", "maxResonators", sp.maxResonators);
        readInt(*s, "spawning", "maxHarmonicWaves", sp.maxHarmonicWaves);
        readFloat(*s, "spawning", "minDissonanceDistance", sp.minDissonanceDistance, 0.0f);
        readFloat(*s, "spawning", "dissonanceLifeTime", sp.dissonanceLifeTime, 0.0f);
        readFloat(*s, "spawning", "amplifierLifeTime", sp.amplifierLifeTime, 0.0f);
        readFloat(*s, "spawning", "amplifierEffectDuration", sp.amplifierEffectDuration, kMinPositive);
    }
    if (const auto* f = section(j, "field")) {
        readFloat(*f, "field", "width", cfg.field.width, 1.0f);
        readFloat(*f, "field", "height", cfg.field.height, 1.0f);
        readFloat(*f, "field", "resonatorRingRadius", cfg.field.resonatorRingRadius, 0.0f);
    }
    if (const auto* e = section(j, "energy")) {
        auto& en = cfg.energy;
        if (const auto* b = section(*e, "initialBalance")) {
            readFloat(*b, "energy.initialBalance", "calm", en.initialBalance.calm, 0.0f);
            readFloat(*b, "energy.initialBalance", "vibrant", en.initialBalance.vibrant, 0.0f);
            readFloat(*b, "energy.initialBalance", "intense", en.initialBalance.intense, 0.0f);
        }
        readFloat(*e, "energy", "decayRate", en.decayRate, 0.0f);
        readFloat(*e, "energy", "imbalanceThreshold", en.imbalanceThreshold, 0.0f, 1.0f);
        readFloat(*e, "energy", "imbalancePenalty", en.imbalancePenalty, 0.0f);
        readFloat(*e, "energy", "balanceBonus", en.balanceBonus, 0.0f);
        readFloat(*e, "energy", "impulseCost", en.impulseCost, 0.0f);
        readFloat(*e, "energy", "waveCost", en.waveCost, 0.0f);
        readFloat(*e, "energy", "waveBalanceShift", en.waveBalanceShift, 0.0f);
        readFloat(*e, "energy", "balancePullScale", en.balancePullScale, 0.0f);
        readFloat(*e, "energy", "counterBalanceDrain", en.counterBalanceDrain, 0.0f);
    }
    if (const auto* h = section(j, "harmony")) {
        auto& hs = cfg.harmony;
        readFloat(*h, "harmony", "activationMargin", hs.activationMargin, 0.0f);
        readFloat(*h, "harmony", "resonatorActivationDuration", hs.resonatorActivationDuration, 0.0f);
        readFloat(*h, "harmony", "waveMaxLifeTime", hs.waveMaxLifeTime, 0.0f);
        readFloat(*h, "harmony", "waveBaseOpacity", hs.waveBaseOpacity, 0.0f, 1.0f);
        readFloat(*h, "harmony", "patternValuePerResonator", hs.patternValuePerResonator, 0.0f);
        readInt(*h, "harmony", "patternsPerHarmonyLevel", hs.patternsPerHarmonyLevel, 1);
        readInt(*h, "harmony", "victoryHarmonyLevel", hs.victoryHarmonyLevel, 1);
        readFloat(*h, "harmony", "connectionScore", hs.connectionScore, 0.0f);
        readFloat(*h, "harmony", "connectionDuration", hs.connectionDuration, -1.0f);
    }
    if (const auto* c = section(j, "collision")) {
        readFloat(*c, "collision", "cooldown", cfg.collision.cooldown, 0.0f);
        readFloat(*c, "collision", "knockbackForce", cfg.collision.knockbackForce, 0.0f);
        readFloat(*c, "collision", "amplifierScore", cfg.collision.amplifierScore, 0.0f);
    }
    if (const auto* v = section(j, "visual")) {
        auto& vs = cfg.visual;
        readEnum(*v, "mode", vs.mode, visualModeFromString);
        readInt(*v, "visual", "fieldResolution", vs.fieldResolution, 1);
        readInt(*v, "visual", "particleCount", vs.particleCount);
        readFloat(*v, "visual", "falloff", vs.falloff, 1.0f);
        readFloat(*v, "visual", "maxRadius", vs.maxRadius, 1.0f);
        readFloat(*v, "visual", "twistStrength", vs.twistStrength);
        readFloat(*v, "visual", "expansionRate", vs.expansionRate, 0.0f);
    }
    return cfg;
}

nlohmann::json ConfigLoader::toJson(const GameConfig& cfg) {
    nlohmann::json j;
    j["mode"] = std::string(toString(cfg.mode));
    j["difficulty"] = std::string(toString(cfg.difficulty));
    j["seed"] = cfg.seed;
    j["debugMode"] = cfg.debugMode;
    j["physics"] = {{"gravity", cfg.physics.gravity},
                    {"friction", cfg.physics.friction},
                    {"maxSpeed", cfg.physics.maxSpeed},
                    {"impulseForce", cfg.physics.impulseForce},
                    {"damping", cfg.physics.damping},
                    {"waveSpeed", cfg.physics.waveSpeed},
                    {"maxWaveDistance", cfg.physics.maxWaveDistance},
                    {"bounceRestitution", cfg.physics.bounceRestitution}};
    j["spawning"] = {{"dissonanceRate", cfg.spawning.dissonanceRate},
                     {"amplifierRate", cfg.spawning.amplifierRate},
                     {"maxDissonances", cfg.spawning.maxDissonances},
                     {"maxAmplifiers", cfg.spawning.maxAmplifiers},
                     {"initialResonators", cfg.spawning.initialResonators},
                     {"maxResonators", cfg.spawning.maxResonators},
                     {"maxHarmonicWaves", cfg.spawning.maxHarmonicWaves},
                     {"minDissonanceDistance", cfg.spawning.minDissonanceDistance},
                     {"dissonanceLifeTime", cfg.spawning.dissonanceLifeTime},
                     {"amplifierLifeTime", cfg.spawning.amplifierLifeTime},
                     {"amplifierEffectDuration", cfg.spawning.amplifierEffectDuration}};
    j["field"] = {{"width", cfg.field.width},
                  {"height", cfg.field.height},
                  {"resonatorRingRadius", cfg.field.resonatorRingRadius}};
    j["energy"] = {{"initialBalance", balanceToJson(cfg.energy.initialBalance)},
                   {"decayRate", cfg.energy.decayRate},
                   {"imbalanceThreshold", cfg.energy.imbalanceThreshold},
                   {"imbalancePenalty", cfg.energy.imbalancePenalty},
                   {"balanceBonus", cfg.energy.balanceBonus},
                   {"impulseCost", cfg.energy.impulseCost},
                   {"waveCost", cfg.energy.waveCost},
                   {"waveBalanceShift", cfg.energy.waveBalanceShift},
                   {"balancePullScale", cfg.energy.balancePullScale},
                   {"counterBalanceDrain", cfg.energy.counterBalanceDrain}};
    j["harmony"] = {{"activationMargin", cfg.harmony.activationMargin},
                    {"resonatorActivationDuration", cfg.harmony.resonatorActivationDuration},
                    {"waveMaxLifeTime", cfg.harmony.waveMaxLifeTime},
                    {"waveBaseOpacity", cfg.harmony.waveBaseOpacity},
                    {"patternValuePerResonator", cfg.harmony.patternValuePerResonator},
                    {"patternsPerHarmonyLevel", cfg.harmony.patternsPerHarmonyLevel},
                    {"victoryHarmonyLevel", cfg.harmony.victoryHarmonyLevel},
                    {"connectionScore", cfg.harmony.connectionScore},
                    {"connectionDuration", cfg.harmony.connectionDuration}};
    j["collision"] = {{"cooldown", cfg.collision.cooldown},
                      {"knockbackForce", cfg.collision.knockbackForce},
                      {"amplifierScore", cfg.collision.amplifierScore}};
    j["visual"] = {{"mode", std::string(toString(cfg.visual.mode))},
                   {"fieldResolution", cfg.visual.fieldResolution},
                   {"particleCount", cfg.visual.particleCount},
                   {"falloff", cfg.visual.falloff},
                   {"maxRadius", cfg.visual.maxRadius},
                   {"twistStrength", cfg.visual.twistStrength},
                   {"expansionRate", cfg.visual.expansionRate}};
    return j;
}

}  // namespace Zen
