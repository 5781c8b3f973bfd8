// Reads GameConfig from JSON; unknown or invalid fields fall back to the incoming values.
#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "GameConfig.h"

namespace Zen {

class ConfigLoader {
public:
    // Returns nullopt when the file is missing or not valid JSON.
    static std::optional<GameConfig> loadFromFile(const std::string& path, const GameConfig& base = {});

    // Applies a (possibly partial) override object. A "mode" key rebases onto that mode's preset first.
    static GameConfig applyOverrides(const GameConfig& base, const nlohmann::json& j);

    static nlohmann::json toJson(const GameConfig& cfg);
};

}  // namespace Zen
