#pragma once

#include <optional>
#include <string>
#include <vector>

#include "strategy/StrategyConfig.h"

namespace candlesim {
namespace strategy {

// Named, ready-to-run strategy configurations.
class StrategyPresets {
public:
    // Case-insensitive; std::nullopt for an unknown name
    static std::optional<StrategyConfig> buildFromPreset(const std::string& name);

    static std::vector<std::string> presetNames();
};

} // namespace strategy
} // namespace candlesim
