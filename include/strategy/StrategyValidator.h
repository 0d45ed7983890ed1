#pragma once

#include <string>
#include <vector>

#include "strategy/StrategyConfig.h"

namespace candlesim {
namespace strategy {

struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
};

// Collects every invariant violation of a strategy; never throws and never stops at the first
// error. Callers decide whether to simulate an invalid configuration anyway.
class StrategyValidator {
public:
    static ValidationResult validate(const StrategyConfig& config);

private:
    static void validateLegs(const std::vector<StrategyLeg>& legs, std::vector<std::string>& errors);
    static void validateLadder(const LadderConfig& ladder, const std::string& label,
                               std::vector<std::string>& errors);
    static void validateSignalGroup(const SignalGroup& group, const std::string& label,
                                    std::vector<std::string>& errors);
};

} // namespace strategy
} // namespace candlesim
