#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <vector>

#include "core/contracts/IResultSink.h"

namespace candlesim {
namespace core {

struct JournalRow {
    std::uint64_t seq = 0;
    std::string scenario;
    backtest::SimulationTarget target;
    backtest::SimulationResult result;
};

// Append-only JSON-lines journal of simulation results.
class ResultJournalJsonl : public IResultSink {
public:
    explicit ResultJournalJsonl(std::filesystem::path file_path);

    bool onResult(const std::string& scenario_id,
                  const backtest::SimulationTarget& target,
                  const backtest::SimulationResult& result) override;

    std::vector<JournalRow> readFrom(std::uint64_t seq_inclusive) const;
    std::uint64_t lastSeq() const;

private:
    std::filesystem::path file_path_;
    mutable std::mutex mutex_;
    std::uint64_t last_seq_ = 0;
};

} // namespace core
} // namespace candlesim
