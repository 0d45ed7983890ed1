#include "core/state/ResultJournalJsonl.h"

#include <algorithm>
#include <fstream>

namespace candlesim {
namespace core {

namespace {
std::uint64_t parseSeq(const nlohmann::json& line) {
    return line.value("seq", static_cast<std::uint64_t>(0));
}

nlohmann::json targetToJson(const backtest::SimulationTarget& target) {
    return {
        {"id", target.id},
        {"chain", target.chain},
        {"startTime", target.start_time},
        {"endTime", target.end_time}
    };
}

backtest::SimulationTarget targetFromJson(const nlohmann::json& j) {
    backtest::SimulationTarget target;
    target.id = j.value("id", std::string());
    target.chain = j.value("chain", std::string("solana"));
    target.start_time = j.value("startTime", 0LL);
    target.end_time = j.value("endTime", 0LL);
    return target;
}
}

ResultJournalJsonl::ResultJournalJsonl(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }
        // Malformed lines are skipped; they carry no sequence number.
        const auto line = nlohmann::json::parse(row, nullptr, false);
        if (line.is_discarded() || !line.is_object()) {
            continue;
        }
        last_seq_ = (std::max)(last_seq_, parseSeq(line));
    }
}

bool ResultJournalJsonl::onResult(const std::string& scenario_id,
                                  const backtest::SimulationTarget& target,
                                  const backtest::SimulationResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (file_path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(file_path_.parent_path(), ec);
    }
    std::ofstream out(file_path_, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        return false;
    }

    const std::uint64_t next_seq = last_seq_ + 1;
    nlohmann::json line;
    line["seq"] = next_seq;
    line["scenario"] = scenario_id;
    line["target"] = targetToJson(target);
    line["result"] = backtest::toJson(result);

    out << line.dump() << "\n";
    last_seq_ = next_seq;
    return true;
}

std::vector<JournalRow> ResultJournalJsonl::readFrom(std::uint64_t seq_inclusive) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<JournalRow> out;
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return out;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }

        const auto line = nlohmann::json::parse(row, nullptr, false);
        if (line.is_discarded() || !line.is_object()) {
            continue;
        }

        const auto seq = parseSeq(line);
        if (seq < seq_inclusive) {
            continue;
        }

        JournalRow journal_row;
        journal_row.seq = seq;
        journal_row.scenario = line.value("scenario", std::string());
        journal_row.target = targetFromJson(line.value("target", nlohmann::json::object()));
        journal_row.result = backtest::resultFromJson(line.value("result", nlohmann::json::object()));
        out.push_back(std::move(journal_row));
    }

    return out;
}

std::uint64_t ResultJournalJsonl::lastSeq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_seq_;
}

} // namespace core
} // namespace candlesim
