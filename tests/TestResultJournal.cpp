#include "core/state/ResultJournalJsonl.h"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>

int main() {
    using namespace candlesim;

    const auto path = std::filesystem::temp_directory_path() / "candlesim_journal" / "test_results.jsonl";
    std::error_code ec;
    std::filesystem::remove(path, ec);

    backtest::SimulationTarget target;
    target.id = "BONK";
    target.start_time = 1700000000;

    backtest::SimulationResult first;
    first.final_pnl = 1.8;
    first.entry_price = 0.5;
    first.total_candles = 12;
    backtest::SimulationEvent entry;
    entry.type = backtest::SimulationEventType::ENTRY;
    entry.timestamp = 1700000000;
    entry.price = 0.5;
    entry.remaining_position = 1.0;
    first.events.push_back(entry);

    backtest::SimulationResult second;
    second.final_pnl = 0.0;
    second.entry_optimization.lowest_price_percent = std::nan("");

    {
        core::ResultJournalJsonl journal(path);
        if (!journal.onResult("scenario-a", target, first)) {
            std::cerr << "[TEST] onResult(first) failed\n";
            return 1;
        }
        if (!journal.onResult("scenario-a", target, second)) {
            std::cerr << "[TEST] onResult(second) failed\n";
            return 1;
        }
        if (journal.lastSeq() != 2) {
            std::cerr << "[TEST] lastSeq should be 2, got " << journal.lastSeq() << "\n";
            return 1;
        }
    }

    // A garbage line is skipped and the sequence resumes after reopening
    {
        std::ofstream out(path, std::ios::app);
        out << "not json\n";
    }
    core::ResultJournalJsonl reopened(path);
    if (reopened.lastSeq() != 2) {
        std::cerr << "[TEST] reopened lastSeq should be 2, got " << reopened.lastSeq() << "\n";
        return 1;
    }

    const auto all = reopened.readFrom(1);
    if (all.size() != 2) {
        std::cerr << "[TEST] readFrom(1) should return 2 rows, got " << all.size() << "\n";
        return 1;
    }
    const auto& row = all.front();
    if (row.scenario != "scenario-a" || row.target.id != "BONK" || row.target.start_time != 1700000000) {
        std::cerr << "[TEST] unexpected row header: " << row.scenario << " " << row.target.id << "\n";
        return 1;
    }
    if (row.result.final_pnl != 1.8 || row.result.events.size() != 1 ||
        row.result.events.front().type != backtest::SimulationEventType::ENTRY) {
        std::cerr << "[TEST] result did not survive the journal\n";
        return 1;
    }
    if (!std::isnan(all.back().result.entry_optimization.lowest_price_percent)) {
        std::cerr << "[TEST] NaN should come back as NaN\n";
        return 1;
    }

    if (!reopened.onResult("scenario-b", target, first) || reopened.lastSeq() != 3) {
        std::cerr << "[TEST] append after reopen failed\n";
        return 1;
    }
    const auto tail = reopened.readFrom(3);
    if (tail.size() != 1 || tail.front().scenario != "scenario-b") {
        std::cerr << "[TEST] readFrom(3) should return the last row only\n";
        return 1;
    }

    std::filesystem::remove_all(path.parent_path(), ec);
    std::cout << "[TEST] ResultJournal PASSED\n";
    return 0;
}
