#include "common/Logger.h"
#include <filesystem>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <vector>

namespace candlesim {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& log_dir, const std::string& level) {
    if (initialized_) return;

    const std::filesystem::path logs_path = std::filesystem::absolute(log_dir);
    std::filesystem::create_directories(logs_path);

    try {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] %v");

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            (logs_path / "candlesim.log").string(), 1024 * 1024 * 10, 3
        );

        std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
        main_logger_ = std::make_shared<spdlog::logger>("main", sinks.begin(), sinks.end());
        main_logger_->set_level(spdlog::level::from_str(level));
        main_logger_->flush_on(spdlog::level::warn);
        spdlog::register_logger(main_logger_);

        run_logger_ = spdlog::daily_logger_mt("runs", (logs_path / "runs.log").string());
        run_logger_->set_pattern("%v");

        initialized_ = true;
        main_logger_->info("Logger initialized");
        main_logger_->info("Log directory: {}", logs_path.string());

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Log init failed: ") + ex.what());
    }
}

void Logger::logRun(const std::string& target, const std::string& scenario,
                    double final_pnl, size_t event_count, size_t candle_count) {
    if (run_logger_) {
        std::ostringstream oss;
        oss << target << "," << scenario << ","
            << std::fixed << std::setprecision(8) << final_pnl << ","
            << event_count << "," << candle_count;
        run_logger_->info(oss.str());
    }
}

} // namespace candlesim
