#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

namespace candlesim {

class Logger {
public:
    static Logger& getInstance();
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info");
    bool isInitialized() const { return initialized_; }

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->debug(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->info(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->warn(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->error(fmt, std::forward<Args>(args)...);
        }
    }

    // One CSV row per finished simulation: target,scenario,final_pnl,events,candles
    void logRun(const std::string& target, const std::string& scenario,
                double final_pnl, size_t event_count, size_t candle_count);

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> run_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) candlesim::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) candlesim::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) candlesim::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) candlesim::Logger::getInstance().error(__VA_ARGS__)

} // namespace candlesim
