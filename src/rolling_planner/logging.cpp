#include "rolling_planner/logging.hpp"

#include <filesystem>
#include <mutex>
#include <stdexcept>

#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace rolling_planner {

namespace {
std::once_flag logger_once_flag;
std::shared_ptr<spdlog::logger> shared_logger;

constexpr char k_logger_name[] = "rolling_planner";
constexpr char k_log_file_name[] = "rolling_planner.log";
constexpr std::size_t k_max_file_size_bytes{10 * 1024 * 1024};
constexpr std::size_t k_max_files{5};
constexpr char k_console_pattern[] = "[%H:%M:%S.%e] [%^%l%$] %v";
// %v is either a JSON fragment or a plain message; plain messages are
// not quoted, so consumers parse "msg" leniently.
constexpr char k_file_pattern[] = R"({"ts":"%Y-%m-%dT%H:%M:%S.%eZ","level":"%l","thread":%t,"msg":%v})";
}  // namespace

std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory) {
    std::call_once(logger_once_flag, [&log_directory]() {
        const std::filesystem::path path_log_dir{log_directory};
        std::error_code error_directory;
        std::filesystem::create_directories(path_log_dir, error_directory);
        if (error_directory) {
            throw std::runtime_error("Unable to create log directory at " + path_log_dir.string() + ": "
                                     + error_directory.message());
        }

        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern(k_console_pattern);
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            (path_log_dir / k_log_file_name).string(), k_max_file_size_bytes, k_max_files);
        file_sink->set_formatter(std::make_unique<spdlog::pattern_formatter>(k_file_pattern, spdlog::pattern_time_type::utc));

        spdlog::sinks_init_list sinks{console_sink, file_sink};
        shared_logger = std::make_shared<spdlog::logger>(k_logger_name, sinks);
        shared_logger->set_level(spdlog::level::info);
        shared_logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(shared_logger);
    });
    return shared_logger;
}

std::shared_ptr<spdlog::logger> get_logger() {
    if (!shared_logger) {
        throw std::runtime_error("Logger not initialized");
    }
    return shared_logger;
}

bool set_log_level(const std::string& str_level) {
    if (!shared_logger) {
        return false;
    }
    const spdlog::level::level_enum level = spdlog::level::from_str(str_level);
    // from_str maps unknown names to off.
    if (level == spdlog::level::off && str_level != "off") {
        shared_logger->warn("Unknown log level {}; keeping info", str_level);
        shared_logger->set_level(spdlog::level::info);
        return false;
    }
    shared_logger->set_level(level);
    return true;
}

void flush_logger() noexcept {
    if (shared_logger) {
        shared_logger->flush();
    }
}

}  // namespace rolling_planner
