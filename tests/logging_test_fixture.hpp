#pragma once

#include "rolling_planner/logging.hpp"

#include <filesystem>
#include <memory>

namespace rolling_planner::test {

inline void ensure_logger_initialized() {
    static const std::shared_ptr<spdlog::logger> logger_handle = []() {
        const auto log_dir = std::filesystem::temp_directory_path() / "rolling_planner_tests_logs";
        return rolling_planner::initialize_logger(log_dir.string());
    }();
    (void)logger_handle;
}

}  // namespace rolling_planner::test
