#include "rolling_planner/report_sink.hpp"

#include <fstream>
#include <stdexcept>
#include <string_view>
#include <system_error>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "rolling_planner/version.hpp"

namespace rolling_planner {

namespace {
constexpr int k_json_indent{2};

std::string csv_field(std::string_view value) {
    if (value.find_first_of(",\"\n") == std::string_view::npos) {
        return std::string{value};
    }
    std::string quoted{"\""};
    for (const char character : value) {
        if (character == '"') {
            quoted.push_back('"');
        }
        quoted.push_back(character);
    }
    quoted.push_back('"');
    return quoted;
}
}  // namespace

std::string format_timestamp(SimTimePoint time) {
    const std::time_t seconds = SystemClock::to_time_t(time);
    return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", fmt::gmtime(seconds));
}

nlohmann::json to_json(const GanttChartData& data) {
    nlohmann::json tasks = nlohmann::json::array();
    for (const GanttTask& task : data.tasks) {
        tasks.push_back({
            {"task_id", task.task_id},
            {"category", task.category},
            {"target_id", task.target_id},
            {"start", format_timestamp(task.start)},
            {"end", format_timestamp(task.end)},
            {"priority", task.priority},
            {"threat_level", std::string{to_string(task.threat_level)}},
            {"metadata", {{"cycle_number", data.cycle_number}, {"platform_id", task.category}, {"target_id", task.target_id}}},
        });
    }

    nlohmann::json cycle_info{
        {"cycle_id", data.cycle_id},
        {"cycle_number", data.cycle_number},
        {"start_time", format_timestamp(data.cycle_start)},
        {"end_time", nullptr},
    };
    if (data.cycle_end.has_value()) {
        cycle_info["end_time"] = format_timestamp(data.cycle_end.value());
    }

    return nlohmann::json{
        {"title", data.title},
        {"cycle_info", std::move(cycle_info)},
        {"tasks", std::move(tasks)},
        {"metadata", {{"total_targets", data.total_targets}, {"total_platforms", data.total_platforms}, {"planner_version", std::string{k_version}}}},
    };
}

nlohmann::json to_json(const MetaTaskSet& meta_task_set, std::uint64_t cycle_number) {
    nlohmann::json windows = nlohmann::json::array();
    for (const MetaTaskWindow& window : meta_task_set.windows) {
        windows.push_back({
            {"window_id", window.window_id},
            {"start", format_timestamp(window.start)},
            {"end", format_timestamp(window.end)},
            {"duration_s", window.duration().count()},
            {"target_ids", window.target_ids},
        });
    }
    return nlohmann::json{
        {"cycle_number", cycle_number},
        {"collection_time", format_timestamp(meta_task_set.collection_time)},
        {"time_range", {{"start", format_timestamp(meta_task_set.interval_start)}, {"end", format_timestamp(meta_task_set.interval_end)}}},
        {"target_ids", meta_task_set.target_ids},
        {"windows", std::move(windows)},
    };
}

FileReportSink::FileReportSink(std::filesystem::path root_directory)
    : root_directory_(std::move(root_directory)),
      logger_(get_logger()) {
    if (root_directory_.empty()) {
        throw std::invalid_argument("FileReportSink requires a root directory");
    }
}

const std::filesystem::path& FileReportSink::root_directory() const noexcept {
    return root_directory_;
}

std::optional<std::filesystem::path> FileReportSink::session_directory() const {
    return optional_session_directory_;
}

bool FileReportSink::has_session() const {
    return optional_session_directory_.has_value();
}

void FileReportSink::create_session(const std::string& name) {
    if (name.empty()) {
        throw std::invalid_argument("Report session name must not be empty");
    }
    const std::filesystem::path session_directory = root_directory_ / name;
    std::error_code error_code;
    std::filesystem::create_directories(session_directory, error_code);
    if (error_code) {
        throw std::runtime_error(fmt::format("Failed to create report session {}: {}", session_directory.string(), error_code.message()));
    }
    optional_session_directory_ = session_directory;
    logger_->info(R"({{"component":"report_sink","action":"create_session","path":"{}"}})", session_directory.string());
}

std::filesystem::path FileReportSink::save_data(const nlohmann::json& blob, const std::string& label) {
    const std::filesystem::path file_path = require_session() / fmt::format("{}.json", label);
    std::ofstream stream(file_path);
    if (!stream) {
        throw std::runtime_error(fmt::format("Failed to open {} for writing", file_path.string()));
    }
    stream << blob.dump(k_json_indent) << '\n';
    if (!stream) {
        throw std::runtime_error(fmt::format("Failed to write {}", file_path.string()));
    }
    logger_->info(R"({{"component":"report_sink","action":"save_data","label":"{}","path":"{}"}})", label, file_path.string());
    return file_path;
}

std::optional<std::filesystem::path> FileReportSink::render_chart(const GanttChartData& data) {
    if (data.tasks.empty()) {
        logger_->warn("Gantt chart for {} has no tasks; nothing rendered", data.cycle_id);
        return std::nullopt;
    }
    const std::filesystem::path file_path = require_session() / fmt::format("{}_gantt.csv", data.cycle_id);
    std::ofstream stream(file_path);
    if (!stream) {
        throw std::runtime_error(fmt::format("Failed to open {} for writing", file_path.string()));
    }
    stream << "task_id,category,target_id,start,end,priority,threat_level\n";
    for (const GanttTask& task : data.tasks) {
        stream << fmt::format("{},{},{},{},{},{},{}\n",
                              csv_field(task.task_id),
                              csv_field(task.category),
                              csv_field(task.target_id),
                              format_timestamp(task.start),
                              format_timestamp(task.end),
                              task.priority,
                              to_string(task.threat_level));
    }
    if (!stream) {
        throw std::runtime_error(fmt::format("Failed to write {}", file_path.string()));
    }
    logger_->info("Planning gantt table written to {}", file_path.string());
    return file_path;
}

std::filesystem::path FileReportSink::require_session() const {
    if (!optional_session_directory_.has_value()) {
        throw std::logic_error("FileReportSink has no active session");
    }
    return optional_session_directory_.value();
}

}  // namespace rolling_planner
