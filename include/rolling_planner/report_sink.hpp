// === Report Sink =============================================================
//
// Destination for per-cycle report artifacts. The cycle manager hands it the
// meta-task set and the planning gantt data; every call is advisory and a
// failure never changes the outcome of a cycle. `FileReportSink` writes JSON
// documents and a CSV gantt table under one directory per session.

#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "rolling_planner/logging.hpp"
#include "rolling_planner/meta_task_planner.hpp"
#include "rolling_planner/target.hpp"
#include "rolling_planner/types.hpp"

namespace rolling_planner {

/** @brief One bar of the planning gantt chart: a target tracked by a platform. */
struct GanttTask final {
    std::string task_id{};   /**< `<platform>_<target>`. */
    std::string category{};  /**< Platform the bar is grouped under. */
    std::string target_id{};
    SimTimePoint start{};
    SimTimePoint end{};
    double priority{};
    ThreatLevel threat_level{ThreatLevel::Medium};
};

/** @brief Planning gantt chart data for one cycle. */
struct GanttChartData final {
    std::string title{};
    std::string cycle_id{};
    std::uint64_t cycle_number{};
    SimTimePoint cycle_start{};
    std::optional<SimTimePoint> cycle_end{};
    std::vector<GanttTask> tasks{};
    std::size_t total_targets{};
    std::size_t total_platforms{};
};

/** @brief Render @p time as `YYYY-mm-ddTHH:MM:SSZ`. */
[[nodiscard]] std::string format_timestamp(SimTimePoint time);

[[nodiscard]] nlohmann::json to_json(const GanttChartData& data);
[[nodiscard]] nlohmann::json to_json(const MetaTaskSet& meta_task_set, std::uint64_t cycle_number);

/** @brief Collaborator receiving report artifacts. */
class ReportSink {
  public:
    virtual ~ReportSink() = default;

    /** @brief True once create_session() has succeeded. */
    [[nodiscard]] virtual bool has_session() const = 0;
    /** @brief Open a session grouping the artifacts that follow. */
    virtual void create_session(const std::string& name) = 0;
    /** @brief Persist @p blob under @p label and return where it went. */
    virtual std::filesystem::path save_data(const nlohmann::json& blob, const std::string& label) = 0;
    /** @brief Render the gantt chart, or std::nullopt if nothing was produced. */
    virtual std::optional<std::filesystem::path> render_chart(const GanttChartData& data) = 0;
};

using ReportSinkPtr = std::shared_ptr<ReportSink>;

class FileReportSink final : public ReportSink {
  public:
    explicit FileReportSink(std::filesystem::path root_directory);

    [[nodiscard]] const std::filesystem::path& root_directory() const noexcept;
    [[nodiscard]] std::optional<std::filesystem::path> session_directory() const;

    [[nodiscard]] bool has_session() const override;
    void create_session(const std::string& name) override;
    std::filesystem::path save_data(const nlohmann::json& blob, const std::string& label) override;
    /** @brief Writes `<cycle_id>_gantt.csv` with one row per task. */
    std::optional<std::filesystem::path> render_chart(const GanttChartData& data) override;

  private:
    std::filesystem::path require_session() const;

    std::filesystem::path root_directory_;
    std::optional<std::filesystem::path> optional_session_directory_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace rolling_planner
