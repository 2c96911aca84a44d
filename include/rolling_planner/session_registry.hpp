// === Session Registry ========================================================
//
// Store of externally-hosted collaborative sessions. The discussion monitor
// and the cycle manager only observe and reap sessions through this interface;
// creating and advancing sessions is the collaborative runtime's business.
// `InMemorySessionRegistry` is the injected default used by the runtime and
// the tests.

#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>

#include "rolling_planner/types.hpp"

namespace rolling_planner {

/** @brief Lifecycle tag carried by each session. */
enum class SessionStatus {
    Active,
    Completed,
    Dissolved,
    Failed,
    ForceCleaned
};

[[nodiscard]] std::string_view to_string(SessionStatus status) noexcept;

/** @brief Snapshot of one session's progress. */
struct SessionProgress final {
    std::string session_id{};
    std::set<std::string> participants{};
    int iteration{};
    int max_iterations{};
    double quality{};
    SessionStatus status{SessionStatus::Active};
    TimePoint created_at{};
};

/** @brief Narrow interface onto the collaborative session store. */
class SessionRegistry {
  public:
    virtual ~SessionRegistry() = default;

    /** @brief Identifiers of sessions currently listed as active. */
    [[nodiscard]] virtual IdList list_active_sessions() const = 0;
    /** @brief Progress snapshot, or std::nullopt for unknown ids. */
    [[nodiscard]] virtual std::optional<SessionProgress> progress(const std::string& session_id) const = 0;
    /** @brief Dissolve a finished session; false if it could not be completed. */
    virtual bool complete_session(const std::string& session_id) = 0;
    /** @brief Overwrite a session's status regardless of progress. */
    virtual void force_update_status(const std::string& session_id, SessionStatus status) = 0;
    /** @brief Drop a session from the active listing; its status record is retained. */
    virtual void remove_session(const std::string& session_id) = 0;
    /**
     * @brief Erase the records of sessions that were already closed at the previous call.
     *
     * Closed records therefore survive one purge, so the outcome of the last
     * cycle stays queryable. Returns how many records were erased.
     */
    virtual std::size_t purge_closed_sessions() = 0;
};

/** @brief Thread-safe in-process registry. */
class InMemorySessionRegistry final : public SessionRegistry {
  public:
    /** @brief Register a new active session; throws if the id already exists. */
    void open_session(SessionProgress progress);
    /** @brief Advance iteration and quality; ignored for unknown or inactive sessions. */
    void record_iteration(const std::string& session_id, int iteration, double quality);
    /** @brief Number of status records, active or not. */
    [[nodiscard]] std::size_t record_count() const;

    [[nodiscard]] IdList list_active_sessions() const override;
    [[nodiscard]] std::optional<SessionProgress> progress(const std::string& session_id) const override;
    bool complete_session(const std::string& session_id) override;
    void force_update_status(const std::string& session_id, SessionStatus status) override;
    void remove_session(const std::string& session_id) override;
    std::size_t purge_closed_sessions() override;

  private:
    mutable std::mutex mutex_;
    std::map<std::string, SessionProgress> map_records_;
    std::set<std::string> set_listed_;
    std::set<std::string> set_purge_candidates_;
};

}  // namespace rolling_planner
