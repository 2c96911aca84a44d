#include "rolling_planner/session_registry.hpp"

#include <algorithm>
#include <stdexcept>

namespace rolling_planner {

std::string_view to_string(SessionStatus status) noexcept {
    switch (status) {
        case SessionStatus::Active:
            return "active";
        case SessionStatus::Completed:
            return "completed";
        case SessionStatus::Dissolved:
            return "dissolved";
        case SessionStatus::Failed:
            return "failed";
        case SessionStatus::ForceCleaned:
            return "force_cleaned";
    }
    return "unknown";
}

void InMemorySessionRegistry::open_session(SessionProgress progress) {
    if (progress.session_id.empty()) {
        throw std::invalid_argument("Session id cannot be empty");
    }
    std::scoped_lock lock(mutex_);
    if (map_records_.count(progress.session_id) != 0) {
        throw std::invalid_argument("Session already registered: " + progress.session_id);
    }
    const std::string session_id = progress.session_id;
    progress.status = SessionStatus::Active;
    map_records_.emplace(session_id, std::move(progress));
    set_listed_.insert(session_id);
}

void InMemorySessionRegistry::record_iteration(const std::string& session_id, int iteration, double quality) {
    std::scoped_lock lock(mutex_);
    const auto iterator_record = map_records_.find(session_id);
    if (iterator_record == map_records_.end() || iterator_record->second.status != SessionStatus::Active) {
        return;
    }
    iterator_record->second.iteration = iteration;
    iterator_record->second.quality = std::clamp(quality, 0.0, 1.0);
}

std::size_t InMemorySessionRegistry::record_count() const {
    std::scoped_lock lock(mutex_);
    return map_records_.size();
}

IdList InMemorySessionRegistry::list_active_sessions() const {
    std::scoped_lock lock(mutex_);
    IdList active_ids;
    for (const std::string& session_id : set_listed_) {
        const auto iterator_record = map_records_.find(session_id);
        if (iterator_record != map_records_.end() && iterator_record->second.status == SessionStatus::Active) {
            active_ids.push_back(session_id);
        }
    }
    return active_ids;
}

std::optional<SessionProgress> InMemorySessionRegistry::progress(const std::string& session_id) const {
    std::scoped_lock lock(mutex_);
    const auto iterator_record = map_records_.find(session_id);
    if (iterator_record == map_records_.end()) {
        return std::nullopt;
    }
    return iterator_record->second;
}

bool InMemorySessionRegistry::complete_session(const std::string& session_id) {
    std::scoped_lock lock(mutex_);
    const auto iterator_record = map_records_.find(session_id);
    if (iterator_record == map_records_.end()) {
        return false;
    }
    if (iterator_record->second.status == SessionStatus::Active) {
        iterator_record->second.status = SessionStatus::Dissolved;
    }
    set_listed_.erase(session_id);
    return true;
}

void InMemorySessionRegistry::force_update_status(const std::string& session_id, SessionStatus status) {
    std::scoped_lock lock(mutex_);
    const auto iterator_record = map_records_.find(session_id);
    if (iterator_record == map_records_.end()) {
        return;
    }
    iterator_record->second.status = status;
}

void InMemorySessionRegistry::remove_session(const std::string& session_id) {
    std::scoped_lock lock(mutex_);
    set_listed_.erase(session_id);
}

std::size_t InMemorySessionRegistry::purge_closed_sessions() {
    std::scoped_lock lock(mutex_);
    std::size_t purged_count = 0;
    for (const std::string& session_id : set_purge_candidates_) {
        if (set_listed_.count(session_id) == 0 && map_records_.erase(session_id) != 0) {
            ++purged_count;
        }
    }
    set_purge_candidates_.clear();
    for (const auto& [session_id, progress] : map_records_) {
        if (set_listed_.count(session_id) == 0) {
            set_purge_candidates_.insert(session_id);
        }
    }
    return purged_count;
}

}  // namespace rolling_planner
