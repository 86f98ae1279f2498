#include <hookstream/core/storage/event_store.hpp>
#include <hookstream/core/utils/clock.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <mutex>
#include <set>
#include <stdexcept>
#include <unordered_set>

namespace HookStream {

void to_json(nlohmann::json& j, const EventStats& s) {
    j = nlohmann::json{
        {"total_events", s.total_events},
        {"by_type", s.by_type},
        {"by_app", s.by_app},
        {"sessions", s.sessions}
    };
}

void to_json(nlohmann::json& j, const FilterOptions& f) {
    j = nlohmann::json{
        {"source_apps", f.source_apps},
        {"session_ids", f.session_ids},
        {"event_types", f.event_types}
    };
}

EventStore::EventStore(size_t capacity, size_t recentLimit)
    : capacity_(capacity), recent_limit_(std::min(recentLimit, capacity)) {
    if (capacity_ == 0) {
        throw std::invalid_argument("EventStore capacity must be greater than zero");
    }
    spdlog::info("[EventStore] Initialized (capacity: {}, recent limit: {})",
                 capacity_, recent_limit_);
}

StoredEvent EventStore::append(HookEvent event) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    StoredEvent stored;
    stored.id = next_id_++;
    stored.source_app = std::move(event.source_app);
    stored.session_id = std::move(event.session_id);
    stored.hook_event_type = std::move(event.hook_event_type);
    stored.timestamp = std::move(event.timestamp);
    stored.payload = std::move(event.payload);
    stored.created_at = Clock::nowRfc3339();

    events_.push_back(stored);

    // Evict oldest until back within capacity
    while (events_.size() > capacity_) {
        events_.pop_front();
    }

    return stored;
}

std::vector<StoredEvent> EventStore::recent(size_t limit) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    size_t count = std::min({limit, recent_limit_, events_.size()});
    return std::vector<StoredEvent>(events_.end() - static_cast<std::ptrdiff_t>(count),
                                    events_.end());
}

size_t EventStore::deleteSession(const std::string& sessionId) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    size_t before = events_.size();
    events_.erase(std::remove_if(events_.begin(), events_.end(),
                                 [&sessionId](const StoredEvent& e) {
                                     return e.session_id == sessionId;
                                 }),
                  events_.end());
    size_t removed = before - events_.size();

    spdlog::info("[EventStore] Deleted session '{}' ({} events removed, {} retained)",
                 sessionId, removed, events_.size());
    return removed;
}

void EventStore::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    size_t dropped = events_.size();
    events_.clear();
    next_id_ = 1;
    spdlog::info("[EventStore] Cleared {} events, id counter reset", dropped);
}

EventStats EventStore::stats(const std::optional<std::string>& sessionId) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    EventStats result;
    std::set<std::string> sessions;
    for (const auto& e : events_) {
        if (sessionId && e.session_id != *sessionId) continue;

        ++result.total_events;
        ++result.by_type[e.hook_event_type];
        ++result.by_app[e.source_app];
        sessions.insert(e.session_id);
    }
    result.sessions = sessions.size();
    return result;
}

FilterOptions EventStore::filterOptions() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    FilterOptions options;
    std::unordered_set<std::string> seenApps;
    std::unordered_set<std::string> seenTypes;
    std::unordered_set<std::string> seenSessions;

    for (const auto& e : events_) {
        if (seenApps.insert(e.source_app).second) {
            options.source_apps.push_back(e.source_app);
        }
        if (seenTypes.insert(e.hook_event_type).second) {
            options.event_types.push_back(e.hook_event_type);
        }
    }

    for (auto it = events_.rbegin();
         it != events_.rend() && options.session_ids.size() < MAX_FILTER_SESSIONS; ++it) {
        if (seenSessions.insert(it->session_id).second) {
            options.session_ids.push_back(it->session_id);
        }
    }

    return options;
}

std::vector<StoredEvent> EventStore::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return std::vector<StoredEvent>(events_.begin(), events_.end());
}

size_t EventStore::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return events_.size();
}

uint64_t EventStore::nextId() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return next_id_;
}

} // namespace HookStream
