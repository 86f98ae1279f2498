#pragma once

#include <hookstream/core/events/hook_event.hpp>
#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace HookStream {

struct EventStats {
    size_t total_events = 0;
    std::map<std::string, size_t> by_type;
    std::map<std::string, size_t> by_app;
    size_t sessions = 0;
};

struct FilterOptions {
    std::vector<std::string> source_apps;
    std::vector<std::string> session_ids;  // most recently active first
    std::vector<std::string> event_types;
};

void to_json(nlohmann::json& j, const EventStats& s);
void to_json(nlohmann::json& j, const FilterOptions& f);

/**
 * @class EventStore
 * @brief Capacity-bounded, ordered in-memory log of hook events.
 *
 * Assigns ids 1, 2, 3, ... in the order appends acquire the write lock and
 * evicts the oldest events once the capacity is exceeded. Clearing the
 * store starts a new generation whose first id is 1 again.
 *
 * Thread safety:
 * - append / deleteSession / clear take the lock exclusively
 * - every read takes it shared
 * - the lock is never held outside a single member call
 *
 * Sessions are not stored separately: a session is the set of events that
 * share a session_id.
 */
class EventStore {
public:
    static constexpr size_t DEFAULT_CAPACITY = 1000;
    static constexpr size_t DEFAULT_RECENT_LIMIT = 500;
    static constexpr size_t MAX_FILTER_SESSIONS = 50;

    explicit EventStore(size_t capacity = DEFAULT_CAPACITY,
                        size_t recentLimit = DEFAULT_RECENT_LIMIT);
    ~EventStore() = default;

    EventStore(const EventStore&) = delete;
    EventStore& operator=(const EventStore&) = delete;

    /**
     * @brief Append an event, assigning its id and created_at
     * @return The event exactly as retained
     */
    StoredEvent append(HookEvent event);

    /**
     * @brief Newest events in ascending id order
     * @param limit Upper bound on the result, further capped by recentLimit()
     */
    std::vector<StoredEvent> recent(size_t limit = DEFAULT_RECENT_LIMIT) const;

    /**
     * @brief Remove every event of a session, keeping the others in order
     * @return Number of events removed (0 if the session is unknown)
     */
    size_t deleteSession(const std::string& sessionId);

    /**
     * @brief Drop all events and reset the id counter to 1
     */
    void clear();

    EventStats stats(const std::optional<std::string>& sessionId = std::nullopt) const;
    FilterOptions filterOptions() const;

    // Full retained log, oldest first
    std::vector<StoredEvent> snapshot() const;

    size_t size() const;
    uint64_t nextId() const;
    size_t capacity() const { return capacity_; }
    size_t recentLimit() const { return recent_limit_; }

private:
    const size_t capacity_;
    const size_t recent_limit_;

    mutable std::shared_mutex mutex_;
    std::deque<StoredEvent> events_;
    uint64_t next_id_ = 1;
};

} // namespace HookStream
