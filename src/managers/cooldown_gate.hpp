#pragma once

#include <string>
#include <map>
#include <mutex>
#include <chrono>
#include <optional>
#include <functional>

// Minimum interval between state-changing operations on one instance.
// Keyed by unique instance id only; positions and names change between
// refreshes. Entries never expire.
class CooldownGate {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using NowFn = std::function<TimePoint()>;

    explicit CooldownGate(std::chrono::seconds window = std::chrono::seconds(10),
                          NowFn now = nullptr);

    // True iff less than the window has elapsed since the last record for id
    bool is_cooling(const std::string& id) const;

    // Set the last-action time for id to now
    void record(const std::string& id);

    // Atomic check-and-record. Returns the recorded stamp, or std::nullopt
    // if id is still cooling. Of two racing callers exactly one wins.
    std::optional<TimePoint> try_acquire(const std::string& id);

    // Roll back an acquisition whose operation failed. No-op if a newer
    // record has replaced `stamp` in the meantime.
    void release(const std::string& id, TimePoint stamp);

    // Seconds until id stops cooling (0 if not cooling)
    int remaining_secs(const std::string& id) const;

    std::chrono::seconds window() const;
    void set_window(std::chrono::seconds window);

private:
    std::chrono::seconds window_;
    NowFn now_;
    std::map<std::string, TimePoint> last_action_;
    mutable std::mutex mutex_;

    bool cooling_unlocked(const std::string& id, TimePoint now) const;
};
