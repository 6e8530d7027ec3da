#include "cooldown_gate.hpp"

CooldownGate::CooldownGate(std::chrono::seconds window, NowFn now)
    : window_(window), now_(now ? std::move(now) : NowFn([] { return Clock::now(); })) {}

bool CooldownGate::cooling_unlocked(const std::string& id, TimePoint now) const {
    auto it = last_action_.find(id);
    if (it == last_action_.end()) return false;
    return now - it->second < window_;
}

bool CooldownGate::is_cooling(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cooling_unlocked(id, now_());
}

void CooldownGate::record(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_action_[id] = now_();
}

std::optional<CooldownGate::TimePoint> CooldownGate::try_acquire(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    TimePoint now = now_();
    if (cooling_unlocked(id, now)) {
        return std::nullopt;
    }
    last_action_[id] = now;
    return now;
}

void CooldownGate::release(const std::string& id, TimePoint stamp) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = last_action_.find(id);
    if (it != last_action_.end() && it->second == stamp) {
        last_action_.erase(it);
    }
}

int CooldownGate::remaining_secs(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = last_action_.find(id);
    if (it == last_action_.end()) return 0;

    auto elapsed = now_() - it->second;
    if (elapsed >= window_) return 0;
    auto left = std::chrono::duration_cast<std::chrono::seconds>(window_ - elapsed);
    // Round partial seconds up so "0s left" never shows while cooling
    if (left < window_ - elapsed) left += std::chrono::seconds(1);
    return static_cast<int>(left.count());
}

std::chrono::seconds CooldownGate::window() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return window_;
}

void CooldownGate::set_window(std::chrono::seconds window) {
    std::lock_guard<std::mutex> lock(mutex_);
    window_ = window;
}
