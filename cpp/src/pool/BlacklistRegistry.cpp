#include "sapool/pool/BlacklistRegistry.hpp"

#include <mutex>

namespace sapool::pool {

BlacklistRegistry::BlacklistRegistry(Clock::duration ttl)
    : ttl_(ttl) {}

BlacklistRegistry& BlacklistRegistry::global() {
    static BlacklistRegistry registry;
    return registry;
}

void BlacklistRegistry::record(std::string_view credential, Clock::time_point at) {
    std::unique_lock lock(mutex_);
    entries_.insert_or_assign(std::string(credential), at);
}

bool BlacklistRegistry::isBlacklisted(std::string_view credential, Clock::time_point now) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(std::string(credential));
    if (it == entries_.end()) {
        return false;
    }
    return now - it->second <= ttl_;
}

bool BlacklistRegistry::claim(std::string_view credential, Clock::time_point now) {
    const std::string key(credential);
    {
        std::shared_lock lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return true;
        }
        if (now - it->second <= ttl_) {
            return false;
        }
    }

    std::unique_lock lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return true;
    }
    // 另一线程可能在两次加锁之间重新拉黑
    if (now - it->second <= ttl_) {
        return false;
    }
    entries_.erase(it);
    return true;
}

std::optional<BlacklistRegistry::Clock::time_point> BlacklistRegistry::recordedAt(std::string_view credential) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(std::string(credential));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void BlacklistRegistry::erase(std::string_view credential) {
    std::unique_lock lock(mutex_);
    entries_.erase(std::string(credential));
}

void BlacklistRegistry::clear() {
    std::unique_lock lock(mutex_);
    entries_.clear();
}

std::size_t BlacklistRegistry::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

} // namespace sapool::pool
