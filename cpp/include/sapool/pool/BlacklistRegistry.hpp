#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace sapool::pool {

// 与每日配额重置对齐
inline constexpr std::chrono::hours kBlacklistTtl{25};

// 进程内共享的限流黑名单，过期条目由 claim() 惰性清除
class BlacklistRegistry {
public:
    using Clock = std::chrono::system_clock;

    explicit BlacklistRegistry(Clock::duration ttl = kBlacklistTtl);

    static BlacklistRegistry& global();

    void record(std::string_view credential, Clock::time_point at = Clock::now());

    [[nodiscard]] bool isBlacklisted(std::string_view credential, Clock::time_point now = Clock::now()) const;

    // 未拉黑或已过期时返回 true，过期条目顺带删除
    bool claim(std::string_view credential, Clock::time_point now = Clock::now());

    [[nodiscard]] std::optional<Clock::time_point> recordedAt(std::string_view credential) const;

    void erase(std::string_view credential);
    void clear();
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] Clock::duration ttl() const noexcept { return ttl_; }

private:
    Clock::duration ttl_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Clock::time_point> entries_;
};

} // namespace sapool::pool
