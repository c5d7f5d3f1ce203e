#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sapool::pool {

struct CredentialEntry {
    std::string identifier;
    bool stale{};
};

struct StaleResult {
    bool exhausted{};
    std::string next;
};

// 顺序轮换索引，非线程安全，由 ServiceAccountPool 加锁
class RotationIndex {
public:
    // 任一参数为空时保持原状态不变
    void rebuild(const std::vector<std::string>& identifiers, const std::string& activeIdentifier);

    // 只计算下一个候选，不切换当前账号
    [[nodiscard]] std::string rollover() const;

    void setActive(const std::string& identifier);
    StaleResult markStale(const std::string& target = {});
    void revertStale(const std::string& target);
    [[nodiscard]] std::optional<std::size_t> randomPick() const;

    [[nodiscard]] std::optional<std::size_t> activeIndex() const noexcept { return active_; }
    [[nodiscard]] std::string active() const;
    [[nodiscard]] bool isStale(const std::string& identifier) const;
    [[nodiscard]] const std::vector<CredentialEntry>& entries() const noexcept { return entries_; }
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] std::size_t liveCount() const noexcept { return lookup_.size(); }
    [[nodiscard]] bool empty() const noexcept { return lookup_.empty(); }

private:
    std::optional<std::size_t> findPosition(const std::string& identifier) const;

    std::vector<CredentialEntry> entries_;
    std::unordered_map<std::string, std::size_t> lookup_;
    std::optional<std::size_t> active_;
};

} // namespace sapool::pool
