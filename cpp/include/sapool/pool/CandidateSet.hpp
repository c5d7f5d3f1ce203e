#pragma once

#include "sapool/pool/BlacklistRegistry.hpp"

#include <cstddef>
#include <set>
#include <string>
#include <unordered_set>

namespace sapool::pool {

// 限流时随机挑选的候选账号
class CandidateSet {
public:
    explicit CandidateSet(BlacklistRegistry& blacklist);

    void assign(std::unordered_set<std::string> identifiers);
    void insert(const std::string& identifier);
    void erase(const std::string& identifier);

    // 先拉黑并移除 exclude，再随机选出一个未拉黑（或已过期）的账号
    std::string selectExcluding(const std::string& exclude);

    [[nodiscard]] bool contains(const std::string& identifier) const;
    [[nodiscard]] std::set<std::string> snapshot() const;
    [[nodiscard]] std::size_t size() const noexcept { return available_.size(); }
    [[nodiscard]] bool empty() const noexcept { return available_.empty(); }

private:
    BlacklistRegistry& blacklist_;
    std::unordered_set<std::string> available_;
};

} // namespace sapool::pool
