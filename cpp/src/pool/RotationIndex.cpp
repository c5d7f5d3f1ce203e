#include "sapool/pool/RotationIndex.hpp"

#include <iterator>
#include <random>

namespace sapool::pool {

void RotationIndex::rebuild(const std::vector<std::string>& identifiers, const std::string& activeIdentifier) {
    if (identifiers.empty() || activeIdentifier.empty()) {
        return;
    }

    std::vector<CredentialEntry> entries;
    std::unordered_map<std::string, std::size_t> lookup;
    entries.reserve(identifiers.size() + 1);
    for (std::size_t i = 0; i < identifiers.size(); ++i) {
        entries.push_back(CredentialEntry{identifiers[i], false});
        lookup[identifiers[i]] = i;
    }

    entries_ = std::move(entries);
    lookup_ = std::move(lookup);

    if (auto it = lookup_.find(activeIdentifier); it != lookup_.end()) {
        active_ = it->second;
        return;
    }
    // 当前账号不在扫描结果中时追加到末尾
    const auto position = entries_.size();
    entries_.push_back(CredentialEntry{activeIdentifier, false});
    lookup_[activeIdentifier] = position;
    active_ = position;
}

std::string RotationIndex::rollover() const {
    const std::size_t start = active_ ? *active_ + 1 : 0;
    for (std::size_t i = start; i < entries_.size(); ++i) {
        if (!entries_[i].stale) {
            return entries_[i].identifier;
        }
    }
    if (!active_) {
        return {};
    }
    for (std::size_t i = 0; i < *active_; ++i) {
        if (!entries_[i].stale) {
            return entries_[i].identifier;
        }
    }
    return {};
}

void RotationIndex::setActive(const std::string& identifier) {
    if (auto it = lookup_.find(identifier); it != lookup_.end()) {
        active_ = it->second;
    }
}

StaleResult RotationIndex::markStale(const std::string& target) {
    std::string resolved = target;
    if (resolved.empty() && active_) {
        resolved = entries_[*active_].identifier;
    }

    if (auto it = lookup_.find(resolved); it != lookup_.end()) {
        entries_[it->second].stale = true;
        lookup_.erase(it);
    }

    auto picked = randomPick();
    if (!picked) {
        active_.reset();
        return StaleResult{true, {}};
    }
    active_ = picked;
    return StaleResult{false, entries_[*picked].identifier};
}

void RotationIndex::revertStale(const std::string& target) {
    if (target.empty()) {
        return;
    }
    if (auto position = findPosition(target)) {
        entries_[*position].stale = false;
        lookup_[target] = *position;
    }
}

std::optional<std::size_t> RotationIndex::randomPick() const {
    if (lookup_.empty()) {
        return std::nullopt;
    }
    static thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<std::size_t> dist(0, lookup_.size() - 1);
    auto it = lookup_.begin();
    std::advance(it, static_cast<std::ptrdiff_t>(dist(rng)));
    return it->second;
}

std::string RotationIndex::active() const {
    if (!active_) {
        return {};
    }
    return entries_[*active_].identifier;
}

bool RotationIndex::isStale(const std::string& identifier) const {
    auto position = findPosition(identifier);
    return position && entries_[*position].stale;
}

std::optional<std::size_t> RotationIndex::findPosition(const std::string& identifier) const {
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        if (entries_[i].identifier == identifier) {
            return i;
        }
    }
    return std::nullopt;
}

} // namespace sapool::pool
