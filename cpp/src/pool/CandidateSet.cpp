#include "sapool/pool/CandidateSet.hpp"
#include "sapool/pool/PoolError.hpp"
#include "sapool/util/Logging.hpp"

#include <algorithm>
#include <random>
#include <vector>

namespace sapool::pool {

CandidateSet::CandidateSet(BlacklistRegistry& blacklist)
    : blacklist_(blacklist) {}

void CandidateSet::assign(std::unordered_set<std::string> identifiers) {
    available_ = std::move(identifiers);
}

void CandidateSet::insert(const std::string& identifier) {
    if (!identifier.empty()) {
        available_.insert(identifier);
    }
}

void CandidateSet::erase(const std::string& identifier) {
    available_.erase(identifier);
}

std::string CandidateSet::selectExcluding(const std::string& exclude) {
    if (!exclude.empty()) {
        blacklist_.record(exclude);
        available_.erase(exclude);
        util::log(util::LogLevel::info, "账号已拉黑: " + exclude);
    }

    if (available_.empty()) {
        throw PoolError(PoolError::Type::no_candidates, "no available service account file");
    }

    std::vector<std::string> keys(available_.begin(), available_.end());
    static thread_local std::mt19937 rng{std::random_device{}()};
    std::shuffle(keys.begin(), keys.end(), rng);

    const auto now = BlacklistRegistry::Clock::now();
    for (const auto& key : keys) {
        if (blacklist_.claim(key, now)) {
            return key;
        }
    }

    throw PoolError(PoolError::Type::all_blacklisted, "no available service account file (all blacklisted)");
}

bool CandidateSet::contains(const std::string& identifier) const {
    return available_.count(identifier) != 0;
}

std::set<std::string> CandidateSet::snapshot() const {
    return std::set<std::string>(available_.begin(), available_.end());
}

} // namespace sapool::pool
