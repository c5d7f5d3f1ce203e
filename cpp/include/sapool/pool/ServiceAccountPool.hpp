#pragma once

#include "sapool/pool/BlacklistRegistry.hpp"
#include "sapool/pool/CandidateSet.hpp"
#include "sapool/pool/ClientCache.hpp"
#include "sapool/pool/PoolConfig.hpp"
#include "sapool/pool/RotationIndex.hpp"
#include "sapool/pool/ServiceClient.hpp"

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace sapool::pool {

inline constexpr std::string_view kCredentialExtension = ".json";

// 服务账号池，支持顺序轮换与限流时随机挑选
class ServiceAccountPool {
public:
    explicit ServiceAccountPool(std::size_t maxCached,
                                BlacklistRegistry& blacklist = BlacklistRegistry::global());

    ServiceAccountPool(const ServiceAccountPool&) = delete;
    ServiceAccountPool& operator=(const ServiceAccountPool&) = delete;

    std::set<std::string> load(const std::filesystem::path& directory, const std::string& activeCredential);
    std::set<std::string> load(const PoolConfig& config);

    // 启动时调用：应用缓存上限、扫描目录并按 preloadCount 预热客户端
    std::size_t configure(const PoolConfig& config, const ClientFactory& factory);

    std::string rollover() const;
    void setActive(const std::string& credential);
    std::string advance();
    StaleResult markStale(const std::string& target = {});
    void revertStale(const std::string& target);
    std::optional<std::size_t> randomPick() const;

    std::string selectExcluding(const std::string& exclude);

    void offer(ServiceClient client);
    ServiceClient take();
    std::size_t preload(std::size_t count, const ClientFactory& factory);

    std::string activeCredential() const;
    std::set<std::string> available() const;
    std::size_t availableCount() const;
    std::size_t cachedCount() const;
    std::size_t maxCached() const;
    void setMaxCached(std::size_t max);
    bool exhausted() const;

private:
    mutable std::mutex mutex_;
    RotationIndex index_;
    CandidateSet candidates_;
    ClientCache cache_;
};

} // namespace sapool::pool
