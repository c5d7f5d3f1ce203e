#include "sapool/pool/ServiceAccountPool.hpp"
#include "sapool/pool/PoolError.hpp"
#include "sapool/util/Logging.hpp"
#include "sapool/util/PathUtil.hpp"

#include <algorithm>
#include <system_error>
#include <unordered_set>
#include <vector>

namespace sapool::pool {
namespace {

std::vector<std::string> listCredentialFiles(const std::filesystem::path& directory) {
    std::error_code ec;
    std::filesystem::directory_iterator it(directory, ec);
    if (ec) {
        throw PoolError(PoolError::Type::io_failure,
                        "error loading service accounts from folder: " + directory.string() + ": " + ec.message());
    }

    std::vector<std::string> names;
    const std::filesystem::directory_iterator end;
    while (it != end) {
        auto name = it->path().filename().string();
        if (util::hasExtension(name, kCredentialExtension)) {
            names.push_back(std::move(name));
        }
        it.increment(ec);
        if (ec) {
            break;
        }
    }
    if (ec) {
        throw PoolError(PoolError::Type::io_failure,
                        "error loading service accounts from folder: " + directory.string() + ": " + ec.message());
    }
    std::sort(names.begin(), names.end());

    std::string prefix = directory.string();
    const char separator = static_cast<char>(std::filesystem::path::preferred_separator);
    if (prefix.empty() || prefix.back() != separator) {
        prefix.push_back(separator);
    }

    std::vector<std::string> files;
    files.reserve(names.size());
    for (const auto& name : names) {
        files.push_back(prefix + name);
    }
    return files;
}

} // namespace

ServiceAccountPool::ServiceAccountPool(std::size_t maxCached, BlacklistRegistry& blacklist)
    : candidates_(blacklist)
    , cache_(maxCached) {}

std::set<std::string> ServiceAccountPool::load(const std::filesystem::path& directory,
                                               const std::string& activeCredential) {
    std::scoped_lock lock(mutex_);
    if (directory.empty()) {
        return candidates_.snapshot();
    }

    util::log(util::LogLevel::debug, "从目录加载服务账号: " + directory.string());
    auto files = listCredentialFiles(directory);

    std::unordered_set<std::string> available;
    for (const auto& file : files) {
        // 当前账号已在使用，不放入随机候选
        if (file != activeCredential) {
            available.insert(file);
        }
    }

    candidates_.assign(std::move(available));
    index_.rebuild(files, activeCredential);

    util::log(util::LogLevel::debug, "已加载 " + std::to_string(candidates_.size()) + " 个服务账号");
    return candidates_.snapshot();
}

std::set<std::string> ServiceAccountPool::load(const PoolConfig& config) {
    return load(config.credentialDirectory, config.activeCredential);
}

std::size_t ServiceAccountPool::configure(const PoolConfig& config, const ClientFactory& factory) {
    setMaxCached(config.maxCached);
    load(config);
    if (config.preloadCount == 0) {
        return 0;
    }
    return preload(config.preloadCount, factory);
}

std::string ServiceAccountPool::rollover() const {
    std::scoped_lock lock(mutex_);
    return index_.rollover();
}

void ServiceAccountPool::setActive(const std::string& credential) {
    std::scoped_lock lock(mutex_);
    index_.setActive(credential);
}

std::string ServiceAccountPool::advance() {
    std::scoped_lock lock(mutex_);
    auto next = index_.rollover();
    if (!next.empty()) {
        index_.setActive(next);
    }
    return next;
}

StaleResult ServiceAccountPool::markStale(const std::string& target) {
    std::scoped_lock lock(mutex_);
    auto result = index_.markStale(target);
    if (result.exhausted) {
        util::log(util::LogLevel::warn, "所有服务账号均已耗尽");
    }
    return result;
}

void ServiceAccountPool::revertStale(const std::string& target) {
    std::scoped_lock lock(mutex_);
    index_.revertStale(target);
}

std::optional<std::size_t> ServiceAccountPool::randomPick() const {
    std::scoped_lock lock(mutex_);
    return index_.randomPick();
}

std::string ServiceAccountPool::selectExcluding(const std::string& exclude) {
    std::scoped_lock lock(mutex_);
    return candidates_.selectExcluding(exclude);
}

void ServiceAccountPool::offer(ServiceClient client) {
    std::scoped_lock lock(mutex_);
    cache_.offer(std::move(client));
}

ServiceClient ServiceAccountPool::take() {
    std::scoped_lock lock(mutex_);
    return cache_.take();
}

std::size_t ServiceAccountPool::preload(std::size_t count, const ClientFactory& factory) {
    if (count == 0 || !factory) {
        return 0;
    }

    std::vector<std::string> files;
    {
        std::scoped_lock lock(mutex_);
        auto snapshot = candidates_.snapshot();
        files.assign(snapshot.begin(), snapshot.end());
    }

    // 构建过程可能涉及文件读取，不持有池锁
    std::vector<ServiceClient> built;
    for (const auto& file : files) {
        if (built.size() >= count) {
            break;
        }
        try {
            built.push_back(factory(file));
        } catch (const std::exception& ex) {
            util::log(util::LogLevel::error, "预加载服务账号失败 (" + file + "): " + ex.what());
        }
    }

    const auto loaded = built.size();
    {
        std::scoped_lock lock(mutex_);
        cache_.prepend(std::move(built));
    }
    util::log(util::LogLevel::debug, "已预加载 " + std::to_string(loaded) + " 个服务");
    return loaded;
}

std::string ServiceAccountPool::activeCredential() const {
    std::scoped_lock lock(mutex_);
    return index_.active();
}

std::set<std::string> ServiceAccountPool::available() const {
    std::scoped_lock lock(mutex_);
    return candidates_.snapshot();
}

std::size_t ServiceAccountPool::availableCount() const {
    std::scoped_lock lock(mutex_);
    return candidates_.size();
}

std::size_t ServiceAccountPool::cachedCount() const {
    std::scoped_lock lock(mutex_);
    return cache_.size();
}

std::size_t ServiceAccountPool::maxCached() const {
    std::scoped_lock lock(mutex_);
    return cache_.max();
}

void ServiceAccountPool::setMaxCached(std::size_t max) {
    std::scoped_lock lock(mutex_);
    cache_.setMax(max);
}

bool ServiceAccountPool::exhausted() const {
    std::scoped_lock lock(mutex_);
    return index_.empty();
}

} // namespace sapool::pool
