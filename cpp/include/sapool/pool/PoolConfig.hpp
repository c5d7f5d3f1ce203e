#pragma once

#include "sapool/util/Logging.hpp"

#include <boost/json.hpp>

#include <cstddef>
#include <filesystem>
#include <string>

namespace sapool::pool {

struct PoolConfig {
    std::filesystem::path credentialDirectory;
    std::string activeCredential;
    std::size_t maxCached{100};
    std::size_t preloadCount{0};
    bool rolling{false};
    std::string scope{"https://www.googleapis.com/auth/drive"};
    util::LogLevel logLevel{util::LogLevel::info};
};

PoolConfig loadConfig(const boost::json::object& json);

// 依次叠加默认值、JSON 配置文件与 SAPOOL_* 环境变量
PoolConfig loadPoolConfig(const std::filesystem::path& path);

} // namespace sapool::pool
