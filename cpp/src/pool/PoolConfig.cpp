#include "sapool/pool/PoolConfig.hpp"
#include "sapool/util/JsonUtil.hpp"
#include "sapool/util/PathUtil.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstring>
#include <cstdlib>
#include <iterator>
#include <string_view>

namespace sapool::pool {
namespace {

bool parseBool(std::string_view text) {
    std::string lower;
    std::transform(text.begin(), text.end(), std::back_inserter(lower), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lower == "1" || lower == "true" || lower == "yes" || lower == "on";
}

std::size_t sizeFrom(const boost::json::value& value, std::size_t fallback) {
    if (value.is_int64() && value.as_int64() >= 0) {
        return static_cast<std::size_t>(value.as_int64());
    }
    if (value.is_uint64()) {
        return static_cast<std::size_t>(value.as_uint64());
    }
    return fallback;
}

// 非法或负数时保留原值
std::size_t sizeFrom(const char* text, std::size_t fallback) {
    std::size_t value = 0;
    const char* end = text + std::strlen(text);
    auto [ptr, ec] = std::from_chars(text, end, value);
    if (ec != std::errc{} || ptr != end || ptr == text) {
        util::log(util::LogLevel::warn, std::string{"忽略非法数值配置: "} + text);
        return fallback;
    }
    return value;
}

} // namespace

PoolConfig loadConfig(const boost::json::object& json) {
    PoolConfig cfg;
    if (auto it = json.if_contains("credentialDirectory"); it && it->is_string()) {
        cfg.credentialDirectory = util::expandPath(std::string(it->as_string()));
    }
    if (auto it = json.if_contains("activeCredential"); it && it->is_string()) {
        cfg.activeCredential = util::expandPath(std::string(it->as_string()));
    }
    if (auto it = json.if_contains("maxCached")) cfg.maxCached = sizeFrom(*it, cfg.maxCached);
    if (auto it = json.if_contains("preloadCount")) cfg.preloadCount = sizeFrom(*it, cfg.preloadCount);
    if (auto it = json.if_contains("rolling"); it && it->is_bool()) cfg.rolling = it->as_bool();
    if (auto it = json.if_contains("scope"); it && it->is_string()) cfg.scope = std::string(it->as_string());
    if (auto it = json.if_contains("logLevel"); it && it->is_string()) {
        cfg.logLevel = util::parseLogLevel(std::string(it->as_string()), cfg.logLevel);
    }
    return cfg;
}

PoolConfig loadPoolConfig(const std::filesystem::path& path) {
    PoolConfig config;

    try {
        if (auto json = util::readJsonFile(path); json && json->is_object()) {
            config = loadConfig(json->as_object());
        }
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::warn, std::string{"解析账号池配置失败: "} + ex.what());
    }

    if (const char* value = std::getenv("SAPOOL_SA_DIR")) config.credentialDirectory = util::expandPath(value);
    if (const char* value = std::getenv("SAPOOL_SA_FILE")) config.activeCredential = util::expandPath(value);
    if (const char* value = std::getenv("SAPOOL_MAX_CACHED")) config.maxCached = sizeFrom(value, config.maxCached);
    if (const char* value = std::getenv("SAPOOL_PRELOAD")) config.preloadCount = sizeFrom(value, config.preloadCount);
    if (const char* value = std::getenv("SAPOOL_ROLLING")) config.rolling = parseBool(value);
    if (const char* value = std::getenv("SAPOOL_SCOPE")) config.scope = value;
    if (const char* value = std::getenv("SAPOOL_LOG_LEVEL")) {
        config.logLevel = util::parseLogLevel(value, config.logLevel);
    }

    return config;
}

} // namespace sapool::pool
