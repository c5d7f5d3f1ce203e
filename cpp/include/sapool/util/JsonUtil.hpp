#pragma once

#include <boost/json.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace sapool::util {

boost::json::value parseJson(const std::string& payload);
std::string stringifyJson(const boost::json::value& value);

// 文件不存在或为空时返回 std::nullopt，内容非法时抛出异常
std::optional<boost::json::value> readJsonFile(const std::filesystem::path& path);

std::string stringField(const boost::json::object& obj, std::string_view key);

} // namespace sapool::util
