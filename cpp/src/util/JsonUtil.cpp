#include "sapool/util/JsonUtil.hpp"

#include <fstream>
#include <iterator>

namespace sapool::util {

boost::json::value parseJson(const std::string& payload) {
    return boost::json::parse(payload);
}

std::string stringifyJson(const boost::json::value& value) {
    return boost::json::serialize(value);
}

std::optional<boost::json::value> readJsonFile(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::nullopt;
    }
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        return std::nullopt;
    }
    std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    if (content.empty()) {
        return std::nullopt;
    }
    return parseJson(content);
}

std::string stringField(const boost::json::object& obj, std::string_view key) {
    if (auto it = obj.if_contains(key); it && it->is_string()) {
        return std::string(it->as_string());
    }
    return {};
}

} // namespace sapool::util
