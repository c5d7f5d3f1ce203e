#include "sapool/util/PathUtil.hpp"

#include <cctype>
#include <cstdlib>
#include <string>

namespace sapool::util {
namespace {

bool isVarChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

std::string envOrEmpty(const std::string& name) {
    if (const char* value = std::getenv(name.c_str())) {
        return value;
    }
    return {};
}

} // namespace

std::string expandPath(std::string_view input) {
    std::string output;
    output.reserve(input.size());

    std::size_t pos = 0;
    if (!input.empty() && input.front() == '~' && (input.size() == 1 || input[1] == '/')) {
        output += envOrEmpty("HOME");
        pos = 1;
    }

    while (pos < input.size()) {
        char c = input[pos];
        if (c != '$' || pos + 1 >= input.size()) {
            output.push_back(c);
            ++pos;
            continue;
        }

        if (input[pos + 1] == '{') {
            auto close = input.find('}', pos + 2);
            if (close == std::string_view::npos) {
                output.append(input.substr(pos));
                break;
            }
            output += envOrEmpty(std::string(input.substr(pos + 2, close - pos - 2)));
            pos = close + 1;
            continue;
        }

        auto end = pos + 1;
        while (end < input.size() && isVarChar(input[end])) {
            ++end;
        }
        if (end == pos + 1) {
            output.push_back(c);
            ++pos;
            continue;
        }
        output += envOrEmpty(std::string(input.substr(pos + 1, end - pos - 1)));
        pos = end;
    }
    return output;
}

// 扩展名取文件名最后一个 '.' 起的部分，".json" 本身也算
bool hasExtension(const std::filesystem::path& path, std::string_view extension) {
    const auto name = path.filename().string();
    const auto dot = name.rfind('.');
    return dot != std::string::npos && std::string_view(name).substr(dot) == extension;
}

} // namespace sapool::util
