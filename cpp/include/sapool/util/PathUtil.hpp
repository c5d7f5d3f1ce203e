#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace sapool::util {

// 展开 ~、$VAR 与 ${VAR}，未设置的变量替换为空串
std::string expandPath(std::string_view input);

bool hasExtension(const std::filesystem::path& path, std::string_view extension);

} // namespace sapool::util
