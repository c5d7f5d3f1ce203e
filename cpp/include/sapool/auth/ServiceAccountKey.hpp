#pragma once

#include <openssl/evp.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace sapool::auth {

inline constexpr std::string_view kDefaultTokenUri = "https://oauth2.googleapis.com/token";
inline constexpr std::chrono::seconds kAssertionLifetime{3600};

std::string base64UrlEncode(std::string_view input);
std::string base64UrlDecode(std::string_view input);

// 服务账号密钥，私钥在副本间共享
class ServiceAccountKey {
public:
    // 内容不合法时抛出 std::invalid_argument
    static ServiceAccountKey fromJson(const std::string& text);
    // 文件不可读时抛出 PoolError(io_failure)
    static ServiceAccountKey fromFile(const std::filesystem::path& path);

    [[nodiscard]] const std::string& clientEmail() const noexcept { return clientEmail_; }
    [[nodiscard]] const std::string& projectId() const noexcept { return projectId_; }
    [[nodiscard]] const std::string& privateKeyId() const noexcept { return privateKeyId_; }
    [[nodiscard]] const std::string& tokenUri() const noexcept { return tokenUri_; }

    // RS256 签名的 JWT，用于换取 access token
    std::string makeAssertion(const std::string& scope,
                              std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;

    [[nodiscard]] EVP_PKEY* privateKey() const noexcept { return key_.get(); }

private:
    ServiceAccountKey() = default;

    std::string clientEmail_;
    std::string projectId_;
    std::string privateKeyId_;
    std::string tokenUri_;
    std::shared_ptr<EVP_PKEY> key_;
};

} // namespace sapool::auth
