#pragma once

#include "sapool/auth/ServiceAccountKey.hpp"
#include "sapool/net/HttpClient.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace sapool::drive {

inline constexpr std::string_view kDriveBaseUrl = "https://www.googleapis.com/drive/v3";

// 首次调用 accessToken() 时才换取 token，构造时不访问网络
class DriveService {
public:
    DriveService(auth::ServiceAccountKey key,
                 std::shared_ptr<net::HttpClient> client,
                 std::string scope);

    std::string accessToken();
    void authorize(net::HttpClient::HttpRequest& request);
    void invalidateToken();

    [[nodiscard]] const auth::ServiceAccountKey& key() const noexcept { return key_; }
    [[nodiscard]] const std::string& scope() const noexcept { return scope_; }
    [[nodiscard]] std::string baseUrl() const { return std::string(kDriveBaseUrl); }
    [[nodiscard]] const std::shared_ptr<net::HttpClient>& client() const noexcept { return client_; }

private:
    auth::ServiceAccountKey key_;
    std::shared_ptr<net::HttpClient> client_;
    std::string scope_;
    std::mutex tokenMutex_;
    std::string token_;
    std::chrono::system_clock::time_point expiresAt_{};
};

} // namespace sapool::drive
