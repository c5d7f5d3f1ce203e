#pragma once

#include <functional>
#include <memory>
#include <string>

namespace sapool::net {
class HttpClient;
}

namespace sapool::drive {
class DriveService;
}

namespace sapool::pool {

// 预热好的客户端与服务句柄，切换账号时直接取用
struct ServiceClient {
    std::string credential;
    std::shared_ptr<net::HttpClient> client;
    std::shared_ptr<drive::DriveService> service;
};

// 由凭据路径构建 ServiceClient，失败时抛出异常
using ClientFactory = std::function<ServiceClient(const std::string& credentialPath)>;

} // namespace sapool::pool
