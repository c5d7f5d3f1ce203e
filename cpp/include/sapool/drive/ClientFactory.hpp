#pragma once

#include "sapool/pool/PoolConfig.hpp"
#include "sapool/pool/ServiceClient.hpp"

#include <chrono>
#include <string>

namespace sapool::drive {

struct ClientOptions {
    std::string scope{"https://www.googleapis.com/auth/drive"};
    std::chrono::seconds timeout{30};
};

ClientOptions clientOptionsFrom(const pool::PoolConfig& config);

// 读取凭据文件并构建客户端，不发起网络请求
pool::ServiceClient createServiceClient(const ClientOptions& options, const std::string& credentialPath);

pool::ClientFactory makeClientFactory(ClientOptions options);

} // namespace sapool::drive
