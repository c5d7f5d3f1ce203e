#include "sapool/drive/ClientFactory.hpp"
#include "sapool/auth/ServiceAccountKey.hpp"
#include "sapool/drive/DriveService.hpp"
#include "sapool/net/HttpClient.hpp"
#include "sapool/util/PathUtil.hpp"

#include <memory>

namespace sapool::drive {

ClientOptions clientOptionsFrom(const pool::PoolConfig& config) {
    ClientOptions options;
    if (!config.scope.empty()) {
        options.scope = config.scope;
    }
    return options;
}

pool::ServiceClient createServiceClient(const ClientOptions& options, const std::string& credentialPath) {
    auto key = auth::ServiceAccountKey::fromFile(util::expandPath(credentialPath));

    pool::ServiceClient result;
    result.credential = credentialPath;
    result.client = std::make_shared<net::HttpClient>(options.timeout);
    result.service = std::make_shared<DriveService>(std::move(key), result.client, options.scope);
    return result;
}

pool::ClientFactory makeClientFactory(ClientOptions options) {
    return [options = std::move(options)](const std::string& credentialPath) {
        return createServiceClient(options, credentialPath);
    };
}

} // namespace sapool::drive
