#include "sapool/drive/DriveService.hpp"
#include "sapool/util/JsonUtil.hpp"
#include "sapool/util/Logging.hpp"

#include <boost/beast/http/status.hpp>

#include <stdexcept>

namespace sapool::drive {
namespace {

constexpr std::chrono::seconds kRefreshMargin{60};
constexpr std::string_view kJwtBearerGrant = "urn:ietf:params:oauth:grant-type:jwt-bearer";

} // namespace

DriveService::DriveService(auth::ServiceAccountKey key,
                           std::shared_ptr<net::HttpClient> client,
                           std::string scope)
    : key_(std::move(key))
    , client_(std::move(client))
    , scope_(std::move(scope)) {
    if (!client_) {
        throw std::invalid_argument("DriveService requires an HTTP client");
    }
}

std::string DriveService::accessToken() {
    const auto now = std::chrono::system_clock::now();
    std::scoped_lock lock(tokenMutex_);
    if (!token_.empty() && now + kRefreshMargin < expiresAt_) {
        return token_;
    }

    auto response = client_->postForm(key_.tokenUri(), {
        {"grant_type", std::string(kJwtBearerGrant)},
        {"assertion", key_.makeAssertion(scope_, now)}
    });
    if (response.result() != boost::beast::http::status::ok) {
        throw std::runtime_error("token endpoint returned status " + std::to_string(response.result_int()) +
                                 " for " + key_.clientEmail());
    }

    auto json = util::parseJson(response.body());
    if (!json.is_object()) {
        throw std::runtime_error("token endpoint payload unexpected");
    }
    const auto& obj = json.as_object();
    auto token = util::stringField(obj, "access_token");
    if (token.empty()) {
        throw std::runtime_error("token endpoint response missing access_token");
    }
    std::chrono::seconds lifetime{3600};
    if (auto it = obj.if_contains("expires_in"); it && it->is_int64()) {
        lifetime = std::chrono::seconds{it->as_int64()};
    }

    token_ = std::move(token);
    expiresAt_ = now + lifetime;
    util::log(util::LogLevel::debug, "已获取 access token: " + key_.clientEmail());
    return token_;
}

void DriveService::authorize(net::HttpClient::HttpRequest& request) {
    request.set(boost::beast::http::field::authorization, "Bearer " + accessToken());
}

void DriveService::invalidateToken() {
    std::scoped_lock lock(tokenMutex_);
    token_.clear();
    expiresAt_ = {};
}

} // namespace sapool::drive
