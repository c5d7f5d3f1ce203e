#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace sapool::net {

struct ParsedUrl {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;
};

using FormFields = std::vector<std::pair<std::string, std::string>>;

ParsedUrl parseUrl(const std::string& url);
std::string formEncode(const FormFields& fields);

class HttpClient {
public:
    using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
    using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

    explicit HttpClient(std::chrono::seconds timeout = std::chrono::seconds{30});

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // request 必须带 Host 头，scheme 为 http 或 https
    HttpResponse fetch(HttpRequest request, const std::string& scheme);

    HttpResponse postForm(const std::string& url, const FormFields& fields);

    [[nodiscard]] std::chrono::seconds timeout() const noexcept { return timeout_; }

private:
    boost::asio::io_context io_;
    boost::asio::ssl::context sslContext_;
    std::chrono::seconds timeout_;
};

} // namespace sapool::net
