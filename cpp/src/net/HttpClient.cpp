#include "sapool/net/HttpClient.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <openssl/ssl.h>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace sapool::net {
namespace {
constexpr unsigned kHttpVersion = 11;

std::string defaultPort(const std::string& scheme) {
    return scheme == "https" ? "443" : "80";
}

std::string urlEncode(const std::string& value) {
    std::ostringstream oss;
    oss << std::uppercase << std::hex;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << static_cast<char>(c);
        } else {
            oss << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return oss.str();
}

template <typename Stream>
HttpClient::HttpResponse exchange(Stream& stream, const HttpClient::HttpRequest& request) {
    boost::beast::http::write(stream, request);
    boost::beast::flat_buffer buffer;
    HttpClient::HttpResponse response;
    boost::beast::http::read(stream, buffer, response);
    return response;
}

} // namespace

ParsedUrl parseUrl(const std::string& url) {
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("URL missing scheme: " + url);
    }

    ParsedUrl parsed;
    parsed.scheme = url.substr(0, schemeEnd);
    std::transform(parsed.scheme.begin(), parsed.scheme.end(), parsed.scheme.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    auto hostStart = schemeEnd + 3;
    auto pathPos = url.find('/', hostStart);
    auto hostPort = url.substr(hostStart, pathPos == std::string::npos ? std::string::npos : pathPos - hostStart);
    if (auto colon = hostPort.find(':'); colon != std::string::npos) {
        parsed.host = hostPort.substr(0, colon);
        parsed.port = hostPort.substr(colon + 1);
    } else {
        parsed.host = hostPort;
        parsed.port = defaultPort(parsed.scheme);
    }
    parsed.target = pathPos == std::string::npos ? "/" : url.substr(pathPos);
    return parsed;
}

std::string formEncode(const FormFields& fields) {
    std::string body;
    for (const auto& [key, value] : fields) {
        if (!body.empty()) {
            body.push_back('&');
        }
        body += urlEncode(key) + '=' + urlEncode(value);
    }
    return body;
}

HttpClient::HttpClient(std::chrono::seconds timeout)
    : sslContext_(boost::asio::ssl::context::tls_client)
    , timeout_(timeout) {
    sslContext_.set_default_verify_paths();
    sslContext_.set_verify_mode(boost::asio::ssl::verify_peer);
}

HttpClient::HttpResponse HttpClient::fetch(HttpRequest request, const std::string& scheme) {
    if (request.count(boost::beast::http::field::host) == 0) {
        throw std::runtime_error("request missing Host header");
    }
    request.version(kHttpVersion);
    request.set(boost::beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING);

    std::string host{request[boost::beast::http::field::host]};
    std::string port = defaultPort(scheme);
    if (auto colon = host.find(':'); colon != std::string::npos) {
        port = host.substr(colon + 1);
        host.resize(colon);
    }

    boost::asio::ip::tcp::resolver resolver(io_);
    auto endpoints = resolver.resolve(host, port);
    boost::system::error_code ec;

    if (scheme == "https") {
        boost::beast::ssl_stream<boost::beast::tcp_stream> stream(io_, sslContext_);
        if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
            throw std::runtime_error("Failed to set SNI host name");
        }
        boost::beast::get_lowest_layer(stream).expires_after(timeout_);
        boost::beast::get_lowest_layer(stream).connect(endpoints);
        stream.handshake(boost::asio::ssl::stream_base::client);

        auto response = net::exchange(stream, request);
        stream.shutdown(ec);
        if (ec && ec != boost::asio::error::eof && ec != boost::asio::ssl::error::stream_truncated) {
            throw boost::system::system_error(ec);
        }
        return response;
    }

    boost::beast::tcp_stream stream(io_);
    stream.expires_after(timeout_);
    stream.connect(endpoints);
    auto response = net::exchange(stream, request);
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    if (ec && ec != boost::asio::error::not_connected) {
        throw boost::system::system_error(ec);
    }
    return response;
}

HttpClient::HttpResponse HttpClient::postForm(const std::string& url, const FormFields& fields) {
    auto parsed = parseUrl(url);
    HttpRequest request{boost::beast::http::verb::post, parsed.target, kHttpVersion};
    request.set(boost::beast::http::field::host,
                parsed.port == defaultPort(parsed.scheme) ? parsed.host : parsed.host + ":" + parsed.port);
    request.set(boost::beast::http::field::content_type, "application/x-www-form-urlencoded");
    request.set(boost::beast::http::field::accept, "application/json");
    request.body() = formEncode(fields);
    request.prepare_payload();
    return fetch(std::move(request), parsed.scheme);
}

} // namespace sapool::net
