#include "sapool/auth/ServiceAccountKey.hpp"
#include "sapool/pool/PoolError.hpp"
#include "sapool/util/JsonUtil.hpp"

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>

#include <boost/json.hpp>

#include <array>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <vector>

namespace sapool::auth {
namespace {

struct BioDeleter {
    void operator()(BIO* bio) const noexcept { BIO_free(bio); }
};

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

std::string opensslError(const std::string& prefix) {
    std::array<char, 256> buffer{};
    auto code = ERR_get_error();
    if (code == 0) {
        return prefix;
    }
    ERR_error_string_n(code, buffer.data(), buffer.size());
    return prefix + ": " + buffer.data();
}

std::shared_ptr<EVP_PKEY> loadPrivateKey(const std::string& pem) {
    std::unique_ptr<BIO, BioDeleter> bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        throw std::runtime_error(opensslError("BIO_new_mem_buf failed"));
    }
    EVP_PKEY* key = PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr);
    if (!key) {
        throw std::invalid_argument(opensslError("invalid service account private key"));
    }
    return std::shared_ptr<EVP_PKEY>(key, EVP_PKEY_free);
}

std::string signSha256(EVP_PKEY* key, std::string_view payload) {
    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error(opensslError("EVP_MD_CTX_new failed"));
    }
    if (EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key) != 1) {
        throw std::runtime_error(opensslError("EVP_DigestSignInit failed"));
    }
    std::size_t length = 0;
    const auto* data = reinterpret_cast<const unsigned char*>(payload.data());
    if (EVP_DigestSign(ctx.get(), nullptr, &length, data, payload.size()) != 1) {
        throw std::runtime_error(opensslError("EVP_DigestSign failed"));
    }
    std::string signature(length, '\0');
    if (EVP_DigestSign(ctx.get(), reinterpret_cast<unsigned char*>(signature.data()), &length, data, payload.size()) != 1) {
        throw std::runtime_error(opensslError("EVP_DigestSign failed"));
    }
    signature.resize(length);
    return signature;
}

} // namespace

std::string base64UrlEncode(std::string_view input) {
    static constexpr char alphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";
    std::string output;
    output.reserve(((input.size() + 2) / 3) * 4);

    std::uint32_t value = 0;
    int bitCount = -6;
    for (unsigned char c : input) {
        value = (value << 8) | c;
        bitCount += 8;
        while (bitCount >= 0) {
            output.push_back(alphabet[(value >> bitCount) & 0x3F]);
            bitCount -= 6;
        }
    }
    if (bitCount > -6) {
        output.push_back(alphabet[((value << 8) >> (bitCount + 8)) & 0x3F]);
    }
    return output;
}

std::string base64UrlDecode(std::string_view input) {
    std::string output;
    output.reserve(input.size() * 3 / 4);

    std::uint32_t value = 0;
    int bitCount = -8;
    for (char c : input) {
        int digit;
        if (c >= 'A' && c <= 'Z') digit = c - 'A';
        else if (c >= 'a' && c <= 'z') digit = c - 'a' + 26;
        else if (c >= '0' && c <= '9') digit = c - '0' + 52;
        else if (c == '-' || c == '+') digit = 62;
        else if (c == '_' || c == '/') digit = 63;
        else if (c == '=') break;
        else throw std::invalid_argument("invalid base64url character");

        value = (value << 6) | static_cast<std::uint32_t>(digit);
        bitCount += 6;
        if (bitCount >= 0) {
            output.push_back(static_cast<char>((value >> bitCount) & 0xFF));
            bitCount -= 8;
        }
    }
    return output;
}

ServiceAccountKey ServiceAccountKey::fromJson(const std::string& text) {
    boost::json::value json;
    try {
        json = util::parseJson(text);
    } catch (const std::exception& ex) {
        throw std::invalid_argument(std::string{"service account file is not valid JSON: "} + ex.what());
    }
    if (!json.is_object()) {
        throw std::invalid_argument("service account file must contain a JSON object");
    }
    const auto& obj = json.as_object();

    auto type = util::stringField(obj, "type");
    if (type != "service_account") {
        throw std::invalid_argument("unsupported credentials type: \"" + type + "\"");
    }

    ServiceAccountKey key;
    key.clientEmail_ = util::stringField(obj, "client_email");
    key.projectId_ = util::stringField(obj, "project_id");
    key.privateKeyId_ = util::stringField(obj, "private_key_id");
    key.tokenUri_ = util::stringField(obj, "token_uri");
    if (key.tokenUri_.empty()) {
        key.tokenUri_ = std::string(kDefaultTokenUri);
    }
    if (key.clientEmail_.empty()) {
        throw std::invalid_argument("service account file missing client_email");
    }
    auto pem = util::stringField(obj, "private_key");
    if (pem.empty()) {
        throw std::invalid_argument("service account file missing private_key");
    }
    key.key_ = loadPrivateKey(pem);
    return key;
}

ServiceAccountKey ServiceAccountKey::fromFile(const std::filesystem::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.is_open()) {
        throw pool::PoolError(pool::PoolError::Type::io_failure,
                              "error opening service account credentials file: " + path.string());
    }
    std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    if (ifs.bad()) {
        throw pool::PoolError(pool::PoolError::Type::io_failure,
                              "error reading service account credentials file: " + path.string());
    }
    return fromJson(content);
}

std::string ServiceAccountKey::makeAssertion(const std::string& scope,
                                             std::chrono::system_clock::time_point now) const {
    const auto issuedAt = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();

    boost::json::object header{{"alg", "RS256"}, {"typ", "JWT"}};
    if (!privateKeyId_.empty()) {
        header["kid"] = privateKeyId_;
    }
    boost::json::object claims{
        {"iss", clientEmail_},
        {"scope", scope},
        {"aud", tokenUri_},
        {"iat", issuedAt},
        {"exp", issuedAt + kAssertionLifetime.count()}
    };

    std::string signingInput = base64UrlEncode(util::stringifyJson(header)) + "." +
                               base64UrlEncode(util::stringifyJson(claims));
    return signingInput + "." + base64UrlEncode(signSha256(key_.get(), signingInput));
}

} // namespace sapool::auth
