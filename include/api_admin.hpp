#pragma once

#include <cctype>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include "api_http.hpp"

namespace bayestext {

using json = nlohmann::json;

// Credentials guarding the endpoints that mutate the model
struct AdminConfig {
    std::string password;
    std::string jwt_secret;
    int jwt_expiration = 3600; // seconds

    bool enabled() const { return !password.empty() && !jwt_secret.empty(); }
};

// Base64 URL-safe encoding without padding (for JWT)
inline std::string base64_url_encode(const std::string& input) {
    static const char* chars = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

    std::string encoded;
    encoded.reserve((input.size() * 4 + 2) / 3);
    uint32_t val = 0;
    int bits = -6;

    for (unsigned char c : input) {
        val = (val << 8) + c;
        bits += 8;
        while (bits >= 0) {
            encoded.push_back(chars[(val >> bits) & 0x3F]);
            bits -= 6;
        }
    }
    if (bits > -6) encoded.push_back(chars[((val << 8) >> (bits + 8)) & 0x3F]);
    return encoded;
}

// Accepts both URL-safe and standard alphabets; stops at padding
inline std::string base64_url_decode(const std::string& input) {
    auto sextet = [](unsigned char c) -> int {
        if (c >= 'A' && c <= 'Z') return c - 'A';
        if (c >= 'a' && c <= 'z') return c - 'a' + 26;
        if (c >= '0' && c <= '9') return c - '0' + 52;
        if (c == '-' || c == '+') return 62;
        if (c == '_' || c == '/') return 63;
        return -1;
    };

    std::string decoded;
    uint32_t val = 0;
    int bits = -8;

    for (unsigned char c : input) {
        if (c == '=') break;
        int d = sextet(c);
        if (d < 0) continue;
        val = (val << 6) + (uint32_t)d;
        bits += 6;
        if (bits >= 0) {
            decoded.push_back(char((val >> bits) & 0xFF));
            bits -= 8;
        }
    }
    return decoded;
}

inline std::string hmac_sha256(const std::string& key, const std::string& data) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    HMAC(EVP_sha256(),
         key.data(), (int)key.size(),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(),
         hash, &hash_len);

    return std::string(reinterpret_cast<char*>(hash), hash_len);
}

inline int64_t unix_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// HS256 token carrying role=admin
inline std::string generate_jwt_token(const std::string& secret, int expiration_seconds = 3600) {
    json header;
    header["alg"] = "HS256";
    header["typ"] = "JWT";

    const int64_t iat = unix_now();
    json payload;
    payload["role"] = "admin";
    payload["iat"] = iat;
    payload["exp"] = iat + expiration_seconds;

    std::string message = base64_url_encode(header.dump()) + "." + base64_url_encode(payload.dump());
    return message + "." + base64_url_encode(hmac_sha256(secret, message));
}

struct JWTValidationResult {
    bool valid = false;
    std::string error;
    json payload;
};

inline JWTValidationResult validate_jwt_token(const std::string& token, const std::string& secret) {
    JWTValidationResult result;

    size_t first = token.find('.');
    size_t second = first == std::string::npos ? first : token.find('.', first + 1);
    if (first == std::string::npos || second == std::string::npos ||
        token.find('.', second + 1) != std::string::npos) {
        result.error = "Invalid token format";
        return result;
    }

    std::string message = token.substr(0, second);
    std::string signature = token.substr(second + 1);
    std::string expected = base64_url_encode(hmac_sha256(secret, message));

    if (signature.size() != expected.size() ||
        CRYPTO_memcmp(signature.data(), expected.data(), expected.size()) != 0) {
        result.error = "Invalid signature";
        return result;
    }

    try {
        result.payload = json::parse(base64_url_decode(token.substr(first + 1, second - first - 1)));
    } catch (const json::parse_error& e) {
        result.error = "Invalid payload: " + std::string(e.what());
        return result;
    }

    if (!result.payload.is_object() || !result.payload.contains("exp") ||
        !result.payload["exp"].is_number_integer()) {
        result.error = "Missing expiration claim";
        return result;
    }
    if (unix_now() >= result.payload["exp"].get<int64_t>()) {
        result.error = "Token expired";
        return result;
    }
    if (result.payload.value("role", "") != "admin") {
        result.error = "Invalid role";
        return result;
    }

    result.valid = true;
    return result;
}

// "Bearer <token>", prefix matched case-insensitively
inline std::string extract_bearer_token(const std::string& auth_header) {
    static const std::string prefix = "bearer ";
    if (auth_header.size() <= prefix.size()) return "";
    for (size_t i = 0; i < prefix.size(); i++) {
        if (std::tolower((unsigned char)auth_header[i]) != prefix[i]) return "";
    }
    return auth_header.substr(prefix.size());
}

// Writes the 401/503 response itself and returns false when access is denied
inline bool require_admin_auth(const httplib::Request& req, httplib::Response& res, const AdminConfig& admin) {
    if (!admin.enabled()) {
        send_error(res, 503, "Admin authentication not configured");
        return false;
    }

    std::string token = extract_bearer_token(req.get_header_value("Authorization"));
    if (token.empty() || !validate_jwt_token(token, admin.jwt_secret).valid) {
        send_error(res, 401, "Unauthorized");
        return false;
    }
    return true;
}

} // namespace bayestext
