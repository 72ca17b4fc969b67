/**
 * @file constant_time.cpp
 * @brief Timing-safe secret comparison using OpenSSL
 */

#include "gateway/security/constant_time.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <array>

namespace gateway::security {

namespace {

using sha256_digest = std::array<unsigned char, 32>;

bool sha256(std::string_view data, sha256_digest& out) noexcept {
    unsigned int length = 0;
    if (EVP_Digest(data.data(), data.size(), out.data(), &length, EVP_sha256(),
                   nullptr) != 1) {
        return false;
    }
    return length == out.size();
}

} // namespace

bool constant_time_equals(std::string_view provided,
                          std::string_view expected) noexcept {
    sha256_digest provided_digest{};
    sha256_digest expected_digest{};

    bool hashed = sha256(provided, provided_digest);
    hashed = sha256(expected, expected_digest) && hashed;
    if (!hashed) {
        return false;
    }

    return CRYPTO_memcmp(provided_digest.data(), expected_digest.data(),
                         provided_digest.size()) == 0;
}

} // namespace gateway::security
