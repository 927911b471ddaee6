#pragma once

#include <openssl/evp.h>

#include <memory>
#include <string>
#include <vector>

namespace lanlens {
namespace opensslutil {

using EVP_MD_CTX_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

// Lowercase hex SHA-256 digest of `data`. Throws std::runtime_error when
// OpenSSL fails.
std::string sha256_hex(const std::string& data);

// Cryptographically secure random bytes.
std::vector<unsigned char> random_bytes(size_t count);

std::string to_hex(const unsigned char* data, size_t len);

}  // namespace opensslutil
}  // namespace lanlens
