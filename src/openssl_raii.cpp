#include "openssl/openssl_raii.hpp"

#include <openssl/rand.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace lanlens {
namespace opensslutil {

std::string to_hex(const unsigned char* data, size_t len) {
  std::stringstream ss;
  for (size_t i = 0; i < len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << (int)data[i];
  }
  return ss.str();
}

std::string sha256_hex(const std::string& data) {
  EVP_MD_CTX_ptr context{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!context) throw std::runtime_error("Failed to create context");

  if (1 != EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr)) {
    throw std::runtime_error("Failed to initialize digest");
  }

  if (1 != EVP_DigestUpdate(context.get(), data.c_str(), data.size())) {
    throw std::runtime_error("Failed to update digest");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int length = 0;
  if (1 != EVP_DigestFinal_ex(context.get(), hash, &length)) {
    throw std::runtime_error("Failed to finalize digest");
  }
  return to_hex(hash, length);
}

std::vector<unsigned char> random_bytes(size_t count) {
  std::vector<unsigned char> out(count);
  if (count > 0 && RAND_bytes(out.data(), static_cast<int>(count)) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
  return out;
}

}  // namespace opensslutil
}  // namespace lanlens
