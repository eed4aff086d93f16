#include "rag_core/services/hash_service.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace rag_core {

HashService::Sha256Digest HashService::sha256(std::string_view data) {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> mdctx(EVP_MD_CTX_new(),
                                                                 &EVP_MD_CTX_free);
  if (!mdctx) {
    throw std::runtime_error("Failed to create EVP context for hashing");
  }
  if (EVP_DigestInit_ex(mdctx.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("Failed to initialize SHA256 digest");
  }
  if (EVP_DigestUpdate(mdctx.get(), data.data(), data.size()) != 1) {
    throw std::runtime_error("Failed to update SHA256 digest");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (EVP_DigestFinal_ex(mdctx.get(), hash, &hash_len) != 1) {
    throw std::runtime_error("Failed to finalize SHA256 digest");
  }
  if (hash_len != 32) {
    throw std::runtime_error("Unexpected SHA256 digest length: " + std::to_string(hash_len));
  }

  Sha256Digest digest{};
  std::copy(hash, hash + hash_len, digest.begin());
  return digest;
}

std::string HashService::sha256_hex(std::string_view data) {
  const Sha256Digest digest = sha256(data);
  std::stringstream ss;
  for (unsigned char byte : digest) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return ss.str();
}

}  // namespace rag_core
