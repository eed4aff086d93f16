#pragma once

#include <array>
#include <string>
#include <string_view>

namespace rag_core {

class HashService {
 public:
  using Sha256Digest = std::array<unsigned char, 32>;

  static Sha256Digest sha256(std::string_view data);
  static std::string sha256_hex(std::string_view data);
};

}  // namespace rag_core
