#include "rag_core/types/uuid.hpp"

#include <openssl/rand.h>

#include <array>
#include <iomanip>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace rag_core {

std::string generate_uuid() {
  std::array<unsigned char, 16> bytes{};
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    throw std::runtime_error("Failed to generate random bytes for UUID");
  }
  // version 4, RFC 4122 variant
  bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
  bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

  std::stringstream ss;
  ss << std::hex << std::setfill('0');
  for (size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      ss << '-';
    }
    ss << std::setw(2) << static_cast<int>(bytes[i]);
  }
  return ss.str();
}

bool is_valid_uuid(const std::string& text) {
  static const std::regex uuid_regex(
      "^[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12}$");
  return std::regex_match(text, uuid_regex);
}

}  // namespace rag_core
