#include <gtest/gtest.h>

#include <set>
#include <string>

#include "rag_core/services/hash_service.hpp"
#include "rag_core/types/uuid.hpp"

namespace rag_core {

TEST(UuidTest, GeneratesCanonicalVersionFourUuids) {
  std::set<std::string> seen;
  for (int i = 0; i < 100; ++i) {
    const std::string uuid = generate_uuid();
    ASSERT_EQ(uuid.size(), 36u);
    EXPECT_TRUE(is_valid_uuid(uuid)) << uuid;
    EXPECT_EQ(uuid[14], '4');
    EXPECT_NE(std::string("89ab").find(uuid[19]), std::string::npos) << uuid;
    seen.insert(uuid);
  }
  EXPECT_EQ(seen.size(), 100u);
}

TEST(UuidTest, ValidatesFormat) {
  EXPECT_TRUE(is_valid_uuid("123e4567-e89b-12d3-a456-426614174000"));
  EXPECT_TRUE(is_valid_uuid("123E4567-E89B-12D3-A456-426614174000"));
  EXPECT_FALSE(is_valid_uuid(""));
  EXPECT_FALSE(is_valid_uuid("A"));
  EXPECT_FALSE(is_valid_uuid("123e4567e89b12d3a456426614174000"));
  EXPECT_FALSE(is_valid_uuid("123e4567-e89b-12d3-a456-42661417400g"));
  EXPECT_FALSE(is_valid_uuid(" 123e4567-e89b-12d3-a456-426614174000"));
}

TEST(HashServiceTest, Sha256KnownVectors) {
  EXPECT_EQ(HashService::sha256_hex(""),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  EXPECT_EQ(HashService::sha256_hex("abc"),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

}  // namespace rag_core
