#include <gtest/gtest.h>

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <string>

#include "rag_core/vector/npy_io.hpp"
#include "rag_core/vector/vector_index_error.hpp"
#include "utilities_test.hpp"

namespace rag_core {

class NpyIoTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = rag_tests::TestUtilities::create_temp_dir("rag_npy");
  }

  void TearDown() override {
    rag_tests::TestUtilities::cleanup_temp_dir(dir_);
  }

  std::filesystem::path dir_;
};

TEST_F(NpyIoTest, WritesAlignedVersionOneHeader) {
  NpyMatrix matrix{2, 3, {1, 2, 3, 4, 5, 6}};
  write_npy_matrix(dir_ / "m.npy", matrix);

  const std::string bytes = rag_tests::TestUtilities::read_file(dir_ / "m.npy");
  ASSERT_GT(bytes.size(), 10u);
  EXPECT_EQ(bytes.substr(0, 6), "\x93NUMPY");
  EXPECT_EQ(bytes[6], '\x01');
  EXPECT_EQ(bytes[7], '\x00');

  const size_t header_len =
      static_cast<unsigned char>(bytes[8]) | (static_cast<unsigned char>(bytes[9]) << 8);
  EXPECT_EQ((10 + header_len) % 64, 0u);
  EXPECT_EQ(bytes[10 + header_len - 1], '\n');
  EXPECT_NE(bytes.find("'shape': (2, 3)"), std::string::npos);
  EXPECT_EQ(bytes.size(), 10 + header_len + 6 * sizeof(float));

  NpyMatrix read = read_npy_matrix(dir_ / "m.npy");
  EXPECT_EQ(read.rows, 2u);
  EXPECT_EQ(read.cols, 3u);
  EXPECT_EQ(read.data, matrix.data);
}

TEST_F(NpyIoTest, ReadsVersionTwoFiles) {
  std::string header = "{'descr': '<f4', 'fortran_order': False, 'shape': (1, 2), }";
  header.append(64 - (12 + header.size() + 1) % 64, ' ');
  header.push_back('\n');

  std::string bytes = "\x93NUMPY";
  bytes.push_back('\x02');
  bytes.push_back('\x00');
  const uint32_t len = static_cast<uint32_t>(header.size());
  for (int i = 0; i < 4; ++i) {
    bytes.push_back(static_cast<char>((len >> (8 * i)) & 0xff));
  }
  bytes += header;
  const float values[2] = {0.25f, -1.5f};
  bytes.append(reinterpret_cast<const char*>(values), sizeof(values));
  rag_tests::TestUtilities::write_file(dir_ / "v2.npy", bytes);

  NpyMatrix read = read_npy_matrix(dir_ / "v2.npy");

  EXPECT_EQ(read.rows, 1u);
  EXPECT_EQ(read.cols, 2u);
  EXPECT_FLOAT_EQ(read.data[0], 0.25f);
  EXPECT_FLOAT_EQ(read.data[1], -1.5f);
}

TEST_F(NpyIoTest, RejectsNonNpyFile) {
  rag_tests::TestUtilities::write_file(dir_ / "bad.npy", "definitely not numpy");

  EXPECT_THROW(read_npy_matrix(dir_ / "bad.npy"), IndexCorruptionError);
}

TEST_F(NpyIoTest, RejectsOtherDtypes) {
  std::string header = "{'descr': '<f8', 'fortran_order': False, 'shape': (1, 1), }\n";
  std::string bytes = "\x93NUMPY";
  bytes.push_back('\x01');
  bytes.push_back('\x00');
  bytes.push_back(static_cast<char>(header.size()));
  bytes.push_back('\x00');
  bytes += header;
  bytes.append(8, '\0');
  rag_tests::TestUtilities::write_file(dir_ / "f8.npy", bytes);

  EXPECT_THROW(read_npy_matrix(dir_ / "f8.npy"), IndexCorruptionError);
}

TEST_F(NpyIoTest, RejectsTruncatedData) {
  write_npy_matrix(dir_ / "t.npy", NpyMatrix{4, 4, std::vector<float>(16, 1.0f)});
  std::filesystem::resize_file(dir_ / "t.npy", std::filesystem::file_size(dir_ / "t.npy") - 8);

  EXPECT_THROW(read_npy_matrix(dir_ / "t.npy"), IndexCorruptionError);
}

namespace {

// Version 1 .npy bytes with the given shape text followed by `floats` zeros
std::string npy_with_shape(const std::string& shape, size_t floats) {
  std::string header = "{'descr': '<f4', 'fortran_order': False, 'shape': " + shape + ", }";
  header.append(64 - (10 + header.size() + 1) % 64, ' ');
  header.push_back('\n');

  std::string bytes = "\x93NUMPY";
  bytes.push_back('\x01');
  bytes.push_back('\x00');
  bytes.push_back(static_cast<char>(header.size() & 0xff));
  bytes.push_back(static_cast<char>(header.size() >> 8));
  bytes += header;
  bytes.append(floats * sizeof(float), '\0');
  return bytes;
}

}  // namespace

TEST_F(NpyIoTest, RejectsShapeLargerThanTheFile) {
  rag_tests::TestUtilities::write_file(dir_ / "huge.npy",
                                       npy_with_shape("(4000000000, 4000000000)", 4));

  EXPECT_THROW(read_npy_matrix(dir_ / "huge.npy"), IndexCorruptionError);
}

TEST_F(NpyIoTest, RejectsShapeWhoseProductOverflows) {
  // 2^62 * 8 wraps to zero in 64 bits
  rag_tests::TestUtilities::write_file(dir_ / "wrap.npy",
                                       npy_with_shape("(4611686018427387904, 8)", 0));

  EXPECT_THROW(read_npy_matrix(dir_ / "wrap.npy"), IndexCorruptionError);
}

TEST_F(NpyIoTest, RejectsShapeBeyondSixtyFourBits) {
  rag_tests::TestUtilities::write_file(dir_ / "digits.npy",
                                       npy_with_shape("(123456789012345678901234567890, 2)", 2));

  EXPECT_THROW(read_npy_matrix(dir_ / "digits.npy"), IndexCorruptionError);
}

TEST_F(NpyIoTest, ReadsEmptyMatrix) {
  rag_tests::TestUtilities::write_file(dir_ / "empty.npy", npy_with_shape("(0, 5)", 0));

  NpyMatrix matrix = read_npy_matrix(dir_ / "empty.npy");
  EXPECT_EQ(matrix.rows, 0u);
  EXPECT_EQ(matrix.cols, 5u);
  EXPECT_TRUE(matrix.data.empty());
}

TEST_F(NpyIoTest, RejectsShapeDataMismatchOnWrite) {
  EXPECT_THROW(write_npy_matrix(dir_ / "x.npy", NpyMatrix{2, 2, {1, 2, 3}}), VectorIndexError);
}

}  // namespace rag_core
