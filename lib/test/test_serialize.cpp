#include "BinaryPack.hpp"
#include "Serialize.hpp"
#include <gtest/gtest.h>

#include <sstream>

namespace {

struct Sample {
  uint32_t version{ 1 };
  std::string name;
  std::vector<uint64_t> values;

  template <typename Archive> void serialize(Archive &ar) {
    ar & version & name & values;
  }
};

} // namespace

TEST(OutputArchiveTest, IntegersAreBigEndian) {
  std::ostringstream oss;
  mc::OutputArchive ar(oss);
  ar & static_cast<uint32_t>(0x01020304) & static_cast<uint64_t>(5);
  EXPECT_EQ(oss.str(), std::string("\x01\x02\x03\x04"
                                   "\x00\x00\x00\x00\x00\x00\x00\x05",
                                   12));
}

TEST(OutputArchiveTest, SignedIntegersUseTwosComplement) {
  std::ostringstream oss;
  mc::OutputArchive ar(oss);
  ar & static_cast<int64_t>(-1);
  EXPECT_EQ(oss.str(), std::string(8, '\xff'));
}

TEST(OutputArchiveTest, StringsCarryLengthPrefix) {
  std::ostringstream oss;
  mc::OutputArchive ar(oss);
  ar & std::string("ab") & std::string();
  EXPECT_EQ(oss.str(), std::string("\x00\x00\x00\x00\x00\x00\x00\x02"
                                   "ab"
                                   "\x00\x00\x00\x00\x00\x00\x00\x00",
                                   18));
}

TEST(OutputArchiveTest, BoolAndByteAreSingleBytes) {
  std::ostringstream oss;
  mc::OutputArchive ar(oss);
  ar & true & false & static_cast<uint8_t>(0x7f);
  EXPECT_EQ(oss.str(), std::string("\x01\x00\x7f", 3));
}

TEST(BinaryPackTest, CustomTypesEncodeFieldsInOrder) {
  Sample sample;
  sample.name = "x";
  sample.values = { 7 };

  std::string packed = mc::utl::binaryPack(sample);
  std::string expected("\x00\x00\x00\x01"                 // version
                       "\x00\x00\x00\x00\x00\x00\x00\x01" // name length
                       "x"
                       "\x00\x00\x00\x00\x00\x00\x00\x01" // values count
                       "\x00\x00\x00\x00\x00\x00\x00\x07",
                       29);
  EXPECT_EQ(packed, expected);
}

TEST(BinaryPackTest, EncodingIsDeterministic) {
  Sample a;
  a.name = "same";
  a.values = { 1, 2, 3 };
  Sample b = a;
  EXPECT_EQ(mc::utl::binaryPack(a), mc::utl::binaryPack(b));

  b.values.back() = 4;
  EXPECT_NE(mc::utl::binaryPack(a), mc::utl::binaryPack(b));
}
