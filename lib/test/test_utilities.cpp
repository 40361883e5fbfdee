#include "Utilities.h"
#include <gtest/gtest.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>

namespace mc {
namespace utl {

namespace {

std::string upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return s;
}

std::string newAddress() {
  auto pair = ed25519Generate();
  return pair.isOk() ? hexEncode(pair->publicKey) : std::string();
}

} // namespace

TEST(Sha256Test, KnownVectors) {
  EXPECT_EQ(sha256(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  EXPECT_EQ(sha256("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  EXPECT_EQ(sha256Digest("abc").size(), 32u);
}

TEST(Ed25519Test, SignAndVerify) {
  auto pair = ed25519Generate();
  ASSERT_TRUE(pair.isOk()) << pair.error().message;
  auto sig = ed25519Sign(pair->privateKey, "payload");
  ASSERT_TRUE(sig.isOk()) << sig.error().message;
  EXPECT_EQ(sig->size(), 64u);

  EXPECT_TRUE(ed25519Verify(pair->publicKey, "payload", *sig));
  EXPECT_FALSE(ed25519Verify(pair->publicKey, "payload!", *sig));
  EXPECT_FALSE(ed25519Verify(pair->publicKey, "payload", sig->substr(0, 32)));
}

TEST(Ed25519Test, RejectsShortSeed) {
  EXPECT_EQ(ed25519Sign(std::string(16, '\0'), "msg").error().code, 1);
  EXPECT_TRUE(ed25519PublicKey(std::string(31, '\0')).isError());
}

TEST(Ed25519Test, PublicKeyDerivesFromSeed) {
  auto pair = ed25519Generate();
  ASSERT_TRUE(pair.isOk());
  auto derived = ed25519PublicKey(pair->privateKey);
  ASSERT_TRUE(derived.isOk());
  EXPECT_EQ(*derived, pair->publicKey);
}

TEST(HexTest, EncodeAndDecode) {
  EXPECT_EQ(hexEncode(std::string("\x00\x0f\xab\xff", 4)), "000fabff");
  EXPECT_EQ(hexDecode("000FabfF"), std::string("\x00\x0f\xab\xff", 4));
  EXPECT_EQ(hexDecode("abc"), "");
  EXPECT_EQ(hexDecode("zz"), "");
}

TEST(AddressTest, CanonicalFormIsLowercaseHexPoint) {
  std::string address = newAddress();
  ASSERT_EQ(address.size(), 64u);
  EXPECT_TRUE(isAddress(address));
  EXPECT_FALSE(isAddress(upper(address)));
  EXPECT_FALSE(isAddress("0x" + address));
  EXPECT_FALSE(isAddress(address.substr(0, 63)));
  EXPECT_FALSE(isAddress(hexDecode(address)));
  // Small-order point, not a usable key
  EXPECT_FALSE(isAddress(std::string(64, '0')));
}

TEST(AddressTest, NormalizeStripsPrefixAndLowercases) {
  std::string address = newAddress();
  ASSERT_FALSE(address.empty());

  auto fromPrefixed = normalizeAddress("0x" + upper(address));
  ASSERT_TRUE(fromPrefixed.isOk()) << fromPrefixed.error().message;
  EXPECT_EQ(*fromPrefixed, address);

  auto padded = normalizeAddress("  " + address + "\n");
  ASSERT_TRUE(padded.isOk());
  EXPECT_EQ(*padded, address);
  EXPECT_TRUE(isAddress(*padded));
}

TEST(AddressTest, NormalizeRejectsNonAddresses) {
  EXPECT_EQ(normalizeAddress("").error().code, 1);
  EXPECT_EQ(normalizeAddress(std::string(65, 'a')).error().code, 1);
  EXPECT_EQ(normalizeAddress("0xgg" + std::string(62, 'a')).error().code, 2);
  EXPECT_EQ(normalizeAddress(std::string(64, '0')).error().code, 3);
}

TEST(ParseTest, ParseUInt64RequiresWholeString) {
  uint64_t value = 0;
  EXPECT_TRUE(parseUInt64("18446744073709551615", value));
  EXPECT_EQ(value, UINT64_MAX);
  EXPECT_FALSE(parseUInt64("12abc", value));
  EXPECT_FALSE(parseUInt64("", value));
  EXPECT_FALSE(parseUInt64("18446744073709551616", value));
}

TEST(ParseTest, ParseHostPortSplitsEndpoint) {
  std::string host = "unchanged";
  uint16_t port = 7;
  EXPECT_FALSE(parseHostPort("localhost:70000", host, port));
  EXPECT_EQ(host, "unchanged");
  EXPECT_EQ(port, 7);

  ASSERT_TRUE(parseHostPort("localhost:50051", host, port));
  EXPECT_EQ(host, "localhost");
  EXPECT_EQ(port, 50051);
  EXPECT_FALSE(parseHostPort("localhost", host, port));
  EXPECT_FALSE(parseHostPort(":80", host, port));
}

class KeyFileTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = std::filesystem::temp_directory_path() / "mockchain_utilities_test";
    std::filesystem::remove_all(dir_);
    std::filesystem::create_directories(dir_);
  }

  void TearDown() override { std::filesystem::remove_all(dir_); }

  std::filesystem::path dir_;
};

TEST_F(KeyFileTest, ReadPrivateKeyInlineOrFromFile) {
  auto pair = ed25519Generate();
  ASSERT_TRUE(pair.isOk());
  std::string hex = hexEncode(pair->privateKey);

  auto inlineKey = readPrivateKey("0x" + hex, dir_.string());
  ASSERT_TRUE(inlineKey.isOk()) << inlineKey.error().message;
  EXPECT_EQ(*inlineKey, pair->privateKey);

  ASSERT_TRUE(writeToNewFile((dir_ / "miner.key").string(), hex + "\n").isOk());
  auto fileKey = readPrivateKey("miner.key", dir_.string());
  ASSERT_TRUE(fileKey.isOk()) << fileKey.error().message;
  EXPECT_EQ(*fileKey, pair->privateKey);

  EXPECT_TRUE(readPrivateKey("").isError());
  EXPECT_TRUE(readPrivateKey("not-a-key").isError());
}

TEST_F(KeyFileTest, WriteToNewFileRefusesOverwrite) {
  auto path = (dir_ / "sub" / "file.txt").string();
  ASSERT_TRUE(writeToNewFile(path, "first").isOk());
  EXPECT_EQ(writeToNewFile(path, "second").error().code, 1);
}

TEST_F(KeyFileTest, LoadJsonFileReportsErrors) {
  EXPECT_EQ(loadJsonFile((dir_ / "missing.json").string()).error().code, 1);

  std::ofstream((dir_ / "bad.json").string()) << "{ not json";
  EXPECT_EQ(loadJsonFile((dir_ / "bad.json").string()).error().code, 3);

  std::ofstream((dir_ / "good.json").string()) << R"({"port": 8080})";
  auto good = loadJsonFile((dir_ / "good.json").string());
  ASSERT_TRUE(good.isOk());
  EXPECT_EQ((*good)["port"].get<int>(), 8080);
}

} // namespace utl
} // namespace mc
