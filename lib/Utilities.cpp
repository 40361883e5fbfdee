#include "Utilities.h"

#include <openssl/evp.h>
#include <sodium.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <stdexcept>

namespace mc {
namespace utl {

namespace fs = std::filesystem;

namespace {

constexpr size_t SEED_SIZE = crypto_sign_SEEDBYTES;
constexpr size_t PUBLIC_KEY_SIZE = crypto_sign_PUBLICKEYBYTES;
constexpr size_t SIGNATURE_SIZE = crypto_sign_BYTES;
constexpr size_t ADDRESS_SIZE = 2 * PUBLIC_KEY_SIZE;

// libsodium must be initialized once before any key operation
const bool sodiumReady = sodium_init() >= 0;

Roe<void> requireSodium() {
  if (!sodiumReady) {
    return Error(10, "libsodium failed to initialize");
  }
  return {};
}

const unsigned char *bytes(const std::string &s) {
  return reinterpret_cast<const unsigned char *>(s.data());
}

unsigned char *bytes(std::string &s) {
  return reinterpret_cast<unsigned char *>(s.data());
}

int hexValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

std::string stripHexPrefix(const std::string &s) {
  if (s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
    return s.substr(2);
  }
  return s;
}

std::string trim(const std::string &s) {
  const char *ws = " \t\r\n";
  size_t begin = s.find_first_not_of(ws);
  if (begin == std::string::npos) {
    return {};
  }
  return s.substr(begin, s.find_last_not_of(ws) - begin + 1);
}

bool readFile(const fs::path &path, std::string &content) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    return false;
  }
  content.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  return !in.bad();
}

bool isCurvePoint(const std::string &raw) {
  return raw.size() == PUBLIC_KEY_SIZE && sodiumReady &&
         crypto_core_ed25519_is_valid_point(bytes(raw)) == 1;
}

} // namespace

int64_t getCurrentTime() {
  using namespace std::chrono;
  return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

int64_t getCurrentTimeMs() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

bool parseUInt64(const std::string &str, uint64_t &value) {
  const char *end = str.data() + str.size();
  auto [ptr, ec] = std::from_chars(str.data(), end, value);
  return ec == std::errc{} && ptr == end && !str.empty();
}

bool parseHostPort(const std::string &hostPort, std::string &host, uint16_t &port) {
  size_t colon = hostPort.rfind(':');
  if (colon == std::string::npos || colon == 0) {
    return false;
  }
  uint64_t value = 0;
  if (!parseUInt64(hostPort.substr(colon + 1), value) || value > 65535) {
    return false;
  }
  host = hostPort.substr(0, colon);
  port = static_cast<uint16_t>(value);
  return true;
}

Roe<nlohmann::json> loadJsonFile(const std::string &path) {
  if (!fs::exists(path)) {
    return Error(1, "Configuration file not found: " + path);
  }
  std::string content;
  if (!readFile(path, content)) {
    return Error(2, "Failed to read configuration file: " + path);
  }
  try {
    return nlohmann::json::parse(content);
  } catch (const nlohmann::json::parse_error &e) {
    return Error(3, "Failed to parse JSON in " + path + ": " + e.what());
  }
}

Roe<void> writeToNewFile(const std::string &path, const std::string &content) {
  if (fs::exists(path)) {
    return Error(1, "File already exists: " + path);
  }
  fs::path parent = fs::path(path).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
      return Error(2, "Failed to create " + parent.string() + ": " + ec.message());
    }
  }
  std::ofstream out(path, std::ios::binary);
  if (!out.is_open()) {
    return Error(3, "Failed to open file for writing: " + path);
  }
  out << content;
  out.close();
  if (!out) {
    return Error(4, "Failed to write file: " + path);
  }
  return {};
}

std::string sha256Digest(const std::string &input) {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(),
                                                              &EVP_MD_CTX_free);
  if (!ctx) {
    throw std::runtime_error("Failed to create EVP_MD_CTX");
  }
  std::string digest(EVP_MAX_MD_SIZE, '\0');
  unsigned int digestLen = 0;
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), input.data(), input.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), bytes(digest), &digestLen) != 1) {
    throw std::runtime_error("EVP SHA-256 digest failed");
  }
  digest.resize(digestLen);
  return digest;
}

std::string sha256(const std::string &input) {
  return hexEncode(sha256Digest(input));
}

std::string hexEncode(const std::string &data) {
  static const char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(data.size() * 2);
  for (unsigned char c : data) {
    out.push_back(digits[c >> 4]);
    out.push_back(digits[c & 0x0f]);
  }
  return out;
}

std::string hexDecode(const std::string &hex) {
  if (hex.size() % 2 != 0) {
    return {};
  }
  std::string out(hex.size() / 2, '\0');
  for (size_t i = 0; i < out.size(); ++i) {
    int hi = hexValue(hex[2 * i]);
    int lo = hexValue(hex[2 * i + 1]);
    if (hi < 0 || lo < 0) {
      return {};
    }
    out[i] = static_cast<char>((hi << 4) | lo);
  }
  return out;
}

// --- Ed25519

Roe<Ed25519KeyPair> ed25519Generate() {
  auto ready = requireSodium();
  if (!ready) {
    return ready.error();
  }
  Ed25519KeyPair pair;
  pair.publicKey.resize(PUBLIC_KEY_SIZE);
  pair.privateKey.resize(SEED_SIZE);
  randombytes_buf(bytes(pair.privateKey), SEED_SIZE);
  std::string secret(crypto_sign_SECRETKEYBYTES, '\0');
  int rc = crypto_sign_seed_keypair(bytes(pair.publicKey), bytes(secret),
                                    bytes(pair.privateKey));
  sodium_memzero(bytes(secret), secret.size());
  if (rc != 0) {
    return Error(1, "crypto_sign_seed_keypair failed");
  }
  return pair;
}

Roe<std::string> ed25519PublicKey(const std::string &privateKey) {
  auto ready = requireSodium();
  if (!ready) {
    return ready.error();
  }
  if (privateKey.size() != SEED_SIZE) {
    return Error(1, "Ed25519 private key must be 32 bytes");
  }
  std::string publicKey(PUBLIC_KEY_SIZE, '\0');
  std::string secret(crypto_sign_SECRETKEYBYTES, '\0');
  int rc = crypto_sign_seed_keypair(bytes(publicKey), bytes(secret), bytes(privateKey));
  sodium_memzero(bytes(secret), secret.size());
  if (rc != 0) {
    return Error(2, "crypto_sign_seed_keypair failed");
  }
  return publicKey;
}

Roe<std::string> ed25519Sign(const std::string &privateKey, const std::string &message) {
  auto ready = requireSodium();
  if (!ready) {
    return ready.error();
  }
  if (privateKey.size() != SEED_SIZE) {
    return Error(1, "Ed25519 private key must be 32 bytes");
  }
  // libsodium signs with the expanded 64-byte secret key
  std::string publicKey(PUBLIC_KEY_SIZE, '\0');
  std::string secret(crypto_sign_SECRETKEYBYTES, '\0');
  if (crypto_sign_seed_keypair(bytes(publicKey), bytes(secret), bytes(privateKey)) != 0) {
    sodium_memzero(bytes(secret), secret.size());
    return Error(2, "crypto_sign_seed_keypair failed");
  }
  std::string signature(SIGNATURE_SIZE, '\0');
  int rc = crypto_sign_detached(bytes(signature), nullptr, bytes(message),
                                message.size(), bytes(secret));
  sodium_memzero(bytes(secret), secret.size());
  if (rc != 0) {
    return Error(3, "crypto_sign_detached failed");
  }
  return signature;
}

bool ed25519Verify(const std::string &publicKey, const std::string &message,
                   const std::string &signature) {
  if (!sodiumReady || publicKey.size() != PUBLIC_KEY_SIZE ||
      signature.size() != SIGNATURE_SIZE) {
    return false;
  }
  return crypto_sign_verify_detached(bytes(signature), bytes(message), message.size(),
                                     bytes(publicKey)) == 0;
}

bool isAddress(const std::string &str) {
  if (str.size() != ADDRESS_SIZE) {
    return false;
  }
  bool lowercaseHex = std::all_of(str.begin(), str.end(), [](char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
  });
  return lowercaseHex && isCurvePoint(hexDecode(str));
}

Roe<std::string> normalizeAddress(const std::string &str) {
  std::string hex = stripHexPrefix(trim(str));
  if (hex.size() != ADDRESS_SIZE) {
    return Error(1, "Address must be 64 hex characters, got " +
                        std::to_string(hex.size()));
  }
  std::transform(hex.begin(), hex.end(), hex.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  std::string raw = hexDecode(hex);
  if (raw.size() != PUBLIC_KEY_SIZE) {
    return Error(2, "Address is not valid hex: " + str);
  }
  if (!isCurvePoint(raw)) {
    return Error(3, "Address is not an Ed25519 public key: " + str);
  }
  return hex;
}

Roe<std::string> readPrivateKey(const std::string &keyOrPath, const std::string &baseDir) {
  if (keyOrPath.empty()) {
    return Error(1, "Key path or value cannot be empty");
  }

  fs::path path(keyOrPath);
  if (!baseDir.empty() && path.is_relative()) {
    fs::path candidate = (fs::path(baseDir) / path).lexically_normal();
    // Inline keys never name a file under baseDir
    if (fs::exists(candidate)) {
      path = candidate;
    }
  }

  std::string content = keyOrPath;
  if (fs::exists(path) && !readFile(path, content)) {
    return Error(2, "Failed to read key file: " + path.string());
  }
  content = trim(content);

  std::string hex = stripHexPrefix(content);
  if (hex.size() == 2 * SEED_SIZE) {
    std::string raw = hexDecode(hex);
    if (raw.size() == SEED_SIZE) {
      return raw;
    }
  }
  if (content.size() == SEED_SIZE) {
    return content;
  }
  return Error(4, "Private key must be 32 bytes raw or 64 hex characters, got " +
                      std::to_string(content.size()));
}

} // namespace utl
} // namespace mc
