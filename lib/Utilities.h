#ifndef MOCKCHAIN_UTILITIES_H
#define MOCKCHAIN_UTILITIES_H

#include "ResultOrError.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace mc {

// Error type for utility functions
struct Error : public RoeErrorBase {
  using RoeErrorBase::RoeErrorBase;
};

template <typename T> using Roe = ResultOrError<T, Error>;

namespace utl {

// Wall clock, seconds and milliseconds since the epoch
int64_t getCurrentTime();
int64_t getCurrentTimeMs();

/**
 * Parse a decimal u64, the whole string must be consumed
 */
bool parseUInt64(const std::string &str, uint64_t &value);

/**
 * Split "host:port". Fails on a missing host, a missing port or a port
 * outside 0-65535; outputs are untouched on failure.
 */
bool parseHostPort(const std::string &hostPort, std::string &host,
                   uint16_t &port);

/**
 * Load and parse a JSON file
 * @return Parsed JSON, error 1 when missing, 2 when unreadable, 3 when malformed
 */
Roe<nlohmann::json> loadJsonFile(const std::string &path);

/**
 * Write `content` to a file that must not exist yet, creating parent
 * directories as needed
 */
Roe<void> writeToNewFile(const std::string &path, const std::string &content);

/**
 * SHA-256 through the OpenSSL EVP API
 * @return Raw 32-byte digest
 * @throws std::runtime_error if the digest cannot be computed
 */
std::string sha256Digest(const std::string &input);

// Lowercase hex SHA-256
std::string sha256(const std::string &input);

std::string hexEncode(const std::string &data);

/**
 * Decode hex of either case
 * @return Decoded bytes, empty on odd length or a non-hex character
 */
std::string hexDecode(const std::string &hex);

// --- Ed25519 (raw binary: 32-byte public key, 32-byte seed, 64-byte signature)

struct Ed25519KeyPair {
  std::string publicKey;
  std::string privateKey;
};

Roe<Ed25519KeyPair> ed25519Generate();
Roe<std::string> ed25519PublicKey(const std::string &privateKey);
Roe<std::string> ed25519Sign(const std::string &privateKey,
                             const std::string &message);
bool ed25519Verify(const std::string &publicKey, const std::string &message,
                   const std::string &signature);

/**
 * Canonical account address: 64 lowercase hex characters encoding a point
 * on the Ed25519 curve. Balances and stakes are keyed by this form.
 */
bool isAddress(const std::string &str);

/**
 * Bring a user-supplied address to its canonical form. Accepts an optional
 * 0x prefix and hex of either case.
 */
Roe<std::string> normalizeAddress(const std::string &str);

/**
 * Read a private key given inline or as a file path
 * @param keyOrPath 64 hex chars (optional 0x), raw 32 bytes, or a file holding either
 * @param baseDir Directory that relative paths are resolved against
 * @return Raw 32-byte private key seed
 */
Roe<std::string> readPrivateKey(const std::string &keyOrPath,
                                const std::string &baseDir = "");

} // namespace utl
} // namespace mc

#endif // MOCKCHAIN_UTILITIES_H
