#ifndef MOCKCHAIN_TRANSACTION_H
#define MOCKCHAIN_TRANSACTION_H

#include "ResultOrError.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace mc {

/**
 * Signed value transfer between two addresses.
 *
 * Addresses are hex-encoded Ed25519 public keys. The signature is a raw
 * 64-byte Ed25519 detached signature over the SHA-256 digest of the canonical
 * encoding of (from, to, amount, timestamp). Faucet credits use the reserved
 * FAUCET_ADDRESS sender and carry no signature.
 */
struct Transaction {
  constexpr static const char *FAUCET_ADDRESS = "FAUCET_MOCKCHAIN_ADDRESS";

  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_SIGNATURE = 1;
  constexpr static int32_t E_AMOUNT = 2;
  constexpr static int32_t E_KEY = 3;
  constexpr static int32_t E_FORMAT = 4;

  std::string from;
  std::string to;
  uint64_t amount{ 0 };
  int64_t timestamp{ 0 }; // milliseconds since epoch
  std::string signature;

  template <typename Archive> void serialize(Archive &ar) {
    ar & from & to & amount & timestamp & signature;
  }

  static Transaction create(const std::string &from, const std::string &to,
                            uint64_t amount);
  static Transaction createFaucet(const std::string &to, uint64_t amount,
                                  int64_t timestamp);

  bool isFaucet() const { return from == FAUCET_ADDRESS; }

  // SHA-256 of the unsigned fields, the message that gets signed
  std::string getSigningDigest() const;

  // Hex SHA-256 of the full encoding, signature included
  std::string getId() const;

  Roe<void> sign(const std::string &privateKey);
  Roe<void> verify() const;

  nlohmann::json toJson() const;
  static Roe<Transaction> fromJson(const nlohmann::json &j);

  bool operator==(const Transaction &other) const {
    return from == other.from && to == other.to && amount == other.amount &&
           timestamp == other.timestamp && signature == other.signature;
  }
};

} // namespace mc

#endif // MOCKCHAIN_TRANSACTION_H
