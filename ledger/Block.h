#pragma once

#include "Transaction.h"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace mc {

/**
 * Ordered batch of transactions linked to its predecessor by hash.
 * The hash covers every other field, so any edit after sealing is detectable.
 */
struct Block {
  static constexpr uint16_t CURRENT_VERSION = 1;
  static constexpr const char *GENESIS_PREVIOUS_HASH = "0";

  uint64_t index{ 0 };
  int64_t timestamp{ 0 }; // milliseconds since epoch
  std::vector<Transaction> transactions;
  std::string previousHash;
  uint64_t nonce{ 0 };
  std::string miner;
  std::string hash;

  // Hash input; excludes the hash itself
  template <typename Archive> void serialize(Archive &ar) {
    ar & static_cast<uint32_t>(CURRENT_VERSION) & index & timestamp &
        transactions & previousHash & nonce & miner;
  }

  /**
   * Hex SHA-256 of the canonical encoding of all fields except hash
   * @throws std::runtime_error if the digest backend fails
   */
  std::string calculateHash() const;

  // True if the stored hash starts with at least `difficulty` '0' hex digits
  bool meetsDifficulty(uint32_t difficulty) const;

  nlohmann::json toJson() const;
};

} // namespace mc
