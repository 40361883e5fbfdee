#include "Block.h"
#include "BinaryPack.hpp"
#include "Utilities.h"

namespace mc {

std::string Block::calculateHash() const {
  return utl::sha256(utl::binaryPack(*this));
}

bool Block::meetsDifficulty(uint32_t difficulty) const {
  if (hash.size() < difficulty) {
    return false;
  }
  for (uint32_t i = 0; i < difficulty; ++i) {
    if (hash[i] != '0') {
      return false;
    }
  }
  return true;
}

nlohmann::json Block::toJson() const {
  nlohmann::json j;
  j["index"] = index;
  j["timestamp"] = timestamp;
  j["previousHash"] = previousHash;
  j["hash"] = hash;
  j["nonce"] = nonce;
  j["miner"] = miner;
  nlohmann::json txes = nlohmann::json::array();
  for (const auto &tx : transactions) {
    nlohmann::json txJson = tx.toJson();
    txJson["id"] = tx.getId();
    txes.push_back(txJson);
  }
  j["transactions"] = txes;
  return j;
}

} // namespace mc
