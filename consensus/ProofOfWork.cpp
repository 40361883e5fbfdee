#include "ProofOfWork.h"
#include "Utilities.h"

#include <limits>

namespace mc {
namespace consensus {

ProofOfWork::ProofOfWork(const Config &config)
    : Consensus("mockchain.consensus.pow", config) {}

ProofOfWork::~ProofOfWork() { stop(); }

ProofOfWork::Roe<Block>
ProofOfWork::generateBlock(uint64_t index,
                           const std::vector<Transaction> &transactions,
                           const std::string &previousHash,
                           const CancelCheck &isCancelled) const {
  if (config_.minerAddress.empty()) {
    return Error(E_CONFIG, "No miner address configured");
  }
  if (!utl::isAddress(config_.minerAddress)) {
    return Error(E_CONFIG, "Miner address is not a canonical address: " +
                               config_.minerAddress);
  }

  Block block;
  block.index = index;
  block.timestamp = utl::getCurrentTimeMs();
  block.transactions = transactions;
  block.previousHash = previousHash;
  block.miner = config_.minerAddress;
  block.nonce = 0;

  uint64_t attempts = 0;
  while (true) {
    block.hash = block.calculateHash();
    if (block.meetsDifficulty(config_.difficulty)) {
      log().debug << "Found nonce " << block.nonce << " for block " << index
                  << " after " << attempts + 1 << " attempts";
      return block;
    }

    ++attempts;
    if (attempts % CANCEL_CHECK_INTERVAL == 0 && isCancelled && isCancelled()) {
      return Error(E_CANCELLED, "Hash search for block " + std::to_string(index) +
                                    " cancelled after " +
                                    std::to_string(attempts) + " attempts");
    }

    if (block.nonce == std::numeric_limits<uint64_t>::max()) {
      // Nonce space exhausted, move the timestamp and start over
      block.timestamp = utl::getCurrentTimeMs();
      block.nonce = 0;
    } else {
      ++block.nonce;
    }
  }
}

bool ProofOfWork::validateBlock(const Block &block,
                                const std::string &previousHash) const {
  if (!checkSeal(block, previousHash)) {
    return false;
  }
  if (!block.meetsDifficulty(config_.difficulty)) {
    log().debug << "Block " << block.index << " hash " << block.hash
                << " misses difficulty " << config_.difficulty;
    return false;
  }
  return true;
}

int64_t ProofOfWork::getBlockIntervalMs() const {
  return config_.blockIntervalMs < 0 ? 0 : config_.blockIntervalMs;
}

} // namespace consensus
} // namespace mc
