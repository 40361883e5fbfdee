#pragma once

#include "Consensus.h"

namespace mc {
namespace consensus {

/**
 * Hash search: a block is valid when its hash starts with `difficulty` '0'
 * hex digits. The configured miner address receives the block reward.
 */
class ProofOfWork : public Consensus {
public:
  // Nonces tried between cancellation checks
  constexpr static uint64_t CANCEL_CHECK_INTERVAL = 4096;

  explicit ProofOfWork(const Config &config);
  ~ProofOfWork() override;

  Type getType() const override { return Type::PROOF_OF_WORK; }
  std::string name() const override { return "Proof of Work"; }

  Roe<Block> generateBlock(uint64_t index,
                           const std::vector<Transaction> &transactions,
                           const std::string &previousHash,
                           const CancelCheck &isCancelled = nullptr) const override;

  bool validateBlock(const Block &block,
                     const std::string &previousHash) const override;

  int64_t getBlockIntervalMs() const override;

  uint32_t getDifficulty() const { return config_.difficulty; }
};

} // namespace consensus
} // namespace mc
