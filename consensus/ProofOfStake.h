#pragma once

#include "Consensus.h"

#include <map>

namespace mc {
namespace consensus {

/**
 * Stake-weighted validator rotation.
 *
 * Validators are the registered stakeholders holding at least minStake. The
 * producer of block `index` on top of `previousHash` is drawn from them in
 * proportion to stake using a hash of (index, previousHash), so anyone can
 * recompute the choice. No hash search is involved.
 */
class ProofOfStake : public Consensus {
public:
  explicit ProofOfStake(const Config &config);
  ~ProofOfStake() override;

  Type getType() const override { return Type::PROOF_OF_STAKE; }
  std::string name() const override { return "Proof of Stake"; }

  Roe<void> setStakeholders(const std::vector<Stakeholder> &stakeholders);

  Roe<Block> generateBlock(uint64_t index,
                           const std::vector<Transaction> &transactions,
                           const std::string &previousHash,
                           const CancelCheck &isCancelled = nullptr) const override;

  bool validateBlock(const Block &block,
                     const std::string &previousHash) const override;

  int64_t getBlockIntervalMs() const override;

  uint64_t getMinStake() const { return config_.minStake; }
  uint64_t getStake(const std::string &address) const;
  uint64_t getEligibleStake() const;
  bool isEligible(const std::string &address) const;
  std::vector<Stakeholder> getValidators() const;

  Roe<std::string> selectValidator(uint64_t index,
                                   const std::string &previousHash) const;

private:
  std::string hashSelectionSeed(uint64_t index,
                                const std::string &previousHash) const;

  std::map<std::string, uint64_t> mStakes_;
};

} // namespace consensus
} // namespace mc
