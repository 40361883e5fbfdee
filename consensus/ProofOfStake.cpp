#include "ProofOfStake.h"
#include "Utilities.h"

#include <cstdlib>
#include <limits>
#include <sstream>

namespace mc {
namespace consensus {

ProofOfStake::ProofOfStake(const Config &config)
    : Consensus("mockchain.consensus.pos", config) {}

ProofOfStake::~ProofOfStake() { stop(); }

ProofOfStake::Roe<void>
ProofOfStake::setStakeholders(const std::vector<Stakeholder> &stakeholders) {
  std::map<std::string, uint64_t> stakes;
  std::vector<Stakeholder> registry;
  uint64_t total = 0;
  for (const auto &holder : stakeholders) {
    auto address = utl::normalizeAddress(holder.address);
    if (!address) {
      return Error(E_CONFIG, "Stakeholder " + holder.address + ": " +
                                 address.error().message);
    }
    if (stakes.count(address.value()) > 0) {
      return Error(E_CONFIG, "Duplicate stakeholder: " + address.value());
    }
    if (total > std::numeric_limits<uint64_t>::max() - holder.stake) {
      return Error(E_CONFIG, "Total stake overflows");
    }
    total += holder.stake;
    stakes[address.value()] = holder.stake;
    registry.push_back(Stakeholder{ address.value(), holder.stake });
  }
  mStakes_ = std::move(stakes);
  config_.stakeholders = std::move(registry);

  log().info << "Registered " << mStakes_.size() << " stakeholders, "
             << getValidators().size() << " eligible with min stake "
             << config_.minStake;
  return {};
}

uint64_t ProofOfStake::getStake(const std::string &address) const {
  auto it = mStakes_.find(address);
  return it == mStakes_.end() ? 0 : it->second;
}

bool ProofOfStake::isEligible(const std::string &address) const {
  auto it = mStakes_.find(address);
  return it != mStakes_.end() && it->second > 0 &&
         it->second >= config_.minStake;
}

std::vector<Stakeholder> ProofOfStake::getValidators() const {
  std::vector<Stakeholder> result;
  for (const auto &[address, stake] : mStakes_) {
    if (stake > 0 && stake >= config_.minStake) {
      result.push_back(Stakeholder{ address, stake });
    }
  }
  return result;
}

uint64_t ProofOfStake::getEligibleStake() const {
  uint64_t total = 0;
  for (const auto &validator : getValidators()) {
    total += validator.stake;
  }
  return total;
}

std::string ProofOfStake::hashSelectionSeed(uint64_t index,
                                            const std::string &previousHash) const {
  std::stringstream ss;
  ss << "mockchain/pos/v1:index:" << index << ":prev:" << previousHash;
  return utl::sha256(ss.str());
}

ProofOfStake::Roe<std::string>
ProofOfStake::selectValidator(uint64_t index,
                              const std::string &previousHash) const {
  auto validators = getValidators();
  uint64_t totalStake = getEligibleStake();
  if (validators.empty() || totalStake == 0) {
    return Error(E_NO_VALIDATOR, "No stakeholder meets the minimum stake of " +
                                     std::to_string(config_.minStake));
  }

  // First 64 bits of the seed, mapped onto the cumulative stake ranges
  std::string seed = hashSelectionSeed(index, previousHash);
  uint64_t point =
      std::strtoull(seed.substr(0, 16).c_str(), nullptr, 16) % totalStake;

  uint64_t cumulative = 0;
  for (const auto &validator : validators) {
    cumulative += validator.stake;
    if (point < cumulative) {
      return validator.address;
    }
  }
  return validators.back().address;
}

ProofOfStake::Roe<Block>
ProofOfStake::generateBlock(uint64_t index,
                            const std::vector<Transaction> &transactions,
                            const std::string &previousHash,
                            const CancelCheck &isCancelled) const {
  if (isCancelled && isCancelled()) {
    return Error(E_CANCELLED, "Block generation cancelled");
  }

  auto leader = selectValidator(index, previousHash);
  if (!leader) {
    return leader.error();
  }

  Block block;
  block.index = index;
  block.timestamp = utl::getCurrentTimeMs();
  block.transactions = transactions;
  block.previousHash = previousHash;
  block.miner = leader.value();
  block.nonce = 0;
  block.hash = block.calculateHash();

  log().debug << "Validator " << block.miner << " selected for block " << index;
  return block;
}

bool ProofOfStake::validateBlock(const Block &block,
                                 const std::string &previousHash) const {
  if (!checkSeal(block, previousHash)) {
    return false;
  }
  if (!isEligible(block.miner)) {
    log().debug << "Block " << block.index << " miner " << block.miner
                << " is not an eligible validator";
    return false;
  }
  auto expected = selectValidator(block.index, previousHash);
  if (!expected || expected.value() != block.miner) {
    log().debug << "Block " << block.index << " was not produced by the selected validator";
    return false;
  }
  return true;
}

int64_t ProofOfStake::getBlockIntervalMs() const {
  return config_.blockIntervalMs < 0 ? DEFAULT_POS_BLOCK_INTERVAL_MS
                                     : config_.blockIntervalMs;
}

} // namespace consensus
} // namespace mc
