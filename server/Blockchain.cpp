#include "Blockchain.h"
#include "Utilities.h"

#include <algorithm>
#include <limits>
#include <ostream>

namespace mc {

// ============ Config ============

nlohmann::json Blockchain::Config::ltsToJson() const {
  nlohmann::json j;
  j["blockReward"] = blockReward;
  j["genesisTimestamp"] = genesisTimestamp;
  j["maxPendingTransactions"] = maxPendingTransactions;
  j["auditBalances"] = auditBalances;
  j["faucet"] = { { "amount", faucet.amount },
                  { "maxRequestsPerAddress", faucet.maxRequestsPerAddress },
                  { "cooldownSeconds", faucet.cooldownSeconds } };
  return j;
}

Blockchain::Roe<void> Blockchain::Config::ltsFromJson(const nlohmann::json &jd) {
  try {
    if (!jd.is_object()) {
      return Error(E_CONFIG, "Ledger configuration must be a JSON object");
    }

    if (jd.contains("blockReward")) {
      if (!jd["blockReward"].is_number_unsigned()) {
        return Error(E_CONFIG, "Field 'blockReward' must be a non-negative number");
      }
      blockReward = jd["blockReward"].get<uint64_t>();
    }

    if (jd.contains("genesisTimestamp")) {
      if (!jd["genesisTimestamp"].is_number_integer()) {
        return Error(E_CONFIG, "Field 'genesisTimestamp' must be an integer");
      }
      genesisTimestamp = jd["genesisTimestamp"].get<int64_t>();
    }

    if (jd.contains("maxPendingTransactions")) {
      if (!jd["maxPendingTransactions"].is_number_unsigned()) {
        return Error(E_CONFIG,
                     "Field 'maxPendingTransactions' must be a non-negative number");
      }
      maxPendingTransactions = jd["maxPendingTransactions"].get<uint64_t>();
    }

    if (jd.contains("auditBalances")) {
      if (!jd["auditBalances"].is_boolean()) {
        return Error(E_CONFIG, "Field 'auditBalances' must be a boolean");
      }
      auditBalances = jd["auditBalances"].get<bool>();
    }

    if (jd.contains("faucet")) {
      const auto &jf = jd["faucet"];
      if (!jf.is_object()) {
        return Error(E_CONFIG, "Field 'faucet' must be an object");
      }
      if (jf.contains("amount")) {
        if (!jf["amount"].is_number_unsigned() || jf["amount"].get<uint64_t>() == 0) {
          return Error(E_CONFIG, "Field 'faucet.amount' must be a positive number");
        }
        faucet.amount = jf["amount"].get<uint64_t>();
      }
      if (jf.contains("maxRequestsPerAddress")) {
        if (!jf["maxRequestsPerAddress"].is_number_unsigned()) {
          return Error(E_CONFIG,
                       "Field 'faucet.maxRequestsPerAddress' must be a non-negative number");
        }
        faucet.maxRequestsPerAddress = jf["maxRequestsPerAddress"].get<uint64_t>();
      }
      if (jf.contains("cooldownSeconds")) {
        if (!jf["cooldownSeconds"].is_number_unsigned()) {
          return Error(E_CONFIG,
                       "Field 'faucet.cooldownSeconds' must be a non-negative number");
        }
        faucet.cooldownSeconds = jf["cooldownSeconds"].get<uint64_t>();
      }
    }

    return {};
  } catch (const std::exception &e) {
    return Error(E_CONFIG,
                 "Failed to parse ledger configuration: " + std::string(e.what()));
  }
}

std::ostream &operator<<(std::ostream &os, const Blockchain::Status &status) {
  os << "Status{length: " << status.chainLength
     << ", tip: " << status.lastBlockHash
     << ", pending: " << status.pendingCount
     << ", supply: " << status.totalSupply
     << ", accounts: " << status.accountCount << "}";
  return os;
}

// ============ Blockchain ============

Blockchain::Blockchain(const consensus::Consensus &consensus,
                       const Config &config)
    : Module("mockchain.chain"), consensus_(consensus), config_(config) {
  chain_.push_back(createGenesisBlock());
  log().info << "Genesis block created: " << chain_.front().hash;
}

Block Blockchain::createGenesisBlock() const {
  Block genesis;
  genesis.index = 0;
  genesis.timestamp = config_.genesisTimestamp;
  genesis.previousHash = Block::GENESIS_PREVIOUS_HASH;
  genesis.nonce = 0;
  genesis.hash = genesis.calculateHash();
  return genesis;
}

// ----------------- IChain -------------------------------------

IChain::Candidate Blockchain::prepareCandidate(size_t maxTransactions) const {
  std::lock_guard<std::mutex> lock(mutex_);
  Candidate candidate;
  candidate.nextIndex = chain_.size();
  candidate.previousHash = chain_.back().hash;
  candidate.transactions = drainPendingLocked(maxTransactions);
  return candidate;
}

Blockchain::Roe<void> Blockchain::appendBlock(const Block &block) {
  std::lock_guard<std::mutex> lock(mutex_);

  const Block &tip = chain_.back();
  if (block.index != chain_.size()) {
    return Error(E_BLOCK_INDEX, "Block index " + std::to_string(block.index) +
                                    " does not extend chain of length " +
                                    std::to_string(chain_.size()));
  }
  if (block.previousHash != tip.hash) {
    return Error(E_BLOCK_CHAIN, "Block " + std::to_string(block.index) +
                                    " links to " + block.previousHash +
                                    ", tip is " + tip.hash);
  }
  if (block.hash != block.calculateHash()) {
    log().warning << "Rejected block " << block.index << ": hash mismatch";
    return Error(E_BLOCK_HASH, "Block hash does not match its contents");
  }
  if (!utl::isAddress(block.miner)) {
    log().warning << "Rejected block " << block.index << ": bad miner address";
    return Error(E_BLOCK_MINER, "Block miner is not a valid address");
  }
  if (!consensus_.validateBlock(block, tip.hash)) {
    log().warning << "Rejected block " << block.index << ": fails "
                  << consensus_.name();
    return Error(E_BLOCK_VALIDATION,
                 "Block fails " + consensus_.name() + " validation");
  }

  // Apply to a working copy; nothing is committed unless every step succeeds
  BalanceMap working = balances_;
  uint64_t minted = totalMinted_;
  std::set<std::string> blockIds;
  for (const auto &tx : block.transactions) {
    std::string id = tx.getId();
    if (committedIds_.count(id) > 0 || !blockIds.insert(id).second) {
      return Error(E_BLOCK_TX, "Block " + std::to_string(block.index) +
                                   " repeats transaction " + id);
    }
    auto verified = tx.verify();
    if (!verified) {
      return Error(E_BLOCK_TX, "Transaction " + id + " in block " +
                                   std::to_string(block.index) + ": " +
                                   verified.error().message);
    }
  }
  auto applied = applyBlock(working, minted, block);
  if (!applied) {
    log().warning << "Rejected block " << block.index << ": "
                  << applied.error().message;
    return applied.error();
  }

  chain_.push_back(block);
  balances_ = std::move(working);
  totalMinted_ = minted;
  committedIds_.insert(blockIds.begin(), blockIds.end());

  size_t before = pending_.size();
  pending_.erase(std::remove_if(pending_.begin(), pending_.end(),
                                [&blockIds](const Transaction &tx) {
                                  return blockIds.count(tx.getId()) > 0;
                                }),
                 pending_.end());
  for (const auto &id : blockIds) {
    pendingIds_.erase(id);
  }
  prunePendingLocked();

  log().info << "Appended block " << block.index << " (" << block.hash << "), "
             << block.transactions.size() << " txs, "
             << (before - pending_.size()) << " left the pool, miner "
             << block.miner << " credited " << config_.blockReward;

  if (config_.auditBalances) {
    auto audit = verifyBalancesLocked();
    if (!audit) {
      log().critical << "Balance audit after block " << block.index
                     << " failed: " << audit.error().message;
    }
  }
  return {};
}

uint64_t Blockchain::getChainLength() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chain_.size();
}

std::string Blockchain::getLastBlockHash() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chain_.back().hash;
}

// ----------------- operations -------------------------------------

Blockchain::Roe<std::string> Blockchain::submitTransaction(const Transaction &tx) {
  auto verified = tx.verify();
  if (!verified) {
    int32_t code = verified.error().code == Transaction::E_AMOUNT ? E_TX_AMOUNT
                                                                  : E_TX_SIGNATURE;
    log().debug << "Rejected transaction from " << tx.from << ": "
                << verified.error().message;
    return Error(code, verified.error().message);
  }
  // Accounts are keyed by the canonical form, signed fields cannot be rewritten
  if (!utl::isAddress(tx.to)) {
    return Error(E_TX_VALIDATION, "Recipient is not a canonical address: " + tx.to);
  }
  if (!tx.isFaucet() && !utl::isAddress(tx.from)) {
    return Error(E_TX_VALIDATION, "Sender is not a canonical address: " + tx.from);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (!tx.isFaucet()) {
    uint64_t spendable = getSpendableLocked(tx.from);
    if (spendable < tx.amount) {
      log().debug << "Rejected transaction from " << tx.from << ": spendable "
                  << spendable << " < " << tx.amount;
      return Error(E_ACCOUNT_BALANCE, "Insufficient funds: spendable balance " +
                                          std::to_string(spendable) +
                                          ", amount " + std::to_string(tx.amount));
    }
  }
  return enqueueLocked(tx);
}

Blockchain::Roe<Transaction> Blockchain::requestFaucet(const std::string &requested) {
  auto normalized = utl::normalizeAddress(requested);
  if (!normalized) {
    return Error(E_FAUCET_ADDRESS, "Faucet address must be a hex Ed25519 public key: " +
                                       normalized.error().message);
  }
  const std::string &address = normalized.value();

  std::lock_guard<std::mutex> lock(mutex_);
  const auto &policy = config_.faucet;
  int64_t now = utl::getCurrentTime();
  auto &record = mFaucetRecords_[address];
  if (policy.maxRequestsPerAddress > 0 &&
      record.count >= policy.maxRequestsPerAddress) {
    return Error(E_FAUCET_LIMIT, "Faucet limit of " +
                                     std::to_string(policy.maxRequestsPerAddress) +
                                     " requests reached for " + address);
  }
  if (policy.cooldownSeconds > 0 && record.count > 0 &&
      now - record.lastRequestTime < static_cast<int64_t>(policy.cooldownSeconds)) {
    return Error(E_FAUCET_LIMIT, "Faucet cooldown active, retry in " +
                                     std::to_string(policy.cooldownSeconds -
                                                    (now - record.lastRequestTime)) +
                                     "s");
  }

  // Keep faucet ids unique when requests land in the same millisecond
  int64_t timestamp = std::max(utl::getCurrentTimeMs(), lastFaucetTimestamp_ + 1);
  Transaction tx = Transaction::createFaucet(address, policy.amount, timestamp);

  auto queued = enqueueLocked(tx);
  if (!queued) {
    return queued.error();
  }
  lastFaucetTimestamp_ = timestamp;
  record.count++;
  record.lastRequestTime = now;
  log().info << "Faucet credit of " << policy.amount << " queued for " << address;
  return tx;
}

std::vector<Transaction> Blockchain::drainPending(size_t maxTransactions) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return drainPendingLocked(maxTransactions);
}

// ----------------- queries -------------------------------------

uint64_t Blockchain::getBalance(const std::string &address) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return getCommittedLocked(address);
}

uint64_t Blockchain::computeBalanceByReplay(const std::string &address) const {
  std::lock_guard<std::mutex> lock(mutex_);
  uint64_t minted = 0;
  auto replay = replayLocked(minted);
  if (!replay) {
    log().critical << "Chain replay failed: " << replay.error().message;
    return 0;
  }
  auto it = replay.value().find(address);
  return it == replay.value().end() ? 0 : it->second.getBalance();
}

Blockchain::Roe<Block> Blockchain::getBlock(uint64_t index) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (index >= chain_.size()) {
    return Error(E_BLOCK_INDEX, "Block " + std::to_string(index) +
                                    " not found, chain length is " +
                                    std::to_string(chain_.size()));
  }
  return chain_[index];
}

Block Blockchain::getLatestBlock() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chain_.back();
}

size_t Blockchain::getPendingCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

uint64_t Blockchain::getTotalSupply() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return totalMinted_;
}

uint64_t Blockchain::getBalanceSum() const {
  std::lock_guard<std::mutex> lock(mutex_);
  uint64_t sum = 0;
  for (const auto &[address, wallet] : balances_) {
    sum += wallet.getBalance();
  }
  return sum;
}

Blockchain::Status Blockchain::getStatus() const {
  std::lock_guard<std::mutex> lock(mutex_);
  Status status;
  status.chainLength = chain_.size();
  status.lastBlockHash = chain_.back().hash;
  status.pendingCount = pending_.size();
  status.totalSupply = totalMinted_;
  status.accountCount = balances_.size();
  return status;
}

Blockchain::Roe<void> Blockchain::verifyBalances() {
  std::lock_guard<std::mutex> lock(mutex_);
  return verifyBalancesLocked();
}

bool Blockchain::isValid() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (chain_.empty()) {
    return false;
  }
  const Block &genesis = chain_.front();
  if (genesis.index != 0 || genesis.previousHash != Block::GENESIS_PREVIOUS_HASH ||
      genesis.hash != genesis.calculateHash()) {
    return false;
  }
  for (size_t i = 1; i < chain_.size(); ++i) {
    const Block &block = chain_[i];
    if (block.index != i || block.previousHash != chain_[i - 1].hash) {
      return false;
    }
    if (!consensus_.validateBlock(block, chain_[i - 1].hash)) {
      return false;
    }
  }
  uint64_t minted = 0;
  return replayLocked(minted).isOk();
}

// ----------------- internals -------------------------------------

std::vector<Transaction>
Blockchain::drainPendingLocked(size_t maxTransactions) const {
  size_t count = pending_.size();
  if (maxTransactions > 0 && maxTransactions < count) {
    count = maxTransactions;
  }
  return std::vector<Transaction>(pending_.begin(), pending_.begin() + count);
}

Blockchain::Roe<std::string> Blockchain::enqueueLocked(const Transaction &tx) {
  std::string id = tx.getId();
  if (pendingIds_.count(id) > 0 || committedIds_.count(id) > 0) {
    return Error(E_TX_DUPLICATE, "Transaction " + id + " already known");
  }
  if (config_.maxPendingTransactions > 0 &&
      pending_.size() >= config_.maxPendingTransactions) {
    return Error(E_TX_POOL_FULL, "Pending pool is full (" +
                                     std::to_string(pending_.size()) + ")");
  }
  pending_.push_back(tx);
  pendingIds_.insert(id);
  log().debug << "Queued transaction " << id << " " << tx.from << " -> "
              << tx.to << " amount " << tx.amount;
  return id;
}

uint64_t Blockchain::getCommittedLocked(const std::string &address) const {
  auto it = balances_.find(address);
  return it == balances_.end() ? 0 : it->second.getBalance();
}

uint64_t Blockchain::getSpendableLocked(const std::string &address) const {
  // Project the committed balance through the pool in arrival order
  Wallet projected(getCommittedLocked(address));
  for (const auto &tx : pending_) {
    if (tx.from == address) {
      auto result = projected.withdraw(tx.amount);
      if (!result) {
        log().error << "Pending pool overdraws " << address << ": "
                    << result.error().message;
        return 0;
      }
    }
    if (tx.to == address) {
      auto result = projected.deposit(tx.amount);
      if (!result) {
        log().error << "Pending pool overflows " << address << ": "
                    << result.error().message;
        return 0;
      }
    }
  }
  return projected.getBalance();
}

Blockchain::Roe<void> Blockchain::applyTransaction(BalanceMap &balances,
                                                   uint64_t &minted,
                                                   const Transaction &tx) const {
  if (tx.isFaucet()) {
    if (minted > std::numeric_limits<uint64_t>::max() - tx.amount) {
      return Error(E_BLOCK_TX, "Faucet credit overflows total supply");
    }
    auto result = balances[tx.to].deposit(tx.amount);
    if (!result) {
      return Error(E_BLOCK_TX, "Faucet credit to " + tx.to + ": " +
                                   result.error().message);
    }
    minted += tx.amount;
    return {};
  }

  auto &source = balances[tx.from];
  auto &destination = balances[tx.to];
  auto result = source.transfer(destination, tx.amount);
  if (!result) {
    int32_t code = result.error().code == Wallet::E_INSUFFICIENT ? E_ACCOUNT_BALANCE
                                                                 : E_BLOCK_TX;
    return Error(code, "Transfer " + tx.from + " -> " + tx.to + ": " +
                           result.error().message);
  }
  return {};
}

Blockchain::Roe<void> Blockchain::applyBlock(BalanceMap &balances,
                                             uint64_t &minted,
                                             const Block &block) const {
  for (const auto &tx : block.transactions) {
    auto result = applyTransaction(balances, minted, tx);
    if (!result) {
      return Error(result.error().code == E_ACCOUNT_BALANCE ? E_BLOCK_TX
                                                            : result.error().code,
                   "Block " + std::to_string(block.index) + ": " +
                       result.error().message);
    }
  }
  if (block.index > 0 && config_.blockReward > 0) {
    if (minted > std::numeric_limits<uint64_t>::max() - config_.blockReward) {
      return Error(E_BLOCK_TX, "Block reward overflows total supply");
    }
    auto result = balances[block.miner].deposit(config_.blockReward);
    if (!result) {
      return Error(E_BLOCK_TX, "Block reward to " + block.miner + ": " +
                                   result.error().message);
    }
    minted += config_.blockReward;
  }
  return {};
}

Blockchain::Roe<Blockchain::BalanceMap>
Blockchain::replayLocked(uint64_t &minted) const {
  BalanceMap balances;
  minted = 0;
  for (const auto &block : chain_) {
    auto result = applyBlock(balances, minted, block);
    if (!result) {
      return result.error();
    }
  }
  return balances;
}

Blockchain::Roe<void> Blockchain::verifyBalancesLocked() {
  uint64_t replayMinted = 0;
  auto replay = replayLocked(replayMinted);
  if (!replay) {
    return Error(E_INTERNAL, "Chain replay failed: " + replay.error().message);
  }

  const BalanceMap &expected = replay.value();
  std::vector<std::string> mismatches;
  for (const auto &[address, wallet] : expected) {
    if (getCommittedLocked(address) != wallet.getBalance()) {
      mismatches.push_back(address);
    }
  }
  for (const auto &[address, wallet] : balances_) {
    if (expected.count(address) == 0 && wallet.getBalance() != 0) {
      mismatches.push_back(address);
    }
  }

  if (mismatches.empty() && replayMinted == totalMinted_) {
    return {};
  }

  log().critical << "Balance cache diverged from chain replay for "
                 << mismatches.size() << " accounts (supply cache "
                 << totalMinted_ << ", replay " << replayMinted
                 << "), rebuilding from replay";
  balances_ = expected;
  totalMinted_ = replayMinted;
  return Error(E_INTERNAL, "Balance cache diverged from chain replay");
}

void Blockchain::prunePendingLocked() {
  // Drop pending transactions the new committed state can no longer fund
  BalanceMap projected = balances_;
  uint64_t minted = totalMinted_;
  std::vector<Transaction> kept;
  kept.reserve(pending_.size());
  for (const auto &tx : pending_) {
    if (committedIds_.count(tx.getId()) > 0) {
      pendingIds_.erase(tx.getId());
      continue;
    }
    auto result = applyTransaction(projected, minted, tx);
    if (!result) {
      log().warning << "Dropping pending transaction " << tx.getId() << ": "
                    << result.error().message;
      pendingIds_.erase(tx.getId());
      continue;
    }
    kept.push_back(tx);
  }
  pending_ = std::move(kept);
}

} // namespace mc
