#ifndef MOCKCHAIN_BLOCKCHAIN_H
#define MOCKCHAIN_BLOCKCHAIN_H

#include "Block.h"
#include "Consensus.h"
#include "IChain.hpp"
#include "Module.h"
#include "ResultOrError.hpp"
#include "Transaction.h"
#include "Wallet.h"

#include <cstdint>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <vector>

namespace mc {

/**
 * Blockchain - In-memory ledger state machine
 *
 * Holds the committed chain, the pool of verified pending transactions and
 * the balances derived from the chain. One mutex guards all of it, so every
 * public call sees and leaves a consistent state. Balances are kept as an
 * incremental cache which is cross-checked against a full replay of the
 * chain after each append when auditing is on.
 */
class Blockchain : public Module, public IChain {
public:
  struct FaucetConfig {
    uint64_t amount{ 1000 };
    uint64_t maxRequestsPerAddress{ 0 }; // 0 = unlimited
    uint64_t cooldownSeconds{ 0 };       // 0 = no cooldown
  };

  struct Config {
    uint64_t blockReward{ 50 };
    int64_t genesisTimestamp{ 0 };
    uint64_t maxPendingTransactions{ 0 }; // 0 = unbounded
    bool auditBalances{ true };
    FaucetConfig faucet;

    nlohmann::json ltsToJson() const;
    Roe<void> ltsFromJson(const nlohmann::json &jd);
  };

  struct Status {
    uint64_t chainLength{ 0 };
    std::string lastBlockHash;
    uint64_t pendingCount{ 0 };
    uint64_t totalSupply{ 0 };
    uint64_t accountCount{ 0 };
  };

  // Error code groups, block errors (10-29) come from IChain
  constexpr static int32_t E_CONFIG = 1;

  // Account errors (40-59)
  constexpr static int32_t E_ACCOUNT_BALANCE = 42; // Insufficient balance

  // Transaction errors (60-79)
  constexpr static int32_t E_TX_VALIDATION = 60; // Malformed transaction
  constexpr static int32_t E_TX_SIGNATURE = 61;  // Invalid signature
  constexpr static int32_t E_TX_AMOUNT = 63;     // Invalid amount
  constexpr static int32_t E_TX_DUPLICATE = 66;  // Already pending or committed
  constexpr static int32_t E_TX_POOL_FULL = 67;  // Pending pool at capacity

  // Faucet errors (70-79)
  constexpr static int32_t E_FAUCET_LIMIT = 70;   // Rate limit reached
  constexpr static int32_t E_FAUCET_ADDRESS = 71; // Not a valid address

  constexpr static int32_t E_INTERNAL = 99;

  Blockchain(const consensus::Consensus &consensus, const Config &config);
  ~Blockchain() override = default;

  // ----------------- IChain -------------------------------------
  Candidate prepareCandidate(size_t maxTransactions) const override;
  Roe<void> appendBlock(const Block &block) override;
  uint64_t getChainLength() const override;
  std::string getLastBlockHash() const override;

  // ----------------- operations -------------------------------------
  /**
   * Verify and enqueue a user transaction
   * @return Transaction id
   */
  Roe<std::string> submitTransaction(const Transaction &tx);

  /**
   * Enqueue a system credit of the configured faucet amount to `address`
   * @return The queued faucet transaction
   */
  Roe<Transaction> requestFaucet(const std::string &address);

  /**
   * Snapshot up to `maxTransactions` pending transactions (0 = all) in
   * arrival order. They stay pending until a block holding them is appended.
   */
  std::vector<Transaction> drainPending(size_t maxTransactions = 0) const;

  // ----------------- queries -------------------------------------
  uint64_t getBalance(const std::string &address) const;
  uint64_t computeBalanceByReplay(const std::string &address) const;
  Roe<Block> getBlock(uint64_t index) const;
  Block getLatestBlock() const;
  size_t getPendingCount() const;
  uint64_t getTotalSupply() const;
  uint64_t getBalanceSum() const;
  Status getStatus() const;
  const Config &getConfig() const { return config_; }

  /**
   * Compare the balance cache with a full replay of the chain. On mismatch
   * the cache is rebuilt from the replay and an error is returned.
   */
  Roe<void> verifyBalances();

  // Re-checks every block and its linkage from genesis
  bool isValid() const;

private:
  using BalanceMap = std::map<std::string, Wallet>;

  struct FaucetRecord {
    uint64_t count{ 0 };
    int64_t lastRequestTime{ 0 };
  };

  Block createGenesisBlock() const;

  std::vector<Transaction> drainPendingLocked(size_t maxTransactions) const;
  Roe<std::string> enqueueLocked(const Transaction &tx);
  uint64_t getSpendableLocked(const std::string &address) const;
  uint64_t getCommittedLocked(const std::string &address) const;

  Roe<void> applyTransaction(BalanceMap &balances, uint64_t &minted,
                             const Transaction &tx) const;
  Roe<void> applyBlock(BalanceMap &balances, uint64_t &minted,
                       const Block &block) const;
  Roe<BalanceMap> replayLocked(uint64_t &minted) const;
  Roe<void> verifyBalancesLocked();
  void prunePendingLocked();

  const consensus::Consensus &consensus_;
  Config config_;

  mutable std::mutex mutex_;
  std::vector<Block> chain_;
  std::vector<Transaction> pending_;
  std::set<std::string> pendingIds_;
  std::set<std::string> committedIds_;
  BalanceMap balances_;
  uint64_t totalMinted_{ 0 };
  std::map<std::string, FaucetRecord> mFaucetRecords_;
  int64_t lastFaucetTimestamp_{ 0 };
};

std::ostream &operator<<(std::ostream &os, const Blockchain::Status &status);

} // namespace mc

#endif // MOCKCHAIN_BLOCKCHAIN_H
