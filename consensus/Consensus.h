#pragma once

#include "Block.h"
#include "IChain.hpp"
#include "Module.h"
#include "ResultOrError.hpp"
#include "Types.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace mc {
namespace consensus {

class Producer;

/**
 * Block production and validation policy.
 *
 * A policy seals candidate blocks (generateBlock) and judges sealed blocks
 * (validateBlock); both are safe to call from any thread. start() runs a
 * Producer against a chain until stop().
 */
class Consensus : public Module {
public:
  enum class Type { PROOF_OF_WORK, PROOF_OF_STAKE };

  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_CONFIG = 1;
  constexpr static int32_t E_CANCELLED = 2;
  constexpr static int32_t E_NO_VALIDATOR = 3;
  constexpr static int32_t E_STATE = 4;

  constexpr static uint32_t DEFAULT_DIFFICULTY = 3;
  constexpr static int64_t DEFAULT_POS_BLOCK_INTERVAL_MS = 10000;
  constexpr static int64_t DEFAULT_IDLE_INTERVAL_MS = 500;

  struct Config {
    Type type{ Type::PROOF_OF_WORK };
    uint32_t difficulty{ DEFAULT_DIFFICULTY };
    std::string minerAddress;
    uint64_t minStake{ 0 };
    std::vector<Stakeholder> stakeholders;
    int64_t blockIntervalMs{ -1 };        // -1 = variant default
    int64_t idleIntervalMs{ DEFAULT_IDLE_INTERVAL_MS };
    uint64_t maxTransactionsPerBlock{ 0 }; // 0 = no limit
    uint64_t minPendingTransactions{ 1 };

    nlohmann::json ltsToJson() const;
    Roe<void> ltsFromJson(const nlohmann::json &jd);
  };

  // Polled during long searches; returning true abandons the search
  using CancelCheck = std::function<bool()>;

  static std::string typeToString(Type type);
  static Roe<Type> typeFromString(const std::string &str);

  static Roe<std::unique_ptr<Consensus>> create(const Config &config);

  Consensus(const std::string &loggerName, const Config &config);
  // Derived policies must stop() in their own destructor
  ~Consensus() override;

  virtual Type getType() const = 0;
  virtual std::string name() const = 0;

  /**
   * Seal a block at `index` on top of `previousHash` holding `transactions`
   * in the given order. The result already passes validateBlock().
   */
  virtual Roe<Block> generateBlock(uint64_t index,
                                   const std::vector<Transaction> &transactions,
                                   const std::string &previousHash,
                                   const CancelCheck &isCancelled = nullptr) const = 0;

  virtual bool validateBlock(const Block &block,
                             const std::string &previousHash) const = 0;

  // Pause between produced blocks
  virtual int64_t getBlockIntervalMs() const = 0;

  const Config &getConfig() const { return config_; }

  Roe<void> start(std::shared_ptr<IChain> chain);
  void stop();
  bool isRunning() const;

  uint64_t getProducedCount() const;
  uint64_t getDiscardedCount() const;

protected:
  // Shared checks: hash recomputes and links to previousHash
  bool checkSeal(const Block &block, const std::string &previousHash) const;

  Config config_;

private:
  std::unique_ptr<Producer> producer_;
  uint64_t producedBefore_{ 0 };
  uint64_t discardedBefore_{ 0 };
};

} // namespace consensus
} // namespace mc
