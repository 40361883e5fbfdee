#pragma once

#include "IChain.hpp"
#include "Service.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>

namespace mc {
namespace consensus {

class Consensus;

/**
 * Block production loop.
 *
 * Each round takes one snapshot from the chain, seals it with the consensus
 * policy outside any chain lock, then offers it back. A candidate whose
 * linkage went stale is dropped and the round restarts from a fresh snapshot.
 */
class Producer : public Service {
public:
  struct Config {
    uint64_t maxTransactionsPerBlock{ 0 };
    uint64_t minPendingTransactions{ 1 };
    int64_t idleIntervalMs{ 500 };
    int64_t blockIntervalMs{ 0 };
  };

  Producer(const Consensus &consensus, std::shared_ptr<IChain> chain,
           const Config &config);
  ~Producer() override;

  enum class Outcome { APPENDED, IDLE, DISCARDED, FAILED };

  // One round: snapshot, seal, self-check, append
  Outcome produceOnce();

  uint64_t getProducedCount() const { return producedCount_; }
  uint64_t getDiscardedCount() const { return discardedCount_; }

protected:
  void runLoop() override;
  void onStopRequested() override;

private:
  // Sleeps up to `ms`, returns early when stop is requested
  void waitFor(int64_t ms);

  const Consensus &consensus_;
  std::shared_ptr<IChain> chain_;
  Config config_;

  std::atomic<uint64_t> producedCount_{ 0 };
  std::atomic<uint64_t> discardedCount_{ 0 };

  std::mutex waitMutex_;
  std::condition_variable waitCv_;
};

} // namespace consensus
} // namespace mc
