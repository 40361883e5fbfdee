#include "Producer.h"
#include "Consensus.h"

#include <chrono>

namespace mc {
namespace consensus {

Producer::Producer(const Consensus &consensus, std::shared_ptr<IChain> chain,
                   const Config &config)
    : Service(consensus.getLoggerName() + ".producer"), consensus_(consensus),
      chain_(std::move(chain)), config_(config) {}

Producer::~Producer() { stop(); }

Producer::Outcome Producer::produceOnce() {
  auto candidate = chain_->prepareCandidate(config_.maxTransactionsPerBlock);
  if (candidate.transactions.empty() ||
      candidate.transactions.size() < config_.minPendingTransactions) {
    return Outcome::IDLE;
  }

  log().debug << "Sealing block " << candidate.nextIndex << " with "
              << candidate.transactions.size() << " transactions";

  auto blockResult = consensus_.generateBlock(
      candidate.nextIndex, candidate.transactions, candidate.previousHash,
      [this]() { return isRunning() && isStopSet(); });
  if (!blockResult) {
    if (blockResult.error().code == Consensus::E_CANCELLED) {
      log().info << "Block " << candidate.nextIndex << " abandoned: "
                 << blockResult.error().message;
      ++discardedCount_;
      return Outcome::DISCARDED;
    }
    log().error << "Failed to generate block " << candidate.nextIndex << ": "
                << blockResult.error().message;
    return Outcome::FAILED;
  }

  const Block &block = blockResult.value();
  if (!consensus_.validateBlock(block, candidate.previousHash)) {
    ++discardedCount_;
    log().error << "Generated block " << block.index
                << " failed its own validation, discarding";
    return Outcome::FAILED;
  }

  auto appendResult = chain_->appendBlock(block);
  if (!appendResult) {
    ++discardedCount_;
    if (IChain::isStale(appendResult.error())) {
      log().warning << "Discarding stale block " << block.index << ": "
                    << appendResult.error().message;
      return Outcome::DISCARDED;
    }
    log().error << "Chain rejected block " << block.index << ": "
                << appendResult.error().message;
    return Outcome::FAILED;
  }

  ++producedCount_;
  log().info << "Produced block " << block.index << " hash " << block.hash
             << " (" << block.transactions.size() << " txs, nonce "
             << block.nonce << ")";
  return Outcome::APPENDED;
}

void Producer::runLoop() {
  log().info << "Block production started (" << consensus_.name() << ")";
  while (!isStopSet()) {
    switch (produceOnce()) {
    case Outcome::APPENDED:
      waitFor(config_.blockIntervalMs);
      break;
    case Outcome::DISCARDED:
      break;
    case Outcome::IDLE:
    case Outcome::FAILED:
      waitFor(config_.idleIntervalMs);
      break;
    }
  }
  log().info << "Block production stopped";
}

void Producer::onStopRequested() {
  std::lock_guard<std::mutex> lock(waitMutex_);
  waitCv_.notify_all();
}

void Producer::waitFor(int64_t ms) {
  if (ms <= 0) {
    return;
  }
  std::unique_lock<std::mutex> lock(waitMutex_);
  waitCv_.wait_for(lock, std::chrono::milliseconds(ms),
                   [this]() { return isStopSet(); });
}

} // namespace consensus
} // namespace mc
