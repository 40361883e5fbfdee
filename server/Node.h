#ifndef MOCKCHAIN_NODE_H
#define MOCKCHAIN_NODE_H

#include "Blockchain.h"
#include "Consensus.h"
#include "Module.h"
#include "ResultOrError.hpp"

#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace mc {

/**
 * Node - Owns the ledger and the consensus policy of a single node
 *
 * Every operation goes through the ledger's public methods; block
 * production reaches the same ledger through IChain. Errors returned by the
 * ledger keep their code so callers can map them with errorKind().
 */
class Node : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static const char *DEFAULT_HOST = "127.0.0.1";
  constexpr static uint16_t DEFAULT_PORT = 50051;

  // Node errors (90-98), ledger and chain codes pass through unchanged
  constexpr static int32_t E_CONFIG = 1;
  constexpr static int32_t E_NOT_INITIALIZED = 90;
  constexpr static int32_t E_KEY = 91;
  constexpr static int32_t E_CONSENSUS = 92;
  constexpr static int32_t E_NOT_FOUND = 93;

  struct Config {
    std::string host{ DEFAULT_HOST };
    uint16_t port{ DEFAULT_PORT };
    std::string logFile;
    std::string minerKey; // hex or path, resolved against the config dir
    consensus::Consensus::Config consensus;
    Blockchain::Config ledger;

    nlohmann::json ltsToJson() const;
    Roe<void> ltsFromJson(const nlohmann::json &jd);
  };

  struct Status {
    std::string consensus;
    bool producing{ false };
    Blockchain::Status chain;
    uint64_t producedBlocks{ 0 };
    uint64_t discardedBlocks{ 0 };

    nlohmann::json toJson() const;
  };

  // Name of the error kind reported to clients for a ledger/chain code
  static std::string errorKind(int32_t code);
  static int httpStatus(int32_t code);

  /**
   * Read a node configuration file. Relative key paths inside it are
   * resolved against the directory holding the file.
   */
  static Roe<Config> loadConfig(const std::string &path);

  Node();
  ~Node() override;

  Node(const Node &) = delete;
  Node &operator=(const Node &) = delete;

  /**
   * Build the consensus policy and the ledger with its genesis block.
   * A Proof-of-Work node without a miner address gets a fresh key.
   */
  Roe<void> init(const Config &config);

  // Start and stop block production
  Roe<void> start();
  void stop();
  bool isRunning() const;

  Roe<std::string> submitTransaction(const Transaction &tx);
  Roe<uint64_t> getBalance(const std::string &address) const;
  Roe<Transaction> requestFaucet(const std::string &address);
  Roe<Block> getBlock(uint64_t index) const;
  Roe<Status> getStatus() const;

  const Config &getConfig() const { return config_; }
  std::shared_ptr<Blockchain> getChain() const { return chain_; }
  consensus::Consensus *getConsensus() const { return consensus_.get(); }

private:
  Roe<void> resolveMinerAddress();
  Roe<void> resolveStakeholders();
  Roe<std::string> generateNodeKey(const std::string &purpose);

  Config config_;
  std::unique_ptr<consensus::Consensus> consensus_;
  std::shared_ptr<Blockchain> chain_;
};

std::ostream &operator<<(std::ostream &os, const Node::Status &status);

} // namespace mc

#endif // MOCKCHAIN_NODE_H
