#include "Node.h"
#include "ProofOfStake.h"
#include "Utilities.h"

#include <filesystem>
#include <ostream>

namespace mc {

// ============ Config ============

nlohmann::json Node::Config::ltsToJson() const {
  nlohmann::json j;
  j["host"] = host;
  j["port"] = port;
  j["logFile"] = logFile;
  j["consensus"] = consensus.ltsToJson();
  if (!minerKey.empty()) {
    j["consensus"]["minerKey"] = minerKey;
  }
  j["ledger"] = ledger.ltsToJson();
  return j;
}

Node::Roe<void> Node::Config::ltsFromJson(const nlohmann::json &jd) {
  try {
    if (!jd.is_object()) {
      return Error(E_CONFIG, "Configuration must be a JSON object");
    }

    if (jd.contains("host")) {
      if (!jd["host"].is_string() || jd["host"].get<std::string>().empty()) {
        return Error(E_CONFIG, "Field 'host' must be a non-empty string");
      }
      host = jd["host"].get<std::string>();
    }

    if (jd.contains("port")) {
      if (!jd["port"].is_number_unsigned() || jd["port"].get<uint64_t>() > 65535) {
        return Error(E_CONFIG, "Field 'port' must be a number between 0 and 65535");
      }
      port = static_cast<uint16_t>(jd["port"].get<uint64_t>());
    }

    if (jd.contains("logFile")) {
      if (!jd["logFile"].is_string()) {
        return Error(E_CONFIG, "Field 'logFile' must be a string");
      }
      logFile = jd["logFile"].get<std::string>();
    }

    if (jd.contains("consensus")) {
      const auto &jc = jd["consensus"];
      auto result = consensus.ltsFromJson(jc);
      if (!result) {
        return Error(E_CONFIG, result.error().message);
      }
      if (jc.contains("minerKey")) {
        if (!jc["minerKey"].is_string()) {
          return Error(E_CONFIG, "Field 'consensus.minerKey' must be a string");
        }
        minerKey = jc["minerKey"].get<std::string>();
      }
    }

    if (jd.contains("ledger")) {
      auto result = ledger.ltsFromJson(jd["ledger"]);
      if (!result) {
        return Error(E_CONFIG, result.error().message);
      }
    }

    return {};
  } catch (const std::exception &e) {
    return Error(E_CONFIG, "Failed to parse configuration: " + std::string(e.what()));
  }
}

nlohmann::json Node::Status::toJson() const {
  nlohmann::json j;
  j["consensus"] = consensus;
  j["producing"] = producing;
  j["chainLength"] = chain.chainLength;
  j["lastBlockHash"] = chain.lastBlockHash;
  j["pendingTransactions"] = chain.pendingCount;
  j["totalSupply"] = chain.totalSupply;
  j["accounts"] = chain.accountCount;
  j["producedBlocks"] = producedBlocks;
  j["discardedBlocks"] = discardedBlocks;
  return j;
}

std::ostream &operator<<(std::ostream &os, const Node::Status &status) {
  os << "Node{consensus: " << status.consensus
     << ", producing: " << (status.producing ? "yes" : "no")
     << ", " << status.chain
     << ", produced: " << status.producedBlocks
     << ", discarded: " << status.discardedBlocks << "}";
  return os;
}

// ============ Node ============

std::string Node::errorKind(int32_t code) {
  switch (code) {
  case Blockchain::E_TX_SIGNATURE:
    return "InvalidSignature";
  case Blockchain::E_TX_AMOUNT:
    return "InvalidAmount";
  case Blockchain::E_ACCOUNT_BALANCE:
    return "InsufficientFunds";
  case Blockchain::E_TX_DUPLICATE:
    return "Duplicate";
  case Blockchain::E_TX_POOL_FULL:
    return "PoolFull";
  case Blockchain::E_TX_VALIDATION:
    return "InvalidTransaction";
  case Blockchain::E_FAUCET_LIMIT:
    return "FaucetLimited";
  case Blockchain::E_FAUCET_ADDRESS:
    return "InvalidAddress";
  case IChain::E_BLOCK_INDEX:
    return "IndexMismatch";
  case IChain::E_BLOCK_CHAIN:
    return "LinkMismatch";
  case IChain::E_BLOCK_HASH:
  case IChain::E_BLOCK_VALIDATION:
  case IChain::E_BLOCK_TX:
  case IChain::E_BLOCK_MINER:
    return "BlockInvalid";
  case E_NOT_FOUND:
    return "NotFound";
  case E_NOT_INITIALIZED:
    return "NotReady";
  default:
    return "Internal";
  }
}

int Node::httpStatus(int32_t code) {
  switch (code) {
  case Blockchain::E_TX_SIGNATURE:
  case Blockchain::E_TX_AMOUNT:
  case Blockchain::E_ACCOUNT_BALANCE:
  case Blockchain::E_TX_VALIDATION:
  case Blockchain::E_FAUCET_ADDRESS:
    return 400;
  case E_NOT_FOUND:
    return 404;
  case Blockchain::E_TX_DUPLICATE:
    return 409;
  case Blockchain::E_FAUCET_LIMIT:
    return 429;
  case Blockchain::E_TX_POOL_FULL:
  case E_NOT_INITIALIZED:
    return 503;
  default:
    return 500;
  }
}

Node::Roe<Node::Config> Node::loadConfig(const std::string &path) {
  auto jsonResult = utl::loadJsonFile(path);
  if (!jsonResult) {
    return Error(E_CONFIG, jsonResult.error().message);
  }

  Config config;
  auto result = config.ltsFromJson(jsonResult.value());
  if (!result) {
    return Error(E_CONFIG, "Invalid configuration in " + path + ": " +
                               result.error().message);
  }

  if (!config.minerKey.empty()) {
    std::string baseDir = std::filesystem::path(path).parent_path().string();
    auto keyResult = utl::readPrivateKey(config.minerKey, baseDir);
    if (!keyResult) {
      return Error(E_KEY, "Failed to read miner key: " + keyResult.error().message);
    }
    // Keep the decoded key so later resolution does not depend on the cwd
    config.minerKey = utl::hexEncode(keyResult.value());
  }
  return config;
}

Node::Node() : Module("mockchain.node") {}

Node::~Node() { stop(); }

Node::Roe<void> Node::init(const Config &config) {
  if (consensus_ && consensus_->isRunning()) {
    return Error(E_CONSENSUS, "Cannot re-initialize a running node");
  }
  config_ = config;

  if (config_.consensus.type == consensus::Consensus::Type::PROOF_OF_WORK) {
    auto result = resolveMinerAddress();
    if (!result) {
      return result;
    }
  } else {
    auto result = resolveStakeholders();
    if (!result) {
      return result;
    }
  }

  auto consensusResult = consensus::Consensus::create(config_.consensus);
  if (!consensusResult) {
    return Error(E_CONSENSUS, consensusResult.error().message);
  }
  consensus_ = std::move(consensusResult.value());
  chain_ = std::make_shared<Blockchain>(*consensus_, config_.ledger);

  log().info << "Node initialized with " << consensus_->name()
             << ", genesis " << chain_->getLastBlockHash();
  return {};
}

Node::Roe<void> Node::resolveMinerAddress() {
  auto &cc = config_.consensus;
  if (!cc.minerAddress.empty()) {
    return {};
  }

  if (!config_.minerKey.empty()) {
    auto keyResult = utl::readPrivateKey(config_.minerKey);
    if (!keyResult) {
      return Error(E_KEY, "Failed to read miner key: " + keyResult.error().message);
    }
    auto publicKey = utl::ed25519PublicKey(keyResult.value());
    if (!publicKey) {
      return Error(E_KEY, publicKey.error().message);
    }
    cc.minerAddress = utl::hexEncode(publicKey.value());
    log().info << "Miner address from key: " << cc.minerAddress;
    return {};
  }

  auto address = generateNodeKey("miner");
  if (!address) {
    return address.error();
  }
  cc.minerAddress = address.value();
  return {};
}

Node::Roe<void> Node::resolveStakeholders() {
  auto &cc = config_.consensus;
  if (!cc.stakeholders.empty()) {
    return {};
  }

  // A stake registry is required; a lone node stakes for itself
  auto address = generateNodeKey("validator");
  if (!address) {
    return address.error();
  }
  consensus::Stakeholder holder;
  holder.address = address.value();
  holder.stake = cc.minStake > 0 ? cc.minStake : 1;
  cc.stakeholders.push_back(holder);
  log().warning << "No stakeholders configured, node validator " << holder.address
                << " registered with stake " << holder.stake;
  return {};
}

Node::Roe<std::string> Node::generateNodeKey(const std::string &purpose) {
  auto pair = utl::ed25519Generate();
  if (!pair) {
    return Error(E_KEY, "Failed to generate " + purpose + " key: " +
                            pair.error().message);
  }
  std::string address = utl::hexEncode(pair->publicKey);
  log().warning << "No " << purpose << " key configured, generated one";
  log().info << "Generated " << purpose << " address: " << address;
  return address;
}

Node::Roe<void> Node::start() {
  if (!consensus_ || !chain_) {
    return Error(E_NOT_INITIALIZED, "Node is not initialized");
  }
  auto result = consensus_->start(chain_);
  if (!result) {
    return Error(E_CONSENSUS, result.error().message);
  }
  return {};
}

void Node::stop() {
  if (consensus_) {
    consensus_->stop();
  }
}

bool Node::isRunning() const { return consensus_ && consensus_->isRunning(); }

Node::Roe<std::string> Node::submitTransaction(const Transaction &tx) {
  if (!chain_) {
    return Error(E_NOT_INITIALIZED, "Node is not initialized");
  }
  if (tx.isFaucet()) {
    log().info << "Transaction rejected: reserved system sender";
    return Error(Blockchain::E_TX_SIGNATURE,
                 "Reserved system sender cannot submit transactions");
  }
  auto result = chain_->submitTransaction(tx);
  if (!result) {
    log().info << "Transaction rejected (" << errorKind(result.error().code)
               << "): " << result.error().message;
    return Error(result.error().code, result.error().message);
  }
  return result.value();
}

Node::Roe<uint64_t> Node::getBalance(const std::string &address) const {
  if (!chain_) {
    return Error(E_NOT_INITIALIZED, "Node is not initialized");
  }
  // Unknown or malformed addresses hold nothing
  auto normalized = utl::normalizeAddress(address);
  return chain_->getBalance(normalized ? normalized.value() : address);
}

Node::Roe<Transaction> Node::requestFaucet(const std::string &address) {
  if (!chain_) {
    return Error(E_NOT_INITIALIZED, "Node is not initialized");
  }
  auto result = chain_->requestFaucet(address);
  if (!result) {
    log().info << "Faucet request rejected (" << errorKind(result.error().code)
               << "): " << result.error().message;
    return Error(result.error().code, result.error().message);
  }
  return result.value();
}

Node::Roe<Block> Node::getBlock(uint64_t index) const {
  if (!chain_) {
    return Error(E_NOT_INITIALIZED, "Node is not initialized");
  }
  auto result = chain_->getBlock(index);
  if (!result) {
    return Error(E_NOT_FOUND, result.error().message);
  }
  return result.value();
}

Node::Roe<Node::Status> Node::getStatus() const {
  if (!chain_ || !consensus_) {
    return Error(E_NOT_INITIALIZED, "Node is not initialized");
  }
  Status status;
  status.consensus = consensus_->name();
  status.producing = consensus_->isRunning();
  status.chain = chain_->getStatus();
  status.producedBlocks = consensus_->getProducedCount();
  status.discardedBlocks = consensus_->getDiscardedCount();
  return status;
}

} // namespace mc
