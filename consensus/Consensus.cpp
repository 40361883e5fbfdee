#include "Consensus.h"
#include "ProofOfStake.h"
#include "ProofOfWork.h"
#include "Producer.h"
#include "Utilities.h"

namespace mc {
namespace consensus {

// ============ Config ============

nlohmann::json Consensus::Config::ltsToJson() const {
  nlohmann::json j;
  j["type"] = typeToString(type);
  j["difficulty"] = difficulty;
  j["minerAddress"] = minerAddress;
  j["minStake"] = minStake;
  nlohmann::json holders = nlohmann::json::array();
  for (const auto &holder : stakeholders) {
    holders.push_back({ { "address", holder.address }, { "stake", holder.stake } });
  }
  j["stakeholders"] = holders;
  j["blockIntervalMs"] = blockIntervalMs;
  j["idleIntervalMs"] = idleIntervalMs;
  j["maxTransactionsPerBlock"] = maxTransactionsPerBlock;
  j["minPendingTransactions"] = minPendingTransactions;
  return j;
}

Consensus::Roe<void> Consensus::Config::ltsFromJson(const nlohmann::json &jd) {
  try {
    if (!jd.is_object()) {
      return Error(E_CONFIG, "Consensus configuration must be a JSON object");
    }

    if (jd.contains("type")) {
      if (!jd["type"].is_string()) {
        return Error(E_CONFIG, "Field 'type' must be a string");
      }
      auto typeResult = typeFromString(jd["type"].get<std::string>());
      if (!typeResult) {
        return typeResult.error();
      }
      type = typeResult.value();
    }

    if (jd.contains("difficulty")) {
      if (!jd["difficulty"].is_number_unsigned()) {
        return Error(E_CONFIG, "Field 'difficulty' must be a non-negative number");
      }
      uint64_t value = jd["difficulty"].get<uint64_t>();
      if (value > 64) {
        return Error(E_CONFIG, "Field 'difficulty' must be at most 64");
      }
      difficulty = static_cast<uint32_t>(value);
    }

    if (jd.contains("minerAddress")) {
      if (!jd["minerAddress"].is_string()) {
        return Error(E_CONFIG, "Field 'minerAddress' must be a string");
      }
      std::string address = jd["minerAddress"].get<std::string>();
      if (address.empty()) {
        minerAddress.clear();
      } else {
        auto normalized = utl::normalizeAddress(address);
        if (!normalized) {
          return Error(E_CONFIG, "Field 'minerAddress': " + normalized.error().message);
        }
        minerAddress = normalized.value();
      }
    }

    if (jd.contains("minStake")) {
      if (!jd["minStake"].is_number_unsigned()) {
        return Error(E_CONFIG, "Field 'minStake' must be a non-negative number");
      }
      minStake = jd["minStake"].get<uint64_t>();
    }

    if (jd.contains("stakeholders")) {
      if (!jd["stakeholders"].is_array()) {
        return Error(E_CONFIG, "Field 'stakeholders' must be an array");
      }
      stakeholders.clear();
      for (const auto &item : jd["stakeholders"]) {
        if (!item.is_object() || !item.contains("address") ||
            !item["address"].is_string() || !item.contains("stake") ||
            !item["stake"].is_number_unsigned()) {
          return Error(E_CONFIG,
                       "Each stakeholder needs a string 'address' and an unsigned 'stake'");
        }
        auto normalized = utl::normalizeAddress(item["address"].get<std::string>());
        if (!normalized) {
          return Error(E_CONFIG, "Stakeholder address: " + normalized.error().message);
        }
        Stakeholder holder;
        holder.address = normalized.value();
        holder.stake = item["stake"].get<uint64_t>();
        stakeholders.push_back(holder);
      }
    }

    if (jd.contains("blockIntervalMs")) {
      if (!jd["blockIntervalMs"].is_number_integer()) {
        return Error(E_CONFIG, "Field 'blockIntervalMs' must be an integer");
      }
      blockIntervalMs = jd["blockIntervalMs"].get<int64_t>();
    }

    if (jd.contains("idleIntervalMs")) {
      if (!jd["idleIntervalMs"].is_number_unsigned()) {
        return Error(E_CONFIG, "Field 'idleIntervalMs' must be a non-negative number");
      }
      idleIntervalMs = jd["idleIntervalMs"].get<int64_t>();
    }

    if (jd.contains("maxTransactionsPerBlock")) {
      if (!jd["maxTransactionsPerBlock"].is_number_unsigned()) {
        return Error(E_CONFIG,
                     "Field 'maxTransactionsPerBlock' must be a non-negative number");
      }
      maxTransactionsPerBlock = jd["maxTransactionsPerBlock"].get<uint64_t>();
    }

    if (jd.contains("minPendingTransactions")) {
      if (!jd["minPendingTransactions"].is_number_unsigned()) {
        return Error(E_CONFIG,
                     "Field 'minPendingTransactions' must be a non-negative number");
      }
      minPendingTransactions = jd["minPendingTransactions"].get<uint64_t>();
    }

    return {};
  } catch (const std::exception &e) {
    return Error(E_CONFIG, "Failed to parse consensus configuration: " +
                               std::string(e.what()));
  }
}

// ============ Consensus ============

std::string Consensus::typeToString(Type type) {
  switch (type) {
  case Type::PROOF_OF_WORK:
    return "pow";
  case Type::PROOF_OF_STAKE:
    return "pos";
  }
  return "unknown";
}

Consensus::Roe<Consensus::Type> Consensus::typeFromString(const std::string &str) {
  if (str == "pow" || str == "proof-of-work") {
    return Type::PROOF_OF_WORK;
  }
  if (str == "pos" || str == "proof-of-stake") {
    return Type::PROOF_OF_STAKE;
  }
  return Error(E_CONFIG, "Unknown consensus type: " + str);
}

Consensus::Roe<std::unique_ptr<Consensus>> Consensus::create(const Config &config) {
  std::unique_ptr<Consensus> consensus;
  switch (config.type) {
  case Type::PROOF_OF_WORK: {
    if (config.minerAddress.empty()) {
      return Error(E_CONFIG, "Proof of Work needs a miner address");
    }
    auto miner = utl::normalizeAddress(config.minerAddress);
    if (!miner) {
      return Error(E_CONFIG, "Invalid miner address: " + miner.error().message);
    }
    Config powConfig = config;
    powConfig.minerAddress = miner.value();
    consensus = std::make_unique<ProofOfWork>(powConfig);
    break;
  }
  case Type::PROOF_OF_STAKE: {
    auto pos = std::make_unique<ProofOfStake>(config);
    auto result = pos->setStakeholders(config.stakeholders);
    if (!result) {
      return result.error();
    }
    consensus = std::move(pos);
    break;
  }
  }
  if (!consensus) {
    return Error(E_CONFIG, "Unsupported consensus type");
  }
  return consensus;
}

Consensus::Consensus(const std::string &loggerName, const Config &config)
    : Module(loggerName), config_(config) {}

Consensus::~Consensus() { stop(); }

Consensus::Roe<void> Consensus::start(std::shared_ptr<IChain> chain) {
  if (!chain) {
    return Error(E_STATE, "Cannot start block production without a chain");
  }
  if (producer_ && producer_->isRunning()) {
    return Error(E_STATE, "Block production is already running");
  }

  Producer::Config producerConfig;
  producerConfig.maxTransactionsPerBlock = config_.maxTransactionsPerBlock;
  producerConfig.minPendingTransactions = config_.minPendingTransactions;
  producerConfig.idleIntervalMs = config_.idleIntervalMs;
  producerConfig.blockIntervalMs = getBlockIntervalMs();

  producer_ = std::make_unique<Producer>(*this, std::move(chain), producerConfig);
  auto result = producer_->start();
  if (!result) {
    producer_.reset();
    return Error(E_STATE, "Failed to start block production: " +
                              result.error().message);
  }
  log().info << name() << " block production started";
  return {};
}

void Consensus::stop() {
  if (!producer_) {
    return;
  }
  producer_->stop();
  log().info << "Block production stopped after " << producer_->getProducedCount()
             << " blocks (" << producer_->getDiscardedCount() << " discarded)";
  producedBefore_ += producer_->getProducedCount();
  discardedBefore_ += producer_->getDiscardedCount();
  producer_.reset();
}

bool Consensus::isRunning() const { return producer_ && producer_->isRunning(); }

uint64_t Consensus::getProducedCount() const {
  return producedBefore_ + (producer_ ? producer_->getProducedCount() : 0);
}

uint64_t Consensus::getDiscardedCount() const {
  return discardedBefore_ + (producer_ ? producer_->getDiscardedCount() : 0);
}

bool Consensus::checkSeal(const Block &block,
                          const std::string &previousHash) const {
  if (block.previousHash != previousHash) {
    log().debug << "Block " << block.index << " does not link to " << previousHash;
    return false;
  }
  if (block.hash != block.calculateHash()) {
    log().debug << "Block " << block.index << " hash mismatch";
    return false;
  }
  return true;
}

} // namespace consensus
} // namespace mc
