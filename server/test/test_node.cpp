#include "Node.h"
#include "Producer.h"
#include "ProofOfStake.h"
#include "Utilities.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>

using namespace mc;

namespace {

std::string makeAddress() {
  auto pair = utl::ed25519Generate();
  EXPECT_TRUE(pair.isOk());
  return pair.isOk() ? utl::hexEncode(pair->publicKey) : std::string();
}

} // namespace

class NodeConfigTest : public ::testing::Test {
protected:
  void SetUp() override {
    testDir = std::filesystem::temp_directory_path() /
              ("mockchain_node_test_" + std::to_string(utl::getCurrentTimeMs()));
    std::filesystem::create_directories(testDir);
  }

  void TearDown() override { std::filesystem::remove_all(testDir); }

  std::string writeFile(const std::string &name, const std::string &content) {
    auto path = testDir / name;
    std::ofstream out(path);
    out << content;
    return path.string();
  }

  std::filesystem::path testDir;
};

TEST_F(NodeConfigTest, LoadsFullConfiguration) {
  std::string miner = makeAddress();
  nlohmann::json j = {
    { "host", "0.0.0.0" },
    { "port", 8080 },
    { "consensus", { { "type", "pow" }, { "difficulty", 2 }, { "minerAddress", miner } } },
    { "ledger", { { "blockReward", 10 }, { "faucet", { { "amount", 77 } } } } }
  };
  auto result = Node::loadConfig(writeFile("node.json", j.dump()));
  ASSERT_TRUE(result.isOk()) << result.error().message;

  const auto &config = result.value();
  EXPECT_EQ(config.host, "0.0.0.0");
  EXPECT_EQ(config.port, 8080);
  EXPECT_EQ(config.consensus.difficulty, 2u);
  EXPECT_EQ(config.consensus.minerAddress, miner);
  EXPECT_EQ(config.ledger.blockReward, 10u);
  EXPECT_EQ(config.ledger.faucet.amount, 77u);
}

TEST_F(NodeConfigTest, DefaultsApplyToEmptyObject) {
  auto result = Node::loadConfig(writeFile("empty.json", "{}"));
  ASSERT_TRUE(result.isOk());
  EXPECT_EQ(result->host, Node::DEFAULT_HOST);
  EXPECT_EQ(result->port, Node::DEFAULT_PORT);
  EXPECT_EQ(result->consensus.type, consensus::Consensus::Type::PROOF_OF_WORK);
  EXPECT_EQ(result->ledger.faucet.amount, 1000u);
}

TEST_F(NodeConfigTest, ResolvesMinerKeyFileNextToConfig) {
  auto pair = utl::ed25519Generate();
  ASSERT_TRUE(pair.isOk());
  writeFile("miner.key", utl::hexEncode(pair->privateKey));
  nlohmann::json j = { { "consensus", { { "minerKey", "miner.key" } } } };
  auto result = Node::loadConfig(writeFile("node.json", j.dump()));
  ASSERT_TRUE(result.isOk()) << result.error().message;
  EXPECT_EQ(result->minerKey, utl::hexEncode(pair->privateKey));

  Node node;
  ASSERT_TRUE(node.init(result.value()).isOk());
  EXPECT_EQ(node.getConfig().consensus.minerAddress, utl::hexEncode(pair->publicKey));
}

TEST_F(NodeConfigTest, PrefixedMinerAddressProducesBlocks) {
  std::string miner = makeAddress();
  std::string prefixed = "0x" + miner;
  std::transform(prefixed.begin() + 2, prefixed.end(), prefixed.begin() + 2,
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  nlohmann::json j = {
    { "consensus", { { "difficulty", 1 }, { "minerAddress", prefixed } } },
    { "ledger", { { "blockReward", 7 } } }
  };
  auto result = Node::loadConfig(writeFile("node.json", j.dump()));
  ASSERT_TRUE(result.isOk()) << result.error().message;
  EXPECT_EQ(result->consensus.minerAddress, miner);

  Node node;
  ASSERT_TRUE(node.init(result.value()).isOk());
  ASSERT_TRUE(node.requestFaucet(makeAddress()).isOk());
  consensus::Producer producer(*node.getConsensus(), node.getChain(),
                               consensus::Producer::Config{});
  ASSERT_EQ(producer.produceOnce(), consensus::Producer::Outcome::APPENDED);
  EXPECT_EQ(node.getBalance(miner).value(), 7u);
  EXPECT_EQ(node.getBalance(prefixed).value(), 7u);
}

TEST_F(NodeConfigTest, ReportsBadFiles) {
  auto missing = Node::loadConfig((testDir / "absent.json").string());
  ASSERT_TRUE(missing.isError());
  EXPECT_EQ(missing.error().code, Node::E_CONFIG);

  auto broken = Node::loadConfig(writeFile("broken.json", "{ not json"));
  EXPECT_TRUE(broken.isError());

  auto badPort = Node::loadConfig(writeFile("port.json", R"({"port": 70000})"));
  EXPECT_TRUE(badPort.isError());

  auto badKey = Node::loadConfig(
      writeFile("key.json", R"({"consensus": {"minerKey": "missing.key"}})"));
  ASSERT_TRUE(badKey.isError());
  EXPECT_EQ(badKey.error().code, Node::E_KEY);
}

TEST(NodeErrorTest, ErrorKindsAndStatuses) {
  EXPECT_EQ(Node::errorKind(Blockchain::E_TX_SIGNATURE), "InvalidSignature");
  EXPECT_EQ(Node::errorKind(Blockchain::E_TX_AMOUNT), "InvalidAmount");
  EXPECT_EQ(Node::errorKind(Blockchain::E_ACCOUNT_BALANCE), "InsufficientFunds");
  EXPECT_EQ(Node::errorKind(Blockchain::E_TX_DUPLICATE), "Duplicate");
  EXPECT_EQ(Node::errorKind(Blockchain::E_FAUCET_LIMIT), "FaucetLimited");
  EXPECT_EQ(Node::errorKind(IChain::E_BLOCK_INDEX), "IndexMismatch");
  EXPECT_EQ(Node::errorKind(IChain::E_BLOCK_CHAIN), "LinkMismatch");
  EXPECT_EQ(Node::errorKind(IChain::E_BLOCK_HASH), "BlockInvalid");
  EXPECT_EQ(Node::errorKind(Node::E_NOT_FOUND), "NotFound");
  EXPECT_EQ(Node::errorKind(12345), "Internal");

  EXPECT_EQ(Node::httpStatus(Blockchain::E_ACCOUNT_BALANCE), 400);
  EXPECT_EQ(Node::httpStatus(Blockchain::E_FAUCET_ADDRESS), 400);
  EXPECT_EQ(Node::httpStatus(Node::E_NOT_FOUND), 404);
  EXPECT_EQ(Node::httpStatus(Blockchain::E_TX_DUPLICATE), 409);
  EXPECT_EQ(Node::httpStatus(Blockchain::E_FAUCET_LIMIT), 429);
  EXPECT_EQ(Node::httpStatus(Blockchain::E_TX_POOL_FULL), 503);
  EXPECT_EQ(Node::httpStatus(Blockchain::E_INTERNAL), 500);
}

TEST(NodeTest, OperationsBeforeInitFail) {
  Node node;
  EXPECT_EQ(node.getStatus().error().code, Node::E_NOT_INITIALIZED);
  EXPECT_EQ(node.getBalance(makeAddress()).error().code, Node::E_NOT_INITIALIZED);
  EXPECT_EQ(node.requestFaucet(makeAddress()).error().code, Node::E_NOT_INITIALIZED);
  EXPECT_EQ(node.getBlock(0).error().code, Node::E_NOT_INITIALIZED);
  EXPECT_EQ(node.start().error().code, Node::E_NOT_INITIALIZED);
  EXPECT_FALSE(node.isRunning());
}

TEST(NodeTest, ProofOfWorkWithoutMinerGetsGeneratedAddress) {
  Node node;
  Node::Config config;
  ASSERT_TRUE(node.init(config).isOk());

  const std::string &miner = node.getConfig().consensus.minerAddress;
  EXPECT_EQ(miner.size(), 64u);
  EXPECT_TRUE(utl::isAddress(miner));
  EXPECT_EQ(node.getConsensus()->getType(), consensus::Consensus::Type::PROOF_OF_WORK);
}

TEST(NodeTest, ProofOfStakeWithoutStakeholdersRegistersItself) {
  Node node;
  Node::Config config;
  config.consensus.type = consensus::Consensus::Type::PROOF_OF_STAKE;
  config.consensus.minStake = 25;
  ASSERT_TRUE(node.init(config).isOk());

  auto *pos = dynamic_cast<consensus::ProofOfStake *>(node.getConsensus());
  ASSERT_NE(pos, nullptr);
  ASSERT_EQ(pos->getValidators().size(), 1u);
  EXPECT_EQ(pos->getValidators().front().stake, 25u);
}

TEST(NodeTest, GetBlockMapsMissingToNotFound) {
  Node node;
  ASSERT_TRUE(node.init(Node::Config{}).isOk());
  ASSERT_TRUE(node.getBlock(0).isOk());

  auto missing = node.getBlock(99);
  ASSERT_TRUE(missing.isError());
  EXPECT_EQ(missing.error().code, Node::E_NOT_FOUND);
  EXPECT_EQ(Node::httpStatus(missing.error().code), 404);
}

TEST(NodeTest, ErrorsKeepLedgerCodes) {
  Node node;
  ASSERT_TRUE(node.init(Node::Config{}).isOk());

  auto faucet = node.requestFaucet("bogus");
  ASSERT_TRUE(faucet.isError());
  EXPECT_EQ(faucet.error().code, Blockchain::E_FAUCET_ADDRESS);
  EXPECT_EQ(Node::errorKind(faucet.error().code), "InvalidAddress");

  auto pair = utl::ed25519Generate();
  ASSERT_TRUE(pair.isOk());
  Transaction tx = Transaction::create(utl::hexEncode(pair->publicKey), makeAddress(), 5);
  ASSERT_TRUE(tx.sign(pair->privateKey).isOk());
  auto submit = node.submitTransaction(tx);
  ASSERT_TRUE(submit.isError());
  EXPECT_EQ(Node::errorKind(submit.error().code), "InsufficientFunds");
}

TEST(NodeTest, ExternalSubmitRejectsSystemSender) {
  Node node;
  ASSERT_TRUE(node.init(Node::Config{}).isOk());

  auto submit = node.submitTransaction(Transaction::createFaucet(makeAddress(), 5, 1));
  ASSERT_TRUE(submit.isError());
  EXPECT_EQ(submit.error().code, Blockchain::E_TX_SIGNATURE);
  EXPECT_EQ(Node::errorKind(submit.error().code), "InvalidSignature");
  EXPECT_EQ(Node::httpStatus(submit.error().code), 400);
  EXPECT_EQ(node.getChain()->getPendingCount(), 0u);
}

TEST(NodeTest, RunningNodeCommitsFaucetCredit) {
  Node node;
  Node::Config config;
  config.consensus.difficulty = 1;
  config.consensus.idleIntervalMs = 10;
  config.ledger.faucet.amount = 250;
  ASSERT_TRUE(node.init(config).isOk());
  ASSERT_TRUE(node.start().isOk());
  EXPECT_TRUE(node.isRunning());

  std::string user = makeAddress();
  ASSERT_TRUE(node.requestFaucet(user).isOk());

  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(30);
  while (node.getBalance(user).value() == 0 &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  EXPECT_EQ(node.getBalance(user).value(), 250u);

  auto status = node.getStatus();
  ASSERT_TRUE(status.isOk());
  EXPECT_TRUE(status->producing);
  EXPECT_GE(status->chain.chainLength, 2u);
  EXPECT_GE(status->producedBlocks, 1u);
  EXPECT_EQ(status->consensus, "Proof of Work");

  nlohmann::json j = status->toJson();
  EXPECT_EQ(j["chainLength"].get<uint64_t>(), status->chain.chainLength);
  EXPECT_EQ(j["lastBlockHash"].get<std::string>(), status->chain.lastBlockHash);

  node.stop();
  EXPECT_FALSE(node.isRunning());
}
