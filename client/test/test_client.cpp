#include "Client.h"
#include "HttpGateway.h"
#include "Node.h"
#include "Utilities.h"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

using namespace mc;

TEST(ClientEndpointTest, ParsesHostAndPort) {
  Client client;
  EXPECT_TRUE(client.setEndpoint("localhost:8080").isOk());
  EXPECT_TRUE(client.setEndpoint("localhost").isError());
  EXPECT_TRUE(client.setEndpoint("localhost:notaport").isError());
  EXPECT_TRUE(client.setEndpoint("localhost:0").isError());
}

TEST(ClientEndpointTest, RequestsWithoutEndpointFail) {
  Client client;
  auto status = client.fetchStatus();
  ASSERT_TRUE(status.isError());
  EXPECT_EQ(status.error().code, Client::E_NOT_CONNECTED);
}

TEST(ClientEndpointTest, UnreachableServerIsRequestFailure) {
  Client client;
  // Port 1 is privileged and not listening in the test environment
  client.setEndpoint("127.0.0.1", 1);
  auto balance = client.fetchBalance(std::string(64, 'a'));
  ASSERT_TRUE(balance.isError());
  EXPECT_EQ(balance.error().code, Client::E_REQUEST_FAILED);
}

class ClientGatewayTest : public ::testing::Test {
protected:
  void SetUp() override {
    Node::Config config;
    config.consensus.difficulty = 1;
    config.consensus.idleIntervalMs = 10;
    config.ledger.faucet.amount = 300;
    ASSERT_TRUE(node.init(config).isOk());

    HttpGateway::Config gc;
    gc.port = 0;
    gateway = std::make_unique<HttpGateway>(node, gc);
    ASSERT_TRUE(gateway->start().isOk());
    client.setEndpoint(gc.host, gateway->getPort());
  }

  void TearDown() override {
    node.stop();
    if (gateway) {
      gateway->stop();
    }
  }

  bool waitForBalance(const std::string &address, uint64_t expected) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(30);
    while (std::chrono::steady_clock::now() < deadline) {
      auto balance = client.fetchBalance(address);
      if (balance.isOk() && balance.value() == expected) {
        return true;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return false;
  }

  Node node;
  std::unique_ptr<HttpGateway> gateway;
  Client client;
};

TEST_F(ClientGatewayTest, FaucetTransferAndStatus) {
  auto alice = utl::ed25519Generate();
  auto bob = utl::ed25519Generate();
  ASSERT_TRUE(alice.isOk() && bob.isOk());
  std::string aliceAddress = utl::hexEncode(alice->publicKey);
  std::string bobAddress = utl::hexEncode(bob->publicKey);

  ASSERT_TRUE(node.start().isOk());

  auto faucet = client.requestFaucet(aliceAddress);
  ASSERT_TRUE(faucet.isOk()) << faucet.error().message;
  EXPECT_EQ(faucet->amount, 300u);
  EXPECT_FALSE(faucet->message.empty());
  ASSERT_TRUE(waitForBalance(aliceAddress, 300));

  Transaction tx = Transaction::create(aliceAddress, bobAddress, 120);
  ASSERT_TRUE(tx.sign(alice->privateKey).isOk());
  auto submitted = client.submitTransaction(tx);
  ASSERT_TRUE(submitted.isOk()) << submitted.error().message;
  EXPECT_EQ(submitted->id, tx.getId());
  ASSERT_TRUE(waitForBalance(bobAddress, 120));
  EXPECT_EQ(client.fetchBalance(aliceAddress).value(), 180u);

  auto status = client.fetchStatus();
  ASSERT_TRUE(status.isOk());
  EXPECT_GE(status.value()["chainLength"].get<uint64_t>(), 3u);
  EXPECT_TRUE(status.value()["producing"].get<bool>());

  auto genesis = client.fetchBlock(0);
  ASSERT_TRUE(genesis.isOk());
  EXPECT_EQ(genesis.value()["index"].get<uint64_t>(), 0u);
}

TEST_F(ClientGatewayTest, ServerErrorsCarryKind) {
  auto missing = client.fetchBlock(1000);
  ASSERT_TRUE(missing.isError());
  EXPECT_EQ(missing.error().code, Client::E_SERVER_ERROR);
  EXPECT_EQ(missing.error().message.rfind("NotFound:", 0), 0u);

  auto badAddress = client.requestFaucet("nope");
  ASSERT_TRUE(badAddress.isError());
  EXPECT_EQ(badAddress.error().message.rfind("InvalidAddress:", 0), 0u);
}
