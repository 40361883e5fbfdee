#include "HttpGateway.h"
#include "Utilities.h"

#include <gtest/gtest.h>
#include <httplib.h>
#include <nlohmann/json.hpp>

using namespace mc;
using json = nlohmann::json;

class HttpGatewayTest : public ::testing::Test {
protected:
  void SetUp() override {
    Node::Config config;
    config.consensus.difficulty = 1;
    config.ledger.faucet.amount = 500;
    ASSERT_TRUE(node.init(config).isOk());

    HttpGateway::Config gc;
    gc.host = "127.0.0.1";
    gc.port = 0;
    gateway = std::make_unique<HttpGateway>(node, gc);
    auto started = gateway->start();
    ASSERT_TRUE(started.isOk()) << started.error().message;
    ASSERT_NE(gateway->getPort(), 0);

    client = std::make_unique<httplib::Client>("127.0.0.1", gateway->getPort());
    client->set_read_timeout(5, 0);
  }

  void TearDown() override {
    if (gateway) {
      gateway->stop();
    }
  }

  std::string makeAddress() {
    auto pair = utl::ed25519Generate();
    EXPECT_TRUE(pair.isOk());
    return pair.isOk() ? utl::hexEncode(pair->publicKey) : std::string();
  }

  Node node;
  std::unique_ptr<HttpGateway> gateway;
  std::unique_ptr<httplib::Client> client;
};

TEST_F(HttpGatewayTest, StatusReportsGenesis) {
  auto res = client->Get("/api/status");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  json body = json::parse(res->body);
  EXPECT_EQ(body["chainLength"].get<uint64_t>(), 1u);
  EXPECT_EQ(body["consensus"].get<std::string>(), "Proof of Work");
  EXPECT_FALSE(body["producing"].get<bool>());
  EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), "*");
}

TEST_F(HttpGatewayTest, BlockLookup) {
  auto genesis = client->Get("/api/block/0");
  ASSERT_TRUE(genesis);
  EXPECT_EQ(genesis->status, 200);
  EXPECT_EQ(json::parse(genesis->body)["hash"].get<std::string>(),
            node.getChain()->getLastBlockHash());

  auto missing = client->Get("/api/block/42");
  ASSERT_TRUE(missing);
  EXPECT_EQ(missing->status, 404);
  json body = json::parse(missing->body);
  EXPECT_FALSE(body["success"].get<bool>());
  EXPECT_EQ(body["error"].get<std::string>(), "NotFound");
}

TEST_F(HttpGatewayTest, FaucetAndBalance) {
  std::string address = makeAddress();
  auto res = client->Post("/api/faucet", json{ { "address", address } }.dump(),
                          "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  json body = json::parse(res->body);
  EXPECT_TRUE(body["success"].get<bool>());
  EXPECT_EQ(body["amount"].get<uint64_t>(), 500u);
  EXPECT_EQ(body["id"].get<std::string>().size(), 64u);

  auto balance = client->Get("/api/balance/" + address);
  ASSERT_TRUE(balance);
  EXPECT_EQ(balance->status, 200);
  json jb = json::parse(balance->body);
  EXPECT_EQ(jb["address"].get<std::string>(), address);
  EXPECT_EQ(jb["balance"].get<uint64_t>(), 0u);
}

TEST_F(HttpGatewayTest, FaucetRejectsBadBody) {
  auto res = client->Post("/api/faucet", "[]", "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);
  EXPECT_EQ(json::parse(res->body)["error"].get<std::string>(), "InvalidAddress");

  auto bad = client->Post("/api/faucet", json{ { "address", "xyz" } }.dump(),
                          "application/json");
  ASSERT_TRUE(bad);
  EXPECT_EQ(bad->status, 400);
}

TEST_F(HttpGatewayTest, SubmitTransactionErrors) {
  auto garbage = client->Post("/api/tx", "{ nope", "application/json");
  ASSERT_TRUE(garbage);
  EXPECT_EQ(garbage->status, 400);
  EXPECT_EQ(json::parse(garbage->body)["error"].get<std::string>(), "InvalidTransaction");

  auto pair = utl::ed25519Generate();
  ASSERT_TRUE(pair.isOk());
  Transaction tx = Transaction::create(utl::hexEncode(pair->publicKey), makeAddress(), 10);
  ASSERT_TRUE(tx.sign(pair->privateKey).isOk());

  auto poor = client->Post("/api/tx", tx.toJson().dump(), "application/json");
  ASSERT_TRUE(poor);
  EXPECT_EQ(poor->status, 400);
  EXPECT_EQ(json::parse(poor->body)["error"].get<std::string>(), "InsufficientFunds");

  tx.amount = 11;
  auto forged = client->Post("/api/tx", tx.toJson().dump(), "application/json");
  ASSERT_TRUE(forged);
  EXPECT_EQ(forged->status, 400);
  EXPECT_EQ(json::parse(forged->body)["error"].get<std::string>(), "InvalidSignature");

  Transaction system = Transaction::createFaucet(makeAddress(), 10, 1);
  auto reserved = client->Post("/api/tx", system.toJson().dump(), "application/json");
  ASSERT_TRUE(reserved);
  EXPECT_EQ(reserved->status, 400);
  EXPECT_EQ(json::parse(reserved->body)["error"].get<std::string>(), "InvalidSignature");
  EXPECT_EQ(node.getChain()->getPendingCount(), 0u);
}

TEST_F(HttpGatewayTest, SubmitTransactionAccepted) {
  auto pair = utl::ed25519Generate();
  ASSERT_TRUE(pair.isOk());
  std::string from = utl::hexEncode(pair->publicKey);
  ASSERT_TRUE(node.requestFaucet(from).isOk());

  Transaction tx = Transaction::create(from, makeAddress(), 20);
  ASSERT_TRUE(tx.sign(pair->privateKey).isOk());
  auto res = client->Post("/api/tx", tx.toJson().dump(), "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  json body = json::parse(res->body);
  EXPECT_TRUE(body["success"].get<bool>());
  EXPECT_EQ(body["id"].get<std::string>(), tx.getId());

  auto again = client->Post("/api/tx", tx.toJson().dump(), "application/json");
  ASSERT_TRUE(again);
  EXPECT_EQ(again->status, 409);
  EXPECT_EQ(json::parse(again->body)["error"].get<std::string>(), "Duplicate");
}

TEST_F(HttpGatewayTest, PreflightIsAnswered) {
  auto res = client->Options("/api/tx");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 204);
}
