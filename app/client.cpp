#include "Client.h"
#include "Logger.h"
#include "Transaction.h"
#include "Utilities.h"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <iostream>
#include <string>

static mc::Client::Roe<mc::Transaction> makeSignedTx(const std::string &to,
                                                    uint64_t amount,
                                                    const std::string &key) {
  auto privateKey = mc::utl::readPrivateKey(key);
  if (!privateKey) {
    return mc::Client::Error(1, privateKey.error().message);
  }
  auto publicKey = mc::utl::ed25519PublicKey(privateKey.value());
  if (!publicKey) {
    return mc::Client::Error(1, publicKey.error().message);
  }
  auto recipient = mc::utl::normalizeAddress(to);
  if (!recipient) {
    return mc::Client::Error(1, "Invalid recipient: " + recipient.error().message);
  }

  auto tx = mc::Transaction::create(mc::utl::hexEncode(publicKey.value()),
                                    recipient.value(), amount);
  auto signResult = tx.sign(privateKey.value());
  if (!signResult) {
    return mc::Client::Error(1, signResult.error().message);
  }
  return tx;
}

static int runKeygen(const std::string &outputPath) {
  auto pair = mc::utl::ed25519Generate();
  if (!pair.isOk()) {
    std::cerr << "Error: " << pair.error().message << "\n";
    return 1;
  }
  std::string privateHex = mc::utl::hexEncode(pair->privateKey);
  if (!outputPath.empty()) {
    auto result = mc::utl::writeToNewFile(outputPath, privateHex + "\n");
    if (!result) {
      std::cerr << "Error: " << result.error().message << "\n";
      return 1;
    }
    std::cout << "Private key written to " << outputPath << "\n";
  }
  std::cout << "Ed25519 key pair generated.\n";
  std::cout << "Address (public key hex): " << mc::utl::hexEncode(pair->publicKey) << "\n";
  if (outputPath.empty()) {
    std::cout << "Private key (hex):        " << privateHex << "\n";
  }
  std::cout << "\nKeep the private key secret. The address receives funds.\n";
  return 0;
}

static int runSignTx(const std::string &to, uint64_t amount, const std::string &key) {
  auto tx = makeSignedTx(to, amount, key);
  if (!tx) {
    std::cerr << "Error: " << tx.error().message << "\n";
    return 1;
  }
  std::cout << tx.value().toJson().dump(2) << "\n";
  return 0;
}

static int runSubmitTx(mc::Client &client, const std::string &to, uint64_t amount,
                       const std::string &key) {
  auto tx = makeSignedTx(to, amount, key);
  if (!tx) {
    std::cerr << "Error: " << tx.error().message << "\n";
    return 1;
  }
  auto result = client.submitTransaction(tx.value());
  if (!result) {
    std::cerr << "Error: " << result.error().message << "\n";
    return 1;
  }
  std::cout << "Transaction submitted: " << result.value().id << "\n";
  return 0;
}

int main(int argc, char **argv) {
  CLI::App app{"mockchain client"};
  app.require_subcommand(1);

  std::string host = mc::Client::DEFAULT_HOST;
  uint16_t port = mc::Client::DEFAULT_PORT;
  bool debug = false;
  app.add_option("--host", host, "Node host, optionally host:port")
      ->default_val(mc::Client::DEFAULT_HOST);
  app.add_option("-p,--port", port, "Node HTTP port")->default_val(mc::Client::DEFAULT_PORT);
  app.add_flag("-d,--debug", debug, "Enable debug logging");

  auto *keygen = app.add_subcommand("keygen", "Generate an Ed25519 key pair");
  std::string keygenOutput;
  keygen->add_option("-o,--output", keygenOutput, "Write the private key to a new file");

  auto *signTxCmd = app.add_subcommand("sign-tx", "Create and sign a transfer, print it as JSON");
  std::string signTo;
  uint64_t signAmount = 0;
  std::string signKey;
  signTxCmd->add_option("to", signTo, "Recipient address")->required();
  signTxCmd->add_option("amount", signAmount, "Amount to transfer")->required();
  signTxCmd->add_option("-k,--key", signKey, "Private key (hex or file)")->required();

  auto *submitTxCmd = app.add_subcommand("submit-tx", "Create, sign and submit a transfer");
  std::string submitTo;
  uint64_t submitAmount = 0;
  std::string submitKey;
  submitTxCmd->add_option("to", submitTo, "Recipient address")->required();
  submitTxCmd->add_option("amount", submitAmount, "Amount to transfer")->required();
  submitTxCmd->add_option("-k,--key", submitKey, "Private key (hex or file)")->required();

  auto *balanceCmd = app.add_subcommand("balance", "Show the committed balance of an address");
  std::string balanceAddress;
  balanceCmd->add_option("address", balanceAddress, "Address")->required();

  auto *faucetCmd = app.add_subcommand("faucet", "Request a faucet credit");
  std::string faucetAddress;
  faucetCmd->add_option("address", faucetAddress, "Address to credit")->required();

  auto *statusCmd = app.add_subcommand("status", "Show node status");

  auto *blockCmd = app.add_subcommand("block", "Show a block by index");
  uint64_t blockIndex = 0;
  blockCmd->add_option("index", blockIndex, "Block index")->required();

  CLI11_PARSE(app, argc, argv);

  mc::logging::getRootLogger().setLevel(debug ? mc::logging::Level::DEBUG
                                              : mc::logging::Level::WARNING);

  // Offline commands
  if (keygen->parsed()) {
    return runKeygen(keygenOutput);
  }
  if (signTxCmd->parsed()) {
    return runSignTx(signTo, signAmount, signKey);
  }

  // Parse host:port format if present
  std::string parsedHost = host;
  uint16_t parsedPort = port;
  std::string extractedHost;
  uint16_t extractedPort = 0;
  if (mc::utl::parseHostPort(host, extractedHost, extractedPort)) {
    parsedHost = extractedHost;
    if (extractedPort != 0 && app.count("--port") == 0) {
      parsedPort = extractedPort;
    }
  }

  mc::Client client;
  client.setEndpoint(parsedHost, parsedPort);

  int exitCode = 0;
  if (submitTxCmd->parsed()) {
    exitCode = runSubmitTx(client, submitTo, submitAmount, submitKey);
  } else if (balanceCmd->parsed()) {
    auto result = client.fetchBalance(balanceAddress);
    if (result) {
      std::cout << balanceAddress << ": " << result.value() << "\n";
    } else {
      std::cerr << "Error: " << result.error().message << "\n";
      exitCode = 1;
    }
  } else if (faucetCmd->parsed()) {
    auto result = client.requestFaucet(faucetAddress);
    if (result) {
      std::cout << result.value().message << "\n";
    } else {
      std::cerr << "Error: " << result.error().message << "\n";
      exitCode = 1;
    }
  } else if (statusCmd->parsed()) {
    auto result = client.fetchStatus();
    if (result) {
      std::cout << result.value().dump(2) << "\n";
    } else {
      std::cerr << "Error: " << result.error().message << "\n";
      exitCode = 1;
    }
  } else if (blockCmd->parsed()) {
    auto result = client.fetchBlock(blockIndex);
    if (result) {
      std::cout << result.value().dump(2) << "\n";
    } else {
      std::cerr << "Error: " << result.error().message << "\n";
      exitCode = 1;
    }
  }

  return exitCode;
}
