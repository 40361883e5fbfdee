#include "HttpGateway.h"
#include "Logger.h"
#include "Node.h"

#include <CLI/CLI.hpp>

#include <atomic>
#include <condition_variable>
#include <csignal>
#include <iostream>
#include <mutex>
#include <string>

namespace {
std::atomic<bool> g_running{true};
std::mutex g_mutex;
std::condition_variable g_cv;

void signalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_running = false;
    g_cv.notify_one();
  }
}
} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"mockchain node: single-node ledger with PoW or PoS block production"};

  std::string configPath;
  std::string consensusType;
  uint32_t difficulty = 0;
  uint16_t port = 0;
  bool debug = false;
  app.add_option("-c,--config", configPath, "Node configuration file (JSON)");
  app.add_option("--consensus", consensusType, "Consensus variant: pow or pos")
      ->check(CLI::IsMember({"pow", "pos"}));
  app.add_option("--difficulty", difficulty, "Proof-of-Work difficulty (leading zero hex digits)");
  app.add_option("-p,--port", port, "HTTP gateway port");
  app.add_flag("-d,--debug", debug, "Enable debug logging");
  CLI11_PARSE(app, argc, argv);

  auto rootLogger = mc::logging::getRootLogger();
  rootLogger.setLevel(debug ? mc::logging::Level::DEBUG : mc::logging::Level::INFO);
  auto logger = mc::logging::getLogger("mockchain");
  logger.info << "mockchain node v1.0";

  mc::Node::Config config;
  if (!configPath.empty()) {
    auto loaded = mc::Node::loadConfig(configPath);
    if (!loaded) {
      std::cerr << "Error: " << loaded.error().message << "\n";
      return 1;
    }
    config = loaded.value();
  }

  // Command line overrides the file
  if (!consensusType.empty()) {
    auto type = mc::consensus::Consensus::typeFromString(consensusType);
    if (!type) {
      std::cerr << "Error: " << type.error().message << "\n";
      return 1;
    }
    config.consensus.type = type.value();
  }
  if (app.count("--difficulty") > 0) {
    if (difficulty > 64) {
      std::cerr << "Error: --difficulty must be at most 64\n";
      return 1;
    }
    config.consensus.difficulty = difficulty;
  }
  if (app.count("--port") > 0) {
    config.port = port;
  }

  if (!config.logFile.empty()) {
    try {
      rootLogger.addFileHandler(config.logFile, debug ? mc::logging::Level::DEBUG
                                                      : mc::logging::Level::INFO);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << "\n";
      return 1;
    }
    logger.info << "Logging to " << config.logFile;
  }

  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);

  mc::Node node;
  auto initResult = node.init(config);
  if (!initResult) {
    logger.error << "Failed to initialize node: " << initResult.error().message;
    std::cerr << "Error: " << initResult.error().message << "\n";
    return 1;
  }

  mc::HttpGateway::Config gatewayConfig;
  gatewayConfig.host = config.host;
  gatewayConfig.port = config.port;
  mc::HttpGateway gateway(node, gatewayConfig);
  auto gatewayResult = gateway.start();
  if (!gatewayResult) {
    logger.error << "Failed to start HTTP gateway: " << gatewayResult.error().message;
    std::cerr << "Error: " << gatewayResult.error().message << "\n";
    return 1;
  }

  auto startResult = node.start();
  if (!startResult) {
    logger.error << "Failed to start block production: " << startResult.error().message;
    std::cerr << "Error: " << startResult.error().message << "\n";
    gateway.stop();
    return 1;
  }

  std::cout << "Node running (" << node.getConsensus()->name() << ")\n";
  std::cout << "HTTP gateway: http://" << config.host << ":" << gateway.getPort() << "\n";
  std::cout << "Press Ctrl+C to stop the node...\n";

  {
    std::unique_lock<std::mutex> lock(g_mutex);
    g_cv.wait(lock, [] { return !g_running.load(); });
  }

  gateway.stop();
  node.stop();
  auto status = node.getStatus();
  if (status) {
    logger.info << "Final state: " << status.value();
  }
  logger.info << "Node stopped";
  return 0;
}
