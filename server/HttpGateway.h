#ifndef MOCKCHAIN_HTTP_GATEWAY_H
#define MOCKCHAIN_HTTP_GATEWAY_H

#include "Node.h"
#include "Service.h"

#include <httplib.h>

#include <atomic>
#include <cstdint>
#include <string>

namespace mc {

/**
 * HttpGateway - JSON over HTTP front for a Node
 *
 * Routes:
 *   POST /api/tx                submit a signed transaction
 *   GET  /api/balance/<address> committed balance
 *   POST /api/faucet            queue a faucet credit, body {"address"}
 *   GET  /api/status            node status
 *   GET  /api/block/<index>     block by height
 *
 * Failures answer {"success":false,"error":"<Kind>","message":...}.
 */
class HttpGateway : public Service {
public:
  struct Config {
    std::string host{ Node::DEFAULT_HOST };
    uint16_t port{ Node::DEFAULT_PORT };
  };

  HttpGateway(Node &node, const Config &config);
  ~HttpGateway() override;

  // Bound port, useful when the configured port is 0
  uint16_t getPort() const { return boundPort_; }

protected:
  Roe<void> onStart() override;
  void runLoop() override;
  void onStopRequested() override;

private:
  void registerRoutes();

  void handleSubmitTransaction(const httplib::Request &req, httplib::Response &res);
  void handleGetBalance(const httplib::Request &req, httplib::Response &res);
  void handleFaucet(const httplib::Request &req, httplib::Response &res);
  void handleGetStatus(const httplib::Request &req, httplib::Response &res);
  void handleGetBlock(const httplib::Request &req, httplib::Response &res);

  Node &node_;
  Config config_;
  httplib::Server svr_;
  uint16_t boundPort_{ 0 };
  std::atomic<bool> listenDone_{ false };
};

} // namespace mc

#endif // MOCKCHAIN_HTTP_GATEWAY_H
