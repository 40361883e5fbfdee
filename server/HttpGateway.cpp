#include "HttpGateway.h"
#include "Utilities.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <thread>

namespace mc {

using json = nlohmann::json;

namespace {

void setJson(httplib::Response &res, int status, const json &body) {
  res.status = status;
  res.set_content(body.dump(), "application/json");
}

void setJsonError(httplib::Response &res, int status, const std::string &kind,
                  const std::string &message) {
  setJson(res, status,
          json{ { "success", false }, { "error", kind }, { "message", message } });
}

void setNodeError(httplib::Response &res, const Node::Error &error) {
  setJsonError(res, Node::httpStatus(error.code), Node::errorKind(error.code),
               error.message);
}

std::string transactionErrorKind(int32_t code) {
  switch (code) {
  case Transaction::E_AMOUNT:
    return Node::errorKind(Blockchain::E_TX_AMOUNT);
  case Transaction::E_SIGNATURE:
    return Node::errorKind(Blockchain::E_TX_SIGNATURE);
  default:
    return Node::errorKind(Blockchain::E_TX_VALIDATION);
  }
}

} // namespace

HttpGateway::HttpGateway(Node &node, const Config &config)
    : Service("mockchain.http"), node_(node), config_(config) {
  svr_.set_logger([this](const httplib::Request &req, const httplib::Response &res) {
    log().info << req.method << " " << req.path << " " << res.status << " ("
               << (req.remote_addr.empty() ? "-" : req.remote_addr) << ")";
  });
  svr_.set_error_logger([this](const httplib::Error &err, const httplib::Request *req) {
    std::string path = req ? req->path : "-";
    log().error << "HTTP error " << httplib::to_string(err) << " path=" << path;
  });

  svr_.set_default_headers(httplib::Headers{
      { "Access-Control-Allow-Origin", "*" },
      { "Access-Control-Allow-Methods", "GET, POST, OPTIONS" },
      { "Access-Control-Allow-Headers", "Content-Type" },
  });
  svr_.set_pre_routing_handler([](const httplib::Request &req, httplib::Response &res) {
    if (req.method == "OPTIONS") {
      res.status = 204;
      return httplib::Server::HandlerResponse::Handled;
    }
    return httplib::Server::HandlerResponse::Unhandled;
  });

  registerRoutes();
}

HttpGateway::~HttpGateway() { stop(); }

void HttpGateway::registerRoutes() {
  svr_.Post("/api/tx", [this](const httplib::Request &req, httplib::Response &res) {
    handleSubmitTransaction(req, res);
  });
  svr_.Get(R"(/api/balance/([^/]+))",
           [this](const httplib::Request &req, httplib::Response &res) {
             handleGetBalance(req, res);
           });
  svr_.Post("/api/faucet", [this](const httplib::Request &req, httplib::Response &res) {
    handleFaucet(req, res);
  });
  svr_.Get("/api/status", [this](const httplib::Request &req, httplib::Response &res) {
    handleGetStatus(req, res);
  });
  svr_.Get(R"(/api/block/(\d+))", [this](const httplib::Request &req, httplib::Response &res) {
    handleGetBlock(req, res);
  });
}

HttpGateway::Roe<void> HttpGateway::onStart() {
  listenDone_ = false;
  if (config_.port == 0) {
    int port = svr_.bind_to_any_port(config_.host);
    if (port <= 0) {
      return Error(1, "Failed to bind HTTP server on " + config_.host);
    }
    boundPort_ = static_cast<uint16_t>(port);
  } else {
    if (!svr_.bind_to_port(config_.host, config_.port)) {
      return Error(1, "Failed to bind HTTP server on " + config_.host + ":" +
                          std::to_string(config_.port));
    }
    boundPort_ = config_.port;
  }
  log().info << "HTTP gateway bound to " << config_.host << ":" << boundPort_;
  return {};
}

void HttpGateway::runLoop() {
  if (!svr_.listen_after_bind()) {
    if (!isStopSet()) {
      log().error << "HTTP server stopped unexpectedly";
    }
  }
  listenDone_ = true;
}

void HttpGateway::onStopRequested() {
  // The server only honors stop() once listen_after_bind() is running
  while (!svr_.is_running() && !listenDone_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  svr_.stop();
}

void HttpGateway::handleSubmitTransaction(const httplib::Request &req,
                                          httplib::Response &res) {
  json body = json::parse(req.body, nullptr, false);
  if (body.is_discarded()) {
    setJsonError(res, 400, Node::errorKind(Blockchain::E_TX_VALIDATION),
                 "Request body is not valid JSON");
    return;
  }

  auto txResult = Transaction::fromJson(body);
  if (!txResult) {
    setJsonError(res, 400, transactionErrorKind(txResult.error().code),
                 txResult.error().message);
    return;
  }

  auto result = node_.submitTransaction(txResult.value());
  if (!result) {
    setNodeError(res, result.error());
    return;
  }
  setJson(res, 200, json{ { "success", true }, { "id", result.value() } });
}

void HttpGateway::handleGetBalance(const httplib::Request &req, httplib::Response &res) {
  std::string address = req.matches[1].str();
  auto result = node_.getBalance(address);
  if (!result) {
    setNodeError(res, result.error());
    return;
  }
  setJson(res, 200, json{ { "address", address }, { "balance", result.value() } });
}

void HttpGateway::handleFaucet(const httplib::Request &req, httplib::Response &res) {
  json body = json::parse(req.body, nullptr, false);
  if (body.is_discarded() || !body.is_object() || !body.contains("address") ||
      !body["address"].is_string()) {
    setJsonError(res, 400, Node::errorKind(Blockchain::E_FAUCET_ADDRESS),
                 "Body must be a JSON object with a string 'address'");
    return;
  }

  std::string address = body["address"].get<std::string>();
  auto result = node_.requestFaucet(address);
  if (!result) {
    setNodeError(res, result.error());
    return;
  }
  const Transaction &tx = result.value();
  setJson(res, 200,
          json{ { "success", true },
                { "amount", tx.amount },
                { "id", tx.getId() },
                { "message", "Faucet credit of " + std::to_string(tx.amount) +
                                 " queued for " + address } });
}

void HttpGateway::handleGetStatus(const httplib::Request &, httplib::Response &res) {
  auto result = node_.getStatus();
  if (!result) {
    setNodeError(res, result.error());
    return;
  }
  setJson(res, 200, result.value().toJson());
}

void HttpGateway::handleGetBlock(const httplib::Request &req, httplib::Response &res) {
  uint64_t index = 0;
  if (!utl::parseUInt64(req.matches[1].str(), index)) {
    setJsonError(res, 400, "InvalidRequest", "Block index out of range");
    return;
  }
  auto result = node_.getBlock(index);
  if (!result) {
    setNodeError(res, result.error());
    return;
  }
  setJson(res, 200, result.value().toJson());
}

} // namespace mc
