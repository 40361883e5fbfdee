#include "Client.h"
#include "Logger.h"
#include "Utilities.h"

#include <httplib.h>

namespace mc {

Client::Client() : Module("mockchain.client") {}

Client::~Client() {}

std::string Client::getErrorMessage(int32_t errorCode) {
  switch (errorCode) {
  case E_NOT_CONNECTED:
    return "Not connected to server";
  case E_INVALID_RESPONSE:
    return "Invalid response from server";
  case E_SERVER_ERROR:
    return "Server error";
  case E_PARSE_ERROR:
    return "Failed to parse response";
  case E_REQUEST_FAILED:
    return "Request failed";
  default:
    return "Unknown error";
  }
}

Client::Roe<void> Client::setEndpoint(const std::string &endpoint) {
  std::string host;
  uint16_t port = 0;
  if (!utl::parseHostPort(endpoint, host, port) || port == 0) {
    return Error(E_NOT_CONNECTED, "Invalid endpoint: " + endpoint);
  }
  setEndpoint(host, port);
  return {};
}

void Client::setEndpoint(const std::string &host, uint16_t port) {
  host_ = host;
  port_ = port;
}

Client::Roe<Client::SubmitResult> Client::submitTransaction(const Transaction &tx) {
  auto result = post("/api/tx", tx.toJson(), TIMEOUT_DATA);
  if (!result) {
    return result.error();
  }
  const auto &j = result.value();
  if (!j.contains("id") || !j["id"].is_string()) {
    return Error(E_INVALID_RESPONSE, "Response has no transaction id");
  }
  SubmitResult submitted;
  submitted.id = j["id"].get<std::string>();
  return submitted;
}

Client::Roe<uint64_t> Client::fetchBalance(const std::string &address) {
  auto result = get("/api/balance/" + address, TIMEOUT_FAST);
  if (!result) {
    return result.error();
  }
  const auto &j = result.value();
  if (!j.contains("balance") || !j["balance"].is_number_unsigned()) {
    return Error(E_INVALID_RESPONSE, "Response has no balance");
  }
  return j["balance"].get<uint64_t>();
}

Client::Roe<Client::FaucetResult> Client::requestFaucet(const std::string &address) {
  auto result = post("/api/faucet", nlohmann::json{ { "address", address } },
                     TIMEOUT_DATA);
  if (!result) {
    return result.error();
  }
  const auto &j = result.value();
  try {
    FaucetResult faucet;
    faucet.amount = j.value("amount", uint64_t(0));
    faucet.id = j.value("id", std::string());
    faucet.message = j.value("message", std::string());
    return faucet;
  } catch (const nlohmann::json::exception &e) {
    return Error(E_INVALID_RESPONSE, std::string("Malformed faucet response: ") + e.what());
  }
}

Client::Roe<nlohmann::json> Client::fetchStatus() {
  return get("/api/status", TIMEOUT_FAST);
}

Client::Roe<nlohmann::json> Client::fetchBlock(uint64_t index) {
  return get("/api/block/" + std::to_string(index), TIMEOUT_DATA);
}

Client::Roe<nlohmann::json> Client::get(const std::string &path,
                                        std::chrono::milliseconds timeout) {
  if (port_ == 0) {
    return Error(E_NOT_CONNECTED, getErrorMessage(E_NOT_CONNECTED));
  }
  httplib::Client cli(host_, port_);
  cli.set_connection_timeout(timeout);
  cli.set_read_timeout(timeout);
  cli.set_write_timeout(timeout);

  log().debug << "GET " << host_ << ":" << port_ << path;
  auto res = cli.Get(path);
  if (!res) {
    return Error(E_REQUEST_FAILED, getErrorMessage(E_REQUEST_FAILED) + ": " +
                                       httplib::to_string(res.error()));
  }
  return parseResponse(res->status, res->body);
}

Client::Roe<nlohmann::json> Client::post(const std::string &path,
                                         const nlohmann::json &body,
                                         std::chrono::milliseconds timeout) {
  if (port_ == 0) {
    return Error(E_NOT_CONNECTED, getErrorMessage(E_NOT_CONNECTED));
  }
  httplib::Client cli(host_, port_);
  cli.set_connection_timeout(timeout);
  cli.set_read_timeout(timeout);
  cli.set_write_timeout(timeout);

  log().debug << "POST " << host_ << ":" << port_ << path << " " << body.dump();
  auto res = cli.Post(path, body.dump(), "application/json");
  if (!res) {
    return Error(E_REQUEST_FAILED, getErrorMessage(E_REQUEST_FAILED) + ": " +
                                       httplib::to_string(res.error()));
  }
  return parseResponse(res->status, res->body);
}

Client::Roe<nlohmann::json> Client::parseResponse(int status, const std::string &body) {
  auto j = nlohmann::json::parse(body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    log().error << "Unparsable response (HTTP " << status << "): " << body;
    return Error(E_PARSE_ERROR, getErrorMessage(E_PARSE_ERROR));
  }
  if (status != 200) {
    try {
      std::string kind = j.value("error", "HTTP " + std::to_string(status));
      std::string message = j.value("message", getErrorMessage(E_SERVER_ERROR));
      return Error(E_SERVER_ERROR, kind + ": " + message);
    } catch (const nlohmann::json::exception &e) {
      return Error(E_INVALID_RESPONSE, "HTTP " + std::to_string(status) + ": " + e.what());
    }
  }
  return j;
}

} // namespace mc
