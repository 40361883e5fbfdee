#ifndef MOCKCHAIN_CLIENT_H
#define MOCKCHAIN_CLIENT_H

#include "Module.h"
#include "ResultOrError.hpp"
#include "Transaction.h"

#include <chrono>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace mc {

/**
 * Client - HTTP/JSON client for a mockchain node gateway
 */
class Client : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  // Default connection settings
  static constexpr const char *DEFAULT_HOST = "127.0.0.1";
  static constexpr const uint16_t DEFAULT_PORT = 50051;

  /** Timeout for lightweight requests (status, balance). */
  static constexpr std::chrono::milliseconds TIMEOUT_FAST{ 5000 };
  /** Timeout for requests that change node state or carry blocks. */
  static constexpr std::chrono::milliseconds TIMEOUT_DATA{ 15000 };

  // Error codes
  static constexpr const int32_t E_NOT_CONNECTED = 1;
  static constexpr const int32_t E_INVALID_RESPONSE = 2;
  static constexpr const int32_t E_SERVER_ERROR = 3;
  static constexpr const int32_t E_PARSE_ERROR = 4;
  static constexpr const int32_t E_REQUEST_FAILED = 5;

  static std::string getErrorMessage(int32_t errorCode);

  struct SubmitResult {
    std::string id;
  };

  struct FaucetResult {
    uint64_t amount{ 0 };
    std::string id;
    std::string message;
  };

  Client();
  ~Client() override;

  Roe<void> setEndpoint(const std::string &endpoint);
  void setEndpoint(const std::string &host, uint16_t port);

  Roe<SubmitResult> submitTransaction(const Transaction &tx);
  Roe<uint64_t> fetchBalance(const std::string &address);
  Roe<FaucetResult> requestFaucet(const std::string &address);
  Roe<nlohmann::json> fetchStatus();
  Roe<nlohmann::json> fetchBlock(uint64_t index);

private:
  Roe<nlohmann::json> get(const std::string &path, std::chrono::milliseconds timeout);
  Roe<nlohmann::json> post(const std::string &path, const nlohmann::json &body,
                           std::chrono::milliseconds timeout);
  Roe<nlohmann::json> parseResponse(int status, const std::string &body);

  std::string host_;
  uint16_t port_{ 0 };
};

} // namespace mc

#endif // MOCKCHAIN_CLIENT_H
