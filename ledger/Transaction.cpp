#include "Transaction.h"
#include "BinaryPack.hpp"
#include "Utilities.h"

namespace mc {

namespace {

struct SigningFields {
  std::string from;
  std::string to;
  uint64_t amount{ 0 };
  int64_t timestamp{ 0 };

  template <typename Archive> void serialize(Archive &ar) {
    ar & from & to & amount & timestamp;
  }
};

} // namespace

Transaction Transaction::create(const std::string &from, const std::string &to,
                                uint64_t amount) {
  Transaction tx;
  tx.from = from;
  tx.to = to;
  tx.amount = amount;
  tx.timestamp = utl::getCurrentTimeMs();
  return tx;
}

Transaction Transaction::createFaucet(const std::string &to, uint64_t amount,
                                      int64_t timestamp) {
  Transaction tx;
  tx.from = FAUCET_ADDRESS;
  tx.to = to;
  tx.amount = amount;
  tx.timestamp = timestamp;
  return tx;
}

std::string Transaction::getSigningDigest() const {
  SigningFields fields{ from, to, amount, timestamp };
  return utl::sha256Digest(utl::binaryPack(fields));
}

std::string Transaction::getId() const {
  return utl::sha256(utl::binaryPack(*this));
}

Transaction::Roe<void> Transaction::sign(const std::string &privateKey) {
  auto result = utl::ed25519Sign(privateKey, getSigningDigest());
  if (!result) {
    return Error(E_KEY, "Failed to sign transaction: " + result.error().message);
  }
  signature = result.value();
  return {};
}

Transaction::Roe<void> Transaction::verify() const {
  if (amount == 0) {
    return Error(E_AMOUNT, "Transaction amount must be positive");
  }
  if (isFaucet()) {
    return {};
  }
  std::string publicKey = utl::hexDecode(from);
  if (publicKey.size() != 32) {
    return Error(E_SIGNATURE, "Sender is not a hex-encoded Ed25519 public key");
  }
  if (signature.size() != 64) {
    return Error(E_SIGNATURE, "Signature must be 64 bytes, got " +
                                  std::to_string(signature.size()));
  }
  if (!utl::ed25519Verify(publicKey, getSigningDigest(), signature)) {
    return Error(E_SIGNATURE, "Signature does not match sender");
  }
  return {};
}

nlohmann::json Transaction::toJson() const {
  nlohmann::json j;
  j["from"] = from;
  j["to"] = to;
  j["amount"] = amount;
  j["timestamp"] = timestamp;
  j["signature"] = utl::hexEncode(signature);
  return j;
}

Transaction::Roe<Transaction> Transaction::fromJson(const nlohmann::json &j) {
  if (!j.is_object()) {
    return Error(E_FORMAT, "Transaction must be a JSON object");
  }
  Transaction tx;
  try {
    tx.from = j.at("from").get<std::string>();
    tx.to = j.at("to").get<std::string>();
    if (!j.at("amount").is_number_unsigned()) {
      return Error(E_AMOUNT, "Amount must be a non-negative integer");
    }
    tx.amount = j.at("amount").get<uint64_t>();
    tx.timestamp = j.at("timestamp").get<int64_t>();
    std::string sigHex = j.value("signature", std::string());
    tx.signature = utl::hexDecode(sigHex);
    if (!sigHex.empty() && tx.signature.empty()) {
      return Error(E_SIGNATURE, "Signature is not valid hex");
    }
  } catch (const nlohmann::json::exception &e) {
    return Error(E_FORMAT, "Malformed transaction: " + std::string(e.what()));
  }
  return tx;
}

} // namespace mc
