#include "Wallet.h"

#include <limits>

namespace mc {

Wallet::Wallet(uint64_t initialBalance) : balance_(initialBalance) {}

Wallet::Roe<void> Wallet::deposit(uint64_t amount) {
  if (amount == 0) {
    return Error(E_AMOUNT, "Deposit amount must be positive");
  }
  if (balance_ > std::numeric_limits<uint64_t>::max() - amount) {
    return Error(E_OVERFLOW, "Deposit would cause balance overflow");
  }
  balance_ += amount;
  return {};
}

Wallet::Roe<void> Wallet::withdraw(uint64_t amount) {
  if (amount == 0) {
    return Error(E_AMOUNT, "Withdrawal amount must be positive");
  }
  if (balance_ < amount) {
    return Error(E_INSUFFICIENT, "Insufficient balance: have " +
                                     std::to_string(balance_) + ", need " +
                                     std::to_string(amount));
  }
  balance_ -= amount;
  return {};
}

Wallet::Roe<void> Wallet::transfer(Wallet &destination, uint64_t amount) {
  if (amount == 0) {
    return Error(E_AMOUNT, "Transfer amount must be positive");
  }
  if (balance_ < amount) {
    return Error(E_INSUFFICIENT, "Insufficient balance for transfer");
  }
  if (&destination == this) {
    return {};
  }
  if (destination.balance_ > std::numeric_limits<uint64_t>::max() - amount) {
    return Error(E_OVERFLOW, "Transfer would cause destination overflow");
  }
  balance_ -= amount;
  destination.balance_ += amount;
  return {};
}

} // namespace mc
