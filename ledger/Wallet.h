#ifndef MOCKCHAIN_WALLET_H
#define MOCKCHAIN_WALLET_H

#include "ResultOrError.hpp"

#include <cstdint>
#include <string>

namespace mc {

/**
 * Balance holder for one address. All arithmetic is checked: a failed
 * operation leaves both sides untouched.
 */
class Wallet {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_AMOUNT = 1;
  constexpr static int32_t E_INSUFFICIENT = 2;
  constexpr static int32_t E_OVERFLOW = 3;

  Wallet() = default;
  explicit Wallet(uint64_t initialBalance);
  ~Wallet() = default;

  uint64_t getBalance() const { return balance_; }
  Roe<void> deposit(uint64_t amount);
  Roe<void> withdraw(uint64_t amount);
  Roe<void> transfer(Wallet &destination, uint64_t amount);

  bool hasBalance(uint64_t amount) const { return balance_ >= amount; }
  bool isEmpty() const { return balance_ == 0; }

private:
  uint64_t balance_{ 0 };
};

} // namespace mc

#endif // MOCKCHAIN_WALLET_H
