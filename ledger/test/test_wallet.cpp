#include "Wallet.h"
#include <gtest/gtest.h>

#include <limits>

TEST(WalletTest, DefaultConstructorCreatesZeroBalance) {
    mc::Wallet wallet;
    EXPECT_EQ(wallet.getBalance(), 0u);
}

TEST(WalletTest, ConstructorWithInitialBalance) {
    mc::Wallet wallet(1000);
    EXPECT_EQ(wallet.getBalance(), 1000u);
}

TEST(WalletTest, DepositIncreasesBalance) {
    mc::Wallet wallet;
    auto result = wallet.deposit(500);
    ASSERT_TRUE(result.isOk());
    EXPECT_EQ(wallet.getBalance(), 500u);
}

TEST(WalletTest, ZeroDepositRejected) {
    mc::Wallet wallet;
    auto result = wallet.deposit(0);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, mc::Wallet::E_AMOUNT);
}

TEST(WalletTest, DepositOverflowRejected) {
    mc::Wallet wallet(std::numeric_limits<uint64_t>::max() - 10);
    auto result = wallet.deposit(11);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, mc::Wallet::E_OVERFLOW);
    EXPECT_EQ(wallet.getBalance(), std::numeric_limits<uint64_t>::max() - 10);
}

TEST(WalletTest, WithdrawDecreasesBalance) {
    mc::Wallet wallet(1000);
    auto result = wallet.withdraw(300);
    ASSERT_TRUE(result.isOk());
    EXPECT_EQ(wallet.getBalance(), 700u);
}

TEST(WalletTest, OverdraftRejected) {
    mc::Wallet wallet(500);
    auto result = wallet.withdraw(1000);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, mc::Wallet::E_INSUFFICIENT);
    EXPECT_EQ(wallet.getBalance(), 500u);
}

TEST(WalletTest, TransferSucceeds) {
    mc::Wallet wallet1(500);
    mc::Wallet wallet2(700);

    auto result = wallet1.transfer(wallet2, 200);
    ASSERT_TRUE(result.isOk());
    EXPECT_EQ(wallet1.getBalance(), 300u);
    EXPECT_EQ(wallet2.getBalance(), 900u);
}

TEST(WalletTest, TransferWithInsufficientBalance) {
    mc::Wallet wallet1(300);
    mc::Wallet wallet2;

    auto result = wallet1.transfer(wallet2, 1000);
    EXPECT_TRUE(result.isError());
    EXPECT_EQ(wallet1.getBalance(), 300u);
    EXPECT_EQ(wallet2.getBalance(), 0u);
}

TEST(WalletTest, TransferOverflowLeavesBothUntouched) {
    mc::Wallet wallet1(100);
    mc::Wallet wallet2(std::numeric_limits<uint64_t>::max());

    auto result = wallet1.transfer(wallet2, 1);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, mc::Wallet::E_OVERFLOW);
    EXPECT_EQ(wallet1.getBalance(), 100u);
}

TEST(WalletTest, SelfTransferKeepsBalance) {
    mc::Wallet wallet(100);
    EXPECT_TRUE(wallet.transfer(wallet, 40).isOk());
    EXPECT_EQ(wallet.getBalance(), 100u);
    EXPECT_TRUE(wallet.transfer(wallet, 101).isError());
}

TEST(WalletTest, HasBalancePositive) {
    mc::Wallet wallet(500);
    EXPECT_TRUE(wallet.hasBalance(100));
    EXPECT_TRUE(wallet.hasBalance(500));
    EXPECT_FALSE(wallet.hasBalance(600));
}

TEST(WalletTest, IsEmptyReflectsBalance) {
    mc::Wallet empty;
    mc::Wallet funded(100);
    EXPECT_TRUE(empty.isEmpty());
    EXPECT_FALSE(funded.isEmpty());
}
