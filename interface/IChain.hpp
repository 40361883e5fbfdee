#pragma once

#include "Block.h"
#include "ResultOrError.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace mc {

/**
 * Chain handle used by the block producer.
 * Implementations must make every call atomic with respect to each other.
 */
class IChain {
public:
    struct Error : RoeErrorBase {
        using RoeErrorBase::RoeErrorBase;
    };

    template <typename T> using Roe = ResultOrError<T, Error>;

    // Block rejections
    constexpr static int32_t E_BLOCK_HASH = 12;
    constexpr static int32_t E_BLOCK_INDEX = 13;
    constexpr static int32_t E_BLOCK_CHAIN = 14;
    constexpr static int32_t E_BLOCK_VALIDATION = 15;
    constexpr static int32_t E_BLOCK_TX = 16;
    constexpr static int32_t E_BLOCK_MINER = 17;

    /**
     * Everything a producer needs to build the next block, taken from one
     * consistent view of the chain.
     */
    struct Candidate {
        uint64_t nextIndex{ 0 };
        std::string previousHash;
        std::vector<Transaction> transactions;
    };

    virtual ~IChain() = default;

    /**
     * Snapshot tip linkage and up to maxTransactions pending transactions
     * (0 = all) in arrival order. The pool is left untouched.
     */
    virtual Candidate prepareCandidate(size_t maxTransactions) const = 0;

    /**
     * Append a sealed block. Fails with E_BLOCK_INDEX or E_BLOCK_CHAIN when
     * the tip moved since the candidate was taken.
     */
    virtual Roe<void> appendBlock(const Block &block) = 0;

    virtual uint64_t getChainLength() const = 0;
    virtual std::string getLastBlockHash() const = 0;

    // True for rejections caused by a moved tip rather than a bad block
    static bool isStale(const Error &error) {
        return error.code == E_BLOCK_INDEX || error.code == E_BLOCK_CHAIN;
    }
};

} // namespace mc
