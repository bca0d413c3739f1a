#pragma once

#include <atomic>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_set>
#include <vector>

#include "block.hpp"
#include "certchain/common/config.hpp"
#include "clock.hpp"
#include "transaction_pool.hpp"

namespace certchain::ledger {

    /// Chain-side counters read under one guard acquisition
    struct ChainTotals {
        size_t blocks = 0;
        size_t pending_transactions = 0;
        size_t confirmed_transactions = 0;
        dp::u64 gas_used = 0;
    };

    /// Append-only sequence of blocks, starting at a fixed genesis block, plus the pool of pending transactions.
    ///
    /// All mutations (submit, append, seal, commit) run under one exclusive guard, so a submit-then-seal
    /// sequence is atomic and no transaction can be lost or sealed twice. Reads take the guard shared and
    /// return copies.
    class Chain {
      public:
        explicit Chain(const Clock &clock, LedgerConfig config = LedgerConfig{});

        Chain(const Chain &) = delete;
        Chain &operator=(const Chain &) = delete;

        /// Stamp a draft into a pending transaction: timestamp, nonce, charged gas and content hash.
        /// Nothing is submitted.
        dp::Result<Transaction, dp::Error> prepare(const TransactionDraft &draft) const;

        /// Queue a transaction for the next seal. Only a Pending transaction whose hash is neither queued
        /// nor sealed is accepted.
        dp::Result<void, dp::Error> submit(Transaction txn);

        /// Seal the given transactions into the next block.
        /// An empty sequence is a no-op and yields no block. A hash that is queued in the pool, already
        /// sealed, or repeated in the batch is refused.
        dp::Result<std::optional<Block>, dp::Error> append(std::vector<Transaction> sealed);

        /// Drain the pool and append it as one block
        dp::Result<std::optional<Block>, dp::Error> seal();

        /// Submit and seal in one step. The returned block contains txn, plus anything already pending.
        /// Refused under the same rules as submit().
        dp::Result<Block, dp::Error> commit(Transaction txn);

        // ===========================================
        // Queries
        // ===========================================

        Block latest() const;
        dp::Result<Block, dp::Error> blockByNumber(dp::u64 number) const;
        std::vector<Block> blocks() const;

        /// Sealed transactions in block order, followed by the pending ones
        std::vector<Transaction> allTransactions() const;

        /// Searches sealed blocks first, then the pool
        dp::Result<Transaction, dp::Error> transactionByHash(const std::string &hash) const;

        size_t length() const;
        size_t pendingCount() const;
        size_t confirmedTransactionCount() const;
        dp::u64 totalGasUsed() const;
        ChainTotals totals() const;

        /// Re-derive every block hash and check the links
        dp::Result<bool, dp::Error> isValid() const;

        void printChainSummary() const;

        inline const LedgerConfig &config() const { return config_; }

      private:
        dp::Result<void, dp::Error> checkSubmittable(const Transaction &txn) const;
        dp::Result<std::optional<Block>, dp::Error> appendLocked(std::vector<Transaction> sealed);
        ChainTotals totalsLocked() const;

        const Clock &clock_;
        LedgerConfig config_;
        std::vector<Block> blocks_;
        TransactionPool pool_;
        std::unordered_set<std::string> sealed_hashes_;
        mutable std::atomic<dp::u64> next_nonce_{0};
        mutable std::shared_mutex mutex_;
    };

} // namespace certchain::ledger
