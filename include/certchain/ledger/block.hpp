#pragma once

#include <datapod/datapod.hpp>
#include <string>
#include <vector>

#include "hasher.hpp"
#include "transaction.hpp"

namespace certchain::ledger {

    /// previous_hash_ of the genesis block
    inline constexpr const char *ZERO_HASH = "0x0000000000000000000000000000000000000000000000000000000000000000";
    /// hash_ of the genesis block; a fixed constant, not a digest
    inline constexpr const char *GENESIS_HASH = "0xffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff";

    class Block {
      public:
        dp::u64 block_number_{0};
        dp::i64 timestamp_{0};
        std::string previous_hash_{};
        std::string hash_{};
        std::vector<Transaction> transactions_{};
        dp::u64 gas_used_{0};
        dp::u64 gas_limit_{gas::DEFAULT_BLOCK_GAS_LIMIT};

        Block() = default;

        inline static Block genesis(dp::i64 timestamp, dp::u64 gas_limit = gas::DEFAULT_BLOCK_GAS_LIMIT) {
            Block block;
            block.block_number_ = 0;
            block.timestamp_ = timestamp;
            block.previous_hash_ = ZERO_HASH;
            block.hash_ = GENESIS_HASH;
            block.gas_limit_ = gas_limit;
            return block;
        }

        inline bool isGenesis() const { return block_number_ == 0; }

        inline size_t transactionCount() const { return transactions_.size(); }

        inline dp::u64 sumGasUsed() const {
            dp::u64 total = 0;
            for (const auto &txn : transactions_)
                total += txn.gas_used_;
            return total;
        }

        /// Everything the block hash covers: number, previous hash, timestamp and the sealed transactions
        inline CanonicalValue headerToCanonical() const {
            auto txs = CanonicalValue::list();
            for (const auto &txn : transactions_)
                txs.push(txn.toCanonical());

            auto value = CanonicalValue::object();
            value.setInteger("block_number", static_cast<dp::i64>(block_number_))
                .setText("previous_hash", previous_hash_)
                .setInteger("timestamp", timestamp_)
                .set("transactions", std::move(txs));
            return value;
        }

        inline dp::Result<std::string, dp::Error> calculateHash() const { return Hasher::hash(headerToCanonical()); }

        inline dp::Result<bool, dp::Error> isValid() const {
            if (isGenesis()) {
                if (previous_hash_ != ZERO_HASH || hash_ != GENESIS_HASH)
                    return dp::Result<bool, dp::Error>::err(dp::Error::invalid_argument("Genesis sentinels altered"));
                if (!transactions_.empty())
                    return dp::Result<bool, dp::Error>::err(
                        dp::Error::invalid_argument("Genesis block holds transactions"));
                return dp::Result<bool, dp::Error>::ok(true);
            }

            auto calc_hash = calculateHash();
            if (!calc_hash.is_ok())
                return dp::Result<bool, dp::Error>::err(calc_hash.error());
            if (hash_ != calc_hash.value())
                return dp::Result<bool, dp::Error>::err(dp::Error::invalid_argument("Block hash mismatch"));
            if (gas_used_ != sumGasUsed())
                return dp::Result<bool, dp::Error>::err(dp::Error::invalid_argument("Block gas total mismatch"));

            for (const auto &txn : transactions_) {
                if (!txn.isConfirmed() || !txn.block_number_ || *txn.block_number_ != block_number_) {
                    return dp::Result<bool, dp::Error>::err(
                        dp::Error::invalid_argument("Block contains a transaction not sealed into it"));
                }
                if (txn.gas_used_ > txn.gas_limit_) {
                    return dp::Result<bool, dp::Error>::err(
                        dp::Error::invalid_argument("Transaction gas used exceeds its limit"));
                }
            }
            return dp::Result<bool, dp::Error>::ok(true);
        }
    };

} // namespace certchain::ledger
