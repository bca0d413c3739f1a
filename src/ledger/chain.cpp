#include <certchain/ledger/address.hpp>
#include <certchain/ledger/chain.hpp>
#include <iostream>
#include <mutex>
#include <unordered_set>

namespace certchain::ledger {

    Chain::Chain(const Clock &clock, LedgerConfig config) : clock_(clock), config_(std::move(config)) {
        blocks_.push_back(Block::genesis(clock_.now(), config_.block_gas_limit));
    }

    dp::Result<Transaction, dp::Error> Chain::prepare(const TransactionDraft &draft) const {
        Transaction txn;
        txn.from_ = draft.from;
        txn.to_ = draft.to;
        txn.operation_ = draft.operation;
        txn.payload_ = draft.payload;
        txn.gas_limit_ = draft.gas_limit;
        txn.gas_used_ = gas::chargedGas(draft.operation, draft.gas_limit);
        txn.gas_price_ = draft.gas_price;
        txn.timestamp_ = clock_.now();
        txn.nonce_ = next_nonce_.fetch_add(1);
        txn.status_ = TransactionStatus::Pending;

        auto hash_result = Hasher::hash(txn.contentToCanonical());
        if (!hash_result.is_ok())
            return dp::Result<Transaction, dp::Error>::err(hash_result.error());
        txn.hash_ = hash_result.value();
        return dp::Result<Transaction, dp::Error>::ok(std::move(txn));
    }

    dp::Result<void, dp::Error> Chain::checkSubmittable(const Transaction &txn) const {
        if (!txn.isPending()) {
            return dp::Result<void, dp::Error>::err(
                already_confirmed(dp::String(("Transaction " + txn.hash_ + " is not pending").c_str())));
        }
        if (sealed_hashes_.count(txn.hash_) || pool_.find(txn.hash_)) {
            std::cout << "Duplicate transaction detected: " << txn.hash_ << std::endl;
            return dp::Result<void, dp::Error>::err(
                duplicate_transaction(dp::String(("Transaction " + txn.hash_ + " already submitted").c_str())));
        }
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> Chain::submit(Transaction txn) {
        std::unique_lock lock(mutex_);
        auto accepted = checkSubmittable(txn);
        if (!accepted.is_ok())
            return accepted;
        pool_.submit(std::move(txn));
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<std::optional<Block>, dp::Error> Chain::append(std::vector<Transaction> sealed) {
        std::unique_lock lock(mutex_);
        // Sealing a queued transaction here would leave its pool copy unsealable
        for (const auto &txn : sealed) {
            if (pool_.find(txn.hash_)) {
                std::cout << "Duplicate transaction detected: " << txn.hash_ << std::endl;
                return dp::Result<std::optional<Block>, dp::Error>::err(
                    duplicate_transaction(dp::String(("Transaction " + txn.hash_ + " is queued").c_str())));
            }
        }
        return appendLocked(std::move(sealed));
    }

    dp::Result<std::optional<Block>, dp::Error> Chain::seal() {
        std::unique_lock lock(mutex_);
        // The pool is only emptied once the block is on the chain
        auto result = appendLocked(pool_.pending());
        if (result.is_ok() && result.value().has_value())
            pool_.drainAll();
        return result;
    }

    dp::Result<Block, dp::Error> Chain::commit(Transaction txn) {
        std::unique_lock lock(mutex_);
        auto accepted = checkSubmittable(txn);
        if (!accepted.is_ok())
            return dp::Result<Block, dp::Error>::err(accepted.error());

        auto batch = pool_.pending();
        batch.push_back(std::move(txn));

        auto result = appendLocked(std::move(batch));
        if (!result.is_ok())
            return dp::Result<Block, dp::Error>::err(result.error());
        pool_.drainAll();
        return dp::Result<Block, dp::Error>::ok(*result.value());
    }

    dp::Result<std::optional<Block>, dp::Error> Chain::appendLocked(std::vector<Transaction> sealed) {
        if (sealed.empty())
            return dp::Result<std::optional<Block>, dp::Error>::ok(std::optional<Block>{});

        const Block &head = blocks_.back();
        Block block;
        block.block_number_ = head.block_number_ + 1;
        block.timestamp_ = clock_.now();
        block.previous_hash_ = head.hash_;
        block.gas_limit_ = config_.block_gas_limit;

        std::unordered_set<std::string> batch_hashes;
        for (const auto &txn : sealed) {
            if (sealed_hashes_.count(txn.hash_) || !batch_hashes.insert(txn.hash_).second) {
                std::cout << "Duplicate transaction detected: " << txn.hash_ << std::endl;
                return dp::Result<std::optional<Block>, dp::Error>::err(duplicate_transaction(
                    dp::String(("Transaction " + txn.hash_ + " sealed twice").c_str())));
            }
        }

        for (auto &txn : sealed) {
            auto confirmed = txn.confirm(block.block_number_);
            if (!confirmed.is_ok()) {
                std::cout << "Refusing to seal block #" << block.block_number_ << ": " << errorMessage(confirmed.error())
                          << std::endl;
                return dp::Result<std::optional<Block>, dp::Error>::err(confirmed.error());
            }
        }
        block.transactions_ = std::move(sealed);
        block.gas_used_ = block.sumGasUsed();

        auto hash_result = block.calculateHash();
        if (!hash_result.is_ok())
            return dp::Result<std::optional<Block>, dp::Error>::err(hash_result.error());
        block.hash_ = hash_result.value();

        for (const auto &txn : block.transactions_)
            sealed_hashes_.insert(txn.hash_);
        blocks_.push_back(block);
        return dp::Result<std::optional<Block>, dp::Error>::ok(std::optional<Block>(std::move(block)));
    }

    Block Chain::latest() const {
        std::shared_lock lock(mutex_);
        return blocks_.back();
    }

    dp::Result<Block, dp::Error> Chain::blockByNumber(dp::u64 number) const {
        std::shared_lock lock(mutex_);
        // Block numbers are dense from genesis, so the number is the index
        if (number >= blocks_.size()) {
            return dp::Result<Block, dp::Error>::err(
                block_not_found(dp::String(("Block #" + std::to_string(number) + " not found").c_str())));
        }
        return dp::Result<Block, dp::Error>::ok(blocks_[number]);
    }

    std::vector<Block> Chain::blocks() const {
        std::shared_lock lock(mutex_);
        return blocks_;
    }

    std::vector<Transaction> Chain::allTransactions() const {
        std::shared_lock lock(mutex_);
        std::vector<Transaction> result;
        for (const auto &block : blocks_)
            result.insert(result.end(), block.transactions_.begin(), block.transactions_.end());
        const auto &pending = pool_.pending();
        result.insert(result.end(), pending.begin(), pending.end());
        return result;
    }

    dp::Result<Transaction, dp::Error> Chain::transactionByHash(const std::string &hash) const {
        std::shared_lock lock(mutex_);
        for (const auto &block : blocks_) {
            for (const auto &txn : block.transactions_) {
                if (txn.hash_ == hash)
                    return dp::Result<Transaction, dp::Error>::ok(txn);
            }
        }
        auto pending = pool_.find(hash);
        if (pending)
            return dp::Result<Transaction, dp::Error>::ok(*pending);
        return dp::Result<Transaction, dp::Error>::err(
            transaction_not_found(dp::String(("Transaction " + hash + " not found").c_str())));
    }

    size_t Chain::length() const {
        std::shared_lock lock(mutex_);
        return blocks_.size();
    }

    size_t Chain::pendingCount() const {
        std::shared_lock lock(mutex_);
        return pool_.size();
    }

    size_t Chain::confirmedTransactionCount() const {
        std::shared_lock lock(mutex_);
        return totalsLocked().confirmed_transactions;
    }

    dp::u64 Chain::totalGasUsed() const {
        std::shared_lock lock(mutex_);
        return totalsLocked().gas_used;
    }

    ChainTotals Chain::totals() const {
        std::shared_lock lock(mutex_);
        return totalsLocked();
    }

    ChainTotals Chain::totalsLocked() const {
        ChainTotals totals;
        totals.blocks = blocks_.size();
        totals.pending_transactions = pool_.size();
        for (const auto &block : blocks_) {
            totals.confirmed_transactions += block.transactionCount();
            totals.gas_used += block.gas_used_;
        }
        return totals;
    }

    dp::Result<bool, dp::Error> Chain::isValid() const {
        std::shared_lock lock(mutex_);
        for (size_t i = 0; i < blocks_.size(); i++) {
            const Block &current = blocks_[i];
            if (current.block_number_ != i)
                return dp::Result<bool, dp::Error>::err(dp::Error::invalid_argument("Block numbering gap"));
            auto valid = current.isValid();
            if (!valid.is_ok())
                return valid;
            if (i > 0 && current.previous_hash_ != blocks_[i - 1].hash_)
                return dp::Result<bool, dp::Error>::err(dp::Error::invalid_argument("Broken hash link"));
        }
        return dp::Result<bool, dp::Error>::ok(true);
    }

    void Chain::printChainSummary() const {
        std::shared_lock lock(mutex_);
        auto totals = totalsLocked();
        std::cout << "=== Ledger Summary ===\n";
        std::cout << "Total Blocks: " << totals.blocks << "\n";
        std::cout << "Confirmed Transactions: " << totals.confirmed_transactions << "\n";
        std::cout << "Pending Transactions: " << totals.pending_transactions << "\n";
        std::cout << "Total Gas Used: " << totals.gas_used << "\n";
        std::cout << "Gas Price: " << config_.gas_price << " gwei\n";
        std::cout << "Contract: " << formatAddress(config_.contract_address) << "\n";
        std::cout << "Latest Block: #" << blocks_.back().block_number_ << " " << blocks_.back().hash_.substr(0, 18)
                  << "...\n";
    }

} // namespace certchain::ledger
