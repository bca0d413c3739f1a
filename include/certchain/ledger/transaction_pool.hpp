#pragma once

#include <optional>
#include <string>
#include <vector>

#include "transaction.hpp"

namespace certchain::ledger {

    /// Transactions submitted but not yet sealed, in submission order.
    /// Not synchronized on its own: the owning Chain serializes every access under its guard.
    class TransactionPool {
      public:
        TransactionPool() = default;

        inline void submit(Transaction txn) { pending_.push_back(std::move(txn)); }

        /// Hand over every pending transaction, oldest first, leaving the pool empty
        inline std::vector<Transaction> drainAll() {
            std::vector<Transaction> drained;
            drained.swap(pending_);
            return drained;
        }

        inline std::optional<Transaction> find(const std::string &hash) const {
            for (const auto &txn : pending_) {
                if (txn.hash_ == hash)
                    return txn;
            }
            return std::nullopt;
        }

        inline const std::vector<Transaction> &pending() const { return pending_; }
        inline size_t size() const { return pending_.size(); }
        inline bool empty() const { return pending_.empty(); }

      private:
        std::vector<Transaction> pending_;
    };

} // namespace certchain::ledger
