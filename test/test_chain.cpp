#include <certchain/ledger/chain.hpp>
#include <atomic>
#include <doctest/doctest.h>
#include <set>
#include <thread>

using namespace certchain;
using namespace certchain::ledger;

namespace {
    TransactionDraft transferDraft(const std::string &memo, dp::u64 gas_limit = 200000) {
        TransactionDraft draft;
        draft.from = "0x1111";
        draft.to = "0x2222";
        draft.operation = OperationKind::Transfer;
        AuditPayload payload;
        payload.fields["memo"] = memo;
        draft.payload = payload;
        draft.gas_limit = gas_limit;
        draft.gas_price = 20;
        return draft;
    }
} // namespace

TEST_SUITE("Chain Tests") {
    TEST_CASE("Chain starts with genesis only") {
        ManualClock clock;
        Chain chain(clock);

        CHECK(chain.length() == 1);
        CHECK(chain.latest().isGenesis());
        CHECK(chain.latest().hash_ == GENESIS_HASH);
        CHECK(chain.pendingCount() == 0);
        CHECK(chain.allTransactions().empty());
    }

    TEST_CASE("Prepare stamps a pending transaction") {
        ManualClock clock(1700000500);
        Chain chain(clock);

        auto txn = chain.prepare(transferDraft("a", 10000));
        REQUIRE(txn.is_ok());
        CHECK(txn.value().isPending());
        CHECK(txn.value().timestamp_ == 1700000500);
        CHECK(txn.value().gas_used_ == 10000);
        CHECK(Hasher::looksLikeHash(txn.value().hash_));
        CHECK(chain.pendingCount() == 0);

        auto other = chain.prepare(transferDraft("a", 10000));
        REQUIRE(other.is_ok());
        CHECK(other.value().nonce_ != txn.value().nonce_);
        CHECK(other.value().hash_ != txn.value().hash_);
    }

    TEST_CASE("Seal drains the pool into one block") {
        ManualClock clock;
        Chain chain(clock);

        for (int i = 0; i < 3; i++)
            REQUIRE(chain.submit(chain.prepare(transferDraft("t" + std::to_string(i))).value()).is_ok());
        CHECK(chain.pendingCount() == 3);

        clock.advance(15);
        auto sealed = chain.seal();
        REQUIRE(sealed.is_ok());
        REQUIRE(sealed.value().has_value());

        const Block &block = *sealed.value();
        CHECK(block.block_number_ == 1);
        CHECK(block.timestamp_ == clock.now());
        CHECK(block.previous_hash_ == GENESIS_HASH);
        CHECK(block.transactionCount() == 3);
        CHECK(block.gas_used_ == 3 * 21000);
        CHECK(chain.pendingCount() == 0);

        for (const auto &txn : block.transactions_) {
            CHECK(txn.isConfirmed());
            CHECK(txn.block_number_.value() == 1);
        }
    }

    TEST_CASE("Pool order is kept inside the block") {
        ManualClock clock;
        Chain chain(clock);

        std::vector<std::string> hashes;
        for (int i = 0; i < 4; i++) {
            auto txn = chain.prepare(transferDraft("order" + std::to_string(i))).value();
            hashes.push_back(txn.hash_);
            REQUIRE(chain.submit(txn).is_ok());
        }

        auto block = chain.seal().value();
        REQUIRE(block.has_value());
        for (size_t i = 0; i < hashes.size(); i++)
            CHECK(block->transactions_[i].hash_ == hashes[i]);
    }

    TEST_CASE("Sealing an empty pool is a no-op") {
        ManualClock clock;
        Chain chain(clock);

        auto sealed = chain.seal();
        REQUIRE(sealed.is_ok());
        CHECK_FALSE(sealed.value().has_value());
        CHECK(chain.length() == 1);

        auto appended = chain.append({});
        REQUIRE(appended.is_ok());
        CHECK_FALSE(appended.value().has_value());
        CHECK(chain.length() == 1);
    }

    TEST_CASE("Blocks link to their predecessor") {
        ManualClock clock;
        Chain chain(clock);

        for (int i = 0; i < 5; i++) {
            clock.advance();
            REQUIRE(chain.commit(chain.prepare(transferDraft("link" + std::to_string(i))).value()).is_ok());
        }

        auto blocks = chain.blocks();
        REQUIRE(blocks.size() == 6);
        for (size_t n = 1; n < blocks.size(); n++) {
            CHECK(blocks[n].block_number_ == n);
            CHECK(blocks[n].previous_hash_ == blocks[n - 1].hash_);
        }

        auto valid = chain.isValid();
        CHECK(valid.is_ok());
        CHECK(valid.value());
    }

    TEST_CASE("Commit includes anything already pending") {
        ManualClock clock;
        Chain chain(clock);

        auto first = chain.prepare(transferDraft("queued")).value();
        REQUIRE(chain.submit(first).is_ok());
        auto second = chain.prepare(transferDraft("committed")).value();

        auto block = chain.commit(second);
        REQUIRE(block.is_ok());
        REQUIRE(block.value().transactionCount() == 2);
        CHECK(block.value().transactions_[0].hash_ == first.hash_);
        CHECK(block.value().transactions_[1].hash_ == second.hash_);
    }

    TEST_CASE("Appending an already confirmed transaction is refused") {
        ManualClock clock;
        Chain chain(clock);

        auto block = chain.commit(chain.prepare(transferDraft("once")).value());
        REQUIRE(block.is_ok());

        auto again = chain.append({block.value().transactions_[0]});
        CHECK(again.is_err());
        CHECK(again.error().code == ERR_DUPLICATE_TRANSACTION);
        CHECK(chain.length() == 2);
    }

    TEST_CASE("A confirmed transaction is never queued or sealed") {
        ManualClock clock;
        Chain chain(clock);

        auto txn = chain.prepare(transferDraft("elsewhere")).value();
        REQUIRE(txn.confirm(7).is_ok());

        auto submitted = chain.submit(txn);
        CHECK(submitted.is_err());
        CHECK(submitted.error().code == ERR_ALREADY_CONFIRMED);
        CHECK(chain.pendingCount() == 0);

        auto committed = chain.commit(txn);
        CHECK(committed.is_err());
        CHECK(committed.error().code == ERR_ALREADY_CONFIRMED);

        auto appended = chain.append({txn});
        CHECK(appended.is_err());
        CHECK(appended.error().code == ERR_ALREADY_CONFIRMED);
        CHECK(chain.length() == 1);

        // The pool still seals normally afterwards
        REQUIRE(chain.submit(chain.prepare(transferDraft("next")).value()).is_ok());
        auto sealed = chain.seal();
        REQUIRE(sealed.is_ok());
        CHECK(sealed.value().has_value());
    }

    TEST_CASE("A queued transaction cannot be submitted or committed again") {
        ManualClock clock;
        Chain chain(clock);

        auto txn = chain.prepare(transferDraft("queued once")).value();
        REQUIRE(chain.submit(txn).is_ok());

        auto resubmitted = chain.submit(txn);
        CHECK(resubmitted.is_err());
        CHECK(resubmitted.error().code == ERR_DUPLICATE_TRANSACTION);
        CHECK(chain.pendingCount() == 1);

        auto committed = chain.commit(txn);
        CHECK(committed.is_err());
        CHECK(committed.error().code == ERR_DUPLICATE_TRANSACTION);
        CHECK(chain.length() == 1);

        auto appended = chain.append({txn});
        CHECK(appended.is_err());
        CHECK(appended.error().code == ERR_DUPLICATE_TRANSACTION);
        CHECK(chain.length() == 1);

        auto sealed = chain.seal();
        REQUIRE(sealed.is_ok());
        REQUIRE(sealed.value().has_value());
        CHECK(sealed.value()->transactionCount() == 1);
        CHECK(chain.pendingCount() == 0);
    }

    TEST_CASE("A sealed transaction cannot enter another block") {
        ManualClock clock;
        Chain chain(clock);

        auto first = chain.prepare(transferDraft("first")).value();
        REQUIRE(chain.commit(first).is_ok());

        // Still Pending in this copy, but its hash is on the chain
        auto resubmitted = chain.submit(first);
        CHECK(resubmitted.is_err());
        CHECK(resubmitted.error().code == ERR_DUPLICATE_TRANSACTION);

        auto recommitted = chain.commit(first);
        CHECK(recommitted.is_err());
        CHECK(recommitted.error().code == ERR_DUPLICATE_TRANSACTION);

        auto second = chain.prepare(transferDraft("second")).value();
        REQUIRE(chain.append({second}).is_ok());
        auto reappended = chain.append({second});
        CHECK(reappended.is_err());
        CHECK(reappended.error().code == ERR_DUPLICATE_TRANSACTION);

        CHECK(chain.length() == 3);
        CHECK(chain.confirmedTransactionCount() == 2);
        CHECK(chain.pendingCount() == 0);
        CHECK(chain.isValid().is_ok());
    }

    TEST_CASE("A batch repeating a hash is refused whole") {
        ManualClock clock;
        Chain chain(clock);

        auto txn = chain.prepare(transferDraft("twice")).value();
        auto appended = chain.append({txn, txn});
        CHECK(appended.is_err());
        CHECK(appended.error().code == ERR_DUPLICATE_TRANSACTION);
        CHECK(chain.length() == 1);

        // Nothing was marked sealed by the refused batch
        auto block = chain.commit(txn);
        REQUIRE(block.is_ok());
        CHECK(block.value().transactionCount() == 1);
    }

    TEST_CASE("Lookups by number and hash") {
        ManualClock clock;
        Chain chain(clock);

        auto sealed = chain.prepare(transferDraft("sealed")).value();
        REQUIRE(chain.commit(sealed).is_ok());
        auto pending = chain.prepare(transferDraft("pending")).value();
        REQUIRE(chain.submit(pending).is_ok());

        CHECK(chain.blockByNumber(0).value().isGenesis());
        CHECK(chain.blockByNumber(1).value().transactions_[0].hash_ == sealed.hash_);

        auto missing = chain.blockByNumber(2);
        CHECK(missing.is_err());
        CHECK(missing.error().code == ERR_BLOCK_NOT_FOUND);
        CHECK(isNotFound(missing.error()));

        auto found_sealed = chain.transactionByHash(sealed.hash_);
        REQUIRE(found_sealed.is_ok());
        CHECK(found_sealed.value().isConfirmed());

        auto found_pending = chain.transactionByHash(pending.hash_);
        REQUIRE(found_pending.is_ok());
        CHECK(found_pending.value().isPending());

        auto unknown = chain.transactionByHash("0xnope");
        CHECK(unknown.is_err());
        CHECK(unknown.error().code == ERR_TRANSACTION_NOT_FOUND);
    }

    TEST_CASE("All transactions lists sealed ones first, then pending") {
        ManualClock clock;
        Chain chain(clock);

        auto a = chain.prepare(transferDraft("a")).value();
        REQUIRE(chain.commit(a).is_ok());
        auto b = chain.prepare(transferDraft("b")).value();
        REQUIRE(chain.commit(b).is_ok());
        auto c = chain.prepare(transferDraft("c")).value();
        REQUIRE(chain.submit(c).is_ok());

        auto all = chain.allTransactions();
        REQUIRE(all.size() == 3);
        CHECK(all[0].hash_ == a.hash_);
        CHECK(all[1].hash_ == b.hash_);
        CHECK(all[2].hash_ == c.hash_);
        CHECK(all[2].isPending());

        CHECK(chain.confirmedTransactionCount() == 2);
        CHECK(chain.totalGasUsed() == 42000);

        auto totals = chain.totals();
        CHECK(totals.blocks == 3);
        CHECK(totals.pending_transactions == 1);
        CHECK(totals.confirmed_transactions == 2);
        CHECK(totals.gas_used == 42000);
    }

    TEST_CASE("Totals never mix states across a concurrent commit") {
        ManualClock clock;
        Chain chain(clock);

        std::atomic<bool> done{false};
        std::thread writer([&chain, &done]() {
            for (int i = 0; i < 200; i++)
                CHECK(chain.commit(chain.prepare(transferDraft("w" + std::to_string(i))).value()).is_ok());
            done = true;
        });

        // One transfer per block and nothing queued: every snapshot satisfies both relations
        size_t mismatches = 0;
        while (!done) {
            auto totals = chain.totals();
            if (totals.confirmed_transactions != totals.blocks - 1 ||
                totals.gas_used != totals.confirmed_transactions * 21000)
                mismatches++;
        }
        writer.join();

        CHECK(mismatches == 0);
        CHECK(chain.totals().blocks == 201);
    }

    TEST_CASE("Concurrent submitters lose nothing and duplicate nothing") {
        ManualClock clock;
        Chain chain(clock);

        const int threads = 8;
        const int per_thread = 25;
        std::vector<std::thread> workers;
        for (int t = 0; t < threads; t++) {
            workers.emplace_back([&chain, t]() {
                for (int i = 0; i < per_thread; i++) {
                    auto txn = chain.prepare(transferDraft(std::to_string(t) + ":" + std::to_string(i)));
                    CHECK(txn.is_ok());
                    if (!txn.is_ok())
                        continue;
                    if (i % 2 == 0) {
                        CHECK(chain.submit(txn.value()).is_ok());
                        CHECK(chain.seal().is_ok());
                    } else {
                        CHECK(chain.commit(txn.value()).is_ok());
                    }
                }
            });
        }
        for (auto &worker : workers)
            worker.join();
        REQUIRE(chain.seal().is_ok());

        std::set<std::string> seen;
        size_t sealed = 0;
        for (const auto &block : chain.blocks()) {
            for (const auto &txn : block.transactions_) {
                CHECK(txn.block_number_.value() == block.block_number_);
                seen.insert(txn.hash_);
                sealed++;
            }
        }
        CHECK(sealed == static_cast<size_t>(threads * per_thread));
        CHECK(seen.size() == sealed);
        CHECK(chain.pendingCount() == 0);
        CHECK(chain.isValid().is_ok());
    }
}
