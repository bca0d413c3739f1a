#include <certchain/ledger/block.hpp>
#include <doctest/doctest.h>

using namespace certchain::ledger;

namespace {
    Transaction confirmedTransaction(const std::string &hash, dp::u64 gas_used, dp::u64 block_number) {
        Transaction txn;
        txn.hash_ = hash;
        txn.operation_ = OperationKind::Transfer;
        txn.gas_limit_ = 200000;
        txn.gas_used_ = gas_used;
        txn.gas_price_ = 20;
        REQUIRE(txn.confirm(block_number).is_ok());
        return txn;
    }

    Block sealedBlock() {
        Block block;
        block.block_number_ = 1;
        block.timestamp_ = 1700000100;
        block.previous_hash_ = GENESIS_HASH;
        block.transactions_ = {confirmedTransaction("0x01", 21000, 1), confirmedTransaction("0x02", 100000, 1)};
        block.gas_used_ = block.sumGasUsed();
        block.hash_ = block.calculateHash().value();
        return block;
    }
} // namespace

TEST_SUITE("Block Tests") {
    TEST_CASE("Genesis block uses fixed sentinels") {
        auto genesis = Block::genesis(1700000000);
        CHECK(genesis.isGenesis());
        CHECK(genesis.block_number_ == 0);
        CHECK(genesis.previous_hash_ == ZERO_HASH);
        CHECK(genesis.hash_ == GENESIS_HASH);
        CHECK(genesis.transactionCount() == 0);
        CHECK(genesis.gas_limit_ == 8000000);

        auto valid = genesis.isValid();
        CHECK(valid.is_ok());
    }

    TEST_CASE("Genesis with altered sentinels is invalid") {
        auto genesis = Block::genesis(1700000000);
        genesis.hash_ = ZERO_HASH;
        CHECK(genesis.isValid().is_err());
    }

    TEST_CASE("Sealed block validates") {
        auto block = sealedBlock();
        CHECK(block.gas_used_ == 121000);
        auto valid = block.isValid();
        CHECK(valid.is_ok());
        CHECK(valid.value());
    }

    TEST_CASE("Hash covers number, previous hash, timestamp and transactions") {
        auto block = sealedBlock();
        auto original = block.hash_;

        auto renumbered = block;
        renumbered.block_number_ = 2;
        CHECK(renumbered.calculateHash().value() != original);

        auto relinked = block;
        relinked.previous_hash_ = ZERO_HASH;
        CHECK(relinked.calculateHash().value() != original);

        auto retimed = block;
        retimed.timestamp_ += 1;
        CHECK(retimed.calculateHash().value() != original);

        auto reordered = block;
        std::swap(reordered.transactions_[0], reordered.transactions_[1]);
        CHECK(reordered.calculateHash().value() != original);

        CHECK(block.calculateHash().value() == original);
    }

    TEST_CASE("Tampering is detected") {
        auto block = sealedBlock();
        block.transactions_[0].gas_used_ = 1;
        CHECK(block.isValid().is_err());

        auto gas_mismatch = sealedBlock();
        gas_mismatch.gas_used_ = 5;
        CHECK(gas_mismatch.isValid().is_err());
    }

    TEST_CASE("A pending transaction inside a block is invalid") {
        auto block = sealedBlock();
        Transaction pending;
        pending.hash_ = "0x03";
        block.transactions_.push_back(pending);
        block.gas_used_ = block.sumGasUsed();
        block.hash_ = block.calculateHash().value();
        CHECK(block.isValid().is_err());
    }
}
