#pragma once

#include <datapod/datapod.hpp>
#include <string>
#include <tuple>

namespace certchain {

    /// Ledger-wide settings. Defaults match the simulated network the HTTP layer presents.
    struct LedgerConfig {
        dp::u64 block_gas_limit = 8000000;  // Advisory block capacity, never enforced
        dp::u64 gas_price = 20;             // Gwei per unit of gas
        dp::u64 default_gas_limit = 200000; // Limit attached to service-issued transactions
        std::string contract_address = "0x742d35Cc6634C0532925a3b8D045A879689996F4";
        std::string system_address = "0x0000000000000000000000000000000000000000"; // Sender of verifications with no caller
        std::string wallet_balance = "10.0";    // Simulated balance reported by connectWallet

        auto members() {
            return std::tie(block_gas_limit, gas_price, default_gas_limit, contract_address, system_address,
                            wallet_balance);
        }
        auto members() const {
            return std::tie(block_gas_limit, gas_price, default_gas_limit, contract_address, system_address,
                            wallet_balance);
        }
    };

} // namespace certchain
