#pragma once

#include <algorithm>
#include <datapod/datapod.hpp>
#include <optional>
#include <string>

namespace certchain::ledger {

    /// Ledger operation kinds
    enum class OperationKind : dp::u8 {
        RegisterInstitution = 0,
        IssueCertificate = 1,
        VerifyCertificate = 2,
        Transfer = 3,
    };

    /// Wire name for an operation kind
    inline std::string operationKindToString(OperationKind kind) {
        switch (kind) {
        case OperationKind::RegisterInstitution:
            return "register_institution";
        case OperationKind::IssueCertificate:
            return "issue_certificate";
        case OperationKind::VerifyCertificate:
            return "verify_certificate";
        case OperationKind::Transfer:
            return "transfer";
        default:
            return "unknown";
        }
    }

    inline std::optional<OperationKind> operationKindFromString(const std::string &name) {
        if (name == "register_institution")
            return OperationKind::RegisterInstitution;
        if (name == "issue_certificate")
            return OperationKind::IssueCertificate;
        if (name == "verify_certificate")
            return OperationKind::VerifyCertificate;
        if (name == "transfer")
            return OperationKind::Transfer;
        return std::nullopt;
    }

    namespace gas {

        constexpr dp::u64 REGISTER_INSTITUTION_COST = 150000;
        constexpr dp::u64 ISSUE_CERTIFICATE_COST = 100000;
        constexpr dp::u64 VERIFY_CERTIFICATE_COST = 21000;
        constexpr dp::u64 TRANSFER_COST = 21000;
        constexpr dp::u64 DEFAULT_COST = 21000;

        constexpr dp::u64 DEFAULT_BLOCK_GAS_LIMIT = 8000000;

        /// Nominal cost of an operation; kinds outside the table cost DEFAULT_COST
        inline dp::u64 costOf(OperationKind kind) {
            switch (kind) {
            case OperationKind::RegisterInstitution:
                return REGISTER_INSTITUTION_COST;
            case OperationKind::IssueCertificate:
                return ISSUE_CERTIFICATE_COST;
            case OperationKind::VerifyCertificate:
                return VERIFY_CERTIFICATE_COST;
            case OperationKind::Transfer:
                return TRANSFER_COST;
            default:
                return DEFAULT_COST;
            }
        }

        inline dp::u64 costOf(const std::string &operation) {
            auto kind = operationKindFromString(operation);
            return kind ? costOf(*kind) : DEFAULT_COST;
        }

        /// Gas actually charged. A limit below the nominal cost is not an error; the caller pays only up to it.
        inline dp::u64 chargedGas(OperationKind kind, dp::u64 supplied_limit) {
            return std::min(supplied_limit, costOf(kind));
        }

        inline dp::u64 chargedGas(const std::string &operation, dp::u64 supplied_limit) {
            return std::min(supplied_limit, costOf(operation));
        }

        /// Fee for a transaction, in the gas price's unit
        inline dp::u64 gasCost(dp::u64 gas_used, dp::u64 gas_price) { return gas_used * gas_price; }

    } // namespace gas

} // namespace certchain::ledger
