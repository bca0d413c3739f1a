#pragma once

#include <datapod/datapod.hpp>
#include <map>
#include <optional>
#include <string>
#include <variant>

#include "canonical.hpp"
#include "certchain/common/error.hpp"
#include "gas.hpp"

namespace certchain::ledger {

    enum class TransactionStatus : dp::u8 {
        Pending = 0,
        Confirmed = 1,
    };

    inline std::string transactionStatusToString(TransactionStatus status) {
        switch (status) {
        case TransactionStatus::Pending:
            return "pending";
        case TransactionStatus::Confirmed:
            return "confirmed";
        default:
            return "unknown";
        }
    }

    // ===========================================
    // Payloads, one per operation kind
    // ===========================================

    struct InstitutionPayload {
        std::string institution_id;
        std::string name;
        std::string contact_address;
        std::string email;
        std::string wallet_address;

        inline CanonicalValue toCanonical() const {
            auto value = CanonicalValue::object();
            value.setText("institution_id", institution_id)
                .setText("name", name)
                .setText("contact_address", contact_address)
                .setText("email", email)
                .setText("wallet_address", wallet_address);
            return value;
        }
    };

    struct CertificatePayload {
        std::string certificate_hash;
        std::string recipient_name;
        std::string course_name;
        std::string completion_date;
        std::string institution_id;

        inline CanonicalValue toCanonical() const {
            auto value = CanonicalValue::object();
            value.setText("certificate_hash", certificate_hash)
                .setText("recipient_name", recipient_name)
                .setText("course_name", course_name)
                .setText("completion_date", completion_date)
                .setText("institution_id", institution_id);
            return value;
        }
    };

    struct VerificationPayload {
        std::string certificate_hash;
        std::string verifier_address;

        inline CanonicalValue toCanonical() const {
            auto value = CanonicalValue::object();
            value.setText("certificate_hash", certificate_hash).setText("verifier_address", verifier_address);
            return value;
        }
    };

    /// Free-form key/value payload for operations without a dedicated shape
    struct AuditPayload {
        std::map<std::string, std::string> fields;

        inline CanonicalValue toCanonical() const {
            auto value = CanonicalValue::object();
            for (const auto &[key, field] : fields)
                value.setText(key, field);
            return value;
        }
    };

    using Payload = std::variant<InstitutionPayload, CertificatePayload, VerificationPayload, AuditPayload>;

    inline CanonicalValue payloadToCanonical(const Payload &payload) {
        return std::visit([](const auto &p) { return p.toCanonical(); }, payload);
    }

    /// What a caller supplies; the chain stamps the rest in Chain::prepare
    struct TransactionDraft {
        std::string from;
        std::string to;
        OperationKind operation{OperationKind::Transfer};
        Payload payload{AuditPayload{}};
        dp::u64 gas_limit{0};
        dp::u64 gas_price{0};
    };

    // ===========================================
    // Transaction
    // ===========================================

    class Transaction {
      public:
        std::string hash_{};
        std::string from_{};
        std::string to_{};
        OperationKind operation_{OperationKind::Transfer};
        Payload payload_{AuditPayload{}};
        dp::u64 gas_limit_{0};
        dp::u64 gas_used_{0};
        dp::u64 gas_price_{0};
        dp::i64 timestamp_{0};
        dp::u64 nonce_{0};
        std::optional<dp::u64> block_number_{};
        TransactionStatus status_{TransactionStatus::Pending};

        Transaction() = default;

        inline bool isPending() const { return status_ == TransactionStatus::Pending; }
        inline bool isConfirmed() const { return status_ == TransactionStatus::Confirmed; }

        /// Fee paid for this transaction
        inline dp::u64 fee() const { return gas::gasCost(gas_used_, gas_price_); }

        /// Seal into a block. Status and block number change together and only once.
        inline dp::Result<void, dp::Error> confirm(dp::u64 block_number) {
            if (isConfirmed()) {
                return dp::Result<void, dp::Error>::err(
                    already_confirmed(dp::String(("Transaction " + hash_ + " already confirmed in block " +
                                                  std::to_string(block_number_.value_or(0)))
                                                     .c_str())));
            }
            status_ = TransactionStatus::Confirmed;
            block_number_ = block_number;
            return dp::Result<void, dp::Error>::ok();
        }

        /// Fields the content hash covers. Hash, status and block number are excluded so the hash is stable.
        inline CanonicalValue contentToCanonical() const {
            auto value = CanonicalValue::object();
            value.setText("from", from_)
                .setText("to", to_)
                .setText("operation", operationKindToString(operation_))
                .set("payload", payloadToCanonical(payload_))
                .setInteger("gas_limit", static_cast<dp::i64>(gas_limit_))
                .setInteger("gas_used", static_cast<dp::i64>(gas_used_))
                .setInteger("gas_price", static_cast<dp::i64>(gas_price_))
                .setInteger("timestamp", timestamp_)
                .setInteger("nonce", static_cast<dp::i64>(nonce_));
            return value;
        }

        /// Full form, as sealed into a block
        inline CanonicalValue toCanonical() const {
            auto value = contentToCanonical();
            value.setText("hash", hash_).setText("status", transactionStatusToString(status_));
            if (block_number_)
                value.setInteger("block_number", static_cast<dp::i64>(*block_number_));
            else
                value.set("block_number", CanonicalValue());
            return value;
        }
    };

} // namespace certchain::ledger
