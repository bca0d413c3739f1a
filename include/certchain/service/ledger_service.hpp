#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "certchain/ledger/address.hpp"
#include "certchain/ledger/chain.hpp"
#include "certchain/ledger/clock.hpp"
#include "certchain/storage/document_store.hpp"
#include "records.hpp"

namespace certchain::service {

    inline constexpr const char *INSTITUTIONS = "institutions";
    inline constexpr const char *CERTIFICATES = "certificates";

    struct InstitutionReceipt {
        std::string institution_id;
        std::string wallet_address;
        std::string transaction_hash;
        dp::u64 block_number = 0;
        dp::u64 gas_used = 0;
    };

    struct CertificateRequest {
        std::string recipient_name;
        std::string course_name;
        std::string completion_date;
        std::optional<std::string> grade;
        std::string institution_id;
        std::string issuer_address; // institution wallet when empty
    };

    struct CertificateReceipt {
        std::string certificate_id;
        std::string certificate_hash;
        std::string transaction_hash;
        dp::u64 block_number = 0;
        dp::u64 gas_used = 0;
    };

    struct VerificationReceipt {
        CertificateRecord certificate;
        bool verified = false;
        std::string transaction_hash;
        dp::u64 block_number = 0;
    };

    struct TransferReceipt {
        std::string transaction_hash;
        dp::u64 block_number = 0;
        dp::u64 gas_used = 0;
        dp::u64 fee = 0;
    };

    struct WalletConnection {
        std::string address;
        std::string balance;
    };

    struct LedgerStats {
        size_t total_blocks = 0;
        size_t total_transactions = 0; // sealed and pending
        size_t pending_transactions = 0;
        size_t total_institutions = 0;
        size_t total_certificates = 0;
        dp::u64 total_gas_used = 0;
        dp::u64 current_gas_price = 0;
        std::string contract_address;
    };

    enum class LedgerEventKind { InstitutionRegistered, CertificateIssued, CertificateVerified };

    inline std::string ledgerEventKindToString(LedgerEventKind kind) {
        switch (kind) {
        case LedgerEventKind::InstitutionRegistered:
            return "InstitutionRegistered";
        case LedgerEventKind::CertificateIssued:
            return "CertificateIssued";
        case LedgerEventKind::CertificateVerified:
            return "CertificateVerified";
        default:
            return "Unknown";
        }
    }

    /// Raised once the operation's block is sealed and its records are stored
    struct LedgerEvent {
        LedgerEventKind kind = LedgerEventKind::InstitutionRegistered;
        std::string subject; // institution id or certificate hash
        std::string actor;   // institution wallet, issuer or verifier address
        std::string detail;  // institution name, or "recipient / course" for an issued certificate
        std::string transaction_hash;
        dp::u64 block_number = 0;
        dp::i64 timestamp = 0;
    };

    using LedgerListener = std::function<void(const LedgerEvent &)>;

    /// Entry point for the HTTP layer: institutions, certificates and chain queries.
    ///
    /// Every mutating call persists its record first and seals the chain second, so a store failure never
    /// leaves a block behind that has no durable record. Registry read-modify-write sequences (duplicate
    /// check, certificate counters) are serialized by the service; chain state is guarded by the Chain.
    class LedgerService {
      public:
        LedgerService(ledger::Chain &chain, storage::DocumentStore &store, ledger::AddressGenerator &addresses,
                      const ledger::Clock &clock);

        LedgerService(const LedgerService &) = delete;
        LedgerService &operator=(const LedgerService &) = delete;

        dp::Result<InstitutionReceipt, dp::Error> registerInstitution(const std::string &name,
                                                                      const std::string &contact_address,
                                                                      const std::string &email);

        /// Fails with ERR_INSTITUTION_NOT_FOUND for an unknown institution and ERR_DUPLICATE_CERTIFICATE when
        /// the same identity fields were already issued
        dp::Result<CertificateReceipt, dp::Error> issueCertificate(const CertificateRequest &request);

        /// Re-confirms an issued certificate and records the check on chain. The record itself is not modified.
        dp::Result<VerificationReceipt, dp::Error>
        verifyCertificate(const std::string &certificate_hash,
                          const std::optional<std::string> &verifier_address = std::nullopt);

        /// Generic value transfer with an audit payload
        dp::Result<TransferReceipt, dp::Error> recordTransfer(const std::string &from, const std::string &to,
                                                              const std::string &amount, const std::string &memo);

        /// Fresh simulated wallet
        dp::Result<WalletConnection, dp::Error> connectWallet();

        // ===========================================
        // Queries
        // ===========================================

        dp::Result<std::vector<InstitutionRecord>, dp::Error> listInstitutions();
        dp::Result<InstitutionRecord, dp::Error> getInstitution(const std::string &institution_id);
        dp::Result<std::vector<CertificateRecord>, dp::Error> listCertificates();
        dp::Result<CertificateRecord, dp::Error> getCertificate(const std::string &certificate_hash);

        dp::Result<ledger::Block, dp::Error> getBlock(dp::u64 number) const;
        std::vector<ledger::Block> listBlocks() const;
        std::vector<ledger::Transaction> listTransactions() const;
        dp::Result<ledger::Transaction, dp::Error> getTransaction(const std::string &hash) const;

        dp::Result<LedgerStats, dp::Error> stats();

        // ===========================================
        // Events
        // ===========================================

        /// Listeners run on the calling thread after the operation succeeds, in registration order
        void addListener(LedgerListener listener);
        void removeAllListeners();

        /// Identity hash of a certificate. Grade and issuer are not part of it.
        static dp::Result<std::string, dp::Error> certificateHash(const std::string &recipient_name,
                                                                  const std::string &course_name,
                                                                  const std::string &completion_date,
                                                                  const std::string &institution_id);

      private:
        template <typename Record>
        dp::Result<std::vector<Record>, dp::Error> loadAll(const char *collection);

        ledger::TransactionDraft draft(ledger::OperationKind operation, const std::string &from,
                                       ledger::Payload payload) const;

        void notify(const LedgerEvent &event);

        ledger::Chain &chain_;
        storage::DocumentStore &store_;
        ledger::AddressGenerator &addresses_;
        const ledger::Clock &clock_;
        std::mutex registry_mutex_;
        std::vector<LedgerListener> listeners_;
        std::mutex listeners_mutex_;
    };

} // namespace certchain::service
