#include <certchain/service/ledger_service.hpp>
#include <iostream>

namespace certchain::service {

    LedgerService::LedgerService(ledger::Chain &chain, storage::DocumentStore &store,
                                 ledger::AddressGenerator &addresses, const ledger::Clock &clock)
        : chain_(chain), store_(store), addresses_(addresses), clock_(clock) {}

    dp::Result<std::string, dp::Error> LedgerService::certificateHash(const std::string &recipient_name,
                                                                      const std::string &course_name,
                                                                      const std::string &completion_date,
                                                                      const std::string &institution_id) {
        auto identity = ledger::CanonicalValue::object();
        identity.setText("recipient_name", recipient_name)
            .setText("course_name", course_name)
            .setText("completion_date", completion_date)
            .setText("institution_id", institution_id);
        return ledger::Hasher::hash(identity);
    }

    ledger::TransactionDraft LedgerService::draft(ledger::OperationKind operation, const std::string &from,
                                                  ledger::Payload payload) const {
        const auto &config = chain_.config();
        ledger::TransactionDraft d;
        d.from = from;
        d.to = config.contract_address;
        d.operation = operation;
        d.payload = std::move(payload);
        d.gas_limit = config.default_gas_limit;
        d.gas_price = config.gas_price;
        return d;
    }

    // ===========================================
    // Institutions
    // ===========================================

    dp::Result<InstitutionReceipt, dp::Error> LedgerService::registerInstitution(const std::string &name,
                                                                                 const std::string &contact_address,
                                                                                 const std::string &email) {
        auto institution_id = addresses_.nextIdentifier();
        if (!institution_id.is_ok())
            return dp::Result<InstitutionReceipt, dp::Error>::err(institution_id.error());
        auto wallet = addresses_.nextAddress();
        if (!wallet.is_ok())
            return dp::Result<InstitutionReceipt, dp::Error>::err(wallet.error());

        ledger::InstitutionPayload payload{institution_id.value(), name, contact_address, email, wallet.value()};
        auto txn = chain_.prepare(draft(ledger::OperationKind::RegisterInstitution, wallet.value(), payload));
        if (!txn.is_ok())
            return dp::Result<InstitutionReceipt, dp::Error>::err(txn.error());

        InstitutionRecord record;
        record.id = dp::String(institution_id.value().c_str());
        record.name = dp::String(name.c_str());
        record.contact_address = dp::String(contact_address.c_str());
        record.email = dp::String(email.c_str());
        record.wallet_address = dp::String(wallet.value().c_str());
        record.verified = false;
        record.registered_at = clock_.now();
        record.transaction_hash = dp::String(txn.value().hash_.c_str());

        {
            std::lock_guard<std::mutex> lock(registry_mutex_);
            auto stored = store_.put(INSTITUTIONS, institution_id.value(), record.toBytes());
            if (!stored.is_ok())
                return dp::Result<InstitutionReceipt, dp::Error>::err(stored.error());
        }

        auto block = chain_.commit(txn.value());
        if (!block.is_ok()) {
            std::cout << "Institution " << institution_id.value() << " stored but not sealed: "
                      << errorMessage(block.error()) << std::endl;
            return dp::Result<InstitutionReceipt, dp::Error>::err(block.error());
        }

        std::cout << "Registered institution " << name << " (" << institution_id.value() << ") wallet "
                  << ledger::formatAddress(wallet.value()) << " in block #" << block.value().block_number_
                  << std::endl;

        LedgerEvent event;
        event.kind = LedgerEventKind::InstitutionRegistered;
        event.subject = institution_id.value();
        event.actor = wallet.value();
        event.detail = name;
        event.transaction_hash = txn.value().hash_;
        event.block_number = block.value().block_number_;
        event.timestamp = block.value().timestamp_;
        notify(event);

        InstitutionReceipt receipt;
        receipt.institution_id = institution_id.value();
        receipt.wallet_address = wallet.value();
        receipt.transaction_hash = txn.value().hash_;
        receipt.block_number = block.value().block_number_;
        receipt.gas_used = txn.value().gas_used_;
        return dp::Result<InstitutionReceipt, dp::Error>::ok(receipt);
    }

    dp::Result<std::vector<InstitutionRecord>, dp::Error> LedgerService::listInstitutions() {
        return loadAll<InstitutionRecord>(INSTITUTIONS);
    }

    dp::Result<InstitutionRecord, dp::Error> LedgerService::getInstitution(const std::string &institution_id) {
        auto body = store_.get(INSTITUTIONS, institution_id);
        if (!body.is_ok()) {
            if (body.error().code == ERR_DOCUMENT_NOT_FOUND) {
                return dp::Result<InstitutionRecord, dp::Error>::err(
                    institution_not_found(dp::String(("Institution " + institution_id + " not found").c_str())));
            }
            return dp::Result<InstitutionRecord, dp::Error>::err(body.error());
        }
        return InstitutionRecord::fromBytes(body.value());
    }

    // ===========================================
    // Certificates
    // ===========================================

    dp::Result<CertificateReceipt, dp::Error> LedgerService::issueCertificate(const CertificateRequest &request) {
        // Held across the duplicate check, the seal and the counter update
        std::lock_guard<std::mutex> lock(registry_mutex_);

        auto institution = getInstitution(request.institution_id);
        if (!institution.is_ok())
            return dp::Result<CertificateReceipt, dp::Error>::err(institution.error());

        auto hash = certificateHash(request.recipient_name, request.course_name, request.completion_date,
                                    request.institution_id);
        if (!hash.is_ok())
            return dp::Result<CertificateReceipt, dp::Error>::err(hash.error());

        auto exists = store_.contains(CERTIFICATES, hash.value());
        if (!exists.is_ok())
            return dp::Result<CertificateReceipt, dp::Error>::err(exists.error());
        if (exists.value()) {
            return dp::Result<CertificateReceipt, dp::Error>::err(
                duplicate_certificate(dp::String(("Certificate " + hash.value() + " already issued").c_str())));
        }

        auto certificate_id = addresses_.nextIdentifier();
        if (!certificate_id.is_ok())
            return dp::Result<CertificateReceipt, dp::Error>::err(certificate_id.error());

        std::string issuer =
            request.issuer_address.empty() ? institution.value().getWalletAddress() : request.issuer_address;

        ledger::CertificatePayload payload{hash.value(), request.recipient_name, request.course_name,
                                           request.completion_date, request.institution_id};
        auto txn = chain_.prepare(draft(ledger::OperationKind::IssueCertificate, issuer, payload));
        if (!txn.is_ok())
            return dp::Result<CertificateReceipt, dp::Error>::err(txn.error());

        CertificateRecord record;
        record.id = dp::String(certificate_id.value().c_str());
        record.certificate_hash = dp::String(hash.value().c_str());
        record.recipient_name = dp::String(request.recipient_name.c_str());
        record.course_name = dp::String(request.course_name.c_str());
        record.completion_date = dp::String(request.completion_date.c_str());
        if (request.grade) {
            record.grade = dp::String(request.grade->c_str());
            record.has_grade = true;
        }
        record.institution_id = dp::String(request.institution_id.c_str());
        record.institution_name = institution.value().name;
        record.issuer_address = dp::String(issuer.c_str());
        record.transaction_hash = dp::String(txn.value().hash_.c_str());
        record.issued_at = clock_.now();

        auto stored = store_.put(CERTIFICATES, hash.value(), record.toBytes());
        if (!stored.is_ok())
            return dp::Result<CertificateReceipt, dp::Error>::err(stored.error());

        auto block = chain_.commit(txn.value());
        if (!block.is_ok()) {
            // The record stays stored without a block; a re-issue of the same identity is refused as a duplicate
            std::cout << "Certificate " << hash.value() << " stored but not sealed: " << errorMessage(block.error())
                      << std::endl;
            return dp::Result<CertificateReceipt, dp::Error>::err(block.error());
        }

        record.setBlockNumber(block.value().block_number_);
        auto backfilled = store_.put(CERTIFICATES, hash.value(), record.toBytes());
        if (!backfilled.is_ok()) {
            std::cout << "Certificate " << hash.value() << " sealed in block #" << block.value().block_number_
                      << " but block number was not stored: " << errorMessage(backfilled.error()) << std::endl;
            return dp::Result<CertificateReceipt, dp::Error>::err(backfilled.error());
        }

        auto updated = institution.value();
        updated.certificates_issued++;
        auto counted = store_.put(INSTITUTIONS, request.institution_id, updated.toBytes());
        if (!counted.is_ok())
            return dp::Result<CertificateReceipt, dp::Error>::err(counted.error());

        LedgerEvent event;
        event.kind = LedgerEventKind::CertificateIssued;
        event.subject = hash.value();
        event.actor = issuer;
        event.detail = request.recipient_name + " / " + request.course_name;
        event.transaction_hash = txn.value().hash_;
        event.block_number = block.value().block_number_;
        event.timestamp = block.value().timestamp_;
        notify(event);

        CertificateReceipt receipt;
        receipt.certificate_id = certificate_id.value();
        receipt.certificate_hash = hash.value();
        receipt.transaction_hash = txn.value().hash_;
        receipt.block_number = block.value().block_number_;
        receipt.gas_used = txn.value().gas_used_;
        return dp::Result<CertificateReceipt, dp::Error>::ok(receipt);
    }

    dp::Result<VerificationReceipt, dp::Error>
    LedgerService::verifyCertificate(const std::string &certificate_hash,
                                     const std::optional<std::string> &verifier_address) {
        auto certificate = getCertificate(certificate_hash);
        if (!certificate.is_ok())
            return dp::Result<VerificationReceipt, dp::Error>::err(certificate.error());

        std::string verifier = verifier_address.value_or(chain_.config().system_address);
        ledger::VerificationPayload payload{certificate_hash, verifier};
        auto txn = chain_.prepare(draft(ledger::OperationKind::VerifyCertificate, verifier, payload));
        if (!txn.is_ok())
            return dp::Result<VerificationReceipt, dp::Error>::err(txn.error());

        auto block = chain_.commit(txn.value());
        if (!block.is_ok())
            return dp::Result<VerificationReceipt, dp::Error>::err(block.error());

        LedgerEvent event;
        event.kind = LedgerEventKind::CertificateVerified;
        event.subject = certificate_hash;
        event.actor = verifier;
        event.transaction_hash = txn.value().hash_;
        event.block_number = block.value().block_number_;
        event.timestamp = block.value().timestamp_;
        notify(event);

        VerificationReceipt receipt;
        receipt.certificate = certificate.value();
        receipt.verified = true;
        receipt.transaction_hash = txn.value().hash_;
        receipt.block_number = block.value().block_number_;
        return dp::Result<VerificationReceipt, dp::Error>::ok(receipt);
    }

    dp::Result<std::vector<CertificateRecord>, dp::Error> LedgerService::listCertificates() {
        return loadAll<CertificateRecord>(CERTIFICATES);
    }

    dp::Result<CertificateRecord, dp::Error> LedgerService::getCertificate(const std::string &certificate_hash) {
        auto body = store_.get(CERTIFICATES, certificate_hash);
        if (!body.is_ok()) {
            if (body.error().code == ERR_DOCUMENT_NOT_FOUND) {
                return dp::Result<CertificateRecord, dp::Error>::err(
                    certificate_not_found(dp::String(("Certificate " + certificate_hash + " not found").c_str())));
            }
            return dp::Result<CertificateRecord, dp::Error>::err(body.error());
        }
        return CertificateRecord::fromBytes(body.value());
    }

    // ===========================================
    // Transfers and wallets
    // ===========================================

    dp::Result<TransferReceipt, dp::Error> LedgerService::recordTransfer(const std::string &from,
                                                                         const std::string &to,
                                                                         const std::string &amount,
                                                                         const std::string &memo) {
        ledger::AuditPayload payload;
        payload.fields["amount"] = amount;
        payload.fields["memo"] = memo;

        auto d = draft(ledger::OperationKind::Transfer, from, payload);
        d.to = to;
        auto txn = chain_.prepare(d);
        if (!txn.is_ok())
            return dp::Result<TransferReceipt, dp::Error>::err(txn.error());

        auto block = chain_.commit(txn.value());
        if (!block.is_ok())
            return dp::Result<TransferReceipt, dp::Error>::err(block.error());

        TransferReceipt receipt;
        receipt.transaction_hash = txn.value().hash_;
        receipt.block_number = block.value().block_number_;
        receipt.gas_used = txn.value().gas_used_;
        receipt.fee = txn.value().fee();
        return dp::Result<TransferReceipt, dp::Error>::ok(receipt);
    }

    dp::Result<WalletConnection, dp::Error> LedgerService::connectWallet() {
        auto address = addresses_.nextAddress();
        if (!address.is_ok())
            return dp::Result<WalletConnection, dp::Error>::err(address.error());
        return dp::Result<WalletConnection, dp::Error>::ok(
            WalletConnection{address.value(), chain_.config().wallet_balance});
    }

    // ===========================================
    // Chain queries
    // ===========================================

    dp::Result<ledger::Block, dp::Error> LedgerService::getBlock(dp::u64 number) const {
        return chain_.blockByNumber(number);
    }

    std::vector<ledger::Block> LedgerService::listBlocks() const { return chain_.blocks(); }

    std::vector<ledger::Transaction> LedgerService::listTransactions() const { return chain_.allTransactions(); }

    dp::Result<ledger::Transaction, dp::Error> LedgerService::getTransaction(const std::string &hash) const {
        return chain_.transactionByHash(hash);
    }

    dp::Result<LedgerStats, dp::Error> LedgerService::stats() {
        auto institutions = store_.listAll(INSTITUTIONS);
        if (!institutions.is_ok())
            return dp::Result<LedgerStats, dp::Error>::err(institutions.error());
        auto certificates = store_.listAll(CERTIFICATES);
        if (!certificates.is_ok())
            return dp::Result<LedgerStats, dp::Error>::err(certificates.error());

        auto totals = chain_.totals();

        LedgerStats stats;
        stats.total_blocks = totals.blocks;
        stats.pending_transactions = totals.pending_transactions;
        stats.total_transactions = totals.confirmed_transactions + totals.pending_transactions;
        stats.total_institutions = institutions.value().size();
        stats.total_certificates = certificates.value().size();
        stats.total_gas_used = totals.gas_used;
        stats.current_gas_price = chain_.config().gas_price;
        stats.contract_address = chain_.config().contract_address;
        return dp::Result<LedgerStats, dp::Error>::ok(stats);
    }

    // ===========================================
    // Events
    // ===========================================

    void LedgerService::addListener(LedgerListener listener) {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners_.push_back(std::move(listener));
    }

    void LedgerService::removeAllListeners() {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners_.clear();
    }

    void LedgerService::notify(const LedgerEvent &event) {
        std::vector<LedgerListener> listeners;
        {
            std::lock_guard<std::mutex> lock(listeners_mutex_);
            listeners = listeners_;
        }
        for (const auto &listener : listeners) {
            if (listener)
                listener(event);
        }
    }

    template <typename Record>
    dp::Result<std::vector<Record>, dp::Error> LedgerService::loadAll(const char *collection) {
        auto bodies = store_.listAll(collection);
        if (!bodies.is_ok())
            return dp::Result<std::vector<Record>, dp::Error>::err(bodies.error());

        std::vector<Record> records;
        for (const auto &body : bodies.value()) {
            auto record = Record::fromBytes(body);
            if (!record.is_ok())
                return dp::Result<std::vector<Record>, dp::Error>::err(record.error());
            records.push_back(record.value());
        }
        return dp::Result<std::vector<Record>, dp::Error>::ok(records);
    }

} // namespace certchain::service
