#include "certchain.hpp"
#include <iostream>
#include <string>

using namespace certchain;

void printSeparator(const std::string &title) {
    std::cout << "\n" << std::string(60, '=') << std::endl;
    std::cout << "  " << title << std::endl;
    std::cout << std::string(60, '=') << std::endl;
}

int main(int argc, char **argv) {
    std::string store_path = argc > 1 ? argv[1] : "certchain_data";

    printSeparator("Opening document store");
    storage::FileStore store;
    auto opened = store.open(dp::String(store_path.c_str()));
    if (!opened.is_ok()) {
        std::cout << "Failed to open store at " << store_path << ": " << errorMessage(opened.error()) << std::endl;
        return 1;
    }
    std::cout << "Store: " << store_path << std::endl;

    ledger::SystemClock clock;
    ledger::KeyAddressGenerator addresses;
    ledger::Chain chain(clock);
    service::LedgerService registry(chain, store, addresses, clock);
    registry.addListener([](const service::LedgerEvent &event) {
        std::cout << "  [event] " << service::ledgerEventKindToString(event.kind) << " " << event.subject
                  << " in block #" << event.block_number << std::endl;
    });

    printSeparator("Connecting wallet");
    auto wallet = registry.connectWallet();
    if (!wallet.is_ok()) {
        std::cout << "Wallet connection failed: " << errorMessage(wallet.error()) << std::endl;
        return 1;
    }
    std::cout << "Connected " << ledger::formatAddress(wallet.value().address) << " balance "
              << wallet.value().balance << " ETH" << std::endl;

    printSeparator("Registering institution");
    auto institution = registry.registerInstitution("Acme University", "1 Campus Way", "registrar@acme.edu");
    if (!institution.is_ok()) {
        std::cout << "Registration failed: " << errorMessage(institution.error()) << std::endl;
        return 1;
    }
    std::cout << "Institution ID: " << institution.value().institution_id << std::endl;
    std::cout << "Gas used: " << institution.value().gas_used << std::endl;

    printSeparator("Issuing certificate");
    service::CertificateRequest request;
    request.recipient_name = "Ada Lovelace";
    request.course_name = "Systems 101";
    request.completion_date = "2024-01-01";
    request.grade = "A";
    request.institution_id = institution.value().institution_id;
    request.issuer_address = institution.value().wallet_address;

    auto certificate = registry.issueCertificate(request);
    if (!certificate.is_ok()) {
        std::cout << "Issuance failed: " << errorMessage(certificate.error()) << std::endl;
        return 1;
    }
    std::cout << "Certificate hash: " << certificate.value().certificate_hash << std::endl;
    std::cout << "Sealed in block #" << certificate.value().block_number << std::endl;

    auto duplicate = registry.issueCertificate(request);
    if (!duplicate.is_ok())
        std::cout << "Re-issue rejected: " << errorMessage(duplicate.error()) << std::endl;

    printSeparator("Verifying certificate");
    auto verified = registry.verifyCertificate(certificate.value().certificate_hash);
    if (!verified.is_ok()) {
        std::cout << "Verification failed: " << errorMessage(verified.error()) << std::endl;
        return 1;
    }
    std::cout << "Verified " << verified.value().certificate.getRecipientName() << " in block #"
              << verified.value().block_number << std::endl;

    auto unknown = registry.verifyCertificate("0xdeadbeef");
    if (!unknown.is_ok() && isNotFound(unknown.error()))
        std::cout << "Unknown certificate: " << errorMessage(unknown.error()) << std::endl;

    printSeparator("Ledger statistics");
    auto stats = registry.stats();
    if (stats.is_ok()) {
        std::cout << "Blocks: " << stats.value().total_blocks << std::endl;
        std::cout << "Transactions: " << stats.value().total_transactions << std::endl;
        std::cout << "Institutions: " << stats.value().total_institutions << std::endl;
        std::cout << "Certificates: " << stats.value().total_certificates << std::endl;
        std::cout << "Gas price: " << stats.value().current_gas_price << " gwei" << std::endl;
    }

    for (const auto &txn : registry.listTransactions()) {
        std::cout << "  " << txn.hash_.substr(0, 18) << "... " << ledger::operationKindToString(txn.operation_)
                  << " gas=" << txn.gas_used_ << " fee=" << txn.fee() << " block #" << txn.block_number_.value_or(0)
                  << std::endl;
    }

    std::cout << std::endl;
    chain.printChainSummary();

    auto valid = chain.isValid();
    std::cout << "Chain valid: " << (valid.is_ok() && valid.value() ? "yes" : "no") << std::endl;
    return 0;
}
