#pragma once

#include <datapod/datapod.hpp>
#include <string>

namespace certchain {

    // ===========================================
    // certchain error codes (100+)
    // ===========================================

    constexpr dp::u32 ERR_INSTITUTION_NOT_FOUND = 100;
    constexpr dp::u32 ERR_CERTIFICATE_NOT_FOUND = 101;
    constexpr dp::u32 ERR_BLOCK_NOT_FOUND = 102;
    constexpr dp::u32 ERR_TRANSACTION_NOT_FOUND = 103;
    constexpr dp::u32 ERR_DOCUMENT_NOT_FOUND = 104;
    constexpr dp::u32 ERR_DUPLICATE_CERTIFICATE = 105;
    constexpr dp::u32 ERR_HASH_FAILED = 106;
    constexpr dp::u32 ERR_STORE_FAILED = 107;
    constexpr dp::u32 ERR_ALREADY_CONFIRMED = 108;
    constexpr dp::u32 ERR_CORRUPT_RECORD = 109;
    constexpr dp::u32 ERR_DUPLICATE_TRANSACTION = 110;

    // ===========================================
    // Error factory functions
    // ===========================================

    inline dp::Error institution_not_found(const dp::String &msg = "Institution not found") {
        return dp::Error{ERR_INSTITUTION_NOT_FOUND, msg};
    }

    inline dp::Error certificate_not_found(const dp::String &msg = "Certificate not found") {
        return dp::Error{ERR_CERTIFICATE_NOT_FOUND, msg};
    }

    inline dp::Error block_not_found(const dp::String &msg = "Block not found") {
        return dp::Error{ERR_BLOCK_NOT_FOUND, msg};
    }

    inline dp::Error transaction_not_found(const dp::String &msg = "Transaction not found") {
        return dp::Error{ERR_TRANSACTION_NOT_FOUND, msg};
    }

    inline dp::Error document_not_found(const dp::String &msg = "Document not found") {
        return dp::Error{ERR_DOCUMENT_NOT_FOUND, msg};
    }

    inline dp::Error duplicate_certificate(const dp::String &msg = "Certificate already issued") {
        return dp::Error{ERR_DUPLICATE_CERTIFICATE, msg};
    }

    inline dp::Error hash_failed(const dp::String &msg = "Hash computation failed") {
        return dp::Error{ERR_HASH_FAILED, msg};
    }

    inline dp::Error store_failed(const dp::String &msg = "Document store operation failed") {
        return dp::Error{ERR_STORE_FAILED, msg};
    }

    inline dp::Error already_confirmed(const dp::String &msg = "Transaction already confirmed") {
        return dp::Error{ERR_ALREADY_CONFIRMED, msg};
    }

    inline dp::Error corrupt_record(const dp::String &msg = "Stored record could not be decoded") {
        return dp::Error{ERR_CORRUPT_RECORD, msg};
    }

    inline dp::Error duplicate_transaction(const dp::String &msg = "Transaction already pending or sealed") {
        return dp::Error{ERR_DUPLICATE_TRANSACTION, msg};
    }

    /// True for every lookup miss the core reports (institution, certificate, block, transaction, document)
    inline bool isNotFound(const dp::Error &error) {
        return error.code >= ERR_INSTITUTION_NOT_FOUND && error.code <= ERR_DOCUMENT_NOT_FOUND;
    }

    inline std::string errorMessage(const dp::Error &error) { return std::string(error.message.c_str()); }

} // namespace certchain
