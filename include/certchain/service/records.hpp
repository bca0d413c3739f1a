#pragma once

#include <datapod/datapod.hpp>
#include <optional>
#include <string>
#include <tuple>

#include "certchain/common/error.hpp"

namespace certchain::service {

    /// Stored form of a registered institution, keyed by id in the "institutions" collection
    struct InstitutionRecord {
        dp::String id;
        dp::String name;
        dp::String contact_address;
        dp::String email;
        dp::String wallet_address;
        bool verified = false; // reserved, no operation sets it
        dp::i64 registered_at = 0;
        dp::String transaction_hash;
        dp::u64 certificates_issued = 0;

        inline std::string getId() const { return std::string(id.c_str()); }
        inline std::string getName() const { return std::string(name.c_str()); }
        inline std::string getWalletAddress() const { return std::string(wallet_address.c_str()); }
        inline std::string getTransactionHash() const { return std::string(transaction_hash.c_str()); }

        inline dp::ByteBuf toBytes() const {
            auto &self = const_cast<InstitutionRecord &>(*this);
            return dp::serialize<dp::Mode::WITH_VERSION>(self);
        }

        inline static dp::Result<InstitutionRecord, dp::Error> fromBytes(const dp::ByteBuf &data) {
            try {
                auto result = dp::deserialize<dp::Mode::WITH_VERSION, InstitutionRecord>(data);
                return dp::Result<InstitutionRecord, dp::Error>::ok(std::move(result));
            } catch (const std::exception &e) {
                return dp::Result<InstitutionRecord, dp::Error>::err(corrupt_record(dp::String(e.what())));
            }
        }

        auto members() {
            return std::tie(id, name, contact_address, email, wallet_address, verified, registered_at,
                            transaction_hash, certificates_issued);
        }
        auto members() const {
            return std::tie(id, name, contact_address, email, wallet_address, verified, registered_at,
                            transaction_hash, certificates_issued);
        }
    };

    /// Stored form of an issued certificate, keyed by certificate hash in the "certificates" collection.
    /// Immutable once issued apart from the block number back-fill.
    struct CertificateRecord {
        dp::String id;
        dp::String certificate_hash;
        dp::String recipient_name;
        dp::String course_name;
        dp::String completion_date;
        dp::String grade;
        bool has_grade = false;
        dp::String institution_id;
        dp::String institution_name;
        dp::String issuer_address;
        dp::String transaction_hash;
        bool has_block_number = false;
        dp::u64 block_number = 0;
        dp::i64 issued_at = 0;

        inline std::string getId() const { return std::string(id.c_str()); }
        inline std::string getCertificateHash() const { return std::string(certificate_hash.c_str()); }
        inline std::string getRecipientName() const { return std::string(recipient_name.c_str()); }
        inline std::string getInstitutionId() const { return std::string(institution_id.c_str()); }
        inline std::string getTransactionHash() const { return std::string(transaction_hash.c_str()); }

        inline std::optional<std::string> getGrade() const {
            if (!has_grade)
                return std::nullopt;
            return std::string(grade.c_str());
        }

        inline std::optional<dp::u64> getBlockNumber() const {
            if (!has_block_number)
                return std::nullopt;
            return block_number;
        }

        inline void setBlockNumber(dp::u64 number) {
            has_block_number = true;
            block_number = number;
        }

        inline dp::ByteBuf toBytes() const {
            auto &self = const_cast<CertificateRecord &>(*this);
            return dp::serialize<dp::Mode::WITH_VERSION>(self);
        }

        inline static dp::Result<CertificateRecord, dp::Error> fromBytes(const dp::ByteBuf &data) {
            try {
                auto result = dp::deserialize<dp::Mode::WITH_VERSION, CertificateRecord>(data);
                return dp::Result<CertificateRecord, dp::Error>::ok(std::move(result));
            } catch (const std::exception &e) {
                return dp::Result<CertificateRecord, dp::Error>::err(corrupt_record(dp::String(e.what())));
            }
        }

        auto members() {
            return std::tie(id, certificate_hash, recipient_name, course_name, completion_date, grade, has_grade,
                            institution_id, institution_name, issuer_address, transaction_hash, has_block_number,
                            block_number, issued_at);
        }
        auto members() const {
            return std::tie(id, certificate_hash, recipient_name, course_name, completion_date, grade, has_grade,
                            institution_id, institution_name, issuer_address, transaction_hash, has_block_number,
                            block_number, issued_at);
        }
    };

} // namespace certchain::service
