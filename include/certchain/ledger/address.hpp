#pragma once

#include <datapod/datapod.hpp>
#include <deque>
#include <iomanip>
#include <keylock/keylock.hpp>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

#include "certchain/common/error.hpp"

namespace certchain::ledger {

    /// Source of wallet addresses and record identifiers.
    /// Values only need to be unique; nothing about them is security sensitive.
    class AddressGenerator {
      public:
        virtual ~AddressGenerator() = default;

        /// Wallet address, "0x" + 40 hex digits
        virtual dp::Result<std::string, dp::Error> nextAddress() = 0;

        /// Record identifier in 8-4-4-4-12 hex form
        virtual dp::Result<std::string, dp::Error> nextIdentifier() = 0;
    };

    /// Derives addresses from fresh Ed25519 keypairs: the last 20 bytes of SHA-256(public key)
    class KeyAddressGenerator : public AddressGenerator {
      public:
        inline dp::Result<std::string, dp::Error> nextAddress() override {
            auto digest = freshDigest();
            if (!digest.is_ok())
                return dp::Result<std::string, dp::Error>::err(digest.error());
            const auto &bytes = digest.value();
            std::vector<dp::u8> tail(bytes.end() - 20, bytes.end());
            return dp::Result<std::string, dp::Error>::ok("0x" + keylock::keylock::to_hex(tail));
        }

        inline dp::Result<std::string, dp::Error> nextIdentifier() override {
            auto digest = freshDigest();
            if (!digest.is_ok())
                return dp::Result<std::string, dp::Error>::err(digest.error());
            const auto &bytes = digest.value();
            std::vector<dp::u8> head(bytes.begin(), bytes.begin() + 16);
            std::string hex = keylock::keylock::to_hex(head);
            return dp::Result<std::string, dp::Error>::ok(hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" +
                                                          hex.substr(12, 4) + "-" + hex.substr(16, 4) + "-" +
                                                          hex.substr(20, 12));
        }

      private:
        inline dp::Result<std::vector<dp::u8>, dp::Error> freshDigest() const {
            keylock::keylock signer(keylock::Algorithm::Ed25519);
            auto keypair = signer.generate_keypair();
            if (keypair.public_key.empty()) {
                return dp::Result<std::vector<dp::u8>, dp::Error>::err(
                    dp::Error::io_error("Failed to generate keypair"));
            }

            keylock::keylock crypto(keylock::Algorithm::XChaCha20_Poly1305, keylock::HashAlgorithm::SHA256);
            auto hash_result = crypto.hash(keypair.public_key);
            if (!hash_result.success || hash_result.data.size() < 20)
                return dp::Result<std::vector<dp::u8>, dp::Error>::err(hash_failed("Failed to hash public key"));
            return dp::Result<std::vector<dp::u8>, dp::Error>::ok(hash_result.data);
        }
    };

    /// Hands out queued values first, then a numbered sequence. Used where outputs must be predictable.
    class SequenceAddressGenerator : public AddressGenerator {
      public:
        SequenceAddressGenerator() = default;
        inline explicit SequenceAddressGenerator(std::vector<std::string> addresses,
                                                 std::vector<std::string> identifiers = {})
            : addresses_(addresses.begin(), addresses.end()), identifiers_(identifiers.begin(), identifiers.end()) {}

        inline dp::Result<std::string, dp::Error> nextAddress() override {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!addresses_.empty()) {
                auto next = addresses_.front();
                addresses_.pop_front();
                return dp::Result<std::string, dp::Error>::ok(next);
            }
            std::ostringstream oss;
            oss << "0x" << std::hex << std::setw(40) << std::setfill('0') << ++address_counter_;
            return dp::Result<std::string, dp::Error>::ok(oss.str());
        }

        inline dp::Result<std::string, dp::Error> nextIdentifier() override {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!identifiers_.empty()) {
                auto next = identifiers_.front();
                identifiers_.pop_front();
                return dp::Result<std::string, dp::Error>::ok(next);
            }
            std::ostringstream oss;
            oss << "00000000-0000-0000-0000-" << std::hex << std::setw(12) << std::setfill('0') << ++identifier_counter_;
            return dp::Result<std::string, dp::Error>::ok(oss.str());
        }

      private:
        std::mutex mutex_;
        std::deque<std::string> addresses_;
        std::deque<std::string> identifiers_;
        dp::u64 address_counter_{0};
        dp::u64 identifier_counter_{0};
    };

    /// Shortened form for display, e.g. "0x742d...96F4"
    inline std::string formatAddress(const std::string &address) {
        if (address.size() <= 10)
            return address;
        return address.substr(0, 6) + "..." + address.substr(address.size() - 4);
    }

} // namespace certchain::ledger
