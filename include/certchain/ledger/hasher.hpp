#pragma once

#include <datapod/datapod.hpp>
#include <cctype>
#include <keylock/keylock.hpp>
#include <string>
#include <vector>

#include "canonical.hpp"
#include "certchain/common/error.hpp"

namespace certchain::ledger {

    /// Content hashing for certificates, transactions and blocks.
    /// The digest is fixed to SHA-256: certificate hashes handed out by one process must verify in the next.
    class Hasher {
      public:
        static constexpr const char *ALGORITHM = "SHA-256";
        static constexpr size_t HEX_LENGTH = 66; // "0x" + 64 hex digits

        /// Hash the canonical serialization of a structured value
        static inline dp::Result<std::string, dp::Error> hash(const CanonicalValue &value) {
            return hashText(value.serialize());
        }

        /// Hash raw text
        static inline dp::Result<std::string, dp::Error> hashText(const std::string &text) {
            keylock::keylock crypto(keylock::Algorithm::XChaCha20_Poly1305, keylock::HashAlgorithm::SHA256);
            std::vector<dp::u8> data(text.begin(), text.end());
            auto hash_result = crypto.hash(data);
            if (!hash_result.success)
                return dp::Result<std::string, dp::Error>::err(hash_failed(dp::String(hash_result.error_message.c_str())));
            return dp::Result<std::string, dp::Error>::ok("0x" + keylock::keylock::to_hex(hash_result.data));
        }

        static inline bool looksLikeHash(const std::string &value) {
            if (value.size() != HEX_LENGTH || value.compare(0, 2, "0x") != 0)
                return false;
            for (size_t i = 2; i < value.size(); ++i) {
                if (!std::isxdigit(static_cast<unsigned char>(value[i])))
                    return false;
            }
            return true;
        }
    };

} // namespace certchain::ledger
