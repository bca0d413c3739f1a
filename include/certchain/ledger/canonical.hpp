#pragma once

#include <datapod/datapod.hpp>
#include <string>
#include <vector>

namespace certchain::ledger {

    /// Structured value with a canonical text form.
    /// Object keys are emitted in lexicographic order at every nesting level, so two values that differ
    /// only in insertion order serialize (and therefore hash) identically.
    class CanonicalValue {
      public:
        enum class Kind : dp::u8 { Null = 0, Text = 1, Integer = 2, Boolean = 3, List = 4, Object = 5 };

        CanonicalValue() = default;

        static CanonicalValue text(const std::string &value);
        static CanonicalValue integer(dp::i64 value);
        static CanonicalValue boolean(bool value);
        static CanonicalValue list();
        static CanonicalValue object();

        /// Set an object member, replacing any previous value under the same key
        CanonicalValue &set(const std::string &key, CanonicalValue value);
        CanonicalValue &setText(const std::string &key, const std::string &value);
        CanonicalValue &setInteger(const std::string &key, dp::i64 value);

        /// Append a list element
        CanonicalValue &push(CanonicalValue value);

        inline Kind kind() const { return kind_; }
        inline bool isNull() const { return kind_ == Kind::Null; }
        inline size_t size() const { return kind_ == Kind::Object ? keys_.size() : items_.size(); }
        bool has(const std::string &key) const;

        /// Compact JSON with sorted object keys
        std::string serialize() const;

        static std::string escape(const std::string &str);

      private:
        Kind kind_{Kind::Null};
        std::string text_{};
        dp::i64 integer_{0};
        bool boolean_{false};
        std::vector<CanonicalValue> items_{};
        std::vector<std::string> keys_{};

        void serializeInto(std::string &out) const;
    };

} // namespace certchain::ledger
