#include <algorithm>
#include <certchain/ledger/canonical.hpp>
#include <cstdio>
#include <numeric>
#include <stdexcept>

namespace certchain::ledger {

    CanonicalValue CanonicalValue::text(const std::string &value) {
        CanonicalValue result;
        result.kind_ = Kind::Text;
        result.text_ = value;
        return result;
    }

    CanonicalValue CanonicalValue::integer(dp::i64 value) {
        CanonicalValue result;
        result.kind_ = Kind::Integer;
        result.integer_ = value;
        return result;
    }

    CanonicalValue CanonicalValue::boolean(bool value) {
        CanonicalValue result;
        result.kind_ = Kind::Boolean;
        result.boolean_ = value;
        return result;
    }

    CanonicalValue CanonicalValue::list() {
        CanonicalValue result;
        result.kind_ = Kind::List;
        return result;
    }

    CanonicalValue CanonicalValue::object() {
        CanonicalValue result;
        result.kind_ = Kind::Object;
        return result;
    }

    CanonicalValue &CanonicalValue::set(const std::string &key, CanonicalValue value) {
        if (kind_ == Kind::Null)
            kind_ = Kind::Object;
        if (kind_ != Kind::Object)
            throw std::logic_error("CanonicalValue::set on a non-object value");

        // keys_[i] names items_[i]
        auto it = std::find(keys_.begin(), keys_.end(), key);
        if (it != keys_.end()) {
            items_[static_cast<size_t>(it - keys_.begin())] = std::move(value);
            return *this;
        }
        keys_.push_back(key);
        items_.push_back(std::move(value));
        return *this;
    }

    CanonicalValue &CanonicalValue::setText(const std::string &key, const std::string &value) {
        return set(key, text(value));
    }

    CanonicalValue &CanonicalValue::setInteger(const std::string &key, dp::i64 value) {
        return set(key, integer(value));
    }

    CanonicalValue &CanonicalValue::push(CanonicalValue value) {
        if (kind_ == Kind::Null)
            kind_ = Kind::List;
        if (kind_ != Kind::List)
            throw std::logic_error("CanonicalValue::push on a non-list value");
        items_.push_back(std::move(value));
        return *this;
    }

    bool CanonicalValue::has(const std::string &key) const {
        return kind_ == Kind::Object && std::find(keys_.begin(), keys_.end(), key) != keys_.end();
    }

    std::string CanonicalValue::serialize() const {
        std::string out;
        serializeInto(out);
        return out;
    }

    void CanonicalValue::serializeInto(std::string &out) const {
        switch (kind_) {
        case Kind::Null:
            out += "null";
            break;
        case Kind::Text:
            out += '"';
            out += escape(text_);
            out += '"';
            break;
        case Kind::Integer:
            out += std::to_string(integer_);
            break;
        case Kind::Boolean:
            out += boolean_ ? "true" : "false";
            break;
        case Kind::List:
            out += '[';
            for (size_t i = 0; i < items_.size(); ++i) {
                if (i > 0)
                    out += ',';
                items_[i].serializeInto(out);
            }
            out += ']';
            break;
        case Kind::Object: {
            std::vector<size_t> order(keys_.size());
            std::iota(order.begin(), order.end(), 0);
            std::sort(order.begin(), order.end(), [this](size_t a, size_t b) { return keys_[a] < keys_[b]; });
            out += '{';
            for (size_t i = 0; i < order.size(); ++i) {
                if (i > 0)
                    out += ',';
                out += '"';
                out += escape(keys_[order[i]]);
                out += "\":";
                items_[order[i]].serializeInto(out);
            }
            out += '}';
            break;
        }
        }
    }

    std::string CanonicalValue::escape(const std::string &str) {
        std::string result;
        result.reserve(str.size());
        for (char c : str) {
            switch (c) {
            case '"':
                result += "\\\"";
                break;
            case '\\':
                result += "\\\\";
                break;
            case '\n':
                result += "\\n";
                break;
            case '\r':
                result += "\\r";
                break;
            case '\t':
                result += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    result += buf;
                } else {
                    result += c;
                }
                break;
            }
        }
        return result;
    }

} // namespace certchain::ledger
