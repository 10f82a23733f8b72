//===----------------------------------------------------------------------===//
//
// Part of the Prov project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the constructed value model.  The interesting parts are key
// identity (equality and hashing agree across the numeric kinds so that `1`,
// `1.0` and `true` address the same mapping entry) and the insertion-ordered
// mapping that keeps the first key object when a later duplicate overwrites
// the value.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Value, Mapping and Document implementations.

#include "yaml/Value.hpp"

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <functional>
#include <limits>
#include <stdexcept>

namespace prov::yaml
{
namespace
{
bool isNumeric(ValueKind kind)
{
    return kind == ValueKind::Bool || kind == ValueKind::Int || kind == ValueKind::Float;
}

/// @brief Numeric payload as a double, for mixed Int/Float comparison.
double numericAsDouble(const Value &v)
{
    switch (v.kind())
    {
        case ValueKind::Bool:
            return v.asBool() ? 1.0 : 0.0;
        case ValueKind::Int:
            return static_cast<double>(v.asInt());
        default:
            return v.asFloat();
    }
}

bool numericEqual(const Value &a, const Value &b)
{
    if (a.kind() != ValueKind::Float && b.kind() != ValueKind::Float)
    {
        auto asInt = [](const Value &v) { return v.kind() == ValueKind::Bool ? int64_t{v.asBool()} : v.asInt(); };
        return asInt(a) == asInt(b);
    }
    return numericAsDouble(a) == numericAsDouble(b);
}

std::size_t combine(std::size_t seed, std::size_t h)
{
    return seed ^ (h + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

std::string twoDigits(unsigned v)
{
    std::string s = std::to_string(v);
    return s.size() < 2 ? "0" + s : s;
}

std::string formatFloat(double d)
{
    if (std::isnan(d))
        return ".nan";
    if (std::isinf(d))
        return d < 0 ? "-.inf" : ".inf";
    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), d);
    std::string out(buf, res.ptr);
    if (out.find_first_of(".e") == std::string::npos)
        out += ".0";
    return out;
}
} // namespace

const char *valueKindName(ValueKind kind)
{
    switch (kind)
    {
        case ValueKind::Null:
            return "null";
        case ValueKind::Bool:
            return "bool";
        case ValueKind::Int:
            return "int";
        case ValueKind::Float:
            return "float";
        case ValueKind::String:
            return "str";
        case ValueKind::Binary:
            return "binary";
        case ValueKind::Timestamp:
            return "timestamp";
        case ValueKind::Sequence:
            return "sequence";
        case ValueKind::Mapping:
            return "mapping";
        case ValueKind::Set:
            return "set";
        case ValueKind::EncryptedString:
            return "encrypted string";
    }
    return "value";
}

std::string Timestamp::toString() const
{
    std::string out = std::to_string(year) + '-' + twoDigits(month) + '-' + twoDigits(day);
    if (!hasTime)
        return out;
    out += 'T' + twoDigits(hour) + ':' + twoDigits(minute) + ':' + twoDigits(second);
    if (microsecond != 0)
    {
        std::string frac = std::to_string(microsecond);
        out += '.' + std::string(6 - frac.size(), '0') + frac;
    }
    if (utcOffsetMinutes)
    {
        int offset = *utcOffsetMinutes;
        out += offset < 0 ? '-' : '+';
        offset = std::abs(offset);
        out += twoDigits(static_cast<unsigned>(offset / 60)) + ':' + twoDigits(static_cast<unsigned>(offset % 60));
    }
    return out;
}

//===----------------------------------------------------------------------===//
// Mapping
//===----------------------------------------------------------------------===//

std::optional<std::size_t> Mapping::indexOf(const Value &key) const
{
    auto [first, last] = byHash_.equal_range(hashValue(key));
    for (auto it = first; it != last; ++it)
    {
        if (*entries_[it->second].first == key)
            return it->second;
    }
    return std::nullopt;
}

/// @brief Insert or overwrite, preserving the first key and its position.
bool Mapping::insertOrAssign(Value *key, Value *value)
{
    if (auto idx = indexOf(*key))
    {
        entries_[*idx].second = value;
        return false;
    }
    byHash_.emplace(hashValue(*key), entries_.size());
    entries_.emplace_back(key, value);
    return true;
}

Value *Mapping::find(const Value &key) const
{
    auto idx = indexOf(key);
    return idx ? entries_[*idx].second : nullptr;
}

Value *Mapping::find(std::string_view key) const
{
    return find(Value::string(std::string(key)));
}

Value *Mapping::findKey(const Value &key) const
{
    auto idx = indexOf(key);
    return idx ? entries_[*idx].first : nullptr;
}

//===----------------------------------------------------------------------===//
// Value
//===----------------------------------------------------------------------===//

Value Value::null()
{
    return Value();
}

Value Value::boolean(bool b)
{
    return Value(ValueKind::Bool, b);
}

Value Value::integer(int64_t i)
{
    return Value(ValueKind::Int, i);
}

Value Value::real(double d)
{
    return Value(ValueKind::Float, d);
}

Value Value::string(std::string s)
{
    return Value(ValueKind::String, std::move(s));
}

Value Value::binary(Bytes bytes)
{
    return Value(ValueKind::Binary, std::move(bytes));
}

Value Value::timestamp(Timestamp ts)
{
    return Value(ValueKind::Timestamp, ts);
}

Value Value::sequence()
{
    return Value(ValueKind::Sequence, Sequence{});
}

Value Value::mapping()
{
    return Value(ValueKind::Mapping, Mapping{});
}

Value Value::set()
{
    return Value(ValueKind::Set, Mapping{});
}

Value Value::encrypted(EncryptedString secret)
{
    return Value(ValueKind::EncryptedString, std::move(secret));
}

bool Value::asBool() const
{
    return std::get<bool>(payload_);
}

int64_t Value::asInt() const
{
    return std::get<int64_t>(payload_);
}

double Value::asFloat() const
{
    return std::get<double>(payload_);
}

const std::string &Value::asString() const
{
    return std::get<std::string>(payload_);
}

const Bytes &Value::asBinary() const
{
    return std::get<Bytes>(payload_);
}

const Timestamp &Value::asTimestamp() const
{
    return std::get<Timestamp>(payload_);
}

const EncryptedString &Value::asEncrypted() const
{
    return std::get<EncryptedString>(payload_);
}

Sequence &Value::asSequence()
{
    return std::get<Sequence>(payload_);
}

const Sequence &Value::asSequence() const
{
    return std::get<Sequence>(payload_);
}

Mapping &Value::asMapping()
{
    return std::get<Mapping>(payload_);
}

const Mapping &Value::asMapping() const
{
    return std::get<Mapping>(payload_);
}

const Value &Value::at(std::string_view key) const
{
    const Value *found = asMapping().find(key);
    if (found == nullptr)
        throw std::out_of_range("no mapping key '" + std::string(key) + "'");
    return *found;
}

const Value &Value::at(std::size_t index) const
{
    const Sequence &items = asSequence();
    if (index >= items.size())
        throw std::out_of_range("sequence index " + std::to_string(index) + " out of range");
    return *items[index];
}

std::size_t Value::size() const
{
    switch (kind_)
    {
        case ValueKind::Sequence:
            return asSequence().size();
        case ValueKind::Mapping:
        case ValueKind::Set:
            return asMapping().size();
        default:
            return 0;
    }
}

bool Value::isHashable() const
{
    return kind_ != ValueKind::Sequence && kind_ != ValueKind::Mapping && kind_ != ValueKind::Set;
}

/// @brief Structural comparison.
/// @details Mappings and sets compare as unordered collections; sequences
///          element-wise.  Comparing self-referential graphs does not
///          terminate.
bool operator==(const Value &a, const Value &b)
{
    if (isNumeric(a.kind()) && isNumeric(b.kind()))
        return numericEqual(a, b);
    if (a.kind() != b.kind())
        return false;

    switch (a.kind())
    {
        case ValueKind::Null:
            return true;
        case ValueKind::String:
            return a.asString() == b.asString();
        case ValueKind::Binary:
            return a.asBinary() == b.asBinary();
        case ValueKind::Timestamp:
            return a.asTimestamp() == b.asTimestamp();
        case ValueKind::EncryptedString:
            return a.asEncrypted() == b.asEncrypted();
        case ValueKind::Sequence:
        {
            const Sequence &x = a.asSequence();
            const Sequence &y = b.asSequence();
            if (x.size() != y.size())
                return false;
            for (std::size_t i = 0; i < x.size(); ++i)
            {
                if (!(*x[i] == *y[i]))
                    return false;
            }
            return true;
        }
        case ValueKind::Mapping:
        case ValueKind::Set:
        {
            const Mapping &x = a.asMapping();
            const Mapping &y = b.asMapping();
            if (x.size() != y.size())
                return false;
            for (const auto &[key, value] : x)
            {
                const Value *other = y.find(*key);
                if (other == nullptr || !(*value == *other))
                    return false;
            }
            return true;
        }
        default:
            return false;
    }
}

std::size_t hashValue(const Value &value)
{
    switch (value.kind())
    {
        case ValueKind::Null:
            return 0x6e756c6cULL;
        case ValueKind::Bool:
            return std::hash<int64_t>{}(value.asBool() ? 1 : 0);
        case ValueKind::Int:
            return std::hash<int64_t>{}(value.asInt());
        case ValueKind::Float:
        {
            // Integral floats hash like the equal Int.
            double d = value.asFloat();
            double whole = 0.0;
            if (std::modf(d, &whole) == 0.0 && whole >= -9.2e18 && whole <= 9.2e18)
                return std::hash<int64_t>{}(static_cast<int64_t>(whole));
            return std::hash<double>{}(d);
        }
        case ValueKind::String:
            return std::hash<std::string_view>{}(value.asString());
        case ValueKind::Binary:
        {
            const Bytes &bytes = value.asBinary();
            return combine(0xb1ULL,
                           std::hash<std::string_view>{}(
                               std::string_view(reinterpret_cast<const char *>(bytes.data()), bytes.size())));
        }
        case ValueKind::Timestamp:
            return combine(0x7157ULL, std::hash<std::string>{}(value.asTimestamp().toString()));
        case ValueKind::EncryptedString:
            return combine(0xe5ULL, std::hash<std::string_view>{}(value.asEncrypted().ciphertext));
        default:
            throw std::invalid_argument(std::string("unhashable value of kind ") + valueKindName(value.kind()));
    }
}

std::string repr(const Value &value)
{
    switch (value.kind())
    {
        case ValueKind::Null:
            return "null";
        case ValueKind::Bool:
            return value.asBool() ? "true" : "false";
        case ValueKind::Int:
            return std::to_string(value.asInt());
        case ValueKind::Float:
            return formatFloat(value.asFloat());
        case ValueKind::String:
        {
            std::string out = "'";
            for (char c : value.asString())
            {
                if (c == '\'' || c == '\\')
                    out += '\\';
                out += c;
            }
            return out + "'";
        }
        case ValueKind::Binary:
            return "<binary, " + std::to_string(value.asBinary().size()) + " bytes>";
        case ValueKind::Timestamp:
            return value.asTimestamp().toString();
        case ValueKind::EncryptedString:
            return "<encrypted>";
        case ValueKind::Sequence:
        {
            std::string out = "[";
            for (const Value *item : value.asSequence())
            {
                if (out.size() > 1)
                    out += ", ";
                out += repr(*item);
            }
            return out + "]";
        }
        case ValueKind::Mapping:
        case ValueKind::Set:
        {
            std::string out = "{";
            for (const auto &[key, item] : value.asMapping())
            {
                if (out.size() > 1)
                    out += ", ";
                out += repr(*key);
                if (value.kind() == ValueKind::Mapping)
                    out += ": " + repr(*item);
            }
            return out + "}";
        }
    }
    return "?";
}

bool canCarry(const Value &value, const support::Tag &tag)
{
    if (std::holds_alternative<support::TrustedAsTemplate>(tag))
        return value.kind() == ValueKind::String || value.kind() == ValueKind::EncryptedString;
    return true;
}

bool operator==(const Document &a, const Document &b)
{
    if (a.root() == nullptr || b.root() == nullptr)
        return a.root() == b.root();
    return *a.root() == *b.root();
}

} // namespace prov::yaml
