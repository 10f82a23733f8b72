//===----------------------------------------------------------------------===//
//
// Part of the Prov project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Value.hpp
/// @brief Constructed data model: tagged values, ordered mappings, documents.
///
/// @details A Value is one of the YAML data kinds plus a TagSet carrying its
/// Origin and, for strings, TrustedAsTemplate.  Containers refer to their
/// children through non-owning pointers; all values of a load live in the
/// Document's arena, which also makes aliases (shared and recursive
/// references) representable.
///
/// Equality is structural and ignores tags.  Numbers compare across Bool, Int
/// and Float the way YAML loaders conventionally do (`1 == 1.0 == true`), which
/// also governs mapping key identity.
///
/// Ownership/Lifetime: Document owns every Value reachable from its root.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "support/arena.hpp"
#include "support/origin.hpp"
#include "support/tags.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace prov::yaml
{

enum class ValueKind
{
    Null,
    Bool,
    Int,
    Float,
    String,
    Binary,
    Timestamp,
    Sequence,
    Mapping,
    Set,
    EncryptedString
};

const char *valueKindName(ValueKind kind);

using Bytes = std::vector<std::uint8_t>;

/// @brief Calendar date with optional time of day and UTC offset.
struct Timestamp
{
    int year{1970};
    unsigned month{1};
    unsigned day{1};
    bool hasTime{false};
    unsigned hour{0};
    unsigned minute{0};
    unsigned second{0};
    unsigned microsecond{0};
    std::optional<int> utcOffsetMinutes; ///< Empty for naive timestamps

    bool operator==(const Timestamp &) const = default;

    /// @brief ISO 8601 rendering (`2001-12-14` or `2001-12-14T21:59:43.1-05:00`).
    [[nodiscard]] std::string toString() const;
};

/// @brief Opaque ciphertext produced by the `!vault` tags.
struct EncryptedString
{
    std::string ciphertext;

    bool operator==(const EncryptedString &) const = default;
};

class Value;

using Sequence = std::vector<Value *>;

/// @brief Insertion-ordered mapping keyed by Value equality.
/// @invariant Keys are unique under Value equality; re-inserting an equal key
///            replaces the value but keeps the first key object and position.
class Mapping
{
  public:
    using Entry = std::pair<Value *, Value *>;
    using const_iterator = std::vector<Entry>::const_iterator;

    /// @brief Insert @p key or replace the value stored under an equal key.
    /// @return True when a new entry was created.
    bool insertOrAssign(Value *key, Value *value);

    [[nodiscard]] Value *find(const Value &key) const;
    [[nodiscard]] Value *find(std::string_view key) const;

    /// @brief Stored key object equal to @p key, or nullptr.
    [[nodiscard]] Value *findKey(const Value &key) const;

    [[nodiscard]] bool contains(const Value &key) const
    {
        return find(key) != nullptr;
    }

    [[nodiscard]] std::size_t size() const
    {
        return entries_.size();
    }

    [[nodiscard]] bool empty() const
    {
        return entries_.empty();
    }

    const_iterator begin() const
    {
        return entries_.begin();
    }

    const_iterator end() const
    {
        return entries_.end();
    }

  private:
    std::optional<std::size_t> indexOf(const Value &key) const;

    std::vector<Entry> entries_;
    std::unordered_multimap<std::size_t, std::size_t> byHash_;
};

/// @brief One constructed datum plus its tags.
class Value
{
  public:
    /// @brief Null value without tags.
    Value() = default;

    static Value null();
    static Value boolean(bool b);
    static Value integer(int64_t i);
    static Value real(double d);
    static Value string(std::string s);
    static Value binary(Bytes bytes);
    static Value timestamp(Timestamp ts);
    static Value sequence();
    static Value mapping();
    static Value set();
    static Value encrypted(EncryptedString secret);

    [[nodiscard]] ValueKind kind() const
    {
        return kind_;
    }

    [[nodiscard]] bool isNull() const
    {
        return kind_ == ValueKind::Null;
    }

    [[nodiscard]] bool isString() const
    {
        return kind_ == ValueKind::String;
    }

    // Typed accessors; calling one for the wrong kind throws std::bad_variant_access.
    [[nodiscard]] bool asBool() const;
    [[nodiscard]] int64_t asInt() const;
    [[nodiscard]] double asFloat() const;
    [[nodiscard]] const std::string &asString() const;
    [[nodiscard]] const Bytes &asBinary() const;
    [[nodiscard]] const Timestamp &asTimestamp() const;
    [[nodiscard]] const EncryptedString &asEncrypted() const;
    [[nodiscard]] Sequence &asSequence();
    [[nodiscard]] const Sequence &asSequence() const;
    /// @brief Entries of a Mapping or the members of a Set (values are null).
    [[nodiscard]] Mapping &asMapping();
    [[nodiscard]] const Mapping &asMapping() const;

    /// @brief Mapping lookup by string key.
    /// @throws std::out_of_range when absent; std::bad_variant_access when not a mapping.
    [[nodiscard]] const Value &at(std::string_view key) const;

    /// @brief Sequence element by position.
    /// @throws std::out_of_range when @p index is past the end.
    [[nodiscard]] const Value &at(std::size_t index) const;

    /// @brief Element count of a collection; 0 for scalars.
    [[nodiscard]] std::size_t size() const;

    support::TagSet &tags()
    {
        return tags_;
    }

    const support::TagSet &tags() const
    {
        return tags_;
    }

    /// @brief Attached Origin, or nullptr.
    [[nodiscard]] const support::Origin *origin() const
    {
        return tags_.get<support::Origin>();
    }

    [[nodiscard]] bool trustedAsTemplate() const
    {
        return tags_.has<support::TrustedAsTemplate>();
    }

    /// @brief Whether the value may serve as a mapping key.
    [[nodiscard]] bool isHashable() const;

  private:
    using Payload = std::
        variant<std::monostate, bool, int64_t, double, std::string, Bytes, Timestamp, Sequence, Mapping, EncryptedString>;

    Value(ValueKind kind, Payload payload) : kind_(kind), payload_(std::move(payload)) {}

    ValueKind kind_{ValueKind::Null};
    Payload payload_;
    support::TagSet tags_;
};

/// @brief Structural equality; tags are ignored.
bool operator==(const Value &a, const Value &b);

/// @brief Hash consistent with operator==.
/// @throws std::invalid_argument for unhashable values.
std::size_t hashValue(const Value &value);

/// @brief Short human-readable rendering used in messages (`'a'`, `1`, `[1, 2]`).
std::string repr(const Value &value);

/// @brief Origin fits every value; TrustedAsTemplate only strings and ciphertext.
bool canCarry(const Value &value, const support::Tag &tag);

/// @brief Hash functor over value pointers, for key sets.
struct ValuePtrHash
{
    std::size_t operator()(const Value *value) const
    {
        return hashValue(*value);
    }
};

/// @brief Equality functor over value pointers, for key sets.
struct ValuePtrEqual
{
    bool operator()(const Value *a, const Value *b) const
    {
        return *a == *b;
    }
};

/// @brief Result of loading one YAML document.
/// @invariant root() is non-null for documents returned by a Loader.
class Document
{
  public:
    Document() = default;
    Document(const Document &) = delete;
    Document &operator=(const Document &) = delete;
    Document(Document &&) = default;
    Document &operator=(Document &&) = default;

    /// @brief Move @p value into the document's arena.
    Value &make(Value value)
    {
        return values_.make(std::move(value));
    }

    [[nodiscard]] Value *root() const
    {
        return root_;
    }

    void setRoot(Value *root)
    {
        root_ = root;
    }

    /// @brief Number of values allocated for this document.
    [[nodiscard]] std::size_t valueCount() const
    {
        return values_.size();
    }

  private:
    support::Arena<Value> values_;
    Value *root_{nullptr};
};

/// @brief Root values compare equal.
bool operator==(const Document &a, const Document &b);

} // namespace prov::yaml
