//===----------------------------------------------------------------------===//
//
// Part of the Prov project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements construction of the YAML 1.1 tag repository: null, bool, int,
// float, str, binary, timestamp, seq, map, set, omap and pairs.
//
// Positions: a node's Origin is the loader's base Origin shifted by the node's
// 0-based start line, with the 0-based start column turned 1-based.  The base
// Origin's own column is not added; a document embedded mid-line reports
// columns relative to its own text.
//
// Mappings: merge keys are expanded first (later merge sources lose to
// earlier ones, explicit entries win over all of them), then each entry is
// inserted.  Only entries written in the mapping itself count as duplicates;
// an explicit entry overriding a merged one is the purpose of `<<`.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Standard tag handlers, merge-key expansion and duplicate detection.

#include "yaml/BaseConstructor.hpp"
#include "yaml/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <limits>
#include <regex>

namespace prov::yaml
{
namespace
{
/// @brief Parse @p digits in @p base into @p out.
/// @return std::errc{} on success; invalid_argument for junk or empty input.
std::errc parseUnsigned(std::string_view digits, int base, uint64_t &out)
{
    if (digits.empty())
        return std::errc::invalid_argument;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), out, base);
    if (ec == std::errc{} && ptr != digits.data() + digits.size())
        return std::errc::invalid_argument;
    return ec;
}

std::vector<std::string_view> splitColons(std::string_view text)
{
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true)
    {
        std::size_t pos = text.find(':', start);
        parts.push_back(text.substr(start, pos == std::string_view::npos ? std::string_view::npos : pos - start));
        if (pos == std::string_view::npos)
            break;
        start = pos + 1;
    }
    return parts;
}

int base64Digit(char c)
{
    if (c >= 'A' && c <= 'Z')
        return c - 'A';
    if (c >= 'a' && c <= 'z')
        return c - 'a' + 26;
    if (c >= '0' && c <= '9')
        return c - '0' + 52;
    if (c == '+')
        return 62;
    if (c == '/')
        return 63;
    return -1;
}

/// @brief Decode base64 text, skipping whitespace.
/// @return Empty optional with @p why set on malformed input.
std::optional<Bytes> decodeBase64(std::string_view text, std::string &why)
{
    std::string clean;
    for (char c : text)
    {
        if (!std::isspace(static_cast<unsigned char>(c)))
            clean += c;
    }
    if (clean.size() % 4 != 0)
    {
        why = "incorrect padding";
        return std::nullopt;
    }

    Bytes out;
    out.reserve(clean.size() / 4 * 3);
    for (std::size_t i = 0; i < clean.size(); i += 4)
    {
        const bool last = i + 4 == clean.size();
        int digits[4];
        int padding = 0;
        for (int j = 0; j < 4; ++j)
        {
            const char c = clean[i + j];
            if (c == '=' && last && j >= 2)
            {
                ++padding;
                digits[j] = 0;
                continue;
            }
            if (padding != 0 || (digits[j] = base64Digit(c)) < 0)
            {
                why = std::string("invalid character '") + c + "'";
                return std::nullopt;
            }
        }
        const uint32_t group = (static_cast<uint32_t>(digits[0]) << 18) | (static_cast<uint32_t>(digits[1]) << 12) |
                               (static_cast<uint32_t>(digits[2]) << 6) | static_cast<uint32_t>(digits[3]);
        out.push_back(static_cast<uint8_t>(group >> 16));
        if (padding < 2)
            out.push_back(static_cast<uint8_t>((group >> 8) & 0xff));
        if (padding < 1)
            out.push_back(static_cast<uint8_t>(group & 0xff));
    }
    return out;
}

unsigned daysInMonth(int year, unsigned month)
{
    static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    return month == 2 && leap ? 29 : kDays[month - 1];
}

std::string lowercase(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return std::tolower(c); });
    return text;
}
} // namespace

BaseConstructor::BaseConstructor(DuplicateKeyPolicy policy,
                                 bool trustedAsTemplate,
                                 const Resolver &resolver,
                                 support::DiagnosticEngine &warnings,
                                 support::Origin baseOrigin)
    : policy_(policy), trust_(trustedAsTemplate), resolver_(resolver), warnings_(warnings),
      baseOrigin_(std::move(baseOrigin))
{
}

BaseConstructor::~BaseConstructor() = default;

/// @brief Install the YAML 1.1 handlers.
void BaseConstructor::registerTagHandlers()
{
    addTagHandler(tag_names::kNull, [this](const Node &n) { return constructNull(n); });
    addTagHandler(tag_names::kBool, [this](const Node &n) { return constructBool(n); });
    addTagHandler(tag_names::kInt, [this](const Node &n) { return constructInt(n); });
    addTagHandler(tag_names::kFloat, [this](const Node &n) { return constructFloat(n); });
    addTagHandler(tag_names::kStr, [this](const Node &n) { return constructStr(n); });
    addTagHandler(tag_names::kBinary, [this](const Node &n) { return constructBinary(n); });
    addTagHandler(tag_names::kTimestamp, [this](const Node &n) { return constructTimestamp(n); });
    addTagHandler(tag_names::kSeq, [this](const Node &n) { return constructSeq(n); });
    addTagHandler(tag_names::kMap, [this](const Node &n) { return constructMap(n); });
    addTagHandler(tag_names::kSet, [this](const Node &n) { return constructSet(n); });
    addTagHandler(tag_names::kOmap,
                  [this](const Node &n) { return constructOrderedPairs(n, "!!omap", "while constructing an ordered map"); });
    addTagHandler(tag_names::kPairs,
                  [this](const Node &n) { return constructOrderedPairs(n, "!!pairs", "while constructing pairs"); });
}

void BaseConstructor::addTagHandler(std::string_view tag, TagHandler handler)
{
    handlers_[std::string(tag)] = std::move(handler);
}

/// @brief Construct a whole document.
/// @details Caches are per document: aliases never cross document boundaries.
Value *BaseConstructor::constructDocument(const Node &root, Document &document)
{
    document_ = &document;
    constructed_.clear();
    inProgress_.clear();
    Value *value = constructObject(root);
    document.setRoot(value);
    document_ = nullptr;
    return value;
}

/// @brief Dispatch @p node to the handler for its tag.
/// @details A node reached again while its own handler is still running, and
///          which did not register a container for itself, is a recursive
///          reference that cannot be represented.
Value *BaseConstructor::constructObject(const Node &node)
{
    if (auto it = constructed_.find(&node); it != constructed_.end())
        return it->second;
    if (inProgress_.count(&node) != 0)
        throw MarkedYamlError({}, std::nullopt, "found unconstructable recursive node", node.startMark);

    inProgress_.insert(&node);
    auto handler = handlers_.find(node.tag);
    Value *value = handler != handlers_.end() ? handler->second(node) : constructUndefined(node);
    constructed_[&node] = value;
    inProgress_.erase(&node);
    return value;
}

/// @brief Construct a retagged copy of @p node as if it were untagged plain text.
/// @details The copy shares its children with @p node.
Value *BaseConstructor::resolveAndConstruct(const Node &node)
{
    Node &plain = retagged_.make(node);
    plain.tag = resolver_.resolve(node.kind, node.value, true);
    return constructObject(plain);
}

support::Origin BaseConstructor::nodeOrigin(const Node &node) const
{
    return baseOrigin_.replace(support::OriginUpdate{
        .lineNum = node.startMark.line + baseOrigin_.lineNum(),
        .colNum = node.startMark.column + 1,
    });
}

Value &BaseConstructor::emit(Value value, const Node &node)
{
    Value &out = document_->make(std::move(value));
    out.tags().apply(nodeOrigin(node));
    return out;
}

Value &BaseConstructor::beginContainer(Value container, const Node &node)
{
    Value &out = emit(std::move(container), node);
    constructed_[&node] = &out;
    return out;
}

const std::string &BaseConstructor::scalarText(const Node &node) const
{
    if (node.kind != NodeKind::Scalar)
        throw MarkedYamlError(
            {}, std::nullopt, std::string("expected a scalar node, but found ") + nodeKindName(node.kind), node.startMark);
    return node.value;
}

//===----------------------------------------------------------------------===//
// Scalars
//===----------------------------------------------------------------------===//

Value *BaseConstructor::constructNull(const Node &node)
{
    scalarText(node);
    return &emit(Value::null(), node);
}

Value *BaseConstructor::constructBool(const Node &node)
{
    const std::string text = lowercase(scalarText(node));
    if (text == "yes" || text == "true" || text == "on")
        return &emit(Value::boolean(true), node);
    if (text == "no" || text == "false" || text == "off")
        return &emit(Value::boolean(false), node);
    throw MarkedYamlError("while constructing a boolean",
                          node.startMark,
                          "invalid boolean value '" + node.value + "'",
                          node.startMark);
}

/// @brief Construct a YAML 1.1 integer.
/// @details Accepts `_` separators, binary (`0b`), octal (leading `0`),
///          hexadecimal (`0x`) and base-60 (`1:30`) forms.  Values outside the
///          signed 64-bit range are rejected.
Value *BaseConstructor::constructInt(const Node &node)
{
    std::string text = scalarText(node);
    std::erase(text, '_');
    auto fail = [&node](const std::string &problem) -> Value *
    { throw MarkedYamlError("while constructing an integer", node.startMark, problem, node.startMark); };

    bool negative = false;
    std::string_view digits = text;
    if (!digits.empty() && (digits.front() == '-' || digits.front() == '+'))
    {
        negative = digits.front() == '-';
        digits.remove_prefix(1);
    }

    uint64_t magnitude = 0;
    std::errc ec{};
    if (digits == "0")
        magnitude = 0;
    else if (digits.starts_with("0b"))
        ec = parseUnsigned(digits.substr(2), 2, magnitude);
    else if (digits.starts_with("0x"))
        ec = parseUnsigned(digits.substr(2), 16, magnitude);
    else if (digits.size() > 1 && digits.front() == '0')
        ec = parseUnsigned(digits.substr(1), 8, magnitude);
    else if (digits.find(':') != std::string_view::npos)
    {
        for (std::string_view part : splitColons(digits))
        {
            uint64_t digit = 0;
            if ((ec = parseUnsigned(part, 10, digit)) != std::errc{})
                break;
            if (magnitude > (std::numeric_limits<uint64_t>::max() - digit) / 60)
            {
                ec = std::errc::result_out_of_range;
                break;
            }
            magnitude = magnitude * 60 + digit;
        }
    }
    else
        ec = parseUnsigned(digits, 10, magnitude);

    if (ec == std::errc::result_out_of_range)
        return fail("integer value '" + node.value + "' is out of range");
    if (ec != std::errc{})
        return fail("invalid integer value '" + node.value + "'");

    constexpr uint64_t kMaxPositive = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    int64_t result = 0;
    if (negative)
    {
        if (magnitude > kMaxPositive + 1)
            return fail("integer value '" + node.value + "' is out of range");
        result = magnitude == kMaxPositive + 1 ? std::numeric_limits<int64_t>::min() : -static_cast<int64_t>(magnitude);
    }
    else
    {
        if (magnitude > kMaxPositive)
            return fail("integer value '" + node.value + "' is out of range");
        result = static_cast<int64_t>(magnitude);
    }
    return &emit(Value::integer(result), node);
}

/// @brief Construct a YAML 1.1 float, including `.inf`, `.nan` and base-60 forms.
Value *BaseConstructor::constructFloat(const Node &node)
{
    std::string text = lowercase(scalarText(node));
    std::erase(text, '_');
    auto fail = [&node]() -> Value *
    {
        throw MarkedYamlError("while constructing a float",
                              node.startMark,
                              "invalid floating point value '" + node.value + "'",
                              node.startMark);
    };

    double sign = 1.0;
    std::string_view digits = text;
    if (!digits.empty() && (digits.front() == '-' || digits.front() == '+'))
    {
        sign = digits.front() == '-' ? -1.0 : 1.0;
        digits.remove_prefix(1);
    }

    double value = 0.0;
    if (digits == ".inf")
        value = std::numeric_limits<double>::infinity();
    else if (digits == ".nan")
        value = std::numeric_limits<double>::quiet_NaN();
    else if (digits.find(':') != std::string_view::npos)
    {
        for (std::string_view part : splitColons(digits))
        {
            double digit = 0.0;
            auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), digit);
            if (part.empty() || ec != std::errc{} || ptr != part.data() + part.size())
                return fail();
            value = value * 60.0 + digit;
        }
    }
    else
    {
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
        if (digits.empty() || ec != std::errc{} || ptr != digits.data() + digits.size())
            return fail();
    }
    return &emit(Value::real(sign * value), node);
}

/// @brief Construct a string, marking it trusted when the load allows it.
Value *BaseConstructor::constructStr(const Node &node)
{
    Value &out = emit(Value::string(scalarText(node)), node);
    if (trust_.shouldTrustStrings())
        out.tags().apply(support::TrustedAsTemplate{});
    return &out;
}

Value *BaseConstructor::constructBinary(const Node &node)
{
    std::string why;
    auto bytes = decodeBase64(scalarText(node), why);
    if (!bytes)
        throw MarkedYamlError({}, std::nullopt, "failed to decode base64 data: " + why, node.startMark);
    return &emit(Value::binary(std::move(*bytes)), node);
}

/// @brief Construct a date or date-time.
/// @details Fractions are kept to microsecond precision; an explicit offset
///          (or `Z`) makes the timestamp zone-aware.
Value *BaseConstructor::constructTimestamp(const Node &node)
{
    static const std::regex kTimestamp(R"(^([0-9][0-9][0-9][0-9])-([0-9][0-9]?)-([0-9][0-9]?))"
                                       R"((?:(?:[Tt]|[ \t]+)([0-9][0-9]?):([0-9][0-9]):([0-9][0-9]))"
                                       R"((?:\.([0-9]*))?)"
                                       R"((?:[ \t]*(Z|([-+])([0-9][0-9]?)(?::([0-9][0-9]))?))?)?$)");
    const std::string &text = scalarText(node);
    auto fail = [&node]() -> Value *
    {
        throw MarkedYamlError("while constructing a timestamp",
                              node.startMark,
                              "invalid timestamp value '" + node.value + "'",
                              node.startMark);
    };

    std::smatch m;
    if (text.size() > kMaxTimestampLength || !std::regex_match(text, m, kTimestamp))
        return fail();

    Timestamp ts;
    ts.year = std::stoi(m[1].str());
    ts.month = static_cast<unsigned>(std::stoul(m[2].str()));
    ts.day = static_cast<unsigned>(std::stoul(m[3].str()));
    if (ts.month < 1 || ts.month > 12 || ts.day < 1 || ts.day > daysInMonth(ts.year, ts.month))
        return fail();

    if (m[4].matched)
    {
        ts.hasTime = true;
        ts.hour = static_cast<unsigned>(std::stoul(m[4].str()));
        ts.minute = static_cast<unsigned>(std::stoul(m[5].str()));
        ts.second = static_cast<unsigned>(std::stoul(m[6].str()));
        if (ts.hour > 23 || ts.minute > 59 || ts.second > 59)
            return fail();
        if (m[7].matched && m[7].length() > 0)
        {
            std::string fraction = m[7].str().substr(0, 6);
            fraction.append(6 - fraction.size(), '0');
            ts.microsecond = static_cast<unsigned>(std::stoul(fraction));
        }
        if (m[8].matched)
        {
            if (m[8].str() == "Z")
            {
                ts.utcOffsetMinutes = 0;
            }
            else
            {
                int minutes = std::stoi(m[10].str()) * 60 + (m[11].matched ? std::stoi(m[11].str()) : 0);
                ts.utcOffsetMinutes = m[9].str() == "-" ? -minutes : minutes;
            }
        }
    }
    return &emit(Value::timestamp(ts), node);
}

//===----------------------------------------------------------------------===//
// Collections
//===----------------------------------------------------------------------===//

Value *BaseConstructor::constructSeq(const Node &node)
{
    if (node.kind != NodeKind::Sequence)
        throw MarkedYamlError({},
                              std::nullopt,
                              std::string("expected a sequence node, but found ") + nodeKindName(node.kind),
                              node.startMark);
    Value &out = beginContainer(Value::sequence(), node);
    for (const Node *item : node.items)
        out.asSequence().push_back(constructObject(*item));
    return &out;
}

Value *BaseConstructor::constructMap(const Node &node)
{
    if (node.kind != NodeKind::Mapping)
        throw MarkedYamlError({},
                              std::nullopt,
                              std::string("expected a mapping node, but found ") + nodeKindName(node.kind),
                              node.startMark);
    Value &out = beginContainer(Value::mapping(), node);
    constructMapping(node, out.asMapping());
    return &out;
}

Value *BaseConstructor::constructSet(const Node &node)
{
    if (node.kind != NodeKind::Mapping)
        throw MarkedYamlError({},
                              std::nullopt,
                              std::string("expected a mapping node, but found ") + nodeKindName(node.kind),
                              node.startMark);
    Value &out = beginContainer(Value::set(), node);
    constructMapping(node, out.asMapping());
    return &out;
}

/// @brief Construct `!!omap` / `!!pairs` as a sequence of `[key, value]` pairs.
/// @details Both tags are deprecated: a plain mapping already keeps key order.
Value *BaseConstructor::constructOrderedPairs(const Node &node, std::string_view tagLabel, std::string_view context)
{
    warnings_.deprecated("Use of the YAML `" + std::string(tagLabel) + "` tag is deprecated.",
                         kDeprecatedTagRemovalVersion,
                         nodeOrigin(node),
                         "Use a standard mapping instead, as key order is always preserved.");

    if (node.kind != NodeKind::Sequence)
        throw MarkedYamlError(std::string(context),
                              node.startMark,
                              std::string("expected a sequence, but found ") + nodeKindName(node.kind),
                              node.startMark);

    Value &out = beginContainer(Value::sequence(), node);
    for (const Node *entry : node.items)
    {
        if (entry->kind != NodeKind::Mapping)
            throw MarkedYamlError(std::string(context),
                                  node.startMark,
                                  std::string("expected a mapping of length 1, but found ") + nodeKindName(entry->kind),
                                  entry->startMark);
        if (entry->pairs.size() != 1)
            throw MarkedYamlError(std::string(context),
                                  node.startMark,
                                  "expected a single mapping item, but found " + std::to_string(entry->pairs.size()) +
                                      " items",
                                  entry->startMark);
        Value &pair = emit(Value::sequence(), *entry);
        pair.asSequence().push_back(constructObject(*entry->pairs.front().first));
        pair.asSequence().push_back(constructObject(*entry->pairs.front().second));
        out.asSequence().push_back(&pair);
    }
    return &out;
}

Value *BaseConstructor::constructUndefined(const Node &node)
{
    throw MarkedYamlError(
        {}, std::nullopt, "could not determine a constructor for the tag '" + node.tag + "'", node.startMark);
}

//===----------------------------------------------------------------------===//
// Mapping helpers
//===----------------------------------------------------------------------===//

/// @brief Split @p node's entries into merged and own entries.
/// @details `<<` values may be a mapping or a sequence of mappings.  Within a
///          sequence, earlier mappings take precedence, so they are appended
///          last.  A `=` key is constructed as a plain string.
BaseConstructor::FlatMapping BaseConstructor::flattenMapping(const Node &node, std::vector<const Node *> &active)
{
    if (std::find(active.begin(), active.end(), &node) != active.end())
        throw MarkedYamlError({}, std::nullopt, "found unconstructable recursive node", node.startMark);
    active.push_back(&node);

    auto appendAll = [](std::vector<NodePair> &dst, const FlatMapping &src)
    {
        dst.insert(dst.end(), src.merged.begin(), src.merged.end());
        dst.insert(dst.end(), src.own.begin(), src.own.end());
    };

    FlatMapping flat;
    for (const auto &[keyNode, valueNode] : node.pairs)
    {
        if (keyNode->tag == tag_names::kMerge)
        {
            if (valueNode->kind == NodeKind::Mapping)
            {
                appendAll(flat.merged, flattenMapping(*valueNode, active));
            }
            else if (valueNode->kind == NodeKind::Sequence)
            {
                std::vector<FlatMapping> sources;
                for (const Node *source : valueNode->items)
                {
                    if (source->kind != NodeKind::Mapping)
                        throw MarkedYamlError("while constructing a mapping",
                                              node.startMark,
                                              std::string("expected a mapping for merging, but found ") +
                                                  nodeKindName(source->kind),
                                              source->startMark);
                    sources.push_back(flattenMapping(*source, active));
                }
                for (auto it = sources.rbegin(); it != sources.rend(); ++it)
                    appendAll(flat.merged, *it);
            }
            else
            {
                throw MarkedYamlError("while constructing a mapping",
                                      node.startMark,
                                      std::string("expected a mapping or list of mappings for merging, but found ") +
                                          nodeKindName(valueNode->kind),
                                      valueNode->startMark);
            }
        }
        else if (keyNode->tag == tag_names::kValue)
        {
            Node &asString = retagged_.make(*keyNode);
            asString.tag = std::string(tag_names::kStr);
            flat.own.emplace_back(&asString, valueNode);
        }
        else
        {
            flat.own.emplace_back(keyNode, valueNode);
        }
    }

    active.pop_back();
    return flat;
}

/// @brief Populate @p target from mapping @p node.
/// @details Merged entries are inserted first so own entries override them.
///          Unhashable keys are grammar-level problems; duplicates follow the
///          configured policy.
void BaseConstructor::constructMapping(const Node &node, Mapping &target)
{
    std::vector<const Node *> active;
    const FlatMapping flat = flattenMapping(node, active);

    auto insert = [&](const NodePair &entry) -> Value *
    {
        Value *key = constructObject(*entry.first);
        if (!key->isHashable())
            throw MarkedYamlError(
                "while constructing a mapping", node.startMark, "found unhashable key", entry.first->startMark);
        target.insertOrAssign(key, constructObject(*entry.second));
        return key;
    };

    for (const NodePair &entry : flat.merged)
        insert(entry);

    std::unordered_set<const Value *, ValuePtrHash, ValuePtrEqual> seen;
    for (const NodePair &entry : flat.own)
    {
        Value *key = insert(entry);
        if (!seen.insert(key).second)
            reportDuplicateKey(*key, *entry.first);
    }
}

void BaseConstructor::reportDuplicateKey(const Value &key, const Node &keyNode)
{
    const std::string message = "Found duplicate mapping key " + repr(key) + ".";
    switch (policy_)
    {
        case DuplicateKeyPolicy::Error:
            throw StructuralConstructionError({}, std::nullopt, message, keyNode.startMark);
        case DuplicateKeyPolicy::Warn:
            warnings_.warning(message, nodeOrigin(keyNode), "Using last defined value only.");
            break;
        case DuplicateKeyPolicy::Ignore:
            break;
    }
}

} // namespace prov::yaml
