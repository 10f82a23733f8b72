//===----------------------------------------------------------------------===//
//
// Part of the Prov project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the yaml-cpp event handler that composes Nodes.  yaml-cpp reports
// collections as start/end pairs; the builder keeps a stack of open
// collections and, for mappings, the key waiting for its value.
//
// yaml-cpp conventions relied upon:
//   - marks are 0-based and point at the first token of the node, including
//     its tag or anchor;
//   - plain null scalars (`~`, `null`, empty) arrive through OnNull;
//   - a tagged node with no content at the end of the stream also arrives
//     through OnNull without its tag, so the tag is read back from the text;
//   - anchor ids restart with every document.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Composer and its yaml-cpp EventHandler.

#include "yaml/Composer.hpp"
#include "yaml/Errors.hpp"

#include <yaml-cpp/eventhandler.h>
#include <yaml-cpp/exceptions.h>
#include <yaml-cpp/mark.h>
#include <yaml-cpp/parser.h>

#include <exception>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace prov::yaml
{
namespace
{
/// Tag yaml-cpp assigns to untagged plain scalars and collections.
constexpr std::string_view kNonSpecificPlain = "?";
/// Tag yaml-cpp assigns to untagged quoted scalars.
constexpr std::string_view kNonSpecificQuoted = "!";

std::optional<Mark> toMark(const YAML::Mark &mark)
{
    if (mark.is_null())
        return std::nullopt;
    return Mark{static_cast<std::size_t>(mark.pos), static_cast<uint32_t>(mark.line), static_cast<uint32_t>(mark.column)};
}

Mark toMarkOrZero(const YAML::Mark &mark)
{
    return toMark(mark).value_or(Mark{});
}

bool isBlank(char c)
{
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

std::size_t skipBlanks(std::string_view text, std::size_t i)
{
    while (i < text.size() && isBlank(text[i]))
        ++i;
    return i;
}

/// @brief True when only whitespace and comments follow @p i.
bool onlyCommentsFrom(std::string_view text, std::size_t i)
{
    for (i = skipBlanks(text, i); i < text.size(); i = skipBlanks(text, i))
    {
        if (text[i] != '#')
            return false;
        i = text.find('\n', i);
        if (i == std::string_view::npos)
            return true;
    }
    return true;
}

/// @brief Expand a tag as written in the source into its full form.
/// @return Nothing for named handles, which need the document's directives.
std::optional<std::string> expandTag(std::string_view written)
{
    if (written.starts_with("!<") && written.ends_with(">"))
        return std::string(written.substr(2, written.size() - 3));
    if (written.starts_with("!!"))
        return "tag:yaml.org,2002:" + std::string(written.substr(2));
    if (written.find('!', 1) != std::string_view::npos)
        return std::nullopt;
    return std::string(written);
}

/// @brief Tag of a content-less node whose properties start at @p pos.
/// @details Only applies when the properties are the last tokens of the
///          stream; anywhere else the parser reports the tag itself.
std::optional<std::string> trailingTagAt(std::string_view text, std::size_t pos)
{
    std::string_view written;
    std::size_t i = pos;
    for (int property = 0; property < 2 && i < text.size(); ++property)
    {
        if (text[i] != '!' && text[i] != '&')
            break;
        std::size_t end = i;
        while (end < text.size() && !isBlank(text[end]))
            ++end;
        if (text[i] == '!')
            written = text.substr(i, end - i);
        i = skipBlanks(text, end);
    }
    if (written.empty() || !onlyCommentsFrom(text, i))
        return std::nullopt;
    return expandTag(written);
}
} // namespace

/// @brief Receives parser events for a single document.
class Composer::Builder : public YAML::EventHandler
{
  public:
    Builder(std::string_view text, support::Arena<Node> &nodes, const Resolver &resolver)
        : text_(text), nodes_(nodes), resolver_(resolver)
    {
    }

    ComposedDocument document;

    void OnDocumentStart(const YAML::Mark &mark) override
    {
        document = ComposedDocument{nullptr, toMarkOrZero(mark)};
        anchors_.clear();
        open_.clear();
    }

    void OnDocumentEnd() override {}

    void OnNull(const YAML::Mark &mark, YAML::anchor_t anchor) override
    {
        std::optional<std::string> tag;
        if (!mark.is_null() && static_cast<std::size_t>(mark.pos) < text_.size())
            tag = trailingTagAt(text_, static_cast<std::size_t>(mark.pos));
        std::string resolved;
        if (!tag)
            resolved = resolver_.resolve(NodeKind::Scalar, "", true);
        else if (*tag == kNonSpecificQuoted)
            resolved = resolver_.resolve(NodeKind::Scalar, "", false);
        else
            resolved = std::move(*tag);
        Node &node = make(NodeKind::Scalar, std::move(resolved), mark);
        remember(anchor, node);
        attach(node);
    }

    void OnAlias(const YAML::Mark &, YAML::anchor_t anchor) override
    {
        // yaml-cpp rejects undefined aliases before reporting them.
        attach(*anchors_.at(anchor));
    }

    void OnScalar(const YAML::Mark &mark, const std::string &tag, YAML::anchor_t anchor, const std::string &value) override
    {
        std::string resolved;
        if (tag == kNonSpecificPlain)
            resolved = resolver_.resolve(NodeKind::Scalar, value, true);
        else if (tag == kNonSpecificQuoted)
            resolved = resolver_.resolve(NodeKind::Scalar, value, false);
        else
            resolved = tag;
        Node &node = make(NodeKind::Scalar, std::move(resolved), mark);
        node.value = value;
        remember(anchor, node);
        attach(node);
    }

    void OnSequenceStart(const YAML::Mark &mark,
                         const std::string &tag,
                         YAML::anchor_t anchor,
                         YAML::EmitterStyle::value) override
    {
        open(NodeKind::Sequence, tag, anchor, mark);
    }

    void OnSequenceEnd() override
    {
        open_.pop_back();
    }

    void OnMapStart(const YAML::Mark &mark,
                    const std::string &tag,
                    YAML::anchor_t anchor,
                    YAML::EmitterStyle::value) override
    {
        open(NodeKind::Mapping, tag, anchor, mark);
    }

    void OnMapEnd() override
    {
        open_.pop_back();
    }

  private:
    struct OpenCollection
    {
        Node *node;
        Node *pendingKey;
    };

    Node &make(NodeKind kind, std::string tag, const YAML::Mark &mark)
    {
        Node &node = nodes_.make();
        node.kind = kind;
        node.tag = std::move(tag);
        node.startMark = toMarkOrZero(mark);
        return node;
    }

    void open(NodeKind kind, const std::string &tag, YAML::anchor_t anchor, const YAML::Mark &mark)
    {
        const bool nonSpecific = tag.empty() || tag == kNonSpecificPlain || tag == kNonSpecificQuoted;
        Node &node = make(kind, nonSpecific ? resolver_.resolve(kind, "", true) : tag, mark);
        // Registered before the children so that recursive aliases find it.
        remember(anchor, node);
        attach(node);
        open_.push_back(OpenCollection{&node, nullptr});
    }

    void remember(YAML::anchor_t anchor, Node &node)
    {
        if (anchor != YAML::NullAnchor)
            anchors_[anchor] = &node;
    }

    void attach(Node &node)
    {
        if (open_.empty())
        {
            document.root = &node;
            return;
        }
        OpenCollection &top = open_.back();
        if (top.node->kind == NodeKind::Sequence)
        {
            top.node->items.push_back(&node);
        }
        else if (top.pendingKey == nullptr)
        {
            top.pendingKey = &node;
        }
        else
        {
            top.node->pairs.emplace_back(top.pendingKey, &node);
            top.pendingKey = nullptr;
        }
    }

    std::string_view text_;
    support::Arena<Node> &nodes_;
    const Resolver &resolver_;
    std::unordered_map<YAML::anchor_t, Node *> anchors_;
    std::vector<OpenCollection> open_;
};

Composer::Composer(std::string text, const Resolver &resolver)
    : text_(std::move(text)), stream_(text_), parser_(std::make_unique<YAML::Parser>(stream_)), resolver_(resolver)
{
}

Composer::~Composer() = default;

/// @brief Run the parser over one document.
/// @details yaml-cpp exceptions are rethrown as MarkedYamlError with the
///          original nested inside, so callers only deal with one family.
bool Composer::nextDocument(ComposedDocument &out)
{
    Builder builder(text_, nodes_, resolver_);
    try
    {
        if (!parser_->HandleNextDocument(builder))
            return false;
    }
    catch (const YAML::Exception &ex)
    {
        std::throw_with_nested(MarkedYamlError({}, std::nullopt, ex.msg, toMark(ex.mark)));
    }
    out = builder.document;
    return out.root != nullptr;
}

} // namespace prov::yaml
