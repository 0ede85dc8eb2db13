/// @file path_grammar.hpp
/// @brief Tokenizer and serializer for path strings.
///
/// Grammar:
/// @code
/// path     := [viewer "_"] [root ("." | "[")] segment *( hop )
/// hop      := "." name | "[" ( index | identity | pattern | quoted ) "]"
/// index    := 1*DIGIT
/// identity := key "=" value *( "|" key "=" value )
/// pattern  := ""
/// quoted   := DQUOTE *( char / "\" char ) DQUOTE
/// viewer   := "left" / "right"
/// @endcode
///
/// A bare property name runs up to the next `.`, `[` or `]`. Names that a
/// bare spelling would lose (empty, holding `.`, `[`, `]`, `"` or `\`, or a
/// leading name that reads as a `left_`/`right_`/`root` prefix) print as
/// `["name"]`, with `\` before `"` and `\`.
///
/// Inside identity segments a `\` escapes the next character; keys and
/// values print with `\` before `]`, `|`, `=`, `"` and `\`. On input a `|`
/// that is not followed by a `key=` pair is kept in the value.

#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace jsondiff_cpp {

/// Which of the two compared trees a location belongs to.
enum class Viewer : std::uint8_t {
    left,
    right,
};

/// Convert a Viewer to its string representation.
constexpr auto to_string_view(Viewer viewer) noexcept -> std::string_view {
    switch (viewer) {
        case Viewer::left:  return "left";
        case Viewer::right: return "right";
    }
    return "unknown";
}

/// Parse "left" / "right".
auto parse_viewer(std::string_view text) noexcept -> std::optional<Viewer>;

/// The root marker token.
inline constexpr std::string_view root_marker = "root";

// -- Segments -----------------------------------------------------------------

/// A property hop: `.name` (or the leading `name`).
struct PropertySegment {
    std::string name;
    auto operator<=>(const PropertySegment&) const = default;
};

/// A positional array hop: `[n]`.
struct IndexSegment {
    std::size_t index{0};
    auto operator<=>(const IndexSegment&) const = default;
};

/// One `key=value` pair inside an identity segment.
struct KeyValue {
    std::string key;
    std::string value;
    auto operator<=>(const KeyValue&) const = default;
};

/// An identity array hop: `[key=value]` or `[k1=v1|k2=v2]`.
struct IdentitySegment {
    std::vector<KeyValue> keys;
    auto operator<=>(const IdentitySegment&) const = default;
};

/// A shape-only array hop: `[]`.
struct PatternSegment {
    auto operator<=>(const PatternSegment&) const = default;
};

using Segment = std::variant<
    PropertySegment,
    IndexSegment,
    IdentitySegment,
    PatternSegment
>;

/// True for index, identity and pattern segments.
constexpr auto is_array_hop(const Segment& s) noexcept -> bool {
    return !std::holds_alternative<PropertySegment>(s);
}

/// A tokenized path with its optional prefixes split off.
struct ParsedPath {
    std::optional<Viewer> viewer;   ///< `left_` / `right_` prefix, if present.
    bool has_root{false};           ///< Whether the path starts with `root`.
    std::vector<Segment> segments;  ///< Hops after the prefixes.

    auto operator==(const ParsedPath&) const -> bool = default;
};

/// Tokenize a path string.
/// @throws PathError (malformed_path) when the text breaks the grammar.
auto parse_path(std::string_view text) -> ParsedPath;

/// Serialize one segment (`name`, `[3]`, `[id=a]`, `[]`, `["a.b"]`).
///
/// A property is only checked for separators here; join_segments() also
/// quotes a leading name that looks like a prefix.
auto to_string(const Segment& segment) -> std::string;

/// Join segments: `.` before properties (except the first), nothing before
/// brackets.
auto join_segments(std::span<const Segment> segments) -> std::string;

/// Serialize a parsed path, restoring its viewer prefix and root marker.
auto to_string(const ParsedPath& path) -> std::string;

/// Remove a viewer prefix and root marker without tokenizing the rest.
///
/// `left_root.a[0]` -> `a[0]`, `root` -> ``, `a.b` -> `a.b`.
auto strip_prefixes(std::string_view text) noexcept -> std::string_view;

/// Count the structural hops of a prefix-free path, skipping bracket
/// contents so that `.` or `[` inside identity values do not count.
auto segment_count(std::string_view core) noexcept -> std::size_t;

/// Whether `ancestor` is a strict structural ancestor of `descendant`.
///
/// Both arguments are prefix-free. Requires a textual prefix followed by a
/// `.` or `[` separator, confirmed by a strictly larger hop count, which
/// rejects siblings such as `contributions` / `contributionType`.
/// The empty (root) path is an ancestor of every non-empty path.
auto is_strict_ancestor(std::string_view ancestor,
                        std::string_view descendant) noexcept -> bool;

}  // namespace jsondiff_cpp
