/// @file path.hpp
/// @brief Path dialects: IndexPath, IdentityPath, ArrayPatternPath, ViewerPath.
///
/// Each dialect is a distinct type over an immutable string. Construction
/// validates the dialect; there are no implicit conversions between them.
/// The only widening offered here is IndexPath -> IdentityPath, which is
/// always valid. Every other crossing goes through path_converter.hpp,
/// because it needs a concrete tree.

#pragma once

#include <jsondiff-cpp/path_grammar.hpp>

#include <compare>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace jsondiff_cpp {

/// A location where every array hop is a numeric offset: `root.items[2].name`.
///
/// Only meaningful relative to one concrete tree.
class IndexPath {
public:
    /// The root path (`root`).
    IndexPath();

    /// Validate and wrap a path string.
    /// @throws PathError malformed_path / wrong_dialect.
    static auto parse(std::string_view text) -> IndexPath;

    /// Build from tokenized segments.
    /// @throws PathError wrong_dialect when a segment is not a property or index.
    static auto from_parsed(const ParsedPath& parsed) -> IndexPath;

    auto str() const noexcept -> const std::string& { return text_; }
    auto parsed() const -> ParsedPath { return parse_path(text_); }

    auto operator<=>(const IndexPath&) const = default;
    auto operator==(const IndexPath&) const -> bool = default;

private:
    explicit IndexPath(std::string text) : text_{std::move(text)} {}
    std::string text_;
};

/// A location where array hops use discovered identities where available:
/// `root.contributions[id=a].amount`. Valid against either compared tree.
class IdentityPath {
public:
    /// The root path (`root`).
    IdentityPath();

    /// @throws PathError malformed_path / wrong_dialect.
    static auto parse(std::string_view text) -> IdentityPath;

    /// @throws PathError wrong_dialect on pattern segments or a viewer prefix.
    static auto from_parsed(const ParsedPath& parsed) -> IdentityPath;

    /// Every index path is also an identity path.
    static auto from(const IndexPath& path) -> IdentityPath;

    auto str() const noexcept -> const std::string& { return text_; }
    auto parsed() const -> ParsedPath { return parse_path(text_); }

    auto operator<=>(const IdentityPath&) const = default;
    auto operator==(const IdentityPath&) const -> bool = default;

private:
    explicit IdentityPath(std::string text) : text_{std::move(text)} {}
    std::string text_;
};

/// The shape of an array location: `accounts[].contributions[]`.
///
/// Every array hop is `[]`, the last hop is the array being described, and
/// the root marker is never part of the canonical spelling. The pattern of
/// an array at the tree root is `[]`.
class ArrayPatternPath {
public:
    /// @throws PathError malformed_path / wrong_dialect.
    static auto parse(std::string_view text) -> ArrayPatternPath;

    /// @throws PathError wrong_dialect.
    static auto from_parsed(const ParsedPath& parsed) -> ArrayPatternPath;

    auto str() const noexcept -> const std::string& { return text_; }
    auto parsed() const -> ParsedPath { return parse_path(text_); }

    auto operator<=>(const ArrayPatternPath&) const = default;
    auto operator==(const ArrayPatternPath&) const -> bool = default;

private:
    explicit ArrayPatternPath(std::string text) : text_{std::move(text)} {}
    std::string text_;
};

/// An index path tagged with the tree it addresses: `left_root.items[0]`.
class ViewerPath {
public:
    static auto make(Viewer viewer, const IndexPath& path) -> ViewerPath;

    /// @throws PathError when the viewer prefix is missing or the rest is
    /// not an index path.
    static auto parse(std::string_view text) -> ViewerPath;

    auto viewer() const noexcept -> Viewer { return viewer_; }
    auto index_path() const -> const IndexPath& { return path_; }
    auto str() const -> std::string;

    auto operator<=>(const ViewerPath&) const = default;
    auto operator==(const ViewerPath&) const -> bool = default;

private:
    ViewerPath(Viewer viewer, IndexPath path)
        : viewer_{viewer}, path_{std::move(path)} {}
    Viewer viewer_;
    IndexPath path_;
};

// -- Dialect inspection -------------------------------------------------------

/// The narrowest dialect a path string belongs to.
enum class PathDialect : std::uint8_t {
    index,     ///< No identity or pattern hops.
    identity,  ///< At least one identity hop, no pattern hops.
    pattern,   ///< At least one pattern hop, no index or identity hops.
};

constexpr auto to_string_view(PathDialect dialect) noexcept -> std::string_view {
    switch (dialect) {
        case PathDialect::index:    return "index";
        case PathDialect::identity: return "identity";
        case PathDialect::pattern:  return "pattern";
    }
    return "unknown";
}

/// Detect the dialect of an untyped path string (prefixes ignored).
/// @throws PathError malformed_path, or wrong_dialect when pattern hops are
/// mixed with index or identity hops.
auto detect_dialect(std::string_view text) -> PathDialect;

/// Whether the path contains at least one `[key=value]` hop.
auto has_identity_segments(const IdentityPath& path) -> bool;

/// Whether every array hop of the path is a numeric offset.
auto is_pure_index(const IdentityPath& path) -> bool;

// -- Array pattern utilities --------------------------------------------------

/// The catalog pattern of the array located at `array_location`.
///
/// `root.accounts[id=7].contributions` -> `accounts[].contributions[]`;
/// `root` -> `[]`.
auto array_pattern_of(const IdentityPath& array_location) -> ArrayPatternPath;

/// Number of `[]` hops.
auto array_depth(const ArrayPatternPath& pattern) -> std::size_t;

/// The property holding the described array: `a[].items[]` -> `items`.
/// Nullopt when the last array hop does not follow a property
/// (`[]`, `a[][]`).
auto target_array_property(const ArrayPatternPath& pattern) -> std::optional<std::string>;

/// The pattern of the closest enclosing array.
///
/// The result is the pattern cut right after its second-to-last `[]` hop:
/// `a[].b[].c[]` -> `a[].b[]`, `a[].b[][]` -> `a[].b[]`. Nullopt when the
/// pattern has fewer than two array hops.
auto parent_array_pattern(const ArrayPatternPath& pattern) -> std::optional<ArrayPatternPath>;

}  // namespace jsondiff_cpp

// -- std::hash specializations ------------------------------------------------

/// @cond HASH_SPECIALIZATIONS

template <>
struct std::hash<jsondiff_cpp::IndexPath> {
    auto operator()(const jsondiff_cpp::IndexPath& p) const noexcept -> std::size_t {
        return std::hash<std::string>{}(p.str());
    }
};

template <>
struct std::hash<jsondiff_cpp::IdentityPath> {
    auto operator()(const jsondiff_cpp::IdentityPath& p) const noexcept -> std::size_t {
        return std::hash<std::string>{}(p.str());
    }
};

template <>
struct std::hash<jsondiff_cpp::ArrayPatternPath> {
    auto operator()(const jsondiff_cpp::ArrayPatternPath& p) const noexcept -> std::size_t {
        return std::hash<std::string>{}(p.str());
    }
};

template <>
struct std::hash<jsondiff_cpp::ViewerPath> {
    auto operator()(const jsondiff_cpp::ViewerPath& p) const noexcept -> std::size_t {
        auto h1 = std::hash<jsondiff_cpp::IndexPath>{}(p.index_path());
        auto h2 = static_cast<std::size_t>(p.viewer());
        return h1 ^ (h2 << 1);
    }
};

/// @endcond
