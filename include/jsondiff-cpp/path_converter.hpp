/// @file path_converter.hpp
/// @brief Translation between path dialects against one concrete tree.
///
/// The same identity may sit at different indices in the two compared
/// trees, so every conversion takes the tree it resolves against. Paths
/// that cannot be resolved (the node only exists on the other side) come
/// back as empty optionals, never as errors.

#pragma once

#include <jsondiff-cpp/diff.hpp>
#include <jsondiff-cpp/path.hpp>
#include <jsondiff-cpp/value.hpp>

#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>

namespace jsondiff_cpp {

/// One side of a comparison and the identity keys discovered for it.
struct ConversionContext {
    const Value& tree;
    std::span<const IdentityKeyInfo> identity_keys;
};

/// Resolve every identity hop to the index of the matching element.
///
/// Returns nullopt when an identity value is absent, an index is out of
/// bounds, a property is missing, or a hop meets the wrong kind of value.
/// The root marker is preserved.
auto identity_to_index(const IdentityPath& path, const ConversionContext& ctx)
    -> std::optional<IndexPath>;

/// Replace index hops with identity hops wherever the catalog knows a key
/// for the array being indexed and the element carries values for it.
///
/// Hops through arrays without a catalog entry keep `[n]`. Once the walk
/// leaves the tree the remaining hops are copied unchanged.
auto index_to_identity(const IndexPath& path, const ConversionContext& ctx) -> IdentityPath;

/// Carry an index path from one tree to the other: identity hops are taken
/// from `from` and resolved in `to`.
///
/// Index hops through arrays without a usable key keep their position.
/// Returns nullopt when the addressed node has no counterpart in `to`.
auto translate_to_other_side(const IndexPath& path, const ConversionContext& from,
                             const ConversionContext& to) -> std::optional<IndexPath>;

/// The node a path addresses in `tree`, or nullptr when a hop misses.
auto value_at(const IdentityPath& path, const Value& tree) -> const Value*;
auto value_at(const IndexPath& path, const Value& tree) -> const Value*;

/// Every known spelling of a path with prefixes stripped.
///
/// Without a context this is just the stripped form. With one, the index
/// form of an identity path (when it resolves) and the identity form of a
/// path with index hops are added. Pattern paths only yield their stripped
/// form.
/// @throws PathError for malformed text.
auto normalize_for_comparison(std::string_view path) -> std::set<std::string>;
auto normalize_for_comparison(std::string_view path, const ConversionContext& ctx)
    -> std::set<std::string>;

/// Whether two paths share at least one normalized spelling.
auto are_equivalent(std::string_view a, std::string_view b) -> bool;
auto are_equivalent(std::string_view a, std::string_view b, const ConversionContext& ctx)
    -> bool;

/// A concrete index path for a shape.
///
/// At each `[]` hop the first element whose subtree holds the rest of the
/// pattern is chosen, falling back to index 0 when none does. The final
/// `[]` therefore picks the first element of the described array.
auto resolve_array_pattern(const ArrayPatternPath& pattern, const Value& tree) -> IndexPath;

/// Resolve an identity path on one side and tag it with that side.
auto to_viewer_path(const IdentityPath& path, Viewer viewer, const ConversionContext& ctx)
    -> std::optional<ViewerPath>;

/// Corresponding elements of the arrays a pattern describes on both sides.
struct PatternMatch {
    std::optional<IndexPath> left;        ///< Element path in the left tree.
    std::optional<IndexPath> right;       ///< Element path in the right tree.
    std::optional<std::string> matching_id;  ///< Shared identity value, if any.

    auto operator==(const PatternMatch&) const -> bool = default;
};

/// Find the first identity value present in both arrays described by
/// `pattern` and return the element path on each side.
///
/// When no key is catalogued for the pattern or no value is shared, each
/// side with a non-empty array falls back to its element 0 and
/// `matching_id` stays empty. A side where the array cannot be located
/// yields nullopt.
auto match_array_pattern(const ArrayPatternPath& pattern, const Value& left, const Value& right,
                         std::span<const IdentityKeyInfo> identity_keys) -> PatternMatch;

}  // namespace jsondiff_cpp
