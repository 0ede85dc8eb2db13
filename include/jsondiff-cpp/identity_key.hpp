/// @file identity_key.hpp
/// @brief Heuristic discovery of per-element identity keys for array pairs.

#pragma once

#include <jsondiff-cpp/path_grammar.hpp>
#include <jsondiff-cpp/value.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jsondiff_cpp {

/// Default minimum share of object-typed elements in each non-empty array.
inline constexpr double default_min_object_proportion = 0.8;

/// Default minimum overlap of identity values, relative to the smaller
/// array's unique value count.
inline constexpr double default_min_overlap_ratio = 0.5;

/// Default largest number of properties combined into a composite key.
inline constexpr std::size_t default_max_composite_arity = 3;

/// Tunables of the identity-key heuristic.
struct DetectorOptions {
    double min_object_proportion{default_min_object_proportion};
    double min_overlap_ratio{default_min_overlap_ratio};
    std::size_t max_composite_arity{default_max_composite_arity};
    /// Property names tried first, in this order (case-insensitive).
    std::vector<std::string> preferred_keys{"id", "key", "uuid", "name", "_id"};
};

/// @throws OptionsError when a ratio is outside [0, 1] or the arity is
/// outside 1..3.
void validate(const DetectorOptions& options);

/// One or more property names that identify an array element.
class IdentityKey {
public:
    /// @param names Ordered, non-empty property names.
    explicit IdentityKey(std::vector<std::string> names);

    /// Split a catalog spelling (`id`, `accountId+type`) into names.
    static auto parse(std::string_view spelling) -> IdentityKey;

    auto names() const noexcept -> const std::vector<std::string>& { return names_; }
    auto is_composite() const noexcept -> bool { return names_.size() > 1; }

    /// The `+`-joined spelling.
    auto name() const -> std::string;

    /// The `|`-joined key strings of an element, or nullopt when the
    /// element is not an object or lacks a string/number value for a key.
    auto value_of(const Value& element) const -> std::optional<std::string>;

    /// A correlation token for an element: like value_of() but each value
    /// carries its kind and length, so `1` and `"1"` (or `"x|y","z"` and
    /// `"x","y|z"`) never meet. Nullopt as for value_of().
    auto token_of(const Value& element) const -> std::optional<std::string>;

    /// The identity segment addressing an element (`[id=a]`,
    /// `[accountId=7|type=roth]`), or nullopt as for value_of().
    auto segment_for(const Value& element) const -> std::optional<IdentitySegment>;

    /// Whether an element carries the key/value pairs of a segment.
    auto matches(const Value& element, const IdentitySegment& segment) const -> bool;

    auto operator==(const IdentityKey&) const -> bool = default;

private:
    std::vector<std::string> names_;
};

/// Decide whether some property (or combination of up to three properties)
/// identifies elements stably across two arrays.
///
/// Candidates come from one sample object, preferred names first and the
/// rest in byte order; single keys are tried before pairs, pairs before
/// triples. A candidate wins when every object on both sides holds
/// string/number values for it, no two elements of one array spell the
/// same identity segment, and the value sets (compared with their kinds)
/// overlap by at least `min_overlap_ratio` of the
/// smaller set. Nullopt means the caller compares positionally.
auto detect_identity_key(const Array& left, const Array& right,
                         const DetectorOptions& options = {}) -> std::optional<IdentityKey>;

}  // namespace jsondiff_cpp
