/// @file highlight.hpp
/// @brief Classify any tree location against a diff list.
///
/// A location is an exact diff, a descendant of one, an ancestor of one,
/// or unrelated. Containers are never diffs themselves; their ancestor
/// status is derived here.

#pragma once

#include <jsondiff-cpp/diff.hpp>
#include <jsondiff-cpp/path_converter.hpp>

#include <cstdint>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace jsondiff_cpp {

/// How a location relates to the diff set.
enum class Relation : std::uint8_t {
    none,        ///< Unrelated to every diff.
    exact,       ///< The location is a diff.
    descendant,  ///< The location lies inside a diff.
    ancestor,    ///< The location contains a diff.
};

/// Convert a Relation to its string representation.
constexpr auto to_string_view(Relation relation) noexcept -> std::string_view {
    switch (relation) {
        case Relation::none:       return "none";
        case Relation::exact:      return "exact";
        case Relation::descendant: return "descendant";
        case Relation::ancestor:   return "ancestor";
    }
    return "unknown";
}

/// The outcome of classifying one location.
struct Classification {
    Relation relation{Relation::none};
    /// Kind of the matching diff; set for exact and descendant.
    std::optional<DiffKind> kind;

    auto operator==(const Classification&) const -> bool = default;
};

/// Whether a diff of `kind` is visible on `viewer`: added records exist
/// only on the right, removed records only on the left.
constexpr auto shows_on(DiffKind kind, Viewer viewer) noexcept -> bool {
    switch (kind) {
        case DiffKind::added:   return viewer == Viewer::right;
        case DiffKind::removed: return viewer == Viewer::left;
        case DiffKind::changed: return true;
    }
    return false;
}

/// Classifies query paths against a fixed diff list.
///
/// Holds its own copy of the records, so it may outlive the CompareResult
/// it was built from. Every classify() call is independent; callers that
/// render many nodes can memoize on (query, viewer).
///
/// @code
/// auto result = jsondiff_cpp::compare(left, right);
/// auto classifier = jsondiff_cpp::HighlightClassifier{result.diffs};
/// auto ctx = jsondiff_cpp::ConversionContext{right, result.identity_keys};
/// auto c = classifier.classify("right_root.items[1].price", Viewer::right, ctx);
/// @endcode
class HighlightClassifier {
public:
    explicit HighlightClassifier(std::vector<DiffRecord> diffs);

    /// Classify by spelling alone, without resolving across dialects.
    /// @throws PathError for malformed text or a prefix naming the other viewer.
    auto classify(std::string_view query, Viewer viewer) const -> Classification;

    /// Classify with index and identity spellings resolved against the
    /// viewer's tree.
    /// @throws PathError for malformed text or a prefix naming the other viewer.
    auto classify(std::string_view query, Viewer viewer,
                  const ConversionContext& ctx) const -> Classification;

    auto diffs() const noexcept -> const std::vector<DiffRecord>& { return diffs_; }

private:
    auto classify_variants(const std::set<std::string>& query,
                           const std::vector<std::set<std::string>>& diff_variants,
                           Viewer viewer) const -> Classification;

    std::vector<DiffRecord> diffs_;
};

/// One-shot form of HighlightClassifier::classify.
auto classify(std::span<const DiffRecord> diffs, std::string_view query, Viewer viewer)
    -> Classification;
auto classify(std::span<const DiffRecord> diffs, std::string_view query, Viewer viewer,
              const ConversionContext& ctx) -> Classification;

}  // namespace jsondiff_cpp
