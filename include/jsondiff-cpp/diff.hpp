/// @file diff.hpp
/// @brief The structural differ: DiffRecord, IdentityKeyInfo and compare().

#pragma once

#include <jsondiff-cpp/identity_key.hpp>
#include <jsondiff-cpp/path.hpp>
#include <jsondiff-cpp/value.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace jsondiff_cpp {

/// What happened at a diff location.
enum class DiffKind : std::uint8_t {
    added,    ///< Present only in the right tree.
    removed,  ///< Present only in the left tree.
    changed,  ///< Present in both with different values or kinds.
};

/// Convert a DiffKind to its string representation.
constexpr auto to_string_view(DiffKind kind) noexcept -> std::string_view {
    switch (kind) {
        case DiffKind::added:   return "added";
        case DiffKind::removed: return "removed";
        case DiffKind::changed: return "changed";
    }
    return "unknown";
}

/// One leaf-level divergence between the two trees.
///
/// `before` is set for removed and changed records, `after` for added and
/// changed records. Containers above a divergence are never recorded; the
/// highlight classifier derives them.
struct DiffRecord {
    IdentityPath path;                          ///< Where the divergence is.
    DiffKind kind{DiffKind::changed};           ///< What happened.
    std::optional<Value> before;                ///< Left-side value.
    std::optional<Value> after;                 ///< Right-side value.
    std::optional<std::string> identity_key_used;  ///< Key that correlated the element.

    static auto added(IdentityPath path, Value after,
                      std::optional<std::string> key = std::nullopt) -> DiffRecord;
    static auto removed(IdentityPath path, Value before,
                        std::optional<std::string> key = std::nullopt) -> DiffRecord;
    static auto changed(IdentityPath path, Value before, Value after) -> DiffRecord;

    auto operator==(const DiffRecord&) const -> bool = default;
};

/// An array location where an identity key was discovered.
///
/// The pattern uses `[]` for every array hop, so one entry covers every
/// instance of a repeated array shape.
struct IdentityKeyInfo {
    ArrayPatternPath array_pattern;  ///< Shape of the array, e.g. `accounts[]`.
    std::string identity_key;        ///< `+`-joined property names.
    bool is_composite{false};        ///< More than one property.
    std::size_t size_left{0};        ///< Left array length at first discovery.
    std::size_t size_right{0};       ///< Right array length at first discovery.

    auto operator==(const IdentityKeyInfo&) const -> bool = default;
};

/// The output of one comparison.
struct CompareResult {
    std::vector<DiffRecord> diffs;
    std::vector<IdentityKeyInfo> identity_keys;

    auto operator==(const CompareResult&) const -> bool = default;
};

// -- Tracing ------------------------------------------------------------------

/// Kinds of structured trace events reported during compare().
enum class TraceEventKind : std::uint8_t {
    identity_key_detected,  ///< An array pair was correlated by a key.
    positional_fallback,    ///< An array pair was compared by position.
    diff_emitted,           ///< A DiffRecord was appended.
};

constexpr auto to_string_view(TraceEventKind kind) noexcept -> std::string_view {
    switch (kind) {
        case TraceEventKind::identity_key_detected: return "identity_key_detected";
        case TraceEventKind::positional_fallback:   return "positional_fallback";
        case TraceEventKind::diff_emitted:          return "diff_emitted";
    }
    return "unknown";
}

/// A structured trace event. Views are valid only during the callback.
struct TraceEvent {
    TraceEventKind kind;
    std::string_view path;    ///< Identity path of the array or diff.
    std::string_view detail;  ///< Key name, or the diff kind.
};

/// Observer invoked synchronously for each trace event.
using TraceObserver = std::function<void(const TraceEvent&)>;

// -- Options ------------------------------------------------------------------

/// Tunables of compare().
struct CompareOptions {
    DetectorOptions detector{};
    /// Identity path every emitted path starts from.
    std::string root_path{root_marker};
    /// Match arrays of scalars as multisets instead of by position, which
    /// makes them order-insensitive.
    bool sort_primitive_arrays{false};
    /// Optional structured tracing hook.
    TraceObserver observer{};
};

/// @throws OptionsError for invalid detector tunables or a root path that
/// is not an identity path.
void validate(const CompareOptions& options);

// -- Operations ---------------------------------------------------------------

/// Compare two trees.
///
/// Arrays are correlated by a discovered identity key when one exists and
/// compared by position otherwise. Equal inputs always produce identical
/// output, order included.
/// @throws OptionsError when `options` fail validation.
auto compare(const Value& left, const Value& right,
             const CompareOptions& options = {}) -> CompareResult;

/// Drop records whose path contains any pattern as a case-insensitive
/// substring. Empty patterns are ignored.
auto filter_ignored(std::span<const DiffRecord> diffs,
                    std::span<const std::string> patterns) -> std::vector<DiffRecord>;

/// Record counts per kind.
struct DiffSummary {
    std::size_t added{0};
    std::size_t removed{0};
    std::size_t changed{0};

    auto total() const noexcept -> std::size_t { return added + removed + changed; }
    auto operator==(const DiffSummary&) const -> bool = default;
};

auto summarize(std::span<const DiffRecord> diffs) noexcept -> DiffSummary;

}  // namespace jsondiff_cpp
