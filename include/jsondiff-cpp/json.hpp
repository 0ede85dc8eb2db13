/// @file json.hpp
/// @brief nlohmann/json interoperability for jsondiff-cpp.
///
/// Provides ADL serialization (to_json/from_json) against
/// nlohmann::ordered_json, which keeps object keys in document order the
/// way Object does, and parsing of JSON text into a Value.

#pragma once

#include <jsondiff-cpp/diff.hpp>
#include <jsondiff-cpp/highlight.hpp>
#include <jsondiff-cpp/path.hpp>
#include <jsondiff-cpp/value.hpp>

#include <nlohmann/json.hpp>

#include <string_view>

namespace jsondiff_cpp {

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

// -- Values -------------------------------------------------------------------

void to_json(nlohmann::ordered_json& j, const Value& v);

/// @throws ValueError for binary or discarded JSON values.
void from_json(const nlohmann::ordered_json& j, Value& v);

// -- Paths (as their string spelling) -----------------------------------------

void to_json(nlohmann::ordered_json& j, const IndexPath& p);
void to_json(nlohmann::ordered_json& j, const IdentityPath& p);
void to_json(nlohmann::ordered_json& j, const ArrayPatternPath& p);
void to_json(nlohmann::ordered_json& j, const ViewerPath& p);

// -- Results ------------------------------------------------------------------

/// `{"path", "kind", "before"?, "after"?, "identity_key_used"?}`
void to_json(nlohmann::ordered_json& j, const DiffRecord& d);

/// `{"array_pattern", "identity_key", "is_composite", "size_left", "size_right"}`
void to_json(nlohmann::ordered_json& j, const IdentityKeyInfo& info);

/// `{"diffs": [...], "identity_keys": [...]}`
void to_json(nlohmann::ordered_json& j, const CompareResult& r);

/// `{"relation", "kind"?}`
void to_json(nlohmann::ordered_json& j, const Classification& c);

// =============================================================================
// Text
// =============================================================================

/// Parse JSON text into a Value.
/// @throws ValueError when the text is not valid JSON.
auto parse_value(std::string_view text) -> Value;

}  // namespace jsondiff_cpp
