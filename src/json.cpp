#include <jsondiff-cpp/json.hpp>

#include <jsondiff-cpp/error.hpp>

#include <cstdint>
#include <limits>
#include <string>
#include <utility>

namespace jsondiff_cpp {

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

void to_json(nlohmann::ordered_json& j, const Value& v) {
    std::visit(overload{
        [&](Null) { j = nullptr; },
        [&](bool b) { j = b; },
        [&](std::int64_t i) { j = i; },
        [&](std::uint64_t u) { j = u; },
        [&](double d) { j = d; },
        [&](const std::string& s) { j = s; },
        [&](const Array& a) {
            j = nlohmann::ordered_json::array();
            for (const auto& item : a) {
                auto child = nlohmann::ordered_json{};
                to_json(child, item);
                j.push_back(std::move(child));
            }
        },
        [&](const Object& o) {
            j = nlohmann::ordered_json::object();
            for (const auto& [key, item] : o) {
                to_json(j[key], item);
            }
        },
    }, v.data);
}

void from_json(const nlohmann::ordered_json& j, Value& v) {
    if (j.is_null()) {
        v = Null{};
    } else if (j.is_boolean()) {
        v = j.get<bool>();
    } else if (j.is_number_unsigned()) {
        auto val = j.get<std::uint64_t>();
        // If it fits in int64, prefer int64 for consistency
        if (val <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            v = static_cast<std::int64_t>(val);
        } else {
            v = val;
        }
    } else if (j.is_number_integer()) {
        v = j.get<std::int64_t>();
    } else if (j.is_number_float()) {
        v = j.get<double>();
    } else if (j.is_string()) {
        v = j.get<std::string>();
    } else if (j.is_array()) {
        auto arr = Array{};
        arr.reserve(j.size());
        for (const auto& item : j) {
            auto child = Value{};
            from_json(item, child);
            arr.push_back(std::move(child));
        }
        v = std::move(arr);
    } else if (j.is_object()) {
        auto obj = Object{};
        for (const auto& [key, item] : j.items()) {
            auto child = Value{};
            from_json(item, child);
            obj.insert_or_assign(key, std::move(child));
        }
        v = std::move(obj);
    } else {
        throw ValueError{std::string{"cannot convert JSON "} + j.type_name() + " to Value"};
    }
}

// -- Paths --------------------------------------------------------------------

void to_json(nlohmann::ordered_json& j, const IndexPath& p) {
    j = p.str();
}

void to_json(nlohmann::ordered_json& j, const IdentityPath& p) {
    j = p.str();
}

void to_json(nlohmann::ordered_json& j, const ArrayPatternPath& p) {
    j = p.str();
}

void to_json(nlohmann::ordered_json& j, const ViewerPath& p) {
    j = p.str();
}

// -- Results ------------------------------------------------------------------

void to_json(nlohmann::ordered_json& j, const DiffRecord& d) {
    j = nlohmann::ordered_json{
        {"path", d.path.str()},
        {"kind", std::string{to_string_view(d.kind)}},
    };
    if (d.before) to_json(j["before"], *d.before);
    if (d.after) to_json(j["after"], *d.after);
    if (d.identity_key_used) j["identity_key_used"] = *d.identity_key_used;
}

void to_json(nlohmann::ordered_json& j, const IdentityKeyInfo& info) {
    j = nlohmann::ordered_json{
        {"array_pattern", info.array_pattern.str()},
        {"identity_key", info.identity_key},
        {"is_composite", info.is_composite},
        {"size_left", info.size_left},
        {"size_right", info.size_right},
    };
}

void to_json(nlohmann::ordered_json& j, const CompareResult& r) {
    auto diffs = nlohmann::ordered_json::array();
    for (const auto& d : r.diffs) {
        auto item = nlohmann::ordered_json{};
        to_json(item, d);
        diffs.push_back(std::move(item));
    }
    auto keys = nlohmann::ordered_json::array();
    for (const auto& info : r.identity_keys) {
        auto item = nlohmann::ordered_json{};
        to_json(item, info);
        keys.push_back(std::move(item));
    }
    j = nlohmann::ordered_json::object();
    j["diffs"] = std::move(diffs);
    j["identity_keys"] = std::move(keys);
}

void to_json(nlohmann::ordered_json& j, const Classification& c) {
    j = nlohmann::ordered_json{{"relation", std::string{to_string_view(c.relation)}}};
    if (c.kind) j["kind"] = std::string{to_string_view(*c.kind)};
}

// =============================================================================
// Text
// =============================================================================

auto parse_value(std::string_view text) -> Value {
    auto j = nlohmann::ordered_json{};
    try {
        j = nlohmann::ordered_json::parse(text);
    } catch (const nlohmann::ordered_json::parse_error& e) {
        throw ValueError{std::string{"invalid JSON: "} + e.what()};
    }
    auto v = Value{};
    from_json(j, v);
    return v;
}

}  // namespace jsondiff_cpp
