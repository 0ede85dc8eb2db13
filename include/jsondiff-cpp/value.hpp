/// @file value.hpp
/// @brief The immutable JSON-like tree compared by the library.

#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace jsondiff_cpp {

/// Represents a JSON null value.
struct Null {
    auto operator<=>(const Null&) const = default;
    auto operator==(const Null&) const -> bool = default;
};

/// The JSON-level kind of a value. All numeric alternatives are `number`.
enum class ValueKind : std::uint8_t {
    null,
    boolean,
    number,
    string,
    array,
    object,
};

/// Convert a ValueKind to its string representation.
constexpr auto to_string_view(ValueKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ValueKind::null:    return "null";
        case ValueKind::boolean: return "boolean";
        case ValueKind::number:  return "number";
        case ValueKind::string:  return "string";
        case ValueKind::array:   return "array";
        case ValueKind::object:  return "object";
    }
    return "unknown";
}

struct Value;

/// An ordered sequence of values.
using Array = std::vector<Value>;

/// An ordered mapping of unique string keys to values.
///
/// Iteration follows insertion order. Assigning to an existing key keeps
/// that key's original position.
class Object {
public:
    using Entry = std::pair<std::string, Value>;
    using const_iterator = std::vector<Entry>::const_iterator;

    Object() = default;

    /// Construct from key/value pairs; a repeated key keeps its last value.
    ///
    /// @code
    /// auto o = Object{{"id", "a"}, {"amount", 7000}};
    /// @endcode
    Object(std::initializer_list<Entry> entries);

    /// Look up a key. Returns nullptr when absent.
    auto find(std::string_view key) const -> const Value*;

    auto contains(std::string_view key) const -> bool;

    /// Insert a key or replace its value in place.
    auto insert_or_assign(std::string key, Value value) -> Value&;

    auto size() const noexcept -> std::size_t { return entries_.size(); }
    auto empty() const noexcept -> bool { return entries_.empty(); }

    auto begin() const noexcept -> const_iterator { return entries_.begin(); }
    auto end() const noexcept -> const_iterator { return entries_.end(); }

    /// Keys compare as a set; order does not matter.
    friend auto operator==(const Object& a, const Object& b) -> bool;

private:
    std::vector<Entry> entries_;
};

/// A value in the tree: null, boolean, number, string, array or object.
///
/// Numbers keep their JSON spelling class (signed, unsigned, floating) but
/// compare numerically, so `Value{1}` equals `Value{1.0}`.
struct Value {
    using Storage = std::variant<
        Null,
        bool,
        std::int64_t,
        std::uint64_t,
        double,
        std::string,
        Array,
        Object
    >;

    Storage data{Null{}};

    Value() = default;
    Value(Null) : data{Null{}} {}
    Value(bool b) : data{b} {}
    Value(int i) : data{std::int64_t{i}} {}
    Value(std::int64_t i) : data{i} {}
    Value(std::uint64_t u) : data{u} {}
    Value(double d) : data{d} {}
    Value(const char* s) : data{std::string{s}} {}
    Value(std::string s) : data{std::move(s)} {}
    Value(Array a) : data{std::move(a)} {}
    Value(Object o) : data{std::move(o)} {}

    /// Deep equality with numeric cross-type comparison.
    friend auto operator==(const Value& a, const Value& b) -> bool;
};

/// The JSON-level kind of a value.
auto kind(const Value& v) noexcept -> ValueKind;

/// Check if a Value is null, boolean, number or string.
inline auto is_scalar(const Value& v) noexcept -> bool {
    auto k = kind(v);
    return k != ValueKind::array && k != ValueKind::object;
}

inline auto as_array(const Value& v) noexcept -> const Array* {
    return std::get_if<Array>(&v.data);
}

inline auto as_object(const Value& v) noexcept -> const Object* {
    return std::get_if<Object>(&v.data);
}

/// The canonical spelling of a scalar inside an identity segment.
///
/// Strings are returned as-is, numbers in their shortest round-trip form
/// (`7000`, `3.5`), booleans as `true`/`false`, null as `null`.
/// Arrays and objects have no key spelling and yield nullopt.
auto key_string(const Value& v) -> std::optional<std::string>;

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

// -- Object inline members (need a complete Value) ----------------------------

inline Object::Object(std::initializer_list<Entry> entries) {
    entries_.reserve(entries.size());
    for (const auto& [k, v] : entries) insert_or_assign(k, v);
}

}  // namespace jsondiff_cpp
