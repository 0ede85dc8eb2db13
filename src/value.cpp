#include <jsondiff-cpp/value.hpp>

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <string>
#include <system_error>

namespace jsondiff_cpp {

namespace {

// Numeric view of a value; nullopt when the value is not a number.
struct Number {
    enum class Form : std::uint8_t { signed_int, unsigned_int, floating };
    Form form;
    std::int64_t i{0};
    std::uint64_t u{0};
    double d{0.0};
};

auto as_number(const Value& v) -> std::optional<Number> {
    return std::visit(overload{
        [](std::int64_t i) -> std::optional<Number> {
            return Number{Number::Form::signed_int, i, 0, 0.0};
        },
        [](std::uint64_t u) -> std::optional<Number> {
            return Number{Number::Form::unsigned_int, 0, u, 0.0};
        },
        [](double d) -> std::optional<Number> {
            return Number{Number::Form::floating, 0, 0, d};
        },
        [](const auto&) -> std::optional<Number> { return std::nullopt; },
    }, v.data);
}

auto to_double(const Number& n) -> double {
    switch (n.form) {
        case Number::Form::signed_int:   return static_cast<double>(n.i);
        case Number::Form::unsigned_int: return static_cast<double>(n.u);
        case Number::Form::floating:     return n.d;
    }
    return 0.0;
}

auto numbers_equal(const Number& a, const Number& b) -> bool {
    using F = Number::Form;
    if (a.form == F::floating || b.form == F::floating) {
        return to_double(a) == to_double(b);
    }
    if (a.form == F::signed_int && b.form == F::signed_int) return a.i == b.i;
    if (a.form == F::unsigned_int && b.form == F::unsigned_int) return a.u == b.u;
    const auto& s = a.form == F::signed_int ? a : b;
    const auto& u = a.form == F::unsigned_int ? a : b;
    return s.i >= 0 && static_cast<std::uint64_t>(s.i) == u.u;
}

template <typename T>
auto integer_to_string(T value) -> std::string {
    auto buf = std::array<char, 32>{};
    auto [end, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), value);
    return std::string{buf.data(), end};
}

auto double_to_string(double d) -> std::string {
    if (std::isnan(d)) return "NaN";
    if (std::isinf(d)) return d > 0 ? "Infinity" : "-Infinity";
    // Integral doubles print without a fraction, like JSON numbers do.
    if (d == std::trunc(d) && std::fabs(d) < 1e15) {
        return integer_to_string(static_cast<std::int64_t>(d));
    }
    auto buf = std::array<char, 64>{};
    auto [end, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), d);
    if (ec != std::errc{}) return std::to_string(d);
    return std::string{buf.data(), end};
}

}  // anonymous namespace

// -- Object -------------------------------------------------------------------

auto Object::find(std::string_view key) const -> const Value* {
    auto it = std::ranges::find_if(entries_, [&](const Entry& e) {
        return e.first == key;
    });
    return it == entries_.end() ? nullptr : &it->second;
}

auto Object::contains(std::string_view key) const -> bool {
    return find(key) != nullptr;
}

auto Object::insert_or_assign(std::string key, Value value) -> Value& {
    auto it = std::ranges::find_if(entries_, [&](const Entry& e) {
        return e.first == key;
    });
    if (it != entries_.end()) {
        it->second = std::move(value);
        return it->second;
    }
    entries_.emplace_back(std::move(key), std::move(value));
    return entries_.back().second;
}

auto operator==(const Object& a, const Object& b) -> bool {
    if (a.size() != b.size()) return false;
    for (const auto& [key, value] : a) {
        const auto* other = b.find(key);
        if (!other || !(value == *other)) return false;
    }
    return true;
}

// -- Value --------------------------------------------------------------------

auto kind(const Value& v) noexcept -> ValueKind {
    return std::visit(overload{
        [](Null) { return ValueKind::null; },
        [](bool) { return ValueKind::boolean; },
        [](std::int64_t) { return ValueKind::number; },
        [](std::uint64_t) { return ValueKind::number; },
        [](double) { return ValueKind::number; },
        [](const std::string&) { return ValueKind::string; },
        [](const Array&) { return ValueKind::array; },
        [](const Object&) { return ValueKind::object; },
    }, v.data);
}

auto operator==(const Value& a, const Value& b) -> bool {
    if (&a == &b) return true;
    const auto ka = kind(a);
    if (ka != kind(b)) return false;
    switch (ka) {
        case ValueKind::null:
            return true;
        case ValueKind::boolean:
            return std::get<bool>(a.data) == std::get<bool>(b.data);
        case ValueKind::number:
            return numbers_equal(*as_number(a), *as_number(b));
        case ValueKind::string:
            return std::get<std::string>(a.data) == std::get<std::string>(b.data);
        case ValueKind::array: {
            const auto& xa = std::get<Array>(a.data);
            const auto& xb = std::get<Array>(b.data);
            return std::ranges::equal(xa, xb);
        }
        case ValueKind::object:
            return std::get<Object>(a.data) == std::get<Object>(b.data);
    }
    return false;
}

auto key_string(const Value& v) -> std::optional<std::string> {
    return std::visit(overload{
        [](Null) -> std::optional<std::string> { return "null"; },
        [](bool b) -> std::optional<std::string> { return b ? "true" : "false"; },
        [](std::int64_t i) -> std::optional<std::string> { return integer_to_string(i); },
        [](std::uint64_t u) -> std::optional<std::string> { return integer_to_string(u); },
        [](double d) -> std::optional<std::string> { return double_to_string(d); },
        [](const std::string& s) -> std::optional<std::string> { return s; },
        [](const Array&) -> std::optional<std::string> { return std::nullopt; },
        [](const Object&) -> std::optional<std::string> { return std::nullopt; },
    }, v.data);
}

}  // namespace jsondiff_cpp
