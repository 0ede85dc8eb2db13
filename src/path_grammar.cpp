#include <jsondiff-cpp/path_grammar.hpp>

#include <jsondiff-cpp/error.hpp>
#include <jsondiff-cpp/value.hpp>

#include <algorithm>
#include <charconv>
#include <string>
#include <system_error>

namespace jsondiff_cpp {

namespace {

[[noreturn]] void fail(std::string_view text, std::string_view reason) {
    auto msg = std::string{"malformed path \""};
    msg.append(text);
    msg.append("\": ");
    msg.append(reason);
    throw PathError{ErrorKind::malformed_path, std::move(msg)};
}

auto is_digits(std::string_view s) noexcept -> bool {
    return !s.empty() && std::ranges::all_of(s, [](char c) {
        return c >= '0' && c <= '9';
    });
}

// Strip "left_" / "right_" and report which one was present.
auto take_viewer(std::string_view& rest) noexcept -> std::optional<Viewer> {
    for (auto v : {Viewer::left, Viewer::right}) {
        auto name = to_string_view(v);
        if (rest.size() > name.size() && rest.starts_with(name) &&
            rest[name.size()] == '_') {
            rest.remove_prefix(name.size() + 1);
            return v;
        }
    }
    return std::nullopt;
}

// Strip a leading root marker followed by end, "." or "[".
auto take_root(std::string_view& rest) noexcept -> bool {
    if (!rest.starts_with(root_marker)) return false;
    if (rest.size() == root_marker.size()) {
        rest = {};
        return true;
    }
    auto next = rest[root_marker.size()];
    if (next == '.') {
        rest.remove_prefix(root_marker.size() + 1);
        return true;
    }
    if (next == '[') {
        rest.remove_prefix(root_marker.size());
        return true;
    }
    return false;
}

// Position of the ']' closing the bracket opened at `open`, or npos.
// A backslash escapes the next character. A body that starts with '"' is a
// quoted property name and must close its quote right before the ']'.
auto bracket_end(std::string_view text, std::size_t open) noexcept -> std::size_t {
    auto i = open + 1;
    if (i < text.size() && text[i] == '"') {
        for (++i; i < text.size(); ++i) {
            if (text[i] == '\\') {
                ++i;
            } else if (text[i] == '"') {
                return i + 1 < text.size() && text[i + 1] == ']' ? i + 1 : std::string_view::npos;
            }
        }
        return std::string_view::npos;
    }
    for (; i < text.size(); ++i) {
        if (text[i] == '\\') {
            ++i;
        } else if (text[i] == ']') {
            return i;
        }
    }
    return std::string_view::npos;
}

auto find_unescaped(std::string_view s, char c, std::size_t from = 0) noexcept -> std::size_t {
    for (auto i = from; i < s.size(); ++i) {
        if (s[i] == '\\') {
            ++i;
        } else if (s[i] == c) {
            return i;
        }
    }
    return std::string_view::npos;
}

auto unescape(std::string_view s) -> std::string {
    auto out = std::string{};
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\\' && i + 1 < s.size()) ++i;
        out.push_back(s[i]);
    }
    return out;
}

void append_escaped(std::string& out, std::string_view s, std::string_view special) {
    for (auto c : s) {
        if (c == '\\' || special.find(c) != std::string_view::npos) out.push_back('\\');
        out.push_back(c);
    }
}

// Names that a bare spelling would lose: separators, escapes, the empty
// name, and leading names the prefix scanner would swallow.
auto needs_quotes(std::string_view name, bool first) noexcept -> bool {
    if (name.empty() || name.find_first_of(".[]\\\"") != std::string_view::npos) return true;
    if (!first) return false;
    auto rest = name;
    return take_viewer(rest).has_value() || take_root(rest);
}

auto property_string(std::string_view name, bool first) -> std::string {
    if (!needs_quotes(name, first)) return std::string{name};
    auto out = std::string{"[\""};
    append_escaped(out, name, "\"");
    out.append("\"]");
    return out;
}

auto parse_identity(std::string_view text, std::string_view body) -> IdentitySegment {
    auto seg = IdentitySegment{};
    std::size_t pos = 0;
    while (pos <= body.size()) {
        auto bar = find_unescaped(body, '|', pos);
        auto piece = body.substr(pos, bar == std::string_view::npos ? bar : bar - pos);
        auto eq = find_unescaped(piece, '=');
        if (eq == std::string_view::npos || eq == 0) {
            // A '|' that does not start a key=value pair belongs to the value.
            if (seg.keys.empty()) fail(text, "identity segment without key=value");
            seg.keys.back().value.push_back('|');
            seg.keys.back().value.append(unescape(piece));
        } else {
            seg.keys.push_back(KeyValue{unescape(piece.substr(0, eq)),
                                        unescape(piece.substr(eq + 1))});
        }
        if (bar == std::string_view::npos) break;
        pos = bar + 1;
    }
    return seg;
}

auto parse_bracket(std::string_view text, std::string_view body) -> Segment {
    if (body.empty()) return PatternSegment{};
    if (body.front() == '"') return PropertySegment{unescape(body.substr(1, body.size() - 2))};
    if (is_digits(body)) {
        auto index = std::size_t{0};
        auto [ptr, ec] = std::from_chars(body.data(), body.data() + body.size(), index);
        if (ec != std::errc{}) fail(text, "array index out of range");
        return IndexSegment{index};
    }
    if (find_unescaped(body, '=') != std::string_view::npos) return parse_identity(text, body);
    fail(text, "bracket is neither an index, an identity nor a pattern");
}

}  // anonymous namespace

auto parse_viewer(std::string_view text) noexcept -> std::optional<Viewer> {
    if (text == to_string_view(Viewer::left)) return Viewer::left;
    if (text == to_string_view(Viewer::right)) return Viewer::right;
    return std::nullopt;
}

auto parse_path(std::string_view text) -> ParsedPath {
    auto result = ParsedPath{};
    auto rest = text;
    result.viewer = take_viewer(rest);
    result.has_root = take_root(rest);

    std::size_t pos = 0;
    bool first = true;
    while (pos < rest.size()) {
        auto c = rest[pos];
        if (c == '[') {
            auto close = bracket_end(rest, pos);
            if (close == std::string_view::npos) fail(text, "unterminated '['");
            result.segments.push_back(parse_bracket(text, rest.substr(pos + 1, close - pos - 1)));
            pos = close + 1;
            if (pos < rest.size() && rest[pos] != '.' && rest[pos] != '[') {
                fail(text, "unexpected character after ']'");
            }
        } else if (c == ']') {
            fail(text, "unbalanced ']'");
        } else {
            if (c == '.') {
                if (first) fail(text, "path starts with '.'");
                ++pos;
            }
            auto end = rest.find_first_of(".[]", pos);
            if (end == std::string_view::npos) end = rest.size();
            if (end == pos) fail(text, "empty property name");
            if (end < rest.size() && rest[end] == ']') fail(text, "unbalanced ']'");
            result.segments.push_back(PropertySegment{std::string{rest.substr(pos, end - pos)}});
            pos = end;
        }
        first = false;
    }
    return result;
}

namespace {

auto segment_string(const Segment& segment, bool first) -> std::string {
    return std::visit(overload{
        [first](const PropertySegment& p) { return property_string(p.name, first); },
        [](const IndexSegment& i) { return "[" + std::to_string(i.index) + "]"; },
        [](const IdentitySegment& id) {
            auto out = std::string{"["};
            for (std::size_t k = 0; k < id.keys.size(); ++k) {
                if (k > 0) out.push_back('|');
                append_escaped(out, id.keys[k].key, "]|=\"");
                out.push_back('=');
                append_escaped(out, id.keys[k].value, "]|=\"");
            }
            out.push_back(']');
            return out;
        },
        [](const PatternSegment&) { return std::string{"[]"}; },
    }, segment);
}

}  // anonymous namespace

auto to_string(const Segment& segment) -> std::string {
    return segment_string(segment, false);
}

auto join_segments(std::span<const Segment> segments) -> std::string {
    auto out = std::string{};
    for (const auto& s : segments) {
        auto hop = segment_string(s, out.empty());
        if (!out.empty() && hop.front() != '[') out.push_back('.');
        out.append(hop);
    }
    return out;
}

auto to_string(const ParsedPath& path) -> std::string {
    auto out = std::string{};
    if (path.viewer) {
        out.append(to_string_view(*path.viewer));
        out.push_back('_');
    }
    auto core = join_segments(path.segments);
    if (path.has_root) {
        out.append(root_marker);
        if (!core.empty() && core.front() != '[') out.push_back('.');
    }
    out.append(core);
    return out;
}

auto strip_prefixes(std::string_view text) noexcept -> std::string_view {
    auto rest = text;
    take_viewer(rest);
    take_root(rest);
    return rest;
}

auto segment_count(std::string_view core) noexcept -> std::size_t {
    if (core.empty()) return 0;
    std::size_t count = core.front() == '[' ? 0 : 1;
    for (std::size_t i = 0; i < core.size(); ++i) {
        if (core[i] == '.') {
            ++count;
        } else if (core[i] == '[') {
            ++count;
            auto close = bracket_end(core, i);
            if (close == std::string_view::npos) break;
            i = close;
        }
    }
    return count;
}

auto is_strict_ancestor(std::string_view ancestor,
                        std::string_view descendant) noexcept -> bool {
    if (ancestor.empty()) return !descendant.empty();
    if (descendant.size() <= ancestor.size()) return false;
    if (!descendant.starts_with(ancestor)) return false;
    auto sep = descendant[ancestor.size()];
    if (sep != '.' && sep != '[') return false;
    return segment_count(ancestor) < segment_count(descendant);
}

}  // namespace jsondiff_cpp
