#include <jsondiff-cpp/path.hpp>

#include <jsondiff-cpp/error.hpp>
#include <jsondiff-cpp/value.hpp>

#include <algorithm>
#include <ranges>
#include <string>

namespace jsondiff_cpp {

namespace {

[[noreturn]] void wrong_dialect(std::string_view dialect, const ParsedPath& parsed,
                                std::string_view reason) {
    auto msg = std::string{"\""};
    msg.append(to_string(parsed));
    msg.append("\" is not a valid ");
    msg.append(dialect);
    msg.append(": ");
    msg.append(reason);
    throw PathError{ErrorKind::wrong_dialect, std::move(msg)};
}

auto is_identity(const Segment& s) noexcept -> bool {
    return std::holds_alternative<IdentitySegment>(s);
}

auto is_pattern(const Segment& s) noexcept -> bool {
    return std::holds_alternative<PatternSegment>(s);
}

auto is_index(const Segment& s) noexcept -> bool {
    return std::holds_alternative<IndexSegment>(s);
}

}  // anonymous namespace

// -- IndexPath ----------------------------------------------------------------

IndexPath::IndexPath() : text_{root_marker} {}

auto IndexPath::parse(std::string_view text) -> IndexPath {
    return from_parsed(parse_path(text));
}

auto IndexPath::from_parsed(const ParsedPath& parsed) -> IndexPath {
    if (parsed.viewer) wrong_dialect("IndexPath", parsed, "viewer prefix belongs to ViewerPath");
    if (std::ranges::any_of(parsed.segments, is_identity)) {
        wrong_dialect("IndexPath", parsed, "contains an identity segment");
    }
    if (std::ranges::any_of(parsed.segments, is_pattern)) {
        wrong_dialect("IndexPath", parsed, "contains a pattern segment");
    }
    return IndexPath{to_string(parsed)};
}

// -- IdentityPath -------------------------------------------------------------

IdentityPath::IdentityPath() : text_{root_marker} {}

auto IdentityPath::parse(std::string_view text) -> IdentityPath {
    return from_parsed(parse_path(text));
}

auto IdentityPath::from_parsed(const ParsedPath& parsed) -> IdentityPath {
    if (parsed.viewer) {
        wrong_dialect("IdentityPath", parsed, "identity paths are viewer-agnostic");
    }
    if (std::ranges::any_of(parsed.segments, is_pattern)) {
        wrong_dialect("IdentityPath", parsed, "contains a pattern segment");
    }
    return IdentityPath{to_string(parsed)};
}

auto IdentityPath::from(const IndexPath& path) -> IdentityPath {
    return IdentityPath{path.str()};
}

// -- ArrayPatternPath ---------------------------------------------------------

auto ArrayPatternPath::parse(std::string_view text) -> ArrayPatternPath {
    return from_parsed(parse_path(text));
}

auto ArrayPatternPath::from_parsed(const ParsedPath& parsed) -> ArrayPatternPath {
    if (parsed.viewer) wrong_dialect("ArrayPatternPath", parsed, "patterns describe shape only");
    if (std::ranges::any_of(parsed.segments, [](const Segment& s) {
            return is_index(s) || is_identity(s);
        })) {
        wrong_dialect("ArrayPatternPath", parsed, "contains a concrete array hop");
    }
    if (parsed.segments.empty() || !is_pattern(parsed.segments.back())) {
        wrong_dialect("ArrayPatternPath", parsed, "must end with []");
    }
    return ArrayPatternPath{join_segments(parsed.segments)};
}

// -- ViewerPath ---------------------------------------------------------------

auto ViewerPath::make(Viewer viewer, const IndexPath& path) -> ViewerPath {
    return ViewerPath{viewer, path};
}

auto ViewerPath::parse(std::string_view text) -> ViewerPath {
    auto parsed = parse_path(text);
    if (!parsed.viewer) {
        wrong_dialect("ViewerPath", parsed, "missing left_/right_ prefix");
    }
    auto viewer = *parsed.viewer;
    parsed.viewer.reset();
    return ViewerPath{viewer, IndexPath::from_parsed(parsed)};
}

auto ViewerPath::str() const -> std::string {
    auto out = std::string{to_string_view(viewer_)};
    out.push_back('_');
    out.append(path_.str());
    return out;
}

// -- Dialect inspection -------------------------------------------------------

auto detect_dialect(std::string_view text) -> PathDialect {
    auto parsed = parse_path(text);
    const auto identity = std::ranges::any_of(parsed.segments, is_identity);
    const auto pattern = std::ranges::any_of(parsed.segments, is_pattern);
    if (pattern) {
        if (identity || std::ranges::any_of(parsed.segments, is_index)) {
            throw PathError{ErrorKind::wrong_dialect,
                            "path mixes [] with concrete array hops: " + std::string{text}};
        }
        return PathDialect::pattern;
    }
    return identity ? PathDialect::identity : PathDialect::index;
}

auto has_identity_segments(const IdentityPath& path) -> bool {
    return std::ranges::any_of(path.parsed().segments, is_identity);
}

auto is_pure_index(const IdentityPath& path) -> bool {
    return !has_identity_segments(path);
}

// -- Array pattern utilities --------------------------------------------------

auto array_pattern_of(const IdentityPath& array_location) -> ArrayPatternPath {
    auto parsed = array_location.parsed();
    auto shape = ParsedPath{};
    shape.segments.reserve(parsed.segments.size() + 1);
    for (auto& s : parsed.segments) {
        if (is_array_hop(s)) {
            shape.segments.emplace_back(PatternSegment{});
        } else {
            shape.segments.push_back(std::move(s));
        }
    }
    shape.segments.emplace_back(PatternSegment{});
    return ArrayPatternPath::from_parsed(shape);
}

auto array_depth(const ArrayPatternPath& pattern) -> std::size_t {
    auto parsed = pattern.parsed();
    return static_cast<std::size_t>(std::ranges::count_if(parsed.segments, is_pattern));
}

auto target_array_property(const ArrayPatternPath& pattern) -> std::optional<std::string> {
    auto parsed = pattern.parsed();
    const auto& segs = parsed.segments;
    if (segs.size() < 2) return std::nullopt;
    if (const auto* p = std::get_if<PropertySegment>(&segs[segs.size() - 2])) {
        return p->name;
    }
    return std::nullopt;
}

auto parent_array_pattern(const ArrayPatternPath& pattern) -> std::optional<ArrayPatternPath> {
    auto parsed = pattern.parsed();
    auto& segs = parsed.segments;
    // The last segment is always the described array's own hop.
    auto it = std::find_if(std::next(segs.rbegin()), segs.rend(), is_pattern);
    if (it == segs.rend()) return std::nullopt;
    segs.erase(it.base(), segs.end());
    return ArrayPatternPath::from_parsed(parsed);
}

}  // namespace jsondiff_cpp
