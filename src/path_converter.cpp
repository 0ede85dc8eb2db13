#include <jsondiff-cpp/path_converter.hpp>

#include <jsondiff-cpp/identity_key.hpp>
#include <jsondiff-cpp/logging.hpp>

#include <algorithm>
#include <unordered_map>
#include <utility>
#include <vector>

namespace jsondiff_cpp {

namespace {

// Follow a property or index hop. Identity and pattern hops need the
// callers' own handling and yield nullptr here.
auto step(const Value& node, const Segment& seg) -> const Value* {
    if (const auto* p = std::get_if<PropertySegment>(&seg)) {
        const auto* obj = as_object(node);
        return obj ? obj->find(p->name) : nullptr;
    }
    if (const auto* i = std::get_if<IndexSegment>(&seg)) {
        const auto* arr = as_array(node);
        return arr && i->index < arr->size() ? &(*arr)[i->index] : nullptr;
    }
    return nullptr;
}

auto carries(const Value& element, const IdentitySegment& id) -> bool {
    const auto* obj = as_object(element);
    if (!obj) return false;
    return std::ranges::all_of(id.keys, [&](const KeyValue& kv) {
        const auto* v = obj->find(kv.key);
        if (!v) return false;
        auto spelled = key_string(*v);
        return spelled && *spelled == kv.value;
    });
}

auto find_identity(const Array& arr, const IdentitySegment& id) -> std::optional<std::size_t> {
    for (std::size_t i = 0; i < arr.size(); ++i) {
        if (carries(arr[i], id)) return i;
    }
    return std::nullopt;
}

// Catalog spelling of the array reached by `prefix`.
auto pattern_string(const std::vector<Segment>& prefix) -> std::string {
    auto shape = std::vector<Segment>{};
    shape.reserve(prefix.size() + 1);
    for (const auto& s : prefix) {
        if (is_array_hop(s)) {
            shape.emplace_back(PatternSegment{});
        } else {
            shape.push_back(s);
        }
    }
    shape.emplace_back(PatternSegment{});
    return join_segments(shape);
}

auto keys_for(std::span<const IdentityKeyInfo> keys, std::string_view pattern)
    -> std::vector<const IdentityKeyInfo*> {
    auto out = std::vector<const IdentityKeyInfo*>{};
    for (const auto& info : keys) {
        if (info.array_pattern.str() == pattern) out.push_back(&info);
    }
    return out;
}

// The identity hop for arr[index], taken from the first catalogued key
// whose spelling picks out that element alone.
auto identity_hop(std::span<const IdentityKeyInfo> keys, std::string_view pattern,
                  const Array& arr, std::size_t index) -> std::optional<IdentitySegment> {
    for (const auto* info : keys_for(keys, pattern)) {
        auto seg = IdentityKey::parse(info->identity_key).segment_for(arr[index]);
        if (!seg) continue;
        auto hits = std::ranges::count_if(arr, [&](const Value& e) { return carries(e, *seg); });
        if (hits == 1) return seg;
    }
    return std::nullopt;
}

// Follow property, index and identity hops. Pattern hops address no
// single node.
auto walk(std::span<const Segment> segments, const Value& tree) -> const Value* {
    const auto* node = &tree;
    for (const auto& seg : segments) {
        if (const auto* id = std::get_if<IdentitySegment>(&seg)) {
            const auto* arr = as_array(*node);
            auto at = arr ? find_identity(*arr, *id) : std::nullopt;
            node = at ? &(*arr)[*at] : nullptr;
        } else {
            node = step(*node, seg);
        }
        if (!node) return nullptr;
    }
    return node;
}

auto core_of(const std::string& text) -> std::string {
    return std::string{strip_prefixes(text)};
}

auto rooted(std::vector<Segment> segments) -> ParsedPath {
    auto parsed = ParsedPath{};
    parsed.has_root = true;
    parsed.segments = std::move(segments);
    return parsed;
}

// Whether `node` holds the property/[] hops of `rest`.
auto holds(const Value& node, std::span<const Segment> rest) -> bool {
    if (rest.empty()) return true;
    if (const auto* p = std::get_if<PropertySegment>(&rest.front())) {
        const auto* obj = as_object(node);
        const auto* child = obj ? obj->find(p->name) : nullptr;
        return child && holds(*child, rest.subspan(1));
    }
    const auto* arr = as_array(node);
    return arr && std::ranges::any_of(*arr, [&](const Value& e) {
        return holds(e, rest.subspan(1));
    });
}

// Walk pattern hops, choosing at each [] the first element that holds the
// remaining hops (index 0 when none does). Returns the node reached, or
// nullptr once the walk has left the tree.
auto choose_path(std::span<const Segment> segs, const Value* node,
                 std::vector<Segment>& out) -> const Value* {
    for (std::size_t i = 0; i < segs.size(); ++i) {
        if (const auto* p = std::get_if<PropertySegment>(&segs[i])) {
            out.push_back(*p);
            const auto* obj = node ? as_object(*node) : nullptr;
            node = obj ? obj->find(p->name) : nullptr;
            continue;
        }
        const auto* arr = node ? as_array(*node) : nullptr;
        auto chosen = std::size_t{0};
        if (arr) {
            auto rest = segs.subspan(i + 1);
            auto it = std::ranges::find_if(*arr, [&](const Value& e) { return holds(e, rest); });
            if (it != arr->end()) chosen = static_cast<std::size_t>(it - arr->begin());
        }
        out.emplace_back(IndexSegment{chosen});
        node = arr && chosen < arr->size() ? &(*arr)[chosen] : nullptr;
    }
    return node;
}

template <typename T>
auto has_hop(const std::vector<Segment>& segments) -> bool {
    return std::ranges::any_of(segments, [](const Segment& s) {
        return std::holds_alternative<T>(s);
    });
}

auto element_path(std::vector<Segment> prefix, std::size_t index) -> IndexPath {
    prefix.emplace_back(IndexSegment{index});
    return IndexPath::from_parsed(rooted(std::move(prefix)));
}

}  // anonymous namespace

// -- Dialect conversion -------------------------------------------------------

auto identity_to_index(const IdentityPath& path, const ConversionContext& ctx)
    -> std::optional<IndexPath> {
    auto parsed = path.parsed();
    const auto* node = &ctx.tree;
    for (auto& seg : parsed.segments) {
        if (const auto* id = std::get_if<IdentitySegment>(&seg)) {
            const auto* arr = as_array(*node);
            if (!arr) return std::nullopt;
            auto at = find_identity(*arr, *id);
            if (!at) return std::nullopt;
            node = &(*arr)[*at];
            seg = IndexSegment{*at};
            continue;
        }
        node = step(*node, seg);
        if (!node) return std::nullopt;
    }
    return IndexPath::from_parsed(parsed);
}

auto index_to_identity(const IndexPath& path, const ConversionContext& ctx) -> IdentityPath {
    auto parsed = path.parsed();
    auto out = ParsedPath{};
    out.has_root = parsed.has_root;
    out.segments.reserve(parsed.segments.size());

    const auto* node = &ctx.tree;
    for (const auto& seg : parsed.segments) {
        if (node) {
            const auto* ix = std::get_if<IndexSegment>(&seg);
            const auto* arr = ix ? as_array(*node) : nullptr;
            if (arr && ix->index < arr->size()) {
                const auto& element = (*arr)[ix->index];
                auto identity = identity_hop(ctx.identity_keys, pattern_string(out.segments),
                                             *arr, ix->index);
                if (identity) {
                    out.segments.emplace_back(std::move(*identity));
                } else {
                    out.segments.push_back(seg);
                }
                node = &element;
                continue;
            }
            node = step(*node, seg);
        }
        out.segments.push_back(seg);
    }
    return IdentityPath::from_parsed(out);
}

auto translate_to_other_side(const IndexPath& path, const ConversionContext& from,
                             const ConversionContext& to) -> std::optional<IndexPath> {
    return identity_to_index(index_to_identity(path, from), to);
}

auto value_at(const IdentityPath& path, const Value& tree) -> const Value* {
    return walk(path.parsed().segments, tree);
}

auto value_at(const IndexPath& path, const Value& tree) -> const Value* {
    return walk(path.parsed().segments, tree);
}

// -- Normalization ------------------------------------------------------------

auto normalize_for_comparison(std::string_view path) -> std::set<std::string> {
    auto parsed = parse_path(path);
    return {join_segments(parsed.segments)};
}

auto normalize_for_comparison(std::string_view path, const ConversionContext& ctx)
    -> std::set<std::string> {
    auto parsed = parse_path(path);
    auto variants = std::set<std::string>{join_segments(parsed.segments)};

    if (has_hop<PatternSegment>(parsed.segments)) return variants;
    const auto identity = has_hop<IdentitySegment>(parsed.segments);
    const auto index = has_hop<IndexSegment>(parsed.segments);

    auto core = rooted(std::move(parsed.segments));
    if (identity) {
        if (auto resolved = identity_to_index(IdentityPath::from_parsed(core), ctx)) {
            variants.insert(core_of(resolved->str()));
            if (index) variants.insert(core_of(index_to_identity(*resolved, ctx).str()));
        }
    } else if (index) {
        variants.insert(core_of(index_to_identity(IndexPath::from_parsed(core), ctx).str()));
    }
    return variants;
}

namespace {

auto intersects(const std::set<std::string>& a, const std::set<std::string>& b) -> bool {
    return std::ranges::any_of(a, [&](const std::string& s) { return b.contains(s); });
}

}  // anonymous namespace

auto are_equivalent(std::string_view a, std::string_view b) -> bool {
    return intersects(normalize_for_comparison(a), normalize_for_comparison(b));
}

auto are_equivalent(std::string_view a, std::string_view b, const ConversionContext& ctx)
    -> bool {
    return intersects(normalize_for_comparison(a, ctx), normalize_for_comparison(b, ctx));
}

// -- Patterns and viewers -----------------------------------------------------

auto resolve_array_pattern(const ArrayPatternPath& pattern, const Value& tree) -> IndexPath {
    auto parsed = pattern.parsed();
    auto out = std::vector<Segment>{};
    out.reserve(parsed.segments.size());
    choose_path(parsed.segments, &tree, out);
    return IndexPath::from_parsed(rooted(std::move(out)));
}

auto to_viewer_path(const IdentityPath& path, Viewer viewer, const ConversionContext& ctx)
    -> std::optional<ViewerPath> {
    auto resolved = identity_to_index(path, ctx);
    if (!resolved) return std::nullopt;
    return ViewerPath::make(viewer, *resolved);
}

auto match_array_pattern(const ArrayPatternPath& pattern, const Value& left, const Value& right,
                         std::span<const IdentityKeyInfo> identity_keys) -> PatternMatch {
    auto parsed = pattern.parsed();
    const auto outer = std::span<const Segment>{parsed.segments}.first(parsed.segments.size() - 1);

    auto left_prefix = std::vector<Segment>{};
    auto right_prefix = std::vector<Segment>{};
    const auto* left_node = choose_path(outer, &left, left_prefix);
    const auto* right_node = choose_path(outer, &right, right_prefix);
    const auto* left_arr = left_node ? as_array(*left_node) : nullptr;
    const auto* right_arr = right_node ? as_array(*right_node) : nullptr;

    const auto candidates = keys_for(identity_keys, pattern.str());
    if (left_arr && right_arr) {
        for (const auto* info : candidates) {
            auto key = IdentityKey::parse(info->identity_key);
            auto right_index = std::unordered_map<std::string, std::size_t>{};
            for (std::size_t j = 0; j < right_arr->size(); ++j) {
                if (auto t = key.token_of((*right_arr)[j])) right_index.emplace(std::move(*t), j);
            }
            for (std::size_t i = 0; i < left_arr->size(); ++i) {
                auto t = key.token_of((*left_arr)[i]);
                if (!t) continue;
                if (auto it = right_index.find(*t); it != right_index.end()) {
                    return PatternMatch{element_path(left_prefix, i),
                                        element_path(right_prefix, it->second),
                                        key.value_of((*left_arr)[i])};
                }
            }
        }
    }
    if (candidates.empty()) {
        logger()->debug("no identity key catalogued for {}", pattern.str());
    }

    auto match = PatternMatch{};
    if (left_arr && !left_arr->empty()) match.left = element_path(left_prefix, 0);
    if (right_arr && !right_arr->empty()) match.right = element_path(right_prefix, 0);
    return match;
}

}  // namespace jsondiff_cpp
