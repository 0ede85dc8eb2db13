#include <jsondiff-cpp/identity_key.hpp>

#include <jsondiff-cpp/error.hpp>

#include "text.hpp"

#include <algorithm>
#include <string>
#include <unordered_set>

namespace jsondiff_cpp {

namespace {

auto preference_rank(std::string_view name, const std::vector<std::string>& preferred)
    -> std::size_t {
    auto lower = detail::lowercase(name);
    for (std::size_t i = 0; i < preferred.size(); ++i) {
        if (detail::lowercase(preferred[i]) == lower) return i;
    }
    return preferred.size();
}

// Candidate names from the sample object, preferred names first.
auto candidate_names(const Object& sample, const std::vector<std::string>& preferred)
    -> std::vector<std::string> {
    auto names = std::vector<std::string>{};
    names.reserve(sample.size());
    for (const auto& [key, value] : sample) names.push_back(key);
    std::ranges::stable_sort(names, [&](const std::string& a, const std::string& b) {
        auto ra = preference_rank(a, preferred);
        auto rb = preference_rank(b, preferred);
        if (ra != rb) return ra < rb;
        return a < b;
    });
    return names;
}

auto collect_objects(const Array& arr) -> std::vector<const Object*> {
    auto out = std::vector<const Object*>{};
    out.reserve(arr.size());
    for (const auto& v : arr) {
        if (const auto* o = as_object(v)) out.push_back(o);
    }
    return out;
}

auto identity_scalar(const Value* v) -> bool {
    if (!v) return false;
    auto k = kind(*v);
    return k == ValueKind::string || k == ValueKind::number;
}

auto object_segment(const Object& obj, const std::vector<std::string>& names)
    -> std::optional<IdentitySegment> {
    auto seg = IdentitySegment{};
    seg.keys.reserve(names.size());
    for (const auto& n : names) {
        const auto* v = obj.find(n);
        if (!identity_scalar(v)) return std::nullopt;
        seg.keys.push_back(KeyValue{n, *key_string(*v)});
    }
    return seg;
}

auto joined_values(const IdentitySegment& seg) -> std::string {
    auto out = std::string{};
    for (std::size_t i = 0; i < seg.keys.size(); ++i) {
        if (i > 0) out.push_back('|');
        out.append(seg.keys[i].value);
    }
    return out;
}

// Each value tagged with its kind and length, so that 1 and "1" differ and
// ("x|y", "z") differs from ("x", "y|z").
auto object_token(const Object& obj, const std::vector<std::string>& names)
    -> std::optional<std::string> {
    auto out = std::string{};
    for (const auto& n : names) {
        const auto* v = obj.find(n);
        if (!identity_scalar(v)) return std::nullopt;
        auto spelled = *key_string(*v);
        out.push_back(kind(*v) == ValueKind::string ? 's' : 'n');
        out.append(std::to_string(spelled.size()));
        out.push_back(':');
        out.append(spelled);
    }
    return out;
}

// Tokens of one side, or nullopt on a missing key or when two elements
// would be addressed by the same identity segment.
auto unique_values(const std::vector<const Object*>& objects, const IdentityKey& key)
    -> std::optional<std::unordered_set<std::string>> {
    auto spellings = std::unordered_set<std::string>{};
    auto tokens = std::unordered_set<std::string>{};
    spellings.reserve(objects.size());
    tokens.reserve(objects.size());
    for (const auto* obj : objects) {
        auto seg = object_segment(*obj, key.names());
        if (!seg || !spellings.insert(to_string(Segment{*seg})).second) return std::nullopt;
        tokens.insert(*object_token(*obj, key.names()));
    }
    return tokens;
}

auto passes(const std::vector<const Object*>& left, const std::vector<const Object*>& right,
            const IdentityKey& key, const DetectorOptions& options) -> bool {
    auto lv = unique_values(left, key);
    if (!lv) return false;
    auto rv = unique_values(right, key);
    if (!rv) return false;
    if (left.empty() || right.empty()) return !(left.empty() && right.empty());

    auto common = std::size_t{0};
    for (const auto& v : *lv) {
        if (rv->contains(v)) ++common;
    }
    auto smaller = std::min(lv->size(), rv->size());
    return static_cast<double>(common) / static_cast<double>(smaller) >= options.min_overlap_ratio;
}

}  // anonymous namespace

void validate(const DetectorOptions& options) {
    if (options.min_object_proportion < 0.0 || options.min_object_proportion > 1.0) {
        throw OptionsError{"min_object_proportion must be within [0, 1]"};
    }
    if (options.min_overlap_ratio < 0.0 || options.min_overlap_ratio > 1.0) {
        throw OptionsError{"min_overlap_ratio must be within [0, 1]"};
    }
    if (options.max_composite_arity < 1 || options.max_composite_arity > 3) {
        throw OptionsError{"max_composite_arity must be 1, 2 or 3"};
    }
}

// -- IdentityKey --------------------------------------------------------------

IdentityKey::IdentityKey(std::vector<std::string> names) : names_{std::move(names)} {}

auto IdentityKey::parse(std::string_view spelling) -> IdentityKey {
    auto names = std::vector<std::string>{};
    std::size_t pos = 0;
    while (true) {
        auto plus = spelling.find('+', pos);
        names.emplace_back(spelling.substr(pos, plus == std::string_view::npos ? plus : plus - pos));
        if (plus == std::string_view::npos) break;
        pos = plus + 1;
    }
    return IdentityKey{std::move(names)};
}

auto IdentityKey::name() const -> std::string {
    auto out = std::string{};
    for (const auto& n : names_) {
        if (!out.empty()) out.push_back('+');
        out.append(n);
    }
    return out;
}

auto IdentityKey::value_of(const Value& element) const -> std::optional<std::string> {
    auto seg = segment_for(element);
    if (!seg) return std::nullopt;
    return joined_values(*seg);
}

auto IdentityKey::token_of(const Value& element) const -> std::optional<std::string> {
    const auto* obj = as_object(element);
    if (!obj) return std::nullopt;
    return object_token(*obj, names_);
}

auto IdentityKey::segment_for(const Value& element) const -> std::optional<IdentitySegment> {
    const auto* obj = as_object(element);
    if (!obj) return std::nullopt;
    return object_segment(*obj, names_);
}

auto IdentityKey::matches(const Value& element, const IdentitySegment& segment) const -> bool {
    auto seg = segment_for(element);
    return seg && *seg == segment;
}

// -- Detection ----------------------------------------------------------------

auto detect_identity_key(const Array& left, const Array& right,
                         const DetectorOptions& options) -> std::optional<IdentityKey> {
    if (left.size() <= 1 && right.size() <= 1) return std::nullopt;

    const auto lobj = collect_objects(left);
    const auto robj = collect_objects(right);

    auto mostly_objects = [&](const Array& arr, const std::vector<const Object*>& objs) {
        if (arr.empty()) return true;
        return static_cast<double>(objs.size()) / static_cast<double>(arr.size())
               >= options.min_object_proportion;
    };
    if (!mostly_objects(left, lobj) || !mostly_objects(right, robj)) return std::nullopt;
    if (lobj.empty() && robj.empty()) return std::nullopt;

    const auto* sample = !lobj.empty() ? lobj.front() : robj.front();
    const auto names = candidate_names(*sample, options.preferred_keys);
    const auto n = names.size();

    for (std::size_t i = 0; i < n; ++i) {
        auto key = IdentityKey{std::vector<std::string>{names[i]}};
        if (passes(lobj, robj, key, options)) return key;
    }
    if (options.max_composite_arity >= 2) {
        for (std::size_t i = 0; i < n; ++i) {
            for (std::size_t j = i + 1; j < n; ++j) {
                auto key = IdentityKey{std::vector<std::string>{names[i], names[j]}};
                if (passes(lobj, robj, key, options)) return key;
            }
        }
    }
    if (options.max_composite_arity >= 3) {
        for (std::size_t i = 0; i < n; ++i) {
            for (std::size_t j = i + 1; j < n; ++j) {
                for (std::size_t k = j + 1; k < n; ++k) {
                    auto key = IdentityKey{std::vector<std::string>{names[i], names[j], names[k]}};
                    if (passes(lobj, robj, key, options)) return key;
                }
            }
        }
    }
    return std::nullopt;
}

}  // namespace jsondiff_cpp
