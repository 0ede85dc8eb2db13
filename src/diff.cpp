#include <jsondiff-cpp/diff.hpp>

#include <jsondiff-cpp/error.hpp>
#include <jsondiff-cpp/logging.hpp>

#include "text.hpp"

#include <algorithm>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>

namespace jsondiff_cpp {

namespace {

// An element of a keyed array, remembered with its original position.
struct KeyedElement {
    std::string value;        // |-joined identity value, the sort key
    std::string token;        // kind-tagged value, the correlation key
    IdentitySegment segment;  // [key=value] hop addressing the element
    const Value* element;
};

class Differ {
public:
    explicit Differ(const CompareOptions& options)
        : options_{options}, root_{parse_path(options.root_path)} {}

    void run(const Value& left, const Value& right) {
        auto path = root_.segments;
        compare_values(left, right, path);
    }

    auto take() -> CompareResult { return std::move(result_); }

private:
    using Segments = std::vector<Segment>;

    auto path_of(const Segments& segments) const -> IdentityPath {
        auto parsed = ParsedPath{};
        parsed.has_root = root_.has_root;
        parsed.segments = segments;
        return IdentityPath::from_parsed(parsed);
    }

    void trace(TraceEventKind kind, const IdentityPath& path, std::string_view detail) {
        if (options_.observer) {
            options_.observer(TraceEvent{kind, path.str(), detail});
        }
    }

    void emit(DiffRecord record) {
        logger()->trace("{} {}", to_string_view(record.kind), record.path.str());
        trace(TraceEventKind::diff_emitted, record.path, to_string_view(record.kind));
        result_.diffs.push_back(std::move(record));
    }

    void compare_values(const Value& left, const Value& right, Segments& path) {
        const auto lk = kind(left);
        const auto rk = kind(right);
        if (lk != rk) {
            emit(DiffRecord::changed(path_of(path), left, right));
            return;
        }
        if (lk == ValueKind::array) {
            compare_arrays(std::get<Array>(left.data), std::get<Array>(right.data), path);
        } else if (lk == ValueKind::object) {
            compare_objects(std::get<Object>(left.data), std::get<Object>(right.data), path);
        } else if (!(left == right)) {
            emit(DiffRecord::changed(path_of(path), left, right));
        }
    }

    void compare_objects(const Object& left, const Object& right, Segments& path) {
        for (const auto& [key, lv] : left) {
            path.emplace_back(PropertySegment{key});
            if (const auto* rv = right.find(key)) {
                compare_values(lv, *rv, path);
            } else {
                emit(DiffRecord::removed(path_of(path), lv));
            }
            path.pop_back();
        }
        for (const auto& [key, rv] : right) {
            if (left.contains(key)) continue;
            path.emplace_back(PropertySegment{key});
            emit(DiffRecord::added(path_of(path), rv));
            path.pop_back();
        }
    }

    void compare_arrays(const Array& left, const Array& right, Segments& path) {
        auto key = detect_identity_key(left, right, options_.detector);
        const auto here = path_of(path);
        if (key) {
            auto name = key->name();
            logger()->debug("identity key '{}' correlates {}", name, here.str());
            trace(TraceEventKind::identity_key_detected, here, name);
            record_identity_key(here, *key, left.size(), right.size());
            compare_keyed(left, right, *key, path);
        } else {
            trace(TraceEventKind::positional_fallback, here, {});
            if (options_.sort_primitive_arrays && all_scalars(left) && all_scalars(right)) {
                compare_unordered_scalars(left, right, path);
            } else {
                compare_positional(left, right, path);
            }
        }
    }

    void record_identity_key(const IdentityPath& array_location, const IdentityKey& key,
                             std::size_t size_left, std::size_t size_right) {
        auto info = IdentityKeyInfo{
            array_pattern_of(array_location),
            key.name(),
            key.is_composite(),
            size_left,
            size_right,
        };
        if (seen_keys_.emplace(info.array_pattern.str(), info.identity_key).second) {
            result_.identity_keys.push_back(std::move(info));
        }
    }

    static auto keyed_elements(const Array& arr, const IdentityKey& key,
                               std::vector<std::size_t>& unkeyed) -> std::vector<KeyedElement> {
        auto out = std::vector<KeyedElement>{};
        out.reserve(arr.size());
        for (std::size_t i = 0; i < arr.size(); ++i) {
            if (auto seg = key.segment_for(arr[i])) {
                out.push_back(KeyedElement{*key.value_of(arr[i]), *key.token_of(arr[i]),
                                           std::move(*seg), &arr[i]});
            } else {
                unkeyed.push_back(i);
            }
        }
        std::ranges::stable_sort(out, {}, &KeyedElement::value);
        return out;
    }

    void compare_keyed(const Array& left, const Array& right, const IdentityKey& key,
                       Segments& path) {
        auto left_rest = std::vector<std::size_t>{};
        auto right_rest = std::vector<std::size_t>{};
        const auto lkeyed = keyed_elements(left, key, left_rest);
        const auto rkeyed = keyed_elements(right, key, right_rest);
        const auto key_name = key.name();

        auto by_token = std::unordered_map<std::string_view, const KeyedElement*>{};
        by_token.reserve(rkeyed.size());
        for (const auto& e : rkeyed) by_token.emplace(e.token, &e);

        for (const auto& le : lkeyed) {
            path.emplace_back(le.segment);
            auto it = by_token.find(le.token);
            if (it != by_token.end()) {
                compare_values(*le.element, *it->second->element, path);
                by_token.erase(it);
            } else {
                emit(DiffRecord::removed(path_of(path), *le.element, key_name));
            }
            path.pop_back();
        }
        for (const auto& re : rkeyed) {
            if (!by_token.contains(re.token)) continue;
            path.emplace_back(re.segment);
            emit(DiffRecord::added(path_of(path), *re.element, key_name));
            path.pop_back();
        }

        // Elements without an identity (non-objects) pair up by position.
        // A pair at two different indices has no single path, so unequal
        // values are reported as removed and added at their own index.
        const auto common = std::min(left_rest.size(), right_rest.size());
        for (std::size_t i = 0; i < common; ++i) {
            const auto li = left_rest[i];
            const auto ri = right_rest[i];
            if (li == ri) {
                path.emplace_back(IndexSegment{li});
                compare_values(left[li], right[ri], path);
                path.pop_back();
                continue;
            }
            if (left[li] == right[ri]) continue;
            path.emplace_back(IndexSegment{li});
            emit(DiffRecord::removed(path_of(path), left[li]));
            path.back() = IndexSegment{ri};
            emit(DiffRecord::added(path_of(path), right[ri]));
            path.pop_back();
        }
        for (auto i = common; i < left_rest.size(); ++i) {
            path.emplace_back(IndexSegment{left_rest[i]});
            emit(DiffRecord::removed(path_of(path), left[left_rest[i]]));
            path.pop_back();
        }
        for (auto i = common; i < right_rest.size(); ++i) {
            path.emplace_back(IndexSegment{right_rest[i]});
            emit(DiffRecord::added(path_of(path), right[right_rest[i]]));
            path.pop_back();
        }
    }

    void compare_positional(const Array& left, const Array& right, Segments& path) {
        const auto common = std::min(left.size(), right.size());
        for (std::size_t i = 0; i < common; ++i) {
            path.emplace_back(IndexSegment{i});
            compare_values(left[i], right[i], path);
            path.pop_back();
        }
        for (auto i = common; i < left.size(); ++i) {
            path.emplace_back(IndexSegment{i});
            emit(DiffRecord::removed(path_of(path), left[i]));
            path.pop_back();
        }
        for (auto i = common; i < right.size(); ++i) {
            path.emplace_back(IndexSegment{i});
            emit(DiffRecord::added(path_of(path), right[i]));
            path.pop_back();
        }
    }

    static auto all_scalars(const Array& arr) -> bool {
        return std::ranges::all_of(arr, [](const Value& v) { return is_scalar(v); });
    }

    // Scalars matched as a multiset: each left element consumes one equal
    // right element; leftovers are removed/added at their own index.
    void compare_unordered_scalars(const Array& left, const Array& right, Segments& path) {
        auto consumed = std::vector<bool>(right.size(), false);
        auto unmatched_left = std::vector<std::size_t>{};
        for (std::size_t i = 0; i < left.size(); ++i) {
            auto found = false;
            for (std::size_t j = 0; j < right.size(); ++j) {
                if (!consumed[j] && left[i] == right[j]) {
                    consumed[j] = true;
                    found = true;
                    break;
                }
            }
            if (!found) unmatched_left.push_back(i);
        }
        for (auto i : unmatched_left) {
            path.emplace_back(IndexSegment{i});
            emit(DiffRecord::removed(path_of(path), left[i]));
            path.pop_back();
        }
        for (std::size_t j = 0; j < right.size(); ++j) {
            if (consumed[j]) continue;
            path.emplace_back(IndexSegment{j});
            emit(DiffRecord::added(path_of(path), right[j]));
            path.pop_back();
        }
    }

    const CompareOptions& options_;
    ParsedPath root_;
    CompareResult result_;
    std::set<std::pair<std::string, std::string>> seen_keys_;
};

}  // anonymous namespace

// -- DiffRecord factories -----------------------------------------------------

auto DiffRecord::added(IdentityPath path, Value after, std::optional<std::string> key)
    -> DiffRecord {
    return DiffRecord{std::move(path), DiffKind::added, std::nullopt, std::move(after),
                      std::move(key)};
}

auto DiffRecord::removed(IdentityPath path, Value before, std::optional<std::string> key)
    -> DiffRecord {
    return DiffRecord{std::move(path), DiffKind::removed, std::move(before), std::nullopt,
                      std::move(key)};
}

auto DiffRecord::changed(IdentityPath path, Value before, Value after) -> DiffRecord {
    return DiffRecord{std::move(path), DiffKind::changed, std::move(before), std::move(after),
                      std::nullopt};
}

// -- Operations ---------------------------------------------------------------

void validate(const CompareOptions& options) {
    validate(options.detector);
    try {
        auto root = IdentityPath::parse(options.root_path);
        (void)root;
    } catch (const PathError& e) {
        throw OptionsError{"root_path is not an identity path: " + std::string{e.what()}};
    }
}

auto compare(const Value& left, const Value& right, const CompareOptions& options)
    -> CompareResult {
    validate(options);
    auto differ = Differ{options};
    differ.run(left, right);
    auto result = differ.take();
    logger()->debug("compare: {} diffs, {} identity keys",
                    result.diffs.size(), result.identity_keys.size());
    return result;
}

auto filter_ignored(std::span<const DiffRecord> diffs,
                    std::span<const std::string> patterns) -> std::vector<DiffRecord> {
    auto needles = std::vector<std::string>{};
    for (const auto& p : patterns) {
        if (!p.empty()) needles.push_back(detail::lowercase(p));
    }
    auto out = std::vector<DiffRecord>{};
    out.reserve(diffs.size());
    for (const auto& d : diffs) {
        auto haystack = detail::lowercase(d.path.str());
        auto ignored = std::ranges::any_of(needles, [&](const std::string& n) {
            return haystack.find(n) != std::string::npos;
        });
        if (!ignored) out.push_back(d);
    }
    return out;
}

auto summarize(std::span<const DiffRecord> diffs) noexcept -> DiffSummary {
    auto s = DiffSummary{};
    for (const auto& d : diffs) {
        switch (d.kind) {
            case DiffKind::added:   ++s.added; break;
            case DiffKind::removed: ++s.removed; break;
            case DiffKind::changed: ++s.changed; break;
        }
    }
    return s;
}

}  // namespace jsondiff_cpp
