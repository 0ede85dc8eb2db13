#include <jsondiff-cpp/highlight.hpp>

#include <jsondiff-cpp/error.hpp>

#include <algorithm>
#include <utility>

namespace jsondiff_cpp {

namespace {

// Fail fast on malformed text and on a prefix naming the other viewer.
void check_query(std::string_view query, Viewer viewer) {
    auto parsed = parse_path(query);
    if (parsed.viewer && *parsed.viewer != viewer) {
        auto msg = std::string{"path \""};
        msg.append(query);
        msg.append("\" belongs to the ");
        msg.append(to_string_view(*parsed.viewer));
        msg.append(" viewer, queried on the ");
        msg.append(to_string_view(viewer));
        throw PathError{ErrorKind::viewer_mismatch, std::move(msg)};
    }
}

auto any_pair(const std::set<std::string>& a, const std::set<std::string>& b,
              auto&& pred) -> bool {
    return std::ranges::any_of(a, [&](const std::string& x) {
        return std::ranges::any_of(b, [&](const std::string& y) { return pred(x, y); });
    });
}

}  // anonymous namespace

HighlightClassifier::HighlightClassifier(std::vector<DiffRecord> diffs)
    : diffs_{std::move(diffs)} {}

auto HighlightClassifier::classify(std::string_view query, Viewer viewer) const
    -> Classification {
    check_query(query, viewer);
    auto variants = std::vector<std::set<std::string>>{};
    variants.reserve(diffs_.size());
    for (const auto& d : diffs_) variants.push_back(normalize_for_comparison(d.path.str()));
    return classify_variants(normalize_for_comparison(query), variants, viewer);
}

auto HighlightClassifier::classify(std::string_view query, Viewer viewer,
                                   const ConversionContext& ctx) const -> Classification {
    check_query(query, viewer);
    auto variants = std::vector<std::set<std::string>>{};
    variants.reserve(diffs_.size());
    for (const auto& d : diffs_) variants.push_back(normalize_for_comparison(d.path.str(), ctx));
    return classify_variants(normalize_for_comparison(query, ctx), variants, viewer);
}

auto HighlightClassifier::classify_variants(
    const std::set<std::string>& query,
    const std::vector<std::set<std::string>>& diff_variants,
    Viewer viewer) const -> Classification {
    // Exact, then descendant, then ancestor; the first hit in diff order wins.
    for (std::size_t i = 0; i < diffs_.size(); ++i) {
        if (!shows_on(diffs_[i].kind, viewer)) continue;
        if (any_pair(diff_variants[i], query,
                     [](const std::string& d, const std::string& q) { return d == q; })) {
            return Classification{Relation::exact, diffs_[i].kind};
        }
    }
    for (std::size_t i = 0; i < diffs_.size(); ++i) {
        if (!shows_on(diffs_[i].kind, viewer)) continue;
        if (any_pair(diff_variants[i], query, [](const std::string& d, const std::string& q) {
                return is_strict_ancestor(d, q);
            })) {
            return Classification{Relation::descendant, diffs_[i].kind};
        }
    }
    for (std::size_t i = 0; i < diffs_.size(); ++i) {
        if (any_pair(diff_variants[i], query, [](const std::string& d, const std::string& q) {
                return is_strict_ancestor(q, d);
            })) {
            return Classification{Relation::ancestor, std::nullopt};
        }
    }
    return Classification{};
}

auto classify(std::span<const DiffRecord> diffs, std::string_view query, Viewer viewer)
    -> Classification {
    auto classifier = HighlightClassifier{std::vector<DiffRecord>(diffs.begin(), diffs.end())};
    return classifier.classify(query, viewer);
}

auto classify(std::span<const DiffRecord> diffs, std::string_view query, Viewer viewer,
              const ConversionContext& ctx) -> Classification {
    auto classifier = HighlightClassifier{std::vector<DiffRecord>(diffs.begin(), diffs.end())};
    return classifier.classify(query, viewer, ctx);
}

}  // namespace jsondiff_cpp
