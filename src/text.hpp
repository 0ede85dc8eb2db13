#pragma once

// Small string helpers shared by the differ and the key detector.
//
// Internal header, not installed.

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace jsondiff_cpp::detail {

// ASCII lowercase copy; bytes outside A-Z pass through.
inline auto lowercase(std::string_view s) -> std::string {
    auto out = std::string{s};
    std::ranges::transform(out, out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

}  // namespace jsondiff_cpp::detail
