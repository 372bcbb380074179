#pragma once

// Identifier tokenizer for similarity scoring.
// Internal header: not installed.
//
// Splits on every non-alphanumeric character, on underscores and on
// lower-to-upper case transitions ("parseHTTPHeader" -> parse, http,
// header), and lower-cases the result.

#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace mergeguard::detail {

inline void append_tokens(std::string_view text, std::vector<std::string>& out) {
    auto is_alnum = [](char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0; };
    auto is_upper = [](char c) { return std::isupper(static_cast<unsigned char>(c)) != 0; };
    auto is_lower = [](char c) { return std::islower(static_cast<unsigned char>(c)) != 0; };

    auto current = std::string{};
    auto flush = [&] {
        if (!current.empty()) out.push_back(std::move(current));
        current.clear();
    };

    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (!is_alnum(c)) {
            flush();
            continue;
        }
        if (is_upper(c) && !current.empty()) {
            const char prev = text[i - 1];
            const bool next_lower = i + 1 < text.size() && is_lower(text[i + 1]);
            // "fooBar" and the "H" of "HTTPHeader"
            if (is_lower(prev) || (is_upper(prev) && next_lower)) flush();
        }
        current += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    flush();
}

inline auto tokenize(std::string_view text) -> std::vector<std::string> {
    auto out = std::vector<std::string>{};
    append_tokens(text, out);
    return out;
}

}  // namespace mergeguard::detail
