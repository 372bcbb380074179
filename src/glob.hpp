#pragma once

// Path glob matching for rule scopes, import bans and ignored paths.
// Internal header: not installed.
//
//   *   any run of characters except '/'
//   **  any run of characters including '/' (a trailing "/**" also
//       matches the directory itself)
//   ?   one character except '/'
//
// A pattern without '/' is matched against the last path segment only,
// so "*.lock" ignores "web/yarn.lock".

#include <cstddef>
#include <string>
#include <string_view>

namespace mergeguard::detail {

inline auto glob_match_here(std::string_view pat, std::string_view text) -> bool {
    std::size_t p = 0;
    std::size_t t = 0;
    while (p < pat.size()) {
        if (pat[p] == '*') {
            const bool deep = p + 1 < pat.size() && pat[p + 1] == '*';
            auto rest = pat.substr(p + (deep ? 2 : 1));
            if (deep && rest.starts_with("/")) {
                // "**/" may also match zero directories
                if (glob_match_here(rest.substr(1), text.substr(t))) return true;
            }
            if (deep && rest.empty()) return true;
            for (auto i = t; i <= text.size(); ++i) {
                if (glob_match_here(rest, text.substr(i))) return true;
                if (i < text.size() && text[i] == '/' && !deep) return false;
            }
            return false;
        }
        if (t >= text.size()) {
            // "dir/**" matches "dir"
            return pat.substr(p) == "/**";
        }
        if (pat[p] == '?') {
            if (text[t] == '/') return false;
        } else if (pat[p] != text[t]) {
            return false;
        }
        ++p;
        ++t;
    }
    return t == text.size();
}

inline auto glob_match(std::string_view pattern, std::string_view path) -> bool {
    if (pattern.find('/') == std::string_view::npos) {
        auto slash = path.rfind('/');
        auto base = slash == std::string_view::npos ? path : path.substr(slash + 1);
        return glob_match_here(pattern, base);
    }
    return glob_match_here(pattern, path);
}

// "auth.session" -> "auth/session"; paths and relative imports pass through.
inline auto module_to_path(std::string_view target) -> std::string {
    auto out = std::string{target};
    if (out.find('/') != std::string::npos || out.starts_with(".")) return out;
    for (auto& c : out) {
        if (c == '.') c = '/';
    }
    return out;
}

}  // namespace mergeguard::detail
