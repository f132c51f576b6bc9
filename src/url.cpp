#include "url.hpp"
#include "util.hpp"

#include <cctype>
#include <cstdio>

namespace shellhost {

static bool has_scheme(const std::string& url) {
    if (url.find("://") != std::string::npos) return true;
    return starts_with(url, "about:") || starts_with(url, "data:") ||
           starts_with(url, "mailto:") || starts_with(url, "javascript:");
}

bool is_internal_url(const std::string& url, const std::string& internal_scheme) {
    return url.empty() || url == "about:blank" ||
           (!internal_scheme.empty() && starts_with(url, internal_scheme));
}

std::string normalize_url(const std::string& url, const std::string& internal_scheme) {
    std::string trimmed = trim(url);
    if (is_internal_url(trimmed, internal_scheme)) return trimmed;
    if (has_scheme(trimmed)) return trimmed;
    return "https://" + trimmed;
}

std::string url_encode_component(const std::string& s) {
    std::string out;
    out.reserve(s.size() * 3);
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '!' ||
            c == '~' || c == '*' || c == '\'' || c == '(' || c == ')') {
            out += static_cast<char>(c);
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

std::string internal_search_url(const std::string& query, const std::string& internal_scheme) {
    return internal_scheme + "search?q=" + url_encode_component(query);
}

} // namespace shellhost
