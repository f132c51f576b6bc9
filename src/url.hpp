#pragma once
#include <string>

namespace shellhost {

// True for URLs rendered by the UI process itself rather than a surface:
// anything under the internal scheme, the empty string and about:blank.
bool is_internal_url(const std::string& url, const std::string& internal_scheme);

// Internal URLs pass through. URLs that already carry a scheme pass through.
// Bare hosts ("example.com") get https:// prepended.
std::string normalize_url(const std::string& url, const std::string& internal_scheme);

// Percent-encode with encodeURIComponent rules (unreserved: A-Z a-z 0-9 - _ . ! ~ * ' ( ))
std::string url_encode_component(const std::string& s);

// <internal_scheme>search?q=<encoded query>
std::string internal_search_url(const std::string& query, const std::string& internal_scheme);

} // namespace shellhost
