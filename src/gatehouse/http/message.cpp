/**
 * @file message.cpp
 * @brief Header map helpers and request host resolution.
 */
#include "gatehouse/http/message.hpp"

#include <algorithm>
#include <cctype>

namespace gatehouse::http {

namespace {

inline unsigned char lower(unsigned char c) noexcept {
    return static_cast<unsigned char>(std::tolower(c));
}

} // namespace

bool CaseInsensitiveLess::operator()(std::string_view a, std::string_view b) const noexcept {
    return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(),
        [](char x, char y) { return lower(static_cast<unsigned char>(x)) < lower(static_cast<unsigned char>(y)); });
}

std::optional<std::string_view> header(const Headers& headers, std::string_view name) {
    auto it = headers.find(name);
    if (it == headers.end()) return std::nullopt;
    return std::string_view{it->second};
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    for (char& c : out) c = static_cast<char>(lower(static_cast<unsigned char>(c)));
    return out;
}

std::string_view strip_port(std::string_view hostport) noexcept {
    if (hostport.empty()) return hostport;
    if (hostport.front() == '[') {
        // [v6]:port
        const auto close = hostport.find(']');
        return close == std::string_view::npos ? hostport : hostport.substr(0, close + 1);
    }
    const auto colon = hostport.rfind(':');
    if (colon == std::string_view::npos) return hostport;
    // More than one ':' without brackets is a bare IPv6 literal, not host:port.
    if (hostport.find(':') != colon) return hostport;
    return hostport.substr(0, colon);
}

std::string host_from_uri(std::string_view uri) {
    const auto scheme_end = uri.find("://");
    if (scheme_end == std::string_view::npos) return {};

    auto authority = uri.substr(scheme_end + 3);
    const auto authority_end = authority.find_first_of("/?#");
    if (authority_end != std::string_view::npos) authority = authority.substr(0, authority_end);

    const auto at = authority.rfind('@');
    if (at != std::string_view::npos) authority = authority.substr(at + 1);

    return to_lower(strip_port(authority));
}

std::string resolve_host(const Request& request) {
    if (auto host = header(request.headers, config::constants::HEADER_HOST); host && !host->empty()) {
        return to_lower(strip_port(*host));
    }
    return host_from_uri(request.uri);
}

} // namespace gatehouse::http
