#pragma once

#include <string>
#include <string_view>

namespace streamfetch::core {

struct Url {
    std::string scheme; // "http" or "https", lowercase
    std::string host;   // Without IPv6 brackets
    unsigned short port = 0;
    std::string target; // Path and query, never empty

    bool is_https() const { return scheme == "https"; }

    // Value for the Host header, port omitted when it is the scheme default
    std::string host_header() const;

    // scheme://host:port, identifies reusable connections
    std::string origin() const;

    std::string ToString() const;
};

// Throws std::invalid_argument for malformed URLs and schemes other than http/https
Url ParseUrl(std::string_view url);

// Resolves a redirect Location header against the URL that produced it
Url ResolveLocation(const Url& base, std::string_view location);

} // namespace streamfetch::core
