#include <algorithm>
#include <cctype>
#include <core/network/client/url.h>
#include <regex>
#include <stdexcept>

namespace streamfetch::core {

namespace {

unsigned short defaultPort(std::string_view scheme) {
    return scheme == "https" ? 443 : 80;
}

std::string withBrackets(const std::string& host) {
    if (host.find(':') != std::string::npos) {
        return "[" + host + "]";
    }
    return host;
}

} // namespace

std::string Url::host_header() const {
    if (port == defaultPort(scheme)) {
        return withBrackets(host);
    }
    return withBrackets(host) + ":" + std::to_string(port);
}

std::string Url::origin() const {
    return scheme + "://" + withBrackets(host) + ":" + std::to_string(port);
}

std::string Url::ToString() const {
    return scheme + "://" + host_header() + target;
}

Url ParseUrl(std::string_view url) {
    static const std::regex url_regex(R"(^([A-Za-z][A-Za-z0-9+.-]*)://(\[[^\]]+\]|[^/?#:\[\]]+)(?::(\d{1,5}))?([/?][^#]*)?(#.*)?$)");

    std::string input(url);
    std::smatch match;
    if (!std::regex_match(input, match, url_regex)) {
        throw std::invalid_argument("Invalid URL: " + input);
    }

    Url result;
    result.scheme = match[1].str();
    std::transform(result.scheme.begin(),
                   result.scheme.end(),
                   result.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (result.scheme != "http" && result.scheme != "https") {
        throw std::invalid_argument("Unsupported URL scheme: " + result.scheme);
    }

    result.host = match[2].str();
    if (result.host.front() == '[') {
        result.host = result.host.substr(1, result.host.size() - 2);
    }

    if (match[3].matched) {
        int port = std::stoi(match[3].str());
        if (port <= 0 || port > 65535) {
            throw std::invalid_argument("Invalid port in URL: " + input);
        }
        result.port = static_cast<unsigned short>(port);
    } else {
        result.port = defaultPort(result.scheme);
    }

    result.target = match[4].matched ? match[4].str() : "/";
    if (result.target.front() == '?') {
        result.target.insert(result.target.begin(), '/');
    }
    return result;
}

Url ResolveLocation(const Url& base, std::string_view location) {
    location = location.substr(0, location.find('#'));
    if (location.find("://") != std::string_view::npos) {
        return ParseUrl(location);
    }
    if (location.substr(0, 2) == "//") {
        return ParseUrl(base.scheme + ":" + std::string(location));
    }

    Url resolved = base;
    if (!location.empty() && location.front() == '/') {
        resolved.target = std::string(location);
    } else {
        std::string directory = base.target.substr(0, base.target.find('?'));
        directory = directory.substr(0, directory.rfind('/') + 1);
        resolved.target = directory + std::string(location);
    }
    if (resolved.target.empty()) {
        resolved.target = "/";
    }
    return resolved;
}

} // namespace streamfetch::core
