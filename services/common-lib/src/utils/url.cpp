/**
 * @file url.cpp
 * @brief URL parsing implementation (RFC 3986 Appendix B)
 */

#include "saml/utils/url.h"
#include "saml/utils/string_utils.h"
#include <cctype>
#include <vector>

namespace saml {
namespace utils {

namespace {

bool hasForbiddenCharacters(const std::string& text) {
    for (unsigned char c : text) {
        if (c <= 0x20 || c == 0x7f) {
            return true;
        }
    }
    return false;
}

bool hasValidPercentEscapes(const std::string& text) {
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '%') {
            continue;
        }
        if (i + 2 >= text.size() ||
            !std::isxdigit(static_cast<unsigned char>(text[i + 1])) ||
            !std::isxdigit(static_cast<unsigned char>(text[i + 2]))) {
            return false;
        }
        i += 2;
    }
    return true;
}

bool isValidScheme(const std::string& scheme) {
    if (scheme.empty() || !std::isalpha(static_cast<unsigned char>(scheme[0]))) {
        return false;
    }
    for (unsigned char c : scheme) {
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') {
            return false;
        }
    }
    return true;
}

/**
 * @brief Split authority into userinfo, host and port
 */
bool parseAuthority(const std::string& authority, Url& url) {
    std::string hostPort = authority;

    size_t at = authority.rfind('@');
    if (at != std::string::npos) {
        url.userinfo = authority.substr(0, at);
        url.hasUserinfo = true;
        hostPort = authority.substr(at + 1);
    }

    size_t portSep = std::string::npos;
    if (!hostPort.empty() && hostPort[0] == '[') {
        // IP literal
        size_t close = hostPort.find(']');
        if (close == std::string::npos) {
            return false;
        }
        if (close + 1 < hostPort.size()) {
            if (hostPort[close + 1] != ':') {
                return false;
            }
            portSep = close + 1;
        }
    } else {
        portSep = hostPort.rfind(':');
    }

    if (portSep != std::string::npos) {
        url.host = hostPort.substr(0, portSep);
        url.port = hostPort.substr(portSep + 1);
        if (url.port.empty() || url.port.size() > 5) {
            return false;
        }
        for (unsigned char c : url.port) {
            if (!std::isdigit(c)) {
                return false;
            }
        }
        if (std::stoi(url.port) > 65535) {
            return false;
        }
    } else {
        url.host = hostPort;
    }

    return true;
}

} // anonymous namespace

std::string Url::toString() const {
    std::string out = scheme + ":";
    if (hasAuthority) {
        out += "//";
        if (hasUserinfo) {
            out += userinfo + "@";
        }
        out += host;
        if (!port.empty()) {
            out += ":" + port;
        }
    }
    out += path;
    if (hasQuery) {
        out += "?" + query;
    }
    if (hasFragment) {
        out += "#" + fragment;
    }
    return out;
}

std::optional<Url> parseUrl(const std::string& text) {
    if (text.empty() || hasForbiddenCharacters(text) || !hasValidPercentEscapes(text)) {
        return std::nullopt;
    }

    // RFC 3986 Appendix B split: scheme ":" ["//" authority] path ["?" query] ["#" fragment]
    size_t schemeEnd = text.find_first_of(":/?#");
    if (schemeEnd == std::string::npos || schemeEnd == 0 || text[schemeEnd] != ':') {
        return std::nullopt;
    }

    Url url;
    url.scheme = text.substr(0, schemeEnd);
    if (!isValidScheme(url.scheme)) {
        return std::nullopt;
    }

    size_t pos = schemeEnd + 1;
    if (text.compare(pos, 2, "//") == 0) {
        pos += 2;
        size_t authorityEnd = text.find_first_of("/?#", pos);
        if (authorityEnd == std::string::npos) {
            authorityEnd = text.size();
        }
        url.hasAuthority = true;
        if (!parseAuthority(text.substr(pos, authorityEnd - pos), url)) {
            return std::nullopt;
        }
        pos = authorityEnd;
    }

    size_t pathEnd = text.find_first_of("?#", pos);
    if (pathEnd == std::string::npos) {
        pathEnd = text.size();
    }
    url.path = text.substr(pos, pathEnd - pos);
    pos = pathEnd;

    if (pos < text.size() && text[pos] == '?') {
        size_t queryEnd = text.find('#', pos + 1);
        if (queryEnd == std::string::npos) {
            queryEnd = text.size();
        }
        url.hasQuery = true;
        url.query = text.substr(pos + 1, queryEnd - pos - 1);
        pos = queryEnd;
    }
    if (pos < text.size() && text[pos] == '#') {
        url.hasFragment = true;
        url.fragment = text.substr(pos + 1);
    }

    return url;
}

void setQueryParameter(Url& url, const std::string& name, const std::string& value) {
    std::vector<std::string> kept;

    if (url.hasQuery && !url.query.empty()) {
        size_t start = 0;
        while (start <= url.query.size()) {
            size_t end = url.query.find('&', start);
            if (end == std::string::npos) {
                end = url.query.size();
            }
            std::string pair = url.query.substr(start, end - start);
            std::string key = pair.substr(0, pair.find('='));
            auto decodedKey = urlDecode(key);
            if (!pair.empty() && !(decodedKey && *decodedKey == name)) {
                kept.push_back(pair);
            }
            start = end + 1;
        }
    }

    kept.push_back(urlEncode(name) + "=" + urlEncode(value));

    std::string query;
    for (size_t i = 0; i < kept.size(); ++i) {
        if (i > 0) {
            query += "&";
        }
        query += kept[i];
    }

    url.query = query;
    url.hasQuery = true;
}

} // namespace utils
} // namespace saml
