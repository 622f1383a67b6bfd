/**
 * @file string_utils.cpp
 * @brief Common string utility functions implementation
 */

#include "saml/utils/string_utils.h"
#include <openssl/evp.h>
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <algorithm>
#include <cctype>
#include <sstream>
#include <iomanip>

namespace saml {
namespace utils {

namespace {
    bool isBase64Char(unsigned char c) {
        return std::isalnum(c) || c == '+' || c == '/';
    }

    int hexValue(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }
}

std::string toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::string trim(const std::string& str) {
    // Find first non-whitespace character
    size_t start = 0;
    while (start < str.length() && std::isspace(static_cast<unsigned char>(str[start]))) {
        ++start;
    }

    // If all whitespace, return empty string
    if (start == str.length()) {
        return "";
    }

    // Find last non-whitespace character
    size_t end = str.length();
    while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
        --end;
    }

    return str.substr(start, end - start);
}

std::string bytesToHex(const uint8_t* data, size_t len) {
    if (!data || len == 0) {
        return "";
    }

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }

    return oss.str();
}

std::string toBase64(const std::vector<uint8_t>& data) {
    if (data.empty()) {
        return "";
    }

    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* mem = BIO_new(BIO_s_mem());
    b64 = BIO_push(b64, mem);

    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    BIO_write(b64, data.data(), static_cast<int>(data.size()));
    BIO_flush(b64);

    BUF_MEM* bufferPtr = nullptr;
    BIO_get_mem_ptr(b64, &bufferPtr);

    std::string result(bufferPtr->data, bufferPtr->length);
    BIO_free_all(b64);

    return result;
}

std::optional<std::vector<uint8_t>> fromBase64(const std::string& base64) {
    std::string compact;
    compact.reserve(base64.size());
    for (char c : base64) {
        if (c == '\r' || c == '\n') {
            continue;
        }
        compact.push_back(c);
    }

    if (compact.empty()) {
        return std::vector<uint8_t>{};
    }
    if (compact.size() % 4 != 0) {
        return std::nullopt;
    }

    // Padding may only appear as the last one or two characters
    size_t padding = 0;
    while (padding < compact.size() && compact[compact.size() - 1 - padding] == '=') {
        ++padding;
    }
    if (padding > 2) {
        return std::nullopt;
    }
    for (size_t i = 0; i < compact.size() - padding; ++i) {
        if (!isBase64Char(static_cast<unsigned char>(compact[i]))) {
            return std::nullopt;
        }
    }

    std::vector<uint8_t> result(compact.size() / 4 * 3);
    int decoded = EVP_DecodeBlock(result.data(),
                                  reinterpret_cast<const unsigned char*>(compact.data()),
                                  static_cast<int>(compact.size()));
    if (decoded < 0) {
        return std::nullopt;
    }

    // EVP_DecodeBlock counts padding bytes as zero output
    result.resize(static_cast<size_t>(decoded) - padding);
    return result;
}

std::string urlEncode(const std::string& str) {
    std::ostringstream oss;
    oss << std::uppercase << std::hex << std::setfill('0');

    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~') {
            oss << c;
        } else {
            oss << '%' << std::setw(2) << static_cast<int>(c);
        }
    }

    return oss.str();
}

std::optional<std::string> urlDecode(const std::string& str) {
    std::string result;
    result.reserve(str.size());

    for (size_t i = 0; i < str.size(); ++i) {
        char c = str[i];
        if (c == '+') {
            result.push_back(' ');
        } else if (c == '%') {
            if (i + 2 >= str.size()) {
                return std::nullopt;
            }
            int hi = hexValue(str[i + 1]);
            int lo = hexValue(str[i + 2]);
            if (hi < 0 || lo < 0) {
                return std::nullopt;
            }
            result.push_back(static_cast<char>((hi << 4) | lo));
            i += 2;
        } else {
            result.push_back(c);
        }
    }

    return result;
}

} // namespace utils
} // namespace saml
