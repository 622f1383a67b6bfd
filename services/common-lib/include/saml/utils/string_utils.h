/**
 * @file string_utils.h
 * @brief String manipulation utilities
 *
 * Common string operations used by the SAML service provider libraries.
 *
 * @version 1.0.0
 * @date 2026-10-19
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace saml {
namespace utils {

/**
 * @brief Convert string to lowercase (ASCII only)
 */
std::string toLower(const std::string& str);

/**
 * @brief Trim whitespace from both ends
 *
 * @param str Input string
 * @return Trimmed string
 */
std::string trim(const std::string& str);

/**
 * @brief Convert binary data to lowercase hex string
 */
std::string bytesToHex(const uint8_t* data, size_t len);

/**
 * @brief Encode binary data to standard Base64 (with padding, no line breaks)
 *
 * @param data Binary data
 * @return Base64-encoded string
 */
std::string toBase64(const std::vector<uint8_t>& data);

/**
 * @brief Decode standard Base64 string
 *
 * CR and LF (MIME-style line wrapping) are skipped. Anything else
 * outside the standard alphabet, including space and tab, a length
 * that is not a multiple of four after line breaks are removed, or
 * misplaced padding is an error.
 *
 * @param base64 Base64-encoded string
 * @return Binary data, or std::nullopt on error
 */
std::optional<std::vector<uint8_t>> fromBase64(const std::string& base64);

/**
 * @brief Percent-encode a string for use in a URL query component
 *
 * RFC 3986 unreserved characters (ALPHA / DIGIT / "-" / "." / "_" / "~")
 * are kept; every other byte becomes "%XX" with uppercase hex digits.
 */
std::string urlEncode(const std::string& str);

/**
 * @brief Decode "%XX" escapes and "+" (as space) in a query component
 *
 * @return Decoded string, or std::nullopt on a malformed escape
 */
std::optional<std::string> urlDecode(const std::string& str);

} // namespace utils
} // namespace saml
