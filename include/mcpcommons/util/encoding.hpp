#pragma once

#include <optional>
#include <string>

namespace mcpcommons::util::encoding
{

/// Standard base64 (RFC 4648 section 4) with '=' padding
std::string base64_encode(const std::string& input);

/// Strict standard base64 decode; nullopt on characters outside the alphabet, a length that
/// is not a multiple of four or misplaced padding.
std::optional<std::string> base64_decode(const std::string& input);

/// Base64url decode (RFC 4648 section 5), padding optional as in JWT segments
std::optional<std::string> base64url_decode(const std::string& input);

/// Percent-encodes every byte outside A-Z a-z 0-9 - _ . ~ (uppercase hex)
std::string url_encode_component(const std::string& value);

/// True when `bytes` is well-formed UTF-8
bool is_valid_utf8(const std::string& bytes);

/// UTF-8 text to ISO-8859-1 bytes; nullopt when a code point is above U+00FF
std::optional<std::string> utf8_to_latin1(const std::string& utf8);

/// ISO-8859-1 bytes to UTF-8 text (always succeeds)
std::string latin1_to_utf8(const std::string& latin1);

/// True when every byte is below 0x80
bool is_ascii(const std::string& bytes);

} // namespace mcpcommons::util::encoding
