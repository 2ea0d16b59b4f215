#pragma once
#include "mcpcommons/types.hpp"

#include <optional>
#include <string>

namespace mcpcommons::devkit
{

/// A JWT split into its parts.
struct DecodedJwt
{
    mcpcommons::OrderedJson headers; // claims in token order
    mcpcommons::OrderedJson data;
    std::string signature; // base64url, as found in the token
    /// true/false when a key or certificate was supplied, empty when nothing was checked
    std::optional<bool> signature_verified;
};

inline void to_json(mcpcommons::OrderedJson& j, const DecodedJwt& jwt)
{
    j = mcpcommons::OrderedJson::object();
    j["headers"] = jwt.headers;
    j["data"] = jwt.data;
    j["signature"] = jwt.signature;
    j["signature_verified"] = jwt.signature_verified
                                  ? mcpcommons::OrderedJson(*jwt.signature_verified)
                                  : mcpcommons::OrderedJson();
}

/**
 * Decode a JWT and optionally verify its signature.
 *
 * Supported algorithms: HS256/384/512 (the key string is the shared secret), RS256/384/512
 * and PS256/384/512. `certificate` wins over `public_key` when both are given; either may be
 * passed as a bare base64 body without the PEM armour lines.
 *
 * A signature that does not verify (including an unsupported algorithm or an unusable key)
 * yields signature_verified == false rather than an error.
 *
 * @throws ValidationError "Failed to decode JWT: ..." when the token is malformed or the
 *         certificate cannot be read
 */
DecodedJwt decode_jwt(const std::string& token,
                      const std::optional<std::string>& public_key = std::nullopt,
                      const std::optional<std::string>& certificate = std::nullopt);

/// Random version-4 UUID in lowercase 8-4-4-4-12 form. A non-empty delimiter replaces the
/// dashes.
std::string generate_guid(const std::optional<std::string>& delimiter = std::nullopt);

/// Percent-encodes `value`, keeping only A-Z a-z 0-9 - _ . ~ literal.
std::string url_encode(const std::string& value);

/// Encodings understood by encode_base64/decode_base64: "utf-8" (also "utf8"), "ascii",
/// "latin-1" (also "latin1", "iso-8859-1"). Matching is case-insensitive.
/// @throws ValidationError for an unknown encoding or text the encoding cannot represent
std::string encode_base64(const std::string& text, const std::string& encoding = "utf-8");

/// @throws ValidationError for an unknown encoding, invalid base64 or undecodable bytes
std::string decode_base64(const std::string& b64_string, const std::string& encoding = "utf-8");

} // namespace mcpcommons::devkit
