#include "mcpcommons/devkit/service.hpp"

#include "mcpcommons/exceptions.hpp"
#include "mcpcommons/util/encoding.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <memory>
#include <openssl/bio.h>
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>
#include <random>
#include <sstream>
#include <vector>

namespace mcpcommons::devkit
{

namespace
{
namespace enc = mcpcommons::util::encoding;

struct BioDeleter
{
    void operator()(BIO* bio) const
    {
        BIO_free(bio);
    }
};
struct PkeyDeleter
{
    void operator()(EVP_PKEY* key) const
    {
        EVP_PKEY_free(key);
    }
};
struct X509Deleter
{
    void operator()(X509* cert) const
    {
        X509_free(cert);
    }
};
struct MdCtxDeleter
{
    void operator()(EVP_MD_CTX* ctx) const
    {
        EVP_MD_CTX_free(ctx);
    }
};

using BioPtr = std::unique_ptr<BIO, BioDeleter>;
using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using X509Ptr = std::unique_ptr<X509, X509Deleter>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

std::string openssl_error()
{
    unsigned long code = ERR_get_error();
    ERR_clear_error();
    if (code == 0)
        return "unknown error";
    char buffer[256];
    ERR_error_string_n(code, buffer, sizeof(buffer));
    return buffer;
}

std::string strip(const std::string& text)
{
    const char* whitespace = " \t\r\n\f\v";
    auto begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos)
        return {};
    auto end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

std::string with_pem_armour(const std::string& key_text, const std::string& label)
{
    std::string pem = strip(key_text);
    const std::string begin = "-----BEGIN " + label + "-----";
    if (pem.rfind(begin, 0) == 0)
        return pem;

    // Bare body, often pasted as one line; PEM wants at most 64 columns
    std::string body;
    for (unsigned char c : pem)
    {
        if (!std::isspace(c))
            body.push_back(static_cast<char>(c));
    }
    std::string armoured = begin + "\n";
    for (size_t i = 0; i < body.size(); i += 64)
        armoured += body.substr(i, 64) + "\n";
    return armoured + "-----END " + label + "-----\n";
}

BioPtr memory_bio(const std::string& data)
{
    return BioPtr(BIO_new_mem_buf(data.data(), static_cast<int>(data.size())));
}

PkeyPtr load_public_key(const std::string& pem)
{
    auto bio = memory_bio(pem);
    if (!bio)
        return nullptr;
    PkeyPtr key(PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr));
    if (!key)
        ERR_clear_error();
    return key;
}

PkeyPtr public_key_from_certificate(const std::string& pem)
{
    auto bio = memory_bio(pem);
    X509Ptr cert(bio ? PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr) : nullptr);
    if (!cert)
        throw ValidationError("Failed to extract public key from certificate: " +
                              openssl_error());
    PkeyPtr key(X509_get_pubkey(cert.get()));
    if (!key)
        throw ValidationError("Failed to extract public key from certificate: " +
                              openssl_error());
    return key;
}

/// SHA-2 digest named by the last three characters of a JWS algorithm ("HS256" -> SHA-256)
const EVP_MD* digest_for(const std::string& alg)
{
    if (alg.size() != 5)
        return nullptr;
    const std::string bits = alg.substr(2);
    if (bits == "256")
        return EVP_sha256();
    if (bits == "384")
        return EVP_sha384();
    if (bits == "512")
        return EVP_sha512();
    return nullptr;
}

bool verify_hmac(const EVP_MD* md, const std::string& secret, const std::string& signing_input,
                 const std::string& signature)
{
    unsigned char expected[EVP_MAX_MD_SIZE];
    unsigned int expected_len = 0;
    if (!HMAC(md, secret.data(), static_cast<int>(secret.size()),
              reinterpret_cast<const unsigned char*>(signing_input.data()), signing_input.size(),
              expected, &expected_len))
    {
        ERR_clear_error();
        return false;
    }
    return expected_len == signature.size() &&
           CRYPTO_memcmp(expected, signature.data(), expected_len) == 0;
}

bool verify_rsa(EVP_PKEY* key, const EVP_MD* md, bool pss, const std::string& signing_input,
                const std::string& signature)
{
    if (EVP_PKEY_base_id(key) != EVP_PKEY_RSA)
        return false;

    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx)
        return false;

    EVP_PKEY_CTX* pctx = nullptr; // owned by ctx
    if (EVP_DigestVerifyInit(ctx.get(), &pctx, md, nullptr, key) != 1)
    {
        ERR_clear_error();
        return false;
    }
    if (pss)
    {
        if (EVP_PKEY_CTX_set_rsa_padding(pctx, RSA_PKCS1_PSS_PADDING) <= 0 ||
            EVP_PKEY_CTX_set_rsa_mgf1_md(pctx, md) <= 0 ||
            EVP_PKEY_CTX_set_rsa_pss_saltlen(pctx, RSA_PSS_SALTLEN_AUTO) <= 0)
        {
            ERR_clear_error();
            return false;
        }
    }

    int rc = EVP_DigestVerify(ctx.get(), reinterpret_cast<const unsigned char*>(signature.data()),
                              signature.size(),
                              reinterpret_cast<const unsigned char*>(signing_input.data()),
                              signing_input.size());
    ERR_clear_error();
    return rc == 1;
}

mcpcommons::OrderedJson decode_segment(const std::string& segment, const char* what)
{
    auto bytes = enc::base64url_decode(segment);
    if (!bytes)
        throw ValidationError(std::string("Invalid base64url encoding in JWT ") + what + ".");
    mcpcommons::OrderedJson value;
    try
    {
        value = mcpcommons::OrderedJson::parse(*bytes);
    }
    catch (const mcpcommons::OrderedJson::parse_error& e)
    {
        throw ValidationError(std::string("Invalid JSON in JWT ") + what + ": " + e.what());
    }
    if (!value.is_object())
        throw ValidationError(std::string("JWT ") + what + " is not a JSON object.");
    return value;
}

std::vector<std::string> split_token(const std::string& token)
{
    std::vector<std::string> parts;
    size_t start = 0;
    size_t end;
    while ((end = token.find('.', start)) != std::string::npos)
    {
        parts.push_back(token.substr(start, end - start));
        start = end + 1;
    }
    parts.push_back(token.substr(start));
    return parts;
}

enum class Charset
{
    Utf8,
    Ascii,
    Latin1
};

Charset charset_for(const std::string& encoding)
{
    std::string name = encoding;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::replace(name.begin(), name.end(), '_', '-');

    if (name == "utf-8" || name == "utf8")
        return Charset::Utf8;
    if (name == "ascii" || name == "us-ascii")
        return Charset::Ascii;
    if (name == "latin-1" || name == "latin1" || name == "iso-8859-1")
        return Charset::Latin1;
    throw ValidationError("Unknown encoding: " + encoding);
}
} // namespace

DecodedJwt decode_jwt(const std::string& token, const std::optional<std::string>& public_key,
                      const std::optional<std::string>& certificate)
{
    try
    {
        auto parts = split_token(token);
        if (parts.size() != 3)
            throw ValidationError("Invalid JWT token format.");

        DecodedJwt decoded;
        decoded.headers = decode_segment(parts[0], "header");
        decoded.data = decode_segment(parts[1], "payload");
        decoded.signature = parts[2];

        PkeyPtr key;
        if (certificate)
            key = public_key_from_certificate(with_pem_armour(*certificate, "CERTIFICATE"));
        else if (public_key)
            key = load_public_key(with_pem_armour(*public_key, "PUBLIC KEY"));

        if (!certificate && !public_key)
            return decoded;

        const std::string alg = decoded.headers.value("alg", "");
        const std::string signing_input = parts[0] + "." + parts[1];
        const EVP_MD* md = digest_for(alg);
        const auto signature = enc::base64url_decode(parts[2]);

        bool verified = false;
        if (md && signature)
        {
            if (alg.rfind("HS", 0) == 0)
            {
                // Shared secret; a certificate cannot serve as one
                if (public_key && !certificate)
                    verified = verify_hmac(md, *public_key, signing_input, *signature);
            }
            else if (key && (alg.rfind("RS", 0) == 0 || alg.rfind("PS", 0) == 0))
            {
                verified = verify_rsa(key.get(), md, alg[0] == 'P', signing_input, *signature);
            }
        }
        decoded.signature_verified = verified;
        return decoded;
    }
    catch (const mcpcommons::OrderedJson::exception& e)
    {
        throw ValidationError(std::string("Failed to decode JWT: ") + e.what());
    }
    catch (const ValidationError& e)
    {
        throw ValidationError(std::string("Failed to decode JWT: ") + e.what());
    }
}

std::string generate_guid(const std::optional<std::string>& delimiter)
{
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t high = dis(gen);
    uint64_t low = dis(gen);
    // RFC 4122 version 4, variant 10xx
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream hex;
    hex << std::hex << std::setfill('0') << std::setw(16) << high << std::setw(16) << low;
    const std::string digits = hex.str();

    const std::string sep = delimiter && !delimiter->empty() ? *delimiter : "-";
    return digits.substr(0, 8) + sep + digits.substr(8, 4) + sep + digits.substr(12, 4) + sep +
           digits.substr(16, 4) + sep + digits.substr(20, 12);
}

std::string url_encode(const std::string& value)
{
    return enc::url_encode_component(value);
}

std::string encode_base64(const std::string& text, const std::string& encoding)
{
    switch (charset_for(encoding))
    {
    case Charset::Utf8:
        return enc::base64_encode(text);
    case Charset::Ascii:
        if (!enc::is_ascii(text))
            throw ValidationError("Text cannot be encoded as ascii.");
        return enc::base64_encode(text);
    case Charset::Latin1:
    {
        auto bytes = enc::utf8_to_latin1(text);
        if (!bytes)
            throw ValidationError("Text cannot be encoded as latin-1.");
        return enc::base64_encode(*bytes);
    }
    }
    throw ValidationError("Unknown encoding: " + encoding);
}

std::string decode_base64(const std::string& b64_string, const std::string& encoding)
{
    const Charset charset = charset_for(encoding);

    // Line breaks and other whitespace are not part of the payload
    std::string compact;
    compact.reserve(b64_string.size());
    for (unsigned char c : b64_string)
    {
        if (!std::isspace(c))
            compact.push_back(static_cast<char>(c));
    }

    auto bytes = enc::base64_decode(compact);
    if (!bytes)
        throw ValidationError("Invalid base64 input.");

    switch (charset)
    {
    case Charset::Utf8:
        if (!enc::is_valid_utf8(*bytes))
            throw ValidationError("Decoded bytes are not valid utf-8.");
        return *bytes;
    case Charset::Ascii:
        if (!enc::is_ascii(*bytes))
            throw ValidationError("Decoded bytes are not valid ascii.");
        return *bytes;
    case Charset::Latin1:
        return enc::latin1_to_utf8(*bytes);
    }
    throw ValidationError("Unknown encoding: " + encoding);
}

} // namespace mcpcommons::devkit
