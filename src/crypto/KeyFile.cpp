#include "wipecert/crypto/KeyFile.hpp"
#include "wipecert/crypto/Digest.hpp"
#include "wipecert/crypto/Encoding.hpp"
#include "wipecert/security/MemoryWiper.hpp"
#include "wipecert/security/ScopeWipe.hpp"
#include <algorithm>
#include <fstream>
#include <iterator>
#include <system_error>

namespace wipecert::crypto
{
namespace
{

constexpr std::string_view g_kPrivateLabel{ "PRIVATE KEY" };
constexpr std::string_view g_kPublicLabel{ "PUBLIC KEY" };

[[nodiscard]] std::string frame(std::string_view label, std::string_view body)
{
    std::string out{ "-----BEGIN " };
    out.append(label);
    out.append("-----\n");
    out.append(body);
    out.append("\n-----END ");
    out.append(label);
    out.append("-----\n");
    return out;
}

// Returns the base64 body between the BEGIN/END lines with all whitespace removed.
[[nodiscard]] std::string unframe(std::string_view pem, std::string_view label)
{
    const std::string begin{ std::string{ "-----BEGIN " } + std::string{ label } + "-----" };
    const std::string end{ std::string{ "-----END " } + std::string{ label } + "-----" };

    const auto beginPos{ pem.find(begin) };
    if (beginPos == std::string_view::npos)
    {
        throw KeyFileError("key file: missing '" + begin + "'");
    }
    const auto bodyPos{ beginPos + begin.size() };
    const auto endPos{ pem.find(end, bodyPos) };
    if (endPos == std::string_view::npos)
    {
        throw KeyFileError("key file: missing '" + end + "'");
    }

    std::string body{};
    body.reserve(endPos - bodyPos);
    for (const char c : pem.substr(bodyPos, endPos - bodyPos))
    {
        if (c != '\n' && c != '\r' && c != ' ' && c != '\t')
        {
            body.push_back(c);
        }
    }
    return body;
}

[[nodiscard]] wipecert::security::SecureBuffer decodeBody(std::string_view pem, std::string_view label)
{
    std::string body{ unframe(pem, label) };
    auto wipeBody{ wipecert::security::scopeWipe(body) };

    auto decoded{ base64Decode(body) };
    if (!decoded)
    {
        throw KeyFileError("key file: invalid base64 encoding");
    }
    if (decoded->size() != g_ed25519SeedBytes)
    {
        wipecert::security::secureRelease(*decoded);
        throw KeyFileError("key file: expected 32 bytes of key material");
    }
    return std::move(*decoded);
}

[[nodiscard]] std::string readText(const std::filesystem::path& path)
{
    std::ifstream in{ path, std::ios::binary };
    if (!in)
    {
        throw KeyFileError("key file: cannot open " + path.string());
    }
    std::string text{ std::istreambuf_iterator<char>{ in }, std::istreambuf_iterator<char>{} };
    if (in.bad())
    {
        wipecert::security::secureWipe(text);
        throw KeyFileError("key file: cannot read " + path.string());
    }
    return text;
}

void writeText(const std::filesystem::path& path, std::string_view text, bool ownerOnly)
{
    std::ofstream out{ path, std::ios::binary | std::ios::trunc };
    if (!out)
    {
        throw KeyFileError("key file: cannot create " + path.string());
    }

    if (ownerOnly)
    {
        std::error_code ec{};
        std::filesystem::permissions(path, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                     std::filesystem::perm_options::replace, ec);
        if (ec)
        {
            throw KeyFileError("key file: cannot restrict permissions of " + path.string());
        }
    }

    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    out.flush();
    if (!out)
    {
        throw KeyFileError("key file: cannot write " + path.string());
    }
}

} // namespace

std::string encodePrivateKeyPem(std::span<const std::uint8_t> seed)
{
    if (seed.size() != g_ed25519SeedBytes)
    {
        throw std::invalid_argument("encodePrivateKeyPem: seed");
    }
    std::string body{ base64Encode(seed) };
    auto wipeBody{ wipecert::security::scopeWipe(body) };
    return frame(g_kPrivateLabel, body);
}

std::string encodePublicKeyPem(const PublicKey& publicKey)
{
    return frame(g_kPublicLabel, base64Encode(std::span<const std::uint8_t>{ publicKey }));
}

wipecert::security::SecureBuffer decodePrivateKeyPem(std::string_view pem)
{
    return decodeBody(pem, g_kPrivateLabel);
}

PublicKey decodePublicKeyPem(std::string_view pem)
{
    auto bytes{ decodeBody(pem, g_kPublicLabel) };
    PublicKey out{};
    std::copy(bytes.begin(), bytes.end(), out.begin());
    return out;
}

SigningKey loadSigningKey(const std::filesystem::path& path, const ICryptoProvider& crypto)
{
    std::string pem{ readText(path) };
    auto wipePem{ wipecert::security::scopeWipe(pem) };

    SigningKey key{};
    key.seed = decodePrivateKeyPem(pem);
    key.publicKey = crypto.derivePublicKey(wipecert::security::asSpan(key.seed));
    return key;
}

PublicKey loadPublicKey(const std::filesystem::path& path)
{
    return decodePublicKeyPem(readText(path));
}

KeyFilePaths writeKeyPair(const std::filesystem::path& outputDir, const SigningKey& key)
{
    std::error_code ec{};
    std::filesystem::create_directories(outputDir, ec);
    if (ec)
    {
        throw KeyFileError("key file: cannot create directory " + outputDir.string());
    }

    KeyFilePaths paths{ .privateKey = outputDir / g_privateKeyFileName, .publicKey = outputDir / g_publicKeyFileName };

    std::string privatePem{ encodePrivateKeyPem(wipecert::security::asSpan(key.seed)) };
    auto wipePem{ wipecert::security::scopeWipe(privatePem) };
    writeText(paths.privateKey, privatePem, true);
    writeText(paths.publicKey, encodePublicKeyPem(key.publicKey), false);
    return paths;
}

std::string keyFingerprint(const PublicKey& publicKey)
{
    return sha256Hex(std::as_bytes(std::span<const std::uint8_t>{ publicKey }));
}

} // namespace wipecert::crypto
