#include "wipecert/crypto/Encoding.hpp"
#include <limits>
#include <openssl/evp.h>
#include <stdexcept>

namespace wipecert::crypto
{
namespace
{

constexpr std::uint8_t g_kNibbleShift{ 4U };
constexpr std::uint8_t g_kNibbleMask{ 0x0FU };

[[nodiscard]] int hexValue(char c) noexcept
{
    if (c >= '0' && c <= '9')
    {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f')
    {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F')
    {
        return c - 'A' + 10;
    }
    return -1;
}

} // namespace

std::string toHex(std::span<const std::uint8_t> bytes)
{
    constexpr char kHex[] = "0123456789abcdef";

    std::string out{};
    out.reserve(bytes.size() * 2U);
    for (const std::uint8_t b : bytes)
    {
        out.push_back(kHex[(b >> g_kNibbleShift) & g_kNibbleMask]);
        out.push_back(kHex[b & g_kNibbleMask]);
    }
    return out;
}

std::optional<std::vector<std::uint8_t>> fromHex(std::string_view hex)
{
    if ((hex.size() % 2U) != 0U)
    {
        return std::nullopt;
    }

    std::vector<std::uint8_t> out{};
    out.reserve(hex.size() / 2U);
    for (std::size_t i{}; i < hex.size(); i += 2U)
    {
        const int hi{ hexValue(hex[i]) };
        const int lo{ hexValue(hex[i + 1U]) };
        if (hi < 0 || lo < 0)
        {
            return std::nullopt;
        }
        out.push_back(static_cast<std::uint8_t>((hi << g_kNibbleShift) | lo));
    }
    return out;
}

std::string base64Encode(std::span<const std::uint8_t> bytes)
{
    if (bytes.empty())
    {
        return {};
    }
    if (bytes.size() > static_cast<std::size_t>(std::numeric_limits<int>::max() / 2))
    {
        throw std::invalid_argument("base64Encode: input too large");
    }

    // EVP_EncodeBlock writes 4 bytes per 3-byte group plus a NUL terminator.
    std::string out(((bytes.size() + 2U) / 3U) * 4U + 1U, '\0');
    const int written{ EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), bytes.data(),
                                       static_cast<int>(bytes.size())) };
    if (written < 0)
    {
        throw std::runtime_error("base64Encode: EVP_EncodeBlock failed");
    }
    out.resize(static_cast<std::size_t>(written));
    return out;
}

std::optional<wipecert::security::SecureBuffer> base64Decode(std::string_view text)
{
    if (text.empty() || (text.size() % 4U) != 0U ||
        text.size() > static_cast<std::size_t>(std::numeric_limits<int>::max()))
    {
        return std::nullopt;
    }

    wipecert::security::SecureBuffer out{};
    out.resize((text.size() / 4U) * 3U);
    const int written{ EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(text.data()),
                                       static_cast<int>(text.size())) };
    if (written < 0 || static_cast<std::size_t>(written) != out.size())
    {
        wipecert::security::secureRelease(out);
        return std::nullopt;
    }

    // EVP_DecodeBlock keeps the zero bytes produced by '=' padding.
    std::size_t padding{ 0U };
    if (text.back() == '=')
    {
        ++padding;
        if (text[text.size() - 2U] == '=')
        {
            ++padding;
        }
    }
    out.resize(out.size() - padding);
    return out;
}

} // namespace wipecert::crypto
