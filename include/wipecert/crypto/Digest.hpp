#ifndef INCLUDE_WIPECERT_CRYPTO_DIGEST_HPP
#define INCLUDE_WIPECERT_CRYPTO_DIGEST_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace wipecert::crypto
{

constexpr std::size_t g_sha256Bytes{ 32 };

using Sha256Digest = std::array<std::uint8_t, g_sha256Bytes>;

[[nodiscard]] Sha256Digest sha256(std::span<const std::byte> data);

// Lowercase hex, 64 characters.
[[nodiscard]] std::string sha256Hex(std::span<const std::byte> data);

} // namespace wipecert::crypto

#endif // INCLUDE_WIPECERT_CRYPTO_DIGEST_HPP
