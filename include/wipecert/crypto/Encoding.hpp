#ifndef INCLUDE_WIPECERT_CRYPTO_ENCODING_HPP
#define INCLUDE_WIPECERT_CRYPTO_ENCODING_HPP

#include "wipecert/security/SecureBuffer.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace wipecert::crypto
{

[[nodiscard]] std::string toHex(std::span<const std::uint8_t> bytes);

// Accepts upper and lower case. Returns std::nullopt for odd length or a non-hex character.
[[nodiscard]] std::optional<std::vector<std::uint8_t>> fromHex(std::string_view hex);

// Standard alphabet, padded, no line breaks.
[[nodiscard]] std::string base64Encode(std::span<const std::uint8_t> bytes);

// Returns std::nullopt for malformed input. The decoded bytes may be key material.
[[nodiscard]] std::optional<wipecert::security::SecureBuffer> base64Decode(std::string_view text);

} // namespace wipecert::crypto

#endif // INCLUDE_WIPECERT_CRYPTO_ENCODING_HPP
