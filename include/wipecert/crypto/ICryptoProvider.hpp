#ifndef INCLUDE_WIPECERT_CRYPTO_ICRYPTOPROVIDER_HPP
#define INCLUDE_WIPECERT_CRYPTO_ICRYPTOPROVIDER_HPP

#include "wipecert/security/SecureBuffer.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace wipecert::crypto
{

constexpr std::size_t g_ed25519SeedBytes{ 32 };
constexpr std::size_t g_ed25519PublicKeyBytes{ 32 };
constexpr std::size_t g_ed25519SignatureBytes{ 64 };

using PublicKey = std::array<std::uint8_t, g_ed25519PublicKeyBytes>;
using Signature = std::array<std::uint8_t, g_ed25519SignatureBytes>;

// Raw 32-byte Ed25519 seed plus the public key derived from it.
struct SigningKey final
{
    wipecert::security::SecureBuffer seed;
    PublicKey publicKey{};
};

class ICryptoProvider
{
public:
    ICryptoProvider() = default;
    ICryptoProvider(const ICryptoProvider&) = delete;
    ICryptoProvider& operator=(const ICryptoProvider&) = delete;
    ICryptoProvider(ICryptoProvider&&) = delete;
    ICryptoProvider& operator=(ICryptoProvider&&) = delete;
    virtual ~ICryptoProvider() = default;

    // Throws std::runtime_error when the CSPRNG fails.
    [[nodiscard]] virtual SigningKey generateKeyPair() = 0;

    // `seed` must be exactly g_ed25519SeedBytes (std::invalid_argument otherwise).
    [[nodiscard]] virtual PublicKey derivePublicKey(std::span<const std::uint8_t> seed) const = 0;

    // Ed25519 (RFC 8032, pure). Deterministic: both providers produce identical signatures.
    [[nodiscard]] virtual Signature sign(std::span<const std::uint8_t> seed, std::span<const std::byte> message) const = 0;

    [[nodiscard]] virtual bool verify(const PublicKey& publicKey, std::span<const std::byte> message,
                                      const Signature& signature) const noexcept = 0;

    [[nodiscard]] virtual bool randomBytes(std::span<std::uint8_t> out) noexcept = 0;
};

} // namespace wipecert::crypto

#endif // INCLUDE_WIPECERT_CRYPTO_ICRYPTOPROVIDER_HPP
