#include "wipecert/crypto/providers/NativeProviderFactory.hpp"
#include "wipecert/security/SecureBuffer.hpp"
#include "wipecert/security/SecureRandom.hpp"
#include "monocypher-ed25519.h"
#include "monocypher.h"
#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <stdexcept>

namespace wipecert::crypto::providers
{
namespace
{

constexpr std::size_t g_kExpandedSecretBytes{ 64 };

std::span<const std::uint8_t> asU8(std::span<const std::byte> s) noexcept
{
    return { reinterpret_cast<const std::uint8_t*>(s.data()), s.size() };
}

void requireExactSize(std::span<const std::uint8_t> s, std::size_t expected, const char* what)
{
    if (s.size() != expected)
    {
        throw std::invalid_argument(what);
    }
}

// Monocypher consumes (wipes) the seed it is handed, so it always gets a scratch copy.
struct ExpandedKey final
{
    std::array<std::uint8_t, g_kExpandedSecretBytes> secret{};
    wipecert::crypto::PublicKey publicKey{};

    explicit ExpandedKey(std::span<const std::uint8_t> seed)
    {
        std::array<std::uint8_t, wipecert::crypto::g_ed25519SeedBytes> scratch{};
        std::copy(seed.begin(), seed.end(), scratch.begin());
        crypto_ed25519_key_pair(secret.data(), publicKey.data(), scratch.data());
        crypto_wipe(scratch.data(), scratch.size());
    }

    ExpandedKey(const ExpandedKey&) = delete;
    ExpandedKey& operator=(const ExpandedKey&) = delete;
    ExpandedKey(ExpandedKey&&) = delete;
    ExpandedKey& operator=(ExpandedKey&&) = delete;

    ~ExpandedKey() noexcept
    {
        crypto_wipe(secret.data(), secret.size());
    }
};

class NativeCryptoProvider final : public wipecert::crypto::ICryptoProvider
{
public:
    [[nodiscard]] wipecert::crypto::SigningKey generateKeyPair() override
    {
        wipecert::crypto::SigningKey key{};
        key.seed.resize(wipecert::crypto::g_ed25519SeedBytes);
        if (!randomBytes(std::span<std::uint8_t>{ key.seed }))
        {
            wipecert::security::secureRelease(key.seed);
            throw std::runtime_error("generateKeyPair: CSPRNG failure");
        }
        key.publicKey = derivePublicKey(wipecert::security::asSpan(key.seed));
        return key;
    }

    [[nodiscard]] wipecert::crypto::PublicKey derivePublicKey(std::span<const std::uint8_t> seed) const override
    {
        requireExactSize(seed, wipecert::crypto::g_ed25519SeedBytes, "derivePublicKey: seed");
        const ExpandedKey expanded{ seed };
        return expanded.publicKey;
    }

    [[nodiscard]] wipecert::crypto::Signature sign(std::span<const std::uint8_t> seed,
                                                   std::span<const std::byte> message) const override
    {
        requireExactSize(seed, wipecert::crypto::g_ed25519SeedBytes, "sign: seed");
        const ExpandedKey expanded{ seed };

        wipecert::crypto::Signature signature{};
        const auto msg{ asU8(message) };
        crypto_ed25519_sign(signature.data(), expanded.secret.data(), msg.data(), msg.size());
        return signature;
    }

    [[nodiscard]] bool verify(const wipecert::crypto::PublicKey& publicKey, std::span<const std::byte> message,
                              const wipecert::crypto::Signature& signature) const noexcept override
    {
        const auto msg{ asU8(message) };
        return crypto_ed25519_check(signature.data(), publicKey.data(), msg.data(), msg.size()) == 0;
    }

    [[nodiscard]] bool randomBytes(std::span<std::uint8_t> out) noexcept override
    {
        return wipecert::security::secureRandomFill(out);
    }
};

} // namespace

[[nodiscard]] std::unique_ptr<wipecert::crypto::ICryptoProvider> makeNativeCryptoProvider()
{
    return std::make_unique<NativeCryptoProvider>();
}

} // namespace wipecert::crypto::providers
