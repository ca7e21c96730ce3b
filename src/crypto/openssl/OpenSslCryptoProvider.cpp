#include "wipecert/crypto/providers/OpenSslProviderFactory.hpp"
#include "wipecert/security/SecureBuffer.hpp"
#include "wipecert/security/SecureRandom.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <openssl/evp.h>
#include <span>
#include <stdexcept>

namespace wipecert::crypto::providers
{
namespace
{

using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

void requireExactSize(std::span<const std::uint8_t> s, std::size_t expected, const char* what)
{
    if (s.size() != expected)
    {
        throw std::invalid_argument(what);
    }
}

[[nodiscard]] EvpPkeyPtr privateKeyFromSeed(std::span<const std::uint8_t> seed)
{
    EvpPkeyPtr pkey{ EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, seed.data(), seed.size()),
                     &EVP_PKEY_free };
    if (!pkey)
    {
        throw std::runtime_error("ed25519: EVP_PKEY_new_raw_private_key failed");
    }
    return pkey;
}

class OpenSslCryptoProvider final : public wipecert::crypto::ICryptoProvider
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
        const auto pkey{ privateKeyFromSeed(seed) };

        wipecert::crypto::PublicKey out{};
        std::size_t len{ out.size() };
        if (EVP_PKEY_get_raw_public_key(pkey.get(), out.data(), &len) != 1 || len != out.size())
        {
            throw std::runtime_error("derivePublicKey: EVP_PKEY_get_raw_public_key failed");
        }
        return out;
    }

    [[nodiscard]] wipecert::crypto::Signature sign(std::span<const std::uint8_t> seed,
                                                   std::span<const std::byte> message) const override
    {
        requireExactSize(seed, wipecert::crypto::g_ed25519SeedBytes, "sign: seed");
        const auto pkey{ privateKeyFromSeed(seed) };

        EvpMdCtxPtr ctx{ EVP_MD_CTX_new(), &EVP_MD_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("sign: EVP_MD_CTX_new failed");
        }
        // Ed25519 is a one-shot scheme: no digest is configured.
        if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1)
        {
            throw std::runtime_error("sign: EVP_DigestSignInit failed");
        }

        wipecert::crypto::Signature signature{};
        std::size_t sigLen{ signature.size() };
        const auto* msg{ reinterpret_cast<const unsigned char*>(message.data()) };
        if (EVP_DigestSign(ctx.get(), signature.data(), &sigLen, msg, message.size()) != 1 ||
            sigLen != signature.size())
        {
            throw std::runtime_error("sign: EVP_DigestSign failed");
        }
        return signature;
    }

    [[nodiscard]] bool verify(const wipecert::crypto::PublicKey& publicKey, std::span<const std::byte> message,
                              const wipecert::crypto::Signature& signature) const noexcept override
    {
        EvpPkeyPtr pkey{ EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, publicKey.data(), publicKey.size()),
                         &EVP_PKEY_free };
        if (!pkey)
        {
            return false;
        }

        EvpMdCtxPtr ctx{ EVP_MD_CTX_new(), &EVP_MD_CTX_free };
        if (!ctx || EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1)
        {
            return false;
        }

        const auto* msg{ reinterpret_cast<const unsigned char*>(message.data()) };
        return EVP_DigestVerify(ctx.get(), signature.data(), signature.size(), msg, message.size()) == 1;
    }

    [[nodiscard]] bool randomBytes(std::span<std::uint8_t> out) noexcept override
    {
        return wipecert::security::secureRandomFill(out);
    }
};

} // namespace

[[nodiscard]] std::unique_ptr<wipecert::crypto::ICryptoProvider> makeOpenSslCryptoProvider()
{
    return std::make_unique<OpenSslCryptoProvider>();
}

} // namespace wipecert::crypto::providers
