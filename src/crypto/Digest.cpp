#include "wipecert/crypto/Digest.hpp"
#include "wipecert/crypto/Encoding.hpp"
#include <memory>
#include <openssl/evp.h>
#include <stdexcept>

namespace wipecert::crypto
{
namespace
{

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

} // namespace

Sha256Digest sha256(std::span<const std::byte> data)
{
    EvpMdCtxPtr ctx{ EVP_MD_CTX_new(), &EVP_MD_CTX_free };
    if (!ctx)
    {
        throw std::runtime_error("sha256: EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1)
    {
        throw std::runtime_error("sha256: EVP_DigestInit_ex failed");
    }
    if (!data.empty() && EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1)
    {
        throw std::runtime_error("sha256: EVP_DigestUpdate failed");
    }

    Sha256Digest out{};
    unsigned int written{ 0U };
    if (EVP_DigestFinal_ex(ctx.get(), out.data(), &written) != 1 || written != out.size())
    {
        throw std::runtime_error("sha256: EVP_DigestFinal_ex failed");
    }
    return out;
}

std::string sha256Hex(std::span<const std::byte> data)
{
    const auto digest{ sha256(data) };
    return toHex(std::span<const std::uint8_t>{ digest });
}

} // namespace wipecert::crypto
