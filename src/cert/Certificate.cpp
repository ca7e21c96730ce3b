#include "wipecert/cert/Certificate.hpp"
#include <utility>

namespace wipecert::cert
{

Schema schemaOf(const Certificate& certificate) noexcept
{
    return std::holds_alternative<EnhancedCertificate>(certificate) ? Schema::Enhanced : Schema::Basic;
}

std::string_view toString(Schema schema) noexcept
{
    return (schema == Schema::Enhanced) ? "enhanced" : "basic";
}

std::optional<Schema> parseSchema(std::string_view text) noexcept
{
    if (text == "basic")
    {
        return Schema::Basic;
    }
    if (text == "enhanced")
    {
        return Schema::Enhanced;
    }
    return std::nullopt;
}

const std::string& certificateId(const Certificate& certificate) noexcept
{
    return std::visit([](const auto& c) -> const std::string& { return c.certificateId; }, certificate);
}

std::uint64_t timestampOf(const Certificate& certificate) noexcept
{
    return std::visit([](const auto& c) { return c.timestamp; }, certificate);
}

const std::string& hashOf(const Certificate& certificate) noexcept
{
    return std::visit([](const auto& c) -> const std::string& { return c.verification.hash; }, certificate);
}

const std::string& signatureOf(const Certificate& certificate) noexcept
{
    return std::visit([](const auto& c) -> const std::string& { return c.signature; }, certificate);
}

const std::string& fingerprintOf(const Certificate& certificate) noexcept
{
    if (const auto* enhanced{ std::get_if<EnhancedCertificate>(&certificate) })
    {
        return enhanced->issuer.publicKeyFingerprint;
    }
    return std::get<BasicCertificate>(certificate).verification.publicKeyFingerprint;
}

void setHashAndSignature(Certificate& certificate, std::string hash, std::string signature)
{
    std::visit(
        [&hash, &signature](auto& c)
        {
            c.verification.hash = std::move(hash);
            c.signature = std::move(signature);
        },
        certificate);
}

} // namespace wipecert::cert
