#ifndef INCLUDE_WIPECERT_CERT_CERTIFICATEISSUER_HPP
#define INCLUDE_WIPECERT_CERT_CERTIFICATEISSUER_HPP

#include "wipecert/Version.hpp"
#include "wipecert/cert/Certificate.hpp"
#include "wipecert/core/Clock.hpp"
#include "wipecert/core/Errors.hpp"
#include "wipecert/core/WipeResult.hpp"
#include "wipecert/crypto/ICryptoProvider.hpp"
#include "wipecert/storage/ICertificateLedger.hpp"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wipecert::cert
{

inline constexpr std::string_view g_certificateFileName{ "wipe_certificate.json" };

struct IssuerIdentity final
{
    std::string name{ "wipecert" };
    std::string organization;
    std::optional<std::string> email;
};

[[nodiscard]] std::vector<std::string> defaultStandards();

struct IssuerConfig final
{
    IssuerIdentity identity{};
    std::optional<std::string> ocspUrl;
    std::optional<std::string> crlUrl;
    std::optional<std::string> caChainPem;
    std::string toolVersion{ wipecert::g_toolVersion };
    std::vector<std::string> standards{ defaultStandards() };
};

struct IssuedCertificate final
{
    Certificate certificate;
    std::string bytes; // persisted form
};

// Salt for enhanced certificate ids. Returns false when no randomness is available.
using RandomU32 = std::function<bool(std::uint32_t&)>;

[[nodiscard]] std::string basicCertificateId(std::uint64_t timestamp);
[[nodiscard]] std::string enhancedCertificateId(std::uint64_t timestamp, std::uint32_t salt);

// Quick -> Basic, Full -> Standard, Advanced -> High.
[[nodiscard]] std::string_view complianceLevelFor(wipecert::core::EraseMode mode) noexcept;

// average = (bytes / GiB * 1024) / hours, 0 for a zero duration. peak is modelled as 1.5 x average.
[[nodiscard]] PerformanceMetrics performanceMetricsFor(const wipecert::core::WipeResult& result);

// Persists atomically: the bytes go to a sibling temp file that is renamed over `path`.
void writeCertificate(const std::filesystem::path& path, std::string_view bytes);

// Builds, hashes and signs certificates. Stateless apart from its configuration.
class CertificateIssuer final
{
public:
    explicit CertificateIssuer(const wipecert::crypto::ICryptoProvider& crypto, IssuerConfig config = {},
                               wipecert::core::NowProvider now = {}, RandomU32 random = {});

    [[nodiscard]] wipecert::core::Result<IssuedCertificate> issue(const wipecert::core::WipeResult& result,
                                                                  const wipecert::crypto::SigningKey& key,
                                                                  Schema schema) const noexcept;

    // issue() + writeCertificate(). Records the certificate in `ledger` when one is given.
    // Nothing is written when signing fails.
    [[nodiscard]] wipecert::core::Result<IssuedCertificate>
    issueToFile(const wipecert::core::WipeResult& result, const wipecert::crypto::SigningKey& key, Schema schema,
                const std::filesystem::path& path, wipecert::storage::ICertificateLedger* ledger) const noexcept;

    [[nodiscard]] const IssuerConfig& config() const noexcept
    {
        return m_config;
    }

private:
    [[nodiscard]] BasicCertificate buildBasic(const wipecert::core::WipeResult& result, std::uint64_t now,
                                              const std::string& fingerprint) const;
    [[nodiscard]] EnhancedCertificate buildEnhanced(const wipecert::core::WipeResult& result, std::uint64_t now,
                                                    std::uint32_t salt, const std::string& fingerprint) const;

    const wipecert::crypto::ICryptoProvider& m_crypto;
    IssuerConfig m_config;
    wipecert::core::NowProvider m_now;
    RandomU32 m_random;
};

} // namespace wipecert::cert

#endif // INCLUDE_WIPECERT_CERT_CERTIFICATEISSUER_HPP
