#ifndef INCLUDE_WIPECERT_CERT_CERTIFICATEVERIFIER_HPP
#define INCLUDE_WIPECERT_CERT_CERTIFICATEVERIFIER_HPP

#include "wipecert/cert/Certificate.hpp"
#include "wipecert/cert/VerificationResult.hpp"
#include "wipecert/core/Clock.hpp"
#include "wipecert/crypto/ICryptoProvider.hpp"
#include <filesystem>
#include <string>
#include <string_view>

namespace wipecert::cert
{

struct VerifierOptions final
{
    bool enableOcsp{ true };
    bool enableCrl{ true };
};

// Looks up a certificate at an OCSP responder or CRL distribution point.
class IRevocationChecker
{
public:
    IRevocationChecker() = default;
    IRevocationChecker(const IRevocationChecker&) = delete;
    IRevocationChecker& operator=(const IRevocationChecker&) = delete;
    IRevocationChecker(IRevocationChecker&&) = delete;
    IRevocationChecker& operator=(IRevocationChecker&&) = delete;
    virtual ~IRevocationChecker() = default;

    [[nodiscard]] virtual RevocationStatus check(std::string_view url,
                                                 const EnhancedCertificate& certificate) const noexcept = 0;
};

// Performs no network traffic; every lookup reports NotEvaluated.
[[nodiscard]] const IRevocationChecker& offlineRevocationChecker() noexcept;

class CertificateVerifier final
{
public:
    explicit CertificateVerifier(const wipecert::crypto::ICryptoProvider& crypto, VerifierOptions options = {},
                                 const IRevocationChecker* revocation = nullptr, wipecert::core::NowProvider now = {});

    // Throws CertificateParseError when `bytes` fit neither schema. Every other problem is reported
    // in the result.
    [[nodiscard]] VerificationResult verify(std::string_view bytes, const wipecert::crypto::PublicKey& key) const;

    // Throws std::runtime_error when the certificate file cannot be read and CertificateParseError
    // when it fits neither schema. Both are checked before the key is loaded.
    [[nodiscard]] VerificationResult verifyFile(const std::filesystem::path& certificatePath,
                                                const std::filesystem::path& publicKeyPath) const;

    [[nodiscard]] const VerifierOptions& options() const noexcept
    {
        return m_options;
    }

private:
    [[nodiscard]] VerificationResult verifyParsed(const Certificate& certificate,
                                                  const wipecert::crypto::PublicKey& key) const;
    void checkRevocation(const EnhancedCertificate& certificate, VerificationResult& result) const;

    const wipecert::crypto::ICryptoProvider& m_crypto;
    VerifierOptions m_options;
    const IRevocationChecker& m_revocation;
    wipecert::core::NowProvider m_now;
};

// Multi-line report printed by `wipecert verify`.
[[nodiscard]] std::string formatReport(const VerificationResult& result);

} // namespace wipecert::cert

#endif // INCLUDE_WIPECERT_CERT_CERTIFICATEVERIFIER_HPP
