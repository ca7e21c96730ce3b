#include "wipecert/cert/CertificateVerifier.hpp"
#include "wipecert/cert/CertificateCodec.hpp"
#include "wipecert/crypto/Digest.hpp"
#include "wipecert/crypto/Encoding.hpp"
#include "wipecert/crypto/KeyFile.hpp"
#include "wipecert/security/SecureEquals.hpp"
#include <algorithm>
#include <array>
#include <cstdio>
#include <fstream>
#include <glog/logging.h>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace wipecert::cert
{
namespace
{

constexpr std::uint64_t g_kSecondsPerDay{ 86'400U };
constexpr std::uint64_t g_kBytesPerGiB{ 1024ULL * 1024ULL * 1024ULL };

class OfflineRevocationChecker final : public IRevocationChecker
{
public:
    [[nodiscard]] RevocationStatus check(std::string_view /*url*/,
                                         const EnhancedCertificate& /*certificate*/) const noexcept override
    {
        return RevocationStatus::NotEvaluated;
    }
};

[[nodiscard]] std::string readCertificateText(const std::filesystem::path& path)
{
    std::ifstream in{ path, std::ios::binary };
    if (!in)
    {
        throw std::runtime_error("Cannot open certificate file: " + path.string());
    }
    std::string text{ std::istreambuf_iterator<char>{ in }, std::istreambuf_iterator<char>{} };
    if (in.bad())
    {
        throw std::runtime_error("Cannot read certificate file: " + path.string());
    }
    return text;
}

[[nodiscard]] std::span<const std::byte> asBytes(std::string_view s) noexcept
{
    return std::as_bytes(std::span<const char>{ s.data(), s.size() });
}

[[nodiscard]] bool checkCompliance(const Certificate& certificate)
{
    const auto* enhanced{ std::get_if<EnhancedCertificate>(&certificate) };
    if (enhanced == nullptr)
    {
        return true;
    }
    return enhanced->wipeDetails.verificationPassed && enhanced->wipeDetails.errors.empty() &&
           !enhanced->compliance.standards.empty();
}

[[nodiscard]] std::string_view checkMark(bool ok) noexcept
{
    return ok ? "✓ Valid" : "✗ Invalid";
}

[[nodiscard]] std::string_view yesNo(bool b) noexcept
{
    return b ? "Yes" : "No";
}

} // namespace

std::string_view toString(RevocationStatus status) noexcept
{
    switch (status)
    {
    case RevocationStatus::NotEvaluated:
        return "not evaluated";
    case RevocationStatus::Good:
        return "good";
    case RevocationStatus::Revoked:
        return "revoked";
    case RevocationStatus::Unknown:
        return "unknown";
    }
    return "unknown";
}

const IRevocationChecker& offlineRevocationChecker() noexcept
{
    static const OfflineRevocationChecker checker{};
    return checker;
}

CertificateVerifier::CertificateVerifier(const wipecert::crypto::ICryptoProvider& crypto, VerifierOptions options,
                                         const IRevocationChecker* revocation, wipecert::core::NowProvider now)
    : m_crypto{ crypto }, m_options{ options },
      m_revocation{ revocation != nullptr ? *revocation : offlineRevocationChecker() },
      m_now{ now ? std::move(now) : wipecert::core::NowProvider{ &wipecert::core::unixSecondsNow } }
{
}

void CertificateVerifier::checkRevocation(const EnhancedCertificate& certificate, VerificationResult& result) const
{
    if (m_options.enableOcsp && certificate.pki.ocspUrl.has_value())
    {
        result.details.ocspChecked = true;
        result.ocspStatus = m_revocation.check(*certificate.pki.ocspUrl, certificate);
        VLOG(1) << "OCSP status for " << certificate.certificateId << ": " << toString(result.ocspStatus);
    }
    if (m_options.enableCrl && certificate.pki.crlUrl.has_value())
    {
        result.details.crlChecked = true;
        result.crlStatus = m_revocation.check(*certificate.pki.crlUrl, certificate);
        VLOG(1) << "CRL status for " << certificate.certificateId << ": " << toString(result.crlStatus);
    }
    if (result.ocspStatus == RevocationStatus::Revoked || result.crlStatus == RevocationStatus::Revoked)
    {
        result.errors.emplace_back("Certificate has been revoked");
    }
}

VerificationResult CertificateVerifier::verify(std::string_view bytes, const wipecert::crypto::PublicKey& key) const
{
    return verifyParsed(parseCertificate(bytes), key);
}

VerificationResult CertificateVerifier::verifyParsed(const Certificate& certificate,
                                                     const wipecert::crypto::PublicKey& key) const
{
    VerificationResult result{};
    result.schema = schemaOf(certificate);
    result.certificateId = certificateId(certificate);

    const std::string canonical{ canonicalBytes(certificate) };
    const auto message{ asBytes(canonical) };

    const auto rawSignature{ wipecert::crypto::fromHex(signatureOf(certificate)) };
    if (!rawSignature.has_value() || rawSignature->size() != wipecert::crypto::g_ed25519SignatureBytes)
    {
        result.errors.emplace_back("Invalid signature format");
    }
    else
    {
        wipecert::crypto::Signature signature{};
        std::copy(rawSignature->begin(), rawSignature->end(), signature.begin());
        result.signatureValid = m_crypto.verify(key, message, signature);
        if (!result.signatureValid)
        {
            result.errors.emplace_back("Invalid signature");
        }
    }

    const std::string expectedHash{ wipecert::crypto::sha256Hex(message) };
    result.hashValid = wipecert::security::secureEquals(std::string_view{ expectedHash }, std::string_view{ hashOf(certificate) });
    if (!result.hashValid)
    {
        result.warnings.emplace_back("Hash verification failed");
    }

    if (fingerprintOf(certificate) != wipecert::crypto::keyFingerprint(key))
    {
        result.warnings.emplace_back("Public key fingerprint mismatch");
    }

    result.complianceValid = checkCompliance(certificate);

    const auto now{ m_now() };
    const auto issuedAt{ timestampOf(certificate) };
    result.details.certificateAgeDays = (now > issuedAt) ? (now - issuedAt) / g_kSecondsPerDay : 0U;

    std::visit(
        [&](const auto& c) {
            using T = std::decay_t<decltype(c)>;
            result.details.deviceSizeGb = c.deviceInfo.size / g_kBytesPerGiB;
            result.details.wipeDurationSeconds = c.wipeDetails.durationSeconds;
            if constexpr (std::is_same_v<T, EnhancedCertificate>)
            {
                result.details.verificationRatio = c.verification.verificationRatio;
                checkRevocation(c, result);
            }
            else
            {
                result.details.verificationRatio = c.wipeDetails.verificationPassed ? 1.0 : 0.0;
            }
        },
        certificate);

    const bool revoked{ result.ocspStatus == RevocationStatus::Revoked ||
                        result.crlStatus == RevocationStatus::Revoked };
    result.isValid = result.signatureValid && result.hashValid && result.complianceValid && !revoked;

    if (result.isValid)
    {
        LOG(INFO) << "Certificate " << result.certificateId << " verified";
    }
    else
    {
        LOG(WARNING) << "Certificate " << result.certificateId << " failed verification";
    }
    return result;
}

VerificationResult CertificateVerifier::verifyFile(const std::filesystem::path& certificatePath,
                                                   const std::filesystem::path& publicKeyPath) const
{
    const Certificate certificate{ parseCertificate(readCertificateText(certificatePath)) };

    wipecert::crypto::PublicKey key{};
    try
    {
        key = wipecert::crypto::loadPublicKey(publicKeyPath);
    }
    catch (const wipecert::crypto::KeyFileError& e)
    {
        VerificationResult result{};
        result.schema = schemaOf(certificate);
        result.certificateId = certificateId(certificate);
        result.errors.push_back(std::string{ "Failed to load public key: " } + e.what());
        return result;
    }
    return verifyParsed(certificate, key);
}

std::string formatReport(const VerificationResult& result)
{
    std::ostringstream out{};
    constexpr std::string_view heading{ "Certificate Verification Result:" };
    out << heading << '\n' << std::string(heading.size(), '=') << '\n';
    if (!result.certificateId.empty())
    {
        out << "Certificate ID: " << result.certificateId << " (" << toString(result.schema) << ")\n";
    }
    out << (result.isValid ? "✓ Certificate is VALID" : "✗ Certificate is INVALID") << "\n\n";

    out << "Signature: " << checkMark(result.signatureValid) << '\n';
    out << "Hash: " << checkMark(result.hashValid) << '\n';
    out << "Compliance: " << checkMark(result.complianceValid) << '\n';
    out << "OCSP Checked: " << yesNo(result.details.ocspChecked) << '\n';
    out << "CRL Checked: " << yesNo(result.details.crlChecked) << '\n';

    if (!result.warnings.empty())
    {
        out << "\nWarnings:\n";
        for (const auto& w : result.warnings)
        {
            out << "  ⚠ " << w << '\n';
        }
    }
    if (!result.errors.empty())
    {
        out << "\nErrors:\n";
        for (const auto& e : result.errors)
        {
            out << "  ✗ " << e << '\n';
        }
    }

    std::array<char, 32> ratio{};
    std::snprintf(ratio.data(), ratio.size(), "%.1f%%", result.details.verificationRatio * 100.0);

    out << "\nDetails:\n";
    out << "  Certificate Age: " << result.details.certificateAgeDays << " days\n";
    out << "  Device Size: " << result.details.deviceSizeGb << " GB\n";
    out << "  Wipe Duration: " << result.details.wipeDurationSeconds << " seconds\n";
    out << "  Verification Ratio: " << ratio.data() << '\n';
    return out.str();
}

} // namespace wipecert::cert
