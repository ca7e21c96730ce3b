#include "wipecert/cert/CertificateIssuer.hpp"
#include "wipecert/cert/CertificateCodec.hpp"
#include "wipecert/crypto/Digest.hpp"
#include "wipecert/crypto/Encoding.hpp"
#include "wipecert/crypto/KeyFile.hpp"
#include "wipecert/security/SecureRandom.hpp"
#include <array>
#include <cinttypes>
#include <cstdio>
#include <fstream>
#include <glog/logging.h>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace wipecert::cert
{
namespace
{

using wipecert::core::ErrorKind;
using wipecert::core::Failure;

constexpr double g_kBytesPerGiB{ 1024.0 * 1024.0 * 1024.0 };
constexpr double g_kMbPerGb{ 1024.0 };
constexpr double g_kSecondsPerHour{ 3600.0 };
constexpr double g_kPeakFactor{ 1.5 };
constexpr std::uint64_t g_kMetricSectorBytes{ 512U };
constexpr std::uint64_t g_kLargeDeviceBytes{ 2ULL * 1024ULL * 1024ULL * 1024ULL * 1024ULL };

constexpr std::string_view g_kVerificationMethod{ "Random Sector Sampling" };
constexpr std::string_view g_kInternalTool{ "Internal Verification" };

[[nodiscard]] std::string_view platformName() noexcept
{
#if defined(__linux__)
    return "linux";
#else
    return "unknown";
#endif
}

[[nodiscard]] std::string_view architectureName() noexcept
{
#if defined(__x86_64__)
    return "x86_64";
#elif defined(__aarch64__)
    return "aarch64";
#elif defined(__arm__)
    return "arm";
#elif defined(__riscv)
    return "riscv64";
#else
    return "unknown";
#endif
}

[[nodiscard]] bool defaultRandom(std::uint32_t& out)
{
    return wipecert::security::secureRandomUint32(out);
}

[[nodiscard]] std::span<const std::byte> asBytes(std::string_view s) noexcept
{
    return std::as_bytes(std::span<const char>{ s.data(), s.size() });
}

[[nodiscard]] std::vector<std::string> warningsFor(const wipecert::core::WipeResult& result)
{
    std::vector<std::string> warnings{};
    if (!result.verificationPassed)
    {
        warnings.emplace_back("Device verification failed - manual inspection recommended");
    }
    if (!result.errors.empty())
    {
        warnings.emplace_back("Errors occurred during wipe operation");
    }
    if (result.device.size > g_kLargeDeviceBytes)
    {
        warnings.emplace_back("Large device - extended verification recommended");
    }
    return warnings;
}

[[nodiscard]] std::vector<AuditEntry> auditTrailFor(const wipecert::core::WipeResult& result)
{
    const bool passed{ result.verificationPassed };
    return {
        AuditEntry{ .timestamp = result.startTime,
                    .action = "Wipe Operation Started",
                    .result = "Success",
                    .details = "Mode: " + std::string{ wipecert::core::toString(result.mode) } },
        AuditEntry{ .timestamp = result.endTime,
                    .action = "Wipe Operation Completed",
                    .result = passed ? "Success" : "Failed",
                    .details = "Bytes written: " + std::to_string(result.bytesWritten) },
        AuditEntry{ .timestamp = result.endTime,
                    .action = "Verification Performed",
                    .result = passed ? "Passed" : "Failed",
                    .details = std::nullopt },
    };
}

} // namespace

std::vector<std::string> defaultStandards()
{
    return { "NIST SP 800-88 Rev. 1", "DoD 5220.22-M", "ISO/IEC 27040:2015" };
}

std::string basicCertificateId(std::uint64_t timestamp)
{
    std::array<char, 32> buf{};
    std::snprintf(buf.data(), buf.size(), "WIPE_%016" PRIX64, timestamp);
    return std::string{ buf.data() };
}

std::string enhancedCertificateId(std::uint64_t timestamp, std::uint32_t salt)
{
    return basicCertificateId(timestamp) + "_" + std::to_string(salt);
}

std::string_view complianceLevelFor(wipecert::core::EraseMode mode) noexcept
{
    switch (mode)
    {
    case wipecert::core::EraseMode::Quick:
        return "Basic";
    case wipecert::core::EraseMode::Full:
        return "Standard";
    case wipecert::core::EraseMode::Advanced:
        return "High";
    }
    return "Basic";
}

PerformanceMetrics performanceMetricsFor(const wipecert::core::WipeResult& result)
{
    PerformanceMetrics metrics{};
    if (result.durationSeconds > 0U)
    {
        const double sizeGb{ static_cast<double>(result.bytesWritten) / g_kBytesPerGiB };
        const double hours{ static_cast<double>(result.durationSeconds) / g_kSecondsPerHour };
        metrics.averageSpeedMbps = (sizeGb * g_kMbPerGb) / hours;
        metrics.sectorsPerSecond = result.bytesWritten / g_kMetricSectorBytes / result.durationSeconds;
    }
    metrics.peakSpeedMbps = metrics.averageSpeedMbps * g_kPeakFactor;
    metrics.retryCount = (result.attempts > 0U) ? (result.attempts - 1U) : 0U;
    return metrics;
}

void writeCertificate(const std::filesystem::path& path, std::string_view bytes)
{
    namespace fs = std::filesystem;
    if (path.has_parent_path())
    {
        fs::create_directories(path.parent_path());
    }

    fs::path temp{ path };
    temp += ".partial";
    {
        std::ofstream out{ temp, std::ios::binary | std::ios::trunc };
        if (!out)
        {
            throw std::runtime_error("writeCertificate: cannot create " + temp.string());
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out)
        {
            out.close();
            std::error_code ignored{};
            fs::remove(temp, ignored);
            throw std::runtime_error("writeCertificate: short write to " + temp.string());
        }
    }

    std::error_code ec{};
    fs::rename(temp, path, ec);
    if (ec)
    {
        std::error_code ignored{};
        fs::remove(temp, ignored);
        throw std::runtime_error("writeCertificate: cannot move certificate into place: " + ec.message());
    }
}

CertificateIssuer::CertificateIssuer(const wipecert::crypto::ICryptoProvider& crypto, IssuerConfig config,
                                     wipecert::core::NowProvider now, RandomU32 random)
    : m_crypto{ crypto }, m_config{ std::move(config) },
      m_now{ now ? std::move(now) : wipecert::core::NowProvider{ &wipecert::core::unixSecondsNow } },
      m_random{ random ? std::move(random) : RandomU32{ &defaultRandom } }
{
}

BasicCertificate CertificateIssuer::buildBasic(const wipecert::core::WipeResult& result, std::uint64_t now,
                                               const std::string& fingerprint) const
{
    BasicCertificate c{};
    c.certificateId = basicCertificateId(now);
    c.timestamp = now;

    c.deviceInfo.path = result.device.path;
    c.deviceInfo.name = result.device.name;
    c.deviceInfo.size = result.device.size;
    c.deviceInfo.deviceType = std::string{ wipecert::core::toString(result.device.type) };
    c.deviceInfo.model = result.device.model;
    c.deviceInfo.serial = result.device.serial;

    c.wipeDetails.mode = std::string{ wipecert::core::toString(result.mode) };
    c.wipeDetails.startTime = result.startTime;
    c.wipeDetails.endTime = result.endTime;
    c.wipeDetails.durationSeconds = result.durationSeconds;
    c.wipeDetails.bytesWritten = result.bytesWritten;
    c.wipeDetails.verificationPassed = result.verificationPassed;
    c.wipeDetails.errors = result.errors;

    c.verification.publicKeyFingerprint = fingerprint;
    return c;
}

EnhancedCertificate CertificateIssuer::buildEnhanced(const wipecert::core::WipeResult& result, std::uint64_t now,
                                                     std::uint32_t salt, const std::string& fingerprint) const
{
    const auto& device{ result.device };

    EnhancedCertificate c{};
    c.certificateId = enhancedCertificateId(now, salt);
    c.timestamp = now;

    c.issuer.name = m_config.identity.name;
    c.issuer.organization = m_config.identity.organization;
    c.issuer.email = m_config.identity.email;
    c.issuer.publicKeyFingerprint = fingerprint;

    c.deviceInfo.path = device.path;
    c.deviceInfo.name = device.name;
    c.deviceInfo.size = device.size;
    c.deviceInfo.deviceType = std::string{ wipecert::core::toString(device.type) };
    c.deviceInfo.model = device.model;
    c.deviceInfo.serial = device.serial;
    c.deviceInfo.firmwareVersion = device.firmwareVersion;
    c.deviceInfo.interfaceType = device.interfaceType;
    for (std::size_t i{}; i < device.hiddenAreas.size(); ++i)
    {
        const auto& area{ device.hiddenAreas[i] };
        c.deviceInfo.hiddenAreas.push_back(HiddenAreaInfo{
            .areaType = std::string{ wipecert::core::toString(area.kind) },
            .startLba = area.startLba,
            .size = area.size,
            .description = area.description,
            .wiped = i < result.hiddenAreasCleared.size() && result.hiddenAreasCleared[i],
        });
    }
    c.deviceInfo.capabilities = DeviceCapabilities{
        .supportsSecureErase = device.supportsSecureErase,
        .supportsTrim = device.supportsTrim,
        .supportsCryptoErase = device.supportsCryptoErase,
        .supportsFormatUnit = device.supportsFormatUnit,
    };

    c.wipeDetails.mode = std::string{ wipecert::core::toString(result.mode) };
    c.wipeDetails.startTime = result.startTime;
    c.wipeDetails.endTime = result.endTime;
    c.wipeDetails.durationSeconds = result.durationSeconds;
    c.wipeDetails.bytesWritten = result.bytesWritten;
    c.wipeDetails.passesCompleted = result.passesCompleted;
    c.wipeDetails.verificationPassed = result.verificationPassed;
    c.wipeDetails.errors = result.errors;
    c.wipeDetails.warnings = warningsFor(result);
    c.wipeDetails.performanceMetrics = performanceMetricsFor(result);

    c.verification.verificationMethod = std::string{ g_kVerificationMethod };
    c.verification.sampleCount = result.sampleCount;
    c.verification.verificationRatio = result.verificationRatio;
    c.verification.forensicToolsUsed = { std::string{ g_kInternalTool } };

    c.compliance.standards = m_config.standards;
    c.compliance.complianceLevel = std::string{ complianceLevelFor(result.mode) };
    c.compliance.auditTrail = auditTrailFor(result);

    c.pki.ocspUrl = m_config.ocspUrl;
    c.pki.crlUrl = m_config.crlUrl;
    c.pki.caChainPem = m_config.caChainPem;

    c.metadata.toolVersion = m_config.toolVersion;
    c.metadata.platform = std::string{ platformName() };
    c.metadata.architecture = std::string{ architectureName() };
    c.metadata.generatedBy = m_config.identity.name;
    c.metadata.qrCodeData = qrCodePayload(c);
    return c;
}

wipecert::core::Result<IssuedCertificate> CertificateIssuer::issue(const wipecert::core::WipeResult& result,
                                                                   const wipecert::crypto::SigningKey& key,
                                                                   Schema schema) const noexcept
{
    try
    {
        if (key.seed.size() != wipecert::crypto::g_ed25519SeedBytes)
        {
            return Failure{ .kind = ErrorKind::Crypto,
                            .summary = "Unusable signing key",
                            .messages = { "seed must be 32 bytes" } };
        }
        if (m_crypto.derivePublicKey(wipecert::security::asSpan(key.seed)) != key.publicKey)
        {
            return Failure{ .kind = ErrorKind::Crypto,
                            .summary = "Unusable signing key",
                            .messages = { "public key does not belong to the private key" } };
        }

        const auto fingerprint{ wipecert::crypto::keyFingerprint(key.publicKey) };
        const auto now{ m_now() };

        Certificate certificate{};
        if (schema == Schema::Enhanced)
        {
            std::uint32_t salt{ 0U };
            if (!m_random(salt))
            {
                return Failure{ .kind = ErrorKind::CertificateGenerationFailed,
                                .summary = "Certificate id salt unavailable",
                                .messages = {} };
            }
            certificate = buildEnhanced(result, now, salt, fingerprint);
        }
        else
        {
            certificate = buildBasic(result, now, fingerprint);
        }

        const std::string canonical{ canonicalBytes(certificate) };
        const auto bytes{ asBytes(canonical) };
        auto hash{ wipecert::crypto::sha256Hex(bytes) };
        const auto signature{ m_crypto.sign(wipecert::security::asSpan(key.seed), bytes) };
        setHashAndSignature(certificate, std::move(hash), wipecert::crypto::toHex(signature));

        IssuedCertificate issued{ .certificate = std::move(certificate), .bytes = {} };
        issued.bytes = persistedBytes(issued.certificate);
        LOG(INFO) << "Issued " << toString(schema) << " certificate " << certificateId(issued.certificate);
        return issued;
    }
    catch (const std::invalid_argument& e)
    {
        LOG(ERROR) << "Certificate signing failed: " << e.what();
        return Failure{ .kind = ErrorKind::Crypto, .summary = "Certificate signing failed", .messages = { e.what() } };
    }
    catch (const std::exception& e)
    {
        LOG(ERROR) << "Certificate generation failed: " << e.what();
        return Failure{ .kind = ErrorKind::CertificateGenerationFailed,
                        .summary = "Certificate generation failed",
                        .messages = { e.what() } };
    }
}

wipecert::core::Result<IssuedCertificate>
CertificateIssuer::issueToFile(const wipecert::core::WipeResult& result, const wipecert::crypto::SigningKey& key,
                               Schema schema, const std::filesystem::path& path,
                               wipecert::storage::ICertificateLedger* ledger) const noexcept
{
    auto issued{ issue(result, key, schema) };
    auto* ok{ std::get_if<IssuedCertificate>(&issued) };
    if (ok == nullptr)
    {
        return issued;
    }

    try
    {
        writeCertificate(path, ok->bytes);
    }
    catch (const std::exception& e)
    {
        LOG(ERROR) << "Cannot persist certificate: " << e.what();
        return Failure{ .kind = ErrorKind::Io, .summary = "Cannot persist certificate", .messages = { e.what() } };
    }

    if (ledger != nullptr)
    {
        try
        {
            ledger->record(wipecert::storage::LedgerEntry{
                .certificateId = certificateId(ok->certificate),
                .timestamp = timestampOf(ok->certificate),
                .devicePath = result.device.path,
                .mode = std::string{ wipecert::core::toString(result.mode) },
                .schema = std::string{ toString(schema) },
                .hash = hashOf(ok->certificate),
                .certificatePath = path,
                .verificationPassed = result.verificationPassed,
            });
        }
        catch (const std::exception& e)
        {
            LOG(ERROR) << "Ledger update failed: " << e.what();
            return Failure{ .kind = ErrorKind::Io,
                            .summary = "Certificate written to " + path.string() + " but the ledger update failed",
                            .messages = { e.what() } };
        }
    }
    return issued;
}

} // namespace wipecert::cert
