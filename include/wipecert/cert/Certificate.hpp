#ifndef INCLUDE_WIPECERT_CERT_CERTIFICATE_HPP
#define INCLUDE_WIPECERT_CERT_CERTIFICATE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace wipecert::cert
{

inline constexpr std::string_view g_basicVersion{ "1.0" };
inline constexpr std::string_view g_enhancedVersion{ "2.0" };
inline constexpr std::string_view g_hashAlgorithm{ "SHA-256" };

struct DeviceInfo final
{
    std::string path;
    std::string name;
    std::uint64_t size{ 0U };
    std::string deviceType;
    std::optional<std::string> model;
    std::optional<std::string> serial;
};

struct WipeDetails final
{
    std::string mode;
    std::uint64_t startTime{ 0U };
    std::uint64_t endTime{ 0U };
    std::uint64_t durationSeconds{ 0U };
    std::uint64_t bytesWritten{ 0U };
    bool verificationPassed{ false };
    std::vector<std::string> errors;
};

struct VerificationInfo final
{
    std::string hash;
    std::string algorithm{ g_hashAlgorithm };
    std::string publicKeyFingerprint;
};

// Schema "1.0".
struct BasicCertificate final
{
    std::string version{ g_basicVersion };
    std::string certificateId;
    std::uint64_t timestamp{ 0U };
    DeviceInfo deviceInfo;
    WipeDetails wipeDetails;
    VerificationInfo verification;
    std::string signature;
};

struct IssuerInfo final
{
    std::string name;
    std::string organization;
    std::optional<std::string> email;
    std::string publicKeyFingerprint;
};

struct HiddenAreaInfo final
{
    std::string areaType;
    std::uint64_t startLba{ 0U };
    std::uint64_t size{ 0U };
    std::string description;
    bool wiped{ false };
};

struct DeviceCapabilities final
{
    bool supportsSecureErase{ false };
    bool supportsTrim{ false };
    bool supportsCryptoErase{ false };
    bool supportsFormatUnit{ false };
};

struct EnhancedDeviceInfo final
{
    std::string path;
    std::string name;
    std::uint64_t size{ 0U };
    std::string deviceType;
    std::optional<std::string> model;
    std::optional<std::string> serial;
    std::optional<std::string> firmwareVersion;
    std::optional<std::string> interfaceType;
    std::vector<HiddenAreaInfo> hiddenAreas;
    DeviceCapabilities capabilities;
};

// peakSpeedMbps is a modelled upper bound (1.5 x average), not a measurement.
struct PerformanceMetrics final
{
    double averageSpeedMbps{ 0.0 };
    double peakSpeedMbps{ 0.0 };
    std::uint64_t sectorsPerSecond{ 0U };
    std::uint32_t retryCount{ 0U };
};

struct EnhancedWipeDetails final
{
    std::string mode;
    std::uint64_t startTime{ 0U };
    std::uint64_t endTime{ 0U };
    std::uint64_t durationSeconds{ 0U };
    std::uint64_t bytesWritten{ 0U };
    std::uint32_t passesCompleted{ 0U };
    bool verificationPassed{ false };
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    PerformanceMetrics performanceMetrics;
};

struct EnhancedVerificationInfo final
{
    std::string hash;
    std::string algorithm{ g_hashAlgorithm };
    std::string verificationMethod;
    std::uint32_t sampleCount{ 0U };
    double verificationRatio{ 0.0 };
    std::vector<std::string> forensicToolsUsed;
};

struct AuditEntry final
{
    std::uint64_t timestamp{ 0U };
    std::string action;
    std::string result;
    std::optional<std::string> details;
};

struct ComplianceInfo final
{
    std::vector<std::string> standards;
    std::string complianceLevel;
    std::vector<AuditEntry> auditTrail;
};

struct PkiInfo final
{
    std::optional<std::string> ocspUrl;
    std::optional<std::string> crlUrl;
    std::optional<std::string> caChainPem;
};

struct CertificateMetadata final
{
    std::string toolVersion;
    std::string platform;
    std::string architecture;
    std::string generatedBy;
    std::optional<std::string> qrCodeData;
};

// Schema "2.0".
struct EnhancedCertificate final
{
    std::string version{ g_enhancedVersion };
    std::string certificateId;
    std::uint64_t timestamp{ 0U };
    IssuerInfo issuer;
    EnhancedDeviceInfo deviceInfo;
    EnhancedWipeDetails wipeDetails;
    EnhancedVerificationInfo verification;
    ComplianceInfo compliance;
    PkiInfo pki;
    std::string signature;
    CertificateMetadata metadata;
};

using Certificate = std::variant<BasicCertificate, EnhancedCertificate>;

enum class Schema : std::uint8_t
{
    Basic,
    Enhanced,
};

[[nodiscard]] Schema schemaOf(const Certificate& certificate) noexcept;
[[nodiscard]] std::string_view toString(Schema schema) noexcept;
[[nodiscard]] std::optional<Schema> parseSchema(std::string_view text) noexcept;

[[nodiscard]] const std::string& certificateId(const Certificate& certificate) noexcept;
[[nodiscard]] std::uint64_t timestampOf(const Certificate& certificate) noexcept;
[[nodiscard]] const std::string& hashOf(const Certificate& certificate) noexcept;
[[nodiscard]] const std::string& signatureOf(const Certificate& certificate) noexcept;
[[nodiscard]] const std::string& fingerprintOf(const Certificate& certificate) noexcept;

// Sets verification.hash and signature, the two fields excluded from the signed bytes.
void setHashAndSignature(Certificate& certificate, std::string hash, std::string signature);

} // namespace wipecert::cert

#endif // INCLUDE_WIPECERT_CERT_CERTIFICATE_HPP
