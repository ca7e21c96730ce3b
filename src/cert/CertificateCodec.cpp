#include "wipecert/cert/CertificateCodec.hpp"
#include <limits>
#include <nlohmann/json.hpp>
#include <optional>
#include <utility>
#include <vector>

namespace wipecert::cert
{
namespace
{

using Json = nlohmann::ordered_json;

constexpr int g_kPersistIndent{ 2 };

// ---- writing ----

[[nodiscard]] Json optionalToJson(const std::optional<std::string>& value)
{
    return value.has_value() ? Json(*value) : Json(nullptr);
}

[[nodiscard]] Json stringArray(const std::vector<std::string>& values)
{
    Json out = Json::array();
    for (const auto& v : values)
    {
        out.push_back(v);
    }
    return out;
}

[[nodiscard]] Json toJson(const BasicCertificate& c)
{
    Json j = Json::object();
    j["version"] = c.version;
    j["certificate_id"] = c.certificateId;
    j["timestamp"] = c.timestamp;

    Json device = Json::object();
    device["path"] = c.deviceInfo.path;
    device["name"] = c.deviceInfo.name;
    device["size"] = c.deviceInfo.size;
    device["device_type"] = c.deviceInfo.deviceType;
    device["model"] = optionalToJson(c.deviceInfo.model);
    device["serial"] = optionalToJson(c.deviceInfo.serial);
    j["device_info"] = std::move(device);

    Json wipe = Json::object();
    wipe["mode"] = c.wipeDetails.mode;
    wipe["start_time"] = c.wipeDetails.startTime;
    wipe["end_time"] = c.wipeDetails.endTime;
    wipe["duration_seconds"] = c.wipeDetails.durationSeconds;
    wipe["bytes_written"] = c.wipeDetails.bytesWritten;
    wipe["verification_passed"] = c.wipeDetails.verificationPassed;
    wipe["errors"] = stringArray(c.wipeDetails.errors);
    j["wipe_details"] = std::move(wipe);

    Json verification = Json::object();
    verification["hash"] = c.verification.hash;
    verification["algorithm"] = c.verification.algorithm;
    verification["public_key_fingerprint"] = c.verification.publicKeyFingerprint;
    j["verification"] = std::move(verification);

    j["signature"] = c.signature;
    return j;
}

[[nodiscard]] Json toJson(const EnhancedCertificate& c)
{
    Json j = Json::object();
    j["version"] = c.version;
    j["certificate_id"] = c.certificateId;
    j["timestamp"] = c.timestamp;

    Json issuer = Json::object();
    issuer["name"] = c.issuer.name;
    issuer["organization"] = c.issuer.organization;
    issuer["email"] = optionalToJson(c.issuer.email);
    issuer["public_key_fingerprint"] = c.issuer.publicKeyFingerprint;
    j["issuer"] = std::move(issuer);

    Json device = Json::object();
    device["path"] = c.deviceInfo.path;
    device["name"] = c.deviceInfo.name;
    device["size"] = c.deviceInfo.size;
    device["device_type"] = c.deviceInfo.deviceType;
    device["model"] = optionalToJson(c.deviceInfo.model);
    device["serial"] = optionalToJson(c.deviceInfo.serial);
    device["firmware_version"] = optionalToJson(c.deviceInfo.firmwareVersion);
    device["interface_type"] = optionalToJson(c.deviceInfo.interfaceType);
    Json areas = Json::array();
    for (const auto& area : c.deviceInfo.hiddenAreas)
    {
        Json a = Json::object();
        a["area_type"] = area.areaType;
        a["start_lba"] = area.startLba;
        a["size"] = area.size;
        a["description"] = area.description;
        a["wiped"] = area.wiped;
        areas.push_back(std::move(a));
    }
    device["hidden_areas"] = std::move(areas);
    Json caps = Json::object();
    caps["supports_secure_erase"] = c.deviceInfo.capabilities.supportsSecureErase;
    caps["supports_trim"] = c.deviceInfo.capabilities.supportsTrim;
    caps["supports_crypto_erase"] = c.deviceInfo.capabilities.supportsCryptoErase;
    caps["supports_format_unit"] = c.deviceInfo.capabilities.supportsFormatUnit;
    device["capabilities"] = std::move(caps);
    j["device_info"] = std::move(device);

    Json wipe = Json::object();
    wipe["mode"] = c.wipeDetails.mode;
    wipe["start_time"] = c.wipeDetails.startTime;
    wipe["end_time"] = c.wipeDetails.endTime;
    wipe["duration_seconds"] = c.wipeDetails.durationSeconds;
    wipe["bytes_written"] = c.wipeDetails.bytesWritten;
    wipe["passes_completed"] = c.wipeDetails.passesCompleted;
    wipe["verification_passed"] = c.wipeDetails.verificationPassed;
    wipe["errors"] = stringArray(c.wipeDetails.errors);
    wipe["warnings"] = stringArray(c.wipeDetails.warnings);
    Json perf = Json::object();
    perf["average_speed_mbps"] = c.wipeDetails.performanceMetrics.averageSpeedMbps;
    perf["peak_speed_mbps"] = c.wipeDetails.performanceMetrics.peakSpeedMbps;
    perf["sectors_per_second"] = c.wipeDetails.performanceMetrics.sectorsPerSecond;
    perf["retry_count"] = c.wipeDetails.performanceMetrics.retryCount;
    wipe["performance_metrics"] = std::move(perf);
    j["wipe_details"] = std::move(wipe);

    Json verification = Json::object();
    verification["hash"] = c.verification.hash;
    verification["algorithm"] = c.verification.algorithm;
    verification["verification_method"] = c.verification.verificationMethod;
    verification["sample_count"] = c.verification.sampleCount;
    verification["verification_ratio"] = c.verification.verificationRatio;
    verification["forensic_tools_used"] = stringArray(c.verification.forensicToolsUsed);
    j["verification"] = std::move(verification);

    Json compliance = Json::object();
    compliance["standards"] = stringArray(c.compliance.standards);
    compliance["compliance_level"] = c.compliance.complianceLevel;
    Json trail = Json::array();
    for (const auto& entry : c.compliance.auditTrail)
    {
        Json e = Json::object();
        e["timestamp"] = entry.timestamp;
        e["action"] = entry.action;
        e["result"] = entry.result;
        e["details"] = optionalToJson(entry.details);
        trail.push_back(std::move(e));
    }
    compliance["audit_trail"] = std::move(trail);
    j["compliance"] = std::move(compliance);

    Json pki = Json::object();
    pki["ocsp_url"] = optionalToJson(c.pki.ocspUrl);
    pki["crl_url"] = optionalToJson(c.pki.crlUrl);
    pki["ca_chain_pem"] = optionalToJson(c.pki.caChainPem);
    j["pki"] = std::move(pki);

    j["signature"] = c.signature;

    Json metadata = Json::object();
    metadata["tool_version"] = c.metadata.toolVersion;
    metadata["platform"] = c.metadata.platform;
    metadata["architecture"] = c.metadata.architecture;
    metadata["generated_by"] = c.metadata.generatedBy;
    metadata["qr_code_data"] = optionalToJson(c.metadata.qrCodeData);
    j["metadata"] = std::move(metadata);
    return j;
}

[[nodiscard]] Json toJson(const Certificate& certificate)
{
    return std::visit([](const auto& c) { return toJson(c); }, certificate);
}

// ---- reading ----

[[nodiscard]] const Json& field(const Json& object, const char* key)
{
    if (!object.is_object())
    {
        throw CertificateParseError(std::string{ "expected object around '" } + key + "'");
    }
    const auto it{ object.find(key) };
    if (it == object.end())
    {
        throw CertificateParseError(std::string{ "missing field '" } + key + "'");
    }
    return *it;
}

[[noreturn]] void wrongType(const char* key, const char* expected)
{
    throw CertificateParseError(std::string{ "field '" } + key + "' must be " + expected);
}

[[nodiscard]] const Json& objectField(const Json& object, const char* key)
{
    const auto& v{ field(object, key) };
    if (!v.is_object())
    {
        wrongType(key, "an object");
    }
    return v;
}

[[nodiscard]] const Json& arrayField(const Json& object, const char* key)
{
    const auto& v{ field(object, key) };
    if (!v.is_array())
    {
        wrongType(key, "an array");
    }
    return v;
}

[[nodiscard]] std::string stringField(const Json& object, const char* key)
{
    const auto& v{ field(object, key) };
    if (!v.is_string())
    {
        wrongType(key, "a string");
    }
    return v.get<std::string>();
}

[[nodiscard]] std::optional<std::string> optionalStringField(const Json& object, const char* key)
{
    if (!object.is_object())
    {
        throw CertificateParseError(std::string{ "expected object around '" } + key + "'");
    }
    const auto it{ object.find(key) };
    if (it == object.end() || it->is_null())
    {
        return std::nullopt;
    }
    if (!it->is_string())
    {
        wrongType(key, "a string or null");
    }
    return it->get<std::string>();
}

[[nodiscard]] std::uint64_t u64Field(const Json& object, const char* key)
{
    const auto& v{ field(object, key) };
    if (v.is_number_unsigned())
    {
        return v.get<std::uint64_t>();
    }
    if (v.is_number_integer() && v.get<std::int64_t>() >= 0)
    {
        return static_cast<std::uint64_t>(v.get<std::int64_t>());
    }
    wrongType(key, "a non-negative integer");
}

[[nodiscard]] std::uint32_t u32Field(const Json& object, const char* key)
{
    const auto value{ u64Field(object, key) };
    if (value > std::numeric_limits<std::uint32_t>::max())
    {
        wrongType(key, "a 32-bit unsigned integer");
    }
    return static_cast<std::uint32_t>(value);
}

[[nodiscard]] double doubleField(const Json& object, const char* key)
{
    const auto& v{ field(object, key) };
    if (!v.is_number())
    {
        wrongType(key, "a number");
    }
    return v.get<double>();
}

[[nodiscard]] bool boolField(const Json& object, const char* key)
{
    const auto& v{ field(object, key) };
    if (!v.is_boolean())
    {
        wrongType(key, "a boolean");
    }
    return v.get<bool>();
}

[[nodiscard]] std::vector<std::string> stringArrayField(const Json& object, const char* key)
{
    std::vector<std::string> out{};
    for (const auto& item : arrayField(object, key))
    {
        if (!item.is_string())
        {
            wrongType(key, "an array of strings");
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

[[nodiscard]] BasicCertificate parseBasic(const Json& j)
{
    BasicCertificate c{};
    c.version = stringField(j, "version");
    c.certificateId = stringField(j, "certificate_id");
    c.timestamp = u64Field(j, "timestamp");

    const auto& device{ objectField(j, "device_info") };
    c.deviceInfo.path = stringField(device, "path");
    c.deviceInfo.name = stringField(device, "name");
    c.deviceInfo.size = u64Field(device, "size");
    c.deviceInfo.deviceType = stringField(device, "device_type");
    c.deviceInfo.model = optionalStringField(device, "model");
    c.deviceInfo.serial = optionalStringField(device, "serial");

    const auto& wipe{ objectField(j, "wipe_details") };
    c.wipeDetails.mode = stringField(wipe, "mode");
    c.wipeDetails.startTime = u64Field(wipe, "start_time");
    c.wipeDetails.endTime = u64Field(wipe, "end_time");
    c.wipeDetails.durationSeconds = u64Field(wipe, "duration_seconds");
    c.wipeDetails.bytesWritten = u64Field(wipe, "bytes_written");
    c.wipeDetails.verificationPassed = boolField(wipe, "verification_passed");
    c.wipeDetails.errors = stringArrayField(wipe, "errors");

    const auto& verification{ objectField(j, "verification") };
    c.verification.hash = stringField(verification, "hash");
    c.verification.algorithm = stringField(verification, "algorithm");
    c.verification.publicKeyFingerprint = stringField(verification, "public_key_fingerprint");

    c.signature = stringField(j, "signature");
    return c;
}

[[nodiscard]] EnhancedCertificate parseEnhanced(const Json& j)
{
    EnhancedCertificate c{};
    c.version = stringField(j, "version");
    c.certificateId = stringField(j, "certificate_id");
    c.timestamp = u64Field(j, "timestamp");

    const auto& issuer{ objectField(j, "issuer") };
    c.issuer.name = stringField(issuer, "name");
    c.issuer.organization = stringField(issuer, "organization");
    c.issuer.email = optionalStringField(issuer, "email");
    c.issuer.publicKeyFingerprint = stringField(issuer, "public_key_fingerprint");

    const auto& device{ objectField(j, "device_info") };
    c.deviceInfo.path = stringField(device, "path");
    c.deviceInfo.name = stringField(device, "name");
    c.deviceInfo.size = u64Field(device, "size");
    c.deviceInfo.deviceType = stringField(device, "device_type");
    c.deviceInfo.model = optionalStringField(device, "model");
    c.deviceInfo.serial = optionalStringField(device, "serial");
    c.deviceInfo.firmwareVersion = optionalStringField(device, "firmware_version");
    c.deviceInfo.interfaceType = optionalStringField(device, "interface_type");
    for (const auto& area : arrayField(device, "hidden_areas"))
    {
        c.deviceInfo.hiddenAreas.push_back(HiddenAreaInfo{
            .areaType = stringField(area, "area_type"),
            .startLba = u64Field(area, "start_lba"),
            .size = u64Field(area, "size"),
            .description = stringField(area, "description"),
            .wiped = boolField(area, "wiped"),
        });
    }
    const auto& caps{ objectField(device, "capabilities") };
    c.deviceInfo.capabilities.supportsSecureErase = boolField(caps, "supports_secure_erase");
    c.deviceInfo.capabilities.supportsTrim = boolField(caps, "supports_trim");
    c.deviceInfo.capabilities.supportsCryptoErase = boolField(caps, "supports_crypto_erase");
    c.deviceInfo.capabilities.supportsFormatUnit = boolField(caps, "supports_format_unit");

    const auto& wipe{ objectField(j, "wipe_details") };
    c.wipeDetails.mode = stringField(wipe, "mode");
    c.wipeDetails.startTime = u64Field(wipe, "start_time");
    c.wipeDetails.endTime = u64Field(wipe, "end_time");
    c.wipeDetails.durationSeconds = u64Field(wipe, "duration_seconds");
    c.wipeDetails.bytesWritten = u64Field(wipe, "bytes_written");
    c.wipeDetails.passesCompleted = u32Field(wipe, "passes_completed");
    c.wipeDetails.verificationPassed = boolField(wipe, "verification_passed");
    c.wipeDetails.errors = stringArrayField(wipe, "errors");
    c.wipeDetails.warnings = stringArrayField(wipe, "warnings");
    const auto& perf{ objectField(wipe, "performance_metrics") };
    c.wipeDetails.performanceMetrics.averageSpeedMbps = doubleField(perf, "average_speed_mbps");
    c.wipeDetails.performanceMetrics.peakSpeedMbps = doubleField(perf, "peak_speed_mbps");
    c.wipeDetails.performanceMetrics.sectorsPerSecond = u64Field(perf, "sectors_per_second");
    c.wipeDetails.performanceMetrics.retryCount = u32Field(perf, "retry_count");

    const auto& verification{ objectField(j, "verification") };
    c.verification.hash = stringField(verification, "hash");
    c.verification.algorithm = stringField(verification, "algorithm");
    c.verification.verificationMethod = stringField(verification, "verification_method");
    c.verification.sampleCount = u32Field(verification, "sample_count");
    c.verification.verificationRatio = doubleField(verification, "verification_ratio");
    c.verification.forensicToolsUsed = stringArrayField(verification, "forensic_tools_used");

    const auto& compliance{ objectField(j, "compliance") };
    c.compliance.standards = stringArrayField(compliance, "standards");
    c.compliance.complianceLevel = stringField(compliance, "compliance_level");
    for (const auto& entry : arrayField(compliance, "audit_trail"))
    {
        c.compliance.auditTrail.push_back(AuditEntry{
            .timestamp = u64Field(entry, "timestamp"),
            .action = stringField(entry, "action"),
            .result = stringField(entry, "result"),
            .details = optionalStringField(entry, "details"),
        });
    }

    const auto& pki{ objectField(j, "pki") };
    c.pki.ocspUrl = optionalStringField(pki, "ocsp_url");
    c.pki.crlUrl = optionalStringField(pki, "crl_url");
    c.pki.caChainPem = optionalStringField(pki, "ca_chain_pem");

    c.signature = stringField(j, "signature");

    const auto& metadata{ objectField(j, "metadata") };
    c.metadata.toolVersion = stringField(metadata, "tool_version");
    c.metadata.platform = stringField(metadata, "platform");
    c.metadata.architecture = stringField(metadata, "architecture");
    c.metadata.generatedBy = stringField(metadata, "generated_by");
    c.metadata.qrCodeData = optionalStringField(metadata, "qr_code_data");
    return c;
}

} // namespace

// Doubles are written by nlohmann's shortest round-trip printer. With e the decimal exponent of the
// leading digit, -5 < e < 15 prints plain decimal and integral values keep ".0" (256000.0, 0.0001).
// Anything else prints "d[.ddd]e" with an explicit sign and at least two exponent digits
// (1e+15, 1e-05).
std::string canonicalBytes(const Certificate& certificate)
{
    Certificate stripped{ certificate };
    setHashAndSignature(stripped, std::string{}, std::string{});
    return toJson(stripped).dump();
}

std::string persistedBytes(const Certificate& certificate)
{
    std::string out{ toJson(certificate).dump(g_kPersistIndent) };
    out.push_back('\n');
    return out;
}

Certificate parseCertificate(std::string_view text)
{
    Json j{};
    try
    {
        j = Json::parse(text.begin(), text.end());
    }
    catch (const Json::parse_error& e)
    {
        throw CertificateParseError(std::string{ "parseCertificate: invalid JSON: " } + e.what());
    }

    try
    {
        return parseEnhanced(j);
    }
    catch (const CertificateParseError& enhancedError)
    {
        try
        {
            return parseBasic(j);
        }
        catch (const CertificateParseError& basicError)
        {
            throw CertificateParseError(std::string{ "parseCertificate: not an enhanced certificate (" } +
                                        enhancedError.what() + ") nor a basic one (" + basicError.what() + ")");
        }
    }
}

std::string qrCodePayload(const EnhancedCertificate& certificate)
{
    Json j = Json::object();
    j["id"] = certificate.certificateId;
    j["timestamp"] = certificate.timestamp;
    j["device"] = certificate.deviceInfo.name;
    j["mode"] = certificate.wipeDetails.mode;
    j["verified"] = certificate.wipeDetails.verificationPassed;
    j["ocsp"] = optionalToJson(certificate.pki.ocspUrl);
    return j.dump();
}

} // namespace wipecert::cert
