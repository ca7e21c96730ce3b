#ifndef INCLUDE_WIPECERT_CERT_VERIFICATIONRESULT_HPP
#define INCLUDE_WIPECERT_CERT_VERIFICATIONRESULT_HPP

#include "wipecert/cert/Certificate.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace wipecert::cert
{

enum class RevocationStatus : std::uint8_t
{
    NotEvaluated,
    Good,
    Revoked,
    Unknown,
};

[[nodiscard]] std::string_view toString(RevocationStatus status) noexcept;

struct VerificationDetails final
{
    std::uint64_t certificateAgeDays{ 0U };
    std::uint64_t deviceSizeGb{ 0U };
    std::uint64_t wipeDurationSeconds{ 0U };
    double verificationRatio{ 0.0 };
    bool ocspChecked{ false };
    bool crlChecked{ false };
};

// Report of one verification. Every failed check is listed; nothing here is thrown.
struct VerificationResult final
{
    bool isValid{ false };
    bool signatureValid{ false };
    bool hashValid{ false };
    bool complianceValid{ false };
    std::vector<std::string> warnings;
    std::vector<std::string> errors;
    VerificationDetails details;

    Schema schema{ Schema::Basic };
    std::string certificateId;
    RevocationStatus ocspStatus{ RevocationStatus::NotEvaluated };
    RevocationStatus crlStatus{ RevocationStatus::NotEvaluated };
};

} // namespace wipecert::cert

#endif // INCLUDE_WIPECERT_CERT_VERIFICATIONRESULT_HPP
