#ifndef INCLUDE_WIPECERT_CERT_CERTIFICATECODEC_HPP
#define INCLUDE_WIPECERT_CERT_CERTIFICATECODEC_HPP

#include "wipecert/cert/Certificate.hpp"
#include <stdexcept>
#include <string>
#include <string_view>

namespace wipecert::cert
{

class CertificateParseError final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Bytes that are hashed and signed: compact JSON in schema field order with verification.hash and
// signature set to "". Always regenerated from the model, never taken from persisted text.
[[nodiscard]] std::string canonicalBytes(const Certificate& certificate);

// On-disk form: same structure with both fields filled, two-space indent, trailing newline.
[[nodiscard]] std::string persistedBytes(const Certificate& certificate);

// Tries the enhanced schema first, then basic. Throws CertificateParseError when neither fits.
[[nodiscard]] Certificate parseCertificate(std::string_view text);

// Compact {"id","timestamp","device","mode","verified","ocsp"} object carried in metadata.qr_code_data.
[[nodiscard]] std::string qrCodePayload(const EnhancedCertificate& certificate);

} // namespace wipecert::cert

#endif // INCLUDE_WIPECERT_CERT_CERTIFICATECODEC_HPP
