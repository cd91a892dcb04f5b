#pragma once
#include <string>
#include <string_view>

namespace mqcert::pki
{

enum class ArtifactKind
{
    CertificateRequest,
    Certificate,
};

/// @brief Human-readable decoding of PEM CSRs and certificates.
class ArtifactInspector final
{
public:
    /// @brief Kind of the first PEM block in @p pem.
    ///
    /// @throws ValidationError if @p pem holds neither a CSR nor a certificate.
    static ArtifactKind detect(std::string_view pem);

    /// @brief OpenSSL text form: version, subject, issuer, validity, public key, extensions and signature.
    ///
    /// @throws ValidationError on malformed or unrecognised input.
    static std::string describe(std::string_view pem);

    /// @brief Subject as "C=US, ST=California, CN=device-001".
    ///
    /// @throws ValidationError on malformed or unrecognised input.
    static std::string subjectOf(std::string_view pem);
};

} // namespace mqcert::pki
