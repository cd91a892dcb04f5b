#pragma once
#include <ctime>
#include <string>
#include <string_view>
#include <mqcert/crypto/pointers.hpp>

namespace mqcert::crypto
{

class Cert final
{
public:
    static X509CertPtr shallowCopy(X509Cert* cert);

    static CertVersion version(X509Cert* cert);

    static X509NamePtr subjectName(X509Cert* cert);

    static X509NamePtr issuerName(X509Cert* cert);

    static BigNumPtr serialNumber(X509Cert* cert);

    static KeyPtr publicKey(X509Cert* cert);

    static std::time_t notBefore(X509Cert* cert);

    static std::time_t notAfter(X509Cert* cert);

    /// @brief True when the basicConstraints extension declares CA:TRUE.
    static bool isCA(X509Cert* cert);

    /// @brief Lower-case hex SHA-256 digest of the DER encoding.
    static std::string fingerprint(X509Cert* cert);

    static X509CertPtr fromBio(Bio* bio, Encoding encoding = Encoding::PEM);

    static void toBio(X509Cert* cert, Bio* bio, Encoding encoding = Encoding::PEM);

    static X509CertPtr fromPem(std::string_view pem);

    static std::string toPem(X509Cert* cert);
};

} // namespace mqcert::crypto
