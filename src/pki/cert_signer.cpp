#include <chrono>

#include <casket/log/log_manager.hpp>

#include <mqcert/crypto/asymm_key.hpp>
#include <mqcert/crypto/cert.hpp>
#include <mqcert/crypto/cert_builder.hpp>
#include <mqcert/crypto/cert_name.hpp>
#include <mqcert/crypto/exception.hpp>
#include <mqcert/crypto/req.hpp>

#include <mqcert/pki/cert_signer.hpp>
#include <mqcert/pki/error.hpp>
#include <mqcert/pki/extension_profile.hpp>

#include "text_utils.hpp"

using namespace mqcert::crypto;

namespace mqcert::pki
{

CertSigner::CertSigner(Key* caKey, X509Cert* caCert, SerialAllocator& serials)
    : caKey_(AsymmKey::shallowCopy(caKey))
    , caCert_(Cert::shallowCopy(caCert))
    , serials_(serials)
{
    crypto::ThrowIfFalse(0 < X509_check_private_key(caCert_, caKey_), "CA key does not match CA certificate");
}

X509CertPtr CertSigner::sign(Role role, X509Req* csr, int validityDays, const std::vector<SanEntry>& sans)
{
    if (role == Role::CA)
    {
        throw ValidationError(Error::UnsupportedRole, "only client and broker certificates can be signed");
    }
    RequireValidityDays(validityDays);

    crypto::ThrowIfFalse(Req::verify(csr), "CSR signature verification failed");

    auto subject = Req::subjectName(csr);
    auto publicKey = Req::publicKey(csr);
    auto exts = ExtensionProfile::forRole(role, sans).toExtensions();
    auto serial = serials_.next(caCert_);

    CertBuilder builder;
    builder.setVersion(CertVersion::V3);
    builder.setSerialNumber(serial);
    builder.setSubjectName(subject);
    builder.setIssuerName(X509_get_subject_name(caCert_));
    builder.setPublicKey(publicKey);
    builder.setNotBefore(std::chrono::seconds(0));
    builder.setNotAfter(ValidityPeriod(validityDays));
    builder.signedBy(caKey_, caCert_);
    builder.addExtensions(exts);
    builder.addExtension(NID_subject_key_identifier, "hash");
    builder.addExtension(NID_authority_key_identifier, "keyid");

    auto cert = builder.build();

    casket::debug("Signed {} certificate for '{}' with serial {}", toString(role), CertName::toString(subject),
                  SerialToHex(serial));
    return cert;
}

std::string CertSigner::signCertificate(Role role, std::string_view csrPem, std::string_view caKeyPem,
                                        std::string_view caCertPem, SerialAllocator& serials, int validityDays,
                                        const std::vector<SanEntry>& sans)
{
    RequireField(Trimmed(csrPem), "csr");
    RequireField(Trimmed(caKeyPem), "caKey");
    RequireField(Trimmed(caCertPem), "caCert");

    auto csr = Req::fromPem(csrPem);
    auto caKey = AsymmKey::fromPem(KeyType::Private, caKeyPem);
    auto caCert = Cert::fromPem(caCertPem);

    CertSigner signer(caKey, caCert, serials);
    auto cert = signer.sign(role, csr, validityDays, sans);
    return Cert::toPem(cert);
}

} // namespace mqcert::pki
