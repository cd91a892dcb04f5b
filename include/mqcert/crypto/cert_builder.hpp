#pragma once

#include <chrono>
#include <memory>
#include <string_view>

#include <casket/utils/noncopyable.hpp>

#include <mqcert/crypto/pointers.hpp>

namespace mqcert::crypto
{

class CertBuilder final : casket::NonCopyable
{
public:
    CertBuilder();

    ~CertBuilder() noexcept;

    void reset();

    CertBuilder& setVersion(CertVersion version);

    CertBuilder& setSubjectName(MQCERT_OSSL_CONST_COMPAT X509Name* name);

    CertBuilder& setIssuerName(MQCERT_OSSL_CONST_COMPAT X509Name* name);

    CertBuilder& setPublicKey(Key* publicKey);

    CertBuilder& setSerialNumber(const BigNum* serialNumber);

    /// @brief Sets notBefore to now plus @p offsetSec.
    CertBuilder& setNotBefore(std::chrono::seconds offsetSec);

    /// @brief Sets notAfter to now plus @p offsetSec.
    CertBuilder& setNotAfter(std::chrono::seconds offsetSec);

    CertBuilder& addExtension(X509Ext* ext);

    /// @brief Adds every extension of @p exts in order.
    CertBuilder& addExtensions(CertExtStack* exts);

    /// @brief Adds an extension from its OpenSSL config value, e.g. (NID_subject_key_identifier, "hash").
    /// Resolved against the subject/issuer set by signedBy() or selfSigned().
    CertBuilder& addExtension(int extNid, std::string_view value);

    CertBuilder& signedBy(Key* issuerPrivateKey, X509Cert* issuerCert);

    CertBuilder& selfSigned(Key* subjectPrivateKey);

    X509CertPtr build();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace mqcert::crypto
