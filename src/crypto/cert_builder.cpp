#include <string>

#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <mqcert/crypto/exception.hpp>

#include <mqcert/crypto/cert.hpp>
#include <mqcert/crypto/cert_builder.hpp>

namespace mqcert::crypto
{

struct CertBuilder::Impl
{
    X509CertPtr cert;
    X509V3Ctx ctx;
    KeyPtr signingKey;
    X509CertPtr issuerCert;

    Impl()
    {
        reset();
    }

    void reset()
    {
        cert.reset(X509_new());
        crypto::ThrowIfTrue(cert == nullptr);

        X509V3_set_ctx_nodb(&ctx);
        X509V3_set_ctx(&ctx, nullptr, nullptr, nullptr, nullptr, X509V3_CTX_REPLACE);

        signingKey.reset();
        issuerCert.reset();
    }
};

CertBuilder::CertBuilder()
    : impl_(std::make_unique<CertBuilder::Impl>())
{
}

CertBuilder::~CertBuilder() noexcept
{
}

void CertBuilder::reset()
{
    impl_->reset();
}

CertBuilder& CertBuilder::setVersion(CertVersion version)
{
    crypto::ThrowIfFalse(X509_set_version(impl_->cert, static_cast<long>(version)));
    return *this;
}

CertBuilder& CertBuilder::setSubjectName(MQCERT_OSSL_CONST_COMPAT X509Name* name)
{
    crypto::ThrowIfFalse(X509_set_subject_name(impl_->cert, name));
    return *this;
}

CertBuilder& CertBuilder::setIssuerName(MQCERT_OSSL_CONST_COMPAT X509Name* name)
{
    crypto::ThrowIfFalse(X509_set_issuer_name(impl_->cert, name));
    return *this;
}

CertBuilder& CertBuilder::setPublicKey(Key* subjectPublicKey)
{
    crypto::ThrowIfFalse(X509_set_pubkey(impl_->cert, subjectPublicKey));
    return *this;
}

CertBuilder& CertBuilder::setSerialNumber(const BigNum* serialNumber)
{
    crypto::ThrowIfFalse(BN_to_ASN1_INTEGER(serialNumber, X509_get_serialNumber(impl_->cert)));
    return *this;
}

CertBuilder& CertBuilder::setNotBefore(std::chrono::seconds offsetSec)
{
    crypto::ThrowIfFalse(X509_time_adj_ex(X509_getm_notBefore(impl_->cert), 0, static_cast<long>(offsetSec.count()),
                                          nullptr));
    return *this;
}

CertBuilder& CertBuilder::setNotAfter(std::chrono::seconds offsetSec)
{
    // Split into days and seconds: long may be 32 bits and ten-year roots overflow it.
    const auto days = std::chrono::duration_cast<std::chrono::hours>(offsetSec).count() / 24;
    const auto rest = offsetSec.count() - days * 24 * 3600;
    crypto::ThrowIfFalse(X509_time_adj_ex(X509_getm_notAfter(impl_->cert), static_cast<int>(days),
                                          static_cast<long>(rest), nullptr));
    return *this;
}

CertBuilder& CertBuilder::addExtension(X509Ext* ext)
{
    crypto::ThrowIfFalse(X509_add_ext(impl_->cert, ext, -1));
    return *this;
}

CertBuilder& CertBuilder::addExtensions(CertExtStack* exts)
{
    for (int i = 0; i < sk_X509_EXTENSION_num(exts); ++i)
    {
        addExtension(sk_X509_EXTENSION_value(exts, i));
    }
    return *this;
}

CertBuilder& CertBuilder::addExtension(int extNid, std::string_view value)
{
    const std::string confValue(value);
    X509ExtPtr ext(X509V3_EXT_conf_nid(nullptr, &impl_->ctx, extNid, confValue.c_str()));
    crypto::ThrowIfTrue(ext == nullptr, std::string("cannot build extension ") + OBJ_nid2sn(extNid));
    return addExtension(ext);
}

CertBuilder& CertBuilder::signedBy(Key* issuerPrivateKey, X509Cert* issuerCert)
{
    crypto::ThrowIfFalse(0 < X509_check_private_key(issuerCert, issuerPrivateKey),
                         "issuer key does not match issuer certificate");

    crypto::ThrowIfFalse(EVP_PKEY_up_ref(issuerPrivateKey));
    impl_->signingKey = KeyPtr(issuerPrivateKey);

    crypto::ThrowIfFalse(X509_up_ref(issuerCert));
    impl_->issuerCert = X509CertPtr(issuerCert);

    X509V3_set_ctx(&impl_->ctx, impl_->issuerCert, impl_->cert, nullptr, nullptr, X509V3_CTX_REPLACE);
    return *this;
}

CertBuilder& CertBuilder::selfSigned(Key* subjectPrivateKey)
{
    crypto::ThrowIfFalse(EVP_PKEY_up_ref(subjectPrivateKey));
    impl_->signingKey = KeyPtr(subjectPrivateKey);

    X509V3_set_ctx(&impl_->ctx, impl_->cert, impl_->cert, nullptr, nullptr, X509V3_CTX_REPLACE);
    return *this;
}

X509CertPtr CertBuilder::build()
{
    crypto::ThrowIfTrue(impl_->signingKey == nullptr, "signing key not specified");

    auto serial = Cert::serialNumber(impl_->cert);
    crypto::ThrowIfTrue(BN_is_zero(serial), "serial number not specified");

    int mdNid{NID_undef};
    crypto::ThrowIfFalse(0 < EVP_PKEY_get_default_digest_nid(impl_->signingKey, &mdNid));

    const EVP_MD* md = EVP_get_digestbynid(mdNid);
    crypto::ThrowIfTrue(md == nullptr);
    crypto::ThrowIfFalse(0 < X509_sign(impl_->cert, impl_->signingKey, md), "certificate signing failed");

    auto result = std::move(impl_->cert);
    reset();

    return result;
}

} // namespace mqcert::crypto
