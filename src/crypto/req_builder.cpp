#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <mqcert/crypto/exception.hpp>
#include <mqcert/crypto/req_builder.hpp>

namespace mqcert::crypto
{

ReqBuilder::ReqBuilder()
{
    reset();
}

void ReqBuilder::reset()
{
    req_.reset(X509_REQ_new());
    crypto::ThrowIfTrue(req_ == nullptr);
    crypto::ThrowIfFalse(X509_REQ_set_version(req_, static_cast<long>(ReqVersion::V1)));

    exts_.reset(sk_X509_EXTENSION_new_null());
    crypto::ThrowIfTrue(exts_ == nullptr);
}

ReqBuilder& ReqBuilder::setSubjectName(MQCERT_OSSL_CONST_COMPAT X509Name* name)
{
    crypto::ThrowIfFalse(X509_REQ_set_subject_name(req_, name));
    return *this;
}

ReqBuilder& ReqBuilder::setPublicKey(Key* publicKey)
{
    crypto::ThrowIfFalse(X509_REQ_set_pubkey(req_, publicKey));
    return *this;
}

ReqBuilder& ReqBuilder::addExtension(X509Ext* ext)
{
    X509ExtPtr copy(X509_EXTENSION_dup(ext));
    crypto::ThrowIfTrue(copy == nullptr);
    crypto::ThrowIfFalse(0 < sk_X509_EXTENSION_push(exts_, copy));
    copy.release();
    return *this;
}

ReqBuilder& ReqBuilder::addExtensions(CertExtStack* exts)
{
    for (int i = 0; i < sk_X509_EXTENSION_num(exts); ++i)
    {
        addExtension(sk_X509_EXTENSION_value(exts, i));
    }
    return *this;
}

X509ReqPtr ReqBuilder::build(Key* privateKey)
{
    crypto::ThrowIfTrue(privateKey == nullptr, "signing key not specified");

    if (sk_X509_EXTENSION_num(exts_) > 0)
    {
        crypto::ThrowIfFalse(X509_REQ_add_extensions(req_, exts_));
    }

    int mdNid{NID_undef};
    crypto::ThrowIfFalse(0 < EVP_PKEY_get_default_digest_nid(privateKey, &mdNid));

    const EVP_MD* md = EVP_get_digestbynid(mdNid);
    crypto::ThrowIfTrue(md == nullptr);
    crypto::ThrowIfFalse(0 < X509_REQ_sign(req_, privateKey, md), "request signing failed");

    auto result = std::move(req_);
    reset();

    return result;
}

} // namespace mqcert::crypto
