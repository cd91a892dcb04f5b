#pragma once

#include <openssl/evp.h>
#include <openssl/bn.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>
#include <openssl/safestack.h>

#include <mqcert/crypto/typedefs.hpp>
#include <mqcert/utils/custom_unique_ptr.hpp>

namespace mqcert::crypto
{

struct CertExtOwningStackDeleter
{
    void operator()(CertExtStack* stack) const noexcept
    {
        sk_X509_EXTENSION_pop_free(stack, X509_EXTENSION_free);
    }
};

struct GeneralNamesDeleter
{
    void operator()(GeneralNames* names) const noexcept
    {
        GENERAL_NAMES_free(names);
    }
};

struct ExtKeyUsageDeleter
{
    void operator()(ExtKeyUsage* usage) const noexcept
    {
        sk_ASN1_OBJECT_pop_free(usage, ASN1_OBJECT_free);
    }
};

MQCERT_DEFINE_UNIQUE_PTR(Asn1BitStringPtr, Asn1BitString, ASN1_BIT_STRING_free);
MQCERT_DEFINE_UNIQUE_PTR(Asn1OctetStringPtr, Asn1OctetString, ASN1_OCTET_STRING_free);

MQCERT_DEFINE_UNIQUE_PTR(BigNumPtr, BigNum, BN_free);
MQCERT_DEFINE_UNIQUE_PTR(BioPtr, Bio, BIO_free_all);

MQCERT_DEFINE_UNIQUE_PTR(X509CertPtr, X509Cert, X509_free);
MQCERT_DEFINE_UNIQUE_PTR(X509ReqPtr, X509Req, X509_REQ_free);
MQCERT_DEFINE_UNIQUE_PTR(X509ExtPtr, X509Ext, X509_EXTENSION_free);
MQCERT_DEFINE_UNIQUE_PTR(X509NamePtr, X509Name, X509_NAME_free);

MQCERT_DEFINE_UNIQUE_PTR(KeyPtr, Key, EVP_PKEY_free);
MQCERT_DEFINE_UNIQUE_PTR(KeyCtxPtr, KeyCtx, EVP_PKEY_CTX_free);

MQCERT_DEFINE_UNIQUE_PTR(BasicConstraintsPtr, BasicConstraints, BASIC_CONSTRAINTS_free);
MQCERT_DEFINE_UNIQUE_PTR(GeneralNamePtr, GeneralName, GENERAL_NAME_free);

MQCERT_DEFINE_UNIQUE_PTR_WITH_DELETER(GeneralNamesPtr, GeneralNames, GeneralNamesDeleter);
MQCERT_DEFINE_UNIQUE_PTR_WITH_DELETER(ExtKeyUsagePtr, ExtKeyUsage, ExtKeyUsageDeleter);
MQCERT_DEFINE_UNIQUE_PTR_WITH_DELETER(CertExtOwningStackPtr, CertExtStack, CertExtOwningStackDeleter);

} // namespace mqcert::crypto
