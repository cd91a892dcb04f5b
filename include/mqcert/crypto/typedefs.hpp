#pragma once
#include <openssl/opensslv.h>
#include <openssl/x509v3.h>

#if (OPENSSL_VERSION_NUMBER >= 0x30000000L)
#define MQCERT_OSSL_CONST_COMPAT const
#else
#define MQCERT_OSSL_CONST_COMPAT
#endif

namespace mqcert::crypto
{

enum class CertVersion
{
    V1 = 0, ///< X509v1
    V2 = 1, ///< X509v2
    V3 = 2, ///< X509v3
};

enum class ReqVersion
{
    V1 = 0, ///< PKCS#10 v1, the only defined version
};

enum class KeyType
{
    Public,
    Private
};

enum class Encoding
{
    PEM,
    DER,
};

using Asn1BitString = struct asn1_string_st;
using Asn1Integer = struct asn1_string_st;
using Asn1OctetString = struct asn1_string_st;
using Asn1Time = struct asn1_string_st;
using BigNum = struct bignum_st;
using Bio = struct bio_st;
using X509Cert = struct x509_st;
using X509Ext = struct X509_extension_st;
using X509Name = struct X509_name_st;
using X509V3Ctx = struct v3_ext_ctx;
using X509Req = struct X509_req_st;
using Key = struct evp_pkey_st;
using KeyCtx = struct evp_pkey_ctx_st;
using BasicConstraints = struct BASIC_CONSTRAINTS_st;
using GeneralName = struct GENERAL_NAME_st;

using GeneralNames = STACK_OF(GENERAL_NAME);
using ExtKeyUsage = STACK_OF(ASN1_OBJECT);
using CertExtStack = STACK_OF(X509_EXTENSION);
using LibContext = struct ossl_lib_ctx_st;

} // namespace mqcert::crypto
