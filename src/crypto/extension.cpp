#include <string>

#include <openssl/x509v3.h>
#include <openssl/err.h>

#include <mqcert/crypto/extension.hpp>
#include <mqcert/crypto/exception.hpp>
#include <mqcert/crypto/error_code.hpp>

namespace mqcert::crypto
{

X509ExtPtr X509Extension::create(int nid, bool critical, void* value)
{
    X509ExtPtr ext(X509V3_EXT_i2d(nid, critical ? 1 : 0, value));
    crypto::ThrowIfTrue(ext == nullptr, std::string("cannot encode extension ") + OBJ_nid2sn(nid));
    return ext;
}

X509ExtPtr X509Extension::basicConstraints(bool isCA, bool critical)
{
    BasicConstraintsPtr bc(BASIC_CONSTRAINTS_new());
    crypto::ThrowIfTrue(bc == nullptr);

    bc->ca = isCA ? 0xFF : 0;
    return create(NID_basic_constraints, critical, bc.get());
}

X509ExtPtr X509Extension::keyUsage(const std::vector<KeyUsageBit>& bits, bool critical)
{
    Asn1BitStringPtr usage(ASN1_BIT_STRING_new());
    crypto::ThrowIfTrue(usage == nullptr);

    for (auto bit : bits)
    {
        crypto::ThrowIfFalse(ASN1_BIT_STRING_set_bit(usage, static_cast<int>(bit), 1));
    }
    return create(NID_key_usage, critical, usage.get());
}

X509ExtPtr X509Extension::extendedKeyUsage(const std::vector<int>& purposes, bool critical)
{
    ExtKeyUsagePtr usage(sk_ASN1_OBJECT_new_null());
    crypto::ThrowIfTrue(usage == nullptr);

    for (auto purpose : purposes)
    {
        // Built-in objects are static, pop_free leaves them alone.
        ASN1_OBJECT* obj = OBJ_nid2obj(purpose);
        crypto::ThrowIfTrue(obj == nullptr);
        crypto::ThrowIfFalse(0 < sk_ASN1_OBJECT_push(usage, obj));
    }
    return create(NID_ext_key_usage, critical, usage.get());
}

X509ExtPtr X509Extension::subjectAltName(GeneralNames* names, bool critical)
{
    crypto::ThrowIfTrue(names == nullptr || sk_GENERAL_NAME_num(names) <= 0,
                        "subjectAltName requires at least one name");
    return create(NID_subject_alt_name, critical, names);
}

GeneralNamePtr X509Extension::dnsName(std::string_view name)
{
    Asn1OctetStringPtr ia5(ASN1_IA5STRING_new());
    crypto::ThrowIfTrue(ia5 == nullptr);
    crypto::ThrowIfFalse(ASN1_STRING_set(ia5, name.data(), static_cast<int>(name.size())));

    GeneralNamePtr result(GENERAL_NAME_new());
    crypto::ThrowIfTrue(result == nullptr);
    GENERAL_NAME_set0_value(result, GEN_DNS, ia5.release());
    return result;
}

GeneralNamePtr X509Extension::ipAddress(std::string_view address)
{
    const std::string text(address);
    Asn1OctetStringPtr octets(a2i_IPADDRESS(text.c_str()));
    if (!octets)
    {
        throw CryptoError(TranslateError(ERR_R_PASSED_INVALID_ARGUMENT), "invalid IP address '" + text + "'");
    }

    GeneralNamePtr result(GENERAL_NAME_new());
    crypto::ThrowIfTrue(result == nullptr);
    GENERAL_NAME_set0_value(result, GEN_IPADD, octets.release());
    return result;
}

bool X509Extension::isCritical(X509Ext* extension)
{
    return 0 < X509_EXTENSION_get_critical(extension);
}

int X509Extension::nid(X509Ext* extension)
{
    return OBJ_obj2nid(X509_EXTENSION_get_object(extension));
}

} // namespace mqcert::crypto
