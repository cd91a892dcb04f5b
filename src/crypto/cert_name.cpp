#include <openssl/x509.h>
#include <openssl/objects.h>

#include <mqcert/crypto/cert_name.hpp>
#include <mqcert/crypto/exception.hpp>

namespace
{

std::string entryToUtf8(X509_NAME_ENTRY* entry)
{
    unsigned char* utf8{nullptr};
    const int length = ASN1_STRING_to_UTF8(&utf8, X509_NAME_ENTRY_get_data(entry));
    mqcert::crypto::ThrowIfTrue(length < 0, "invalid name entry encoding");

    std::string result(reinterpret_cast<char*>(utf8), static_cast<size_t>(length));
    OPENSSL_free(utf8);
    return result;
}

} // namespace

namespace mqcert::crypto
{

X509NamePtr CertName::deepCopy(MQCERT_OSSL_CONST_COMPAT X509Name* name)
{
    return X509NamePtr{X509_NAME_dup(name)};
}

bool CertName::isEqual(const X509Name* a, const X509Name* b)
{
    return (0 == X509_NAME_cmp(a, b));
}

std::vector<std::pair<std::string, std::string>> CertName::entries(MQCERT_OSSL_CONST_COMPAT X509Name* name)
{
    std::vector<std::pair<std::string, std::string>> result;

    const int count = X509_NAME_entry_count(name);
    for (int i = 0; i < count; ++i)
    {
        auto entry = X509_NAME_get_entry(name, i);
        crypto::ThrowIfTrue(entry == nullptr);

        const int nid = OBJ_obj2nid(X509_NAME_ENTRY_get_object(entry));
        const char* sn = (nid == NID_undef) ? "UNDEF" : OBJ_nid2sn(nid);
        result.emplace_back(sn, entryToUtf8(entry));
    }

    return result;
}

std::string CertName::entryValue(MQCERT_OSSL_CONST_COMPAT X509Name* name, int nid)
{
    auto loc = X509_NAME_get_index_by_NID(name, nid, -1);
    if (loc < 0)
    {
        return std::string();
    }

    auto entry = X509_NAME_get_entry(name, loc);
    crypto::ThrowIfTrue(entry == nullptr);
    return entryToUtf8(entry);
}

std::string CertName::toString(MQCERT_OSSL_CONST_COMPAT X509Name* name)
{
    std::string result;
    for (const auto& [field, value] : entries(name))
    {
        if (!result.empty())
        {
            result += ", ";
        }
        result += field + "=" + value;
    }
    return result;
}

} // namespace mqcert::crypto
