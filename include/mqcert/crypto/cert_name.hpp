#pragma once
#include <string>
#include <utility>
#include <vector>
#include <mqcert/crypto/pointers.hpp>

namespace mqcert::crypto
{

class CertName final
{
public:
    static X509NamePtr deepCopy(MQCERT_OSSL_CONST_COMPAT X509Name* name);

    static bool isEqual(const X509Name* a, const X509Name* b);

    /// @brief Entries in encoding order as (short name, UTF-8 value) pairs, e.g. ("CN", "device-001").
    static std::vector<std::pair<std::string, std::string>> entries(MQCERT_OSSL_CONST_COMPAT X509Name* name);

    /// @brief Value of the first entry with @p nid, empty if there is none.
    static std::string entryValue(MQCERT_OSSL_CONST_COMPAT X509Name* name, int nid);

    /// @brief One-line "C=US, O=Acme, CN=device-001" rendering.
    static std::string toString(MQCERT_OSSL_CONST_COMPAT X509Name* name);
};

} // namespace mqcert::crypto
