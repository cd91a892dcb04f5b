#include <string>

#include <mqcert/crypto/cert_name_builder.hpp>
#include <mqcert/crypto/exception.hpp>

#include <casket/utils/exception.hpp>

namespace mqcert::crypto
{

CertNameBuilder::CertNameBuilder()
{
    reset();
}

CertNameBuilder& CertNameBuilder::addEntry(int nid, std::string_view value)
{
    casket::ThrowIfTrue(value.empty(), "empty value for name entry");

    auto data = reinterpret_cast<const unsigned char*>(value.data());
    int sz = static_cast<int>(value.size());

    crypto::ThrowIfFalse(X509_NAME_add_entry_by_NID(name(), nid, MBSTRING_UTF8, data, sz, -1, 0),
                         std::string("invalid value for name entry ") + OBJ_nid2sn(nid));
    return *this;
}

X509NamePtr CertNameBuilder::build()
{
    auto result = std::move(name_);
    reset();
    return result;
}

void CertNameBuilder::reset()
{
    name_.reset(X509_NAME_new());
    crypto::ThrowIfTrue(name_ == nullptr);
}

} // namespace mqcert::crypto
