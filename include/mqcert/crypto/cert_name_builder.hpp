#pragma once
#include <string_view>
#include <mqcert/crypto/pointers.hpp>
#include <casket/utils/noncopyable.hpp>

namespace mqcert::crypto
{

class CertNameBuilder final : casket::NonCopyable
{
public:
    CertNameBuilder();

    ~CertNameBuilder() = default;

    void reset();

    /// @brief Appends a UTF-8 entry. OpenSSL enforces per-attribute size limits (e.g. two letters for C).
    CertNameBuilder& addEntry(int nid, std::string_view value);

    X509NamePtr build();

    X509Name* name()
    {
        return name_;
    }

private:
    X509NamePtr name_;
};

} // namespace mqcert::crypto
