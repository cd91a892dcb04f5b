#pragma once
#include <string>
#include <vector>

#include <mqcert/crypto/pointers.hpp>
#include <mqcert/pki/types.hpp>

namespace mqcert::pki
{

struct DnAttribute
{
    int nid;
    std::string value;
};

/// @brief Ordered distinguished name, exactly the attributes that were supplied.
class DistinguishedName final
{
public:
    DistinguishedName() = default;

    explicit DistinguishedName(std::vector<DnAttribute> attributes)
        : attributes_(std::move(attributes))
    {
    }

    const std::vector<DnAttribute>& attributes() const noexcept
    {
        return attributes_;
    }

    /// @brief Value of the attribute with @p nid, empty if absent.
    std::string get(int nid) const;

    crypto::X509NamePtr toX509Name() const;

    /// @brief "C=US, O=Acme, CN=device-001".
    std::string toString() const;

private:
    std::vector<DnAttribute> attributes_;
};

class SubjectBuilder final
{
public:
    /// @brief Applies the role's required-field rules and emits the supplied fields in the
    /// order C, ST, L, O, OU, CN, serialNumber, emailAddress.
    ///
    /// Values are trimmed; a blank value counts as absent.
    ///
    /// @throws ValidationError when a required field is missing or the country is not two letters.
    static DistinguishedName build(Role role, const IdentityFields& fields);
};

} // namespace mqcert::pki
