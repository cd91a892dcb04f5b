#include <mqcert/pki/subject_builder.hpp>
#include <mqcert/pki/error.hpp>

#include <mqcert/crypto/cert_name_builder.hpp>

#include "text_utils.hpp"

namespace mqcert::pki
{

std::string DistinguishedName::get(int nid) const
{
    for (const auto& attribute : attributes_)
    {
        if (attribute.nid == nid)
        {
            return attribute.value;
        }
    }
    return std::string();
}

crypto::X509NamePtr DistinguishedName::toX509Name() const
{
    crypto::CertNameBuilder builder;
    for (const auto& attribute : attributes_)
    {
        builder.addEntry(attribute.nid, attribute.value);
    }
    return builder.build();
}

std::string DistinguishedName::toString() const
{
    std::string result;
    for (const auto& attribute : attributes_)
    {
        if (!result.empty())
        {
            result += ", ";
        }
        result += OBJ_nid2sn(attribute.nid);
        result += "=";
        result += attribute.value;
    }
    return result;
}

DistinguishedName SubjectBuilder::build(Role role, const IdentityFields& fields)
{
    const auto commonName = Trimmed(fields.commonName);
    const auto organization = Trimmed(fields.organization);
    const auto organizationalUnit = Trimmed(fields.organizationalUnit);
    const auto country = Trimmed(fields.country);
    const auto state = Trimmed(fields.state);
    const auto locality = Trimmed(fields.locality);
    const auto email = Trimmed(fields.email);
    const auto serialNumber = Trimmed(fields.serialNumber);

    RequireField(commonName, "commonName");
    if (role == Role::Client)
    {
        RequireField(organization, "organization");
        RequireField(country, "country");
        RequireField(state, "state");
        RequireField(locality, "locality");
    }

    if (!country.empty() && country.size() != 2)
    {
        throw ValidationError(Error::InvalidValue, "country must be a two-letter code, got '" + country + "'");
    }

    std::vector<DnAttribute> attributes;
    auto append = [&attributes](int nid, const std::string& value) {
        if (!value.empty())
        {
            attributes.push_back(DnAttribute{nid, value});
        }
    };

    append(NID_countryName, country);
    append(NID_stateOrProvinceName, state);
    append(NID_localityName, locality);
    append(NID_organizationName, organization);
    append(NID_organizationalUnitName, organizationalUnit);
    append(NID_commonName, commonName);
    append(NID_serialNumber, serialNumber);
    append(NID_pkcs9_emailAddress, email);

    return DistinguishedName(std::move(attributes));
}

} // namespace mqcert::pki
