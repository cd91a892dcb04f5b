#pragma once
#include <string>
#include <string_view>

namespace mqcert::pki
{

/// @brief Role of the certificate being requested or issued.
enum class Role
{
    Client,
    Broker,
    CA,
};

std::string_view toString(Role role) noexcept;

/// @brief User-supplied identity of a subject. Empty means absent.
struct IdentityFields
{
    std::string commonName;
    std::string organization;
    std::string organizationalUnit;
    std::string country;
    std::string state;
    std::string locality;
    std::string email;
    /// Subject serialNumber attribute, unrelated to the certificate serial.
    std::string serialNumber;
};

/// @brief Subject alternative name as received from the caller, type still unparsed ("DNS", "IP").
struct SanEntry
{
    std::string type;
    std::string value;
};

} // namespace mqcert::pki
