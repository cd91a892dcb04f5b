#pragma once
#include <string>
#include <string_view>

#include <mqcert/pki/subject_builder.hpp>

namespace mqcert::pki
{

struct CaPair
{
    std::string caKey;
    std::string caCert;
};

class CaIssuer final
{
public:
    static constexpr int kDefaultValidityDays = 3650;

    /// @brief Identity used for fields the caller leaves blank.
    static IdentityFields defaultIdentity();

    /// @brief Fills blank fields of @p fields from defaultIdentity().
    static IdentityFields withDefaults(const IdentityFields& fields);

    /// @brief Generates a key on @p curve and a self-signed root certificate carrying the CA profile.
    ///
    /// @throws ValidationError if @p validityDays is not positive.
    /// @throws CryptoError on key generation or signing failure.
    static CaPair issueRootCa(std::string_view curve, const DistinguishedName& subject,
                              int validityDays = kDefaultValidityDays);
};

} // namespace mqcert::pki
