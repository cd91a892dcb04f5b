#pragma once
#include <string>
#include <string_view>

#include <mqcert/pki/extension_profile.hpp>
#include <mqcert/pki/subject_builder.hpp>

namespace mqcert::pki
{

/// @brief PEM outputs of a key and CSR generation.
struct KeyAndCsr
{
    std::string privateKey;
    std::string publicKey;
    std::string csr;
};

class CsrGenerator final
{
public:
    /// @brief Generates an EC key pair on @p curve and a CSR for @p subject that requests the
    /// extensions of @p profile.
    ///
    /// Either the complete triple is returned or nothing is.
    ///
    /// @throws CryptoError on an unsupported curve or any encoding or signing failure.
    static KeyAndCsr generate(std::string_view curve, const DistinguishedName& subject,
                              const ExtensionProfile& profile);
};

} // namespace mqcert::pki
