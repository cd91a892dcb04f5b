#pragma once
#include <string>
#include <string_view>
#include <vector>

#include <casket/utils/noncopyable.hpp>

#include <mqcert/crypto/pointers.hpp>
#include <mqcert/pki/serial_allocator.hpp>
#include <mqcert/pki/types.hpp>

namespace mqcert::pki
{

/// @brief Issues client and broker leaf certificates on behalf of one CA.
///
/// The extension set always comes from the role profile; extensions requested in
/// the CSR are not copied. The subject and public key are taken from the CSR.
class CertSigner final : public casket::NonCopyable
{
public:
    static constexpr int kDefaultValidityDays = 365;

    /// @throws CryptoError if @p caKey is not the private key of @p caCert.
    CertSigner(crypto::Key* caKey, crypto::X509Cert* caCert, SerialAllocator& serials);

    ~CertSigner() = default;

    /// @throws ValidationError for the ca role or a non-positive validity.
    /// @throws CryptoError when the CSR signature does not verify or signing fails.
    crypto::X509CertPtr sign(Role role, crypto::X509Req* csr, int validityDays = kDefaultValidityDays,
                             const std::vector<SanEntry>& sans = {});

    /// @brief PEM in, PEM out variant of sign().
    ///
    /// @throws ValidationError if a PEM input is blank.
    /// @throws CryptoError if a PEM input cannot be decoded.
    static std::string signCertificate(Role role, std::string_view csrPem, std::string_view caKeyPem,
                                       std::string_view caCertPem, SerialAllocator& serials,
                                       int validityDays = kDefaultValidityDays,
                                       const std::vector<SanEntry>& sans = {});

private:
    crypto::KeyPtr caKey_;
    crypto::X509CertPtr caCert_;
    SerialAllocator& serials_;
};

} // namespace mqcert::pki
