/// @file
/// @brief Entry points of the issuer: CSR generation, root CA issuance, leaf signing and inspection.

#pragma once
#include <string>
#include <string_view>
#include <vector>

#include <mqcert/pki/artifact_writer.hpp>
#include <mqcert/pki/ca_issuer.hpp>
#include <mqcert/pki/cert_signer.hpp>
#include <mqcert/pki/serial_allocator.hpp>
#include <mqcert/pki/types.hpp>

namespace mqcert::pki
{

namespace artifact
{

inline constexpr std::string_view kPrivateKey = "private-key.pem";
inline constexpr std::string_view kPublicKey = "public-key.pem";
inline constexpr std::string_view kCsr = "csr.pem";
inline constexpr std::string_view kCaKey = "ca-key.pem";
inline constexpr std::string_view kCaCert = "ca-cert.pem";
inline constexpr std::string_view kSignedCert = "signed-cert.pem";

} // namespace artifact

struct CsrRequest
{
    IdentityFields identity;
    /// Blank selects prime256v1.
    std::string curve;
    /// Only used for broker CSRs.
    std::vector<SanEntry> sans;
};

struct CsrResult
{
    std::string privateKey;
    std::string publicKey;
    std::string csr;
    std::string csrDetails;

    std::vector<Artifact> artifacts() const;
};

struct RootCaRequest
{
    /// Blank fields are taken from CaIssuer::defaultIdentity().
    IdentityFields identity;
    std::string curve;
    int validityDays{CaIssuer::kDefaultValidityDays};
};

struct RootCaResult
{
    std::string caKey;
    std::string caCert;
    std::string certDetails;

    std::vector<Artifact> artifacts() const;
};

struct SignRequest
{
    std::string csr;
    std::string caKey;
    std::string caCert;
    int validityDays{CertSigner::kDefaultValidityDays};
    /// Only used for broker certificates.
    std::vector<SanEntry> sans;
};

struct SignResult
{
    std::string signedCert;
    std::string certDetails;

    std::vector<Artifact> artifacts() const;
};

/// @brief Validates requests, runs the issuance components and collects their PEM outputs.
///
/// Input is checked completely before any key is generated or anything is signed.
class IssuanceService final
{
public:
    /// @param[in] serials Serial source for signed leaves, must outlive the service.
    explicit IssuanceService(SerialAllocator& serials);

    CsrResult generateClientCsr(const CsrRequest& request) const;

    CsrResult generateBrokerCsr(const CsrRequest& request) const;

    RootCaResult generateRootCa(const RootCaRequest& request) const;

    SignResult signClientCert(const SignRequest& request) const;

    SignResult signBrokerCert(const SignRequest& request) const;

    std::string describe(std::string_view pem) const;

private:
    CsrResult generateCsr(Role role, const CsrRequest& request) const;

    SignResult sign(Role role, const SignRequest& request) const;

private:
    SerialAllocator& serials_;
};

} // namespace mqcert::pki
