#include <casket/log/log_manager.hpp>

#include <mqcert/crypto/asymm_keygen.hpp>

#include <mqcert/pki/artifact_inspector.hpp>
#include <mqcert/pki/csr_generator.hpp>
#include <mqcert/pki/error.hpp>
#include <mqcert/pki/extension_profile.hpp>
#include <mqcert/pki/issuance_service.hpp>
#include <mqcert/pki/subject_builder.hpp>

#include "text_utils.hpp"

namespace mqcert::pki
{

namespace
{

std::string CurveOrDefault(std::string_view curve)
{
    auto result = Trimmed(curve);
    return result.empty() ? std::string(crypto::akey::ec::kDefaultGroup) : result;
}

} // namespace

std::vector<Artifact> CsrResult::artifacts() const
{
    return {
        Artifact{std::string(artifact::kPrivateKey), privateKey, true},
        Artifact{std::string(artifact::kPublicKey), publicKey, false},
        Artifact{std::string(artifact::kCsr), csr, false},
    };
}

std::vector<Artifact> RootCaResult::artifacts() const
{
    return {
        Artifact{std::string(artifact::kCaKey), caKey, true},
        Artifact{std::string(artifact::kCaCert), caCert, false},
    };
}

std::vector<Artifact> SignResult::artifacts() const
{
    return {
        Artifact{std::string(artifact::kSignedCert), signedCert, false},
    };
}

IssuanceService::IssuanceService(SerialAllocator& serials)
    : serials_(serials)
{
}

CsrResult IssuanceService::generateClientCsr(const CsrRequest& request) const
{
    return generateCsr(Role::Client, request);
}

CsrResult IssuanceService::generateBrokerCsr(const CsrRequest& request) const
{
    return generateCsr(Role::Broker, request);
}

CsrResult IssuanceService::generateCsr(Role role, const CsrRequest& request) const
{
    auto subject = SubjectBuilder::build(role, request.identity);
    auto profile = ExtensionProfile::forRole(role, request.sans);
    const auto curve = CurveOrDefault(request.curve);

    casket::info("Generating {} CSR for '{}' on {}", toString(role), subject.get(NID_commonName), curve);

    auto keyAndCsr = CsrGenerator::generate(curve, subject, profile);

    CsrResult result;
    result.privateKey = std::move(keyAndCsr.privateKey);
    result.publicKey = std::move(keyAndCsr.publicKey);
    result.csr = std::move(keyAndCsr.csr);
    result.csrDetails = ArtifactInspector::describe(result.csr);
    return result;
}

RootCaResult IssuanceService::generateRootCa(const RootCaRequest& request) const
{
    RequireValidityDays(request.validityDays);
    auto subject = SubjectBuilder::build(Role::CA, CaIssuer::withDefaults(request.identity));
    const auto curve = CurveOrDefault(request.curve);

    casket::info("Issuing root CA '{}' on {} for {} days", subject.get(NID_commonName), curve,
                 request.validityDays);

    auto pair = CaIssuer::issueRootCa(curve, subject, request.validityDays);

    RootCaResult result;
    result.caKey = std::move(pair.caKey);
    result.caCert = std::move(pair.caCert);
    result.certDetails = ArtifactInspector::describe(result.caCert);
    return result;
}

SignResult IssuanceService::signClientCert(const SignRequest& request) const
{
    return sign(Role::Client, request);
}

SignResult IssuanceService::signBrokerCert(const SignRequest& request) const
{
    return sign(Role::Broker, request);
}

SignResult IssuanceService::sign(Role role, const SignRequest& request) const
{
    RequireField(Trimmed(request.csr), "csr");
    RequireField(Trimmed(request.caKey), "caKey");
    RequireField(Trimmed(request.caCert), "caCert");
    RequireValidityDays(request.validityDays);
    if (role == Role::Broker)
    {
        NormalizeSans(request.sans);
    }

    casket::info("Signing {} certificate for {} days", toString(role), request.validityDays);

    SignResult result;
    result.signedCert = CertSigner::signCertificate(role, request.csr, request.caKey, request.caCert, serials_,
                                                    request.validityDays, request.sans);
    result.certDetails = ArtifactInspector::describe(result.signedCert);

    casket::info("Issued certificate for '{}'", ArtifactInspector::subjectOf(result.signedCert));
    return result;
}

std::string IssuanceService::describe(std::string_view pem) const
{
    return ArtifactInspector::describe(pem);
}

} // namespace mqcert::pki
