#include <algorithm>

#include <openssl/x509.h>

#include <mqcert/crypto/bio.hpp>
#include <mqcert/crypto/cert.hpp>
#include <mqcert/crypto/cert_name.hpp>
#include <mqcert/crypto/exception.hpp>
#include <mqcert/crypto/req.hpp>

#include <mqcert/pki/artifact_inspector.hpp>
#include <mqcert/pki/error.hpp>

using namespace mqcert::crypto;

namespace mqcert::pki
{

namespace
{

constexpr std::string_view kCertificateArmour = "-----BEGIN CERTIFICATE-----";
constexpr std::string_view kRequestArmour = "-----BEGIN CERTIFICATE REQUEST-----";
constexpr std::string_view kNewRequestArmour = "-----BEGIN NEW CERTIFICATE REQUEST-----";

X509ReqPtr DecodeRequest(std::string_view pem)
{
    try
    {
        return Req::fromPem(pem);
    }
    catch (const CryptoError& e)
    {
        throw ValidationError(Error::MalformedInput, std::string("malformed certificate request: ") + e.what());
    }
}

X509CertPtr DecodeCertificate(std::string_view pem)
{
    try
    {
        return Cert::fromPem(pem);
    }
    catch (const CryptoError& e)
    {
        throw ValidationError(Error::MalformedInput, std::string("malformed certificate: ") + e.what());
    }
}

} // namespace

ArtifactKind ArtifactInspector::detect(std::string_view pem)
{
    const auto cert = pem.find(kCertificateArmour);
    const auto req = std::min(pem.find(kRequestArmour), pem.find(kNewRequestArmour));

    if (cert == std::string_view::npos && req == std::string_view::npos)
    {
        throw ValidationError(Error::MalformedInput, "input is neither a PEM certificate nor a certificate request");
    }
    return req < cert ? ArtifactKind::CertificateRequest : ArtifactKind::Certificate;
}

std::string ArtifactInspector::describe(std::string_view pem)
{
    auto bio = BioTraits::createMemoryBuffer();

    if (detect(pem) == ArtifactKind::CertificateRequest)
    {
        auto req = DecodeRequest(pem);
        crypto::ThrowIfFalse(0 < X509_REQ_print_ex(bio, req, XN_FLAG_COMPAT, X509_FLAG_COMPAT));
    }
    else
    {
        auto cert = DecodeCertificate(pem);
        crypto::ThrowIfFalse(0 < X509_print_ex(bio, cert, XN_FLAG_COMPAT, X509_FLAG_COMPAT));
    }

    return BioTraits::getMemoryDataAsString(bio);
}

std::string ArtifactInspector::subjectOf(std::string_view pem)
{
    if (detect(pem) == ArtifactKind::CertificateRequest)
    {
        auto req = DecodeRequest(pem);
        return CertName::toString(X509_REQ_get_subject_name(req));
    }

    auto cert = DecodeCertificate(pem);
    return CertName::toString(X509_get_subject_name(cert));
}

} // namespace mqcert::pki
