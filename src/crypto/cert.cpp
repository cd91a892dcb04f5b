#include <cstring>
#include <iomanip>
#include <sstream>
#include <openssl/x509.h>
#include <openssl/x509v3.h>
#include <openssl/bio.h>
#include <openssl/pem.h>
#include <openssl/err.h>

#include <mqcert/crypto/bio.hpp>
#include <mqcert/crypto/cert.hpp>
#include <mqcert/crypto/cert_name.hpp>

#include <mqcert/crypto/exception.hpp>
#include <mqcert/crypto/error_code.hpp>

using namespace mqcert::crypto;

namespace
{

std::time_t asn1TimeToEpoch(const Asn1Time* asn1Time)
{
    std::tm tmTime;
    std::memset(&tmTime, 0, sizeof(tmTime));
    ThrowIfFalse(ASN1_TIME_to_tm(asn1Time, &tmTime));

    // ASN1_TIME_to_tm yields UTC; mktime would apply the local zone.
    std::time_t result = timegm(&tmTime);
    if (result == static_cast<std::time_t>(-1))
    {
        throw CryptoError(TranslateError(ERR_R_OPERATION_FAIL), "cannot convert ASN1_TIME to epoch");
    }

    return result;
}

} // namespace

namespace mqcert::crypto
{

X509CertPtr Cert::shallowCopy(X509Cert* cert)
{
    if (cert)
    {
        crypto::ThrowIfFalse(0 < X509_up_ref(cert));
        return X509CertPtr{cert};
    }
    return nullptr;
}

CertVersion Cert::version(X509Cert* cert)
{
    long value = X509_get_version(cert);
    switch (value)
    {
    case static_cast<long>(CertVersion::V1):
    case static_cast<long>(CertVersion::V2):
    case static_cast<long>(CertVersion::V3):
        return static_cast<CertVersion>(value);
    default:
        throw CryptoError(TranslateError(ERR_R_PASSED_INVALID_ARGUMENT),
                          "unsupported version of certificate: " + std::to_string(value));
    }
}

X509NamePtr Cert::subjectName(X509Cert* cert)
{
    auto name = X509_get_subject_name(cert);
    crypto::ThrowIfTrue(name == nullptr);

    auto result = CertName::deepCopy(name);
    crypto::ThrowIfTrue(result == nullptr);

    return result;
}

X509NamePtr Cert::issuerName(X509Cert* cert)
{
    auto name = X509_get_issuer_name(cert);
    crypto::ThrowIfTrue(name == nullptr);

    auto result = CertName::deepCopy(name);
    crypto::ThrowIfTrue(result == nullptr);

    return result;
}

BigNumPtr Cert::serialNumber(X509Cert* cert)
{
    Asn1Integer* sn = X509_get_serialNumber(cert);
    crypto::ThrowIfTrue(sn == nullptr);

    BigNumPtr result{ASN1_INTEGER_to_BN(sn, nullptr)};
    crypto::ThrowIfTrue(result == nullptr);
    return result;
}

KeyPtr Cert::publicKey(X509Cert* cert)
{
    auto result = X509_get_pubkey(cert);
    crypto::ThrowIfTrue(result == nullptr);

    return KeyPtr{result};
}

std::time_t Cert::notBefore(X509Cert* cert)
{
    const Asn1Time* asn1Time = X509_get0_notBefore(cert);
    crypto::ThrowIfTrue(asn1Time == nullptr);

    return asn1TimeToEpoch(asn1Time);
}

std::time_t Cert::notAfter(X509Cert* cert)
{
    const Asn1Time* asn1Time = X509_get0_notAfter(cert);
    crypto::ThrowIfTrue(asn1Time == nullptr);

    return asn1TimeToEpoch(asn1Time);
}

bool Cert::isCA(X509Cert* cert)
{
    // Forces the cached extension decode; EXFLAG_INVALID marks a broken extension block.
    const auto flags = X509_get_extension_flags(cert);
    crypto::ThrowIfTrue(flags & EXFLAG_INVALID, "certificate has invalid extensions");
    return (flags & EXFLAG_BCONS) && (flags & EXFLAG_CA);
}

std::string Cert::fingerprint(X509Cert* cert)
{
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int length{0};
    crypto::ThrowIfFalse(X509_digest(cert, EVP_sha256(), md, &length));

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < length; ++i)
    {
        oss << std::setw(2) << static_cast<int>(md[i]);
    }
    return oss.str();
}

X509CertPtr Cert::fromBio(Bio* bio, Encoding encoding)
{
    X509CertPtr result;

    switch (encoding)
    {
    case Encoding::DER:
    {
        result.reset(d2i_X509_bio(bio, nullptr));
        break;
    }

    case Encoding::PEM:
    {
        result.reset(PEM_read_bio_X509(bio, nullptr, nullptr, nullptr));
        break;
    }

    default:
    {
        throw CryptoError(TranslateError(ERR_R_PASSED_INVALID_ARGUMENT), "unsupported encoding");
    }
    }

    if (!result)
    {
        throw CryptoError(GetLastError(), "failed to parse certificate");
    }

    return result;
}

void Cert::toBio(X509Cert* cert, Bio* bio, Encoding encoding)
{
    int ret{0};

    switch (encoding)
    {
    case Encoding::DER:
    {
        ret = i2d_X509_bio(bio, cert);
    }
    break;

    case Encoding::PEM:
    {
        ret = PEM_write_bio_X509(bio, cert);
    }
    break;

    default:
    {
        throw CryptoError(TranslateError(ERR_R_PASSED_INVALID_ARGUMENT), "unsupported encoding");
    }
    }

    if (!ret)
    {
        throw CryptoError(GetLastError(), "failed to save certificate");
    }
}

X509CertPtr Cert::fromPem(std::string_view pem)
{
    auto bio = BioTraits::createMemoryReader(pem);
    return fromBio(bio, Encoding::PEM);
}

std::string Cert::toPem(X509Cert* cert)
{
    auto bio = BioTraits::createMemoryBuffer();
    toBio(cert, bio, Encoding::PEM);
    return BioTraits::getMemoryDataAsString(bio);
}

} // namespace mqcert::crypto
