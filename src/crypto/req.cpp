#include <openssl/x509.h>
#include <openssl/pem.h>
#include <openssl/err.h>

#include <mqcert/crypto/bio.hpp>
#include <mqcert/crypto/req.hpp>
#include <mqcert/crypto/cert_name.hpp>

#include <mqcert/crypto/exception.hpp>
#include <mqcert/crypto/error_code.hpp>

namespace mqcert::crypto
{

X509NamePtr Req::subjectName(X509Req* req)
{
    auto name = X509_REQ_get_subject_name(req);
    crypto::ThrowIfTrue(name == nullptr);

    auto result = CertName::deepCopy(name);
    crypto::ThrowIfTrue(result == nullptr);

    return result;
}

KeyPtr Req::publicKey(X509Req* req)
{
    KeyPtr result{X509_REQ_get_pubkey(req)};
    crypto::ThrowIfTrue(result == nullptr, "request has no usable public key");
    return result;
}

bool Req::verify(X509Req* req)
{
    auto key = publicKey(req);
    const int ret = X509_REQ_verify(req, key);
    if (ret < 0)
    {
        throw CryptoError(GetLastError(), "request signature cannot be checked");
    }
    ::ERR_clear_error();
    return ret == 1;
}

CertExtOwningStackPtr Req::extensions(X509Req* req)
{
    CertExtOwningStackPtr result{X509_REQ_get_extensions(req)};
    if (!result)
    {
        result.reset(sk_X509_EXTENSION_new_null());
        crypto::ThrowIfTrue(result == nullptr);
    }
    return result;
}

X509ReqPtr Req::fromBio(Bio* bio, Encoding encoding)
{
    X509ReqPtr result;

    switch (encoding)
    {
    case Encoding::DER:
    {
        result.reset(d2i_X509_REQ_bio(bio, nullptr));
        break;
    }

    case Encoding::PEM:
    {
        // Accepts both "CERTIFICATE REQUEST" and "NEW CERTIFICATE REQUEST" armour.
        result.reset(PEM_read_bio_X509_REQ(bio, nullptr, nullptr, nullptr));
        break;
    }

    default:
    {
        throw CryptoError(TranslateError(ERR_R_PASSED_INVALID_ARGUMENT), "unsupported encoding");
    }
    }

    if (!result)
    {
        throw CryptoError(GetLastError(), "failed to parse certificate request");
    }

    return result;
}

void Req::toBio(X509Req* req, Bio* bio, Encoding encoding)
{
    int ret{0};

    switch (encoding)
    {
    case Encoding::DER:
        ret = i2d_X509_REQ_bio(bio, req);
        break;

    case Encoding::PEM:
        ret = PEM_write_bio_X509_REQ(bio, req);
        break;

    default:
        throw CryptoError(TranslateError(ERR_R_PASSED_INVALID_ARGUMENT), "unsupported encoding");
    }

    if (!ret)
    {
        throw CryptoError(GetLastError(), "failed to save certificate request");
    }
}

X509ReqPtr Req::fromPem(std::string_view pem)
{
    auto bio = BioTraits::createMemoryReader(pem);
    return fromBio(bio, Encoding::PEM);
}

std::string Req::toPem(X509Req* req)
{
    auto bio = BioTraits::createMemoryBuffer();
    toBio(req, bio, Encoding::PEM);
    return BioTraits::getMemoryDataAsString(bio);
}

} // namespace mqcert::crypto
