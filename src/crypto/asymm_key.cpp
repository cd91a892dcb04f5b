#include <array>

#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/err.h>
#include <openssl/core_names.h>

#include <mqcert/crypto/asymm_key.hpp>
#include <mqcert/crypto/bio.hpp>

#include <mqcert/crypto/exception.hpp>
#include <mqcert/crypto/error_code.hpp>

namespace mqcert::crypto
{

KeyPtr AsymmKey::shallowCopy(Key* key)
{
    if (key)
    {
        crypto::ThrowIfFalse(0 < EVP_PKEY_up_ref(key));
        return KeyPtr{key};
    }
    return nullptr;
}

bool AsymmKey::isAlgorithm(const Key* key, std::string_view alg)
{
    const std::string name(alg);
    return EVP_PKEY_is_a(key, name.c_str());
}

bool AsymmKey::isEqual(const Key* a, const Key* b)
{
    return 0 < EVP_PKEY_eq(a, b);
}

std::string AsymmKey::groupName(const Key* key)
{
    std::array<char, 80> buffer{};
    size_t length{0};
    crypto::ThrowIfFalse(0 < EVP_PKEY_get_utf8_string_param(key, OSSL_PKEY_PARAM_GROUP_NAME, buffer.data(),
                                                            buffer.size(), &length),
                         "key has no EC group");
    return std::string(buffer.data(), length);
}

KeyPtr AsymmKey::fromBio(KeyType keyType, Bio* in, Encoding inEncoding)
{
    KeyPtr result;

    switch (inEncoding)
    {
    case Encoding::DER:
    {
        if (keyType == KeyType::Public)
        {
            result.reset(d2i_PUBKEY_bio(in, nullptr));
        }
        else
        {
            result.reset(d2i_PrivateKey_bio(in, nullptr));
        }
    }
    break;

    case Encoding::PEM:
    {
        if (keyType == KeyType::Public)
        {
            result.reset(PEM_read_bio_PUBKEY(in, nullptr, nullptr, nullptr));
        }
        else
        {
            // Empty passphrase instead of a terminal prompt: encrypted keys are rejected.
            result.reset(PEM_read_bio_PrivateKey(in, nullptr, nullptr, const_cast<char*>("")));
        }
    }
    break;

    default:
    {
        throw CryptoError(TranslateError(ERR_R_PASSED_INVALID_ARGUMENT), "unsupported input encoding");
    }
    }

    if (!result)
    {
        throw CryptoError(GetLastError(), "failed to parse key");
    }

    return result;
}

void AsymmKey::toBio(KeyType keyType, Key* key, Bio* bio, Encoding encoding)
{
    int ret{0};

    switch (encoding)
    {
    case Encoding::DER:
    {
        if (keyType == KeyType::Public)
        {
            ret = i2d_PUBKEY_bio(bio, key);
        }
        else
        {
            ret = i2d_PrivateKey_bio(bio, key);
        }
    }
    break;

    case Encoding::PEM:
    {
        if (keyType == KeyType::Public)
        {
            ret = PEM_write_bio_PUBKEY(bio, key);
        }
        else
        {
            ret = PEM_write_bio_PrivateKey(bio, key, nullptr, nullptr, 0, nullptr, nullptr);
        }
    }
    break;

    default:
    {
        throw CryptoError(TranslateError(ERR_R_PASSED_INVALID_ARGUMENT), "unsupported encoding");
    }
    }

    if (!ret)
    {
        throw CryptoError(GetLastError(), "failed to save key");
    }
}

KeyPtr AsymmKey::fromPem(KeyType keyType, std::string_view pem)
{
    auto bio = BioTraits::createMemoryReader(pem);
    return fromBio(keyType, bio, Encoding::PEM);
}

std::string AsymmKey::toPem(KeyType keyType, Key* key)
{
    auto bio = BioTraits::createMemoryBuffer();
    toBio(keyType, key, bio, Encoding::PEM);
    return BioTraits::getMemoryDataAsString(bio);
}

} // namespace mqcert::crypto
