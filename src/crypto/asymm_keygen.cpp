#include <string>

#include <openssl/evp.h>
#include <openssl/core_names.h>
#include <openssl/params.h>

#include <mqcert/crypto/asymm_keygen.hpp>
#include <mqcert/crypto/exception.hpp>

using namespace mqcert;

namespace
{

crypto::KeyPtr generateWithParams(crypto::LibContext* libctx, const char* name, const char* propq,
                                  const OSSL_PARAM* params)
{
    EVP_PKEY* pkey{nullptr};
    crypto::KeyCtxPtr ctx(EVP_PKEY_CTX_new_from_name(libctx, name, propq));
    crypto::ThrowIfFalse(ctx != nullptr);
    crypto::ThrowIfFalse(0 < EVP_PKEY_keygen_init(ctx));
    crypto::ThrowIfFalse(0 < EVP_PKEY_CTX_set_params(ctx, params), "unsupported key parameters");
    crypto::ThrowIfFalse(0 < EVP_PKEY_generate(ctx, &pkey), "key generation failed");
    return crypto::KeyPtr{pkey};
}

} // namespace

namespace mqcert::crypto::akey
{

namespace ec
{

KeyPtr generate(std::string_view groupName, LibContext* libctx, const char* propq)
{
    // OSSL_PARAM wants a NUL-terminated string.
    std::string group(groupName);
    OSSL_PARAM params[] = {OSSL_PARAM_END, OSSL_PARAM_END};

    params[0] = OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME, group.data(), 0);

    try
    {
        return ::generateWithParams(libctx, "EC", propq, params);
    }
    catch (const CryptoError& e)
    {
        throw CryptoError(e.code(), "unsupported curve '" + group + "': " + e.what());
    }
}

} // namespace ec

} // namespace mqcert::crypto::akey
