#pragma once
#include <string>
#include <string_view>
#include <mqcert/crypto/pointers.hpp>

namespace mqcert::crypto
{

/// @brief Accessors for PKCS#10 certificate signing requests.
class Req final
{
public:
    static X509NamePtr subjectName(X509Req* req);

    static KeyPtr publicKey(X509Req* req);

    /// @brief Checks the self-signature with the embedded public key.
    static bool verify(X509Req* req);

    /// @brief Requested extensions; an empty stack when none were requested.
    static CertExtOwningStackPtr extensions(X509Req* req);

    static X509ReqPtr fromBio(Bio* bio, Encoding encoding = Encoding::PEM);

    static void toBio(X509Req* req, Bio* bio, Encoding encoding = Encoding::PEM);

    static X509ReqPtr fromPem(std::string_view pem);

    static std::string toPem(X509Req* req);
};

} // namespace mqcert::crypto
