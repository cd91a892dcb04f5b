#pragma once
#include <string>
#include <string_view>
#include <mqcert/crypto/pointers.hpp>

namespace mqcert::crypto
{

class AsymmKey
{
public:
    static KeyPtr shallowCopy(Key* key);

    static bool isAlgorithm(const Key* key, std::string_view alg);

    static bool isEqual(const Key* a, const Key* b);

    /// @brief Name of the EC group the key lives on, e.g. "prime256v1".
    static std::string groupName(const Key* key);

    static KeyPtr fromBio(KeyType keyType, Bio* in, Encoding inEncoding = Encoding::PEM);

    static void toBio(KeyType keyType, Key* key, Bio* bio, Encoding encoding = Encoding::PEM);

    static KeyPtr fromPem(KeyType keyType, std::string_view pem);

    /// @brief Serializes the private key as unencrypted PKCS#8 PEM or the public key as SubjectPublicKeyInfo PEM.
    static std::string toPem(KeyType keyType, Key* key);
};

} // namespace mqcert::crypto
