#pragma once
#include <string_view>
#include <vector>
#include <mqcert/crypto/pointers.hpp>

namespace mqcert::crypto
{

/// @brief Bit positions in the keyUsage BIT STRING (RFC 5280, 4.2.1.3).
enum class KeyUsageBit
{
    DigitalSignature = 0,
    NonRepudiation = 1,
    KeyEncipherment = 2,
    DataEncipherment = 3,
    KeyAgreement = 4,
    KeyCertSign = 5,
    CrlSign = 6,
};

/// @brief Builds X.509v3 extensions from typed ASN.1 structures.
class X509Extension final
{
public:
    static X509ExtPtr basicConstraints(bool isCA, bool critical = true);

    static X509ExtPtr keyUsage(const std::vector<KeyUsageBit>& bits, bool critical = true);

    /// @param[in] purposes NIDs of the key purposes, e.g. NID_client_auth.
    static X509ExtPtr extendedKeyUsage(const std::vector<int>& purposes, bool critical = false);

    static X509ExtPtr subjectAltName(GeneralNames* names, bool critical = false);

    static GeneralNamePtr dnsName(std::string_view name);

    /// @brief IPv4 or IPv6 literal. Throws CryptoError on anything else.
    static GeneralNamePtr ipAddress(std::string_view address);

    static bool isCritical(X509Ext* extension);

    static int nid(X509Ext* extension);

private:
    static X509ExtPtr create(int nid, bool critical, void* value);
};

} // namespace mqcert::crypto
