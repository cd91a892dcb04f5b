#include <openssl/err.h>
#include <openssl/x509v3.h>

#include <casket/log/log_manager.hpp>
#include <casket/utils/string.hpp>

#include <mqcert/crypto/exception.hpp>
#include <mqcert/crypto/pointers.hpp>
#include <mqcert/pki/error.hpp>
#include <mqcert/pki/extension_profile.hpp>

#include "text_utils.hpp"

using namespace mqcert::crypto;

namespace mqcert::pki
{

std::string_view toString(SanType type) noexcept
{
    switch (type)
    {
    case SanType::DNS:
        return "DNS";
    case SanType::IP:
        return "IP";
    }
    return "";
}

std::vector<SanEntry> ParseSanList(const std::string& text)
{
    std::vector<SanEntry> result;
    if (text.empty())
    {
        return result;
    }

    for (auto&& item : casket::split(text, ","))
    {
        const auto colon = item.find(':');
        if (colon == std::string::npos)
        {
            result.push_back(SanEntry{std::string(), item});
        }
        else
        {
            // IPv6 literals contain colons, only the first one separates the type.
            result.push_back(SanEntry{item.substr(0, colon), item.substr(colon + 1)});
        }
    }
    return result;
}

std::string IndexedSan::label() const
{
    return std::string(toString(type)) + "." + std::to_string(index);
}

std::vector<IndexedSan> NormalizeSans(const std::vector<SanEntry>& entries)
{
    std::vector<IndexedSan> result;
    std::size_t dnsCount{0};
    std::size_t ipCount{0};

    for (const auto& entry : entries)
    {
        auto value = Trimmed(entry.value);
        if (value.empty())
        {
            continue;
        }

        if (entry.type == "DNS")
        {
            result.push_back(IndexedSan{SanType::DNS, ++dnsCount, std::move(value)});
        }
        else if (entry.type == "IP")
        {
            Asn1OctetStringPtr octets(a2i_IPADDRESS(value.c_str()));
            if (!octets)
            {
                ERR_clear_error();
                throw ValidationError(Error::InvalidValue, "invalid IP address '" + value + "' in subjectAltName");
            }
            result.push_back(IndexedSan{SanType::IP, ++ipCount, std::move(value)});
        }
        else
        {
            casket::debug("Dropping subjectAltName entry of unknown type '{}'", entry.type);
        }
    }
    return result;
}

ExtensionProfile ExtensionProfile::client()
{
    ExtensionProfile profile;
    profile.keyUsage_ = {KeyUsageBit::DigitalSignature, KeyUsageBit::KeyAgreement};
    profile.extendedKeyUsage_ = {NID_client_auth};
    profile.isCA_ = false;
    return profile;
}

ExtensionProfile ExtensionProfile::broker(const std::vector<SanEntry>& sans)
{
    ExtensionProfile profile;
    profile.keyUsage_ = {KeyUsageBit::DigitalSignature, KeyUsageBit::KeyEncipherment, KeyUsageBit::KeyAgreement};
    profile.extendedKeyUsage_ = {NID_server_auth};
    profile.isCA_ = false;
    profile.subjectAltNames_ = NormalizeSans(sans);
    return profile;
}

ExtensionProfile ExtensionProfile::ca()
{
    ExtensionProfile profile;
    profile.keyUsage_ = {KeyUsageBit::DigitalSignature, KeyUsageBit::CrlSign, KeyUsageBit::KeyCertSign};
    profile.isCA_ = true;
    return profile;
}

ExtensionProfile ExtensionProfile::forRole(Role role, const std::vector<SanEntry>& sans)
{
    switch (role)
    {
    case Role::Client:
        return client();
    case Role::Broker:
        return broker(sans);
    case Role::CA:
        return ca();
    }
    return client();
}

CertExtOwningStackPtr ExtensionProfile::toExtensions() const
{
    CertExtOwningStackPtr exts(sk_X509_EXTENSION_new_null());
    crypto::ThrowIfTrue(exts == nullptr);

    auto push = [&exts](X509ExtPtr ext) {
        crypto::ThrowIfFalse(0 < sk_X509_EXTENSION_push(exts, ext.get()));
        ext.release();
    };

    push(X509Extension::basicConstraints(isCA_));

    if (!keyUsage_.empty())
    {
        push(X509Extension::keyUsage(keyUsage_));
    }

    if (!extendedKeyUsage_.empty())
    {
        push(X509Extension::extendedKeyUsage(extendedKeyUsage_));
    }

    if (!subjectAltNames_.empty())
    {
        GeneralNamesPtr names(sk_GENERAL_NAME_new_null());
        crypto::ThrowIfTrue(names == nullptr);

        for (const auto& san : subjectAltNames_)
        {
            auto name = (san.type == SanType::DNS) ? X509Extension::dnsName(san.value)
                                                   : X509Extension::ipAddress(san.value);
            crypto::ThrowIfFalse(0 < sk_GENERAL_NAME_push(names, name.get()));
            name.release();
        }
        push(X509Extension::subjectAltName(names));
    }

    return exts;
}

} // namespace mqcert::pki
