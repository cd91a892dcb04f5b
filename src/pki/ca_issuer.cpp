#include <chrono>

#include <mqcert/crypto/asymm_key.hpp>
#include <mqcert/crypto/asymm_keygen.hpp>
#include <mqcert/crypto/cert.hpp>
#include <mqcert/crypto/cert_builder.hpp>

#include <mqcert/pki/ca_issuer.hpp>
#include <mqcert/pki/error.hpp>
#include <mqcert/pki/extension_profile.hpp>
#include <mqcert/pki/serial_allocator.hpp>

#include "text_utils.hpp"

using namespace mqcert::crypto;

namespace mqcert::pki
{

IdentityFields CaIssuer::defaultIdentity()
{
    IdentityFields fields;
    fields.commonName = "Root CA";
    fields.organization = "Organization";
    fields.country = "US";
    fields.state = "California";
    fields.locality = "San Francisco";
    return fields;
}

IdentityFields CaIssuer::withDefaults(const IdentityFields& fields)
{
    const auto defaults = defaultIdentity();
    IdentityFields result = fields;

    auto fill = [](std::string& value, const std::string& fallback) {
        if (Trimmed(value).empty())
        {
            value = fallback;
        }
    };

    fill(result.commonName, defaults.commonName);
    fill(result.organization, defaults.organization);
    fill(result.country, defaults.country);
    fill(result.state, defaults.state);
    fill(result.locality, defaults.locality);
    return result;
}

CaPair CaIssuer::issueRootCa(std::string_view curve, const DistinguishedName& subject, int validityDays)
{
    RequireValidityDays(validityDays);

    auto key = akey::ec::generate(curve);
    auto name = subject.toX509Name();
    auto exts = ExtensionProfile::ca().toExtensions();

    RandomSerialAllocator serials;

    CertBuilder builder;
    builder.setVersion(CertVersion::V3);
    builder.setSerialNumber(serials.next(nullptr));
    builder.setSubjectName(name);
    builder.setIssuerName(name);
    builder.setPublicKey(key);
    builder.setNotBefore(std::chrono::seconds(0));
    builder.setNotAfter(ValidityPeriod(validityDays));
    builder.selfSigned(key);
    builder.addExtensions(exts);
    builder.addExtension(NID_subject_key_identifier, "hash");
    auto cert = builder.build();

    CaPair result;
    result.caKey = AsymmKey::toPem(KeyType::Private, key);
    result.caCert = Cert::toPem(cert);
    return result;
}

} // namespace mqcert::pki
