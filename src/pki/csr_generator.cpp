#include <mqcert/crypto/asymm_key.hpp>
#include <mqcert/crypto/asymm_keygen.hpp>
#include <mqcert/crypto/req.hpp>
#include <mqcert/crypto/req_builder.hpp>

#include <mqcert/pki/csr_generator.hpp>

using namespace mqcert::crypto;

namespace mqcert::pki
{

KeyAndCsr CsrGenerator::generate(std::string_view curve, const DistinguishedName& subject,
                                 const ExtensionProfile& profile)
{
    auto key = akey::ec::generate(curve);
    auto name = subject.toX509Name();
    auto exts = profile.toExtensions();

    ReqBuilder builder;
    builder.setSubjectName(name);
    builder.setPublicKey(key);
    builder.addExtensions(exts);
    auto req = builder.build(key);

    KeyAndCsr result;
    result.privateKey = AsymmKey::toPem(KeyType::Private, key);
    result.publicKey = AsymmKey::toPem(KeyType::Public, key);
    result.csr = Req::toPem(req);
    return result;
}

} // namespace mqcert::pki
