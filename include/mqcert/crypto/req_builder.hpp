#pragma once

#include <casket/utils/noncopyable.hpp>

#include <mqcert/crypto/pointers.hpp>

namespace mqcert::crypto
{

/// @brief Assembles and signs a PKCS#10 certificate signing request.
///
/// The requested extensions are collected and written as a single
/// extensionRequest attribute when build() runs.
class ReqBuilder final : casket::NonCopyable
{
public:
    ReqBuilder();

    ~ReqBuilder() noexcept = default;

    void reset();

    ReqBuilder& setSubjectName(MQCERT_OSSL_CONST_COMPAT X509Name* name);

    ReqBuilder& setPublicKey(Key* publicKey);

    ReqBuilder& addExtension(X509Ext* ext);

    ReqBuilder& addExtensions(CertExtStack* exts);

    /// @brief Signs the request with @p privateKey using the key's default digest.
    X509ReqPtr build(Key* privateKey);

private:
    X509ReqPtr req_;
    CertExtOwningStackPtr exts_;
};

} // namespace mqcert::crypto
