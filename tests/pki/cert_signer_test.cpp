#include <gtest/gtest.h>

#include <mqcert/crypto/asymm_key.hpp>
#include <mqcert/crypto/asymm_keygen.hpp>
#include <mqcert/crypto/cert.hpp>
#include <mqcert/crypto/cert_name.hpp>
#include <mqcert/crypto/exception.hpp>
#include <mqcert/crypto/extension.hpp>
#include <mqcert/crypto/req.hpp>
#include <mqcert/crypto/req_builder.hpp>
#include <mqcert/pki/ca_issuer.hpp>
#include <mqcert/pki/cert_signer.hpp>
#include <mqcert/pki/csr_generator.hpp>
#include <mqcert/pki/error.hpp>

#include "test_utils.hpp"

using namespace mqcert;
using namespace mqcert::crypto;
using namespace mqcert::pki;

class CertSignerTest : public testing::Test
{
public:
    void SetUp() override
    {
        auto caSubject = SubjectBuilder::build(Role::CA, CaIssuer::defaultIdentity());
        ASSERT_NO_THROW(ca_ = CaIssuer::issueRootCa("prime256v1", caSubject));

        caKey_ = AsymmKey::fromPem(KeyType::Private, ca_.caKey);
        caCert_ = Cert::fromPem(ca_.caCert);

        IdentityFields client;
        client.commonName = "device-001";
        client.organization = "Acme";
        client.country = "US";
        client.state = "CA";
        client.locality = "SF";
        clientCsr_ = CsrGenerator::generate("prime256v1", SubjectBuilder::build(Role::Client, client),
                                            ExtensionProfile::client())
                         .csr;

        IdentityFields broker;
        broker.commonName = "broker.local";
        brokerCsr_ = CsrGenerator::generate("prime256v1", SubjectBuilder::build(Role::Broker, broker),
                                            ExtensionProfile::broker({}))
                         .csr;
    }

protected:
    CaPair ca_;
    KeyPtr caKey_;
    X509CertPtr caCert_;
    std::string clientCsr_;
    std::string brokerCsr_;
    RandomSerialAllocator serials_;
};

TEST_F(CertSignerTest, SignClientCertificate)
{
    CertSigner signer(caKey_, caCert_, serials_);
    auto csr = Req::fromPem(clientCsr_);

    X509CertPtr cert;
    ASSERT_NO_THROW(cert = signer.sign(Role::Client, csr));

    EXPECT_EQ(Cert::version(cert), CertVersion::V3);
    EXPECT_TRUE(CertName::isEqual(Cert::subjectName(cert), Req::subjectName(csr)));
    EXPECT_TRUE(CertName::isEqual(Cert::issuerName(cert), Cert::subjectName(caCert_)));
    EXPECT_TRUE(AsymmKey::isEqual(Cert::publicKey(cert), Req::publicKey(csr)));
    EXPECT_EQ(1, X509_verify(cert, caKey_));

    EXPECT_EQ(test::BasicConstraintsCA(cert), 0);
    EXPECT_FALSE(Cert::isCA(cert));
    EXPECT_EQ(test::ExtendedKeyUsages(cert), std::vector<int>{NID_client_auth});
    EXPECT_TRUE(test::IsExtensionCritical(cert, NID_key_usage));
    EXPECT_EQ(test::ExtensionCount(cert, NID_subject_alt_name), 0);
    EXPECT_EQ(test::ExtensionCount(cert, NID_subject_key_identifier), 1);
    EXPECT_EQ(test::ExtensionCount(cert, NID_authority_key_identifier), 1);

    const uint32_t usage = X509_get_key_usage(cert);
    EXPECT_TRUE(usage & KU_DIGITAL_SIGNATURE);
    EXPECT_TRUE(usage & KU_KEY_AGREEMENT);
    EXPECT_FALSE(usage & KU_KEY_CERT_SIGN);

    const auto lifetime = Cert::notAfter(cert) - Cert::notBefore(cert);
    EXPECT_NEAR(static_cast<double>(lifetime), 365.0 * 24 * 3600, 5.0);
}

TEST_F(CertSignerTest, ChainVerifiesAgainstRoot)
{
    CertSigner signer(caKey_, caCert_, serials_);
    auto cert = signer.sign(Role::Client, Req::fromPem(clientCsr_));

    X509_STORE* store = X509_STORE_new();
    ASSERT_NE(store, nullptr);
    ASSERT_EQ(1, X509_STORE_add_cert(store, caCert_));

    X509_STORE_CTX* ctx = X509_STORE_CTX_new();
    ASSERT_NE(ctx, nullptr);
    ASSERT_EQ(1, X509_STORE_CTX_init(ctx, store, cert, nullptr));
    X509_STORE_CTX_set_purpose(ctx, X509_PURPOSE_SSL_CLIENT);

    const int ok = X509_verify_cert(ctx);
    const int err = X509_STORE_CTX_get_error(ctx);

    X509_STORE_CTX_free(ctx);
    X509_STORE_free(store);

    EXPECT_EQ(ok, 1) << X509_verify_cert_error_string(err);
}

TEST_F(CertSignerTest, SignBrokerCertificateWithSans)
{
    CertSigner signer(caKey_, caCert_, serials_);
    auto cert = signer.sign(Role::Broker, Req::fromPem(brokerCsr_), 30,
                            {{"DNS", "broker.local"}, {"IP", "10.0.0.5"}, {"FTP", "ignored"}});

    EXPECT_EQ(test::ExtendedKeyUsages(cert), std::vector<int>{NID_server_auth});
    std::vector<std::string> expectedSans{"DNS:broker.local", "IP:10.0.0.5"};
    EXPECT_EQ(test::SubjectAltNames(cert), expectedSans);

    const uint32_t usage = X509_get_key_usage(cert);
    EXPECT_TRUE(usage & KU_KEY_ENCIPHERMENT);
    EXPECT_TRUE(usage & KU_KEY_AGREEMENT);

    const auto lifetime = Cert::notAfter(cert) - Cert::notBefore(cert);
    EXPECT_NEAR(static_cast<double>(lifetime), 30.0 * 24 * 3600, 5.0);
}

TEST_F(CertSignerTest, RequestedCaFlagIsIgnored)
{
    auto key = akey::ec::generate(akey::ec::kDefaultGroup);
    auto subject = SubjectBuilder::build(Role::Broker, IdentityFields{"rogue"});

    ReqBuilder builder;
    builder.setSubjectName(subject.toX509Name()).setPublicKey(key);
    builder.addExtensions(ExtensionProfile::ca().toExtensions());
    auto csr = builder.build(key);

    CertSigner signer(caKey_, caCert_, serials_);
    auto cert = signer.sign(Role::Client, csr);

    EXPECT_EQ(test::BasicConstraintsCA(cert), 0);
    EXPECT_EQ(test::ExtensionCount(cert, NID_basic_constraints), 1);
    EXPECT_FALSE(X509_get_key_usage(cert) & KU_KEY_CERT_SIGN);
}

TEST_F(CertSignerTest, ResigningGivesDistinctSerials)
{
    CertSigner signer(caKey_, caCert_, serials_);
    auto csr = Req::fromPem(clientCsr_);

    auto first = signer.sign(Role::Client, csr);
    auto second = signer.sign(Role::Client, csr);

    EXPECT_NE(BN_cmp(Cert::serialNumber(first), Cert::serialNumber(second)), 0);
}

TEST_F(CertSignerTest, CaRoleIsNotSignable)
{
    CertSigner signer(caKey_, caCert_, serials_);
    try
    {
        signer.sign(Role::CA, Req::fromPem(clientCsr_));
        FAIL() << "expected ValidationError";
    }
    catch (const ValidationError& e)
    {
        EXPECT_EQ(e.code(), MakeErrorCode(Error::UnsupportedRole));
    }
}

TEST_F(CertSignerTest, NonPositiveValidityIsRejected)
{
    CertSigner signer(caKey_, caCert_, serials_);
    ASSERT_THROW(signer.sign(Role::Client, Req::fromPem(clientCsr_), 0), ValidationError);
}

TEST_F(CertSignerTest, OverlongValidityIsRejected)
{
    CertSigner signer(caKey_, caCert_, serials_);
    ASSERT_THROW(signer.sign(Role::Client, Req::fromPem(clientCsr_), 178956971), ValidationError);
}

TEST_F(CertSignerTest, LongValidityKeepsFullLifetime)
{
    CertSigner signer(caKey_, caCert_, serials_);
    auto cert = signer.sign(Role::Client, Req::fromPem(clientCsr_), 50000);

    const auto lifetime = Cert::notAfter(cert) - Cert::notBefore(cert);
    EXPECT_NEAR(static_cast<double>(lifetime), 50000.0 * 24 * 3600, 5.0);
}

TEST_F(CertSignerTest, MismatchedCaKeyIsCryptoError)
{
    auto otherKey = akey::ec::generate(akey::ec::kDefaultGroup);
    ASSERT_THROW(CertSigner signer(otherKey, caCert_, serials_), CryptoError);
}

TEST_F(CertSignerTest, TamperedCsrIsCryptoError)
{
    auto csr = Req::fromPem(clientCsr_);

    // Re-sign with a key that does not match the embedded public key.
    auto otherKey = akey::ec::generate(akey::ec::kDefaultGroup);
    ASSERT_GT(X509_REQ_sign(csr, otherKey, EVP_sha256()), 0);

    CertSigner signer(caKey_, caCert_, serials_);
    ASSERT_THROW(signer.sign(Role::Client, csr), CryptoError);
}

TEST_F(CertSignerTest, SignCertificateFromPem)
{
    std::string pem;
    ASSERT_NO_THROW(pem = CertSigner::signCertificate(Role::Client, clientCsr_, ca_.caKey, ca_.caCert, serials_));

    auto cert = Cert::fromPem(pem);
    EXPECT_EQ(CertName::toString(X509_get_subject_name(cert)), "C=US, ST=CA, L=SF, O=Acme, CN=device-001");
}

TEST_F(CertSignerTest, MissingInputsAreValidationErrors)
{
    EXPECT_THROW(CertSigner::signCertificate(Role::Client, "", ca_.caKey, ca_.caCert, serials_), ValidationError);
    EXPECT_THROW(CertSigner::signCertificate(Role::Client, clientCsr_, " ", ca_.caCert, serials_), ValidationError);
    EXPECT_THROW(CertSigner::signCertificate(Role::Client, clientCsr_, ca_.caKey, "", serials_), ValidationError);
}

TEST_F(CertSignerTest, MalformedCsrIsCryptoError)
{
    EXPECT_THROW(CertSigner::signCertificate(Role::Client, "not a csr", ca_.caKey, ca_.caCert, serials_),
                 CryptoError);
}
