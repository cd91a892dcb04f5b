#include <gtest/gtest.h>

#include <mqcert/crypto/asymm_key.hpp>
#include <mqcert/crypto/cert_name.hpp>
#include <mqcert/crypto/exception.hpp>
#include <mqcert/crypto/extension.hpp>
#include <mqcert/crypto/req.hpp>
#include <mqcert/pki/csr_generator.hpp>

using namespace mqcert;
using namespace mqcert::crypto;
using namespace mqcert::pki;

class CsrGeneratorTest : public testing::Test
{
public:
    void SetUp() override
    {
        IdentityFields fields;
        fields.commonName = "device-001";
        fields.organization = "Acme";
        fields.country = "US";
        fields.state = "CA";
        fields.locality = "SF";
        subject_ = SubjectBuilder::build(Role::Client, fields);
    }

protected:
    DistinguishedName subject_;
};

TEST_F(CsrGeneratorTest, GeneratesConsistentTriple)
{
    KeyAndCsr result;
    ASSERT_NO_THROW(result = CsrGenerator::generate("prime256v1", subject_, ExtensionProfile::client()));

    auto privateKey = AsymmKey::fromPem(KeyType::Private, result.privateKey);
    auto publicKey = AsymmKey::fromPem(KeyType::Public, result.publicKey);
    auto req = Req::fromPem(result.csr);

    EXPECT_TRUE(AsymmKey::isEqual(privateKey, publicKey));
    EXPECT_TRUE(AsymmKey::isEqual(Req::publicKey(req), publicKey));
    EXPECT_TRUE(Req::verify(req));
    EXPECT_EQ(AsymmKey::groupName(publicKey), "prime256v1");
    EXPECT_EQ(CertName::toString(X509_REQ_get_subject_name(req)), "C=US, ST=CA, L=SF, O=Acme, CN=device-001");
}

TEST_F(CsrGeneratorTest, RequestsProfileExtensions)
{
    auto result = CsrGenerator::generate("prime256v1", subject_, ExtensionProfile::client());
    auto req = Req::fromPem(result.csr);
    auto exts = Req::extensions(req);

    ASSERT_EQ(sk_X509_EXTENSION_num(exts), 3);
    EXPECT_EQ(X509Extension::nid(sk_X509_EXTENSION_value(exts, 0)), NID_basic_constraints);
    EXPECT_EQ(X509Extension::nid(sk_X509_EXTENSION_value(exts, 1)), NID_key_usage);
    EXPECT_EQ(X509Extension::nid(sk_X509_EXTENSION_value(exts, 2)), NID_ext_key_usage);
}

TEST_F(CsrGeneratorTest, OtherCurve)
{
    auto result = CsrGenerator::generate("secp384r1", subject_, ExtensionProfile::client());
    auto publicKey = AsymmKey::fromPem(KeyType::Public, result.publicKey);
    EXPECT_EQ(AsymmKey::groupName(publicKey), "secp384r1");
}

TEST_F(CsrGeneratorTest, UnsupportedCurveIsCryptoError)
{
    ASSERT_THROW(CsrGenerator::generate("curve25519-nope", subject_, ExtensionProfile::client()), CryptoError);
}

TEST_F(CsrGeneratorTest, EachCallGeneratesFreshKey)
{
    auto first = CsrGenerator::generate("prime256v1", subject_, ExtensionProfile::client());
    auto second = CsrGenerator::generate("prime256v1", subject_, ExtensionProfile::client());
    EXPECT_NE(first.privateKey, second.privateKey);
}
