#include <gtest/gtest.h>

#include <mqcert/crypto/asymm_key.hpp>
#include <mqcert/crypto/asymm_keygen.hpp>
#include <mqcert/crypto/cert_name.hpp>
#include <mqcert/crypto/cert_name_builder.hpp>
#include <mqcert/crypto/exception.hpp>
#include <mqcert/crypto/extension.hpp>
#include <mqcert/crypto/req.hpp>
#include <mqcert/crypto/req_builder.hpp>

using namespace mqcert::crypto;

class ReqBuilderTest : public testing::Test
{
public:
    void SetUp() override
    {
        ASSERT_NO_THROW(key_ = akey::ec::generate(akey::ec::kDefaultGroup));

        CertNameBuilder nameBuilder;
        nameBuilder.addEntry(NID_countryName, "US");
        nameBuilder.addEntry(NID_commonName, "device-001");
        name_ = nameBuilder.build();
    }

protected:
    KeyPtr key_;
    X509NamePtr name_;
};

TEST_F(ReqBuilderTest, BuildSignedRequest)
{
    ReqBuilder builder;
    builder.setSubjectName(name_).setPublicKey(key_);
    builder.addExtension(X509Extension::basicConstraints(false));
    builder.addExtension(X509Extension::extendedKeyUsage({NID_client_auth}));

    X509ReqPtr req;
    ASSERT_NO_THROW(req = builder.build(key_));

    EXPECT_EQ(X509_REQ_get_version(req), 0);
    EXPECT_TRUE(Req::verify(req));
    EXPECT_TRUE(CertName::isEqual(Req::subjectName(req), name_));
    EXPECT_TRUE(AsymmKey::isEqual(Req::publicKey(req), key_));

    auto exts = Req::extensions(req);
    ASSERT_EQ(sk_X509_EXTENSION_num(exts), 2);
    EXPECT_EQ(X509Extension::nid(sk_X509_EXTENSION_value(exts, 0)), NID_basic_constraints);
    EXPECT_EQ(X509Extension::nid(sk_X509_EXTENSION_value(exts, 1)), NID_ext_key_usage);
}

TEST_F(ReqBuilderTest, RequestWithoutExtensions)
{
    ReqBuilder builder;
    builder.setSubjectName(name_).setPublicKey(key_);
    auto req = builder.build(key_);

    EXPECT_EQ(sk_X509_EXTENSION_num(Req::extensions(req)), 0);
}

TEST_F(ReqBuilderTest, PemRoundTrip)
{
    ReqBuilder builder;
    builder.setSubjectName(name_).setPublicKey(key_);
    auto pem = Req::toPem(builder.build(key_));

    EXPECT_EQ(pem.rfind("-----BEGIN CERTIFICATE REQUEST-----", 0), 0U);

    X509ReqPtr decoded;
    ASSERT_NO_THROW(decoded = Req::fromPem(pem));
    EXPECT_EQ(CertName::toString(X509_REQ_get_subject_name(decoded)), "C=US, CN=device-001");
}

TEST_F(ReqBuilderTest, SignatureFromOtherKeyDoesNotVerify)
{
    auto otherKey = akey::ec::generate(akey::ec::kDefaultGroup);

    ReqBuilder builder;
    builder.setSubjectName(name_).setPublicKey(key_);
    auto req = builder.build(otherKey);

    EXPECT_FALSE(Req::verify(req));
}

TEST(ReqTest, MalformedPemThrows)
{
    ASSERT_THROW(Req::fromPem("-----BEGIN CERTIFICATE REQUEST-----\nAAAA\n-----END CERTIFICATE REQUEST-----\n"),
                 CryptoError);
    ASSERT_THROW(Req::fromPem("garbage"), CryptoError);
}
