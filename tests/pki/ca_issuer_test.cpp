#include <gtest/gtest.h>

#include <mqcert/crypto/asymm_key.hpp>
#include <mqcert/crypto/cert.hpp>
#include <mqcert/crypto/cert_name.hpp>
#include <mqcert/pki/ca_issuer.hpp>
#include <mqcert/pki/error.hpp>

#include "test_utils.hpp"

using namespace mqcert;
using namespace mqcert::crypto;
using namespace mqcert::pki;

TEST(CaIssuerTest, DefaultIdentity)
{
    auto fields = CaIssuer::withDefaults(IdentityFields{});
    EXPECT_EQ(fields.commonName, "Root CA");
    EXPECT_EQ(fields.organization, "Organization");
    EXPECT_EQ(fields.country, "US");
    EXPECT_EQ(fields.state, "California");
    EXPECT_EQ(fields.locality, "San Francisco");
    EXPECT_TRUE(fields.organizationalUnit.empty());
}

TEST(CaIssuerTest, SuppliedFieldsWin)
{
    IdentityFields supplied;
    supplied.commonName = "Acme Root";
    supplied.country = "DE";

    auto fields = CaIssuer::withDefaults(supplied);
    EXPECT_EQ(fields.commonName, "Acme Root");
    EXPECT_EQ(fields.country, "DE");
    EXPECT_EQ(fields.organization, "Organization");
}

TEST(CaIssuerTest, IssuesSelfSignedCa)
{
    auto subject = SubjectBuilder::build(Role::CA, CaIssuer::defaultIdentity());

    CaPair pair;
    ASSERT_NO_THROW(pair = CaIssuer::issueRootCa("prime256v1", subject));

    auto key = AsymmKey::fromPem(KeyType::Private, pair.caKey);
    auto cert = Cert::fromPem(pair.caCert);

    EXPECT_EQ(Cert::version(cert), CertVersion::V3);
    EXPECT_TRUE(CertName::isEqual(Cert::subjectName(cert), Cert::issuerName(cert)));
    EXPECT_EQ(CertName::toString(X509_get_subject_name(cert)),
              "C=US, ST=California, L=San Francisco, O=Organization, CN=Root CA");
    EXPECT_TRUE(AsymmKey::isEqual(key, Cert::publicKey(cert)));
    EXPECT_EQ(1, X509_verify(cert, key));

    EXPECT_TRUE(Cert::isCA(cert));
    EXPECT_EQ(test::BasicConstraintsCA(cert), 1);
    EXPECT_TRUE(test::IsExtensionCritical(cert, NID_basic_constraints));
    EXPECT_TRUE(test::IsExtensionCritical(cert, NID_key_usage));
    EXPECT_EQ(test::ExtensionCount(cert, NID_ext_key_usage), 0);
    EXPECT_EQ(test::ExtensionCount(cert, NID_subject_key_identifier), 1);

    const uint32_t usage = X509_get_key_usage(cert);
    EXPECT_TRUE(usage & KU_DIGITAL_SIGNATURE);
    EXPECT_TRUE(usage & KU_CRL_SIGN);
    EXPECT_TRUE(usage & KU_KEY_CERT_SIGN);
    EXPECT_FALSE(usage & KU_KEY_AGREEMENT);
}

TEST(CaIssuerTest, ValidityInDays)
{
    auto subject = SubjectBuilder::build(Role::CA, CaIssuer::defaultIdentity());
    auto pair = CaIssuer::issueRootCa("prime256v1", subject, 10);
    auto cert = Cert::fromPem(pair.caCert);

    const auto lifetime = Cert::notAfter(cert) - Cert::notBefore(cert);
    EXPECT_NEAR(static_cast<double>(lifetime), 10.0 * 24 * 3600, 5.0);
}

TEST(CaIssuerTest, LongValidityKeepsFullLifetime)
{
    auto subject = SubjectBuilder::build(Role::CA, CaIssuer::defaultIdentity());
    auto cert = Cert::fromPem(CaIssuer::issueRootCa("prime256v1", subject, 100000).caCert);

    const auto lifetime = Cert::notAfter(cert) - Cert::notBefore(cert);
    EXPECT_NEAR(static_cast<double>(lifetime), 100000.0 * 24 * 3600, 5.0);
}

TEST(CaIssuerTest, DefaultValidityIsTenYears)
{
    auto subject = SubjectBuilder::build(Role::CA, CaIssuer::defaultIdentity());
    auto cert = Cert::fromPem(CaIssuer::issueRootCa("prime256v1", subject).caCert);

    const auto lifetime = Cert::notAfter(cert) - Cert::notBefore(cert);
    EXPECT_NEAR(static_cast<double>(lifetime), 3650.0 * 24 * 3600, 5.0);
}

TEST(CaIssuerTest, SerialIsPositiveAndRandom)
{
    auto subject = SubjectBuilder::build(Role::CA, CaIssuer::defaultIdentity());
    auto first = Cert::fromPem(CaIssuer::issueRootCa("prime256v1", subject).caCert);
    auto second = Cert::fromPem(CaIssuer::issueRootCa("prime256v1", subject).caCert);

    auto a = Cert::serialNumber(first);
    auto b = Cert::serialNumber(second);
    EXPECT_FALSE(BN_is_negative(a));
    EXPECT_FALSE(BN_is_zero(a));
    EXPECT_LE(BN_num_bits(a), 159);
    EXPECT_NE(BN_cmp(a, b), 0);
}

TEST(CaIssuerTest, NonPositiveValidityIsRejected)
{
    auto subject = SubjectBuilder::build(Role::CA, CaIssuer::defaultIdentity());
    ASSERT_THROW(CaIssuer::issueRootCa("prime256v1", subject, 0), ValidationError);
    ASSERT_THROW(CaIssuer::issueRootCa("prime256v1", subject, -5), ValidationError);
}

TEST(CaIssuerTest, ValidityPastYear9999IsRejected)
{
    auto subject = SubjectBuilder::build(Role::CA, CaIssuer::defaultIdentity());
    try
    {
        CaIssuer::issueRootCa("prime256v1", subject, 178956971);
        FAIL() << "expected ValidationError";
    }
    catch (const ValidationError& e)
    {
        EXPECT_EQ(e.code(), MakeErrorCode(Error::InvalidValue));
    }
    ASSERT_THROW(CaIssuer::issueRootCa("prime256v1", subject, 3000000), ValidationError);
}
