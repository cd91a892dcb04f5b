#include <filesystem>
#include <fstream>
#include <set>
#include <thread>

#include <gtest/gtest.h>

#include <mqcert/crypto/cert.hpp>
#include <mqcert/crypto/rand.hpp>
#include <mqcert/pki/ca_issuer.hpp>
#include <mqcert/pki/error.hpp>
#include <mqcert/pki/serial_allocator.hpp>

using namespace mqcert;
using namespace mqcert::crypto;
using namespace mqcert::pki;

namespace fs = std::filesystem;

class SerialAllocatorTest : public testing::Test
{
public:
    void SetUp() override
    {
        dir_ = fs::temp_directory_path() / ("mqcert-serial-" + Rand::hex(6));

        auto subject = SubjectBuilder::build(Role::CA, CaIssuer::defaultIdentity());
        caCert_ = Cert::fromPem(CaIssuer::issueRootCa("prime256v1", subject).caCert);
        otherCaCert_ = Cert::fromPem(CaIssuer::issueRootCa("prime256v1", subject).caCert);
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

protected:
    fs::path dir_;
    X509CertPtr caCert_;
    X509CertPtr otherCaCert_;
};

TEST_F(SerialAllocatorTest, RandomSerialsArePositiveAndDistinct)
{
    RandomSerialAllocator allocator;
    auto a = allocator.next(caCert_);
    auto b = allocator.next(caCert_);

    EXPECT_FALSE(BN_is_negative(a));
    EXPECT_FALSE(BN_is_zero(a));
    EXPECT_LE(BN_num_bits(a), RandomSerialAllocator::kSerialBits);
    EXPECT_NE(BN_cmp(a, b), 0);
}

TEST_F(SerialAllocatorTest, FileCounterStartsAtOneAndIncrements)
{
    FileSerialAllocator allocator(dir_);

    EXPECT_EQ(BN_get_word(allocator.next(caCert_)), 1U);
    EXPECT_EQ(BN_get_word(allocator.next(caCert_)), 2U);
    EXPECT_EQ(BN_get_word(allocator.next(caCert_)), 3U);

    auto path = allocator.counterPath(caCert_);
    EXPECT_EQ(path.filename().string(), Cert::fingerprint(caCert_) + ".srl");

    std::ifstream in(path);
    std::string text;
    in >> text;
    EXPECT_EQ(text, "03");
}

TEST_F(SerialAllocatorTest, FileCounterPersistsAcrossInstances)
{
    {
        FileSerialAllocator allocator(dir_);
        allocator.next(caCert_);
        allocator.next(caCert_);
    }

    FileSerialAllocator reopened(dir_);
    EXPECT_EQ(BN_get_word(reopened.next(caCert_)), 3U);
}

TEST_F(SerialAllocatorTest, CountersAreScopedPerCa)
{
    FileSerialAllocator allocator(dir_);

    EXPECT_EQ(BN_get_word(allocator.next(caCert_)), 1U);
    EXPECT_EQ(BN_get_word(allocator.next(caCert_)), 2U);
    EXPECT_EQ(BN_get_word(allocator.next(otherCaCert_)), 1U);
}

TEST_F(SerialAllocatorTest, ConcurrentAllocationsAreUnique)
{
    FileSerialAllocator allocator(dir_);
    constexpr int kThreads = 4;
    constexpr int kPerThread = 25;

    std::vector<std::vector<unsigned long>> results(kThreads);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t)
    {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < kPerThread; ++i)
            {
                results[t].push_back(BN_get_word(allocator.next(caCert_)));
            }
        });
    }
    for (auto& thread : threads)
    {
        thread.join();
    }

    std::set<unsigned long> unique;
    for (const auto& values : results)
    {
        unique.insert(values.begin(), values.end());
    }
    EXPECT_EQ(unique.size(), static_cast<size_t>(kThreads * kPerThread));
    EXPECT_EQ(*unique.rbegin(), static_cast<unsigned long>(kThreads * kPerThread));
}

TEST_F(SerialAllocatorTest, CorruptedCounterIsResourceError)
{
    FileSerialAllocator allocator(dir_);
    allocator.next(caCert_);

    std::ofstream(allocator.counterPath(caCert_), std::ios::trunc) << "not-hex";
    ASSERT_THROW(allocator.next(caCert_), ResourceError);
}

TEST_F(SerialAllocatorTest, UnusableDirectoryIsResourceError)
{
    fs::create_directories(dir_);
    const auto blocker = dir_ / "file";
    std::ofstream(blocker) << "x";

    FileSerialAllocator allocator(blocker / "serials");
    ASSERT_THROW(allocator.next(caCert_), ResourceError);
}

TEST(SerialToHexTest, UpperCaseHex)
{
    BigNumPtr serial(BN_new());
    BN_set_word(serial, 0xABCD);
    EXPECT_EQ(SerialToHex(serial), "ABCD");
}
